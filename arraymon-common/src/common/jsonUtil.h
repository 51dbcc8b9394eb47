#ifndef __INCLUDE_JSONUTIL_H__
#define __INCLUDE_JSONUTIL_H__
/*
 * Copyright (c) 2013-2016 Wind River Systems, Inc.
*
* SPDX-License-Identifier: Apache-2.0
*
 */

 /**
  * @file
  * Storage Array Monitor
  *
  * JSON Utility Header
  */

#include <iostream>
#include <list>
#include <json-c/json.h>

using namespace std;

#include "monBase.h"

/** Missing string values are returned as this */
#define JSON_NONE "none"

/***********************************************************************
 *
 * Name        : jsonUtil_get_key_val
 *
 * Description : Load 'value' with the string value of 'key' in the
 *               top level object of the json string. A missing key
 *               loads "none".
 *
 * Returns     : PASS or FAIL_JSON_PARSE for a bad json string
 *
 ************************************************************************/
int jsonUtil_get_key_val ( char   * json_str_ptr,
                           string   key,
                           string & value );

/***********************************************************************
 *
 * Name        : jsonUtil_get_array
 *
 * Description : Load element_list with the json string of each element
 *               of a json string whose top level is an array.
 *
 * Returns     : PASS, FAIL_JSON_PARSE or FAIL_JSON_OBJECT if the top
 *               level is not an array.
 *
 ************************************************************************/
int jsonUtil_get_array  (   char * json_str_ptr, list<string> & element_list );

/***********************************************************************
 *
 * Name        : jsonUtil_get_object
 *
 * Description : Return the parsed object of a json string whose top
 *               level is either an object or a single element array
 *               holding one. The caller must json_object_put the
 *               returned root when done.
 *
 ************************************************************************/
int jsonUtil_get_object (   char * json_str_ptr,
                            struct json_object ** root_ptr,
                            struct json_object ** obj_ptr );

/***********************************************************************
* Escape special characters in JSON string
************************************************************************/
string jsonUtil_escapeSpecialChar(const string& input);

double jsonUtil_get_key_value_double ( struct json_object * obj, const char * key );
long long jsonUtil_get_key_value_int64 ( struct json_object * obj, const char * key );
string jsonUtil_get_key_value_string ( struct json_object * obj, const char * key );

/* true if the object has the key with a non-null value */
bool   jsonUtil_has_key              ( struct json_object * obj, const char * key );

#endif /* __INCLUDE_JSONUTIL_H__ */
