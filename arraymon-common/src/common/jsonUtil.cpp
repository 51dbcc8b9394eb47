/*
 * Copyright (c) 2013-2016 Wind River Systems, Inc.
*
* SPDX-License-Identifier: Apache-2.0
*
 */

 /**
  * @file
  * Storage Array Monitor JSON Utilities
  */

#include <stdio.h>
#include <stdlib.h>
#include <iostream>
#include <list>
#include <json-c/json.h>      /* for ... json-c json string parsing */
#include <sstream>

using namespace std;

#ifdef  __AREA__
#undef  __AREA__
#endif
#define __AREA__ "jsn"

#include "monUtil.h"
#include "jsonUtil.h"    /* JSON Utilities      */

/* Internal Private Interfaces */
static string _json_get_key_value_string ( struct json_object * obj,
                                           const char * key );

static string _json_get_key_value_string ( struct json_object * obj, const char * key )
{
    std::string value = "" ;

    /* Get the node object */
    struct json_object * key_obj = (struct json_object *)(NULL) ;
    json_bool status = json_object_object_get_ex(obj, key, &key_obj);
    if (( status ) && ( key_obj ) && ( !json_object_is_type ( key_obj, json_type_null )))
    {
        value.append(json_object_get_string(key_obj));
    }
    else
    {
        value = JSON_NONE ;
    }
    return ( value );
}

long long jsonUtil_get_key_value_int64 ( struct json_object * obj, const char * key )
{
    long long value = 0 ;

    struct json_object * key_obj = (struct json_object *)(NULL) ;
    json_bool status = json_object_object_get_ex(obj, key, &key_obj);
    if (( status ) && ( key_obj ))
    {
        value = (long long)json_object_get_int64(key_obj);
    }
    return ( value );
}

double jsonUtil_get_key_value_double ( struct json_object * obj, const char * key )
{
    double value = 0.0 ;

    struct json_object * key_obj = (struct json_object *)(NULL) ;
    json_bool status = json_object_object_get_ex(obj, key, &key_obj);
    if (( status ) && ( key_obj ))
    {
        value = json_object_get_double(key_obj);
    }
    return ( value );
}

string jsonUtil_get_key_value_string ( struct json_object * obj, const char * key )
{
    return (_json_get_key_value_string ( obj, key ));
}

bool jsonUtil_has_key ( struct json_object * obj, const char * key )
{
    struct json_object * key_obj = (struct json_object *)(NULL) ;
    json_bool status = json_object_object_get_ex(obj, key, &key_obj);
    if (( status ) && ( key_obj ) && ( !json_object_is_type ( key_obj, json_type_null )))
        return (true);
    return (false);
}

int jsonUtil_get_key_val ( char   * json_str_ptr,
                           string   key,
                           string & value )
{
    value = "" ;

    /* init to null to avoid trap on early cleanup call with
     * bad non-null default pointer value */
    struct json_object *raw_obj  = (struct json_object *)(NULL);

    if ((json_str_ptr == NULL) || ( *json_str_ptr == '\0' ) || ( ! strncmp ( json_str_ptr, "(null)" , 6 )))
    {
        elog ("Cannot tokenize a null json string\n");
        return (FAIL_JSON_PARSE);
    }

    jlog2 ("String: %s\n", json_str_ptr );

    raw_obj = json_tokener_parse( json_str_ptr );
    if ( raw_obj )
    {
        value = _json_get_key_value_string ( raw_obj, key.data() ) ;
        jlog1 ("%s:%s\n", key.c_str(), value.c_str());
        json_object_put(raw_obj);
    }
    else
    {
        elog ("Unable to tokenize string (len:%ld)\n", (long)strlen(json_str_ptr));
        jlog ("... json string: %s\n", json_str_ptr );
        return (FAIL_JSON_PARSE);
    }
    return (PASS);
}

int jsonUtil_get_array ( char * json_str_ptr, list<string> & element_list )
{
    int rc = PASS ;
    struct json_object * raw_obj   = (struct json_object *)(NULL);
    struct json_object * item_obj  = (struct json_object *)(NULL);

    if (( json_str_ptr == NULL ) || ( *json_str_ptr == '\0' ))
    {
        elog ("Cannot tokenize a null json string\n");
        return (FAIL_JSON_PARSE);
    }

    raw_obj = json_tokener_parse( json_str_ptr );
    if ( !raw_obj )
    {
        elog ("unable to parse raw object (%s)\n", json_str_ptr);
        rc = FAIL_JSON_PARSE ;
    }
    else if ( !json_object_is_type ( raw_obj, json_type_array ))
    {
        elog ("top level json object is not an array\n");
        rc = FAIL_JSON_OBJECT ;
    }
    else
    {
        int len = (int)json_object_array_length (raw_obj);
        jlog ( "array has %d elements\n", len );
        for ( int i = 0 ; i < len ; i++ )
        {
            item_obj = json_object_array_get_idx (raw_obj, i);
            if ( item_obj )
            {
                element_list.push_back (json_object_to_json_string(item_obj));
            }
        }
    }

    if (raw_obj)   json_object_put(raw_obj);

    return (rc);
}

int jsonUtil_get_object ( char * json_str_ptr,
                          struct json_object ** root_ptr,
                          struct json_object ** obj_ptr )
{
    if (( root_ptr == NULL ) || ( obj_ptr == NULL ))
        return (FAIL_NULL_POINTER);

    *root_ptr = (struct json_object *)(NULL);
    *obj_ptr  = (struct json_object *)(NULL);

    if (( json_str_ptr == NULL ) || ( *json_str_ptr == '\0' ))
    {
        elog ("Cannot tokenize a null json string\n");
        return (FAIL_JSON_PARSE);
    }

    struct json_object * raw_obj = json_tokener_parse( json_str_ptr );
    if ( !raw_obj )
    {
        elog ("unable to parse raw object (%s)\n", json_str_ptr);
        return (FAIL_JSON_PARSE);
    }

    if ( json_object_is_type ( raw_obj, json_type_object ))
    {
        *root_ptr = raw_obj ;
        *obj_ptr  = raw_obj ;
        return (PASS);
    }

    if ( json_object_is_type ( raw_obj, json_type_array ) &&
        ( json_object_array_length ( raw_obj ) > 0 ))
    {
        struct json_object * item_obj = json_object_array_get_idx ( raw_obj, 0 );
        if (( item_obj ) && ( json_object_is_type ( item_obj, json_type_object )))
        {
            if ( json_object_array_length ( raw_obj ) > 1 )
            {
                wlog ("using first of %d array elements\n", (int)json_object_array_length ( raw_obj ));
            }
            *root_ptr = raw_obj ;
            *obj_ptr  = item_obj ;
            return (PASS);
        }
    }

    elog ("json string holds no object\n");
    json_object_put ( raw_obj );
    return (FAIL_JSON_OBJECT);
}

string jsonUtil_escapeSpecialChar(const string& input)
{
    ostringstream ss;
    for (string::const_iterator iter = input.begin(); iter != input.end(); iter++)
    {
        switch (*iter)
        {
            case '\\': ss << "\\\\"; break;
            case '"': ss << "\\\""; break;
            case '/': ss << "\\/"; break;
            case '\b': ss << "\\b"; break;
            case '\f': ss << "\\f"; break;
            case '\n': ss << "\\n"; break;
            case '\r': ss << "\\r"; break;
            case '\t': ss << "\\t"; break;
            default: ss << *iter; break;
        }
    }
    return ss.str();
}
