#ifndef __INCLUDE_MONUTIL_H__
#define __INCLUDE_MONUTIL_H__
/*
 * Copyright (c) 2013-2016 Wind River Systems, Inc.
*
* SPDX-License-Identifier: Apache-2.0
*
 */

 /**
  * @file
  * Storage Array Monitor Common Utilities Header
  */

#include <iostream>
#include <string>
#include <list>

using namespace std;

#include "monBase.h"

string itos   ( int val );
string lltos  ( long long unsigned int val );
string dtos   ( double val, int resolution );

std::string tolowercase ( const std::string in );

bool string_contains ( string buffer, string sequence );

/* replace every occurrence of 'token' in 'str' with 'value'
 * and return the number of replacements made */
int  string_replace  ( string & str, string token, string value );

/* strip leading and trailing whitespace */
string trim_whitespace ( string str );

#endif /* __INCLUDE_MONUTIL_H__ */
