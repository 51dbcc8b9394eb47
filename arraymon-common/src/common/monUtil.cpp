/*
 * Copyright (c) 2013-2018 Wind River Systems, Inc.
*
* SPDX-License-Identifier: Apache-2.0
*
 */

 /**
  * @file
  * Storage Array Monitor Common Utilities
  */

#include <stdio.h>
#include <stdlib.h>
#include <string.h>
#include <ctype.h>
#include <algorithm>
#include <iterator>

using namespace std;

#ifdef  __AREA__
#undef  __AREA__
#endif
#define __AREA__ "com"

#include "monUtil.h"

#define MAX_NUM_LEN 64
string itos ( int val )
{
    char int_str[MAX_NUM_LEN] ;
    string temp ;
    memset  ( &int_str[0], 0, MAX_NUM_LEN );
    snprintf ( &int_str[0], MAX_NUM_LEN, "%d" , val );
    temp = int_str ;
    return (temp);
}

string lltos (long long unsigned int val )
{
    char int_str[MAX_NUM_LEN] ;
    string temp ;
    memset  ( &int_str[0], 0, MAX_NUM_LEN );
    snprintf ( &int_str[0], MAX_NUM_LEN, "%llu" , val );
    temp = int_str ;
    return (temp);
}

string dtos ( double val, int resolution )
{
    char float_str[MAX_NUM_LEN] ;
    string temp ;
    memset  ( &float_str[0], 0, MAX_NUM_LEN );
    if ( resolution == 0 )
        snprintf ( &float_str[0], MAX_NUM_LEN, "%.0f" , val );
    else if ( resolution == 2 )
        snprintf ( &float_str[0], MAX_NUM_LEN, "%.2f" , val );
    else if ( resolution == 3 )
        snprintf ( &float_str[0], MAX_NUM_LEN, "%.3f" , val );
    else
        snprintf ( &float_str[0], MAX_NUM_LEN, "%.1f" , val );
    temp = float_str ;
    return (temp);
}

std::string tolowercase ( const std::string in )
{
    std::string out;

    std::transform( in.begin(), in.end(), std::back_inserter( out ), ::tolower );
    return out;
}

bool string_contains ( string buffer, string sequence )
{
    size_t found = buffer.find(sequence);
    if ( found != string::npos )
        return (true);
    else
        return (false);
}

int string_replace ( string & str, string token, string value )
{
    int count = 0 ;
    if ( token.empty() )
        return (count);

    size_t pos = str.find ( token );
    while ( pos != string::npos )
    {
        str.replace ( pos, token.length(), value );
        count++ ;
        pos = str.find ( token, pos + value.length() );
    }
    return (count);
}

string trim_whitespace ( string str )
{
    size_t first = str.find_first_not_of ( " \t\r\n" );
    if ( first == string::npos )
        return ("");

    size_t last = str.find_last_not_of ( " \t\r\n" );
    return ( str.substr ( first, last - first + 1 ));
}
