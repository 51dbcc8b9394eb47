/*
* Copyright (c) 2013-2014, 2016 Wind River Systems, Inc.
*
* SPDX-License-Identifier: Apache-2.0
*
*/

 /**
  * @file
  * Storage Array Monitor log stamps and [debug] config section
  */

#include <iostream>
#include <stdio.h>
#include <string.h>
#include <stdlib.h>
#include <limits.h>
#include <time.h>

using namespace std;

#include "daemon_ini.h"    /* for ... MATCH                */
#include "daemon_common.h"
#include "monBase.h"

static char time_buff [50] ;
static const char null_t [25] = "YYYY:MM:DD HH:MM:SS.xxx";

/* Log counter */
static int __lc = 0 ;
int lc (void) /* returns the current log count */
{
   return(__lc++);
}

/* console log time stamp */
char * pt ( void )
{
    struct timespec ts ;
    struct tm t;
    int    len ;

    clock_gettime (CLOCK_REALTIME, &ts );
    if (localtime_r(&(ts.tv_sec), &t) == NULL)
    {
        return ((char*)&null_t[0]);
    }
    len = strftime(time_buff, 30, "%FT%H:%M:%S.", &t );
    sprintf ( &time_buff[len], "%03ld", (ts.tv_nsec/1000000) );

    return (&time_buff[0]);
}

/* a [debug] value must be a whole non-negative number */
static int _debug_number ( const char * name, const char * value, int & number )
{
    char * end_ptr = NULL ;

    if (( value == NULL ) || ( *value == '\0' ))
    {
        elog ("[debug] %s has no value\n", name );
        return (FAIL_INVALID_DATA);
    }

    long num = strtol ( value, &end_ptr, 0 );
    if (( *end_ptr != '\0' ) || ( num < 0 ) || ( num > INT_MAX ))
    {
        elog ("[debug] %s '%s' is not a valid number\n", name, value );
        return (FAIL_INVALID_DATA);
    }
    number = (int)num ;
    return (PASS);
}

static bool _fit_code_known ( int code )
{
    switch ( code )
    {
        case FIT_CODE__NONE:
        case FIT_CODE__ARRAY__AUTH_FAIL:
        case FIT_CODE__ARRAY__QUERY_TIMEOUT:
        case FIT_CODE__STORE__WRITE_FAIL:
        case FIT_CODE__PROV__CLONE_FAIL:
        case FIT_CODE__PROV__SET_PARAMS_FAIL:
        case FIT_CODE__PROV__ENABLE_FAIL:
        case FIT_CODE__PROV__DELETE_FAIL:
            return (true);
        default:
            return (false);
    }
}

/*****************************************************************************
 *
 * Name       : debug_config_handler
 *
 * Description: Load one [debug] label into the daemon config.
 *
 * Returns    : PASS, or FAIL_INVALID_DATA for a value that is not a
 *              number, a fit_code with no fault behind it, or an
 *              empty fit_name. The value is not applied on failure.
 *
 *****************************************************************************/
int debug_config_handler (        void * user,
                            const char * section,
                            const char * name,
                            const char * value)
{
    daemon_config_type* config_ptr = (daemon_config_type*)user;
    int number = 0 ;

    if (MATCH("debug", "fit_name"))
    {
        if (( value == NULL ) || ( *value == '\0' ))
        {
            elog ("[debug] fit_name has no value ; use 'none' or 'any'\n");
            return (FAIL_INVALID_DATA);
        }
        daemon_config_set_str ( &config_ptr->fit_name, value );
        return (PASS);
    }

    if ( strcmp ( section, "debug" ) != 0 )
        return (PASS);

    if (( strcmp ( name, "debug_json"  ) != 0 ) &&
        ( strcmp ( name, "debug_http"  ) != 0 ) &&
        ( strcmp ( name, "debug_level" ) != 0 ) &&
        ( strcmp ( name, "debug_all"   ) != 0 ) &&
        ( strcmp ( name, "testmode"    ) != 0 ) &&
        ( strcmp ( name, "fit_code"    ) != 0 ))
    {
        wlog ("[debug] %s is not a known label\n", name );
        return (PASS);
    }

    if ( _debug_number ( name, value, number ) != PASS )
        return (FAIL_INVALID_DATA);

    if (MATCH("debug", "debug_json"))
    {
        config_ptr->debug_json = number ;
        if ( config_ptr->debug_json )
        {
            ilog (" Json Debug : %x\n", config_ptr->debug_json );
        }
    }
    else if (MATCH("debug", "debug_http"))
    {
        config_ptr->debug_http = number ;
        if ( config_ptr->debug_http )
        {
            ilog (" Http Debug : %x\n", config_ptr->debug_http );
        }
    }
    else if (MATCH("debug", "debug_level"))
    {
        config_ptr->debug_level = number ;
        if ( config_ptr->debug_level )
        {
            ilog ("Level Debug : %x\n", config_ptr->debug_level );
        }
    }
    else if (MATCH("debug", "debug_all"))
    {
        config_ptr->debug_all = number ;
        if ( config_ptr->debug_all )
        {
            ilog ("  All Debug : %x\n", config_ptr->debug_all );
            config_ptr->debug_json  = number ;
            config_ptr->debug_http  = number ;
            config_ptr->debug_level = number ;
        }
    }
    else if (MATCH("debug", "testmode"))
    {
        config_ptr->testmode = number ;
        if ( config_ptr->testmode )
        {
            ilog ("  Test Mode : %x\n", config_ptr->testmode );
        }
    }
    else if (MATCH("debug", "fit_code"))
    {
        if ( _fit_code_known ( number ) == false )
        {
            elog ("[debug] fit_code %d has no fault insertion point\n", number );
            return (FAIL_INVALID_DATA);
        }
        config_ptr->fit_code = number ;
        if ( config_ptr->fit_code )
        {
            ilog ("   FIT Code : %d\n", config_ptr->fit_code );
        }
    }
    return (PASS);
}
