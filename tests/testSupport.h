#ifndef __INCLUDE_TESTSUPPORT_H__
#define __INCLUDE_TESTSUPPORT_H__
/*
 * Copyright (c) 2013-2017 Wind River Systems, Inc.
*
* SPDX-License-Identifier: Apache-2.0
*
 */

#include <iostream>
#include <string>
#include <list>
#include <set>

using namespace std;

#include "monUtil.h"
#include "provBackend.h"
#include "sensorStore.h"

/* mkdtemp under /tmp ; empty on failure */
string test_make_dir     ( void );
void   test_remove_dir   ( string dir );
void   test_write_file   ( string filename, string data );

/* reset the global daemon config to its defaults */
void   test_config_default ( void );

/** Records every call ; fails the ones it is told to */
class testProvBackend : public provBackend
{
    public:

    testProvBackend ( void );

    list<string> calls ;       /**< "clone:<name>" "params:<id>:<params>" "enable:<id>" "delete:<id>" */
    set<string>  fail_clone  ; /**< by new instance name */
    set<string>  fail_params ; /**< by instance id       */
    set<string>  fail_enable ;
    set<string>  fail_delete ;

    int    next_id ;
    string clone_template ;
    string clone_parent   ;

    /* when set ; count configure calls for instances not yet on disk */
    sensorStore_type * store_ptr ;
    int configured_before_recorded ;

    int clone_instance  ( string template_id,
                          string new_name,
                          string parent_id,
                          string & new_instance_id );
    int set_parameters  ( string instance_id, string parameters );
    int enable_instance ( string instance_id );
    int delete_instance ( string instance_id );

    /* calls that start with 'prefix' */
    int count ( string prefix );
};

#endif /* __INCLUDE_TESTSUPPORT_H__ */
