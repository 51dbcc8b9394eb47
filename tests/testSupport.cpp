/*
 * Copyright (c) 2013-2017 Wind River Systems, Inc.
*
* SPDX-License-Identifier: Apache-2.0
*
 */

 /**
  * @file
  * Storage Array Monitor unit test support
  *
  * The log hooks the service main normally provides, plus the
  * temporary directory and fake provisioning helpers the tests share.
  */

#include <iostream>
#include <string>
#include <stdio.h>
#include <stdlib.h>
#include <unistd.h>
#include <dirent.h>
#include <sys/stat.h>

using namespace std;

#include "daemon_common.h"
#include "monBase.h"
#include "testSupport.h"

static char this_hostname [MAX_CHARS_HOSTNAME+2] = "testhost" ;

char * _hn ( void )
{
    return(&this_hostname[0]);
}

void set_hn ( char * hn )
{
    snprintf ( &this_hostname[0], MAX_CHARS_HOSTNAME+1, "%s", hn ? hn : "localhost" );
}

/* test logs go to the console */
bool ltc ( void )
{
    return (true);
}

string test_make_dir ( void )
{
    char templ[] = "/tmp/arraymon_test_XXXXXX" ;
    char * dir_ptr = mkdtemp ( templ );
    if ( dir_ptr == NULL )
        return ("");
    return ( string(dir_ptr) );
}

void test_remove_dir ( string dir )
{
    if ( dir.empty() )
        return ;

    DIR * dir_ptr = opendir ( dir.data() );
    if ( dir_ptr )
    {
        struct dirent * entry_ptr ;
        while (( entry_ptr = readdir ( dir_ptr )) != NULL )
        {
            string name = entry_ptr->d_name ;
            if (( name == "." ) || ( name == ".." ))
                continue ;

            string path = dir + "/" + name ;
            if ( daemon_is_dir_present ( path.data() ))
                test_remove_dir ( path );
            else
                unlink ( path.data() );
        }
        closedir ( dir_ptr );
    }
    rmdir ( dir.data() );
}

void test_write_file ( string filename, string data )
{
    FILE * file_ptr = fopen ( filename.data(), "w" );
    if ( file_ptr )
    {
        fputs ( data.data(), file_ptr );
        fclose ( file_ptr );
    }
}

void test_config_default ( void )
{
    daemon_config_type * cfg_ptr = daemon_get_cfg_ptr();
    daemon_config_free    ( cfg_ptr );
    daemon_config_default ( cfg_ptr );
}

/*****************************************************************************
 *
 * Recording provisioning backend
 *
 *****************************************************************************/

testProvBackend::testProvBackend ( void )
{
    next_id   = 1000 ;
    store_ptr = NULL ;
    configured_before_recorded = 0 ;
}

int testProvBackend::clone_instance ( string template_id,
                                      string new_name,
                                      string parent_id,
                                      string & new_instance_id )
{
    calls.push_back ( "clone:" + new_name );
    new_instance_id.clear();

    if ( fail_clone.count ( new_name ))
        return (FAIL_TIMEOUT);

    new_instance_id = itos ( next_id++ );
    clone_template = template_id ;
    clone_parent   = parent_id ;
    return (PASS);
}

int testProvBackend::set_parameters ( string instance_id, string parameters )
{
    calls.push_back ( "params:" + instance_id + ":" + parameters );

    /* the instance must be on disk before it is configured */
    if ( store_ptr )
    {
        string data ;
        sensor_map_type records ;
        bool recorded = false ;
        if (( daemon_read_file ( store_ptr->filename.data(), data ) == PASS ) &&
            ( sensorStore_parse ( data, records ) == PASS ))
        {
            for ( sensor_map_type::iterator iter = records.begin() ; iter != records.end() ; ++iter )
                if ( iter->second == instance_id )
                    recorded = true ;
        }
        if ( recorded == false )
            configured_before_recorded++ ;
    }

    if ( fail_params.count ( instance_id ))
        return (FAIL_HTTP_ZERO_STATUS);
    return (PASS);
}

int testProvBackend::enable_instance ( string instance_id )
{
    calls.push_back ( "enable:" + instance_id );
    if ( fail_enable.count ( instance_id ))
        return (FAIL_CONNECT);
    return (PASS);
}

int testProvBackend::delete_instance ( string instance_id )
{
    calls.push_back ( "delete:" + instance_id );
    if ( fail_delete.count ( instance_id ))
        return (FAIL_TIMEOUT);
    return (PASS);
}

int testProvBackend::count ( string prefix )
{
    int n = 0 ;
    for ( list<string>::iterator iter = calls.begin() ; iter != calls.end() ; ++iter )
        if ( iter->compare ( 0, prefix.length(), prefix ) == 0 )
            n++ ;
    return (n);
}
