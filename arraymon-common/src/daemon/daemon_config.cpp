/*
* Copyright (c) 2013-2014, 2016 Wind River Systems, Inc.
*
* SPDX-License-Identifier: Apache-2.0
*
*/


#include <iostream>
#include <stdio.h>
#include <string.h>
#include <stdlib.h>

using namespace std;

#include "daemon_ini.h"    /* Init parset header       */
#include "daemon_common.h" /* Common daemon header     */
#include "monBase.h"

/** The allocated memory for the daemon configuration */
static daemon_config_type __config ;

daemon_config_type * daemon_get_cfg_ptr ( void )
{
    return ( &__config );
}

void daemon_config_default ( daemon_config_type* config_ptr )
{
    /* init config struct */
    memset ( config_ptr, 0 , sizeof(daemon_config_type));

    config_ptr->array_port       = 80 ;
    config_ptr->api_version      = strdup("1.19");
    config_ptr->http_timeout     = 20 ;
    config_ptr->store_dir        = strdup("/var/lib/arraymon");
    config_ptr->capacity_warn    = 80 ;
    config_ptr->capacity_error   = 90 ;

    config_ptr->prov_url         = strdup("");
    config_ptr->prov_username    = strdup("");
    config_ptr->prov_passhash    = strdup("");
    config_ptr->prov_template_id = strdup("");
    config_ptr->prov_parent_id   = strdup("");
    config_ptr->prov_name_prefix = strdup("Volume ");
    config_ptr->prov_parameters  = strdup("--scope volume --volume %volume%");
    config_ptr->prov_property    = strdup("params");

    config_ptr->fit_name         = strdup("none");

    config_ptr->debug_all    = 0 ;
    config_ptr->debug_json   = 0 ;
    config_ptr->debug_http   = 0 ;
    config_ptr->debug_level  = 0 ;
    config_ptr->testmode     = 0 ;
    config_ptr->fit_code     = FIT_CODE__NONE ;
}

#define FREE_STR(_s_) { if ( _s_ ) { free ( _s_ ) ; _s_ = NULL ; } }

void daemon_config_free ( daemon_config_type * config_ptr )
{
    FREE_STR ( config_ptr->api_version      );
    FREE_STR ( config_ptr->store_dir        );
    FREE_STR ( config_ptr->prov_url         );
    FREE_STR ( config_ptr->prov_username    );
    FREE_STR ( config_ptr->prov_passhash    );
    FREE_STR ( config_ptr->prov_template_id );
    FREE_STR ( config_ptr->prov_parent_id   );
    FREE_STR ( config_ptr->prov_name_prefix );
    FREE_STR ( config_ptr->prov_parameters  );
    FREE_STR ( config_ptr->prov_property    );
    FREE_STR ( config_ptr->fit_name         );
}

/* Replace a strdup'ed config string */
void daemon_config_set_str ( char ** str_ptr, const char * value )
{
    if ( *str_ptr )
        free ( *str_ptr );
    *str_ptr = strdup ( value ? value : "" );
}

void daemon_dump_cfg ( void )
{
    daemon_config_type * ptr = daemon_get_cfg_ptr();

    ilog ("Array Port  : %d\n",       ptr->array_port );
    ilog ("API Version : %s\n",       ptr->api_version );
    ilog ("HTTP Timeout: %d secs\n",  ptr->http_timeout );
    ilog ("Store Dir   : %s\n",       ptr->store_dir );
    ilog ("Capacity    : warn:%d%% error:%d%%\n", ptr->capacity_warn, ptr->capacity_error );
    if ( ptr->prov_url && strlen(ptr->prov_url) )
    {
        ilog ("Prov URL    : %s\n",   ptr->prov_url );
        ilog ("Prov User   : %s\n",   ptr->prov_username );
        ilog ("Template    : %s (parent:%s)\n", ptr->prov_template_id, ptr->prov_parent_id );
        ilog ("Name Prefix : '%s'\n", ptr->prov_name_prefix );
        ilog ("Parameters  : %s:'%s'\n", ptr->prov_property, ptr->prov_parameters );
    }
    if ( ptr->testmode )
    {
        ilog ("FIT         : code:%d name:%s\n", ptr->fit_code, ptr->fit_name );
    }
}

void daemon_exit ( void )
{
    daemon_config_free ( daemon_get_cfg_ptr() );
    daemon_files_fini ();
}
