/*
 * Copyright (c) 2013-2017 Wind River Systems, Inc.
*
* SPDX-License-Identifier: Apache-2.0
*
 */

 /**
  * @file
  * Storage Array Monitor Configuration
  */

#include <iostream>
#include <string>
#include <stdlib.h>
#include <string.h>

using namespace std;

#ifdef  __AREA__
#undef  __AREA__
#endif
#define __AREA__ "cfg"

#include "daemon_ini.h"      /* for ... ini_parse , MATCH            */
#include "daemon_common.h"
#include "monUtil.h"
#include "arraymon.h"

/* percent limits outside 1..100 keep their default */
static void _load_percent ( int & limit, const char * name, const char * value )
{
    int percent = atoi ( value );
    if (( percent > 0 ) && ( percent <= 100 ))
        limit = percent ;
    else
    {
        wlog ("%s '%s' is not a percent ; keeping %d\n", name, value, limit );
    }
}

/*****************************************************************************
 *
 * Name       : arraymon_config_handler
 *
 * Description: ini_parse callback for the [config] , [provision] and
 *              [debug] sections. Unknown labels are ignored.
 *
 * Returns    : non-zero ; inih treats zero as a parse error.
 *
 *****************************************************************************/
static int arraymon_config_handler (       void * user,
                                     const char * section,
                                     const char * name,
                                     const char * value)
{
    daemon_config_type * config_ptr = (daemon_config_type*)user;

    if (MATCH("config", "array_port"))
    {
        config_ptr->array_port = atoi(value);
        config_ptr->mask |= CONFIG_ARRAY_PORT ;
    }
    else if (MATCH("config", "api_version"))
    {
        daemon_config_set_str ( &config_ptr->api_version, value );
        config_ptr->mask |= CONFIG_API_VERSION ;
    }
    else if (MATCH("config", "http_timeout"))
    {
        int timeout = atoi(value);
        if ( timeout > 0 )
            config_ptr->http_timeout = timeout ;
        config_ptr->mask |= CONFIG_HTTP_TIMEOUT ;
    }
    else if (MATCH("config", "store_dir"))
    {
        daemon_config_set_str ( &config_ptr->store_dir, value );
        config_ptr->mask |= CONFIG_STORE_DIR ;
    }
    else if (MATCH("config", "capacity_warn"))
    {
        _load_percent ( config_ptr->capacity_warn, name, value );
        config_ptr->mask |= CONFIG_CAPACITY_LIMITS ;
    }
    else if (MATCH("config", "capacity_error"))
    {
        _load_percent ( config_ptr->capacity_error, name, value );
        config_ptr->mask |= CONFIG_CAPACITY_LIMITS ;
    }
    else if (MATCH("provision", "url"))
    {
        daemon_config_set_str ( &config_ptr->prov_url, value );
        config_ptr->mask |= CONFIG_PROV_URL ;
    }
    else if (MATCH("provision", "username"))
    {
        daemon_config_set_str ( &config_ptr->prov_username, value );
        config_ptr->mask |= CONFIG_PROV_CREDS ;
    }
    else if (MATCH("provision", "passhash"))
    {
        daemon_config_set_str ( &config_ptr->prov_passhash, value );
        config_ptr->mask |= CONFIG_PROV_CREDS ;
    }
    else if (MATCH("provision", "template_id"))
    {
        daemon_config_set_str ( &config_ptr->prov_template_id, value );
        config_ptr->mask |= CONFIG_PROV_TEMPLATE ;
    }
    else if (MATCH("provision", "parent_id"))
    {
        daemon_config_set_str ( &config_ptr->prov_parent_id, value );
        config_ptr->mask |= CONFIG_PROV_TEMPLATE ;
    }
    else if (MATCH("provision", "name_prefix"))
    {
        daemon_config_set_str ( &config_ptr->prov_name_prefix, value );
    }
    else if (MATCH("provision", "parameters"))
    {
        daemon_config_set_str ( &config_ptr->prov_parameters, value );
    }
    else if (MATCH("provision", "property"))
    {
        if ( strlen ( value ) )
            daemon_config_set_str ( &config_ptr->prov_property, value );
    }
    else if ( strcmp ( section, "debug" ) == 0 )
    {
        if ( debug_config_handler ( user, section, name, value ) != PASS )
            return (0);
    }
    return (1);
}

/*****************************************************************************
 *
 * Name       : daemon_configure
 *
 * Description: Load the config file over the defaults. A missing file
 *              leaves the defaults in place.
 *
 *****************************************************************************/
int daemon_configure ( const char * config_file )
{
    daemon_config_type * config_ptr = daemon_get_cfg_ptr ();

    if (( config_file == NULL ) || ( strlen ( config_file ) == 0 ))
    {
        slog ("no config file specified\n");
        return (FAIL_STRING_EMPTY);
    }

    if ( daemon_is_file_present ( config_file ) == false )
    {
        wlog ("%s not found ; using defaults\n", config_file );
        return (PASS);
    }

    int rc = ini_parse ( config_file, arraymon_config_handler, config_ptr );
    if ( rc != 0 )
    {
        if ( rc > 0 )
        {
            elog ("%s parse error on line %d\n", config_file, rc );
        }
        else
        {
            elog ("%s could not be read (%d)\n", config_file, rc );
        }
        return (FAIL_LOAD_INI);
    }

    if ( config_ptr->capacity_warn > config_ptr->capacity_error )
    {
        wlog ("capacity warning limit %d%% is above the error limit %d%%\n",
                  config_ptr->capacity_warn, config_ptr->capacity_error );
    }
    return (PASS);
}

void arraymon_ctrl_init ( arraymon_ctrl_type & ctrl )
{
    ctrl.array_ip.clear();
    ctrl.array_port = 80 ;
    ctrl.username.clear();
    ctrl.password.clear();
    ctrl.api_key.clear();
    ctrl.prefix.clear();
    ctrl.timeout    = 20 ;
    ctrl.array_name.clear();

    ctrl.scope = ARRAYMON_SCOPE__NONE ;
    ctrl.volume.clear();

    ctrl.capacity_warn  = 80 ;
    ctrl.capacity_error = 90 ;

    ctrl.store_dir.clear();

    ctrl.prov_url.clear();
    ctrl.prov_username.clear();
    ctrl.prov_passhash.clear();
    ctrl.prov_template_id.clear();
    ctrl.prov_parent_id.clear();
    ctrl.prov_name_prefix.clear();
    ctrl.prov_parameters.clear();
    ctrl.prov_property.clear();

    ctrl.failure    = ARRAYMON_FAILURE__NONE ;
    ctrl.failure_rc = PASS ;
    ctrl.failure_text.clear();
}

/* strdup'ed config strings may be NULL after a free */
static string _cfg_str ( const char * str_ptr )
{
    return ( str_ptr ? string(str_ptr) : string("") );
}

void arraymon_ctrl_load ( arraymon_ctrl_type & ctrl, daemon_config_type * cfg_ptr )
{
    if ( cfg_ptr == NULL )
    {
        slog ("null config pointer\n");
        return ;
    }

    ctrl.array_port     = cfg_ptr->array_port ;
    ctrl.timeout        = cfg_ptr->http_timeout ;
    ctrl.capacity_warn  = cfg_ptr->capacity_warn ;
    ctrl.capacity_error = cfg_ptr->capacity_error ;
    ctrl.store_dir      = _cfg_str ( cfg_ptr->store_dir );

    ctrl.prefix = ARRAYMON_API_PREFIX ;
    ctrl.prefix.append ( _cfg_str ( cfg_ptr->api_version ));

    ctrl.prov_url         = _cfg_str ( cfg_ptr->prov_url         );
    ctrl.prov_username    = _cfg_str ( cfg_ptr->prov_username    );
    ctrl.prov_passhash    = _cfg_str ( cfg_ptr->prov_passhash    );
    ctrl.prov_template_id = _cfg_str ( cfg_ptr->prov_template_id );
    ctrl.prov_parent_id   = _cfg_str ( cfg_ptr->prov_parent_id   );
    ctrl.prov_name_prefix = _cfg_str ( cfg_ptr->prov_name_prefix );
    ctrl.prov_parameters  = _cfg_str ( cfg_ptr->prov_parameters  );
    ctrl.prov_property    = _cfg_str ( cfg_ptr->prov_property    );
}

arraymon_scope_enum arraymon_scope_parse ( string scope )
{
    string s = tolowercase ( trim_whitespace ( scope ));

    if      ( s == "capacity"    ) return ( ARRAYMON_SCOPE__CAPACITY    );
    else if ( s == "performance" ) return ( ARRAYMON_SCOPE__PERFORMANCE );
    else if ( s == "hardware"    ) return ( ARRAYMON_SCOPE__HARDWARE    );
    else if ( s == "drive"       ) return ( ARRAYMON_SCOPE__DRIVE       );
    else if ( s == "volume"      ) return ( ARRAYMON_SCOPE__VOLUME      );
    else if ( s == "volumemgmt"  ) return ( ARRAYMON_SCOPE__VOLUMEMGMT  );

    return ( ARRAYMON_SCOPE__NONE );
}

const char * arraymon_scope_name ( arraymon_scope_enum scope )
{
    switch ( scope )
    {
        case ARRAYMON_SCOPE__CAPACITY:    return ("capacity");
        case ARRAYMON_SCOPE__PERFORMANCE: return ("performance");
        case ARRAYMON_SCOPE__HARDWARE:    return ("hardware");
        case ARRAYMON_SCOPE__DRIVE:       return ("drive");
        case ARRAYMON_SCOPE__VOLUME:      return ("volume");
        case ARRAYMON_SCOPE__VOLUMEMGMT:  return ("volumemgmt");
        case ARRAYMON_SCOPE__NONE:
        case ARRAYMON_SCOPE__LAST:
            break ;
    }
    return ("none");
}
