/*
 * Copyright (c) 2013-2017 Wind River Systems, Inc.
*
* SPDX-License-Identifier: Apache-2.0
*
 */

 /**
  * @file
  * Storage Array Monitor Scope Runners
  */

#include <iostream>
#include <string>
#include <list>

using namespace std;

#ifdef  __AREA__
#undef  __AREA__
#endif
#define __AREA__ "scp"

#include "monUtil.h"
#include "httpUtil.h"        /* for ... libEvent                    */
#include "arrayHttp.h"       /* for ... arrayHttp_get_xxx           */
#include "sensorStore.h"     /* for ... sensorStore_load            */
#include "volReconcile.h"    /* for ... volReconcile_run            */
#include "arraymonScope.h"

/* the event used for all array requests of a run */
static libEvent __array_event__ ;

int arraymon_array_volume_list ( arraymon_ctrl_type & ctrl, list<string> & names )
{
    return ( arrayHttp_list_volumes ( __array_event__, ctrl, names ));
}

int arraymon_fail ( arraymon_ctrl_type  & ctrl,
                    arraymon_failure_enum failure,
                    int                   rc,
                    string                text )
{
    /* the first failure is the one reported */
    if ( ctrl.failure == ARRAYMON_FAILURE__NONE )
    {
        ctrl.failure      = failure ;
        ctrl.failure_rc   = rc ;
        ctrl.failure_text = text ;
    }
    elog ("%s %s (rc:%d)\n", arraymon_failure_name ( failure ), text.c_str(), rc );
    return (rc);
}

const char * arraymon_failure_name ( arraymon_failure_enum failure )
{
    switch ( failure )
    {
        case ARRAYMON_FAILURE__NONE:   return ("None");
        case ARRAYMON_FAILURE__CONFIG: return ("ConfigError");
        case ARRAYMON_FAILURE__AUTH:   return ("AuthFailure");
        case ARRAYMON_FAILURE__QUERY:  return ("ArrayQueryFailure");
        case ARRAYMON_FAILURE__STORE:  return ("StoreUnavailable");
    }
    return ("Unknown");
}

/* a response that arrived but can't be used */
static bool _content_failure ( int rc )
{
    switch ( rc )
    {
        case FAIL_JSON_PARSE:
        case FAIL_JSON_OBJECT:
        case FAIL_JSON_ZERO_LEN:
        case FAIL_JSON_TOO_LONG:
        case FAIL_INVALID_DATA:
            return (true);
        default:
            break ;
    }
    return (false);
}

int arraymon_exit_code ( arraymon_ctrl_type & ctrl )
{
    switch ( ctrl.failure )
    {
        case ARRAYMON_FAILURE__NONE:
            return ( ARRAYMON_EXIT__OK );

        case ARRAYMON_FAILURE__CONFIG:
        case ARRAYMON_FAILURE__STORE:
            return ( ARRAYMON_EXIT__SYSTEM_ERROR );

        case ARRAYMON_FAILURE__AUTH:
            return ( ARRAYMON_EXIT__PROTOCOL_ERROR );

        case ARRAYMON_FAILURE__QUERY:
        {
            if ( _content_failure ( ctrl.failure_rc ))
                return ( ARRAYMON_EXIT__CONTENT_ERROR );
            return ( ARRAYMON_EXIT__PROTOCOL_ERROR );
        }
    }
    return ( ARRAYMON_EXIT__SYSTEM_ERROR );
}

string arraymon_document ( arraymon_ctrl_type & ctrl,
                           const list<prtg_result_type> & results )
{
    if ( ctrl.failure != ARRAYMON_FAILURE__NONE )
    {
        string text = arraymon_failure_name ( ctrl.failure );
        text.append (": ");
        text.append ( ctrl.failure_text );
        text.append (" (rc:");
        text.append ( itos ( ctrl.failure_rc ));
        text.append (")");
        return ( arrayFormat_error ( text ));
    }
    return ( arrayFormat_result ( results ));
}

int arraymon_ctrl_validate ( arraymon_ctrl_type & ctrl )
{
    if ( ctrl.scope == ARRAYMON_SCOPE__NONE )
    {
        return ( arraymon_fail ( ctrl, ARRAYMON_FAILURE__CONFIG, FAIL_BAD_PARM,
                                 "missing or unsupported scope" ));
    }
    if ( ctrl.array_ip.empty() )
    {
        return ( arraymon_fail ( ctrl, ARRAYMON_FAILURE__CONFIG, FAIL_BAD_PARM,
                                 "missing array address" ));
    }
    if (( ctrl.array_port <= 0 ) || ( ctrl.array_port > 65535 ))
    {
        return ( arraymon_fail ( ctrl, ARRAYMON_FAILURE__CONFIG, FAIL_BAD_PARM,
                                 "invalid array port " + itos(ctrl.array_port) ));
    }
    if ( ctrl.api_key.empty() && ( ctrl.username.empty() || ctrl.password.empty()))
    {
        return ( arraymon_fail ( ctrl, ARRAYMON_FAILURE__CONFIG, FAIL_BAD_PARM,
                                 "missing api key or username and password" ));
    }
    if (( ctrl.scope == ARRAYMON_SCOPE__VOLUME ) && ( ctrl.volume.empty() ))
    {
        return ( arraymon_fail ( ctrl, ARRAYMON_FAILURE__CONFIG, FAIL_BAD_PARM,
                                 "volume scope requires a volume name" ));
    }
    if ( ctrl.scope == ARRAYMON_SCOPE__VOLUMEMGMT )
    {
        if ( ctrl.store_dir.empty() )
        {
            return ( arraymon_fail ( ctrl, ARRAYMON_FAILURE__CONFIG, FAIL_BAD_PARM,
                                     "missing sensor store directory" ));
        }
        if ( ctrl.prov_url.empty() || ctrl.prov_username.empty() || ctrl.prov_passhash.empty() )
        {
            return ( arraymon_fail ( ctrl, ARRAYMON_FAILURE__CONFIG, FAIL_BAD_PARM,
                                     "missing provisioning url or credentials" ));
        }
        if ( ctrl.prov_template_id.empty() || ctrl.prov_parent_id.empty() )
        {
            return ( arraymon_fail ( ctrl, ARRAYMON_FAILURE__CONFIG, FAIL_BAD_PARM,
                                     "missing template or parent group id" ));
        }
    }
    return (PASS);
}

int arraymon_connect ( arraymon_ctrl_type & ctrl )
{
    int rc = arrayHttp_login ( __array_event__, ctrl );
    if ( rc != PASS )
    {
        return ( arraymon_fail ( ctrl, ARRAYMON_FAILURE__AUTH, rc,
                                 "array login to " + ctrl.array_ip + " failed" ));
    }

    rc = arrayHttp_get_array_name ( __array_event__, ctrl, ctrl.array_name );
    if ( rc != PASS )
    {
        return ( arraymon_fail ( ctrl, ARRAYMON_FAILURE__QUERY, rc,
                                 "array name query failed" ));
    }
    ilog ("%s is array '%s'\n", ctrl.array_ip.c_str(), ctrl.array_name.c_str());
    return (PASS);
}

int arraymon_volumemgmt ( arraymon_ctrl_type       & ctrl,
                          arraymon_volume_list_fn    list_fn,
                          provBackend              & backend,
                          list<prtg_result_type>   & results )
{
    list<string> volumes ;
    int rc ;

    if ( list_fn == NULL )
    {
        slog ("no volume list source\n");
        return ( arraymon_fail ( ctrl, ARRAYMON_FAILURE__CONFIG, FAIL_NULL_POINTER,
                                 "no volume list source" ));
    }

    rc = list_fn ( ctrl, volumes );
    if ( rc != PASS )
    {
        return ( arraymon_fail ( ctrl, ARRAYMON_FAILURE__QUERY, rc,
                                 "volume list query failed" ));
    }

    sensorStore_type store ;
    rc = sensorStore_load ( store, ctrl.store_dir, ctrl.array_name );
    if ( rc != PASS )
    {
        return ( arraymon_fail ( ctrl, ARRAYMON_FAILURE__STORE, rc,
                                 "sensor store of " + ctrl.array_name + " is unavailable" ));
    }

    volReconcile_cfg_type cfg ;
    cfg.template_id = ctrl.prov_template_id ;
    cfg.parent_id   = ctrl.prov_parent_id   ;
    cfg.name_prefix = ctrl.prov_name_prefix ;
    cfg.parameters  = ctrl.prov_parameters  ;

    volReconcile_counts_type counts ;
    rc = volReconcile_run ( volumes, store, backend, cfg, counts );
    if ( rc != PASS )
    {
        return ( arraymon_fail ( ctrl, ARRAYMON_FAILURE__STORE, rc,
                                 "sensor store of " + ctrl.array_name + " is unavailable" ));
    }

    results.push_back ( arrayFormat_scan_status ( VOLUME_SCAN_COMPLETE ));
    return (PASS);
}

int arraymon_query_scope ( arraymon_ctrl_type     & ctrl,
                           list<prtg_result_type> & results )
{
    int rc = PASS ;
    list<prtg_result_type> scope_results ;

    switch ( ctrl.scope )
    {
        case ARRAYMON_SCOPE__CAPACITY:
        {
            array_capacity_type capacity ;
            rc = arrayHttp_get_capacity ( __array_event__, ctrl, capacity );
            if ( rc == PASS )
                scope_results = arrayFormat_capacity ( capacity, ctrl.capacity_warn, ctrl.capacity_error );
            break ;
        }
        case ARRAYMON_SCOPE__PERFORMANCE:
        {
            array_perf_type perf ;
            rc = arrayHttp_get_performance ( __array_event__, ctrl, perf );
            if ( rc == PASS )
                scope_results = arrayFormat_performance ( perf );
            break ;
        }
        case ARRAYMON_SCOPE__HARDWARE:
        {
            list<array_hw_type> hw_list ;
            rc = arrayHttp_get_hardware ( __array_event__, ctrl, hw_list );
            if ( rc == PASS )
                scope_results = arrayFormat_hardware ( hw_list );
            break ;
        }
        case ARRAYMON_SCOPE__DRIVE:
        {
            list<array_drive_type> drive_list ;
            rc = arrayHttp_get_drives ( __array_event__, ctrl, drive_list );
            if ( rc == PASS )
                scope_results = arrayFormat_drives ( drive_list );
            break ;
        }
        case ARRAYMON_SCOPE__VOLUME:
        {
            array_volume_type volume ;
            rc = arrayHttp_get_volume ( __array_event__, ctrl, ctrl.volume, volume );
            if ( rc == PASS )
                scope_results = arrayFormat_volume ( volume );
            break ;
        }
        case ARRAYMON_SCOPE__VOLUMEMGMT:
        case ARRAYMON_SCOPE__NONE:
        case ARRAYMON_SCOPE__LAST:
        {
            slog ("'%s' is not a query scope\n", arraymon_scope_name ( ctrl.scope ));
            return ( arraymon_fail ( ctrl, ARRAYMON_FAILURE__CONFIG, FAIL_BAD_CASE,
                                     "unsupported scope" ));
        }
    }

    if ( rc != PASS )
    {
        string text = arraymon_scope_name ( ctrl.scope );
        text.append (" query failed");
        return ( arraymon_fail ( ctrl, ARRAYMON_FAILURE__QUERY, rc, text ));
    }

    results.splice ( results.end(), scope_results );
    return (PASS);
}
