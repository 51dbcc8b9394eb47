/*
 * Copyright (c) 2013, 2015-2017 Wind River Systems, Inc.
*
* SPDX-License-Identifier: Apache-2.0
*
 */

 /**
  * @file
  * Storage Array Monitor array REST API queries
  */

#include <iostream>
#include <string>
#include <list>

using namespace std;

#ifdef  __AREA__
#undef  __AREA__
#endif
#define __AREA__ "arh"

#include "monUtil.h"
#include "daemon_common.h"   /* for ... daemon_want_fit             */
#include "tokenUtil.h"       /* for ... tokenUtil_new_token         */
#include "arrayJson.h"       /* for ... arrayJson_load_xxx          */
#include "arrayHttp.h"

int arrayHttp_login ( libEvent & event, arraymon_ctrl_type & ctrl )
{
    tokenUtil_cred_type cred ;

    cred.ip       = ctrl.array_ip   ;
    cred.port     = ctrl.array_port ;
    cred.prefix   = ctrl.prefix     ;
    cred.username = ctrl.username   ;
    cred.password = ctrl.password   ;
    cred.api_key  = ctrl.api_key    ;
    cred.timeout  = ctrl.timeout    ;

    int rc = tokenUtil_new_token ( event, cred );
    if ( rc != PASS )
    {
        elog ("%s array login failed (rc:%d)\n", ctrl.array_ip.c_str(), rc );
    }
    return (rc);
}

int arrayHttp_handler ( libEvent & event )
{
    if ( event.status )
    {
        elog ("%s handler called with existing error (status:%d)\n",
                  event.log_prefix.c_str(), event.status );
        return ( event.status );
    }
    if ( event.response.empty() )
    {
        elog ("%s query returned no content (http:%d)\n",
                  event.log_prefix.c_str(), event.http_status );
        return ( FAIL_JSON_ZERO_LEN );
    }
    jlog ("%s Response: %s\n", event.log_prefix.c_str(), event.response.c_str());
    return (PASS);
}

/*****************************************************************************
 *
 * Name       : _array_get
 *
 * Description: Issue one blocking GET of <prefix>/<label> with the
 *              session cookie and leave the response in the event.
 *
 *****************************************************************************/
static int _array_get ( libEvent           & event,
                        arraymon_ctrl_type & ctrl,
                        libEvent_enum        request,
                        string               operation,
                        string               label )
{
    if ( daemon_want_fit ( FIT_CODE__ARRAY__QUERY_TIMEOUT, operation ))
    {
        slog ("%s FIT '%s' query timeout\n", ctrl.array_ip.c_str(), operation.c_str());
        return (FAIL_TIMEOUT);
    }

    httpUtil_event_init ( &event,
                           ctrl.array_ip,
                           "arrayHttp",
                           ctrl.array_ip,
                           ctrl.array_port );

    event.request    = request ;
    event.operation  = operation ;
    event.entity     = ctrl.array_name ;
    event.type       = EVHTTP_REQ_GET ;
    event.timeout    = ctrl.timeout ;
    event.handler    = &arrayHttp_handler ;
    event.user_agent = ARRAYMON_USER_AGENT ;
    event.token      = tokenUtil_get_token ();

    event.address = ctrl.prefix ;
    event.address.append ("/");
    event.address.append ( label );

    int rc = httpUtil_api_request ( event );
    if ( rc != PASS )
    {
        elog ("%s '%s' query failed (rc:%d) (http:%d)\n",
                  ctrl.array_ip.c_str(), operation.c_str(), rc, event.http_status );
    }
    return (rc);
}

int arrayHttp_get_array_name ( libEvent & event, arraymon_ctrl_type & ctrl, string & array_name )
{
    int rc = _array_get ( event, ctrl, ARRAY_GET_NAME, "array name", ARRAY_LABEL__ARRAY );
    if ( rc == PASS )
    {
        rc = arrayJson_load_array_name ( (char*)event.response.data(), array_name );
    }
    return (rc);
}

int arrayHttp_get_capacity ( libEvent & event, arraymon_ctrl_type & ctrl, array_capacity_type & capacity )
{
    int rc = _array_get ( event, ctrl, ARRAY_GET_CAPACITY, "capacity", ARRAY_LABEL__SPACE );
    if ( rc == PASS )
    {
        rc = arrayJson_load_capacity ( (char*)event.response.data(), capacity );
    }
    return (rc);
}

int arrayHttp_get_performance ( libEvent & event, arraymon_ctrl_type & ctrl, array_perf_type & perf )
{
    int rc = _array_get ( event, ctrl, ARRAY_GET_PERFORMANCE, "performance", ARRAY_LABEL__MONITOR );
    if ( rc == PASS )
    {
        rc = arrayJson_load_performance ( (char*)event.response.data(), perf );
    }
    return (rc);
}

int arrayHttp_get_hardware ( libEvent & event, arraymon_ctrl_type & ctrl, list<array_hw_type> & hw_list )
{
    int rc = _array_get ( event, ctrl, ARRAY_GET_HARDWARE, "hardware", ARRAY_LABEL__HARDWARE );
    if ( rc == PASS )
    {
        rc = arrayJson_load_hardware ( (char*)event.response.data(), hw_list );
    }
    return (rc);
}

int arrayHttp_get_drives ( libEvent & event, arraymon_ctrl_type & ctrl, list<array_drive_type> & drive_list )
{
    int rc = _array_get ( event, ctrl, ARRAY_GET_DRIVES, "drives", ARRAY_LABEL__DRIVE );
    if ( rc == PASS )
    {
        rc = arrayJson_load_drives ( (char*)event.response.data(), drive_list );
    }
    return (rc);
}

int arrayHttp_get_volume ( libEvent & event, arraymon_ctrl_type & ctrl, string name, array_volume_type & volume )
{
    if ( name.empty() )
    {
        elog ("%s volume query requires a volume name\n", ctrl.array_ip.c_str());
        return (FAIL_STRING_EMPTY);
    }

    string label = ARRAY_LABEL__VOLUME ;
    label.append ("/");
    label.append ( httpUtil_uri_encode ( name ));
    label.append ( ARRAY_QUERY__SPACE );

    int rc = _array_get ( event, ctrl, ARRAY_GET_VOLUME, "volume", label );
    if ( rc == PASS )
    {
        rc = arrayJson_load_volume ( (char*)event.response.data(), volume );
    }
    return (rc);
}

int arrayHttp_list_volumes ( libEvent & event, arraymon_ctrl_type & ctrl, list<string> & names )
{
    names.clear();
    int rc = _array_get ( event, ctrl, ARRAY_LIST_VOLUMES, "list volumes", ARRAY_LABEL__VOLUME );
    if ( rc == PASS )
    {
        rc = arrayJson_load_volume_names ( (char*)event.response.data(), names );
        if ( rc == PASS )
        {
            dlog ("%s lists %ld volumes\n", ctrl.array_name.c_str(), (long)names.size());
        }
    }
    return (rc);
}
