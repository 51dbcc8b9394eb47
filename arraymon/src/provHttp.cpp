/*
 * Copyright (c) 2015-2017 Wind River Systems, Inc.
*
* SPDX-License-Identifier: Apache-2.0
*
 */

 /**
  * @file
  * Storage Array Monitor Monitor Provisioning HTTP client
  */

#include <iostream>
#include <string>

using namespace std;

#ifdef  __AREA__
#undef  __AREA__
#endif
#define __AREA__ "prv"

#include "monUtil.h"
#include "daemon_common.h"   /* for ... daemon_want_fit             */
#include "arraymon.h"        /* for ... ARRAYMON_USER_AGENT         */
#include "provHttp.h"

/*****************************************************************************
 *
 * Name       : provHttp_handler
 *
 * Description: Called with the response of a successful provisioning
 *              request. The clone's new instance id is the id query
 *              value of the redirect Location.
 *
 *****************************************************************************/
int provHttp_handler ( libEvent & event )
{
    int rc = PASS ;

    if ( event.status )
    {
        elog ("%s handler called with existing error (status:%d)\n",
                  event.log_prefix.c_str(), event.status );
        return ( event.status );
    }

    switch ( event.request )
    {
        case PROV_CLONE_INSTANCE:
        {
            if ( event.location.empty() )
            {
                elog ("%s clone response has no Location header (http:%d)\n",
                          event.entity.c_str(), event.http_status );
                rc = FAIL_INVALID_DATA ;
                break ;
            }
            if ( httpUtil_query_value ( event.location, PROV_LOCATION_ID, event.new_id ) != PASS )
            {
                elog ("%s clone Location '%s' has no id\n",
                          event.entity.c_str(), event.location.c_str());
                rc = FAIL_INVALID_DATA ;
                break ;
            }
            dlog ("%s cloned as instance %s\n", event.entity.c_str(), event.new_id.c_str());
            break ;
        }
        case PROV_SET_PARAMETERS:
        case PROV_ENABLE_INSTANCE:
        case PROV_DELETE_INSTANCE:
        {
            jlog ("%s Response: %s\n", event.log_prefix.c_str(), event.response.c_str());
            break ;
        }
        default:
        {
            slog ("%s unsupported provisioning request (%d)\n",
                      event.log_prefix.c_str(), event.request );
            rc = FAIL_BAD_CASE ;
            break ;
        }
    }
    return (rc);
}

provHttpClass::provHttpClass ( void )
{
    port       = 80    ;
    timeout    = HTTP_DEFAULT_TIMEOUT ;
    configured = false ;
    httpUtil_event_init ( &event, PROV_SIG, "provHttp", "", 0 );
}

provHttpClass::~provHttpClass ( void )
{
    httpUtil_free_base ( event );
}

int provHttpClass::configure ( string url,
                               string username,
                               string passhash,
                               string property,
                               int    timeout )
{
    int rc = httpUtil_url_parse ( url, this->ip, this->port, this->path );
    if ( rc != PASS )
    {
        elog ("invalid provisioning url '%s'\n", url.c_str());
        configured = false ;
        return (rc);
    }
    if ( username.empty() || passhash.empty() )
    {
        elog ("provisioning username and passhash are required\n");
        configured = false ;
        return (FAIL_AUTHENTICATION);
    }

    this->username = username ;
    this->passhash = passhash ;
    this->property = property.empty() ? "params" : property ;
    this->timeout  = ( timeout > 0 ) ? timeout : HTTP_DEFAULT_TIMEOUT ;
    configured     = true ;

    ilog ("provisioning %s:%d%s as %s\n", this->ip.c_str(), this->port,
              this->path.c_str(), this->username.c_str());
    return (PASS);
}

int provHttpClass::request ( libEvent_enum request,
                             string        operation,
                             string        entity,
                             string        api,
                             string        query,
                             bool          accept_redirect )
{
    if ( configured == false )
    {
        slog ("%s provisioning not configured\n", entity.c_str());
        return (FAIL_OPERATION);
    }

    httpUtil_event_init ( &event, PROV_SIG, "provHttp", ip, port );

    event.request         = request ;
    event.operation       = operation ;
    event.entity          = entity ;
    event.type            = EVHTTP_REQ_GET ;
    event.timeout         = timeout ;
    event.accept_redirect = accept_redirect ;
    event.handler         = &provHttp_handler ;
    event.user_agent      = ARRAYMON_USER_AGENT ;

    event.address = path ;
    event.address.append ( api );
    event.address.append ("?");
    event.address.append ( query );
    event.address.append ("&username=");
    event.address.append ( httpUtil_uri_encode ( username ));
    event.address.append ("&passhash=");
    event.address.append ( httpUtil_uri_encode ( passhash ));

    int rc = httpUtil_api_request ( event );
    if ( rc != PASS )
    {
        elog ("%s %s failed (rc:%d) (http:%d)\n",
                  entity.c_str(), operation.c_str(), rc, event.http_status );
    }
    return (rc);
}

int provHttpClass::clone_instance ( string template_id,
                                    string new_name,
                                    string parent_id,
                                    string & new_instance_id )
{
    new_instance_id.clear();

    if ( daemon_want_fit ( FIT_CODE__PROV__CLONE_FAIL, new_name ))
        return (FAIL_FIT);

    string query = "id=" ;
    query.append ( httpUtil_uri_encode ( template_id ));
    query.append ("&name=");
    query.append ( httpUtil_uri_encode ( new_name ));
    query.append ("&targetid=");
    query.append ( httpUtil_uri_encode ( parent_id ));

    int rc = request ( PROV_CLONE_INSTANCE, "clone", new_name, PROV_API_CLONE, query, true );
    if ( rc == PASS )
    {
        new_instance_id = event.new_id ;
    }
    return (rc);
}

int provHttpClass::set_parameters ( string instance_id, string parameters )
{
    if ( daemon_want_fit ( FIT_CODE__PROV__SET_PARAMS_FAIL, instance_id ))
        return (FAIL_FIT);

    string query = "id=" ;
    query.append ( httpUtil_uri_encode ( instance_id ));
    query.append ("&name=");
    query.append ( httpUtil_uri_encode ( property ));
    query.append ("&value=");
    query.append ( httpUtil_uri_encode ( parameters ));

    return ( request ( PROV_SET_PARAMETERS, "set parameters", instance_id,
                       PROV_API_SET_PROPERTY, query, false ));
}

int provHttpClass::enable_instance ( string instance_id )
{
    if ( daemon_want_fit ( FIT_CODE__PROV__ENABLE_FAIL, instance_id ))
        return (FAIL_FIT);

    string query = "id=" ;
    query.append ( httpUtil_uri_encode ( instance_id ));
    query.append ("&action=1");

    return ( request ( PROV_ENABLE_INSTANCE, "enable", instance_id,
                       PROV_API_PAUSE, query, true ));
}

int provHttpClass::delete_instance ( string instance_id )
{
    if ( daemon_want_fit ( FIT_CODE__PROV__DELETE_FAIL, instance_id ))
        return (FAIL_FIT);

    string query = "id=" ;
    query.append ( httpUtil_uri_encode ( instance_id ));
    query.append ("&approve=1");

    return ( request ( PROV_DELETE_INSTANCE, "delete", instance_id,
                       PROV_API_DELETE, query, true ));
}
