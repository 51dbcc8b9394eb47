/*
 * Copyright (c) 2013-2017 Wind River Systems, Inc.
*
* SPDX-License-Identifier: Apache-2.0
*
 */

 /**
  * @file
  * Storage Array Monitor Service Run
  *
  * One run :
  *
  *   config file -> command line overrides -> validate
  *   -> array login -> array name -> scope -> one document on stdout
  */

#include <iostream>
#include <string>
#include <list>
#include <stdio.h>

using namespace std;

#ifdef  __AREA__
#undef  __AREA__
#endif
#define __AREA__ "run"

#include "daemon_option.h"   /* for ... daemon_get_opts_ptr         */
#include "daemon_common.h"
#include "monUtil.h"
#include "provHttp.h"        /* for ... provHttpClass               */
#include "arraymonScope.h"

/* command line values override config file values */
static void _load_opts ( arraymon_ctrl_type & ctrl, opts_type * opts_ptr )
{
    ctrl.array_ip = opts_ptr->array ;
    if ( opts_ptr->port )
        ctrl.array_port = opts_ptr->port ;

    ctrl.username = opts_ptr->username ;
    ctrl.password = opts_ptr->password ;
    ctrl.api_key  = opts_ptr->apikey   ;
    ctrl.scope    = arraymon_scope_parse ( opts_ptr->scope );
    ctrl.volume   = opts_ptr->volume   ;

    if ( !opts_ptr->prov_url.empty() )
        ctrl.prov_url = opts_ptr->prov_url ;
    if ( !opts_ptr->prov_user.empty() )
        ctrl.prov_username = opts_ptr->prov_user ;
    if ( !opts_ptr->prov_hash.empty() )
        ctrl.prov_passhash = opts_ptr->prov_hash ;
    if ( !opts_ptr->prov_template.empty() )
        ctrl.prov_template_id = opts_ptr->prov_template ;
    if ( !opts_ptr->prov_group.empty() )
        ctrl.prov_parent_id = opts_ptr->prov_group ;
}

static int _run_scope ( arraymon_ctrl_type & ctrl, list<prtg_result_type> & results )
{
    int rc = arraymon_connect ( ctrl );
    if ( rc != PASS )
        return (rc);

    if ( ctrl.scope != ARRAYMON_SCOPE__VOLUMEMGMT )
        return ( arraymon_query_scope ( ctrl, results ));

    provHttpClass prov ;
    rc = prov.configure ( ctrl.prov_url,
                          ctrl.prov_username,
                          ctrl.prov_passhash,
                          ctrl.prov_property,
                          ctrl.timeout );
    if ( rc != PASS )
    {
        return ( arraymon_fail ( ctrl, ARRAYMON_FAILURE__CONFIG, rc,
                                 "invalid provisioning url or credentials" ));
    }
    return ( arraymon_volumemgmt ( ctrl, &arraymon_array_volume_list, prov, results ));
}

/*****************************************************************************
 *
 * Name       : daemon_service_run
 *
 * Description: Run the requested scope and print its document.
 *
 * Returns    : the process exit code
 *
 *****************************************************************************/
int daemon_service_run ( void )
{
    opts_type * opts_ptr = daemon_get_opts_ptr ();
    arraymon_ctrl_type     ctrl    ;
    list<prtg_result_type> results ;

    arraymon_ctrl_init ( ctrl );
    arraymon_ctrl_load ( ctrl, daemon_get_cfg_ptr() );
    _load_opts ( ctrl, opts_ptr );

    daemon_dump_cfg ();

    if ( opts_ptr->bad_arg )
    {
        arraymon_fail ( ctrl, ARRAYMON_FAILURE__CONFIG, FAIL_BAD_PARM,
                        "invalid command line or config file" );
    }
    else if ( arraymon_ctrl_validate ( ctrl ) == PASS )
    {
        ilog ("%s '%s' scope\n", ctrl.array_ip.c_str(), arraymon_scope_name ( ctrl.scope ));
        if ( _run_scope ( ctrl, results ) == PASS )
        {
            ilog ("%s '%s' scope complete with %ld results\n",
                      ctrl.array_name.c_str(),
                      arraymon_scope_name ( ctrl.scope ),
                      (long)results.size());
        }
    }

    string document = arraymon_document ( ctrl, results );
    fprintf ( stdout, "%s\n", document.c_str());
    fflush  ( stdout );

    int exit_code = arraymon_exit_code ( ctrl );
    if ( exit_code != ARRAYMON_EXIT__OK )
    {
        elog ("%s '%s' scope failed ; exit code %d\n",
                  ctrl.array_ip.c_str(),
                  arraymon_scope_name ( ctrl.scope ),
                  exit_code );
    }
    return ( exit_code );
}
