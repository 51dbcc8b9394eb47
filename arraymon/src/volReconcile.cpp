/*
 * Copyright (c) 2013-2017 Wind River Systems, Inc.
*
* SPDX-License-Identifier: Apache-2.0
*
 */

 /**
  * @file
  * Storage Array Monitor Volume Sensor Reconciler
  */

#include <iostream>
#include <string>
#include <list>
#include <set>

using namespace std;

#ifdef  __AREA__
#undef  __AREA__
#endif
#define __AREA__ "rec"

#include "monUtil.h"
#include "volReconcile.h"

void volReconcile_counts_init ( volReconcile_counts_type & counts )
{
    counts.planned_creates   = 0 ;
    counts.planned_deletes   = 0 ;
    counts.completed_creates = 0 ;
    counts.completed_deletes = 0 ;
    counts.incomplete        = 0 ;
    counts.failed            = 0 ;
}

void volReconcile_plan ( const list<string>     & volumes,
                         const sensor_map_type  & known,
                         volReconcile_plan_type & plan )
{
    plan.creates.clear();
    plan.deletes.clear();
    plan.matched = 0 ;

    sensor_map_type unmatched_known = known ;
    set<string>     seen ;

    for ( list<string>::const_iterator iter = volumes.begin() ; iter != volumes.end() ; ++iter )
    {
        if ( iter->empty() )
        {
            wlog ("array listed a volume with no name ; ignored\n");
            continue ;
        }
        if ( seen.insert ( *iter ).second == false )
        {
            dlog ("%s listed more than once\n", iter->c_str());
            continue ;
        }
        if ( known.find ( *iter ) != known.end() )
        {
            unmatched_known.erase ( *iter );
            plan.matched++ ;
            dlog2 ("%s already monitored\n", iter->c_str());
        }
        else
        {
            plan.creates.push_back ( *iter );
        }
    }

    for ( sensor_map_type::iterator iter  = unmatched_known.begin() ;
                                    iter != unmatched_known.end() ; ++iter )
    {
        volReconcile_delete_type del ;
        del.volume_name = iter->first  ;
        del.instance_id = iter->second ;
        plan.deletes.push_back ( del );
    }
}

string volReconcile_parameters ( string parameter_template, string volume_name )
{
    string parameters = parameter_template ;
    if ( string_replace ( parameters, VOLUME_PARAM_TOKEN, volume_name ) == 0 )
    {
        parameters.append ( VOLUME_PARAM_OPTION );
        parameters.append ( volume_name );
    }
    return ( parameters );
}

/*****************************************************************************
 *
 * Name       : _create_one
 *
 * Description: Clone, record, configure and enable the monitor
 *              instance of one volume.
 *
 *              The store write comes straight after the clone so a
 *              cloned instance is never left unrecorded unless that
 *              write itself fails.
 *
 *****************************************************************************/
static void _create_one ( string                     volume_name,
                          sensorStore_type         & store,
                          provBackend              & backend,
                          volReconcile_cfg_type    & cfg,
                          volReconcile_counts_type & counts )
{
    /* a name the store can't hold would be cloned again every run */
    int rc = sensorStore_validate_name ( volume_name );
    if ( rc != PASS )
    {
        elog ("%s can't be recorded ; not monitored\n", volume_name.c_str());
        counts.failed++ ;
        return ;
    }

    string instance_name = cfg.name_prefix ;
    instance_name.append ( volume_name );

    string instance_id ;
    rc = backend.clone_instance ( cfg.template_id, instance_name, cfg.parent_id, instance_id );
    if ( rc != PASS )
    {
        elog ("%s clone of template %s failed (rc:%d) ; retry next run\n",
                  volume_name.c_str(), cfg.template_id.c_str(), rc );
        counts.failed++ ;
        return ;
    }
    if ( instance_id.empty() )
    {
        elog ("%s clone returned no instance id ; retry next run\n", volume_name.c_str());
        counts.failed++ ;
        return ;
    }

    rc = sensorStore_put ( store, volume_name, instance_id );
    if ( rc != PASS )
    {
        elog ("%s instance %s is orphaned ; store write failed (rc:%d)\n",
                  volume_name.c_str(), instance_id.c_str(), rc );
        counts.failed++ ;
        return ;
    }

    rc = backend.set_parameters ( instance_id, volReconcile_parameters ( cfg.parameters, volume_name ));
    if ( rc != PASS )
    {
        elog ("%s instance %s created but not configured ; set parameters failed (rc:%d)\n",
                  volume_name.c_str(), instance_id.c_str(), rc );
        counts.incomplete++ ;
        counts.failed++ ;
        return ;
    }

    rc = backend.enable_instance ( instance_id );
    if ( rc != PASS )
    {
        elog ("%s instance %s created but not enabled (rc:%d)\n",
                  volume_name.c_str(), instance_id.c_str(), rc );
        counts.incomplete++ ;
        counts.failed++ ;
        return ;
    }

    ilog ("%s monitored by instance %s\n", volume_name.c_str(), instance_id.c_str());
    counts.completed_creates++ ;
}

static void _delete_one ( volReconcile_delete_type & del,
                          sensorStore_type         & store,
                          provBackend              & backend,
                          volReconcile_counts_type & counts )
{
    int rc = backend.delete_instance ( del.instance_id );
    if ( rc != PASS )
    {
        elog ("%s instance %s delete failed (rc:%d) ; retry next run\n",
                  del.volume_name.c_str(), del.instance_id.c_str(), rc );
        counts.failed++ ;
        return ;
    }

    rc = sensorStore_remove ( store, del.volume_name );
    if ( rc != PASS )
    {
        /* the delete is repeated next run against a missing instance */
        elog ("%s instance %s deleted but still recorded (rc:%d)\n",
                  del.volume_name.c_str(), del.instance_id.c_str(), rc );
        counts.failed++ ;
        return ;
    }

    ilog ("%s gone ; instance %s deleted\n", del.volume_name.c_str(), del.instance_id.c_str());
    counts.completed_deletes++ ;
}

int volReconcile_execute ( volReconcile_plan_type   & plan,
                           sensorStore_type         & store,
                           provBackend              & backend,
                           volReconcile_cfg_type    & cfg,
                           volReconcile_counts_type & counts )
{
    if ( store.loaded == false )
    {
        slog ("sensor store not loaded\n");
        return (FAIL_OPERATION);
    }

    counts.planned_creates = (int)plan.creates.size();
    counts.planned_deletes = (int)plan.deletes.size();

    for ( list<string>::iterator iter = plan.creates.begin() ; iter != plan.creates.end() ; ++iter )
    {
        _create_one ( *iter, store, backend, cfg, counts );
    }

    for ( list<volReconcile_delete_type>::iterator iter  = plan.deletes.begin() ;
                                                   iter != plan.deletes.end() ; ++iter )
    {
        _delete_one ( *iter, store, backend, counts );
    }
    return (PASS);
}

int volReconcile_run ( const list<string>       & volumes,
                       sensorStore_type         & store,
                       provBackend              & backend,
                       volReconcile_cfg_type    & cfg,
                       volReconcile_counts_type & counts )
{
    volReconcile_plan_type plan ;

    volReconcile_counts_init ( counts );

    if ( store.loaded == false )
    {
        slog ("sensor store not loaded\n");
        return (FAIL_OPERATION);
    }

    volReconcile_plan ( volumes, store.records, plan );

    ilog ("%s %ld volumes ; %d monitored ; %ld to create ; %ld to delete\n",
              store.array_id.c_str(),
              (long)volumes.size(),
              plan.matched,
              (long)plan.creates.size(),
              (long)plan.deletes.size());

    int rc = volReconcile_execute ( plan, store, backend, cfg, counts );

    if ( counts.failed )
    {
        wlog ("%s reconcile: created %d of %d ; deleted %d of %d ; %d incomplete ; %d failed\n",
                  store.array_id.c_str(),
                  counts.completed_creates, counts.planned_creates,
                  counts.completed_deletes, counts.planned_deletes,
                  counts.incomplete, counts.failed );
    }
    else
    {
        ilog ("%s reconcile: created %d ; deleted %d\n",
                  store.array_id.c_str(),
                  counts.completed_creates,
                  counts.completed_deletes );
    }
    return (rc);
}
