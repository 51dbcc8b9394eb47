#ifndef __INCLUDE_VOLRECONCILE_H__
#define __INCLUDE_VOLRECONCILE_H__
/*
 * Copyright (c) 2013-2017 Wind River Systems, Inc.
*
* SPDX-License-Identifier: Apache-2.0
*
 */

 /**
  * @file
  * Storage Array Monitor Volume Sensor Reconciler
  *
  * Converges the monitor instances recorded in the sensor store with
  * the volumes the array currently reports.
  *
  *   array volume present , not in store  -> Create
  *   array volume present , in store      -> no action
  *   store record without an array volume -> Delete
  *
  * Create : clone -> store put -> set parameters -> enable
  * Delete : delete -> store remove
  *
  * A failed action is logged and counted ; the remaining actions
  * still run. Only the store records actions that got as far as
  * their store write.
  */

#include <iostream>
#include <string>
#include <list>

using namespace std;

#include "monBase.h"
#include "sensorStore.h"     /* for ... sensorStore_type            */
#include "provBackend.h"     /* for ... provBackend                 */

/* replaced by the volume name in the parameter template */
#define VOLUME_PARAM_TOKEN   "%volume%"
#define VOLUME_PARAM_OPTION  " --volume "

/* the value of a completed reconciliation's status channel */
#define VOLUME_SCAN_COMPLETE (1)

typedef struct
{
    string volume_name ;
    string instance_id ;
} volReconcile_delete_type ;

/** The actions of one run ; creates and deletes never share a name */
typedef struct
{
    list<string>                   creates ; /**< volume names in array order */
    list<volReconcile_delete_type> deletes ; /**< in store key order          */
    int                            matched ; /**< volumes with no action      */
} volReconcile_plan_type ;

/** What a create needs to know about the monitoring system */
typedef struct
{
    string template_id ;
    string parent_id   ;
    string name_prefix ;
    string parameters  ; /**< template ; see VOLUME_PARAM_TOKEN */
} volReconcile_cfg_type ;

typedef struct
{
    int planned_creates   ;
    int planned_deletes   ;
    int completed_creates ; /**< cloned, recorded, configured and enabled */
    int completed_deletes ; /**< deleted and removed from the store       */
    int incomplete        ; /**< cloned and recorded but not configured   */
    int failed            ; /**< actions that failed at any step          */
} volReconcile_counts_type ;

void   volReconcile_counts_init ( volReconcile_counts_type & counts );

/*****************************************************************************
 *
 * Name       : volReconcile_plan
 *
 * Description: Compute the actions that take 'known' to 'volumes'.
 *              Repeated and empty volume names are dropped.
 *
 *****************************************************************************/
void   volReconcile_plan       ( const list<string>      & volumes,
                                 const sensor_map_type   & known,
                                 volReconcile_plan_type  & plan );

/* the parameter string of the monitor instance of 'volume_name' */
string volReconcile_parameters ( string parameter_template, string volume_name );

/*****************************************************************************
 *
 * Name       : volReconcile_execute
 *
 * Description: Apply all the plan's creates and then all its deletes
 *              through 'backend', updating 'store' as each one lands.
 *
 * Returns    : PASS ; action failures are only counted.
 *              FAIL_OPERATION if the store is not loaded.
 *
 *****************************************************************************/
int    volReconcile_execute    ( volReconcile_plan_type   & plan,
                                 sensorStore_type         & store,
                                 provBackend              & backend,
                                 volReconcile_cfg_type    & cfg,
                                 volReconcile_counts_type & counts );

/* plan against the loaded store and execute */
int    volReconcile_run        ( const list<string>       & volumes,
                                 sensorStore_type         & store,
                                 provBackend              & backend,
                                 volReconcile_cfg_type    & cfg,
                                 volReconcile_counts_type & counts );

#endif /* __INCLUDE_VOLRECONCILE_H__ */
