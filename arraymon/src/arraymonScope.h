#ifndef __INCLUDE_ARRAYMONSCOPE_H__
#define __INCLUDE_ARRAYMONSCOPE_H__
/*
 * Copyright (c) 2013-2017 Wind River Systems, Inc.
*
* SPDX-License-Identifier: Apache-2.0
*
 */

 /**
  * @file
  * Storage Array Monitor Scope Runners
  *
  * Each runner appends its result elements to the caller's list or
  * records why it failed in the control struct. The caller turns
  * that into the one output document and the exit code.
  */

#include <iostream>
#include <string>
#include <list>

using namespace std;

#include "arraymon.h"
#include "arrayFormat.h"     /* for ... prtg_result_type            */
#include "provBackend.h"     /* for ... provBackend                 */

/** Source of the array's current volume names */
typedef int (*arraymon_volume_list_fn) ( arraymon_ctrl_type & ctrl, list<string> & names );

/* lists the volumes of the logged in array */
int          arraymon_array_volume_list ( arraymon_ctrl_type & ctrl, list<string> & names );

/* record a fatal failure ; returns 'rc' */
int          arraymon_fail         ( arraymon_ctrl_type  & ctrl,
                                     arraymon_failure_enum failure,
                                     int                   rc,
                                     string                text );

const char * arraymon_failure_name ( arraymon_failure_enum failure );

/* process exit code of the run */
int          arraymon_exit_code    ( arraymon_ctrl_type & ctrl );

/* the run's one output document */
string       arraymon_document     ( arraymon_ctrl_type & ctrl,
                                     const list<prtg_result_type> & results );

/* checks the settings the selected scope needs */
int          arraymon_ctrl_validate ( arraymon_ctrl_type & ctrl );

/* log in and resolve the array name */
int          arraymon_connect      ( arraymon_ctrl_type & ctrl );

/*****************************************************************************
 *
 * Name       : arraymon_volumemgmt
 *
 * Description: Reconcile the monitor instances of the array's volumes.
 *
 *              1. list the array's volumes with 'list_fn'
 *              2. load the array's sensor store
 *              3. reconcile through 'backend'
 *
 *              Fails only if the volume list or the store can't be read.
 *              Provisioning failures are logged and retried next run.
 *
 *****************************************************************************/
int          arraymon_volumemgmt   ( arraymon_ctrl_type       & ctrl,
                                     arraymon_volume_list_fn    list_fn,
                                     provBackend              & backend,
                                     list<prtg_result_type>   & results );

/* run one of the query scopes ; not volumemgmt */
int          arraymon_query_scope  ( arraymon_ctrl_type     & ctrl,
                                     list<prtg_result_type> & results );

#endif /* __INCLUDE_ARRAYMONSCOPE_H__ */
