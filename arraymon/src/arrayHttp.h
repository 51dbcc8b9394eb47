#ifndef __INCLUDE_ARRAYHTTP_H__
#define __INCLUDE_ARRAYHTTP_H__
/*
 * Copyright (c) 2013, 2015-2017 Wind River Systems, Inc.
*
* SPDX-License-Identifier: Apache-2.0
*
 */

 /**
  * @file
  * Storage Array Monitor array REST API query interface
  *
  * All queries are blocking GETs of <prefix>/<label> carrying the
  * session cookie opened by arrayHttp_login. The raw response is
  * parsed into the caller's record by the arrayJson loaders.
  */

#include <iostream>
#include <string>
#include <list>

using namespace std;

#include "httpUtil.h"        /* for ... libEvent                   */
#include "arraymon.h"        /* for ... arraymon_ctrl_type          */

#define ARRAY_LABEL__ARRAY        "array"
#define ARRAY_LABEL__SPACE        "array?space=true"
#define ARRAY_LABEL__MONITOR      "array?action=monitor"
#define ARRAY_LABEL__HARDWARE     "hardware"
#define ARRAY_LABEL__DRIVE        "drive"
#define ARRAY_LABEL__VOLUME       "volume"
#define ARRAY_QUERY__SPACE        "?space=true"

/* open the array session ; any failure is an authentication failure */
int arrayHttp_login ( libEvent & event, arraymon_ctrl_type & ctrl );

/* checks the query produced a response to parse */
int arrayHttp_handler ( libEvent & event );

int arrayHttp_get_array_name  ( libEvent & event, arraymon_ctrl_type & ctrl, string & array_name );
int arrayHttp_get_capacity    ( libEvent & event, arraymon_ctrl_type & ctrl, array_capacity_type & capacity );
int arrayHttp_get_performance ( libEvent & event, arraymon_ctrl_type & ctrl, array_perf_type & perf );
int arrayHttp_get_hardware    ( libEvent & event, arraymon_ctrl_type & ctrl, list<array_hw_type> & hw_list );
int arrayHttp_get_drives      ( libEvent & event, arraymon_ctrl_type & ctrl, list<array_drive_type> & drive_list );
int arrayHttp_get_volume      ( libEvent & event, arraymon_ctrl_type & ctrl, string name, array_volume_type & volume );
int arrayHttp_list_volumes    ( libEvent & event, arraymon_ctrl_type & ctrl, list<string> & names );

#endif /* __INCLUDE_ARRAYHTTP_H__ */
