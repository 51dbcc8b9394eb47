#ifndef __INCLUDE_ARRAYFORMAT_H__
#define __INCLUDE_ARRAYFORMAT_H__
/*
 * Copyright (c) 2013-2016 Wind River Systems, Inc.
*
* SPDX-License-Identifier: Apache-2.0
*
 */

 /**
  * @file
  * Storage Array Monitor output document formatter
  *
  * Every function here returns its result. The caller collects the
  * result elements of a scope into its own list and turns that list
  * into the one output document with arrayFormat_result.
  *
  * Success : {"prtg":{"result":[{"channel":"..","value":"..",...},...]}}
  * Failure : {"prtg":{"error":1,"text":".."}}
  */

#include <iostream>
#include <string>
#include <list>

using namespace std;

#include "arraymon.h"

#define PRTG_UNIT__CUSTOM        "Custom"
#define PRTG_UNIT__PERCENT       "Percent"
#define PRTG_UNIT__BYTES_DISK    "BytesDisk"
#define PRTG_UNIT__COUNT         "Count"
#define PRTG_UNIT__SPEED_DISK    "SpeedDisk"
#define PRTG_UNIT__TIME_RESPONSE "TimeResponse"

/* limits of the drives failed channel */
#define DRIVES_FAILED_MAX_ERROR  "0.5"

/** One result element ; empty strings are left out of the document */
typedef struct
{
    string channel           ;
    string value             ; /**< numeric text                  */
    string unit              ;
    string customunit        ;
    bool   is_float          ;
    string limit_max_error   ;
    string limit_max_warning ;
    string limit_min_error   ;
    string limit_min_warning ;
    int    limit_mode        ; /**< 1 when any limit is set       */
    string value_lookup      ;
} prtg_result_type ;

prtg_result_type arrayFormat_channel ( string channel, string value, string unit );

list<prtg_result_type> arrayFormat_capacity    ( const array_capacity_type & capacity,
                                                 int warn_percent,
                                                 int error_percent );
list<prtg_result_type> arrayFormat_performance ( const array_perf_type & perf );
list<prtg_result_type> arrayFormat_hardware    ( const list<array_hw_type> & hw_list );
list<prtg_result_type> arrayFormat_drives      ( const list<array_drive_type> & drive_list );
list<prtg_result_type> arrayFormat_volume      ( const array_volume_type & volume );
prtg_result_type       arrayFormat_scan_status ( int value );

/* one {..} element */
string arrayFormat_element ( const prtg_result_type & result );

/* the success and error documents */
string arrayFormat_result  ( const list<prtg_result_type> & results );
string arrayFormat_error   ( string text );

#endif /* __INCLUDE_ARRAYFORMAT_H__ */
