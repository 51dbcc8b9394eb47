#ifndef __INCLUDE_ARRAYMON_H__
#define __INCLUDE_ARRAYMON_H__
/*
 * Copyright (c) 2013-2016 Wind River Systems, Inc.
*
* SPDX-License-Identifier: Apache-2.0
*
 */

 /**
  * @file
  * Storage Array Monitor Service Header
  */

#include <iostream>
#include <string>
#include <list>

using namespace std;

#include "monBase.h"
#include "arrayStatus.h"

#define ARRAYMON_USER_AGENT     "arraymon/1.0"
#define ARRAYMON_API_PREFIX     "/api/"

/* process exit codes understood by the invoking monitor */
#define ARRAYMON_EXIT__OK            (0)
#define ARRAYMON_EXIT__SYSTEM_ERROR  (2)
#define ARRAYMON_EXIT__PROTOCOL_ERROR (3)
#define ARRAYMON_EXIT__CONTENT_ERROR (4)

typedef enum
{
    ARRAYMON_SCOPE__NONE,
    ARRAYMON_SCOPE__CAPACITY,
    ARRAYMON_SCOPE__PERFORMANCE,
    ARRAYMON_SCOPE__HARDWARE,
    ARRAYMON_SCOPE__DRIVE,
    ARRAYMON_SCOPE__VOLUME,
    ARRAYMON_SCOPE__VOLUMEMGMT,
    ARRAYMON_SCOPE__LAST,
} arraymon_scope_enum ;

/* the stage a fatal error came from ; selects the error text and exit code */
typedef enum
{
    ARRAYMON_FAILURE__NONE,
    ARRAYMON_FAILURE__CONFIG,     /**< bad arguments or config            */
    ARRAYMON_FAILURE__AUTH,       /**< AuthFailure                        */
    ARRAYMON_FAILURE__QUERY,      /**< ArrayQueryFailure                  */
    ARRAYMON_FAILURE__STORE,      /**< StoreUnavailable                   */
} arraymon_failure_enum ;

/** GET array?space=true */
typedef struct
{
    long long capacity          ;
    long long total             ; /**< used space                         */
    long long volumes           ;
    long long snapshots         ;
    long long shared_space      ;
    long long system            ;
    double    data_reduction    ;
    double    total_reduction   ;
    double    thin_provisioning ; /**< fraction 0..1                      */
} array_capacity_type ;

/** GET array?action=monitor */
typedef struct
{
    long long reads_per_sec     ;
    long long writes_per_sec    ;
    long long input_per_sec     ; /**< bytes per second written           */
    long long output_per_sec    ; /**< bytes per second read              */
    long long usec_per_read_op  ;
    long long usec_per_write_op ;
    long long queue_depth       ;
} array_perf_type ;

/** one element of GET hardware */
typedef struct
{
    string        name   ;
    hwStatus_enum status ;
} array_hw_type ;

/** one element of GET drive */
typedef struct
{
    string           name     ;
    driveStatus_enum status   ;
    string           type     ;
    long long        capacity ;
} array_drive_type ;

/** GET volume/<name>?space=true */
typedef struct
{
    string    name              ;
    long long size              ;
    long long volumes           ;
    long long snapshots         ;
    long long total             ;
    double    data_reduction    ;
    double    thin_provisioning ;
} array_volume_type ;

/** Everything one run needs ; loaded from config then the command line */
typedef struct
{
    /* array */
    string array_ip    ;
    int    array_port  ;
    string username    ;
    string password    ;
    string api_key     ;
    string prefix      ; /**< /api/<version>                         */
    int    timeout     ;
    string array_name  ; /**< resolved at startup ; keys the store   */

    arraymon_scope_enum scope ;
    string volume      ;

    /* capacity used percent limits */
    int    capacity_warn  ;
    int    capacity_error ;

    /* sensor store */
    string store_dir   ;

    /* provisioning */
    string prov_url         ;
    string prov_username    ;
    string prov_passhash    ;
    string prov_template_id ;
    string prov_parent_id   ;
    string prov_name_prefix ;
    string prov_parameters  ;
    string prov_property    ;

    /* result of the run */
    arraymon_failure_enum failure      ;
    int                   failure_rc   ;
    string                failure_text ; /**< what failed ; for the error document */
} arraymon_ctrl_type ;

void                arraymon_ctrl_init   ( arraymon_ctrl_type & ctrl );

/* load the config file values ; command line values are applied after */
void                arraymon_ctrl_load   ( arraymon_ctrl_type & ctrl, daemon_config_type * cfg_ptr );

arraymon_scope_enum arraymon_scope_parse ( string scope );
const char *        arraymon_scope_name  ( arraymon_scope_enum scope );

#endif /* __INCLUDE_ARRAYMON_H__ */
