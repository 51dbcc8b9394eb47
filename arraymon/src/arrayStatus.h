#ifndef __INCLUDE_ARRAYSTATUS_H__
#define __INCLUDE_ARRAYSTATUS_H__
/*
 * Copyright (c) 2013-2016 Wind River Systems, Inc.
*
* SPDX-License-Identifier: Apache-2.0
*
 */

 /**
  * @file
  * Storage Array Monitor hardware and drive status types
  *
  * The array reports component status as strings. Each is parsed into
  * a closed enum once and from then on only the enum is passed around.
  * The numeric code is the channel value and the lookup text is what
  * the value lookup table displays for that code.
  */

#include <iostream>
#include <string>

using namespace std;

/* value lookup tables the status channels refer to ;
 * see arraymon/scripts/lookups */
#define HW_STATUS_LOOKUP_TABLE      "arraymon.hardware.status"
#define DRIVE_STATUS_LOOKUP_TABLE   "arraymon.drive.status"

typedef enum
{
    HW_STATUS__OK            = 0,
    HW_STATUS__NOT_INSTALLED = 1,
    HW_STATUS__IDENTIFYING   = 2,
    HW_STATUS__UNKNOWN       = 3,
    HW_STATUS__DEGRADED      = 4,
    HW_STATUS__DEVICE_OFF    = 5,
    HW_STATUS__CRITICAL      = 6,
} hwStatus_enum ;

typedef enum
{
    DRIVE_STATUS__HEALTHY      =  0,
    DRIVE_STATUS__EMPTY        =  1,
    DRIVE_STATUS__UPDATING     =  2,
    DRIVE_STATUS__UNUSED       =  3,
    DRIVE_STATUS__EVACUATING   =  4,
    DRIVE_STATUS__IDENTIFYING  =  5,
    DRIVE_STATUS__RECOVERING   =  6,
    DRIVE_STATUS__UNADMITTED   =  7,
    DRIVE_STATUS__UNRECOGNIZED =  8,
    DRIVE_STATUS__UNHEALTHY    =  9,
    DRIVE_STATUS__FAILED       = 10,
} driveStatus_enum ;

/** Parse the array's status string ; unrecognized strings map to
 *  HW_STATUS__UNKNOWN and DRIVE_STATUS__UNRECOGNIZED */
hwStatus_enum    arrayStatus_hw_parse      ( string status );
driveStatus_enum arrayStatus_drive_parse   ( string status );

/** The channel value for a status */
int              arrayStatus_hw_code       ( hwStatus_enum    status );
int              arrayStatus_drive_code    ( driveStatus_enum status );

/** The array's name for a status ; the inverse of parse */
const char *     arrayStatus_hw_name       ( hwStatus_enum    status );
const char *     arrayStatus_drive_name    ( driveStatus_enum status );

/** The display text of a status in its value lookup table */
const char *     arrayStatus_hw_lookup     ( hwStatus_enum    status );
const char *     arrayStatus_drive_lookup  ( driveStatus_enum status );

/* drives at or above this code count as failed */
#define DRIVE_STATUS__FAILED_THRESHOLD (DRIVE_STATUS__UNHEALTHY)

#endif /* __INCLUDE_ARRAYSTATUS_H__ */
