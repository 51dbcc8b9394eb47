/*
 * Copyright (c) 2013-2016 Wind River Systems, Inc.
*
* SPDX-License-Identifier: Apache-2.0
*
 */

 /**
  * @file
  * Storage Array Monitor hardware and drive status types
  */

#include <iostream>
#include <string>

using namespace std;

#ifdef  __AREA__
#undef  __AREA__
#endif
#define __AREA__ "sts"

#include "monUtil.h"
#include "arrayStatus.h"

/* The switch statements below have no default so the
 * compiler flags any status that is added but not handled. */

const char * arrayStatus_hw_name ( hwStatus_enum status )
{
    switch ( status )
    {
        case HW_STATUS__OK:            return ("ok");
        case HW_STATUS__NOT_INSTALLED: return ("not_installed");
        case HW_STATUS__IDENTIFYING:   return ("identifying");
        case HW_STATUS__UNKNOWN:       return ("unknown");
        case HW_STATUS__DEGRADED:      return ("degraded");
        case HW_STATUS__DEVICE_OFF:    return ("device_off");
        case HW_STATUS__CRITICAL:      return ("critical");
    }
    return ("unknown");
}

const char * arrayStatus_hw_lookup ( hwStatus_enum status )
{
    switch ( status )
    {
        case HW_STATUS__OK:            return ("OK");
        case HW_STATUS__NOT_INSTALLED: return ("Not Installed");
        case HW_STATUS__IDENTIFYING:   return ("Identifying");
        case HW_STATUS__UNKNOWN:       return ("Unknown");
        case HW_STATUS__DEGRADED:      return ("Degraded");
        case HW_STATUS__DEVICE_OFF:    return ("Device Off");
        case HW_STATUS__CRITICAL:      return ("Critical");
    }
    return ("Unknown");
}

int arrayStatus_hw_code ( hwStatus_enum status )
{
    switch ( status )
    {
        case HW_STATUS__OK:
        case HW_STATUS__NOT_INSTALLED:
        case HW_STATUS__IDENTIFYING:
        case HW_STATUS__UNKNOWN:
        case HW_STATUS__DEGRADED:
        case HW_STATUS__DEVICE_OFF:
        case HW_STATUS__CRITICAL:
            return ((int)status);
    }
    return ((int)HW_STATUS__UNKNOWN);
}

hwStatus_enum arrayStatus_hw_parse ( string status )
{
    string s = tolowercase ( trim_whitespace ( status ));

    if      ( s == "ok"            ) return (HW_STATUS__OK);
    else if ( s == "not_installed" ) return (HW_STATUS__NOT_INSTALLED);
    else if ( s == "identifying"   ) return (HW_STATUS__IDENTIFYING);
    else if ( s == "unknown"       ) return (HW_STATUS__UNKNOWN);
    else if ( s == "degraded"      ) return (HW_STATUS__DEGRADED);
    else if ( s == "device_off"    ) return (HW_STATUS__DEVICE_OFF);
    else if ( s == "critical"      ) return (HW_STATUS__CRITICAL);

    wlog ("unrecognized hardware status '%s' ; reporting unknown\n", status.c_str());
    return (HW_STATUS__UNKNOWN);
}

const char * arrayStatus_drive_name ( driveStatus_enum status )
{
    switch ( status )
    {
        case DRIVE_STATUS__HEALTHY:      return ("healthy");
        case DRIVE_STATUS__EMPTY:        return ("empty");
        case DRIVE_STATUS__UPDATING:     return ("updating");
        case DRIVE_STATUS__UNUSED:       return ("unused");
        case DRIVE_STATUS__EVACUATING:   return ("evacuating");
        case DRIVE_STATUS__IDENTIFYING:  return ("identifying");
        case DRIVE_STATUS__RECOVERING:   return ("recovering");
        case DRIVE_STATUS__UNADMITTED:   return ("unadmitted");
        case DRIVE_STATUS__UNRECOGNIZED: return ("unrecognized");
        case DRIVE_STATUS__UNHEALTHY:    return ("unhealthy");
        case DRIVE_STATUS__FAILED:       return ("failed");
    }
    return ("unrecognized");
}

const char * arrayStatus_drive_lookup ( driveStatus_enum status )
{
    switch ( status )
    {
        case DRIVE_STATUS__HEALTHY:      return ("Healthy");
        case DRIVE_STATUS__EMPTY:        return ("Empty");
        case DRIVE_STATUS__UPDATING:     return ("Updating");
        case DRIVE_STATUS__UNUSED:       return ("Unused");
        case DRIVE_STATUS__EVACUATING:   return ("Evacuating");
        case DRIVE_STATUS__IDENTIFYING:  return ("Identifying");
        case DRIVE_STATUS__RECOVERING:   return ("Recovering");
        case DRIVE_STATUS__UNADMITTED:   return ("Unadmitted");
        case DRIVE_STATUS__UNRECOGNIZED: return ("Unrecognized");
        case DRIVE_STATUS__UNHEALTHY:    return ("Unhealthy");
        case DRIVE_STATUS__FAILED:       return ("Failed");
    }
    return ("Unrecognized");
}

int arrayStatus_drive_code ( driveStatus_enum status )
{
    switch ( status )
    {
        case DRIVE_STATUS__HEALTHY:
        case DRIVE_STATUS__EMPTY:
        case DRIVE_STATUS__UPDATING:
        case DRIVE_STATUS__UNUSED:
        case DRIVE_STATUS__EVACUATING:
        case DRIVE_STATUS__IDENTIFYING:
        case DRIVE_STATUS__RECOVERING:
        case DRIVE_STATUS__UNADMITTED:
        case DRIVE_STATUS__UNRECOGNIZED:
        case DRIVE_STATUS__UNHEALTHY:
        case DRIVE_STATUS__FAILED:
            return ((int)status);
    }
    return ((int)DRIVE_STATUS__UNRECOGNIZED);
}

driveStatus_enum arrayStatus_drive_parse ( string status )
{
    string s = tolowercase ( trim_whitespace ( status ));

    if      ( s == "healthy"      ) return (DRIVE_STATUS__HEALTHY);
    else if ( s == "empty"        ) return (DRIVE_STATUS__EMPTY);
    else if ( s == "updating"     ) return (DRIVE_STATUS__UPDATING);
    else if ( s == "unused"       ) return (DRIVE_STATUS__UNUSED);
    else if ( s == "evacuating"   ) return (DRIVE_STATUS__EVACUATING);
    else if ( s == "identifying"  ) return (DRIVE_STATUS__IDENTIFYING);
    else if ( s == "recovering"   ) return (DRIVE_STATUS__RECOVERING);
    else if ( s == "unadmitted"   ) return (DRIVE_STATUS__UNADMITTED);
    else if ( s == "unrecognized" ) return (DRIVE_STATUS__UNRECOGNIZED);
    else if ( s == "unhealthy"    ) return (DRIVE_STATUS__UNHEALTHY);
    else if ( s == "failed"       ) return (DRIVE_STATUS__FAILED);

    wlog ("unrecognized drive status '%s' ; reporting unrecognized\n", status.c_str());
    return (DRIVE_STATUS__UNRECOGNIZED);
}
