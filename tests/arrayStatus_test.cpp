/*
 * Copyright (c) 2013-2017 Wind River Systems, Inc.
*
* SPDX-License-Identifier: Apache-2.0
*
 */

 /**
  * @file
  * Storage Array Monitor status type tests
  */

#include <gtest/gtest.h>

#include <iostream>
#include <string>

using namespace std;

#include "arrayStatus.h"
#include "testSupport.h"

TEST ( ArrayStatus, HardwareParse )
{
    EXPECT_EQ ( HW_STATUS__OK,            arrayStatus_hw_parse ("ok"));
    EXPECT_EQ ( HW_STATUS__NOT_INSTALLED, arrayStatus_hw_parse ("not_installed"));
    EXPECT_EQ ( HW_STATUS__DEVICE_OFF,    arrayStatus_hw_parse (" Device_Off "));
    EXPECT_EQ ( HW_STATUS__CRITICAL,      arrayStatus_hw_parse ("critical"));
    EXPECT_EQ ( HW_STATUS__UNKNOWN,       arrayStatus_hw_parse ("on_fire"));
    EXPECT_EQ ( HW_STATUS__UNKNOWN,       arrayStatus_hw_parse (""));
}

TEST ( ArrayStatus, HardwareCodesAndNames )
{
    EXPECT_EQ ( 0, arrayStatus_hw_code ( HW_STATUS__OK ));
    EXPECT_EQ ( 4, arrayStatus_hw_code ( HW_STATUS__DEGRADED ));
    EXPECT_EQ ( 6, arrayStatus_hw_code ( HW_STATUS__CRITICAL ));

    EXPECT_STREQ ( "not_installed", arrayStatus_hw_name   ( HW_STATUS__NOT_INSTALLED ));
    EXPECT_STREQ ( "Not Installed", arrayStatus_hw_lookup ( HW_STATUS__NOT_INSTALLED ));
    EXPECT_STREQ ( "Device Off",    arrayStatus_hw_lookup ( HW_STATUS__DEVICE_OFF ));

    /* every name parses back to its status */
    for ( int code = HW_STATUS__OK ; code <= HW_STATUS__CRITICAL ; code++ )
    {
        hwStatus_enum status = (hwStatus_enum)code ;
        EXPECT_EQ ( status, arrayStatus_hw_parse ( arrayStatus_hw_name ( status )));
    }
}

TEST ( ArrayStatus, DriveParse )
{
    EXPECT_EQ ( DRIVE_STATUS__HEALTHY,      arrayStatus_drive_parse ("healthy"));
    EXPECT_EQ ( DRIVE_STATUS__EVACUATING,   arrayStatus_drive_parse ("EVACUATING"));
    EXPECT_EQ ( DRIVE_STATUS__FAILED,       arrayStatus_drive_parse ("failed"));
    EXPECT_EQ ( DRIVE_STATUS__UNRECOGNIZED, arrayStatus_drive_parse ("melting"));
}

TEST ( ArrayStatus, DriveCodesAndNames )
{
    EXPECT_EQ (  0, arrayStatus_drive_code ( DRIVE_STATUS__HEALTHY ));
    EXPECT_EQ (  9, arrayStatus_drive_code ( DRIVE_STATUS__UNHEALTHY ));
    EXPECT_EQ ( 10, arrayStatus_drive_code ( DRIVE_STATUS__FAILED ));

    EXPECT_STREQ ( "unadmitted", arrayStatus_drive_name   ( DRIVE_STATUS__UNADMITTED ));
    EXPECT_STREQ ( "Unhealthy",  arrayStatus_drive_lookup ( DRIVE_STATUS__UNHEALTHY ));

    for ( int code = DRIVE_STATUS__HEALTHY ; code <= DRIVE_STATUS__FAILED ; code++ )
    {
        driveStatus_enum status = (driveStatus_enum)code ;
        EXPECT_EQ ( status, arrayStatus_drive_parse ( arrayStatus_drive_name ( status )));
    }
}
