/*
 * Copyright (c) 2013-2017 Wind River Systems, Inc.
*
* SPDX-License-Identifier: Apache-2.0
*
 */

 /**
  * @file
  * Storage Array Monitor output document formatter tests
  */

#include <gtest/gtest.h>

#include <iostream>
#include <string>
#include <list>

using namespace std;

#include "monBase.h"
#include "arrayFormat.h"
#include "testSupport.h"

static const prtg_result_type & nth ( const list<prtg_result_type> & results, size_t n )
{
    list<prtg_result_type>::const_iterator iter = results.begin();
    while ( n-- )
        ++iter ;
    return ( *iter );
}

static array_capacity_type capacity_sample ( void )
{
    array_capacity_type capacity ;
    capacity.capacity          = 1000 ;
    capacity.total             = 825  ;
    capacity.volumes           = 700  ;
    capacity.snapshots         = 100  ;
    capacity.shared_space      = 20   ;
    capacity.system            = 5    ;
    capacity.data_reduction    = 3.456 ;
    capacity.total_reduction   = 8.0  ;
    capacity.thin_provisioning = 0.125 ;
    return (capacity);
}

TEST ( ArrayFormat, CapacityUsedCarriesLimits )
{
    list<prtg_result_type> results = arrayFormat_capacity ( capacity_sample(), 80, 90 );

    ASSERT_EQ ( 10u, results.size() );
    EXPECT_EQ ( "{\"channel\":\"Capacity Used\",\"value\":\"82.50\",\"unit\":\"Percent\",\"float\":1,"
                "\"LimitMaxError\":\"90\",\"LimitMaxWarning\":\"80\",\"LimitMode\":1}",
                arrayFormat_element ( results.front() ));

    EXPECT_EQ ( "{\"channel\":\"Capacity\",\"value\":\"1000\",\"unit\":\"BytesDisk\",\"float\":0,\"LimitMode\":0}",
                arrayFormat_element ( nth ( results, 1 )));

    EXPECT_EQ ( "{\"channel\":\"Data Reduction\",\"value\":\"3.46\",\"unit\":\"Custom\",\"customunit\":\":1\",\"float\":1,\"LimitMode\":0}",
                arrayFormat_element ( nth ( results, 7 )));

    EXPECT_EQ ( "Thin Provisioning", results.back().channel );
    EXPECT_EQ ( "12.50", results.back().value );
}

TEST ( ArrayFormat, ZeroCapacityIsZeroPercent )
{
    array_capacity_type capacity = capacity_sample ();
    capacity.capacity = 0 ;

    list<prtg_result_type> results = arrayFormat_capacity ( capacity, 80, 90 );
    EXPECT_EQ ( "0.00", results.front().value );
}

TEST ( ArrayFormat, PerformanceBandwidthDirection )
{
    array_perf_type perf ;
    perf.reads_per_sec     = 100 ;
    perf.writes_per_sec    = 50  ;
    perf.input_per_sec     = 2000 ;
    perf.output_per_sec    = 9000 ;
    perf.usec_per_read_op  = 300 ;
    perf.usec_per_write_op = 450 ;
    perf.queue_depth       = 2 ;

    list<prtg_result_type> results = arrayFormat_performance ( perf );
    ASSERT_EQ ( 7u, results.size() );

    EXPECT_EQ ( "{\"channel\":\"Read IOPS\",\"value\":\"100\",\"unit\":\"Custom\",\"customunit\":\"IOPS\",\"float\":0,\"LimitMode\":0}",
                arrayFormat_element ( results.front() ));
    EXPECT_EQ ( "Read Bandwidth", nth ( results, 2 ).channel );
    EXPECT_EQ ( "9000",           nth ( results, 2 ).value );
    EXPECT_EQ ( "Write Bandwidth", nth ( results, 3 ).channel );
    EXPECT_EQ ( "2000",            nth ( results, 3 ).value );
    EXPECT_EQ ( "us", nth ( results, 4 ).customunit );
    EXPECT_EQ ( "Queue Depth", results.back().channel );
}

TEST ( ArrayFormat, HardwareUsesValueLookup )
{
    list<array_hw_type> hw_list ;
    array_hw_type hw ;
    hw.name   = "CT0.FAN1" ;
    hw.status = HW_STATUS__DEGRADED ;
    hw_list.push_back ( hw );

    list<prtg_result_type> results = arrayFormat_hardware ( hw_list );
    ASSERT_EQ ( 1u, results.size() );
    EXPECT_EQ ( "{\"channel\":\"CT0.FAN1\",\"value\":\"4\",\"unit\":\"Custom\",\"float\":0,"
                "\"LimitMode\":0,\"ValueLookup\":\"arraymon.hardware.status\"}",
                arrayFormat_element ( results.front() ));
}

TEST ( ArrayFormat, DrivesFailedCount )
{
    list<array_drive_type> drive_list ;
    const driveStatus_enum states[] = { DRIVE_STATUS__HEALTHY,
                                        DRIVE_STATUS__UNRECOGNIZED,
                                        DRIVE_STATUS__UNHEALTHY,
                                        DRIVE_STATUS__FAILED };
    for ( int i = 0 ; i < 4 ; i++ )
    {
        array_drive_type drive ;
        drive.name     = "BAY" + itos(i) ;
        drive.status   = states[i] ;
        drive.capacity = 0 ;
        drive_list.push_back ( drive );
    }

    list<prtg_result_type> results = arrayFormat_drives ( drive_list );
    ASSERT_EQ ( 5u, results.size() );
    EXPECT_EQ ( "arraymon.drive.status", results.front().value_lookup );
    EXPECT_EQ ( "{\"channel\":\"Drives Failed\",\"value\":\"2\",\"unit\":\"Count\",\"float\":0,"
                "\"LimitMaxError\":\"0.5\",\"LimitMode\":1}",
                arrayFormat_element ( results.back() ));

    list<array_drive_type> none ;
    results = arrayFormat_drives ( none );
    ASSERT_EQ ( 1u, results.size() );
    EXPECT_EQ ( "0", results.front().value );
}

TEST ( ArrayFormat, Volume )
{
    array_volume_type volume ;
    volume.name              = "vol-a" ;
    volume.size              = 4000 ;
    volume.volumes           = 900 ;
    volume.snapshots         = 100 ;
    volume.total             = 1000 ;
    volume.data_reduction    = 2.5 ;
    volume.thin_provisioning = 0.5 ;

    list<prtg_result_type> results = arrayFormat_volume ( volume );
    ASSERT_EQ ( 5u, results.size() );
    EXPECT_EQ ( "Size", results.front().channel );
    EXPECT_EQ ( "4000", results.front().value );
    EXPECT_EQ ( "Used Percent", nth ( results, 3 ).channel );
    EXPECT_EQ ( "25.00",        nth ( results, 3 ).value );
    EXPECT_EQ ( "2.50", results.back().value );
}

TEST ( ArrayFormat, ResultDocument )
{
    list<prtg_result_type> results ;
    EXPECT_EQ ( "{\"prtg\":{\"result\":[]}}", arrayFormat_result ( results ));

    results.push_back ( arrayFormat_scan_status ( 1 ));
    results.push_back ( arrayFormat_channel ( "Queue Depth", "3", PRTG_UNIT__COUNT ));
    EXPECT_EQ ( "{\"prtg\":{\"result\":["
                "{\"channel\":\"Scan Status\",\"value\":\"1\",\"unit\":\"Count\",\"float\":0,\"LimitMode\":0},"
                "{\"channel\":\"Queue Depth\",\"value\":\"3\",\"unit\":\"Count\",\"float\":0,\"LimitMode\":0}"
                "]}}",
                arrayFormat_result ( results ));
}

TEST ( ArrayFormat, ErrorDocumentIsEscaped )
{
    EXPECT_EQ ( "{\"prtg\":{\"error\":1,\"text\":\"ArrayQueryFailure: volume\\/\\\"a\\\" failed\"}}",
                arrayFormat_error ( "ArrayQueryFailure: volume/\"a\" failed" ));
}
