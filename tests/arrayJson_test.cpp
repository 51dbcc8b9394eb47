/*
 * Copyright (c) 2015-2017 Wind River Systems, Inc.
*
* SPDX-License-Identifier: Apache-2.0
*
 */

 /**
  * @file
  * Storage Array Monitor array response parser tests
  */

#include <gtest/gtest.h>

#include <iostream>
#include <string>
#include <list>

using namespace std;

#include "monBase.h"
#include "arrayJson.h"
#include "testSupport.h"

/* the loaders take a mutable buffer */
static int capacity_of ( string json, array_capacity_type & capacity )
{
    return ( arrayJson_load_capacity ( (char*)json.data(), capacity ));
}

TEST ( ArrayJson, ArrayName )
{
    string name ;
    string json = "{\"array_name\":\"flash-01\",\"id\":\"abc\"}" ;
    EXPECT_EQ ( PASS, arrayJson_load_array_name ( (char*)json.data(), name ));
    EXPECT_EQ ( "flash-01", name );

    string no_name = "{\"id\":\"abc\"}" ;
    EXPECT_EQ ( FAIL_JSON_OBJECT, arrayJson_load_array_name ( (char*)no_name.data(), name ));
    EXPECT_TRUE ( name.empty() );
}

TEST ( ArrayJson, CapacityFromOneElementList )
{
    array_capacity_type capacity ;
    string json = "[{\"capacity\":1000,\"total\":250,\"volumes\":200,\"snapshots\":30,"
                  "\"shared_space\":15,\"system\":5,\"data_reduction\":3.5,"
                  "\"total_reduction\":7.25,\"thin_provisioning\":0.4}]" ;

    EXPECT_EQ ( PASS, capacity_of ( json, capacity ));
    EXPECT_EQ ( 1000, capacity.capacity );
    EXPECT_EQ ( 250,  capacity.total );
    EXPECT_EQ ( 200,  capacity.volumes );
    EXPECT_EQ ( 30,   capacity.snapshots );
    EXPECT_EQ ( 15,   capacity.shared_space );
    EXPECT_EQ ( 5,    capacity.system );
    EXPECT_DOUBLE_EQ ( 3.5,  capacity.data_reduction );
    EXPECT_DOUBLE_EQ ( 7.25, capacity.total_reduction );
    EXPECT_DOUBLE_EQ ( 0.4,  capacity.thin_provisioning );
}

TEST ( ArrayJson, CapacityErrors )
{
    array_capacity_type capacity ;
    EXPECT_EQ ( FAIL_JSON_OBJECT, capacity_of ( "{\"total\":250}", capacity ));
    EXPECT_EQ ( FAIL_JSON_PARSE,  capacity_of ( "{\"capacity\":", capacity ));
    EXPECT_EQ ( FAIL_JSON_PARSE,  capacity_of ( "", capacity ));
}

TEST ( ArrayJson, Performance )
{
    array_perf_type perf ;
    string json = "[{\"reads_per_sec\":1200,\"writes_per_sec\":800,\"input_per_sec\":4096,"
                  "\"output_per_sec\":8192,\"usec_per_read_op\":250,"
                  "\"usec_per_write_op\":400,\"queue_depth\":3}]" ;

    EXPECT_EQ ( PASS, arrayJson_load_performance ( (char*)json.data(), perf ));
    EXPECT_EQ ( 1200, perf.reads_per_sec );
    EXPECT_EQ ( 800,  perf.writes_per_sec );
    EXPECT_EQ ( 4096, perf.input_per_sec );
    EXPECT_EQ ( 8192, perf.output_per_sec );
    EXPECT_EQ ( 250,  perf.usec_per_read_op );
    EXPECT_EQ ( 400,  perf.usec_per_write_op );
    EXPECT_EQ ( 3,    perf.queue_depth );

    string partial = "{\"reads_per_sec\":1200}" ;
    EXPECT_EQ ( FAIL_JSON_OBJECT, arrayJson_load_performance ( (char*)partial.data(), perf ));
}

TEST ( ArrayJson, Hardware )
{
    list<array_hw_type> hw_list ;
    string json = "[{\"name\":\"CT0\",\"status\":\"ok\"},"
                  "{\"name\":\"CT1.FAN0\",\"status\":\"critical\"},"
                  "{\"name\":\"SH0\",\"status\":\"strange\"}]" ;

    EXPECT_EQ ( PASS, arrayJson_load_hardware ( (char*)json.data(), hw_list ));
    ASSERT_EQ ( 3u, hw_list.size() );
    EXPECT_EQ ( "CT0", hw_list.front().name );
    EXPECT_EQ ( HW_STATUS__OK, hw_list.front().status );
    EXPECT_EQ ( HW_STATUS__UNKNOWN, hw_list.back().status );

    hw_list.clear();
    string object = "{\"name\":\"CT0\",\"status\":\"ok\"}" ;
    EXPECT_EQ ( FAIL_JSON_OBJECT, arrayJson_load_hardware ( (char*)object.data(), hw_list ));

    string unnamed = "[{\"status\":\"ok\"}]" ;
    EXPECT_EQ ( FAIL_JSON_OBJECT, arrayJson_load_hardware ( (char*)unnamed.data(), hw_list ));
}

TEST ( ArrayJson, Drives )
{
    list<array_drive_type> drive_list ;
    string json = "[{\"name\":\"SH0.BAY0\",\"status\":\"healthy\",\"type\":\"SSD\",\"capacity\":1024},"
                  "{\"name\":\"SH0.BAY1\",\"status\":\"failed\",\"type\":\"SSD\",\"capacity\":1024}]" ;

    EXPECT_EQ ( PASS, arrayJson_load_drives ( (char*)json.data(), drive_list ));
    ASSERT_EQ ( 2u, drive_list.size() );
    EXPECT_EQ ( DRIVE_STATUS__HEALTHY, drive_list.front().status );
    EXPECT_EQ ( "SSD", drive_list.front().type );
    EXPECT_EQ ( 1024, drive_list.front().capacity );
    EXPECT_EQ ( DRIVE_STATUS__FAILED, drive_list.back().status );
}

TEST ( ArrayJson, Volume )
{
    array_volume_type volume ;
    string json = "{\"name\":\"vol-a\",\"size\":2000,\"volumes\":400,\"snapshots\":100,"
                  "\"total\":500,\"data_reduction\":2.0,\"thin_provisioning\":0.75}" ;

    EXPECT_EQ ( PASS, arrayJson_load_volume ( (char*)json.data(), volume ));
    EXPECT_EQ ( "vol-a", volume.name );
    EXPECT_EQ ( 2000, volume.size );
    EXPECT_EQ ( 500,  volume.total );
    EXPECT_EQ ( 100,  volume.snapshots );

    string no_size = "{\"name\":\"vol-a\"}" ;
    EXPECT_EQ ( FAIL_JSON_OBJECT, arrayJson_load_volume ( (char*)no_size.data(), volume ));
}

TEST ( ArrayJson, VolumeNamesKeepOrderAndDuplicates )
{
    list<string> names ;
    string json = "[{\"name\":\"vol-b\",\"size\":1},{\"name\":\"vol-a\",\"size\":1},{\"name\":\"vol-b\",\"size\":1}]" ;

    EXPECT_EQ ( PASS, arrayJson_load_volume_names ( (char*)json.data(), names ));
    ASSERT_EQ ( 3u, names.size() );
    list<string>::iterator iter = names.begin();
    EXPECT_EQ ( "vol-b", *iter++ );
    EXPECT_EQ ( "vol-a", *iter++ );
    EXPECT_EQ ( "vol-b", *iter );

    names.clear();
    string empty = "[]" ;
    EXPECT_EQ ( PASS, arrayJson_load_volume_names ( (char*)empty.data(), names ));
    EXPECT_TRUE ( names.empty() );
}
