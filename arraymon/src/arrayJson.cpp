/*
 * Copyright (c) 2015-2017 Wind River Systems, Inc.
*
* SPDX-License-Identifier: Apache-2.0
*
 */

 /**
  * @file
  * Storage Array Monitor array response parsers
  */

#include <stdio.h>
#include <stdlib.h>
#include <json-c/json.h>      /* for ... json-c json string parsing */

using namespace std;

#ifdef  __AREA__
#undef  __AREA__
#endif
#define __AREA__ "arj"

#include "monBase.h"
#include "monUtil.h"
#include "jsonUtil.h"
#include "arrayJson.h"

int arrayJson_load_array_name ( char * json_str_ptr, string & array_name )
{
    int rc = jsonUtil_get_key_val ( json_str_ptr, ARRAY_JSON_ARRAY_NAME, array_name );
    if ( rc != PASS )
        return (rc);

    if ( array_name.empty() || ( array_name == JSON_NONE ))
    {
        elog ("array response has no '%s'\n", ARRAY_JSON_ARRAY_NAME );
        array_name.clear();
        return (FAIL_JSON_OBJECT);
    }
    return (PASS);
}

int arrayJson_load_capacity ( char * json_str_ptr, array_capacity_type & capacity )
{
    int rc = PASS ;
    struct json_object * root_obj = (struct json_object *)(NULL);
    struct json_object * cap_obj  = (struct json_object *)(NULL);

    MEMSET_ZERO ( capacity );

    rc = jsonUtil_get_object ( json_str_ptr, &root_obj, &cap_obj );
    if ( rc != PASS )
        return (rc);

    if ( jsonUtil_has_key ( cap_obj, ARRAY_JSON_CAPACITY ) == false )
    {
        elog ("capacity response has no '%s'\n", ARRAY_JSON_CAPACITY );
        rc = FAIL_JSON_OBJECT ;
        goto load_capacity_cleanup ;
    }

    capacity.capacity          = jsonUtil_get_key_value_int64  ( cap_obj, ARRAY_JSON_CAPACITY );
    capacity.total             = jsonUtil_get_key_value_int64  ( cap_obj, ARRAY_JSON_TOTAL );
    capacity.volumes           = jsonUtil_get_key_value_int64  ( cap_obj, ARRAY_JSON_VOLUMES );
    capacity.snapshots         = jsonUtil_get_key_value_int64  ( cap_obj, ARRAY_JSON_SNAPSHOTS );
    capacity.shared_space      = jsonUtil_get_key_value_int64  ( cap_obj, ARRAY_JSON_SHARED_SPACE );
    capacity.system            = jsonUtil_get_key_value_int64  ( cap_obj, ARRAY_JSON_SYSTEM );
    capacity.data_reduction    = jsonUtil_get_key_value_double ( cap_obj, ARRAY_JSON_DATA_REDUCTION );
    capacity.total_reduction   = jsonUtil_get_key_value_double ( cap_obj, ARRAY_JSON_TOTAL_REDUCTION );
    capacity.thin_provisioning = jsonUtil_get_key_value_double ( cap_obj, ARRAY_JSON_THIN_PROVISIONING );

    dlog ("capacity:%lld used:%lld\n", capacity.capacity, capacity.total );

load_capacity_cleanup:

    if ( root_obj ) json_object_put ( root_obj );
    return (rc);
}

int arrayJson_load_performance ( char * json_str_ptr, array_perf_type & perf )
{
    int rc = PASS ;
    struct json_object * root_obj = (struct json_object *)(NULL);
    struct json_object * perf_obj = (struct json_object *)(NULL);

    MEMSET_ZERO ( perf );

    rc = jsonUtil_get_object ( json_str_ptr, &root_obj, &perf_obj );
    if ( rc != PASS )
        return (rc);

    if (( jsonUtil_has_key ( perf_obj, ARRAY_JSON_READS_PER_SEC  ) == false ) ||
        ( jsonUtil_has_key ( perf_obj, ARRAY_JSON_WRITES_PER_SEC ) == false ))
    {
        elog ("performance response has no iops counters\n");
        rc = FAIL_JSON_OBJECT ;
    }
    else
    {
        perf.reads_per_sec     = jsonUtil_get_key_value_int64 ( perf_obj, ARRAY_JSON_READS_PER_SEC );
        perf.writes_per_sec    = jsonUtil_get_key_value_int64 ( perf_obj, ARRAY_JSON_WRITES_PER_SEC );
        perf.input_per_sec     = jsonUtil_get_key_value_int64 ( perf_obj, ARRAY_JSON_INPUT_PER_SEC );
        perf.output_per_sec    = jsonUtil_get_key_value_int64 ( perf_obj, ARRAY_JSON_OUTPUT_PER_SEC );
        perf.usec_per_read_op  = jsonUtil_get_key_value_int64 ( perf_obj, ARRAY_JSON_USEC_PER_READ );
        perf.usec_per_write_op = jsonUtil_get_key_value_int64 ( perf_obj, ARRAY_JSON_USEC_PER_WRITE );
        perf.queue_depth       = jsonUtil_get_key_value_int64 ( perf_obj, ARRAY_JSON_QUEUE_DEPTH );
    }

    json_object_put ( root_obj );
    return (rc);
}

/*****************************************************************************
 *
 * Name       : _load_named_list
 *
 * Description: Split a top level json array into its element records.
 *
 *****************************************************************************/
static int _load_named_list ( char * json_str_ptr, const char * what, list<string> & records )
{
    int rc = jsonUtil_get_array ( json_str_ptr, records );
    if ( rc != PASS )
    {
        elog ("%s response is not a list (rc:%d)\n", what, rc );
        return (rc);
    }
    dlog ("%s list has %ld elements\n", what, (long)records.size());
    return (PASS);
}

int arrayJson_load_hardware ( char * json_str_ptr, list<array_hw_type> & hw_list )
{
    list<string> records ;
    int rc = _load_named_list ( json_str_ptr, "hardware", records );
    if ( rc != PASS )
        return (rc);

    for ( list<string>::iterator iter = records.begin() ; iter != records.end() ; ++iter )
    {
        struct json_object * root_obj = (struct json_object *)(NULL);
        struct json_object * hw_obj   = (struct json_object *)(NULL);

        rc = jsonUtil_get_object ( (char*)iter->data(), &root_obj, &hw_obj );
        if ( rc != PASS )
            break ;

        array_hw_type hw ;
        hw.name   = jsonUtil_get_key_value_string ( hw_obj, ARRAY_JSON_NAME );
        hw.status = arrayStatus_hw_parse ( jsonUtil_get_key_value_string ( hw_obj, ARRAY_JSON_STATUS ));
        json_object_put ( root_obj );

        if ( hw.name == JSON_NONE )
        {
            elog ("hardware record without a name\n");
            wlog ("... Raw Record: %s\n", iter->c_str());
            rc = FAIL_JSON_OBJECT ;
            break ;
        }
        dlog1 ("%s status:%s\n", hw.name.c_str(), arrayStatus_hw_name(hw.status));
        hw_list.push_back ( hw );
    }
    return (rc);
}

int arrayJson_load_drives ( char * json_str_ptr, list<array_drive_type> & drive_list )
{
    list<string> records ;
    int rc = _load_named_list ( json_str_ptr, "drive", records );
    if ( rc != PASS )
        return (rc);

    for ( list<string>::iterator iter = records.begin() ; iter != records.end() ; ++iter )
    {
        struct json_object * root_obj  = (struct json_object *)(NULL);
        struct json_object * drive_obj = (struct json_object *)(NULL);

        rc = jsonUtil_get_object ( (char*)iter->data(), &root_obj, &drive_obj );
        if ( rc != PASS )
            break ;

        array_drive_type drive ;
        drive.name     = jsonUtil_get_key_value_string ( drive_obj, ARRAY_JSON_NAME );
        drive.status   = arrayStatus_drive_parse ( jsonUtil_get_key_value_string ( drive_obj, ARRAY_JSON_STATUS ));
        drive.type     = jsonUtil_get_key_value_string ( drive_obj, ARRAY_JSON_TYPE );
        drive.capacity = jsonUtil_get_key_value_int64  ( drive_obj, ARRAY_JSON_CAPACITY );
        json_object_put ( root_obj );

        if ( drive.name == JSON_NONE )
        {
            elog ("drive record without a name\n");
            wlog ("... Raw Record: %s\n", iter->c_str());
            rc = FAIL_JSON_OBJECT ;
            break ;
        }
        dlog1 ("%s status:%s type:%s\n", drive.name.c_str(),
                   arrayStatus_drive_name(drive.status), drive.type.c_str());
        drive_list.push_back ( drive );
    }
    return (rc);
}

int arrayJson_load_volume ( char * json_str_ptr, array_volume_type & volume )
{
    int rc = PASS ;
    struct json_object * root_obj = (struct json_object *)(NULL);
    struct json_object * vol_obj  = (struct json_object *)(NULL);

    rc = jsonUtil_get_object ( json_str_ptr, &root_obj, &vol_obj );
    if ( rc != PASS )
        return (rc);

    volume.name = jsonUtil_get_key_value_string ( vol_obj, ARRAY_JSON_NAME );
    if (( volume.name == JSON_NONE ) ||
        ( jsonUtil_has_key ( vol_obj, ARRAY_JSON_SIZE ) == false ))
    {
        elog ("volume response has no name or size\n");
        volume.name.clear();
        rc = FAIL_JSON_OBJECT ;
    }
    else
    {
        volume.size              = jsonUtil_get_key_value_int64  ( vol_obj, ARRAY_JSON_SIZE );
        volume.volumes           = jsonUtil_get_key_value_int64  ( vol_obj, ARRAY_JSON_VOLUMES );
        volume.snapshots         = jsonUtil_get_key_value_int64  ( vol_obj, ARRAY_JSON_SNAPSHOTS );
        volume.total             = jsonUtil_get_key_value_int64  ( vol_obj, ARRAY_JSON_TOTAL );
        volume.data_reduction    = jsonUtil_get_key_value_double ( vol_obj, ARRAY_JSON_DATA_REDUCTION );
        volume.thin_provisioning = jsonUtil_get_key_value_double ( vol_obj, ARRAY_JSON_THIN_PROVISIONING );
    }

    json_object_put ( root_obj );
    return (rc);
}

int arrayJson_load_volume_names ( char * json_str_ptr, list<string> & names )
{
    list<string> records ;
    int rc = _load_named_list ( json_str_ptr, "volume", records );
    if ( rc != PASS )
        return (rc);

    for ( list<string>::iterator iter = records.begin() ; iter != records.end() ; ++iter )
    {
        string name ;
        rc = jsonUtil_get_key_val ( (char*)iter->data(), ARRAY_JSON_NAME, name );
        if ( rc != PASS )
            break ;
        if ( name == JSON_NONE )
        {
            elog ("volume record without a name\n");
            wlog ("... Raw Record: %s\n", iter->c_str());
            rc = FAIL_JSON_OBJECT ;
            break ;
        }
        names.push_back ( name );
    }
    return (rc);
}
