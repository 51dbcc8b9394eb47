#ifndef __INCLUDE_ARRAYJSON_H__
#define __INCLUDE_ARRAYJSON_H__
/*
 * Copyright (c) 2015-2017 Wind River Systems, Inc.
*
* SPDX-License-Identifier: Apache-2.0
*
 */

 /**
  * @file
  * Storage Array Monitor array response parsers
  *
  * Each loader takes the raw response of one array query and fills
  * the matching record. A response that does not parse or that lacks
  * the record's key fields fails with FAIL_JSON_PARSE or FAIL_JSON_OBJECT.
  */

#include <iostream>
#include <string>
#include <list>

using namespace std;

#include "arraymon.h"

#define ARRAY_JSON_ARRAY_NAME        "array_name"
#define ARRAY_JSON_NAME              "name"
#define ARRAY_JSON_STATUS            "status"
#define ARRAY_JSON_TYPE              "type"
#define ARRAY_JSON_SIZE              "size"
#define ARRAY_JSON_CAPACITY          "capacity"
#define ARRAY_JSON_TOTAL             "total"
#define ARRAY_JSON_VOLUMES           "volumes"
#define ARRAY_JSON_SNAPSHOTS         "snapshots"
#define ARRAY_JSON_SHARED_SPACE      "shared_space"
#define ARRAY_JSON_SYSTEM            "system"
#define ARRAY_JSON_DATA_REDUCTION    "data_reduction"
#define ARRAY_JSON_TOTAL_REDUCTION   "total_reduction"
#define ARRAY_JSON_THIN_PROVISIONING "thin_provisioning"
#define ARRAY_JSON_READS_PER_SEC     "reads_per_sec"
#define ARRAY_JSON_WRITES_PER_SEC    "writes_per_sec"
#define ARRAY_JSON_INPUT_PER_SEC     "input_per_sec"
#define ARRAY_JSON_OUTPUT_PER_SEC    "output_per_sec"
#define ARRAY_JSON_USEC_PER_READ     "usec_per_read_op"
#define ARRAY_JSON_USEC_PER_WRITE    "usec_per_write_op"
#define ARRAY_JSON_QUEUE_DEPTH       "queue_depth"

int arrayJson_load_array_name   ( char * json_str_ptr, string & array_name );
int arrayJson_load_capacity     ( char * json_str_ptr, array_capacity_type & capacity );
int arrayJson_load_performance  ( char * json_str_ptr, array_perf_type & perf );
int arrayJson_load_hardware     ( char * json_str_ptr, list<array_hw_type> & hw_list );
int arrayJson_load_drives       ( char * json_str_ptr, list<array_drive_type> & drive_list );
int arrayJson_load_volume       ( char * json_str_ptr, array_volume_type & volume );

/* names in the order the array listed them ; duplicates are kept */
int arrayJson_load_volume_names ( char * json_str_ptr, list<string> & names );

#endif /* __INCLUDE_ARRAYJSON_H__ */
