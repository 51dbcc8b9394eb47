#ifndef __INCLUDE_SENSORSTORE_H__
#define __INCLUDE_SENSORSTORE_H__
/*
 * Copyright (c) 2013-2016 Wind River Systems, Inc.
*
* SPDX-License-Identifier: Apache-2.0
*
 */

 /**
  * @file
  * Storage Array Monitor Sensor State Store
  *
  * The durable volume name to monitor instance id map of one array.
  *
  * File: <store_dir>/<encoded array_name>.sensors
  *
  *   # comment
  *   <volume_name>=<instance_id>
  *
  * Every put and remove rewrites the whole file through
  * daemon_write_file_atomic before returning. The in memory
  * map is only changed once that write succeeds.
  */

#include <iostream>
#include <string>
#include <map>

using namespace std;

#include "monBase.h"

#define SENSOR_STORE_SUFFIX ".sensors"

typedef map<string,string> sensor_map_type ;

typedef struct
{
    string          array_id ; /**< the array name                */
    string          filename ; /**< full path of the backing file */
    sensor_map_type records  ; /**< volume_name -> instance_id    */
    bool            loaded   ;
} sensorStore_type ;

/*****************************************************************************
 *
 * Name       : sensorStore_load
 *
 * Description: Load the store of 'array_id' from 'store_dir'. A missing
 *              file loads an empty store and creates the file.
 *
 * Returns    : PASS or a StoreUnavailable code ;
 *              FAIL_FILE_OPEN/READ for an unreadable file,
 *              FAIL_INVALID_DATA for a malformed or repeated line,
 *              FAIL_DIR_CREATE or a write code if the file can't be created.
 *
 *****************************************************************************/
int  sensorStore_load   ( sensorStore_type & store, string store_dir, string array_id );

/* upsert ; durable before returning */
int  sensorStore_put    ( sensorStore_type & store, string volume_name, string instance_id );

/* durable before returning ; removing an absent name is a PASS */
int  sensorStore_remove ( sensorStore_type & store, string volume_name );

bool sensorStore_get    ( sensorStore_type & store, string volume_name, string & instance_id );

/* the file contents of a map and the map of file contents */
string sensorStore_format ( const string & array_id, const sensor_map_type & records );
int    sensorStore_parse  ( const string & data, sensor_map_type & records );

/* PASS if the name and id can be stored, else FAIL_INVALID_DATA */
int    sensorStore_validate      ( const string & volume_name, const string & instance_id );
int    sensorStore_validate_name ( const string & volume_name );

/* the store file name of an array, without directory or suffix */
string sensorStore_file_id ( const string & array_id );

#endif /* __INCLUDE_SENSORSTORE_H__ */
