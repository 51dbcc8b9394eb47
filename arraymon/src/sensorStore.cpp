/*
 * Copyright (c) 2013-2016 Wind River Systems, Inc.
*
* SPDX-License-Identifier: Apache-2.0
*
 */

 /**
  * @file
  * Storage Array Monitor Sensor State Store
  */

#include <iostream>
#include <string>
#include <map>

using namespace std;

#ifdef  __AREA__
#undef  __AREA__
#endif
#define __AREA__ "sto"

#include "monUtil.h"
#include "httpUtil.h"        /* for ... httpUtil_uri_encode        */
#include "daemon_common.h"   /* for ... daemon_write_file_atomic   */
#include "sensorStore.h"

int sensorStore_validate_name ( const string & volume_name )
{
    if ( volume_name.empty() )
    {
        wlog ("empty volume name\n");
        return (FAIL_INVALID_DATA);
    }
    if (( volume_name.find_first_of ("=\r\n") != string::npos ) ||
        ( volume_name[0] == '#' ) ||
        ( trim_whitespace ( volume_name ) != volume_name ))
    {
        wlog ("volume name '%s' can't be stored\n", volume_name.c_str());
        return (FAIL_INVALID_DATA);
    }
    return (PASS);
}

int sensorStore_validate ( const string & volume_name, const string & instance_id )
{
    int rc = sensorStore_validate_name ( volume_name );
    if ( rc != PASS )
        return (rc);

    if ( instance_id.empty() )
    {
        wlog ("%s empty instance id\n", volume_name.c_str());
        return (FAIL_INVALID_DATA);
    }
    if (( instance_id.find_first_of ("\r\n") != string::npos ) ||
        ( trim_whitespace ( instance_id ) != instance_id ))
    {
        wlog ("%s instance id can't be stored\n", volume_name.c_str());
        return (FAIL_INVALID_DATA);
    }
    return (PASS);
}

string sensorStore_format ( const string & array_id, const sensor_map_type & records )
{
    string data = "# arraymon sensor store for " ;
    data.append ( array_id );
    data.append ("\n# <volume name>=<monitor instance id>\n");

    for ( sensor_map_type::const_iterator iter = records.begin() ; iter != records.end() ; ++iter )
    {
        data.append ( iter->first  );
        data.append ("=");
        data.append ( iter->second );
        data.append ("\n");
    }
    return (data);
}

/*****************************************************************************
 *
 * Name       : sensorStore_parse
 *
 * Description: Load records from the store file contents. Blank lines
 *              and lines starting with '#' are skipped. Any other line
 *              must be key=value with both parts present, and a key
 *              may only appear once.
 *
 *****************************************************************************/
int sensorStore_parse ( const string & data, sensor_map_type & records )
{
    records.clear();

    int    line_num = 0 ;
    size_t first    = 0 ;
    while ( first < data.length() )
    {
        size_t last = data.find ('\n', first );
        if ( last == string::npos )
            last = data.length();

        string line = data.substr ( first, last-first );
        first = last + 1 ;
        line_num++ ;

        string trimmed = trim_whitespace ( line );
        if ( trimmed.empty() || ( trimmed[0] == '#' ))
            continue ;

        size_t pos = trimmed.find ('=');
        if (( pos == string::npos ) || ( pos == 0 ) || ( pos == trimmed.length()-1 ))
        {
            elog ("malformed store line %d\n", line_num );
            records.clear();
            return (FAIL_INVALID_DATA);
        }

        string key   = trim_whitespace ( trimmed.substr ( 0, pos ));
        string value = trim_whitespace ( trimmed.substr ( pos+1 ));
        if ( key.empty() || value.empty() )
        {
            elog ("malformed store line %d\n", line_num );
            records.clear();
            return (FAIL_INVALID_DATA);
        }
        if ( records.find ( key ) != records.end() )
        {
            elog ("store line %d repeats volume '%s'\n", line_num, key.c_str());
            records.clear();
            return (FAIL_INVALID_DATA);
        }
        records[key] = value ;
    }
    return (PASS);
}

/*****************************************************************************
 *
 * Name       : sensorStore_file_id
 *
 * Description: The array name as a file name. Everything but letters,
 *              digits and "-._~" is percent encoded, '%' included, and
 *              so is a leading '.', so two array names never share a
 *              store file.
 *
 *****************************************************************************/
string sensorStore_file_id ( const string & array_id )
{
    string file_id = httpUtil_uri_encode ( array_id );
    if ( !file_id.empty() && ( file_id[0] == '.' ))
    {
        file_id.replace ( 0, 1, "%2E" );
    }
    return (file_id);
}

/* write 'records' and only then make them the store's records */
static int _store_commit ( sensorStore_type & store, const sensor_map_type & records )
{
    int rc = daemon_write_file_atomic ( store.filename.data(),
                                        sensorStore_format ( store.array_id, records ));
    if ( rc != PASS )
    {
        elog ("%s store write failed (rc:%d)\n", store.array_id.c_str(), rc );
        return (rc);
    }
    store.records = records ;
    return (PASS);
}

int sensorStore_load ( sensorStore_type & store, string store_dir, string array_id )
{
    int rc = PASS ;

    store.records.clear();
    store.loaded = false ;

    if ( array_id.empty() || store_dir.empty() )
    {
        slog ("missing store directory or array id\n");
        return (FAIL_STRING_EMPTY);
    }

    string file_id = sensorStore_file_id ( array_id );

    store.array_id = array_id ;
    store.filename = store_dir ;
    store.filename.append ("/");
    store.filename.append ( file_id );
    store.filename.append ( SENSOR_STORE_SUFFIX );

    if ( daemon_is_file_present ( store.filename.data() ) == false )
    {
        rc = daemon_make_dir ( store_dir.data() );
        if ( rc != PASS )
        {
            elog ("%s cannot create store directory '%s' (rc:%d)\n",
                      array_id.c_str(), store_dir.c_str(), rc );
            return (rc);
        }

        sensor_map_type empty ;
        rc = _store_commit ( store, empty );
        if ( rc != PASS )
            return (rc);

        ilog ("%s created empty sensor store %s\n", array_id.c_str(), store.filename.c_str());
        store.loaded = true ;
        return (PASS);
    }

    string data ;
    rc = daemon_read_file ( store.filename.data(), data );
    if ( rc != PASS )
    {
        elog ("%s sensor store %s is unreadable (rc:%d)\n",
                  array_id.c_str(), store.filename.c_str(), rc );
        return (rc);
    }

    rc = sensorStore_parse ( data, store.records );
    if ( rc != PASS )
    {
        elog ("%s sensor store %s is corrupt\n", array_id.c_str(), store.filename.c_str());
        return (rc);
    }

    store.loaded = true ;
    ilog ("%s loaded %ld sensor records\n", array_id.c_str(), (long)store.records.size());
    return (PASS);
}

int sensorStore_put ( sensorStore_type & store, string volume_name, string instance_id )
{
    if ( store.loaded == false )
    {
        slog ("%s store not loaded\n", volume_name.c_str());
        return (FAIL_OPERATION);
    }

    int rc = sensorStore_validate ( volume_name, instance_id );
    if ( rc != PASS )
        return (rc);

    sensor_map_type records = store.records ;
    records[volume_name] = instance_id ;

    rc = _store_commit ( store, records );
    if ( rc == PASS )
    {
        dlog ("%s recorded as instance %s\n", volume_name.c_str(), instance_id.c_str());
    }
    return (rc);
}

int sensorStore_remove ( sensorStore_type & store, string volume_name )
{
    if ( store.loaded == false )
    {
        slog ("%s store not loaded\n", volume_name.c_str());
        return (FAIL_OPERATION);
    }

    sensor_map_type::iterator iter = store.records.find ( volume_name );
    if ( iter == store.records.end() )
    {
        dlog ("%s not in store ; no remove required\n", volume_name.c_str());
        return (PASS);
    }

    sensor_map_type records = store.records ;
    records.erase ( volume_name );

    int rc = _store_commit ( store, records );
    if ( rc == PASS )
    {
        dlog ("%s removed from store\n", volume_name.c_str());
    }
    return (rc);
}

bool sensorStore_get ( sensorStore_type & store, string volume_name, string & instance_id )
{
    sensor_map_type::iterator iter = store.records.find ( volume_name );
    if ( iter == store.records.end() )
        return (false);
    instance_id = iter->second ;
    return (true);
}
