/*
 * Copyright (c) 2013-2016 Wind River Systems, Inc.
*
* SPDX-License-Identifier: Apache-2.0
*
 */

 /**
  * @file
  * Storage Array Monitor output document formatter
  */

#include <iostream>
#include <string>
#include <list>

using namespace std;

#ifdef  __AREA__
#undef  __AREA__
#endif
#define __AREA__ "fmt"

#include "monUtil.h"
#include "jsonUtil.h"      /* for ... jsonUtil_escapeSpecialChar */
#include "arrayFormat.h"

static string _count ( long long value )
{
    if ( value < 0 )
        value = 0 ;
    return ( lltos ( (unsigned long long)value ));
}

static string _percent ( long long part, long long whole )
{
    if ( whole <= 0 )
        return ("0.00");
    return ( dtos ( ((double)part / (double)whole) * 100.0, 2 ));
}

prtg_result_type arrayFormat_channel ( string channel, string value, string unit )
{
    prtg_result_type result ;
    result.channel    = channel ;
    result.value      = value   ;
    result.unit       = unit    ;
    result.is_float   = false   ;
    result.limit_mode = 0       ;
    return (result);
}

static prtg_result_type _custom ( string channel, string value, string customunit, bool is_float )
{
    prtg_result_type result = arrayFormat_channel ( channel, value, PRTG_UNIT__CUSTOM );
    result.customunit = customunit ;
    result.is_float   = is_float   ;
    return (result);
}

/*****************************************************************************
 *
 * Name       : arrayFormat_capacity
 *
 * Description: The array space channels. Capacity Used carries the
 *              configured warning and error limits.
 *
 *****************************************************************************/
list<prtg_result_type> arrayFormat_capacity ( const array_capacity_type & capacity,
                                              int warn_percent,
                                              int error_percent )
{
    list<prtg_result_type> results ;

    prtg_result_type used = arrayFormat_channel ( "Capacity Used",
                                                  _percent ( capacity.total, capacity.capacity ),
                                                  PRTG_UNIT__PERCENT );
    used.is_float          = true ;
    used.limit_max_warning = itos ( warn_percent );
    used.limit_max_error   = itos ( error_percent );
    used.limit_mode        = 1 ;
    results.push_back ( used );

    results.push_back ( arrayFormat_channel ( "Capacity",     _count(capacity.capacity),     PRTG_UNIT__BYTES_DISK ));
    results.push_back ( arrayFormat_channel ( "Used",         _count(capacity.total),        PRTG_UNIT__BYTES_DISK ));
    results.push_back ( arrayFormat_channel ( "Volumes",      _count(capacity.volumes),      PRTG_UNIT__BYTES_DISK ));
    results.push_back ( arrayFormat_channel ( "Snapshots",    _count(capacity.snapshots),    PRTG_UNIT__BYTES_DISK ));
    results.push_back ( arrayFormat_channel ( "Shared Space", _count(capacity.shared_space), PRTG_UNIT__BYTES_DISK ));
    results.push_back ( arrayFormat_channel ( "System",       _count(capacity.system),       PRTG_UNIT__BYTES_DISK ));

    results.push_back ( _custom ( "Data Reduction",  dtos ( capacity.data_reduction,  2 ), ":1", true ));
    results.push_back ( _custom ( "Total Reduction", dtos ( capacity.total_reduction, 2 ), ":1", true ));

    prtg_result_type thin = arrayFormat_channel ( "Thin Provisioning",
                                                  dtos ( capacity.thin_provisioning * 100.0, 2 ),
                                                  PRTG_UNIT__PERCENT );
    thin.is_float = true ;
    results.push_back ( thin );

    return (results);
}

list<prtg_result_type> arrayFormat_performance ( const array_perf_type & perf )
{
    list<prtg_result_type> results ;

    results.push_back ( _custom ( "Read IOPS",  _count(perf.reads_per_sec),  "IOPS", false ));
    results.push_back ( _custom ( "Write IOPS", _count(perf.writes_per_sec), "IOPS", false ));

    /* output is what the array sends ; reads */
    results.push_back ( arrayFormat_channel ( "Read Bandwidth",  _count(perf.output_per_sec), PRTG_UNIT__SPEED_DISK ));
    results.push_back ( arrayFormat_channel ( "Write Bandwidth", _count(perf.input_per_sec),  PRTG_UNIT__SPEED_DISK ));

    results.push_back ( _custom ( "Read Latency",  _count(perf.usec_per_read_op),  "us", false ));
    results.push_back ( _custom ( "Write Latency", _count(perf.usec_per_write_op), "us", false ));

    results.push_back ( arrayFormat_channel ( "Queue Depth", _count(perf.queue_depth), PRTG_UNIT__COUNT ));

    return (results);
}

list<prtg_result_type> arrayFormat_hardware ( const list<array_hw_type> & hw_list )
{
    list<prtg_result_type> results ;

    for ( list<array_hw_type>::const_iterator iter = hw_list.begin() ; iter != hw_list.end() ; ++iter )
    {
        prtg_result_type hw = _custom ( iter->name, itos ( arrayStatus_hw_code ( iter->status )), "", false );
        hw.value_lookup = HW_STATUS_LOOKUP_TABLE ;
        results.push_back ( hw );
    }
    return (results);
}

list<prtg_result_type> arrayFormat_drives ( const list<array_drive_type> & drive_list )
{
    list<prtg_result_type> results ;
    int failed = 0 ;

    for ( list<array_drive_type>::const_iterator iter = drive_list.begin() ; iter != drive_list.end() ; ++iter )
    {
        int code = arrayStatus_drive_code ( iter->status );
        if ( code >= arrayStatus_drive_code ( DRIVE_STATUS__FAILED_THRESHOLD ))
        {
            failed++ ;
        }
        prtg_result_type drive = _custom ( iter->name, itos ( code ), "", false );
        drive.value_lookup = DRIVE_STATUS_LOOKUP_TABLE ;
        results.push_back ( drive );
    }

    prtg_result_type summary = arrayFormat_channel ( "Drives Failed", itos ( failed ), PRTG_UNIT__COUNT );
    summary.limit_max_error = DRIVES_FAILED_MAX_ERROR ;
    summary.limit_mode      = 1 ;
    results.push_back ( summary );

    return (results);
}

list<prtg_result_type> arrayFormat_volume ( const array_volume_type & volume )
{
    list<prtg_result_type> results ;

    results.push_back ( arrayFormat_channel ( "Size",      _count(volume.size),      PRTG_UNIT__BYTES_DISK ));
    results.push_back ( arrayFormat_channel ( "Used",      _count(volume.total),     PRTG_UNIT__BYTES_DISK ));
    results.push_back ( arrayFormat_channel ( "Snapshots", _count(volume.snapshots), PRTG_UNIT__BYTES_DISK ));

    prtg_result_type used = arrayFormat_channel ( "Used Percent",
                                                  _percent ( volume.total, volume.size ),
                                                  PRTG_UNIT__PERCENT );
    used.is_float = true ;
    results.push_back ( used );

    results.push_back ( _custom ( "Data Reduction", dtos ( volume.data_reduction, 2 ), ":1", true ));

    return (results);
}

prtg_result_type arrayFormat_scan_status ( int value )
{
    return ( arrayFormat_channel ( "Scan Status", itos ( value ), PRTG_UNIT__COUNT ));
}

static void _add_str ( string & element, const char * key, const string & value )
{
    element.append (",\"");
    element.append (key);
    element.append ("\":\"");
    element.append (jsonUtil_escapeSpecialChar ( value ));
    element.append ("\"");
}

string arrayFormat_element ( const prtg_result_type & result )
{
    string element = "{\"channel\":\"" ;
    element.append (jsonUtil_escapeSpecialChar ( result.channel ));
    element.append ("\"");

    _add_str ( element, "value", result.value );
    _add_str ( element, "unit",  result.unit  );

    if ( !result.customunit.empty() )
        _add_str ( element, "customunit", result.customunit );

    element.append (",\"float\":");
    element.append ( result.is_float ? "1" : "0" );

    if ( !result.limit_max_error.empty() )
        _add_str ( element, "LimitMaxError", result.limit_max_error );
    if ( !result.limit_max_warning.empty() )
        _add_str ( element, "LimitMaxWarning", result.limit_max_warning );
    if ( !result.limit_min_error.empty() )
        _add_str ( element, "LimitMinError", result.limit_min_error );
    if ( !result.limit_min_warning.empty() )
        _add_str ( element, "LimitMinWarning", result.limit_min_warning );

    element.append (",\"LimitMode\":");
    element.append ( itos ( result.limit_mode ));

    if ( !result.value_lookup.empty() )
        _add_str ( element, "ValueLookup", result.value_lookup );

    element.append ("}");
    return (element);
}

string arrayFormat_result ( const list<prtg_result_type> & results )
{
    string document = "{\"prtg\":{\"result\":[" ;
    for ( list<prtg_result_type>::const_iterator iter = results.begin() ; iter != results.end() ; ++iter )
    {
        if ( iter != results.begin() )
            document.append (",");
        document.append ( arrayFormat_element ( *iter ));
    }
    document.append ("]}}");
    return (document);
}

string arrayFormat_error ( string text )
{
    string document = "{\"prtg\":{\"error\":1,\"text\":\"" ;
    document.append ( jsonUtil_escapeSpecialChar ( text ));
    document.append ("\"}}");
    return (document);
}
