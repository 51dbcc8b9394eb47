#ifndef __DAEMON_COMMON_H__
#define __DAEMON_COMMON_H__
/*
 * Copyright (c) 2013, 2016 Wind River Systems, Inc.
*
* SPDX-License-Identifier: Apache-2.0
*
 */

 /**
  * @file
  * Storage Array Monitor Common Daemon Header
  */

#include <iostream>
#include <string>

using namespace std ;

#include "logMacros.h"
#include "returnCodes.h"

#define DAEMON_CONFIG_FILE  "/etc/arraymon/arraymon.conf"

#ifndef UNUSED
#define UNUSED(_x_) ((void) _x_)
#endif

#ifndef MEMSET_ZERO
#define MEMSET_ZERO(_y_) (memset (&_y_,0,sizeof(_y_)))
#endif

/** Called on exit to close syslog and free config strings */
void daemon_exit ( void );

/** daemon_files.cpp cleanup utility */
void daemon_files_fini ( void );

bool   daemon_is_file_present ( const char * filename );
bool   daemon_is_dir_present  ( const char * dirname  );
int    daemon_make_dir        ( const char * dir );
void   daemon_remove_file     ( const char * filename );
int    daemon_read_file       ( const char * filename, string & data );

/* Write the full contents to 'filename' through a temp file that is
 * synced and then renamed over the target, then sync the directory. */
int    daemon_write_file_atomic ( const char * filename, const string & data );

/**
 * Read the specified config file into the daemon configuration.
 * A missing file leaves the defaults in place.
 */
int  daemon_configure ( const char * config_file );

/* Set default config values.
 * This is especially important for char * options that default to null. */
void daemon_config_default ( daemon_config_type * config_ptr );

/* Free the strdup'ed config strings */
void daemon_config_free    ( daemon_config_type * config_ptr );

/* Replace a strdup'ed config string with a copy of value */
void daemon_config_set_str ( char ** str_ptr, const char * value );

void daemon_dump_cfg ( void );

/**
 * Run the requested scope and return the process exit code
 */
int daemon_service_run ( void );

int debug_config_handler (         void * user,
                             const char * section,
                             const char * name,
                             const char * value);

/* Fault insertion ; always false unless built with WANT_FIT_TESTING */
bool daemon_want_fit ( int code );
bool daemon_want_fit ( int code, string name );

#define CONFIG_ARRAY_PORT            0x00000001 /**< Array REST API port       */
#define CONFIG_API_VERSION           0x00000002 /**< Array REST API version    */
#define CONFIG_HTTP_TIMEOUT          0x00000004 /**< Request timeout           */
#define CONFIG_STORE_DIR             0x00000008 /**< Sensor store directory    */
#define CONFIG_CAPACITY_LIMITS       0x00000010 /**< Capacity percent limits   */
#define CONFIG_PROV_URL              0x00000020 /**< Provisioning base url     */
#define CONFIG_PROV_CREDS            0x00000040 /**< Provisioning credentials  */
#define CONFIG_PROV_TEMPLATE         0x00000080 /**< Template and parent ids   */

#endif /* __DAEMON_COMMON_H__ */
