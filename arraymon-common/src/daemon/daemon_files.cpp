/*
 * Copyright (c) 2013-2019, 2025 Wind River Systems, Inc.
*
* SPDX-License-Identifier: Apache-2.0
*
 */

 /**
  * @file
  * Storage Array Monitor file utilities
  *
  * Presence checks, directory creation, whole file read and
  * the durable whole file rewrite used by the sensor store.
  *
  */

#include <stdlib.h>     /* for .. system           */
#include <unistd.h>     /* for .. close and fsync  */
#include <stdio.h>
#include <fcntl.h>
#include <libgen.h>     /* for .. dirname          */
#include <sys/types.h>
#include <sys/stat.h>
#include <syslog.h>
#include <errno.h>

using namespace std;

#include "daemon_common.h"
#include "monBase.h"

#define BUFFER 1024

void daemon_files_fini ( void )
{
    close_syslog();
}

bool daemon_is_file_present ( const char * filename )
{
    struct stat p ;
    memset ( &p, 0 , sizeof(struct stat));
    if ( stat ( filename, &p ) != 0 )
        return (false);
    if ((p.st_ino != 0 ) && (p.st_dev != 0))
        return (true);
    else
        return (false);
}

bool daemon_is_dir_present ( const char * dir )
{
    struct stat p ;
    memset ( &p, 0 , sizeof(struct stat));
    if ( stat ( dir, &p ) != 0 )
        return (false);
    return ( S_ISDIR(p.st_mode) ? true : false );
}

/****************************************************************************
 *
 * Name       : daemon_remove_file
 *
 * Description: Remove the specified file if it exists.
 *
 *****************************************************************************/

void daemon_remove_file ( const char * filename )
{
    if ( daemon_is_file_present ( filename ))
    {
        if ( remove(filename) )
        {
            elog ("failed to remove file '%s' ; (%d:%m)\n", filename, errno);
        }
        else
        {
            if ( daemon_is_file_present ( filename ) )
            {
                elog ("failed to remove file '%s' ; still present\n", filename );
            }
            else
            {
                dlog3 ("removed %s\n", filename );
            }
        }
    }
    else
    {
        dlog3 ("no remove required ; file '%s' not present\n", filename );
    }
}

/****************************************************************************
 *
 * Name       : daemon_make_dir
 *
 * Description: Create the specified full path directory including
 *              any missing parent directories.
 *
 * Returns    : PASS if the directory exists on return or FAIL_DIR_CREATE
 *
 *****************************************************************************/

int daemon_make_dir ( const char * dir )
{
    if (( dir == NULL ) || ( *dir == '\0' ))
        return (FAIL_STRING_EMPTY);

    if ( daemon_is_dir_present ( dir ) == true )
        return (PASS);

    string path = dir ;
    for ( size_t pos = path.find ('/', 1) ; pos != string::npos ; pos = path.find ('/', pos+1))
    {
        string parent = path.substr ( 0, pos );
        if ( daemon_is_dir_present ( parent.data() ) == false )
        {
            if (( mkdir ( parent.data(), 0755 ) != 0 ) && ( errno != EEXIST ))
            {
                elog ("failed to create directory '%s' ; (%d:%m)\n", parent.c_str(), errno );
                return (FAIL_DIR_CREATE);
            }
        }
    }
    if (( mkdir (dir, 0755) != 0 ) && ( errno != EEXIST ))
    {
        elog ("failed to create directory '%s' ; (%d:%m)\n", dir, errno );
        return (FAIL_DIR_CREATE);
    }
    dlog ("created directory %s\n", dir );
    return (PASS);
}

/****************************************************************************
 *
 * Name       : daemon_read_file
 *
 * Description: Load 'data' with the whole contents of 'filename'.
 *
 * Returns    : PASS, FAIL_NOT_FOUND, FAIL_FILE_OPEN or FAIL_FILE_READ
 *
 *****************************************************************************/

int daemon_read_file ( const char * filename, string & data )
{
    data.clear();
    if ( daemon_is_file_present ( filename ) == false )
        return (FAIL_NOT_FOUND);

    FILE * _stream = fopen ( filename, "r" );
    if ( _stream == NULL )
    {
        elog ("failed to open '%s' for read ; (%d:%m)\n", filename, errno );
        return (FAIL_FILE_OPEN);
    }

    int rc = PASS ;
    char buffer [BUFFER];
    MEMSET_ZERO(buffer);
    while ( fgets (buffer, BUFFER, _stream) )
    {
        data.append(buffer);
        MEMSET_ZERO(buffer);
    }
    if ( ferror ( _stream ))
    {
        elog ("failed to read '%s' ; (%d:%m)\n", filename, errno );
        rc = FAIL_FILE_READ ;
    }
    fclose (_stream);
    return (rc);
}

/****************************************************************************
 *
 * Name       : daemon_write_file_atomic
 *
 * Description: Replace the contents of 'filename' with 'data'.
 *
 *              1. write <filename>.tmp
 *              2. fsync it
 *              3. rename it over <filename>
 *              4. fsync the containing directory
 *
 *              A failure at any step leaves the previous file in place.
 *
 *****************************************************************************/

int daemon_write_file_atomic ( const char * filename, const string & data )
{
    int rc = PASS ;
    string tmp_filename = filename ;
    tmp_filename.append (".tmp");

    if ( daemon_want_fit ( FIT_CODE__STORE__WRITE_FAIL, filename ))
    {
        slog ("FIT write failure on %s\n", filename );
        return (FAIL_FIT);
    }

    int fd = open ( tmp_filename.data(), O_WRONLY | O_CREAT | O_TRUNC, 0644 );
    if ( fd < 0 )
    {
        elog ("failed to open '%s' for write ; (%d:%m)\n", tmp_filename.c_str(), errno );
        return (FAIL_FILE_OPEN);
    }

    size_t done = 0 ;
    while ( done < data.length() )
    {
        ssize_t n = write ( fd, data.data()+done, data.length()-done );
        if ( n < 0 )
        {
            if ( errno == EINTR )
                continue ;
            elog ("failed to write '%s' ; (%d:%m)\n", tmp_filename.c_str(), errno );
            rc = FAIL_FILE_WRITE ;
            break ;
        }
        done += (size_t)n ;
    }

    if (( rc == PASS ) && ( fsync ( fd ) != 0 ))
    {
        elog ("failed to sync '%s' ; (%d:%m)\n", tmp_filename.c_str(), errno );
        rc = FAIL_FILE_SYNC ;
    }
    if (( close ( fd ) != 0 ) && ( rc == PASS ))
    {
        elog ("failed to close '%s' ; (%d:%m)\n", tmp_filename.c_str(), errno );
        rc = FAIL_FILE_WRITE ;
    }
    if ( rc != PASS )
    {
        daemon_remove_file ( tmp_filename.data() );
        return (rc);
    }

    if ( rename ( tmp_filename.data(), filename ) != 0 )
    {
        elog ("Error renaming %s -> %s (%d:%m)\n", tmp_filename.c_str(), filename, errno );
        daemon_remove_file ( tmp_filename.data() );
        return (FAIL_FILE_RENAME);
    }

    /* make the rename itself durable */
    char * dir_copy = strdup ( filename );
    if ( dir_copy == NULL )
        return (FAIL_NULL_POINTER);

    int dir_fd = open ( dirname ( dir_copy ), O_RDONLY | O_DIRECTORY );
    if ( dir_fd < 0 )
    {
        elog ("failed to open directory of '%s' ; (%d:%m)\n", filename, errno );
        rc = FAIL_FILE_SYNC ;
    }
    else
    {
        if ( fsync ( dir_fd ) != 0 )
        {
            elog ("failed to sync directory of '%s' ; (%d:%m)\n", filename, errno );
            rc = FAIL_FILE_SYNC ;
        }
        close ( dir_fd );
    }
    free ( dir_copy );

    dlog1 ("wrote %s (%ld bytes)\n", filename, (long)data.length());
    return (rc);
}

/*****************************************************************************
 *
 * Fault insertion
 *
 * Only active when built with WANT_FIT_TESTING and the config [debug]
 * section sets testmode. A fit_name of "any" matches every target.
 *
 *****************************************************************************/

/* Check for fault insertion */
bool daemon_want_fit ( int code )
{
#ifdef WANT_FIT_TESTING
    daemon_config_type * cfg_ptr = daemon_get_cfg_ptr();
    if (( cfg_ptr->testmode ) && ( cfg_ptr->fit_code ))
    {
        if ( cfg_ptr->fit_code == code )
        {
            ilog ("FIT hit code %d\n", code );
            return (true) ;
        }
    }
#else
    UNUSED(code);
#endif
   return (false);
}

bool daemon_want_fit ( int code, string name )
{
#ifdef WANT_FIT_TESTING
    daemon_config_type * cfg_ptr = daemon_get_cfg_ptr();
    if (( cfg_ptr->testmode ) && ( cfg_ptr->fit_code == code ) && ( cfg_ptr->fit_name ))
    {
        string fit_name = cfg_ptr->fit_name ;
        if (( fit_name == "any" ) || ( name.find(fit_name) != std::string::npos ))
        {
            ilog ("FIT hit code %d on %s\n", code, name.c_str());
            return (true) ;
        }
    }
#else
    UNUSED(code);
    UNUSED(name);
#endif
    return (false);
}
