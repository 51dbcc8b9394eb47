#ifndef __INCLUDE_NODELOG_HH__
#define __INCLUDE_NODELOG_HH__
/*
 * Copyright (c) 2013-2017 Wind River Systems, Inc.
*
* SPDX-License-Identifier: Apache-2.0
*
 */

 /**
  * @file
  * Storage Array Monitor "Log Macros" Header
  */

#include <syslog.h>
#include <stdio.h>

#define DEBUG_LEVEL1     0x00000001
#define DEBUG_LEVEL2     0x00000002
#define DEBUG_LEVEL3     0x00000004
#define DEBUG_LEVEL4     0x00000008
#ifndef __AREA__
#define __AREA__ "---"
#endif

/* including for getpid */
#include <sys/types.h>
#include <unistd.h>
#include <stdbool.h>

#ifdef __cplusplus
extern "C" {
#endif

/** configuration options */
typedef struct
{
    /* [config] */
    int   array_port            ; /**< Storage array REST API port            */
    char* api_version           ; /**< Storage array REST API version         */
    int   http_timeout          ; /**< Per request timeout in seconds         */
    char* store_dir             ; /**< Sensor state store directory           */
    int   capacity_warn         ; /**< Capacity used percent warning limit    */
    int   capacity_error        ; /**< Capacity used percent error limit      */

    /* [provision] */
    char* prov_url              ; /**< Provisioning API base url              */
    char* prov_username         ; /**< Provisioning API username              */
    char* prov_passhash         ; /**< Provisioning API passhash              */
    char* prov_template_id      ; /**< Instance cloned for each new volume    */
    char* prov_parent_id        ; /**< Group the new instances are added to   */
    char* prov_name_prefix      ; /**< New instance name is prefix+volume     */
    char* prov_parameters       ; /**< Parameter template ; %volume% expanded */
    char* prov_property         ; /**< Parameter property name                */

    unsigned int mask           ; /**< Config init mask                       */

    /* [debug] */
    int   debug_all    ;
    int   debug_json   ; /**< Enable jlog (json string  ) output if not false */
    int   debug_http   ; /**< Enable hlog (http logs    ) output if not false */
    int   debug_level  ; /**< Enable dlog (debug levels ) output if not 0     */

    int   testmode     ; /**< Enables fault insertion                         */
    int   fit_code     ; /**< fault insertion code ; fitCodes.h               */
    char* fit_name     ; /**< the target name to apply the fit code to        */
} daemon_config_type ;

daemon_config_type * daemon_get_cfg_ptr (void);

bool ltc ( void );

/* returns the current log count */
int lc (void);

char * pt ( void ) ; /* returns pointer to the current time      */
char  * _hn ( void ) ; /* returns pointer to the current host name */
void set_hn ( char * hn ); /* set the current host name */

extern char *program_invocation_name;
extern char *program_invocation_short_name;
#define _pn program_invocation_short_name

#define SYSLOG_OPTION LOG_NDELAY
#define SYSLOG_FACILITY LOG_LOCAL5

/** Open syslog */
#define open_syslog() \
{ \
    openlog(program_invocation_short_name, SYSLOG_OPTION, SYSLOG_FACILITY ) ; \
}

/** Close syslog */
#define close_syslog() \
{ \
    closelog(); \
}

/* ltc represents '-f' option for running in forground and means 'log to console'.
 * Console logs go to stderr ; stdout is reserved for the output document. */

/** Swerr logger macro*/
#define slog(format, args...) { \
    if ( ltc() ) { fprintf ( stderr, "%s [%d.%05d] %s %s %-3s %-18s(%4d) %-24s:Swerr : " format, pt(), getpid(), lc(), _hn(), _pn, __AREA__, __FILE__, __LINE__, __FUNCTION__, ##args) ; } \
    else { syslog(LOG_INFO, "[%d.%05d] %s %s %-3s %-18s(%4d) %-24s:Swerr : " format, getpid(), lc(), _hn(), _pn, __AREA__, __FILE__, __LINE__, __FUNCTION__, ##args) ; } \
}

/** Error log macro */
#define elog(format, args...) { \
    if ( ltc() ) { fprintf ( stderr, "%s [%d.%05d] %s %s %-3s %-18s(%4d) %-24s:Error : " format, pt(), getpid(), lc(), _hn(), _pn, __AREA__, __FILE__, __LINE__, __FUNCTION__, ##args) ; } \
    else { syslog(LOG_INFO, "[%d.%05d] %s %s %-3s %-18s(%4d) %-24s:Error : " format, getpid(), lc(), _hn(), _pn, __AREA__, __FILE__, __LINE__, __FUNCTION__, ##args) ; } \
}

/** Warning logger macro */
#define wlog(format, args...) { \
    if ( ltc() ) { fprintf ( stderr, "%s [%d.%05d] %s %s %-3s %-18s(%4d) %-24s: Warn : " format, pt(), getpid(), lc(), _hn(), _pn, __AREA__, __FILE__, __LINE__, __FUNCTION__, ##args) ; } \
    else { syslog(LOG_INFO, "[%d.%05d] %s %s %-3s %-18s(%4d) %-24s: Warn : " format, getpid(), lc(), _hn(), _pn, __AREA__, __FILE__, __LINE__, __FUNCTION__, ##args) ; } \
}

/** Warning logger macro with throttling */
#define wlog_throttled(cnt,max,format,args...) { \
    if ( ++cnt == 1 ) \
    { \
        if (ltc()) {   fprintf ( stderr, "%s [%d.%05d] %s %s %-3s %-18s(%4d) %-24s: Warn : " format, pt(), getpid(), lc(), _hn(), _pn, __AREA__, __FILE__, __LINE__, __FUNCTION__, ##args) ; } \
        else { syslog(LOG_INFO, "[%d.%05d] %s %s %-3s %-18s(%4d) %-24s: Warn : " format, getpid(), lc(), _hn(), _pn, __AREA__, __FILE__, __LINE__, __FUNCTION__, ##args) ; } \
    } \
    if ( cnt >= max ) \
    { \
        cnt = 0 ; \
    } \
}

/** Info logger macro*/
#define ilog(format, args...) { \
    if ( ltc() ) { fprintf ( stderr, "%s [%d.%05d] %s %s %-3s %-18s(%4d) %-24s: Info : " format, pt(), getpid(), lc(), _hn(), _pn, __AREA__, __FILE__, __LINE__, __FUNCTION__, ##args) ; } \
    else { syslog(LOG_INFO, "[%d.%05d] %s %s %-3s %-18s(%4d) %-24s: Info : " format, getpid(), lc(), _hn(), _pn, __AREA__, __FILE__, __LINE__, __FUNCTION__, ##args) ; } \
}

/** Debug logger macro */
#define dlog(format, args...) { \
    if(daemon_get_cfg_ptr()->debug_level&1) \
    { \
        if ( ltc() ) { fprintf ( stderr, "%s [%d.%05d] %s %s %-3s %-18s(%4d) %-24s:Debug : " format, pt(), getpid(), lc(), _hn(), _pn, __AREA__, __FILE__, __LINE__, __FUNCTION__, ##args) ; } \
        else { syslog(LOG_INFO, "[%d.%05d] %s %s %-3s %-18s(%4d) %-24s:Debug : " format, getpid(), lc(), _hn(), _pn, __AREA__, __FILE__, __LINE__, __FUNCTION__, ##args) ; } \
    } \
}

#define dlog1(format, args...) { \
    if(daemon_get_cfg_ptr()->debug_level&2) \
    { \
        if ( ltc() ) { fprintf ( stderr, "%s [%d.%05d] %s %s %-3s %-18s(%4d) %-24s:Debug2: " format, pt(), getpid(), lc(), _hn(), _pn, __AREA__, __FILE__, __LINE__, __FUNCTION__, ##args) ; } \
        else { syslog(LOG_INFO, "[%d.%05d] %s %s %-3s %-18s(%4d) %-24s:Debug2: " format, getpid(), lc(), _hn(), _pn, __AREA__, __FILE__, __LINE__, __FUNCTION__, ##args) ; } \
    } \
}

#define dlog2(format, args...) { \
    if(daemon_get_cfg_ptr()->debug_level&4) \
    { \
        if ( ltc() ) { fprintf ( stderr, "%s [%d.%05d] %s %s %-3s %-18s(%4d) %-24s:Debug4: " format, pt(), getpid(), lc(), _hn(), _pn, __AREA__, __FILE__, __LINE__, __FUNCTION__, ##args) ; } \
        else { syslog(LOG_INFO, "[%d.%05d] %s %s %-3s %-18s(%4d) %-24s:Debug4: " format, getpid(), lc(), _hn(), _pn, __AREA__, __FILE__, __LINE__, __FUNCTION__, ##args) ; } \
    } \
}

#define dlog3(format, args...) { \
    if(daemon_get_cfg_ptr()->debug_level&8) \
    { \
        if ( ltc() ) { fprintf ( stderr, "%s [%d.%05d] %s %s %-3s %-18s(%4d) %-24s:Debug8: " format, pt(), getpid(), lc(), _hn(), _pn, __AREA__, __FILE__, __LINE__, __FUNCTION__, ##args) ; } \
        else { syslog(LOG_INFO, "[%d.%05d] %s %s %-3s %-18s(%4d) %-24s:Debug8: " format, getpid(), lc(), _hn(), _pn, __AREA__, __FILE__, __LINE__, __FUNCTION__, ##args) ; } \
    } \
}

#define jlog(format, args...)  { if(daemon_get_cfg_ptr()->debug_json&1) syslog(LOG_INFO, "[%d.%05d] %s %s %-3s %-18s(%4d) %-24s: Json : " format, getpid(), lc(), _hn(), _pn, __AREA__, __FILE__, __LINE__, __FUNCTION__, ##args) ; }
#define jlog1(format, args...) { if(daemon_get_cfg_ptr()->debug_json&2) syslog(LOG_INFO, "[%d.%05d] %s %s %-3s %-18s(%4d) %-24s: Json2: " format, getpid(), lc(), _hn(), _pn, __AREA__, __FILE__, __LINE__, __FUNCTION__, ##args) ; }
#define jlog2(format, args...) { if(daemon_get_cfg_ptr()->debug_json&4) syslog(LOG_INFO, "[%d.%05d] %s %s %-3s %-18s(%4d) %-24s: Json4: " format, getpid(), lc(), _hn(), _pn, __AREA__, __FILE__, __LINE__, __FUNCTION__, ##args) ; }

#define hlog(format, args...)  { if(daemon_get_cfg_ptr()->debug_http&1) syslog(LOG_INFO, "[%d.%05d] %s %s %-3s %-18s(%4d) %-24s: Http : " format, getpid(), lc(), _hn(), _pn, __AREA__, __FILE__, __LINE__, __FUNCTION__, ##args) ; }
#define hlog1(format, args...) { if(daemon_get_cfg_ptr()->debug_http&2) syslog(LOG_INFO, "[%d.%05d] %s %s %-3s %-18s(%4d) %-24s: Http2: " format, getpid(), lc(), _hn(), _pn, __AREA__, __FILE__, __LINE__, __FUNCTION__, ##args) ; }
#define hlog2(format, args...) { if(daemon_get_cfg_ptr()->debug_http&4) syslog(LOG_INFO, "[%d.%05d] %s %s %-3s %-18s(%4d) %-24s: Http4: " format, getpid(), lc(), _hn(), _pn, __AREA__, __FILE__, __LINE__, __FUNCTION__, ##args) ; }

#ifdef __cplusplus
}
#endif

#endif /* __INCLUDE_NODELOG_HH__ */
