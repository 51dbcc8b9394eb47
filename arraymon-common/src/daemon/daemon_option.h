#if !defined(_ARRAYMON_DAEMON_H__)
#define      _ARRAYMON_DAEMON_H__
/*
 * Copyright (c) 2013, 2015 Wind River Systems, Inc.
*
* SPDX-License-Identifier: Apache-2.0
*
 */

/**
 * @file
 * Storage Array Monitor Run Options
 */

/**
 * @addtogroup daemon_main
 * @{
 */

#include <iostream>
#include <string>

using namespace std ;

/**
 * Command line run options structure
 */
typedef struct
{
   int    help     ; /**< Display options help                   */
   int    bad_arg  ; /**< unsupported option or missing value    */
   int    verbose  ; /**< Dump command line options               */
   int    debug    ; /**< debug level ; overrides config file     */
   int    front    ; /**< log to the console rather than syslog   */
   int    port     ; /**< array port ; 0 means use config         */

   string array    ; /**< array address                           */
   string username ; /**< array username                          */
   string password ; /**< array password                          */
   string apikey   ; /**< array api token ; preferred over login  */
   string scope    ; /**< scope to run                            */
   string volume   ; /**< volume scope target                     */
   string config   ; /**< config file                             */

   string prov_url      ; /**< provisioning base url               */
   string prov_user     ; /**< provisioning username               */
   string prov_hash     ; /**< provisioning passhash               */
   string prov_template ; /**< instance to clone                   */
   string prov_group    ; /**< group to clone into                 */
}  opts_type   ;

opts_type * daemon_get_opts_ptr ( void );

/**
 * @} daemon_main
 */

#endif
