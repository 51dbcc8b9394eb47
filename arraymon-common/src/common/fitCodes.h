#ifndef __INCLUDE_FITCODES_H__
#define __INCLUDE_FITCODES_H__
/*
 * Copyright (c) 2013, 2016, 2024 Wind River Systems, Inc.
*
* SPDX-License-Identifier: Apache-2.0
*
 */

 /**
  * @file
  * Storage Array Monitor Fault Insertion Code Definitions
  */

/*****************************************************************************
 *
 * These definitions are used for fault insertion testing.
 *
 * Fault insertion is only compiled in with WANT_FIT_TESTING and is only
 * active when the [debug] section of the config file has
 *
 *   testmode = 1
 *   fit_code = <decimal number>
 *   fit_name = <target name>   ; volume name, instance id or "any"
 *
 *****************************************************************************/

#define FIT_CODE__NONE                                (0)

/* Storage Array queries */
#define FIT_CODE__ARRAY__AUTH_FAIL                   (10)
#define FIT_CODE__ARRAY__QUERY_TIMEOUT               (11)

/* Sensor State Store */
#define FIT_CODE__STORE__WRITE_FAIL                  (20)

/* Monitor Provisioning API */
#define FIT_CODE__PROV__CLONE_FAIL                   (30)
#define FIT_CODE__PROV__SET_PARAMS_FAIL              (31)
#define FIT_CODE__PROV__ENABLE_FAIL                  (32)
#define FIT_CODE__PROV__DELETE_FAIL                  (33)

#endif /* __INCLUDE_FITCODES_H__ */
