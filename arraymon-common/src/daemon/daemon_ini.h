#ifndef __INCLUDE_DAEMON_INI_H__
#define __INCLUDE_DAEMON_INI_H__
/*
 * Copyright (c) 2013-2014 Wind River Systems, Inc.
*
* SPDX-License-Identifier: Apache-2.0
*
 */

 /**
  * @file
  * Storage Array Monitor ini file parser wrapper
  *
  * Handlers are called once per name=value pair with the section
  * and name they were found under ; use MATCH to select them.
  */

#include <string.h>
#include <ini.h>      /* for ... ini_parse */

#define MATCH(s, n) ((strcmp(section, s) == 0) && (strcmp(name, n) == 0))

#endif /* __INCLUDE_DAEMON_INI_H__ */
