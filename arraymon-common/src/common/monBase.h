#ifndef __INCLUDE_MONBASE_HH__
#define __INCLUDE_MONBASE_HH__
/*
 * Copyright (c) 2013-2016 Wind River Systems, Inc.
*
* SPDX-License-Identifier: Apache-2.0
*
 */

 /**
  * @file
  * Storage Array Monitor "Base" Header
  */

#include <iostream>
#include <string.h>

using namespace std;

#include "fitCodes.h"
#include "logMacros.h"
#include "returnCodes.h"

#ifndef UNUSED
#define UNUSED(_x_) ((void) _x_)
#endif

#ifndef MEMSET_ZERO
#define MEMSET_ZERO(_y_) (memset (&_y_,0,sizeof(_y_)))
#endif

#define MAX_FILENAME_LEN        (100)
#define MAX_CHARS_HOSTNAME       (32)  /**< The largest hostname length    */
#define MAX_API_LOG_LEN         (512)  /**< request log line buffer size   */

/** Largest response body accepted from any REST API */
#define MAX_RESPONSE_LEN    (1048576)

#define NONE "none"

#endif /* __INCLUDE_MONBASE_HH__ */
