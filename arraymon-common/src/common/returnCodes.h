#ifndef __INCLUDE_RETURNCODES_H__
#define __INCLUDE_RETURNCODES_H__
/*
 * Copyright (c) 2013-2016 Wind River Systems, Inc.
*
* SPDX-License-Identifier: Apache-2.0
*
 */

 /**
  * @file
  * Storage Array Monitor Common Return Codes
  *
  * All service interfaces return PASS or one of these failure codes.
  * Raw HTTP status codes (400..599) are also passed through unchanged
  * by the http utilities so codes below stay clear of that range.
  */

#define PASS                      (0)
#define FAIL                      (1)
#define RETRY                     (2)

#define FAIL_NULL_POINTER        (10)
#define FAIL_BAD_PARM            (11)
#define FAIL_BAD_CASE            (12)
#define FAIL_STRING_EMPTY        (13)
#define FAIL_INVALID_DATA        (14)
#define FAIL_NOT_FOUND           (15)
#define FAIL_DUPLICATE           (16)
#define FAIL_OPERATION           (17)
#define FAIL_NOT_SUPPORTED       (18)

#define FAIL_FILE_OPEN           (20)
#define FAIL_FILE_WRITE          (21)
#define FAIL_FILE_READ           (22)
#define FAIL_FILE_SYNC           (23)
#define FAIL_FILE_RENAME         (24)
#define FAIL_DIR_CREATE          (25)

#define FAIL_LOAD_INI            (30)
#define FAIL_INI_CONFIG          (31)
#define FAIL_DAEMON_INIT         (32)

#define FAIL_JSON_PARSE          (40)
#define FAIL_JSON_OBJECT         (41)
#define FAIL_JSON_ZERO_LEN       (42)
#define FAIL_JSON_TOO_LONG       (43)

#define FAIL_TIMEOUT             (50)
#define FAIL_CONNECT             (51)
#define FAIL_EVENT_BASE          (52)
#define FAIL_REQUEST_NEW         (53)
#define FAIL_PAYLOAD_ADD         (54)
#define FAIL_HEADER_ADD          (55)
#define FAIL_HTTP_ZERO_STATUS    (56)
#define FAIL_HTTP_REDIRECT       (57)
#define FAIL_AUTHENTICATION      (58)
#define FAIL_URI_PARSE           (59)

#define FAIL_FIT                 (99)

#endif /* __INCLUDE_RETURNCODES_H__ */
