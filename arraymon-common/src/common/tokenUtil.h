#ifndef __INCLUDE_TOKENUTIL_H__
#define __INCLUDE_TOKENUTIL_H__
/*
 * Copyright (c) 2013, 2017 Wind River Systems, Inc.
*
* SPDX-License-Identifier: Apache-2.0
*
 */

/*
 * This module contains a single static __token__ object and
 * an interface that fills it with an array REST API session.
 *
 *  tokenUtil_new_token  - gets an api token with the username and
 *                         password, unless an api key was supplied,
 *                         and then opens a session with that token.
 *
 *  The session cookie is copied into each request's event.token
 *  and sent as the Cookie header.
 */

#include <iostream>
#include <string>

using namespace std;

#include "logMacros.h"
#include "httpUtil.h"        /* for ... libEvent                   */

#define ARRAY_API_TOKEN_LABEL    "auth/apitoken"
#define ARRAY_SESSION_LABEL      "auth/session"
#define ARRAY_JSON_API_TOKEN     "api_token"

/** Array login credentials and location */
typedef struct
{
    string ip       ; /**< array address                          */
    int    port     ; /**< array REST API port                    */
    string prefix   ; /**< /api/<version>                         */
    string username ;
    string password ;
    string api_key  ; /**< pre-issued api token ; preferred       */
    int    timeout  ; /**< per request timeout in seconds         */
} tokenUtil_cred_type ;

/* returns the static token object for this module */
keyToken_type * tokenUtil_get_ptr      ( void );
keyToken_type   tokenUtil_get_token    ( void );

int             tokenUtil_handler      ( libEvent & event );
int             tokenUtil_new_token    ( libEvent & event, tokenUtil_cred_type & cred );

/* strip the attributes off a Set-Cookie header value ;
 * "session=abc; Path=/; HttpOnly" -> "session=abc" */
string          tokenUtil_cookie_value ( string set_cookie );

#endif /* __INCLUDE_TOKENUTIL_H__ */
