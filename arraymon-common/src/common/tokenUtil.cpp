/*
 * Copyright (c) 2013, 2017 Wind River Systems, Inc.
*
* SPDX-License-Identifier: Apache-2.0
*
 */

 /**
  * @file
  * Storage Array Monitor array session token utility
  */

#include <iostream>
#include <string>

using namespace std;

#ifdef  __AREA__
#undef  __AREA__
#endif
#define __AREA__ "tok"

#include "monUtil.h"        /* for ... common utilities               */
#include "jsonUtil.h"       /* for ... Json utilities                 */
#include "tokenUtil.h"      /* for ... this module header             */
#include "daemon_common.h"  /* for ... daemon_want_fit                */

/* The static token used for authentication by any
 * daemon that includes this module */
static keyToken_type      __token__ ;
keyToken_type * tokenUtil_get_ptr   ( void ) { return &__token__ ; };
keyToken_type   tokenUtil_get_token ( void ) { return __token__ ; };

string tokenUtil_cookie_value ( string set_cookie )
{
    size_t pos = set_cookie.find (';');
    if ( pos != string::npos )
        set_cookie = set_cookie.substr ( 0, pos );
    return ( trim_whitespace ( set_cookie ));
}

/*******************************************************************
 *
 * Name       : tokenUtil_handler
 *
 * Description: Handles the array authentication request
 *              responses for the following messages
 *
 *     ARRAY_GET_API_TOKEN - {"api_token": "..."}
 *     ARRAY_GET_SESSION   - {"username": "..."} + Set-Cookie header
 *
 *******************************************************************/
int tokenUtil_handler ( libEvent & event )
{
    string hn = event.hostname ;
    int    rc = event.status   ;

    keyToken_type * token_ptr = tokenUtil_get_ptr ( ) ;

    if ( event.status )
    {
        elog ( "%s Token Request Failed - Error Code (%d) \n", hn.c_str(), event.status );
        return ( event.status );
    }
    if ( event.request == ARRAY_GET_API_TOKEN )
    {
        string api_token ;
        if ( jsonUtil_get_key_val ( (char*)event.response.data(), ARRAY_JSON_API_TOKEN, api_token ) != PASS )
        {
            elog ( "%s Token Request Failed - Json Parse Error\n", hn.c_str());
            rc = FAIL_JSON_PARSE ;
        }
        else if ( api_token.empty() || ( api_token == JSON_NONE ))
        {
            elog ( "%s Token Request Failed - no '%s' in response\n", hn.c_str(), ARRAY_JSON_API_TOKEN );
            rc = FAIL_AUTHENTICATION ;
        }
        else
        {
            jlog ("%s Token Len: %ld\n", hn.c_str(), (long)api_token.length() );
            token_ptr->token = api_token ;
            rc = PASS ;
        }
    }
    else if ( event.request == ARRAY_GET_SESSION )
    {
        string cookie = tokenUtil_cookie_value ( event.cookie ) ;
        if ( cookie.empty() )
        {
            elog ( "%s Session Request Failed - no session cookie in header\n", hn.c_str());
            rc = FAIL_AUTHENTICATION ;
        }
        else
        {
            token_ptr->cookie    = cookie ;
            token_ptr->refreshed = true   ;
            rc = PASS ;
        }
    }
    else
    {
        slog ("%s unsupported token request (%d)\n", hn.c_str(), event.request );
        rc = FAIL_BAD_CASE ;
    }
    return (rc);
}

/*******************************************************************
 *
 * Name       : tokenUtil_new_token
 *
 * Description: Fetch an api token, if no api key was supplied, and
 *              then open a session with it. Both are blocking requests.
 *
 * Returns    : PASS with __token__ loaded or FAIL_AUTHENTICATION or
 *              the transport failure code.
 *
 *******************************************************************/
int tokenUtil_new_token ( libEvent & event, tokenUtil_cred_type & cred )
{
    int rc = PASS ;

    __token__.url = cred.prefix ;
    __token__.token.clear();
    __token__.cookie.clear();
    __token__.refreshed = false ;

    ilog ("%s Requesting Array Session\n", cred.ip.c_str());

    if ( daemon_want_fit ( FIT_CODE__ARRAY__AUTH_FAIL, cred.ip ))
    {
        slog ("%s FIT array authentication failure\n", cred.ip.c_str());
        return (FAIL_AUTHENTICATION);
    }

    if ( !cred.api_key.empty() )
    {
        dlog ("%s using supplied api key\n", cred.ip.c_str());
        __token__.token = cred.api_key ;
    }
    else if ( cred.username.empty() || cred.password.empty() )
    {
        elog ("%s no api key or username/password supplied\n", cred.ip.c_str());
        return (FAIL_AUTHENTICATION);
    }
    else
    {
        httpUtil_event_init ( &event,
                               cred.ip,
                               "tokenUtil_new_token",
                               cred.ip,
                               cred.port );

        event.request     = ARRAY_GET_API_TOKEN ;
        event.operation   = "get api token" ;
        event.type        = EVHTTP_REQ_POST ;
        event.timeout     = cred.timeout ;
        event.handler     = &tokenUtil_handler ;
        event.address     = cred.prefix ;
        event.address.append ("/");
        event.address.append (ARRAY_API_TOKEN_LABEL);

        event.payload = "{\"username\":\"" ;
        event.payload.append (jsonUtil_escapeSpecialChar(cred.username));
        event.payload.append ("\",\"password\":\"");
        event.payload.append (jsonUtil_escapeSpecialChar(cred.password));
        event.payload.append ("\"}");

        rc = httpUtil_api_request ( event );
        if ( rc != PASS )
        {
            elog ("%s api token request failed (rc:%d)\n", cred.ip.c_str(), rc );
            return (rc);
        }
    }

    httpUtil_event_init ( &event,
                           cred.ip,
                           "tokenUtil_new_token",
                           cred.ip,
                           cred.port );

    event.request     = ARRAY_GET_SESSION ;
    event.operation   = "open session" ;
    event.type        = EVHTTP_REQ_POST ;
    event.timeout     = cred.timeout ;
    event.handler     = &tokenUtil_handler ;
    event.address     = cred.prefix ;
    event.address.append ("/");
    event.address.append (ARRAY_SESSION_LABEL);

    event.payload = "{\"api_token\":\"" ;
    event.payload.append (jsonUtil_escapeSpecialChar(__token__.token));
    event.payload.append ("\"}");

    rc = httpUtil_api_request ( event );
    if ( rc != PASS )
    {
        elog ("%s session request failed (rc:%d)\n", cred.ip.c_str(), rc );
    }
    else
    {
        ilog ("%s Array Session Established\n", cred.ip.c_str());
    }
    return (rc);
}
