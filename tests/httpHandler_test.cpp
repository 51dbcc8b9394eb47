/*
 * Copyright (c) 2013-2017 Wind River Systems, Inc.
*
* SPDX-License-Identifier: Apache-2.0
*
 */

 /**
  * @file
  * Storage Array Monitor http helper and response handler tests
  *
  * None of these send a request ; each handler is called with the
  * event state the request machinery leaves behind.
  */

#include <gtest/gtest.h>

#include <iostream>
#include <string>

using namespace std;

#include "monBase.h"
#include "httpUtil.h"
#include "tokenUtil.h"
#include "arrayHttp.h"
#include "provHttp.h"
#include "daemon_common.h"
#include "testSupport.h"

/* an event as left by a completed request */
static void _completed ( libEvent & event, libEvent_enum request )
{
    httpUtil_event_init ( &event, "testhost", "test", "127.0.0.1", 80 );
    event.request     = request ;
    event.status      = PASS ;
    event.http_status = 200 ;
}

TEST ( HttpUtil, UrlParse )
{
    string ip   ;
    int    port = 0 ;
    string path ;

    EXPECT_EQ ( PASS, httpUtil_url_parse ( "http://prtg.local:8080/base/", ip, port, path ));
    EXPECT_EQ ( "prtg.local", ip );
    EXPECT_EQ ( 8080, port );
    EXPECT_EQ ( "/base", path );

    EXPECT_EQ ( PASS, httpUtil_url_parse ( "http://10.1.1.2", ip, port, path ));
    EXPECT_EQ ( "10.1.1.2", ip );
    EXPECT_EQ ( 80, port );
    EXPECT_EQ ( "", path );

    EXPECT_EQ ( FAIL_URI_PARSE, httpUtil_url_parse ( "https://prtg.local", ip, port, path ));
    EXPECT_EQ ( FAIL_URI_PARSE, httpUtil_url_parse ( "prtg.local:8080", ip, port, path ));
}

TEST ( HttpUtil, UriEncode )
{
    EXPECT_EQ ( "Volume%20vol-a", httpUtil_uri_encode ("Volume vol-a"));
    EXPECT_EQ ( "--scope%20volume%20--volume%20a%2Fb",
                httpUtil_uri_encode ("--scope volume --volume a/b"));
    EXPECT_EQ ( "plain_name.1~", httpUtil_uri_encode ("plain_name.1~"));
}

TEST ( HttpUtil, QueryValue )
{
    string value ;
    EXPECT_EQ ( PASS, httpUtil_query_value ( "/sensor.htm?id=2345&tabid=1", "id", value ));
    EXPECT_EQ ( "2345", value );

    EXPECT_EQ ( PASS, httpUtil_query_value ( "/sensor.htm?id=2345&tabid=1", "tabid", value ));
    EXPECT_EQ ( "1", value );

    EXPECT_EQ ( FAIL_NOT_FOUND, httpUtil_query_value ( "/sensor.htm?tabid=1", "id", value ));
    EXPECT_TRUE ( value.empty() );
    EXPECT_EQ ( FAIL_NOT_FOUND, httpUtil_query_value ( "/sensor.htm", "id", value ));
}

TEST ( ProvHttpHandler, CloneIdFromLocation )
{
    libEvent event ;
    _completed ( event, PROV_CLONE_INSTANCE );
    event.http_status = 302 ;
    event.location    = "/sensor.htm?id=2345&tabid=1" ;

    EXPECT_EQ ( PASS, provHttp_handler ( event ));
    EXPECT_EQ ( "2345", event.new_id );
}

TEST ( ProvHttpHandler, CloneWithoutIdFails )
{
    libEvent event ;
    _completed ( event, PROV_CLONE_INSTANCE );
    EXPECT_EQ ( FAIL_INVALID_DATA, provHttp_handler ( event ));

    event.location = "/sensor.htm?tabid=1" ;
    EXPECT_EQ ( FAIL_INVALID_DATA, provHttp_handler ( event ));
    EXPECT_TRUE ( event.new_id.empty() );
}

TEST ( ProvHttpHandler, OtherRequests )
{
    libEvent event ;
    _completed ( event, PROV_DELETE_INSTANCE );
    EXPECT_EQ ( PASS, provHttp_handler ( event ));

    _completed ( event, ARRAY_GET_CAPACITY );
    EXPECT_EQ ( FAIL_BAD_CASE, provHttp_handler ( event ));

    _completed ( event, PROV_ENABLE_INSTANCE );
    event.status = FAIL_TIMEOUT ;
    EXPECT_EQ ( FAIL_TIMEOUT, provHttp_handler ( event ));
}

TEST ( ProvHttpClient, ConfigureChecksUrlAndCredentials )
{
    provHttpClass prov ;
    string new_id ;

    /* nothing is sent before a good configure */
    EXPECT_EQ ( FAIL_OPERATION, prov.clone_instance ( "500", "Volume vol-a", "40", new_id ));
    EXPECT_EQ ( FAIL_OPERATION, prov.delete_instance ( "2345" ));

    EXPECT_EQ ( FAIL_URI_PARSE, prov.configure ( "ftp://prtg.local", "admin", "12345", "params", 5 ));
    EXPECT_EQ ( FAIL_AUTHENTICATION, prov.configure ( "http://prtg.local", "admin", "", "params", 5 ));
    EXPECT_EQ ( FAIL_OPERATION, prov.enable_instance ( "2345" ));

    EXPECT_EQ ( PASS, prov.configure ( "http://prtg.local:8080", "admin", "12345", "", 5 ));
}

TEST ( ArrayHttpHandler, EmptyResponseIsZeroLength )
{
    libEvent event ;
    _completed ( event, ARRAY_GET_CAPACITY );
    EXPECT_EQ ( FAIL_JSON_ZERO_LEN, arrayHttp_handler ( event ));

    event.response = "[{\"capacity\":1}]" ;
    EXPECT_EQ ( PASS, arrayHttp_handler ( event ));

    event.status = FAIL_HTTP_ZERO_STATUS ;
    EXPECT_EQ ( FAIL_HTTP_ZERO_STATUS, arrayHttp_handler ( event ));
}

TEST ( ArrayHttpQuery, EmptyVolumeNameRejected )
{
    libEvent event ;
    arraymon_ctrl_type ctrl ;
    array_volume_type volume ;

    httpUtil_event_init ( &event, "testhost", "test", "127.0.0.1", 80 );
    arraymon_ctrl_init ( ctrl );
    EXPECT_EQ ( FAIL_STRING_EMPTY, arrayHttp_get_volume ( event, ctrl, "", volume ));
}

TEST ( TokenUtil, CookieValue )
{
    EXPECT_EQ ( "session=.eJw1jk", tokenUtil_cookie_value ("session=.eJw1jk; Expires=Thu, 01 Jan 2026; HttpOnly; Path=/"));
    EXPECT_EQ ( "session=abc", tokenUtil_cookie_value (" session=abc "));
    EXPECT_EQ ( "", tokenUtil_cookie_value (""));
}

TEST ( TokenUtil, ApiTokenAndSessionHandled )
{
    libEvent event ;
    _completed ( event, ARRAY_GET_API_TOKEN );
    event.response = "{\"api_token\":\"6e1b80a0-1f2b\"}" ;
    EXPECT_EQ ( PASS, tokenUtil_handler ( event ));
    EXPECT_EQ ( "6e1b80a0-1f2b", tokenUtil_get_token().token );

    event.response = "{\"other\":\"x\"}" ;
    EXPECT_EQ ( FAIL_AUTHENTICATION, tokenUtil_handler ( event ));

    _completed ( event, ARRAY_GET_SESSION );
    event.response = "{\"username\":\"pureuser\"}" ;
    event.cookie   = "session=abc123; HttpOnly; Path=/" ;
    EXPECT_EQ ( PASS, tokenUtil_handler ( event ));
    EXPECT_EQ ( "session=abc123", tokenUtil_get_token().cookie );

    event.cookie.clear();
    EXPECT_EQ ( FAIL_AUTHENTICATION, tokenUtil_handler ( event ));
}

#ifdef WANT_FIT_TESTING
TEST ( ProvHttpClient, InsertedCloneFailure )
{
    test_config_default ();
    daemon_config_type * cfg_ptr = daemon_get_cfg_ptr();
    cfg_ptr->testmode = 1 ;
    cfg_ptr->fit_code = FIT_CODE__PROV__CLONE_FAIL ;
    daemon_config_set_str ( &cfg_ptr->fit_name, "vol-b" );

    provHttpClass prov ;
    string new_id ;
    EXPECT_EQ ( FAIL_FIT, prov.clone_instance ( "500", "Volume vol-b", "40", new_id ));
    EXPECT_TRUE ( new_id.empty() );

    /* other names are not hit */
    EXPECT_EQ ( FAIL_OPERATION, prov.clone_instance ( "500", "Volume vol-a", "40", new_id ));

    test_config_default ();
}
#endif
