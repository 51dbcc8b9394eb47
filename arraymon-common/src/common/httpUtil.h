#ifndef __INCLUDE_HTTPUTIL_H__
#define __INCLUDE_HTTPUTIL_H__

/*
 * Copyright (c) 2013, 2016, 2024 Wind River Systems, Inc.
 *
 * SPDX-License-Identifier: Apache-2.0
 *
 */

 /**
  * @file
  * Storage Array Monitor blocking HTTP request utility
  */

#include <iostream>         /* for ... string               */
#include <evhttp.h>         /* for ... http libevent client */
#include <time.h>
#include <list>

using namespace std;

#include "monBase.h"

/* HTTP Status Codes with no specific existing define MACRO */
#define MON_HTTP_CREATED              201
#define MON_HTTP_ACCEPTED             202
#define MON_HTTP_NO_CONTENT           204
#define MON_HTTP_MOVED                301
#define MON_HTTP_FOUND                302
#define MON_HTTP_SEE_OTHER            303
#define MON_HTTP_BAD_REQUEST          400
#define MON_HTTP_UNAUTHORIZED         401
#define MON_HTTP_FORBIDDEN            403
#define MON_HTTP_NOT_FOUND            404

#define HTTP_DEFAULT_TIMEOUT   (20)

#define CLIENT_HEADER      "User-Agent"
#define CLIENT_ARRAYMON    "arraymon/1.0"

#define ARRAY_SIG          "array"
#define PROV_SIG           "prov"

/** Array session token / cookie */
typedef struct
{
    string url      ; /**< Array REST API prefix path         */
    string token    ; /**< api token ; from key or user login */
    string cookie   ; /**< session cookie sent on every query */
    bool   refreshed; /**< set true when a session was made   */
} keyToken_type ;

/** All supported Request Type Enums */
typedef enum {
    SERVICE_NONE,

    ARRAY_GET_API_TOKEN,
    ARRAY_GET_SESSION,
    ARRAY_GET_NAME,
    ARRAY_GET_CAPACITY,
    ARRAY_GET_PERFORMANCE,
    ARRAY_GET_HARDWARE,
    ARRAY_GET_DRIVES,
    ARRAY_GET_VOLUME,
    ARRAY_LIST_VOLUMES,

    PROV_CLONE_INSTANCE,
    PROV_SET_PARAMETERS,
    PROV_ENABLE_INSTANCE,
    PROV_DELETE_INSTANCE,

    SERVICE_LAST
} libEvent_enum ;


/** Local event control structure for REST API requests
 *
 *  Storage Array and Monitor Provisioning
 *
 */
struct libEvent
{
    /** Execution Controls */
    int    sequence               ; /**< Event sequence number       */
    int    timeout                ; /**< Request timeout in seconds  */
    bool   accept_redirect        ; /**< treat 3xx as success        */

    /* HTTP request Info */
    enum   evhttp_cmd_type    type; /**< HTTP Request Type ; PUT/GET */
    struct event_base        *base; /**< libEvent API service base   */
    struct evhttp_connection *conn; /**< HTTP connection ptr         */
    struct evhttp_request    *req ; /**< HTTP request ptr            */
    struct evbuffer          *buf ; /**< HTTP output buffer ptr      */

    string log_prefix             ; /**< log prefix for this event   */

    /** Service Specific Request Info */
    libEvent_enum       request   ; /**< Specify the request command */
    keyToken_type       token     ; /**< Copy of the active token    */
    string service                ; /**< Service being executed      */
    string hostname               ; /**< Target name for logs        */
    string ip                     ; /**< Server IP address           */
    int    port                   ; /**< Server port number          */
    string operation              ; /**< Specify the operation       */
    string entity                 ; /**< volume or instance operated on */
    string address                ; /**< http url path and query     */
    string payload                ; /**< the request's payload       */
    string user_agent             ; /**< set the User-Agent header   */

    /** Result Info */
    int    status                 ; /**< Execution Status            */
    int    http_status            ; /**< raw http returned status    */
    int    exec_time_msec         ; /**< execution time in msec      */
    size_t response_len           ; /**< the json response length    */
    string response               ; /**< the json response string    */
    string location               ; /**< Location response header    */
    string cookie                 ; /**< Set-Cookie response header  */
    string new_id                 ; /**< id created & returned       */
    string result                 ; /**< Command specific result str */

    unsigned long long send_msec  ; /**< request dispatch time       */

    int (*handler) (struct libEvent &) ;
} ;


/** Maximum number of headers that can be added to an HTTP message. */
#define MAX_HEADERS (10)

/** A header entry type. */
typedef struct
{
    string key   ; /**< the header label. */
    string value ; /**< the header value. */
} http_header_entry_type;

/** The header entry table. */
typedef struct
{
    int entries ; /**< Number of entries in the header table.    */
    http_header_entry_type entry[MAX_HEADERS]; /**< entry array. */
} http_headers_type ;

int httpUtil_event_init ( libEvent * ptr ,
                            string   hostname,
                            string   service,
                            string   ip,
                               int   port );

/** Add payload to the HTTP message body. */
int httpUtil_payload_add  ( libEvent & event );

/** Add all headers in header table to the HTTP connection message. */
int httpUtil_header_add   ( libEvent * ptr, http_headers_type * hdrs_ptr );

/** Open a connection to an HTTP server. */
int httpUtil_connect ( libEvent & event );

/** Get a new HTTP request pointer. */
int httpUtil_request  ( libEvent & event,
                        void(*hdlr)(struct evhttp_request *, void *));

/** Common blocking REST API Request Utility */
int httpUtil_api_request ( libEvent & event );

/** HTTP response status checker */
int httpUtil_status ( libEvent & event );

/** Free the libEvent */
void httpUtil_free_base ( libEvent & event );

/** Free the event lib connection */
void httpUtil_free_conn ( libEvent & event );

/** Get the length of the json response */
int httpUtil_get_length ( libEvent & event );

/** Load the json response into the event struct */
int httpUtil_get_response ( libEvent & event );

/** print event filtered event */
void httpUtil_log_event ( libEvent & event );

const char * getHttpCmdType_str ( evhttp_cmd_type type );

/** Split an http://host[:port][/path] url into its parts */
int httpUtil_url_parse ( string url, string & ip, int & port, string & path );

/** Percent encode a string for use as a query value */
string httpUtil_uri_encode ( string str );

/** Find the value of 'key' in the query part of a url or path */
int httpUtil_query_value ( string url, string key, string & value );

#endif /* __INCLUDE_HTTPUTIL_H__ */
