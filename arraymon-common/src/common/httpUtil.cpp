/*
 * Copyright (c) 2013, 2016, 2024 Wind River Systems, Inc.
*
* SPDX-License-Identifier: Apache-2.0
*
 */

 /**
  * @file
  * Storage Array Monitor blocking HTTP request utility
  *
  * Every request gets its own event base and connection.
  * The request is dispatched and the base run until the
  * response handler fires or the request times out.
  */

#include <stdlib.h>
#include <time.h>
#include <event2/keyvalq_struct.h>  /* for ... struct evkeyvalq */

using namespace std;

#ifdef  __AREA__
#undef  __AREA__
#endif
#define __AREA__ "htp"

#include "httpUtil.h"       /* this module header                  */
#include "monUtil.h"        /* for ... string_contains             */

const char * getHttpCmdType_str ( evhttp_cmd_type type )
{
    switch (type)
    {
        case EVHTTP_REQ_GET:     return("GET");
        case EVHTTP_REQ_POST:    return("POST");
        case EVHTTP_REQ_HEAD:    return("HEAD");
        case EVHTTP_REQ_PUT:     return("PUT");
        case EVHTTP_REQ_DELETE:  return("DELETE");
        case EVHTTP_REQ_OPTIONS: return("OPTIONS");
        case EVHTTP_REQ_TRACE:   return("TRACE");
        case EVHTTP_REQ_CONNECT: return("CONNECT");
        case EVHTTP_REQ_PATCH:   return("PATCH");
    }
    return("unknown");
}

/* The request address with the values of credential
 * query parameters masked ; used for all logging */
static string _log_address ( const string & address )
{
    const char * secrets[] = { "passhash=", "password=", "api_token=" } ;
    string safe = address ;
    for ( unsigned int i = 0 ; i < sizeof(secrets)/sizeof(secrets[0]) ; i++ )
    {
        size_t pos = safe.find ( secrets[i] );
        while ( pos != string::npos )
        {
            size_t start = pos + strlen ( secrets[i] );
            size_t end   = safe.find ('&', start );
            if ( end == string::npos )
                end = safe.length();
            safe.replace ( start, end-start, "****" );
            pos = safe.find ( secrets[i], start );
        }
    }
    return (safe);
}

static unsigned long long _now_msec ( void )
{
    struct timespec ts ;
    clock_gettime (CLOCK_MONOTONIC, &ts);
    return (((unsigned long long) ts.tv_sec) * 1000ULL + (ts.tv_nsec/1000000));
}

/*****************************************************************************
 *
 * Name       : httpUtil_event_init
 *
 * Description: Initialize the supplied libevent structure to default
 *              start values including with the supplied hostname,
 *              service , ip and port values.
 *
 * Note: No memory allication is performed.
 *
 ******************************************************************************/

int httpUtil_event_init ( libEvent * ptr ,
                            string   hostname,
                            string   service,
                            string   ip,
                               int   port )
{
    if ( ptr == NULL )
        return (FAIL_NULL_POINTER);

    /* Default Starting States */
    ptr->sequence   = 0              ;
    ptr->request    = SERVICE_NONE   ;
    ptr->log_prefix = hostname       ;
    ptr->log_prefix.append(" ")      ;
    ptr->log_prefix.append(service)  ;

    /* Execution Controls */
    ptr->timeout         = HTTP_DEFAULT_TIMEOUT ;
    ptr->accept_redirect = false ;

    ptr->base = NULL ;
    ptr->conn = NULL ;
    ptr->req  = NULL ;
    ptr->buf  = NULL ;

    /* Service Specific Request Info */
    ptr->ip       = ip       ;
    ptr->port     = port     ;
    ptr->hostname = hostname ;
    ptr->service  = service  ;

    ptr->token.url.clear();
    ptr->token.token.clear();
    ptr->token.cookie.clear();
    ptr->token.refreshed = false ;

    /* Instance Specific Request Data */
    ptr->operation.clear();
    ptr->entity.clear();
    ptr->address.clear();
    ptr->payload.clear();

    /** Default the user agent ; commands can override */
    ptr->user_agent = CLIENT_ARRAYMON ;

    /* HTTP Specific Info */
    ptr->type = EVHTTP_REQ_GET ; /* request type GET/PUT/PATCH etc */

    /* Result Info */
    ptr->status         = FAIL ;
    ptr->http_status    = 0    ;
    ptr->exec_time_msec = 0    ;
    ptr->response_len   = 0    ;
    ptr->response.clear();
    ptr->location.clear();
    ptr->cookie.clear();
    ptr->new_id.clear();
    ptr->result.clear();
    ptr->send_msec = 0 ;

    ptr->handler = NULL ;

    return (PASS);
}

/* ***********************************************************************
 *
 * Name       : httpUtil_free_conn
 *
 * Description: Free an event's connection memory if it exists.
 *
 * ************************************************************************/
void httpUtil_free_conn ( libEvent & event )
{
    if ( event.conn )
    {
        hlog2 ("%s Free Connection (%p)\n", event.log_prefix.c_str(), event.conn );
        evhttp_connection_free ( event.conn );
        event.conn = NULL ;
    }
    else
    {
        hlog1 ("%s Already Freed Connection\n", event.log_prefix.c_str());
    }
}

/* ***********************************************************************
 *
 * Name       : httpUtil_free_base
 *
 * Description: Free an event's base memory if it exists.
 *
 * ************************************************************************/
void httpUtil_free_base ( libEvent & event )
{
    /* Free the base */
    if ( event.base )
    {
        hlog2 ("%s Free Base (%p)\n", event.log_prefix.c_str(), event.base );

        /* the connection must go first ; it references the base */
        httpUtil_free_conn ( event );

        event_base_free(event.base);
        event.base = NULL ;
    }
    else
    {
        hlog1 ("%s Already Freed Event Base\n", event.log_prefix.c_str());
    }
}

/*****************************************************************************
 *
 * Name       : httpUtil_connect
 *
 * Description: Allocate memory for a new connection off the supplied
 *              base with respect to an ip and port.
 *
 ******************************************************************************/

int httpUtil_connect ( libEvent & event )
{
    if ( event.base )
    {
        hlog ("%s target:%s:%d\n", event.log_prefix.c_str(), event.ip.c_str(), event.port);

        /* Open an http connection to specified IP and port */
        event.conn = evhttp_connection_base_new ( event.base, NULL,
                                                  event.ip.c_str(),
                                                  event.port );
        if ( event.conn )
        {
            return(PASS) ;
        }
        else
        {
            elog ("%s create connection failed (evhttp_connection_base_new)\n", event.log_prefix.c_str());
            return (FAIL_CONNECT);
        }
    }
    else
    {
        slog ("%s Null Event base\n", event.log_prefix.c_str());
        return (FAIL_EVENT_BASE);
    }
}

/* Connection level failures ; libevent calls this before the
 * response handler is called with a null request */
static void httpUtil_error_handler ( enum evhttp_request_error error, void * arg )
{
    libEvent * event_ptr = (libEvent*)arg ;
    if ( event_ptr == NULL )
        return ;

    switch ( error )
    {
        case EVREQ_HTTP_TIMEOUT:
            event_ptr->status = FAIL_TIMEOUT ;
            break ;
        case EVREQ_HTTP_EOF:
        case EVREQ_HTTP_INVALID_HEADER:
        case EVREQ_HTTP_BUFFER_ERROR:
        case EVREQ_HTTP_DATA_TOO_LONG:
            event_ptr->status = FAIL_HTTP_ZERO_STATUS ;
            break ;
        case EVREQ_HTTP_REQUEST_CANCEL:
        default:
            event_ptr->status = FAIL_CONNECT ;
            break ;
    }
    wlog ("%s connection error (%d) (rc:%d)\n",
              event_ptr->log_prefix.c_str(), error, event_ptr->status );
}

/*****************************************************************************
 *
 * Name       : httpUtil_request
 *
 * Description: Allocate memory for a new request with the supplied handler
 *              bound to this event as its callback argument.
 *
 ******************************************************************************/

int httpUtil_request ( libEvent & event,
                       void(*hdlr)(struct evhttp_request *, void *))
{
    int rc = PASS ;

    /* make a new request and bind the event handler to it */
    event.req = evhttp_request_new( hdlr , &event );
    if ( ! event.req )
    {
        elog ("%s evhttp_request_new returned NULL\n", event.log_prefix.c_str() );
        rc = FAIL_REQUEST_NEW ;
    }
    else
    {
        evhttp_request_set_error_cb ( event.req, httpUtil_error_handler );
    }
    return (rc);
}

/* ***********************************************************************
 *
 * Name       : httpUtil_payload_add
 *
 * Description: Add the payload to the output buffer.
 *
 * @param event is a reference to the callers libEvent struct
 *        where it inds the payload
 *
 * @return status of buffer add operation
 *
 * ************************************************************************/
int httpUtil_payload_add ( libEvent & event )
{
    int rc = PASS ;

    /* Returns the output buffer. */
    event.buf = evhttp_request_get_output_buffer ( event.req );

    /* Check for no buffer */
    if ( ! event.buf )
    {
        elog ("%s evhttp_request_get_output_buffer returned null (%p)\n",
                  event.log_prefix.c_str(), event.req );

        rc = FAIL ;
    }
    else
    {
        /* write the body into the buffer */
        rc = evbuffer_add ( event.buf, event.payload.data(), event.payload.length());
        if ( rc == -1 )
        {
            elog ("%s evbuffer_add returned error (-1)\n",
                      event.log_prefix.c_str());

            rc = FAIL ;
        }
        else
        {
            rc = PASS ;
        }
    }
    return (rc);
}

/* ***********************************************************************
 *
 * Name       : httpUtil_header_add
 *
 * Description: Add the supplied list of headers to the http request
 *              headers section.
 *
 * ************************************************************************/
int httpUtil_header_add ( libEvent * ptr, http_headers_type * hdrs_ptr )
{
    int rc = PASS ;

    if ( hdrs_ptr->entries > MAX_HEADERS )
    {
        elog ("%s Too many headers (%d:%d)\n",
                  ptr->log_prefix.c_str(), MAX_HEADERS, hdrs_ptr->entries );
        return FAIL ;
    }
    struct evkeyvalq * output_headers = evhttp_request_get_output_headers ( ptr->req );
    for ( int i = 0 ; i < hdrs_ptr->entries ; i++ )
    {
        /* Add the header */
        rc = evhttp_add_header( output_headers,
                                hdrs_ptr->entry[i].key.c_str() ,
                                hdrs_ptr->entry[i].value.c_str());
        if ( rc )
        {
            elog ("%s evhttp_add_header returned failure (%d:%s)\n",
                   ptr->log_prefix.c_str(), rc,
                   hdrs_ptr->entry[i].key.c_str());
            rc = FAIL ;
            break ;
        }
    }
    return (rc);
}

/* ***********************************************************************
 *
 * Name       : httpUtil_get_length
 *
 * Description: Loads libEvent.response_len with the length of the
 *              input buffer so we can allocate enough memory to
 *              copy it into.
 *
 * ************************************************************************/
int httpUtil_get_length ( libEvent & event )
{
    event.response_len = evbuffer_get_length ( evhttp_request_get_input_buffer ( event.req ));
    if ( event.response_len == 0 )
    {
        hlog ("%s Request - Response has no content\n",
                event.log_prefix.c_str());
        event.status = FAIL_JSON_ZERO_LEN ;
    }
    return ( event.response_len );
}

/* ***********************************************************************
 *
 * Name       : httpUtil_get_response
 *
 * Description: Copy the response body into libEvent.response
 *
 * ************************************************************************/
int httpUtil_get_response ( libEvent & event )
{
    if ( httpUtil_get_length ( event ) )
    {
        if ( event.response_len > MAX_RESPONSE_LEN )
        {
            elog ("%s response too large (%ld:%d)\n",
                      event.log_prefix.c_str(),
                      (long)event.response_len, MAX_RESPONSE_LEN );
            event.status = FAIL_JSON_TOO_LONG ;
            return ( event.status );
        }

        size_t real_len      ;

        /* Get a stack buffer, zero it, copy to it and terminate it */
        char * stack_buf_ptr = (char*)malloc (event.response_len+1);
        if ( stack_buf_ptr == NULL )
        {
            elog ("%s no memory for response (%ld)\n",
                      event.log_prefix.c_str(), (long)event.response_len );
            event.status = FAIL_NULL_POINTER ;
            return ( event.status );
        }
        memset ( stack_buf_ptr, 0, event.response_len+1 );
        real_len = evbuffer_remove( evhttp_request_get_input_buffer ( event.req ),
                                    stack_buf_ptr,
                                    event.response_len);

        if ( real_len != event.response_len )
        {
            wlog ("%s Length differs from removed length (%ld:%ld)\n",
                      event.log_prefix.c_str(),
                      (long)event.response_len,
                      (long)real_len );
        }

        /* Terminate the buffer , this is where the +1 above is required. */
        *(stack_buf_ptr+event.response_len) = '\0';

        /* Store the response */
        event.response = stack_buf_ptr ;

        free (stack_buf_ptr);
    }
    return ( event.status );
}

/* ***********************************************************************
 *
 * Name       : httpUtil_status
 *
 * Description: Map the raw http response code to a return code.
 *
 * ************************************************************************/
int httpUtil_status ( libEvent & event )
{
    int rc = PASS ;

    if ( !event.req )
    {
        elog ("%s Invalid request\n", event.log_prefix.c_str() );
        return (FAIL_NULL_POINTER);
    }
    event.http_status = evhttp_request_get_response_code (event.req);
    switch (event.http_status)
    {
        case HTTP_OK:
        case MON_HTTP_CREATED:
        case MON_HTTP_ACCEPTED:
        case 203:
        case MON_HTTP_NO_CONTENT:
        {
            hlog ("%s HTTP_OK (%d)\n", event.log_prefix.c_str(), event.http_status );
            break;
        }
        case MON_HTTP_MOVED:
        case MON_HTTP_FOUND:
        case MON_HTTP_SEE_OTHER:
        {
            if ( event.accept_redirect == true )
            {
                hlog ("%s HTTP Redirect (%d)\n", event.log_prefix.c_str(), event.http_status );
            }
            else
            {
                wlog ("%s unexpected redirect (%d)\n", event.log_prefix.c_str(), event.http_status );
                rc = FAIL_HTTP_REDIRECT ;
            }
            break ;
        }
        case MON_HTTP_UNAUTHORIZED:
        case MON_HTTP_FORBIDDEN:
        {
            wlog ("%s authentication rejected (%d)\n", event.log_prefix.c_str(), event.http_status );
            rc = FAIL_AUTHENTICATION ;
            break ;
        }
        case MON_HTTP_NOT_FOUND:
        {
            rc = FAIL_NOT_FOUND ;
            break ;
        }
        case 0:
        {
            wlog ("%s failed to maintain connection to '%s:%d'\n",
                      event.log_prefix.c_str(), event.ip.c_str(), event.port );
            rc = FAIL_HTTP_ZERO_STATUS ;
            break ;
        }
        default:
        {
            hlog2 ("%s Status: %d\n", event.log_prefix.c_str(), event.http_status );
            rc = event.http_status ;
            break;
        }
    }
    return (rc);
}

/* ***********************************************************************
 *
 * Name       : httpUtil_handler
 *
 * Description: Response handler for all requests. Checks status, loads
 *              the response body and the headers of interest and then
 *              calls the request specific handler bound to the event.
 *
 * ************************************************************************/
static void httpUtil_handler ( struct evhttp_request *req, void *arg )
{
    libEvent * event_ptr = (libEvent*)arg ;

    if ( event_ptr == NULL )
    {
        slog ("null event pointer\n");
        return ;
    }

    event_ptr->exec_time_msec = (int)(_now_msec() - event_ptr->send_msec) ;

    if ( ! req )
    {
        /* error handler already set the reason */
        if (( event_ptr->status == RETRY ) || ( event_ptr->status == PASS ))
            event_ptr->status = FAIL_TIMEOUT ;

        elog ("%s Request Failed (timeout:%d secs) (rc:%d)\n",
                   event_ptr->log_prefix.c_str(),
                   event_ptr->timeout,
                   event_ptr->status);
        goto httpUtil_handler_done ;
    }

    /* Check the HTTP Status Code */
    event_ptr->status = httpUtil_status ( (*event_ptr) ) ;
    if ( event_ptr->status != PASS )
    {
        /* keep the error body for the logs */
        if ( httpUtil_get_length ( (*event_ptr) ) != 0 )
        {
            int rc = event_ptr->status ;
            httpUtil_get_response ( (*event_ptr) ) ;
            event_ptr->status = rc ;
        }
        goto httpUtil_handler_done ;
    }
    else
    {
        struct evkeyvalq * headers_ptr = evhttp_request_get_input_headers ( req );
        const char * location_ptr = evhttp_find_header ( headers_ptr, "Location"   );
        const char * cookie_ptr   = evhttp_find_header ( headers_ptr, "Set-Cookie" );
        if ( location_ptr )
            event_ptr->location = location_ptr ;
        if ( cookie_ptr )
            event_ptr->cookie = cookie_ptr ;
    }

    /* Delete commands and redirects don't need a response body */
    if ( httpUtil_get_response ( (*event_ptr) ) == FAIL_JSON_ZERO_LEN )
    {
        event_ptr->status = PASS ;
    }
    else if ( event_ptr->status != PASS )
    {
        elog ("%s failed to get response\n", event_ptr->log_prefix.c_str());
        goto httpUtil_handler_done ;
    }

    if ( event_ptr->handler )
    {
        event_ptr->status = event_ptr->handler ( (*event_ptr) ) ;
    }

httpUtil_handler_done:

    if ( event_ptr->status )
    {
        elog ( "%s Failed (rc:%d) (http:%d)\n",
                   event_ptr->log_prefix.c_str(),
                   event_ptr->status,
                   event_ptr->http_status );
    }
    httpUtil_log_event ( *event_ptr );

    /* the request is owned and freed by libevent after this returns */
    event_ptr->req = NULL ;

    /* we are done ; stop the dispatch loop */
    if ( event_ptr->base )
        event_base_loopbreak ( event_ptr->base );
}

/* ***********************************************************************
 *
 * Name       : httpUtil_api_request
 *
 * Description: Makes a blocking HTTP request based on all the info
 *              in the supplied libEvent.
 *
 * Returns    : PASS or the failure code of the request.
 *
 * ************************************************************************/
int httpUtil_api_request ( libEvent & event )
{
    http_headers_type hdrs ;
    int hdr_entry   = 0    ;
    event.status    = PASS ;

    event.log_prefix = event.hostname ;
    event.log_prefix.append (" ");
    event.log_prefix.append (event.service) ;
    event.log_prefix.append (" '");
    event.log_prefix.append (event.operation) ;
    event.log_prefix.append ("'");

    hlog ("%s '%s' request\n", event.log_prefix.c_str(), getHttpCmdType_str(event.type));

    if (( event.request == SERVICE_NONE ) ||
        ( event.request >= SERVICE_LAST ))
    {
        slog ("%s Invalid request %d\n", event.log_prefix.c_str(), event.request);
        event.status = FAIL_BAD_PARM ;
        return (event.status);
    }

    if ( event.address.empty() || event.ip.empty() )
    {
        slog ("%s missing address or ip\n", event.log_prefix.c_str());
        event.status = FAIL_BAD_PARM ;
        return (event.status);
    }

    /* Check for memory leaks */
    if ( event.base )
    {
        slog ("%s http base memory leak avoidance (%p)\n",
                  event.log_prefix.c_str(), event.base );
        httpUtil_free_base ( event );
    }

    /* Allocate the base */
    event.base = event_base_new();
    if ( event.base == NULL )
    {
        elog ("%s No Memory for Request\n", event.log_prefix.c_str());
        event.status = FAIL_EVENT_BASE ;
        return (event.status) ;
    }

    /* Establish connection */
    if ( httpUtil_connect ( event ))
    {
        event.status = FAIL_CONNECT ;
        goto httpUtil_api_request_done ;
    }

    if ( httpUtil_request ( event, &httpUtil_handler ))
    {
        event.status = FAIL_REQUEST_NEW ;
        goto httpUtil_api_request_done ;
    }

    jlog ("%s Address : %s\n", event.log_prefix.c_str(), _log_address(event.address).c_str());

    if (( event.type != EVHTTP_REQ_GET ) &&
        ( event.type != EVHTTP_REQ_DELETE ) &&
        ( !event.payload.empty() ))
    {
        /* Add payload to the output buffer but only for PUT, POST and PATCH requests */
        if ( httpUtil_payload_add ( event ))
        {
            event.status = FAIL_PAYLOAD_ADD ;
            goto httpUtil_api_request_done ;
        }
        if ( daemon_get_cfg_ptr()->debug_json )
        {
            if ((!string_contains(event.payload,"token")) &&
                (!string_contains(event.payload,"assword")))
            {
                jlog ("%s Payload : %s\n", event.log_prefix.c_str(),
                                           event.payload.c_str() );
            }
            else
            {
                jlog ("%s Payload : ... contains private content ...\n",
                          event.log_prefix.c_str());
            }
        }
    }

    /* Build the HTTP Header */
    hdrs.entry[hdr_entry].key   = "Host" ;
    hdrs.entry[hdr_entry].value = event.ip ;
    hdr_entry++;

    if (( event.type != EVHTTP_REQ_GET ) &&
        ( event.type != EVHTTP_REQ_DELETE ))
    {
        hdrs.entry[hdr_entry].key   = "Content-Length" ;
        hdrs.entry[hdr_entry].value = itos(event.payload.length());
        hdr_entry++;
    }

    hdrs.entry[hdr_entry].key   = CLIENT_HEADER ;
    hdrs.entry[hdr_entry].value = event.user_agent ;
    hdr_entry++;

    hdrs.entry[hdr_entry].key   = "Content-Type" ;
    hdrs.entry[hdr_entry].value = "application/json" ;
    hdr_entry++;

    hdrs.entry[hdr_entry].key   = "Accept" ;
    hdrs.entry[hdr_entry].value = "application/json" ;
    hdr_entry++;

    if ( !event.token.cookie.empty() )
    {
        hdrs.entry[hdr_entry].key   = "Cookie" ;
        hdrs.entry[hdr_entry].value = event.token.cookie ;
        hdr_entry++;
    }

    hdrs.entry[hdr_entry].key   = "Connection" ;
    hdrs.entry[hdr_entry].value = "close" ;
    hdr_entry++;
    hdrs.entries = hdr_entry ;

    /* Add the headers */
    if ( httpUtil_header_add ( &event, &hdrs ))
    {
        event.status = FAIL_HEADER_ADD ;
        goto httpUtil_api_request_done ;
    }

    event.send_msec = _now_msec();
    evhttp_connection_set_timeout ( event.conn, event.timeout );

    /* Default to retry ; the handler overwrites it with the result */
    event.status = RETRY ;
    if ( evhttp_make_request ( event.conn, event.req, event.type, event.address.data()) == 0 )
    {
        hlog ("%s Requested (blocking) (timeout:%d secs)\n", event.log_prefix.c_str(), event.timeout);

        /* Send the message and wait for the handler or timeout */
        event_base_dispatch ( event.base );

        if ( event.status == RETRY )
        {
            elog ("%s no response (timeout:%d secs)\n", event.log_prefix.c_str(), event.timeout );
            event.status = FAIL_TIMEOUT ;
        }
    }
    else
    {
        elog ("%s Call to 'evhttp_make_request' failed\n",
                  event.log_prefix.c_str());

        /* libevent frees the request on failure */
        event.req = NULL ;
        event.status = FAIL_CONNECT ;
    }

httpUtil_api_request_done:

    httpUtil_free_base ( event );

    return (event.status);
}

/* ***********************************************************************
 *
 * Name       : httpUtil_log_event
 *
 * Description: Log the request's result. Failures are always logged ;
 *              successes only with http debug enabled.
 *
 * ************************************************************************/
void httpUtil_log_event ( libEvent & event )
{
    if ( event.status )
    {
        elog ("%s %s %s:%d%s (rc:%d) (http:%d) (%d msec)\n",
                  event.log_prefix.c_str(),
                  getHttpCmdType_str(event.type),
                  event.ip.c_str(), event.port,
                  _log_address(event.address).c_str(),
                  event.status, event.http_status,
                  event.exec_time_msec );

        if ( !event.response.empty() )
        {
            elog ("%s Response: %s\n",
                      event.log_prefix.c_str(),
                      event.response.c_str());
        }
    }
    else
    {
        hlog ("%s %s %s:%d%s (http:%d) (%d msec)\n",
                  event.log_prefix.c_str(),
                  getHttpCmdType_str(event.type),
                  event.ip.c_str(), event.port,
                  _log_address(event.address).c_str(),
                  event.http_status,
                  event.exec_time_msec );
        jlog ("%s Response: %s\n",
                  event.log_prefix.c_str(),
                  event.response.c_str());
    }
}

/* ***********************************************************************
 *
 * Name       : httpUtil_url_parse
 *
 * Description: Split an http://host[:port][/path] url. The port
 *              defaults to 80 and the path is returned without a
 *              trailing slash.
 *
 * ************************************************************************/
int httpUtil_url_parse ( string url, string & ip, int & port, string & path )
{
    int rc = PASS ;

    struct evhttp_uri * uri_ptr = evhttp_uri_parse ( url.c_str() );
    if ( uri_ptr == NULL )
    {
        wlog ("failed to parse url '%s'\n", url.c_str());
        return (FAIL_URI_PARSE);
    }

    const char * scheme_ptr = evhttp_uri_get_scheme ( uri_ptr );
    const char * host_ptr   = evhttp_uri_get_host   ( uri_ptr );
    const char * path_ptr   = evhttp_uri_get_path   ( uri_ptr );

    if (( scheme_ptr == NULL ) || ( strcmp ( scheme_ptr, "http" )))
    {
        wlog ("unsupported url scheme '%s'\n", scheme_ptr ? scheme_ptr : "none" );
        rc = FAIL_URI_PARSE ;
    }
    else if (( host_ptr == NULL ) || ( *host_ptr == '\0' ))
    {
        wlog ("url '%s' has no host\n", url.c_str());
        rc = FAIL_URI_PARSE ;
    }
    else
    {
        ip   = host_ptr ;
        port = evhttp_uri_get_port ( uri_ptr );
        if ( port <= 0 )
            port = 80 ;
        path = path_ptr ? path_ptr : "" ;
        while ( !path.empty() && ( path[path.length()-1] == '/' ))
            path.erase ( path.length()-1 );
    }

    evhttp_uri_free ( uri_ptr );
    return (rc);
}

string httpUtil_uri_encode ( string str )
{
    string encoded = "" ;
    char * encoded_ptr = evhttp_encode_uri ( str.c_str() );
    if ( encoded_ptr )
    {
        encoded = encoded_ptr ;
        free ( encoded_ptr );
    }
    return (encoded);
}

/* ***********************************************************************
 *
 * Name       : httpUtil_query_value
 *
 * Description: Find the value of 'key' in the query part of the
 *              supplied url, ie. "/sensor.htm?id=2034&tabid=1"
 *
 * Returns    : PASS with value loaded or FAIL_NOT_FOUND
 *
 * ************************************************************************/
int httpUtil_query_value ( string url, string key, string & value )
{
    int rc = FAIL_NOT_FOUND ;
    value.clear();

    size_t pos = url.find ('?');
    if ( pos == string::npos )
        return (rc);

    string query = url.substr ( pos+1 );
    struct evkeyvalq params ;
    if ( evhttp_parse_query_str ( query.c_str(), &params ) == 0 )
    {
        const char * value_ptr = evhttp_find_header ( &params, key.c_str() );
        if (( value_ptr ) && ( *value_ptr != '\0' ))
        {
            value = value_ptr ;
            rc = PASS ;
        }
    }
    else
    {
        wlog ("failed to parse query '%s'\n", query.c_str());
        rc = FAIL_URI_PARSE ;
    }
    evhttp_clear_headers ( &params );
    return (rc);
}
