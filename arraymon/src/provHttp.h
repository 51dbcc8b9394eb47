#ifndef __INCLUDE_PROVHTTP_H__
#define __INCLUDE_PROVHTTP_H__
/*
 * Copyright (c) 2015-2017 Wind River Systems, Inc.
*
* SPDX-License-Identifier: Apache-2.0
*
 */

 /**
  * @file
  * Storage Array Monitor Monitor Provisioning HTTP client
  *
  * clone  : GET /api/duplicateobject.htm?id=<template>&name=<name>&targetid=<parent>
  *          302 with the new id in the Location header ; /sensor.htm?id=2345
  * params : GET /api/setobjectproperty.htm?id=<id>&name=<property>&value=<parameters>
  * enable : GET /api/pause.htm?id=<id>&action=1
  * delete : GET /api/deleteobject.htm?id=<id>&approve=1
  *
  * Every request carries &username=<user>&passhash=<hash>
  */

#include <iostream>
#include <string>

using namespace std;

#include "httpUtil.h"        /* for ... libEvent                   */
#include "provBackend.h"

#define PROV_API_CLONE       "/api/duplicateobject.htm"
#define PROV_API_SET_PROPERTY "/api/setobjectproperty.htm"
#define PROV_API_PAUSE       "/api/pause.htm"
#define PROV_API_DELETE      "/api/deleteobject.htm"
#define PROV_LOCATION_ID     "id"

/* handles the response of all provisioning requests ;
 * loads event.new_id from the clone's Location header */
int provHttp_handler ( libEvent & event );

class provHttpClass : public provBackend
{
    private:

    string ip       ;
    int    port     ;
    string path     ; /**< base path of the url ; usually empty */
    string username ;
    string passhash ;
    string property ; /**< the parameter property name         */
    int    timeout  ;
    bool   configured ;

    libEvent event  ;

    /* common request setup and dispatch */
    int request ( libEvent_enum request,
                  string operation,
                  string entity,
                  string api,
                  string query,
                  bool   accept_redirect );

    public:

     provHttpClass ( void );
    ~provHttpClass ( void );

    /** Load the base url and credentials ; FAIL_URI_PARSE for a bad url */
    int configure ( string url,
                    string username,
                    string passhash,
                    string property,
                    int    timeout );

    int clone_instance  ( string template_id,
                          string new_name,
                          string parent_id,
                          string & new_instance_id );

    int set_parameters  ( string instance_id, string parameters );
    int enable_instance ( string instance_id );
    int delete_instance ( string instance_id );
};

#endif /* __INCLUDE_PROVHTTP_H__ */
