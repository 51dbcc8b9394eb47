#ifndef __INCLUDE_PROVBACKEND_H__
#define __INCLUDE_PROVBACKEND_H__
/*
 * Copyright (c) 2013-2016 Wind River Systems, Inc.
*
* SPDX-License-Identifier: Apache-2.0
*
 */

 /**
  * @file
  * Storage Array Monitor Monitor Provisioning interface
  *
  * The four calls the volume reconciler makes against the monitoring
  * system. Each returns PASS or a failure code ; any failure is a
  * provisioning error local to the one volume being worked on.
  */

#include <iostream>
#include <string>

using namespace std;

class provBackend
{
    public:

    virtual ~provBackend ( void ) {}

    /** Copy 'template_id' into 'parent_id' as 'new_name' and
     *  load 'new_instance_id' with the id of the copy */
    virtual int clone_instance  ( string template_id,
                                  string new_name,
                                  string parent_id,
                                  string & new_instance_id ) = 0 ;

    /** Point the instance at its volume */
    virtual int set_parameters  ( string instance_id, string parameters ) = 0 ;

    /** Unpause the instance */
    virtual int enable_instance ( string instance_id ) = 0 ;

    virtual int delete_instance ( string instance_id ) = 0 ;
};

#endif /* __INCLUDE_PROVBACKEND_H__ */
