/*
 * Copyright (c) 2013-2017 Wind River Systems, Inc.
*
* SPDX-License-Identifier: Apache-2.0
*
 */

 /**
  * @file
  * Storage Array Monitor Volume Reconciler tests
  */

#include <gtest/gtest.h>

#include <iostream>
#include <string>
#include <list>

using namespace std;

#include "daemon_common.h"
#include "sensorStore.h"
#include "volReconcile.h"
#include "testSupport.h"

class VolReconcileTest : public ::testing::Test
{
    protected:

    string                   dir     ;
    sensorStore_type         store   ;
    testProvBackend          backend ;
    volReconcile_cfg_type    cfg     ;
    volReconcile_counts_type counts  ;

    void SetUp ( void )
    {
        test_config_default ();
        dir = test_make_dir ();
        ASSERT_FALSE ( dir.empty() );
        ASSERT_EQ ( PASS, sensorStore_load ( store, dir, "array1" ));

        cfg.template_id = "500" ;
        cfg.parent_id   = "40"  ;
        cfg.name_prefix = "Volume " ;
        cfg.parameters  = "--scope volume --volume %volume%" ;
        volReconcile_counts_init ( counts );
    }

    void TearDown ( void )
    {
        test_remove_dir ( dir );
        test_config_default ();
    }

    void seed ( string volume_name, string instance_id )
    {
        ASSERT_EQ ( PASS, sensorStore_put ( store, volume_name, instance_id ));
    }

    /* the store as it is on disk */
    sensor_map_type on_disk ( void )
    {
        sensorStore_type reloaded ;
        EXPECT_EQ ( PASS, sensorStore_load ( reloaded, dir, "array1" ));
        return ( reloaded.records );
    }

    int run ( list<string> volumes )
    {
        return ( volReconcile_run ( volumes, store, backend, cfg, counts ));
    }
};

static list<string> names ( const char * a = NULL, const char * b = NULL, const char * c = NULL, const char * d = NULL )
{
    list<string> l ;
    if ( a ) l.push_back ( a );
    if ( b ) l.push_back ( b );
    if ( c ) l.push_back ( c );
    if ( d ) l.push_back ( d );
    return (l);
}

TEST ( VolReconcilePlan, FirstRunIsCreateOnly )
{
    sensor_map_type known ;
    volReconcile_plan_type plan ;

    volReconcile_plan ( names ("vol-a", "vol-b"), known, plan );

    ASSERT_EQ ( 2u, plan.creates.size() );
    EXPECT_EQ ( "vol-a", plan.creates.front() );
    EXPECT_EQ ( "vol-b", plan.creates.back()  );
    EXPECT_TRUE ( plan.deletes.empty() );
    EXPECT_EQ ( 0, plan.matched );
}

TEST ( VolReconcilePlan, EmptyArrayIsDeleteOnly )
{
    sensor_map_type known ;
    known["vol-a"] = "101" ;
    known["vol-b"] = "102" ;
    volReconcile_plan_type plan ;

    volReconcile_plan ( names (), known, plan );

    EXPECT_TRUE ( plan.creates.empty() );
    ASSERT_EQ ( 2u, plan.deletes.size() );
    EXPECT_EQ ( "vol-a", plan.deletes.front().volume_name );
    EXPECT_EQ ( "101",   plan.deletes.front().instance_id );
    EXPECT_EQ ( "vol-b", plan.deletes.back().volume_name  );
    EXPECT_EQ ( "102",   plan.deletes.back().instance_id  );
}

TEST ( VolReconcilePlan, DuplicatesAndEmptyNamesDropped )
{
    sensor_map_type known ;
    volReconcile_plan_type plan ;

    volReconcile_plan ( names ("vol-b", "", "vol-a", "vol-b"), known, plan );

    ASSERT_EQ ( 2u, plan.creates.size() );
    EXPECT_EQ ( "vol-b", plan.creates.front() );
    EXPECT_EQ ( "vol-a", plan.creates.back()  );
}

TEST ( VolReconcilePlan, RenameIsOneDeleteAndOneCreate )
{
    sensor_map_type known ;
    known["old-name"] = "101" ;
    volReconcile_plan_type plan ;

    volReconcile_plan ( names ("new-name"), known, plan );

    ASSERT_EQ ( 1u, plan.creates.size() );
    EXPECT_EQ ( "new-name", plan.creates.front() );
    ASSERT_EQ ( 1u, plan.deletes.size() );
    EXPECT_EQ ( "old-name", plan.deletes.front().volume_name );
}

TEST ( VolReconcilePlan, CreatesAndDeletesAreDisjointAndCover )
{
    sensor_map_type known ;
    known["vol-a"] = "1" ;
    known["vol-c"] = "3" ;
    known["vol-e"] = "5" ;
    list<string> volumes = names ("vol-a", "vol-b", "vol-c", "vol-d");
    volReconcile_plan_type plan ;

    volReconcile_plan ( volumes, known, plan );

    set<string> creates ( plan.creates.begin(), plan.creates.end() );
    set<string> deletes ;
    for ( list<volReconcile_delete_type>::iterator iter = plan.deletes.begin() ; iter != plan.deletes.end() ; ++iter )
        deletes.insert ( iter->volume_name );

    for ( set<string>::iterator iter = creates.begin() ; iter != creates.end() ; ++iter )
        EXPECT_EQ ( 0u, deletes.count ( *iter ));

    /* every array volume is either known or created */
    for ( list<string>::iterator iter = volumes.begin() ; iter != volumes.end() ; ++iter )
        EXPECT_TRUE (( known.count ( *iter ) == 1 ) || ( creates.count ( *iter ) == 1 ));

    /* every known volume not in the array is deleted */
    EXPECT_EQ ( 1u, deletes.size() );
    EXPECT_EQ ( 1u, deletes.count ("vol-e"));
    EXPECT_EQ ( 2,  plan.matched );
}

TEST ( VolReconcileParameters, VolumeTokenReplaced )
{
    EXPECT_EQ ( "--scope volume --volume vol-a",
                volReconcile_parameters ( "--scope volume --volume %volume%", "vol-a" ));
    EXPECT_EQ ( "-V vol-a -x vol-a",
                volReconcile_parameters ( "-V %volume% -x %volume%", "vol-a" ));
}

TEST ( VolReconcileParameters, VolumeOptionAppendedWithoutToken )
{
    EXPECT_EQ ( "--scope volume --volume vol-a",
                volReconcile_parameters ( "--scope volume", "vol-a" ));
}

TEST_F ( VolReconcileTest, NewVolumeAddedToStore )
{
    seed ( "vol-a", "101" );

    EXPECT_EQ ( PASS, run ( names ("vol-a", "vol-b")));

    sensor_map_type records = on_disk ();
    ASSERT_EQ ( 2u, records.size() );
    EXPECT_EQ ( "101",  records["vol-a"] );
    EXPECT_EQ ( "1000", records["vol-b"] );

    EXPECT_EQ ( 1, backend.count ("clone:Volume vol-b"));
    EXPECT_EQ ( 1, backend.count ("params:1000:--scope volume --volume vol-b"));
    EXPECT_EQ ( 1, backend.count ("enable:1000"));
    EXPECT_EQ ( 0, backend.count ("delete:"));
    EXPECT_EQ ( "500", backend.clone_template );
    EXPECT_EQ ( "40",  backend.clone_parent   );

    EXPECT_EQ ( 1, counts.planned_creates   );
    EXPECT_EQ ( 1, counts.completed_creates );
    EXPECT_EQ ( 0, counts.failed );
}

TEST_F ( VolReconcileTest, RemovedVolumeDeleted )
{
    seed ( "vol-a", "101" );
    seed ( "vol-b", "102" );

    EXPECT_EQ ( PASS, run ( names ("vol-a")));

    sensor_map_type records = on_disk ();
    ASSERT_EQ ( 1u, records.size() );
    EXPECT_EQ ( "101", records["vol-a"] );

    ASSERT_EQ ( 1u, backend.calls.size() );
    EXPECT_EQ ( "delete:102", backend.calls.front() );
    EXPECT_EQ ( 1, counts.completed_deletes );
}

TEST_F ( VolReconcileTest, EmptyArrayAndEmptyStoreIsNoop )
{
    EXPECT_EQ ( PASS, run ( names ()));

    EXPECT_TRUE ( backend.calls.empty() );
    EXPECT_TRUE ( on_disk().empty() );
    EXPECT_EQ ( 0, counts.planned_creates );
    EXPECT_EQ ( 0, counts.planned_deletes );
    EXPECT_EQ ( 0, counts.failed );
}

TEST_F ( VolReconcileTest, SecondRunIsNoop )
{
    seed ( "vol-x", "77" );
    list<string> volumes = names ("vol-a", "vol-b", "vol-c");

    EXPECT_EQ ( PASS, run ( volumes ));
    sensor_map_type first = on_disk ();
    EXPECT_EQ ( 3u, first.size() );
    backend.calls.clear();

    EXPECT_EQ ( PASS, run ( volumes ));
    EXPECT_TRUE ( backend.calls.empty() );
    EXPECT_EQ ( 0, counts.planned_creates );
    EXPECT_EQ ( 0, counts.planned_deletes );
    EXPECT_EQ ( first, on_disk() );
}

TEST_F ( VolReconcileTest, RecordedBeforeConfigured )
{
    backend.store_ptr = &store ;

    EXPECT_EQ ( PASS, run ( names ("vol-a", "vol-b")));

    EXPECT_EQ ( 2, backend.count ("params:"));
    EXPECT_EQ ( 0, backend.configured_before_recorded );
}

TEST_F ( VolReconcileTest, DuplicateArrayNamesCreateOnce )
{
    EXPECT_EQ ( PASS, run ( names ("vol-a", "vol-a", "vol-a")));

    EXPECT_EQ ( 1, backend.count ("clone:"));
    EXPECT_EQ ( 1u, on_disk().size() );
}

TEST_F ( VolReconcileTest, FailedDeleteKeepsOnlyItsRecord )
{
    seed ( "vol-a", "101" );
    seed ( "vol-b", "102" );
    seed ( "vol-c", "103" );
    backend.fail_delete.insert ("102");

    EXPECT_EQ ( PASS, run ( names ("vol-new")));

    /* every action was still attempted */
    EXPECT_EQ ( 1, backend.count ("clone:Volume vol-new"));
    EXPECT_EQ ( 1, backend.count ("delete:101"));
    EXPECT_EQ ( 1, backend.count ("delete:102"));
    EXPECT_EQ ( 1, backend.count ("delete:103"));

    sensor_map_type records = on_disk ();
    ASSERT_EQ ( 2u, records.size() );
    EXPECT_EQ ( "102",  records["vol-b"]   );
    EXPECT_EQ ( "1000", records["vol-new"] );

    EXPECT_EQ ( 1, counts.failed );
    EXPECT_EQ ( 2, counts.completed_deletes );
    EXPECT_EQ ( 1, counts.completed_creates );
}

TEST_F ( VolReconcileTest, FailedDeleteRetriedNextRun )
{
    seed ( "vol-b", "102" );
    backend.fail_delete.insert ("102");
    EXPECT_EQ ( PASS, run ( names ()));
    EXPECT_EQ ( 1u, on_disk().size() );

    backend.fail_delete.clear();
    EXPECT_EQ ( PASS, run ( names ()));
    EXPECT_EQ ( 2, backend.count ("delete:102"));
    EXPECT_TRUE ( on_disk().empty() );
}

TEST_F ( VolReconcileTest, FailedCloneRecordsNothing )
{
    backend.fail_clone.insert ("Volume vol-a");

    EXPECT_EQ ( PASS, run ( names ("vol-a", "vol-b")));

    sensor_map_type records = on_disk ();
    ASSERT_EQ ( 1u, records.size() );
    EXPECT_EQ ( 1u, records.count ("vol-b"));
    EXPECT_EQ ( 0, backend.count ("params:1000:--scope volume --volume vol-a"));
    EXPECT_EQ ( 1, counts.failed );

    /* still pending ; created next run */
    backend.fail_clone.clear();
    EXPECT_EQ ( PASS, run ( names ("vol-a", "vol-b")));
    EXPECT_EQ ( 2u, on_disk().size() );
}

TEST_F ( VolReconcileTest, UnstorableNameNeverCloned )
{
    for ( int run_num = 0 ; run_num < 3 ; run_num++ )
    {
        EXPECT_EQ ( PASS, run ( names ("#vol-a", "vol=b", " vol-c", "vol-d")));
        EXPECT_EQ ( 3, counts.failed );
    }

    /* only the storable name is cloned and only once */
    EXPECT_EQ ( 1, backend.count ("clone:"));
    EXPECT_EQ ( 1, backend.count ("clone:Volume vol-d"));
    EXPECT_EQ ( 0, backend.count ("delete:"));

    sensor_map_type records = on_disk ();
    ASSERT_EQ ( 1u, records.size() );
    EXPECT_EQ ( "1000", records["vol-d"] );
}

TEST_F ( VolReconcileTest, FailedConfigureStaysRecorded )
{
    backend.fail_params.insert ("1000");

    EXPECT_EQ ( PASS, run ( names ("vol-a")));

    EXPECT_EQ ( "1000", on_disk()["vol-a"] );
    EXPECT_EQ ( 0, backend.count ("enable:1000"));
    EXPECT_EQ ( 1, counts.incomplete );
    EXPECT_EQ ( 1, counts.failed );
    EXPECT_EQ ( 0, counts.completed_creates );

    /* no repair on the next run */
    backend.calls.clear();
    EXPECT_EQ ( PASS, run ( names ("vol-a")));
    EXPECT_TRUE ( backend.calls.empty() );
}

TEST_F ( VolReconcileTest, FailedEnableStaysRecorded )
{
    backend.fail_enable.insert ("1000");

    EXPECT_EQ ( PASS, run ( names ("vol-a", "vol-b")));

    sensor_map_type records = on_disk ();
    EXPECT_EQ ( "1000", records["vol-a"] );
    EXPECT_EQ ( "1001", records["vol-b"] );
    EXPECT_EQ ( 1, counts.incomplete );
    EXPECT_EQ ( 1, counts.completed_creates );
}

TEST_F ( VolReconcileTest, StoreWriteFailureSkipsConfigure )
{
    /* take the store's directory away after the load */
    test_remove_dir ( dir );

    EXPECT_EQ ( PASS, run ( names ("vol-a")));

    EXPECT_EQ ( 1, backend.count ("clone:Volume vol-a"));
    EXPECT_EQ ( 0, backend.count ("params:"));
    EXPECT_EQ ( 0, backend.count ("enable:"));
    EXPECT_EQ ( 1, counts.failed );
    EXPECT_TRUE ( store.records.empty() );
}

TEST_F ( VolReconcileTest, UnloadedStoreFails )
{
    sensorStore_type unloaded ;
    unloaded.loaded = false ;

    EXPECT_EQ ( FAIL_OPERATION, volReconcile_run ( names ("vol-a"), unloaded, backend, cfg, counts ));
    EXPECT_TRUE ( backend.calls.empty() );
}

#ifdef WANT_FIT_TESTING
TEST_F ( VolReconcileTest, InsertedStoreWriteFailureOrphans )
{
    seed ( "vol-a", "101" );

    daemon_config_type * cfg_ptr = daemon_get_cfg_ptr();
    cfg_ptr->testmode = 1 ;
    cfg_ptr->fit_code = FIT_CODE__STORE__WRITE_FAIL ;
    daemon_config_set_str ( &cfg_ptr->fit_name, "array1.sensors" );

    EXPECT_EQ ( PASS, run ( names ("vol-b")));

    /* the clone happened ; nothing else for it and the delete is kept */
    EXPECT_EQ ( 1, backend.count ("clone:Volume vol-b"));
    EXPECT_EQ ( 0, backend.count ("params:"));
    EXPECT_EQ ( 1, backend.count ("delete:101"));
    EXPECT_EQ ( 2, counts.failed );

    cfg_ptr->testmode = 0 ;
    sensor_map_type records = on_disk ();
    ASSERT_EQ ( 1u, records.size() );
    EXPECT_EQ ( "101", records["vol-a"] );
}
#endif
