/*
 * Copyright (c) 2013-2017 Wind River Systems, Inc.
*
* SPDX-License-Identifier: Apache-2.0
*
 */

 /**
  * @file
  * Storage Array Monitor common utility tests
  */

#include <gtest/gtest.h>

#include <iostream>
#include <string>

using namespace std;

#include "monBase.h"
#include "monUtil.h"
#include "testSupport.h"

TEST ( MonUtil, NumberToString )
{
    EXPECT_EQ ( "0",    itos ( 0 ));
    EXPECT_EQ ( "-12",  itos ( -12 ));
    EXPECT_EQ ( "18446744073709551615", lltos ( 18446744073709551615ULL ));
    EXPECT_EQ ( "12.35", dtos ( 12.345678, 2 ));
    EXPECT_EQ ( "0.00",  dtos ( 0.0, 2 ));
    EXPECT_EQ ( "3",     dtos ( 3.2, 0 ));
}

TEST ( MonUtil, StringReplaceCountsEveryToken )
{
    string str = "-V %volume% -x %volume%" ;
    EXPECT_EQ ( 2, string_replace ( str, "%volume%", "vol%volume%" ));
    EXPECT_EQ ( "-V vol%volume% -x vol%volume%", str );

    string none = "nothing here" ;
    EXPECT_EQ ( 0, string_replace ( none, "%volume%", "x" ));
    EXPECT_EQ ( 0, string_replace ( none, "", "x" ));
    EXPECT_EQ ( "nothing here", none );
}

TEST ( MonUtil, TrimAndCase )
{
    EXPECT_EQ ( "vol a",  trim_whitespace ( " \tvol a \r\n" ));
    EXPECT_EQ ( "",       trim_whitespace ( "  \t " ));
    EXPECT_EQ ( "volume", tolowercase ( "VoLuMe" ));
}
