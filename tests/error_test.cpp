/******************************************************************************\
* Copyright (c) 2016, Robert van Engelen, Genivia Inc. All rights reserved.    *
*                                                                              *
* Redistribution and use in source and binary forms, with or without           *
* modification, are permitted provided that the following conditions are met:  *
*                                                                              *
*   (1) Redistributions of source code must retain the above copyright notice, *
*       this list of conditions and the following disclaimer.                  *
*                                                                              *
*   (2) Redistributions in binary form must reproduce the above copyright      *
*       notice, this list of conditions and the following disclaimer in the    *
*       documentation and/or other materials provided with the distribution.   *
*                                                                              *
*   (3) The name of the author may not be used to endorse or promote products  *
*       derived from this software without specific prior written permission.  *
*                                                                              *
* THIS SOFTWARE IS PROVIDED BY THE AUTHOR ``AS IS'' AND ANY EXPRESS OR IMPLIED *
* WARRANTIES, INCLUDING, BUT NOT LIMITED TO, THE IMPLIED WARRANTIES OF         *
* MERCHANTABILITY AND FITNESS FOR A PARTICULAR PURPOSE ARE DISCLAIMED. IN NO   *
* EVENT SHALL THE AUTHOR BE LIABLE FOR ANY DIRECT, INDIRECT, INCIDENTAL,       *
* SPECIAL, EXEMPLARY, OR CONSEQUENTIAL DAMAGES (INCLUDING, BUT NOT LIMITED TO, *
* PROCUREMENT OF SUBSTITUTE GOODS OR SERVICES; LOSS OF USE, DATA, OR PROFITS;  *
* OR BUSINESS INTERRUPTION) HOWEVER CAUSED AND ON ANY THEORY OF LIABILITY,     *
* WHETHER IN CONTRACT, STRICT LIABILITY, OR TORT (INCLUDING NEGLIGENCE OR      *
* OTHERWISE) ARISING IN ANY WAY OUT OF THE USE OF THIS SOFTWARE, EVEN IF       *
* ADVISED OF THE POSSIBILITY OF SUCH DAMAGE.                                   *
\******************************************************************************/

/**
@file      error_test.cpp
@brief     tests of tree errors and feature errors
@copyright (c) BSD-3 License - see LICENSE.txt
*/

#include <recompose/flavor.h>
#include <gtest/gtest.h>

using namespace recompose;

TEST(ErrorTest, FormatsTreeError)
{
  tree_error e(tree_error::invalid_repeat, 3, "{5,2}");
  EXPECT_EQ(tree_error::invalid_repeat, e.code());
  EXPECT_EQ(3u, e.node());
  EXPECT_STREQ("error at node 3: invalid repeat {5,2}", e.what());
  EXPECT_STREQ("error at node 7: unresolved back-reference", tree_error(tree_error::unresolved_backreference, 7).what());
}

TEST(ErrorTest, FormatsFeatureError)
{
  feature_error e(feature_error::lookbehind, "JavaScript", 12, "(?<=...)");
  EXPECT_EQ(feature_error::lookbehind, e.code());
  EXPECT_EQ("JavaScript", e.flavor());
  EXPECT_EQ(12u, e.node());
  EXPECT_EQ("(?<=...)", e.construct());
  EXPECT_STREQ("error at node 12\n(?<=...)\n\\___lookbehind not supported by JavaScript\n", e.what());
}

TEST(ErrorTest, DistinguishesErrorKinds)
{
  Builder b;
  Builder::Index l = b.lookbehind(b.literal("a"));
  Tree tree = b.build(l);
  try
  {
    Flavor::javascript().render(tree);
    FAIL() << "expected feature_error";
  }
  catch (const tree_error&)
  {
    FAIL() << "expected feature_error";
  }
  catch (const feature_error& e)
  {
    EXPECT_EQ(l, e.node());
  }
  EXPECT_THROW(b.repeat(l, 2, 1), tree_error);
  EXPECT_THROW(b.repeat(l, 2, 1), std::runtime_error);
}

TEST(ErrorTest, ConvertsSizeToString)
{
  EXPECT_EQ("0", ztoa(0));
  EXPECT_EQ("1234567", ztoa(1234567));
}
