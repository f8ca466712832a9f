//---------------------------------------------------------- -*- Mode: C++ -*-
// $Id$
//
// Created 2026/10/18
//
// Copyright 2026 The dirsweep Authors.
//
// This file is part of dirsweep.
//
// Licensed under the Apache License, Version 2.0
// (the "License"); you may not use this file except in compliance with
// the License. You may obtain a copy of the License at
//
// http://www.apache.org/licenses/LICENSE-2.0
//
// Unless required by applicable law or agreed to in writing, software
// distributed under the License is distributed on an "AS IS" BASIS,
// WITHOUT WARRANTIES OR CONDITIONS OF ANY KIND, either express or
// implied. See the License for the specific language governing
// permissions and limitations under the License.
//
//----------------------------------------------------------------------------

#include <gtest/gtest.h>

#include <cctype>
#include <cerrno>
#include <ctime>
#include <string>
#include <vector>

#include "sweep/SweepLog.h"
#include "tests/TestUtils.h"

using std::string;
using std::vector;
using namespace DirSweep;
using namespace DirSweep::test;

// "YYYY-MM-DD HH:MM:SS | "
static bool
HasTimestampPrefix(const string &line)
{
    const string shape = "dddd-dd-dd dd:dd:dd | ";

    if (line.size() < shape.size())
        return false;
    for (string::size_type i = 0; i < shape.size(); ++i) {
        if (shape[i] == 'd') {
            if (!isdigit((unsigned char) line[i]))
                return false;
        } else if (shape[i] != line[i]) {
            return false;
        }
    }
    return true;
}

TEST(SweepLogTest, TestFormat)
{
    string line = FormatSweepLogLine(time(NULL), "Removed empty directories under /x");

    EXPECT_TRUE(HasTimestampPrefix(line)) << line;
    EXPECT_EQ(line.substr(22), "Removed empty directories under /x");
}

TEST(SweepLogTest, TestAppendCreatesAndAppends)
{
    ScratchDir scratch;
    FileSweepLog log(scratch.At("sweep.log"));

    EXPECT_EQ(log.GetPath(), scratch.At("sweep.log"));
    EXPECT_EQ(log.Append("first"), 0);
    EXPECT_EQ(log.Append("second"), 0);

    vector<string> lines = ReadLines(scratch.At("sweep.log"));
    ASSERT_EQ(lines.size(), 2u);
    EXPECT_TRUE(HasTimestampPrefix(lines[0]));
    EXPECT_EQ(lines[0].substr(22), "first");
    EXPECT_EQ(lines[1].substr(22), "second");
}

TEST(SweepLogTest, TestAppendKeepsExistingLines)
{
    ScratchDir scratch;
    scratch.MakeFile("sweep.log", "old line\n");
    FileSweepLog log(scratch.At("sweep.log"));

    EXPECT_EQ(log.Append("new"), 0);

    vector<string> lines = ReadLines(scratch.At("sweep.log"));
    ASSERT_EQ(lines.size(), 2u);
    EXPECT_EQ(lines[0], "old line");
    EXPECT_EQ(lines[1].substr(22), "new");
}

TEST(SweepLogTest, TestAppendFailure)
{
    ScratchDir scratch;
    FileSweepLog log(scratch.At("no/such/dir/sweep.log"));

    EXPECT_LT(log.Append("lost"), 0);
    EXPECT_FALSE(scratch.Exists("no"));
}
