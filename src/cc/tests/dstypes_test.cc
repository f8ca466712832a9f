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

#include <cerrno>

#include "common/dstypes.h"

using namespace DirSweep;

TEST(StatusTest, TestExitCodes)
{
    EXPECT_EQ(StatusToExitCode(0), EXIT_SWEEP_OK);
    EXPECT_EQ(StatusToExitCode(-ENOENT), EXIT_SWEEP_OK);
    EXPECT_EQ(StatusToExitCode(-EUNSAFEPATH), EXIT_SWEEP_UNSAFE_PATH);
    EXPECT_EQ(StatusToExitCode(-EACCES), EXIT_SWEEP_IO_ERROR);
    EXPECT_EQ(StatusToExitCode(-ENOTDIR), EXIT_SWEEP_IO_ERROR);
}

TEST(StatusTest, TestMostSevere)
{
    EXPECT_EQ(MostSevereExitCode(EXIT_SWEEP_OK, EXIT_SWEEP_OK), EXIT_SWEEP_OK);
    EXPECT_EQ(MostSevereExitCode(EXIT_SWEEP_OK, EXIT_SWEEP_IO_ERROR),
              EXIT_SWEEP_IO_ERROR);
    EXPECT_EQ(MostSevereExitCode(EXIT_SWEEP_IO_ERROR, EXIT_SWEEP_UNSAFE_PATH),
              EXIT_SWEEP_UNSAFE_PATH);
    EXPECT_EQ(MostSevereExitCode(EXIT_SWEEP_UNSAFE_PATH, EXIT_SWEEP_IO_ERROR),
              EXIT_SWEEP_UNSAFE_PATH);
}

TEST(StatusTest, TestErrorCodeToStr)
{
    EXPECT_EQ(ErrorCodeToStr(0), "");
    EXPECT_EQ(ErrorCodeToStr(-EUNSAFEPATH), "unsafe target path");
    EXPECT_FALSE(ErrorCodeToStr(-ENOENT).empty());
}
