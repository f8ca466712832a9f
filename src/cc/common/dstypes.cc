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

#include <string.h>
#include "dstypes.h"

using std::string;
using namespace DirSweep;

string
DirSweep::ErrorCodeToStr(int status)
{
    if (status == 0)
        return "";

    if (status == -EUNSAFEPATH)
        return "unsafe target path";

    char buf[4096];
    const char *errptr = NULL;

#if defined (__APPLE__) || defined(__sun__)
    if (strerror_r(-status, buf, sizeof buf) == 0)
        errptr = buf;
    else
        errptr = "<unknown error>";
#else
    if ((errptr = strerror_r(-status, buf, sizeof buf)) == NULL)
        errptr = "<unknown error>";
#endif
    return string(errptr);
}

int
DirSweep::StatusToExitCode(int status)
{
    if ((status == 0) || (status == -ENOENT))
        return EXIT_SWEEP_OK;
    if (status == -EUNSAFEPATH)
        return EXIT_SWEEP_UNSAFE_PATH;
    return EXIT_SWEEP_IO_ERROR;
}

int
DirSweep::MostSevereExitCode(int a, int b)
{
    if ((a == EXIT_SWEEP_UNSAFE_PATH) || (b == EXIT_SWEEP_UNSAFE_PATH))
        return EXIT_SWEEP_UNSAFE_PATH;
    return a > b ? a : b;
}
