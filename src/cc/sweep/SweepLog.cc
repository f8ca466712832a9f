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

#include <cerrno>
#include <fstream>

#include "SweepLog.h"
#include "common/log.h"

using std::string;
using namespace DirSweep;

string
DirSweep::FormatSweepLogLine(time_t when, const string &message)
{
    struct tm tmbuf;
    char timestr[32];

    localtime_r(&when, &tmbuf);
    strftime(timestr, sizeof(timestr), "%Y-%m-%d %H:%M:%S", &tmbuf);

    return string(timestr) + " | " + message;
}

int
FileSweepLog::Append(const string &message)
{
    std::ofstream file;

    errno = 0;
    file.open(mPath.c_str(), std::ios_base::app);
    if (file.fail()) {
        int err = errno ? errno : EIO;
        DIRSWEEP_LOG_VA_DEBUG("Unable to open sweep log %s", mPath.c_str());
        return -err;
    }

    file << FormatSweepLogLine(time(NULL), message) << '\n';
    file.flush();
    return file.fail() ? -EIO : 0;
}
