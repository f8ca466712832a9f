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
// \file SweepLog.h
// \brief Append-only record of completed sweeps.
//
//----------------------------------------------------------------------------

#ifndef SWEEP_SWEEPLOG_H
#define SWEEP_SWEEPLOG_H

#include <ctime>
#include <string>

namespace DirSweep
{

///
/// Sink for the one-line record written after each successful sweep.
/// Implementations append; they never rewrite earlier lines.
///
class SweepLog {
public:
    virtual ~SweepLog() { }
    /// Append one record for message.
    /// @retval 0 on success; -errno on failure
    virtual int Append(const std::string &message) = 0;
};

/// Format "<YYYY-MM-DD HH:MM:SS> | <message>" using local time.
extern std::string FormatSweepLogLine(time_t when, const std::string &message);

///
/// Sweep log kept in a plain text file; the file is opened in append
/// mode (and created if needed) for every record.
///
class FileSweepLog : public SweepLog {
public:
    explicit FileSweepLog(const std::string &path) : mPath(path) { }
    virtual int Append(const std::string &message);
    const std::string &GetPath() const { return mPath; }
private:
    std::string mPath;
};

}

#endif // SWEEP_SWEEPLOG_H
