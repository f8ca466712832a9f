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
// \file Sweeper.h
// \brief Prune empty directories / purge directory contents.
//
//----------------------------------------------------------------------------

#ifndef SWEEP_SWEEPER_H
#define SWEEP_SWEEPER_H

#include <string>
#include <vector>
#include <boost/shared_ptr.hpp>

#include "PathGuard.h"
#include "SweepConfig.h"
#include "SweepLog.h"

namespace DirSweep
{

/// What a single sweep did.
struct SweepStats {
    SweepStats() : dirsRemoved(0), filesRemoved(0), failures(0) { }

    int dirsRemoved;
    int filesRemoved;
    int failures;   //!< entries that could not be read or removed
};

///
/// The sweeper runs one request at a time: validate the target with
/// the path guard, sweep it, and on success append a record to the
/// sweep log.  Failures are best effort: the walk keeps going past an
/// entry it can't read or remove, counts it, and the first error is
/// returned at the end.  The target directory itself is never
/// removed.  Symbolic links below the target are never followed.
///
class Sweeper {
public:
    Sweeper(const PathGuard &guard, const boost::shared_ptr<SweepLog> &log);

    /// @retval 0 if targetDir may be swept; -EUNSAFEPATH otherwise
    int Validate(const std::string &targetDir) const;

    /// Remove every empty directory below targetDir, including the
    /// ones that become empty because their children were removed.
    /// @param[in] targetDir  root of the walk; kept even if empty
    /// @param[out] stats  counters; may be NULL
    /// @retval 0 on success; -EUNSAFEPATH, -ENOENT, -ENOTDIR or the
    /// first -errno hit during the walk
    int PruneEmptyDirs(const std::string &targetDir, SweepStats *stats);

    /// Remove every entry below targetDir at any depth.  A missing
    /// targetDir is reported as -ENOENT and nothing is created.
    /// @param[in] targetDir  directory to empty; kept
    /// @param[out] stats  counters; may be NULL
    /// @retval 0 on success; -EUNSAFEPATH, -ENOENT, -ENOTDIR or the
    /// first -errno hit during the walk
    int PurgeContents(const std::string &targetDir, SweepStats *stats);

    /// Append a record to the sweep log.  A failure is logged as a
    /// warning and returned, but never affects the sweep.
    int AppendLog(const std::string &message);

    /// Validate, sweep and log.
    int Run(const SweepRequest &request, SweepStats *stats);

private:
    PathGuard mGuard;
    boost::shared_ptr<SweepLog> mLog;

    int CheckTarget(const std::string &targetDir, std::string *sweepDir) const;
    int PruneDir(const std::string &dirname, SweepStats *stats, bool *isEmpty);
    int RemoveContents(const std::string &dirname, SweepStats *stats);
};

/// Read the names in dirname, minus "." and "..", in sorted order.
/// @retval 0 on success; -errno on failure
extern int ListDirectory(const std::string &dirname,
                         std::vector<std::string> &names);

}

#endif // SWEEP_SWEEPER_H
