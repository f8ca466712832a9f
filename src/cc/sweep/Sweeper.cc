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

extern "C" {
#include <sys/types.h>
#include <sys/stat.h>
#include <unistd.h>
#include <dirent.h>
#include <stdlib.h>
#include <string.h>
}

#include <cerrno>
#include <boost/lexical_cast.hpp>

#include "Sweeper.h"
#include "common/dstypes.h"
#include "common/log.h"

using std::string;
using std::vector;
using boost::lexical_cast;
using namespace DirSweep;

static string
JoinPath(const string &dirname, const char *name)
{
    if (!dirname.empty() && dirname[dirname.size() - 1] == '/')
        return dirname + name;
    return dirname + "/" + name;
}

static int
RecordFailure(const string &pathname, const char *what, int err,
              SweepStats *stats)
{
    stats->failures++;
    DIRSWEEP_LOG_VA_ERROR("Unable to %s %s: %s", what, pathname.c_str(),
                          ErrorCodeToStr(-err).c_str());
    return -err;
}

int
DirSweep::ListDirectory(const string &dirname, vector<string> &names)
{
    struct dirent **entries;
    int n;

    names.clear();
    n = scandir(dirname.c_str(), &entries, 0, alphasort);
    if (n < 0)
        return -errno;

    for (int i = 0; i < n; i++) {
        if ((strcmp(entries[i]->d_name, ".") != 0) &&
            (strcmp(entries[i]->d_name, "..") != 0))
            names.push_back(entries[i]->d_name);
        free(entries[i]);
    }
    free(entries);
    return 0;
}

Sweeper::Sweeper(const PathGuard &guard, const boost::shared_ptr<SweepLog> &log) :
    mGuard(guard), mLog(log)
{
}

int
Sweeper::Validate(const string &targetDir) const
{
    return mGuard.Validate(targetDir);
}

//
// Resolve targetDir once and hand back the resolved path: that is the
// path checked against the deny-list and the only one walked.
//
int
Sweeper::CheckTarget(const string &targetDir, string *sweepDir) const
{
    struct stat statInfo;
    int res = mGuard.Resolve(targetDir, sweepDir);

    if (res == -ENOENT) {
        DIRSWEEP_LOG_VA_WARN("Directory %s not found", targetDir.c_str());
        return res;
    }
    if (res == -EUNSAFEPATH)
        return res;
    if (res < 0) {
        DIRSWEEP_LOG_VA_ERROR("Unable to resolve %s: %s", targetDir.c_str(),
                              ErrorCodeToStr(res).c_str());
        return res;
    }

    if (stat(sweepDir->c_str(), &statInfo) < 0) {
        res = -errno;
        DIRSWEEP_LOG_VA_ERROR("Unable to stat %s: %s", sweepDir->c_str(),
                              ErrorCodeToStr(res).c_str());
        return res;
    }
    if (!S_ISDIR(statInfo.st_mode)) {
        DIRSWEEP_LOG_VA_ERROR("%s is not a directory", targetDir.c_str());
        return -ENOTDIR;
    }
    return 0;
}

int
Sweeper::PruneEmptyDirs(const string &targetDir, SweepStats *stats)
{
    SweepStats unused;
    bool isEmpty;

    if (stats == NULL)
        stats = &unused;

    string sweepDir;
    int res = CheckTarget(targetDir, &sweepDir);
    if (res < 0)
        return res;

    // the root is only walked; whether it ends up empty doesn't matter
    return PruneDir(sweepDir, stats, &isEmpty);
}

//
// Post-order walk: every child directory is pruned before its parent
// is looked at, so a parent emptied by the removal of its children is
// removed in the same pass.
//
int
Sweeper::PruneDir(const string &dirname, SweepStats *stats, bool *isEmpty)
{
    vector<string> names;
    int status = 0;
    int res;

    *isEmpty = false;
    res = ListDirectory(dirname, names);
    if (res == -ENOENT)
        return 0;
    if (res < 0)
        return RecordFailure(dirname, "read directory", -res, stats);

    vector<string>::size_type remaining = names.size();

    for (vector<string>::size_type i = 0; i < names.size(); ++i) {
        string pathname = JoinPath(dirname, names[i].c_str());
        struct stat statInfo;
        bool childEmpty;

        if (lstat(pathname.c_str(), &statInfo) < 0) {
            if (errno == ENOENT) {
                remaining--;
                continue;
            }
            res = RecordFailure(pathname, "stat", errno, stats);
            if (status == 0)
                status = res;
            continue;
        }
        if (!S_ISDIR(statInfo.st_mode))
            continue;

        res = PruneDir(pathname, stats, &childEmpty);
        if ((res < 0) && (status == 0))
            status = res;
        if (!childEmpty)
            continue;

        if (rmdir(pathname.c_str()) == 0) {
            DIRSWEEP_LOG_VA_DEBUG("Removed empty dir: %s", pathname.c_str());
            stats->dirsRemoved++;
            remaining--;
        } else if (errno == ENOENT) {
            remaining--;
        // ENOTEMPTY/EEXIST: something was created in there since we looked
        } else if ((errno != ENOTEMPTY) && (errno != EEXIST)) {
            res = RecordFailure(pathname, "rmdir", errno, stats);
            if (status == 0)
                status = res;
        }
    }

    *isEmpty = (remaining == 0);
    return status;
}

int
Sweeper::PurgeContents(const string &targetDir, SweepStats *stats)
{
    SweepStats unused;

    if (stats == NULL)
        stats = &unused;

    string sweepDir;
    int res = CheckTarget(targetDir, &sweepDir);
    if (res < 0)
        return res;

    return RemoveContents(sweepDir, stats);
}

// do the equivalent of rm -rf on everything below dirname
int
Sweeper::RemoveContents(const string &dirname, SweepStats *stats)
{
    vector<string> names;
    int status = 0;
    int res;

    res = ListDirectory(dirname, names);
    if (res == -ENOENT)
        return 0;
    if (res < 0)
        return RecordFailure(dirname, "read directory", -res, stats);

    for (vector<string>::size_type i = 0; i < names.size(); ++i) {
        string pathname = JoinPath(dirname, names[i].c_str());
        struct stat statInfo;

        if (lstat(pathname.c_str(), &statInfo) < 0) {
            if (errno == ENOENT)
                continue;
            res = RecordFailure(pathname, "stat", errno, stats);
            if (status == 0)
                status = res;
            continue;
        }

        if (S_ISDIR(statInfo.st_mode)) {
            res = RemoveContents(pathname, stats);
            if ((res < 0) && (status == 0))
                status = res;
            if (rmdir(pathname.c_str()) == 0) {
                stats->dirsRemoved++;
            } else if (errno != ENOENT) {
                res = RecordFailure(pathname, "rmdir", errno, stats);
                if (status == 0)
                    status = res;
            }
            continue;
        }

        if (unlink(pathname.c_str()) == 0) {
            stats->filesRemoved++;
        } else if (errno != ENOENT) {
            res = RecordFailure(pathname, "remove", errno, stats);
            if (status == 0)
                status = res;
        }
    }
    return status;
}

int
Sweeper::AppendLog(const string &message)
{
    if (!mLog)
        return 0;

    int res = mLog->Append(message);
    if (res < 0) {
        DIRSWEEP_LOG_VA_WARN("Unable to write sweep log: %s",
                             ErrorCodeToStr(res).c_str());
    }
    return res;
}

int
Sweeper::Run(const SweepRequest &request, SweepStats *stats)
{
    SweepStats unused;
    string message;
    int res;

    if (stats == NULL)
        stats = &unused;

    DIRSWEEP_LOG_VA_INFO("Sweeping %s (%s)", request.targetDir.c_str(),
                         SweepModeName(request.mode));

    if (request.mode == kPurgeContents) {
        res = PurgeContents(request.targetDir, stats);
        message = "Removed all contents of " + request.targetDir + " (" +
            lexical_cast<string>(stats->filesRemoved) + " files, " +
            lexical_cast<string>(stats->dirsRemoved) + " directories)";
    } else {
        res = PruneEmptyDirs(request.targetDir, stats);
        message = "Removed empty directories under " + request.targetDir +
            " (" + lexical_cast<string>(stats->dirsRemoved) + " removed)";
    }

    if (res < 0) {
        DIRSWEEP_LOG_VA_INFO("Sweep of %s failed: %s",
                             request.targetDir.c_str(),
                             ErrorCodeToStr(res).c_str());
        return res;
    }

    DIRSWEEP_LOG_INFO(message.c_str());
    // the sweep log is best effort; AppendLog() already warned
    (void) AppendLog(message);
    return 0;
}
