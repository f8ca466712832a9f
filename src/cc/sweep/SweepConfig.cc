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

#include "SweepConfig.h"
#include "PathGuard.h"
#include "common/log.h"

using std::string;
using std::vector;
using namespace DirSweep;

const char *const DirSweep::DEFAULT_TARGET_DIR = "/file/downloads";
const char *const DirSweep::DEFAULT_SWEEP_LOG_PATH = "/var/log/rm_empty_dirs.log";

int
DirSweep::ParseSweepMode(const string &name, SweepMode *mode)
{
    if (name == "prune-empty") {
        *mode = kPruneEmptyDirs;
        return 0;
    }
    if (name == "purge-contents") {
        *mode = kPurgeContents;
        return 0;
    }
    return -EINVAL;
}

const char *
DirSweep::SweepModeName(SweepMode mode)
{
    return mode == kPurgeContents ? "purge-contents" : "prune-empty";
}

SweepConfig::SweepConfig() :
    targetDirs(), mode(kPruneEmptyDirs),
    logPath(DEFAULT_SWEEP_LOG_PATH), denyList(),
#ifdef NDEBUG
    logLevel("INFO")
#else
    logLevel("DEBUG")
#endif
{
    targetDirs.push_back(DEFAULT_TARGET_DIR);
}

vector<SweepRequest>
SweepConfig::GetRequests() const
{
    vector<SweepRequest> requests;

    for (vector<string>::const_iterator it = targetDirs.begin();
         it != targetDirs.end(); ++it) {
        requests.push_back(SweepRequest(*it, mode));
    }
    return requests;
}

// "/a" and "/a/" name the same directory
static bool
ContainsPath(const vector<string> &paths, const string &path)
{
    const string normalized = NormalizePath(path);

    for (vector<string>::const_iterator it = paths.begin();
         it != paths.end(); ++it) {
        if (NormalizePath(*it) == normalized)
            return true;
    }
    return false;
}

void
DirSweep::SplitPathList(const string &list, vector<string> &out)
{
    const char *delims = " \t\r\n,;";
    string::size_type curr = 0, next;

    while (curr < list.size()) {
        next = list.find_first_of(delims, curr);
        if (next == string::npos)
            next = list.size();

        string component(list, curr, next - curr);
        curr = next + 1;

        if (component.empty())
            continue;
        if (ContainsPath(out, component))
            continue;
        out.push_back(component);
    }
}

int
DirSweep::LoadSweepConfig(const Properties &props, SweepConfig *config)
{
    if (props.hasKey("sweeper.targetDirs") || props.hasKey("sweeper.targetDir")) {
        vector<string> dirs;

        SplitPathList(props.getValue("sweeper.targetDirs", ""), dirs);
        if (props.hasKey("sweeper.targetDir")) {
            // a single target may be set to "" on purpose; keep it so
            // that it gets rejected by the path guard
            string single = props.getValue("sweeper.targetDir", "");
            if (!ContainsPath(dirs, single))
                dirs.push_back(single);
        }
        if (dirs.empty()) {
            DIRSWEEP_LOG_ERROR("sweeper.targetDirs lists no directories");
            return -EINVAL;
        }
        config->targetDirs = dirs;
    }

    string modeName = props.getValue("sweeper.mode",
                                     SweepModeName(config->mode));
    if (ParseSweepMode(modeName, &config->mode) < 0) {
        DIRSWEEP_LOG_VA_ERROR("Unknown sweep mode: %s", modeName.c_str());
        return -EINVAL;
    }

    config->logPath = props.getValue("sweeper.logPath", config->logPath);

    vector<string> deny;
    SplitPathList(props.getValue("sweeper.denyList", ""), deny);
    config->denyList.insert(config->denyList.end(), deny.begin(), deny.end());

    string level = props.getValue("sweeper.loglevel", config->logLevel);
    if ((level != "DEBUG") && (level != "INFO") && (level != "WARN") &&
        (level != "ERROR") && (level != "FATAL")) {
        DIRSWEEP_LOG_VA_ERROR("Unknown log level: %s", level.c_str());
        return -EINVAL;
    }
    config->logLevel = level;

    return 0;
}
