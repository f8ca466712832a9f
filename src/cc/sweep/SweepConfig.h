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
// \file SweepConfig.h
// \brief Sweep requests and the configuration they are built from.
//
//----------------------------------------------------------------------------

#ifndef SWEEP_SWEEPCONFIG_H
#define SWEEP_SWEEPCONFIG_H

#include <string>
#include <vector>

#include "common/properties.h"

namespace DirSweep
{

enum SweepMode {
    kPruneEmptyDirs,    //!< remove empty directories below the target
    kPurgeContents      //!< remove everything below the target
};

/// Parse "prune-empty" / "purge-contents".
/// @retval 0 on success; -EINVAL if name is not a known mode
extern int ParseSweepMode(const std::string &name, SweepMode *mode);
extern const char *SweepModeName(SweepMode mode);

///
/// A single unit of work: sweep targetDir in the given mode.
///
struct SweepRequest {
    SweepRequest() : targetDir(), mode(kPruneEmptyDirs) { }
    SweepRequest(const std::string &d, SweepMode m) :
        targetDir(d), mode(m) { }

    std::string targetDir;
    SweepMode mode;
};

// Compiled-in defaults, used when there is no properties file.
extern const char *const DEFAULT_TARGET_DIR;
extern const char *const DEFAULT_SWEEP_LOG_PATH;

struct SweepConfig {
    SweepConfig();

    /// Build one request per target directory.
    std::vector<SweepRequest> GetRequests() const;

    std::vector<std::string> targetDirs;  //!< de-duplicated, in order
    SweepMode mode;
    std::string logPath;                  //!< sweep log (append only)
    std::vector<std::string> denyList;    //!< in addition to "" and "/"
    std::string logLevel;                 //!< MsgLogger level name
};

///
/// Fill config from the "sweeper.*" keys in props; keys that are
/// absent leave the compiled-in defaults in place.
/// @param[in] props  loaded properties
/// @param[out] config  the resulting configuration
/// @retval 0 on success; -EINVAL on a bad mode or log level
///
extern int LoadSweepConfig(const Properties &props, SweepConfig *config);

/// Split a list of paths separated by blanks, ',' or ';' and append
/// the ones not already in out, comparing normalized forms.
extern void SplitPathList(const std::string &list,
                          std::vector<std::string> &out);

}

#endif // SWEEP_SWEEPCONFIG_H
