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
// \file PathGuard.h
// \brief Refuse destructive operations on dangerous paths.
//
//----------------------------------------------------------------------------

#ifndef SWEEP_PATHGUARD_H
#define SWEEP_PATHGUARD_H

#include <set>
#include <string>
#include <vector>

namespace DirSweep
{

///
/// Lexically normalize a path: collapse repeated '/', drop "."
/// components and trailing '/', fold ".." into its parent ("/.." is
/// "/").  Relative paths stay relative; "" stays "".
///
extern std::string NormalizePath(const std::string &path);

///
/// The deny-list of paths that must never be swept.  The empty path
/// and the filesystem root are always on it; more entries can be
/// added from the configuration.
///
class PathGuard {
public:
    PathGuard();

    /// Add a path (normalized before it is stored).  When the path
    /// exists, its resolved form is denied as well.
    void AddDenied(const std::string &path);
    void AddDenied(const std::vector<std::string> &paths);

    bool IsDenied(const std::string &path) const;

    /// Check that targetDir is safe to sweep: it must be a non-empty
    /// absolute path whose normalized form, and whose resolved form
    /// when it exists, is not on the deny-list.  Does not touch the
    /// filesystem beyond resolving symlinks.
    /// @param[in] targetDir  the directory about to be swept
    /// @retval 0 if safe; -EUNSAFEPATH otherwise
    int Validate(const std::string &targetDir) const;

    /// Validate targetDir and resolve it to the directory the kernel
    /// would actually walk into.  The resolved path is checked against
    /// the deny-list as well; it is the only path that may be swept.
    /// @param[in] targetDir  the directory about to be swept
    /// @param[out] resolved  absolute path with no symlinks or "..".
    /// @retval 0 if safe; -EUNSAFEPATH or the -errno from realpath()
    int Resolve(const std::string &targetDir, std::string *resolved) const;

private:
    std::set<std::string> mDenied;
};

}

#endif // SWEEP_PATHGUARD_H
