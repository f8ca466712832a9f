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
#include <limits.h>
#include <stdlib.h>
}

#include <cerrno>
#include <deque>

#include "PathGuard.h"
#include "common/dstypes.h"
#include "common/log.h"

using std::deque;
using std::string;
using std::vector;
using namespace DirSweep;

string
DirSweep::NormalizePath(const string &path)
{
    if (path.empty())
        return path;

    const bool absolute = (path[0] == '/');
    deque<string> components;
    string::size_type start = 0;

    while (start <= path.size()) {
        string::size_type slash = path.find('/', start);
        if (slash == string::npos)
            slash = path.size();
        string c = path.substr(start, slash - start);
        start = slash + 1;

        if (c.empty() || (c == "."))
            continue;
        if (c == "..") {
            if (!components.empty() && (components.back() != "..")) {
                components.pop_back();
                continue;
            }
            // ".." above the root is the root
            if (absolute)
                continue;
        }
        components.push_back(c);
    }

    string result = absolute ? "/" : "";
    for (deque<string>::size_type i = 0; i < components.size(); ++i) {
        if (i > 0)
            result += '/';
        result += components[i];
    }
    if (result.empty())
        result = ".";
    return result;
}

PathGuard::PathGuard()
{
    mDenied.insert("/");
}

void
PathGuard::AddDenied(const string &path)
{
    if (path.empty())
        return;
    mDenied.insert(NormalizePath(path));

    // a symlinked entry protects what it points at
    char resolved[PATH_MAX];
    if (realpath(path.c_str(), resolved) != NULL)
        mDenied.insert(resolved);
}

void
PathGuard::AddDenied(const vector<string> &paths)
{
    for (vector<string>::const_iterator it = paths.begin();
         it != paths.end(); ++it) {
        AddDenied(*it);
    }
}

bool
PathGuard::IsDenied(const string &path) const
{
    if (path.empty())
        return true;
    return mDenied.find(NormalizePath(path)) != mDenied.end();
}

int
PathGuard::Validate(const string &targetDir) const
{
    if (targetDir.empty()) {
        DIRSWEEP_LOG_ERROR("Refusing to sweep an empty path");
        return -EUNSAFEPATH;
    }
    if (targetDir[0] != '/') {
        DIRSWEEP_LOG_VA_ERROR("Refusing to sweep relative path: '%s'",
                              targetDir.c_str());
        return -EUNSAFEPATH;
    }
    if (IsDenied(targetDir)) {
        DIRSWEEP_LOG_VA_ERROR("Refusing to sweep deny-listed path: '%s'",
                              targetDir.c_str());
        return -EUNSAFEPATH;
    }

    char resolved[PATH_MAX];
    if (realpath(targetDir.c_str(), resolved) != NULL && IsDenied(resolved)) {
        DIRSWEEP_LOG_VA_ERROR("Refusing to sweep '%s': resolves to deny-listed '%s'",
                              targetDir.c_str(), resolved);
        return -EUNSAFEPATH;
    }
    return 0;
}

int
PathGuard::Resolve(const string &targetDir, string *resolved) const
{
    int res = Validate(targetDir);

    if (res < 0)
        return res;

    char buf[PATH_MAX];
    if (realpath(targetDir.c_str(), buf) == NULL)
        return -errno;

    if (IsDenied(buf)) {
        DIRSWEEP_LOG_VA_ERROR("Refusing to sweep '%s': resolves to deny-listed '%s'",
                              targetDir.c_str(), buf);
        return -EUNSAFEPATH;
    }
    *resolved = buf;
    return 0;
}
