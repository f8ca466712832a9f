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
#include <dirent.h>
#include <fcntl.h>
#include <unistd.h>
#include <stdlib.h>
#include <string.h>
}

#include <cerrno>
#include <fstream>
#include <stdexcept>

#include "TestUtils.h"
#include "sweep/Sweeper.h"

using std::string;
using std::vector;
using namespace DirSweep;
using namespace DirSweep::test;

ScratchDir::ScratchDir()
{
    const char *tmpdir = getenv("TMPDIR");
    string templ = string((tmpdir && *tmpdir) ? tmpdir : "/tmp") +
        "/dirsweep_test.XXXXXX";
    vector<char> buf(templ.begin(), templ.end());
    buf.push_back('\0');

    if (mkdtemp(&buf[0]) == NULL)
        throw std::runtime_error("mkdtemp failed: " + string(strerror(errno)));
    mPath = &buf[0];
}

ScratchDir::~ScratchDir()
{
    RemoveTree(mPath);
}

string
ScratchDir::At(const string &relpath) const
{
    if (relpath.empty())
        return mPath;
    return mPath + "/" + relpath;
}

void
ScratchDir::MakeDirs(const string &relpath) const
{
    string::size_type pos = 0;

    while (pos != string::npos) {
        pos = relpath.find('/', pos + 1);
        string sub = At(relpath.substr(0, pos));
        if ((mkdir(sub.c_str(), 0755) < 0) && (errno != EEXIST))
            throw std::runtime_error("mkdir failed: " + sub);
    }
}

void
ScratchDir::MakeFile(const string &relpath, const string &contents) const
{
    string::size_type slash = relpath.rfind('/');
    if (slash != string::npos)
        MakeDirs(relpath.substr(0, slash));

    std::ofstream file(At(relpath).c_str());
    if (!file)
        throw std::runtime_error("unable to create " + At(relpath));
    file << contents;
}

void
ScratchDir::MakeSymlink(const string &target, const string &relpath) const
{
    if (symlink(target.c_str(), At(relpath).c_str()) < 0)
        throw std::runtime_error("symlink failed: " + At(relpath));
}

size_t
ScratchDir::MakeDeepDirs(const string &relpath, int depth) const
{
    const string name(200, 'd');
    string::size_type length = At(relpath).size();

    MakeDirs(relpath);
    int fd = open(At(relpath).c_str(), O_RDONLY | O_DIRECTORY);
    if (fd < 0)
        throw std::runtime_error("open failed: " + At(relpath));

    for (int i = 0; i < depth; i++) {
        if (mkdirat(fd, name.c_str(), 0755) < 0) {
            close(fd);
            throw std::runtime_error("mkdirat failed: " + string(strerror(errno)));
        }
        int child = openat(fd, name.c_str(), O_RDONLY | O_DIRECTORY);
        close(fd);
        if (child < 0)
            throw std::runtime_error("openat failed: " + string(strerror(errno)));
        fd = child;
        length += 1 + name.size();
    }
    close(fd);
    return length;
}

bool
ScratchDir::Exists(const string &relpath) const
{
    struct stat statInfo;
    return lstat(At(relpath).c_str(), &statInfo) == 0;
}

bool
ScratchDir::IsDir(const string &relpath) const
{
    struct stat statInfo;
    return (lstat(At(relpath).c_str(), &statInfo) == 0) &&
        S_ISDIR(statInfo.st_mode);
}

int
ScratchDir::CountEntries(const string &relpath) const
{
    vector<string> names;
    if (ListDirectory(At(relpath), names) < 0)
        return -1;
    return (int) names.size();
}

// Works relative to the parent's fd, so trees deeper than PATH_MAX
// go away too.
static void
RemoveTreeAt(int parentFd, const char *name)
{
    struct stat statInfo;

    if (fstatat(parentFd, name, &statInfo, AT_SYMLINK_NOFOLLOW) < 0)
        return;
    if (!S_ISDIR(statInfo.st_mode)) {
        unlinkat(parentFd, name, 0);
        return;
    }

    // tests may have taken permissions away
    fchmodat(parentFd, name, 0755, 0);
    int fd = openat(parentFd, name, O_RDONLY | O_DIRECTORY | O_NOFOLLOW);
    if (fd >= 0) {
        DIR *dir = fdopendir(fd);
        if (dir == NULL) {
            close(fd);
        } else {
            vector<string> names;
            struct dirent *entry;

            while ((entry = readdir(dir)) != NULL) {
                if ((strcmp(entry->d_name, ".") != 0) &&
                    (strcmp(entry->d_name, "..") != 0))
                    names.push_back(entry->d_name);
            }
            for (vector<string>::size_type i = 0; i < names.size(); ++i)
                RemoveTreeAt(dirfd(dir), names[i].c_str());
            closedir(dir);
        }
    }
    unlinkat(parentFd, name, AT_REMOVEDIR);
}

void
DirSweep::test::RemoveTree(const string &path)
{
    RemoveTreeAt(AT_FDCWD, path.c_str());
}

vector<string>
DirSweep::test::ReadLines(const string &path)
{
    vector<string> lines;
    std::ifstream file(path.c_str());
    string line;

    while (getline(file, line))
        lines.push_back(line);
    return lines;
}
