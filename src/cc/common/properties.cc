//---------------------------------------------------------- -*- Mode: C++ -*-
// $Id$
//
// \brief Properties implementation.
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

#include <fstream>
#include <cerrno>
#include "properties.h"
#include "log.h"

using std::string;
using namespace DirSweep;

Properties::Properties()
{
}

int Properties::loadProperties(const char *fileName, char delimiter, bool verbose)
{
    std::ifstream input(fileName);

    if (!input.is_open()) {
        int err = errno ? errno : ENOENT;
        DIRSWEEP_LOG_VA_ERROR("Could not open the properties file: %s", fileName);
        return -err;
    }
    loadProperties(input, delimiter, verbose);
    input.close();
    return 0;
}

int Properties::loadProperties(std::istream &ist, char delimiter, bool verbose)
{
    string line;

    while (getline(ist, line)) {
        if (line.find('#') == 0)
            continue;                               //ignore comments
        string::size_type pos = line.find(delimiter);

        if (pos == line.npos)
            continue;                               //ignore if no delimiter is found
        string key = removeLTSpaces(line.substr(0, pos));
        string value = removeLTSpaces(line.substr(pos + 1));

        propmap[key] = value;

        if (verbose)
            DIRSWEEP_LOG_VA_DEBUG("Loading key %s with value %s",
                                  key.c_str(), value.c_str());
    }
    return 0;
}

string Properties::removeLTSpaces(string str)
{
    char const* delims = " \t\r\n";

    // trim leading whitespace
    string::size_type notwhite = str.find_first_not_of(delims);
    str.erase(0, notwhite);

    // trim trailing whitespace
    notwhite = str.find_last_not_of(delims);
    str.erase(notwhite + 1);
    return str;
}

void Properties::getList(string &outBuf, const string &linePrefix) const
{
    std::map<string, string>::const_iterator iter;

    for (iter = propmap.begin(); iter != propmap.end(); iter++) {
        if (iter->first.size() > 0) {
            outBuf += linePrefix;
            outBuf += iter->first;
            outBuf += '=';
            outBuf += iter->second;
            outBuf += '\n';
        }
    }
}

string Properties::getValue(const string &key, const string &defaultValue) const
{
    std::map<string, string>::const_iterator it = propmap.find(key);

    if (it == propmap.end())
        return defaultValue;

    return it->second;
}

const char* Properties::getValue(const string &key, const char* defaultValue) const
{
    std::map<string, string>::const_iterator it = propmap.find(key);

    if (it == propmap.end())
        return defaultValue;

    return it->second.c_str();
}

bool Properties::hasKey(const string &key) const
{
    return propmap.find(key) != propmap.end();
}

void Properties::setValue(const string &key, const string &value)
{
    propmap[key] = value;
}
