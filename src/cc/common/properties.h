//---------------------------------------------------------- -*- Mode: C++ -*-
// $Id$
//
// \brief Properties file similar to java.util.Properties
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

#ifndef COMMON_PROPERTIES_H
#define COMMON_PROPERTIES_H

#include <istream>
#include <string>
#include <map>

namespace DirSweep
{

class Properties {

  private :
    //Map that holds the (key,value) pairs
    std::map<std::string, std::string> propmap;
    static std::string removeLTSpaces(std::string str);

  public  :
    /// Load the properties from a file.  Lines are "key <delimiter>
    /// value"; lines starting with '#' and lines without the
    /// delimiter are skipped.
    /// @retval 0 on success; -errno if the file can't be opened
    int loadProperties(const char* fileName, char delimiter, bool verbose);
    // load the properties from an in-core buffer
    int loadProperties(std::istream &ist, char delimiter, bool verbose);
    std::string getValue(const std::string &key, const std::string &def) const;
    const char* getValue(const std::string &key, const char* def) const;
    bool hasKey(const std::string &key) const;
    void setValue(const std::string &key, const std::string &value);
    void getList(std::string &outBuf, const std::string &linePrefix) const;
    Properties();
};

}

#endif // COMMON_PROPERTIES_H
