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
// \brief Status codes shared by the sweeper and the tools.
//
//----------------------------------------------------------------------------

#ifndef COMMON_DSTYPES_H
#define COMMON_DSTYPES_H

#include <cerrno>
#include <string>

namespace DirSweep {

//!< Status codes are 0 on success, -errno on failure.  Codes for
//!< dirsweep specific errors start at 1000 so that they can't collide
//!< with errno values.

// target path is empty, a filesystem root, relative or deny-listed
const int EUNSAFEPATH = 1000;

//!< Process exit codes
const int EXIT_SWEEP_OK = 0;
const int EXIT_SWEEP_UNSAFE_PATH = 1;
const int EXIT_SWEEP_IO_ERROR = 2;
const int EXIT_SWEEP_BAD_CONFIG = 3;

/// Map a (negative) status code to a readable message.
extern std::string ErrorCodeToStr(int status);

/// Map a status code returned by a sweep to the process exit code.
/// A missing target is a no-op and maps to EXIT_SWEEP_OK.
extern int StatusToExitCode(int status);

/// Combine the exit codes of several sweeps: an unsafe path wins over
/// an I/O error, which wins over success.
extern int MostSevereExitCode(int a, int b);

}

#endif // COMMON_DSTYPES_H
