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
// \brief A logging facility that uses log4cpp.
//
//----------------------------------------------------------------------------

#ifndef COMMON_LOG_H
#define COMMON_LOG_H

#define LOG4CPP_FIX_ERROR_COLLISION 1
#include <log4cpp/Category.hh>
#include <log4cpp/Priority.hh>
#include <libgen.h>
#include <string>

namespace DirSweep
{
    // Have a singleton logger for an application
    class MsgLogger
    {
    private:
        MsgLogger();
        MsgLogger(const MsgLogger &other);
        MsgLogger& operator=(const MsgLogger &other);
        static log4cpp::Category *logger;
    public:
        static log4cpp::Category* GetLogger() { return logger; }
        /// Log to filename; if filename is NULL, log to stderr.
        static void Init(const char *filename,
                         log4cpp::Priority::Value priority =
#ifdef NDEBUG
                         log4cpp::Priority::INFO
#else
                         log4cpp::Priority::DEBUG
#endif
                         );
        static void SetLevel(log4cpp::Priority::Value priority);
        /// Set the level by name: DEBUG, INFO, WARN, ERROR, FATAL.
        /// @retval 0 on success; -EINVAL if the name is not recognized
        static int SetLevel(const std::string &levelName);
        static void Stop();
    };

#ifndef THIS_FILE
#define THIS_FILE basename((char *) __FILE__)
#endif

// The following if prevents arguments evaluation (and possible side effect).

#ifndef DIRSWEEP_LOG_VA_PRIORITY
#   define DIRSWEEP_LOG_VA_PRIORITY(priority, method, msg, ...) \
        if (MsgLogger::GetLogger() && \
                MsgLogger::GetLogger()->isPriorityEnabled(priority)) \
            MsgLogger::GetLogger()->method("(%s:%d) " \
                msg, THIS_FILE, __LINE__, __VA_ARGS__)
#endif

#ifndef DIRSWEEP_LOG_PRIORITY
#   define DIRSWEEP_LOG_PRIORITY(priority, method, msg) \
        DIRSWEEP_LOG_VA_PRIORITY(priority, method, "%s", msg)
#endif

#ifndef DIRSWEEP_LOG_DEBUG
#   define DIRSWEEP_LOG_DEBUG(msg) \
        DIRSWEEP_LOG_PRIORITY(log4cpp::Priority::DEBUG, debug, msg)
#endif
#ifndef DIRSWEEP_LOG_VA_DEBUG
#   define DIRSWEEP_LOG_VA_DEBUG(msg, ...) \
        DIRSWEEP_LOG_VA_PRIORITY(log4cpp::Priority::DEBUG, debug, msg, __VA_ARGS__)
#endif

#ifndef DIRSWEEP_LOG_INFO
#   define DIRSWEEP_LOG_INFO(msg) \
        DIRSWEEP_LOG_PRIORITY(log4cpp::Priority::INFO, info, msg)
#endif
#ifndef DIRSWEEP_LOG_VA_INFO
#   define DIRSWEEP_LOG_VA_INFO(msg, ...) \
        DIRSWEEP_LOG_VA_PRIORITY(log4cpp::Priority::INFO, info, msg, __VA_ARGS__)
#endif

#ifndef DIRSWEEP_LOG_WARN
#   define DIRSWEEP_LOG_WARN(msg) \
        DIRSWEEP_LOG_PRIORITY(log4cpp::Priority::WARN, warn, msg)
#endif
#ifndef DIRSWEEP_LOG_VA_WARN
#   define DIRSWEEP_LOG_VA_WARN(msg, ...) \
        DIRSWEEP_LOG_VA_PRIORITY(log4cpp::Priority::WARN, warn, msg, __VA_ARGS__)
#endif

#ifndef DIRSWEEP_LOG_ERROR
#   define DIRSWEEP_LOG_ERROR(msg) \
        DIRSWEEP_LOG_PRIORITY(log4cpp::Priority::ERROR, error, msg)
#endif
#ifndef DIRSWEEP_LOG_VA_ERROR
#   define DIRSWEEP_LOG_VA_ERROR(msg, ...) \
        DIRSWEEP_LOG_VA_PRIORITY(log4cpp::Priority::ERROR, error, msg, __VA_ARGS__)
#endif

#ifndef DIRSWEEP_LOG_FATAL
#   define DIRSWEEP_LOG_FATAL(msg) \
        DIRSWEEP_LOG_PRIORITY(log4cpp::Priority::FATAL, fatal, msg)
#endif
#ifndef DIRSWEEP_LOG_VA_FATAL
#   define DIRSWEEP_LOG_VA_FATAL(msg, ...) \
        DIRSWEEP_LOG_VA_PRIORITY(log4cpp::Priority::FATAL, fatal, msg, __VA_ARGS__)
#endif

}

#endif // COMMON_LOG_H
