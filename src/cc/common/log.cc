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

#include "log.h"
#include <cerrno>
#include <iostream>
#include <log4cpp/FileAppender.hh>
#include <log4cpp/OstreamAppender.hh>
#include <log4cpp/PatternLayout.hh>

using namespace DirSweep;

log4cpp::Category* DirSweep::MsgLogger::logger = NULL;

void
MsgLogger::Init(const char *filename, log4cpp::Priority::Value priority)
{
    log4cpp::Appender* appender;
    log4cpp::PatternLayout* layout = new log4cpp::PatternLayout();
    layout->setConversionPattern("%d{%Y-%m-%d %H:%M:%S.%l} %p - %m %n");

    if (filename != NULL)
        appender = new log4cpp::FileAppender("default", std::string(filename));
    else
        appender = new log4cpp::OstreamAppender("default", &std::cerr);

    appender->setLayout(layout);

    logger = &(log4cpp::Category::getInstance(std::string("dirsweep")));
    // Init() may be called again to switch the destination
    logger->removeAllAppenders();
    logger->addAppender(appender);
    logger->setAdditivity(false);
    logger->setPriority(priority);
}

void
MsgLogger::SetLevel(log4cpp::Priority::Value priority)
{
    if (logger)
        logger->setPriority(priority);
}

int
MsgLogger::SetLevel(const std::string &levelName)
{
    log4cpp::Priority::Value priority;

    if (levelName == "DEBUG") {
        priority = log4cpp::Priority::DEBUG;
    } else if (levelName == "INFO") {
        priority = log4cpp::Priority::INFO;
    } else if (levelName == "WARN") {
        priority = log4cpp::Priority::WARN;
    } else if (levelName == "ERROR") {
        priority = log4cpp::Priority::ERROR;
    } else if (levelName == "FATAL") {
        priority = log4cpp::Priority::FATAL;
    } else {
        return -EINVAL;
    }
    SetLevel(priority);
    return 0;
}

void
MsgLogger::Stop()
{
    if (logger == NULL)
        return;
    logger = NULL;
    log4cpp::Category::shutdown();
}
