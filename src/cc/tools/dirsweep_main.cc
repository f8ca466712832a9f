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
// \brief Tool that prunes empty directories / purges directory contents.
//
//----------------------------------------------------------------------------

#include <iostream>
#include <string>
#include <vector>

extern "C" {
#include <unistd.h>
#include <stdlib.h>
}

#include <boost/shared_ptr.hpp>

#include "common/dstypes.h"
#include "common/log.h"
#include "common/properties.h"
#include "sweep/PathGuard.h"
#include "sweep/SweepConfig.h"
#include "sweep/SweepLog.h"
#include "sweep/Sweeper.h"

using std::cout;
using std::cerr;
using std::endl;
using std::string;
using std::vector;

using namespace DirSweep;

static Properties gProp;
static SweepConfig gConfig;

static int ReadSweepProperties(const char *fileName);
static int RunSweeps();

static void
Usage(const char *progname)
{
    cout << "Usage: " << progname
         << " [-c <properties file>] [-l <msg log file>] [-h]" << endl;
    cout << "With no properties file, runs prune-empty on "
         << DEFAULT_TARGET_DIR << endl;
}

int
main(int argc, char **argv)
{
    const char *propsFile = NULL;
    const char *msgLogFile = NULL;
    bool help = false;
    int optchar;

    while ((optchar = getopt(argc, argv, "hc:l:")) != -1) {
        switch (optchar) {
            case 'c':
                propsFile = optarg;
                break;
            case 'l':
                msgLogFile = optarg;
                break;
            case 'h':
                help = true;
                break;
            default:
                Usage(argv[0]);
                exit(EXIT_SWEEP_BAD_CONFIG);
        }
    }

    if (help) {
        Usage(argv[0]);
        exit(EXIT_SWEEP_OK);
    }

    MsgLogger::Init(msgLogFile);

    if (propsFile != NULL && ReadSweepProperties(propsFile) != 0) {
        cerr << "Bad properties file: " << propsFile << " aborting..." << endl;
        MsgLogger::Stop();
        exit(EXIT_SWEEP_BAD_CONFIG);
    }
    // the level names were checked when the config was loaded
    (void) MsgLogger::SetLevel(gConfig.logLevel);

    int exitCode = RunSweeps();

    MsgLogger::Stop();
    return exitCode;
}

///
/// Read and validate the configuration settings for the sweeper.
/// The configuration file is assumed to contain lines of the form:
/// sweeper.xxx = <value>
/// @result 0 on success; -1 on failure
/// @param[in] fileName File that contains the configuration.
///
static int
ReadSweepProperties(const char *fileName)
{
    if (gProp.loadProperties(fileName, '=', true) != 0)
        return -1;

    if (LoadSweepConfig(gProp, &gConfig) != 0)
        return -1;

    string props;
    gProp.getList(props, "  ");
    DIRSWEEP_LOG_VA_DEBUG("Loaded properties from %s:\n%s", fileName,
                          props.c_str());
    return 0;
}

static int
RunSweeps()
{
    PathGuard guard;
    guard.AddDenied(gConfig.denyList);

    boost::shared_ptr<SweepLog> sweepLog(new FileSweepLog(gConfig.logPath));
    Sweeper sweeper(guard, sweepLog);

    vector<SweepRequest> requests = gConfig.GetRequests();
    int exitCode = EXIT_SWEEP_OK;
    for (vector<SweepRequest>::size_type i = 0; i < requests.size(); ++i) {
        const SweepRequest &req = requests[i];
        SweepStats stats;
        int res = sweeper.Run(req, &stats);

        if (res == -EUNSAFEPATH) {
            cerr << "Error: Invalid target_dir: '" << req.targetDir << "'" << endl;
        } else if (res == -ENOENT) {
            cout << "Directory " << req.targetDir << " not found!" << endl;
        } else if (res < 0) {
            cerr << "Sweep of " << req.targetDir << " failed: "
                 << ErrorCodeToStr(res) << " (" << stats.failures
                 << " entries could not be removed)" << endl;
        } else if (req.mode == kPurgeContents) {
            cout << "Purged " << req.targetDir << ": "
                 << stats.filesRemoved << " files, "
                 << stats.dirsRemoved << " directories removed" << endl;
        } else {
            cout << "Pruned " << req.targetDir << ": "
                 << stats.dirsRemoved << " empty directories removed" << endl;
        }
        exitCode = MostSevereExitCode(exitCode, StatusToExitCode(res));
    }
    return exitCode;
}
