// Copyright (c) 2009-2010 Satoshi Nakamoto
// Copyright (c) 2009-2015 The Bitcoin developers
// Copyright (c) 2026 The LinkedToken developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "fs.h"
#include "init.h"
#include "logging.h"
#include "rpc/protocol.h"
#include "rpc/server.h"
#include "util/system.h"
#include "version.h"

#include <iostream>
#include <stdio.h>
#include <string>

#include <univalue.h>

/* Introduction text for doxygen: */

/*! \mainpage Developer documentation
 *
 * \section intro_sec Introduction
 *
 * linkedtokend runs a linked token instance on a local subnet and, with
 * -paired, its counterpart on the linked subnet in the same process. Requests
 * are JSON-RPC objects read one per line from stdin, replies are written one
 * per line to stdout.
 */

static void ServeRequests()
{
    std::string strLine;
    while (!ShutdownRequested() && std::getline(std::cin, strLine)) {
        if (strLine.empty())
            continue;

        UniValue req;
        if (!req.read(strLine) || !req.isObject()) {
            UniValue reply = JSONRPCReplyObj(NullUniValue, JSONRPCError(RPC_PARSE_ERROR, "Parse error"), NullUniValue);
            std::cout << reply.write() << std::endl;
            continue;
        }
        std::cout << JSONRPCExecOne(req) << std::flush;
    }
}

static bool AppInit(int argc, char* argv[])
{
    bool fRet = false;

    std::string error;
    if (!gArgs.ParseParameters(argc, argv, error)) {
        fprintf(stderr, "Error parsing command line arguments: %s\n", error.c_str());
        return false;
    }

    // Process help and version before taking care about datadir
    if (gArgs.IsArgSet("-?") || gArgs.IsArgSet("-h") || gArgs.IsArgSet("-help") || gArgs.IsArgSet("-version")) {
        std::string strUsage = strprintf("LinkedToken Daemon version v%d.%d.%d\n",
                                         CLIENT_VERSION_MAJOR, CLIENT_VERSION_MINOR, CLIENT_VERSION_REVISION);
        if (!gArgs.IsArgSet("-version")) {
            strUsage += "\nUsage:\n  linkedtokend [options]    Start LinkedToken Daemon\n";
            strUsage += "\n" + GetLinkedTokenHelpString();
        }
        fprintf(stdout, "%s", strUsage.c_str());
        return true;
    }

    try {
        if (!fs::is_directory(GetDataDir())) {
            fprintf(stderr, "Error: Specified data directory \"%s\" does not exist.\n", gArgs.GetArg("-datadir", "").c_str());
            return false;
        }
        if (!gArgs.ReadConfigFile(gArgs.GetArg("-conf", LINKEDTOKEN_CONF_FILENAME), error)) {
            fprintf(stderr, "Error reading configuration file: %s\n", error.c_str());
            return false;
        }

        InitLogging();
        fRet = AppInitMain();
        if (fRet) {
            ServeRequests();
        }
    } catch (const std::exception& e) {
        LogPrintf("EXCEPTION: %s\n", e.what());
        fprintf(stderr, "EXCEPTION: %s\n", e.what());
        fRet = false;
    }

    Shutdown();
    return fRet;
}

int main(int argc, char* argv[])
{
    return (AppInit(argc, argv) ? EXIT_SUCCESS : EXIT_FAILURE);
}
