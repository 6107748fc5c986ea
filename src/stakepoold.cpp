// Copyright (c) 2025 The StakePool developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "fs.h"
#include "logging.h"
#include "pool/pool_errors.h"
#include "pool/pool_events.h"
#include "pool/pool_ledger.h"
#include "pool/pool_params.h"
#include "pool/pool_statedb.h"
#include "pool/pool_vault.h"
#include "rpc/pool.h"
#include "rpc/server.h"
#include "util/system.h"
#include "utilmoneystr.h"

#include <algorithm>
#include <cstdio>
#include <cstdlib>
#include <iostream>
#include <memory>
#include <stdexcept>
#include <string>

static const bool DEFAULT_PRINTTOCONSOLE = false;
static const bool DEFAULT_DB = true;
static const bool DEFAULT_PRINTEVENTS = false;

static void PrintUsage()
{
    std::cout <<
        "Usage:  stakepoold [options]\n"
        "\n"
        "Reads one JSON request per line on stdin, writes one JSON reply per line on stdout.\n"
        "\n"
        "Options:\n"
        "  -?                     This help message\n"
        "  -conf=<file>           Specify configuration file (default: " << STAKEPOOL_CONF_FILENAME << ")\n"
        "  -datadir=<dir>         Specify data directory\n"
        "  -network=<net>         Pool parameters to use: main, test or regtest (default: main)\n"
        "  -maxdeposit=<amt>      Deposit cap of a newly created pool\n"
        "  -admin=<address>       Admin of a newly created pool\n"
        "  -pauser=<address>      Pause operator of a newly created pool\n"
        "  -nodb                  Keep the pool in memory only\n"
        "  -dbcache=<n>           Database cache size in MiB\n"
        "  -printevents           Write every pool event as a JSON line before the reply\n"
        "  -debug=<category>      Output debugging information (" << ListLogCategories() << ")\n"
        "  -printtoconsole        Send trace/debug info to console instead of debug.log file\n";
}

/** Writes committed events to stdout as {"event": ...} lines */
class CStdoutEventPrinter : public CPoolEventListener
{
public:
    void PoolEvent(const CPoolEvent& event) override
    {
        std::cout << PoolEventToJSON(event).write() << std::endl;
    }
};

static bool InitLogging()
{
    LogInstance().m_print_to_console = gArgs.GetBoolArg("-printtoconsole", DEFAULT_PRINTTOCONSOLE);
    LogInstance().m_print_to_file = !LogInstance().m_print_to_console;
    LogInstance().m_file_path = GetDataDir() / DEFAULT_DEBUGLOGFILE;

    for (const std::string& cat : gArgs.GetArgs("-debug")) {
        if (!LogInstance().EnableCategory(cat)) {
            fprintf(stderr, "Warning: Unsupported logging category -debug=%s.\n", cat.c_str());
        }
    }

    if (!LogInstance().StartLogging()) {
        fprintf(stderr, "Error: Could not open debug log file %s\n", LogInstance().m_file_path.string().c_str());
        return false;
    }
    return true;
}

static bool AppInit(int argc, char* argv[])
{
    std::string error;
    if (!gArgs.ParseParameters(argc, argv, error)) {
        fprintf(stderr, "Error parsing command line arguments: %s\n", error.c_str());
        return false;
    }

    if (gArgs.IsArgSet("-?") || gArgs.IsArgSet("-h") || gArgs.IsArgSet("-help")) {
        PrintUsage();
        return true;
    }

    if (gArgs.IsArgSet("-datadir") && !fs::is_directory(fs::path(gArgs.GetArg("-datadir", "")))) {
        fprintf(stderr, "Error: Specified data directory \"%s\" does not exist.\n", gArgs.GetArg("-datadir", "").c_str());
        return false;
    }
    if (!gArgs.ReadConfigFile(gArgs.GetArg("-conf", STAKEPOOL_CONF_FILENAME), error)) {
        fprintf(stderr, "Error reading configuration file: %s\n", error.c_str());
        return false;
    }

    try {
        SelectPoolParams(gArgs.GetArg("-network", CPoolParams::MAIN));
    } catch (const std::exception& e) {
        fprintf(stderr, "Error: %s\n", e.what());
        return false;
    }
    const CPoolParams& params = PoolParams();

    ClearDatadirCache();
    fs::create_directories(GetDataDir());

    if (!InitLogging()) {
        return false;
    }
    LogPrintf("stakepoold starting, network=%s datadir=%s\n", params.NetworkIDString(), GetDataDir().string());

    CAmount nCap = params.DefaultDepositCap();
    if (gArgs.IsArgSet("-maxdeposit") && !ParseMoney(gArgs.GetArg("-maxdeposit", ""), nCap)) {
        fprintf(stderr, "Error: Invalid amount for -maxdeposit=<amount>: '%s'\n", gArgs.GetArg("-maxdeposit", "").c_str());
        return false;
    }
    const std::string strAdmin = gArgs.GetArg("-admin", params.DefaultAdmin());
    const std::string strPauser = gArgs.GetArg("-pauser", params.DefaultPauser());

    std::unique_ptr<CPoolStateDB> pdb;
    // -nodb arrives as -db=0
    if (gArgs.GetBoolArg("-db", DEFAULT_DB)) {
        const int64_t nCacheMiB = gArgs.GetArg("-dbcache", params.DefaultDBCache());
        try {
            pdb.reset(new CPoolStateDB(GetDataDir() / "pool", (size_t)std::max<int64_t>(nCacheMiB, 1) << 20));
        } catch (const dbwrapper_error& e) {
            fprintf(stderr, "Error opening pool database: %s\n", e.what());
            return false;
        }
    }

    CInMemoryVault vault;
    vault.SetHolder(params.PoolAddress());
    // The vault lives in the same database, the pool refuses to load against any other copy
    if (pdb && pdb->ExistsVault() && !pdb->ReadVault(vault)) {
        fprintf(stderr, "Error: unable to load the vault from the pool database\n");
        return false;
    }

    CStakePool pool(vault, params.PoolAddress(), pdb.get());
    CPoolValidationState vstate;
    if (!pool.Init(nCap, strAdmin, strPauser, vstate)) {
        fprintf(stderr, "Error: unable to start the pool: %s\n", vstate.ToString().c_str());
        return false;
    }

    CStdoutEventPrinter printer;
    if (gArgs.GetBoolArg("-printevents", DEFAULT_PRINTEVENTS)) {
        pool.RegisterListener(&printer);
    }

    CPoolRPCTable table;
    RegisterPoolRPCCommands(table);

    PoolRPCContext context;
    context.pool = &pool;
    context.vault = &vault;

    std::string strLine;
    while (std::getline(std::cin, strLine)) {
        if (strLine.empty()) continue;
        const UniValue reply = ExecuteRequestLine(table, context, strLine);
        std::cout << reply.write() << std::endl;
        if (pdb && !pdb->WriteVault(vault)) {
            fprintf(stderr, "Error: unable to write the vault to the pool database\n");
            pool.UnregisterListener(&printer);
            return false;
        }
    }

    pool.UnregisterListener(&printer);
    LogPrintf("stakepoold shutting down\n");
    return true;
}

int main(int argc, char* argv[])
{
    try {
        return AppInit(argc, argv) ? EXIT_SUCCESS : EXIT_FAILURE;
    } catch (const std::exception& e) {
        fprintf(stderr, "EXCEPTION: %s\n", e.what());
    }
    return EXIT_FAILURE;
}
