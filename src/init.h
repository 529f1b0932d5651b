// Copyright (c) 2021-2022 The PIVX Core developers
// Copyright (c) 2026 The LinkedToken developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or https://www.opensource.org/licenses/mit-license.php.

#ifndef LINKEDTOKEN_INIT_H
#define LINKEDTOKEN_INIT_H

#include "gmp/subnet.h"
#include "linkedtoken/custody.h"
#include "linkedtoken/ledgerdb.h"
#include "linkedtoken/linkedtoken.h"

#include <memory>
#include <stdint.h>
#include <string>

class CLoopbackTransport;

static const int64_t DEFAULT_DB_CACHE_MB = 16;
static const char* const DEFAULT_LOCAL_SUBNET = "/r314159";
static const char* const DEFAULT_CUSTODY = "lock";
static const bool DEFAULT_PAIRED = false;
static const char* const PAIRED_LEDGER_DB_NAME = "paired_ledger";

/**
 * One linked token instance with everything it owns. Members are
 * destroyed in reverse order, token first.
 */
struct LinkedTokenDomain
{
    std::unique_ptr<CTokenAccounts> accounts;
    std::unique_ptr<ICustodyStrategy> custody;
    std::unique_ptr<CUnconfirmedTransferDB> ledger;
    std::unique_ptr<CLinkedToken> token;

    bool IsActive() const { return token != nullptr; }
    void Reset();
};

extern std::unique_ptr<CLoopbackTransport> g_gmp_transport;
extern LinkedTokenDomain g_local_domain;
//! Replica on the linked subnet, only with -paired
extern LinkedTokenDomain g_paired_domain;

std::string GetLinkedTokenHelpString();

/** Build a custody strategy by name ("lock" or "burn"), nullptr if unknown. */
std::unique_ptr<ICustodyStrategy> MakeCustodyStrategy(const std::string& strName, CTokenAccounts& accounts, const uint160& vault);

/**
 * Assemble a domain: accounts, custody, ledger at <datadir>/<strLedgerName>,
 * and the token registered on the transport at `self`.
 */
bool InitLinkedTokenDomain(LinkedTokenDomain& domain, const std::string& strLedgerName, const std::string& strCustody,
                           const uint160& owner, const IPCAddress& self, const uint160& underlying,
                           const SubnetID& linkedSubnet, CLoopbackTransport& transport,
                           size_t nCacheSize, bool fMemory);

void InitLogging();
bool AppInitMain();
void Shutdown();

void StartShutdown();
bool ShutdownRequested();
int64_t GetStartupTime();

/** Print to stderr and the log, returns false. */
bool InitError(const std::string& str);

#endif // LINKEDTOKEN_INIT_H
