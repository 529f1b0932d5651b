// Copyright (c) 2021-2022 The PIVX Core developers
// Copyright (c) 2026 The LinkedToken developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or https://www.opensource.org/licenses/mit-license.php.

#include "init.h"

#include "consensus/validation.h"
#include "gmp/loopback.h"
#include "logging.h"
#include "rpc/register.h"
#include "rpc/server.h"
#include "util/system.h"
#include "utilmoneystr.h"
#include "utilstrencodings.h"
#include "utiltime.h"
#include "version.h"

#include <algorithm>
#include <atomic>
#include <initializer_list>
#include <stdio.h>

std::unique_ptr<CLoopbackTransport> g_gmp_transport;
LinkedTokenDomain g_local_domain;
LinkedTokenDomain g_paired_domain;

static std::atomic<bool> fRequestShutdown(false);
static int64_t nStartupTime = 0;

/** Writes every protocol event to the log. */
class CLinkedTokenEventLogger : public CLinkedTokenInterface
{
private:
    const std::string strDomain;

public:
    explicit CLinkedTokenEventLogger(const std::string& strDomainIn) : strDomain(strDomainIn) {}

protected:
    void LinkInitialized(const LinkConfig& link) override
    {
        LogPrintf("[%s] LinkInitialized %s\n", strDomain, link.ToString());
    }
    void TransferSent(const LinkedTransferSent& sent) override
    {
        LogPrint(BCLog::LINKEDTOKEN, "[%s] TransferSent id=%s initiator=%s recipient=%s nonce=%u amount=%s\n", strDomain,
                 sent.id.ToString(), sent.initiator.ToString(), sent.recipient.ToString(), sent.nonce, FormatMoney(sent.amount));
    }
    void TransferReceived(const LinkedTransferReceived& received) override
    {
        LogPrint(BCLog::LINKEDTOKEN, "[%s] TransferReceived id=%s recipient=%s amount=%s\n", strDomain,
                 received.id.ToString(), received.recipient.ToString(), FormatMoney(received.amount));
    }
    void TransferSettled(const LinkedTransferSettled& settled) override
    {
        LogPrint(BCLog::LINKEDTOKEN, "[%s] TransferSettled id=%s outcome=%s refunded=%d\n", strDomain,
                 settled.id.ToString(), OutcomeTypeToString(settled.outcome), settled.fRefunded);
    }
    void UnconfirmedTransferRemoved(const uint256& id, const UnconfirmedTransfer& transfer, const uint160& removedBy) override
    {
        LogPrintf("[%s] UnconfirmedTransferRemoved id=%s initiator=%s amount=%s by=%s\n", strDomain,
                  id.ToString(), transfer.initiator.ToString(), FormatMoney(transfer.amount), removedBy.ToString());
    }
};

static std::unique_ptr<CLinkedTokenEventLogger> pLocalEventLogger;
static std::unique_ptr<CLinkedTokenEventLogger> pPairedEventLogger;

void LinkedTokenDomain::Reset()
{
    token.reset();
    ledger.reset();
    custody.reset();
    accounts.reset();
}

std::string GetLinkedTokenHelpString()
{
    std::string strUsage = HelpMessageGroup("Options:");
    strUsage += HelpMessageOpt("-?", "Print this help message and exit");
    strUsage += HelpMessageOpt("-conf=<file>", strprintf("Specify configuration file (default: %s)", LINKEDTOKEN_CONF_FILENAME));
    strUsage += HelpMessageOpt("-datadir=<dir>", "Specify data directory");
    strUsage += HelpMessageOpt("-dbcache=<n>", strprintf("Ledger database cache size in megabytes (default: %d)", DEFAULT_DB_CACHE_MB));

    strUsage += HelpMessageGroup("Link options:");
    strUsage += HelpMessageOpt("-owner=<address>", "Owner allowed to (re)initialize the link and remove unconfirmed transfers (required)");
    strUsage += HelpMessageOpt("-underlying=<address>", "Underlying token this instance moves across the link (required)");
    strUsage += HelpMessageOpt("-localsubnet=<subnet>", strprintf("Subnet this instance lives in (default: %s)", DEFAULT_LOCAL_SUBNET));
    strUsage += HelpMessageOpt("-localaddress=<address>", "Contract address of this instance (required)");
    strUsage += HelpMessageOpt("-linkedsubnet=<subnet>", "Subnet of the linked instance (required)");
    strUsage += HelpMessageOpt("-linkedcontract=<address>", "Contract address of the linked instance, initializes the link at startup if unset");
    strUsage += HelpMessageOpt("-custody=<lock|burn>", strprintf("How value is captured and released (default: %s)", DEFAULT_CUSTODY));
    strUsage += HelpMessageOpt("-paired", strprintf("Run the linked instance in process, joined by a loopback transport (default: %u)", DEFAULT_PAIRED));

    strUsage += HelpMessageGroup("Debugging/Testing options:");
    strUsage += HelpMessageOpt("-debug=<category>", "Output debugging information (default: 0). "
                                                    "If <category> is not supplied or if <category> = 1, output all debugging information. "
                                                    "<category> can be: " + ListLogCategories() + ".");
    strUsage += HelpMessageOpt("-printtoconsole", "Send trace/debug info to stderr as well as debug.log (stdout carries RPC replies)");
    return strUsage;
}

bool InitError(const std::string& str)
{
    LogPrintf("Error: %s\n", str);
    fprintf(stderr, "Error: %s\n", str.c_str());
    return false;
}

void StartShutdown()
{
    fRequestShutdown = true;
}

bool ShutdownRequested()
{
    return fRequestShutdown;
}

int64_t GetStartupTime()
{
    return nStartupTime;
}

void InitLogging()
{
    LogInstance().m_print_to_file = !gArgs.IsArgNegated("-debuglogfile");
    LogInstance().m_file_path = GetDataDir() / DEFAULT_DEBUGLOGFILE;
    LogInstance().m_print_to_console = gArgs.GetBoolArg("-printtoconsole", false);
    LogInstance().m_log_timestamps = gArgs.GetBoolArg("-logtimestamps", DEFAULT_LOGTIMESTAMPS);

    if (gArgs.IsArgSet("-debug")) {
        // Special-case: if debug=0 or debug=none is set, turn off debugging messages
        const std::vector<std::string> categories = gArgs.GetArgs("-debug");
        if (std::none_of(categories.begin(), categories.end(),
                         [](std::string cat) { return cat == "0" || cat == "none"; })) {
            for (const auto& cat : categories) {
                if (!LogInstance().EnableCategory(cat)) {
                    LogPrintf("Unsupported logging category -debug=%s.\n", cat);
                }
            }
        }
    }

    if (LogInstance().m_print_to_file) {
        if (gArgs.GetBoolArg("-shrinkdebugfile", LogInstance().DefaultShrinkDebugFile())) {
            LogInstance().ShrinkDebugFile();
        }
        if (!LogInstance().OpenDebugLog()) {
            fprintf(stderr, "Could not open debug log file %s\n", LogInstance().m_file_path.string().c_str());
        }
    }

    LogPrintf("LinkedToken version v%d.%d.%d\n", CLIENT_VERSION_MAJOR, CLIENT_VERSION_MINOR, CLIENT_VERSION_REVISION);
    LogPrintf("Using data directory %s\n", GetDataDir().string());
}

std::unique_ptr<ICustodyStrategy> MakeCustodyStrategy(const std::string& strName, CTokenAccounts& accounts, const uint160& vault)
{
    if (strName == "lock")
        return std::unique_ptr<ICustodyStrategy>(new CLockVaultCustody(accounts, vault));
    if (strName == "burn")
        return std::unique_ptr<ICustodyStrategy>(new CBurnMintCustody(accounts));
    return nullptr;
}

bool InitLinkedTokenDomain(LinkedTokenDomain& domain, const std::string& strLedgerName, const std::string& strCustody,
                           const uint160& owner, const IPCAddress& self, const uint160& underlying,
                           const SubnetID& linkedSubnet, CLoopbackTransport& transport,
                           size_t nCacheSize, bool fMemory)
{
    domain.Reset();

    domain.accounts.reset(new CTokenAccounts());

    // Locked value sits on the contract's own account
    uint160 vault;
    if (!self.rawAddress.GetEvmAddress(vault)) {
        return InitError(strprintf("%s is not an EVM contract address", self.ToString()));
    }
    domain.custody = MakeCustodyStrategy(strCustody, *domain.accounts, vault);
    if (!domain.custody) {
        return InitError(strprintf("Unknown custody '%s', expected lock or burn", strCustody));
    }

    if (!InitUnconfirmedTransferDB(domain.ledger, strLedgerName, nCacheSize, fMemory)) {
        return InitError(strprintf("Could not open the ledger database %s", strLedgerName));
    }

    domain.token.reset(new CLinkedToken(owner, self, underlying, linkedSubnet, *domain.custody, transport, *domain.ledger));

    CValidationState state;
    if (!domain.token->LoadLinkConfig(state)) {
        return InitError(strprintf("Stored link configuration of %s is unusable: %s", strLedgerName, FormatStateMessage(state)));
    }

    transport.RegisterReceiver(self, domain.token.get());

    CUnconfirmedTransferDB::Stats stats = domain.ledger->GetStats();
    LogPrintf("LinkedToken: %s at %s, custody=%s, %u unconfirmed transfers (%s%s pending)\n", strLedgerName,
              self.ToString(), domain.custody->GetName(), stats.pendingCount, stats.fAmountCapped ? "at least " : "",
              FormatMoney(stats.pendingAmount));
    return true;
}

static bool GetAddressArg(const std::string& strArg, uint160& address)
{
    std::string strHex = StripHexPrefix(gArgs.GetArg(strArg, ""));
    if (strHex.size() != 40 || !IsHex(strHex)) {
        return InitError(strprintf("Invalid or missing %s=<address>, expected 20 byte hex", strArg));
    }
    address = uint160S(strHex);
    if (address.IsNull()) {
        return InitError(strprintf("%s must not be the zero address", strArg));
    }
    return true;
}

static bool GetSubnetArg(const std::string& strArg, const std::string& strDefault, SubnetID& subnet)
{
    const std::string strValue = gArgs.GetArg(strArg, strDefault);
    if (!SubnetID::FromString(strValue, subnet)) {
        return InitError(strprintf("Invalid %s=%s, expected /r<chainid>/<0xaddr>...", strArg, strValue));
    }
    return true;
}

static bool EnsureLinkInitialized(CLinkedToken& token, const uint160& linkedContract)
{
    LinkConfig link = token.GetLinkConfig();
    if (link.IsInitialized()) {
        if (link.linkedContract != linkedContract) {
            LogPrintf("LinkedToken: WARNING: -linkedcontract=%s ignored, link already points at %s (use reinitializelink)\n",
                      linkedContract.ToString(), link.linkedContract.ToString());
        }
        return true;
    }

    CValidationState state;
    if (!token.InitializeLink(token.GetOwner(), linkedContract, state)) {
        return InitError(strprintf("Could not initialize link: %s", FormatStateMessage(state)));
    }
    return true;
}

bool AppInitMain()
{
    nStartupTime = GetTime();

    uint160 owner, underlying, localAddress;
    if (!GetAddressArg("-owner", owner) ||
        !GetAddressArg("-underlying", underlying) ||
        !GetAddressArg("-localaddress", localAddress)) {
        return false;
    }

    SubnetID localSubnet, linkedSubnet;
    if (!GetSubnetArg("-localsubnet", DEFAULT_LOCAL_SUBNET, localSubnet))
        return false;
    if (!gArgs.IsArgSet("-linkedsubnet"))
        return InitError("Missing -linkedsubnet=<subnet>");
    if (!GetSubnetArg("-linkedsubnet", "", linkedSubnet))
        return false;
    if (linkedSubnet == localSubnet)
        return InitError("-linkedsubnet must differ from -localsubnet");

    const bool fPaired = gArgs.GetBoolArg("-paired", DEFAULT_PAIRED);
    uint160 linkedContract;
    if ((gArgs.IsArgSet("-linkedcontract") || fPaired) && !GetAddressArg("-linkedcontract", linkedContract))
        return false;

    const std::string strCustody = gArgs.GetArg("-custody", DEFAULT_CUSTODY);
    int64_t nCacheMB = gArgs.GetArg("-dbcache", DEFAULT_DB_CACHE_MB);
    if (nCacheMB < 1) nCacheMB = 1;
    const size_t nCacheSize = (size_t)nCacheMB << 20;

    g_gmp_transport.reset(new CLoopbackTransport());

    const IPCAddress localSelf = IPCAddress::FromEvm(localSubnet, localAddress);
    if (!InitLinkedTokenDomain(g_local_domain, DEFAULT_LEDGER_DB_NAME, strCustody, owner, localSelf,
                               underlying, linkedSubnet, *g_gmp_transport, nCacheSize, false)) {
        return false;
    }
    pLocalEventLogger.reset(new CLinkedTokenEventLogger("local"));
    g_local_domain.token->Signals().RegisterInterface(pLocalEventLogger.get());

    if (!linkedContract.IsNull() && !EnsureLinkInitialized(*g_local_domain.token, linkedContract))
        return false;

    if (fPaired) {
        // The replica mints what the local side locks, and the other way round
        const std::string strPairedCustody = strCustody == "lock" ? "burn" : "lock";
        const IPCAddress pairedSelf = IPCAddress::FromEvm(linkedSubnet, linkedContract);
        if (!InitLinkedTokenDomain(g_paired_domain, PAIRED_LEDGER_DB_NAME, strPairedCustody, owner, pairedSelf,
                                   underlying, localSubnet, *g_gmp_transport, nCacheSize, false)) {
            return false;
        }
        pPairedEventLogger.reset(new CLinkedTokenEventLogger("paired"));
        g_paired_domain.token->Signals().RegisterInterface(pPairedEventLogger.get());

        if (!EnsureLinkInitialized(*g_paired_domain.token, localAddress))
            return false;
    }

    RegisterAllLinkedTokenRPCCommands(tableRPC);

    LogPrintf("LinkedToken: started, owner=%s underlying=%s paired=%d\n", owner.ToString(), underlying.ToString(), fPaired);
    return true;
}

void Shutdown()
{
    LogPrintf("Shutdown: In progress...\n");

    for (LinkedTokenDomain* domain : {&g_paired_domain, &g_local_domain}) {
        if (!domain->IsActive()) continue;
        if (g_gmp_transport) {
            g_gmp_transport->UnregisterReceiver(domain->token->GetAddress());
        }
        domain->token->Signals().UnregisterAll();
        if (!domain->ledger->Sync()) {
            LogPrintf("Shutdown: failed to sync ledger of %s\n", domain->token->GetAddress().ToString());
        }
        domain->Reset();
    }
    pPairedEventLogger.reset();
    pLocalEventLogger.reset();

    if (g_gmp_transport && g_gmp_transport->GetQueueSize() > 0) {
        LogPrintf("Shutdown: %u undelivered envelopes discarded\n", g_gmp_transport->GetQueueSize());
    }
    g_gmp_transport.reset();

    LogPrintf("Shutdown: done\n");
}
