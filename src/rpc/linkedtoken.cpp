// Copyright (c) 2026 The LinkedToken developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "consensus/validation.h"
#include "core_io.h"
#include "gmp/abi.h"
#include "init.h"
#include "linkedtoken/ledgerdb.h"
#include "linkedtoken/linkedtoken.h"
#include "rpc/server.h"
#include "rpc/util.h"
#include "utilmoneystr.h"
#include "utilstrencodings.h"

#include <univalue.h>

UniValue getlinkinfo(const JSONRPCRequest& request)
{
    if (request.fHelp || request.params.size() > 1) {
        throw std::runtime_error(
            "getlinkinfo ( paired )\n"
            "\nReturns the link configuration of this linked token instance.\n"
            "\nArguments:\n"
            "1. paired      (boolean, optional, default=false) Query the in-process paired instance\n"
            "\nResult:\n"
            "{\n"
            "  \"owner\": \"0x...\",           (string) Owner allowed to administer the link\n"
            "  \"address\": {...},           (object) Subnet and address of this instance\n"
            "  \"underlying\": \"0x...\",      (string) Underlying token\n"
            "  \"linkedsubnet\": \"/r...\",    (string) Subnet of the linked instance\n"
            "  \"linkedcontract\": \"0x...\",  (string) Linked contract (zero until initialized)\n"
            "  \"initialized\": true|false,  (boolean) Whether transfers are enabled\n"
            "  \"custody\": \"lock|burn\",     (string) Capture/release strategy\n"
            "  \"receiveselector\": \"...\"    (string) Selector of receiveLinked(address,uint256)\n"
            "}\n"
            "\nExamples:\n"
            + HelpExampleCli("getlinkinfo", "")
            + HelpExampleRpc("getlinkinfo", "true")
        );
    }

    LinkedTokenDomain& domain = DomainFromRequest(request, 0);
    CLinkedToken& token = *domain.token;

    UniValue result(UniValue::VOBJ);
    result.pushKV("owner", token.GetOwner().ToString());
    UniValue address(UniValue::VOBJ);
    IPCAddressToUniv(token.GetAddress(), address);
    result.pushKV("address", address);
    LinkConfigToUniv(token.GetLinkConfig(), result);
    result.pushKV("custody", token.GetCustody().GetName());
    result.pushKV("receiveselector", HexStr(CLinkedToken::GetReceiveSelector()));
    return result;
}

UniValue initializelink(const JSONRPCRequest& request)
{
    if (request.fHelp || request.params.size() < 2 || request.params.size() > 3) {
        throw std::runtime_error(
            "initializelink \"caller\" \"linkedcontract\" ( paired )\n"
            "\nSet the linked contract. Owner only, can only be done once.\n"
            "\nArguments:\n"
            "1. caller          (string, required) Address performing the call\n"
            "2. linkedcontract  (string, required) Contract address of the linked instance\n"
            "3. paired          (boolean, optional, default=false) Act on the paired instance\n"
            "\nResult:\n"
            "{ link configuration, see getlinkinfo }\n"
            "\nExamples:\n"
            + HelpExampleCli("initializelink", "\"0x1111...\" \"0x2222...\"")
        );
    }

    const uint160 caller = ParseAddressV(request.params[0], "caller");
    const uint160 linkedContract = ParseAddressV(request.params[1], "linkedcontract");
    LinkedTokenDomain& domain = DomainFromRequest(request, 2);

    CValidationState state;
    ThrowIfRejected(domain.token->InitializeLink(caller, linkedContract, state), state);

    UniValue result(UniValue::VOBJ);
    LinkConfigToUniv(domain.token->GetLinkConfig(), result);
    return result;
}

UniValue reinitializelink(const JSONRPCRequest& request)
{
    if (request.fHelp || request.params.size() < 2 || request.params.size() > 4) {
        throw std::runtime_error(
            "reinitializelink \"caller\" \"linkedcontract\" ( force paired )\n"
            "\nPoint the link at a different contract. Owner only.\n"
            "Refused while unconfirmed transfers are pending unless force is set:\n"
            "their results would be checked against the new contract.\n"
            "\nArguments:\n"
            "1. caller          (string, required) Address performing the call\n"
            "2. linkedcontract  (string, required) New linked contract address\n"
            "3. force           (boolean, optional, default=false) Proceed with transfers in flight\n"
            "4. paired          (boolean, optional, default=false) Act on the paired instance\n"
            "\nResult:\n"
            "{ link configuration, see getlinkinfo }\n"
            "\nExamples:\n"
            + HelpExampleCli("reinitializelink", "\"0x1111...\" \"0x3333...\" true")
        );
    }

    const uint160 caller = ParseAddressV(request.params[0], "caller");
    const uint160 linkedContract = ParseAddressV(request.params[1], "linkedcontract");
    bool fForce = false;
    if (request.params.size() > 2 && !request.params[2].isNull())
        fForce = request.params[2].get_bool();
    LinkedTokenDomain& domain = DomainFromRequest(request, 3);

    CValidationState state;
    ThrowIfRejected(domain.token->ReinitializeLink(caller, linkedContract, fForce, state), state);

    UniValue result(UniValue::VOBJ);
    LinkConfigToUniv(domain.token->GetLinkConfig(), result);
    return result;
}

UniValue linkedtransfer(const JSONRPCRequest& request)
{
    if (request.fHelp || request.params.size() < 3 || request.params.size() > 4) {
        throw std::runtime_error(
            "linkedtransfer \"from\" \"recipient\" amount ( paired )\n"
            "\nCapture amount from an account and send it to recipient on the linked subnet.\n"
            "The transfer stays unconfirmed until the linked side reports a result.\n"
            "\nArguments:\n"
            "1. from        (string, required) Account the value is captured from\n"
            "2. recipient   (string, required) Recipient on the linked subnet\n"
            "3. amount      (numeric, required) Amount in base units\n"
            "4. paired      (boolean, optional, default=false) Send from the paired instance\n"
            "\nResult:\n"
            "{\n"
            "  \"id\": \"0x...\",        (string) Envelope id, key of the unconfirmed transfer\n"
            "  \"nonce\": n,           (numeric) Transport nonce\n"
            "  \"amount\": n,          (numeric) Amount captured\n"
            "  \"envelope\": {...}     (object) The dispatched envelope\n"
            "}\n"
            "\nExamples:\n"
            + HelpExampleCli("linkedtransfer", "\"0xaaaa...\" \"0xbbbb...\" 100")
        );
    }

    const uint160 from = ParseAddressV(request.params[0], "from");
    const uint160 recipient = ParseAddressV(request.params[1], "recipient");
    const CAmount amount = AmountFromValue(request.params[2]);
    LinkedTokenDomain& domain = DomainFromRequest(request, 3);

    IpcEnvelope envelope;
    CValidationState state;
    ThrowIfRejected(domain.token->LinkedTransfer(from, recipient, amount, envelope, state), state);

    UniValue result(UniValue::VOBJ);
    result.pushKV("id", envelope.GetHash().ToString());
    result.pushKV("nonce", (int64_t)envelope.nonce);
    result.pushKV("amount", ValueFromAmount(amount));
    UniValue env(UniValue::VOBJ);
    EnvelopeToUniv(envelope, env);
    result.pushKV("envelope", env);
    return result;
}

UniValue getunconfirmedtransfer(const JSONRPCRequest& request)
{
    if (request.fHelp || request.params.size() < 1 || request.params.size() > 2) {
        throw std::runtime_error(
            "getunconfirmedtransfer \"id\" ( paired )\n"
            "\nReturns a pending transfer by envelope id.\n"
            "\nArguments:\n"
            "1. id          (string, required) Envelope id returned by linkedtransfer\n"
            "2. paired      (boolean, optional, default=false) Query the paired instance\n"
            "\nResult:\n"
            "{\n"
            "  \"id\": \"0x...\",          (string) Envelope id\n"
            "  \"initiator\": \"0x...\",   (string) Account the value was captured from\n"
            "  \"amount\": n             (numeric) Amount captured\n"
            "}\n"
            "\nExamples:\n"
            + HelpExampleCli("getunconfirmedtransfer", "\"0x5f3a...\"")
        );
    }

    const uint256 id = ParseHashV(request.params[0], "id");
    LinkedTokenDomain& domain = DomainFromRequest(request, 1);

    UnconfirmedTransfer transfer;
    if (!domain.token->GetUnconfirmedTransfer(id, transfer)) {
        throw JSONRPCError(RPC_LINK_NOT_FOUND, "No unconfirmed transfer " + id.ToString());
    }

    UniValue result(UniValue::VOBJ);
    UnconfirmedTransferToUniv(id, transfer, result);
    return result;
}

UniValue listunconfirmedtransfers(const JSONRPCRequest& request)
{
    if (request.fHelp || request.params.size() > 2) {
        throw std::runtime_error(
            "listunconfirmedtransfers ( \"initiator\" paired )\n"
            "\nList pending transfers, optionally only those of one initiator.\n"
            "\nArguments:\n"
            "1. initiator   (string, optional) Only list transfers captured from this account\n"
            "2. paired      (boolean, optional, default=false) Query the paired instance\n"
            "\nResult:\n"
            "[ { \"id\": ..., \"initiator\": ..., \"amount\": ... }, ... ]\n"
            "\nExamples:\n"
            + HelpExampleCli("listunconfirmedtransfers", "")
            + HelpExampleCli("listunconfirmedtransfers", "\"0xaaaa...\"")
        );
    }

    LinkedTokenDomain& domain = DomainFromRequest(request, 1);
    CUnconfirmedTransferDB& ledger = domain.token->GetLedger();

    UniValue result(UniValue::VARR);
    if (request.params.size() > 0 && !request.params[0].isNull()) {
        const uint160 initiator = ParseAddressV(request.params[0], "initiator");
        std::vector<uint256> ids;
        ledger.GetByInitiator(initiator, ids);
        for (const uint256& id : ids) {
            UnconfirmedTransfer transfer;
            if (!ledger.ReadTransfer(id, transfer))
                continue;  // Settled since the index was read
            UniValue entry(UniValue::VOBJ);
            UnconfirmedTransferToUniv(id, transfer, entry);
            result.push_back(entry);
        }
        return result;
    }

    ledger.ForEachTransfer([&](const uint256& id, const UnconfirmedTransfer& transfer) {
        UniValue entry(UniValue::VOBJ);
        UnconfirmedTransferToUniv(id, transfer, entry);
        result.push_back(entry);
        return true;
    });
    return result;
}

UniValue removeunconfirmedtransfer(const JSONRPCRequest& request)
{
    if (request.fHelp || request.params.size() < 2 || request.params.size() > 3) {
        throw std::runtime_error(
            "removeunconfirmedtransfer \"caller\" \"id\" ( paired )\n"
            "\nDrop a pending transfer without refunding it. Owner only.\n"
            "For transfers whose result can never arrive. The captured value stays captured.\n"
            "\nArguments:\n"
            "1. caller      (string, required) Address performing the call\n"
            "2. id          (string, required) Envelope id of the transfer\n"
            "3. paired      (boolean, optional, default=false) Act on the paired instance\n"
            "\nResult:\n"
            "{ the removed transfer, see getunconfirmedtransfer }\n"
            "\nExamples:\n"
            + HelpExampleCli("removeunconfirmedtransfer", "\"0x1111...\" \"0x5f3a...\"")
        );
    }

    const uint160 caller = ParseAddressV(request.params[0], "caller");
    const uint256 id = ParseHashV(request.params[1], "id");
    LinkedTokenDomain& domain = DomainFromRequest(request, 2);

    UnconfirmedTransfer transfer;
    CValidationState state;
    ThrowIfRejected(domain.token->RemoveUnconfirmedTransfer(caller, id, transfer, state), state);

    UniValue result(UniValue::VOBJ);
    UnconfirmedTransferToUniv(id, transfer, result);
    return result;
}

UniValue getlinkstats(const JSONRPCRequest& request)
{
    if (request.fHelp || request.params.size() > 1) {
        throw std::runtime_error(
            "getlinkstats ( paired )\n"
            "\nReturns ledger and supply statistics.\n"
            "\nArguments:\n"
            "1. paired      (boolean, optional, default=false) Query the paired instance\n"
            "\nResult:\n"
            "{\n"
            "  \"pending\": n,          (numeric) Unconfirmed transfers\n"
            "  \"pending_amount\": n,   (numeric) Value captured by unconfirmed transfers\n"
            "  \"pending_amount_capped\": true|false, (boolean) pending_amount stopped at the largest amount\n"
            "  \"total_supply\": n,     (numeric) Supply of the underlying on this domain\n"
            "  \"custody\": \"...\"       (string) Capture/release strategy\n"
            "}\n"
            "\nExamples:\n"
            + HelpExampleCli("getlinkstats", "")
        );
    }

    LinkedTokenDomain& domain = DomainFromRequest(request, 0);
    const CUnconfirmedTransferDB::Stats stats = domain.ledger->GetStats();

    UniValue result(UniValue::VOBJ);
    result.pushKV("pending", (int64_t)stats.pendingCount);
    result.pushKV("pending_amount", ValueFromAmount(stats.pendingAmount));
    result.pushKV("pending_amount_capped", stats.fAmountCapped);
    result.pushKV("total_supply", ValueFromAmount(domain.accounts->GetTotalSupply()));
    result.pushKV("custody", domain.custody->GetName());
    return result;
}

// Register commands
static const CRPCCommand commands[] = {
    //  category        name                          actor                       okSafeMode  argNames
    { "linkedtoken",   "getlinkinfo",                &getlinkinfo,               true,       {"paired"} },
    { "linkedtoken",   "initializelink",             &initializelink,            false,      {"caller", "linkedcontract", "paired"} },
    { "linkedtoken",   "reinitializelink",           &reinitializelink,          false,      {"caller", "linkedcontract", "force", "paired"} },
    { "linkedtoken",   "linkedtransfer",             &linkedtransfer,            false,      {"from", "recipient", "amount", "paired"} },
    { "linkedtoken",   "getunconfirmedtransfer",     &getunconfirmedtransfer,    true,       {"id", "paired"} },
    { "linkedtoken",   "listunconfirmedtransfers",   &listunconfirmedtransfers,  true,       {"initiator", "paired"} },
    { "linkedtoken",   "removeunconfirmedtransfer",  &removeunconfirmedtransfer, false,      {"caller", "id", "paired"} },
    { "linkedtoken",   "getlinkstats",               &getlinkstats,              true,       {"paired"} },
};

void RegisterLinkedTokenRPCCommands(CRPCTable& t)
{
    for (const auto& cmd : commands) {
        t.appendCommand(cmd.name, &cmd);
    }
}
