// Copyright (c) 2026 The LinkedToken developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "consensus/validation.h"
#include "core_io.h"
#include "gmp/loopback.h"
#include "init.h"
#include "logging.h"
#include "rpc/server.h"
#include "rpc/util.h"
#include "utilmoneystr.h"

#include <univalue.h>

UniValue getbalance(const JSONRPCRequest& request)
{
    if (request.fHelp || request.params.size() < 1 || request.params.size() > 2) {
        throw std::runtime_error(
            "getbalance \"address\" ( paired )\n"
            "\nReturns the underlying token balance of an account.\n"
            "\nArguments:\n"
            "1. address     (string, required) Account address\n"
            "2. paired      (boolean, optional, default=false) Query the paired instance\n"
            "\nResult:\n"
            "n              (numeric) Balance in base units\n"
            "\nExamples:\n"
            + HelpExampleCli("getbalance", "\"0xaaaa...\"")
        );
    }

    const uint160 address = ParseAddressV(request.params[0], "address");
    LinkedTokenDomain& domain = DomainFromRequest(request, 1);
    return ValueFromAmount(domain.accounts->GetBalance(address));
}

UniValue mintbalance(const JSONRPCRequest& request)
{
    if (request.fHelp || request.params.size() < 2 || request.params.size() > 3) {
        throw std::runtime_error(
            "mintbalance \"address\" amount ( paired )\n"
            "\nCredit an account with new underlying tokens. Testing aid for the\n"
            "in-process token, there is no external supply.\n"
            "\nArguments:\n"
            "1. address     (string, required) Account to credit\n"
            "2. amount      (numeric, required) Amount in base units\n"
            "3. paired      (boolean, optional, default=false) Mint on the paired instance\n"
            "\nResult:\n"
            "n              (numeric) New balance\n"
            "\nExamples:\n"
            + HelpExampleCli("mintbalance", "\"0xaaaa...\" 1000")
        );
    }

    const uint160 address = ParseAddressV(request.params[0], "address");
    const CAmount amount = AmountFromValue(request.params[1]);
    LinkedTokenDomain& domain = DomainFromRequest(request, 2);

    CValidationState state;
    ThrowIfRejected(domain.accounts->Mint(address, amount, state), state);
    LogPrint(BCLog::RPC, "mintbalance: %s +%s\n", address.ToString(), FormatMoney(amount));
    return ValueFromAmount(domain.accounts->GetBalance(address));
}

UniValue deliverenvelopes(const JSONRPCRequest& request)
{
    if (request.fHelp || request.params.size() > 1) {
        throw std::runtime_error(
            "deliverenvelopes ( count )\n"
            "\nDeliver queued envelopes in dispatch order. Results produced by\n"
            "delivered calls are queued behind them.\n"
            "\nArguments:\n"
            "1. count       (numeric, optional, default=all) Maximum envelopes to deliver\n"
            "\nResult:\n"
            "{\n"
            "  \"delivered\": n,   (numeric) Envelopes handled in this call\n"
            "  \"queued\": n,      (numeric) Envelopes still waiting\n"
            "  \"accepted\": n,    (numeric) Calls accepted since startup\n"
            "  \"rejected\": n     (numeric) Calls rejected since startup\n"
            "}\n"
            "\nExamples:\n"
            + HelpExampleCli("deliverenvelopes", "")
            + HelpExampleCli("deliverenvelopes", "1")
        );
    }

    if (!g_gmp_transport) {
        throw JSONRPCError(RPC_LINK_NOT_INITIALIZED, "Transport not running");
    }

    size_t nDelivered = 0;
    if (request.params.size() > 0 && !request.params[0].isNull()) {
        const int nCount = request.params[0].get_int();
        if (nCount < 0) {
            throw JSONRPCError(RPC_INVALID_PARAMETER, "count must be non-negative");
        }
        for (int i = 0; i < nCount && g_gmp_transport->GetQueueSize() > 0; i++) {
            g_gmp_transport->DeliverNext();
            nDelivered++;
        }
    } else {
        nDelivered = g_gmp_transport->DeliverAll();
    }

    UniValue result(UniValue::VOBJ);
    result.pushKV("delivered", (int64_t)nDelivered);
    result.pushKV("queued", (int64_t)g_gmp_transport->GetQueueSize());
    result.pushKV("accepted", (int64_t)g_gmp_transport->GetDeliveredCount());
    result.pushKV("rejected", (int64_t)g_gmp_transport->GetRejectedCount());
    return result;
}

UniValue listqueuedenvelopes(const JSONRPCRequest& request)
{
    if (request.fHelp || request.params.size() > 0) {
        throw std::runtime_error(
            "listqueuedenvelopes\n"
            "\nReturns the next envelope waiting for delivery, if any.\n"
            "\nResult:\n"
            "{\n"
            "  \"queued\": n,      (numeric) Envelopes waiting\n"
            "  \"next\": {...}     (object, optional) Next envelope to be delivered\n"
            "}\n"
            "\nExamples:\n"
            + HelpExampleCli("listqueuedenvelopes", "")
        );
    }

    if (!g_gmp_transport) {
        throw JSONRPCError(RPC_LINK_NOT_INITIALIZED, "Transport not running");
    }

    UniValue result(UniValue::VOBJ);
    result.pushKV("queued", (int64_t)g_gmp_transport->GetQueueSize());
    IpcEnvelope next;
    if (g_gmp_transport->PeekNext(next)) {
        UniValue env(UniValue::VOBJ);
        EnvelopeToUniv(next, env, true);
        result.pushKV("next", env);
    }
    return result;
}

// Register commands
static const CRPCCommand commands[] = {
    //  category        name                    actor                   okSafeMode  argNames
    { "accounts",      "getbalance",           &getbalance,            true,       {"address", "paired"} },
    { "accounts",      "mintbalance",          &mintbalance,           false,      {"address", "amount", "paired"} },
    { "transport",     "deliverenvelopes",     &deliverenvelopes,      false,      {"count"} },
    { "transport",     "listqueuedenvelopes",  &listqueuedenvelopes,   true,       {} },
};

void RegisterAccountRPCCommands(CRPCTable& t)
{
    for (const auto& cmd : commands) {
        t.appendCommand(cmd.name, &cmd);
    }
}
