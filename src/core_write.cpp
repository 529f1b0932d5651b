// Copyright (c) 2009-2014 The Bitcoin developers
// Copyright (c) 2017-2021 The PIVX Core developers
// Copyright (c) 2026 The LinkedToken developers
// Distributed under the MIT/X11 software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "core_io.h"

#include "gmp/address.h"
#include "gmp/envelope.h"
#include "linkedtoken/transfer.h"
#include "serialize.h"
#include "streams.h"
#include <univalue.h>
#include "utilmoneystr.h"
#include "utilstrencodings.h"
#include "version.h"

std::string EncodeHexEnvelope(const IpcEnvelope& envelope)
{
    CDataStream ssEnv(SER_NETWORK, ENVELOPE_VERSION);
    ssEnv << envelope;
    return HexStr(ssEnv.begin(), ssEnv.end());
}

void IPCAddressToUniv(const IPCAddress& address, UniValue& out)
{
    out.pushKV("subnet", address.subnetId.ToString());
    out.pushKV("address", address.rawAddress.ToString());

    uint160 evm;
    if (address.rawAddress.GetEvmAddress(evm))
        out.pushKV("evm", evm.ToString());
}

void EnvelopeToUniv(const IpcEnvelope& envelope, UniValue& entry, bool fIncludeHex)
{
    entry.pushKV("id", envelope.GetHash().ToString());
    entry.pushKV("kind", IpcMsgKindToString(envelope.kind));

    UniValue from(UniValue::VOBJ);
    IPCAddressToUniv(envelope.from, from);
    entry.pushKV("from", from);

    UniValue to(UniValue::VOBJ);
    IPCAddressToUniv(envelope.to, to);
    entry.pushKV("to", to);

    entry.pushKV("nonce", (int64_t)envelope.nonce);
    entry.pushKV("value", UniValue(UniValue::VNUM, FormatMoney(envelope.value)));

    CallMsg call;
    ResultMsg result;
    if (envelope.DecodeCall(call)) {
        UniValue msg(UniValue::VOBJ);
        msg.pushKV("method", HexStr(call.method));
        msg.pushKV("params", HexStr(call.params));
        entry.pushKV("call", msg);
    } else if (envelope.DecodeResult(result)) {
        UniValue msg(UniValue::VOBJ);
        msg.pushKV("id", result.id.ToString());
        msg.pushKV("outcome", OutcomeTypeToString(result.outcome));
        msg.pushKV("ret", std::string(result.ret.begin(), result.ret.end()));
        entry.pushKV("result", msg);
    }

    if (fIncludeHex)
        entry.pushKV("hex", EncodeHexEnvelope(envelope));
}

void LinkConfigToUniv(const LinkConfig& link, UniValue& entry)
{
    entry.pushKV("underlying", link.underlying.ToString());
    entry.pushKV("linkedsubnet", link.linkedSubnet.ToString());
    entry.pushKV("linkedcontract", link.linkedContract.ToString());
    entry.pushKV("initialized", link.IsInitialized());
}

void UnconfirmedTransferToUniv(const uint256& id, const UnconfirmedTransfer& transfer, UniValue& entry)
{
    entry.pushKV("id", id.ToString());
    entry.pushKV("initiator", transfer.initiator.ToString());
    entry.pushKV("amount", UniValue(UniValue::VNUM, FormatMoney(transfer.amount)));
}
