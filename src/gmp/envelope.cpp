// Copyright (c) 2026 The LinkedToken developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "gmp/envelope.h"

#include "hash.h"
#include "streams.h"
#include "utilstrencodings.h"
#include "version.h"

#include <ios>

namespace {

template <typename T>
std::vector<unsigned char> EncodeMessage(const T& msg)
{
    CDataStream ss(SER_NETWORK, ENVELOPE_VERSION);
    ss << msg;
    return std::vector<unsigned char>(ss.begin(), ss.end());
}

template <typename T>
bool DecodeMessage(const std::vector<unsigned char>& data, T& msg)
{
    try {
        CDataStream ss(data, SER_NETWORK, ENVELOPE_VERSION);
        ss >> msg;
        return ss.empty();
    } catch (const std::ios_base::failure&) {
        return false;
    }
}

} // anonymous namespace

std::string IpcMsgKindToString(IpcMsgKind kind)
{
    switch (kind) {
    case IpcMsgKind::Transfer: return "transfer";
    case IpcMsgKind::Call:     return "call";
    case IpcMsgKind::Result:   return "result";
    }
    return "unknown";
}

std::string OutcomeTypeToString(OutcomeType outcome)
{
    switch (outcome) {
    case OutcomeType::Ok:        return "ok";
    case OutcomeType::SystemErr: return "system-error";
    case OutcomeType::ActorErr:  return "actor-error";
    }
    return "unknown";
}

uint256 IpcEnvelope::GetHash() const
{
    return SerializeKeccakHash(*this, SER_GETHASH, ENVELOPE_VERSION);
}

IpcEnvelope IpcEnvelope::CreateCall(const IPCAddress& from, const IPCAddress& to, uint64_t nonce, CAmount value, const CallMsg& call)
{
    IpcEnvelope env;
    env.kind = IpcMsgKind::Call;
    env.from = from;
    env.to = to;
    env.nonce = nonce;
    env.value = value;
    env.message = EncodeMessage(call);
    return env;
}

IpcEnvelope IpcEnvelope::CreateResult(const IpcEnvelope& call, uint64_t nonce, OutcomeType outcome, const std::vector<unsigned char>& ret)
{
    ResultMsg result;
    result.id = call.GetHash();
    result.outcome = outcome;
    result.ret = ret;

    IpcEnvelope env;
    env.kind = IpcMsgKind::Result;
    env.from = call.to;
    env.to = call.from;
    env.nonce = nonce;
    env.value = 0;
    env.message = EncodeMessage(result);
    return env;
}

bool IpcEnvelope::DecodeCall(CallMsg& call) const
{
    if (kind != IpcMsgKind::Call)
        return false;
    return DecodeMessage(message, call);
}

bool IpcEnvelope::DecodeResult(ResultMsg& result) const
{
    if (kind != IpcMsgKind::Result)
        return false;
    if (!DecodeMessage(message, result))
        return false;
    // Unknown outcome tags are malformed, not a third outcome class
    return result.outcome == OutcomeType::Ok ||
           result.outcome == OutcomeType::SystemErr ||
           result.outcome == OutcomeType::ActorErr;
}

std::string IpcEnvelope::ToString() const
{
    return strprintf("IpcEnvelope(id=%s, kind=%s, from=%s, to=%s, nonce=%u, value=%d, message=%u bytes)",
                     GetHash().ToString(), IpcMsgKindToString(kind), from.ToString(), to.ToString(),
                     nonce, value, message.size());
}
