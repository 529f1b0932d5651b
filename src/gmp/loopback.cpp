// Copyright (c) 2026 The LinkedToken developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "gmp/loopback.h"

#include "consensus/validation.h"
#include "logging.h"

#include <vector>

uint64_t CLoopbackTransport::NextNonce(const IPCAddress& from)
{
    // Caller holds cs_loopback
    return mapNonces[from.ToString()]++;
}

CGmpReceiver* CLoopbackTransport::FindReceiver(const IPCAddress& to) const
{
    LOCK(cs_loopback);
    auto it = mapReceivers.find(to.ToString());
    return it == mapReceivers.end() ? nullptr : it->second;
}

void CLoopbackTransport::RegisterReceiver(const IPCAddress& address, CGmpReceiver* receiver)
{
    LOCK(cs_loopback);
    mapReceivers[address.ToString()] = receiver;
    LogPrint(BCLog::GMP, "GMP: registered receiver at %s\n", address.ToString());
}

void CLoopbackTransport::UnregisterReceiver(const IPCAddress& address)
{
    LOCK(cs_loopback);
    mapReceivers.erase(address.ToString());
}

bool CLoopbackTransport::Dispatch(const IPCAddress& from, const IPCAddress& to, const CallMsg& call, CAmount value,
                                  IpcEnvelope& envelope, CValidationState& state)
{
    if (from.subnetId.IsNull() || to.subnetId.IsNull()) {
        return state.Invalid(false, REJECT_INVALID, "gmp-null-subnet");
    }
    if (!MoneyRange(value)) {
        return state.Invalid(false, REJECT_INVALID, "gmp-value-out-of-range");
    }

    LOCK(cs_loopback);
    envelope = IpcEnvelope::CreateCall(from, to, NextNonce(from), value, call);
    queue.push_back(envelope);

    LogPrint(BCLog::GMP, "GMP: dispatched %s\n", envelope.ToString());
    return true;
}

void CLoopbackTransport::Enqueue(const IpcEnvelope& envelope)
{
    LOCK(cs_loopback);
    queue.push_back(envelope);
}

bool CLoopbackTransport::DropNext(IpcEnvelope& dropped)
{
    LOCK(cs_loopback);
    if (queue.empty())
        return false;
    dropped = queue.front();
    queue.pop_front();
    LogPrint(BCLog::GMP, "GMP: dropped %s\n", dropped.GetHash().ToString());
    return true;
}

bool CLoopbackTransport::DeliverNext()
{
    IpcEnvelope envelope;
    {
        LOCK(cs_loopback);
        if (queue.empty())
            return false;
        envelope = queue.front();
        queue.pop_front();
    }

    // Receivers run without cs_loopback held, they may dispatch again
    CGmpReceiver* receiver = FindReceiver(envelope.to);
    CValidationState state;

    if (envelope.IsCall()) {
        OutcomeType outcome = OutcomeType::Ok;
        std::string strRet;

        CallMsg call;
        if (receiver == nullptr) {
            outcome = OutcomeType::SystemErr;
            strRet = "no-receiver";
        } else if (!envelope.DecodeCall(call)) {
            outcome = OutcomeType::SystemErr;
            strRet = "bad-envelope-decode";
        } else if (!receiver->HandleCall(envelope, call, state)) {
            outcome = state.IsError() ? OutcomeType::SystemErr : OutcomeType::ActorErr;
            strRet = state.GetRejectReason();
        }

        LogPrint(BCLog::GMP, "GMP: call %s delivered, outcome=%s%s\n", envelope.GetHash().ToString(),
                 OutcomeTypeToString(outcome), strRet.empty() ? "" : " (" + strRet + ")");

        LOCK(cs_loopback);
        if (outcome == OutcomeType::Ok) nDelivered++; else nRejected++;
        IpcEnvelope receipt = IpcEnvelope::CreateResult(envelope, NextNonce(envelope.to), outcome,
                                                        std::vector<unsigned char>(strRet.begin(), strRet.end()));
        queue.push_back(receipt);
        return outcome == OutcomeType::Ok;
    }

    if (envelope.IsResult()) {
        ResultMsg result;
        bool fOk = false;
        if (receiver == nullptr) {
            LogPrintf("GMP: no receiver for result %s at %s, dropped\n", envelope.GetHash().ToString(), envelope.to.ToString());
        } else if (!envelope.DecodeResult(result)) {
            LogPrintf("GMP: malformed result %s, dropped\n", envelope.GetHash().ToString());
        } else if (!receiver->HandleResult(envelope, result, state)) {
            LogPrintf("GMP: result %s for %s rejected: %s\n", envelope.GetHash().ToString(),
                      result.id.ToString(), FormatStateMessage(state));
        } else {
            fOk = true;
        }

        LOCK(cs_loopback);
        if (fOk) nDelivered++; else nRejected++;
        return fOk;
    }

    LogPrintf("GMP: envelope kind %s not routable, dropped\n", IpcMsgKindToString(envelope.kind));
    LOCK(cs_loopback);
    nRejected++;
    return false;
}

size_t CLoopbackTransport::DeliverAll()
{
    size_t nCount = 0;
    while (GetQueueSize() > 0) {
        DeliverNext();
        nCount++;
    }
    return nCount;
}

size_t CLoopbackTransport::GetQueueSize() const
{
    LOCK(cs_loopback);
    return queue.size();
}

bool CLoopbackTransport::PeekNext(IpcEnvelope& envelope) const
{
    LOCK(cs_loopback);
    if (queue.empty())
        return false;
    envelope = queue.front();
    return true;
}

uint64_t CLoopbackTransport::GetDeliveredCount() const
{
    LOCK(cs_loopback);
    return nDelivered;
}

uint64_t CLoopbackTransport::GetRejectedCount() const
{
    LOCK(cs_loopback);
    return nRejected;
}
