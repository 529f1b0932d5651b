// Copyright (c) 2026 The LinkedToken developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "linkedtoken/linkedtoken.h"

#include "consensus/validation.h"
#include "gmp/abi.h"
#include "linkedtoken/authenticator.h"
#include "linkedtoken/custody.h"
#include "linkedtoken/ledgerdb.h"
#include "logging.h"
#include "utilmoneystr.h"

std::string LinkConfig::ToString() const
{
    return strprintf("LinkConfig(underlying=%s, linkedSubnet=%s, linkedContract=%s)",
                     underlying.ToString(), linkedSubnet.ToString(), linkedContract.ToString());
}

/** Holds the settlement claim on one id for the lifetime of the object. */
class SettlementClaim
{
private:
    CLinkedToken& token;
    const uint256 id;

public:
    SettlementClaim(CLinkedToken& tokenIn, const uint256& idIn) : token(tokenIn), id(idIn)
    {
        token.ClaimSettlement(id);
    }
    ~SettlementClaim()
    {
        token.FinishSettlement(id);
    }

    SettlementClaim(const SettlementClaim&) = delete;
    SettlementClaim& operator=(const SettlementClaim&) = delete;
};

CLinkedToken::CLinkedToken(const uint160& ownerIn, const IPCAddress& selfIn, const uint160& underlying, const SubnetID& linkedSubnet,
                           ICustodyStrategy& custodyIn, CGmpTransport& transportIn, CUnconfirmedTransferDB& ledgerIn)
    : owner(ownerIn), self(selfIn), custody(custodyIn), transport(transportIn), ledger(ledgerIn)
{
    link.underlying = underlying;
    link.linkedSubnet = linkedSubnet;
}

// =============================================================================
// Helpers
// =============================================================================

void CLinkedToken::ClaimSettlement(const uint256& id)
{
    // A second delivery of the same id waits here, then finds the record gone
    WAIT_LOCK(cs_settling, lock);
    condSettling.wait(lock, [&] { return setSettling.count(id) == 0; });
    setSettling.insert(id);
}

void CLinkedToken::FinishSettlement(const uint256& id)
{
    {
        LOCK(cs_settling);
        setSettling.erase(id);
    }
    condSettling.notify_all();
}

bool CLinkedToken::GetInitializedLink(LinkConfig& linkOut, CValidationState& state) const
{
    LOCK(cs_link);
    if (!link.IsInitialized()) {
        return state.Invalid(false, REJECT_NOT_INITIALIZED, "linked-not-initialized");
    }
    linkOut = link;
    return true;
}

bool CLinkedToken::CheckOwner(const uint160& caller, CValidationState& state) const
{
    if (caller != owner) {
        return state.Invalid(false, REJECT_UNAUTHORIZED, "bad-link-owner-only", caller.ToString());
    }
    return true;
}

bool CLinkedToken::CheckTransferParams(const uint160& recipient, CAmount amount, CValidationState& state)
{
    if (recipient.IsNull()) {
        return state.Invalid(false, REJECT_INVALID, "bad-transfer-zero-recipient");
    }
    if (amount == 0) {
        return state.Invalid(false, REJECT_INVALID, "bad-transfer-zero-amount");
    }
    if (amount < 0) {
        return state.Invalid(false, REJECT_INVALID, "bad-transfer-negative-amount");
    }
    return true;
}

std::vector<unsigned char> CLinkedToken::GetReceiveSelector()
{
    return ComputeSelector(LINKED_RECEIVE_SIGNATURE);
}

CallMsg CLinkedToken::BuildReceiveCall(const uint160& recipient, CAmount amount)
{
    CallMsg call;
    call.method = GetReceiveSelector();
    AbiEncodeAddress(call.params, recipient);
    AbiEncodeAmount(call.params, amount);
    return call;
}

bool CLinkedToken::SetLinkedContract(const uint160& linkedContract, CValidationState& state)
{
    // Caller holds cs_link
    LinkConfig updated = link;
    updated.linkedContract = linkedContract;
    if (!ledger.WriteLinkConfig(updated)) {
        LogPrintf("ERROR: %s: failed to persist link configuration\n", __func__);
        return state.Error("ledger-write-failed");
    }
    link = updated;
    return true;
}

// =============================================================================
// Link configuration
// =============================================================================

bool CLinkedToken::LoadLinkConfig(CValidationState& state)
{
    LinkConfig stored;
    if (!ledger.ReadLinkConfig(stored)) {
        return true;  // Fresh ledger, link not initialized yet
    }

    LOCK(cs_link);
    if (stored.underlying != link.underlying || stored.linkedSubnet != link.linkedSubnet) {
        LogPrintf("ERROR: %s: stored %s does not match configured %s\n", __func__, stored.ToString(), link.ToString());
        return state.Error("linked-config-mismatch");
    }
    link.linkedContract = stored.linkedContract;
    LogPrint(BCLog::LINKEDTOKEN, "LinkedToken: restored %s\n", link.ToString());
    return true;
}

bool CLinkedToken::InitializeLink(const uint160& caller, const uint160& linkedContract, CValidationState& state)
{
    if (!CheckOwner(caller, state))
        return false;
    if (linkedContract.IsNull()) {
        return state.Invalid(false, REJECT_INVALID, "bad-link-zero-contract");
    }

    LinkConfig snapshot;
    {
        LOCK(cs_link);
        if (link.IsInitialized()) {
            return state.Invalid(false, REJECT_DUPLICATE, "linked-already-initialized", link.linkedContract.ToString());
        }
        if (!SetLinkedContract(linkedContract, state))
            return false;
        snapshot = link;
    }

    LogPrintf("LinkedToken: link initialized, %s\n", snapshot.ToString());
    signals.LinkInitialized(snapshot);
    return true;
}

bool CLinkedToken::ReinitializeLink(const uint160& caller, const uint160& linkedContract, bool fForce, CValidationState& state)
{
    if (!CheckOwner(caller, state))
        return false;
    if (linkedContract.IsNull()) {
        return state.Invalid(false, REJECT_INVALID, "bad-link-zero-contract");
    }

    LinkConfig snapshot;
    uint160 previous;
    size_t nPending = 0;
    {
        LOCK(cs_ledger);
        nPending = ledger.GetStats().pendingCount;
        if (nPending > 0 && !fForce) {
            return state.Invalid(false, REJECT_INVALID, "linked-transfers-pending",
                                 strprintf("%u unconfirmed transfers", nPending));
        }

        LOCK(cs_link);
        previous = link.linkedContract;
        if (!SetLinkedContract(linkedContract, state))
            return false;
        snapshot = link;
    }

    if (nPending > 0) {
        LogPrintf("LinkedToken: WARNING: link forced from %s to %s with %u unconfirmed transfers in flight\n",
                  previous.ToString(), linkedContract.ToString(), nPending);
    } else {
        LogPrintf("LinkedToken: link reinitialized from %s, %s\n", previous.ToString(), snapshot.ToString());
    }
    signals.LinkInitialized(snapshot);
    return true;
}

LinkConfig CLinkedToken::GetLinkConfig() const
{
    LOCK(cs_link);
    return link;
}

bool CLinkedToken::IsInitialized() const
{
    LOCK(cs_link);
    return link.IsInitialized();
}

bool CLinkedToken::GetUnconfirmedTransfer(const uint256& id, UnconfirmedTransfer& transfer) const
{
    LOCK(cs_ledger);
    return ledger.ReadTransfer(id, transfer);
}

// =============================================================================
// Initiation
// =============================================================================

bool CLinkedToken::LinkedTransfer(const uint160& caller, const uint160& recipient, CAmount amount,
                                  IpcEnvelope& envelope, CValidationState& state)
{
    // Held from the link read to the ledger write so a reinitialization
    // either sees this record or happens before the link is read
    LOCK(cs_ledger);

    LinkConfig current;
    if (!GetInitializedLink(current, state))
        return false;
    if (!CheckTransferParams(recipient, amount, state))
        return false;

    // (a) capture
    if (!custody.Capture(caller, amount, state)) {
        LogPrint(BCLog::LINKEDTOKEN, "LinkedToken: capture of %s from %s failed: %s\n",
                 FormatMoney(amount), caller.ToString(), FormatStateMessage(state));
        return false;
    }

    // (b)+(c) dispatch receiveLinked(recipient, amount) with no value attached
    const IPCAddress destination = IPCAddress::FromEvm(current.linkedSubnet, current.linkedContract);
    CValidationState dispatchState;
    if (!transport.Dispatch(self, destination, BuildReceiveCall(recipient, amount), 0, envelope, dispatchState)) {
        CValidationState releaseState;
        if (!custody.Release(caller, amount, releaseState)) {
            LogPrintf("ERROR: %s: dispatch failed (%s) and capture of %s from %s could not be reversed: %s\n", __func__,
                      FormatStateMessage(dispatchState), FormatMoney(amount), caller.ToString(), FormatStateMessage(releaseState));
            return state.Error("linked-capture-not-reversed", FormatStateMessage(dispatchState));
        }
        return state.Invalid(false, dispatchState.GetRejectCode(), dispatchState.GetRejectReason(),
                             dispatchState.GetDebugMessage());
    }

    // (d) record as unconfirmed
    const uint256 id = envelope.GetHash();
    const UnconfirmedTransfer transfer(caller, amount);
    if (!ledger.WriteTransfer(id, transfer)) {
        // The call is already on the wire, there is nothing left to undo
        LogPrintf("ERROR: %s: dispatched %s but could not record it\n", __func__, id.ToString());
        return state.Error("ledger-write-failed");
    }

    LogPrint(BCLog::LINKEDTOKEN, "LinkedToken: sent %s from %s to %s, id=%s nonce=%u\n",
             FormatMoney(amount), caller.ToString(), recipient.ToString(), id.ToString(), envelope.nonce);

    // (e) event
    LinkedTransferSent sent;
    sent.underlying = current.underlying;
    sent.initiator = caller;
    sent.recipient = recipient;
    sent.id = id;
    sent.nonce = envelope.nonce;
    sent.amount = amount;
    signals.TransferSent(sent);
    return true;
}

// =============================================================================
// Inbound call (destination side)
// =============================================================================

bool CLinkedToken::HandleCall(const IpcEnvelope& envelope, const CallMsg& call, CValidationState& state)
{
    if (!envelope.IsCall()) {
        return state.Invalid(false, REJECT_MALFORMED, "bad-envelope-kind", IpcMsgKindToString(envelope.kind));
    }

    LinkConfig current;
    if (!GetInitializedLink(current, state))
        return false;

    const CMessageAuthenticator auth(current);
    if (!auth.CheckOrigin(envelope, state))
        return false;
    if (envelope.value != 0) {
        return state.Invalid(false, REJECT_INVALID, "bad-envelope-nonzero-value", FormatMoney(envelope.value));
    }
    if (!CMessageAuthenticator::CheckSelector(call.method, LINKED_RECEIVE_SIGNATURE, state))
        return false;

    uint160 recipient;
    CAmount amount = 0;
    if (call.params.size() != 2 * ABI_WORD_SIZE ||
        !AbiDecodeAddress(call.params, 0, recipient) ||
        !AbiDecodeAmount(call.params, ABI_WORD_SIZE, amount)) {
        return state.Invalid(false, REJECT_MALFORMED, "bad-envelope-decode");
    }
    if (!CheckTransferParams(recipient, amount, state))
        return false;

    if (!custody.Release(recipient, amount, state)) {
        LogPrintf("LinkedToken: release of %s to %s for %s failed: %s\n", FormatMoney(amount),
                  recipient.ToString(), envelope.GetHash().ToString(), FormatStateMessage(state));
        return false;
    }

    const uint256 id = envelope.GetHash();
    LogPrint(BCLog::LINKEDTOKEN, "LinkedToken: received %s for %s, id=%s\n",
             FormatMoney(amount), recipient.ToString(), id.ToString());

    LinkedTransferReceived received;
    received.recipient = recipient;
    received.amount = amount;
    received.id = id;
    signals.TransferReceived(received);
    return true;
}

// =============================================================================
// Inbound result (origin side)
// =============================================================================

bool CLinkedToken::HandleResult(const IpcEnvelope& envelope, const ResultMsg& result, CValidationState& state)
{
    if (!envelope.IsResult()) {
        return state.Invalid(false, REJECT_MALFORMED, "bad-envelope-kind", IpcMsgKindToString(envelope.kind));
    }

    LinkConfig current;
    if (!GetInitializedLink(current, state))
        return false;

    const CMessageAuthenticator auth(current);
    if (!auth.CheckOrigin(envelope, state))
        return false;

    SettlementClaim claim(*this, result.id);

    UnconfirmedTransfer transfer;
    {
        LOCK(cs_ledger);
        if (!ledger.ReadTransfer(result.id, transfer)) {
            LogPrintf("ERROR: %s: result %s for %s which has no unconfirmed transfer\n", __func__,
                      envelope.GetHash().ToString(), result.id.ToString());
            return state.Error("unconfirmed-transfer-missing", result.id.ToString());
        }
    }

    const bool fRefund = !result.IsSuccess();
    if (fRefund && !custody.Release(transfer.initiator, transfer.amount, state)) {
        LogPrintf("LinkedToken: refund of %s to %s for %s failed, record kept: %s\n", FormatMoney(transfer.amount),
                  transfer.initiator.ToString(), result.id.ToString(), FormatStateMessage(state));
        return false;
    }

    {
        LOCK(cs_ledger);
        CUnconfirmedTransferDB::Batch batch = ledger.CreateBatch();
        batch.EraseTransfer(result.id, transfer);
        if (!batch.Commit()) {
            LogPrintf("ERROR: %s: settled %s but could not erase it\n", __func__, result.id.ToString());
            return state.Error("ledger-write-failed");
        }
    }

    LogPrint(BCLog::LINKEDTOKEN, "LinkedToken: settled %s outcome=%s%s\n", result.id.ToString(),
             OutcomeTypeToString(result.outcome),
             fRefund ? strprintf(", refunded %s to %s", FormatMoney(transfer.amount), transfer.initiator.ToString()) : "");

    LinkedTransferSettled settled;
    settled.id = result.id;
    settled.transfer = transfer;
    settled.outcome = result.outcome;
    settled.fRefunded = fRefund;
    signals.TransferSettled(settled);
    return true;
}

// =============================================================================
// Administrative override
// =============================================================================

bool CLinkedToken::RemoveUnconfirmedTransfer(const uint160& caller, const uint256& id, UnconfirmedTransfer& transfer,
                                             CValidationState& state)
{
    if (!CheckOwner(caller, state))
        return false;

    SettlementClaim claim(*this, id);

    {
        LOCK(cs_ledger);
        if (!ledger.ReadTransfer(id, transfer)) {
            return state.Invalid(false, REJECT_INVALID, "unconfirmed-transfer-not-found", id.ToString());
        }
        CUnconfirmedTransferDB::Batch batch = ledger.CreateBatch();
        batch.EraseTransfer(id, transfer);
        if (!batch.Commit()) {
            LogPrintf("ERROR: %s: could not erase %s\n", __func__, id.ToString());
            return state.Error("ledger-write-failed");
        }
    }

    LogPrintf("LinkedToken: AUDIT: owner %s removed unconfirmed transfer %s (initiator=%s amount=%s) without refund\n",
              caller.ToString(), id.ToString(), transfer.initiator.ToString(), FormatMoney(transfer.amount));
    signals.UnconfirmedTransferRemoved(id, transfer, caller);
    return true;
}
