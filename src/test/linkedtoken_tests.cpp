// Copyright (c) 2026 The LinkedToken developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

/**
 * Linked token protocol tests
 *
 * Tests:
 *   1. Initiation (capture, dispatch, ledger record)
 *   2. Inbound call (authentication, selector, decode, release)
 *   3. Inbound result (settle, refund, redelivery)
 *   4. Administrative surface (initialize, reinitialize, override)
 *   5. Events and persistence of the link
 */

#include "consensus/validation.h"
#include "gmp/abi.h"
#include "linkedtoken/ledgerdb.h"
#include "linkedtoken/linkedtoken.h"
#include "test/test_linkedtoken.h"
#include "utilstrencodings.h"

#include <vector>

#include <boost/test/unit_test.hpp>

namespace {

const uint160 STRANGER = uint160S("0x000000000000000000000000000000000000dead");

/** Counts every event a token fires. */
class EventRecorder : public CLinkedTokenInterface
{
public:
    std::vector<LinkConfig> links;
    std::vector<LinkedTransferSent> sent;
    std::vector<LinkedTransferReceived> received;
    std::vector<LinkedTransferSettled> settled;
    std::vector<uint256> removed;

protected:
    void LinkInitialized(const LinkConfig& link) override { links.push_back(link); }
    void TransferSent(const LinkedTransferSent& ev) override { sent.push_back(ev); }
    void TransferReceived(const LinkedTransferReceived& ev) override { received.push_back(ev); }
    void TransferSettled(const LinkedTransferSettled& ev) override { settled.push_back(ev); }
    void UnconfirmedTransferRemoved(const uint256& id, const UnconfirmedTransfer&, const uint160&) override { removed.push_back(id); }
};

/** Transport that refuses everything. */
class RefusingTransport : public CGmpTransport
{
public:
    bool Dispatch(const IPCAddress&, const IPCAddress&, const CallMsg&, CAmount, IpcEnvelope&, CValidationState& state) override
    {
        return state.Invalid(false, REJECT_INVALID, "gmp-queue-full");
    }
};

struct ProtocolSetup : public LinkedTokenTestingSetup {
    IpcEnvelope Send(const uint160& from, const uint160& to, CAmount amount)
    {
        IpcEnvelope envelope;
        CValidationState state;
        BOOST_REQUIRE_MESSAGE(TokenA().LinkedTransfer(from, to, amount, envelope, state), FormatStateMessage(state));
        return envelope;
    }

    //! Call envelope into B claiming to come from `from`
    IpcEnvelope CallIntoB(const IPCAddress& from, const CallMsg& call, CAmount value = 0)
    {
        return IpcEnvelope::CreateCall(from, TokenB().GetAddress(), 0, value, call);
    }

    size_t PendingOnA() { return domainA.ledger->GetStats().pendingCount; }
};

} // namespace

BOOST_FIXTURE_TEST_SUITE(linkedtoken_tests, ProtocolSetup)

// =============================================================================
// Test 1: Initiation
// =============================================================================
BOOST_AUTO_TEST_CASE(initiate_captures_and_records)
{
    Fund(ALICE, 1000);

    const IpcEnvelope envelope = Send(ALICE, BOB, 100);

    BOOST_CHECK_EQUAL(domainA.accounts->GetBalance(ALICE), 900);
    BOOST_CHECK_EQUAL(domainA.accounts->GetBalance(CONTRACT_A), 100);

    UnconfirmedTransfer transfer;
    BOOST_REQUIRE(TokenA().GetUnconfirmedTransfer(envelope.GetHash(), transfer));
    BOOST_CHECK(transfer.initiator == ALICE);
    BOOST_CHECK_EQUAL(transfer.amount, 100);
    BOOST_CHECK_EQUAL(PendingOnA(), 1U);

    // receiveLinked(BOB, 100) to the linked contract with no value attached
    BOOST_CHECK(envelope.IsCall());
    BOOST_CHECK(envelope.to == IPCAddress::FromEvm(subnetB, CONTRACT_B));
    BOOST_CHECK(envelope.from == TokenA().GetAddress());
    BOOST_CHECK_EQUAL(envelope.value, 0);
    CallMsg call;
    BOOST_REQUIRE(envelope.DecodeCall(call));
    BOOST_CHECK(call.method == CLinkedToken::GetReceiveSelector());
    uint160 recipient;
    CAmount amount = 0;
    BOOST_CHECK(AbiDecodeAddress(call.params, 0, recipient));
    BOOST_CHECK(AbiDecodeAmount(call.params, ABI_WORD_SIZE, amount));
    BOOST_CHECK(recipient == BOB);
    BOOST_CHECK_EQUAL(amount, 100);

    BOOST_CHECK_EQUAL(transport.GetQueueSize(), 1U);
}

BOOST_AUTO_TEST_CASE(each_transfer_gets_its_own_record)
{
    Fund(ALICE, 1000);
    const IpcEnvelope first = Send(ALICE, BOB, 10);
    const IpcEnvelope second = Send(ALICE, BOB, 10);
    BOOST_CHECK(first.GetHash() != second.GetHash());
    BOOST_CHECK_EQUAL(second.nonce, first.nonce + 1);
    BOOST_CHECK_EQUAL(PendingOnA(), 2U);
    BOOST_CHECK_EQUAL(domainA.accounts->GetBalance(ALICE), 980);
}

BOOST_AUTO_TEST_CASE(zero_recipient_fails_before_capture)
{
    Fund(ALICE, 1000);
    IpcEnvelope envelope;
    CValidationState state;
    BOOST_CHECK(!TokenA().LinkedTransfer(ALICE, uint160(), 100, envelope, state));
    BOOST_CHECK_EQUAL(state.GetRejectReason(), "bad-transfer-zero-recipient");
    BOOST_CHECK_EQUAL(domainA.accounts->GetBalance(ALICE), 1000);
    BOOST_CHECK_EQUAL(domainA.accounts->GetBalance(CONTRACT_A), 0);
    BOOST_CHECK_EQUAL(transport.GetQueueSize(), 0U);
    BOOST_CHECK_EQUAL(PendingOnA(), 0U);
}

BOOST_AUTO_TEST_CASE(bad_amounts_fail_before_capture)
{
    Fund(ALICE, 1000);
    IpcEnvelope envelope;

    CValidationState zero;
    BOOST_CHECK(!TokenA().LinkedTransfer(ALICE, BOB, 0, envelope, zero));
    BOOST_CHECK_EQUAL(zero.GetRejectReason(), "bad-transfer-zero-amount");

    CValidationState negative;
    BOOST_CHECK(!TokenA().LinkedTransfer(ALICE, BOB, -5, envelope, negative));
    BOOST_CHECK_EQUAL(negative.GetRejectReason(), "bad-transfer-negative-amount");

    CValidationState poor;
    BOOST_CHECK(!TokenA().LinkedTransfer(ALICE, BOB, 1001, envelope, poor));
    BOOST_CHECK_EQUAL(poor.GetRejectReason(), "custody-insufficient-balance");

    BOOST_CHECK_EQUAL(domainA.accounts->GetBalance(ALICE), 1000);
    BOOST_CHECK_EQUAL(transport.GetQueueSize(), 0U);
    BOOST_CHECK_EQUAL(PendingOnA(), 0U);
}

BOOST_AUTO_TEST_CASE(refused_dispatch_reverses_capture)
{
    Fund(ALICE, 1000);
    RefusingTransport refusing;
    CLinkedToken token(OWNER, TokenA().GetAddress(), UNDERLYING, subnetB, *domainA.custody, refusing, *domainA.ledger);
    CValidationState loadState;
    BOOST_REQUIRE(token.LoadLinkConfig(loadState));
    BOOST_REQUIRE(token.IsInitialized());

    IpcEnvelope envelope;
    CValidationState state;
    BOOST_CHECK(!token.LinkedTransfer(ALICE, BOB, 100, envelope, state));
    BOOST_CHECK(state.IsInvalid());
    BOOST_CHECK_EQUAL(state.GetRejectReason(), "gmp-queue-full");
    BOOST_CHECK_EQUAL(domainA.accounts->GetBalance(ALICE), 1000);
    BOOST_CHECK_EQUAL(domainA.accounts->GetBalance(CONTRACT_A), 0);
    BOOST_CHECK_EQUAL(PendingOnA(), 0U);
}

// =============================================================================
// Test 2: Inbound call
// =============================================================================
BOOST_AUTO_TEST_CASE(round_trip_success)
{
    Fund(ALICE, 1000);
    EventRecorder eventsA, eventsB;
    TokenA().Signals().RegisterInterface(&eventsA);
    TokenB().Signals().RegisterInterface(&eventsB);

    const IpcEnvelope envelope = Send(ALICE, BOB, 100);
    BOOST_CHECK_EQUAL(transport.DeliverAll(), 2U);

    // Captured 100 stays locked on A, B minted 100
    BOOST_CHECK_EQUAL(domainA.accounts->GetBalance(ALICE), 900);
    BOOST_CHECK_EQUAL(domainA.accounts->GetBalance(CONTRACT_A), 100);
    BOOST_CHECK_EQUAL(domainB.accounts->GetBalance(BOB), 100);
    const CAmount circulating = domainA.accounts->GetTotalSupply() - domainA.accounts->GetBalance(CONTRACT_A) +
                                domainB.accounts->GetTotalSupply();
    BOOST_CHECK_EQUAL(circulating, 1000);
    BOOST_CHECK_EQUAL(PendingOnA(), 0U);

    BOOST_REQUIRE_EQUAL(eventsA.sent.size(), 1U);
    BOOST_CHECK(eventsA.sent[0].id == envelope.GetHash());
    BOOST_CHECK(eventsA.sent[0].underlying == UNDERLYING);
    BOOST_CHECK(eventsA.sent[0].initiator == ALICE);
    BOOST_CHECK(eventsA.sent[0].recipient == BOB);
    BOOST_CHECK_EQUAL(eventsA.sent[0].nonce, envelope.nonce);
    BOOST_CHECK_EQUAL(eventsA.sent[0].amount, 100);

    BOOST_REQUIRE_EQUAL(eventsB.received.size(), 1U);
    BOOST_CHECK(eventsB.received[0].recipient == BOB);
    BOOST_CHECK_EQUAL(eventsB.received[0].amount, 100);

    BOOST_REQUIRE_EQUAL(eventsA.settled.size(), 1U);
    BOOST_CHECK(eventsA.settled[0].outcome == OutcomeType::Ok);
    BOOST_CHECK(!eventsA.settled[0].fRefunded);

    TokenA().Signals().UnregisterAll();
    TokenB().Signals().UnregisterAll();
}

BOOST_AUTO_TEST_CASE(round_trip_back_to_origin)
{
    Fund(ALICE, 1000);
    Send(ALICE, BOB, 100);
    transport.DeliverAll();

    // BOB sends 40 back from B, A unlocks it to ALICE
    IpcEnvelope envelope;
    CValidationState state;
    BOOST_REQUIRE(TokenB().LinkedTransfer(BOB, ALICE, 40, envelope, state));
    BOOST_CHECK_EQUAL(domainB.accounts->GetTotalSupply(), 60);
    transport.DeliverAll();

    BOOST_CHECK_EQUAL(domainA.accounts->GetBalance(ALICE), 940);
    BOOST_CHECK_EQUAL(domainA.accounts->GetBalance(CONTRACT_A), 60);
    BOOST_CHECK_EQUAL(domainB.ledger->GetStats().pendingCount, 0U);
}

BOOST_AUTO_TEST_CASE(wrong_selector_never_releases)
{
    CallMsg call = CLinkedToken::BuildReceiveCall(BOB, 100);
    call.method = ParseHex("a9059cbb");
    const IpcEnvelope envelope = CallIntoB(IPCAddress::FromEvm(subnetA, CONTRACT_A), call);

    CValidationState state;
    BOOST_CHECK(!TokenB().HandleCall(envelope, call, state));
    BOOST_CHECK_EQUAL(state.GetRejectReason(), "bad-envelope-invalid-selector");
    BOOST_CHECK_EQUAL(domainB.accounts->GetTotalSupply(), 0);
}

BOOST_AUTO_TEST_CASE(three_byte_selector_is_short_not_undecodable)
{
    CallMsg call = CLinkedToken::BuildReceiveCall(BOB, 100);
    call.method.resize(3);
    const IpcEnvelope envelope = CallIntoB(IPCAddress::FromEvm(subnetA, CONTRACT_A), call);

    CValidationState state;
    BOOST_CHECK(!TokenB().HandleCall(envelope, call, state));
    BOOST_CHECK_EQUAL(state.GetRejectReason(), "bad-envelope-short-selector");
    BOOST_CHECK_EQUAL(domainB.accounts->GetTotalSupply(), 0);
}

BOOST_AUTO_TEST_CASE(unauthenticated_calls_are_rejected)
{
    const CallMsg call = CLinkedToken::BuildReceiveCall(BOB, 100);

    // Well formed payload, foreign subnet
    CValidationState subnetState;
    BOOST_CHECK(!TokenB().HandleCall(CallIntoB(IPCAddress::FromEvm(subnetB, CONTRACT_A), call), call, subnetState));
    BOOST_CHECK_EQUAL(subnetState.GetRejectReason(), "bad-envelope-origin-subnet");

    // Right subnet, foreign contract
    CValidationState contractState;
    BOOST_CHECK(!TokenB().HandleCall(CallIntoB(IPCAddress::FromEvm(subnetA, STRANGER), call), call, contractState));
    BOOST_CHECK_EQUAL(contractState.GetRejectReason(), "bad-envelope-origin-contract");

    BOOST_CHECK_EQUAL(domainB.accounts->GetTotalSupply(), 0);
}

BOOST_AUTO_TEST_CASE(inbound_call_payload_checks)
{
    const IPCAddress origin = IPCAddress::FromEvm(subnetA, CONTRACT_A);

    CallMsg call = CLinkedToken::BuildReceiveCall(BOB, 100);
    CValidationState valueState;
    BOOST_CHECK(!TokenB().HandleCall(CallIntoB(origin, call, 5), call, valueState));
    BOOST_CHECK_EQUAL(valueState.GetRejectReason(), "bad-envelope-nonzero-value");

    CallMsg truncated = call;
    truncated.params.pop_back();
    CValidationState decodeState;
    BOOST_CHECK(!TokenB().HandleCall(CallIntoB(origin, truncated), truncated, decodeState));
    BOOST_CHECK_EQUAL(decodeState.GetRejectReason(), "bad-envelope-decode");

    CallMsg zeroRecipient = CLinkedToken::BuildReceiveCall(uint160(), 100);
    CValidationState recipientState;
    BOOST_CHECK(!TokenB().HandleCall(CallIntoB(origin, zeroRecipient), zeroRecipient, recipientState));
    BOOST_CHECK_EQUAL(recipientState.GetRejectReason(), "bad-transfer-zero-recipient");

    CallMsg zeroAmount = CLinkedToken::BuildReceiveCall(BOB, 0);
    CValidationState amountState;
    BOOST_CHECK(!TokenB().HandleCall(CallIntoB(origin, zeroAmount), zeroAmount, amountState));
    BOOST_CHECK_EQUAL(amountState.GetRejectReason(), "bad-transfer-zero-amount");

    // A result envelope is not a call
    const IpcEnvelope result = IpcEnvelope::CreateResult(CallIntoB(origin, call), 0, OutcomeType::Ok, {});
    CValidationState kindState;
    BOOST_CHECK(!TokenB().HandleCall(result, call, kindState));
    BOOST_CHECK_EQUAL(kindState.GetRejectReason(), "bad-envelope-kind");

    BOOST_CHECK_EQUAL(domainB.accounts->GetTotalSupply(), 0);

    // Same origin, valid payload
    CValidationState okState;
    BOOST_CHECK(TokenB().HandleCall(CallIntoB(origin, call), call, okState));
    BOOST_CHECK_EQUAL(domainB.accounts->GetBalance(BOB), 100);
}

// =============================================================================
// Test 3: Inbound result
// =============================================================================
BOOST_AUTO_TEST_CASE(failure_result_refunds_initiator)
{
    Fund(ALICE, 1000);
    EventRecorder events;
    TokenA().Signals().RegisterInterface(&events);

    const IpcEnvelope call = Send(ALICE, BOB, 100);
    UnconfirmedTransfer pending;
    BOOST_REQUIRE(TokenA().GetUnconfirmedTransfer(call.GetHash(), pending));
    BOOST_CHECK(pending == UnconfirmedTransfer(ALICE, 100));

    IpcEnvelope dropped;
    BOOST_REQUIRE(transport.DropNext(dropped));
    transport.Enqueue(IpcEnvelope::CreateResult(call, 0, OutcomeType::ActorErr, {}));
    BOOST_CHECK(transport.DeliverNext());

    BOOST_CHECK_EQUAL(domainA.accounts->GetBalance(ALICE), 1000);
    BOOST_CHECK_EQUAL(domainA.accounts->GetBalance(CONTRACT_A), 0);
    BOOST_CHECK(!TokenA().GetUnconfirmedTransfer(call.GetHash(), pending));
    BOOST_REQUIRE_EQUAL(events.settled.size(), 1U);
    BOOST_CHECK(events.settled[0].fRefunded);
    BOOST_CHECK(events.settled[0].outcome == OutcomeType::ActorErr);

    TokenA().Signals().UnregisterAll();
}

BOOST_AUTO_TEST_CASE(destination_rejection_refunds_through_transport)
{
    Fund(ALICE, 1000);
    CValidationState state;
    // B now only trusts a different contract, so it rejects A's call
    BOOST_REQUIRE(TokenB().ReinitializeLink(OWNER, STRANGER, false, state));

    Send(ALICE, BOB, 250);
    BOOST_CHECK_EQUAL(domainA.accounts->GetBalance(ALICE), 750);
    transport.DeliverAll();

    BOOST_CHECK_EQUAL(domainA.accounts->GetBalance(ALICE), 1000);
    BOOST_CHECK_EQUAL(domainB.accounts->GetTotalSupply(), 0);
    BOOST_CHECK_EQUAL(PendingOnA(), 0U);
}

BOOST_AUTO_TEST_CASE(redelivered_result_cannot_double_refund)
{
    Fund(ALICE, 1000);
    const IpcEnvelope call = Send(ALICE, BOB, 100);
    IpcEnvelope dropped;
    BOOST_REQUIRE(transport.DropNext(dropped));

    const IpcEnvelope resultEnv = IpcEnvelope::CreateResult(call, 0, OutcomeType::SystemErr, {});
    ResultMsg result;
    BOOST_REQUIRE(resultEnv.DecodeResult(result));

    CValidationState first;
    BOOST_CHECK(TokenA().HandleResult(resultEnv, result, first));
    BOOST_CHECK_EQUAL(domainA.accounts->GetBalance(ALICE), 1000);

    CValidationState second;
    BOOST_CHECK(!TokenA().HandleResult(resultEnv, result, second));
    BOOST_CHECK(second.IsError());
    BOOST_CHECK_EQUAL(second.GetRejectReason(), "unconfirmed-transfer-missing");
    BOOST_CHECK_EQUAL(domainA.accounts->GetBalance(ALICE), 1000);
    BOOST_CHECK_EQUAL(domainA.accounts->GetTotalSupply(), 1000);

    // Through the transport as well
    transport.Enqueue(resultEnv);
    BOOST_CHECK(!transport.DeliverNext());
    BOOST_CHECK_EQUAL(domainA.accounts->GetBalance(ALICE), 1000);
}

BOOST_AUTO_TEST_CASE(redelivered_success_result_is_rejected)
{
    Fund(ALICE, 1000);
    Send(ALICE, BOB, 100);
    transport.DeliverNext();

    IpcEnvelope resultEnv;
    BOOST_REQUIRE(transport.PeekNext(resultEnv));
    BOOST_CHECK(transport.DeliverNext());
    transport.Enqueue(resultEnv);
    BOOST_CHECK(!transport.DeliverNext());

    BOOST_CHECK_EQUAL(domainA.accounts->GetBalance(ALICE), 900);
    BOOST_CHECK_EQUAL(domainA.accounts->GetBalance(CONTRACT_A), 100);
}

BOOST_AUTO_TEST_CASE(result_for_unknown_id_is_an_error)
{
    ResultMsg result;
    result.id = uint256S("0x01");
    result.outcome = OutcomeType::ActorErr;
    IpcEnvelope envelope;
    envelope.kind = IpcMsgKind::Result;
    envelope.from = IPCAddress::FromEvm(subnetB, CONTRACT_B);
    envelope.to = TokenA().GetAddress();

    CValidationState state;
    BOOST_CHECK(!TokenA().HandleResult(envelope, result, state));
    BOOST_CHECK(state.IsError());
    BOOST_CHECK_EQUAL(state.GetRejectReason(), "unconfirmed-transfer-missing");
}

BOOST_AUTO_TEST_CASE(forged_result_leaves_ledger_alone)
{
    Fund(ALICE, 1000);
    const IpcEnvelope call = Send(ALICE, BOB, 100);

    ResultMsg result;
    result.id = call.GetHash();
    result.outcome = OutcomeType::ActorErr;
    IpcEnvelope envelope;
    envelope.kind = IpcMsgKind::Result;
    envelope.from = IPCAddress::FromEvm(subnetB, STRANGER);
    envelope.to = TokenA().GetAddress();

    CValidationState state;
    BOOST_CHECK(!TokenA().HandleResult(envelope, result, state));
    BOOST_CHECK_EQUAL(state.GetRejectReason(), "bad-envelope-origin-contract");
    BOOST_CHECK_EQUAL(domainA.accounts->GetBalance(ALICE), 900);
    BOOST_CHECK_EQUAL(PendingOnA(), 1U);
}

// =============================================================================
// Test 4: Administrative surface
// =============================================================================
BOOST_AUTO_TEST_CASE(initialize_is_owner_only_and_once)
{
    CValidationState state;
    BOOST_CHECK(!TokenA().InitializeLink(OWNER, STRANGER, state));
    BOOST_CHECK_EQUAL(state.GetRejectReason(), "linked-already-initialized");
    BOOST_CHECK_EQUAL(state.GetRejectCode(), REJECT_DUPLICATE);
    BOOST_CHECK(TokenA().GetLinkConfig().linkedContract == CONTRACT_B);
}

BOOST_AUTO_TEST_CASE(reinitialize_guards_pending_transfers)
{
    Fund(ALICE, 1000);
    EventRecorder events;
    TokenA().Signals().RegisterInterface(&events);

    CValidationState stranger;
    BOOST_CHECK(!TokenA().ReinitializeLink(ALICE, STRANGER, true, stranger));
    BOOST_CHECK_EQUAL(stranger.GetRejectReason(), "bad-link-owner-only");

    Send(ALICE, BOB, 100);
    CValidationState pending;
    BOOST_CHECK(!TokenA().ReinitializeLink(OWNER, STRANGER, false, pending));
    BOOST_CHECK_EQUAL(pending.GetRejectReason(), "linked-transfers-pending");
    BOOST_CHECK(TokenA().GetLinkConfig().linkedContract == CONTRACT_B);

    CValidationState forced;
    BOOST_CHECK(TokenA().ReinitializeLink(OWNER, STRANGER, true, forced));
    BOOST_CHECK(TokenA().GetLinkConfig().linkedContract == STRANGER);
    BOOST_REQUIRE_EQUAL(events.links.size(), 1U);
    BOOST_CHECK(events.links[0].linkedContract == STRANGER);

    // The in-flight result no longer authenticates
    transport.DeliverAll();
    BOOST_CHECK_EQUAL(PendingOnA(), 1U);

    TokenA().Signals().UnregisterAll();
}

BOOST_AUTO_TEST_CASE(remove_unconfirmed_transfer)
{
    Fund(ALICE, 1000);
    EventRecorder events;
    TokenA().Signals().RegisterInterface(&events);

    const IpcEnvelope call = Send(ALICE, BOB, 100);
    const uint256 id = call.GetHash();

    UnconfirmedTransfer removed;
    CValidationState notOwner;
    BOOST_CHECK(!TokenA().RemoveUnconfirmedTransfer(ALICE, id, removed, notOwner));
    BOOST_CHECK_EQUAL(notOwner.GetRejectReason(), "bad-link-owner-only");
    BOOST_CHECK_EQUAL(notOwner.GetRejectCode(), REJECT_UNAUTHORIZED);

    CValidationState state;
    BOOST_CHECK(TokenA().RemoveUnconfirmedTransfer(OWNER, id, removed, state));
    BOOST_CHECK(removed.initiator == ALICE);
    BOOST_CHECK_EQUAL(removed.amount, 100);
    BOOST_CHECK_EQUAL(PendingOnA(), 0U);
    // No compensation
    BOOST_CHECK_EQUAL(domainA.accounts->GetBalance(ALICE), 900);
    BOOST_REQUIRE_EQUAL(events.removed.size(), 1U);
    BOOST_CHECK(events.removed[0] == id);

    CValidationState again;
    BOOST_CHECK(!TokenA().RemoveUnconfirmedTransfer(OWNER, id, removed, again));
    BOOST_CHECK_EQUAL(again.GetRejectReason(), "unconfirmed-transfer-not-found");

    // The late failure result finds nothing to refund
    IpcEnvelope dropped;
    BOOST_REQUIRE(transport.DropNext(dropped));
    transport.Enqueue(IpcEnvelope::CreateResult(call, 0, OutcomeType::ActorErr, {}));
    BOOST_CHECK(!transport.DeliverNext());
    BOOST_CHECK_EQUAL(domainA.accounts->GetBalance(ALICE), 900);

    TokenA().Signals().UnregisterAll();
}

// =============================================================================
// Test 5: Link persistence
// =============================================================================
BOOST_AUTO_TEST_CASE(link_config_is_restored)
{
    CLinkedToken restored(OWNER, TokenA().GetAddress(), UNDERLYING, subnetB, *domainA.custody, transport, *domainA.ledger);
    BOOST_CHECK(!restored.IsInitialized());
    CValidationState state;
    BOOST_CHECK(restored.LoadLinkConfig(state));
    BOOST_CHECK(restored.IsInitialized());
    BOOST_CHECK(restored.GetLinkConfig().linkedContract == CONTRACT_B);

    CLinkedToken mismatched(OWNER, TokenA().GetAddress(), STRANGER, subnetB, *domainA.custody, transport, *domainA.ledger);
    CValidationState mismatch;
    BOOST_CHECK(!mismatched.LoadLinkConfig(mismatch));
    BOOST_CHECK(mismatch.IsError());
    BOOST_CHECK_EQUAL(mismatch.GetRejectReason(), "linked-config-mismatch");
}

BOOST_AUTO_TEST_SUITE_END()

BOOST_FIXTURE_TEST_SUITE(linkedtoken_unlinked_tests, UnlinkedTestingSetup)

BOOST_AUTO_TEST_CASE(nothing_moves_before_initialization)
{
    Fund(ALICE, 1000);
    IpcEnvelope envelope;
    CValidationState state;
    BOOST_CHECK(!TokenA().LinkedTransfer(ALICE, BOB, 100, envelope, state));
    BOOST_CHECK_EQUAL(state.GetRejectReason(), "linked-not-initialized");
    BOOST_CHECK_EQUAL(state.GetRejectCode(), REJECT_NOT_INITIALIZED);
    BOOST_CHECK_EQUAL(domainA.accounts->GetBalance(ALICE), 1000);

    const CallMsg call = CLinkedToken::BuildReceiveCall(BOB, 100);
    const IpcEnvelope inbound = IpcEnvelope::CreateCall(IPCAddress::FromEvm(subnetA, CONTRACT_A), TokenB().GetAddress(), 0, 0, call);
    CValidationState callState;
    BOOST_CHECK(!TokenB().HandleCall(inbound, call, callState));
    BOOST_CHECK_EQUAL(callState.GetRejectReason(), "linked-not-initialized");
    BOOST_CHECK_EQUAL(domainB.accounts->GetTotalSupply(), 0);
}

BOOST_AUTO_TEST_CASE(initialize_checks)
{
    EventRecorder events;
    TokenA().Signals().RegisterInterface(&events);

    CValidationState notOwner;
    BOOST_CHECK(!TokenA().InitializeLink(ALICE, CONTRACT_B, notOwner));
    BOOST_CHECK_EQUAL(notOwner.GetRejectReason(), "bad-link-owner-only");

    CValidationState zero;
    BOOST_CHECK(!TokenA().InitializeLink(OWNER, uint160(), zero));
    BOOST_CHECK_EQUAL(zero.GetRejectReason(), "bad-link-zero-contract");
    BOOST_CHECK(!TokenA().IsInitialized());
    BOOST_CHECK(events.links.empty());

    CValidationState state;
    BOOST_CHECK(TokenA().InitializeLink(OWNER, CONTRACT_B, state));
    BOOST_CHECK(TokenA().IsInitialized());
    BOOST_REQUIRE_EQUAL(events.links.size(), 1U);
    BOOST_CHECK(events.links[0].underlying == UNDERLYING);
    BOOST_CHECK(events.links[0].linkedSubnet == subnetB);
    BOOST_CHECK(events.links[0].linkedContract == CONTRACT_B);

    LinkConfig stored;
    BOOST_CHECK(domainA.ledger->ReadLinkConfig(stored));
    BOOST_CHECK(stored.linkedContract == CONTRACT_B);

    TokenA().Signals().UnregisterAll();
}

BOOST_AUTO_TEST_SUITE_END()
