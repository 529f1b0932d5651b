// Copyright (c) 2026 The LinkedToken developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#ifndef LINKEDTOKEN_LINKEDTOKEN_LINKEDTOKEN_H
#define LINKEDTOKEN_LINKEDTOKEN_LINKEDTOKEN_H

/**
 * CLinkedToken - One side of a linked token pair
 *
 * Origin side:
 *   LinkedTransfer   Capture -> Dispatch(receiveLinked) -> ledger insert
 *   HandleResult     Ok: erase record
 *                    SystemErr/ActorErr: Release(initiator) then erase record
 *
 * Destination side:
 *   HandleCall       authenticate -> decode -> Release(recipient)
 *
 * Every entry point is all-or-nothing: when it returns false through an
 * Invalid state nothing was changed. An Error state means an invariant
 * broke (e.g. a result for an id that was never pending) and is logged.
 *
 * Lock order: cs_ledger before cs_link. cs_settling is only held while
 * claiming or releasing an id, never across other work.
 */

#include "amount.h"
#include "gmp/transport.h"
#include "linkedtoken/signals.h"
#include "linkedtoken/transfer.h"
#include "sync.h"
#include "uint256.h"

#include <condition_variable>
#include <set>
#include <vector>

class CValidationState;
class CUnconfirmedTransferDB;
class ICustodyStrategy;

class CLinkedToken : public CGmpReceiver
{
private:
    const uint160 owner;
    const IPCAddress self;

    ICustodyStrategy& custody;
    CGmpTransport& transport;
    CUnconfirmedTransferDB& ledger;

    mutable Mutex cs_link;
    LinkConfig link;

    //! Serializes dispatch + insert against settlement lookups
    mutable RecursiveMutex cs_ledger;

    //! Ids currently being settled or removed
    Mutex cs_settling;
    std::condition_variable condSettling;
    std::set<uint256> setSettling;

    CLinkedTokenSignals signals;

    friend class SettlementClaim;

    void ClaimSettlement(const uint256& id);
    void FinishSettlement(const uint256& id);

    bool GetInitializedLink(LinkConfig& linkOut, CValidationState& state) const;
    bool CheckOwner(const uint160& caller, CValidationState& state) const;
    bool SetLinkedContract(const uint160& linkedContract, CValidationState& state);

public:
    CLinkedToken(const uint160& ownerIn, const IPCAddress& selfIn, const uint160& underlying, const SubnetID& linkedSubnet,
                 ICustodyStrategy& custodyIn, CGmpTransport& transportIn, CUnconfirmedTransferDB& ledgerIn);

    /**
     * Restore the link contract persisted by an earlier run.
     * Fails if the stored underlying or linked subnet differ from ours.
     */
    bool LoadLinkConfig(CValidationState& state);

    // === Administrative surface (owner only) ===

    /**
     * InitializeLink - Set the linked contract once
     * @return false with linked-already-initialized on a second call
     */
    bool InitializeLink(const uint160& caller, const uint160& linkedContract, CValidationState& state);

    /**
     * ReinitializeLink - Point the link at a new contract
     *
     * Results still in flight would authenticate against the new contract,
     * so this refuses while the ledger holds pending transfers unless
     * fForce is set.
     */
    bool ReinitializeLink(const uint160& caller, const uint160& linkedContract, bool fForce, CValidationState& state);

    /**
     * RemoveUnconfirmedTransfer - Drop a pending record without refund
     * Audited through the log and UnconfirmedTransferRemoved.
     *
     * @param transfer Output: the record that was removed
     */
    bool RemoveUnconfirmedTransfer(const uint160& caller, const uint256& id, UnconfirmedTransfer& transfer,
                                   CValidationState& state);

    // === Transfer protocol ===

    /**
     * LinkedTransfer - Capture `amount` from `caller` and send it to
     * `recipient` on the linked subnet.
     *
     * @param envelope Output: the dispatched call, GetHash() is the ledger key
     */
    bool LinkedTransfer(const uint160& caller, const uint160& recipient, CAmount amount,
                        IpcEnvelope& envelope, CValidationState& state);

    bool HandleCall(const IpcEnvelope& envelope, const CallMsg& call, CValidationState& state) override;
    bool HandleResult(const IpcEnvelope& envelope, const ResultMsg& result, CValidationState& state) override;

    // === Queries ===

    LinkConfig GetLinkConfig() const;
    bool IsInitialized() const;
    bool GetUnconfirmedTransfer(const uint256& id, UnconfirmedTransfer& transfer) const;

    const uint160& GetOwner() const { return owner; }
    const IPCAddress& GetAddress() const { return self; }
    ICustodyStrategy& GetCustody() { return custody; }
    CUnconfirmedTransferDB& GetLedger() { return ledger; }
    CLinkedTokenSignals& Signals() { return signals; }

    //! Selector of receiveLinked(address,uint256)
    static std::vector<unsigned char> GetReceiveSelector();

    //! Recipient and amount rules shared by both sides
    static bool CheckTransferParams(const uint160& recipient, CAmount amount, CValidationState& state);

    //! receiveLinked(recipient, amount) call payload
    static CallMsg BuildReceiveCall(const uint160& recipient, CAmount amount);
};

#endif // LINKEDTOKEN_LINKEDTOKEN_LINKEDTOKEN_H
