// Copyright (c) 2026 The LinkedToken developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#ifndef LINKEDTOKEN_LINKEDTOKEN_TRANSFER_H
#define LINKEDTOKEN_LINKEDTOKEN_TRANSFER_H

/**
 * Linked token transfer records
 *
 * A linked token pair is two instances on two domains, each pointing at the
 * other through its LinkConfig. A transfer captures value on the origin,
 * dispatches receiveLinked(recipient, amount) to the linked contract and
 * parks an UnconfirmedTransfer under the envelope id until the result comes
 * back:
 *
 *   None --LinkedTransfer--> Pending --HandleResult(Ok)-------> Settled
 *                                    --HandleResult(failure)--> Settled + refund
 *                                    --owner override--------> Settled
 *
 * Settled records are erased; there are no tombstones.
 *
 * DB Keys:
 * 'U' + id -> UnconfirmedTransfer
 * 'I' + initiator + id -> marker (per initiator index)
 * 'K' -> LinkConfig
 */

#include "amount.h"
#include "gmp/envelope.h"
#include "gmp/subnet.h"
#include "serialize.h"
#include "uint256.h"
#include "version.h"

#include <stdint.h>
#include <string>

// DB Key prefixes
static const char DB_UNCONFIRMED = 'U';           // UnconfirmedTransfer by envelope id
static const char DB_UNCONFIRMED_INITIATOR = 'I'; // Ids by initiator (index)
static const char DB_LINK_CONFIG = 'K';           // Persisted link configuration

//! Method invoked on the linked contract for every transfer
static const char* const LINKED_RECEIVE_SIGNATURE = "receiveLinked(address,uint256)";

/**
 * UnconfirmedTransfer - Origin side record of a dispatched transfer
 *
 * Existence means the initiator's value was captured and neither settled
 * nor refunded yet.
 */
struct UnconfirmedTransfer
{
    uint8_t nVersion{LEDGER_RECORD_VERSION};
    uint160 initiator;
    CAmount amount{0};

    UnconfirmedTransfer() {}
    UnconfirmedTransfer(const uint160& initiatorIn, CAmount amountIn) : initiator(initiatorIn), amount(amountIn) {}

    SERIALIZE_METHODS(UnconfirmedTransfer, obj)
    {
        READWRITE(obj.nVersion, obj.initiator, obj.amount);
    }

    bool IsNull() const { return initiator.IsNull() && amount == 0; }

    friend bool operator==(const UnconfirmedTransfer& a, const UnconfirmedTransfer& b)
    {
        return a.initiator == b.initiator && a.amount == b.amount;
    }
};

/**
 * LinkConfig - Where the paired instance lives
 *
 * underlying and linkedSubnet are fixed at construction; linkedContract is
 * null until the owner initializes the link.
 */
struct LinkConfig
{
    uint160 underlying;
    SubnetID linkedSubnet;
    uint160 linkedContract;

    SERIALIZE_METHODS(LinkConfig, obj)
    {
        READWRITE(obj.underlying, obj.linkedSubnet, obj.linkedContract);
    }

    bool IsInitialized() const { return !linkedContract.IsNull(); }

    std::string ToString() const;
};

// === Events ===

struct LinkedTransferSent
{
    uint160 underlying;
    uint160 initiator;
    uint160 recipient;
    uint256 id;
    uint64_t nonce{0};
    CAmount amount{0};
};

struct LinkedTransferReceived
{
    uint160 recipient;
    CAmount amount{0};
    uint256 id;
};

struct LinkedTransferSettled
{
    uint256 id;
    UnconfirmedTransfer transfer;
    OutcomeType outcome{OutcomeType::Ok};
    bool fRefunded{false};
};

#endif // LINKEDTOKEN_LINKEDTOKEN_TRANSFER_H
