// Copyright (c) 2009-2010 Satoshi Nakamoto
// Copyright (c) 2009-2015 The Bitcoin Core developers
// Copyright (c) 2026 The LinkedToken developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#ifndef LINKEDTOKEN_LINKEDTOKEN_SIGNALS_H
#define LINKEDTOKEN_LINKEDTOKEN_SIGNALS_H

#include "linkedtoken/transfer.h"

#include <memory>

class CLinkedTokenSignals;

/**
 * Implement this to subscribe to events generated by a CLinkedToken.
 *
 * Callbacks run synchronously on the thread that completed the operation,
 * after its state change is committed.
 */
class CLinkedTokenInterface
{
public:
    virtual ~CLinkedTokenInterface() {}

protected:
    /** Link contract set by the owner, also fired on a reinitialize. */
    virtual void LinkInitialized(const LinkConfig& link) {}
    virtual void TransferSent(const LinkedTransferSent& sent) {}
    virtual void TransferReceived(const LinkedTransferReceived& received) {}
    virtual void TransferSettled(const LinkedTransferSettled& settled) {}
    /** Owner removed a pending record without settlement. */
    virtual void UnconfirmedTransferRemoved(const uint256& id, const UnconfirmedTransfer& transfer, const uint160& removedBy) {}

    friend class CLinkedTokenSignals;
};

struct LinkedTokenSignalsInstance;

/** Per instance signal set, listeners are not owned. */
class CLinkedTokenSignals
{
private:
    std::unique_ptr<LinkedTokenSignalsInstance> m_internals;

public:
    CLinkedTokenSignals();
    ~CLinkedTokenSignals();

    void RegisterInterface(CLinkedTokenInterface* pif);
    void UnregisterInterface(CLinkedTokenInterface* pif);
    void UnregisterAll();

    void LinkInitialized(const LinkConfig& link);
    void TransferSent(const LinkedTransferSent& sent);
    void TransferReceived(const LinkedTransferReceived& received);
    void TransferSettled(const LinkedTransferSettled& settled);
    void UnconfirmedTransferRemoved(const uint256& id, const UnconfirmedTransfer& transfer, const uint160& removedBy);
};

#endif // LINKEDTOKEN_LINKEDTOKEN_SIGNALS_H
