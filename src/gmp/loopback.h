// Copyright (c) 2026 The LinkedToken developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#ifndef LINKEDTOKEN_GMP_LOOPBACK_H
#define LINKEDTOKEN_GMP_LOOPBACK_H

/**
 * CLoopbackTransport - In-process GMP transport
 *
 * Joins receivers living in the same process. Envelopes are queued on
 * Dispatch and delivered in FIFO order by DeliverNext / DeliverAll:
 *
 *   Call   -> receiver at envelope.to
 *             Ok        handler accepted
 *             ActorErr  handler rejected (ret = reject reason)
 *             SystemErr no receiver registered, or handler hit an internal error
 *             the result envelope is queued back to envelope.from
 *   Result -> receiver at envelope.to, no further receipt
 *
 * Every envelope is delivered at most once.
 */

#include "gmp/transport.h"
#include "sync.h"

#include <deque>
#include <map>
#include <string>

class CLoopbackTransport : public CGmpTransport
{
private:
    mutable Mutex cs_loopback;
    std::map<std::string, CGmpReceiver*> mapReceivers;
    std::map<std::string, uint64_t> mapNonces;
    std::deque<IpcEnvelope> queue;

    uint64_t nDelivered{0};
    uint64_t nRejected{0};

    uint64_t NextNonce(const IPCAddress& from);
    CGmpReceiver* FindReceiver(const IPCAddress& to) const;

public:
    /** Route envelopes addressed to `address` to `receiver`. Not owned. */
    void RegisterReceiver(const IPCAddress& address, CGmpReceiver* receiver);
    void UnregisterReceiver(const IPCAddress& address);

    bool Dispatch(const IPCAddress& from, const IPCAddress& to, const CallMsg& call, CAmount value,
                  IpcEnvelope& envelope, CValidationState& state) override;

    /** Queue an already built envelope, e.g. a redelivery or a forged one. */
    void Enqueue(const IpcEnvelope& envelope);

    //! Drop the next queued envelope without delivering it
    bool DropNext(IpcEnvelope& dropped);

    /**
     * Deliver the oldest queued envelope.
     * @return false if the queue was empty or the receiver rejected it
     */
    bool DeliverNext();

    /** Deliver until the queue is empty (results queued on the way included). */
    size_t DeliverAll();

    size_t GetQueueSize() const;
    bool PeekNext(IpcEnvelope& envelope) const;
    uint64_t GetDeliveredCount() const;
    uint64_t GetRejectedCount() const;
};

#endif // LINKEDTOKEN_GMP_LOOPBACK_H
