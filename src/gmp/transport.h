// Copyright (c) 2026 The LinkedToken developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#ifndef LINKEDTOKEN_GMP_TRANSPORT_H
#define LINKEDTOKEN_GMP_TRANSPORT_H

#include "amount.h"
#include "gmp/envelope.h"

class CValidationState;

/**
 * CGmpReceiver - Inbound side of the transport
 *
 * The transport authenticates nothing beyond the claimed origin; receivers
 * check origin subnet and contract themselves. A receiver returning false
 * rejects the envelope and leaves its state untouched.
 */
class CGmpReceiver
{
public:
    virtual ~CGmpReceiver() {}

    virtual bool HandleCall(const IpcEnvelope& envelope, const CallMsg& call, CValidationState& state) = 0;
    virtual bool HandleResult(const IpcEnvelope& envelope, const ResultMsg& result, CValidationState& state) = 0;
};

/**
 * CGmpTransport - Outbound side of the transport
 *
 * Dispatch assigns the sender's next nonce, builds the call envelope and
 * accepts it for delivery. The returned envelope's GetHash() is the
 * identifier its result will carry.
 */
class CGmpTransport
{
public:
    virtual ~CGmpTransport() {}

    virtual bool Dispatch(const IPCAddress& from, const IPCAddress& to, const CallMsg& call, CAmount value,
                          IpcEnvelope& envelope, CValidationState& state) = 0;
};

#endif // LINKEDTOKEN_GMP_TRANSPORT_H
