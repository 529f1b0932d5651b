// Copyright (c) 2026 The LinkedToken developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#ifndef LINKEDTOKEN_GMP_ENVELOPE_H
#define LINKEDTOKEN_GMP_ENVELOPE_H

/**
 * IPC envelopes
 *
 * An envelope is the unit the transport carries between domains. Its
 * identifier is the Keccak-256 of its serialization, so two envelopes are
 * the same message iff every field matches. Results refer back to the call
 * they answer through that identifier.
 *
 *   Call:    from=origin contract, to=linked contract, message=CallMsg
 *   Result:  from=linked contract, to=origin contract, message=ResultMsg
 */

#include "amount.h"
#include "gmp/address.h"
#include "serialize.h"
#include "uint256.h"

#include <stdint.h>
#include <string>
#include <vector>

enum class IpcMsgKind : uint8_t {
    Transfer = 0,   //!< Plain value transfer, no payload
    Call = 1,       //!< Method call carrying a CallMsg
    Result = 2,     //!< Receipt for an earlier call carrying a ResultMsg
};

enum class OutcomeType : uint8_t {
    Ok = 0,         //!< Destination executed the call
    SystemErr = 1,  //!< Transport or runtime failure before execution
    ActorErr = 2,   //!< Destination handler rejected the call
};

std::string IpcMsgKindToString(IpcMsgKind kind);
std::string OutcomeTypeToString(OutcomeType outcome);

/** Call payload: 4 byte method selector and ABI encoded arguments */
struct CallMsg
{
    std::vector<unsigned char> method;
    std::vector<unsigned char> params;

    SERIALIZE_METHODS(CallMsg, obj)
    {
        READWRITE(obj.method, obj.params);
    }
};

/** Result payload correlated to a call envelope by its identifier */
struct ResultMsg
{
    uint256 id;
    OutcomeType outcome{OutcomeType::Ok};
    std::vector<unsigned char> ret;

    SERIALIZE_METHODS(ResultMsg, obj)
    {
        uint8_t nOutcome = static_cast<uint8_t>(obj.outcome);
        READWRITE(obj.id, nOutcome, obj.ret);
        SER_READ(obj, obj.outcome = static_cast<OutcomeType>(nOutcome));
    }

    bool IsSuccess() const { return outcome == OutcomeType::Ok; }
};

class IpcEnvelope
{
public:
    IpcMsgKind kind{IpcMsgKind::Transfer};
    IPCAddress from;
    IPCAddress to;
    uint64_t nonce{0};
    CAmount value{0};
    std::vector<unsigned char> message;

    SERIALIZE_METHODS(IpcEnvelope, obj)
    {
        uint8_t nKind = static_cast<uint8_t>(obj.kind);
        READWRITE(nKind, obj.from, obj.to, obj.nonce, obj.value, obj.message);
        SER_READ(obj, obj.kind = static_cast<IpcMsgKind>(nKind));
    }

    /** Envelope identifier, Keccak-256 over the serialized envelope. */
    uint256 GetHash() const;

    bool IsCall() const { return kind == IpcMsgKind::Call; }
    bool IsResult() const { return kind == IpcMsgKind::Result; }

    static IpcEnvelope CreateCall(const IPCAddress& from, const IPCAddress& to, uint64_t nonce, CAmount value, const CallMsg& call);

    /** Build the receipt for `call`, addressed back to its sender. */
    static IpcEnvelope CreateResult(const IpcEnvelope& call, uint64_t nonce, OutcomeType outcome, const std::vector<unsigned char>& ret);

    //! Decode the payload; false if the kind does not match or the bytes are malformed
    bool DecodeCall(CallMsg& call) const;
    bool DecodeResult(ResultMsg& result) const;

    std::string ToString() const;
};

#endif // LINKEDTOKEN_GMP_ENVELOPE_H
