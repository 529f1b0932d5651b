// Copyright (c) 2026 The LinkedToken developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#ifndef LINKEDTOKEN_GMP_ADDRESS_H
#define LINKEDTOKEN_GMP_ADDRESS_H

#include "gmp/subnet.h"
#include "serialize.h"
#include "uint256.h"

#include <stdint.h>
#include <string>
#include <vector>

/** FVM address protocols (first byte of an FVM address) */
enum FvmAddressProtocol : uint8_t {
    FVM_PROTOCOL_ID = 0,
    FVM_PROTOCOL_SECP256K1 = 1,
    FVM_PROTOCOL_ACTOR = 2,
    FVM_PROTOCOL_BLS = 3,
    FVM_PROTOCOL_DELEGATED = 4,
};

//! Address manager namespace that owns delegated EVM addresses (f410...).
static const uint64_t EAM_ACTOR_NAMESPACE = 10;

/**
 * FvmAddress - Transport-side address representation
 *
 * An EVM address is carried on the transport as a delegated address:
 *   protocol = FVM_PROTOCOL_DELEGATED
 *   payload  = LEB128(EAM_ACTOR_NAMESPACE) || 20 byte EVM address
 *
 * Authentication compares FvmAddress values, so every EVM address must go
 * through FromEvmAddress() before it is compared against an envelope.
 */
class FvmAddress
{
public:
    uint8_t protocol;
    std::vector<unsigned char> payload;

    FvmAddress() : protocol(FVM_PROTOCOL_ID) {}
    FvmAddress(uint8_t protocolIn, const std::vector<unsigned char>& payloadIn) : protocol(protocolIn), payload(payloadIn) {}

    SERIALIZE_METHODS(FvmAddress, obj)
    {
        READWRITE(obj.protocol, obj.payload);
    }

    bool IsNull() const { return protocol == FVM_PROTOCOL_ID && payload.empty(); }

    /** Normalize an EVM address into its delegated f410 form. */
    static FvmAddress FromEvmAddress(const uint160& evmAddress);

    /**
     * Extract the EVM address back out of a delegated f410 address.
     * @return false if this is not a delegated EAM address
     */
    bool GetEvmAddress(uint160& evmAddress) const;

    std::string ToString() const;

    friend bool operator==(const FvmAddress& a, const FvmAddress& b)
    {
        return a.protocol == b.protocol && a.payload == b.payload;
    }
    friend bool operator!=(const FvmAddress& a, const FvmAddress& b) { return !(a == b); }
};

/** IPCAddress - An FVM address qualified by the domain it lives in */
class IPCAddress
{
public:
    SubnetID subnetId;
    FvmAddress rawAddress;

    IPCAddress() {}
    IPCAddress(const SubnetID& subnetIn, const FvmAddress& rawIn) : subnetId(subnetIn), rawAddress(rawIn) {}

    SERIALIZE_METHODS(IPCAddress, obj)
    {
        READWRITE(obj.subnetId, obj.rawAddress);
    }

    //! Convenience for an EVM contract living in the given domain.
    static IPCAddress FromEvm(const SubnetID& subnet, const uint160& evmAddress)
    {
        return IPCAddress(subnet, FvmAddress::FromEvmAddress(evmAddress));
    }

    bool IsNull() const { return subnetId.IsNull() && rawAddress.IsNull(); }

    //! "<subnet>:<address>", also used as a map key by the loopback transport
    std::string ToString() const;

    friend bool operator==(const IPCAddress& a, const IPCAddress& b)
    {
        return a.subnetId == b.subnetId && a.rawAddress == b.rawAddress;
    }
    friend bool operator!=(const IPCAddress& a, const IPCAddress& b) { return !(a == b); }
};

#endif // LINKEDTOKEN_GMP_ADDRESS_H
