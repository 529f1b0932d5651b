// Copyright (c) 2026 The LinkedToken developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "gmp/address.h"

#include "utilstrencodings.h"

namespace {

void WriteLeb128(std::vector<unsigned char>& out, uint64_t n)
{
    do {
        unsigned char b = n & 0x7f;
        n >>= 7;
        if (n != 0) b |= 0x80;
        out.push_back(b);
    } while (n != 0);
}

// Returns the number of bytes consumed, 0 on malformed input
size_t ReadLeb128(const std::vector<unsigned char>& in, uint64_t& n)
{
    n = 0;
    for (size_t i = 0; i < in.size() && i < 10; i++) {
        n |= (uint64_t)(in[i] & 0x7f) << (7 * i);
        if ((in[i] & 0x80) == 0)
            return i + 1;
    }
    return 0;
}

} // anonymous namespace

FvmAddress FvmAddress::FromEvmAddress(const uint160& evmAddress)
{
    std::vector<unsigned char> payload;
    WriteLeb128(payload, EAM_ACTOR_NAMESPACE);
    payload.insert(payload.end(), evmAddress.begin(), evmAddress.end());
    return FvmAddress(FVM_PROTOCOL_DELEGATED, payload);
}

bool FvmAddress::GetEvmAddress(uint160& evmAddress) const
{
    if (protocol != FVM_PROTOCOL_DELEGATED)
        return false;

    uint64_t ns = 0;
    size_t nLen = ReadLeb128(payload, ns);
    if (nLen == 0 || ns != EAM_ACTOR_NAMESPACE)
        return false;
    if (payload.size() - nLen != evmAddress.size())
        return false;

    evmAddress = uint160(std::vector<unsigned char>(payload.begin() + nLen, payload.end()));
    return true;
}

std::string FvmAddress::ToString() const
{
    uint160 evm;
    if (GetEvmAddress(evm)) {
        return strprintf("f4%u-%s", EAM_ACTOR_NAMESPACE, evm.ToString());
    }
    return strprintf("f%u-%s", protocol, HexStr(payload));
}

std::string IPCAddress::ToString() const
{
    return subnetId.ToString() + ":" + rawAddress.ToString();
}
