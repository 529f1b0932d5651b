// Copyright (c) 2026 The LinkedToken developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "gmp/abi.h"

#include "hash.h"

#include <limits>

std::vector<unsigned char> ComputeSelector(const std::string& signature)
{
    uint256 hash = KeccakHash(signature);
    return std::vector<unsigned char>(hash.begin(), hash.begin() + ABI_SELECTOR_SIZE);
}

void AbiEncodeAddress(std::vector<unsigned char>& out, const uint160& address)
{
    out.insert(out.end(), ABI_WORD_SIZE - address.size(), 0);
    out.insert(out.end(), address.begin(), address.end());
}

void AbiEncodeAmount(std::vector<unsigned char>& out, CAmount amount)
{
    // Negative amounts never reach the wire, callers validate first
    uint64_t n = static_cast<uint64_t>(amount);
    out.insert(out.end(), ABI_WORD_SIZE - 8, 0);
    for (int i = 7; i >= 0; i--) {
        out.push_back((n >> (8 * i)) & 0xff);
    }
}

bool AbiDecodeAddress(const std::vector<unsigned char>& data, size_t offset, uint160& address)
{
    if (offset > data.size() || data.size() - offset < ABI_WORD_SIZE)
        return false;

    const size_t nPad = ABI_WORD_SIZE - address.size();
    for (size_t i = 0; i < nPad; i++) {
        if (data[offset + i] != 0)
            return false;
    }
    address = uint160(std::vector<unsigned char>(data.begin() + offset + nPad, data.begin() + offset + ABI_WORD_SIZE));
    return true;
}

bool AbiDecodeAmount(const std::vector<unsigned char>& data, size_t offset, CAmount& amount)
{
    if (offset > data.size() || data.size() - offset < ABI_WORD_SIZE)
        return false;

    for (size_t i = 0; i < ABI_WORD_SIZE - 8; i++) {
        if (data[offset + i] != 0)
            return false;
    }
    uint64_t n = 0;
    for (size_t i = ABI_WORD_SIZE - 8; i < ABI_WORD_SIZE; i++) {
        n = (n << 8) | data[offset + i];
    }
    if (n > (uint64_t)std::numeric_limits<CAmount>::max())
        return false;

    amount = static_cast<CAmount>(n);
    return true;
}
