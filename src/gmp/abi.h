// Copyright (c) 2026 The LinkedToken developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#ifndef LINKEDTOKEN_GMP_ABI_H
#define LINKEDTOKEN_GMP_ABI_H

/**
 * Minimal Solidity ABI codec
 *
 * Only the static head types the transfer protocol needs: address and
 * uint256, each one 32 byte big-endian word. Amounts travel as uint256 on
 * the wire but are CAmount (int64) in memory, so decoding rejects any word
 * above the int64 range.
 */

#include "amount.h"
#include "uint256.h"

#include <string>
#include <vector>

static const size_t ABI_WORD_SIZE = 32;
static const size_t ABI_SELECTOR_SIZE = 4;

/** First 4 bytes of Keccak-256 over a canonical method signature. */
std::vector<unsigned char> ComputeSelector(const std::string& signature);

void AbiEncodeAddress(std::vector<unsigned char>& out, const uint160& address);
void AbiEncodeAmount(std::vector<unsigned char>& out, CAmount amount);

/**
 * Decode one address word at `offset`.
 * @return false if the data is short or the 12 padding bytes are not zero
 */
bool AbiDecodeAddress(const std::vector<unsigned char>& data, size_t offset, uint160& address);

/**
 * Decode one uint256 word at `offset` into a CAmount.
 * @return false if the data is short or the value exceeds the int64 range
 */
bool AbiDecodeAmount(const std::vector<unsigned char>& data, size_t offset, CAmount& amount);

#endif // LINKEDTOKEN_GMP_ABI_H
