// Copyright (c) 2020 The Bitcoin Core developers
// Copyright (c) 2026 The LinkedToken developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#ifndef LINKEDTOKEN_CRYPTO_KECCAK_H
#define LINKEDTOKEN_CRYPTO_KECCAK_H

#include <stdint.h>
#include <stdlib.h>

//! The Keccak-f[1600] transform.
void KeccakF(uint64_t (&st)[25]);

/**
 * Keccak-256 with the original (pre-FIPS 202) 0x01 domain padding.
 *
 * This is the hash EVM-family domains use for method selectors and event
 * topics. It is NOT SHA3-256, which pads with 0x06.
 */
class CKeccak256
{
private:
    uint64_t m_state[25] = {0};
    unsigned char m_buffer[8];
    unsigned m_bufsize = 0;
    unsigned m_pos = 0;

    //! Sponge rate in bits.
    static constexpr unsigned RATE_BITS = 1088;

    //! Sponge rate expressed as a multiple of the buffer size.
    static constexpr unsigned RATE_BUFFERS = RATE_BITS / (8 * sizeof(m_buffer));

    static_assert(RATE_BITS % (8 * sizeof(m_buffer)) == 0, "Rate must be a multiple of 8 bytes");

public:
    static constexpr size_t OUTPUT_SIZE = 32;

    CKeccak256() {}
    CKeccak256& Write(const unsigned char* data, size_t len);
    void Finalize(unsigned char hash[OUTPUT_SIZE]);
    CKeccak256& Reset();
};

#endif // LINKEDTOKEN_CRYPTO_KECCAK_H
