// Copyright (c) 2020 The Bitcoin Core developers
// Copyright (c) 2026 The LinkedToken developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

// Based on https://github.com/mjosaarinen/tiny_sha3/blob/master/sha3.c
// by Markku-Juhani O. Saarinen <mjos@iki.fi>

#include "crypto/keccak.h"

#include <algorithm>
#include <iterator>
#include <string.h>

namespace {

inline uint64_t Rotl(uint64_t x, int n) { return (x << n) | (x >> (64 - n)); }

inline uint64_t ReadLE64(const unsigned char* ptr)
{
    uint64_t x = 0;
    for (int i = 0; i < 8; ++i) {
        x |= ((uint64_t)ptr[i]) << (8 * i);
    }
    return x;
}

inline void WriteLE64(unsigned char* ptr, uint64_t x)
{
    for (int i = 0; i < 8; ++i) {
        ptr[i] = (unsigned char)(x >> (8 * i));
    }
}

const uint64_t RNDC[24] = {
    0x0000000000000001ULL, 0x0000000000008082ULL, 0x800000000000808aULL, 0x8000000080008000ULL,
    0x000000000000808bULL, 0x0000000080000001ULL, 0x8000000080008081ULL, 0x8000000000008009ULL,
    0x000000000000008aULL, 0x0000000000000088ULL, 0x0000000080008009ULL, 0x000000008000000aULL,
    0x000000008000808bULL, 0x800000000000008bULL, 0x8000000000008089ULL, 0x8000000000008003ULL,
    0x8000000000008002ULL, 0x8000000000000080ULL, 0x000000000000800aULL, 0x800000008000000aULL,
    0x8000000080008081ULL, 0x8000000000008080ULL, 0x0000000080000001ULL, 0x8000000080008008ULL
};

const int ROTC[24] = {1, 3, 6, 10, 15, 21, 28, 36, 45, 55, 2, 14, 27, 41, 56, 8, 25, 43, 62, 18, 39, 61, 20, 44};

const int PILN[24] = {10, 7, 11, 17, 18, 3, 5, 16, 8, 21, 24, 4, 15, 23, 19, 13, 12, 2, 20, 14, 22, 9, 6, 1};

} // namespace

void KeccakF(uint64_t (&st)[25])
{
    uint64_t bc[5];
    uint64_t t;

    for (int round = 0; round < 24; ++round) {
        // Theta
        for (int i = 0; i < 5; ++i) {
            bc[i] = st[i] ^ st[i + 5] ^ st[i + 10] ^ st[i + 15] ^ st[i + 20];
        }
        for (int i = 0; i < 5; ++i) {
            t = bc[(i + 4) % 5] ^ Rotl(bc[(i + 1) % 5], 1);
            for (int j = 0; j < 25; j += 5) {
                st[j + i] ^= t;
            }
        }

        // Rho Pi
        t = st[1];
        for (int i = 0; i < 24; ++i) {
            int j = PILN[i];
            bc[0] = st[j];
            st[j] = Rotl(t, ROTC[i]);
            t = bc[0];
        }

        // Chi
        for (int j = 0; j < 25; j += 5) {
            for (int i = 0; i < 5; ++i) {
                bc[i] = st[j + i];
            }
            for (int i = 0; i < 5; ++i) {
                st[j + i] ^= (~bc[(i + 1) % 5]) & bc[(i + 2) % 5];
            }
        }

        // Iota
        st[0] ^= RNDC[round];
    }
}

CKeccak256& CKeccak256::Write(const unsigned char* data, size_t len)
{
    if (m_bufsize && len >= sizeof(m_buffer) - m_bufsize) {
        // Fill the buffer and process it.
        size_t fill = sizeof(m_buffer) - m_bufsize;
        memcpy(m_buffer + m_bufsize, data, fill);
        data += fill;
        len -= fill;
        m_state[m_pos++] ^= ReadLE64(m_buffer);
        m_bufsize = 0;
        if (m_pos == RATE_BUFFERS) {
            KeccakF(m_state);
            m_pos = 0;
        }
    }
    while (len >= sizeof(m_buffer)) {
        // Process chunks directly from the input.
        m_state[m_pos++] ^= ReadLE64(data);
        data += 8;
        len -= 8;
        if (m_pos == RATE_BUFFERS) {
            KeccakF(m_state);
            m_pos = 0;
        }
    }
    if (len) {
        // Keep the remainder in the buffer.
        memcpy(m_buffer + m_bufsize, data, len);
        m_bufsize += len;
    }
    return *this;
}

void CKeccak256::Finalize(unsigned char hash[OUTPUT_SIZE])
{
    memset(m_buffer + m_bufsize, 0, sizeof(m_buffer) - m_bufsize);
    m_buffer[m_bufsize] ^= 0x01;
    m_state[m_pos] ^= ReadLE64(m_buffer);
    m_state[RATE_BUFFERS - 1] ^= 0x8000000000000000ULL;
    KeccakF(m_state);
    for (unsigned i = 0; i < 4; ++i) {
        WriteLE64(hash + 8 * i, m_state[i]);
    }
}

CKeccak256& CKeccak256::Reset()
{
    m_bufsize = 0;
    m_pos = 0;
    std::fill(std::begin(m_state), std::end(m_state), 0);
    return *this;
}
