// Copyright (c) 2009-2010 Satoshi Nakamoto
// Copyright (c) 2009-2014 The Bitcoin developers
// Copyright (c) 2026 The LinkedToken developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#ifndef LINKEDTOKEN_HASH_H
#define LINKEDTOKEN_HASH_H

#include "crypto/keccak.h"
#include "serialize.h"
#include "uint256.h"

#include <string>
#include <vector>

/** Compute the Keccak-256 hash of a byte range. */
template <typename T1>
inline uint256 KeccakHash(const T1 pbegin, const T1 pend)
{
    static const unsigned char pblank[1] = {};
    uint256 result;
    CKeccak256()
        .Write(pbegin == pend ? pblank : (const unsigned char*)&pbegin[0], (pend - pbegin) * sizeof(pbegin[0]))
        .Finalize(result.begin());
    return result;
}

inline uint256 KeccakHash(const std::string& str)
{
    return KeccakHash(str.begin(), str.end());
}

inline uint256 KeccakHash(const std::vector<unsigned char>& vch)
{
    return KeccakHash(vch.begin(), vch.end());
}

/** A writer stream (for serialization) that computes a Keccak-256 hash. */
class CKeccakWriter
{
private:
    CKeccak256 ctx;

    const int nType;
    const int nVersion;

public:
    CKeccakWriter(int nTypeIn, int nVersionIn) : nType(nTypeIn), nVersion(nVersionIn) {}

    int GetType() const { return nType; }
    int GetVersion() const { return nVersion; }

    void write(const char* pch, size_t size)
    {
        ctx.Write((const unsigned char*)pch, size);
    }

    uint256 GetHash()
    {
        uint256 result;
        ctx.Finalize(result.begin());
        return result;
    }

    template <typename T>
    CKeccakWriter& operator<<(const T& obj)
    {
        // Serialize to this stream
        ::Serialize(*this, obj);
        return (*this);
    }
};

/** Compute the Keccak-256 hash of an object's serialization. */
template <typename T>
uint256 SerializeKeccakHash(const T& obj, int nType, int nVersion)
{
    CKeccakWriter ss(nType, nVersion);
    ss << obj;
    return ss.GetHash();
}

#endif // LINKEDTOKEN_HASH_H
