// Copyright (c) 2009-2010 Satoshi Nakamoto
// Copyright (c) 2009-2014 The Bitcoin developers
// Copyright (c) 2026 The LinkedToken developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#ifndef LINKEDTOKEN_AMOUNT_H
#define LINKEDTOKEN_AMOUNT_H

#include <stdint.h>

/** Amount in base units of the underlying token (can be negative in arithmetic) */
typedef int64_t CAmount;

/** No amount larger than this is valid on the wire. */
static const CAmount MAX_MONEY = 0x7fffffffffffffffLL;

inline bool MoneyRange(const CAmount& nValue) { return (nValue >= 0 && nValue <= MAX_MONEY); }

#endif // LINKEDTOKEN_AMOUNT_H
