// Copyright (c) 2009-2010 Satoshi Nakamoto
// Copyright (c) 2009-2014 The Bitcoin developers
// Copyright (c) 2026 The LinkedToken developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

/**
 * Utilities for converting data from/to strings.
 */
#ifndef LINKEDTOKEN_UTILSTRENCODINGS_H
#define LINKEDTOKEN_UTILSTRENCODINGS_H

#include <tinyformat.h>

#include <stdint.h>
#include <string>
#include <vector>

#define strprintf tfm::format

/** Decode a hex string, skipping whitespace. Stops at the first non-hex character. */
std::vector<unsigned char> ParseHex(const char* psz);
std::vector<unsigned char> ParseHex(const std::string& str);
signed char HexDigit(char c);
/** Returns true if each character in str is a hex character and has an even number of hex digits. */
bool IsHex(const std::string& str);
/** Strip an optional "0x" prefix. */
std::string StripHexPrefix(const std::string& str);
/** Remove unsafe characters from a string before it goes to the log. */
std::string SanitizeString(const std::string& str);
std::string TrimString(const std::string& str, const std::string& pattern = " \f\n\r\t\v");

/**
 * Format a paragraph of text to a fixed width, adding spaces for
 * indentation to any added line.
 */
std::string FormatParagraph(const std::string& in, size_t width = 79, size_t indent = 0);

int64_t atoi64(const char* psz);
int64_t atoi64(const std::string& str);
int atoi(const std::string& str);

/** Parse a decimal number, rejecting trailing garbage and out-of-range values. */
bool ParseInt64(const std::string& str, int64_t* out);
bool ParseUInt64(const std::string& str, uint64_t* out);

template <typename T>
std::string HexStr(const T itbegin, const T itend)
{
    std::string rv;
    static const char hexmap[16] = {'0', '1', '2', '3', '4', '5', '6', '7',
                                    '8', '9', 'a', 'b', 'c', 'd', 'e', 'f'};
    rv.reserve((itend - itbegin) * 2);
    for (T it = itbegin; it < itend; ++it) {
        unsigned char val = (unsigned char)(*it);
        rv.push_back(hexmap[val >> 4]);
        rv.push_back(hexmap[val & 15]);
    }
    return rv;
}

template <typename T>
inline std::string HexStr(const T& vch)
{
    return HexStr(vch.begin(), vch.end());
}

#endif // LINKEDTOKEN_UTILSTRENCODINGS_H
