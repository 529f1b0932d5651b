// Copyright (c) 2009-2010 Satoshi Nakamoto
// Copyright (c) 2009-2014 The Bitcoin developers
// Copyright (c) 2026 The LinkedToken developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "utilmoneystr.h"

#include "utilstrencodings.h"

#include <algorithm>
#include <ctype.h>

#include <boost/algorithm/string/trim.hpp>

std::string FormatMoney(const CAmount& n, bool fPlus)
{
    // Amounts on both sides of a link are whole base units.
    return strprintf(fPlus && n > 0 ? "+%d" : "%d", n);
}

bool ParseMoney(const std::string& str, CAmount& nRet)
{
    const std::string strValue = boost::algorithm::trim_copy(str);
    if (strValue.empty() || !std::all_of(strValue.begin(), strValue.end(), [](unsigned char c) { return isdigit(c) != 0; }))
        return false;

    int64_t nValue = 0;
    if (!ParseInt64(strValue, &nValue) || !MoneyRange(nValue))
        return false;
    nRet = nValue;
    return true;
}

bool ParseMoney(const char* pszIn, CAmount& nRet)
{
    return pszIn != nullptr && ParseMoney(std::string(pszIn), nRet);
}
