// Copyright (c) 2026 The LinkedToken developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "linkedtoken/authenticator.h"

#include "consensus/validation.h"
#include "gmp/abi.h"
#include "logging.h"

#include <algorithm>

CMessageAuthenticator::CMessageAuthenticator(const LinkConfig& link)
    : linkedSubnet(link.linkedSubnet), linkedContract(FvmAddress::FromEvmAddress(link.linkedContract))
{
}

bool CMessageAuthenticator::CheckOrigin(const IpcEnvelope& envelope, CValidationState& state) const
{
    if (envelope.from.subnetId != linkedSubnet) {
        LogPrint(BCLog::LINKEDTOKEN, "LinkedToken: envelope %s from foreign subnet %s (expected %s)\n",
                 envelope.GetHash().ToString(), envelope.from.subnetId.ToString(), linkedSubnet.ToString());
        return state.Invalid(false, REJECT_UNAUTHORIZED, "bad-envelope-origin-subnet",
                             envelope.from.subnetId.ToString());
    }

    if (envelope.from.rawAddress != linkedContract) {
        LogPrint(BCLog::LINKEDTOKEN, "LinkedToken: envelope %s from foreign contract %s (expected %s)\n",
                 envelope.GetHash().ToString(), envelope.from.rawAddress.ToString(), linkedContract.ToString());
        return state.Invalid(false, REJECT_UNAUTHORIZED, "bad-envelope-origin-contract",
                             envelope.from.rawAddress.ToString());
    }

    return true;
}

bool CMessageAuthenticator::CheckSelector(const std::vector<unsigned char>& method, const std::string& signature, CValidationState& state)
{
    if (method.size() < ABI_SELECTOR_SIZE) {
        return state.Invalid(false, REJECT_MALFORMED, "bad-envelope-short-selector",
                             strprintf("selector is %u bytes", method.size()));
    }

    const std::vector<unsigned char> expected = ComputeSelector(signature);
    if (!std::equal(expected.begin(), expected.end(), method.begin())) {
        return state.Invalid(false, REJECT_INVALID, "bad-envelope-invalid-selector",
                             strprintf("got %s, expected %s for %s", HexStr(method.begin(), method.begin() + ABI_SELECTOR_SIZE),
                                       HexStr(expected), signature));
    }

    return true;
}
