// Copyright (c) 2026 The LinkedToken developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#ifndef LINKEDTOKEN_LINKEDTOKEN_AUTHENTICATOR_H
#define LINKEDTOKEN_LINKEDTOKEN_AUTHENTICATOR_H

#include "gmp/address.h"
#include "gmp/envelope.h"
#include "linkedtoken/transfer.h"

#include <string>
#include <vector>

class CValidationState;

/**
 * CMessageAuthenticator - Inbound envelope checks
 *
 * Built from a snapshot of the link configuration. The transport vouches
 * that an envelope really comes from its claimed origin; this class only
 * checks that the claimed origin is the linked pair:
 *
 *   CheckOrigin     subnet == linkedSubnet     else bad-envelope-origin-subnet
 *                   from   == f410(contract)   else bad-envelope-origin-contract
 *   CheckSelector   len(method) >= 4           else bad-envelope-short-selector
 *                   method[0:4] == selector    else bad-envelope-invalid-selector
 */
class CMessageAuthenticator
{
private:
    const SubnetID linkedSubnet;
    const FvmAddress linkedContract;

public:
    explicit CMessageAuthenticator(const LinkConfig& link);

    bool CheckOrigin(const IpcEnvelope& envelope, CValidationState& state) const;

    static bool CheckSelector(const std::vector<unsigned char>& method, const std::string& signature, CValidationState& state);
};

#endif // LINKEDTOKEN_LINKEDTOKEN_AUTHENTICATOR_H
