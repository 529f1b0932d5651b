// Copyright (c) 2026 The LinkedToken developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#ifndef LINKEDTOKEN_RPC_UTIL_H
#define LINKEDTOKEN_RPC_UTIL_H

#include <stddef.h>

class JSONRPCRequest;
struct LinkedTokenDomain;

/**
 * Resolve the trailing optional "paired" argument at `index` to a running
 * domain. Throws RPC_LINK_NOT_INITIALIZED if that domain is not running.
 */
LinkedTokenDomain& DomainFromRequest(const JSONRPCRequest& request, size_t index);

#endif // LINKEDTOKEN_RPC_UTIL_H
