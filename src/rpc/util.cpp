// Copyright (c) 2026 The LinkedToken developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "rpc/util.h"

#include "init.h"
#include "rpc/server.h"

LinkedTokenDomain& DomainFromRequest(const JSONRPCRequest& request, size_t index)
{
    bool fPaired = false;
    if (request.params.size() > index && !request.params[index].isNull())
        fPaired = request.params[index].get_bool();

    LinkedTokenDomain& domain = fPaired ? g_paired_domain : g_local_domain;
    if (!domain.IsActive()) {
        throw JSONRPCError(RPC_LINK_NOT_INITIALIZED,
                           fPaired ? "No paired instance, start with -paired=1" : "Linked token not running");
    }
    return domain;
}
