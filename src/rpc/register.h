// Copyright (c) 2009-2016 The Bitcoin Core developers
// Copyright (c) 2026 The LinkedToken developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#ifndef LINKEDTOKEN_RPC_REGISTER_H
#define LINKEDTOKEN_RPC_REGISTER_H

/** These are in one header file to avoid creating tons of single-function
 * headers for everything under src/rpc/ */
class CRPCTable;

/** Register link administration and transfer RPC commands */
void RegisterLinkedTokenRPCCommands(CRPCTable& tableRPC);
/** Register account and transport RPC commands (getbalance, mintbalance, deliverenvelopes, listqueuedenvelopes) */
void RegisterAccountRPCCommands(CRPCTable& tableRPC);

static inline void RegisterAllLinkedTokenRPCCommands(CRPCTable& tableRPC)
{
    RegisterLinkedTokenRPCCommands(tableRPC);
    RegisterAccountRPCCommands(tableRPC);
}

#endif // LINKEDTOKEN_RPC_REGISTER_H
