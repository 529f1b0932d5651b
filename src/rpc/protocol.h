// Copyright (c) 2010 Satoshi Nakamoto
// Copyright (c) 2009-2015 The Bitcoin Core developers
// Copyright (c) 2026 The LinkedToken developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#ifndef LINKEDTOKEN_RPC_PROTOCOL_H
#define LINKEDTOKEN_RPC_PROTOCOL_H

#include <string>

#include <univalue.h>

//! LinkedToken RPC error codes
enum RPCErrorCode {
    //! Standard JSON-RPC 2.0 errors
    RPC_INVALID_REQUEST  = -32600,
    RPC_METHOD_NOT_FOUND = -32601,
    RPC_INVALID_PARAMS   = -32602,
    RPC_INTERNAL_ERROR   = -32603,
    RPC_PARSE_ERROR      = -32700,

    //! General application defined errors
    RPC_MISC_ERROR              = -1,  //!< std::exception thrown in command handling
    RPC_TYPE_ERROR              = -3,  //!< Unexpected type was passed as parameter
    RPC_INVALID_PARAMETER       = -8,  //!< Invalid, missing or duplicate parameter
    RPC_DATABASE_ERROR          = -20, //!< Database error
    RPC_VERIFY_ERROR            = -25, //!< Internal-consistency error while processing
    RPC_VERIFY_REJECTED         = -26, //!< Rejected by the transfer protocol

    //! Link errors
    RPC_LINK_NOT_INITIALIZED    = -40, //!< Link contract not set yet
    RPC_LINK_UNAUTHORIZED       = -41, //!< Caller is not the owner
    RPC_LINK_NOT_FOUND          = -42, //!< No such unconfirmed transfer
    RPC_LINK_INSUFFICIENT_FUNDS = -43, //!< Custody could not capture or release
};

UniValue JSONRPCRequestObj(const std::string& strMethod, const UniValue& params, const UniValue& id);
UniValue JSONRPCReplyObj(const UniValue& result, const UniValue& error, const UniValue& id);
std::string JSONRPCReply(const UniValue& result, const UniValue& error, const UniValue& id);
UniValue JSONRPCError(int code, const std::string& message);

#endif // LINKEDTOKEN_RPC_PROTOCOL_H
