// Copyright (c) 2009-2014 The Bitcoin developers
// Copyright (c) 2026 The LinkedToken developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#ifndef LINKEDTOKEN_CORE_IO_H
#define LINKEDTOKEN_CORE_IO_H

#include "amount.h"

#include <string>
#include <vector>

class IpcEnvelope;
class IPCAddress;
class UniValue;
class uint256;
struct LinkConfig;
struct UnconfirmedTransfer;

// core_write.cpp
std::string EncodeHexEnvelope(const IpcEnvelope& envelope);
void IPCAddressToUniv(const IPCAddress& address, UniValue& out);
void EnvelopeToUniv(const IpcEnvelope& envelope, UniValue& entry, bool fIncludeHex = false);
void LinkConfigToUniv(const LinkConfig& link, UniValue& entry);
void UnconfirmedTransferToUniv(const uint256& id, const UnconfirmedTransfer& transfer, UniValue& entry);

#endif // LINKEDTOKEN_CORE_IO_H
