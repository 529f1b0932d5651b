// Copyright (c) 2012-2014 The Bitcoin developers
// Copyright (c) 2026 The LinkedToken developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#ifndef LINKEDTOKEN_VERSION_H
#define LINKEDTOKEN_VERSION_H

#include <stdint.h>

/**
 * client and storage versioning
 */

static const int CLIENT_VERSION_MAJOR = 0;
static const int CLIENT_VERSION_MINOR = 3;
static const int CLIENT_VERSION_REVISION = 1;

static const int CLIENT_VERSION =
    1000000 * CLIENT_VERSION_MAJOR + 10000 * CLIENT_VERSION_MINOR + 100 * CLIENT_VERSION_REVISION;

//! envelope wire format version, bumped when IpcEnvelope serialization changes
static const int ENVELOPE_VERSION = 1;

//! ledger record format version written alongside each UnconfirmedTransfer
static const uint8_t LEDGER_RECORD_VERSION = 1;

#endif // LINKEDTOKEN_VERSION_H
