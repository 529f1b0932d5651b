// Copyright (c) 2015-2018 The Bitcoin Core developers
// Copyright (c) 2026 The LinkedToken developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#ifndef LINKEDTOKEN_TEST_TEST_LINKEDTOKEN_H
#define LINKEDTOKEN_TEST_TEST_LINKEDTOKEN_H

#include "fs.h"
#include "gmp/loopback.h"
#include "gmp/subnet.h"
#include "init.h"
#include "uint256.h"

#include <memory>

/** Basic testing setup.
 * This just configures logging and a private data directory.
 */
struct BasicTestingSetup {
    fs::path pathTemp;

    BasicTestingSetup();
    ~BasicTestingSetup();
};

/** Two linked instances joined by a loopback transport.
 *
 * A lives on the root subnet with lock custody, B on a child subnet with
 * burn custody. Both links are initialized, ledgers are in memory.
 */
struct LinkedTokenTestingSetup : public BasicTestingSetup {
    static const uint160 OWNER;
    static const uint160 UNDERLYING;
    static const uint160 CONTRACT_A;
    static const uint160 CONTRACT_B;
    static const uint160 ALICE;
    static const uint160 BOB;

    SubnetID subnetA;
    SubnetID subnetB;
    CLoopbackTransport transport;
    LinkedTokenDomain domainA;
    LinkedTokenDomain domainB;

    explicit LinkedTokenTestingSetup(bool fInitializeLinks = true);
    ~LinkedTokenTestingSetup();

    CLinkedToken& TokenA() { return *domainA.token; }
    CLinkedToken& TokenB() { return *domainB.token; }

    /** Credit `account` on A. */
    void Fund(const uint160& account, CAmount amount);
};

/** Same as LinkedTokenTestingSetup with both links left unset. */
struct UnlinkedTestingSetup : public LinkedTokenTestingSetup {
    UnlinkedTestingSetup() : LinkedTokenTestingSetup(false) {}
};

#endif // LINKEDTOKEN_TEST_TEST_LINKEDTOKEN_H
