// Copyright (c) 2026 The LinkedToken developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "linkedtoken/ledgerdb.h"
#include "test/test_linkedtoken.h"

#include <memory>
#include <vector>

#include <boost/test/unit_test.hpp>

BOOST_FIXTURE_TEST_SUITE(ledgerdb_tests, BasicTestingSetup)

static const uint160 ALICE = uint160S("0x1111111111111111111111111111111111111111");
static const uint160 BOB = uint160S("0x2222222222222222222222222222222222222222");

static uint256 Id(unsigned char n)
{
    uint256 id;
    *id.begin() = n;
    return id;
}

BOOST_AUTO_TEST_CASE(write_read_erase)
{
    std::unique_ptr<CUnconfirmedTransferDB> ledger;
    BOOST_REQUIRE(InitUnconfirmedTransferDB(ledger, "ledger", 1 << 20, true));

    const UnconfirmedTransfer transfer(ALICE, 100);
    BOOST_CHECK(!ledger->HaveTransfer(Id(1)));
    BOOST_CHECK(ledger->WriteTransfer(Id(1), transfer));
    BOOST_CHECK(ledger->HaveTransfer(Id(1)));

    UnconfirmedTransfer read;
    BOOST_CHECK(ledger->ReadTransfer(Id(1), read));
    BOOST_CHECK(read == transfer);
    BOOST_CHECK_EQUAL(read.nVersion, LEDGER_RECORD_VERSION);

    BOOST_CHECK(ledger->EraseTransfer(Id(1)));
    BOOST_CHECK(!ledger->HaveTransfer(Id(1)));
    BOOST_CHECK(!ledger->ReadTransfer(Id(1), read));

    // Erasing what is gone reports it
    BOOST_CHECK(!ledger->EraseTransfer(Id(1)));
}

BOOST_AUTO_TEST_CASE(initiator_index_and_stats)
{
    std::unique_ptr<CUnconfirmedTransferDB> ledger;
    BOOST_REQUIRE(InitUnconfirmedTransferDB(ledger, "ledger", 1 << 20, true));

    BOOST_REQUIRE(ledger->WriteTransfer(Id(1), UnconfirmedTransfer(ALICE, 100)));
    BOOST_REQUIRE(ledger->WriteTransfer(Id(2), UnconfirmedTransfer(BOB, 40)));
    BOOST_REQUIRE(ledger->WriteTransfer(Id(3), UnconfirmedTransfer(ALICE, 7)));

    std::vector<uint256> ids;
    BOOST_CHECK(ledger->GetByInitiator(ALICE, ids));
    BOOST_REQUIRE_EQUAL(ids.size(), 2U);
    BOOST_CHECK(ids[0] == Id(1));
    BOOST_CHECK(ids[1] == Id(3));

    CUnconfirmedTransferDB::Stats stats = ledger->GetStats();
    BOOST_CHECK_EQUAL(stats.pendingCount, 3U);
    BOOST_CHECK_EQUAL(stats.pendingAmount, 147);

    // Erase drops the index entry too
    BOOST_CHECK(ledger->EraseTransfer(Id(1)));
    BOOST_CHECK(ledger->GetByInitiator(ALICE, ids));
    BOOST_REQUIRE_EQUAL(ids.size(), 1U);
    BOOST_CHECK(ids[0] == Id(3));

    BOOST_CHECK(ledger->EraseTransfer(Id(2)));
    BOOST_CHECK(!ledger->GetByInitiator(BOB, ids));
    BOOST_CHECK(ids.empty());

    stats = ledger->GetStats();
    BOOST_CHECK_EQUAL(stats.pendingCount, 1U);
    BOOST_CHECK_EQUAL(stats.pendingAmount, 7);
}

BOOST_AUTO_TEST_CASE(stats_amount_capped_at_max_money)
{
    std::unique_ptr<CUnconfirmedTransferDB> ledger;
    BOOST_REQUIRE(InitUnconfirmedTransferDB(ledger, "ledger", 1 << 20, true));

    BOOST_REQUIRE(ledger->WriteTransfer(Id(1), UnconfirmedTransfer(ALICE, MAX_MONEY)));
    CUnconfirmedTransferDB::Stats stats = ledger->GetStats();
    BOOST_CHECK_EQUAL(stats.pendingAmount, MAX_MONEY);
    BOOST_CHECK(!stats.fAmountCapped);

    BOOST_REQUIRE(ledger->WriteTransfer(Id(2), UnconfirmedTransfer(BOB, MAX_MONEY)));
    BOOST_REQUIRE(ledger->WriteTransfer(Id(3), UnconfirmedTransfer(ALICE, 5)));
    stats = ledger->GetStats();
    BOOST_CHECK_EQUAL(stats.pendingCount, 3U);
    BOOST_CHECK_EQUAL(stats.pendingAmount, MAX_MONEY);
    BOOST_CHECK(stats.fAmountCapped);

    // Back under the bound the sum is exact again
    BOOST_CHECK(ledger->EraseTransfer(Id(1)));
    BOOST_CHECK(ledger->EraseTransfer(Id(2)));
    stats = ledger->GetStats();
    BOOST_CHECK_EQUAL(stats.pendingCount, 1U);
    BOOST_CHECK_EQUAL(stats.pendingAmount, 5);
    BOOST_CHECK(!stats.fAmountCapped);
}

BOOST_AUTO_TEST_CASE(foreach_stops_on_false)
{
    std::unique_ptr<CUnconfirmedTransferDB> ledger;
    BOOST_REQUIRE(InitUnconfirmedTransferDB(ledger, "ledger", 1 << 20, true));
    for (unsigned char n = 1; n <= 5; n++) {
        BOOST_REQUIRE(ledger->WriteTransfer(Id(n), UnconfirmedTransfer(ALICE, n)));
    }

    // Link config under its own key does not show up as a transfer
    LinkConfig link;
    link.underlying = BOB;
    link.linkedSubnet = SubnetID(314159, {});
    BOOST_REQUIRE(ledger->WriteLinkConfig(link));

    int nSeen = 0;
    ledger->ForEachTransfer([&](const uint256&, const UnconfirmedTransfer&) {
        return ++nSeen < 3;
    });
    BOOST_CHECK_EQUAL(nSeen, 3);

    nSeen = 0;
    ledger->ForEachTransfer([&](const uint256&, const UnconfirmedTransfer&) {
        ++nSeen;
        return true;
    });
    BOOST_CHECK_EQUAL(nSeen, 5);
}

BOOST_AUTO_TEST_CASE(batch_is_atomic)
{
    std::unique_ptr<CUnconfirmedTransferDB> ledger;
    BOOST_REQUIRE(InitUnconfirmedTransferDB(ledger, "ledger", 1 << 20, true));
    BOOST_REQUIRE(ledger->WriteTransfer(Id(1), UnconfirmedTransfer(ALICE, 10)));

    {
        CUnconfirmedTransferDB::Batch batch = ledger->CreateBatch();
        batch.EraseTransfer(Id(1), UnconfirmedTransfer(ALICE, 10));
        batch.WriteTransfer(Id(2), UnconfirmedTransfer(BOB, 20));
        // Not committed yet
        BOOST_CHECK(ledger->HaveTransfer(Id(1)));
        BOOST_CHECK(!ledger->HaveTransfer(Id(2)));
        BOOST_CHECK(batch.Commit());
    }
    BOOST_CHECK(!ledger->HaveTransfer(Id(1)));
    BOOST_CHECK(ledger->HaveTransfer(Id(2)));
}

BOOST_AUTO_TEST_CASE(survives_reopen)
{
    const uint256 id = Id(9);
    LinkConfig link;
    link.underlying = BOB;
    link.linkedSubnet = SubnetID(314159, {}).CreateChild(ALICE);
    link.linkedContract = ALICE;

    std::unique_ptr<CUnconfirmedTransferDB> ledger;
    BOOST_REQUIRE(InitUnconfirmedTransferDB(ledger, "ledger", 1 << 20, false, true));
    BOOST_REQUIRE(ledger->WriteTransfer(id, UnconfirmedTransfer(ALICE, 55)));
    BOOST_REQUIRE(ledger->WriteLinkConfig(link));
    BOOST_CHECK(ledger->Sync());
    ledger.reset();

    BOOST_REQUIRE(InitUnconfirmedTransferDB(ledger, "ledger", 1 << 20, false, false));
    UnconfirmedTransfer transfer;
    BOOST_CHECK(ledger->ReadTransfer(id, transfer));
    BOOST_CHECK(transfer == UnconfirmedTransfer(ALICE, 55));

    LinkConfig restored;
    BOOST_CHECK(ledger->ReadLinkConfig(restored));
    BOOST_CHECK(restored.underlying == link.underlying);
    BOOST_CHECK(restored.linkedSubnet == link.linkedSubnet);
    BOOST_CHECK(restored.linkedContract == link.linkedContract);
    ledger.reset();
}

BOOST_AUTO_TEST_SUITE_END()
