// Copyright (c) 2011-2018 The Bitcoin Core developers
// Copyright (c) 2026 The LinkedToken developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "init.h"
#include "test/test_linkedtoken.h"
#include "util/system.h"
#include "utilmoneystr.h"
#include "utilstrencodings.h"

#include <boost/test/unit_test.hpp>

BOOST_FIXTURE_TEST_SUITE(util_tests, BasicTestingSetup)

BOOST_AUTO_TEST_CASE(util_money_base_units)
{
    BOOST_CHECK_EQUAL(FormatMoney(0), "0");
    BOOST_CHECK_EQUAL(FormatMoney(1234567), "1234567");
    BOOST_CHECK_EQUAL(FormatMoney(5, true), "+5");

    CAmount amount = 0;
    BOOST_CHECK(ParseMoney("100", amount));
    BOOST_CHECK_EQUAL(amount, 100);
    BOOST_CHECK(ParseMoney(" 42 ", amount));
    BOOST_CHECK_EQUAL(amount, 42);
    BOOST_CHECK(!ParseMoney("", amount));
    BOOST_CHECK(!ParseMoney("-1", amount));
    BOOST_CHECK(!ParseMoney("1.5", amount));
    BOOST_CHECK(!ParseMoney("1 2", amount));
    BOOST_CHECK(!ParseMoney("+5", amount));
    BOOST_CHECK(ParseMoney("9223372036854775807", amount));
    BOOST_CHECK_EQUAL(amount, MAX_MONEY);
    BOOST_CHECK(!ParseMoney("9223372036854775808", amount));
}

BOOST_AUTO_TEST_CASE(util_hex)
{
    BOOST_CHECK(IsHex("00ff"));
    BOOST_CHECK(!IsHex("0ff"));
    BOOST_CHECK(!IsHex("zz"));
    BOOST_CHECK_EQUAL(StripHexPrefix("0xabcd"), "abcd");
    BOOST_CHECK_EQUAL(StripHexPrefix("abcd"), "abcd");
    BOOST_CHECK_EQUAL(HexStr(ParseHex("a9059cbb")), "a9059cbb");
    BOOST_CHECK_EQUAL(uint160S("0x00000000000000000000000000000000000000a1").ToString(),
                      "0x00000000000000000000000000000000000000a1");
}

BOOST_AUTO_TEST_CASE(util_args)
{
    const char* argv[] = {"linkedtokend", "-owner=0xa1", "-paired", "-nodebuglogfile", "-dbcache=32"};
    std::string error;
    BOOST_CHECK(gArgs.ParseParameters(5, argv, error));
    BOOST_CHECK_EQUAL(gArgs.GetArg("-owner", ""), "0xa1");
    BOOST_CHECK(gArgs.GetBoolArg("-paired", false));
    BOOST_CHECK(gArgs.IsArgNegated("-debuglogfile"));
    BOOST_CHECK_EQUAL(gArgs.GetArg("-dbcache", DEFAULT_DB_CACHE_MB), 32);
    BOOST_CHECK_EQUAL(gArgs.GetArg("-custody", DEFAULT_CUSTODY), "lock");
    gArgs.ClearArgs();
}

BOOST_AUTO_TEST_CASE(custody_by_name)
{
    CTokenAccounts accounts;
    const uint160 vault = uint160S("0x000000000000000000000000000000000000c0a1");
    BOOST_CHECK_EQUAL(MakeCustodyStrategy("lock", accounts, vault)->GetName(), "lock");
    BOOST_CHECK_EQUAL(MakeCustodyStrategy("burn", accounts, vault)->GetName(), "burn");
    BOOST_CHECK(MakeCustodyStrategy("mint", accounts, vault) == nullptr);

    CLoopbackTransport transport;
    LinkedTokenDomain domain;
    const IPCAddress self = IPCAddress::FromEvm(SubnetID(314159, {}), vault);
    BOOST_CHECK(!InitLinkedTokenDomain(domain, "ledger", "mint", vault, self, vault,
                                       SubnetID(314159, {}).CreateChild(vault), transport, 1 << 20, true));
    BOOST_CHECK(!domain.IsActive());
}

BOOST_AUTO_TEST_CASE(help_lists_link_options)
{
    const std::string strHelp = GetLinkedTokenHelpString();
    BOOST_CHECK(strHelp.find("-linkedsubnet=<subnet>") != std::string::npos);
    BOOST_CHECK(strHelp.find("-paired") != std::string::npos);
    BOOST_CHECK(strHelp.find("-custody=<lock|burn>") != std::string::npos);
}

BOOST_AUTO_TEST_SUITE_END()
