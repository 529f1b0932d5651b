// Copyright (c) 2026 The LinkedToken developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "amount.h"
#include "gmp/abi.h"
#include "test/test_linkedtoken.h"
#include "utilstrencodings.h"

#include <vector>

#include <boost/test/unit_test.hpp>

BOOST_FIXTURE_TEST_SUITE(abi_tests, BasicTestingSetup)

BOOST_AUTO_TEST_CASE(encode_address_left_pads_to_word)
{
    std::vector<unsigned char> out;
    AbiEncodeAddress(out, uint160S("0x1234567890abcdef1234567890abcdef12345678"));
    BOOST_CHECK_EQUAL(out.size(), ABI_WORD_SIZE);
    BOOST_CHECK_EQUAL(HexStr(out),
                      "0000000000000000000000001234567890abcdef1234567890abcdef12345678");
}

BOOST_AUTO_TEST_CASE(encode_amount_big_endian)
{
    std::vector<unsigned char> out;
    AbiEncodeAmount(out, 100);
    BOOST_CHECK_EQUAL(HexStr(out),
                      "0000000000000000000000000000000000000000000000000000000000000064");

    out.clear();
    AbiEncodeAmount(out, MAX_MONEY);
    BOOST_CHECK_EQUAL(HexStr(out),
                      "0000000000000000000000000000000000000000000000007fffffffffffffff");
}

BOOST_AUTO_TEST_CASE(decode_address_and_amount)
{
    const uint160 recipient = uint160S("0x2222222222222222222222222222222222222222");
    std::vector<unsigned char> data;
    AbiEncodeAddress(data, recipient);
    AbiEncodeAmount(data, 5000);

    uint160 decoded;
    CAmount amount = 0;
    BOOST_CHECK(AbiDecodeAddress(data, 0, decoded));
    BOOST_CHECK(decoded == recipient);
    BOOST_CHECK(AbiDecodeAmount(data, ABI_WORD_SIZE, amount));
    BOOST_CHECK_EQUAL(amount, 5000);
}

BOOST_AUTO_TEST_CASE(decode_rejects_short_data)
{
    std::vector<unsigned char> data(ABI_WORD_SIZE - 1, 0);
    uint160 address;
    CAmount amount = 0;
    BOOST_CHECK(!AbiDecodeAddress(data, 0, address));
    BOOST_CHECK(!AbiDecodeAmount(data, 0, amount));

    // Offset past the end
    data.resize(ABI_WORD_SIZE);
    BOOST_CHECK(!AbiDecodeAmount(data, ABI_WORD_SIZE + 1, amount));
    BOOST_CHECK(!AbiDecodeAmount(data, 1, amount));
}

BOOST_AUTO_TEST_CASE(decode_address_rejects_dirty_padding)
{
    std::vector<unsigned char> data;
    AbiEncodeAddress(data, uint160S("0x2222222222222222222222222222222222222222"));
    data[0] = 0x01;

    uint160 address;
    BOOST_CHECK(!AbiDecodeAddress(data, 0, address));
}

BOOST_AUTO_TEST_CASE(decode_amount_rejects_above_int64)
{
    // 2^63, one above the int64 maximum
    std::vector<unsigned char> data = ParseHex("0000000000000000000000000000000000000000000000008000000000000000");
    CAmount amount = 0;
    BOOST_CHECK(!AbiDecodeAmount(data, 0, amount));

    // 2^64
    data = ParseHex("0000000000000000000000000000000000000000000000010000000000000000");
    BOOST_CHECK(!AbiDecodeAmount(data, 0, amount));

    data = ParseHex("0000000000000000000000000000000000000000000000007fffffffffffffff");
    BOOST_CHECK(AbiDecodeAmount(data, 0, amount));
    BOOST_CHECK_EQUAL(amount, MAX_MONEY);
}

BOOST_AUTO_TEST_SUITE_END()
