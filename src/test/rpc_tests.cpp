// Copyright (c) 2012-2016 The Bitcoin Core developers
// Copyright (c) 2026 The LinkedToken developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "init.h"
#include "rpc/protocol.h"
#include "rpc/register.h"
#include "rpc/server.h"
#include "test/test_linkedtoken.h"

#include <initializer_list>
#include <string>

#include <boost/test/unit_test.hpp>
#include <univalue.h>

namespace {

/** Local and paired domains wired through the globals the RPC layer uses. */
struct RPCTestingSetup : public BasicTestingSetup {
    const std::string strOwner = "0x00000000000000000000000000000000000000a1";
    const std::string strAlice = "0x1111111111111111111111111111111111111111";
    const std::string strBob = "0x2222222222222222222222222222222222222222";

    RPCTestingSetup()
    {
        const SubnetID subnetA(314159, {});
        const SubnetID subnetB = subnetA.CreateChild(uint160S("0x00000000000000000000000000000000000000bb"));
        const uint160 contractA = uint160S("0x000000000000000000000000000000000000c0a1");
        const uint160 contractB = uint160S("0x000000000000000000000000000000000000c0b2");
        const uint160 underlying = uint160S("0x00000000000000000000000000000000000000e2");

        g_gmp_transport.reset(new CLoopbackTransport());
        BOOST_REQUIRE(InitLinkedTokenDomain(g_local_domain, "ledger", "lock", uint160S(strOwner),
                                            IPCAddress::FromEvm(subnetA, contractA), underlying, subnetB,
                                            *g_gmp_transport, 1 << 20, true));
        BOOST_REQUIRE(InitLinkedTokenDomain(g_paired_domain, "paired_ledger", "burn", uint160S(strOwner),
                                            IPCAddress::FromEvm(subnetB, contractB), underlying, subnetA,
                                            *g_gmp_transport, 1 << 20, true));
        RegisterAllLinkedTokenRPCCommands(tableRPC);

        CallRPC("initializelink", Params({strOwner, contractB.ToString()}));
        UniValue paired = Params({strOwner, contractA.ToString()});
        paired.push_back(true);
        CallRPC("initializelink", paired);
    }

    ~RPCTestingSetup()
    {
        g_paired_domain.Reset();
        g_local_domain.Reset();
        g_gmp_transport.reset();
    }

    static UniValue Params(std::initializer_list<std::string> args)
    {
        UniValue params(UniValue::VARR);
        for (const std::string& arg : args) params.push_back(arg);
        return params;
    }

    UniValue CallRPC(const std::string& strMethod, const UniValue& params)
    {
        JSONRPCRequest request;
        request.strMethod = strMethod;
        request.params = params;
        return tableRPC.execute(request);
    }

    //! Error code thrown by the call, 0 if it succeeded
    int RPCErrorCode(const std::string& strMethod, const UniValue& params)
    {
        try {
            CallRPC(strMethod, params);
        } catch (const UniValue& objError) {
            return find_value(objError, "code").get_int();
        }
        return 0;
    }
};

} // namespace

BOOST_FIXTURE_TEST_SUITE(rpc_tests, RPCTestingSetup)

BOOST_AUTO_TEST_CASE(rpc_getlinkinfo)
{
    UniValue info = CallRPC("getlinkinfo", UniValue(UniValue::VARR));
    BOOST_CHECK_EQUAL(find_value(info, "owner").get_str(), strOwner);
    BOOST_CHECK_EQUAL(find_value(info, "custody").get_str(), "lock");
    BOOST_CHECK(find_value(info, "initialized").get_bool());
    BOOST_CHECK_EQUAL(find_value(info, "linkedcontract").get_str(), "0x000000000000000000000000000000000000c0b2");

    UniValue paired(UniValue::VARR);
    paired.push_back(true);
    info = CallRPC("getlinkinfo", paired);
    BOOST_CHECK_EQUAL(find_value(info, "custody").get_str(), "burn");
}

BOOST_AUTO_TEST_CASE(rpc_transfer_round_trip)
{
    UniValue mint = Params({strAlice});
    mint.push_back(1000);
    CallRPC("mintbalance", mint);

    UniValue transfer = Params({strAlice, strBob});
    transfer.push_back(100);
    UniValue sent = CallRPC("linkedtransfer", transfer);
    const std::string strId = find_value(sent, "id").get_str();

    UniValue pending = CallRPC("listunconfirmedtransfers", UniValue(UniValue::VARR));
    BOOST_REQUIRE_EQUAL(pending.size(), 1U);
    BOOST_CHECK_EQUAL(find_value(pending[0], "id").get_str(), strId);

    UniValue record = CallRPC("getunconfirmedtransfer", Params({strId}));
    BOOST_CHECK_EQUAL(find_value(record, "initiator").get_str(), strAlice);
    BOOST_CHECK_EQUAL(find_value(record, "amount").get_int64(), 100);

    UniValue stats = CallRPC("getlinkstats", UniValue(UniValue::VARR));
    BOOST_CHECK_EQUAL(find_value(stats, "pending").get_int64(), 1);
    BOOST_CHECK_EQUAL(find_value(stats, "pending_amount").get_int64(), 100);
    BOOST_CHECK(!find_value(stats, "pending_amount_capped").get_bool());

    UniValue delivered = CallRPC("deliverenvelopes", UniValue(UniValue::VARR));
    BOOST_CHECK_EQUAL(find_value(delivered, "delivered").get_int64(), 2);
    BOOST_CHECK_EQUAL(find_value(delivered, "queued").get_int64(), 0);

    BOOST_CHECK_EQUAL(CallRPC("getbalance", Params({strAlice})).get_int64(), 900);
    UniValue bobOnPaired = Params({strBob});
    bobOnPaired.push_back(true);
    BOOST_CHECK_EQUAL(CallRPC("getbalance", bobOnPaired).get_int64(), 100);

    BOOST_CHECK_EQUAL(RPCErrorCode("getunconfirmedtransfer", Params({strId})), RPC_LINK_NOT_FOUND);
}

BOOST_AUTO_TEST_CASE(rpc_rejections_map_to_codes)
{
    UniValue transfer = Params({strAlice, strBob});
    transfer.push_back(100);
    BOOST_CHECK_EQUAL(RPCErrorCode("linkedtransfer", transfer), RPC_LINK_INSUFFICIENT_FUNDS);

    UniValue zero = Params({strAlice, "0x0000000000000000000000000000000000000000"});
    zero.push_back(100);
    BOOST_CHECK_EQUAL(RPCErrorCode("linkedtransfer", zero), RPC_VERIFY_REJECTED);

    BOOST_CHECK_EQUAL(RPCErrorCode("initializelink", Params({strAlice, strBob})), RPC_LINK_UNAUTHORIZED);
    BOOST_CHECK_EQUAL(RPCErrorCode("initializelink", Params({strOwner, strBob})), RPC_VERIFY_REJECTED);
    BOOST_CHECK_EQUAL(RPCErrorCode("getbalance", Params({"0x1234"})), RPC_INVALID_PARAMETER);
    BOOST_CHECK_EQUAL(RPCErrorCode("nosuchcommand", UniValue(UniValue::VARR)), RPC_METHOD_NOT_FOUND);

    const std::string strMissing = "0x00000000000000000000000000000000000000000000000000000000000000ff";
    BOOST_CHECK_EQUAL(RPCErrorCode("removeunconfirmedtransfer", Params({strOwner, strMissing})), RPC_LINK_NOT_FOUND);
}

BOOST_AUTO_TEST_CASE(rpc_remove_and_reinitialize)
{
    UniValue mint = Params({strAlice});
    mint.push_back(500);
    CallRPC("mintbalance", mint);
    UniValue transfer = Params({strAlice, strBob});
    transfer.push_back(50);
    const std::string strId = find_value(CallRPC("linkedtransfer", transfer), "id").get_str();

    const std::string strNewContract = "0x000000000000000000000000000000000000beef";
    BOOST_CHECK_EQUAL(RPCErrorCode("reinitializelink", Params({strOwner, strNewContract})), RPC_VERIFY_REJECTED);

    BOOST_CHECK_EQUAL(RPCErrorCode("removeunconfirmedtransfer", Params({strAlice, strId})), RPC_LINK_UNAUTHORIZED);
    UniValue removed = CallRPC("removeunconfirmedtransfer", Params({strOwner, strId}));
    BOOST_CHECK_EQUAL(find_value(removed, "id").get_str(), strId);
    BOOST_CHECK_EQUAL(find_value(removed, "initiator").get_str(), strAlice);
    BOOST_CHECK_EQUAL(find_value(removed, "amount").get_int64(), 50);

    UniValue info = CallRPC("reinitializelink", Params({strOwner, strNewContract}));
    BOOST_CHECK_EQUAL(find_value(info, "linkedcontract").get_str(), strNewContract);
}

BOOST_AUTO_TEST_CASE(rpc_named_arguments)
{
    UniValue params(UniValue::VOBJ);
    params.pushKV("address", strAlice);
    params.pushKV("amount", 42);
    BOOST_CHECK_EQUAL(CallRPC("mintbalance", params).get_int64(), 42);

    UniValue unknown(UniValue::VOBJ);
    unknown.pushKV("bogus", 1);
    BOOST_CHECK_EQUAL(RPCErrorCode("getlinkinfo", unknown), RPC_INVALID_PARAMETER);
}

BOOST_AUTO_TEST_CASE(rpc_exec_one_line)
{
    UniValue req;
    BOOST_REQUIRE(req.read("{\"id\": 7, \"method\": \"getbalance\", \"params\": [\"" + strAlice + "\"]}"));
    UniValue reply;
    BOOST_REQUIRE(reply.read(JSONRPCExecOne(req)));
    BOOST_CHECK(find_value(reply, "error").isNull());
    BOOST_CHECK_EQUAL(find_value(reply, "result").get_int64(), 0);
    BOOST_CHECK_EQUAL(find_value(reply, "id").get_int(), 7);

    BOOST_REQUIRE(req.read("{\"id\": 8, \"method\": \"getbalance\", \"params\": []}"));
    BOOST_REQUIRE(reply.read(JSONRPCExecOne(req)));
    BOOST_CHECK(!find_value(reply, "error").isNull());
}

BOOST_AUTO_TEST_SUITE_END()
