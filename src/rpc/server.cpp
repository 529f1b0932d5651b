// Copyright (c) 2010 Satoshi Nakamoto
// Copyright (c) 2009-2015 The Bitcoin Core developers
// Copyright (c) 2026 The LinkedToken developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "rpc/server.h"

#include "consensus/validation.h"
#include "dbwrapper.h"
#include "init.h"
#include "logging.h"
#include "utilmoneystr.h"
#include "utilstrencodings.h"
#include "utiltime.h"

#include <algorithm>
#include <set>
#include <stdexcept>

#include <boost/algorithm/string/case_conv.hpp>

void JSONRPCRequest::parse(const UniValue& valRequest)
{
    // Parse request
    if (!valRequest.isObject())
        throw JSONRPCError(RPC_INVALID_REQUEST, "Invalid Request object");
    const UniValue& request = valRequest.get_obj();

    // Parse id now so errors from here on will have the id
    id = find_value(request, "id");

    // Parse method
    UniValue valMethod = find_value(request, "method");
    if (valMethod.isNull())
        throw JSONRPCError(RPC_INVALID_REQUEST, "Missing method");
    if (!valMethod.isStr())
        throw JSONRPCError(RPC_INVALID_REQUEST, "Method must be a string");
    strMethod = valMethod.get_str();
    LogPrint(BCLog::RPC, "ThreadRPCServer method=%s\n", SanitizeString(strMethod));

    // Parse params
    UniValue valParams = find_value(request, "params");
    if (valParams.isArray() || valParams.isObject())
        params = valParams;
    else if (valParams.isNull())
        params = UniValue(UniValue::VARR);
    else
        throw JSONRPCError(RPC_INVALID_REQUEST, "Params must be an array or object");
}

// =============================================================================
// Parameter helpers
// =============================================================================

uint256 ParseHashV(const UniValue& v, const std::string& strName)
{
    std::string strHex;
    if (v.isStr())
        strHex = StripHexPrefix(v.get_str());
    if (strHex.size() != 64 || !IsHex(strHex))
        throw JSONRPCError(RPC_INVALID_PARAMETER, strName + " must be a 32 byte hex string (not '" + strHex + "')");
    return uint256S(strHex);
}

uint160 ParseAddressV(const UniValue& v, const std::string& strName)
{
    std::string strHex;
    if (v.isStr())
        strHex = StripHexPrefix(v.get_str());
    if (strHex.size() != 40 || !IsHex(strHex))
        throw JSONRPCError(RPC_INVALID_PARAMETER, strName + " must be a 20 byte hex address (not '" + strHex + "')");
    return uint160S(strHex);
}

CAmount AmountFromValue(const UniValue& value)
{
    if (!value.isNum() && !value.isStr())
        throw JSONRPCError(RPC_TYPE_ERROR, "Amount is not a number or string");
    CAmount amount;
    if (!ParseMoney(value.getValStr(), amount))
        throw JSONRPCError(RPC_TYPE_ERROR, "Invalid amount");
    if (!MoneyRange(amount))
        throw JSONRPCError(RPC_TYPE_ERROR, "Amount out of range");
    return amount;
}

UniValue ValueFromAmount(const CAmount& amount)
{
    return UniValue(UniValue::VNUM, FormatMoney(amount));
}

void ThrowIfRejected(bool fOk, const CValidationState& state)
{
    if (fOk)
        return;

    const std::string strMessage = FormatStateMessage(state);
    if (state.IsError())
        throw JSONRPCError(RPC_VERIFY_ERROR, strMessage);

    switch (state.GetRejectCode()) {
    case REJECT_NOT_INITIALIZED:
        throw JSONRPCError(RPC_LINK_NOT_INITIALIZED, strMessage);
    case REJECT_UNAUTHORIZED:
        throw JSONRPCError(RPC_LINK_UNAUTHORIZED, strMessage);
    case REJECT_INSUFFICIENT:
        throw JSONRPCError(RPC_LINK_INSUFFICIENT_FUNDS, strMessage);
    default:
        if (state.GetRejectReason() == "unconfirmed-transfer-not-found")
            throw JSONRPCError(RPC_LINK_NOT_FOUND, strMessage);
        throw JSONRPCError(RPC_VERIFY_REJECTED, strMessage);
    }
}

std::string HelpExampleCli(const std::string& methodname, const std::string& args)
{
    return "> linkedtoken-cli " + methodname + " " + args + "\n";
}

std::string HelpExampleRpc(const std::string& methodname, const std::string& args)
{
    return "> {\"jsonrpc\": \"1.0\", \"id\":\"curltest\", "
        "\"method\": \"" + methodname + "\", \"params\": [" + args + "] }\n";
}

// =============================================================================
// Built-in commands
// =============================================================================

UniValue help(const JSONRPCRequest& jsonRequest)
{
    if (jsonRequest.fHelp || jsonRequest.params.size() > 1)
        throw std::runtime_error(
            "help ( \"command\" )\n"
            "\nList all commands, or get help for a specified command.\n"
            "\nArguments:\n"
            "1. \"command\"     (string, optional) The command to get help on\n"
            "\nResult:\n"
            "\"text\"     (string) The help text\n");

    std::string strCommand;
    if (jsonRequest.params.size() > 0)
        strCommand = jsonRequest.params[0].get_str();

    return tableRPC.help(strCommand);
}

UniValue stop(const JSONRPCRequest& jsonRequest)
{
    if (jsonRequest.fHelp || jsonRequest.params.size() > 0)
        throw std::runtime_error(
            "stop\n"
            "\nStop LinkedToken server.");
    StartShutdown();
    return "LinkedToken server stopping";
}

UniValue uptime(const JSONRPCRequest& jsonRequest)
{
    if (jsonRequest.fHelp || jsonRequest.params.size() > 0)
        throw std::runtime_error(
            "uptime\n"
            "\nReturns the total uptime of the server.\n"
            "\nResult:\n"
            "ttt        (numeric) The number of seconds that the server has been running\n"
            "\nExamples:\n"
            + HelpExampleCli("uptime", ""));

    return GetTime() - GetStartupTime();
}

static const CRPCCommand vRPCCommands[] = {
    //  category       name        actor       okSafeMode  argNames
    { "control",      "help",     &help,      true,       {"command"} },
    { "control",      "stop",     &stop,      true,       {} },
    { "control",      "uptime",   &uptime,    true,       {} },
};

CRPCTable::CRPCTable()
{
    for (const auto& cmd : vRPCCommands) {
        mapCommands[cmd.name] = &cmd;
    }
}

const CRPCCommand* CRPCTable::operator[](const std::string& name) const
{
    auto it = mapCommands.find(name);
    if (it == mapCommands.end())
        return nullptr;
    return it->second;
}

std::string CRPCTable::help(const std::string& strCommand) const
{
    std::string strRet;
    std::string category;
    std::set<rpcfn_type> setDone;
    std::vector<std::pair<std::string, const CRPCCommand*> > vCommands;

    for (const auto& entry : mapCommands)
        vCommands.push_back(std::make_pair(entry.second->category + entry.first, entry.second));
    std::sort(vCommands.begin(), vCommands.end());

    JSONRPCRequest jreq;
    jreq.fHelp = true;
    for (const auto& command : vCommands) {
        const CRPCCommand* pcmd = command.second;
        std::string strMethod = pcmd->name;
        if ((strCommand != "" || pcmd->category == "hidden") && strMethod != strCommand)
            continue;
        jreq.strMethod = strMethod;
        try {
            rpcfn_type pfn = pcmd->actor;
            if (setDone.insert(pfn).second)
                (*pfn)(jreq);
        } catch (const std::exception& e) {
            // Help text is returned in an exception
            std::string strHelp = std::string(e.what());
            if (strCommand == "") {
                if (strHelp.find('\n') != std::string::npos)
                    strHelp = strHelp.substr(0, strHelp.find('\n'));

                if (category != pcmd->category) {
                    if (!category.empty())
                        strRet += "\n";
                    category = pcmd->category;
                    std::string firstLetter = category.substr(0, 1);
                    boost::to_upper(firstLetter);
                    strRet += "== " + firstLetter + category.substr(1) + " ==\n";
                }
            }
            strRet += strHelp + "\n";
        }
    }
    if (strRet == "")
        strRet = strprintf("help: unknown command: %s\n", strCommand);
    strRet = strRet.substr(0, strRet.size() - 1);
    return strRet;
}

bool CRPCTable::appendCommand(const std::string& name, const CRPCCommand* pcmd)
{
    std::map<std::string, const CRPCCommand*>::iterator it = mapCommands.find(name);
    if (it != mapCommands.end())
        return false;

    mapCommands[name] = pcmd;
    return true;
}

std::vector<std::string> CRPCTable::listCommands() const
{
    std::vector<std::string> commandList;
    for (const auto& entry : mapCommands)
        commandList.push_back(entry.first);
    return commandList;
}

/**
 * Process named arguments into a vector of positional arguments, based on the
 * argument names registered for the RPC call.
 */
static inline JSONRPCRequest transformNamedArguments(const JSONRPCRequest& in, const std::vector<std::string>& argNames)
{
    JSONRPCRequest out = in;
    out.params = UniValue(UniValue::VARR);
    // Build a map of parameters, and remove ones that have been processed, so that we can throw a focused error if
    // there is an unknown one.
    const std::vector<std::string>& keys = in.params.getKeys();
    const std::vector<UniValue>& values = in.params.getValues();
    std::map<std::string, const UniValue*> argsIn;
    for (size_t i = 0; i < keys.size(); ++i) {
        argsIn[keys[i]] = &values[i];
    }
    // Process expected parameters.
    int hole = 0;
    for (const std::string& argName : argNames) {
        auto fr = argsIn.find(argName);
        if (fr != argsIn.end()) {
            for (int i = 0; i < hole; ++i) {
                // Fill hole between specified parameters with JSON nulls,
                // but not at the end (for backwards compatibility with calls
                // that act based on number of specified parameters).
                out.params.push_back(UniValue());
            }
            hole = 0;
            out.params.push_back(*fr->second);
            argsIn.erase(fr);
        } else {
            hole += 1;
        }
    }
    // If there are still arguments in the argsIn map, this is an error.
    if (!argsIn.empty()) {
        throw JSONRPCError(RPC_INVALID_PARAMETER, "Unknown named parameter " + argsIn.begin()->first);
    }
    // Return request with named arguments transformed to positional arguments
    return out;
}

UniValue CRPCTable::execute(const JSONRPCRequest& request) const
{
    // Find method
    const CRPCCommand* pcmd = tableRPC[request.strMethod];
    if (!pcmd)
        throw JSONRPCError(RPC_METHOD_NOT_FOUND, "Method not found");

    try {
        // Execute, convert arguments to array if necessary
        if (request.params.isObject()) {
            return pcmd->actor(transformNamedArguments(request, pcmd->argNames));
        } else {
            return pcmd->actor(request);
        }
    } catch (const dbwrapper_error& e) {
        throw JSONRPCError(RPC_DATABASE_ERROR, e.what());
    } catch (const std::exception& e) {
        throw JSONRPCError(RPC_MISC_ERROR, e.what());
    }
}

std::string JSONRPCExecOne(const UniValue& req)
{
    UniValue rpc_result(UniValue::VOBJ);

    JSONRPCRequest jreq;
    try {
        jreq.parse(req);

        UniValue result = tableRPC.execute(jreq);
        rpc_result = JSONRPCReplyObj(result, NullUniValue, jreq.id);
    } catch (const UniValue& objError) {
        rpc_result = JSONRPCReplyObj(NullUniValue, objError, jreq.id);
    } catch (const std::exception& e) {
        rpc_result = JSONRPCReplyObj(NullUniValue,
                                     JSONRPCError(RPC_PARSE_ERROR, e.what()), jreq.id);
    }

    return rpc_result.write() + "\n";
}

CRPCTable tableRPC;
