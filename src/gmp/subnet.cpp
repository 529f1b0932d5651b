// Copyright (c) 2026 The LinkedToken developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "gmp/subnet.h"

#include "utilstrencodings.h"

SubnetID SubnetID::CreateChild(const uint160& subnetActor) const
{
    SubnetID child(*this);
    child.route.push_back(subnetActor);
    return child;
}

bool SubnetID::GetParent(SubnetID& parent) const
{
    if (IsNull() || route.empty())
        return false;
    parent = *this;
    parent.route.pop_back();
    return true;
}

std::string SubnetID::ToString() const
{
    std::string str = strprintf("/r%u", root);
    for (const uint160& actor : route) {
        str += "/" + actor.ToString();
    }
    return str;
}

bool SubnetID::FromString(const std::string& str, SubnetID& subnet)
{
    subnet = SubnetID();

    // Split on '/', the leading slash yields an empty first element
    std::vector<std::string> parts;
    size_t start = 0;
    while (start <= str.size()) {
        size_t end = str.find('/', start);
        if (end == std::string::npos) end = str.size();
        parts.push_back(str.substr(start, end - start));
        start = end + 1;
    }

    if (parts.size() < 2 || !parts[0].empty())
        return false;

    const std::string& rootPart = parts[1];
    if (rootPart.size() < 2 || rootPart[0] != 'r')
        return false;
    uint64_t root = 0;
    if (!ParseUInt64(rootPart.substr(1), &root) || root == 0)
        return false;

    std::vector<uint160> route;
    for (size_t i = 2; i < parts.size(); i++) {
        std::string hex = StripHexPrefix(parts[i]);
        if (hex.size() != 40 || !IsHex(hex))
            return false;
        route.push_back(uint160(ParseHex(hex)));
    }

    subnet.root = root;
    subnet.route = route;
    return true;
}
