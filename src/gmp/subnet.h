// Copyright (c) 2026 The LinkedToken developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#ifndef LINKEDTOKEN_GMP_SUBNET_H
#define LINKEDTOKEN_GMP_SUBNET_H

#include "serialize.h"
#include "uint256.h"

#include <stdint.h>
#include <string>
#include <vector>

/**
 * SubnetID - Hierarchical domain identifier
 *
 * A domain is named by the chain id of its root network plus the route of
 * subnet actor addresses from the root down to it:
 *
 *   /r314159                              root network
 *   /r314159/0x1f2e...                    child of the root
 *   /r314159/0x1f2e.../0x9a8b...          grandchild
 *
 * Two SubnetIDs are the same domain iff root and every route element match
 * exactly. There is no normalization beyond that.
 */
class SubnetID
{
public:
    uint64_t root;
    std::vector<uint160> route;

    SubnetID() : root(0) {}
    SubnetID(uint64_t rootIn, const std::vector<uint160>& routeIn) : root(rootIn), route(routeIn) {}

    SERIALIZE_METHODS(SubnetID, obj)
    {
        READWRITE(obj.root, obj.route);
    }

    //! A null SubnetID has no root chain and names no domain.
    bool IsNull() const { return root == 0; }
    bool IsRoot() const { return root != 0 && route.empty(); }

    //! Number of route elements below the root.
    size_t Depth() const { return route.size(); }

    /** Child domain one level below this one. */
    SubnetID CreateChild(const uint160& subnetActor) const;

    /** Parent domain; fails for a root or null subnet. */
    bool GetParent(SubnetID& parent) const;

    std::string ToString() const;

    /**
     * Parse the canonical "/r<root>/<0xaddr>..." form.
     * @return false on any malformed component
     */
    static bool FromString(const std::string& str, SubnetID& subnet);

    friend bool operator==(const SubnetID& a, const SubnetID& b)
    {
        return a.root == b.root && a.route == b.route;
    }
    friend bool operator!=(const SubnetID& a, const SubnetID& b) { return !(a == b); }
};

#endif // LINKEDTOKEN_GMP_SUBNET_H
