// Copyright (c) 2026 The LinkedToken developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#ifndef LINKEDTOKEN_LINKEDTOKEN_CUSTODY_H
#define LINKEDTOKEN_LINKEDTOKEN_CUSTODY_H

#include "amount.h"
#include "sync.h"
#include "uint256.h"

#include <map>
#include <string>

class CValidationState;

/**
 * ICustodyStrategy - Capture / Release of the underlying value
 *
 * Capture takes `amount` out of the holder's reach, Release hands `amount`
 * to the beneficiary. Both are all-or-nothing: on failure they reject
 * through `state` and leave balances untouched.
 */
class ICustodyStrategy
{
public:
    virtual ~ICustodyStrategy() {}

    virtual bool Capture(const uint160& holder, CAmount amount, CValidationState& state) = 0;
    virtual bool Release(const uint160& beneficiary, CAmount amount, CValidationState& state) = 0;

    virtual std::string GetName() const = 0;
};

/**
 * CTokenAccounts - Balances of the underlying token on one domain
 *
 * Thread safe. Supply = sum of all balances, Mint and Burn move it.
 */
class CTokenAccounts
{
private:
    mutable Mutex cs_accounts;
    std::map<uint160, CAmount> mapBalances;
    CAmount nTotalSupply{0};

public:
    CAmount GetBalance(const uint160& account) const;
    CAmount GetTotalSupply() const;

    bool Mint(const uint160& account, CAmount amount, CValidationState& state);
    bool Burn(const uint160& account, CAmount amount, CValidationState& state);
    bool Move(const uint160& from, const uint160& to, CAmount amount, CValidationState& state);
};

/** Capture locks value in a vault account, Release pays out of it. */
class CLockVaultCustody : public ICustodyStrategy
{
private:
    CTokenAccounts& accounts;
    const uint160 vault;

public:
    CLockVaultCustody(CTokenAccounts& accountsIn, const uint160& vaultIn) : accounts(accountsIn), vault(vaultIn) {}

    bool Capture(const uint160& holder, CAmount amount, CValidationState& state) override;
    bool Release(const uint160& beneficiary, CAmount amount, CValidationState& state) override;
    std::string GetName() const override { return "lock"; }

    const uint160& GetVault() const { return vault; }
};

/** Capture burns supply, Release mints it. */
class CBurnMintCustody : public ICustodyStrategy
{
private:
    CTokenAccounts& accounts;

public:
    explicit CBurnMintCustody(CTokenAccounts& accountsIn) : accounts(accountsIn) {}

    bool Capture(const uint160& holder, CAmount amount, CValidationState& state) override;
    bool Release(const uint160& beneficiary, CAmount amount, CValidationState& state) override;
    std::string GetName() const override { return "burn"; }
};

#endif // LINKEDTOKEN_LINKEDTOKEN_CUSTODY_H
