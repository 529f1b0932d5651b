// Copyright (c) 2026 The LinkedToken developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "linkedtoken/custody.h"

#include "consensus/validation.h"
#include "logging.h"
#include "utilmoneystr.h"

// =============================================================================
// CTokenAccounts
// =============================================================================

CAmount CTokenAccounts::GetBalance(const uint160& account) const
{
    LOCK(cs_accounts);
    auto it = mapBalances.find(account);
    return it == mapBalances.end() ? 0 : it->second;
}

CAmount CTokenAccounts::GetTotalSupply() const
{
    LOCK(cs_accounts);
    return nTotalSupply;
}

bool CTokenAccounts::Mint(const uint160& account, CAmount amount, CValidationState& state)
{
    if (amount <= 0 || !MoneyRange(amount)) {
        return state.Invalid(false, REJECT_INVALID, "custody-bad-amount");
    }

    LOCK(cs_accounts);
    if (amount > MAX_MONEY - nTotalSupply) {
        return state.Invalid(false, REJECT_INVALID, "custody-supply-overflow");
    }
    mapBalances[account] += amount;
    nTotalSupply += amount;
    return true;
}

bool CTokenAccounts::Burn(const uint160& account, CAmount amount, CValidationState& state)
{
    if (amount <= 0 || !MoneyRange(amount)) {
        return state.Invalid(false, REJECT_INVALID, "custody-bad-amount");
    }

    LOCK(cs_accounts);
    auto it = mapBalances.find(account);
    if (it == mapBalances.end() || it->second < amount) {
        return state.Invalid(false, REJECT_INSUFFICIENT, "custody-insufficient-balance",
                             strprintf("%s has %s, needs %s", account.ToString(),
                                       FormatMoney(it == mapBalances.end() ? 0 : it->second), FormatMoney(amount)));
    }
    it->second -= amount;
    if (it->second == 0) mapBalances.erase(it);
    nTotalSupply -= amount;
    return true;
}

bool CTokenAccounts::Move(const uint160& from, const uint160& to, CAmount amount, CValidationState& state)
{
    if (amount <= 0 || !MoneyRange(amount)) {
        return state.Invalid(false, REJECT_INVALID, "custody-bad-amount");
    }

    LOCK(cs_accounts);
    auto it = mapBalances.find(from);
    if (it == mapBalances.end() || it->second < amount) {
        return state.Invalid(false, REJECT_INSUFFICIENT, "custody-insufficient-balance",
                             strprintf("%s has %s, needs %s", from.ToString(),
                                       FormatMoney(it == mapBalances.end() ? 0 : it->second), FormatMoney(amount)));
    }
    it->second -= amount;
    if (it->second == 0) mapBalances.erase(it);
    mapBalances[to] += amount;
    return true;
}

// =============================================================================
// CLockVaultCustody
// =============================================================================

bool CLockVaultCustody::Capture(const uint160& holder, CAmount amount, CValidationState& state)
{
    if (!accounts.Move(holder, vault, amount, state))
        return false;
    LogPrint(BCLog::CUSTODY, "Custody: locked %s from %s\n", FormatMoney(amount), holder.ToString());
    return true;
}

bool CLockVaultCustody::Release(const uint160& beneficiary, CAmount amount, CValidationState& state)
{
    if (accounts.GetBalance(vault) < amount) {
        return state.Invalid(false, REJECT_INSUFFICIENT, "custody-vault-insufficient",
                             strprintf("vault holds %s, release of %s", FormatMoney(accounts.GetBalance(vault)), FormatMoney(amount)));
    }
    if (!accounts.Move(vault, beneficiary, amount, state))
        return false;
    LogPrint(BCLog::CUSTODY, "Custody: unlocked %s to %s\n", FormatMoney(amount), beneficiary.ToString());
    return true;
}

// =============================================================================
// CBurnMintCustody
// =============================================================================

bool CBurnMintCustody::Capture(const uint160& holder, CAmount amount, CValidationState& state)
{
    if (!accounts.Burn(holder, amount, state))
        return false;
    LogPrint(BCLog::CUSTODY, "Custody: burned %s from %s\n", FormatMoney(amount), holder.ToString());
    return true;
}

bool CBurnMintCustody::Release(const uint160& beneficiary, CAmount amount, CValidationState& state)
{
    if (!accounts.Mint(beneficiary, amount, state))
        return false;
    LogPrint(BCLog::CUSTODY, "Custody: minted %s to %s\n", FormatMoney(amount), beneficiary.ToString());
    return true;
}
