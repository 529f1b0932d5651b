// Copyright (c) 2026 The LinkedToken developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#ifndef LINKEDTOKEN_LINKEDTOKEN_LEDGERDB_H
#define LINKEDTOKEN_LINKEDTOKEN_LEDGERDB_H

/**
 * Unconfirmed transfer ledger
 *
 * Provides persistence for the origin side of linked transfers:
 * - WriteTransfer / ReadTransfer / EraseTransfer (by envelope id)
 * - GetByInitiator (for listing one account's outstanding transfers)
 * - WriteLinkConfig / ReadLinkConfig (link survives restarts)
 *
 * Record and index always change together, use Batch for that.
 */

#include "dbwrapper.h"
#include "linkedtoken/transfer.h"

#include <functional>
#include <memory>
#include <string>
#include <vector>

static const char* const DEFAULT_LEDGER_DB_NAME = "ledger";

class CUnconfirmedTransferDB
{
private:
    std::unique_ptr<CDBWrapper> db;

public:
    CUnconfirmedTransferDB(const std::string& strName, size_t nCacheSize, bool fMemory = false, bool fWipe = false);
    ~CUnconfirmedTransferDB();

    // === Transfer Record Operations ===

    /**
     * WriteTransfer - Store a record and its initiator index entry
     * @param id Envelope id of the dispatched call
     * @param transfer The record to store
     * @return true on success
     */
    bool WriteTransfer(const uint256& id, const UnconfirmedTransfer& transfer);

    /**
     * ReadTransfer - Retrieve a record by envelope id
     * @return true if found
     */
    bool ReadTransfer(const uint256& id, UnconfirmedTransfer& transfer) const;

    /**
     * EraseTransfer - Remove a record and its index entry
     * @return false if the record did not exist or the write failed
     */
    bool EraseTransfer(const uint256& id);

    bool HaveTransfer(const uint256& id) const;

    // === Query Operations ===

    /**
     * GetByInitiator - Envelope ids of every pending transfer started by `initiator`
     * @return true if any found
     */
    bool GetByInitiator(const uint160& initiator, std::vector<uint256>& ids) const;

    /**
     * ForEachTransfer - Iterate over all pending transfers in id order
     * @param func Callback (return false to stop)
     */
    void ForEachTransfer(std::function<bool(const uint256&, const UnconfirmedTransfer&)> func) const;

    struct Stats {
        size_t pendingCount;
        //! Sum of pending amounts, held at MAX_MONEY once it would exceed it
        CAmount pendingAmount;
        bool fAmountCapped;
    };

    Stats GetStats() const;

    // === Link Configuration ===

    bool WriteLinkConfig(const LinkConfig& link);
    bool ReadLinkConfig(LinkConfig& link) const;

    // === Batch Operations ===

    class Batch
    {
    private:
        CDBBatch batch;
        CUnconfirmedTransferDB& parent;

    public:
        explicit Batch(CUnconfirmedTransferDB& db);

        void WriteTransfer(const uint256& id, const UnconfirmedTransfer& transfer);
        void EraseTransfer(const uint256& id, const UnconfirmedTransfer& transfer);
        void WriteLinkConfig(const LinkConfig& link);

        bool Commit();
    };

    Batch CreateBatch() { return Batch(*this); }

    // Sync to disk
    bool Sync();
};

/**
 * InitUnconfirmedTransferDB - Open a ledger under <datadir>/<strName>
 *
 * @param db Output: the opened ledger, reset first
 * @param nCacheSize DB cache size in bytes
 * @param fMemory If true, use in-memory database (for tests)
 * @param fWipe If true, wipe and recreate DB
 * @return true on success
 */
bool InitUnconfirmedTransferDB(std::unique_ptr<CUnconfirmedTransferDB>& db, const std::string& strName,
                               size_t nCacheSize, bool fMemory = false, bool fWipe = false);

#endif // LINKEDTOKEN_LINKEDTOKEN_LEDGERDB_H
