// Copyright (c) 2026 The LinkedToken developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "linkedtoken/ledgerdb.h"

#include "logging.h"
#include "util/system.h"

// DB key helpers
namespace {

template<typename T>
std::pair<char, T> MakeKey(char prefix, const T& key)
{
    return std::make_pair(prefix, key);
}

// Initiator index key: 'I' + initiator + id
struct InitiatorIndexKey
{
    uint160 initiator;
    uint256 id;

    SERIALIZE_METHODS(InitiatorIndexKey, obj)
    {
        READWRITE(obj.initiator, obj.id);
    }
};

} // anonymous namespace

// =============================================================================
// Constructor / Destructor
// =============================================================================

CUnconfirmedTransferDB::CUnconfirmedTransferDB(const std::string& strName, size_t nCacheSize, bool fMemory, bool fWipe)
{
    fs::path path = GetDataDir() / strName;
    db = std::make_unique<CDBWrapper>(path, nCacheSize, fMemory, fWipe);
}

CUnconfirmedTransferDB::~CUnconfirmedTransferDB() = default;

// =============================================================================
// Transfer Record Operations
// =============================================================================

bool CUnconfirmedTransferDB::WriteTransfer(const uint256& id, const UnconfirmedTransfer& transfer)
{
    Batch batch(*this);
    batch.WriteTransfer(id, transfer);
    return batch.Commit();
}

bool CUnconfirmedTransferDB::ReadTransfer(const uint256& id, UnconfirmedTransfer& transfer) const
{
    return db->Read(MakeKey(DB_UNCONFIRMED, id), transfer);
}

bool CUnconfirmedTransferDB::EraseTransfer(const uint256& id)
{
    UnconfirmedTransfer transfer;
    if (!ReadTransfer(id, transfer))
        return false;

    Batch batch(*this);
    batch.EraseTransfer(id, transfer);
    return batch.Commit();
}

bool CUnconfirmedTransferDB::HaveTransfer(const uint256& id) const
{
    return db->Exists(MakeKey(DB_UNCONFIRMED, id));
}

// =============================================================================
// Query Operations
// =============================================================================

bool CUnconfirmedTransferDB::GetByInitiator(const uint160& initiator, std::vector<uint256>& ids) const
{
    ids.clear();

    // Iterate over all entries with this initiator prefix
    std::unique_ptr<CDBIterator> it(db->NewIterator());
    InitiatorIndexKey prefix{initiator, uint256()};
    it->Seek(MakeKey(DB_UNCONFIRMED_INITIATOR, prefix));

    while (it->Valid()) {
        std::pair<char, InitiatorIndexKey> key;
        if (it->GetKey(key) && key.first == DB_UNCONFIRMED_INITIATOR && key.second.initiator == initiator) {
            ids.push_back(key.second.id);
            it->Next();
        } else {
            break;  // No more entries for this initiator
        }
    }

    return !ids.empty();
}

void CUnconfirmedTransferDB::ForEachTransfer(std::function<bool(const uint256&, const UnconfirmedTransfer&)> func) const
{
    std::unique_ptr<CDBIterator> it(db->NewIterator());
    it->Seek(MakeKey(DB_UNCONFIRMED, uint256()));

    while (it->Valid()) {
        std::pair<char, uint256> key;
        if (it->GetKey(key) && key.first == DB_UNCONFIRMED) {
            UnconfirmedTransfer transfer;
            if (it->GetValue(transfer)) {
                if (!func(key.second, transfer)) {
                    break;  // Callback returned false, stop iteration
                }
            }
            it->Next();
        } else {
            break;  // No more transfer entries
        }
    }
}

CUnconfirmedTransferDB::Stats CUnconfirmedTransferDB::GetStats() const
{
    Stats stats{0, 0, false};
    ForEachTransfer([&](const uint256&, const UnconfirmedTransfer& transfer) {
        stats.pendingCount++;
        if (stats.fAmountCapped)
            return true;
        if (transfer.amount > MAX_MONEY - stats.pendingAmount) {
            stats.pendingAmount = MAX_MONEY;
            stats.fAmountCapped = true;
        } else {
            stats.pendingAmount += transfer.amount;
        }
        return true;
    });
    return stats;
}

// =============================================================================
// Link Configuration
// =============================================================================

bool CUnconfirmedTransferDB::WriteLinkConfig(const LinkConfig& link)
{
    return db->Write(DB_LINK_CONFIG, link, true);
}

bool CUnconfirmedTransferDB::ReadLinkConfig(LinkConfig& link) const
{
    return db->Read(DB_LINK_CONFIG, link);
}

// =============================================================================
// Batch Operations
// =============================================================================

CUnconfirmedTransferDB::Batch::Batch(CUnconfirmedTransferDB& db) : batch(CLIENT_VERSION), parent(db) {}

void CUnconfirmedTransferDB::Batch::WriteTransfer(const uint256& id, const UnconfirmedTransfer& transfer)
{
    batch.Write(MakeKey(DB_UNCONFIRMED, id), transfer);
    InitiatorIndexKey key{transfer.initiator, id};
    batch.Write(MakeKey(DB_UNCONFIRMED_INITIATOR, key), true);  // Value is just a marker
}

void CUnconfirmedTransferDB::Batch::EraseTransfer(const uint256& id, const UnconfirmedTransfer& transfer)
{
    batch.Erase(MakeKey(DB_UNCONFIRMED, id));
    InitiatorIndexKey key{transfer.initiator, id};
    batch.Erase(MakeKey(DB_UNCONFIRMED_INITIATOR, key));
}

void CUnconfirmedTransferDB::Batch::WriteLinkConfig(const LinkConfig& link)
{
    batch.Write(DB_LINK_CONFIG, link);
}

bool CUnconfirmedTransferDB::Batch::Commit()
{
    return parent.db->WriteBatch(batch, true);
}

bool CUnconfirmedTransferDB::Sync()
{
    return db->Sync();
}

// =============================================================================
// InitUnconfirmedTransferDB - Open a ledger database
// =============================================================================

bool InitUnconfirmedTransferDB(std::unique_ptr<CUnconfirmedTransferDB>& db, const std::string& strName,
                               size_t nCacheSize, bool fMemory, bool fWipe)
{
    try {
        db.reset();
        db = std::make_unique<CUnconfirmedTransferDB>(strName, nCacheSize, fMemory, fWipe);
        LogPrint(BCLog::LEDGER, "Ledger: Initialized database %s (cache=%zu, memory=%d, wipe=%d)\n",
                 strName, nCacheSize, fMemory, fWipe);
        return true;
    } catch (const std::exception& e) {
        LogPrintf("ERROR: Failed to initialize ledger database %s: %s\n", strName, e.what());
        return false;
    }
}
