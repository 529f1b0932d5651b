// Copyright (c) 2009-2010 Satoshi Nakamoto
// Copyright (c) 2009-2015 The Bitcoin Core developers
// Copyright (c) 2026 The LinkedToken developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "linkedtoken/signals.h"

#include <boost/signals2/signal.hpp>

#include <map>

struct LinkedTokenSignalsInstance
{
    boost::signals2::signal<void (const LinkConfig&)> LinkInitialized;
    boost::signals2::signal<void (const LinkedTransferSent&)> TransferSent;
    boost::signals2::signal<void (const LinkedTransferReceived&)> TransferReceived;
    boost::signals2::signal<void (const LinkedTransferSettled&)> TransferSettled;
    boost::signals2::signal<void (const uint256&, const UnconfirmedTransfer&, const uint160&)> UnconfirmedTransferRemoved;

    std::multimap<CLinkedTokenInterface*, boost::signals2::connection> connections;
};

CLinkedTokenSignals::CLinkedTokenSignals() : m_internals(new LinkedTokenSignalsInstance()) {}

CLinkedTokenSignals::~CLinkedTokenSignals()
{
    UnregisterAll();
}

void CLinkedTokenSignals::RegisterInterface(CLinkedTokenInterface* pif)
{
    auto& conns = m_internals->connections;
    conns.emplace(pif, m_internals->LinkInitialized.connect([pif](const LinkConfig& link) { pif->LinkInitialized(link); }));
    conns.emplace(pif, m_internals->TransferSent.connect([pif](const LinkedTransferSent& sent) { pif->TransferSent(sent); }));
    conns.emplace(pif, m_internals->TransferReceived.connect([pif](const LinkedTransferReceived& received) { pif->TransferReceived(received); }));
    conns.emplace(pif, m_internals->TransferSettled.connect([pif](const LinkedTransferSettled& settled) { pif->TransferSettled(settled); }));
    conns.emplace(pif, m_internals->UnconfirmedTransferRemoved.connect(
                           [pif](const uint256& id, const UnconfirmedTransfer& transfer, const uint160& removedBy) {
                               pif->UnconfirmedTransferRemoved(id, transfer, removedBy);
                           }));
}

void CLinkedTokenSignals::UnregisterInterface(CLinkedTokenInterface* pif)
{
    auto range = m_internals->connections.equal_range(pif);
    for (auto it = range.first; it != range.second; ++it) {
        it->second.disconnect();
    }
    m_internals->connections.erase(range.first, range.second);
}

void CLinkedTokenSignals::UnregisterAll()
{
    m_internals->LinkInitialized.disconnect_all_slots();
    m_internals->TransferSent.disconnect_all_slots();
    m_internals->TransferReceived.disconnect_all_slots();
    m_internals->TransferSettled.disconnect_all_slots();
    m_internals->UnconfirmedTransferRemoved.disconnect_all_slots();
    m_internals->connections.clear();
}

void CLinkedTokenSignals::LinkInitialized(const LinkConfig& link)
{
    m_internals->LinkInitialized(link);
}

void CLinkedTokenSignals::TransferSent(const LinkedTransferSent& sent)
{
    m_internals->TransferSent(sent);
}

void CLinkedTokenSignals::TransferReceived(const LinkedTransferReceived& received)
{
    m_internals->TransferReceived(received);
}

void CLinkedTokenSignals::TransferSettled(const LinkedTransferSettled& settled)
{
    m_internals->TransferSettled(settled);
}

void CLinkedTokenSignals::UnconfirmedTransferRemoved(const uint256& id, const UnconfirmedTransfer& transfer, const uint160& removedBy)
{
    m_internals->UnconfirmedTransferRemoved(id, transfer, removedBy);
}
