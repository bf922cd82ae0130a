// Copyright (c) 2026 The Agora Core developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or https://www.opensource.org/licenses/mit-license.php.

#include "tender/tendernotificationinterface.h"

#include "logging.h"

#include <functional>
#include <utility>

#include <boost/signals2/signal.hpp>

using namespace std::placeholders;

struct CTenderSignalsInstance {
    boost::signals2::signal<void (TenderPhase, TenderPhase, TenderAction)> PhaseChanged;
    boost::signals2::signal<void (const AccountId&, int64_t)> ApprovalVoteAccepted;
    boost::signals2::signal<void (const CTenderProposal&)> ProposalSubmitted;
    boost::signals2::signal<void (ProposalId, const AccountId&, int64_t, ProposalId)> ProposalVoteAccepted;
    boost::signals2::signal<void (ProposalId, const ProjectId&, CAmount)> TenderAwarded;
    boost::signals2::signal<void (const AccountId&, const AccountId&)> AdminUpdated;
};

// The tender state is already committed when a signal fires, so a failing
// handler is logged and the operation still succeeds.
template <typename Signal, typename... Args>
static void FireSignal(const char* strEvent, Signal& sig, Args&&... args)
{
    try {
        sig(std::forward<Args>(args)...);
    } catch (const std::exception& e) {
        LogPrintf("%s: notification handler failed: %s\n", strEvent, e.what());
    }
}

CTenderSignals::CTenderSignals() : m_internals(new CTenderSignalsInstance()) {}

// Connections must be released before the signals they belong to.
CTenderSignals::~CTenderSignals()
{
    UnregisterAll();
}

void CTenderSignals::Register(CTenderNotificationInterface* pinterface)
{
    if (m_connections.count(pinterface)) return;
    auto& conns = m_connections[pinterface];
    conns.emplace_back(m_internals->PhaseChanged.connect(std::bind(&CTenderNotificationInterface::PhaseChanged, pinterface, _1, _2, _3)));
    conns.emplace_back(m_internals->ApprovalVoteAccepted.connect(std::bind(&CTenderNotificationInterface::ApprovalVoteAccepted, pinterface, _1, _2)));
    conns.emplace_back(m_internals->ProposalSubmitted.connect(std::bind(&CTenderNotificationInterface::ProposalSubmitted, pinterface, _1)));
    conns.emplace_back(m_internals->ProposalVoteAccepted.connect(std::bind(&CTenderNotificationInterface::ProposalVoteAccepted, pinterface, _1, _2, _3, _4)));
    conns.emplace_back(m_internals->TenderAwarded.connect(std::bind(&CTenderNotificationInterface::TenderAwarded, pinterface, _1, _2, _3)));
    conns.emplace_back(m_internals->AdminUpdated.connect(std::bind(&CTenderNotificationInterface::AdminUpdated, pinterface, _1, _2)));
}

void CTenderSignals::Unregister(CTenderNotificationInterface* pinterface)
{
    m_connections.erase(pinterface);
}

void CTenderSignals::UnregisterAll()
{
    m_connections.clear();
}

void CTenderSignals::PhaseChanged(TenderPhase oldPhase, TenderPhase newPhase, TenderAction action)
{
    FireSignal(__func__, m_internals->PhaseChanged, oldPhase, newPhase, action);
}

void CTenderSignals::ApprovalVoteAccepted(const AccountId& voter, int64_t nYesVotes)
{
    FireSignal(__func__, m_internals->ApprovalVoteAccepted, voter, nYesVotes);
}

void CTenderSignals::ProposalSubmitted(const CTenderProposal& proposal)
{
    FireSignal(__func__, m_internals->ProposalSubmitted, proposal);
}

void CTenderSignals::ProposalVoteAccepted(ProposalId nProposalId, const AccountId& voter, int64_t nVotes, ProposalId nLeadingProposal)
{
    FireSignal(__func__, m_internals->ProposalVoteAccepted, nProposalId, voter, nVotes, nLeadingProposal);
}

void CTenderSignals::TenderAwarded(ProposalId nWinningProposal, const ProjectId& projectId, CAmount nAmount)
{
    FireSignal(__func__, m_internals->TenderAwarded, nWinningProposal, projectId, nAmount);
}

void CTenderSignals::AdminUpdated(const AccountId& oldAdmin, const AccountId& newAdmin)
{
    FireSignal(__func__, m_internals->AdminUpdated, oldAdmin, newAdmin);
}

void CTenderAuditLog::PhaseChanged(TenderPhase oldPhase, TenderPhase newPhase, TenderAction action)
{
    LogPrintf("tender %s: phase %s -> %s (%s)\n", strTenderId,
              TenderPhaseToString(oldPhase), TenderPhaseToString(newPhase), TenderActionToString(action));
}

void CTenderAuditLog::ApprovalVoteAccepted(const AccountId& voter, int64_t nYesVotes)
{
    LogPrint(BCLog::TENDERVOTE, "tender %s: approval vote from %s, yes votes %d\n", strTenderId, voter, nYesVotes);
}

void CTenderAuditLog::ProposalSubmitted(const CTenderProposal& proposal)
{
    LogPrint(BCLog::TENDER, "tender %s: new proposal %s\n", strTenderId, proposal.ToString());
}

void CTenderAuditLog::ProposalVoteAccepted(ProposalId nProposalId, const AccountId& voter, int64_t nVotes, ProposalId nLeadingProposal)
{
    LogPrint(BCLog::TENDERVOTE, "tender %s: vote from %s for proposal %d (%d votes), leading proposal %d\n",
             strTenderId, voter, nProposalId, nVotes, nLeadingProposal);
}

void CTenderAuditLog::TenderAwarded(ProposalId nWinningProposal, const ProjectId& projectId, CAmount nAmount)
{
    LogPrintf("tender %s: awarded to proposal %d, project %s funded with %d\n",
              strTenderId, nWinningProposal, projectId, nAmount);
}

void CTenderAuditLog::AdminUpdated(const AccountId& oldAdmin, const AccountId& newAdmin)
{
    LogPrintf("tender %s: admin changed from %s to %s\n", strTenderId, oldAdmin, newAdmin);
}
