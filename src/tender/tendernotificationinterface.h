// Copyright (c) 2026 The Agora Core developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or https://www.opensource.org/licenses/mit-license.php.

#ifndef AGORA_TENDER_TENDERNOTIFICATIONINTERFACE_H
#define AGORA_TENDER_TENDERNOTIFICATIONINTERFACE_H

#include "amount.h"
#include "tender/tender.h"

#include <map>
#include <memory>
#include <vector>

#include <boost/signals2/connection.hpp>

class CTenderSignals;

/**
 * Implement this to subscribe to the events of a tender.
 * Callbacks run after every write of the operation has been committed, while
 * the tender lock is still held, so they observe events in operation order and
 * may read the tender from the same thread. They must not call back into the
 * tender that fired them from another thread. An exception thrown by a
 * callback is logged and skips the remaining callbacks of that event; it does
 * not undo the operation.
 */
class CTenderNotificationInterface
{
protected:
    friend class CTenderSignals;

    virtual ~CTenderNotificationInterface() {}

    virtual void PhaseChanged(TenderPhase oldPhase, TenderPhase newPhase, TenderAction action) {}
    virtual void ApprovalVoteAccepted(const AccountId& voter, int64_t nYesVotes) {}
    virtual void ProposalSubmitted(const CTenderProposal& proposal) {}
    virtual void ProposalVoteAccepted(ProposalId nProposalId, const AccountId& voter, int64_t nVotes, ProposalId nLeadingProposal) {}
    virtual void TenderAwarded(ProposalId nWinningProposal, const ProjectId& projectId, CAmount nAmount) {}
    virtual void AdminUpdated(const AccountId& oldAdmin, const AccountId& newAdmin) {}
};

struct CTenderSignalsInstance;

/** Dispatches tender events to the registered interfaces */
class CTenderSignals
{
private:
    std::unique_ptr<CTenderSignalsInstance> m_internals;
    std::map<CTenderNotificationInterface*, std::vector<boost::signals2::scoped_connection>> m_connections;

public:
    CTenderSignals();
    ~CTenderSignals();

    void Register(CTenderNotificationInterface* pinterface);
    void Unregister(CTenderNotificationInterface* pinterface);
    void UnregisterAll();

    void PhaseChanged(TenderPhase oldPhase, TenderPhase newPhase, TenderAction action);
    void ApprovalVoteAccepted(const AccountId& voter, int64_t nYesVotes);
    void ProposalSubmitted(const CTenderProposal& proposal);
    void ProposalVoteAccepted(ProposalId nProposalId, const AccountId& voter, int64_t nVotes, ProposalId nLeadingProposal);
    void TenderAwarded(ProposalId nWinningProposal, const ProjectId& projectId, CAmount nAmount);
    void AdminUpdated(const AccountId& oldAdmin, const AccountId& newAdmin);
};

/** Writes every tender event to the debug log */
class CTenderAuditLog : public CTenderNotificationInterface
{
public:
    explicit CTenderAuditLog(const std::string& strTenderIdIn) : strTenderId(strTenderIdIn) {}

protected:
    void PhaseChanged(TenderPhase oldPhase, TenderPhase newPhase, TenderAction action) override;
    void ApprovalVoteAccepted(const AccountId& voter, int64_t nYesVotes) override;
    void ProposalSubmitted(const CTenderProposal& proposal) override;
    void ProposalVoteAccepted(ProposalId nProposalId, const AccountId& voter, int64_t nVotes, ProposalId nLeadingProposal) override;
    void TenderAwarded(ProposalId nWinningProposal, const ProjectId& projectId, CAmount nAmount) override;
    void AdminUpdated(const AccountId& oldAdmin, const AccountId& newAdmin) override;

private:
    std::string strTenderId;
};

#endif // AGORA_TENDER_TENDERNOTIFICATIONINTERFACE_H
