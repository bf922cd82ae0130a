// Copyright (c) 2026 The Agora Core developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or https://www.opensource.org/licenses/mit-license.php.

#ifndef AGORA_TENDER_TENDER_H
#define AGORA_TENDER_TENDER_H

#include "optional.h"

#include <stdint.h>
#include <string>

/** Identity of a caller (voter, company representative or admin) */
typedef std::string AccountId;
/** Identifier of a company in the company directory */
typedef uint64_t CompanyId;
/** Identity of a project created by the project factory */
typedef std::string ProjectId;
/** Sequential index of a proposal inside its tender */
typedef uint32_t ProposalId;

enum class TenderPhase {
    VOTING,
    APPROVED,
    DECLINED,
    PROPOSING,
    PROPOSAL_VOTING,
    VOTING_CLOSED,
    AWARDED,
};

/** Everything that moves a tender from one phase to another */
enum class TenderAction {
    APPROVE_BY_VOTE,        //! automatic, yes votes reached the threshold
    OVERRIDE_APPROVE,
    OVERRIDE_DECLINE,
    OPEN_PROPOSING,
    CLOSE_PROPOSING,
    CLOSE_PROPOSAL_VOTING,
    AWARD,
};

std::string TenderPhaseToString(TenderPhase phase);
Optional<TenderPhase> TenderPhaseFromString(const std::string& str);
std::string TenderActionToString(TenderAction action);

/**
 * Look up the phase reached by applying action while in phase from.
 * This table is the only place where phase edges are defined: an action
 * that is not listed for the current phase has no target and the caller
 * must reject the operation.
 */
Optional<TenderPhase> GetTenderTransition(TenderAction action, TenderPhase from);

/** True if some action leads from one phase to the other */
bool IsTenderTransition(TenderPhase from, TenderPhase to);

/**
 * A bid submitted by a company representative while the tender is open
 * for proposals. Only the vote count changes after creation.
 */
class CTenderProposal
{
private:
    ProposalId nId;
    CompanyId nCompanyId;
    AccountId strSubmitter;
    std::string strDescriptorURI;
    int64_t nSubmitTime;
    int64_t nVoteCount{0};

public:
    CTenderProposal(ProposalId nIdIn, CompanyId nCompanyIdIn, const AccountId& strSubmitterIn,
                    const std::string& strDescriptorURIIn, int64_t nSubmitTimeIn);

    ProposalId GetId() const { return nId; }
    CompanyId GetCompanyId() const { return nCompanyId; }
    const AccountId& GetSubmitter() const { return strSubmitter; }
    const std::string& GetDescriptorURI() const { return strDescriptorURI; }
    int64_t GetSubmitTime() const { return nSubmitTime; }
    int64_t GetVoteCount() const { return nVoteCount; }

    void AddVote() { nVoteCount++; }

    /**
     * True if this proposal should take the lead from the given one:
     * strictly more votes, or as many votes and an earlier submission.
     */
    bool Outranks(const CTenderProposal& other) const;

    std::string ToString() const;
};

#endif // AGORA_TENDER_TENDER_H
