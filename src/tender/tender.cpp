// Copyright (c) 2026 The Agora Core developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or https://www.opensource.org/licenses/mit-license.php.

#include "tender/tender.h"

#include "util/string.h"

#include <vector>

struct CTenderTransitionRule
{
    TenderAction action;
    std::vector<TenderPhase> from;
    TenderPhase to;
};

static const CTenderTransitionRule transitionRules[] = {
    { TenderAction::APPROVE_BY_VOTE,       {TenderPhase::VOTING},                          TenderPhase::APPROVED },
    { TenderAction::OVERRIDE_APPROVE,      {TenderPhase::VOTING, TenderPhase::DECLINED},   TenderPhase::APPROVED },
    { TenderAction::OVERRIDE_DECLINE,      {TenderPhase::VOTING, TenderPhase::APPROVED},   TenderPhase::DECLINED },
    { TenderAction::OPEN_PROPOSING,        {TenderPhase::APPROVED},                        TenderPhase::PROPOSING },
    { TenderAction::CLOSE_PROPOSING,       {TenderPhase::PROPOSING},                       TenderPhase::PROPOSAL_VOTING },
    { TenderAction::CLOSE_PROPOSAL_VOTING, {TenderPhase::PROPOSAL_VOTING},                 TenderPhase::VOTING_CLOSED },
    { TenderAction::AWARD,                 {TenderPhase::VOTING_CLOSED},                   TenderPhase::AWARDED },
};

Optional<TenderPhase> GetTenderTransition(TenderAction action, TenderPhase from)
{
    for (const auto& rule : transitionRules) {
        if (rule.action != action) continue;
        for (const TenderPhase phase : rule.from) {
            if (phase == from) return rule.to;
        }
        return nullopt;
    }
    return nullopt;
}

bool IsTenderTransition(TenderPhase from, TenderPhase to)
{
    for (const auto& rule : transitionRules) {
        if (rule.to != to) continue;
        for (const TenderPhase phase : rule.from) {
            if (phase == from) return true;
        }
    }
    return false;
}

std::string TenderPhaseToString(TenderPhase phase)
{
    switch (phase) {
    case TenderPhase::VOTING:          return "VOTING";
    case TenderPhase::APPROVED:        return "APPROVED";
    case TenderPhase::DECLINED:        return "DECLINED";
    case TenderPhase::PROPOSING:       return "PROPOSING";
    case TenderPhase::PROPOSAL_VOTING: return "PROPOSAL_VOTING";
    case TenderPhase::VOTING_CLOSED:   return "VOTING_CLOSED";
    case TenderPhase::AWARDED:         return "AWARDED";
    }
    return "UNKNOWN";
}

Optional<TenderPhase> TenderPhaseFromString(const std::string& str)
{
    for (const TenderPhase phase : {TenderPhase::VOTING, TenderPhase::APPROVED, TenderPhase::DECLINED,
                                    TenderPhase::PROPOSING, TenderPhase::PROPOSAL_VOTING,
                                    TenderPhase::VOTING_CLOSED, TenderPhase::AWARDED}) {
        if (TenderPhaseToString(phase) == str) return phase;
    }
    return nullopt;
}

std::string TenderActionToString(TenderAction action)
{
    switch (action) {
    case TenderAction::APPROVE_BY_VOTE:       return "approve-by-vote";
    case TenderAction::OVERRIDE_APPROVE:      return "override-approve";
    case TenderAction::OVERRIDE_DECLINE:      return "override-decline";
    case TenderAction::OPEN_PROPOSING:        return "open-proposing";
    case TenderAction::CLOSE_PROPOSING:       return "close-proposing";
    case TenderAction::CLOSE_PROPOSAL_VOTING: return "close-proposal-voting";
    case TenderAction::AWARD:                 return "award";
    }
    return "unknown";
}

CTenderProposal::CTenderProposal(ProposalId nIdIn, CompanyId nCompanyIdIn, const AccountId& strSubmitterIn,
                                 const std::string& strDescriptorURIIn, int64_t nSubmitTimeIn) :
        nId(nIdIn),
        nCompanyId(nCompanyIdIn),
        strSubmitter(strSubmitterIn),
        strDescriptorURI(strDescriptorURIIn),
        nSubmitTime(nSubmitTimeIn)
{}

bool CTenderProposal::Outranks(const CTenderProposal& other) const
{
    if (nVoteCount != other.nVoteCount) return nVoteCount > other.nVoteCount;
    return nId < other.nId;
}

std::string CTenderProposal::ToString() const
{
    return strprintf("CTenderProposal(id=%d, company=%d, submitter=%s, votes=%d, uri=%s)",
                     nId, nCompanyId, strSubmitter, nVoteCount, strDescriptorURI);
}
