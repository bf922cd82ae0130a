// Copyright (c) 2026 The Agora Core developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or https://www.opensource.org/licenses/mit-license.php.

#include "tender/tenderman.h"

#include "consensus/validation.h"
#include "logging.h"
#include "util/validation.h"
#include "utiltime.h"

#include <limits>
#include <stdexcept>

static bool RejectOperation(const char* strOperation, CValidationState& state, unsigned int nRejectCode,
                            const std::string& strRejectReason, const std::string& strDebugMessage)
{
    state.Invalid(false, nRejectCode, strRejectReason, strDebugMessage);
    LogPrint(BCLog::TENDER, "%s: %s\n", strOperation, FormatStateMessage(state));
    return false;
}

static bool DependencyFailure(const char* strOperation, CValidationState& state,
                              const std::string& strRejectReason, const std::string& strDebugMessage)
{
    state.Error(strRejectReason, strDebugMessage);
    LogPrintf("%s: %s\n", strOperation, FormatStateMessage(state));
    return false;
}

// Parameters are checked before the deadline is computed from them.
static int64_t CheckedVotingDeadline(const CTenderParams& params)
{
    std::string strError;
    if (!params.Check(strError)) {
        throw std::invalid_argument(strprintf("CTenderManager: %s", strError));
    }
    // the clock may have moved since Check
    const int64_t nNow = GetTime();
    if (params.nVotingDuration > std::numeric_limits<int64_t>::max() - nNow) {
        throw std::invalid_argument(strprintf("CTenderManager: voting duration %d ends after the time range", params.nVotingDuration));
    }
    return nNow + params.nVotingDuration;
}

CTenderManager::CTenderManager(const CTenderParams& params,
                               CCompanyDirectory& companyDirectoryIn,
                               CFundingLedger& fundingLedgerIn,
                               CProjectFactory& projectFactoryIn) :
        strTenderId(params.strTenderId),
        strDescriptorURI(params.strDescriptorURI),
        nVotingDeadline(CheckedVotingDeadline(params)),
        nRequiredYesVotes(params.nRequiredYesVotes),
        companyDirectory(companyDirectoryIn),
        fundingLedger(fundingLedgerIn),
        projectFactory(projectFactoryIn)
{
    LOCK(cs_tender);
    admin = params.admin;
    LogPrint(BCLog::TENDER, "%s: tender %s created, admin %s, deadline %s, required votes %d\n", __func__,
             strTenderId, admin, FormatISO8601DateTime(nVotingDeadline), nRequiredYesVotes);
}

bool CTenderManager::CheckAdmin(const AccountId& caller, const char* strOperation, CValidationState& state) const
{
    AssertLockHeld(cs_tender);
    if (caller != admin) {
        return RejectOperation(strOperation, state, REJECT_AUTHORIZATION, "tender-not-admin",
                               strprintf("%s is not the tender admin", caller));
    }
    return true;
}

bool CTenderManager::CheckTransition(TenderAction action, const char* strOperation, TenderPhase& nextRet, CValidationState& state) const
{
    AssertLockHeld(cs_tender);
    const Optional<TenderPhase> next = GetTenderTransition(action, phase);
    if (!next) {
        return RejectOperation(strOperation, state, REJECT_PHASE, "tender-bad-phase",
                               strprintf("%s not allowed in phase %s", TenderActionToString(action), TenderPhaseToString(phase)));
    }
    nextRet = *next;
    return true;
}

TenderPhase CTenderManager::SetPhase(TenderPhase nextPhase, TenderAction action)
{
    AssertLockHeld(cs_tender);
    const TenderPhase oldPhase = phase;
    phase = nextPhase;
    LogPrint(BCLog::TENDER, "%s: tender %s %s -> %s (%s)\n", __func__, strTenderId,
             TenderPhaseToString(oldPhase), TenderPhaseToString(nextPhase), TenderActionToString(action));
    return oldPhase;
}

CompanyLookupResult CTenderManager::LookupRepresentative(CompanyId nCompanyId, AccountId& representativeRet, std::string& strError) const
{
    try {
        return companyDirectory.LookupRepresentative(nCompanyId, representativeRet, strError);
    } catch (const std::exception& e) {
        strError = strprintf("company directory exception: %s", e.what());
        return CompanyLookupResult::FAILED;
    }
}

bool CTenderManager::CreateProject(CompanyId nCompanyId, ProjectId& projectIdRet, std::string& strError)
{
    try {
        return projectFactory.CreateProject(strTenderId, nCompanyId, projectIdRet, strError);
    } catch (const std::exception& e) {
        strError = strprintf("project factory exception: %s", e.what());
        return false;
    }
}

bool CTenderManager::Disburse(CAmount nAmount, const ProjectId& projectId, std::string& strError)
{
    try {
        return fundingLedger.Disburse(nAmount, projectId, strError);
    } catch (const std::exception& e) {
        strError = strprintf("funding ledger exception: %s", e.what());
        return false;
    }
}

bool CTenderManager::DiscardProject(const ProjectId& projectId, std::string& strError)
{
    try {
        return projectFactory.DiscardProject(projectId, strError);
    } catch (const std::exception& e) {
        strError = strprintf("project factory exception: %s", e.what());
        return false;
    }
}

bool CTenderManager::CastApprovalVote(const AccountId& voter, CValidationState& state)
{
    LOCK(cs_tender);

    if (phase != TenderPhase::VOTING) {
        return RejectOperation(__func__, state, REJECT_PHASE, "tender-bad-phase",
                               strprintf("approval votes need phase VOTING, tender is %s", TenderPhaseToString(phase)));
    }

    const int64_t nNow = GetTime();
    if (nNow > nVotingDeadline) {
        return RejectOperation(__func__, state, REJECT_DEADLINE, "tender-voting-expired",
                               strprintf("voting ended at %s, now %s",
                                         FormatISO8601DateTime(nVotingDeadline), FormatISO8601DateTime(nNow)));
    }

    if (voter.empty()) {
        return RejectOperation(__func__, state, REJECT_INVALID, "tender-bad-voter", "empty voter identity");
    }

    if (setYesVoters.count(voter)) {
        return RejectOperation(__func__, state, REJECT_DUPLICATE_VOTE, "tender-duplicate-vote",
                               strprintf("%s already approved the tender", voter));
    }

    setYesVoters.insert(voter);
    const int64_t nYesVotes = setYesVoters.size();
    LogPrint(BCLog::TENDERVOTE, "%s: approval from %s (%d/%d)\n", __func__, voter, nYesVotes, nRequiredYesVotes);

    // The vote that reaches the threshold approves the tender in the same step.
    Optional<TenderPhase> next;
    if (nYesVotes >= nRequiredYesVotes) {
        next = GetTenderTransition(TenderAction::APPROVE_BY_VOTE, phase);
    }
    const TenderPhase oldPhase = next ? SetPhase(*next, TenderAction::APPROVE_BY_VOTE) : phase;

    signals.ApprovalVoteAccepted(voter, nYesVotes);
    if (next) signals.PhaseChanged(oldPhase, *next, TenderAction::APPROVE_BY_VOTE);
    return true;
}

bool CTenderManager::SubmitProposal(CompanyId nCompanyId, const std::string& strProposalURI, const AccountId& caller,
                                    CValidationState& state, ProposalId* pnProposalIdRet)
{
    LOCK(cs_tender);

    if (phase != TenderPhase::PROPOSING) {
        return RejectOperation(__func__, state, REJECT_PHASE, "tender-bad-phase",
                               strprintf("proposals need phase PROPOSING, tender is %s", TenderPhaseToString(phase)));
    }

    if (vProposals.size() >= std::numeric_limits<ProposalId>::max()) {
        return RejectOperation(__func__, state, REJECT_INVALID, "tender-too-many-proposals",
                               strprintf("tender already holds %d proposals", vProposals.size()));
    }

    AccountId representative;
    std::string strError;
    switch (LookupRepresentative(nCompanyId, representative, strError)) {
    case CompanyLookupResult::FOUND:
        break;
    case CompanyLookupResult::UNKNOWN_COMPANY:
        return RejectOperation(__func__, state, REJECT_NOT_FOUND, "tender-unknown-company",
                               strprintf("company %d is not registered", nCompanyId));
    case CompanyLookupResult::FAILED:
        return DependencyFailure(__func__, state, "tender-directory-failed",
                                 strprintf("lookup of company %d failed: %s", nCompanyId, strError));
    }

    if (representative != caller) {
        return RejectOperation(__func__, state, REJECT_AUTHORIZATION, "tender-not-representative",
                               strprintf("%s does not represent company %d", caller, nCompanyId));
    }

    const ProposalId nId = vProposals.size();
    vProposals.emplace_back(nId, nCompanyId, caller, strProposalURI, GetTime());
    LogPrint(BCLog::TENDER, "%s: %s\n", __func__, vProposals.back().ToString());
    signals.ProposalSubmitted(vProposals.back());

    if (pnProposalIdRet) *pnProposalIdRet = nId;
    return true;
}

bool CTenderManager::VoteForProposal(ProposalId nProposalId, const AccountId& voter, CValidationState& state)
{
    LOCK(cs_tender);

    if (phase != TenderPhase::PROPOSAL_VOTING) {
        return RejectOperation(__func__, state, REJECT_PHASE, "tender-bad-phase",
                               strprintf("proposal votes need phase PROPOSAL_VOTING, tender is %s", TenderPhaseToString(phase)));
    }

    if (nProposalId >= vProposals.size()) {
        return RejectOperation(__func__, state, REJECT_NOT_FOUND, "tender-unknown-proposal",
                               strprintf("proposal %d does not exist (%d proposals)", nProposalId, vProposals.size()));
    }

    if (voter.empty()) {
        return RejectOperation(__func__, state, REJECT_INVALID, "tender-bad-voter", "empty voter identity");
    }

    const auto vote = std::make_pair(voter, nProposalId);
    if (setProposalVotes.count(vote)) {
        return RejectOperation(__func__, state, REJECT_DUPLICATE_VOTE, "tender-duplicate-vote",
                               strprintf("%s already voted for proposal %d", voter, nProposalId));
    }

    setProposalVotes.insert(vote);
    CTenderProposal& proposal = vProposals[nProposalId];
    proposal.AddVote();
    if (nProposalId != nCurrentWinningProposal && proposal.Outranks(vProposals[nCurrentWinningProposal])) {
        nCurrentWinningProposal = nProposalId;
    }

    LogPrint(BCLog::TENDERVOTE, "%s: %s voted for proposal %d (%d votes), leading proposal %d\n", __func__,
             voter, nProposalId, proposal.GetVoteCount(), nCurrentWinningProposal);
    signals.ProposalVoteAccepted(nProposalId, voter, proposal.GetVoteCount(), nCurrentWinningProposal);
    return true;
}

bool CTenderManager::ApplyAdminTransition(const AccountId& caller, TenderAction action, const char* strOperation, CValidationState& state)
{
    LOCK(cs_tender);
    TenderPhase next{TenderPhase::VOTING};
    if (!CheckAdmin(caller, strOperation, state) || !CheckTransition(action, strOperation, next, state)) {
        return false;
    }
    const TenderPhase oldPhase = SetPhase(next, action);
    signals.PhaseChanged(oldPhase, next, action);
    return true;
}

bool CTenderManager::OverrideAndApprove(const AccountId& caller, CValidationState& state)
{
    return ApplyAdminTransition(caller, TenderAction::OVERRIDE_APPROVE, __func__, state);
}

bool CTenderManager::OverrideAndDecline(const AccountId& caller, CValidationState& state)
{
    return ApplyAdminTransition(caller, TenderAction::OVERRIDE_DECLINE, __func__, state);
}

bool CTenderManager::OpenTenderForProposals(const AccountId& caller, CValidationState& state)
{
    return ApplyAdminTransition(caller, TenderAction::OPEN_PROPOSING, __func__, state);
}

bool CTenderManager::CloseProposingAndOpenVoting(const AccountId& caller, CValidationState& state)
{
    LOCK(cs_tender);
    TenderPhase next{TenderPhase::VOTING};
    if (!CheckAdmin(caller, __func__, state) || !CheckTransition(TenderAction::CLOSE_PROPOSING, __func__, next, state)) {
        return false;
    }
    // Without proposals there is nothing to vote for and no default winner.
    if (vProposals.empty()) {
        return RejectOperation(__func__, state, REJECT_NOT_FOUND, "tender-no-proposals",
                               "cannot open proposal voting without proposals");
    }
    const TenderPhase oldPhase = SetPhase(next, TenderAction::CLOSE_PROPOSING);
    signals.PhaseChanged(oldPhase, next, TenderAction::CLOSE_PROPOSING);
    return true;
}

bool CTenderManager::CloseProposalVoting(const AccountId& caller, CValidationState& state)
{
    return ApplyAdminTransition(caller, TenderAction::CLOSE_PROPOSAL_VOTING, __func__, state);
}

bool CTenderManager::AwardProposal(const AccountId& caller, CAmount nFundingAmount, CValidationState& state)
{
    LOCK(cs_tender);
    TenderPhase next{TenderPhase::VOTING};
    if (!CheckAdmin(caller, __func__, state) || !CheckTransition(TenderAction::AWARD, __func__, next, state)) {
        return false;
    }

    if (nFundingAmount <= 0 || !MoneyRange(nFundingAmount)) {
        return RejectOperation(__func__, state, REJECT_INVALID, "tender-bad-amount",
                               strprintf("funding amount %d out of range", nFundingAmount));
    }

    if (nCurrentWinningProposal >= vProposals.size()) {
        return RejectOperation(__func__, state, REJECT_NOT_FOUND, "tender-unknown-proposal",
                               strprintf("leading proposal %d does not exist", nCurrentWinningProposal));
    }
    const CTenderProposal& winner = vProposals[nCurrentWinningProposal];

    // Nothing is written to the tender until both collaborators succeeded.
    ProjectId projectId;
    std::string strError;
    if (!CreateProject(winner.GetCompanyId(), projectId, strError)) {
        return DependencyFailure(__func__, state, "tender-project-failed",
                                 strprintf("project for company %d not created: %s", winner.GetCompanyId(), strError));
    }

    if (!Disburse(nFundingAmount, projectId, strError)) {
        std::string strDiscardError;
        if (!DiscardProject(projectId, strDiscardError)) {
            strError += strprintf("; project %s could not be discarded: %s", projectId, strDiscardError);
        }
        return DependencyFailure(__func__, state, "tender-disburse-failed",
                                 strprintf("disbursement of %d to project %s failed: %s", nFundingAmount, projectId, strError));
    }

    nWinningProposal = nCurrentWinningProposal;
    awardedProject = projectId;
    const TenderPhase oldPhase = SetPhase(next, TenderAction::AWARD);
    LogPrintf("%s: tender %s awarded to proposal %d, project %s, amount %d\n", __func__,
              strTenderId, nCurrentWinningProposal, projectId, nFundingAmount);

    signals.PhaseChanged(oldPhase, next, TenderAction::AWARD);
    signals.TenderAwarded(nCurrentWinningProposal, projectId, nFundingAmount);
    return true;
}

bool CTenderManager::UpdateAdmin(const AccountId& caller, const AccountId& newAdmin, CValidationState& state)
{
    LOCK(cs_tender);
    if (!CheckAdmin(caller, __func__, state)) {
        return false;
    }
    if (newAdmin.empty()) {
        return RejectOperation(__func__, state, REJECT_INVALID, "tender-bad-admin", "new admin cannot be empty");
    }

    const AccountId oldAdmin = admin;
    admin = newAdmin;
    LogPrintf("%s: tender %s admin %s -> %s\n", __func__, strTenderId, oldAdmin, newAdmin);
    signals.AdminUpdated(oldAdmin, newAdmin);
    return true;
}

void CTenderManager::RegisterNotificationInterface(CTenderNotificationInterface* pinterface)
{
    LOCK(cs_tender);
    signals.Register(pinterface);
}

void CTenderManager::UnregisterNotificationInterface(CTenderNotificationInterface* pinterface)
{
    LOCK(cs_tender);
    signals.Unregister(pinterface);
}

TenderPhase CTenderManager::GetPhase() const
{
    LOCK(cs_tender);
    return phase;
}

AccountId CTenderManager::GetAdmin() const
{
    LOCK(cs_tender);
    return admin;
}

int64_t CTenderManager::GetYesVoteCount() const
{
    LOCK(cs_tender);
    return setYesVoters.size();
}

bool CTenderManager::HasApprovalVoted(const AccountId& voter) const
{
    LOCK(cs_tender);
    return setYesVoters.count(voter) > 0;
}

bool CTenderManager::HasVotedForProposal(const AccountId& voter, ProposalId nProposalId) const
{
    LOCK(cs_tender);
    return setProposalVotes.count(std::make_pair(voter, nProposalId)) > 0;
}

size_t CTenderManager::GetProposalCount() const
{
    LOCK(cs_tender);
    return vProposals.size();
}

Optional<CTenderProposal> CTenderManager::GetProposal(ProposalId nProposalId) const
{
    LOCK(cs_tender);
    if (nProposalId >= vProposals.size()) return nullopt;
    return vProposals[nProposalId];
}

std::vector<CTenderProposal> CTenderManager::GetProposals() const
{
    LOCK(cs_tender);
    return vProposals;
}

ProposalId CTenderManager::GetCurrentWinningProposal() const
{
    LOCK(cs_tender);
    return nCurrentWinningProposal;
}

Optional<ProposalId> CTenderManager::GetWinningProposal() const
{
    LOCK(cs_tender);
    return nWinningProposal;
}

Optional<ProjectId> CTenderManager::GetAwardedProject() const
{
    LOCK(cs_tender);
    return awardedProject;
}

CTenderSnapshot CTenderManager::GetSnapshot() const
{
    LOCK(cs_tender);
    CTenderSnapshot snapshot;
    snapshot.strTenderId = strTenderId;
    snapshot.strDescriptorURI = strDescriptorURI;
    snapshot.phase = phase;
    snapshot.admin = admin;
    snapshot.nVotingDeadline = nVotingDeadline;
    snapshot.nYesVoteCount = setYesVoters.size();
    snapshot.nRequiredYesVotes = nRequiredYesVotes;
    snapshot.vProposals = vProposals;
    snapshot.nCurrentWinningProposal = nCurrentWinningProposal;
    snapshot.nWinningProposal = nWinningProposal;
    snapshot.awardedProject = awardedProject;
    return snapshot;
}

std::string CTenderManager::ToString() const
{
    LOCK(cs_tender);
    return strprintf("CTenderManager(id=%s, phase=%s, admin=%s, yes votes=%d/%d, proposals=%d, leading=%d)",
                     strTenderId, TenderPhaseToString(phase), admin, setYesVoters.size(), nRequiredYesVotes,
                     vProposals.size(), nCurrentWinningProposal);
}
