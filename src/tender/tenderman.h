// Copyright (c) 2026 The Agora Core developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or https://www.opensource.org/licenses/mit-license.php.

#ifndef AGORA_TENDER_TENDERMAN_H
#define AGORA_TENDER_TENDERMAN_H

#include "amount.h"
#include "optional.h"
#include "sync.h"
#include "tender/tender.h"
#include "tender/tenderinterfaces.h"
#include "tender/tendernotificationinterface.h"
#include "tender/tenderparams.h"

#include <set>
#include <string>
#include <utility>
#include <vector>

class CValidationState;

/** Consistent copy of everything a tender publishes */
struct CTenderSnapshot
{
    std::string strTenderId;
    std::string strDescriptorURI;
    TenderPhase phase{TenderPhase::VOTING};
    AccountId admin;
    int64_t nVotingDeadline{0};
    int64_t nYesVoteCount{0};
    int64_t nRequiredYesVotes{0};
    std::vector<CTenderProposal> vProposals;
    ProposalId nCurrentWinningProposal{0};
    Optional<ProposalId> nWinningProposal;
    Optional<ProjectId> awardedProject;
};

/**
 * The tender state machine.
 *
 * A tender starts in VOTING. Voters approve it, the admin opens it for
 * proposals, registered companies submit them, voters pick one and the admin
 * awards it. Every operation either commits completely or fails with the
 * reason stored in the CValidationState and no state change. All operations
 * are serialized on cs_tender.
 */
class CTenderManager
{
private:
    // critical section to protect the inner data structures
    mutable RecursiveMutex cs_tender;

    const std::string strTenderId;
    const std::string strDescriptorURI;
    const int64_t nVotingDeadline;
    const int64_t nRequiredYesVotes;

    TenderPhase phase GUARDED_BY(cs_tender){TenderPhase::VOTING};
    AccountId admin GUARDED_BY(cs_tender);

    // voters that approved the tender
    std::set<AccountId> setYesVoters GUARDED_BY(cs_tender);
    // (voter, proposal) pairs already counted
    std::set<std::pair<AccountId, ProposalId>> setProposalVotes GUARDED_BY(cs_tender);

    std::vector<CTenderProposal> vProposals GUARDED_BY(cs_tender);
    ProposalId nCurrentWinningProposal GUARDED_BY(cs_tender){0};

    Optional<ProposalId> nWinningProposal GUARDED_BY(cs_tender);
    Optional<ProjectId> awardedProject GUARDED_BY(cs_tender);

    CCompanyDirectory& companyDirectory;
    CFundingLedger& fundingLedger;
    CProjectFactory& projectFactory;

    CTenderSignals signals;

    bool CheckAdmin(const AccountId& caller, const char* strOperation, CValidationState& state) const EXCLUSIVE_LOCKS_REQUIRED(cs_tender);
    // Resolve the target phase of action, or fail with REJECT_PHASE
    bool CheckTransition(TenderAction action, const char* strOperation, TenderPhase& nextRet, CValidationState& state) const EXCLUSIVE_LOCKS_REQUIRED(cs_tender);
    // Returns the previous phase. Callers fire PhaseChanged once all their writes are done.
    TenderPhase SetPhase(TenderPhase nextPhase, TenderAction action) EXCLUSIVE_LOCKS_REQUIRED(cs_tender);
    // Admin operations that only move the phase
    bool ApplyAdminTransition(const AccountId& caller, TenderAction action, const char* strOperation, CValidationState& state);

    // Collaborator calls. A thrown std::exception counts as a failure.
    CompanyLookupResult LookupRepresentative(CompanyId nCompanyId, AccountId& representativeRet, std::string& strError) const;
    bool CreateProject(CompanyId nCompanyId, ProjectId& projectIdRet, std::string& strError);
    bool Disburse(CAmount nAmount, const ProjectId& projectId, std::string& strError);
    bool DiscardProject(const ProjectId& projectId, std::string& strError);

public:
    /**
     * Create a tender in phase VOTING. The voting deadline is the current
     * time plus params.nVotingDuration. Throws std::invalid_argument if the
     * parameters are not usable (see CTenderParams::Check).
     */
    CTenderManager(const CTenderParams& params,
                   CCompanyDirectory& companyDirectoryIn,
                   CFundingLedger& fundingLedgerIn,
                   CProjectFactory& projectFactoryIn);

    // Voter operations

    /// Approve the tender. Moves it to APPROVED once nRequiredYesVotes voters approved.
    bool CastApprovalVote(const AccountId& voter, CValidationState& state);

    /// Vote for one proposal. A voter may back several proposals, each once.
    bool VoteForProposal(ProposalId nProposalId, const AccountId& voter, CValidationState& state);

    // Company operations

    /// Submit a proposal on behalf of a company. caller must be its representative.
    bool SubmitProposal(CompanyId nCompanyId, const std::string& strDescriptorURI, const AccountId& caller,
                        CValidationState& state, ProposalId* pnProposalIdRet = nullptr);

    // Admin operations

    bool OverrideAndApprove(const AccountId& caller, CValidationState& state);
    bool OverrideAndDecline(const AccountId& caller, CValidationState& state);
    bool OpenTenderForProposals(const AccountId& caller, CValidationState& state);
    /// Requires at least one proposal.
    bool CloseProposingAndOpenVoting(const AccountId& caller, CValidationState& state);
    bool CloseProposalVoting(const AccountId& caller, CValidationState& state);
    /// Create the project of the leading proposal and fund it, all or nothing.
    bool AwardProposal(const AccountId& caller, CAmount nFundingAmount, CValidationState& state);
    bool UpdateAdmin(const AccountId& caller, const AccountId& newAdmin, CValidationState& state);

    // Observers
    void RegisterNotificationInterface(CTenderNotificationInterface* pinterface);
    void UnregisterNotificationInterface(CTenderNotificationInterface* pinterface);

    // Read access
    const std::string& GetTenderId() const { return strTenderId; }
    const std::string& GetDescriptorURI() const { return strDescriptorURI; }
    int64_t GetVotingDeadline() const { return nVotingDeadline; }
    int64_t GetRequiredYesVotes() const { return nRequiredYesVotes; }

    TenderPhase GetPhase() const;
    AccountId GetAdmin() const;
    int64_t GetYesVoteCount() const;
    bool HasApprovalVoted(const AccountId& voter) const;
    bool HasVotedForProposal(const AccountId& voter, ProposalId nProposalId) const;

    size_t GetProposalCount() const;
    Optional<CTenderProposal> GetProposal(ProposalId nProposalId) const;
    std::vector<CTenderProposal> GetProposals() const;

    ProposalId GetCurrentWinningProposal() const;
    Optional<ProposalId> GetWinningProposal() const;
    Optional<ProjectId> GetAwardedProject() const;

    CTenderSnapshot GetSnapshot() const;

    std::string ToString() const;
};

#endif // AGORA_TENDER_TENDERMAN_H
