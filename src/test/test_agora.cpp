// Copyright (c) 2011-2018 The Bitcoin Core developers
// Copyright (c) 2026 The Agora Core developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or https://www.opensource.org/licenses/mit-license.php.

#include "test/test_agora.h"

#include "logging.h"
#include "util/system.h"
#include "utiltime.h"

#include <stdexcept>

#include <boost/test/unit_test.hpp>

BasicTestingSetup::BasicTestingSetup()
{
    SetMockTime(TEST_GENESIS_TIME);
    gArgs.ClearArgs();
    g_logger->m_print_to_console = false;
    g_logger->m_print_to_file = false;
    g_logger->EnableCategory(BCLog::ALL);
    m_path_root = fs::temp_directory_path() / strprintf("test_agora_%d_%s", GetSystemTimeInSeconds(),
                                                        fs::unique_path("%%%%%%%%").string());
    fs::create_directories(m_path_root);
}

BasicTestingSetup::~BasicTestingSetup()
{
    fs::remove_all(m_path_root);
    g_logger->DisableCategory(BCLog::ALL);
    gArgs.ClearArgs();
    SetMockTime(0);
}

fs::path BasicTestingSetup::SetDataDir(const std::string& name)
{
    fs::path ret = m_path_root / name;
    fs::create_directories(ret);
    return ret;
}

CompanyLookupResult CTestCompanyDirectory::LookupRepresentative(CompanyId nCompanyId, AccountId& representativeRet, std::string& strError) const
{
    nLookups++;
    if (fThrow) throw std::runtime_error("directory offline");
    if (fFail) {
        strError = "directory unavailable";
        return CompanyLookupResult::FAILED;
    }
    const auto it = mapCompanies.find(nCompanyId);
    if (it == mapCompanies.end()) return CompanyLookupResult::UNKNOWN_COMPANY;
    representativeRet = it->second;
    return CompanyLookupResult::FOUND;
}

bool CTestFundingLedger::Disburse(CAmount nAmount, const ProjectId& projectId, std::string& strError)
{
    if (fThrow) throw std::runtime_error("ledger offline");
    if (fFail) {
        strError = "insufficient funds";
        return false;
    }
    vDisbursements.emplace_back(nAmount, projectId);
    return true;
}

bool CTestProjectFactory::CreateProject(const std::string& strTenderId, CompanyId nCompanyId, ProjectId& projectIdRet, std::string& strError)
{
    vRequests.emplace_back(strTenderId, nCompanyId);
    if (fFail) {
        strError = "factory unavailable";
        return false;
    }
    projectIdRet = strprintf("project-%s-%d", strTenderId, ++nCreated);
    vProjects.push_back(projectIdRet);
    return true;
}

bool CTestProjectFactory::DiscardProject(const ProjectId& projectId, std::string& strError)
{
    if (fFailDiscard) {
        strError = "discard refused";
        return false;
    }
    for (auto it = vProjects.begin(); it != vProjects.end(); ++it) {
        if (*it == projectId) {
            vProjects.erase(it);
            vDiscarded.push_back(projectId);
            return true;
        }
    }
    strError = strprintf("no project %s", projectId);
    return false;
}

void CTenderEventRecorder::PhaseChanged(TenderPhase oldPhase, TenderPhase newPhase, TenderAction action)
{
    vPhaseChanges.emplace_back(oldPhase, newPhase);
    vEvents.push_back(strprintf("phase %s->%s %s", TenderPhaseToString(oldPhase), TenderPhaseToString(newPhase),
                                TenderActionToString(action)));
}

void CTenderEventRecorder::ApprovalVoteAccepted(const AccountId& voter, int64_t nYesVotes)
{
    vEvents.push_back(strprintf("approval %s %d", voter, nYesVotes));
}

void CTenderEventRecorder::ProposalSubmitted(const CTenderProposal& proposal)
{
    vEvents.push_back(strprintf("proposal %d %d", proposal.GetId(), proposal.GetCompanyId()));
}

void CTenderEventRecorder::ProposalVoteAccepted(ProposalId nProposalId, const AccountId& voter, int64_t nVotes, ProposalId nLeadingProposal)
{
    vEvents.push_back(strprintf("vote %s %d %d %d", voter, nProposalId, nVotes, nLeadingProposal));
}

void CTenderEventRecorder::TenderAwarded(ProposalId nWinningProposal, const ProjectId& projectId, CAmount nAmount)
{
    vEvents.push_back(strprintf("award %d %s %d", nWinningProposal, projectId, nAmount));
}

void CTenderEventRecorder::AdminUpdated(const AccountId& oldAdmin, const AccountId& newAdmin)
{
    vEvents.push_back(strprintf("admin %s %s", oldAdmin, newAdmin));
}

TenderTestingSetup::TenderTestingSetup()
{
    directory.mapCompanies[TEST_COMPANY_A] = TEST_REP_A;
    directory.mapCompanies[TEST_COMPANY_B] = TEST_REP_B;
    directory.mapCompanies[TEST_COMPANY_C] = TEST_REP_C;
    ResetTender(DEFAULT_TENDER_VOTING_DURATION, 2);
}

TenderTestingSetup::~TenderTestingSetup()
{
    if (tender) tender->UnregisterNotificationInterface(&recorder);
}

void TenderTestingSetup::ResetTender(int64_t nVotingDuration, int64_t nRequiredYesVotes)
{
    if (tender) tender->UnregisterNotificationInterface(&recorder);
    recorder.vPhaseChanges.clear();
    recorder.vEvents.clear();

    CTenderParams params;
    params.strTenderId = "roads";
    params.admin = TEST_ADMIN;
    params.nVotingDuration = nVotingDuration;
    params.nRequiredYesVotes = nRequiredYesVotes;
    params.strDescriptorURI = "ipfs://roads";
    tender.reset(new CTenderManager(params, directory, ledger, factory));
    tender->RegisterNotificationInterface(&recorder);
}

void TenderTestingSetup::Approve()
{
    CValidationState state;
    BOOST_REQUIRE(tender->OverrideAndApprove(TEST_ADMIN, state));
    BOOST_REQUIRE(tender->GetPhase() == TenderPhase::APPROVED);
}

void TenderTestingSetup::OpenProposing()
{
    Approve();
    CValidationState state;
    BOOST_REQUIRE(tender->OpenTenderForProposals(TEST_ADMIN, state));
    BOOST_REQUIRE(tender->GetPhase() == TenderPhase::PROPOSING);
}

void TenderTestingSetup::OpenProposalVoting(const std::vector<CompanyId>& vCompanies)
{
    OpenProposing();
    for (const CompanyId nCompanyId : vCompanies) {
        CValidationState state;
        BOOST_REQUIRE(tender->SubmitProposal(nCompanyId, strprintf("ipfs://bid-%d", nCompanyId),
                                             directory.mapCompanies.at(nCompanyId), state));
    }
    CValidationState state;
    BOOST_REQUIRE(tender->CloseProposingAndOpenVoting(TEST_ADMIN, state));
    BOOST_REQUIRE(tender->GetPhase() == TenderPhase::PROPOSAL_VOTING);
}

void TenderTestingSetup::CloseVoting()
{
    CValidationState state;
    BOOST_REQUIRE(tender->CloseProposalVoting(TEST_ADMIN, state));
    BOOST_REQUIRE(tender->GetPhase() == TenderPhase::VOTING_CLOSED);
}

void TenderTestingSetup::CheckRejected(const CValidationState& state, unsigned int nRejectCode, const std::string& strReason)
{
    BOOST_CHECK(!state.IsValid());
    BOOST_CHECK_EQUAL(state.GetRejectCode(), nRejectCode);
    BOOST_CHECK_EQUAL(state.GetRejectReason(), strReason);
}
