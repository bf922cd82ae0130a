// Copyright (c) 2026 The Agora Core developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or https://www.opensource.org/licenses/mit-license.php.

#include "test/test_agora.h"

#include "consensus/validation.h"
#include "tender/tenderman.h"
#include "util/string.h"
#include "utiltime.h"

#include <random>

#include <boost/test/unit_test.hpp>

BOOST_FIXTURE_TEST_SUITE(tender_proposal_tests, TenderTestingSetup)

BOOST_AUTO_TEST_CASE(submit_proposals)
{
    OpenProposing();
    recorder.vEvents.clear();

    SetMockTime(TEST_GENESIS_TIME + 60);
    CValidationState state;
    ProposalId nId = 99;
    BOOST_CHECK(tender->SubmitProposal(TEST_COMPANY_A, "ipfs://A", TEST_REP_A, state, &nId));
    BOOST_CHECK_EQUAL(nId, 0U);
    BOOST_CHECK(tender->SubmitProposal(TEST_COMPANY_B, "ipfs://B", TEST_REP_B, state, &nId));
    BOOST_CHECK_EQUAL(nId, 1U);
    // a company may bid more than once
    BOOST_CHECK(tender->SubmitProposal(TEST_COMPANY_A, "ipfs://A2", TEST_REP_A, state, &nId));
    BOOST_CHECK_EQUAL(nId, 2U);
    BOOST_CHECK(state.IsValid());

    BOOST_CHECK_EQUAL(tender->GetProposalCount(), 3U);
    const Optional<CTenderProposal> proposal = tender->GetProposal(1);
    BOOST_REQUIRE(proposal);
    BOOST_CHECK_EQUAL(proposal->GetId(), 1U);
    BOOST_CHECK_EQUAL(proposal->GetCompanyId(), TEST_COMPANY_B);
    BOOST_CHECK_EQUAL(proposal->GetSubmitter(), TEST_REP_B);
    BOOST_CHECK_EQUAL(proposal->GetDescriptorURI(), "ipfs://B");
    BOOST_CHECK_EQUAL(proposal->GetSubmitTime(), TEST_GENESIS_TIME + 60);
    BOOST_CHECK_EQUAL(proposal->GetVoteCount(), 0);

    BOOST_REQUIRE_EQUAL(recorder.vEvents.size(), 3U);
    BOOST_CHECK_EQUAL(recorder.vEvents[0], "proposal 0 1");
    BOOST_CHECK_EQUAL(recorder.vEvents[2], "proposal 2 1");
}

BOOST_AUTO_TEST_CASE(submit_not_representative)
{
    OpenProposing();
    CValidationState state;
    BOOST_CHECK(!tender->SubmitProposal(TEST_COMPANY_A, "ipfs://A", TEST_REP_B, state));
    CheckRejected(state, REJECT_AUTHORIZATION, "tender-not-representative");
    BOOST_CHECK_EQUAL(tender->GetProposalCount(), 0U);
}

BOOST_AUTO_TEST_CASE(submit_unknown_company)
{
    OpenProposing();
    CValidationState state;
    BOOST_CHECK(!tender->SubmitProposal(42, "ipfs://X", TEST_REP_A, state));
    CheckRejected(state, REJECT_NOT_FOUND, "tender-unknown-company");
    BOOST_CHECK(state.IsInvalid());
    BOOST_CHECK_EQUAL(tender->GetProposalCount(), 0U);
}

BOOST_AUTO_TEST_CASE(submit_directory_failure)
{
    OpenProposing();
    directory.fFail = true;
    CValidationState state;
    BOOST_CHECK(!tender->SubmitProposal(TEST_COMPANY_A, "ipfs://A", TEST_REP_A, state));
    CheckRejected(state, REJECT_DEPENDENCY, "tender-directory-failed");
    BOOST_CHECK(state.IsError());

    directory.fFail = false;
    directory.fThrow = true;
    CValidationState stateThrow;
    BOOST_CHECK(!tender->SubmitProposal(TEST_COMPANY_A, "ipfs://A", TEST_REP_A, stateThrow));
    CheckRejected(stateThrow, REJECT_DEPENDENCY, "tender-directory-failed");
    BOOST_CHECK(stateThrow.GetDebugMessage().find("directory offline") != std::string::npos);
    BOOST_CHECK_EQUAL(tender->GetProposalCount(), 0U);
    BOOST_CHECK(tender->GetPhase() == TenderPhase::PROPOSING);
}

BOOST_AUTO_TEST_CASE(submit_wrong_phase)
{
    CValidationState state;
    BOOST_CHECK(!tender->SubmitProposal(TEST_COMPANY_A, "ipfs://A", TEST_REP_A, state));
    CheckRejected(state, REJECT_PHASE, "tender-bad-phase");
    // the phase is checked before the directory is asked
    BOOST_CHECK_EQUAL(directory.nLookups, 0);

    OpenProposalVoting({TEST_COMPANY_A});
    CValidationState stateLate;
    BOOST_CHECK(!tender->SubmitProposal(TEST_COMPANY_B, "ipfs://B", TEST_REP_B, stateLate));
    CheckRejected(stateLate, REJECT_PHASE, "tender-bad-phase");
    BOOST_CHECK_EQUAL(tender->GetProposalCount(), 1U);
}

BOOST_AUTO_TEST_CASE(close_proposing_needs_proposals)
{
    OpenProposing();
    CValidationState state;
    BOOST_CHECK(!tender->CloseProposingAndOpenVoting(TEST_ADMIN, state));
    CheckRejected(state, REJECT_NOT_FOUND, "tender-no-proposals");
    BOOST_CHECK(tender->GetPhase() == TenderPhase::PROPOSING);
}

BOOST_AUTO_TEST_CASE(proposal_votes)
{
    OpenProposalVoting({TEST_COMPANY_A, TEST_COMPANY_B});
    CValidationState state;
    BOOST_CHECK(tender->VoteForProposal(1, "alice", state));
    // the same voter may back another proposal
    BOOST_CHECK(tender->VoteForProposal(0, "alice", state));
    BOOST_CHECK(state.IsValid());

    BOOST_CHECK(!tender->VoteForProposal(1, "alice", state));
    CheckRejected(state, REJECT_DUPLICATE_VOTE, "tender-duplicate-vote");
    BOOST_CHECK_EQUAL(tender->GetProposal(1)->GetVoteCount(), 1);

    CValidationState stateUnknown;
    BOOST_CHECK(!tender->VoteForProposal(2, "bob", stateUnknown));
    CheckRejected(stateUnknown, REJECT_NOT_FOUND, "tender-unknown-proposal");

    CValidationState stateEmpty;
    BOOST_CHECK(!tender->VoteForProposal(0, "", stateEmpty));
    CheckRejected(stateEmpty, REJECT_INVALID, "tender-bad-voter");

    BOOST_CHECK(tender->HasVotedForProposal("alice", 0));
    BOOST_CHECK(tender->HasVotedForProposal("alice", 1));
    BOOST_CHECK(!tender->HasVotedForProposal("bob", 0));
    BOOST_CHECK_EQUAL(tender->GetProposal(0)->GetVoteCount(), 1);
}

BOOST_AUTO_TEST_CASE(proposal_votes_wrong_phase)
{
    OpenProposing();
    CValidationState stateSubmit;
    BOOST_REQUIRE(tender->SubmitProposal(TEST_COMPANY_A, "ipfs://A", TEST_REP_A, stateSubmit));

    CValidationState state;
    BOOST_CHECK(!tender->VoteForProposal(0, "alice", state));
    CheckRejected(state, REJECT_PHASE, "tender-bad-phase");

    BOOST_REQUIRE(tender->CloseProposingAndOpenVoting(TEST_ADMIN, state));
    CloseVoting();
    CValidationState stateClosed;
    BOOST_CHECK(!tender->VoteForProposal(0, "alice", stateClosed));
    CheckRejected(stateClosed, REJECT_PHASE, "tender-bad-phase");
    BOOST_CHECK_EQUAL(tender->GetProposal(0)->GetVoteCount(), 0);
}

BOOST_AUTO_TEST_CASE(leading_proposal_ties)
{
    OpenProposalVoting({TEST_COMPANY_A, TEST_COMPANY_B, TEST_COMPANY_C});
    // proposal 0 leads by default
    BOOST_CHECK_EQUAL(tender->GetCurrentWinningProposal(), 0U);

    CValidationState state;
    BOOST_CHECK(tender->VoteForProposal(2, "alice", state));
    BOOST_CHECK_EQUAL(tender->GetCurrentWinningProposal(), 2U);

    // a tie with the incumbent goes to the smaller id
    BOOST_CHECK(tender->VoteForProposal(1, "bob", state));
    BOOST_CHECK_EQUAL(tender->GetCurrentWinningProposal(), 1U);

    BOOST_CHECK(tender->VoteForProposal(2, "bob", state));
    BOOST_CHECK_EQUAL(tender->GetCurrentWinningProposal(), 2U);

    BOOST_CHECK(tender->VoteForProposal(1, "carol", state));
    BOOST_CHECK_EQUAL(tender->GetCurrentWinningProposal(), 1U);

    BOOST_CHECK(tender->VoteForProposal(0, "alice", state));
    BOOST_CHECK_EQUAL(tender->GetCurrentWinningProposal(), 1U);
    BOOST_CHECK(tender->VoteForProposal(0, "bob", state));
    BOOST_CHECK_EQUAL(tender->GetCurrentWinningProposal(), 0U);

    // a duplicate does not move the lead
    CValidationState stateDuplicate;
    BOOST_CHECK(!tender->VoteForProposal(2, "alice", stateDuplicate));
    BOOST_CHECK_EQUAL(tender->GetCurrentWinningProposal(), 0U);

    BOOST_CHECK(tender->VoteForProposal(2, "carol", state));
    BOOST_CHECK_EQUAL(tender->GetCurrentWinningProposal(), 2U);
    BOOST_CHECK_EQUAL(recorder.vEvents.back(), "vote carol 2 3 2");
}

BOOST_AUTO_TEST_CASE(leading_proposal_random_votes)
{
    std::mt19937 rng(7);
    for (int nRound = 0; nRound < 10; nRound++) {
        ResetTender(DEFAULT_TENDER_VOTING_DURATION, 1);
        OpenProposalVoting({TEST_COMPANY_A, TEST_COMPANY_B, TEST_COMPANY_C, TEST_COMPANY_A, TEST_COMPANY_B});

        for (int nVote = 0; nVote < 80; nVote++) {
            CValidationState state;
            tender->VoteForProposal(rng() % 5, strprintf("voter%d", rng() % 12), state);

            // the leader has the most votes and the smallest id among equals
            const std::vector<CTenderProposal> vProposals = tender->GetProposals();
            const ProposalId nLeading = tender->GetCurrentWinningProposal();
            for (const CTenderProposal& proposal : vProposals) {
                BOOST_CHECK(vProposals[nLeading].GetVoteCount() >= proposal.GetVoteCount());
                if (proposal.GetVoteCount() == vProposals[nLeading].GetVoteCount()) {
                    BOOST_CHECK(nLeading <= proposal.GetId());
                }
            }
        }
    }
}

BOOST_AUTO_TEST_CASE(proposal_outranks)
{
    CTenderProposal first(0, TEST_COMPANY_A, TEST_REP_A, "ipfs://A", TEST_GENESIS_TIME);
    CTenderProposal second(1, TEST_COMPANY_B, TEST_REP_B, "ipfs://B", TEST_GENESIS_TIME);
    BOOST_CHECK(first.Outranks(second));
    BOOST_CHECK(!second.Outranks(first));

    second.AddVote();
    BOOST_CHECK(second.Outranks(first));
    first.AddVote();
    BOOST_CHECK(first.Outranks(second));
    BOOST_CHECK(!first.Outranks(first));
}

BOOST_AUTO_TEST_SUITE_END()
