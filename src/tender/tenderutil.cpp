// Copyright (c) 2021 The hemis Core developers
// Copyright (c) 2026 The Agora Core developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or https://www.opensource.org/licenses/mit-license.php.

#include "tender/tenderutil.h"

#include "consensus/validation.h"
#include "util/validation.h"
#include "utiltime.h"

static UniValue packRetStatus(const std::string& strOperation, const std::string& result, const std::string& error)
{
    UniValue statusObj(UniValue::VOBJ);
    statusObj.pushKV("operation", strOperation);
    statusObj.pushKV("result", result);
    statusObj.pushKV("error", error);
    return statusObj;
}

UniValue ProposalToJSON(const CTenderProposal& proposal, bool fLeading)
{
    UniValue obj(UniValue::VOBJ);
    obj.pushKV("id", (int64_t)proposal.GetId());
    obj.pushKV("companyId", (int64_t)proposal.GetCompanyId());
    obj.pushKV("submitter", proposal.GetSubmitter());
    obj.pushKV("uri", proposal.GetDescriptorURI());
    obj.pushKV("submitTime", proposal.GetSubmitTime());
    obj.pushKV("votes", proposal.GetVoteCount());
    obj.pushKV("leading", fLeading);
    return obj;
}

UniValue TenderToJSON(const CTenderSnapshot& snapshot)
{
    UniValue ret(UniValue::VOBJ);
    ret.pushKV("tenderId", snapshot.strTenderId);
    ret.pushKV("uri", snapshot.strDescriptorURI);
    ret.pushKV("phase", TenderPhaseToString(snapshot.phase));
    ret.pushKV("admin", snapshot.admin);
    ret.pushKV("votingDeadline", snapshot.nVotingDeadline);
    ret.pushKV("votingDeadlineISO", FormatISO8601DateTime(snapshot.nVotingDeadline));
    ret.pushKV("yesVotes", snapshot.nYesVoteCount);
    ret.pushKV("requiredYesVotes", snapshot.nRequiredYesVotes);

    UniValue proposals(UniValue::VARR);
    for (const CTenderProposal& p : snapshot.vProposals) {
        proposals.push_back(ProposalToJSON(p, !snapshot.vProposals.empty() && p.GetId() == snapshot.nCurrentWinningProposal));
    }
    ret.pushKV("proposals", proposals);
    ret.pushKV("currentWinningProposal", (int64_t)snapshot.nCurrentWinningProposal);

    if (snapshot.nWinningProposal) {
        ret.pushKV("winningProposal", (int64_t)*snapshot.nWinningProposal);
    } else {
        ret.pushKV("winningProposal", NullUniValue);
    }
    if (snapshot.awardedProject) {
        ret.pushKV("awardedProject", *snapshot.awardedProject);
    } else {
        ret.pushKV("awardedProject", NullUniValue);
    }
    return ret;
}

UniValue OperationResultToJSON(const std::string& strOperation, const CValidationState& state)
{
    if (state.IsValid()) {
        return packRetStatus(strOperation, "success", "");
    }
    UniValue ret = packRetStatus(strOperation, "failed", FormatStateMessage(state));
    ret.pushKV("kind", GetRejectCodeName(state.GetRejectCode()));
    ret.pushKV("code", (int64_t)state.GetRejectCode());
    return ret;
}
