// Copyright (c) 2026 The Agora Core developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or https://www.opensource.org/licenses/mit-license.php.

#include "tender/tenderparams.h"

#include "logging.h"
#include "tender/companyconfig.h"
#include "util/system.h"
#include "utiltime.h"

#include <limits>

bool CTenderParams::Check(std::string& strError) const
{
    if (strTenderId.empty()) {
        strError = "tender id cannot be empty";
        return false;
    }
    if (admin.empty()) {
        strError = "tender admin cannot be empty";
        return false;
    }
    if (nVotingDuration <= 0) {
        strError = strprintf("invalid voting duration %d, must be positive", nVotingDuration);
        return false;
    }
    // the deadline is the creation time plus the duration
    if (nVotingDuration > std::numeric_limits<int64_t>::max() - GetTime()) {
        strError = strprintf("invalid voting duration %d, deadline out of range", nVotingDuration);
        return false;
    }
    if (nRequiredYesVotes < 1) {
        strError = strprintf("invalid required yes votes %d, must be at least 1", nRequiredYesVotes);
        return false;
    }
    return true;
}

std::string GetTenderHelpString()
{
    std::string strUsage = HelpMessageGroup("Tender options:");
    strUsage += HelpMessageOpt("-tenderid=<id>", strprintf("Identity of the tender, passed to the project factory (default: %s)", DEFAULT_TENDER_ID));
    strUsage += HelpMessageOpt("-tenderadmin=<account>", "Account holding the admin override authority (required)");
    strUsage += HelpMessageOpt("-tenderduration=<n>", strprintf("Seconds during which approval votes are accepted (default: %u)", DEFAULT_TENDER_VOTING_DURATION));
    strUsage += HelpMessageOpt("-tenderrequiredvotes=<n>", strprintf("Approval votes needed to approve the tender (default: %u)", DEFAULT_TENDER_REQUIRED_VOTES));
    strUsage += HelpMessageOpt("-tenderuri=<uri>", "Location of the tender documentation");
    strUsage += HelpMessageOpt("-companyconf=<file>", strprintf("Specify the company directory file (default: %s)", AGORA_COMPANY_CONF_FILENAME));
    return strUsage;
}

static bool ReadInt64Arg(const ArgsManager& args, const std::string& strArg, int64_t& nRet, std::string& strError)
{
    if (!args.IsArgSet(strArg)) return true;
    const std::string strValue = args.GetArg(strArg, "");
    if (!ParseInt64(strValue, &nRet)) {
        strError = strprintf("Invalid number for %s: '%s'", strArg, strValue);
        return false;
    }
    return true;
}

bool ReadTenderParams(const ArgsManager& args, CTenderParams& paramsRet, std::string& strError)
{
    CTenderParams params;
    params.strTenderId = args.GetArg("-tenderid", DEFAULT_TENDER_ID);
    params.admin = args.GetArg("-tenderadmin", "");
    params.strDescriptorURI = args.GetArg("-tenderuri", "");
    if (!ReadInt64Arg(args, "-tenderduration", params.nVotingDuration, strError) ||
        !ReadInt64Arg(args, "-tenderrequiredvotes", params.nRequiredYesVotes, strError)) {
        return false;
    }
    if (!params.Check(strError)) {
        return false;
    }

    LogPrint(BCLog::CONFIG, "%s: tender %s, admin %s, duration %d, required votes %d\n", __func__,
             params.strTenderId, params.admin, params.nVotingDuration, params.nRequiredYesVotes);
    paramsRet = params;
    return true;
}
