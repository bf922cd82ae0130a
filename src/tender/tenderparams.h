// Copyright (c) 2026 The Agora Core developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or https://www.opensource.org/licenses/mit-license.php.

#ifndef AGORA_TENDER_TENDERPARAMS_H
#define AGORA_TENDER_TENDERPARAMS_H

#include "tender/tender.h"

#include <stdint.h>
#include <string>

class ArgsManager;

static const int64_t DEFAULT_TENDER_VOTING_DURATION = 7 * 24 * 60 * 60; // One week.
static const int64_t DEFAULT_TENDER_REQUIRED_VOTES = 1;
static const char* const DEFAULT_TENDER_ID = "tender";

/** Parameters a tender is created with */
struct CTenderParams
{
    std::string strTenderId{DEFAULT_TENDER_ID};
    AccountId admin;
    int64_t nVotingDuration{DEFAULT_TENDER_VOTING_DURATION};
    int64_t nRequiredYesVotes{DEFAULT_TENDER_REQUIRED_VOTES};
    std::string strDescriptorURI;

    // Return false and set strError if a tender cannot be created from these values
    bool Check(std::string& strError) const;
};

std::string GetTenderHelpString();

/**
 * Read -tenderid, -tenderadmin, -tenderduration, -tenderrequiredvotes and
 * -tenderuri. Missing optional values keep their defaults.
 */
bool ReadTenderParams(const ArgsManager& args, CTenderParams& paramsRet, std::string& strError);

#endif // AGORA_TENDER_TENDERPARAMS_H
