// Copyright (c) 2021 The hemis Core developers
// Copyright (c) 2026 The Agora Core developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or https://www.opensource.org/licenses/mit-license.php.

#ifndef AGORA_TENDER_TENDERUTIL_H
#define AGORA_TENDER_TENDERUTIL_H

#include "tender/tenderman.h"

#include <univalue.h>

class CValidationState;

UniValue ProposalToJSON(const CTenderProposal& proposal, bool fLeading);

// Published state of a tender, the way an RPC "gettenderinfo" reports it
UniValue TenderToJSON(const CTenderSnapshot& snapshot);

// {"result": "success"|"failed", "error": ..., "code": ...} for one operation
UniValue OperationResultToJSON(const std::string& strOperation, const CValidationState& state);

#endif // AGORA_TENDER_TENDERUTIL_H
