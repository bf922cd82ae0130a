// Copyright (c) 2009-2010 Satoshi Nakamoto
// Copyright (c) 2009-2019 The Bitcoin Core developers
// Copyright (c) 2026 The Agora Core developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "util/validation.h"

#include "consensus/validation.h"
#include "util/string.h"

std::string FormatStateMessage(const CValidationState& state)
{
    return strprintf("%s%s (code %i)",
        state.GetRejectReason(),
        state.GetDebugMessage().empty() ? "" : ", " + state.GetDebugMessage(),
        state.GetRejectCode());
}

std::string GetRejectCodeName(unsigned int nRejectCode)
{
    switch (nRejectCode) {
    case 0:                     return "None";
    case REJECT_INVALID:        return "InvalidArgument";
    case REJECT_PHASE:          return "PhaseError";
    case REJECT_AUTHORIZATION:  return "AuthorizationError";
    case REJECT_DUPLICATE_VOTE: return "DuplicateVoteError";
    case REJECT_DEADLINE:       return "DeadlineError";
    case REJECT_NOT_FOUND:      return "NotFoundError";
    case REJECT_DEPENDENCY:     return "DependencyFailure";
    }
    return "Unknown";
}
