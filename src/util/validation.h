// Copyright (c) 2009-2010 Satoshi Nakamoto
// Copyright (c) 2009-2019 The Bitcoin Core developers
// Copyright (c) 2026 The Agora Core developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#ifndef AGORA_UTIL_VALIDATION_H
#define AGORA_UTIL_VALIDATION_H

#include <string>

class CValidationState;

/** Convert CValidationState to a human-readable message for logging */
std::string FormatStateMessage(const CValidationState& state);

/** Name of the error kind behind a reject code, e.g. "PhaseError" */
std::string GetRejectCodeName(unsigned int nRejectCode);

#endif // AGORA_UTIL_VALIDATION_H
