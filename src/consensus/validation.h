// Copyright (c) 2009-2010 Satoshi Nakamoto
// Copyright (c) 2009-2015 The Bitcoin developers
// Copyright (c) 2026 The Agora Core developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or https://www.opensource.org/licenses/mit-license.php.

#ifndef AGORA_CONSENSUS_VALIDATION_H
#define AGORA_CONSENSUS_VALIDATION_H

#include <string>

/** "reject" codes of a tender operation */
static const unsigned int REJECT_INVALID = 0x10;
static const unsigned int REJECT_PHASE = 0x40;
static const unsigned int REJECT_AUTHORIZATION = 0x41;
static const unsigned int REJECT_DUPLICATE_VOTE = 0x42;
static const unsigned int REJECT_DEADLINE = 0x43;
static const unsigned int REJECT_NOT_FOUND = 0x44;
static const unsigned int REJECT_DEPENDENCY = 0x45;

/** Capture information about the outcome of a tender operation */
class CValidationState
{
private:
    enum mode_state {
        MODE_VALID,   //! everything ok
        MODE_INVALID, //! the request broke a tender rule
        MODE_ERROR,   //! run-time error in a collaborator
    } mode;
    unsigned int chRejectCode;
    std::string strRejectReason;
    std::string strDebugMessage;

public:
    CValidationState() : mode(MODE_VALID), chRejectCode(0) {}

    bool Invalid(bool ret = false,
                 unsigned int _chRejectCode = 0,
                 const std::string& _strRejectReason = "",
                 const std::string& _strDebugMessage = "")
    {
        // a state reused by several operations reports the latest rejection
        chRejectCode = _chRejectCode;
        strRejectReason = _strRejectReason;
        strDebugMessage = _strDebugMessage;
        mode = MODE_INVALID;
        return ret;
    }
    bool Error(const std::string& strRejectReasonIn, const std::string& _strDebugMessage = "")
    {
        strRejectReason = strRejectReasonIn;
        chRejectCode = REJECT_DEPENDENCY;
        strDebugMessage = _strDebugMessage;
        mode = MODE_ERROR;
        return false;
    }
    bool IsValid() const
    {
        return mode == MODE_VALID;
    }
    bool IsInvalid() const
    {
        return mode == MODE_INVALID;
    }
    bool IsError() const
    {
        return mode == MODE_ERROR;
    }
    unsigned int GetRejectCode() const { return chRejectCode; }
    std::string GetRejectReason() const { return strRejectReason; }
    std::string GetDebugMessage() const { return strDebugMessage; }
};

#endif // AGORA_CONSENSUS_VALIDATION_H
