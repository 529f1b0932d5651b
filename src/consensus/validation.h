// Copyright (c) 2009-2010 Satoshi Nakamoto
// Copyright (c) 2009-2016 The Bitcoin Core developers
// Copyright (c) 2026 The LinkedToken developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#ifndef LINKEDTOKEN_CONSENSUS_VALIDATION_H
#define LINKEDTOKEN_CONSENSUS_VALIDATION_H

#include <string>

/** "reject" codes, stable across releases for monitoring */
static const unsigned char REJECT_MALFORMED = 0x01;
static const unsigned char REJECT_INVALID = 0x10;
static const unsigned char REJECT_DUPLICATE = 0x12;
static const unsigned char REJECT_UNAUTHORIZED = 0x44;
static const unsigned char REJECT_NOT_INITIALIZED = 0x45;
static const unsigned char REJECT_INSUFFICIENT = 0x46;

/** Capture information about entry point processing. */
class CValidationState
{
private:
    enum mode_state {
        MODE_VALID,   //!< everything ok
        MODE_INVALID, //!< rejected input, nothing was changed
        MODE_ERROR,   //!< run-time or internal-consistency error
    } mode;
    unsigned int chRejectCode;
    std::string strRejectReason;
    std::string strDebugMessage;

public:
    CValidationState() : mode(MODE_VALID), chRejectCode(0) {}

    bool Invalid(bool ret = false,
                 unsigned int chRejectCodeIn = 0,
                 const std::string& strRejectReasonIn = "",
                 const std::string& strDebugMessageIn = "")
    {
        chRejectCode = chRejectCodeIn;
        strRejectReason = strRejectReasonIn;
        strDebugMessage = strDebugMessageIn;
        if (mode == MODE_ERROR)
            return ret;
        mode = MODE_INVALID;
        return ret;
    }

    /**
     * An internal-consistency or storage failure. Unlike Invalid(), an
     * Error() means some invariant the caller relies on is broken.
     */
    bool Error(const std::string& strRejectReasonIn, const std::string& strDebugMessageIn = "")
    {
        if (mode == MODE_VALID) {
            strRejectReason = strRejectReasonIn;
            strDebugMessage = strDebugMessageIn;
        }
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

/** Convert CValidationState to a human-readable message for logging */
inline std::string FormatStateMessage(const CValidationState& state)
{
    std::string msg = state.GetRejectReason();
    if (!state.GetDebugMessage().empty())
        msg += " (" + state.GetDebugMessage() + ")";
    if (state.GetRejectCode() != 0)
        msg += " (code " + std::to_string(state.GetRejectCode()) + ")";
    return msg;
}

#endif // LINKEDTOKEN_CONSENSUS_VALIDATION_H
