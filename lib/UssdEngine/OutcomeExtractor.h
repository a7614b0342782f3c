/*
 * =================================================================================
 * Project:   USSD Pilot - USSD Session Automation Engine
 * File:      lib/UssdEngine/OutcomeExtractor.h
 *
 * Description:
 * Terminal-turn classification and value extraction. Error keywords always win
 * over success keywords on ambiguous text ("Insufficient balance").
 * =================================================================================
 */
#pragma once
#include <string>

#include "Types.h"

class OutcomeExtractor {
public:
    static bool isErrorMessage(const std::string& text);

    // False whenever isErrorMessage() is true.
    static bool isSuccessMessage(const std::string& text);

    static bool isTerminal(const std::string& text) {
        return isErrorMessage(text) || isSuccessMessage(text);
    }

    /**
     * Labeled reference ("Ref No: ...", "Txn ID ...") whose code contains a
     * digit, else the first run of 12+ digits.
     * @return false if none found (outId is cleared).
     */
    static bool extractReferenceId(const std::string& text, std::string& outId);

    /**
     * "Balance: Rs 1,234.50", "Rs. 12,345.50 available", "Available INR 99".
     * Thousands separators are stripped before parsing.
     */
    static bool extractBalance(const std::string& text, double& outBalance);

    /**
     * Builds the Outcome for a terminal turn. Balance is only extracted from
     * successful turns; the message is cut to maxMessageLength.
     */
    static Outcome buildOutcome(const Session& session, bool success,
                                const std::string& finalMessage, size_t maxMessageLength);
};
