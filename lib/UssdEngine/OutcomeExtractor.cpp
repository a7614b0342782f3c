/*
 * =================================================================================
 * Project:   USSD Pilot - USSD Session Automation Engine
 * File:      lib/UssdEngine/OutcomeExtractor.cpp
 * =================================================================================
 */
#include <regex>
#include <stdlib.h>

#include "OutcomeExtractor.h"
#include "TextUtils.h"

static const char* const ERROR_KEYWORDS[] = {
    "incorrect",
    "invalid",
    "failed",
    "unsuccessful",
    "declined",
    "not registered",
    "connection problem",
    "try again",
    "unable to",
    "could not",
    "cannot",
    "blocked",
    "expired",
    "insufficient",
    NULL
};

static const char* const SUCCESS_KEYWORDS[] = {
    "success",
    "completed",
    "balance is",
    "available balance",
    NULL
};

// =================================================================================
// SECTION: CLASSIFICATION
// =================================================================================

bool OutcomeExtractor::isErrorMessage(const std::string& text) {
    std::string lower = TextUtils::toLower(text);
    // "invalid mmi", "payment address incorrect" and "beneficiary ... incorrect"
    // are all covered by the plain keywords above.
    return TextUtils::containsAny(lower, ERROR_KEYWORDS);
}

bool OutcomeExtractor::isSuccessMessage(const std::string& text) {
    if (isErrorMessage(text)) return false;

    std::string lower = TextUtils::toLower(text);
    if (TextUtils::containsAny(lower, SUCCESS_KEYWORDS)) return true;

    // Bare balance statements: "Bal Rs 500" style replies without a verb.
    return TextUtils::contains(lower, "rs") && TextUtils::contains(lower, "balance");
}

// =================================================================================
// SECTION: EXTRACTION
// =================================================================================

static bool containsDigit(const std::string& s) {
    for (size_t i = 0; i < s.size(); i++) {
        if (TextUtils::isDigit(s[i])) return true;
    }
    return false;
}

bool OutcomeExtractor::extractReferenceId(const std::string& text, std::string& outId) {
    static const std::regex LABELED(
        "\\b(?:reference|transaction|ref|txn)\\s*(?:number|no|id)?\\.?[:\\s]*([A-Z0-9]+)",
        std::regex::ECMAScript | std::regex::icase);
    static const std::regex LONG_NUMERIC("[0-9]{12,}");

    outId.clear();

    // Skip labels followed by plain words ("transaction successful").
    std::sregex_iterator it(text.begin(), text.end(), LABELED);
    std::sregex_iterator end;
    for (; it != end; ++it) {
        std::string candidate = (*it)[1].str();
        if (containsDigit(candidate)) {
            outId = candidate;
            return true;
        }
    }

    std::smatch match;
    if (std::regex_search(text, match, LONG_NUMERIC)) {
        outId = match[0].str();
        return true;
    }

    return false;
}

static bool parseAmount(const std::string& raw, double& out) {
    std::string digits;
    for (size_t i = 0; i < raw.size(); i++) {
        if (raw[i] != ',') digits += raw[i];
    }
    if (digits.empty()) return false;

    char* endPtr = NULL;
    double value = strtod(digits.c_str(), &endPtr);
    if (endPtr == digits.c_str() || *endPtr != '\0') return false;

    out = value;
    return true;
}

// U+20B9 in UTF-8
#define RUPEE_SIGN "\xE2\x82\xB9"

bool OutcomeExtractor::extractBalance(const std::string& text, double& outBalance) {
    static const std::regex PATTERNS[] = {
        std::regex("\\b(?:balance|bal)[:\\s]*(?:is\\s*)?(?:rs\\.?|inr|" RUPEE_SIGN ")?\\s*([0-9][0-9,]*(?:\\.[0-9]+)?)",
                   std::regex::ECMAScript | std::regex::icase),
        std::regex("(?:\\b(?:rs\\.?|inr)|" RUPEE_SIGN ")\\s*([0-9][0-9,]*(?:\\.[0-9]+)?)",
                   std::regex::ECMAScript | std::regex::icase),
        std::regex("\\bavailable[:\\s]*(?:rs\\.?|inr|" RUPEE_SIGN ")?\\s*([0-9][0-9,]*(?:\\.[0-9]+)?)",
                   std::regex::ECMAScript | std::regex::icase)
    };
    const size_t NUM_PATTERNS = sizeof(PATTERNS) / sizeof(PATTERNS[0]);

    for (size_t i = 0; i < NUM_PATTERNS; i++) {
        std::smatch match;
        if (std::regex_search(text, match, PATTERNS[i])) {
            double value = 0.0;
            if (parseAmount(match[1].str(), value)) {
                outBalance = value;
                return true;
            }
        }
    }

    return false;
}

Outcome OutcomeExtractor::buildOutcome(const Session& session, bool success,
                                       const std::string& finalMessage, size_t maxMessageLength) {
    Outcome outcome;
    outcome.handle = session.handle;
    outcome.kind = session.kind;
    outcome.success = success;
    outcome.finalMessage = TextUtils::truncate(finalMessage, maxMessageLength);
    outcome.hasBalance = false;
    outcome.balance = 0.0;

    extractReferenceId(finalMessage, outcome.referenceId);

    if (success) {
        outcome.hasBalance = extractBalance(finalMessage, outcome.balance);
    }

    return outcome;
}
