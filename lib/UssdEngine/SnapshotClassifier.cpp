/*
 * =================================================================================
 * Project:   USSD Pilot - USSD Session Automation Engine
 * File:      lib/UssdEngine/SnapshotClassifier.cpp
 * =================================================================================
 */
#include <regex>
#include <vector>

#include "SnapshotClassifier.h"
#include "SnapshotQuery.h"
#include "TextUtils.h"

// Labels of the dialog's own buttons. Never part of the message.
static const char* const BUTTON_LABELS[] = { "ok", "cancel", "send", "reply", NULL };

static const char* const GENERIC_WORDS[] = { "call", "chat", "video", "info", "back", "next", "done", NULL };

static const char* const PROTOCOL_KEYWORDS[] = {
    "1.", "2.", "3.",
    "select option",
    "bank", "upi", "pin",
    "account", "balance",
    "send money", "transfer",
    "request money",
    "enter amount", "amount",
    "mobile", "vpa",
    "success", "fail", "completed",
    "carrier info",
    "enter your", "enter the",
    "debit card", "last 6",
    "ifsc",
    "incorrect", "invalid", "declined",
    "beneficiary", "payment address",
    NULL
};

bool SnapshotClassifier::isNumberedItem(const std::string& fragment) {
    std::string t = TextUtils::trim(fragment);
    size_t i = 0;
    while (i < t.size() && TextUtils::isDigit(t[i])) i++;
    if (i == 0 || i >= t.size()) return false;
    return t[i] == '.' || t[i] == ')' || TextUtils::isSpace(t[i]);
}

bool SnapshotClassifier::isUiChrome(const std::string& fragment) {
    static const std::regex DATE_STAMP("^[a-z]{3} \\d{1,2}$");
    static const std::regex PHONE_NUMBER("^\\+?\\d{2}\\s?\\d{4,5}\\s?\\d{4,5}$");

    std::string lower = TextUtils::toLower(fragment);

    if (lower == "search contacts" || lower == "contacts" || lower == "india" ||
        lower.compare(0, 7, "search ") == 0) {
        return true;
    }

    if (std::regex_match(lower, DATE_STAMP)) return true;
    if (std::regex_match(TextUtils::trim(fragment), PHONE_NUMBER)) return true;

    if (!isNumberedItem(fragment)) {
        std::string word = TextUtils::trim(lower);
        for (size_t i = 0; GENERIC_WORDS[i] != NULL; i++) {
            if (word == GENERIC_WORDS[i]) return true;
        }
    }

    return false;
}

bool SnapshotClassifier::keepFragment(const std::string& fragment) {
    if (TextUtils::isBlank(fragment)) return false;

    for (size_t i = 0; BUTTON_LABELS[i] != NULL; i++) {
        if (TextUtils::equalsIgnoreCase(TextUtils::trim(fragment), BUTTON_LABELS[i])) return false;
    }

    if (fragment.size() < 3 && !isNumberedItem(fragment)) return false;

    return !isUiChrome(fragment);
}

bool SnapshotClassifier::extractMessage(const SnapshotNode& root, std::string& outText) {
    outText.clear();

    std::vector<std::string> fragments;
    SnapshotQuery::collectText(root, fragments);

    for (size_t i = 0; i < fragments.size(); i++) {
        if (!keepFragment(fragments[i])) continue;
        if (!outText.empty()) outText += '\n';
        outText += fragments[i];
    }

    return !outText.empty();
}

bool SnapshotClassifier::isProtocolContent(const std::string& text) {
    return TextUtils::containsAny(TextUtils::toLower(text), PROTOCOL_KEYWORDS);
}
