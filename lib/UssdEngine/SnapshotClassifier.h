/*
 * =================================================================================
 * Project:   USSD Pilot - USSD Session Automation Engine
 * File:      lib/UssdEngine/SnapshotClassifier.h
 *
 * Description:
 * Turns a raw element tree into candidate message text and decides whether the
 * text belongs to the USSD conversation or to some unrelated screen that was
 * briefly visible (dialer chrome, contact search, status bar).
 * =================================================================================
 */
#pragma once
#include <string>

#include "Snapshot.h"

class SnapshotClassifier {
public:
    /**
     * Collects all text fragments, drops button labels and UI chrome, and joins
     * the remainder with '\n' in traversal order.
     * @return false if nothing meaningful is left (outText is cleared).
     */
    static bool extractMessage(const SnapshotNode& root, std::string& outText);

    /**
     * True if the fragment survives filtering (not a button label, not chrome,
     * at least 3 characters unless it is a numbered menu item).
     */
    static bool keepFragment(const std::string& fragment);

    /**
     * Known non-USSD strings: contact search, country label, date stamps,
     * bare phone numbers, generic navigation words.
     */
    static bool isUiChrome(const std::string& fragment);

    /**
     * True iff the text mentions at least one word of the protocol vocabulary.
     */
    static bool isProtocolContent(const std::string& text);

    /**
     * True for fragments such as "1." / "2) Pay" / "10 Exit".
     */
    static bool isNumberedItem(const std::string& fragment);
};
