/*
 * =================================================================================
 * Project:   USSD Pilot - USSD Session Automation Engine
 * File:      lib/UssdEngine/ResponsePlanner.h
 *
 * Description:
 * Decides what to answer for a stabilized turn. Pure logic: no I/O, no timing.
 * Each operation kind is a fixed, priority-ordered cascade of steps; a step
 * fires at most once per session because it is guarded by its progress flag.
 * =================================================================================
 */
#pragma once
#include <string>
#include <vector>

#include "Types.h"

enum TurnShape : uint8_t { SHAPE_ANY, SHAPE_MENU, SHAPE_FREE };

enum ValueSource : uint8_t {
    VALUE_MENU_OPTION,    // number of the item matching the step's keywords
    VALUE_PAYMENT_METHOD, // number chosen by recipient shape, with fallback
    VALUE_PIN,
    VALUE_BANK,
    VALUE_CARD,
    VALUE_RECIPIENT,
    VALUE_AMOUNT,
    VALUE_REMARKS
};

typedef bool (*PromptCheck)(const std::string& lowerText);

struct CascadeStep {
    TurnShape shape;
    ProgressField field;             // set when the step fires
    ProgressField prerequisite;      // must already be set, FIELD_NONE if unconditional
    PromptCheck prompt;              // NULL: step is matched by menuKeywords alone
    const char* const* menuKeywords; // NULL-terminated, VALUE_MENU_OPTION only
    ValueSource value;
    bool suppressOnEcho;             // stay silent if the turn already shows the value
};

struct MenuItem {
    std::string number;
    std::string label;
};

class ResponsePlanner {
public:
    /**
     * Runs the cascade for session.kind against the turn.
     * On a match: writes the response, marks the step's flag, bumps stepCounter.
     * @param outField Optional. Receives the flag that fired (for logging).
     * @return false if nothing should be sent for this turn.
     */
    static bool decideResponse(Session& session, const std::string& turnText,
                               std::string& outResponse, ProgressField* outField = nullptr);

    /**
     * Extracts "N." / "N)" items, inline or one per line.
     * @return true if the turn is a menu (at least two items).
     */
    static bool parseMenu(const std::string& text, std::vector<MenuItem>& items);

    static bool findMenuOption(const std::vector<MenuItem>& items, const char* const* keywords,
                               std::string& outNumber);

    static const CascadeStep* cascadeFor(OperationKind kind, size_t& outCount);

    // --- Progress flags ---
    static bool isFieldSet(const SessionProgress& progress, ProgressField field);
    static void markField(SessionProgress& progress, ProgressField field);

    // --- Values ---
    static std::string bankInput(const BankSecrets& secrets);
    static bool isMobileNumber(const std::string& recipient);
    static bool isVpa(const std::string& recipient);

    // --- Prompt predicates (lower-case input) ---
    static bool isAskingForPin(const std::string& lower);
    static bool isAskingForBank(const std::string& lower);
    static bool isAskingForCard(const std::string& lower);
    static bool isAskingForRecipient(const std::string& lower);
    static bool isAskingForAmount(const std::string& lower);
    static bool isAskingForRemarks(const std::string& lower);
    static bool isAskingForPaymentMethod(const std::string& lower);

private:
    static bool resolveValue(const CascadeStep& step, const Session& session,
                             const std::vector<MenuItem>& items, std::string& outValue);
};
