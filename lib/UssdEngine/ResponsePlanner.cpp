/*
 * =================================================================================
 * Project:   USSD Pilot - USSD Session Automation Engine
 * File:      lib/UssdEngine/ResponsePlanner.cpp
 * =================================================================================
 */
#include "ResponsePlanner.h"
#include "TextUtils.h"

// =================================================================================
// SECTION: KEYWORD TABLES
// =================================================================================

static const char* const BALANCE_MENU_KEYWORDS[] = {
    "check balance", "bal enq", "balance enquiry", "know balance", NULL
};

static const char* const SEND_MENU_KEYWORDS[] = {
    "send money", "transfer", "pay", NULL
};

static const char* const PROFILE_MENU_KEYWORDS[] = {
    "my profile", "profile", "settings", "my account", NULL
};

static const char* const CHANGE_BANK_KEYWORDS[] = {
    "change bank", "link bank", "bank account", NULL
};

static const char* const VPA_OPTION_KEYWORDS[] = { "upi id", "vpa", NULL };
static const char* const MOBILE_OPTION_KEYWORDS[] = { "mobile no", "mobile number", NULL };

static const char* const PIN_PROMPTS[] = {
    "upi pin", "enter pin", "enter your pin", "m-pin", "mpin", "4 digit", "6 digit", NULL
};
static const char* const BANK_PROMPTS[] = {
    "enter your bank", "bank's name", "bank ifsc", "first 4 letters", NULL
};
static const char* const CARD_PROMPTS[] = {
    "last 6", "debit card", "card number", "card details", NULL
};
static const char* const RECIPIENT_PROMPTS[] = {
    "mobile", "vpa", "upi id", "beneficiary", "payee", "enter number", "recipient", NULL
};
static const char* const AMOUNT_PROMPTS[] = { "enter amount", "amount to", "how much", NULL };
static const char* const REMARKS_PROMPTS[] = { "remark", "comment", "note", NULL };
static const char* const PAYMENT_METHOD_PROMPTS[] = { "send money to", "mobile no", "upi id", NULL };

// Fallback option numbers when the payment-method menu has no matching label.
static const char* const VPA_FALLBACK_OPTION = "3";
static const char* const DEFAULT_METHOD_OPTION = "1";

// =================================================================================
// SECTION: CASCADES
// =================================================================================
// Evaluated top to bottom. The first step whose shape, guard, prerequisite and
// prompt all match decides the answer for the turn.

static const CascadeStep BALANCE_CASCADE[] = {
    { SHAPE_MENU, FIELD_MENU_SELECTED, FIELD_NONE, NULL, BALANCE_MENU_KEYWORDS, VALUE_MENU_OPTION, false },
    { SHAPE_FREE, FIELD_PIN_SENT,      FIELD_NONE, ResponsePlanner::isAskingForPin,  NULL, VALUE_PIN,  false },
    { SHAPE_FREE, FIELD_BANK_SENT,     FIELD_NONE, ResponsePlanner::isAskingForBank, NULL, VALUE_BANK, false },
    { SHAPE_FREE, FIELD_CARD_SENT,     FIELD_NONE, ResponsePlanner::isAskingForCard, NULL, VALUE_CARD, false },
};

static const CascadeStep SEND_CASCADE[] = {
    { SHAPE_MENU, FIELD_MENU_SELECTED,           FIELD_NONE,          NULL, SEND_MENU_KEYWORDS, VALUE_MENU_OPTION, false },
    { SHAPE_MENU, FIELD_PAYMENT_METHOD_SELECTED, FIELD_MENU_SELECTED, ResponsePlanner::isAskingForPaymentMethod, NULL, VALUE_PAYMENT_METHOD, false },
    { SHAPE_FREE, FIELD_PIN_SENT,                FIELD_NONE, ResponsePlanner::isAskingForPin,       NULL, VALUE_PIN,       false },
    { SHAPE_FREE, FIELD_BANK_SENT,               FIELD_NONE, ResponsePlanner::isAskingForBank,      NULL, VALUE_BANK,      false },
    { SHAPE_FREE, FIELD_CARD_SENT,               FIELD_NONE, ResponsePlanner::isAskingForCard,      NULL, VALUE_CARD,      false },
    { SHAPE_FREE, FIELD_RECIPIENT_SENT,          FIELD_NONE, ResponsePlanner::isAskingForRecipient, NULL, VALUE_RECIPIENT, true },
    { SHAPE_FREE, FIELD_AMOUNT_SENT,             FIELD_NONE, ResponsePlanner::isAskingForAmount,    NULL, VALUE_AMOUNT,    true },
    { SHAPE_FREE, FIELD_REMARKS_SENT,            FIELD_NONE, ResponsePlanner::isAskingForRemarks,   NULL, VALUE_REMARKS,   false },
};

// Credential prompts can arrive inside a menu-shaped turn here, so they come
// first and accept any shape. The second menu level reuses the payment-method flag.
static const CascadeStep LINK_BANK_CASCADE[] = {
    { SHAPE_ANY,  FIELD_BANK_SENT,               FIELD_NONE,          ResponsePlanner::isAskingForBank, NULL, VALUE_BANK, false },
    { SHAPE_ANY,  FIELD_CARD_SENT,               FIELD_NONE,          ResponsePlanner::isAskingForCard, NULL, VALUE_CARD, false },
    { SHAPE_MENU, FIELD_MENU_SELECTED,           FIELD_NONE,          NULL, PROFILE_MENU_KEYWORDS, VALUE_MENU_OPTION, false },
    { SHAPE_MENU, FIELD_PAYMENT_METHOD_SELECTED, FIELD_MENU_SELECTED, NULL, CHANGE_BANK_KEYWORDS,  VALUE_MENU_OPTION, false },
};

#define CASCADE_LENGTH(table) (sizeof(table) / sizeof(table[0]))

const CascadeStep* ResponsePlanner::cascadeFor(OperationKind kind, size_t& outCount) {
    switch (kind) {
        case OP_BALANCE_CHECK:
            outCount = CASCADE_LENGTH(BALANCE_CASCADE);
            return BALANCE_CASCADE;
        case OP_SEND_MONEY:
            outCount = CASCADE_LENGTH(SEND_CASCADE);
            return SEND_CASCADE;
        case OP_LINK_BANK:
            outCount = CASCADE_LENGTH(LINK_BANK_CASCADE);
            return LINK_BANK_CASCADE;
    }
    outCount = 0;
    return NULL;
}

// =================================================================================
// SECTION: DECISION
// =================================================================================

bool ResponsePlanner::decideResponse(Session& session, const std::string& turnText,
                                     std::string& outResponse, ProgressField* outField) {
    outResponse.clear();
    if (outField) *outField = FIELD_NONE;

    std::string lower = TextUtils::toLower(turnText);
    std::vector<MenuItem> items;
    bool isMenu = parseMenu(turnText, items);

    size_t count = 0;
    const CascadeStep* steps = cascadeFor(session.kind, count);

    for (size_t i = 0; i < count; i++) {
        const CascadeStep& step = steps[i];

        if (step.shape == SHAPE_MENU && !isMenu) continue;
        if (step.shape == SHAPE_FREE && isMenu) continue;
        if (isFieldSet(session.progress, step.field)) continue;
        if (step.prerequisite != FIELD_NONE && !isFieldSet(session.progress, step.prerequisite)) continue;
        if (step.prompt && !step.prompt(lower)) continue;

        std::string value;
        if (!resolveValue(step, session, items, value)) continue;

        // Network echo of a value already typed: no response this turn.
        if (step.suppressOnEcho && !value.empty() &&
            TextUtils::contains(lower, TextUtils::toLower(value).c_str())) {
            return false;
        }

        markField(session.progress, step.field);
        session.progress.stepCounter++;
        outResponse = value;
        if (outField) *outField = step.field;
        return true;
    }

    return false;
}

bool ResponsePlanner::resolveValue(const CascadeStep& step, const Session& session,
                                   const std::vector<MenuItem>& items, std::string& outValue) {
    switch (step.value) {
        case VALUE_MENU_OPTION:
            return step.menuKeywords != NULL && findMenuOption(items, step.menuKeywords, outValue);

        case VALUE_PAYMENT_METHOD: {
            const std::string& recipient = session.transfer.recipient;
            if (isVpa(recipient)) {
                if (!findMenuOption(items, VPA_OPTION_KEYWORDS, outValue)) outValue = VPA_FALLBACK_OPTION;
            } else if (isMobileNumber(recipient)) {
                if (!findMenuOption(items, MOBILE_OPTION_KEYWORDS, outValue)) outValue = DEFAULT_METHOD_OPTION;
            } else {
                outValue = DEFAULT_METHOD_OPTION;
            }
            return true;
        }

        case VALUE_PIN:
            outValue = session.secrets.upiPin;
            return true;

        case VALUE_BANK:
            outValue = bankInput(session.secrets);
            return true;

        case VALUE_CARD:
            outValue = session.secrets.cardDetails;
            return true;

        case VALUE_RECIPIENT:
            outValue = session.transfer.recipient;
            return true;

        case VALUE_AMOUNT:
            outValue = session.transfer.amount;
            return true;

        case VALUE_REMARKS:
            outValue = TextUtils::isBlank(session.transfer.remarks) ? std::string(DEFAULT_REMARKS)
                                                                    : session.transfer.remarks;
            return true;
    }
    return false;
}

// =================================================================================
// SECTION: MENU PARSING
// =================================================================================

// Matches an item marker at 'pos': one or two digits then '.' or ')', at the
// start of the text or after whitespace. "12.50" is a number, not a marker.
static bool markerAt(const std::string& text, size_t pos, size_t& outDigits) {
    if (pos > 0 && !TextUtils::isSpace(text[pos - 1])) return false;

    size_t digits = 0;
    while (pos + digits < text.size() && TextUtils::isDigit(text[pos + digits]) && digits < 3) {
        digits++;
    }
    if (digits == 0 || digits > 2) return false;

    size_t punct = pos + digits;
    if (punct >= text.size()) return false;
    if (text[punct] != '.' && text[punct] != ')') return false;
    if (punct + 1 < text.size() && TextUtils::isDigit(text[punct + 1])) return false;

    outDigits = digits;
    return true;
}

bool ResponsePlanner::parseMenu(const std::string& text, std::vector<MenuItem>& items) {
    items.clear();

    size_t pos = 0;
    while (pos < text.size()) {
        size_t digits = 0;
        if (!markerAt(text, pos, digits)) {
            pos++;
            continue;
        }

        MenuItem item;
        item.number = text.substr(pos, digits);

        size_t labelStart = pos + digits + 1;
        size_t labelEnd = labelStart;
        size_t ignored = 0;
        while (labelEnd < text.size() && text[labelEnd] != '\n' && !markerAt(text, labelEnd, ignored)) {
            labelEnd++;
        }

        item.label = TextUtils::trim(text.substr(labelStart, labelEnd - labelStart));
        items.push_back(item);
        pos = labelEnd;
    }

    return items.size() >= 2;
}

bool ResponsePlanner::findMenuOption(const std::vector<MenuItem>& items, const char* const* keywords,
                                     std::string& outNumber) {
    for (size_t i = 0; i < items.size(); i++) {
        if (TextUtils::containsAny(TextUtils::toLower(items[i].label), keywords)) {
            outNumber = items[i].number;
            return true;
        }
    }
    return false;
}

// =================================================================================
// SECTION: PROGRESS FLAGS
// =================================================================================

bool ResponsePlanner::isFieldSet(const SessionProgress& progress, ProgressField field) {
    switch (field) {
        case FIELD_NONE: return false;
        case FIELD_MENU_SELECTED: return progress.menuSelected;
        case FIELD_PAYMENT_METHOD_SELECTED: return progress.paymentMethodSelected;
        case FIELD_PIN_SENT: return progress.pinSent;
        case FIELD_BANK_SENT: return progress.bankSent;
        case FIELD_CARD_SENT: return progress.cardSent;
        case FIELD_RECIPIENT_SENT: return progress.recipientSent;
        case FIELD_AMOUNT_SENT: return progress.amountSent;
        case FIELD_REMARKS_SENT: return progress.remarksSent;
    }
    return false;
}

void ResponsePlanner::markField(SessionProgress& progress, ProgressField field) {
    switch (field) {
        case FIELD_NONE: break;
        case FIELD_MENU_SELECTED: progress.menuSelected = true; break;
        case FIELD_PAYMENT_METHOD_SELECTED: progress.paymentMethodSelected = true; break;
        case FIELD_PIN_SENT: progress.pinSent = true; break;
        case FIELD_BANK_SENT: progress.bankSent = true; break;
        case FIELD_CARD_SENT: progress.cardSent = true; break;
        case FIELD_RECIPIENT_SENT: progress.recipientSent = true; break;
        case FIELD_AMOUNT_SENT: progress.amountSent = true; break;
        case FIELD_REMARKS_SENT: progress.remarksSent = true; break;
    }
}

// =================================================================================
// SECTION: VALUES
// =================================================================================

std::string ResponsePlanner::bankInput(const BankSecrets& secrets) {
    if (secrets.bankIfsc.size() >= 4) {
        return TextUtils::toUpper(secrets.bankIfsc.substr(0, 4));
    }
    return secrets.bankName;
}

bool ResponsePlanner::isMobileNumber(const std::string& recipient) {
    return recipient.size() == 10 && TextUtils::isAllDigits(recipient);
}

bool ResponsePlanner::isVpa(const std::string& recipient) {
    return recipient.find('@') != std::string::npos;
}

// =================================================================================
// SECTION: PROMPT PREDICATES
// =================================================================================

bool ResponsePlanner::isAskingForPin(const std::string& lower) {
    if (TextUtils::containsAny(lower, PIN_PROMPTS)) return true;
    return TextUtils::contains(lower, "enter") && TextUtils::contains(lower, "pin") &&
           !TextUtils::contains(lower, "upi id");
}

bool ResponsePlanner::isAskingForBank(const std::string& lower) {
    return TextUtils::containsAny(lower, BANK_PROMPTS);
}

bool ResponsePlanner::isAskingForCard(const std::string& lower) {
    return TextUtils::containsAny(lower, CARD_PROMPTS);
}

bool ResponsePlanner::isAskingForRecipient(const std::string& lower) {
    return TextUtils::containsAny(lower, RECIPIENT_PROMPTS);
}

bool ResponsePlanner::isAskingForAmount(const std::string& lower) {
    return TextUtils::containsAny(lower, AMOUNT_PROMPTS);
}

bool ResponsePlanner::isAskingForRemarks(const std::string& lower) {
    return TextUtils::containsAny(lower, REMARKS_PROMPTS);
}

bool ResponsePlanner::isAskingForPaymentMethod(const std::string& lower) {
    return TextUtils::containsAny(lower, PAYMENT_METHOD_PROMPTS);
}
