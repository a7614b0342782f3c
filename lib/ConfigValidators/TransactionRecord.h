#pragma once
#include <ArduinoJson.h>
#include <string>

#include "ConfigValidators.h"
#include "Types.h"

enum PaymentCategory : uint8_t {
    CAT_FOOD_DINING,
    CAT_SHOPPING,
    CAT_GROCERIES,
    CAT_TRANSPORT,
    CAT_ENTERTAINMENT,
    CAT_BILLS_UTILITIES,
    CAT_HEALTH,
    CAT_EDUCATION,
    CAT_PERSONAL_TRANSFER,
    CAT_OTHER
};

class TransactionRecord {
public:
    // Keyword groups are checked in enum order. Blank text is CAT_OTHER,
    // text matching no group is a personal transfer.
    static PaymentCategory categorize(const std::string& text);
    static const char* categoryLabel(PaymentCategory category);

    static const char* typeName(OperationKind kind);

    // Fills 'out' with the journal record of one finished session.
    static void build(const Outcome& outcome, const TransferRequest& request,
                      unsigned long long timestampMs, JsonObject out);
};
