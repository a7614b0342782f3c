#include "TransactionRecord.h"
#include "TextUtils.h"

static const char* const FOOD_KEYWORDS[] = {
    "zomato", "swiggy", "dominos", "pizza", "restaurant", "cafe",
    "food", "burger", "kfc", "mcdonalds", "starbucks", "chai", NULL
};
static const char* const SHOPPING_KEYWORDS[] = {
    "amazon", "flipkart", "myntra", "ajio", "nykaa", "meesho",
    "shopping", "store", "mall", "mart", "shop", NULL
};
static const char* const GROCERY_KEYWORDS[] = {
    "bigbasket", "blinkit", "zepto", "dmart", "grofers", "jiomart",
    "grocery", "vegetables", "fruits", "kirana", "supermarket", NULL
};
static const char* const TRANSPORT_KEYWORDS[] = {
    "uber", "ola", "rapido", "metro", "petrol", "diesel", "fuel",
    "parking", "toll", "irctc", "redbus", "train", "flight", NULL
};
static const char* const ENTERTAINMENT_KEYWORDS[] = {
    "netflix", "hotstar", "prime", "spotify", "gaana", "jio",
    "movie", "cinema", "pvr", "inox", "gaming", "game", NULL
};
static const char* const BILLS_KEYWORDS[] = {
    "electricity", "water", "gas", "internet", "broadband", "recharge",
    "postpaid", "prepaid", "dth", "bill", "insurance", "emi", NULL
};
static const char* const HEALTH_KEYWORDS[] = {
    "hospital", "clinic", "pharmacy", "medical", "medicine", "doctor",
    "apollo", "pharmeasy", "netmeds", "1mg", "health", "lab", NULL
};
static const char* const EDUCATION_KEYWORDS[] = {
    "school", "college", "university", "course", "fees", "tuition",
    "book", "udemy", "coursera", "byju", "unacademy", "education", NULL
};

struct CategoryRule {
    PaymentCategory category;
    const char* const* keywords;
};

static const CategoryRule CATEGORY_RULES[] = {
    { CAT_FOOD_DINING, FOOD_KEYWORDS },
    { CAT_SHOPPING, SHOPPING_KEYWORDS },
    { CAT_GROCERIES, GROCERY_KEYWORDS },
    { CAT_TRANSPORT, TRANSPORT_KEYWORDS },
    { CAT_ENTERTAINMENT, ENTERTAINMENT_KEYWORDS },
    { CAT_BILLS_UTILITIES, BILLS_KEYWORDS },
    { CAT_HEALTH, HEALTH_KEYWORDS },
    { CAT_EDUCATION, EDUCATION_KEYWORDS },
};

PaymentCategory TransactionRecord::categorize(const std::string& text) {
    if (TextUtils::isBlank(text)) return CAT_OTHER;

    std::string lower = TextUtils::toLower(text);
    for (size_t i = 0; i < sizeof(CATEGORY_RULES) / sizeof(CATEGORY_RULES[0]); i++) {
        if (TextUtils::containsAny(lower, CATEGORY_RULES[i].keywords)) {
            return CATEGORY_RULES[i].category;
        }
    }
    return CAT_PERSONAL_TRANSFER;
}

const char* TransactionRecord::categoryLabel(PaymentCategory category) {
    switch (category) {
        case CAT_FOOD_DINING: return "Food & Dining";
        case CAT_SHOPPING: return "Shopping";
        case CAT_GROCERIES: return "Groceries";
        case CAT_TRANSPORT: return "Transport";
        case CAT_ENTERTAINMENT: return "Entertainment";
        case CAT_BILLS_UTILITIES: return "Bills & Utilities";
        case CAT_HEALTH: return "Health";
        case CAT_EDUCATION: return "Education";
        case CAT_PERSONAL_TRANSFER: return "Personal Transfer";
        case CAT_OTHER: return "Other";
    }
    return "Other";
}

const char* TransactionRecord::typeName(OperationKind kind) {
    switch (kind) {
        case OP_SEND_MONEY: return "send";
        case OP_BALANCE_CHECK: return "balance_check";
        case OP_LINK_BANK: return "link_bank";
    }
    return "unknown";
}

void TransactionRecord::build(const Outcome& outcome, const TransferRequest& request,
                              unsigned long long timestampMs, JsonObject out) {
    out["id"] = std::to_string(timestampMs) + "-" + std::to_string(outcome.handle);
    out["type"] = typeName(outcome.kind);
    out["status"] = outcome.success ? "success" : "failed";
    out["timestamp"] = timestampMs;

    if (outcome.kind == OP_SEND_MONEY) {
        // Whole units, as sent to the network
        out["amount"] = (double)(long long)request.amount;
        out["recipient_vpa"] = request.recipient;
        out["category"] = categoryLabel(categorize(request.remarks));
    } else {
        out["amount"] = 0.0;
        out["category"] = categoryLabel(CAT_OTHER);
    }

    out["message"] = outcome.finalMessage;
    out["reference_id"] = outcome.referenceId;

    if (outcome.hasBalance) {
        out["balance"] = outcome.balance;
    }
}
