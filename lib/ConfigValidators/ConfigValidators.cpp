#include "ConfigValidators.h"
#include "TextUtils.h"

// --- Limits ---
static const uint32_t MAX_DELAY_MS = 60000;
static const uint32_t MAX_SESSION_TIMEOUT_MS = 3600000;
static const uint32_t MIN_MESSAGE_LENGTH = 16;
static const uint32_t MAX_MESSAGE_LENGTH = 1000;
static const double MAX_TRANSFER_AMOUNT = 100000.0;

// =================================================================================
// SECTION: ENGINE TIMINGS
// =================================================================================

static bool readUInt(const JsonVariant& json, const char* key, uint32_t fallback, uint32_t maxValue,
                     uint32_t& out, std::string& errorMsg) {
    JsonVariant v = json[key];
    if (v.isNull()) {
        out = fallback;
        return true;
    }
    if (!v.is<uint32_t>()) {
        errorMsg = std::string(key) + " must be a non-negative integer.";
        return false;
    }
    uint32_t value = v.as<uint32_t>();
    if (value > maxValue) {
        errorMsg = std::string(key) + " too large (max " + std::to_string(maxValue) + ").";
        return false;
    }
    out = value;
    return true;
}

bool ConfigValidators::parseEngineTimings(const JsonVariant& json, const EngineTimings& defaults,
                                          EngineTimings& outTimings, std::string& errorMsg) {
    if (!json.isNull() && !json.is<JsonObject>()) {
        errorMsg = "Engine timings must be a JSON object.";
        return false;
    }

    EngineTimings t = defaults;

    // 1. Delays
    if (!readUInt(json, "eventDebounceMs", defaults.eventDebounceMs, MAX_DELAY_MS, t.eventDebounceMs, errorMsg)) return false;
    if (!readUInt(json, "stabilizeMs", defaults.stabilizeMs, MAX_DELAY_MS, t.stabilizeMs, errorMsg)) return false;
    if (!readUInt(json, "textInjectionDelayMs", defaults.textInjectionDelayMs, MAX_DELAY_MS, t.textInjectionDelayMs, errorMsg)) return false;
    if (!readUInt(json, "postSendCooldownMs", defaults.postSendCooldownMs, MAX_DELAY_MS, t.postSendCooldownMs, errorMsg)) return false;
    if (!readUInt(json, "minSendIntervalMs", defaults.minSendIntervalMs, MAX_DELAY_MS, t.minSendIntervalMs, errorMsg)) return false;
    if (!readUInt(json, "sendRetrySlackMs", defaults.sendRetrySlackMs, MAX_DELAY_MS, t.sendRetrySlackMs, errorMsg)) return false;
    if (!readUInt(json, "focusRetryMs", defaults.focusRetryMs, MAX_DELAY_MS, t.focusRetryMs, errorMsg)) return false;
    if (!readUInt(json, "dismissDelayMs", defaults.dismissDelayMs, MAX_DELAY_MS, t.dismissDelayMs, errorMsg)) return false;

    // 2. Session timeout (0 disables it)
    if (!readUInt(json, "sessionTimeoutMs", defaults.sessionTimeoutMs, MAX_SESSION_TIMEOUT_MS, t.sessionTimeoutMs, errorMsg)) return false;

    // 3. Message bound
    if (!readUInt(json, "maxMessageLength", defaults.maxMessageLength, MAX_MESSAGE_LENGTH, t.maxMessageLength, errorMsg)) return false;

    // Sanity checks
    if (t.stabilizeMs == 0) {
        errorMsg = "stabilizeMs must be greater than 0.";
        return false;
    }
    if (t.eventDebounceMs >= t.stabilizeMs) {
        errorMsg = "eventDebounceMs must be shorter than stabilizeMs.";
        return false;
    }
    if (t.textInjectionDelayMs == 0 || t.minSendIntervalMs == 0) {
        errorMsg = "textInjectionDelayMs and minSendIntervalMs must be greater than 0.";
        return false;
    }
    if (t.maxMessageLength < MIN_MESSAGE_LENGTH) {
        errorMsg = "maxMessageLength too small (min " + std::to_string(MIN_MESSAGE_LENGTH) + ").";
        return false;
    }

    outTimings = t;
    return true;
}

void ConfigValidators::writeEngineTimings(const EngineTimings& timings, JsonObject out) {
    out["eventDebounceMs"] = timings.eventDebounceMs;
    out["stabilizeMs"] = timings.stabilizeMs;
    out["textInjectionDelayMs"] = timings.textInjectionDelayMs;
    out["postSendCooldownMs"] = timings.postSendCooldownMs;
    out["minSendIntervalMs"] = timings.minSendIntervalMs;
    out["sendRetrySlackMs"] = timings.sendRetrySlackMs;
    out["focusRetryMs"] = timings.focusRetryMs;
    out["dismissDelayMs"] = timings.dismissDelayMs;
    out["sessionTimeoutMs"] = timings.sessionTimeoutMs;
    out["maxMessageLength"] = timings.maxMessageLength;
}

// =================================================================================
// SECTION: CREDENTIALS
// =================================================================================

static bool readString(const JsonVariant& json, const char* key, std::string& out, std::string& errorMsg) {
    JsonVariant v = json[key];
    if (v.isNull()) {
        out.clear();
        return true;
    }
    // Digits as JSON numbers would lose leading zeros ("0123").
    if (!v.is<const char*>()) {
        errorMsg = std::string(key) + " must be a string.";
        return false;
    }
    out = TextUtils::trim(v.as<const char*>());
    return true;
}

bool ConfigValidators::parseCredentials(const JsonVariant& json, UserCredentials& outCreds, std::string& errorMsg) {
    if (!json.is<JsonObject>()) {
        errorMsg = "Credentials must be a JSON object.";
        return false;
    }

    UserCredentials c;
    if (!readString(json, "upi_pin", c.upiPin, errorMsg)) return false;
    if (!readString(json, "mobile_number", c.mobileNumber, errorMsg)) return false;
    if (!readString(json, "bank_name", c.bankName, errorMsg)) return false;
    if (!readString(json, "bank_ifsc", c.bankIfsc, errorMsg)) return false;
    if (!readString(json, "card_last_six", c.cardLastSix, errorMsg)) return false;
    if (!readString(json, "card_expiry_month", c.cardExpiryMonth, errorMsg)) return false;
    if (!readString(json, "card_expiry_year", c.cardExpiryYear, errorMsg)) return false;

    c.bankIfsc = TextUtils::toUpper(c.bankIfsc);
    c.isSetupComplete = json["is_setup_complete"] | false;

    outCreds = c;
    return true;
}

void ConfigValidators::writeCredentials(const UserCredentials& creds, JsonObject out) {
    out["upi_pin"] = creds.upiPin;
    out["mobile_number"] = creds.mobileNumber;
    out["bank_name"] = creds.bankName;
    out["bank_ifsc"] = creds.bankIfsc;
    out["card_last_six"] = creds.cardLastSix;
    out["card_expiry_month"] = creds.cardExpiryMonth;
    out["card_expiry_year"] = creds.cardExpiryYear;
    out["is_setup_complete"] = creds.isSetupComplete;
}

bool ConfigValidators::isValidMobile(const std::string& mobile) {
    return mobile.size() == 10 && TextUtils::isAllDigits(mobile) && mobile[0] >= '6' && mobile[0] <= '9';
}

bool ConfigValidators::isValidVpa(const std::string& vpa) {
    size_t at = vpa.find('@');
    if (at == std::string::npos || at == 0 || at == vpa.size() - 1) return false;
    if (vpa.find('@', at + 1) != std::string::npos) return false;
    for (size_t i = 0; i < vpa.size(); i++) {
        if (TextUtils::isSpace(vpa[i])) return false;
    }
    return true;
}

bool ConfigValidators::validateCredentials(const UserCredentials& creds, std::string& errorMsg) {
    if (creds.upiPin.size() < 4 || creds.upiPin.size() > 6 || !TextUtils::isAllDigits(creds.upiPin)) {
        errorMsg = "UPI PIN must be 4-6 digits.";
        return false;
    }
    if (!isValidMobile(creds.mobileNumber)) {
        errorMsg = "Mobile number must be 10 digits starting with 6-9.";
        return false;
    }
    if (TextUtils::isBlank(creds.bankName)) {
        errorMsg = "Bank name cannot be empty.";
        return false;
    }
    if (creds.bankIfsc.size() != 11) {
        errorMsg = "IFSC must be 11 characters.";
        return false;
    }
    if (creds.cardLastSix.size() != 6 || !TextUtils::isAllDigits(creds.cardLastSix)) {
        errorMsg = "Card last six must be 6 digits.";
        return false;
    }
    if (creds.cardExpiryMonth.size() != 2 || !TextUtils::isAllDigits(creds.cardExpiryMonth)) {
        errorMsg = "Card expiry month must be 2 digits (MM).";
        return false;
    }
    if (creds.cardExpiryYear.size() != 2 || !TextUtils::isAllDigits(creds.cardExpiryYear)) {
        errorMsg = "Card expiry year must be 2 digits (YY).";
        return false;
    }
    return true;
}

// =================================================================================
// SECTION: TRANSFER REQUESTS
// =================================================================================

const char* ConfigValidators::operationName(OperationKind kind) {
    switch (kind) {
        case OP_BALANCE_CHECK: return "balance_check";
        case OP_SEND_MONEY: return "send_money";
        case OP_LINK_BANK: return "link_bank";
    }
    return "unknown";
}

bool ConfigValidators::parseOperationName(const std::string& name, OperationKind& outKind) {
    if (name == "balance_check") outKind = OP_BALANCE_CHECK;
    else if (name == "send_money") outKind = OP_SEND_MONEY;
    else if (name == "link_bank") outKind = OP_LINK_BANK;
    else return false;
    return true;
}

bool ConfigValidators::parseTransferRequest(const JsonVariant& json, TransferRequest& outRequest, std::string& errorMsg) {
    if (!json.is<JsonObject>()) {
        errorMsg = "Request must be a JSON object.";
        return false;
    }

    // 1. Operation
    std::string opStr = json["operation"] | "";
    TransferRequest r;
    if (!parseOperationName(opStr, r.kind)) {
        errorMsg = "Invalid operation: " + opStr;
        return false;
    }

    // 2. Transfer fields (ignored for non-transfer operations)
    if (!readString(json, "recipient", r.recipient, errorMsg)) return false;

    JsonVariant amount = json["amount"];
    if (!amount.isNull()) {
        if (!amount.is<double>()) {
            errorMsg = "amount must be a number.";
            return false;
        }
        r.amount = amount.as<double>();
    }

    if (!readString(json, "remarks", r.remarks, errorMsg)) return false;
    if (r.remarks.empty()) r.remarks = DEFAULT_REMARKS;

    outRequest = r;
    return true;
}

bool ConfigValidators::validateTransfer(const TransferRequest& request, std::string& errorMsg) {
    if (request.kind != OP_SEND_MONEY) return true;

    if (!isValidMobile(request.recipient) && !isValidVpa(request.recipient)) {
        errorMsg = "Recipient must be a 10-digit mobile number or a UPI ID.";
        return false;
    }
    // The network takes whole units only.
    if (!(request.amount >= 1.0)) {
        errorMsg = "Enter a valid amount.";
        return false;
    }
    if (request.amount > MAX_TRANSFER_AMOUNT) {
        errorMsg = "Maximum amount is 100000.";
        return false;
    }
    return true;
}
