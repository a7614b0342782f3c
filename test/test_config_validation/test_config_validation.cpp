/*
 * File: test/test_config_validation/test_config_validation.cpp
 * Description: Unit tests for ConfigValidators and TransactionRecord.
 * Verifies engine timing parsing, the credential store format, request parsing
 * and the journal record built for each finished session.
 */
#include <unity.h>
#include <string.h>
#include <ArduinoJson.h>
#include "ConfigValidators.h"
#include "TransactionRecord.h"
#include "Types.h"

// --- Defaults ---
const EngineTimings defaults = { 100, 1500, 300, 1000, 2000, 100, 200, 2000, 120000, 150 };

// --- Helpers ---
UserCredentials validCredentials() {
    UserCredentials c;
    c.upiPin = "1234";
    c.mobileNumber = "9876543210";
    c.bankName = "HDFC Bank";
    c.bankIfsc = "HDFC0001234";
    c.cardLastSix = "123456";
    c.cardExpiryMonth = "05";
    c.cardExpiryYear = "28";
    c.isSetupComplete = true;
    return c;
}

Outcome makeOutcome(OperationKind kind, bool success) {
    Outcome o;
    o.handle = 3;
    o.kind = kind;
    o.success = success;
    o.finalMessage = success ? "Transaction successful" : "Transaction declined";
    o.hasBalance = false;
    o.balance = 0.0;
    return o;
}

void setUp(void) {}
void tearDown(void) {}

// ============================================================================
// ENGINE TIMINGS
// ============================================================================

void test_timings_missing_object_uses_defaults(void) {
    JsonDocument doc;
    EngineTimings out = {};
    std::string err;

    TEST_ASSERT_TRUE(ConfigValidators::parseEngineTimings(doc["engine"], defaults, out, err));
    TEST_ASSERT_EQUAL_UINT32(1500, out.stabilizeMs);
    TEST_ASSERT_EQUAL_UINT32(120000, out.sessionTimeoutMs);
}

void test_timings_partial_override(void) {
    JsonDocument doc;
    deserializeJson(doc, "{\"stabilizeMs\": 800, \"sessionTimeoutMs\": 0}");
    EngineTimings out = {};
    std::string err;

    TEST_ASSERT_TRUE(ConfigValidators::parseEngineTimings(doc.as<JsonVariant>(), defaults, out, err));
    TEST_ASSERT_EQUAL_UINT32(800, out.stabilizeMs);
    TEST_ASSERT_EQUAL_UINT32(0, out.sessionTimeoutMs);
    TEST_ASSERT_EQUAL_UINT32(300, out.textInjectionDelayMs);
}

void test_timings_negative_rejected(void) {
    JsonDocument doc;
    deserializeJson(doc, "{\"focusRetryMs\": -5}");
    EngineTimings out = defaults;
    std::string err;

    TEST_ASSERT_FALSE(ConfigValidators::parseEngineTimings(doc.as<JsonVariant>(), defaults, out, err));
    TEST_ASSERT_EQUAL_STRING("focusRetryMs must be a non-negative integer.", err.c_str());
}

void test_timings_too_large_rejected(void) {
    JsonDocument doc;
    deserializeJson(doc, "{\"dismissDelayMs\": 600000}");
    EngineTimings out = defaults;
    std::string err;

    TEST_ASSERT_FALSE(ConfigValidators::parseEngineTimings(doc.as<JsonVariant>(), defaults, out, err));
    TEST_ASSERT_EQUAL_STRING("dismissDelayMs too large (max 60000).", err.c_str());
}

void test_timings_debounce_must_be_shorter_than_stabilize(void) {
    JsonDocument doc;
    deserializeJson(doc, "{\"eventDebounceMs\": 500, \"stabilizeMs\": 500}");
    EngineTimings out = defaults;
    std::string err;

    TEST_ASSERT_FALSE(ConfigValidators::parseEngineTimings(doc.as<JsonVariant>(), defaults, out, err));
    TEST_ASSERT_EQUAL_STRING("eventDebounceMs must be shorter than stabilizeMs.", err.c_str());
}

void test_timings_zero_stabilize_rejected(void) {
    JsonDocument doc;
    deserializeJson(doc, "{\"eventDebounceMs\": 0, \"stabilizeMs\": 0}");
    EngineTimings out = defaults;
    std::string err;

    TEST_ASSERT_FALSE(ConfigValidators::parseEngineTimings(doc.as<JsonVariant>(), defaults, out, err));
    TEST_ASSERT_EQUAL_STRING("stabilizeMs must be greater than 0.", err.c_str());
}

void test_timings_message_bound(void) {
    JsonDocument doc;
    deserializeJson(doc, "{\"maxMessageLength\": 8}");
    EngineTimings out = defaults;
    std::string err;

    TEST_ASSERT_FALSE(ConfigValidators::parseEngineTimings(doc.as<JsonVariant>(), defaults, out, err));
    TEST_ASSERT_EQUAL_STRING("maxMessageLength too small (min 16).", err.c_str());
}

void test_timings_not_an_object(void) {
    JsonDocument doc;
    deserializeJson(doc, "[1, 2, 3]");
    EngineTimings out = defaults;
    std::string err;

    TEST_ASSERT_FALSE(ConfigValidators::parseEngineTimings(doc.as<JsonVariant>(), defaults, out, err));
    TEST_ASSERT_EQUAL_STRING("Engine timings must be a JSON object.", err.c_str());
}

void test_timings_written_back_parse_equal(void) {
    JsonDocument doc;
    EngineTimings custom = defaults;
    custom.focusRetryMs = 450;
    ConfigValidators::writeEngineTimings(custom, doc.to<JsonObject>());

    EngineTimings out = {};
    std::string err;
    TEST_ASSERT_TRUE(ConfigValidators::parseEngineTimings(doc.as<JsonVariant>(), defaults, out, err));
    TEST_ASSERT_EQUAL_UINT32(450, out.focusRetryMs);
}

// ============================================================================
// CREDENTIALS
// ============================================================================

void test_credentials_parsed_from_store_format(void) {
    JsonDocument doc;
    deserializeJson(doc,
                    "{\"upi_pin\": \"0123\", \"mobile_number\": \"9876543210\", \"bank_name\": \"State Bank\","
                    " \"bank_ifsc\": \" sbin0000001 \", \"card_last_six\": \"654321\","
                    " \"card_expiry_month\": \"12\", \"card_expiry_year\": \"27\", \"is_setup_complete\": true}");
    UserCredentials c;
    std::string err;

    TEST_ASSERT_TRUE(ConfigValidators::parseCredentials(doc.as<JsonVariant>(), c, err));
    TEST_ASSERT_EQUAL_STRING("0123", c.upiPin.c_str());
    TEST_ASSERT_EQUAL_STRING("SBIN0000001", c.bankIfsc.c_str());
    TEST_ASSERT_TRUE(c.isSetupComplete);
    TEST_ASSERT_TRUE(ConfigValidators::validateCredentials(c, err));

    BankSecrets s = c.toSecrets();
    TEST_ASSERT_EQUAL_STRING("6543211227", s.cardDetails.c_str());
    TEST_ASSERT_EQUAL_STRING("0123", s.upiPin.c_str());
}

void test_credentials_numeric_pin_rejected(void) {
    JsonDocument doc;
    deserializeJson(doc, "{\"upi_pin\": 1234}");
    UserCredentials c;
    std::string err;

    TEST_ASSERT_FALSE(ConfigValidators::parseCredentials(doc.as<JsonVariant>(), c, err));
    TEST_ASSERT_EQUAL_STRING("upi_pin must be a string.", err.c_str());
}

void test_credentials_field_checks(void) {
    std::string err;
    UserCredentials c = validCredentials();
    TEST_ASSERT_TRUE_MESSAGE(ConfigValidators::validateCredentials(c, err), "Should accept a complete profile");

    c = validCredentials();
    c.upiPin = "12a4";
    TEST_ASSERT_FALSE(ConfigValidators::validateCredentials(c, err));
    TEST_ASSERT_EQUAL_STRING("UPI PIN must be 4-6 digits.", err.c_str());

    c = validCredentials();
    c.mobileNumber = "1234567890";
    TEST_ASSERT_FALSE(ConfigValidators::validateCredentials(c, err));
    TEST_ASSERT_EQUAL_STRING("Mobile number must be 10 digits starting with 6-9.", err.c_str());

    c = validCredentials();
    c.bankIfsc = "HDFC001";
    TEST_ASSERT_FALSE(ConfigValidators::validateCredentials(c, err));
    TEST_ASSERT_EQUAL_STRING("IFSC must be 11 characters.", err.c_str());

    c = validCredentials();
    c.cardExpiryMonth = "5";
    TEST_ASSERT_FALSE(ConfigValidators::validateCredentials(c, err));
    TEST_ASSERT_EQUAL_STRING("Card expiry month must be 2 digits (MM).", err.c_str());
}

// ============================================================================
// TRANSFER REQUESTS
// ============================================================================

void test_request_send_money(void) {
    JsonDocument doc;
    deserializeJson(doc, "{\"operation\": \"send_money\", \"recipient\": \"friend@okaxis\", \"amount\": 250}");
    TransferRequest r;
    std::string err;

    TEST_ASSERT_TRUE(ConfigValidators::parseTransferRequest(doc.as<JsonVariant>(), r, err));
    TEST_ASSERT_EQUAL(OP_SEND_MONEY, r.kind);
    TEST_ASSERT_EQUAL_DOUBLE(250.0, r.amount);
    TEST_ASSERT_EQUAL_STRING(DEFAULT_REMARKS, r.remarks.c_str());
    TEST_ASSERT_TRUE(ConfigValidators::validateTransfer(r, err));
}

void test_request_unknown_operation(void) {
    JsonDocument doc;
    deserializeJson(doc, "{\"operation\": \"request_money\"}");
    TransferRequest r;
    std::string err;

    TEST_ASSERT_FALSE(ConfigValidators::parseTransferRequest(doc.as<JsonVariant>(), r, err));
    TEST_ASSERT_EQUAL_STRING("Invalid operation: request_money", err.c_str());
}

void test_request_amount_must_be_number(void) {
    JsonDocument doc;
    deserializeJson(doc, "{\"operation\": \"send_money\", \"recipient\": \"9876543210\", \"amount\": \"500\"}");
    TransferRequest r;
    std::string err;

    TEST_ASSERT_FALSE(ConfigValidators::parseTransferRequest(doc.as<JsonVariant>(), r, err));
    TEST_ASSERT_EQUAL_STRING("amount must be a number.", err.c_str());
}

void test_transfer_checks(void) {
    TransferRequest r;
    r.kind = OP_SEND_MONEY;
    r.recipient = "9876543210";
    r.amount = 100000.0;
    std::string err;
    TEST_ASSERT_TRUE(ConfigValidators::validateTransfer(r, err));

    r.amount = 100001.0;
    TEST_ASSERT_FALSE(ConfigValidators::validateTransfer(r, err));
    TEST_ASSERT_EQUAL_STRING("Maximum amount is 100000.", err.c_str());

    r.amount = 0.5;
    TEST_ASSERT_FALSE(ConfigValidators::validateTransfer(r, err));
    TEST_ASSERT_EQUAL_STRING("Enter a valid amount.", err.c_str());

    r.amount = 10.0;
    r.recipient = "friend@";
    TEST_ASSERT_FALSE(ConfigValidators::validateTransfer(r, err));
    TEST_ASSERT_EQUAL_STRING("Recipient must be a 10-digit mobile number or a UPI ID.", err.c_str());

    // Balance checks carry no transfer fields.
    TransferRequest balance;
    TEST_ASSERT_TRUE(ConfigValidators::validateTransfer(balance, err));
}

void test_recipient_formats(void) {
    TEST_ASSERT_TRUE(ConfigValidators::isValidMobile("6000000000"));
    TEST_ASSERT_FALSE(ConfigValidators::isValidMobile("5999999999"));
    TEST_ASSERT_FALSE(ConfigValidators::isValidMobile("98765 4321"));

    TEST_ASSERT_TRUE(ConfigValidators::isValidVpa("name.surname@okhdfcbank"));
    TEST_ASSERT_FALSE(ConfigValidators::isValidVpa("@okaxis"));
    TEST_ASSERT_FALSE(ConfigValidators::isValidVpa("a@b@c"));
    TEST_ASSERT_FALSE(ConfigValidators::isValidVpa("my name@okaxis"));
}

// ============================================================================
// JOURNAL RECORDS
// ============================================================================

void test_categories_from_remarks(void) {
    TEST_ASSERT_EQUAL(CAT_FOOD_DINING, TransactionRecord::categorize("Swiggy dinner"));
    TEST_ASSERT_EQUAL(CAT_TRANSPORT, TransactionRecord::categorize("uber to airport"));
    TEST_ASSERT_EQUAL(CAT_BILLS_UTILITIES, TransactionRecord::categorize("Electricity bill"));
    TEST_ASSERT_EQUAL(CAT_PERSONAL_TRANSFER, TransactionRecord::categorize("for mom"));
    TEST_ASSERT_EQUAL(CAT_OTHER, TransactionRecord::categorize("  "));
    TEST_ASSERT_EQUAL_STRING("Food & Dining", TransactionRecord::categoryLabel(CAT_FOOD_DINING));
}

void test_send_record(void) {
    Outcome o = makeOutcome(OP_SEND_MONEY, true);
    o.referenceId = "412345678901";

    TransferRequest r;
    r.kind = OP_SEND_MONEY;
    r.recipient = "friend@okaxis";
    r.amount = 250.9;
    r.remarks = "pizza night";

    JsonDocument doc;
    TransactionRecord::build(o, r, 1700000000000ULL, doc.to<JsonObject>());

    TEST_ASSERT_EQUAL_STRING("1700000000000-3", doc["id"].as<const char*>());
    TEST_ASSERT_EQUAL_STRING("send", doc["type"].as<const char*>());
    TEST_ASSERT_EQUAL_STRING("success", doc["status"].as<const char*>());
    TEST_ASSERT_EQUAL_DOUBLE(250.0, doc["amount"].as<double>());
    TEST_ASSERT_EQUAL_STRING("friend@okaxis", doc["recipient_vpa"].as<const char*>());
    TEST_ASSERT_EQUAL_STRING("Food & Dining", doc["category"].as<const char*>());
    TEST_ASSERT_EQUAL_STRING("412345678901", doc["reference_id"].as<const char*>());
    TEST_ASSERT_TRUE(doc["balance"].isNull());
}

void test_balance_record(void) {
    Outcome o = makeOutcome(OP_BALANCE_CHECK, true);
    o.hasBalance = true;
    o.balance = 12345.5;

    TransferRequest r;
    JsonDocument doc;
    TransactionRecord::build(o, r, 42ULL, doc.to<JsonObject>());

    TEST_ASSERT_EQUAL_STRING("balance_check", doc["type"].as<const char*>());
    TEST_ASSERT_EQUAL_DOUBLE(0.0, doc["amount"].as<double>());
    TEST_ASSERT_EQUAL_STRING("Other", doc["category"].as<const char*>());
    TEST_ASSERT_EQUAL_DOUBLE(12345.5, doc["balance"].as<double>());
    TEST_ASSERT_TRUE(doc["recipient_vpa"].isNull());
}

void test_failed_record(void) {
    Outcome o = makeOutcome(OP_SEND_MONEY, false);
    TransferRequest r;
    r.kind = OP_SEND_MONEY;
    r.recipient = "9876543210";
    r.amount = 10.0;

    JsonDocument doc;
    TransactionRecord::build(o, r, 42ULL, doc.to<JsonObject>());

    TEST_ASSERT_EQUAL_STRING("failed", doc["status"].as<const char*>());
    TEST_ASSERT_EQUAL_STRING("Transaction declined", doc["message"].as<const char*>());
    TEST_ASSERT_EQUAL_STRING("", doc["reference_id"].as<const char*>());
}

int main(void) {
    UNITY_BEGIN();

    RUN_TEST(test_timings_missing_object_uses_defaults);
    RUN_TEST(test_timings_partial_override);
    RUN_TEST(test_timings_negative_rejected);
    RUN_TEST(test_timings_too_large_rejected);
    RUN_TEST(test_timings_debounce_must_be_shorter_than_stabilize);
    RUN_TEST(test_timings_zero_stabilize_rejected);
    RUN_TEST(test_timings_message_bound);
    RUN_TEST(test_timings_not_an_object);
    RUN_TEST(test_timings_written_back_parse_equal);

    RUN_TEST(test_credentials_parsed_from_store_format);
    RUN_TEST(test_credentials_numeric_pin_rejected);
    RUN_TEST(test_credentials_field_checks);

    RUN_TEST(test_request_send_money);
    RUN_TEST(test_request_unknown_operation);
    RUN_TEST(test_request_amount_must_be_number);
    RUN_TEST(test_transfer_checks);
    RUN_TEST(test_recipient_formats);

    RUN_TEST(test_categories_from_remarks);
    RUN_TEST(test_send_record);
    RUN_TEST(test_balance_record);
    RUN_TEST(test_failed_record);

    return UNITY_END();
}
