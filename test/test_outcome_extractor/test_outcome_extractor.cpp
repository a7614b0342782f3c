/*
 * File: test/test_outcome_extractor/test_outcome_extractor.cpp
 * Description: Unit tests for OutcomeExtractor.
 * Verifies error/success precedence and balance / reference extraction from
 * free-text network replies.
 */
#include <unity.h>
#include "OutcomeExtractor.h"

// --- Helper ---
Session makeSession(OperationKind kind) {
    Session s;
    s.handle = 7;
    s.kind = kind;
    return s;
}

void setUp(void) {}
void tearDown(void) {}

// ============================================================================
// CLASSIFICATION
// ============================================================================

void test_error_keywords(void) {
    TEST_ASSERT_TRUE(OutcomeExtractor::isErrorMessage("Incorrect UPI PIN"));
    TEST_ASSERT_TRUE(OutcomeExtractor::isErrorMessage("Invalid MMI code"));
    TEST_ASSERT_TRUE(OutcomeExtractor::isErrorMessage("Connection problem or invalid MMI code."));
    TEST_ASSERT_TRUE(OutcomeExtractor::isErrorMessage("Mobile number not registered"));
    TEST_ASSERT_TRUE(OutcomeExtractor::isErrorMessage("Beneficiary payment address incorrect"));
    TEST_ASSERT_TRUE(OutcomeExtractor::isErrorMessage("Your card has EXPIRED"));
    TEST_ASSERT_FALSE(OutcomeExtractor::isErrorMessage("Enter UPI PIN"));
}

void test_success_keywords(void) {
    TEST_ASSERT_TRUE(OutcomeExtractor::isSuccessMessage("Transaction Successful"));
    TEST_ASSERT_TRUE(OutcomeExtractor::isSuccessMessage("Request completed"));
    TEST_ASSERT_TRUE(OutcomeExtractor::isSuccessMessage("Your balance is Rs 500"));
    TEST_ASSERT_TRUE(OutcomeExtractor::isSuccessMessage("A/c XX1234 Available Balance: INR 10"));
    TEST_ASSERT_TRUE(OutcomeExtractor::isSuccessMessage("Bal Rs 500 in your balance"));
    TEST_ASSERT_FALSE(OutcomeExtractor::isSuccessMessage("1. Send Money\n2. Check Balance"));
}

void test_error_wins_over_success(void) {
    const char* text = "Insufficient balance";
    TEST_ASSERT_TRUE(OutcomeExtractor::isErrorMessage(text));
    TEST_ASSERT_FALSE(OutcomeExtractor::isSuccessMessage(text));
    TEST_ASSERT_TRUE(OutcomeExtractor::isTerminal(text));

    TEST_ASSERT_FALSE(OutcomeExtractor::isSuccessMessage("Transaction failed. Request completed with errors"));
}

void test_prompts_are_not_terminal(void) {
    TEST_ASSERT_FALSE(OutcomeExtractor::isTerminal("Enter amount"));
    TEST_ASSERT_FALSE(OutcomeExtractor::isTerminal("Send Money to\n1. Mobile No.\n2. UPI ID"));
}

// ============================================================================
// BALANCE
// ============================================================================

void test_balance_with_thousands_separator(void) {
    double balance = 0.0;
    TEST_ASSERT_TRUE(OutcomeExtractor::extractBalance("Your available balance is Rs. 12,345.50", balance));
    TEST_ASSERT_EQUAL_DOUBLE(12345.50, balance);
}

void test_balance_indian_grouping(void) {
    double balance = 0.0;
    TEST_ASSERT_TRUE(OutcomeExtractor::extractBalance("A/c balance: INR 1,00,000.00", balance));
    TEST_ASSERT_EQUAL_DOUBLE(100000.0, balance);
}

void test_balance_short_label(void) {
    double balance = 0.0;
    TEST_ASSERT_TRUE(OutcomeExtractor::extractBalance("Bal Rs 500", balance));
    TEST_ASSERT_EQUAL_DOUBLE(500.0, balance);
}

void test_balance_currency_prefix_only(void) {
    double balance = 0.0;
    TEST_ASSERT_TRUE(OutcomeExtractor::extractBalance("Available INR 99", balance));
    TEST_ASSERT_EQUAL_DOUBLE(99.0, balance);
}

void test_balance_rupee_sign(void) {
    double balance = 0.0;
    TEST_ASSERT_TRUE(OutcomeExtractor::extractBalance("Your balance is \xE2\x82\xB9 12,345.50", balance));
    TEST_ASSERT_EQUAL_DOUBLE(12345.50, balance);

    balance = 0.0;
    TEST_ASSERT_TRUE(OutcomeExtractor::extractBalance("Credited \xE2\x82\xB9" "250 to A/c", balance));
    TEST_ASSERT_EQUAL_DOUBLE(250.0, balance);
}

void test_no_balance_in_text(void) {
    double balance = 42.0;
    TEST_ASSERT_FALSE(OutcomeExtractor::extractBalance("Insufficient balance", balance));
    TEST_ASSERT_EQUAL_DOUBLE(42.0, balance);
}

// ============================================================================
// REFERENCE ID
// ============================================================================

void test_reference_labeled(void) {
    std::string ref;
    TEST_ASSERT_TRUE(OutcomeExtractor::extractReferenceId("Transaction successful. Ref No: 412345678901", ref));
    TEST_ASSERT_EQUAL_STRING("412345678901", ref.c_str());

    TEST_ASSERT_TRUE(OutcomeExtractor::extractReferenceId("UPI Ref: AB12CD34", ref));
    TEST_ASSERT_EQUAL_STRING("AB12CD34", ref.c_str());

    TEST_ASSERT_TRUE(OutcomeExtractor::extractReferenceId("Txn ID 123456 paid", ref));
    TEST_ASSERT_EQUAL_STRING("123456", ref.c_str());
}

void test_reference_long_number_fallback(void) {
    std::string ref;
    TEST_ASSERT_TRUE(OutcomeExtractor::extractReferenceId("Paid Rs 10. 123456789012345 is your receipt", ref));
    TEST_ASSERT_EQUAL_STRING("123456789012345", ref.c_str());
}

void test_reference_absent(void) {
    std::string ref = "stale";
    TEST_ASSERT_FALSE(OutcomeExtractor::extractReferenceId("Transaction successful", ref));
    TEST_ASSERT_EQUAL_STRING("", ref.c_str());

    // Eleven digits is a phone number, not a reference.
    TEST_ASSERT_FALSE(OutcomeExtractor::extractReferenceId("Sent to 91987654321", ref));
}

// ============================================================================
// OUTCOME
// ============================================================================

void test_build_outcome_success_with_balance(void) {
    Session s = makeSession(OP_BALANCE_CHECK);
    Outcome o = OutcomeExtractor::buildOutcome(s, true, "Your available balance is Rs. 12,345.50", 150);

    TEST_ASSERT_EQUAL_UINT32(7, o.handle);
    TEST_ASSERT_EQUAL(OP_BALANCE_CHECK, o.kind);
    TEST_ASSERT_TRUE(o.success);
    TEST_ASSERT_TRUE(o.hasBalance);
    TEST_ASSERT_EQUAL_DOUBLE(12345.50, o.balance);
    TEST_ASSERT_EQUAL_STRING("", o.referenceId.c_str());
}

void test_build_outcome_failure_never_has_balance(void) {
    Session s = makeSession(OP_SEND_MONEY);
    Outcome o = OutcomeExtractor::buildOutcome(s, false, "Insufficient balance. Available balance Rs 100", 150);

    TEST_ASSERT_FALSE(o.success);
    TEST_ASSERT_FALSE(o.hasBalance);
}

void test_build_outcome_failure_keeps_reference(void) {
    Session s = makeSession(OP_SEND_MONEY);
    Outcome o = OutcomeExtractor::buildOutcome(s, false, "Transaction declined. Ref No 998877665544", 150);

    TEST_ASSERT_EQUAL_STRING("998877665544", o.referenceId.c_str());
}

void test_build_outcome_truncates_message(void) {
    Session s = makeSession(OP_BALANCE_CHECK);
    Outcome o = OutcomeExtractor::buildOutcome(s, false, "Connection problem or invalid MMI code.", 20);

    TEST_ASSERT_EQUAL(20, (int)o.finalMessage.size());
    TEST_ASSERT_EQUAL_STRING("Connection proble...", o.finalMessage.c_str());
}

void test_build_outcome_truncation_keeps_utf8_whole(void) {
    Session s = makeSession(OP_BALANCE_CHECK);
    // The rupee sign occupies bytes 4..6, straddling the cut at 6.
    Outcome o = OutcomeExtractor::buildOutcome(s, false, "Bal \xE2\x82\xB9" "500 not available", 9);

    TEST_ASSERT_EQUAL_STRING("Bal ...", o.finalMessage.c_str());
}

int main(void) {
    UNITY_BEGIN();

    RUN_TEST(test_error_keywords);
    RUN_TEST(test_success_keywords);
    RUN_TEST(test_error_wins_over_success);
    RUN_TEST(test_prompts_are_not_terminal);

    RUN_TEST(test_balance_with_thousands_separator);
    RUN_TEST(test_balance_indian_grouping);
    RUN_TEST(test_balance_short_label);
    RUN_TEST(test_balance_currency_prefix_only);
    RUN_TEST(test_balance_rupee_sign);
    RUN_TEST(test_no_balance_in_text);

    RUN_TEST(test_reference_labeled);
    RUN_TEST(test_reference_long_number_fallback);
    RUN_TEST(test_reference_absent);

    RUN_TEST(test_build_outcome_success_with_balance);
    RUN_TEST(test_build_outcome_failure_never_has_balance);
    RUN_TEST(test_build_outcome_failure_keeps_reference);
    RUN_TEST(test_build_outcome_truncates_message);
    RUN_TEST(test_build_outcome_truncation_keeps_utf8_whole);

    return UNITY_END();
}
