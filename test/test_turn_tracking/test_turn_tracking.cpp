/*
 * File: test/test_turn_tracking/test_turn_tracking.cpp
 * Description: Unit tests for TurnTracker.
 * Verifies debounce, turn classification, the one-response-per-fingerprint
 * guard and the minimum send interval.
 */
#include <unity.h>
#include "TurnTracker.h"
#include "TextUtils.h"

// --- Constants ---
const EngineTimings timings = { 100, 200, 300, 300, 300, 100, 200, 500, 5000, 150 };

EngineState state;

void setUp(void) {}
void tearDown(void) {}

// ============================================================================
// DEBOUNCE
// ============================================================================

void test_first_event_always_accepted(void) {
    TurnTracker tracker(state, timings);
    TEST_ASSERT_TRUE(tracker.acceptEvent(5));
}

void test_events_inside_window_dropped(void) {
    TurnTracker tracker(state, timings);

    TEST_ASSERT_TRUE(tracker.acceptEvent(1000));
    TEST_ASSERT_FALSE(tracker.acceptEvent(1050));
    TEST_ASSERT_FALSE(tracker.acceptEvent(1099));
    TEST_ASSERT_TRUE(tracker.acceptEvent(1100));
    // The window moved with the accepted event.
    TEST_ASSERT_FALSE(tracker.acceptEvent(1150));
}

// ============================================================================
// CLASSIFICATION
// ============================================================================

void test_blank_text_ignored(void) {
    TurnTracker tracker(state, timings);
    bool first = true;

    TEST_ASSERT_EQUAL(TURN_IGNORED, tracker.observe("", first));
    TEST_ASSERT_FALSE(first);
    TEST_ASSERT_EQUAL(TURN_IGNORED, tracker.observe("  \n ", first));
    TEST_ASSERT_EQUAL_UINT32(0, state.currentFingerprint);
}

void test_new_turn_then_repeat_after_stabilization(void) {
    TurnTracker tracker(state, timings);
    bool first = false;

    TEST_ASSERT_EQUAL(TURN_NEW_NON_TERMINAL, tracker.observe("Enter UPI PIN", first));
    TEST_ASSERT_TRUE(first);
    TEST_ASSERT_EQUAL_STRING("Enter UPI PIN", state.currentText.c_str());

    // Same text while still settling: not yet a repeat.
    TEST_ASSERT_EQUAL(TURN_NEW_NON_TERMINAL, tracker.observe("Enter UPI PIN", first));
    TEST_ASSERT_FALSE(first);

    tracker.markStabilized();
    TEST_ASSERT_EQUAL(TURN_REPEAT_NON_TERMINAL, tracker.observe("Enter UPI PIN", first));
    TEST_ASSERT_FALSE(first);
}

void test_changed_text_is_new_turn(void) {
    TurnTracker tracker(state, timings);
    bool first = false;

    tracker.observe("1. Send Money\n2. Check Balance", first);
    tracker.markStabilized();

    TEST_ASSERT_EQUAL(TURN_NEW_NON_TERMINAL, tracker.observe("Enter UPI PIN", first));
    TEST_ASSERT_TRUE(first);
    TEST_ASSERT_FALSE(state.isStabilized);
    TEST_ASSERT_TRUE(tracker.isCurrent(TextUtils::fingerprint("Enter UPI PIN")));
}

void test_error_text_is_terminal_immediately(void) {
    TurnTracker tracker(state, timings);
    bool first = false;

    TEST_ASSERT_EQUAL(TURN_NEW_ERROR_TERMINAL, tracker.observe("Incorrect UPI PIN", first));
    TEST_ASSERT_TRUE(first);
    TEST_ASSERT_EQUAL(TURN_NEW_ERROR_TERMINAL, tracker.observe("Transaction declined by bank", first));
}

void test_success_text_is_not_error_terminal(void) {
    TurnTracker tracker(state, timings);
    bool first = false;

    // Success needs stabilization first; only errors short-circuit.
    TEST_ASSERT_EQUAL(TURN_NEW_NON_TERMINAL, tracker.observe("Transaction successful", first));
}

// ============================================================================
// RESPONSE GUARD
// ============================================================================

void test_can_respond_only_when_stabilized(void) {
    TurnTracker tracker(state, timings);
    bool first = false;

    tracker.observe("Enter amount", first);
    TEST_ASSERT_FALSE(tracker.canRespond());

    tracker.markStabilized();
    TEST_ASSERT_TRUE(tracker.canRespond());
}

void test_answered_turn_blocks_second_response(void) {
    TurnTracker tracker(state, timings);
    bool first = false;

    tracker.observe("Enter amount", first);
    tracker.markStabilized();
    tracker.markResponded(state.currentFingerprint);

    TEST_ASSERT_TRUE(tracker.isAnswered());
    TEST_ASSERT_FALSE(tracker.canRespond());

    // The next turn is answerable again.
    tracker.observe("Enter remarks", first);
    tracker.markStabilized();
    TEST_ASSERT_FALSE(tracker.isAnswered());
    TEST_ASSERT_TRUE(tracker.canRespond());
}

void test_submission_lock_blocks_response(void) {
    TurnTracker tracker(state, timings);
    bool first = false;

    tracker.observe("Enter amount", first);
    tracker.markStabilized();

    tracker.beginSubmit();
    TEST_ASSERT_FALSE(tracker.canRespond());
    tracker.endSubmit();
    TEST_ASSERT_TRUE(tracker.canRespond());
}

void test_no_turn_is_never_answered(void) {
    TurnTracker tracker(state, timings);
    TEST_ASSERT_FALSE(tracker.isAnswered());
}

// ============================================================================
// SEND INTERVAL
// ============================================================================

void test_send_delay_zero_before_first_submit(void) {
    TurnTracker tracker(state, timings);
    TEST_ASSERT_EQUAL_UINT32(0, tracker.sendDelay(1000));
}

void test_send_delay_covers_remaining_interval_plus_slack(void) {
    TurnTracker tracker(state, timings);
    tracker.markSubmitted(1000);

    // 300 interval, 100 elapsed -> 200 left + 100 slack
    TEST_ASSERT_EQUAL_UINT32(300, tracker.sendDelay(1100));
    TEST_ASSERT_EQUAL_UINT32(101, tracker.sendDelay(1299));
    TEST_ASSERT_EQUAL_UINT32(0, tracker.sendDelay(1300));
    TEST_ASSERT_EQUAL_UINT32(0, tracker.sendDelay(5000));
}

// ============================================================================
// RESET
// ============================================================================

void test_reset_clears_everything(void) {
    TurnTracker tracker(state, timings);
    bool first = false;

    tracker.acceptEvent(1000);
    tracker.observe("Enter UPI PIN", first);
    tracker.markStabilized();
    tracker.markResponded(state.currentFingerprint);
    tracker.markSubmitted(1200);
    tracker.beginSubmit();

    tracker.reset();

    TEST_ASSERT_EQUAL_UINT32(0, state.currentFingerprint);
    TEST_ASSERT_EQUAL_UINT32(0, state.lastRespondedFingerprint);
    TEST_ASSERT_EQUAL_UINT32(0, state.lastEventTimestamp);
    TEST_ASSERT_EQUAL_UINT32(0, state.lastSubmitTimestamp);
    TEST_ASSERT_FALSE(state.isSubmitting);
    TEST_ASSERT_FALSE(state.isStabilized);
    TEST_ASSERT_EQUAL_STRING("", state.currentText.c_str());

    // The same prompt counts as a new turn again.
    TEST_ASSERT_EQUAL(TURN_NEW_NON_TERMINAL, tracker.observe("Enter UPI PIN", first));
    TEST_ASSERT_TRUE(first);
}

void test_fingerprint_distinguishes_texts(void) {
    TEST_ASSERT_NOT_EQUAL(TextUtils::fingerprint("Enter UPI PIN"), TextUtils::fingerprint("Enter UPI PIN "));
    TEST_ASSERT_EQUAL_UINT32(TextUtils::fingerprint("abc"), TextUtils::fingerprint("abc"));
    TEST_ASSERT_NOT_EQUAL(0, TextUtils::fingerprint(""));
}

int main(void) {
    UNITY_BEGIN();

    RUN_TEST(test_first_event_always_accepted);
    RUN_TEST(test_events_inside_window_dropped);

    RUN_TEST(test_blank_text_ignored);
    RUN_TEST(test_new_turn_then_repeat_after_stabilization);
    RUN_TEST(test_changed_text_is_new_turn);
    RUN_TEST(test_error_text_is_terminal_immediately);
    RUN_TEST(test_success_text_is_not_error_terminal);

    RUN_TEST(test_can_respond_only_when_stabilized);
    RUN_TEST(test_answered_turn_blocks_second_response);
    RUN_TEST(test_submission_lock_blocks_response);
    RUN_TEST(test_no_turn_is_never_answered);

    RUN_TEST(test_send_delay_zero_before_first_submit);
    RUN_TEST(test_send_delay_covers_remaining_interval_plus_slack);

    RUN_TEST(test_reset_clears_everything);
    RUN_TEST(test_fingerprint_distinguishes_texts);

    return UNITY_END();
}
