// =====================================================
// OneShotTimer Unit Tests
// =====================================================
// Run with: ctest -R test_one_shot_timer
// =====================================================

#include <unity.h>
#include "one_shot_timer.h"
#include "../mock_platform.h"

void setUp() {
    mock_platform_reset();
}

void tearDown() {
}

void test_new_timer_is_disarmed() {
    OneShotTimer timer;
    TEST_ASSERT_FALSE(timer.isArmed());
    TEST_ASSERT_FALSE(timer.poll());
    TEST_ASSERT_EQUAL_UINT32(0, timer.remainingMs());
}

void test_fires_once_at_deadline() {
    OneShotTimer timer;
    timer.arm(500);

    mock_platform_advance_millis(499);
    TEST_ASSERT_FALSE(timer.poll());
    TEST_ASSERT_EQUAL_UINT32(1, timer.remainingMs());

    mock_platform_advance_millis(1);
    TEST_ASSERT_TRUE(timer.poll());
    TEST_ASSERT_FALSE(timer.isArmed());
    TEST_ASSERT_FALSE(timer.poll());
}

void test_late_poll_still_fires() {
    OneShotTimer timer;
    timer.arm(100);
    mock_platform_advance_millis(5000);
    TEST_ASSERT_EQUAL_UINT32(0, timer.remainingMs());
    TEST_ASSERT_TRUE(timer.poll());
}

void test_rearm_replaces_deadline() {
    OneShotTimer timer;
    timer.arm(100);
    mock_platform_advance_millis(90);
    timer.arm(100);

    mock_platform_advance_millis(90);
    TEST_ASSERT_FALSE(timer.poll());
    mock_platform_advance_millis(10);
    TEST_ASSERT_TRUE(timer.poll());
}

void test_cancel_prevents_expiry() {
    OneShotTimer timer;
    timer.arm(100);
    timer.cancel();
    mock_platform_advance_millis(200);
    TEST_ASSERT_FALSE(timer.poll());
}

void test_survives_millis_wraparound() {
    mock_platform_set_millis(0xFFFFFF00u);
    OneShotTimer timer;
    timer.arm(0x200);

    mock_platform_advance_millis(0x100);  // wraps to 0
    TEST_ASSERT_FALSE(timer.poll());
    TEST_ASSERT_EQUAL_UINT32(0x100, timer.remainingMs());

    mock_platform_advance_millis(0x100);
    TEST_ASSERT_TRUE(timer.poll());
}

int main(int argc, char **argv) {
    UNITY_BEGIN();

    RUN_TEST(test_new_timer_is_disarmed);
    RUN_TEST(test_fires_once_at_deadline);
    RUN_TEST(test_late_poll_still_fires);
    RUN_TEST(test_rearm_replaces_deadline);
    RUN_TEST(test_cancel_prevents_expiry);
    RUN_TEST(test_survives_millis_wraparound);

    return UNITY_END();
}
