// =====================================================
// USB Console Unit Tests
// =====================================================
// Drives UsbCommandHandler through the host serial mock
// with a real BarGraph on top of MockI2cBus.
//
// Run with: ctest -R test_usb_serial
// =====================================================

#include <unity.h>
#include <string.h>
#include "usb_serial.h"
#include "../mock_i2c_bus.h"
#include "../mock_platform.h"

// =====================================================
// Test Fixtures
// =====================================================

MockI2cBus bus;
static BarGraph* graph = nullptr;
static LevelMeter* meter = nullptr;
static UsbCommandHandler* usb = nullptr;

void setUp() {
    bus.reset();
    mock_platform_reset();

    graph = new BarGraph(&bus, 0x70);
    meter = new LevelMeter(*graph);
    meter->begin(0, 24);
    usb = new UsbCommandHandler(*meter, *graph);
    usb->begin(115200);

    bus.clearWrites();
    mock_serial_clear_output();
}

void tearDown() {
    delete usb;
    delete meter;
    delete graph;
    usb = nullptr;
    meter = nullptr;
    graph = nullptr;
}

static void send(const char* line) {
    mock_serial_clear_output();
    mock_serial_feed(line);
    usb->poll();
}

static void assertOutputContains(const char* expected) {
    const char* out = mock_serial_output();
    if (strstr(out, expected) == nullptr) {
        TEST_FAIL_MESSAGE(out);
    }
}

// =====================================================
// Framing
// =====================================================

void test_hello_reports_identity() {
    send("HELLO\n");
    assertOutputContains("{\"event\":\"hello\",\"device_id\":\"A0A1A2A3A4A5A6A7A8A9AAAB\"");
    assertOutputContains("\"fw\":\"bargraph-meter 1.2.0\"");
    assertOutputContains("\"hash\":\"");
}

void test_commands_are_case_insensitive_and_accept_crlf() {
    send("  hello\r\n");
    assertOutputContains("\"event\":\"hello\"");
}

void test_unknown_command_is_reported() {
    send("frobnicate 1\n");
    assertOutputContains("{\"event\":\"error\",\"msg\":\"unknown command: FROBNICATE\"}");
}

void test_partial_line_waits_for_newline() {
    send("HEL");
    TEST_ASSERT_EQUAL_STRING("", mock_serial_output());

    send("LO\n");
    assertOutputContains("\"event\":\"hello\"");
}

void test_overlong_line_is_discarded_up_to_newline() {
    char line[200];
    memset(line, 'X', sizeof(line) - 2);
    line[sizeof(line) - 2] = '\n';
    line[sizeof(line) - 1] = '\0';

    send(line);
    assertOutputContains("line too long");
    TEST_ASSERT_NULL(strstr(mock_serial_output(), "unknown command"));

    send("HELLO\n");
    assertOutputContains("\"event\":\"hello\"");
}

// =====================================================
// Meter Commands
// =====================================================

void test_level_reports_first_rejected_and_accepted() {
    send("LEVEL 12\n");
    assertOutputContains("{\"event\":\"level\",\"result\":\"first\",\"bars\":12}");
    TEST_ASSERT_TRUE(usb->isManualInput());

    send("LEVEL 12.1\n");
    assertOutputContains("{\"event\":\"level\",\"result\":\"rejected\",\"bars\":12}");

    send("LEVEL 20\n");
    assertOutputContains("{\"event\":\"level\",\"result\":\"accepted\",\"delta\":8.000,\"bars\":20}");
}

void test_level_rejects_bad_argument() {
    send("LEVEL abc\n");
    assertOutputContains("LEVEL args");
    TEST_ASSERT_FALSE(meter->hasLevel());
    TEST_ASSERT_FALSE(usb->isManualInput());

    send("LEVEL nan\n");
    assertOutputContains("{\"event\":\"error\",\"cmd\":\"LEVEL\",\"msg\":\"range_error\"}");
    TEST_ASSERT_FALSE(meter->hasLevel());
}

void test_huge_level_lights_every_bar() {
    send("LEVEL 1e30\n");
    assertOutputContains("{\"event\":\"level\",\"result\":\"first\",\"bars\":24}");
}

void test_auto_leaves_manual_mode() {
    send("LEVEL 3\n");
    TEST_ASSERT_TRUE(usb->isManualInput());

    send("AUTO\n");
    assertOutputContains("{\"event\":\"ack\",\"cmd\":\"AUTO\"}");
    TEST_ASSERT_FALSE(usb->isManualInput());
}

void test_min_max_select_integer_or_real_bounds() {
    send("MIN 2\n");
    assertOutputContains("{\"event\":\"ack\",\"cmd\":\"MIN\"}");
    TEST_ASSERT_EQUAL_FLOAT(2.0f, meter->minValue());
    TEST_ASSERT_EQUAL_FLOAT(23.0f, meter->range());

    send("MAX 50.5\n");
    assertOutputContains("{\"event\":\"ack\",\"cmd\":\"MAX\"}");
    TEST_ASSERT_EQUAL_FLOAT(48.5f, meter->range());
}

void test_inverted_bound_reports_config_error() {
    send("MIN 30\n");
    assertOutputContains("{\"event\":\"error\",\"cmd\":\"MIN\",\"msg\":\"config_error\"}");
    TEST_ASSERT_EQUAL_FLOAT(0.0f, meter->minValue());

    send("MAX\n");
    assertOutputContains("MAX args");
}

void test_integer_bound_outside_int_is_rejected() {
    send("MIN 4294967296\n");
    assertOutputContains("MIN args");
    TEST_ASSERT_EQUAL_FLOAT(0.0f, meter->minValue());

    send("MIN 3000000000\n");
    assertOutputContains("MIN args");
    TEST_ASSERT_EQUAL_FLOAT(0.0f, meter->minValue());

    send("MAX -3000000000\n");
    assertOutputContains("MAX args");
    TEST_ASSERT_EQUAL_FLOAT(24.0f, meter->maxValue());

    send("MAX 99999999999999999999999\n");
    assertOutputContains("MAX args");
    TEST_ASSERT_EQUAL_FLOAT(24.0f, meter->maxValue());
}

void test_noise_value_and_default() {
    send("NOISE 3\n");
    assertOutputContains("\"cmd\":\"NOISE\"");
    TEST_ASSERT_EQUAL_FLOAT(3.0f, meter->noise());

    send("NOISE DEFAULT\n");
    TEST_ASSERT_FLOAT_WITHIN(0.0001f, 25.0f / 48.0f, meter->noise());

    send("NOISE 3\n");
    send("NOISE Default\n");
    assertOutputContains("{\"event\":\"ack\",\"cmd\":\"NOISE\"}");
    TEST_ASSERT_FLOAT_WITHIN(0.0001f, 25.0f / 48.0f, meter->noise());

    send("NOISE defaults\n");
    assertOutputContains("NOISE args");

    send("NOISE -1\n");
    assertOutputContains("NOISE args");
}

void test_warning_thresholds() {
    send("LOW_WARN 7 3\n");
    assertOutputContains("{\"event\":\"ack\",\"cmd\":\"LOW_WARN\"}");
    TEST_ASSERT_EQUAL(7, meter->lowWarn());
    TEST_ASSERT_EQUAL(3, meter->lowCrit());

    send("HIGH_WARN 19 30\n");
    assertOutputContains("{\"event\":\"error\",\"cmd\":\"HIGH_WARN\",\"msg\":\"range_error\"}");
    TEST_ASSERT_EQUAL(0, meter->highCrit());

    send("HIGH_WARN 19\n");
    assertOutputContains("HIGH_WARN args");
}

// =====================================================
// Display Commands
// =====================================================

void test_brightness_and_blink_reach_the_bus() {
    send("BRIGHTNESS 9\n");
    assertOutputContains("\"cmd\":\"BRIGHTNESS\"");
    TEST_ASSERT_EQUAL(1, bus.countCommand(0xE9));

    send("BLINK 2\n");
    assertOutputContains("\"cmd\":\"BLINK\"");
    TEST_ASSERT_EQUAL(1, bus.countCommand(0x85));
}

void test_out_of_range_display_values_are_rejected() {
    send("BRIGHTNESS 16\n");
    assertOutputContains("{\"event\":\"error\",\"cmd\":\"BRIGHTNESS\",\"msg\":\"range_error\"}");

    send("BLINK 4\n");
    assertOutputContains("{\"event\":\"error\",\"cmd\":\"BLINK\",\"msg\":\"range_error\"}");
    TEST_ASSERT_EQUAL(0, bus.writeCount);
}

void test_bus_failure_reports_bus_error_code() {
    bus.failAll(4);
    send("BRIGHTNESS 1\n");
    assertOutputContains("{\"event\":\"error\",\"cmd\":\"BRIGHTNESS\",\"msg\":\"bus_write_error\",\"bus_error\":4}");
}

void test_clear_resets_meter_and_display() {
    send("LEVEL 12\n");
    TEST_ASSERT_TRUE(meter->hasLevel());
    bus.clearWrites();

    send("CLEAR\n");
    assertOutputContains("{\"event\":\"ack\",\"cmd\":\"CLEAR\"}");
    TEST_ASSERT_FALSE(meter->hasLevel());

    const uint8_t blank[] = { 0x00, 0, 0, 0, 0, 0, 0 };
    TEST_ASSERT_EQUAL(1, bus.countPayload(blank, sizeof(blank)));
    TEST_ASSERT_EQUAL(BarColor::Off, graph->getBar(0));
}

// =====================================================
// State
// =====================================================

void test_get_state_before_and_after_level() {
    send("GET_STATE\n");
    assertOutputContains("{\"event\":\"state\",\"level\":null,\"min\":0.000,\"max\":24.000");
    assertOutputContains("\"input\":\"auto\"");

    send("LEVEL 12\n");
    send("GET_STATE\n");
    assertOutputContains("\"level\":12.000");
    assertOutputContains("\"bars\":12");
    assertOutputContains("\"rising\":false");
    assertOutputContains("\"input\":\"manual\",\"bus_error\":0}");
}

// =====================================================
// Test Runner
// =====================================================

int main(int argc, char **argv) {
    UNITY_BEGIN();

    RUN_TEST(test_hello_reports_identity);
    RUN_TEST(test_commands_are_case_insensitive_and_accept_crlf);
    RUN_TEST(test_unknown_command_is_reported);
    RUN_TEST(test_partial_line_waits_for_newline);
    RUN_TEST(test_overlong_line_is_discarded_up_to_newline);
    RUN_TEST(test_level_reports_first_rejected_and_accepted);
    RUN_TEST(test_level_rejects_bad_argument);
    RUN_TEST(test_huge_level_lights_every_bar);
    RUN_TEST(test_auto_leaves_manual_mode);
    RUN_TEST(test_min_max_select_integer_or_real_bounds);
    RUN_TEST(test_inverted_bound_reports_config_error);
    RUN_TEST(test_integer_bound_outside_int_is_rejected);
    RUN_TEST(test_noise_value_and_default);
    RUN_TEST(test_warning_thresholds);
    RUN_TEST(test_brightness_and_blink_reach_the_bus);
    RUN_TEST(test_out_of_range_display_values_are_rejected);
    RUN_TEST(test_bus_failure_reports_bus_error_code);
    RUN_TEST(test_clear_resets_meter_and_display);
    RUN_TEST(test_get_state_before_and_after_level);

    return UNITY_END();
}
