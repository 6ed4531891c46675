#include <unity.h>
#include <cstring>
#include "registry/validator.h"

using namespace lifxctl;

void setUp(void) {}
void tearDown(void) {}

// --- Address tests ---

void test_address_valid(void) {
    char out[ADDRESS_LEN];
    Error err;
    TEST_ASSERT_TRUE(validateAddress("192.168.1.10", out, sizeof(out), err));
    TEST_ASSERT_EQUAL_STRING("192.168.1.10", out);
    TEST_ASSERT_EQUAL(Error::NONE, err);
}

void test_address_bounds(void) {
    char out[ADDRESS_LEN];
    Error err;
    TEST_ASSERT_TRUE(validateAddress("0.0.0.0", out, sizeof(out), err));
    TEST_ASSERT_TRUE(validateAddress("255.255.255.255", out, sizeof(out), err));
    TEST_ASSERT_EQUAL_STRING("255.255.255.255", out);
}

void test_address_leading_zeros_canonical(void) {
    char out[ADDRESS_LEN];
    Error err;
    TEST_ASSERT_TRUE(validateAddress("010.001.000.009", out, sizeof(out), err));
    TEST_ASSERT_EQUAL_STRING("10.1.0.9", out);
}

void test_address_part_over_255(void) {
    char out[ADDRESS_LEN];
    Error err;
    TEST_ASSERT_FALSE(validateAddress("192.168.1.256", out, sizeof(out), err));
    TEST_ASSERT_EQUAL(Error::INVALID_ADDRESS, err);
}

void test_address_malformed(void) {
    char out[ADDRESS_LEN];
    Error err;
    const char* bad[] = {
        "", "192.168.1", "192.168.1.1.1", "192.168..1", "a.b.c.d",
        "192.168.1.1 ", " 192.168.1.1", "1920.168.1.1", "-1.2.3.4", "1.2.3.4."
    };
    for (size_t i = 0; i < sizeof(bad) / sizeof(bad[0]); i++) {
        TEST_ASSERT_FALSE_MESSAGE(validateAddress(bad[i], out, sizeof(out), err), bad[i]);
        TEST_ASSERT_EQUAL(Error::INVALID_ADDRESS, err);
    }
}

void test_address_null(void) {
    char out[ADDRESS_LEN];
    Error err;
    TEST_ASSERT_FALSE(validateAddress(nullptr, out, sizeof(out), err));
    TEST_ASSERT_EQUAL(Error::INVALID_ADDRESS, err);
}

// --- Identifier tests ---

void test_identifier_colon_form(void) {
    char out[IDENTIFIER_LEN];
    Error err;
    TEST_ASSERT_TRUE(validateIdentifier("d0:73:d5:01:02:03", out, sizeof(out), err));
    TEST_ASSERT_EQUAL_STRING("d0:73:d5:01:02:03", out);
}

void test_identifier_dash_and_case_normalized(void) {
    char out[IDENTIFIER_LEN];
    Error err;
    TEST_ASSERT_TRUE(validateIdentifier("D0-73-D5-0A-BB-FF", out, sizeof(out), err));
    TEST_ASSERT_EQUAL_STRING("d0:73:d5:0a:bb:ff", out);
}

void test_identifier_mixed_separators_accepted(void) {
    char out[IDENTIFIER_LEN];
    Error err;
    TEST_ASSERT_TRUE(validateIdentifier("d0:73-d5:01-02:03", out, sizeof(out), err));
    TEST_ASSERT_EQUAL_STRING("d0:73:d5:01:02:03", out);
}

void test_identifier_malformed(void) {
    char out[IDENTIFIER_LEN];
    Error err;
    const char* bad[] = {
        "", "d0:73:d5:01:02", "d0:73:d5:01:02:03:04", "d0:73:d5:01:02:0g",
        "d073d5010203", "d0.73.d5.01.02.03", "d0:73:d5:01:02:3", " d0:73:d5:01:02:03"
    };
    for (size_t i = 0; i < sizeof(bad) / sizeof(bad[0]); i++) {
        TEST_ASSERT_FALSE_MESSAGE(validateIdentifier(bad[i], out, sizeof(out), err), bad[i]);
        TEST_ASSERT_EQUAL(Error::INVALID_IDENTIFIER, err);
    }
}

// --- Brightness / colour tests ---

void test_brightness_range(void) {
    uint16_t level = 1;
    Error err;
    TEST_ASSERT_TRUE(validateBrightness(0, level, err));
    TEST_ASSERT_EQUAL_UINT16(0, level);
    TEST_ASSERT_TRUE(validateBrightness(65535, level, err));
    TEST_ASSERT_EQUAL_UINT16(65535, level);
    TEST_ASSERT_FALSE(validateBrightness(65536, level, err));
    TEST_ASSERT_EQUAL(Error::OUT_OF_RANGE, err);
    TEST_ASSERT_FALSE(validateBrightness(-1, level, err));
    TEST_ASSERT_EQUAL(Error::OUT_OF_RANGE, err);
}

void test_color_valid(void) {
    ColorSpec color;
    Error err;
    TEST_ASSERT_TRUE(validateColor(0, 65535, 40000, 3500, color, err));
    TEST_ASSERT_EQUAL_UINT16(0, color.hue);
    TEST_ASSERT_EQUAL_UINT16(65535, color.saturation);
    TEST_ASSERT_EQUAL_UINT16(40000, color.brightness);
    TEST_ASSERT_EQUAL_UINT16(3500, color.kelvin);
}

void test_color_kelvin_bounds(void) {
    ColorSpec color;
    Error err;
    const char* field = nullptr;
    TEST_ASSERT_TRUE(validateColor(0, 0, 0, LIFX_KELVIN_MIN, color, err));
    TEST_ASSERT_TRUE(validateColor(0, 0, 0, LIFX_KELVIN_MAX, color, err));
    TEST_ASSERT_FALSE(validateColor(0, 0, 0, LIFX_KELVIN_MIN - 1, color, err, &field));
    TEST_ASSERT_EQUAL(Error::OUT_OF_RANGE, err);
    TEST_ASSERT_EQUAL_STRING("kelvin", field);
    TEST_ASSERT_FALSE(validateColor(0, 0, 0, LIFX_KELVIN_MAX + 1, color, err));
}

void test_color_names_first_bad_field(void) {
    ColorSpec color;
    color.hue = 7;
    Error err;
    const char* field = nullptr;
    TEST_ASSERT_FALSE(validateColor(0, 70000, -1, 3500, color, err, &field));
    TEST_ASSERT_EQUAL_STRING("saturation", field);
    TEST_ASSERT_EQUAL_UINT16(7, color.hue);  // untouched on failure

    TEST_ASSERT_FALSE(validateColor(65536, 0, 0, 3500, color, err, &field));
    TEST_ASSERT_EQUAL_STRING("hue", field);
}

// --- Name tests ---

void test_name_trimmed(void) {
    char out[NAME_LEN];
    Error err;
    TEST_ASSERT_TRUE(validateName("  Desk Lamp \t", out, sizeof(out), err));
    TEST_ASSERT_EQUAL_STRING("Desk Lamp", out);
}

void test_name_empty_rejected(void) {
    char out[NAME_LEN];
    Error err;
    TEST_ASSERT_FALSE(validateName("", out, sizeof(out), err));
    TEST_ASSERT_EQUAL(Error::INVALID_NAME, err);
    TEST_ASSERT_FALSE(validateName("   ", out, sizeof(out), err));
    TEST_ASSERT_EQUAL(Error::INVALID_NAME, err);
}

void test_name_too_long_rejected(void) {
    char longName[LIFXCTL_MAX_NAME_LEN + 2];
    memset(longName, 'x', sizeof(longName) - 1);
    longName[sizeof(longName) - 1] = '\0';

    char out[NAME_LEN];
    Error err;
    TEST_ASSERT_FALSE(validateName(longName, out, sizeof(out), err));
    TEST_ASSERT_EQUAL(Error::INVALID_NAME, err);

    longName[LIFXCTL_MAX_NAME_LEN] = '\0';
    TEST_ASSERT_TRUE(validateName(longName, out, sizeof(out), err));
}

int main(int argc, char **argv) {
    UNITY_BEGIN();
    RUN_TEST(test_address_valid);
    RUN_TEST(test_address_bounds);
    RUN_TEST(test_address_leading_zeros_canonical);
    RUN_TEST(test_address_part_over_255);
    RUN_TEST(test_address_malformed);
    RUN_TEST(test_address_null);
    RUN_TEST(test_identifier_colon_form);
    RUN_TEST(test_identifier_dash_and_case_normalized);
    RUN_TEST(test_identifier_mixed_separators_accepted);
    RUN_TEST(test_identifier_malformed);
    RUN_TEST(test_brightness_range);
    RUN_TEST(test_color_valid);
    RUN_TEST(test_color_kelvin_bounds);
    RUN_TEST(test_color_names_first_bad_field);
    RUN_TEST(test_name_trimmed);
    RUN_TEST(test_name_empty_rejected);
    RUN_TEST(test_name_too_long_rejected);
    return UNITY_END();
}
