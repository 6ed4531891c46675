#include <unity.h>
#include <cstdlib>
#include <cstring>
#include "cli/cli_options.h"
#include "config.h"

using namespace lifxctl;

static char message[160];

void setUp(void) {
    message[0] = '\0';
    unsetenv(LIFXCTL_REGISTRY_ENV);
}

void tearDown(void) {
    unsetenv(LIFXCTL_REGISTRY_ENV);
}

#define ARGC(a) ((int)(sizeof(a) / sizeof(a[0])))

void test_no_arguments(void) {
    char* argv[] = {(char*)"lifxctl"};
    CliOptions opts;
    TEST_ASSERT_TRUE(parseCliOptions(ARGC(argv), argv, opts, message, sizeof(message)));
    TEST_ASSERT_EQUAL(CliAction::NONE, opts.action);
    TEST_ASSERT_NULL(opts.registryPath);
    TEST_ASSERT_EQUAL_UINT32(LIFX_REQUEST_TIMEOUT_MS, opts.timeoutMs);
    TEST_ASSERT_EQUAL_UINT32(LIFX_DISCOVERY_TIMEOUT_MS, opts.scanTimeoutMs);
}

void test_discover_and_list(void) {
    char* a1[] = {(char*)"lifxctl", (char*)"--discover"};
    CliOptions opts;
    TEST_ASSERT_TRUE(parseCliOptions(ARGC(a1), a1, opts, message, sizeof(message)));
    TEST_ASSERT_EQUAL(CliAction::DISCOVER, opts.action);

    char* a2[] = {(char*)"lifxctl", (char*)"-l"};
    TEST_ASSERT_TRUE(parseCliOptions(ARGC(a2), a2, opts, message, sizeof(message)));
    TEST_ASSERT_EQUAL(CliAction::LIST, opts.action);
}

void test_save_device_takes_three_values(void) {
    char* argv[] = {(char*)"lifxctl", (char*)"--save-device",
                    (char*)"192.168.1.10", (char*)"d0:73:d5:01:02:03", (char*)"Desk"};
    CliOptions opts;
    TEST_ASSERT_TRUE(parseCliOptions(ARGC(argv), argv, opts, message, sizeof(message)));
    TEST_ASSERT_EQUAL(CliAction::SAVE_DEVICE, opts.action);
    TEST_ASSERT_EQUAL_STRING("192.168.1.10", opts.saveAddress);
    TEST_ASSERT_EQUAL_STRING("d0:73:d5:01:02:03", opts.saveIdentifier);
    TEST_ASSERT_EQUAL_STRING("Desk", opts.saveName);
}

void test_save_device_missing_values(void) {
    char* argv[] = {(char*)"lifxctl", (char*)"--save-device",
                    (char*)"192.168.1.10", (char*)"d0:73:d5:01:02:03"};
    CliOptions opts;
    TEST_ASSERT_FALSE(parseCliOptions(ARGC(argv), argv, opts, message, sizeof(message)));
    TEST_ASSERT_TRUE(strlen(message) > 0);
}

void test_control_with_args(void) {
    char* argv[] = {(char*)"lifxctl", (char*)"--name", (char*)"Desk",
                    (char*)"--command", (char*)"setColor", (char*)"--args",
                    (char*)"0", (char*)"65535", (char*)"40000", (char*)"3500"};
    CliOptions opts;
    TEST_ASSERT_TRUE(parseCliOptions(ARGC(argv), argv, opts, message, sizeof(message)));
    TEST_ASSERT_EQUAL(CliAction::CONTROL, opts.action);
    TEST_ASSERT_EQUAL_STRING("Desk", opts.name);
    TEST_ASSERT_EQUAL_STRING("setColor", opts.command);
    TEST_ASSERT_EQUAL_INT(4, opts.argc);
    TEST_ASSERT_EQUAL_STRING("0", opts.args[0]);
    TEST_ASSERT_EQUAL_STRING("3500", opts.args[3]);
}

void test_control_negative_argument_after_separator(void) {
    char* argv[] = {(char*)"lifxctl", (char*)"-n", (char*)"Desk", (char*)"-c",
                    (char*)"setBrightness", (char*)"--", (char*)"-5"};
    CliOptions opts;
    TEST_ASSERT_TRUE(parseCliOptions(ARGC(argv), argv, opts, message, sizeof(message)));
    TEST_ASSERT_EQUAL_INT(1, opts.argc);
    TEST_ASSERT_EQUAL_STRING("-5", opts.args[0]);
}

void test_name_without_command(void) {
    char* argv[] = {(char*)"lifxctl", (char*)"--name", (char*)"Desk"};
    CliOptions opts;
    TEST_ASSERT_FALSE(parseCliOptions(ARGC(argv), argv, opts, message, sizeof(message)));
}

void test_conflicting_actions(void) {
    char* argv[] = {(char*)"lifxctl", (char*)"--discover", (char*)"--list"};
    CliOptions opts;
    TEST_ASSERT_FALSE(parseCliOptions(ARGC(argv), argv, opts, message, sizeof(message)));
    TEST_ASSERT_NOT_NULL(strstr(message, "exclusive"));
}

void test_unknown_option_and_missing_value(void) {
    char* a1[] = {(char*)"lifxctl", (char*)"--bogus"};
    CliOptions opts;
    TEST_ASSERT_FALSE(parseCliOptions(ARGC(a1), a1, opts, message, sizeof(message)));
    TEST_ASSERT_NOT_NULL(strstr(message, "unknown option"));

    char* a2[] = {(char*)"lifxctl", (char*)"--list", (char*)"--config"};
    TEST_ASSERT_FALSE(parseCliOptions(ARGC(a2), a2, opts, message, sizeof(message)));
    TEST_ASSERT_NOT_NULL(strstr(message, "needs a value"));
}

void test_stray_positional_rejected(void) {
    char* argv[] = {(char*)"lifxctl", (char*)"--list", (char*)"extra"};
    CliOptions opts;
    TEST_ASSERT_FALSE(parseCliOptions(ARGC(argv), argv, opts, message, sizeof(message)));
}

void test_timeouts_and_config(void) {
    char* argv[] = {(char*)"lifxctl", (char*)"--config", (char*)"/tmp/reg.json",
                    (char*)"--timeout", (char*)"500", (char*)"--scan-timeout", (char*)"9000",
                    (char*)"--discover"};
    CliOptions opts;
    TEST_ASSERT_TRUE(parseCliOptions(ARGC(argv), argv, opts, message, sizeof(message)));
    TEST_ASSERT_EQUAL_STRING("/tmp/reg.json", opts.registryPath);
    TEST_ASSERT_EQUAL_UINT32(500, opts.timeoutMs);
    TEST_ASSERT_EQUAL_UINT32(9000, opts.scanTimeoutMs);

    char* bad[] = {(char*)"lifxctl", (char*)"--timeout", (char*)"0", (char*)"--list"};
    TEST_ASSERT_FALSE(parseCliOptions(ARGC(bad), bad, opts, message, sizeof(message)));
}

void test_help_wins(void) {
    char* argv[] = {(char*)"lifxctl", (char*)"--list", (char*)"--help"};
    CliOptions opts;
    TEST_ASSERT_TRUE(parseCliOptions(ARGC(argv), argv, opts, message, sizeof(message)));
    TEST_ASSERT_EQUAL(CliAction::HELP, opts.action);
}

void test_registry_path_precedence(void) {
    TEST_ASSERT_EQUAL_STRING(LIFXCTL_REGISTRY_PATH, resolveRegistryPath(nullptr));

    setenv(LIFXCTL_REGISTRY_ENV, "/tmp/from_env.json", 1);
    TEST_ASSERT_EQUAL_STRING("/tmp/from_env.json", resolveRegistryPath(nullptr));
    TEST_ASSERT_EQUAL_STRING("/tmp/from_env.json", resolveRegistryPath(""));
    TEST_ASSERT_EQUAL_STRING("/tmp/cli.json", resolveRegistryPath("/tmp/cli.json"));
}

int main(int argc, char **argv) {
    UNITY_BEGIN();
    RUN_TEST(test_no_arguments);
    RUN_TEST(test_discover_and_list);
    RUN_TEST(test_save_device_takes_three_values);
    RUN_TEST(test_save_device_missing_values);
    RUN_TEST(test_control_with_args);
    RUN_TEST(test_control_negative_argument_after_separator);
    RUN_TEST(test_name_without_command);
    RUN_TEST(test_conflicting_actions);
    RUN_TEST(test_unknown_option_and_missing_value);
    RUN_TEST(test_stray_positional_rejected);
    RUN_TEST(test_timeouts_and_config);
    RUN_TEST(test_help_wins);
    RUN_TEST(test_registry_path_precedence);
    return UNITY_END();
}
