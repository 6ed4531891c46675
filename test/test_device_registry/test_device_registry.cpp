#include <unity.h>
#include <cstdio>
#include <cstring>
#include "registry/device_registry.h"

using namespace lifxctl;

static Registry reg;

void setUp(void) {
    initRegistry(reg);
}

void tearDown(void) {}

static DeviceRecord makeRecord(const char* id, const char* addr, const char* name) {
    DeviceRecord r;
    Error err;
    TEST_ASSERT_TRUE(makeDeviceRecord(id, addr, name, r, err));
    return r;
}

void test_make_record_normalizes(void) {
    DeviceRecord r;
    Error err;
    TEST_ASSERT_TRUE(makeDeviceRecord("D0-73-D5-01-02-03", "192.168.001.010", " Desk ", r, err));
    TEST_ASSERT_EQUAL_STRING("d0:73:d5:01:02:03", r.identifier);
    TEST_ASSERT_EQUAL_STRING("192.168.1.10", r.address);
    TEST_ASSERT_EQUAL_STRING("Desk", r.name);
}

void test_make_record_reports_field(void) {
    DeviceRecord r;
    Error err;
    TEST_ASSERT_FALSE(makeDeviceRecord("nope", "192.168.1.10", "Desk", r, err));
    TEST_ASSERT_EQUAL(Error::INVALID_IDENTIFIER, err);
    TEST_ASSERT_FALSE(makeDeviceRecord("d0:73:d5:01:02:03", "300.1.1.1", "Desk", r, err));
    TEST_ASSERT_EQUAL(Error::INVALID_ADDRESS, err);
    TEST_ASSERT_FALSE(makeDeviceRecord("d0:73:d5:01:02:03", "10.0.0.1", "", r, err));
    TEST_ASSERT_EQUAL(Error::INVALID_NAME, err);
}

void test_add_new_record(void) {
    bool changed = false;
    Error err;
    TEST_ASSERT_TRUE(addOrUpdate(reg, makeRecord("d0:73:d5:01:02:03", "192.168.1.10", "Desk"),
                                 changed, err));
    TEST_ASSERT_TRUE(changed);
    TEST_ASSERT_EQUAL_INT(1, reg.count);
}

void test_add_identical_is_noop(void) {
    DeviceRecord r = makeRecord("d0:73:d5:01:02:03", "192.168.1.10", "Desk");
    bool changed;
    Error err;
    TEST_ASSERT_TRUE(addOrUpdate(reg, r, changed, err));
    TEST_ASSERT_TRUE(addOrUpdate(reg, r, changed, err));
    TEST_ASSERT_FALSE(changed);
    TEST_ASSERT_EQUAL_INT(1, reg.count);
}

void test_update_address_and_name(void) {
    bool changed;
    Error err;
    addOrUpdate(reg, makeRecord("d0:73:d5:01:02:03", "192.168.1.10", "Desk"), changed, err);
    TEST_ASSERT_TRUE(addOrUpdate(reg, makeRecord("d0:73:d5:01:02:03", "192.168.1.22", "Office"),
                                 changed, err));
    TEST_ASSERT_TRUE(changed);
    TEST_ASSERT_EQUAL_INT(1, reg.count);
    TEST_ASSERT_EQUAL_STRING("192.168.1.22", reg.devices[0].address);
    TEST_ASSERT_EQUAL_STRING("Office", reg.devices[0].name);
    TEST_ASSERT_NULL(findByName(reg, "Desk"));
}

void test_rename_same_device_case_only(void) {
    bool changed;
    Error err;
    addOrUpdate(reg, makeRecord("d0:73:d5:01:02:03", "192.168.1.10", "Desk"), changed, err);
    TEST_ASSERT_TRUE(addOrUpdate(reg, makeRecord("d0:73:d5:01:02:03", "192.168.1.10", "DESK"),
                                 changed, err));
    TEST_ASSERT_TRUE(changed);
    TEST_ASSERT_EQUAL_STRING("DESK", reg.devices[0].name);
}

void test_name_conflict_leaves_registry_untouched(void) {
    bool changed;
    Error err;
    addOrUpdate(reg, makeRecord("d0:73:d5:01:02:03", "192.168.1.10", "Desk"), changed, err);

    Registry before = reg;
    TEST_ASSERT_FALSE(addOrUpdate(reg, makeRecord("d0:73:d5:0a:0b:0c", "192.168.1.11", "desk"),
                                  changed, err));
    TEST_ASSERT_EQUAL(Error::NAME_CONFLICT, err);
    TEST_ASSERT_FALSE(changed);
    TEST_ASSERT_TRUE(registryEquals(before, reg));
}

void test_invalid_record_rejected(void) {
    DeviceRecord r;
    memset(&r, 0, sizeof(r));
    strcpy(r.identifier, "not-a-mac");
    strcpy(r.address, "192.168.1.10");
    strcpy(r.name, "Desk");

    bool changed;
    Error err;
    TEST_ASSERT_FALSE(addOrUpdate(reg, r, changed, err));
    TEST_ASSERT_EQUAL(Error::INVALID_IDENTIFIER, err);
    TEST_ASSERT_EQUAL_INT(0, reg.count);
}

void test_registry_full(void) {
    bool changed;
    Error err;
    for (int i = 0; i < LIFXCTL_MAX_DEVICES; i++) {
        char id[IDENTIFIER_LEN];
        char name[NAME_LEN];
        snprintf(id, sizeof(id), "d0:73:d5:00:%02x:%02x", i / 256, i % 256);
        snprintf(name, sizeof(name), "Bulb %d", i);
        TEST_ASSERT_TRUE(addOrUpdate(reg, makeRecord(id, "10.0.0.1", name), changed, err));
    }

    TEST_ASSERT_FALSE(addOrUpdate(reg, makeRecord("d0:73:d5:ff:ff:ff", "10.0.0.2", "Extra"),
                                  changed, err));
    TEST_ASSERT_EQUAL(Error::REGISTRY_FULL, err);
    TEST_ASSERT_EQUAL_INT(LIFXCTL_MAX_DEVICES, reg.count);

    // Updating an existing device still works when full
    TEST_ASSERT_TRUE(addOrUpdate(reg, makeRecord("d0:73:d5:00:00:00", "10.0.0.9", "Bulb 0"),
                                 changed, err));
    TEST_ASSERT_TRUE(changed);
}

void test_find_by_name_case_insensitive(void) {
    bool changed;
    Error err;
    addOrUpdate(reg, makeRecord("d0:73:d5:01:02:03", "192.168.1.10", "Desk"), changed, err);

    const DeviceRecord* r = findByName(reg, "dEsK");
    TEST_ASSERT_NOT_NULL(r);
    TEST_ASSERT_EQUAL_STRING("d0:73:d5:01:02:03", r->identifier);
    TEST_ASSERT_NULL(findByName(reg, "Kitchen"));
    TEST_ASSERT_NULL(findByName(reg, nullptr));
}

void test_find_by_identifier(void) {
    bool changed;
    Error err;
    addOrUpdate(reg, makeRecord("d0:73:d5:01:02:03", "192.168.1.10", "Desk"), changed, err);
    TEST_ASSERT_NOT_NULL(findByIdentifier(reg, "d0:73:d5:01:02:03"));
    TEST_ASSERT_NULL(findByIdentifier(reg, "d0:73:d5:01:02:04"));
}

void test_list_all_sorted_by_name(void) {
    bool changed;
    Error err;
    addOrUpdate(reg, makeRecord("d0:73:d5:00:00:03", "10.0.0.3", "porch"), changed, err);
    addOrUpdate(reg, makeRecord("d0:73:d5:00:00:01", "10.0.0.1", "Kitchen"), changed, err);
    addOrUpdate(reg, makeRecord("d0:73:d5:00:00:02", "10.0.0.2", "desk"), changed, err);

    const DeviceRecord* out[LIFXCTL_MAX_DEVICES];
    int n = listAll(reg, out, LIFXCTL_MAX_DEVICES);
    TEST_ASSERT_EQUAL_INT(3, n);
    TEST_ASSERT_EQUAL_STRING("desk", out[0]->name);
    TEST_ASSERT_EQUAL_STRING("Kitchen", out[1]->name);
    TEST_ASSERT_EQUAL_STRING("porch", out[2]->name);
}

void test_list_all_empty(void) {
    const DeviceRecord* out[4];
    TEST_ASSERT_EQUAL_INT(0, listAll(reg, out, 4));
}

void test_registry_equals_ignores_order(void) {
    Registry other;
    initRegistry(other);
    bool changed;
    Error err;
    DeviceRecord a = makeRecord("d0:73:d5:00:00:01", "10.0.0.1", "A");
    DeviceRecord b = makeRecord("d0:73:d5:00:00:02", "10.0.0.2", "B");
    addOrUpdate(reg, a, changed, err);
    addOrUpdate(reg, b, changed, err);
    addOrUpdate(other, b, changed, err);
    addOrUpdate(other, a, changed, err);
    TEST_ASSERT_TRUE(registryEquals(reg, other));

    addOrUpdate(other, makeRecord("d0:73:d5:00:00:02", "10.0.0.3", "B"), changed, err);
    TEST_ASSERT_FALSE(registryEquals(reg, other));
}

int main(int argc, char **argv) {
    UNITY_BEGIN();
    RUN_TEST(test_make_record_normalizes);
    RUN_TEST(test_make_record_reports_field);
    RUN_TEST(test_add_new_record);
    RUN_TEST(test_add_identical_is_noop);
    RUN_TEST(test_update_address_and_name);
    RUN_TEST(test_rename_same_device_case_only);
    RUN_TEST(test_name_conflict_leaves_registry_untouched);
    RUN_TEST(test_invalid_record_rejected);
    RUN_TEST(test_registry_full);
    RUN_TEST(test_find_by_name_case_insensitive);
    RUN_TEST(test_find_by_identifier);
    RUN_TEST(test_list_all_sorted_by_name);
    RUN_TEST(test_list_all_empty);
    RUN_TEST(test_registry_equals_ignores_order);
    return UNITY_END();
}
