#include <cstdio>
#include <cstring>
#include "config.h"
#include "debug_log.h"
#include "errors.h"
#include "cli/cli_options.h"
#include "cli/report.h"
#include "commands/command_dispatcher.h"
#include "discovery/console_prompt.h"
#include "discovery/discovery_reconciler.h"
#include "registry/device_registry.h"
#include "registry/registry_store.h"
#include "transport/lifx_transport.h"

using namespace lifxctl;

// Registry is a few kilobytes of fixed arrays; keep it off the stack
static Registry registry;

static int failWith(Error error, const char* path, const char* address,
                    const char* identifier, const char* name) {
    char message[256];
    if (formatRegistryError(error, path, address, identifier, name,
                            message, sizeof(message)) < 0) {
        snprintf(message, sizeof(message), "%s", errorToString(error));
    }
    fprintf(stderr, "Error: %s\n", message);
    return errorExitCode(error);
}

static int runDiscover(RegistryStore& store, const CliOptions& options) {
    static DiscoveredDevice found[LIFXCTL_MAX_DEVICES];

    printf("Discovering LIFX devices...\n");
    fflush(stdout);

    LifxTransport transport(options.timeoutMs);
    int count = transport.scan(options.scanTimeoutMs, found, LIFXCTL_MAX_DEVICES);
    LOG_INFO("MAIN", "Scan returned %d device(s)", count);

    // Prompting starts only after the scan has finished
    ConsolePrompt prompt(stdin, stdout);
    ReconcileSummary summary;
    Error error;
    bool ok = reconcileDiscovered(registry, store, found, count, prompt, summary, error);
    printReconcileSummary(summary, stdout);

    if (!ok) {
        return failWith(error, store.path(), nullptr, nullptr, nullptr);
    }

    printf("\nDevice discovery complete.\n");
    return 0;
}

static int runSaveDevice(RegistryStore& store, const CliOptions& options) {
    DeviceRecord record;
    bool changed = false;
    Error error;
    if (!registerDevice(registry, store, options.saveAddress, options.saveIdentifier,
                        options.saveName, record, changed, error)) {
        return failWith(error, store.path(), options.saveAddress,
                        options.saveIdentifier, options.saveName);
    }

    if (changed) {
        printf("Device '%s' saved successfully with IP: %s and MAC: %s\n",
               record.name, record.address, record.identifier);
    } else {
        printf("Device '%s' is already registered with IP: %s and MAC: %s\n",
               record.name, record.address, record.identifier);
    }
    return 0;
}

static int runControl(RegistryStore& store, const CliOptions& options) {
    LifxTransport transport(options.timeoutMs);
    CommandDispatcher dispatcher(registry, store, transport);

    DispatchResult result;
    bool ok = dispatcher.dispatch(options.name, options.command,
                                  options.args, options.argc, result);

    char report[512];
    if (formatDispatchReport(result, options.name, report, sizeof(report)) < 0) {
        snprintf(report, sizeof(report), "%s", errorToString(result.error));
    }

    if (!ok) {
        LOG_DEBUG("MAIN", "Dispatch stopped at %s", dispatchStateToString(result.state));
        fprintf(stderr, "Error: %s\n", report);
        return errorExitCode(result.error);
    }

    if (result.addressRefreshed) {
        printf("Updated IP address for %s to %s\n", result.device.name, result.device.address);
    } else if (result.refreshError != Error::NONE) {
        fprintf(stderr, "Warning: %s now answers at a new address but %s could not be "
                        "updated (%s)\n",
                result.device.name, store.path(), errorToString(result.refreshError));
    }
    printf("%s\n", report);
    return 0;
}

int main(int argc, char** argv) {
    CliOptions options;
    char message[256];
    if (!parseCliOptions(argc, argv, options, message, sizeof(message))) {
        fprintf(stderr, "%s: %s\n\n", LIFXCTL_NAME, message);
        printUsage(stderr, LIFXCTL_NAME);
        return 2;
    }

    switch (options.action) {
        case CliAction::NONE:
        case CliAction::HELP:
            printUsage(stdout, LIFXCTL_NAME);
            return 0;
        case CliAction::VERSION:
            printf("%s %s\n", LIFXCTL_NAME, LIFXCTL_VERSION);
            return 0;
        default:
            break;
    }

    const char* path = resolveRegistryPath(options.registryPath);
    RegistryStore store(path);
    LOG_DEBUG("MAIN", "Registry: %s", path);

    Error error;
    if (!store.load(registry, error)) {
        return failWith(error, path, nullptr, nullptr, nullptr);
    }

    switch (options.action) {
        case CliAction::DISCOVER:
            return runDiscover(store, options);
        case CliAction::SAVE_DEVICE:
            return runSaveDevice(store, options);
        case CliAction::LIST:
            printDeviceTable(registry, stdout);
            return 0;
        case CliAction::CONTROL:
            return runControl(store, options);
        default:
            printUsage(stderr, LIFXCTL_NAME);
            return 2;
    }
}
