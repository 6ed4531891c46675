#pragma once
#include <cstddef>
#include <cstdio>

namespace lifxctl {

enum class CliAction {
    NONE,
    HELP,
    VERSION,
    DISCOVER,
    SAVE_DEVICE,
    LIST,
    CONTROL
};

struct CliOptions {
    CliAction action;
    const char* registryPath;     // --config, nullptr if not given
    unsigned long timeoutMs;      // --timeout, per transport request
    unsigned long scanTimeoutMs;  // --scan-timeout
    const char* saveAddress;      // --save-device IP MAC NAME
    const char* saveIdentifier;
    const char* saveName;
    const char* name;             // --name
    const char* command;          // --command
    const char* const* args;      // positional arguments after the options
    int argc;
};

// Parse the command line. Options stop at the first positional argument;
// everything from there on is a command argument:
//   lifxctl --name Desk --command setColor --args 0 65535 40000 3500
// Returns false and writes a one-line reason to message on usage errors
// (unknown option, missing value, conflicting actions).
bool parseCliOptions(int argc, char** argv, CliOptions& options,
                     char* message, size_t messageLen);

// Registry path: --config, then $LIFXCTL_CONFIG, then the built-in default
const char* resolveRegistryPath(const char* cliPath);

void printUsage(FILE* out, const char* program);

} // namespace lifxctl
