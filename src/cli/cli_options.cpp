#include "cli_options.h"
#include <cstdlib>
#include <cstring>
#include <getopt.h>
#include "../config.h"
#include "../commands/command.h"

namespace lifxctl {

static bool setAction(CliOptions& options, CliAction action,
                      char* message, size_t messageLen) {
    if (options.action != CliAction::NONE && options.action != action) {
        snprintf(message, messageLen,
                 "--discover, --save-device, --list and --name/--command are exclusive");
        return false;
    }
    options.action = action;
    return true;
}

static bool parseTimeout(const char* text, const char* option, unsigned long& value,
                         char* message, size_t messageLen) {
    long parsed = 0;
    if (!parseIntArgument(text, parsed) || parsed <= 0) {
        snprintf(message, messageLen, "%s expects a positive number of milliseconds, got '%s'",
                 option, text);
        return false;
    }
    value = (unsigned long)parsed;
    return true;
}

bool parseCliOptions(int argc, char** argv, CliOptions& options,
                     char* message, size_t messageLen) {
    memset(&options, 0, sizeof(options));
    options.action = CliAction::NONE;
    options.timeoutMs = LIFX_REQUEST_TIMEOUT_MS;
    options.scanTimeoutMs = LIFX_DISCOVERY_TIMEOUT_MS;
    if (message != nullptr && messageLen > 0) message[0] = '\0';

    static const struct option longOpts[] = {
        {"discover",     no_argument,       nullptr, 'd'},
        {"save-device",  required_argument, nullptr, 's'},
        {"list",         no_argument,       nullptr, 'l'},
        {"name",         required_argument, nullptr, 'n'},
        {"command",      required_argument, nullptr, 'c'},
        {"args",         no_argument,       nullptr, 'a'},
        {"config",       required_argument, nullptr, 'f'},
        {"timeout",      required_argument, nullptr, 't'},
        {"scan-timeout", required_argument, nullptr, 'T'},
        {"help",         no_argument,       nullptr, 'h'},
        {"version",      no_argument,       nullptr, 'V'},
        {nullptr,        0,                 nullptr, 0}
    };
    // '+' stops at the first positional argument. A negative command
    // argument must follow "--". ':' reports missing values as ':'
    const char* shortOpts = "+:ds:ln:c:af:t:T:hV";

    optind = 0;  // full getopt re-initialisation (glibc)
    opterr = 0;

    bool help = false;
    bool version = false;

    for (;;) {
        int opt = getopt_long(argc, argv, shortOpts, longOpts, nullptr);
        if (opt == -1) break;

        switch (opt) {
            case 'd':
                if (!setAction(options, CliAction::DISCOVER, message, messageLen)) return false;
                break;
            case 's':
                if (!setAction(options, CliAction::SAVE_DEVICE, message, messageLen)) return false;
                if (optind + 1 >= argc) {
                    snprintf(message, messageLen, "--save-device expects IP MAC NAME");
                    return false;
                }
                options.saveAddress = optarg;
                options.saveIdentifier = argv[optind];
                options.saveName = argv[optind + 1];
                optind += 2;
                break;
            case 'l':
                if (!setAction(options, CliAction::LIST, message, messageLen)) return false;
                break;
            case 'n':
                if (!setAction(options, CliAction::CONTROL, message, messageLen)) return false;
                options.name = optarg;
                break;
            case 'c':
                if (!setAction(options, CliAction::CONTROL, message, messageLen)) return false;
                options.command = optarg;
                break;
            case 'a':
                // Marks the start of command arguments; they are positional
                break;
            case 'f':
                options.registryPath = optarg;
                break;
            case 't':
                if (!parseTimeout(optarg, "--timeout", options.timeoutMs,
                                  message, messageLen)) return false;
                break;
            case 'T':
                if (!parseTimeout(optarg, "--scan-timeout", options.scanTimeoutMs,
                                  message, messageLen)) return false;
                break;
            case 'h':
                help = true;
                break;
            case 'V':
                version = true;
                break;
            case ':':
                snprintf(message, messageLen, "option %s needs a value",
                         optind > 0 && optind <= argc ? argv[optind - 1] : "?");
                return false;
            default:
                snprintf(message, messageLen, "unknown option %s",
                         optind > 0 && optind <= argc ? argv[optind - 1] : "?");
                return false;
        }
    }

    options.args = (const char* const*)(argv + optind);
    options.argc = argc - optind;

    if (help) {
        options.action = CliAction::HELP;
        return true;
    }
    if (version) {
        options.action = CliAction::VERSION;
        return true;
    }

    if (options.action == CliAction::CONTROL) {
        if (options.name == nullptr || options.command == nullptr) {
            snprintf(message, messageLen, "--name and --command must be given together");
            return false;
        }
    } else if (options.argc > 0) {
        snprintf(message, messageLen, "unexpected argument '%s'", options.args[0]);
        return false;
    }

    return true;
}

const char* resolveRegistryPath(const char* cliPath) {
    if (cliPath != nullptr && cliPath[0] != '\0') return cliPath;

    const char* env = getenv(LIFXCTL_REGISTRY_ENV);
    if (env != nullptr && env[0] != '\0') return env;

    return LIFXCTL_REGISTRY_PATH;
}

void printUsage(FILE* out, const char* program) {
    fprintf(out,
            "LIFX Bulb Controller\n"
            "\n"
            "Usage:\n"
            "  %s --discover\n"
            "  %s --save-device IP MAC NAME\n"
            "  %s --list\n"
            "  %s --name NAME --command COMMAND [--args ARG...]\n"
            "\n"
            "Commands:\n"
            "  on | off | status\n"
            "  setBrightness LEVEL            level 0-65535\n"
            "  setColor HUE SAT BRI KELVIN    0-65535 each, kelvin %d-%d\n"
            "\n"
            "Options:\n"
            "  --config PATH        registry file (default: $%s or %s)\n"
            "  --timeout MS         per-request device timeout (default %d)\n"
            "  --scan-timeout MS    discovery listen time (default %d)\n"
            "  --help, --version\n",
            program, program, program, program,
            LIFX_KELVIN_MIN, LIFX_KELVIN_MAX,
            LIFXCTL_REGISTRY_ENV, LIFXCTL_REGISTRY_PATH,
            LIFX_REQUEST_TIMEOUT_MS, LIFX_DISCOVERY_TIMEOUT_MS);
}

} // namespace lifxctl
