#include "console_prompt.h"
#include <cstring>

namespace lifxctl {

ConsolePrompt::ConsolePrompt(FILE* in, FILE* out) : _in(in), _out(out) {}

PromptResult ConsolePrompt::askName(const DiscoveredDevice& device, char* name, size_t nameLen) {
    fprintf(_out, "\nFound new device:\n");
    fprintf(_out, "MAC Address: %s\n", device.identifier);
    fprintf(_out, "IP Address: %s\n", device.address);
    fprintf(_out, "Enter a name for this device (or press Enter to skip): ");
    fflush(_out);

    char line[256];
    if (fgets(line, sizeof(line), _in) == nullptr) {
        fprintf(_out, "\n");
        return PromptResult::CANCEL;
    }

    // Drop the rest of an over-long line so it does not answer the next prompt
    size_t len = strlen(line);
    if (len > 0 && line[len - 1] != '\n' && !feof(_in)) {
        int c;
        while ((c = fgetc(_in)) != EOF && c != '\n') {}
    }
    line[strcspn(line, "\r\n")] = '\0';

    const char* start = line;
    while (*start == ' ' || *start == '\t') start++;
    len = strlen(start);
    while (len > 0 && (start[len - 1] == ' ' || start[len - 1] == '\t')) len--;
    if (len == 0) return PromptResult::SKIP;
    line[(start - line) + len] = '\0';

    if (strlen(start) >= nameLen) {
        fprintf(_out, "Name is too long (max %u characters); device skipped.\n",
                (unsigned)(nameLen - 1));
        return PromptResult::SKIP;
    }

    strcpy(name, start);
    return PromptResult::NAME;
}

void ConsolePrompt::reportConflict(const DiscoveredDevice& device, const char* name,
                                   const DeviceRecord& owner) {
    fprintf(_out, "Name '%s' is already used by %s (%s); %s was not added.\n",
            name, owner.identifier, owner.address, device.identifier);
}

void ConsolePrompt::reportAdded(const DeviceRecord& record) {
    fprintf(_out, "Device '%s' added to configuration.\n", record.name);
}

} // namespace lifxctl
