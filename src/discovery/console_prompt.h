#pragma once
#include <cstddef>
#include <cstdio>
#include "discovery_reconciler.h"

namespace lifxctl {

// Line-based prompt on a pair of stdio streams. An empty line skips the
// device, end of input cancels.
class ConsolePrompt : public NamePrompt {
public:
    ConsolePrompt(FILE* in, FILE* out);

    PromptResult askName(const DiscoveredDevice& device, char* name, size_t nameLen) override;
    void reportConflict(const DiscoveredDevice& device, const char* name,
                        const DeviceRecord& owner) override;
    void reportAdded(const DeviceRecord& record) override;

private:
    FILE* _in;
    FILE* _out;
};

} // namespace lifxctl
