#pragma once

#include <optional>

namespace LT {

struct RuntimeFlags {
    // New list items may be produced by cloning an already rendered item.
    // LIVETREE_TEMPLATE_CLONING (default on).
    bool template_cloning = true;
    // Every platform mutation is written to the logger under the "Mutation" tag.
    // LIVETREE_TRACE_MUTATIONS (default off).
    bool trace_mutations = false;
};

// Reads the LIVETREE_* variables. Unset variables keep their defaults; set
// variables are false for "0", "false", "off", "no" and true otherwise.
[[nodiscard]] auto LoadRuntimeFlags() -> RuntimeFlags;

// Flags in effect for this process: the innermost ScopedRuntimeFlags if any,
// otherwise the environment values read on first use.
[[nodiscard]] auto CurrentRuntimeFlags() -> RuntimeFlags const&;

class ScopedRuntimeFlags {
public:
    explicit ScopedRuntimeFlags(RuntimeFlags flags);
    ~ScopedRuntimeFlags();

    ScopedRuntimeFlags(ScopedRuntimeFlags const&)            = delete;
    ScopedRuntimeFlags& operator=(ScopedRuntimeFlags const&) = delete;

private:
    std::optional<RuntimeFlags> previous_;
};

} // namespace LT
