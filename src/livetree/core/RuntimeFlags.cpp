#include <livetree/core/RuntimeFlags.hpp>

#include <cctype>
#include <cstdlib>
#include <string>
#include <string_view>

namespace {

auto parse_truthy(char const* value, bool fallback) -> bool {
    if (value == nullptr) {
        return fallback;
    }
    std::string_view text{value};
    auto is_space = [](char ch) {
        return ch == ' ' || ch == '\t' || ch == '\n';
    };
    while (!text.empty() && is_space(text.front())) {
        text.remove_prefix(1);
    }
    while (!text.empty() && is_space(text.back())) {
        text.remove_suffix(1);
    }
    if (text.empty()) {
        return true;
    }
    std::string normalized;
    normalized.reserve(text.size());
    for (char ch : text) {
        normalized.push_back(static_cast<char>(std::tolower(static_cast<unsigned char>(ch))));
    }
    if (normalized == "0" || normalized == "false" || normalized == "off" || normalized == "no") {
        return false;
    }
    return true;
}

auto environment_flags() -> LT::RuntimeFlags const& {
    static LT::RuntimeFlags flags = LT::LoadRuntimeFlags();
    return flags;
}

std::optional<LT::RuntimeFlags> g_override;

} // namespace

namespace LT {

auto LoadRuntimeFlags() -> RuntimeFlags {
    RuntimeFlags defaults;
    RuntimeFlags flags;
    flags.template_cloning = parse_truthy(std::getenv("LIVETREE_TEMPLATE_CLONING"), defaults.template_cloning);
    flags.trace_mutations  = parse_truthy(std::getenv("LIVETREE_TRACE_MUTATIONS"), defaults.trace_mutations);
    return flags;
}

auto CurrentRuntimeFlags() -> RuntimeFlags const& {
    if (g_override) {
        return *g_override;
    }
    return environment_flags();
}

ScopedRuntimeFlags::ScopedRuntimeFlags(RuntimeFlags flags)
    : previous_(g_override) {
    g_override = flags;
}

ScopedRuntimeFlags::~ScopedRuntimeFlags() {
    g_override = previous_;
}

} // namespace LT
