#pragma once
#include <expected>
#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>

namespace LT {

struct Error {
    enum class Code {
        InvalidError = 0,
        UnknownError,
        NotFound,
        InvalidHierarchy,
        InvalidNodeKind,
        InvalidArgument,
        MalformedInput,
        NotSupported
    };

    Error(Code c, std::string m)
        : code(c), message(std::move(m)) {}

    Code                       code;
    std::optional<std::string> message;
};

template <typename T>
using Expected = std::expected<T, Error>;

// Raised when a render function is not positionally stable, or the component
// graph is accessed in a way the update protocol forbids. Aborts the render cycle.
class ContractViolation : public std::logic_error {
public:
    explicit ContractViolation(std::string const& what)
        : std::logic_error(what) {}
};

[[noreturn]] inline auto contract_violation(std::string_view what) -> void {
    throw ContractViolation(std::string{what});
}

[[nodiscard]] inline auto errorCodeToString(Error::Code code) -> std::string_view {
    switch (code) {
    case Error::Code::InvalidError:
        return "invalid_error";
    case Error::Code::UnknownError:
        return "unknown_error";
    case Error::Code::NotFound:
        return "not_found";
    case Error::Code::InvalidHierarchy:
        return "invalid_hierarchy";
    case Error::Code::InvalidNodeKind:
        return "invalid_node_kind";
    case Error::Code::InvalidArgument:
        return "invalid_argument";
    case Error::Code::MalformedInput:
        return "malformed_input";
    case Error::Code::NotSupported:
        return "not_supported";
    }
    return "unknown_error";
}

[[nodiscard]] inline auto describeError(Error const& error) -> std::string {
    auto const label = errorCodeToString(error.code);
    if (error.message && !error.message->empty()) {
        std::string description;
        description.reserve(label.size() + 1 + error.message->size());
        description.append(label.data(), label.size());
        description.push_back(':');
        description.append(error.message->data(), error.message->size());
        return description;
    }
    return std::string{label};
}

// Platform writes performed by the reconciler are not expected to fail; a
// failure means the tree no longer matches the slot structure.
inline auto expect_ok(Expected<void> const& result, std::string_view context) -> void {
    if (!result) {
        std::string what{context};
        what.append(": ");
        what.append(describeError(result.error()));
        throw ContractViolation(what);
    }
}

} // namespace LT
