#pragma once

#include <livetree/platform/LiveNode.hpp>

#include <cstddef>
#include <cstdint>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

namespace LT::Dom {

// A bound listener. The registration keeps the handler attached for as long
// as the slot holds it; an empty slot is what a clone inherits.
struct ListenerSlot {
    Platform::ListenerHandle registration;
};

using Attribute = std::variant<ListenerSlot, std::string, bool, std::int32_t, std::uint32_t, double>;

/**
 * Values applied to one element during the previous render, addressed by the
 * order in which the render function wrote them.
 *
 * Each check_* call consumes one position. It returns true when the platform
 * must be written: the position is new, or the stored value differs (and is
 * replaced). A record of another kind at the position throws
 * ContractViolation.
 */
class AttributeList {
public:
    [[nodiscard]] auto check_bool(std::size_t index, bool value) -> bool;
    [[nodiscard]] auto check_str(std::size_t index, std::string_view value) -> bool;
    [[nodiscard]] auto check_i32(std::size_t index, std::int32_t value) -> bool;
    [[nodiscard]] auto check_u32(std::size_t index, std::uint32_t value) -> bool;
    [[nodiscard]] auto check_f64(std::size_t index, double value) -> bool;

    auto store_listener(std::size_t index, Platform::ListenerHandle registration) -> void;

    [[nodiscard]] auto clone_without_listeners() const -> AttributeList;

    [[nodiscard]] auto size() const -> std::size_t { return records_.size(); }
    [[nodiscard]] auto empty() const -> bool { return records_.empty(); }
    [[nodiscard]] auto at(std::size_t index) const -> Attribute const& { return records_.at(index); }
    [[nodiscard]] auto bound_listener_count() const -> std::size_t;

    auto clear() -> void { records_.clear(); }

private:
    template <typename T, typename Stored, typename Equal>
    auto check(std::size_t index, T value, Equal equal, char const* kind) -> bool;

    std::vector<Attribute> records_;
};

} // namespace LT::Dom
