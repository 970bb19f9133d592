#pragma once

#include <livetree/core/Error.hpp>
#include <livetree/dom/Nodes.hpp>

#include <parallel_hashmap/phmap.h>

#include <array>
#include <concepts>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <optional>
#include <string>
#include <string_view>
#include <type_traits>
#include <variant>
#include <vector>

namespace LT::Dom {

struct Uuid {
    std::array<std::uint8_t, 16> bytes{};

    // Canonical 8-4-4-4-12 hex form, either case.
    [[nodiscard]] static auto parse(std::string_view text) -> Expected<Uuid>;
    [[nodiscard]] auto to_string() const -> std::string;

    auto operator<=>(Uuid const&) const = default;
};

/**
 * Identity of a keyed list item. Keys of different alternatives never compare
 * equal, so an item keyed by the string "1" and one keyed by the integer 1 are
 * distinct. Integral keys map onto the alternative of matching signedness and
 * width; pointer-sized integers use the 64-bit alternatives.
 */
class KeyValue {
public:
    using Value = std::variant<std::string, std::int32_t, std::uint32_t, std::int64_t, std::uint64_t, Uuid>;

    KeyValue(std::string value)
        : value_(std::move(value)) {}
    KeyValue(std::string_view value)
        : value_(std::string{value}) {}
    KeyValue(char const* value)
        : value_(std::string{value}) {}
    KeyValue(Uuid value)
        : value_(value) {}

    template <std::integral T>
        requires(!std::is_same_v<T, bool>)
    KeyValue(T value)
        : value_(map_integral(value)) {}

    [[nodiscard]] auto value() const -> Value const& { return value_; }
    [[nodiscard]] auto to_string() const -> std::string;

    auto operator==(KeyValue const&) const -> bool = default;

private:
    template <std::integral T>
    static auto map_integral(T value) -> Value {
        if constexpr (std::is_signed_v<T>) {
            if constexpr (sizeof(T) <= sizeof(std::int32_t)) {
                return static_cast<std::int32_t>(value);
            } else {
                return static_cast<std::int64_t>(value);
            }
        } else {
            if constexpr (sizeof(T) <= sizeof(std::uint32_t)) {
                return static_cast<std::uint32_t>(value);
            } else {
                return static_cast<std::uint64_t>(value);
            }
        }
    }

    Value value_;
};

struct KeyValueHash {
    [[nodiscard]] auto operator()(KeyValue const& key) const -> std::size_t;
};

struct KeyedElement {
    KeyValue key;
    Element  element;
};

// Prototype that new items are cloned from. It is rendered once, with the
// first item that needed it, and never inserted into the live tree.
struct ListItemTemplate {
    bool    rendered = false;
    Element element;
};

/**
 * Double-buffered keyed children of one parent.
 *
 * A render pass calls pre_update(n) with the new item count, then
 * build_old_elements_map(), then fills active slots 0..n-1 from
 * take_old_element() or fresh elements, and finally remove_unused() for the
 * keys that did not come back. Placement of the live nodes is the caller's.
 */
class KeyedList {
public:
    KeyedList();
    ~KeyedList();

    KeyedList(KeyedList const&)            = delete;
    KeyedList& operator=(KeyedList const&) = delete;

    // Afterwards active() has exactly `count` empty slots and the previous
    // items wait in the buffer.
    auto pre_update(std::size_t count) -> void;

    // Drains the buffer into the key lookup table. When the previous pass
    // produced the same key twice, the later element is removed from `parent`.
    auto build_old_elements_map(Platform::Node& parent) -> void;

    [[nodiscard]] auto take_old_element(KeyValue const& key) -> std::optional<Element>;
    [[nodiscard]] auto old_element_count() const -> std::size_t { return old_elements_map_.size(); }

    // Creates the template with `make` when missing. Returns true while the
    // template has not been rendered yet.
    auto require_init_template(std::function<Element()> const& make) -> bool;
    [[nodiscard]] auto template_element() -> Element&;
    auto mark_template_rendered() -> void;
    [[nodiscard]] auto has_template() const -> bool { return template_.has_value(); }

    auto set_active(std::size_t index, KeyedElement item) -> void;
    [[nodiscard]] auto active_count() const -> std::size_t { return active_.size(); }
    [[nodiscard]] auto key_at(std::size_t index) const -> KeyValue const&;
    [[nodiscard]] auto element_at(std::size_t index) -> Element&;
    [[nodiscard]] auto element_at(std::size_t index) const -> Element const&;

    // Removes from `parent` every element whose key did not come back.
    auto remove_unused(Platform::Node& parent) -> std::size_t;

    auto remove_from_dom(Platform::Node& parent) -> void;
    auto append_to(Platform::Node& parent) const -> void;

private:
    std::vector<std::optional<KeyedElement>>                  active_;
    std::vector<std::optional<KeyedElement>>                  buffer_;
    std::optional<ListItemTemplate>                           template_;
    phmap::flat_hash_map<KeyValue, Element, KeyValueHash>    old_elements_map_;
};

} // namespace LT::Dom
