#include <livetree/dom/KeyedList.hpp>

#include "log/TaggedLogger.hpp"

#include <algorithm>
#include <cctype>

namespace LT::Dom {

namespace {

constexpr std::array<std::size_t, 4> kUuidDashes{8, 13, 18, 23};

auto hex_value(char ch) -> int {
    if (ch >= '0' && ch <= '9') {
        return ch - '0';
    }
    auto lower = static_cast<char>(std::tolower(static_cast<unsigned char>(ch)));
    if (lower >= 'a' && lower <= 'f') {
        return lower - 'a' + 10;
    }
    return -1;
}

auto mix(std::size_t seed, std::size_t value) -> std::size_t {
    return seed ^ (value + 0x9e3779b97f4a7c15ULL + (seed << 6) + (seed >> 2));
}

} // namespace

// Uuid -----------------------------------------------------------------------

auto Uuid::parse(std::string_view text) -> Expected<Uuid> {
    if (text.size() != 36) {
        return std::unexpected(Error{Error::Code::MalformedInput, "uuid must be 36 characters"});
    }
    Uuid        uuid;
    std::size_t byte = 0;
    for (std::size_t i = 0; i < text.size();) {
        if (std::find(kUuidDashes.begin(), kUuidDashes.end(), i) != kUuidDashes.end()) {
            if (text[i] != '-') {
                return std::unexpected(Error{Error::Code::MalformedInput, "uuid groups must be separated by '-'"});
            }
            ++i;
            continue;
        }
        auto high = hex_value(text[i]);
        auto low  = hex_value(text[i + 1]);
        if (high < 0 || low < 0) {
            return std::unexpected(Error{Error::Code::MalformedInput, "uuid contains a non-hex digit"});
        }
        uuid.bytes[byte++] = static_cast<std::uint8_t>((high << 4) | low);
        i += 2;
    }
    return uuid;
}

auto Uuid::to_string() const -> std::string {
    static constexpr char kDigits[] = "0123456789abcdef";
    std::string           text;
    text.reserve(36);
    for (std::size_t i = 0; i < bytes.size(); ++i) {
        if (i == 4 || i == 6 || i == 8 || i == 10) {
            text.push_back('-');
        }
        text.push_back(kDigits[bytes[i] >> 4]);
        text.push_back(kDigits[bytes[i] & 0x0F]);
    }
    return text;
}

// KeyValue -------------------------------------------------------------------

auto KeyValue::to_string() const -> std::string {
    return std::visit(
            [](auto const& value) -> std::string {
                using T = std::decay_t<decltype(value)>;
                if constexpr (std::is_same_v<T, std::string>) {
                    return "\"" + value + "\"";
                } else if constexpr (std::is_same_v<T, Uuid>) {
                    return value.to_string();
                } else {
                    return std::to_string(value);
                }
            },
            value_);
}

auto KeyValueHash::operator()(KeyValue const& key) const -> std::size_t {
    auto const& value = key.value();
    auto        hash  = std::visit(
            [](auto const& alternative) -> std::size_t {
                using T = std::decay_t<decltype(alternative)>;
                if constexpr (std::is_same_v<T, Uuid>) {
                    std::size_t seed = 0;
                    for (auto byte : alternative.bytes) {
                        seed = mix(seed, byte);
                    }
                    return seed;
                } else {
                    return std::hash<T>{}(alternative);
                }
            },
            value);
    return mix(hash, value.index());
}

// KeyedList ------------------------------------------------------------------

KeyedList::KeyedList()  = default;
KeyedList::~KeyedList() = default;

auto KeyedList::pre_update(std::size_t count) -> void {
    old_elements_map_.reserve(count);
    buffer_.clear();
    buffer_.resize(count);
    std::swap(active_, buffer_);
}

auto KeyedList::build_old_elements_map(Platform::Node& parent) -> void {
    for (auto& slot : buffer_) {
        if (!slot) {
            continue;
        }
        if (old_elements_map_.find(slot->key) != old_elements_map_.end()) {
            lt_log("duplicate key " + slot->key.to_string() + " in keyed list, dropping the later element", "KeyedList", "WARN");
            slot->element.remove_from(parent);
        } else {
            old_elements_map_.emplace(slot->key, std::move(slot->element));
        }
        slot.reset();
    }
    buffer_.clear();
}

auto KeyedList::take_old_element(KeyValue const& key) -> std::optional<Element> {
    auto it = old_elements_map_.find(key);
    if (it == old_elements_map_.end()) {
        return std::nullopt;
    }
    std::optional<Element> element{std::move(it->second)};
    old_elements_map_.erase(it);
    return element;
}

auto KeyedList::require_init_template(std::function<Element()> const& make) -> bool {
    if (!template_) {
        template_.emplace(ListItemTemplate{false, make()});
        return true;
    }
    return !template_->rendered;
}

auto KeyedList::template_element() -> Element& {
    if (!template_) {
        contract_violation("keyed list has no template element");
    }
    return template_->element;
}

auto KeyedList::mark_template_rendered() -> void {
    if (template_) {
        template_->rendered = true;
    }
}

auto KeyedList::set_active(std::size_t index, KeyedElement item) -> void {
    if (index >= active_.size()) {
        contract_violation("keyed list item " + std::to_string(index) + " is beyond the announced count "
                           + std::to_string(active_.size()));
    }
    active_[index].emplace(std::move(item));
}

auto KeyedList::key_at(std::size_t index) const -> KeyValue const& {
    if (index >= active_.size() || !active_[index]) {
        contract_violation("keyed list has no item at " + std::to_string(index));
    }
    return active_[index]->key;
}

auto KeyedList::element_at(std::size_t index) -> Element& {
    if (index >= active_.size() || !active_[index]) {
        contract_violation("keyed list has no item at " + std::to_string(index));
    }
    return active_[index]->element;
}

auto KeyedList::element_at(std::size_t index) const -> Element const& {
    if (index >= active_.size() || !active_[index]) {
        contract_violation("keyed list has no item at " + std::to_string(index));
    }
    return active_[index]->element;
}

auto KeyedList::remove_unused(Platform::Node& parent) -> std::size_t {
    auto const removed = old_elements_map_.size();
    for (auto& entry : old_elements_map_) {
        entry.second.remove_from(parent);
    }
    old_elements_map_.clear();
    return removed;
}

auto KeyedList::remove_from_dom(Platform::Node& parent) -> void {
    for (auto& slot : active_) {
        if (slot) {
            slot->element.remove_from(parent);
        }
    }
    active_.clear();
    buffer_.clear();
}

auto KeyedList::append_to(Platform::Node& parent) const -> void {
    for (auto const& slot : active_) {
        if (slot) {
            slot->element.append_to(parent);
        }
    }
}

} // namespace LT::Dom
