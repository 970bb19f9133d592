#include <livetree/dom/AttributeList.hpp>

#include <livetree/core/Error.hpp>

#include <cfloat>
#include <cmath>

namespace LT::Dom {

template <typename T, typename Stored, typename Equal>
auto AttributeList::check(std::size_t index, T value, Equal equal, char const* kind) -> bool {
    if (index >= records_.size()) {
        records_.emplace_back(std::in_place_type<Stored>, value);
        return true;
    }
    auto* stored = std::get_if<Stored>(&records_[index]);
    if (stored == nullptr) {
        contract_violation("attribute slot " + std::to_string(index) + " does not hold a " + kind
                           + " record; the render function is not positionally stable");
    }
    if (equal(*stored, value)) {
        return false;
    }
    *stored = Stored(value);
    return true;
}

auto AttributeList::check_bool(std::size_t index, bool value) -> bool {
    return check<bool, bool>(index, value, [](bool a, bool b) { return a == b; }, "bool");
}

auto AttributeList::check_str(std::size_t index, std::string_view value) -> bool {
    return check<std::string_view, std::string>(
            index, value, [](std::string const& a, std::string_view b) { return a == b; }, "string");
}

auto AttributeList::check_i32(std::size_t index, std::int32_t value) -> bool {
    return check<std::int32_t, std::int32_t>(index, value, [](std::int32_t a, std::int32_t b) { return a == b; }, "i32");
}

auto AttributeList::check_u32(std::size_t index, std::uint32_t value) -> bool {
    return check<std::uint32_t, std::uint32_t>(index, value, [](std::uint32_t a, std::uint32_t b) { return a == b; }, "u32");
}

auto AttributeList::check_f64(std::size_t index, double value) -> bool {
    return check<double, double>(index, value, [](double a, double b) { return std::fabs(a - b) < DBL_EPSILON; }, "f64");
}

auto AttributeList::store_listener(std::size_t index, Platform::ListenerHandle registration) -> void {
    if (index < records_.size()) {
        records_[index] = ListenerSlot{std::move(registration)};
    } else {
        records_.emplace_back(ListenerSlot{std::move(registration)});
    }
}

auto AttributeList::clone_without_listeners() const -> AttributeList {
    AttributeList copy;
    copy.records_.reserve(records_.size());
    for (auto const& record : records_) {
        if (std::holds_alternative<ListenerSlot>(record)) {
            copy.records_.emplace_back(ListenerSlot{});
        } else {
            copy.records_.push_back(record);
        }
    }
    return copy;
}

auto AttributeList::bound_listener_count() const -> std::size_t {
    std::size_t count = 0;
    for (auto const& record : records_) {
        if (auto const* slot = std::get_if<ListenerSlot>(&record); slot != nullptr && slot->registration) {
            ++count;
        }
    }
    return count;
}

} // namespace LT::Dom
