#include <livetree/render/AttributeWrites.hpp>

#include <livetree/core/Error.hpp>

#include "log/TaggedLogger.hpp"

#include <format>

namespace LT::Render::detail {

auto write_str_attribute(Platform::Element& element, std::string_view name, std::string_view value) -> void {
    expect_ok(element.set_attribute(name, value), "Render::set_str_attribute");
}

auto write_bool_attribute(Platform::Element& element, std::string_view name, bool value) -> void {
    if (value) {
        expect_ok(element.set_attribute(name, ""), "Render::set_bool_attribute");
    } else {
        element.remove_attribute(name);
    }
}

auto write_i32_attribute(Platform::Element& element, std::string_view name, std::int32_t value) -> void {
    expect_ok(element.set_attribute(name, std::to_string(value)), "Render::set_i32_attribute");
}

auto write_u32_attribute(Platform::Element& element, std::string_view name, std::uint32_t value) -> void {
    expect_ok(element.set_attribute(name, std::to_string(value)), "Render::set_u32_attribute");
}

auto write_f64_attribute(Platform::Element& element, std::string_view name, double value) -> void {
    // Shortest text that reads back as the same double.
    expect_ok(element.set_attribute(name, std::format("{}", value)), "Render::set_f64_attribute");
}

auto write_class_toggle(Platform::Element& element, std::string_view class_name, bool on) -> void {
    if (on) {
        expect_ok(element.class_list_add(class_name), "Render::class_if");
    } else {
        expect_ok(element.class_list_remove(class_name), "Render::class_if");
    }
}

auto write_checked(Platform::Element& element, bool checked) -> void {
    auto result = element.set_checked(checked);
    if (!result) {
        lt_log(".checked() on <" + element.tag_name() + ">, which is not an <input>", "Reconciler", "WARN");
    }
}

auto write_value(Platform::Element& element, std::string_view value) -> std::optional<std::string> {
    auto const& tag = element.tag_name();
    if (tag == "select") {
        return std::string{value};
    }
    auto result = element.set_value(value);
    if (!result) {
        lt_log(".value() on <" + tag + ">, which is not an <input>, <select> or <textarea>", "Reconciler", "WARN");
    }
    return std::nullopt;
}

auto apply_select_value(Platform::Element& element, std::string const& value) -> void {
    expect_ok(element.set_value(value), "Render::select value");
}

auto trace_render(std::string const& message) -> void {
    lt_log(message, "Reconciler");
}

} // namespace LT::Render::detail
