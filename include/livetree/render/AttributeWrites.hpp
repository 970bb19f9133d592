#pragma once

#include <livetree/platform/LiveNode.hpp>

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

// Platform writes shared by every ElementRender instantiation. Called only
// after the attribute cache reported a change.
namespace LT::Render::detail {

auto write_str_attribute(Platform::Element& element, std::string_view name, std::string_view value) -> void;
// Presence toggle: "" when true, removed when false.
auto write_bool_attribute(Platform::Element& element, std::string_view name, bool value) -> void;
auto write_i32_attribute(Platform::Element& element, std::string_view name, std::int32_t value) -> void;
auto write_u32_attribute(Platform::Element& element, std::string_view name, std::uint32_t value) -> void;
auto write_f64_attribute(Platform::Element& element, std::string_view name, double value) -> void;
auto write_class_toggle(Platform::Element& element, std::string_view class_name, bool on) -> void;
auto write_checked(Platform::Element& element, bool checked) -> void;

// A <select> only accepts values of options it already has, so its value is
// returned for the caller to apply once the options are rendered.
[[nodiscard]] auto write_value(Platform::Element& element, std::string_view value) -> std::optional<std::string>;
auto apply_select_value(Platform::Element& element, std::string const& value) -> void;

auto trace_render(std::string const& message) -> void;

} // namespace LT::Render::detail
