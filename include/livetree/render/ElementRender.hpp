#pragma once

#include <livetree/core/Error.hpp>
#include <livetree/dom/ElementStatus.hpp>
#include <livetree/dom/KeyedList.hpp>
#include <livetree/dom/Nodes.hpp>
#include <livetree/render/AttributeWrites.hpp>

#include <cstddef>
#include <cstdint>
#include <format>
#include <optional>
#include <string>
#include <string_view>

namespace LT {
template <typename C>
class Comp;
template <typename C>
class RcComp;
template <typename C>
class ComponentHandle;
} // namespace LT

namespace LT::Render {

// Whether list items after the first may be cloned from it.
enum class ListElementCreation {
    Clone,
    New,
};

template <typename C>
class NodesRender;

/**
 * Writes one element during a render pass.
 *
 * Every attribute writer and listener consumes the next position of the
 * element's attribute cache, so a render function must call them in the same
 * order on every pass. In static mode (static_attributes()) writers apply only
 * to a JustCreated element and leave the cache alone.
 */
template <typename C>
class ElementRender {
public:
    ElementRender(Comp<C> const& comp, C const& state, Dom::Element& element, Dom::ElementStatus status)
        : comp_(comp), state_(state), element_(element), status_(status) {}

    // Applies a select value still waiting for its options.
    ~ElementRender() { finish_select_value(); }

    ElementRender(ElementRender const&)            = delete;
    ElementRender& operator=(ElementRender const&) = delete;

    [[nodiscard]] auto status() const -> Dom::ElementStatus { return status_; }
    [[nodiscard]] auto state() const -> C const& { return state_; }
    [[nodiscard]] auto comp() const -> Comp<C> const& { return comp_; }
    [[nodiscard]] auto element() -> Dom::Element& { return element_; }
    [[nodiscard]] auto live() const -> Platform::Element& { return *element_.live(); }

    auto static_attributes() -> ElementRender& {
        static_mode_ = true;
        return *this;
    }
    auto update_attributes() -> ElementRender& {
        static_mode_ = false;
        return *this;
    }

    auto set_str_attribute(std::string_view name, std::string_view value) -> ElementRender& {
        if (check_str(value)) {
            detail::write_str_attribute(live(), name, value);
        }
        return *this;
    }
    auto set_bool_attribute(std::string_view name, bool value) -> ElementRender& {
        if (check_bool(value)) {
            detail::write_bool_attribute(live(), name, value);
        }
        return *this;
    }
    auto set_i32_attribute(std::string_view name, std::int32_t value) -> ElementRender& {
        if (check_i32(value)) {
            detail::write_i32_attribute(live(), name, value);
        }
        return *this;
    }
    auto set_u32_attribute(std::string_view name, std::uint32_t value) -> ElementRender& {
        if (check_u32(value)) {
            detail::write_u32_attribute(live(), name, value);
        }
        return *this;
    }
    auto set_f64_attribute(std::string_view name, double value) -> ElementRender& {
        if (check_f64(value)) {
            detail::write_f64_attribute(live(), name, value);
        }
        return *this;
    }

    auto class_name(std::string_view value) -> ElementRender& { return set_str_attribute("class", value); }
    auto id(std::string_view value) -> ElementRender& { return set_str_attribute("id", value); }
    auto href_str(std::string_view value) -> ElementRender& { return set_str_attribute("href", value); }

    auto class_if(std::string_view class_name, bool on) -> ElementRender& {
        if (check_bool(on)) {
            detail::write_class_toggle(live(), class_name, on);
        }
        return *this;
    }

    // Input property; other elements log a warning.
    auto checked(bool value) -> ElementRender& {
        if (check_bool(value)) {
            detail::write_checked(live(), value);
        }
        return *this;
    }

    // A <select> value is held back until the element's list has rendered
    // its options.
    auto value(std::string_view value) -> ElementRender& {
        if (check_str(value)) {
            if (auto deferred = detail::write_value(live(), value)) {
                select_value_ = std::move(deferred);
            }
        }
        return *this;
    }

    auto focus(bool value) -> ElementRender& {
        if (value) {
            live().focus();
        }
        return *this;
    }

    // Bound for new and cloned elements only. An Existing element keeps the
    // registration from the pass that created it.
    auto on(std::string_view type, Platform::EventHandler handler) -> ElementRender& {
        if (status_ == Dom::ElementStatus::Existing) {
            ++index_;
            return *this;
        }
        auto registration = live().add_event_listener(std::string{type}, std::move(handler));
        element_.attributes().store_listener(index_++, std::move(registration));
        return *this;
    }
    auto on_click(Platform::EventHandler handler) -> ElementRender& { return on("click", std::move(handler)); }
    auto on_input(Platform::EventHandler handler) -> ElementRender& { return on("input", std::move(handler)); }
    auto on_change(Platform::EventHandler handler) -> ElementRender& { return on("change", std::move(handler)); }

    [[nodiscard]] auto nodes() -> NodesRender<C>;
    [[nodiscard]] auto static_nodes() -> NodesRender<C>;

    // Shorthands for an element whose only child is one text node.
    auto update_text(std::string_view text) -> void;
    auto static_text(std::string_view text) -> void;

    // Children of this element, one `tag` element per item. `fn` is called as
    // fn(item, ElementRender<C>&).
    template <typename Items, typename Fn>
    auto list(Items const& items, std::string_view tag, Fn&& fn, ListElementCreation mode = ListElementCreation::Clone) -> void;

    // As list(), matched by `key_fn(item)` instead of position.
    template <typename Items, typename KeyFn, typename Fn>
    auto keyed_list(Items const&         items,
                    std::string_view     tag,
                    KeyFn&&              key_fn,
                    Fn&&                 fn,
                    ListElementCreation mode = ListElementCreation::Clone) -> void;

    // Mounts `child` into this element when the element is new or the child
    // is not mounted.
    template <typename CC>
    auto component(RcComp<CC> const& child) -> void;

private:
    [[nodiscard]] auto check_bool(bool value) -> bool {
        return static_mode_ ? status_ == Dom::ElementStatus::JustCreated : element_.attributes().check_bool(index_++, value);
    }
    [[nodiscard]] auto check_str(std::string_view value) -> bool {
        return static_mode_ ? status_ == Dom::ElementStatus::JustCreated : element_.attributes().check_str(index_++, value);
    }
    [[nodiscard]] auto check_i32(std::int32_t value) -> bool {
        return static_mode_ ? status_ == Dom::ElementStatus::JustCreated : element_.attributes().check_i32(index_++, value);
    }
    [[nodiscard]] auto check_u32(std::uint32_t value) -> bool {
        return static_mode_ ? status_ == Dom::ElementStatus::JustCreated : element_.attributes().check_u32(index_++, value);
    }
    [[nodiscard]] auto check_f64(double value) -> bool {
        return static_mode_ ? status_ == Dom::ElementStatus::JustCreated : element_.attributes().check_f64(index_++, value);
    }

    // An element's children come from one of nodes(), list(), keyed_list()
    // or component(), called once per render.
    auto take_content(std::string_view what) -> void {
        if (content_taken_) {
            contract_violation(std::format("ElementRender::{}: children of <{}> already rendered", what, live().tag_name()));
        }
        content_taken_ = true;
    }

    auto finish_select_value() -> void {
        if (select_value_) {
            detail::apply_select_value(live(), *select_value_);
            select_value_.reset();
        }
    }

    Comp<C> const&             comp_;
    C const&                   state_;
    Dom::Element&              element_;
    Dom::ElementStatus         status_;
    std::size_t                index_         = 0;
    bool                       static_mode_   = false;
    bool                       content_taken_ = false;
    std::optional<std::string> select_value_;
};

} // namespace LT::Render
