#pragma once

#include <livetree/core/Error.hpp>
#include <livetree/core/RuntimeFlags.hpp>
#include <livetree/dom/KeyedList.hpp>
#include <livetree/dom/Nodes.hpp>
#include <livetree/platform/Document.hpp>
#include <livetree/render/ElementRender.hpp>

#include <cstddef>
#include <iterator>
#include <optional>
#include <string>
#include <string_view>

namespace LT::Render {

namespace detail {

inline auto document_of(Platform::Node const& parent) -> Platform::Document& {
    auto const& document = parent.owner_document();
    if (!document) {
        contract_violation("list parent has no owner document");
    }
    return *document;
}

} // namespace detail

/**
 * Positional list: item n always renders into element n. Surplus elements from
 * a longer previous pass are removed.
 */
template <typename C>
class ListRender {
public:
    ListRender(Comp<C> const&      comp,
               C const&            state,
               Dom::Nodes&         items,
               Platform::Node&     parent,
               Platform::NodePtr   next_sibling,
               std::string_view    tag,
               ListElementCreation mode)
        : comp_(comp), state_(state), items_(items), parent_(parent), next_sibling_(std::move(next_sibling)), tag_(tag), mode_(mode) {}

    template <typename Items, typename Fn>
    auto render(Items const& items, Fn& fn) -> void {
        std::size_t index = 0;
        for (auto const& item : items) {
            auto status = items_.check_or_create_element_for_list(tag_, std::nullopt, index, parent_, next_sibling_,
                                                                  mode_ == ListElementCreation::Clone);
            {
                ElementRender<C> element{comp_, state_, items_.element_at(index), status};
                fn(item, element);
            }
            ++index;
        }
        auto const previous = items_.count();
        items_.clear_after(index, parent_);
        if (previous > index) {
            detail::trace_render("list <" + std::string{tag_} + "> dropped " + std::to_string(previous - index) + " items");
        }
    }

private:
    Comp<C> const&      comp_;
    C const&            state_;
    Dom::Nodes&         items_;
    Platform::Node&     parent_;
    Platform::NodePtr   next_sibling_;
    std::string_view    tag_;
    ListElementCreation mode_;
};

/**
 * Keyed list: an item keeps its element for as long as its key keeps coming
 * back, wherever the item moves.
 *
 * Elements are matched first, then unmatched ones are removed, and finally
 * the live order is fixed up walking backwards from `end_anchor`. Only
 * elements that are detached or sit in front of the wrong sibling are moved.
 */
template <typename C>
class KeyedListRender {
public:
    KeyedListRender(Comp<C> const&      comp,
                    C const&            state,
                    Dom::KeyedList&     list,
                    Platform::Node&     parent,
                    Platform::NodePtr   end_anchor,
                    std::string_view    tag,
                    ListElementCreation mode)
        : comp_(comp), state_(state), list_(list), parent_(parent), end_anchor_(std::move(end_anchor)), tag_(tag), mode_(mode) {}

    template <typename Items, typename KeyFn, typename Fn>
    auto render(Items const& items, KeyFn& key_fn, Fn& fn) -> void {
        auto const count = static_cast<std::size_t>(std::size(items));
        list_.pre_update(count);
        list_.build_old_elements_map(parent_);

        std::size_t index   = 0;
        std::size_t created = 0;
        for (auto const& item : items) {
            Dom::KeyValue key{key_fn(item)};
            auto          status = Dom::ElementStatus::Existing;
            auto          old    = list_.take_old_element(key);
            if (!old) {
                old.emplace(create_item(item, fn, status));
                ++created;
            }
            list_.set_active(index, Dom::KeyedElement{std::move(key), std::move(*old)});
            {
                ElementRender<C> element{comp_, state_, list_.element_at(index), status};
                fn(item, element);
            }
            ++index;
        }

        auto const removed = list_.remove_unused(parent_);
        auto const moved   = place(count);
        detail::trace_render("keyed list <" + std::string{tag_} + ">: " + std::to_string(count) + " items, "
                             + std::to_string(created) + " new, " + std::to_string(removed) + " removed, "
                             + std::to_string(moved) + " inserted");
    }

private:
    template <typename Item, typename Fn>
    auto create_item(Item const& item, Fn& fn, Dom::ElementStatus& status) -> Dom::Element {
        auto& document = detail::document_of(parent_);
        if (mode_ == ListElementCreation::Clone && CurrentRuntimeFlags().template_cloning) {
            auto const first_use = list_.require_init_template(
                    [&] { return Dom::Element::create(document, std::nullopt, tag_); });
            if (first_use) {
                {
                    ElementRender<C> prototype{comp_, state_, list_.template_element(), Dom::ElementStatus::JustCreated};
                    fn(item, prototype);
                }
                list_.mark_template_rendered();
            }
            status = Dom::ElementStatus::JustCloned;
            return list_.template_element().clone();
        }
        status = Dom::ElementStatus::JustCreated;
        return Dom::Element::create(document, std::nullopt, tag_);
    }

    auto place(std::size_t count) -> std::size_t {
        std::size_t       moved  = 0;
        Platform::NodePtr anchor = end_anchor_;
        for (auto index = count; index-- > 0;) {
            auto const& element = list_.element_at(index);
            auto const& live    = element.live();
            if (live->parent().get() != &parent_ || live->next_sibling() != anchor) {
                element.insert_before(parent_, anchor);
                ++moved;
            }
            anchor = live;
        }
        return moved;
    }

    Comp<C> const&      comp_;
    C const&            state_;
    Dom::KeyedList&     list_;
    Platform::Node&     parent_;
    Platform::NodePtr   end_anchor_;
    std::string_view    tag_;
    ListElementCreation mode_;
};

} // namespace LT::Render
