#pragma once

#include <livetree/render/ElementRender.hpp>

#include <cstddef>
#include <cstdint>
#include <format>
#include <optional>
#include <string>
#include <string_view>
#include <type_traits>

namespace LT::Render {

template <typename C>
class MatchIfRender;

/**
 * Visits the children of one parent in render order. Each call addresses the
 * next position of the parent's node store.
 *
 * In static mode elements, match-ifs and lists are rendered only while the
 * parent is JustCreated; otherwise they are skipped but keep their position.
 */
template <typename C>
class NodesRender {
public:
    NodesRender(Comp<C> const&     comp,
                C const&           state,
                Dom::Nodes&        nodes,
                Dom::ElementStatus parent_status,
                Platform::Node&    parent,
                Platform::NodePtr  next_sibling)
        : comp_(comp),
          state_(state),
          nodes_(nodes),
          parent_status_(parent_status),
          parent_(parent),
          next_sibling_(std::move(next_sibling)) {}

    [[nodiscard]] auto state() const -> C const& { return state_; }
    [[nodiscard]] auto comp() const -> Comp<C> const& { return comp_; }
    [[nodiscard]] auto parent() const -> Platform::Node& { return parent_; }
    [[nodiscard]] auto index() const -> std::size_t { return index_; }
    [[nodiscard]] auto parent_status() const -> Dom::ElementStatus { return parent_status_; }

    auto set_static_mode() -> NodesRender& {
        update_mode_ = false;
        return *this;
    }
    auto set_update_mode() -> NodesRender& {
        update_mode_ = true;
        return *this;
    }

    auto update_text(std::string_view text) -> NodesRender& {
        nodes_.update_text(index_++, text, parent_, next_sibling_);
        return *this;
    }

    // Written when the node is created, never compared afterwards.
    auto static_text(std::string_view text) -> NodesRender& {
        nodes_.static_text(index_++, text, parent_, next_sibling_);
        return *this;
    }

    template <typename N>
        requires(std::is_arithmetic_v<N> && !std::is_same_v<N, bool>)
    auto text(N value) -> NodesRender& {
        return update_text(std::format("{}", value));
    }

    template <typename Fn>
    auto element(std::string_view tag, Fn&& fn) -> NodesRender& {
        return render_element(std::nullopt, tag, fn);
    }

    template <typename Fn>
    auto element_ns(std::string_view namespace_uri, std::string_view tag, Fn&& fn) -> NodesRender& {
        return render_element(namespace_uri, tag, fn);
    }

    // `fn` receives a MatchIfRender<C> and picks one arm with
    // render_on_arm_index().
    template <typename Fn>
    auto match_if(Fn&& fn) -> NodesRender&;

    template <typename Items, typename Fn>
    auto list(Items const& items, std::string_view tag, Fn&& fn, ListElementCreation mode = ListElementCreation::Clone)
            -> NodesRender&;

    template <typename Items, typename KeyFn, typename Fn>
    auto keyed_list(Items const&         items,
                    std::string_view     tag,
                    KeyFn&&              key_fn,
                    Fn&&                 fn,
                    ListElementCreation mode = ListElementCreation::Clone) -> NodesRender&;

private:
    [[nodiscard]] auto require_render() const -> bool {
        return update_mode_ || parent_status_ == Dom::ElementStatus::JustCreated;
    }

    template <typename Fn>
    auto render_element(std::optional<std::string_view> namespace_uri, std::string_view tag, Fn& fn) -> NodesRender& {
        if (!require_render()) {
            ++index_;
            return *this;
        }
        auto status = nodes_.check_or_create_element(tag, namespace_uri, index_, parent_status_, parent_, next_sibling_);
        {
            ElementRender<C> element{comp_, state_, nodes_.element_at(index_), status};
            fn(element);
        }
        ++index_;
        return *this;
    }

    Comp<C> const&     comp_;
    C const&           state_;
    Dom::Nodes&        nodes_;
    Dom::ElementStatus parent_status_;
    Platform::Node&    parent_;
    Platform::NodePtr  next_sibling_;
    std::size_t        index_       = 0;
    bool               update_mode_ = true;
};

// One grouped node list whose content is one of several arms. Switching arms
// drops the previous arm's nodes.
template <typename C>
class MatchIfRender {
public:
    MatchIfRender(Comp<C> const& comp, C const& state, Dom::GroupedNodes& group, Platform::Node& parent)
        : comp_(comp), state_(state), group_(group), parent_(parent) {}

    [[nodiscard]] auto state() const -> C const& { return state_; }
    [[nodiscard]] auto comp() const -> Comp<C> const& { return comp_; }

    [[nodiscard]] auto render_on_arm_index(std::uint32_t index) -> NodesRender<C> {
        auto status = group_.set_active_index(index, parent_);
        return NodesRender<C>{comp_, state_, group_.nodes(), status, parent_, group_.end_marker()};
    }

private:
    Comp<C> const&     comp_;
    C const&           state_;
    Dom::GroupedNodes& group_;
    Platform::Node&    parent_;
};

} // namespace LT::Render
