// Members of ElementRender and NodesRender that need the whole render layer.
// Included from Render.hpp only.

namespace LT::Render {

// ElementRender ---------------------------------------------------------------

template <typename C>
auto ElementRender<C>::nodes() -> NodesRender<C> {
    take_content("nodes");
    return NodesRender<C>{comp_, state_, element_.nodes(), status_, live(), nullptr};
}

template <typename C>
auto ElementRender<C>::static_nodes() -> NodesRender<C> {
    auto render = nodes();
    render.set_static_mode();
    return render;
}

template <typename C>
auto ElementRender<C>::update_text(std::string_view text) -> void {
    nodes().update_text(text);
}

template <typename C>
auto ElementRender<C>::static_text(std::string_view text) -> void {
    nodes().static_text(text);
}

template <typename C>
template <typename Items, typename Fn>
auto ElementRender<C>::list(Items const& items, std::string_view tag, Fn&& fn, ListElementCreation mode) -> void {
    take_content("list");
    ListRender<C>{comp_, state_, element_.nodes(), live(), nullptr, tag, mode}.render(items, fn);
    finish_select_value();
}

template <typename C>
template <typename Items, typename KeyFn, typename Fn>
auto ElementRender<C>::keyed_list(Items const&         items,
                                  std::string_view     tag,
                                  KeyFn&&              key_fn,
                                  Fn&&                 fn,
                                  ListElementCreation mode) -> void {
    take_content("keyed_list");
    KeyedListRender<C>{comp_, state_, element_.keyed_list(), live(), nullptr, tag, mode}.render(items, key_fn, fn);
    finish_select_value();
}

template <typename C>
template <typename CC>
auto ElementRender<C>::component(RcComp<CC> const& child) -> void {
    take_content("component");
    if (status_ != Dom::ElementStatus::JustCreated && child.is_mounted()) {
        return;
    }
    // A handle already in the slot marks its child unmounted when replaced, so
    // it goes before the mount.
    element_.nodes().store_component_handle(std::make_unique<ComponentHandle<CC>>(child.comp()));
    child.mount_to(element_.live());
}

// NodesRender -----------------------------------------------------------------

template <typename C>
template <typename Fn>
auto NodesRender<C>::match_if(Fn&& fn) -> NodesRender& {
    if (!require_render()) {
        ++index_;
        return *this;
    }
    auto&            group = nodes_.grouped_nodes(index_, parent_, next_sibling_);
    MatchIfRender<C> arms{comp_, state_, group, parent_};
    fn(arms);
    ++index_;
    return *this;
}

template <typename C>
template <typename Items, typename Fn>
auto NodesRender<C>::list(Items const& items, std::string_view tag, Fn&& fn, ListElementCreation mode) -> NodesRender& {
    if (!require_render()) {
        ++index_;
        return *this;
    }
    auto& group = nodes_.grouped_nodes(index_, parent_, next_sibling_);
    ListRender<C>{comp_, state_, group.nodes(), parent_, group.end_marker(), tag, mode}.render(items, fn);
    ++index_;
    return *this;
}

template <typename C>
template <typename Items, typename KeyFn, typename Fn>
auto NodesRender<C>::keyed_list(Items const&         items,
                                std::string_view     tag,
                                KeyFn&&              key_fn,
                                Fn&&                 fn,
                                ListElementCreation mode) -> NodesRender& {
    if (!require_render()) {
        ++index_;
        return *this;
    }
    auto& group = nodes_.grouped_nodes(index_, parent_, next_sibling_);
    KeyedListRender<C>{comp_, state_, group.keyed_list(), parent_, group.end_marker(), tag, mode}.render(items, key_fn, fn);
    ++index_;
    return *this;
}

} // namespace LT::Render
