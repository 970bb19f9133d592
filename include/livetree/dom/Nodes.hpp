#pragma once

#include <livetree/dom/AttributeList.hpp>
#include <livetree/dom/ElementStatus.hpp>
#include <livetree/platform/LiveNode.hpp>

#include <cstddef>
#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <type_traits>
#include <utility>
#include <variant>
#include <vector>

namespace LT::Dom {

class Element;
class GroupedNodes;
class KeyedList;
class NodeSlot;

// Type-erased owner of a mounted child component. Destroying it marks the
// child unmounted.
class ComponentHandleBase {
public:
    virtual ~ComponentHandleBase() = default;
};

/**
 * The children a render function produced under one parent, in render order.
 * Position is identity: the n-th visit of a render pass always addresses the
 * n-th slot.
 */
class Nodes {
public:
    Nodes();
    ~Nodes();
    Nodes(Nodes&&) noexcept;
    Nodes& operator=(Nodes&&) noexcept;

    [[nodiscard]] auto count() const -> std::size_t;
    [[nodiscard]] auto empty() const -> bool { return count() == 0; }

    // Creates the element when `index` is one past the end, otherwise reuses it.
    [[nodiscard]] auto check_or_create_element(std::string_view                tag,
                                               std::optional<std::string_view> namespace_uri,
                                               std::size_t                     index,
                                               ElementStatus                   parent_status,
                                               Platform::Node&                 parent,
                                               Platform::NodePtr const&        next_sibling) -> ElementStatus;

    // List items may instead be cloned from item 0 when `use_template` is set
    // and template cloning is enabled.
    [[nodiscard]] auto check_or_create_element_for_list(std::string_view                tag,
                                                        std::optional<std::string_view> namespace_uri,
                                                        std::size_t                     index,
                                                        Platform::Node&                 parent,
                                                        Platform::NodePtr const&        next_sibling,
                                                        bool                            use_template) -> ElementStatus;

    [[nodiscard]] auto element_at(std::size_t index) -> Element&;

    auto static_text(std::size_t index, std::string_view text, Platform::Node& parent, Platform::NodePtr const& next_sibling) -> void;
    auto update_text(std::size_t index, std::string_view text, Platform::Node& parent, Platform::NodePtr const& next_sibling) -> void;

    [[nodiscard]] auto grouped_nodes(std::size_t index, Platform::Node& parent, Platform::NodePtr const& next_sibling) -> GroupedNodes&;

    auto store_component_handle(std::unique_ptr<ComponentHandleBase> handle) -> void;

    auto clear(Platform::Node& parent) -> void;
    auto clear_after(std::size_t index, Platform::Node& parent) -> void;
    auto append_to(Platform::Node& parent) const -> void;

    // Rebuilds this slot structure over the children of a deep-cloned live
    // node, consuming them from `cursor` on.
    [[nodiscard]] auto clone_onto(Platform::Node const& live_parent, std::size_t& cursor) const -> Nodes;

private:
    auto add_text_node(std::string_view text, Platform::Node& parent, Platform::NodePtr const& next_sibling) -> void;

    std::vector<NodeSlot> slots_;
};

// Reconciler-side element: the live node plus what the last render wrote to it.
class Element {
public:
    explicit Element(Platform::ElementPtr live);
    ~Element();
    Element(Element&&) noexcept;
    Element& operator=(Element&&) noexcept;

    [[nodiscard]] static auto create(Platform::Document& document, std::optional<std::string_view> namespace_uri, std::string_view tag) -> Element;

    [[nodiscard]] auto live() const -> Platform::ElementPtr const& { return live_; }
    [[nodiscard]] auto attributes() -> AttributeList& { return attributes_; }
    [[nodiscard]] auto attributes() const -> AttributeList const& { return attributes_; }
    [[nodiscard]] auto nodes() -> Nodes& { return nodes_; }
    [[nodiscard]] auto nodes() const -> Nodes const& { return nodes_; }

    // Created on first use.
    [[nodiscard]] auto keyed_list() -> KeyedList&;
    [[nodiscard]] auto has_keyed_list() const -> bool { return keyed_list_ != nullptr; }

    [[nodiscard]] auto is_empty() const -> bool;

    // One deep platform clone; listeners are not carried over.
    [[nodiscard]] auto clone() const -> Element;

    // Moves every rendered child into `live` and forgets the attribute cache,
    // which described the previous live element.
    auto replace_live(Platform::ElementPtr live) -> void;

    auto insert_before(Platform::Node& parent, Platform::NodePtr const& next_sibling) const -> void;
    auto append_to(Platform::Node& parent) const -> void;
    auto remove_from(Platform::Node& parent) const -> void;

private:
    friend class Nodes;

    [[nodiscard]] auto clone_onto(Platform::ElementPtr live) const -> Element;

    Platform::ElementPtr       live_;
    AttributeList              attributes_;
    Nodes                      nodes_;
    std::unique_ptr<KeyedList> keyed_list_;
};

class TextNode {
public:
    TextNode(Platform::TextPtr live, std::string text);

    [[nodiscard]] auto live() const -> Platform::TextPtr const& { return live_; }
    [[nodiscard]] auto text() const -> std::string const& { return text_; }

    auto update_text(std::string_view text) -> void;

private:
    Platform::TextPtr live_;
    std::string       text_;
};

/**
 * A run of siblings bounded by an invisible end marker. Everything the group
 * renders is inserted before the marker, so siblings rendered after the group
 * are unaffected by how many nodes it currently holds.
 *
 * Used for match-if arms (the active arm index) and for lists rendered in the
 * middle of other children.
 */
class GroupedNodes {
public:
    explicit GroupedNodes(Platform::CommentPtr end_marker);
    ~GroupedNodes();
    GroupedNodes(GroupedNodes&&) noexcept;
    GroupedNodes& operator=(GroupedNodes&&) noexcept;

    // Existing when `index` is already active; otherwise drops the content of
    // the previous arm and reports JustCreated.
    [[nodiscard]] auto set_active_index(std::uint32_t index, Platform::Node& parent) -> ElementStatus;
    [[nodiscard]] auto active_index() const -> std::optional<std::uint32_t> { return active_index_; }

    [[nodiscard]] auto end_marker() const -> Platform::CommentPtr const& { return end_marker_; }
    [[nodiscard]] auto nodes() -> Nodes& { return nodes_; }
    [[nodiscard]] auto nodes() const -> Nodes const& { return nodes_; }
    [[nodiscard]] auto keyed_list() -> KeyedList&;
    [[nodiscard]] auto has_keyed_list() const -> bool { return keyed_list_ != nullptr; }

    // Removes the content and the marker.
    auto clear(Platform::Node& parent) -> void;
    auto append_to(Platform::Node& parent) const -> void;

    [[nodiscard]] auto clone_onto(Platform::Node const& live_parent, std::size_t& cursor) const -> GroupedNodes;

private:
    auto clear_content(Platform::Node& parent) -> void;

    std::optional<std::uint32_t> active_index_;
    Platform::CommentPtr         end_marker_;
    Nodes                        nodes_;
    std::unique_ptr<KeyedList>   keyed_list_;
};

struct ComponentSlot {
    std::unique_ptr<ComponentHandleBase> handle;
};

class NodeSlot {
public:
    using Value = std::variant<Element, TextNode, GroupedNodes, ComponentSlot>;

    template <typename T>
        requires(!std::is_same_v<std::remove_cvref_t<T>, NodeSlot>)
    explicit NodeSlot(T&& value)
        : value_(std::forward<T>(value)) {}

    [[nodiscard]] auto value() -> Value& { return value_; }
    [[nodiscard]] auto value() const -> Value const& { return value_; }

    auto clear(Platform::Node& parent) -> void;
    auto append_to(Platform::Node& parent) const -> void;

private:
    Value value_;
};

} // namespace LT::Dom
