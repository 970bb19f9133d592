#pragma once

#include <livetree/core/Error.hpp>

#include <cstddef>
#include <cstdint>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace LT::Platform {

enum class NodeKind {
    Element,
    Text,
    Comment,
};

enum class MutationKind {
    ElementCreated,
    TextCreated,
    CommentCreated,
    Clone,
    Insert,
    Removal,
    AttributeWrite,
    AttributeRemoval,
    ClassWrite,
    PropertyWrite,
    TextWrite,
    ListenerBind,
};

class Document;
class Node;
class Element;
class Text;
class Comment;

using NodePtr    = std::shared_ptr<Node>;
using ElementPtr = std::shared_ptr<Element>;
using TextPtr    = std::shared_ptr<Text>;
using CommentPtr = std::shared_ptr<Comment>;

struct Event {
    std::string         type;
    std::string         value;
    std::weak_ptr<Node> target;
};

using EventHandler = std::function<void(Event const&)>;

class ListenerTable {
public:
    struct Entry {
        std::uint64_t                 id = 0;
        std::string                   type;
        std::shared_ptr<EventHandler> handler;
    };

    auto add(std::string type, EventHandler handler) -> std::uint64_t;
    auto remove(std::uint64_t id) -> bool;
    auto contains(std::uint64_t id) const -> bool;

    // Snapshot of the handlers for `type`, in registration order. Dispatch
    // works on the snapshot so handlers may add or remove listeners.
    [[nodiscard]] auto handlers_for(std::string_view type) const -> std::vector<std::shared_ptr<EventHandler>>;
    [[nodiscard]] auto count(std::string_view type) const -> std::size_t;
    [[nodiscard]] auto size() const -> std::size_t { return entries_.size(); }

private:
    std::vector<Entry> entries_;
    std::uint64_t      next_id_ = 1;
};

// Detaches its handler from the owning table when destroyed.
class ListenerRegistration {
public:
    ListenerRegistration(std::weak_ptr<ListenerTable> table, std::uint64_t id, std::string type);
    ~ListenerRegistration();

    ListenerRegistration(ListenerRegistration const&)            = delete;
    ListenerRegistration& operator=(ListenerRegistration const&) = delete;

    [[nodiscard]] auto event_type() const -> std::string const& { return type_; }
    [[nodiscard]] auto active() const -> bool;

private:
    std::weak_ptr<ListenerTable> table_;
    std::uint64_t                id_ = 0;
    std::string                  type_;
};

using ListenerHandle = std::shared_ptr<ListenerRegistration>;

class Node : public std::enable_shared_from_this<Node> {
public:
    virtual ~Node() = default;

    Node(Node const&)            = delete;
    Node& operator=(Node const&) = delete;

    [[nodiscard]] auto kind() const -> NodeKind { return kind_; }
    [[nodiscard]] auto owner_document() const -> std::shared_ptr<Document> const& { return document_; }

    [[nodiscard]] auto parent() const -> NodePtr { return parent_.lock(); }
    [[nodiscard]] auto child_nodes() const -> std::vector<NodePtr> const& { return children_; }
    [[nodiscard]] auto child_count() const -> std::size_t { return children_.size(); }
    [[nodiscard]] auto first_child() const -> NodePtr;
    [[nodiscard]] auto last_child() const -> NodePtr;
    [[nodiscard]] auto next_sibling() const -> NodePtr;
    [[nodiscard]] auto previous_sibling() const -> NodePtr;
    [[nodiscard]] auto index_in_parent() const -> std::optional<std::size_t>;
    [[nodiscard]] auto contains(Node const* other) const -> bool;

    // Inserting a node that already has a parent moves it. A null `reference`
    // appends.
    auto append_child(NodePtr const& child) -> Expected<void>;
    auto insert_before(NodePtr const& child, NodePtr const& reference) -> Expected<void>;
    auto remove_child(NodePtr const& child) -> Expected<void>;

    [[nodiscard]] virtual auto text_content() const -> std::string;
    virtual auto set_text_content(std::optional<std::string_view> text) -> void;

    [[nodiscard]] auto clone_node(bool deep) const -> NodePtr;

protected:
    Node(NodeKind kind, std::shared_ptr<Document> document);

    [[nodiscard]] virtual auto clone_self() const -> NodePtr = 0;
    auto remove_all_children() -> void;
    auto record(MutationKind kind, std::string_view detail = {}) const -> void;

    NodeKind                  kind_;
    std::shared_ptr<Document> document_;
    std::weak_ptr<Node>       parent_;
    std::vector<NodePtr>      children_;

private:
    auto clone_children_into(Node& target) const -> void;
    auto detach_from_parent() -> void;
};

class Element final : public Node {
public:
    Element(std::shared_ptr<Document> document, std::string tag, std::optional<std::string> namespace_uri);

    [[nodiscard]] auto tag_name() const -> std::string const& { return tag_; }
    [[nodiscard]] auto namespace_uri() const -> std::optional<std::string> const& { return namespace_uri_; }

    auto set_attribute(std::string_view name, std::string_view value) -> Expected<void>;
    auto remove_attribute(std::string_view name) -> void;
    [[nodiscard]] auto get_attribute(std::string_view name) const -> std::optional<std::string>;
    [[nodiscard]] auto has_attribute(std::string_view name) const -> bool;
    [[nodiscard]] auto attributes() const -> std::vector<std::pair<std::string, std::string>> const& { return attributes_; }

    auto class_list_add(std::string_view name) -> Expected<void>;
    auto class_list_remove(std::string_view name) -> Expected<void>;
    [[nodiscard]] auto class_list_contains(std::string_view name) const -> bool;

    [[nodiscard]] auto id() const -> std::string;
    auto set_id(std::string_view id) -> void;

    // Form control properties. `input` and `textarea` hold their own value;
    // `select` resolves it against its `option` descendants.
    [[nodiscard]] auto value() const -> std::string;
    auto set_value(std::string_view value) -> Expected<void>;
    [[nodiscard]] auto checked() const -> bool { return checked_; }
    auto set_checked(bool checked) -> Expected<void>;
    [[nodiscard]] auto selected_index() const -> std::optional<std::size_t>;

    auto focus() -> void;

    [[nodiscard]] auto add_event_listener(std::string type, EventHandler handler) -> ListenerHandle;
    auto dispatch_event(Event event) -> std::size_t;
    [[nodiscard]] auto listener_count(std::string_view type) const -> std::size_t;
    [[nodiscard]] auto listener_count() const -> std::size_t;

    auto set_text_content(std::optional<std::string_view> text) -> void override;

protected:
    [[nodiscard]] auto clone_self() const -> NodePtr override;

private:
    auto collect_options(std::vector<Element const*>& out) const -> void;

    std::string                                      tag_;
    std::optional<std::string>                       namespace_uri_;
    std::vector<std::pair<std::string, std::string>> attributes_;
    std::string                                      value_;
    std::optional<std::string>                       selected_option_value_;
    bool                                             checked_ = false;
    std::shared_ptr<ListenerTable>                   listeners_;
};

class Text final : public Node {
public:
    Text(std::shared_ptr<Document> document, std::string data);

    [[nodiscard]] auto data() const -> std::string const& { return data_; }
    auto set_data(std::string_view data) -> void;

    [[nodiscard]] auto text_content() const -> std::string override { return data_; }
    auto set_text_content(std::optional<std::string_view> text) -> void override;

protected:
    [[nodiscard]] auto clone_self() const -> NodePtr override;

private:
    std::string data_;
};

class Comment final : public Node {
public:
    Comment(std::shared_ptr<Document> document, std::string data);

    [[nodiscard]] auto data() const -> std::string const& { return data_; }
    [[nodiscard]] auto text_content() const -> std::string override { return {}; }
    auto set_text_content(std::optional<std::string_view>) -> void override {}

protected:
    [[nodiscard]] auto clone_self() const -> NodePtr override;

private:
    std::string data_;
};

[[nodiscard]] inline auto as_element(NodePtr const& node) -> ElementPtr {
    if (node && node->kind() == NodeKind::Element) {
        return std::static_pointer_cast<Element>(node);
    }
    return nullptr;
}

[[nodiscard]] inline auto as_text(NodePtr const& node) -> TextPtr {
    if (node && node->kind() == NodeKind::Text) {
        return std::static_pointer_cast<Text>(node);
    }
    return nullptr;
}

} // namespace LT::Platform
