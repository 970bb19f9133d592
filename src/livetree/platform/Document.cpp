#include <livetree/core/RuntimeFlags.hpp>
#include <livetree/platform/Document.hpp>

#include "log/TaggedLogger.hpp"

#include <string>

namespace LT::Platform {

namespace {

auto mutation_name(MutationKind kind) -> std::string_view {
    switch (kind) {
    case MutationKind::ElementCreated:
        return "create-element";
    case MutationKind::TextCreated:
        return "create-text";
    case MutationKind::CommentCreated:
        return "create-comment";
    case MutationKind::Clone:
        return "clone";
    case MutationKind::Insert:
        return "insert";
    case MutationKind::Removal:
        return "remove";
    case MutationKind::AttributeWrite:
        return "set-attribute";
    case MutationKind::AttributeRemoval:
        return "remove-attribute";
    case MutationKind::ClassWrite:
        return "class-list";
    case MutationKind::PropertyWrite:
        return "set-property";
    case MutationKind::TextWrite:
        return "set-text";
    case MutationKind::ListenerBind:
        return "add-listener";
    }
    return "unknown";
}

} // namespace

Document::Document()
    : global_listeners_(std::make_shared<ListenerTable>()) {}

auto Document::create() -> std::shared_ptr<Document> {
    return std::shared_ptr<Document>(new Document());
}

auto Document::create_element(std::string_view tag) -> ElementPtr {
    return create_element_ns(std::nullopt, tag);
}

auto Document::create_element_ns(std::optional<std::string_view> namespace_uri, std::string_view tag) -> ElementPtr {
    std::optional<std::string> ns;
    if (namespace_uri) {
        ns = std::string{*namespace_uri};
    }
    auto element = std::make_shared<Element>(shared_from_this(), std::string{tag}, std::move(ns));
    record(MutationKind::ElementCreated, tag);
    return element;
}

auto Document::create_text_node(std::string_view data) -> TextPtr {
    auto text = std::make_shared<Text>(shared_from_this(), std::string{data});
    record(MutationKind::TextCreated);
    return text;
}

auto Document::create_comment(std::string_view data) -> CommentPtr {
    auto comment = std::make_shared<Comment>(shared_from_this(), std::string{data});
    record(MutationKind::CommentCreated);
    return comment;
}

auto Document::record(MutationKind kind, std::string_view detail) -> void {
    switch (kind) {
    case MutationKind::ElementCreated:
        ++stats_.elements_created;
        break;
    case MutationKind::TextCreated:
        ++stats_.text_nodes_created;
        break;
    case MutationKind::CommentCreated:
        ++stats_.comments_created;
        break;
    case MutationKind::Clone:
        ++stats_.clones;
        break;
    case MutationKind::Insert:
        ++stats_.inserts;
        break;
    case MutationKind::Removal:
        ++stats_.removals;
        break;
    case MutationKind::AttributeWrite:
        ++stats_.attribute_writes;
        break;
    case MutationKind::AttributeRemoval:
        ++stats_.attribute_removals;
        break;
    case MutationKind::ClassWrite:
        ++stats_.class_writes;
        break;
    case MutationKind::PropertyWrite:
        ++stats_.property_writes;
        break;
    case MutationKind::TextWrite:
        ++stats_.text_writes;
        break;
    case MutationKind::ListenerBind:
        ++stats_.listener_binds;
        break;
    }
    if (CurrentRuntimeFlags().trace_mutations) {
        std::string line{mutation_name(kind)};
        if (!detail.empty()) {
            line.push_back(' ');
            line.append(detail);
        }
        lt_log(line, "Mutation");
    }
}

auto Document::add_global_listener(std::string type, EventHandler handler) -> ListenerHandle {
    auto id = global_listeners_->add(type, std::move(handler));
    record(MutationKind::ListenerBind, type);
    return std::make_shared<ListenerRegistration>(global_listeners_, id, std::move(type));
}

auto Document::dispatch_global_event(Event event) -> std::size_t {
    auto handlers = global_listeners_->handlers_for(event.type);
    for (auto const& handler : handlers) {
        (*handler)(event);
    }
    return handlers.size();
}

auto Document::global_listener_count(std::string_view type) const -> std::size_t {
    return global_listeners_->count(type);
}

} // namespace LT::Platform
