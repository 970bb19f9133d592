#pragma once

#include <livetree/platform/LiveNode.hpp>

#include <cstdint>
#include <memory>
#include <optional>
#include <string_view>

namespace LT::Platform {

// Counts every mutating platform call. Tests use it to verify that a render
// pass touched only what changed.
struct MutationStats {
    std::uint64_t elements_created   = 0;
    std::uint64_t text_nodes_created = 0;
    std::uint64_t comments_created   = 0;
    std::uint64_t clones             = 0;
    std::uint64_t inserts            = 0;
    std::uint64_t removals           = 0;
    std::uint64_t attribute_writes   = 0;
    std::uint64_t attribute_removals = 0;
    std::uint64_t class_writes       = 0;
    std::uint64_t property_writes    = 0;
    std::uint64_t text_writes        = 0;
    std::uint64_t listener_binds     = 0;

    // Writes against existing nodes: attributes, classes, properties, text.
    [[nodiscard]] auto content_writes() const -> std::uint64_t {
        return attribute_writes + attribute_removals + class_writes + property_writes + text_writes;
    }
    [[nodiscard]] auto structural_writes() const -> std::uint64_t {
        return inserts + removals;
    }
    [[nodiscard]] auto total_writes() const -> std::uint64_t {
        return content_writes() + structural_writes() + elements_created + text_nodes_created
               + comments_created + clones;
    }
};

class Document : public std::enable_shared_from_this<Document> {
public:
    [[nodiscard]] static auto create() -> std::shared_ptr<Document>;

    Document(Document const&)            = delete;
    Document& operator=(Document const&) = delete;

    [[nodiscard]] auto create_element(std::string_view tag) -> ElementPtr;
    [[nodiscard]] auto create_element_ns(std::optional<std::string_view> namespace_uri, std::string_view tag) -> ElementPtr;
    [[nodiscard]] auto create_text_node(std::string_view data) -> TextPtr;
    [[nodiscard]] auto create_comment(std::string_view data) -> CommentPtr;

    [[nodiscard]] auto stats() const -> MutationStats const& { return stats_; }
    auto reset_stats() -> void { stats_ = {}; }
    auto record(MutationKind kind, std::string_view detail = {}) -> void;

    [[nodiscard]] auto active_element() const -> ElementPtr { return active_element_.lock(); }
    auto set_active_element(ElementPtr const& element) -> void { active_element_ = element; }

    // Window-level listeners, owned by whoever keeps the registration.
    [[nodiscard]] auto add_global_listener(std::string type, EventHandler handler) -> ListenerHandle;
    auto dispatch_global_event(Event event) -> std::size_t;
    [[nodiscard]] auto global_listener_count(std::string_view type) const -> std::size_t;

private:
    Document();

    MutationStats                  stats_;
    std::weak_ptr<Element>         active_element_;
    std::shared_ptr<ListenerTable> global_listeners_;
};

using DocumentPtr = std::shared_ptr<Document>;

} // namespace LT::Platform
