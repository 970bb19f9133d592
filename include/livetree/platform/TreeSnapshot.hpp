#pragma once

#include <livetree/core/Error.hpp>
#include <livetree/platform/LiveNode.hpp>

#include <cstddef>
#include <string>
#include <utility>
#include <vector>

namespace LT::Platform {

struct HtmlOptions {
    // Grouped fragments leave comment markers in the tree; they are hidden by
    // default so the output reads like what a browser would display.
    bool include_comments = false;
};

[[nodiscard]] auto SerializeHtml(Node const& node, HtmlOptions const& options = {}) -> std::string;
[[nodiscard]] auto SerializeInnerHtml(Node const& node, HtmlOptions const& options = {}) -> std::string;

struct NodeSummary {
    NodeKind                                         kind = NodeKind::Element;
    std::string                                      name;
    std::string                                      text;
    std::vector<std::pair<std::string, std::string>> attributes;
    std::string                                      value;
    bool                                             checked        = false;
    std::size_t                                      listener_count = 0;
    std::vector<NodeSummary>                         children;
};

[[nodiscard]] auto BuildTreeSnapshot(Node const& node) -> NodeSummary;

[[nodiscard]] auto SerializeTreeSnapshot(NodeSummary const& summary, int indent = 2) -> std::string;

[[nodiscard]] auto ParseTreeSnapshot(std::string const& payload) -> Expected<NodeSummary>;

} // namespace LT::Platform
