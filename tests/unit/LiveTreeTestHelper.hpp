#pragma once

#include <livetree/LiveTree.hpp>

#include <string>
#include <string_view>

namespace LT {
struct LiveTreeTestHelper {
    static Platform::ElementPtr findById(Platform::NodePtr const& node, std::string_view id) {
        if (auto element = Platform::as_element(node)) {
            if (element->get_attribute("id") == id) {
                return element;
            }
        }
        for (auto const& child : node->child_nodes()) {
            if (auto found = findById(child, id)) {
                return found;
            }
        }
        return nullptr;
    }

    static std::size_t click(Platform::ElementPtr const& element) {
        return element->dispatch_event(Platform::Event{.type = "click"});
    }

    static std::size_t input(Platform::ElementPtr const& element, std::string value) {
        return element->dispatch_event(Platform::Event{.type = "input", .value = std::move(value)});
    }

    static std::string html(Platform::ElementPtr const& root) { return Platform::SerializeInnerHtml(*root); }

    template <typename C>
    static Platform::MutationStats const& stats(App<C> const& app) {
        return app.document()->stats();
    }
};
} // namespace LT
