#pragma once

#include <livetree/component/Component.hpp>
#include <livetree/platform/Document.hpp>

#include <string_view>
#include <utility>

namespace LT {

/**
 * Top-level component bound to an element of a document for the lifetime of
 * the App. The first render happens in the constructor.
 */
template <typename C>
class App {
public:
    template <typename Init>
    App(Platform::DocumentPtr document, Platform::ElementPtr root, Init&& init)
        : document_(std::move(document)), root_(RcComp<C>::create(std::forward<Init>(init), std::move(root))) {
        root_.first_render();
    }

    // Creates a fresh document with a `root_tag` element to render into.
    template <typename Init>
    [[nodiscard]] static auto mount(std::string_view root_tag, Init&& init) -> App {
        auto document = Platform::Document::create();
        auto root     = document->create_element(root_tag);
        return App{std::move(document), std::move(root), std::forward<Init>(init)};
    }

    App(App&&) noexcept = default;

    [[nodiscard]] auto comp() const -> Comp<C> { return root_.comp(); }
    [[nodiscard]] auto instance() const -> CompInstance<C>& { return root_.instance(); }
    [[nodiscard]] auto state() const -> C const& { return root_.state(); }
    [[nodiscard]] auto document() const -> Platform::DocumentPtr const& { return document_; }
    [[nodiscard]] auto root() const -> Platform::ElementPtr const& { return root_.instance().root_live(); }

private:
    Platform::DocumentPtr document_;
    RcComp<C>             root_;
};

} // namespace LT
