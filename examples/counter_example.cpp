#include <livetree/LiveTree.hpp>

#include <iostream>
#include <string_view>

using namespace LT;
using Render::ElementRender;

namespace {

struct Counter {
    int value = 0;

    auto render(ElementRender<Counter>& e) const -> void {
        e.class_name("counter").class_if("negative", value < 0);
        e.nodes()
                .element("button",
                         [](ElementRender<Counter>& b) {
                             b.id("dec").on_click(b.comp().handler([](Counter& c) { --c.value; }));
                             b.static_text("-");
                         })
                .element("span", [this](ElementRender<Counter>& s) { s.nodes().text(value); })
                .element("button", [](ElementRender<Counter>& b) {
                    b.id("inc").on_click(b.comp().handler([](Counter& c) { ++c.value; }));
                    b.static_text("+");
                });
    }
};

auto click(Platform::Element& root, std::string_view id) -> void {
    for (auto const& child : root.child_nodes()) {
        auto element = Platform::as_element(child);
        if (element && element->get_attribute("id") == id) {
            (void)element->dispatch_event(Platform::Event{.type = "click"});
        }
    }
}

} // namespace

int main(int argc, char** argv) {
    bool dump_json = false;
    int  clicks    = 3;
    for (int idx = 1; idx < argc; ++idx) {
        std::string_view arg{argv[idx]};
        if (arg == "--dump_json") {
            dump_json = true;
        } else if (arg == "--down") {
            clicks = -clicks;
        } else {
            std::cerr << "Unknown argument: " << arg << '\n';
            std::cerr << "Usage: " << argv[0] << " [--dump_json] [--down]\n";
            return 1;
        }
    }

    auto app = App<Counter>::mount("div", [](Comp<Counter> const&) { return Counter{}; });
    std::cout << Platform::SerializeHtml(*app.root()) << '\n';

    auto const target = clicks < 0 ? "dec" : "inc";
    for (int i = 0; i < (clicks < 0 ? -clicks : clicks); ++i) {
        click(*app.root(), target);
        std::cout << Platform::SerializeHtml(*app.root()) << '\n';
    }

    auto const& stats = app.document()->stats();
    std::cout << "text writes: " << stats.text_writes << ", class writes: " << stats.class_writes
              << ", elements created: " << stats.elements_created << '\n';

    if (dump_json) {
        std::cout << Platform::SerializeTreeSnapshot(Platform::BuildTreeSnapshot(*app.root())) << '\n';
    }
    return 0;
}
