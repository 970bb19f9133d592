#include <livetree/LiveTree.hpp>

#include <algorithm>
#include <cstdint>
#include <iostream>
#include <string>
#include <string_view>
#include <vector>

using namespace LT;
using Render::ElementRender;
using Render::MatchIfRender;

namespace {

struct Todo {
    std::uint32_t id = 0;
    std::string   title;
    bool          done = false;
};

struct TodoList {
    std::vector<Todo> todos;
    std::string       draft;
    std::uint32_t     next_id = 1;

    auto add(std::string title) -> void { todos.push_back(Todo{next_id++, std::move(title)}); }

    auto render(ElementRender<TodoList>& e) const -> void {
        e.class_name("todo-app");
        e.nodes()
                .element("input",
                         [this](ElementRender<TodoList>& input) {
                             input.static_attributes().set_str_attribute("placeholder", "What needs doing?");
                             input.update_attributes().value(draft).on_input(input.comp().handler_arg(
                                     [](TodoList& list, Platform::Event const& event) { list.draft = event.value; }));
                         })
                .element("button",
                         [](ElementRender<TodoList>& add) {
                             add.id("add").on_click(add.comp().handler([](TodoList& list) {
                                 if (list.draft.empty()) {
                                     return ShouldRender::No;
                                 }
                                 list.add(std::move(list.draft));
                                 list.draft.clear();
                                 return ShouldRender::Yes;
                             }));
                             add.static_text("Add");
                         })
                .element("ul", [this](ElementRender<TodoList>& ul) {
                    ul.keyed_list(
                            todos, "li", [](Todo const& todo) { return todo.id; },
                            [](Todo const& todo, ElementRender<TodoList>& li) {
                                auto const id = todo.id;
                                li.set_u32_attribute("data-id", id)
                                        .class_if("done", todo.done)
                                        .on_click(li.comp().handler([id](TodoList& list) {
                                            auto it = std::find_if(list.todos.begin(), list.todos.end(),
                                                                   [id](Todo const& t) { return t.id == id; });
                                            if (it != list.todos.end()) {
                                                it->done = !it->done;
                                            }
                                        }));
                                li.update_text(todo.title);
                            });
                })
                .match_if([this](MatchIfRender<TodoList>& arms) {
                    if (todos.empty()) {
                        arms.render_on_arm_index(0).element("p", [](ElementRender<TodoList>& p) { p.static_text("Nothing to do"); });
                    } else {
                        auto left = std::count_if(todos.begin(), todos.end(), [](Todo const& t) { return !t.done; });
                        arms.render_on_arm_index(1).text(left).static_text(" left");
                    }
                });
    }
};

auto find_by_id(Platform::Element& root, std::string_view id) -> Platform::ElementPtr {
    for (auto const& child : root.child_nodes()) {
        if (auto element = Platform::as_element(child)) {
            if (element->get_attribute("id") == id || element->get_attribute("data-id") == id) {
                return element;
            }
            if (auto found = find_by_id(*element, id)) {
                return found;
            }
        }
    }
    return nullptr;
}

auto print(std::string_view step, App<TodoList> const& app) -> void {
    std::cout << step << ": " << Platform::SerializeInnerHtml(*app.root()) << '\n';
}

} // namespace

int main(int argc, char** argv) {
    bool dump_json = false;
    for (int idx = 1; idx < argc; ++idx) {
        std::string_view arg{argv[idx]};
        if (arg == "--dump_json") {
            dump_json = true;
        } else {
            std::cerr << "Unknown argument: " << arg << '\n';
            std::cerr << "Usage: " << argv[0] << " [--dump_json]\n";
            return 1;
        }
    }

    auto app = App<TodoList>::mount("main", [](Comp<TodoList> const&) { return TodoList{}; });
    print("empty", app);

    auto input  = Platform::as_element(app.root()->first_child());
    auto add    = find_by_id(*app.root(), "add");
    auto typeIn = [&](std::string title) {
        (void)input->dispatch_event(Platform::Event{.type = "input", .value = std::move(title)});
        (void)add->dispatch_event(Platform::Event{.type = "click"});
    };
    typeIn("write the parser");
    typeIn("review the patch");
    typeIn("ship it");
    print("three items", app);

    if (auto second = find_by_id(*app.root(), "2")) {
        (void)second->dispatch_event(Platform::Event{.type = "click"});
    }
    print("second done", app);

    app.document()->reset_stats();
    app.comp().update([](TodoList& list) {
        std::reverse(list.todos.begin(), list.todos.end());
        list.todos.erase(list.todos.begin() + 1);
    });
    print("reversed, middle removed", app);
    auto const& stats = app.document()->stats();
    std::cout << "inserts: " << stats.inserts << ", removals: " << stats.removals
              << ", elements created: " << stats.elements_created << ", clones: " << stats.clones << '\n';

    if (dump_json) {
        std::cout << Platform::SerializeTreeSnapshot(Platform::BuildTreeSnapshot(*app.root())) << '\n';
    }
    return 0;
}
