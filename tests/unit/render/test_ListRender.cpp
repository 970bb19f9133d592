#include "../LiveTreeTestHelper.hpp"

#include <doctest/doctest.h>

#include <string>
#include <utility>
#include <vector>

using namespace LT;
using Render::ElementRender;
using Render::ListElementCreation;

namespace {

struct Item {
    std::string key;
    std::string label;
};

struct KeyedRows {
    std::vector<Item>   items;
    ListElementCreation mode = ListElementCreation::Clone;

    auto render(ElementRender<KeyedRows>& e) const -> void {
        e.keyed_list(
                items, "li", [](Item const& item) { return item.key; },
                [](Item const& item, ElementRender<KeyedRows>& li) {
                    li.set_str_attribute("data-key", item.key);
                    li.update_text(item.label);
                },
                mode);
    }
};

struct Rows {
    std::vector<std::string> labels;
    int                      clicks = 0;
    ListElementCreation      mode   = ListElementCreation::Clone;

    auto render(ElementRender<Rows>& e) const -> void {
        e.list(
                labels, "li",
                [](std::string const& label, ElementRender<Rows>& li) {
                    li.class_name("row").on_click(li.comp().handler([](Rows& r) { ++r.clicks; }));
                    li.update_text(label);
                },
                mode);
    }
};

struct Framed {
    std::vector<int> values;

    auto render(ElementRender<Framed>& e) const -> void {
        e.nodes()
                .static_text("[")
                .list(values, "b", [](int value, ElementRender<Framed>& b) { b.update_text(std::to_string(value)); })
                .static_text("]");
    }
};

struct Picker {
    std::vector<std::string> options;
    std::string              selected;

    auto render(ElementRender<Picker>& e) const -> void {
        e.value(selected);
        e.keyed_list(
                options, "option", [](std::string const& option) { return option; },
                [](std::string const& option, ElementRender<Picker>& o) {
                    o.set_str_attribute("value", option);
                    o.update_text(option);
                });
    }
};

auto keys_of(Platform::ElementPtr const& root) -> std::vector<std::string> {
    std::vector<std::string> keys;
    for (auto const& child : root->child_nodes()) {
        if (auto element = Platform::as_element(child)) {
            keys.push_back(element->get_attribute("data-key").value_or("?"));
        }
    }
    return keys;
}

} // namespace

TEST_SUITE("render.list") {
    TEST_CASE("keyed reconciliation reuses, creates and removes by key") {
        auto app = App<KeyedRows>::mount("ul", [](Comp<KeyedRows> const&) {
            return KeyedRows{{{"k1", "A"}, {"k2", "B"}, {"k3", "C"}}};
        });
        auto root = app.root();
        REQUIRE(keys_of(root) == std::vector<std::string>{"k1", "k2", "k3"});
        auto k1 = root->child_nodes()[0];
        auto k2 = root->child_nodes()[1];
        auto k3 = root->child_nodes()[2];

        app.document()->reset_stats();
        app.comp().update([](KeyedRows& rows) { rows.items = {{"k3", "C"}, {"k1", "A"}, {"k4", "D"}}; });

        auto const& stats = app.document()->stats();
        CHECK(keys_of(root) == std::vector<std::string>{"k3", "k1", "k4"});
        CHECK(root->text_content() == "CAD");
        CHECK(root->child_nodes()[0] == k3);
        CHECK(root->child_nodes()[1] == k1);
        CHECK(k2->parent() == nullptr);
        CHECK(stats.elements_created + stats.clones == 1);
        CHECK(stats.removals == 1);
    }

    TEST_CASE("keyed reconciliation without templates") {
        auto app = App<KeyedRows>::mount("ul", [](Comp<KeyedRows> const&) {
            return KeyedRows{{{"k1", "A"}, {"k2", "B"}, {"k3", "C"}}, ListElementCreation::New};
        });
        app.document()->reset_stats();
        app.comp().update([](KeyedRows& rows) { rows.items = {{"k3", "C"}, {"k1", "A"}, {"k4", "D"}}; });
        CHECK(app.document()->stats().elements_created == 1);
        CHECK(app.document()->stats().clones == 0);
        CHECK(keys_of(app.root()) == std::vector<std::string>{"k3", "k1", "k4"});
    }

    TEST_CASE("keyed list placement") {
        auto app = App<KeyedRows>::mount("ul", [](Comp<KeyedRows> const&) {
            return KeyedRows{{{"a", "a"}, {"b", "b"}, {"c", "c"}, {"d", "d"}}};
        });
        auto root = app.root();

        SUBCASE("unchanged order moves nothing") {
            app.document()->reset_stats();
            app.comp().update([](KeyedRows&) {});
            CHECK(app.document()->stats().total_writes() == 0);
        }

        SUBCASE("swap of the ends") {
            app.comp().update([](KeyedRows& rows) { std::swap(rows.items.front(), rows.items.back()); });
            CHECK(keys_of(root) == std::vector<std::string>{"d", "b", "c", "a"});
        }

        SUBCASE("reverse") {
            app.comp().update([](KeyedRows& rows) { rows.items = {{"d", "d"}, {"c", "c"}, {"b", "b"}, {"a", "a"}}; });
            CHECK(keys_of(root) == std::vector<std::string>{"d", "c", "b", "a"});
        }

        SUBCASE("insert in the middle") {
            app.document()->reset_stats();
            app.comp().update([](KeyedRows& rows) { rows.items.insert(rows.items.begin() + 2, Item{"x", "x"}); });
            CHECK(keys_of(root) == std::vector<std::string>{"a", "b", "x", "c", "d"});
            CHECK(app.document()->stats().inserts == 1);
        }

        SUBCASE("clear and refill") {
            app.comp().update([](KeyedRows& rows) { rows.items.clear(); });
            CHECK(root->child_count() == 0);
            app.comp().update([](KeyedRows& rows) { rows.items = {{"e", "e"}}; });
            CHECK(keys_of(root) == std::vector<std::string>{"e"});
        }

        SUBCASE("duplicate keys are tolerated") {
            app.comp().update([](KeyedRows& rows) { rows.items = {{"a", "1"}, {"a", "2"}}; });
            CHECK(root->child_count() == 2);
            app.comp().update([](KeyedRows& rows) { rows.items = {{"a", "3"}}; });
            CHECK(root->child_count() == 1);
            CHECK(root->text_content() == "3");
        }
    }

    TEST_CASE("cloned list items rebind every listener") {
        auto app = App<Rows>::mount("ul", [](Comp<Rows> const&) { return Rows{{"one", "two", "three"}}; });
        auto root = app.root();

        CHECK(app.document()->stats().clones == 2);
        CHECK(app.document()->stats().listener_binds == 3);
        for (auto const& child : root->child_nodes()) {
            auto row = Platform::as_element(child);
            REQUIRE(row);
            CHECK(row->listener_count("click") == 1);
            CHECK(row->get_attribute("class") == "row");
        }

        auto third = Platform::as_element(root->child_nodes()[2]);
        LiveTreeTestHelper::click(third);
        CHECK(app.state().clicks == 1);
        CHECK(third->text_content() == "three");

        // A re-render binds nothing new.
        app.document()->reset_stats();
        app.comp().update([](Rows&) {});
        CHECK(app.document()->stats().listener_binds == 0);
        CHECK(third->listener_count("click") == 1);
    }

    TEST_CASE("keyed template clones rebind listeners too") {
        struct Buttons {
            std::vector<int> ids;
            int              last = 0;

            auto render(ElementRender<Buttons>& e) const -> void {
                e.keyed_list(
                        ids, "button", [](int id) { return id; },
                        [](int id, ElementRender<Buttons>& b) {
                            b.set_i32_attribute("data-id", id);
                            b.on_click(b.comp().handler([id](Buttons& state) { state.last = id; }));
                        });
            }
        };
        auto app = App<Buttons>::mount("div", [](Comp<Buttons> const&) { return Buttons{{1, 2, 3}}; });
        CHECK(app.document()->stats().clones == 3);

        for (auto const& child : app.root()->child_nodes()) {
            CHECK(Platform::as_element(child)->listener_count("click") == 1);
        }
        LiveTreeTestHelper::click(Platform::as_element(app.root()->child_nodes()[1]));
        CHECK(app.state().last == 2);
    }

    TEST_CASE("positional lists grow and shrink") {
        auto app  = App<Rows>::mount("ul", [](Comp<Rows> const&) { return Rows{{"a"}, 0, ListElementCreation::New}; });
        auto root = app.root();

        app.comp().update([](Rows& r) { r.labels = {"a", "b", "c"}; });
        CHECK(root->text_content() == "abc");
        CHECK(app.document()->stats().clones == 0);

        app.document()->reset_stats();
        app.comp().update([](Rows& r) { r.labels = {"z"}; });
        CHECK(root->text_content() == "z");
        CHECK(app.document()->stats().removals == 2);
        CHECK(app.document()->stats().text_writes == 1);
    }

    TEST_CASE("a list between siblings stays between them") {
        auto app = App<Framed>::mount("p", [](Comp<Framed> const&) { return Framed{{1}}; });
        CHECK(LiveTreeTestHelper::html(app.root()) == "[<b>1</b>]");

        app.comp().update([](Framed& f) { f.values = {1, 2, 3}; });
        CHECK(LiveTreeTestHelper::html(app.root()) == "[<b>1</b><b>2</b><b>3</b>]");

        app.comp().update([](Framed& f) { f.values.clear(); });
        CHECK(LiveTreeTestHelper::html(app.root()) == "[]");
    }

    TEST_CASE("select value waits for its options") {
        auto app = App<Picker>::mount("select", [](Comp<Picker> const&) { return Picker{{"red", "green", "blue"}, "green"}; });
        CHECK(app.root()->value() == "green");

        app.comp().update([](Picker& p) { p.selected = "blue"; });
        CHECK(app.root()->value() == "blue");

        app.comp().update([](Picker& p) {
            p.options.push_back("black");
            p.selected = "black";
        });
        CHECK(app.root()->value() == "black");
    }

    TEST_CASE("template cloning can be switched off") {
        ScopedRuntimeFlags flags{RuntimeFlags{.template_cloning = false}};
        auto app = App<Rows>::mount("ul", [](Comp<Rows> const&) { return Rows{{"one", "two"}}; });
        CHECK(app.document()->stats().clones == 0);
        CHECK(app.document()->stats().elements_created == 3);
    }
}
