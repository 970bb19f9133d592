#include "../LiveTreeTestHelper.hpp"

#include <doctest/doctest.h>

#include <string>
#include <vector>

using namespace LT;
using Render::ElementRender;

namespace {

struct Counter {
    int  value       = 0;
    bool highlighted = false;

    auto render(ElementRender<Counter>& e) const -> void {
        e.class_name("counter").class_if("hot", highlighted);
        e.nodes()
                .element("button",
                         [](ElementRender<Counter>& b) {
                             b.id("dec").on_click(b.comp().handler([](Counter& c) { --c.value; }));
                             b.static_text("-");
                         })
                .text(value)
                .element("button", [](ElementRender<Counter>& b) {
                    b.id("inc").on_click(b.comp().handler([](Counter& c) { ++c.value; }));
                    b.static_text("+");
                });
    }
};

struct Badge {
    bool        active = true;
    std::string title  = "first";
    double      ratio  = 0.5;
    int         level  = -1;
    unsigned    count  = 2;

    auto render(ElementRender<Badge>& e) const -> void {
        e.set_bool_attribute("data-active", active)
                .set_str_attribute("title", title)
                .set_f64_attribute("data-ratio", ratio)
                .set_i32_attribute("data-level", level)
                .set_u32_attribute("data-count", count);
    }
};

struct Banner {
    std::string label   = "v1";
    int         renders = 0;

    auto render(ElementRender<Banner>& e) const -> void {
        e.static_attributes().class_name(label).update_attributes().set_str_attribute("data-label", label);
        e.static_nodes().element("h1", [this](ElementRender<Banner>& h) { h.update_text(label); }).update_text(label);
    }
};

struct Form {
    std::string text;
    bool        done = false;

    auto render(ElementRender<Form>& e) const -> void {
        e.nodes()
                .element("input",
                         [this](ElementRender<Form>& input) {
                             input.set_str_attribute("type", "checkbox").checked(done).value(text);
                         })
                .element("p", [this](ElementRender<Form>& p) {
                    // Neither property exists on a <p>; both only warn.
                    p.checked(done).value(text);
                });
    }
};

struct Drawing {
    int radius = 4;

    auto render(ElementRender<Drawing>& e) const -> void {
        e.nodes().element_ns("http://www.w3.org/2000/svg", "circle",
                             [this](ElementRender<Drawing>& c) { c.set_i32_attribute("r", radius); });
    }
};

struct Unstable {
    bool as_text = true;

    auto render(ElementRender<Unstable>& e) const -> void {
        if (as_text) {
            e.nodes().update_text("text");
        } else {
            e.nodes().element("b", [](ElementRender<Unstable>&) {});
        }
    }
};

struct Gauge {
    double reading = 1234567.0;

    auto render(ElementRender<Gauge>& e) const -> void { e.set_f64_attribute("data-reading", reading); }
};

struct Meter {
    double level = 1.5;

    auto render(ElementRender<Meter>& e) const -> void { e.nodes().text(level); }
};

struct Article {
    std::string link  = "/a";
    std::string title = "Title";
    std::string body  = "Body";

    auto render(ElementRender<Article>& e) const -> void {
        e.href_str(link);
        e.static_nodes()
                .element("h1", [this](ElementRender<Article>& h) { h.update_text(title); })
                .set_update_mode()
                .element("p", [this](ElementRender<Article>& p) { p.update_text(body); });
    }
};

struct Greedy {
    int second = 0;

    auto render(ElementRender<Greedy>& e) const -> void {
        e.nodes().text(1);
        if (second == 1) {
            e.nodes().text(2);
        } else if (second == 2) {
            e.list(std::vector<int>{1, 2}, "li", [](int value, ElementRender<Greedy>& li) { li.nodes().text(value); });
        }
    }
};

} // namespace

TEST_SUITE("render.element") {
    TEST_CASE("first render builds the tree") {
        auto app = App<Counter>::mount("div", [](Comp<Counter> const&) { return Counter{}; });
        CHECK(LiveTreeTestHelper::html(app.root())
              == "<button id=\"dec\">-</button>0<button id=\"inc\">+</button>");
        CHECK(app.root()->get_attribute("class") == "counter");
        CHECK(app.instance().render_count() == 1);
    }

    TEST_CASE("re-rendering unchanged state writes nothing") {
        auto app = App<Counter>::mount("div", [](Comp<Counter> const&) { return Counter{}; });
        app.document()->reset_stats();

        app.comp().update([](Counter&) {});

        CHECK(app.instance().render_count() == 2);
        CHECK(app.document()->stats().total_writes() == 0);
        CHECK(app.document()->stats().listener_binds == 0);
    }

    TEST_CASE("events update state and only the changed text is written") {
        auto app = App<Counter>::mount("div", [](Comp<Counter> const&) { return Counter{}; });
        auto inc = LiveTreeTestHelper::findById(app.root(), "inc");
        REQUIRE(inc);
        app.document()->reset_stats();

        CHECK(LiveTreeTestHelper::click(inc) == 1);
        CHECK(LiveTreeTestHelper::click(inc) == 1);

        CHECK(app.state().value == 2);
        CHECK(app.root()->text_content() == "-2+");
        CHECK(app.document()->stats().text_writes == 2);
        CHECK(app.document()->stats().content_writes() == 2);

        app.comp().update([](Counter& c) { c.highlighted = true; });
        CHECK(app.root()->get_attribute("class") == "counter hot");
    }

    TEST_CASE("attribute writes follow value changes position by position") {
        auto app   = App<Badge>::mount("span", [](Comp<Badge> const&) { return Badge{}; });
        auto root  = app.root();
        auto stats = [&] { return app.document()->stats(); };
        CHECK(root->has_attribute("data-active"));
        CHECK(root->get_attribute("data-ratio") == "0.5");
        CHECK(root->get_attribute("data-level") == "-1");
        CHECK(root->get_attribute("data-count") == "2");

        app.document()->reset_stats();
        app.comp().update([](Badge& b) { b.title = "second"; });
        CHECK(stats().attribute_writes == 1);
        CHECK(stats().attribute_removals == 0);
        CHECK(root->get_attribute("title") == "second");

        app.document()->reset_stats();
        app.comp().update([](Badge& b) {
            b.active = false;
            b.title  = "second";
        });
        CHECK(stats().attribute_writes == 0);
        CHECK(stats().attribute_removals == 1);
        CHECK_FALSE(root->has_attribute("data-active"));

        app.document()->reset_stats();
        app.comp().update([](Badge& b) {
            b.ratio += 1e-18;
            b.level = 3;
            b.count = 2;
        });
        CHECK(stats().attribute_writes == 1);
        CHECK(root->get_attribute("data-level") == "3");
    }

    TEST_CASE("static attributes and static nodes are written once") {
        auto app = App<Banner>::mount("header", [](Comp<Banner> const&) { return Banner{}; });
        CHECK(LiveTreeTestHelper::html(app.root()) == "<h1>v1</h1>v1");

        app.comp().update([](Banner& b) { b.label = "v2"; });

        CHECK(app.root()->get_attribute("class") == "v1");
        CHECK(app.root()->get_attribute("data-label") == "v2");
        // The <h1> is skipped, the trailing text is still compared.
        CHECK(LiveTreeTestHelper::html(app.root()) == "<h1>v1</h1>v2");
    }

    TEST_CASE("form properties and soft mismatches") {
        auto app   = App<Form>::mount("form", [](Comp<Form> const&) { return Form{"draft", true}; });
        auto input = Platform::as_element(app.root()->first_child());
        REQUIRE(input);
        CHECK(input->value() == "draft");
        CHECK(input->checked());

        app.comp().update([](Form& f) { f.done = false; });
        CHECK_FALSE(input->checked());
        CHECK(input->value() == "draft");
    }

    TEST_CASE("namespaced elements") {
        auto app    = App<Drawing>::mount("svg", [](Comp<Drawing> const&) { return Drawing{}; });
        auto circle = Platform::as_element(app.root()->first_child());
        REQUIRE(circle);
        CHECK(circle->namespace_uri() == "http://www.w3.org/2000/svg");
        CHECK(circle->get_attribute("r") == "4");
    }

    TEST_CASE("an unstable render function is a contract violation") {
        auto app = App<Unstable>::mount("div", [](Comp<Unstable> const&) { return Unstable{}; });
        CHECK_THROWS_AS(app.comp().update([](Unstable& u) { u.as_text = false; }), ContractViolation);
        CHECK_FALSE(UpdateQueue::in_flight());
        CHECK_FALSE(app.instance().borrowed());
    }

    TEST_CASE("focus moves the active element") {
        struct Search {
            auto render(ElementRender<Search>& e) const -> void {
                e.nodes().element("input", [](ElementRender<Search>& input) { input.focus(input.status() != Dom::ElementStatus::Existing); });
            }
        };
        auto app = App<Search>::mount("div", [](Comp<Search> const&) { return Search{}; });
        CHECK(app.document()->active_element() == app.root()->first_child());
    }

    TEST_CASE("f64 attributes keep every significant digit") {
        auto app  = App<Gauge>::mount("meter", [](Comp<Gauge> const&) { return Gauge{}; });
        auto root = app.root();
        CHECK(root->get_attribute("data-reading") == "1234567");

        app.document()->reset_stats();
        app.comp().update([](Gauge& g) { g.reading = 1234568.0; });
        CHECK(app.document()->stats().attribute_writes == 1);
        CHECK(root->get_attribute("data-reading") == "1234568");

        app.comp().update([](Gauge& g) { g.reading = 0.1234567; });
        CHECK(root->get_attribute("data-reading") == "0.1234567");
    }

    TEST_CASE("number text uses the shortest exact form") {
        auto app = App<Meter>::mount("div", [](Comp<Meter> const&) { return Meter{}; });
        CHECK(app.root()->text_content() == "1.5");

        app.comp().update([](Meter& m) { m.level = 1e-7; });
        CHECK(app.root()->text_content() == "1e-07");

        app.document()->reset_stats();
        app.comp().update([](Meter& m) { m.level = 2e-7; });
        CHECK(app.document()->stats().text_writes == 1);
        CHECK(app.root()->text_content() == "2e-07");
    }

    TEST_CASE("update mode resumes diffing after static nodes") {
        auto app = App<Article>::mount("a", [](Comp<Article> const&) { return Article{}; });
        CHECK(app.root()->get_attribute("href") == "/a");
        CHECK(LiveTreeTestHelper::html(app.root()) == "<h1>Title</h1><p>Body</p>");

        app.comp().update([](Article& a) {
            a.link  = "/b";
            a.title = "Changed";
            a.body  = "Edited";
        });
        CHECK(app.root()->get_attribute("href") == "/b");
        CHECK(LiveTreeTestHelper::html(app.root()) == "<h1>Title</h1><p>Edited</p>");
    }

    TEST_CASE("children can be taken once per render") {
        auto app = App<Greedy>::mount("ul", [](Comp<Greedy> const&) { return Greedy{}; });
        CHECK(app.root()->text_content() == "1");

        SUBCASE("a second nodes() call") {
            CHECK_THROWS_AS(app.comp().update([](Greedy& g) { g.second = 1; }), ContractViolation);
        }
        SUBCASE("a list after nodes()") {
            CHECK_THROWS_AS(app.comp().update([](Greedy& g) { g.second = 2; }), ContractViolation);
        }
        CHECK_FALSE(UpdateQueue::in_flight());
        CHECK_FALSE(app.instance().borrowed());
        CHECK(app.root()->text_content() == "1");
    }
}
