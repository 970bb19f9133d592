#include <livetree/platform/Document.hpp>
#include <livetree/platform/LiveNode.hpp>

#include <doctest/doctest.h>

#include <string>
#include <vector>

using namespace LT;
using namespace LT::Platform;

TEST_SUITE("platform.live_node") {
    TEST_CASE("insert_before places, moves and validates children") {
        auto doc  = Document::create();
        auto list = doc->create_element("ul");
        auto a    = doc->create_element("li");
        auto b    = doc->create_element("li");
        auto c    = doc->create_element("li");

        REQUIRE(list->append_child(a));
        REQUIRE(list->append_child(c));
        REQUIRE(list->insert_before(b, c));
        CHECK(list->child_nodes() == std::vector<NodePtr>{a, b, c});
        CHECK(b->next_sibling() == c);
        CHECK(b->previous_sibling() == a);
        CHECK(c->next_sibling() == nullptr);

        SUBCASE("moving an attached child detaches it first") {
            REQUIRE(list->insert_before(c, a));
            CHECK(list->child_nodes() == std::vector<NodePtr>{c, a, b});
            CHECK(list->child_count() == 3);
        }

        SUBCASE("reference that is not a child") {
            auto stranger = doc->create_element("li");
            auto result   = list->insert_before(doc->create_element("li"), stranger);
            REQUIRE_FALSE(result);
            CHECK(result.error().code == Error::Code::NotFound);
        }

        SUBCASE("a node cannot become its own descendant") {
            auto result = a->append_child(list);
            REQUIRE_FALSE(result);
            CHECK(result.error().code == Error::Code::InvalidHierarchy);
        }

        SUBCASE("text nodes have no children") {
            auto text   = doc->create_text_node("x");
            auto result = text->append_child(doc->create_element("b"));
            REQUIRE_FALSE(result);
            CHECK(result.error().code == Error::Code::InvalidHierarchy);
        }

        SUBCASE("removing a stranger fails") {
            auto result = list->remove_child(doc->create_element("li"));
            REQUIRE_FALSE(result);
            CHECK(result.error().code == Error::Code::NotFound);
            REQUIRE(list->remove_child(b));
            CHECK(b->parent() == nullptr);
            CHECK(list->child_count() == 2);
        }
    }

    TEST_CASE("mutations are counted per kind") {
        auto doc = Document::create();
        auto div = doc->create_element("div");
        auto txt = doc->create_text_node("hi");
        REQUIRE(div->append_child(txt));
        REQUIRE(div->set_attribute("title", "t"));
        div->remove_attribute("title");
        REQUIRE(div->class_list_add("on"));
        txt->set_data("ho");

        auto const& stats = doc->stats();
        CHECK(stats.elements_created == 1);
        CHECK(stats.text_nodes_created == 1);
        CHECK(stats.inserts == 1);
        CHECK(stats.attribute_writes == 1);
        CHECK(stats.attribute_removals == 1);
        CHECK(stats.class_writes == 1);
        CHECK(stats.text_writes == 1);
        CHECK(stats.content_writes() == 4);

        doc->reset_stats();
        CHECK(doc->stats().total_writes() == 0);
    }

    TEST_CASE("attribute names are validated") {
        auto doc = Document::create();
        auto div = doc->create_element("div");
        CHECK_FALSE(div->set_attribute("", "x"));
        CHECK_FALSE(div->set_attribute("a b", "x"));
        CHECK_FALSE(div->set_attribute("a=b", "x"));
        CHECK(div->set_attribute("data-id", "7"));
        CHECK(div->get_attribute("data-id") == "7");
        CHECK(div->has_attribute("data-id"));
    }

    TEST_CASE("class list keeps the class attribute in sync") {
        auto doc = Document::create();
        auto div = doc->create_element("div");
        REQUIRE(div->class_list_add("a"));
        REQUIRE(div->class_list_add("b"));
        REQUIRE(div->class_list_add("a"));
        CHECK(div->get_attribute("class") == "a b");
        REQUIRE(div->class_list_remove("a"));
        CHECK(div->get_attribute("class") == "b");
        CHECK(div->class_list_contains("b"));
        CHECK_FALSE(div->class_list_contains("a"));
    }

    TEST_CASE("form properties") {
        auto doc = Document::create();

        SUBCASE("input value and checked") {
            auto input = doc->create_element("input");
            REQUIRE(input->set_value("typed"));
            REQUIRE(input->set_checked(true));
            CHECK(input->value() == "typed");
            CHECK(input->checked());
            CHECK_FALSE(input->has_attribute("value"));
        }

        SUBCASE("select needs a matching option") {
            auto select = doc->create_element("select");
            REQUIRE(select->set_value("b"));
            CHECK(select->value().empty());

            for (auto const* value : {"a", "b"}) {
                auto option = doc->create_element("option");
                REQUIRE(option->set_attribute("value", value));
                REQUIRE(select->append_child(option));
            }
            CHECK(select->value() == "a");
            REQUIRE(select->set_value("b"));
            CHECK(select->value() == "b");
            CHECK(select->selected_index() == 1);
        }

        SUBCASE("option value falls back to its text") {
            auto select = doc->create_element("select");
            auto option = doc->create_element("option");
            option->set_text_content("Plain");
            REQUIRE(select->append_child(option));
            CHECK(select->value() == "Plain");
        }

        SUBCASE("unsupported elements") {
            auto div = doc->create_element("div");
            auto value = div->set_value("x");
            REQUIRE_FALSE(value);
            CHECK(value.error().code == Error::Code::NotSupported);
            CHECK_FALSE(div->set_checked(true));
        }
    }

    TEST_CASE("listeners detach when their registration is dropped") {
        auto doc    = Document::create();
        auto button = doc->create_element("button");
        int  clicks = 0;

        auto registration = button->add_event_listener("click", [&](Event const& event) {
            ++clicks;
            CHECK(event.target.lock() == button);
        });
        CHECK(button->dispatch_event(Event{.type = "click"}) == 1);
        CHECK(button->listener_count("click") == 1);
        CHECK(registration->active());

        registration.reset();
        CHECK(button->dispatch_event(Event{.type = "click"}) == 0);
        CHECK(clicks == 1);
    }

    TEST_CASE("a handler may remove itself during dispatch") {
        auto doc    = Document::create();
        auto button = doc->create_element("button");
        int  calls  = 0;

        ListenerHandle registration;
        registration = button->add_event_listener("click", [&](Event const&) {
            ++calls;
            registration.reset();
        });
        button->dispatch_event(Event{.type = "click"});
        button->dispatch_event(Event{.type = "click"});
        CHECK(calls == 1);
    }

    TEST_CASE("deep clone copies attributes and children but not listeners") {
        auto doc  = Document::create();
        auto item = doc->create_element("li");
        REQUIRE(item->set_attribute("class", "row"));
        auto label = doc->create_element("span");
        label->set_text_content("first");
        REQUIRE(item->append_child(label));
        auto handle = item->add_event_listener("click", [](Event const&) {});

        doc->reset_stats();
        auto copy = as_element(item->clone_node(true));
        REQUIRE(copy);
        CHECK(doc->stats().clones == 1);
        CHECK(copy->get_attribute("class") == "row");
        CHECK(copy->text_content() == "first");
        CHECK(copy->listener_count() == 0);
        CHECK(copy->parent() == nullptr);
        CHECK(copy->child_nodes().front() != label);

        auto shallow = item->clone_node(false);
        CHECK(shallow->child_count() == 0);
    }

    TEST_CASE("text content replaces children") {
        auto doc = Document::create();
        auto div = doc->create_element("div");
        REQUIRE(div->append_child(doc->create_element("b")));
        div->set_text_content("plain");
        CHECK(div->child_count() == 1);
        CHECK(div->text_content() == "plain");
        div->set_text_content(std::nullopt);
        CHECK(div->child_count() == 0);
    }

    TEST_CASE("focus and global listeners") {
        auto doc   = Document::create();
        auto input = doc->create_element("input");
        input->focus();
        CHECK(doc->active_element() == input);

        int  resizes = 0;
        auto handle  = doc->add_global_listener("resize", [&](Event const&) { ++resizes; });
        CHECK(doc->dispatch_global_event(Event{.type = "resize"}) == 1);
        CHECK(doc->global_listener_count("resize") == 1);
        handle.reset();
        CHECK(doc->dispatch_global_event(Event{.type = "resize"}) == 0);
        CHECK(resizes == 1);
    }
}
