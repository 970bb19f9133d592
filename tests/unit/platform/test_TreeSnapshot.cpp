#include <livetree/platform/Document.hpp>
#include <livetree/platform/TreeSnapshot.hpp>

#include <doctest/doctest.h>

#include <string>

using namespace LT;
using namespace LT::Platform;

TEST_SUITE("platform.tree_snapshot") {
    TEST_CASE("html escapes text and attributes and skips void closers") {
        auto doc = Document::create();
        auto div = doc->create_element("div");
        REQUIRE(div->set_attribute("title", "a \"quoted\" <b>"));
        REQUIRE(div->set_attribute("hidden", ""));
        REQUIRE(div->append_child(doc->create_text_node("1 < 2 & \"ok\"")));
        REQUIRE(div->append_child(doc->create_element("br")));
        REQUIRE(div->append_child(doc->create_comment("marker")));

        CHECK(SerializeHtml(*div) == "<div title=\"a &quot;quoted&quot; &lt;b&gt;\" hidden>1 &lt; 2 &amp; \"ok\"<br></div>");
        CHECK(SerializeHtml(*div, HtmlOptions{.include_comments = true}).find("<!--marker-->") != std::string::npos);
        CHECK(SerializeInnerHtml(*div).starts_with("1 &lt; 2"));
    }

    TEST_CASE("snapshot json describes elements, form state and listeners") {
        auto doc   = Document::create();
        auto form  = doc->create_element("form");
        auto input = doc->create_element("input");
        REQUIRE(input->set_attribute("type", "checkbox"));
        REQUIRE(input->set_checked(true));
        auto handle = input->add_event_listener("change", [](Event const&) {});
        REQUIRE(form->append_child(input));
        REQUIRE(form->append_child(doc->create_text_node("label")));

        auto summary = BuildTreeSnapshot(*form);
        REQUIRE(summary.children.size() == 2);
        CHECK(summary.children[0].checked);
        CHECK(summary.children[0].listener_count == 1);
        CHECK(summary.children[1].kind == NodeKind::Text);

        auto json = SerializeTreeSnapshot(summary);
        CHECK(json.find("\"checked\": true") != std::string::npos);
        CHECK(json.find("\"listeners\": 1") != std::string::npos);

        auto parsed = ParseTreeSnapshot(json);
        REQUIRE(parsed);
        CHECK(parsed->name == "form");
        REQUIRE(parsed->children.size() == 2);
        CHECK(parsed->children[0].attributes.front().first == "type");
        CHECK(parsed->children[0].checked);
        CHECK(parsed->children[1].text == "label");
    }

    TEST_CASE("malformed snapshots are rejected") {
        auto notJson = ParseTreeSnapshot("{ nope");
        REQUIRE_FALSE(notJson);
        CHECK(notJson.error().code == Error::Code::MalformedInput);

        auto badKind = ParseTreeSnapshot(R"({"kind": "widget"})");
        REQUIRE_FALSE(badKind);
        CHECK(badKind.error().code == Error::Code::MalformedInput);

        auto badChildren = ParseTreeSnapshot(R"({"kind": "element", "name": "div", "children": {}})");
        REQUIRE_FALSE(badChildren);

        auto badAttribute = ParseTreeSnapshot(R"({"kind": "element", "name": "div", "attributes": {"x": 1}})");
        REQUIRE_FALSE(badAttribute);
    }
}
