#include <livetree/platform/TreeSnapshot.hpp>

#include <nlohmann/json.hpp>

#include <array>
#include <optional>
#include <string_view>

namespace LT::Platform {

namespace {

constexpr std::array<std::string_view, 8> kVoidElements{"area", "br", "col", "hr", "img", "input", "link", "meta"};

auto is_void_element(std::string_view tag) -> bool {
    for (auto candidate : kVoidElements) {
        if (candidate == tag) {
            return true;
        }
    }
    return false;
}

auto is_form_control(std::string_view tag) -> bool {
    return tag == "input" || tag == "textarea" || tag == "select";
}

auto append_escaped(std::string& out, std::string_view text, bool attribute) -> void {
    for (char ch : text) {
        switch (ch) {
        case '&':
            out.append("&amp;");
            break;
        case '<':
            out.append("&lt;");
            break;
        case '>':
            out.append("&gt;");
            break;
        case '"':
            if (attribute) {
                out.append("&quot;");
            } else {
                out.push_back(ch);
            }
            break;
        default:
            out.push_back(ch);
        }
    }
}

auto write_html(std::string& out, Node const& node, HtmlOptions const& options) -> void;

auto write_children(std::string& out, Node const& node, HtmlOptions const& options) -> void {
    for (auto const& child : node.child_nodes()) {
        write_html(out, *child, options);
    }
}

auto write_html(std::string& out, Node const& node, HtmlOptions const& options) -> void {
    switch (node.kind()) {
    case NodeKind::Text:
        append_escaped(out, static_cast<Text const&>(node).data(), false);
        return;
    case NodeKind::Comment:
        if (options.include_comments) {
            out.append("<!--");
            out.append(static_cast<Comment const&>(node).data());
            out.append("-->");
        }
        return;
    case NodeKind::Element:
        break;
    }

    auto const& element = static_cast<Element const&>(node);
    out.push_back('<');
    out.append(element.tag_name());
    for (auto const& [name, value] : element.attributes()) {
        out.push_back(' ');
        out.append(name);
        if (!value.empty()) {
            out.append("=\"");
            append_escaped(out, value, true);
            out.push_back('"');
        }
    }
    out.push_back('>');
    if (is_void_element(element.tag_name())) {
        return;
    }
    write_children(out, node, options);
    out.append("</");
    out.append(element.tag_name());
    out.push_back('>');
}

auto kind_name(NodeKind kind) -> std::string_view {
    switch (kind) {
    case NodeKind::Element:
        return "element";
    case NodeKind::Text:
        return "text";
    case NodeKind::Comment:
        return "comment";
    }
    return "element";
}

auto kind_from_name(std::string_view name) -> std::optional<NodeKind> {
    if (name == "element") {
        return NodeKind::Element;
    }
    if (name == "text") {
        return NodeKind::Text;
    }
    if (name == "comment") {
        return NodeKind::Comment;
    }
    return std::nullopt;
}

[[nodiscard]] auto to_json(NodeSummary const& node) -> nlohmann::json {
    nlohmann::json result{
            {"kind", std::string{kind_name(node.kind)}},
    };
    if (node.kind == NodeKind::Element) {
        result["name"] = node.name;
        if (!node.attributes.empty()) {
            nlohmann::json attributes = nlohmann::json::object();
            for (auto const& [name, value] : node.attributes) {
                attributes[name] = value;
            }
            result["attributes"] = std::move(attributes);
        }
        if (is_form_control(node.name)) {
            result["value"] = node.value;
        }
        if (node.name == "input") {
            result["checked"] = node.checked;
        }
        if (node.listener_count > 0) {
            result["listeners"] = node.listener_count;
        }
        nlohmann::json children = nlohmann::json::array();
        for (auto const& child : node.children) {
            children.push_back(to_json(child));
        }
        result["children"] = std::move(children);
    } else {
        result["text"] = node.text;
    }
    return result;
}

[[nodiscard]] auto node_from_json(nlohmann::json const& json) -> Expected<NodeSummary> {
    if (!json.is_object()) {
        return std::unexpected(Error{Error::Code::MalformedInput, "snapshot node must be an object"});
    }
    auto kind = kind_from_name(json.value("kind", std::string{}));
    if (!kind) {
        return std::unexpected(Error{Error::Code::MalformedInput, "snapshot node has an unknown kind"});
    }

    NodeSummary node;
    node.kind           = *kind;
    node.name           = json.value("name", std::string{});
    node.text           = json.value("text", std::string{});
    node.value          = json.value("value", std::string{});
    node.checked        = json.value("checked", false);
    node.listener_count = json.value("listeners", std::size_t{0});

    if (auto it = json.find("attributes"); it != json.end()) {
        if (!it->is_object()) {
            return std::unexpected(Error{Error::Code::MalformedInput, "snapshot attributes must be an object"});
        }
        for (auto const& [name, value] : it->items()) {
            if (!value.is_string()) {
                return std::unexpected(Error{Error::Code::MalformedInput, "snapshot attribute values must be strings"});
            }
            node.attributes.emplace_back(name, value.get<std::string>());
        }
    }

    if (auto it = json.find("children"); it != json.end()) {
        if (!it->is_array()) {
            return std::unexpected(Error{Error::Code::MalformedInput, "snapshot node children must be an array"});
        }
        node.children.reserve(it->size());
        for (auto const& child : *it) {
            auto parsed = node_from_json(child);
            if (!parsed) {
                return parsed;
            }
            node.children.push_back(std::move(*parsed));
        }
    }
    return node;
}

} // namespace

auto SerializeHtml(Node const& node, HtmlOptions const& options) -> std::string {
    std::string out;
    write_html(out, node, options);
    return out;
}

auto SerializeInnerHtml(Node const& node, HtmlOptions const& options) -> std::string {
    std::string out;
    write_children(out, node, options);
    return out;
}

auto BuildTreeSnapshot(Node const& node) -> NodeSummary {
    NodeSummary summary;
    summary.kind = node.kind();
    switch (node.kind()) {
    case NodeKind::Text:
        summary.text = static_cast<Text const&>(node).data();
        return summary;
    case NodeKind::Comment:
        summary.text = static_cast<Comment const&>(node).data();
        return summary;
    case NodeKind::Element:
        break;
    }

    auto const& element    = static_cast<Element const&>(node);
    summary.name           = element.tag_name();
    summary.attributes     = element.attributes();
    summary.listener_count = element.listener_count();
    if (is_form_control(element.tag_name())) {
        summary.value = element.value();
    }
    summary.checked = element.checked();
    summary.children.reserve(node.child_count());
    for (auto const& child : node.child_nodes()) {
        summary.children.push_back(BuildTreeSnapshot(*child));
    }
    return summary;
}

auto SerializeTreeSnapshot(NodeSummary const& summary, int indent) -> std::string {
    return to_json(summary).dump(indent);
}

auto ParseTreeSnapshot(std::string const& payload) -> Expected<NodeSummary> {
    auto json = nlohmann::json::parse(payload, nullptr, false);
    if (json.is_discarded()) {
        return std::unexpected(Error{Error::Code::MalformedInput, "invalid tree snapshot JSON"});
    }
    return node_from_json(json);
}

} // namespace LT::Platform
