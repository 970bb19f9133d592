#include <livetree/dom/KeyedList.hpp>
#include <livetree/dom/Nodes.hpp>

#include <livetree/core/Error.hpp>
#include <livetree/core/RuntimeFlags.hpp>
#include <livetree/platform/Document.hpp>

#include "log/TaggedLogger.hpp"

namespace LT::Dom {

namespace {

constexpr std::string_view kGroupEndMarker = "Mark the end of a grouped node list";

auto document_of(Platform::Node const& parent) -> Platform::Document& {
    auto const& document = parent.owner_document();
    if (!document) {
        contract_violation("parent node has no owner document");
    }
    return *document;
}

auto slot_kind(NodeSlot::Value const& value) -> char const* {
    switch (value.index()) {
    case 0:
        return "element";
    case 1:
        return "text node";
    case 2:
        return "grouped node list";
    case 3:
        return "component";
    }
    return "unknown";
}

auto live_child_at(Platform::Node const& live_parent, std::size_t& cursor) -> Platform::NodePtr const& {
    auto const& children = live_parent.child_nodes();
    if (cursor >= children.size()) {
        contract_violation("cloned live node has fewer children than its slot structure");
    }
    return children[cursor++];
}

} // namespace

// Nodes ----------------------------------------------------------------------

Nodes::Nodes()                            = default;
Nodes::~Nodes()                           = default;
Nodes::Nodes(Nodes&&) noexcept            = default;
Nodes& Nodes::operator=(Nodes&&) noexcept = default;

auto Nodes::count() const -> std::size_t {
    return slots_.size();
}

auto Nodes::check_or_create_element(std::string_view                tag,
                                    std::optional<std::string_view> namespace_uri,
                                    std::size_t                     index,
                                    ElementStatus                   parent_status,
                                    Platform::Node&                 parent,
                                    Platform::NodePtr const&        next_sibling) -> ElementStatus {
    if (index == slots_.size()) {
        auto element = Element::create(document_of(parent), namespace_uri, tag);
        element.insert_before(parent, next_sibling);
        slots_.emplace_back(std::move(element));
        return ElementStatus::JustCreated;
    }
    if (index > slots_.size()) {
        contract_violation("element visited at index " + std::to_string(index) + " but only " + std::to_string(slots_.size())
                           + " nodes exist");
    }
    return parent_status;
}

auto Nodes::check_or_create_element_for_list(std::string_view                tag,
                                             std::optional<std::string_view> namespace_uri,
                                             std::size_t                     index,
                                             Platform::Node&                 parent,
                                             Platform::NodePtr const&        next_sibling,
                                             bool                            use_template) -> ElementStatus {
    auto const item_count = slots_.size();
    if (index < item_count) {
        return ElementStatus::Existing;
    }
    if (index > item_count) {
        contract_violation("list item visited at index " + std::to_string(index) + " but only " + std::to_string(item_count)
                           + " items exist");
    }
    if (use_template && item_count > 0 && CurrentRuntimeFlags().template_cloning) {
        auto element = element_at(0).clone();
        element.insert_before(parent, next_sibling);
        slots_.emplace_back(std::move(element));
        return ElementStatus::JustCloned;
    }
    auto element = Element::create(document_of(parent), namespace_uri, tag);
    element.insert_before(parent, next_sibling);
    slots_.emplace_back(std::move(element));
    return ElementStatus::JustCreated;
}

auto Nodes::element_at(std::size_t index) -> Element& {
    if (index >= slots_.size()) {
        contract_violation("no node at index " + std::to_string(index));
    }
    auto& value = slots_[index].value();
    auto* element = std::get_if<Element>(&value);
    if (element == nullptr) {
        contract_violation("node " + std::to_string(index) + " is a " + slot_kind(value) + ", expected an element");
    }
    return *element;
}

auto Nodes::static_text(std::size_t index, std::string_view text, Platform::Node& parent, Platform::NodePtr const& next_sibling) -> void {
    if (index == slots_.size()) {
        add_text_node(text, parent, next_sibling);
        return;
    }
    if (index > slots_.size() || !std::holds_alternative<TextNode>(slots_[index].value())) {
        contract_violation("static text at index " + std::to_string(index) + " does not match a text node");
    }
}

auto Nodes::update_text(std::size_t index, std::string_view text, Platform::Node& parent, Platform::NodePtr const& next_sibling) -> void {
    if (index == slots_.size()) {
        add_text_node(text, parent, next_sibling);
        return;
    }
    if (index > slots_.size()) {
        contract_violation("text visited at index " + std::to_string(index) + " but only " + std::to_string(slots_.size())
                           + " nodes exist");
    }
    auto& value     = slots_[index].value();
    auto* text_node = std::get_if<TextNode>(&value);
    if (text_node == nullptr) {
        contract_violation("node " + std::to_string(index) + " is a " + slot_kind(value) + ", expected a text node");
    }
    text_node->update_text(text);
}

auto Nodes::add_text_node(std::string_view text, Platform::Node& parent, Platform::NodePtr const& next_sibling) -> void {
    auto live = document_of(parent).create_text_node(text);
    expect_ok(parent.insert_before(live, next_sibling), "Dom::Nodes::add_text_node");
    slots_.emplace_back(TextNode{std::move(live), std::string{text}});
}

auto Nodes::grouped_nodes(std::size_t index, Platform::Node& parent, Platform::NodePtr const& next_sibling) -> GroupedNodes& {
    if (index == slots_.size()) {
        auto marker = document_of(parent).create_comment(kGroupEndMarker);
        expect_ok(parent.insert_before(marker, next_sibling), "Dom::Nodes::grouped_nodes");
        slots_.emplace_back(GroupedNodes{std::move(marker)});
    }
    if (index >= slots_.size()) {
        contract_violation("grouped nodes visited at index " + std::to_string(index) + " but only "
                           + std::to_string(slots_.size()) + " nodes exist");
    }
    auto& value   = slots_[index].value();
    auto* grouped = std::get_if<GroupedNodes>(&value);
    if (grouped == nullptr) {
        contract_violation("node " + std::to_string(index) + " is a " + slot_kind(value) + ", expected a grouped node list");
    }
    return *grouped;
}

auto Nodes::store_component_handle(std::unique_ptr<ComponentHandleBase> handle) -> void {
    if (slots_.empty()) {
        slots_.emplace_back(ComponentSlot{std::move(handle)});
    } else {
        slots_.front() = NodeSlot{ComponentSlot{std::move(handle)}};
    }
}

auto Nodes::clear(Platform::Node& parent) -> void {
    for (auto& slot : slots_) {
        slot.clear(parent);
    }
    slots_.clear();
}

auto Nodes::clear_after(std::size_t index, Platform::Node& parent) -> void {
    if (index >= slots_.size()) {
        return;
    }
    for (auto i = index; i < slots_.size(); ++i) {
        slots_[i].clear(parent);
    }
    slots_.erase(slots_.begin() + static_cast<std::ptrdiff_t>(index), slots_.end());
}

auto Nodes::append_to(Platform::Node& parent) const -> void {
    for (auto const& slot : slots_) {
        slot.append_to(parent);
    }
}

auto Nodes::clone_onto(Platform::Node const& live_parent, std::size_t& cursor) const -> Nodes {
    Nodes copy;
    copy.slots_.reserve(slots_.size());
    for (auto const& slot : slots_) {
        auto const& value = slot.value();
        if (auto const* element = std::get_if<Element>(&value)) {
            auto live = Platform::as_element(live_child_at(live_parent, cursor));
            if (!live) {
                contract_violation("cloned live node does not match an element slot");
            }
            copy.slots_.emplace_back(element->clone_onto(std::move(live)));
        } else if (auto const* text = std::get_if<TextNode>(&value)) {
            auto live = Platform::as_text(live_child_at(live_parent, cursor));
            if (!live) {
                contract_violation("cloned live node does not match a text slot");
            }
            copy.slots_.emplace_back(TextNode{std::move(live), text->text()});
        } else if (auto const* grouped = std::get_if<GroupedNodes>(&value)) {
            copy.slots_.emplace_back(grouped->clone_onto(live_parent, cursor));
        } else {
            contract_violation("an element holding a mounted component cannot be cloned");
        }
    }
    return copy;
}

// Element --------------------------------------------------------------------

Element::Element(Platform::ElementPtr live)
    : live_(std::move(live)) {}

Element::~Element()                             = default;
Element::Element(Element&&) noexcept            = default;
Element& Element::operator=(Element&&) noexcept = default;

auto Element::create(Platform::Document& document, std::optional<std::string_view> namespace_uri, std::string_view tag) -> Element {
    return Element{document.create_element_ns(namespace_uri, tag)};
}

auto Element::keyed_list() -> KeyedList& {
    if (!keyed_list_) {
        keyed_list_ = std::make_unique<KeyedList>();
    }
    return *keyed_list_;
}

auto Element::is_empty() const -> bool {
    return nodes_.empty() && (!keyed_list_ || keyed_list_->active_count() == 0);
}

auto Element::clone() const -> Element {
    if (keyed_list_) {
        contract_violation("an element that owns a keyed list cannot be cloned");
    }
    auto live = Platform::as_element(live_->clone_node(true));
    return clone_onto(std::move(live));
}

auto Element::clone_onto(Platform::ElementPtr live) const -> Element {
    if (keyed_list_) {
        contract_violation("an element that owns a keyed list cannot be cloned");
    }
    Element     copy{std::move(live)};
    std::size_t cursor = 0;
    copy.attributes_   = attributes_.clone_without_listeners();
    copy.nodes_        = nodes_.clone_onto(*copy.live_, cursor);
    return copy;
}

auto Element::replace_live(Platform::ElementPtr live) -> void {
    if (live == live_) {
        return;
    }
    nodes_.append_to(*live);
    if (keyed_list_) {
        keyed_list_->append_to(*live);
    }
    attributes_.clear();
    live_ = std::move(live);
}

auto Element::insert_before(Platform::Node& parent, Platform::NodePtr const& next_sibling) const -> void {
    expect_ok(parent.insert_before(live_, next_sibling), "Dom::Element::insert_before");
}

auto Element::append_to(Platform::Node& parent) const -> void {
    expect_ok(parent.append_child(live_), "Dom::Element::append_to");
}

auto Element::remove_from(Platform::Node& parent) const -> void {
    expect_ok(parent.remove_child(live_), "Dom::Element::remove_from");
}

// TextNode -------------------------------------------------------------------

TextNode::TextNode(Platform::TextPtr live, std::string text)
    : live_(std::move(live)), text_(std::move(text)) {}

auto TextNode::update_text(std::string_view text) -> void {
    if (text_ == text) {
        return;
    }
    text_.assign(text);
    live_->set_data(text);
}

// GroupedNodes ---------------------------------------------------------------

GroupedNodes::GroupedNodes(Platform::CommentPtr end_marker)
    : end_marker_(std::move(end_marker)) {}

GroupedNodes::~GroupedNodes()                                  = default;
GroupedNodes::GroupedNodes(GroupedNodes&&) noexcept            = default;
GroupedNodes& GroupedNodes::operator=(GroupedNodes&&) noexcept = default;

auto GroupedNodes::set_active_index(std::uint32_t index, Platform::Node& parent) -> ElementStatus {
    if (active_index_ == index) {
        return ElementStatus::Existing;
    }
    if (active_index_) {
        lt_log("match-if switches arm " + std::to_string(*active_index_) + " -> " + std::to_string(index), "Reconciler");
    }
    clear_content(parent);
    active_index_ = index;
    return ElementStatus::JustCreated;
}

auto GroupedNodes::keyed_list() -> KeyedList& {
    if (!keyed_list_) {
        keyed_list_ = std::make_unique<KeyedList>();
    }
    return *keyed_list_;
}

auto GroupedNodes::clear_content(Platform::Node& parent) -> void {
    nodes_.clear(parent);
    if (keyed_list_) {
        keyed_list_->remove_from_dom(parent);
        keyed_list_.reset();
    }
}

auto GroupedNodes::clear(Platform::Node& parent) -> void {
    clear_content(parent);
    expect_ok(parent.remove_child(end_marker_), "Dom::GroupedNodes::clear");
}

auto GroupedNodes::append_to(Platform::Node& parent) const -> void {
    nodes_.append_to(parent);
    if (keyed_list_) {
        keyed_list_->append_to(parent);
    }
    expect_ok(parent.append_child(end_marker_), "Dom::GroupedNodes::append_to");
}

auto GroupedNodes::clone_onto(Platform::Node const& live_parent, std::size_t& cursor) const -> GroupedNodes {
    if (keyed_list_) {
        contract_violation("a keyed list cannot be cloned");
    }
    auto nodes  = nodes_.clone_onto(live_parent, cursor);
    auto marker = live_child_at(live_parent, cursor);
    if (marker->kind() != Platform::NodeKind::Comment) {
        contract_violation("cloned live node does not match a grouped node end marker");
    }
    GroupedNodes copy{std::static_pointer_cast<Platform::Comment>(marker)};
    copy.active_index_ = active_index_;
    copy.nodes_        = std::move(nodes);
    return copy;
}

// NodeSlot -------------------------------------------------------------------

auto NodeSlot::clear(Platform::Node& parent) -> void {
    if (auto* element = std::get_if<Element>(&value_)) {
        element->remove_from(parent);
    } else if (auto* text = std::get_if<TextNode>(&value_)) {
        expect_ok(parent.remove_child(text->live()), "Dom::NodeSlot::clear");
    } else if (auto* grouped = std::get_if<GroupedNodes>(&value_)) {
        grouped->clear(parent);
    } else if (auto* component = std::get_if<ComponentSlot>(&value_)) {
        component->handle.reset();
    }
}

auto NodeSlot::append_to(Platform::Node& parent) const -> void {
    if (auto const* element = std::get_if<Element>(&value_)) {
        element->append_to(parent);
    } else if (auto const* text = std::get_if<TextNode>(&value_)) {
        expect_ok(parent.append_child(text->live()), "Dom::NodeSlot::append_to");
    } else if (auto const* grouped = std::get_if<GroupedNodes>(&value_)) {
        grouped->append_to(parent);
    }
}

} // namespace LT::Dom
