#include <livetree/platform/Document.hpp>
#include <livetree/platform/LiveNode.hpp>

#include <algorithm>

namespace LT::Platform {

namespace {

auto is_valid_token(std::string_view name) -> bool {
    if (name.empty()) {
        return false;
    }
    return std::none_of(name.begin(), name.end(), [](char ch) {
        return ch == ' ' || ch == '\t' || ch == '\n' || ch == '\r' || ch == '\f' || ch == '=';
    });
}

auto split_classes(std::string_view text) -> std::vector<std::string_view> {
    std::vector<std::string_view> classes;
    std::size_t                   pos = 0;
    while (pos < text.size()) {
        auto start = text.find_first_not_of(" \t\n\r\f", pos);
        if (start == std::string_view::npos) {
            break;
        }
        auto end = text.find_first_of(" \t\n\r\f", start);
        if (end == std::string_view::npos) {
            end = text.size();
        }
        classes.push_back(text.substr(start, end - start));
        pos = end;
    }
    return classes;
}

auto join_classes(std::vector<std::string_view> const& classes) -> std::string {
    std::string joined;
    for (auto const& name : classes) {
        if (!joined.empty()) {
            joined.push_back(' ');
        }
        joined.append(name);
    }
    return joined;
}

auto option_value(Element const& option) -> std::string {
    if (auto attr = option.get_attribute("value")) {
        return *attr;
    }
    return option.text_content();
}

} // namespace

// ListenerTable --------------------------------------------------------------

auto ListenerTable::add(std::string type, EventHandler handler) -> std::uint64_t {
    auto id = next_id_++;
    entries_.push_back(Entry{id, std::move(type), std::make_shared<EventHandler>(std::move(handler))});
    return id;
}

auto ListenerTable::remove(std::uint64_t id) -> bool {
    auto it = std::find_if(entries_.begin(), entries_.end(), [id](Entry const& entry) { return entry.id == id; });
    if (it == entries_.end()) {
        return false;
    }
    entries_.erase(it);
    return true;
}

auto ListenerTable::contains(std::uint64_t id) const -> bool {
    return std::any_of(entries_.begin(), entries_.end(), [id](Entry const& entry) { return entry.id == id; });
}

auto ListenerTable::handlers_for(std::string_view type) const -> std::vector<std::shared_ptr<EventHandler>> {
    std::vector<std::shared_ptr<EventHandler>> handlers;
    for (auto const& entry : entries_) {
        if (entry.type == type) {
            handlers.push_back(entry.handler);
        }
    }
    return handlers;
}

auto ListenerTable::count(std::string_view type) const -> std::size_t {
    return static_cast<std::size_t>(
            std::count_if(entries_.begin(), entries_.end(), [type](Entry const& entry) { return entry.type == type; }));
}

ListenerRegistration::ListenerRegistration(std::weak_ptr<ListenerTable> table, std::uint64_t id, std::string type)
    : table_(std::move(table)), id_(id), type_(std::move(type)) {}

ListenerRegistration::~ListenerRegistration() {
    if (auto table = table_.lock()) {
        table->remove(id_);
    }
}

auto ListenerRegistration::active() const -> bool {
    auto table = table_.lock();
    return table && table->contains(id_);
}

// Node -----------------------------------------------------------------------

Node::Node(NodeKind kind, std::shared_ptr<Document> document)
    : kind_(kind), document_(std::move(document)) {}

auto Node::first_child() const -> NodePtr {
    return children_.empty() ? nullptr : children_.front();
}

auto Node::last_child() const -> NodePtr {
    return children_.empty() ? nullptr : children_.back();
}

auto Node::index_in_parent() const -> std::optional<std::size_t> {
    auto parent = parent_.lock();
    if (!parent) {
        return std::nullopt;
    }
    auto const& siblings = parent->children_;
    for (std::size_t i = 0; i < siblings.size(); ++i) {
        if (siblings[i].get() == this) {
            return i;
        }
    }
    return std::nullopt;
}

auto Node::next_sibling() const -> NodePtr {
    auto index = index_in_parent();
    if (!index) {
        return nullptr;
    }
    auto const& siblings = parent_.lock()->children_;
    return *index + 1 < siblings.size() ? siblings[*index + 1] : nullptr;
}

auto Node::previous_sibling() const -> NodePtr {
    auto index = index_in_parent();
    if (!index || *index == 0) {
        return nullptr;
    }
    return parent_.lock()->children_[*index - 1];
}

auto Node::contains(Node const* other) const -> bool {
    if (other == this) {
        return true;
    }
    return std::any_of(children_.begin(), children_.end(), [other](NodePtr const& child) { return child->contains(other); });
}

auto Node::append_child(NodePtr const& child) -> Expected<void> {
    return insert_before(child, nullptr);
}

auto Node::insert_before(NodePtr const& child, NodePtr const& reference) -> Expected<void> {
    if (kind_ != NodeKind::Element) {
        return std::unexpected(Error{Error::Code::InvalidHierarchy, "only elements have children"});
    }
    if (!child) {
        return std::unexpected(Error{Error::Code::InvalidArgument, "null child"});
    }
    if (child->contains(this)) {
        return std::unexpected(Error{Error::Code::InvalidHierarchy, "node would become its own descendant"});
    }
    if (reference && reference->parent_.lock().get() != this) {
        return std::unexpected(Error{Error::Code::NotFound, "reference is not a child of this node"});
    }
    if (reference == child) {
        return {};
    }

    child->detach_from_parent();
    auto position = children_.end();
    if (reference) {
        position = std::find(children_.begin(), children_.end(), reference);
    }
    children_.insert(position, child);
    child->parent_ = weak_from_this();
    record(MutationKind::Insert);
    return {};
}

auto Node::remove_child(NodePtr const& child) -> Expected<void> {
    auto it = std::find(children_.begin(), children_.end(), child);
    if (!child || it == children_.end()) {
        return std::unexpected(Error{Error::Code::NotFound, "node is not a child of this node"});
    }
    children_.erase(it);
    child->parent_.reset();
    record(MutationKind::Removal);
    return {};
}

auto Node::detach_from_parent() -> void {
    auto parent = parent_.lock();
    if (!parent) {
        return;
    }
    auto& siblings = parent->children_;
    auto  it       = std::find_if(siblings.begin(), siblings.end(), [this](NodePtr const& node) { return node.get() == this; });
    if (it != siblings.end()) {
        siblings.erase(it);
    }
    parent_.reset();
}

auto Node::remove_all_children() -> void {
    for (auto& child : children_) {
        child->parent_.reset();
    }
    children_.clear();
}

auto Node::text_content() const -> std::string {
    std::string text;
    for (auto const& child : children_) {
        text.append(child->text_content());
    }
    return text;
}

auto Node::set_text_content(std::optional<std::string_view> text) -> void {
    remove_all_children();
    if (text && !text->empty()) {
        auto node     = std::make_shared<Text>(document_, std::string{*text});
        node->parent_ = weak_from_this();
        children_.push_back(std::move(node));
    }
}

auto Node::clone_node(bool deep) const -> NodePtr {
    auto copy = clone_self();
    if (deep) {
        clone_children_into(*copy);
    }
    record(MutationKind::Clone);
    return copy;
}

auto Node::clone_children_into(Node& target) const -> void {
    for (auto const& child : children_) {
        auto copy = child->clone_self();
        child->clone_children_into(*copy);
        copy->parent_ = target.weak_from_this();
        target.children_.push_back(std::move(copy));
    }
}

auto Node::record(MutationKind kind, std::string_view detail) const -> void {
    if (document_) {
        document_->record(kind, detail);
    }
}

// Element --------------------------------------------------------------------

Element::Element(std::shared_ptr<Document> document, std::string tag, std::optional<std::string> namespace_uri)
    : Node(NodeKind::Element, std::move(document)),
      tag_(std::move(tag)),
      namespace_uri_(std::move(namespace_uri)),
      listeners_(std::make_shared<ListenerTable>()) {}

auto Element::set_attribute(std::string_view name, std::string_view value) -> Expected<void> {
    if (!is_valid_token(name)) {
        return std::unexpected(Error{Error::Code::InvalidArgument, "invalid attribute name '" + std::string{name} + "'"});
    }
    auto it = std::find_if(attributes_.begin(), attributes_.end(), [name](auto const& attr) { return attr.first == name; });
    if (it == attributes_.end()) {
        attributes_.emplace_back(std::string{name}, std::string{value});
    } else {
        it->second.assign(value);
    }
    record(MutationKind::AttributeWrite, name);
    return {};
}

auto Element::remove_attribute(std::string_view name) -> void {
    std::erase_if(attributes_, [name](auto const& attr) { return attr.first == name; });
    record(MutationKind::AttributeRemoval, name);
}

auto Element::get_attribute(std::string_view name) const -> std::optional<std::string> {
    auto it = std::find_if(attributes_.begin(), attributes_.end(), [name](auto const& attr) { return attr.first == name; });
    if (it == attributes_.end()) {
        return std::nullopt;
    }
    return it->second;
}

auto Element::has_attribute(std::string_view name) const -> bool {
    return get_attribute(name).has_value();
}

auto Element::class_list_add(std::string_view name) -> Expected<void> {
    if (!is_valid_token(name)) {
        return std::unexpected(Error{Error::Code::InvalidArgument, "invalid class name '" + std::string{name} + "'"});
    }
    auto current = get_attribute("class").value_or("");
    auto classes = split_classes(current);
    if (std::find(classes.begin(), classes.end(), name) == classes.end()) {
        classes.push_back(name);
        auto joined = join_classes(classes);
        auto it     = std::find_if(attributes_.begin(), attributes_.end(), [](auto const& attr) { return attr.first == "class"; });
        if (it == attributes_.end()) {
            attributes_.emplace_back("class", std::move(joined));
        } else {
            it->second = std::move(joined);
        }
    }
    record(MutationKind::ClassWrite, name);
    return {};
}

auto Element::class_list_remove(std::string_view name) -> Expected<void> {
    if (!is_valid_token(name)) {
        return std::unexpected(Error{Error::Code::InvalidArgument, "invalid class name '" + std::string{name} + "'"});
    }
    auto current = get_attribute("class");
    if (current) {
        auto classes = split_classes(*current);
        std::erase(classes, name);
        auto joined = join_classes(classes);
        for (auto& attr : attributes_) {
            if (attr.first == "class") {
                attr.second = std::move(joined);
                break;
            }
        }
    }
    record(MutationKind::ClassWrite, name);
    return {};
}

auto Element::class_list_contains(std::string_view name) const -> bool {
    auto current = get_attribute("class");
    if (!current) {
        return false;
    }
    auto classes = split_classes(*current);
    return std::find(classes.begin(), classes.end(), name) != classes.end();
}

auto Element::id() const -> std::string {
    return get_attribute("id").value_or("");
}

auto Element::set_id(std::string_view id) -> void {
    expect_ok(set_attribute("id", id), "Element::set_id");
}

auto Element::collect_options(std::vector<Element const*>& out) const -> void {
    for (auto const& child : children_) {
        if (child->kind() != NodeKind::Element) {
            continue;
        }
        auto const& element = static_cast<Element const&>(*child);
        if (element.tag_ == "option") {
            out.push_back(&element);
        } else {
            element.collect_options(out);
        }
    }
}

auto Element::selected_index() const -> std::optional<std::size_t> {
    if (tag_ != "select") {
        return std::nullopt;
    }
    std::vector<Element const*> options;
    collect_options(options);
    if (options.empty()) {
        return std::nullopt;
    }
    if (selected_option_value_) {
        for (std::size_t i = 0; i < options.size(); ++i) {
            if (option_value(*options[i]) == *selected_option_value_) {
                return i;
            }
        }
    }
    return 0;
}

auto Element::value() const -> std::string {
    if (tag_ == "input" || tag_ == "textarea") {
        return value_;
    }
    if (tag_ == "select") {
        std::vector<Element const*> options;
        collect_options(options);
        auto index = selected_index();
        return index ? option_value(*options[*index]) : std::string{};
    }
    return get_attribute("value").value_or("");
}

auto Element::set_value(std::string_view value) -> Expected<void> {
    if (tag_ == "input" || tag_ == "textarea") {
        value_.assign(value);
        record(MutationKind::PropertyWrite, "value");
        return {};
    }
    if (tag_ == "select") {
        // A value without a matching option leaves nothing selected; the
        // select then reports its first option.
        std::vector<Element const*> options;
        collect_options(options);
        auto match = std::find_if(options.begin(), options.end(), [value](Element const* option) { return option_value(*option) == value; });
        if (match != options.end()) {
            selected_option_value_ = std::string{value};
        } else {
            selected_option_value_.reset();
        }
        record(MutationKind::PropertyWrite, "value");
        return {};
    }
    return std::unexpected(Error{Error::Code::NotSupported, "<" + tag_ + "> has no value property"});
}

auto Element::set_checked(bool checked) -> Expected<void> {
    if (tag_ != "input") {
        return std::unexpected(Error{Error::Code::NotSupported, "<" + tag_ + "> has no checked property"});
    }
    checked_ = checked;
    record(MutationKind::PropertyWrite, "checked");
    return {};
}

auto Element::focus() -> void {
    if (document_) {
        document_->set_active_element(std::static_pointer_cast<Element>(shared_from_this()));
    }
}

auto Element::add_event_listener(std::string type, EventHandler handler) -> ListenerHandle {
    auto id = listeners_->add(type, std::move(handler));
    record(MutationKind::ListenerBind, type);
    return std::make_shared<ListenerRegistration>(listeners_, id, std::move(type));
}

auto Element::dispatch_event(Event event) -> std::size_t {
    event.target  = weak_from_this();
    auto handlers = listeners_->handlers_for(event.type);
    for (auto const& handler : handlers) {
        (*handler)(event);
    }
    return handlers.size();
}

auto Element::listener_count(std::string_view type) const -> std::size_t {
    return listeners_->count(type);
}

auto Element::listener_count() const -> std::size_t {
    return listeners_->size();
}

auto Element::set_text_content(std::optional<std::string_view> text) -> void {
    Node::set_text_content(text);
    record(MutationKind::TextWrite, "textContent");
}

auto Element::clone_self() const -> NodePtr {
    auto copy                    = std::make_shared<Element>(document_, tag_, namespace_uri_);
    copy->attributes_            = attributes_;
    copy->value_                 = value_;
    copy->selected_option_value_ = selected_option_value_;
    copy->checked_               = checked_;
    return copy;
}

// Text / Comment -------------------------------------------------------------

Text::Text(std::shared_ptr<Document> document, std::string data)
    : Node(NodeKind::Text, std::move(document)), data_(std::move(data)) {}

auto Text::set_data(std::string_view data) -> void {
    data_.assign(data);
    record(MutationKind::TextWrite, "data");
}

auto Text::set_text_content(std::optional<std::string_view> text) -> void {
    set_data(text.value_or(std::string_view{}));
}

auto Text::clone_self() const -> NodePtr {
    return std::make_shared<Text>(document_, data_);
}

Comment::Comment(std::shared_ptr<Document> document, std::string data)
    : Node(NodeKind::Comment, std::move(document)), data_(std::move(data)) {}

auto Comment::clone_self() const -> NodePtr {
    return std::make_shared<Comment>(document_, data_);
}

} // namespace LT::Platform
