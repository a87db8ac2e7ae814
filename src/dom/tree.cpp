#include <conform/dom/tree.h>

#include <algorithm>
#include <stdexcept>
#include <string>
#include <utility>

namespace conform::dom {

QualName html_name(std::string local) {
    return QualName{Namespace::html(), std::move(local)};
}

Tree::Tree(NodeData root_data) {
    root_ = push(std::move(root_data));
}

Tree Tree::new_document() {
    return Tree(DocumentData{});
}

Tree Tree::new_fragment() {
    return Tree(FragmentData{});
}

NodeId Tree::push(NodeData data) {
    NodeId id = nodes_.size();
    nodes_.push_back(Node{std::move(data), std::nullopt, {}});
    return id;
}

NodeId Tree::create_element(QualName name, std::vector<Attribute> attributes) {
    ElementData element;
    element.name = std::move(name);
    element.attributes.reserve(attributes.size());
    for (auto& attr : attributes) {
        auto dup = std::find_if(element.attributes.begin(), element.attributes.end(),
            [&attr](const Attribute& existing) { return existing.name == attr.name; });
        if (dup == element.attributes.end()) {
            element.attributes.push_back(std::move(attr));
        }
    }
    return push(std::move(element));
}

NodeId Tree::create_text(std::string data) {
    return push(TextData{std::move(data)});
}

NodeId Tree::create_comment(std::string data) {
    return push(CommentData{std::move(data)});
}

NodeId Tree::create_doctype(Doctype doctype) {
    return push(std::move(doctype));
}

std::optional<NodeId> Tree::template_owner(NodeId contents) const {
    for (NodeId id = 0; id < nodes_.size(); ++id) {
        const auto* data = std::get_if<ElementData>(&nodes_[id].data);
        if (data && data->template_contents == contents) {
            return id;
        }
    }
    return std::nullopt;
}

bool Tree::is_inclusive_ancestor(NodeId ancestor, NodeId node) const {
    std::optional<NodeId> current = node;
    while (current) {
        if (*current == ancestor) return true;
        const Node& n = nodes_.at(*current);
        current = n.parent ? n.parent : template_owner(*current);
    }
    return false;
}

void Tree::check_insertion(NodeId parent, NodeId child) const {
    node(parent);
    node(child);
    if (child == root_) {
        throw std::invalid_argument("cannot insert the tree root as a child");
    }
    if (is_inclusive_ancestor(child, parent)) {
        throw std::invalid_argument("node " + std::to_string(child) +
                                    " is an inclusive ancestor of node " + std::to_string(parent));
    }
}

void Tree::append_child(NodeId parent, NodeId child) {
    check_insertion(parent, child);
    detach(child);
    at(child).parent = parent;
    at(parent).children.push_back(child);
}

void Tree::insert_before(NodeId parent, NodeId child, std::optional<NodeId> reference) {
    check_insertion(parent, child);
    detach(child);
    if (reference) {
        auto& siblings = at(parent).children;
        auto it = std::find(siblings.begin(), siblings.end(), *reference);
        if (it != siblings.end()) {
            at(child).parent = parent;
            siblings.insert(it, child);
            return;
        }
    }
    append_child(parent, child);
}

void Tree::detach(NodeId node) {
    Node& n = at(node);
    if (!n.parent) return;

    auto& siblings = at(*n.parent).children;
    auto it = std::find(siblings.begin(), siblings.end(), node);
    if (it != siblings.end()) {
        siblings.erase(it);
    }
    n.parent.reset();
}

void Tree::set_attribute(NodeId element, Attribute attribute) {
    auto* data = std::get_if<ElementData>(&at(element).data);
    if (!data) return;

    for (auto& existing : data->attributes) {
        if (existing.name == attribute.name) {
            existing.value = std::move(attribute.value);
            return;
        }
    }
    data->attributes.push_back(std::move(attribute));
}

NodeId Tree::ensure_template_contents(NodeId element) {
    auto* data = std::get_if<ElementData>(&at(element).data);
    if (!data) return element;
    if (data->template_contents) return *data->template_contents;

    // push() may reallocate the arena, so look the element up again afterwards.
    NodeId contents = push(FragmentData{});
    std::get<ElementData>(nodes_[element].data).template_contents = contents;
    return contents;
}

const ElementData* Tree::element(NodeId id) const {
    return std::get_if<ElementData>(&node(id).data);
}

const TextData* Tree::text(NodeId id) const {
    return std::get_if<TextData>(&node(id).data);
}

} // namespace conform::dom
