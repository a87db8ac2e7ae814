#pragma once
#include <cstddef>
#include <optional>
#include <string>
#include <utility>
#include <variant>
#include <vector>

namespace conform::dom {

using NodeId = std::size_t;

// Namespaces only change how names are printed, never the tree shape.
struct Namespace {
    enum class Kind { Html, Svg, MathMl, Other };

    Kind kind = Kind::Html;
    std::string other;  // set only for Kind::Other, e.g. "xlink"

    static Namespace html() { return {Kind::Html, {}}; }
    static Namespace svg() { return {Kind::Svg, {}}; }
    static Namespace mathml() { return {Kind::MathMl, {}}; }
    static Namespace named(std::string name) { return {Kind::Other, std::move(name)}; }

    bool operator==(const Namespace&) const = default;
};

struct QualName {
    Namespace ns;
    std::string local;

    bool operator==(const QualName& other) const = default;
};

QualName html_name(std::string local);

struct Attribute {
    QualName name;
    std::string value;

    bool operator==(const Attribute& other) const = default;
};

struct Doctype {
    std::string name;
    std::string public_id;
    std::string system_id;

    bool operator==(const Doctype& other) const = default;
};

// ---------------------------------------------------------------------------
// Node payloads
// ---------------------------------------------------------------------------

struct DocumentData {
    bool operator==(const DocumentData&) const = default;
};

struct FragmentData {
    bool operator==(const FragmentData&) const = default;
};

struct ElementData {
    QualName name;
    std::vector<Attribute> attributes;
    std::optional<NodeId> template_contents;

    bool operator==(const ElementData& other) const = default;
};

struct TextData {
    std::string data;
    bool operator==(const TextData& other) const = default;
};

struct CommentData {
    std::string data;
    bool operator==(const CommentData& other) const = default;
};

using NodeData = std::variant<DocumentData, FragmentData, ElementData, TextData, CommentData, Doctype>;

struct Node {
    NodeData data;
    std::optional<NodeId> parent;   // relation only; the tree owns every node
    std::vector<NodeId> children;   // display order
};

// Append-only node arena with a document or fragment root. Ids are indexes
// that stay valid for the life of the tree; detached nodes are never freed.
// Every member taking a NodeId throws std::out_of_range for an unknown id.
class Tree {
public:
    static Tree new_document();
    static Tree new_fragment();

    NodeId root() const { return root_; }
    size_t size() const { return nodes_.size(); }
    bool contains(NodeId id) const { return id < nodes_.size(); }

    const Node& node(NodeId id) const { return nodes_.at(id); }
    const std::vector<Node>& nodes() const { return nodes_; }

    // Creation never attaches the new node.
    // Duplicate attribute names keep the first occurrence.
    NodeId create_element(QualName name, std::vector<Attribute> attributes = {});
    NodeId create_text(std::string data);
    NodeId create_comment(std::string data);
    NodeId create_doctype(Doctype doctype);

    // A child that already has a parent is detached from it first.
    // Throws std::invalid_argument when `child` is the root or an inclusive
    // ancestor of `parent`; the tree is left unchanged.
    void append_child(NodeId parent, NodeId child);

    // Inserts before `reference` when it is a child of `parent`; otherwise
    // appends. Rejects the same edits as append_child.
    void insert_before(NodeId parent, NodeId child, std::optional<NodeId> reference);

    // Unlinks `node` from its parent. Its own subtree stays attached to it.
    void detach(NodeId node);

    // Overwrites the value of an attribute with an equal qualified name in
    // place, or appends. No-op for non-elements.
    void set_attribute(NodeId element, Attribute attribute);

    // Returns the element's template contents fragment, creating it on the
    // first call. For a non-element the id itself is returned unchanged.
    NodeId ensure_template_contents(NodeId element);

    // Convenience accessors; nullptr when the node has another kind.
    const ElementData* element(NodeId id) const;
    const TextData* text(NodeId id) const;

private:
    explicit Tree(NodeData root_data);

    NodeId push(NodeData data);
    void check_insertion(NodeId parent, NodeId child) const;
    // Walks parent links, crossing from template contents to their element.
    bool is_inclusive_ancestor(NodeId ancestor, NodeId node) const;
    std::optional<NodeId> template_owner(NodeId contents) const;
    Node& at(NodeId id) { return nodes_.at(id); }

    std::vector<Node> nodes_;
    NodeId root_ = 0;
};

} // namespace conform::dom
