#include <conform/serialize/test_format.h>
#include <conform/core/text.h>

#include <algorithm>
#include <variant>
#include <vector>

namespace conform::serialize {

namespace {

struct SortedAttribute {
    std::u16string key;
    std::string display;
    const std::string* value;
};

std::vector<SortedAttribute> sort_attributes(const std::vector<dom::Attribute>& attributes) {
    std::vector<SortedAttribute> sorted;
    sorted.reserve(attributes.size());
    for (const auto& attr : attributes) {
        std::string display = display_name(attr.name);
        std::u16string key = core::utf8_to_utf16(display);
        sorted.push_back({std::move(key), std::move(display), &attr.value});
    }
    // Stable, so equal display names keep insertion order.
    std::stable_sort(sorted.begin(), sorted.end(),
        [](const SortedAttribute& a, const SortedAttribute& b) { return a.key < b.key; });
    return sorted;
}

bool is_html_template(const dom::ElementData& element) {
    return element.name.ns.kind == dom::Namespace::Kind::Html && element.name.local == "template";
}

class TestFormatWriter {
public:
    explicit TestFormatWriter(const dom::Tree& tree) : tree_(tree) {}

    void write(dom::NodeId id, size_t indent) {
        const dom::Node& node = tree_.node(id);
        std::visit([&](const auto& data) { write_node(node, data, indent); }, node.data);
    }

    std::string take() { return core::join_lines(lines_); }

private:
    const dom::Tree& tree_;
    std::vector<std::string> lines_;

    void line(size_t indent, std::string_view content) {
        std::string out = "| ";
        out.append(indent, ' ');
        out += content;
        lines_.push_back(std::move(out));
    }

    void write_children(const dom::Node& node, size_t indent) {
        for (dom::NodeId child : node.children) {
            write(child, indent);
        }
    }

    void write_node(const dom::Node& node, const dom::DocumentData&, size_t indent) {
        write_children(node, indent);
    }

    void write_node(const dom::Node& node, const dom::FragmentData&, size_t indent) {
        write_children(node, indent);
    }

    void write_node(const dom::Node&, const dom::Doctype& doctype, size_t indent) {
        if (doctype.public_id.empty() && doctype.system_id.empty()) {
            line(indent, "<!DOCTYPE " + doctype.name + ">");
            return;
        }
        line(indent, "<!DOCTYPE " + doctype.name + " \"" + doctype.public_id + "\" \"" +
                         doctype.system_id + "\">");
    }

    void write_node(const dom::Node&, const dom::CommentData& comment, size_t indent) {
        line(indent, "<!-- " + comment.data + " -->");
    }

    void write_node(const dom::Node&, const dom::TextData& text, size_t indent) {
        line(indent, "\"" + text.data + "\"");
    }

    void write_node(const dom::Node& node, const dom::ElementData& element, size_t indent) {
        line(indent, "<" + display_name(element.name) + ">");
        for (const auto& attr : sort_attributes(element.attributes)) {
            line(indent + 2, attr.display + "=\"" + *attr.value + "\"");
        }

        if (is_html_template(element) && element.template_contents) {
            line(indent + 2, "content");
            write_children(tree_.node(*element.template_contents), indent + 4);
            return;
        }
        write_children(node, indent + 2);
    }
};

} // namespace

std::string_view namespace_prefix(const dom::Namespace& ns) {
    switch (ns.kind) {
        case dom::Namespace::Kind::Html:   return "";
        case dom::Namespace::Kind::Svg:    return "svg ";
        case dom::Namespace::Kind::MathMl: return "math ";
        case dom::Namespace::Kind::Other:
            if (ns.other == "xlink") return "xlink ";
            if (ns.other == "xml") return "xml ";
            if (ns.other == "xmlns") return "xmlns ";
            return "";
    }
    return "";
}

std::string display_name(const dom::QualName& name) {
    std::string result(namespace_prefix(name.ns));
    result += name.local;
    return result;
}

std::string to_test_format(const dom::Tree& tree, dom::NodeId root) {
    TestFormatWriter writer(tree);
    writer.write(root, 0);
    return writer.take();
}

std::string to_test_format(const dom::Tree& tree) {
    return to_test_format(tree, tree.root());
}

std::string normalize_tree_text(std::string_view text) {
    std::vector<std::string_view> lines = core::split_lines(core::trim(text));
    for (auto& l : lines) {
        l = core::trim_end(l);
    }
    return core::join_lines(lines);
}

} // namespace conform::serialize
