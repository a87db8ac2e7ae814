#include <conform/dom/tree.h>

#include <gtest/gtest.h>

#include <stdexcept>
#include <vector>

using namespace conform::dom;

// ---------------------------------------------------------------------------
// Roots and creation
// ---------------------------------------------------------------------------
TEST(TreeTest, NewDocumentHasSingleRoot) {
    Tree tree = Tree::new_document();
    EXPECT_EQ(tree.size(), 1u);
    EXPECT_TRUE(std::holds_alternative<DocumentData>(tree.node(tree.root()).data));
    EXPECT_FALSE(tree.node(tree.root()).parent.has_value());
}

TEST(TreeTest, NewFragmentRoot) {
    Tree tree = Tree::new_fragment();
    EXPECT_TRUE(std::holds_alternative<FragmentData>(tree.node(tree.root()).data));
}

TEST(TreeTest, CreatedNodesAreDetached) {
    Tree tree = Tree::new_document();
    NodeId text = tree.create_text("hi");
    EXPECT_FALSE(tree.node(text).parent.has_value());
    EXPECT_TRUE(tree.node(tree.root()).children.empty());
    ASSERT_NE(tree.text(text), nullptr);
    EXPECT_EQ(tree.text(text)->data, "hi");
    EXPECT_EQ(tree.element(text), nullptr);
}

TEST(TreeTest, DuplicateAttributesKeepFirst) {
    Tree tree = Tree::new_document();
    NodeId el = tree.create_element(html_name("p"), {{html_name("id"), "a"},
                                                     {html_name("id"), "b"},
                                                     {QualName{Namespace::svg(), "id"}, "c"}});
    const ElementData* data = tree.element(el);
    ASSERT_NE(data, nullptr);
    ASSERT_EQ(data->attributes.size(), 2u);
    EXPECT_EQ(data->attributes[0].value, "a");
    EXPECT_EQ(data->attributes[1].value, "c");
}

TEST(TreeTest, UnknownIdThrows) {
    Tree tree = Tree::new_document();
    EXPECT_FALSE(tree.contains(7));
    EXPECT_THROW(tree.node(7), std::out_of_range);
    EXPECT_THROW(tree.append_child(tree.root(), 7), std::out_of_range);
    EXPECT_THROW(tree.append_child(9, tree.root()), std::out_of_range);
}

// ---------------------------------------------------------------------------
// Structure mutation
// ---------------------------------------------------------------------------
TEST(TreeTest, AppendChildSetsParentAndOrder) {
    Tree tree = Tree::new_document();
    NodeId a = tree.create_comment("a");
    NodeId b = tree.create_comment("b");
    tree.append_child(tree.root(), a);
    tree.append_child(tree.root(), b);

    EXPECT_EQ(tree.node(tree.root()).children, (std::vector<NodeId>{a, b}));
    EXPECT_EQ(tree.node(a).parent, tree.root());
}

TEST(TreeTest, AppendChildMovesFromPreviousParent) {
    Tree tree = Tree::new_document();
    NodeId div = tree.create_element(html_name("div"));
    NodeId span = tree.create_element(html_name("span"));
    tree.append_child(tree.root(), div);
    tree.append_child(div, span);
    tree.append_child(tree.root(), span);

    EXPECT_TRUE(tree.node(div).children.empty());
    EXPECT_EQ(tree.node(tree.root()).children, (std::vector<NodeId>{div, span}));
    EXPECT_EQ(tree.node(span).parent, tree.root());
}

TEST(TreeTest, InsertBeforeReference) {
    Tree tree = Tree::new_document();
    NodeId a = tree.create_text("a");
    NodeId b = tree.create_text("b");
    NodeId c = tree.create_text("c");
    tree.append_child(tree.root(), a);
    tree.append_child(tree.root(), c);
    tree.insert_before(tree.root(), b, c);

    EXPECT_EQ(tree.node(tree.root()).children, (std::vector<NodeId>{a, b, c}));
    EXPECT_EQ(tree.node(b).parent, tree.root());
}

TEST(TreeTest, InsertBeforeWithoutReferenceAppends) {
    Tree tree = Tree::new_document();
    NodeId a = tree.create_text("a");
    NodeId stray = tree.create_text("stray");
    NodeId b = tree.create_text("b");
    tree.append_child(tree.root(), a);
    tree.insert_before(tree.root(), b, std::nullopt);
    EXPECT_EQ(tree.node(tree.root()).children.back(), b);

    NodeId c = tree.create_text("c");
    tree.insert_before(tree.root(), c, stray);
    EXPECT_EQ(tree.node(tree.root()).children, (std::vector<NodeId>{a, b, c}));
}

TEST(TreeTest, DetachKeepsSubtree) {
    Tree tree = Tree::new_document();
    NodeId div = tree.create_element(html_name("div"));
    NodeId text = tree.create_text("x");
    tree.append_child(tree.root(), div);
    tree.append_child(div, text);

    tree.detach(div);
    EXPECT_TRUE(tree.node(tree.root()).children.empty());
    EXPECT_FALSE(tree.node(div).parent.has_value());
    EXPECT_EQ(tree.node(div).children, (std::vector<NodeId>{text}));
    EXPECT_EQ(tree.size(), 3u);

    tree.detach(div);
    EXPECT_FALSE(tree.node(div).parent.has_value());
}

TEST(TreeTest, RootCannotBecomeAChild) {
    Tree tree = Tree::new_document();
    NodeId div = tree.create_element(html_name("div"));
    tree.append_child(tree.root(), div);

    EXPECT_THROW(tree.append_child(div, tree.root()), std::invalid_argument);
    EXPECT_THROW(tree.insert_before(div, tree.root(), std::nullopt), std::invalid_argument);
    EXPECT_FALSE(tree.node(tree.root()).parent.has_value());
    EXPECT_TRUE(tree.node(div).children.empty());
}

TEST(TreeTest, NodeCannotBeItsOwnChild) {
    Tree tree = Tree::new_document();
    NodeId span = tree.create_element(html_name("span"));
    tree.append_child(tree.root(), span);

    EXPECT_THROW(tree.append_child(span, span), std::invalid_argument);
    EXPECT_THROW(tree.insert_before(span, span, std::nullopt), std::invalid_argument);
    ASSERT_TRUE(tree.node(span).parent.has_value());
    EXPECT_EQ(*tree.node(span).parent, tree.root());
    EXPECT_TRUE(tree.node(span).children.empty());
}

TEST(TreeTest, AncestorCannotMoveUnderDescendant) {
    Tree tree = Tree::new_document();
    NodeId outer = tree.create_element(html_name("div"));
    NodeId inner = tree.create_element(html_name("p"));
    NodeId leaf = tree.create_text("x");
    tree.append_child(tree.root(), outer);
    tree.append_child(outer, inner);
    tree.append_child(inner, leaf);

    EXPECT_THROW(tree.append_child(inner, outer), std::invalid_argument);
    EXPECT_THROW(tree.insert_before(inner, outer, leaf), std::invalid_argument);
    EXPECT_EQ(tree.node(tree.root()).children, (std::vector<NodeId>{outer}));
    EXPECT_EQ(tree.node(inner).children, (std::vector<NodeId>{leaf}));

    // Moving a descendant up is still allowed.
    tree.append_child(tree.root(), inner);
    EXPECT_EQ(tree.node(tree.root()).children, (std::vector<NodeId>{outer, inner}));
}

// ---------------------------------------------------------------------------
// Attributes and templates
// ---------------------------------------------------------------------------
TEST(TreeTest, SetAttributeOverwritesInPlace) {
    Tree tree = Tree::new_document();
    NodeId el = tree.create_element(html_name("a"), {{html_name("href"), "x"},
                                                     {html_name("id"), "y"}});
    tree.set_attribute(el, {html_name("href"), "z"});
    tree.set_attribute(el, {html_name("title"), "t"});

    const auto& attrs = tree.element(el)->attributes;
    ASSERT_EQ(attrs.size(), 3u);
    EXPECT_EQ(attrs[0].value, "z");
    EXPECT_EQ(attrs[2].name.local, "title");
}

TEST(TreeTest, SetAttributeIgnoresNonElements) {
    Tree tree = Tree::new_document();
    NodeId text = tree.create_text("x");
    tree.set_attribute(text, {html_name("id"), "y"});
    EXPECT_EQ(tree.text(text)->data, "x");
}

TEST(TreeTest, TemplateContentsCreatedOnce) {
    Tree tree = Tree::new_document();
    NodeId tmpl = tree.create_element(html_name("template"));
    NodeId contents = tree.ensure_template_contents(tmpl);

    EXPECT_NE(contents, tmpl);
    EXPECT_TRUE(std::holds_alternative<FragmentData>(tree.node(contents).data));
    EXPECT_EQ(tree.ensure_template_contents(tmpl), contents);
    EXPECT_EQ(tree.element(tmpl)->template_contents, contents);
    EXPECT_FALSE(tree.node(contents).parent.has_value());
}

TEST(TreeTest, TemplateContentsOfNonElementIsItself) {
    Tree tree = Tree::new_document();
    NodeId text = tree.create_text("x");
    EXPECT_EQ(tree.ensure_template_contents(text), text);
}

TEST(TreeTest, TemplateCannotMoveIntoItsOwnContents) {
    Tree tree = Tree::new_document();
    NodeId tmpl = tree.create_element(html_name("template"));
    tree.append_child(tree.root(), tmpl);
    NodeId contents = tree.ensure_template_contents(tmpl);
    NodeId div = tree.create_element(html_name("div"));
    tree.append_child(contents, div);

    EXPECT_THROW(tree.append_child(contents, tmpl), std::invalid_argument);
    EXPECT_THROW(tree.append_child(div, tmpl), std::invalid_argument);
    EXPECT_EQ(tree.node(contents).children, (std::vector<NodeId>{div}));
}
