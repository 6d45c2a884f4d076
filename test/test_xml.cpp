#include <gtest/gtest.h>
#include <xml/node.hpp>
#include <xml/parser.hpp>
#include <errors.hpp>
#include <memory>


static std::unique_ptr<XmlElement> parse(const std::string& xml) {
    return std::unique_ptr<XmlElement>(parseXml(xml));
}


TEST(Parse, TextAndTails) {
    auto root = parse("<t t-name=\"x\"><p>a<b>b</b>c</p></t>");
    EXPECT_EQ(root -> tag, "t");
    EXPECT_EQ(root -> get("t-name"), "x");
    ASSERT_EQ(root -> children.size(), 1u);
    XmlElement* p = (XmlElement*)root -> children[0];
    EXPECT_EQ(p -> text, "a");
    ASSERT_EQ(p -> children.size(), 1u);
    XmlElement* b = (XmlElement*)p -> children[0];
    EXPECT_EQ(b -> text, "b");
    EXPECT_EQ(b -> tail, "c");
    EXPECT_EQ(b -> parent, p);
}

TEST(Parse, EntitiesAreDecoded) {
    auto root = parse("<p title=\"a &quot;b&quot;\">&amp;&#65;&#x42;&lt;</p>");
    EXPECT_EQ(root -> text, "&AB<");
    EXPECT_EQ(root -> get("title"), "a \"b\"");
}

TEST(Parse, CommentsAndProcessingInstructions) {
    auto root = parse("<div><!-- note --><?php echo 1 ?>tail</div>");
    ASSERT_EQ(root -> children.size(), 2u);
    EXPECT_EQ(root -> children[0] -> type, XmlNode::Comment);
    EXPECT_EQ(((XmlComment*)root -> children[0]) -> text, " note ");
    EXPECT_EQ(root -> children[1] -> type, XmlNode::ProcessingInstruction);
    EXPECT_EQ(((XmlPI*)root -> children[1]) -> target, "php");
    EXPECT_EQ(root -> children[1] -> tail, "tail");
}

TEST(Parse, CDataIsText) {
    auto root = parse("<script><![CDATA[a < b]]></script>");
    EXPECT_EQ(root -> text, "a < b");
}

TEST(Parse, NamespacesAreInherited) {
    auto root = parse("<svg xmlns=\"http://www.w3.org/2000/svg\"><g xmlns:x=\"urn:x\"><x:rect/></g></svg>");
    XmlElement* g = (XmlElement*)root -> children[0];
    XmlElement* rect = (XmlElement*)g -> children[0];
    Namespaces ns = rect -> nsmap();
    ASSERT_EQ(ns.size(), 2u);
    EXPECT_EQ(ns[0].first, "");
    EXPECT_EQ(ns[1].first, "x");
    EXPECT_EQ(ns[1].second, "urn:x");
    EXPECT_EQ(rect -> tag, "x:rect");
}

TEST(Parse, MalformedDocumentsNameTheLine) {
    try {
        parse("<div>\n<p></div>");
        FAIL() << "mismatched tags parsed";
    }
    catch (CompileError& e) {
        EXPECT_EQ(e.kind, "XMLSyntaxError");
        EXPECT_NE(e.message().find("line 2"), std::string::npos);
    }
    EXPECT_THROW(parse(""), CompileError);
    EXPECT_THROW(parse("<a x=\"1\" x=\"2\"/>"), CompileError);
    EXPECT_THROW(parse("<a/><b/>"), CompileError);
}


TEST(Element, PathCountsSameTagSiblings) {
    auto root = parse("<div><span/><span/><p/></div>");
    EXPECT_EQ(root -> path(), "/div");
    EXPECT_EQ(((XmlElement*)root -> children[1]) -> path(), "/div/span[2]");
    EXPECT_EQ(((XmlElement*)root -> children[2]) -> path(), "/div/p");
}

TEST(Element, SnippetIsTheSelfClosedStartTag) {
    auto root = parse("<div t-if=\"a &lt; b\" class=\"x\"><p>hidden</p></div>");
    EXPECT_EQ(root -> snippet(), "<div t-if=\"a &lt; b\" class=\"x\"/>");
}

TEST(Element, AttributeEditing) {
    auto root = parse("<p a=\"1\" b=\"2\"/>");
    std::string value;
    EXPECT_TRUE(root -> pop("a", value));
    EXPECT_EQ(value, "1");
    EXPECT_FALSE(root -> pop("a", value));
    root -> set("b", "3");
    root -> set("c", "4");
    std::vector<std::string> names = root -> attributeNames();
    ASSERT_EQ(names.size(), 2u);
    EXPECT_EQ(names[0], "b");
    EXPECT_EQ(root -> get("b"), "3");
    EXPECT_EQ(root -> get("missing", "fallback"), "fallback");
}

TEST(Element, DetachedChildrenAreSkipped) {
    auto root = parse("<div><a/><!--c--><b/></div>");
    XmlElement* a = (XmlElement*)root -> children[0];
    EXPECT_EQ(a -> getnext() -> type, XmlNode::Comment);
    root -> detach(root -> children[1]);
    EXPECT_EQ(a -> getnext(), root -> children[2]);
    EXPECT_EQ(root -> elementCount(), 2u);
}

TEST(Element, CloneIsDeep) {
    auto root = parse("<t t-name=\"x\"><p>a</p>b</t>");
    std::unique_ptr<XmlElement> copy(root -> cloneElement());
    ((XmlElement*)copy -> children[0]) -> text = "changed";
    EXPECT_EQ(((XmlElement*)root -> children[0]) -> text, "a");
    EXPECT_EQ(copy -> serialize(), "<t t-name=\"x\"><p>changed</p>b</t>");
}

TEST(Element, FindNamedSearchesDepthFirst) {
    auto root = parse("<templates><t><t t-name=\"inner\"/></t><t t-name=\"second\"/></templates>");
    XmlElement* found = root -> findNamed("t-name");
    ASSERT_NE(found, (XmlElement*)NULL);
    EXPECT_EQ(found -> get("t-name"), "inner");
}
