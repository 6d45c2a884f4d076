#include <gtest/gtest.h>
#include <engine.hpp>
#include <errors.hpp>


struct Directives : ::testing::Test {
    Engine engine;

    void add(const std::string& xml) {
        engine.defaultLoader.add(xml);
    }

    std::string render(const std::string& ref, const Mapping& values = {}, RenderOptions options = {}) {
        return engine.render(ref, values, options);
    }
};


TEST_F(Directives, StaticMarkupIsCopied) {
    add("<t t-name=\"static\"><div class=\"a\"><p>x &amp; y</p><br/><img src=\"/i.png\"/></div></t>");
    EXPECT_EQ(render("static"), "<div class=\"a\"><p>x &amp; y</p><br/><img src=\"/i.png\"/></div>");
}

TEST_F(Directives, StaticUrlsAreSanitized) {
    add("<t t-name=\"links\"><a href=\"javascript:alert(1)\">x</a><a href=\"/ok\">y</a></t>");
    EXPECT_EQ(render("links"), "<a href=\"\">x</a><a href=\"/ok\">y</a>");
}

TEST_F(Directives, DynamicUrlsAreSanitized) {
    add("<t t-name=\"dyn\"><a t-att-href=\"url\">x</a></t>");
    EXPECT_EQ(render("dyn", { { "url", Value::str("javascript:steal()") } }), "<a href=\"\">x</a>");
    EXPECT_EQ(render("dyn", { { "url", Value::str("/page") } }), "<a href=\"/page\">x</a>");
}

TEST_F(Directives, CommentsOnlyWhenPreserved) {
    add("<t t-name=\"comments\"><div><!-- kept? --></div></t>");
    EXPECT_EQ(render("comments"), "<div></div>");
    RenderOptions options;
    options.preserveComments = true;
    EXPECT_EQ(render("comments", {}, options), "<div></div>"); // not part of the cache key: still the first compile
    engine.clearCache();
    EXPECT_EQ(render("comments", {}, options), "<div><!-- kept? --></div>");
}


TEST_F(Directives, IfElifElse) {
    add("<t t-name=\"cond\"><t t-if=\"x == 1\">one</t><t t-elif=\"x == 2\">two</t><t t-else=\"\">other</t></t>");
    EXPECT_EQ(render("cond", { { "x", Value::integer(1) } }), "one");
    EXPECT_EQ(render("cond", { { "x", Value::integer(2) } }), "two");
    EXPECT_EQ(render("cond", { { "x", Value::integer(3) } }), "other");
}

TEST_F(Directives, IfKeepsTheIndentationOfItsContent) {
    add("<t t-name=\"indent\"><div>\n    <t t-if=\"show\">x</t>\n</div></t>");
    EXPECT_EQ(render("indent", { { "show", Value::boolean(true) } }), "<div>\n    x\n</div>");
    EXPECT_EQ(render("indent", { { "show", Value::boolean(false) } }), "<div>\n</div>");
}

TEST_F(Directives, CommentsBetweenIfAndElseAreDropped) {
    add("<t t-name=\"gap\"><t t-if=\"0\">a</t> <!-- between --> <t t-else=\"\">b</t></t>");
    EXPECT_EQ(render("gap"), "b");
}

TEST_F(Directives, EmptyIfDoesNotCompile) {
    add("<t t-name=\"empty\"><t t-if=\"\">x</t></t>");
    EXPECT_THROW(render("empty"), CompileError);
}

TEST_F(Directives, ElseNeedsAnIf) {
    add("<t t-name=\"orphan\"><t t-else=\"\">x</t></t>");
    EXPECT_THROW(render("orphan"), CompileError);
}

TEST_F(Directives, TextBetweenIfAndElseDoesNotCompile) {
    add("<t t-name=\"text\"><t t-if=\"1\">a</t>oops<t t-else=\"\">b</t></t>");
    EXPECT_THROW(render("text"), CompileError);
}


TEST_F(Directives, ForeachLoopVariables) {
    add("<t t-name=\"loop\"><t t-foreach=\"['a', 'b']\" t-as=\"x\"><t t-esc=\"x_index\"/>:<t t-esc=\"x\"/><t t-if=\"not x_last\">,</t></t></t>");
    EXPECT_EQ(render("loop"), "0:a,1:b");
}

TEST_F(Directives, ForeachOverDictGivesKeysAndValues) {
    add("<t t-name=\"dict\"><t t-foreach=\"{'a': 1, 'b': 2}\" t-as=\"k\"><t t-esc=\"k\"/>=<t t-esc=\"k_value\"/>;</t></t>");
    EXPECT_EQ(render("dict"), "a=1;b=2;");
}

TEST_F(Directives, ForeachOverACount) {
    add("<t t-name=\"count\"><t t-foreach=\"3\" t-as=\"i\"><t t-esc=\"i\"/></t></t>");
    EXPECT_EQ(render("count"), "012");
}

TEST_F(Directives, ForeachBindingsStayInTheLoop) {
    add("<t t-name=\"scope\"><t t-set=\"x\" t-value=\"'outer'\"/><t t-foreach=\"[1, 2]\" t-as=\"x\"><t t-set=\"y\" t-value=\"x\"/></t><t t-esc=\"x\"/><t t-esc=\"y\"/><t t-esc=\"x_size\"/></t>");
    EXPECT_EQ(render("scope"), "outer");
}

TEST_F(Directives, ForeachNeedsAs) {
    add("<t t-name=\"noas\"><t t-foreach=\"[1]\">x</t></t>");
    try {
        render("noas");
        FAIL() << "t-foreach compiled without t-as";
    }
    catch (CompileError& e) {
        EXPECT_EQ(e.kind, "KeyError");
    }
}

TEST_F(Directives, AsNeedsForeach) {
    add("<t t-name=\"as\"><t t-as=\"x\">x</t></t>");
    EXPECT_THROW(render("as"), CompileError);
}


TEST_F(Directives, DirectiveOrderDoesNotDependOnAttributeOrder) {
    add("<templates><t t-name=\"a\"><span t-esc=\"v\" t-foreach=\"[1, 2]\" t-as=\"v\" t-if=\"v &gt; 1\"/></t>"
        "<t t-name=\"b\"><span t-if=\"v &gt; 1\" t-as=\"v\" t-esc=\"v\" t-foreach=\"[1, 2]\"/></t></templates>");
    EXPECT_EQ(render("a"), "<span>2</span>");
    EXPECT_EQ(render("b"), render("a"));
}


TEST_F(Directives, SetFromValueAndFormat) {
    add("<t t-name=\"set\"><t t-set=\"a\" t-value=\"2 + 3\"/><t t-set=\"g\" t-valuef=\"hi {{name}}\"/><t t-esc=\"a\"/> <t t-esc=\"g\"/></t>");
    EXPECT_EQ(render("set", { { "name", Value::str("<you>") } }), "5 hi &lt;you&gt;");
}

TEST_F(Directives, SetMergesADict) {
    add("<t t-name=\"merge\"><t t-set=\"{'a': 1, 'b': 2}\"/><t t-esc=\"a + b\"/></t>");
    EXPECT_EQ(render("merge"), "3");
}

TEST_F(Directives, SetFromContentIsMarkup) {
    add("<t t-name=\"content\"><t t-set=\"v\"><b>hi</b></t><p t-out=\"v\"/></t>");
    EXPECT_EQ(render("content"), "<p><b>hi</b></p>");
}

TEST_F(Directives, ContentThatIsNeverShownNeverRuns) {
    add("<t t-name=\"lazy\"><t t-set=\"v\"><t t-esc=\"1 / 0\"/></t>ok</t>");
    EXPECT_EQ(render("lazy"), "ok");
}

TEST_F(Directives, SetNamesAreChecked) {
    add("<templates><t t-name=\"dunder\"><t t-set=\"a__b\" t-value=\"1\"/></t>"
        "<t t-name=\"slot\"><t t-set=\"0\" t-value=\"1\"/></t>"
        "<t t-name=\"stray\"><t t-value=\"1\"/></t></templates>");
    EXPECT_THROW(render("dunder"), CompileError);
    EXPECT_THROW(render("slot"), CompileError);
    EXPECT_THROW(render("stray"), CompileError);
}


TEST_F(Directives, OutEscapesUnlessMarkup) {
    add("<t t-name=\"out\"><t t-out=\"html\"/><t t-out=\"text\"/><t t-raw=\"text\"/></t>");
    Mapping values = { { "html", Value::markup("<b>x</b>") }, { "text", Value::str("<i>") } };
    EXPECT_EQ(render("out", values), "<b>x</b>&lt;i&gt;<i>");
}

TEST_F(Directives, OutFallsBackToDefaultContent) {
    add("<t t-name=\"fallback\"><span t-out=\"missing\">default</span><div><em t-esc=\"None\"/></div><t t-esc=\"False\"/>|<t t-esc=\"0\"/></t>");
    EXPECT_EQ(render("fallback"), "<span>default</span><div></div>|");
}

TEST_F(Directives, OutWithWidgetOptions) {
    add("<t t-name=\"widget\"><span t-out=\"amount\" t-options=\"{'widget': 'float', 'precision': 1}\"/></t>");
    EXPECT_EQ(render("widget", { { "amount", Value::number(3.14159) } }), "<span data-oe-type=\"float\" data-oe-expression=\"amount\">3.1</span>");
}

TEST_F(Directives, OptionsNeedAConsumer) {
    add("<t t-name=\"unused\"><span t-options=\"{}\"/></t>");
    EXPECT_THROW(render("unused"), CompileError);
}


TEST_F(Directives, AttributesFromExpressionsAndFormats) {
    add("<t t-name=\"att\"><div title=\"t\" t-att-class=\"cls\" t-attf-id=\"x-{{n}}\" t-att-data-none=\"None\"/></t>");
    Mapping values = { { "cls", Value::str("a\"b") }, { "n", Value::integer(1) } };
    EXPECT_EQ(render("att", values), "<div title=\"t\" class=\"a&#34;b\" id=\"x-1\"></div>");
}

TEST_F(Directives, AttributesFromADictOrPairs) {
    add("<t t-name=\"spread\"><i t-att=\"{'a': 1, 'b': None}\"/><i t-att=\"['c', 'd']\"/></t>");
    EXPECT_EQ(render("spread"), "<i a=\"1\"></i><i c=\"d\"></i>");
}


TEST_F(Directives, FieldThroughTheConverter) {
    add("<t t-name=\"field\"><span t-field=\"rec.name\"/></t>");
    Value rec = Value::dict();
    rec.map -> set("name", Value::str("Ada & co"));
    EXPECT_EQ(render("field", { { "rec", rec } }), "<span>Ada &amp; co</span>");

    RenderOptions branded;
    branded.inheritBranding = true;
    EXPECT_EQ(render("field", { { "rec", rec } }, branded), "<span data-oe-field=\"name\" data-oe-type=\"char\" data-oe-expression=\"rec.name\">Ada &amp; co</span>");
}

TEST_F(Directives, FieldNeedsARealElementAndARecord) {
    add("<templates><t t-name=\"on-t\"><t t-field=\"rec.name\"/></t>"
        "<t t-name=\"on-td\"><table><tr><td t-field=\"rec.name\"/></tr></table></t>"
        "<t t-name=\"no-dot\"><span t-field=\"name\"/></t></templates>");
    EXPECT_THROW(render("on-t"), CompileError);
    EXPECT_THROW(render("on-td"), CompileError);
    EXPECT_THROW(render("no-dot"), CompileError);
}


TEST_F(Directives, GroupsAskTheAccessControl) {
    add("<t t-name=\"groups\"><p groups=\"admin\">yes</p><p t-groups=\"!admin\">no</p></t>");
    EXPECT_EQ(render("groups"), "<p>no</p>");
    engine.defaultAccess.groups.insert("admin");
    EXPECT_EQ(render("groups"), "<p>yes</p>");
}

TEST_F(Directives, AssetsBecomeLinksAndScripts) {
    add("<t t-name=\"assets\"><t t-call-assets=\"web\" defer_load=\"True\"/></t>");
    engine.defaultAssets.add("web", { "/b.js", "/a.css" });
    EXPECT_EQ(render("assets"), "<link type=\"text/css\" rel=\"stylesheet\" href=\"/a.css\"/>\n        <script type=\"text/javascript\" defer=\"defer\" src=\"/b.js\"></script>");
}

TEST_F(Directives, AssetsCannotHaveChildren) {
    add("<t t-name=\"children\"><t t-call-assets=\"web\"><p/></t></t>");
    EXPECT_THROW(render("children"), CompileError);
}


TEST_F(Directives, UnknownAttributesAreReported) {
    add("<t t-name=\"unknown\"><div t-frobnicate=\"1\">x</div></t>");
    std::shared_ptr<const CompiledTemplate> compiled = engine.compile("unknown", RenderOptions());
    ASSERT_EQ(compiled -> diagnostics.size(), 1u);
    EXPECT_NE(compiled -> diagnostics[0].find("t-frobnicate"), std::string::npos);
    EXPECT_EQ(render("unknown"), "<div>x</div>");
}

TEST_F(Directives, DebugOnlyInDevMode) {
    add("<t t-name=\"debug\"><t t-debug=\"\">x</t></t>");
    EXPECT_EQ(render("debug"), "x");

    Engine dev;
    dev.defaultLoader.add("<t t-name=\"bad-debugger\"><t t-debug=\"gdb\">x</t></t>");
    RenderOptions options;
    options.devMode = true;
    EXPECT_THROW(dev.render("bad-debugger", {}, options), TemplateError);
}

TEST_F(Directives, LangOnlyBesideCall) {
    add("<t t-name=\"lang\"><t t-lang=\"'fr'\">x</t></t>");
    EXPECT_THROW(render("lang"), CompileError);
}

TEST_F(Directives, CallOnlyOnT) {
    add("<t t-name=\"callee\">x</t>");
    add("<t t-name=\"call-on-div\"><div t-call=\"callee\"/></t>");
    EXPECT_THROW(render("call-on-div"), CompileError);
}
