#include <gtest/gtest.h>
#include <engine.hpp>
#include <session.hpp>
#include <errors.hpp>
#include <writer.hpp>
#include <xml/parser.hpp>
#include <render/callparams.hpp>
#include <render/stack.hpp>
#include <algorithm>
#include <cstdlib>
#include <fstream>
#include <memory>
#include <thread>
#include <unistd.h>


struct Render : ::testing::Test {
    Engine engine;

    void add(const std::string& xml) {
        engine.defaultLoader.add(xml);
    }

    std::string render(const std::string& ref, const Mapping& values = {}, RenderOptions options = {}) {
        return engine.render(ref, values, options);
    }
};


TEST_F(Render, InlineElementLoop) {
    std::unique_ptr<XmlElement> el(parseXml("<t t-foreach=\"[1,2,3]\" t-as=\"i\"><span t-esc=\"i\"/></t>"));
    EXPECT_EQ(engine.render(*el), "<span>1</span><span>2</span><span>3</span>");
}

TEST_F(Render, InlineElementUsesItsNamedDescendant) {
    std::unique_ptr<XmlElement> el(parseXml("<templates><t t-name=\"inline\">named</t><t t-name=\"other\">no</t></templates>"));
    EXPECT_EQ(engine.render(*el), "named");
    EXPECT_EQ(engine.compile(*el, RenderOptions()) -> ref, "inline");
}

TEST_F(Render, CallPassesItsBodyAsTheSlot) {
    add("<t t-name=\"A\"><t t-call=\"B\"><p>slot</p></t></t>");
    add("<t t-name=\"B\">before-<t t-out=\"0\"/>-after</t>");
    EXPECT_EQ(render("A"), "before-<p>slot</p>-after");
}

TEST_F(Render, CallArguments) {
    add("<templates><t t-name=\"callee\"><t t-esc=\"x\"/>|<t t-esc=\"y\"/>|<t t-esc=\"w\"/></t>"
        "<t t-name=\"caller\"><t t-set=\"w\" t-value=\"'seen'\"/><t t-call=\"callee\" x=\"1 + 1\" y.f=\"v{{1}}\"/></t></templates>");
    EXPECT_EQ(render("caller"), "2|v1|seen");
}

TEST_F(Render, CalleeBindingsDoNotLeak) {
    add("<templates><t t-name=\"setter\"><t t-set=\"z\" t-value=\"1\"/></t>"
        "<t t-name=\"main\"><t t-call=\"setter\"/>[<t t-esc=\"z\"/>]</t></templates>");
    EXPECT_EQ(render("main"), "[]");
}

TEST_F(Render, CallTargetIsAFormat) {
    add("<templates><t t-name=\"page-home\">home</t><t t-name=\"dispatch\"><t t-call=\"page-{{which}}\"/></t></templates>");
    EXPECT_EQ(render("dispatch", { { "which", Value::str("home") } }), "home");
}

TEST_F(Render, CallByNumericId) {
    add("<t t-name=\"first\">by id</t>");
    add("<t t-name=\"second\"><t t-call=\"1\"/></t>");
    EXPECT_EQ(render("second"), "by id");
    EXPECT_EQ(render("1"), "by id");
}

TEST_F(Render, SlotContentSeesTheCallersBindings) {
    add("<templates><t t-name=\"frame\"><div><t t-out=\"0\"/></div></t>"
        "<t t-name=\"page\"><t t-set=\"title\" t-value=\"'Hello'\"/><t t-call=\"frame\"><h1 t-esc=\"title\"/></t></t></templates>");
    EXPECT_EQ(render("page"), "<div><h1>Hello</h1></div>");
}


TEST_F(Render, CompiledTemplatesAreReused) {
    add("<t t-name=\"A\"><t t-call=\"B\"/></t>");
    add("<t t-name=\"B\">b</t>");
    EXPECT_EQ(render("A"), "b");
    EXPECT_EQ(engine.compileCount, 2u);
    EXPECT_EQ(render("A"), "b");
    EXPECT_EQ(render("B"), "b");
    EXPECT_EQ(engine.compileCount, 2u);

    RenderOptions french;
    french.lang = "fr";
    render("B", {}, french); // another cache key
    EXPECT_EQ(engine.compileCount, 3u);

    engine.clearCache();
    render("B");
    EXPECT_EQ(engine.compileCount, 4u);
}

TEST_F(Render, CompileFailuresAreCachedToo) {
    add("<t t-name=\"broken\"><t t-if=\"\"/></t>");
    EXPECT_THROW(render("broken"), CompileError);
    EXPECT_THROW(render("broken"), CompileError);
    EXPECT_EQ(engine.compileCount, 1u);
}

TEST_F(Render, CompileErrorsSayWhere) {
    add("<t t-name=\"where\"><div><p t-foreach=\"x\" t-as=\"bad name\"/></div></t>");
    try {
        render("where");
        FAIL() << "bad t-as compiled";
    }
    catch (CompileError& e) {
        EXPECT_EQ(e.kind, "ValueError");
        EXPECT_EQ(e.info.templateName, "where");
        EXPECT_EQ(e.info.path, "/t/div/p");
        EXPECT_EQ(e.info.element, "<p t-foreach=\"x\" t-as=\"bad name\"/>");
    }
}


TEST_F(Render, RecursionIsBounded) {
    add("<t t-name=\"forever\"><t t-call=\"forever\"/></t>");
    EXPECT_THROW(render("forever"), RecursionError);
}

TEST_F(Render, DeepButFiniteCallsWork) {
    add("<t t-name=\"countdown\"><t t-esc=\"n\"/><t t-if=\"n\"><t t-call=\"countdown\" n=\"n - 1\"/></t></t>");
    EXPECT_EQ(render("countdown", { { "n", Value::integer(10) } }), "109876543210");
}


TEST_F(Render, MissingTemplatesFailOnlyWhenRendered) {
    EXPECT_NO_THROW(engine.compile("nowhere", RenderOptions()));
    EXPECT_THROW(render("nowhere"), TemplateNotFound);

    RenderOptions lenient;
    lenient.raiseIfNotFound = false;
    EXPECT_EQ(render("nowhere", {}, lenient), "");

    add("<t t-name=\"outer\">a<t t-call=\"nowhere\"/>b</t>");
    EXPECT_EQ(render("outer", {}, lenient), "ab");
    EXPECT_THROW(render("outer"), TemplateNotFound);
}

TEST_F(Render, RenderErrorsCarryTheCallChain) {
    add("<templates><t t-name=\"inner\"><span t-esc=\"a.b\"/></t>"
        "<t t-name=\"outer\"><div><t t-call=\"inner\"/></div></t></templates>");
    try {
        render("outer");
        FAIL() << "a.b rendered without a";
    }
    catch (TemplateError& e) {
        EXPECT_EQ(e.kind, "KeyError");
        EXPECT_EQ(e.info.templateName, "inner");
        EXPECT_EQ(e.info.path, "/t/span");
        ASSERT_EQ(e.info.source.size(), 1u);
        EXPECT_EQ(e.info.source[0].path, "/t/div/t");
        std::string described = e.describe();
        EXPECT_NE(described.find("KeyError: 'a'"), std::string::npos);
        EXPECT_NE(described.find("Template: inner"), std::string::npos);
    }
}


TEST_F(Render, EnvironmentDefaults) {
    add("<t t-name=\"env\"><t t-esc=\"lang\"/>|<t t-esc=\"floor(2.7)\"/>|<t t-esc=\"true\"/></t>");
    RenderOptions options;
    options.lang = "fr_FR";
    EXPECT_EQ(render("env", {}, options), "fr_FR|2|True");

    options.minimalQcontext = true;
    EXPECT_THROW(render("env", {}, options), TemplateError); // no floor
}

TEST_F(Render, LangFromTheOptionsWins) {
    add("<t t-name=\"lang\"><t t-esc=\"lang\"/></t>");
    RenderOptions options;
    options.lang = "fr_FR";
    EXPECT_EQ(render("lang", { { "lang", Value::str("xx") } }, options), "fr_FR");
    EXPECT_EQ(render("lang", { { "lang", Value::str("xx") } }), "xx");
}

TEST_F(Render, JsonAndQuotePlusAreBound) {
    add("<t t-name=\"helpers\"><div t-att-data-x=\"json.dumps({'a': [1, None]})\"/><a t-attf-href=\"/s?q={{quote_plus(q)}}\">go</a>"
        "<t t-esc=\"json.loads('[1, 2]')[1]\"/></t>");
    EXPECT_EQ(render("helpers", { { "q", Value::str("a b&c") } }),
        "<div data-x=\"{&#34;a&#34;: [1, null]}\"></div><a href=\"/s?q=a+b%26c\">go</a>2");

    RenderOptions minimal;
    minimal.minimalQcontext = true;
    EXPECT_THROW(render("helpers", { { "q", Value::str("") } }, minimal), TemplateError);
}

TEST_F(Render, ReservedSlotIsDropped) {
    add("<t t-name=\"slot\">[<t t-out=\"0\"/>]</t>");
    EXPECT_EQ(render("slot", { { "0", Value::str("injected") } }), "[]");
}

TEST_F(Render, EntryBindsTheTemplateIds) {
    add("<t t-name=\"ids\"><t t-esc=\"xmlid\"/>#<t t-esc=\"viewid\"/></t>");
    EXPECT_EQ(render("ids"), "ids#1");
}


TEST_F(Render, StreamsIntoAWriter) {
    add("<t t-name=\"stream\">a<t t-call=\"part\"/>c</t>");
    add("<t t-name=\"part\">b</t>");
    StringWriteOutput out;
    engine.render("stream", {}, RenderOptions(), out);
    EXPECT_EQ(out.content, "abc");
}

TEST_F(Render, StackStepsThroughFrames) {
    add("<t t-name=\"top\">a<t t-call=\"leaf\"/>c</t>");
    add("<t t-name=\"leaf\">b</t>");
    Session session(&engine, {}, RenderOptions());
    std::shared_ptr<CallParameters> params = std::make_shared<CallParameters>();
    params -> ref = "top";
    params -> directive = "render";
    RenderStack stack(&session, params);

    size_t deepest = 0;
    std::string text;
    RenderStack::Step s;
    while ((s = stack.step()) != RenderStack::Done) {
        deepest = std::max(deepest, stack.depth());
        if (s == RenderStack::Chunk) {
            text += stack.chunk;
        }
    }
    EXPECT_EQ(text, "abc");
    EXPECT_EQ(deepest, 2u);
    EXPECT_EQ(session.depth, 0u);
}

TEST_F(Render, HugeLoopsStartWithoutBuildingTheirItems) {
    add("<t t-name=\"huge\"><t t-foreach=\"4000000000\" t-as=\"i\"><t t-esc=\"i\"/>,</t></t>");
    Session session(&engine, {}, RenderOptions());
    std::shared_ptr<CallParameters> params = std::make_shared<CallParameters>();
    params -> ref = "huge";
    params -> directive = "render";
    RenderStack stack(&session, params);

    std::string text;
    RenderStack::Step s;
    while (text.size() < 6 && (s = stack.step()) != RenderStack::Done) {
        if (s == RenderStack::Chunk) {
            text += stack.chunk;
        }
    }
    EXPECT_EQ(text.substr(0, 6), "0,1,2,");
}

TEST_F(Render, LoopsSeeItemsAppendedWhileRunning) {
    add("<t t-name=\"grow\"><t t-set=\"l\" t-value=\"[1]\"/>"
        "<t t-foreach=\"l\" t-as=\"i\"><t t-esc=\"i\"/><t t-if=\"i &lt; 3\" t-esc=\"l.append(i + 1)\"/></t></t>");
    EXPECT_EQ(render("grow"), "123");
}

TEST_F(Render, LoopCountsBeyondSixtyFourBits) {
    add("<t t-name=\"toolong\"><t t-foreach=\"99999999999999999999\" t-as=\"i\"/></t>");
    for (int n = 0; n < 2; n ++) {
        try {
            render("toolong");
            FAIL() << "an unrepresentable count compiled";
        }
        catch (CompileError& e) {
            EXPECT_EQ(e.kind, "OverflowError");
        }
    }
    EXPECT_EQ(engine.compileCount, 1u);
}

struct HugeIdLoader : TemplateLoader {
    MemoryLoader named;

    LoadedTemplate load(const std::string& ref) {
        LoadedTemplate ret = named.load(ref);
        ret.id = "99999999999999999999";
        return ret;
    }
};

TEST_F(Render, TemplateIdsBeyondSixtyFourBits) {
    HugeIdLoader loader;
    loader.named.add("<t t-name=\"far\">x</t>");
    engine.setLoader(&loader);
    try {
        render("far");
        FAIL() << "an unrepresentable id compiled";
    }
    catch (CompileError& e) {
        EXPECT_EQ(e.kind, "OverflowError");
    }
    engine.setLoader(NULL);
}

TEST_F(Render, ConcurrentRendersShareTheCache) {
    add("<t t-name=\"shared\"><t t-foreach=\"range(50)\" t-as=\"i\"><t t-esc=\"i\"/></t></t>");
    std::string expected = render("shared");
    std::vector<std::string> results(4);
    std::vector<std::thread> threads;
    for (size_t n = 0; n < results.size(); n ++) {
        threads.push_back(std::thread([this, &results, n]() {
            results[n] = render("shared");
        }));
    }
    for (std::thread& t : threads) {
        t.join();
    }
    for (const std::string& result : results) {
        EXPECT_EQ(result, expected);
    }
    EXPECT_EQ(engine.compileCount, 1u);
}

TEST_F(Render, ProfilingCountsDirectives) {
    add("<t t-name=\"profiled\"><t t-foreach=\"[1, 2]\" t-as=\"i\"><t t-esc=\"i\"/></t></t>");
    RenderOptions options;
    options.profile = true;
    EXPECT_EQ(render("profiled", {}, options), "12");
    ASSERT_GT(engine.defaultProfiler.entries.size(), 0u);
    size_t esc = 0;
    for (auto& entry : engine.defaultProfiler.entries) {
        if (entry.first.find(" esc") != std::string::npos) {
            esc += entry.second.count;
        }
    }
    EXPECT_EQ(esc, 2u);
    EXPECT_EQ(engine.defaultProfiler.started.size(), 0u);
}


TEST(DirectoryLoaderTest, LoadsEveryXmlFile) {
    char dir[] = "/tmp/weft-test-XXXXXX";
    ASSERT_NE(mkdtemp(dir), (char*)NULL);
    {
        std::ofstream page(std::string(dir) + "/page.xml");
        page << "<templates><t t-name=\"page\"><t t-call=\"layout\">body</t></t></templates>";
    }
    {
        std::ofstream layout(std::string(dir) + "/layout.xml");
        layout << "<t t-name=\"layout\"><main><t t-out=\"0\"/></main></t>";
    }
    DirectoryLoader loader(dir);
    Engine engine;
    engine.setLoader(&loader);
    EXPECT_EQ(engine.render("page"), "<main>body</main>");
    unlink((std::string(dir) + "/page.xml").c_str());
    unlink((std::string(dir) + "/layout.xml").c_str());
    rmdir(dir);
}
