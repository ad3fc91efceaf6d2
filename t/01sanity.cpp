#include "../src/context.h"
#include "../src/lexer.h"
#include "../src/parser.h"
#include "../src/renderer.h"
#include "../src/dialect.h"
#ifdef VATIC_INCLUDE_RAPIDJSON_CONTEXT
    #include "../src/rapidjsoncontext.h"
#endif

#include <gtest/gtest.h>
#include <ctime>
#include <cctype>
#include <stdexcept>

using namespace std;
using namespace Vatic;

Context& getContext() {
    static Context context(Context::STANDARD_DIALECT);
    return context;
}

Renderer& getRenderer() {
    static Renderer renderer(getContext());
    return renderer;
}

Parser& getParser() {
    static Parser parser(getContext());
    return parser;
}

string renderTemplate(const string& tmpl, const RenderContext& store) {
    auto tokens = getParser().parse(tmpl);
    return getRenderer().render(tokens, store);
}

// Renders, expecting a render time failure; returns what failed.
Renderer::Error renderError(const string& tmpl, const RenderContext& store) {
    auto tokens = getParser().parse(tmpl);
    try {
        getRenderer().render(tokens, store);
    } catch (Renderer::Exception& exp) {
        return exp.rendererError;
    }
    return Renderer::Error();
}

Parser::Error parseError(const string& tmpl) {
    try {
        getParser().parse(tmpl);
    } catch (Parser::Exception& exp) {
        if (exp.parserErrors.size() > 0)
            return exp.parserErrors[0];
    }
    return Parser::Error();
}

string localTime(long long offset, const char* format) {
    time_t target = time(nullptr) + offset;
    struct tm timeinfo;
    char buffer[128];
    localtime_r(&target, &timeinfo);
    size_t length = strftime(buffer, sizeof(buffer), format, &timeinfo);
    return string(buffer, length);
}

RenderContext getWeatherStore() {
    RenderContext store;
    store.memories.emplace_back("2024-05-03", "2024-05-03 08:00", "sunny");
    store.memories.emplace_back("2024-05-02", "2024-05-02 08:00", "rainy");
    store.memories.emplace_back("2024-05-01", "2024-05-01 08:00", "cloudy");
    return store;
}

TEST(sanity, lexer) {
    auto tokens = getParser().parse("");
    ASSERT_EQ(tokens.size(), 0);

    tokens = getParser().parse("no tags at all\n{ % } %");
    ASSERT_EQ(tokens.size(), 1);
    ASSERT_EQ(tokens[0].type, Token::Type::LITERAL);
    ASSERT_EQ(tokens[0].literal, "no tags at all\n{ % } %");

    tokens = getParser().parse("a{% result %}b{%   endfor   %}");
    ASSERT_EQ(tokens.size(), 4);
    ASSERT_EQ(tokens[0].literal, "a");
    ASSERT_EQ(tokens[1].type, Token::Type::TAG);
    ASSERT_EQ(tokens[1].tag.name, "result");
    ASSERT_EQ(tokens[2].literal, "b");
    ASSERT_EQ(tokens[3].type, Token::Type::FOR_END);

    tokens = getParser().parse("{% date %}{% date %}");
    ASSERT_EQ(tokens.size(), 2);

    tokens = getParser().parse("line one\n  {% result %}");
    ASSERT_EQ(tokens[1].line, 2);
    ASSERT_EQ(tokens[1].column, 3);

    ASSERT_THROW({
        getParser().parse("Hello {% custom:name");
    }, Parser::Exception);

    try {
        getParser().parse("ab\ncd {% result");
        FAIL();
    } catch (Parser::Exception& exp) {
        ASSERT_EQ(exp.lexerError.type, VATIC_LEXER_ERROR_TYPE_UNCLOSED_TAG);
        ASSERT_EQ(exp.lexerError.details.line, 2);
        ASSERT_EQ(exp.lexerError.details.column, 4);
        ASSERT_STREQ(exp.what(), "Unclosed tag on line 2, column 4: missing '%}'.");
    }
}

TEST(sanity, tags) {
    auto tokens = getParser().parse("{% date minus=1d\tplus:2h | summary %}");
    ASSERT_EQ(tokens.size(), 1);
    ASSERT_EQ(tokens[0].tag.name, "date");
    ASSERT_EQ(tokens[0].tag.params.size(), 2);
    ASSERT_EQ(tokens[0].tag.params["minus"], "1d");
    ASSERT_EQ(tokens[0].tag.params["plus"], "2h");
    ASSERT_EQ(tokens[0].tag.pipe, "summary");

    tokens = getParser().parse("{% memory key=val:ue other:a=b %}");
    ASSERT_EQ(tokens[0].tag.params["key"], "val:ue");
    ASSERT_EQ(tokens[0].tag.params["other:a"], "b");

    tokens = getParser().parse("{% date minus=i\"d\" %}");
    ASSERT_EQ(tokens[0].tag.params["minus"], "i\"d\"");

    tokens = getParser().parse("{% date label=\"a b\" %}");
    ASSERT_EQ(tokens[0].tag.params.size(), 1);
    ASSERT_EQ(tokens[0].tag.params["label"], "\"a b\"");

    tokens = getParser().parse("{% result empty= %}");
    ASSERT_EQ(tokens[0].tag.params["empty"], "");

    tokens = getParser().parse("{% result | %}");
    ASSERT_FALSE(tokens[0].tag.hasPipe());

    Parser::Error error = parseError("{%   %}");
    ASSERT_EQ(error.type, VATIC_PARSER_ERROR_TYPE_EMPTY_TAG);
    error = parseError("{% | summary %}");
    ASSERT_EQ(error.type, VATIC_PARSER_ERROR_TYPE_EMPTY_TAG);

    error = parseError("text\n{% date bogus %}");
    ASSERT_EQ(error.type, VATIC_PARSER_ERROR_TYPE_INVALID_PARAM);
    ASSERT_STREQ(error.details.args[0], "bogus");
    ASSERT_EQ(error.details.line, 2);
    ASSERT_EQ(error.details.column, 1);

    error = parseError("{% date =1d %}");
    ASSERT_EQ(error.type, VATIC_PARSER_ERROR_TYPE_INVALID_PARAM);
    ASSERT_EQ(Parser::Error::english(error), "Invalid parameter '=1d' on line 1, column 1: empty key.");
}

TEST(sanity, forloopParsing) {
    auto tokens = getParser().parse("{% for i in (-2..10) %}{% endfor %}");
    ASSERT_EQ(tokens.size(), 2);
    ASSERT_EQ(tokens[0].type, Token::Type::FOR_START);
    ASSERT_EQ(tokens[0].loop.var, "i");
    ASSERT_TRUE(tokens[0].loop.iterable == Iterable::range(-2, 10));

    tokens = getParser().parse("{% for i in ( 1 .. 3 ) %}{% endfor %}");
    ASSERT_TRUE(tokens[0].loop.iterable == Iterable::range(1, 3));

    tokens = getParser().parse("{% for m in memories limit:3 %}{% endfor %}");
    ASSERT_TRUE(tokens[0].loop.iterable == Iterable::collection("memories"));
    ASSERT_EQ(tokens[0].loop.params["limit"], "3");

    // Unknown collections are only caught when rendering.
    tokens = getParser().parse("{% for m in nonsense %}{% endfor %}");
    ASSERT_TRUE(tokens[0].loop.iterable == Iterable::collection("nonsense"));

    ASSERT_EQ(parseError("{% for i (1..3) %}").type, VATIC_PARSER_ERROR_TYPE_INVALID_FOR_LOOP_SYNTAX);
    ASSERT_EQ(parseError("{% for i on (1..3) %}").type, VATIC_PARSER_ERROR_TYPE_INVALID_FOR_LOOP_SYNTAX);
    ASSERT_EQ(parseError("{% for i %}").type, VATIC_PARSER_ERROR_TYPE_INVALID_FOR_LOOP_SYNTAX);
    ASSERT_EQ(parseError("{% for i in (1..3 %}").type, VATIC_PARSER_ERROR_TYPE_UNCLOSED_RANGE_PAREN);
    ASSERT_EQ(parseError("{% for i in (1...3) %}").type, VATIC_PARSER_ERROR_TYPE_INVALID_RANGE_BOUND);

    Parser::Error error = parseError("{% for i in (1..3..5) %}");
    ASSERT_EQ(error.type, VATIC_PARSER_ERROR_TYPE_INVALID_RANGE_BOUND);
    error = parseError("{% for i in (a..3) %}");
    ASSERT_EQ(error.type, VATIC_PARSER_ERROR_TYPE_INVALID_RANGE_BOUND);
    ASSERT_STREQ(error.details.args[1], "start");
    error = parseError("{% for i in (1..) %}");
    ASSERT_EQ(error.type, VATIC_PARSER_ERROR_TYPE_INVALID_RANGE_BOUND);
    ASSERT_STREQ(error.details.args[1], "end");
}

TEST(sanity, literal) {
    RenderContext store;
    ASSERT_EQ(renderTemplate("asdf", store), "asdf");
    ASSERT_EQ(renderTemplate("", store), "");
}

TEST(sanity, forloop) {
    RenderContext store;
    ASSERT_EQ(renderTemplate("{% for i in (1..3) %}item {% endfor %}", store), "item item item ");
    ASSERT_EQ(renderTemplate("{% for i in (1..5) %}{% i %}{% endfor %}", store), "12345");
    ASSERT_EQ(renderTemplate("{% for i in (-2..1) %}{% i %},{% endfor %}", store), "-2,-1,0,1,");
    ASSERT_EQ(renderTemplate("{% for i in (3..3) %}{% i %}{% endfor %}", store), "3");
    ASSERT_EQ(renderTemplate("a{% for i in (5..1) %}{% i %}{% endfor %}b", store), "ab");
    ASSERT_EQ(renderTemplate("{% for i in (9223372036854775806..9223372036854775807) %}{% i %} {% endfor %}", store), "9223372036854775806 9223372036854775807 ");

    ASSERT_EQ(renderTemplate("{% for i in (1..2) %}{% for j in (1..2) %}({% i %},{% j %}) {% endfor %}{% endfor %}", store), "(1,1) (1,2) (2,1) (2,2) ");
    ASSERT_EQ(renderTemplate("{% for i in (1..2) %}[{% for j in (1..2) %}{% for k in (1..2) %}.{% endfor %}{% endfor %}]{% endfor %}", store), "[....][....]");

    // An inner loop binding the same name shadows the outer one, and the outer value comes back after it.
    ASSERT_EQ(renderTemplate("{% for i in (1..2) %}{% i %}{% for i in (7..8) %}{% i %}{% endfor %}{% i %} {% endfor %}", store), "1781 2782 ");

    // Loop variables do not outlive their loop.
    ASSERT_EQ(renderError("{% for i in (1..2) %}{% endfor %}{% i %}", store).type, VATIC_RENDERER_ERROR_TYPE_UNKNOWN_TAG);
}

TEST(sanity, blockMatching) {
    RenderContext store;
    Renderer::Error error = renderError("a\n{% for i in (1..3) %}{% i %}", store);
    ASSERT_EQ(error.type, VATIC_RENDERER_ERROR_TYPE_UNTERMINATED_FOR_LOOP);
    ASSERT_EQ(error.details.line, 2);
    ASSERT_EQ(error.details.column, 1);

    error = renderError("{% for i in (1..3) %}{% for j in (1..3) %}{% endfor %}", store);
    ASSERT_EQ(error.type, VATIC_RENDERER_ERROR_TYPE_UNTERMINATED_FOR_LOOP);
    ASSERT_EQ(error.details.column, 1);

    error = renderError("text {% endfor %}", store);
    ASSERT_EQ(error.type, VATIC_RENDERER_ERROR_TYPE_UNEXPECTED_END_FOR);
    ASSERT_EQ(error.details.column, 6);

    error = renderError("{% for i in (1..3) %}{% endfor %}{% endfor %}", store);
    ASSERT_EQ(error.type, VATIC_RENDERER_ERROR_TYPE_UNEXPECTED_END_FOR);

    // Nothing is rendered when anything fails.
    ASSERT_THROW({
        getRenderer().render(getParser().parse("output {% bogus %}"), store);
    }, Renderer::Exception);
}

TEST(sanity, memories) {
    RenderContext store = getWeatherStore();
    ASSERT_EQ(renderTemplate("{% memory %}", store), "sunny");
    ASSERT_EQ(renderTemplate("{% memory minus=1 %}", store), "sunny");
    ASSERT_EQ(renderTemplate("{% memory minus=0 %}", store), "sunny");
    ASSERT_EQ(renderTemplate("{% memory minus=2 %}", store), "rainy");
    ASSERT_EQ(renderTemplate("{% memory minus:3 %}", store), "cloudy");
    // The last occurrence of a key wins.
    ASSERT_EQ(renderTemplate("{% memory minus=2 minus=3 %}", store), "cloudy");

    Renderer::Error error = renderError("{% memory minus=99 %}", store);
    ASSERT_EQ(error.type, VATIC_RENDERER_ERROR_TYPE_MEMORY_OFFSET_OUT_OF_RANGE);
    ASSERT_EQ(Renderer::Error::english(error), "No memory at offset 98 (have 3 memories) on line 1, column 1.");

    ASSERT_EQ(renderError("{% memory %}", RenderContext()).type, VATIC_RENDERER_ERROR_TYPE_MEMORY_OFFSET_OUT_OF_RANGE);
    ASSERT_EQ(renderError("{% memory minus=two %}", store).type, VATIC_RENDERER_ERROR_TYPE_INVALID_MEMORY_OFFSET);
    ASSERT_EQ(renderError("{% memory minus=-1 %}", store).type, VATIC_RENDERER_ERROR_TYPE_INVALID_MEMORY_OFFSET);

    RenderContext twoDays;
    twoDays.memories.emplace_back("2024-05-02", "2024-05-02 08:00", "sunny");
    twoDays.memories.emplace_back("2024-05-01", "2024-05-01 08:00", "rainy");
    ASSERT_EQ(renderTemplate("{% for i in memories limit:3 %}Date: {% i.date %}\n{% endfor %}", twoDays), "Date: 2024-05-02\nDate: 2024-05-01\n");

    ASSERT_EQ(renderTemplate("{% for m in memories %}{% m %};{% endfor %}", store), "sunny;rainy;cloudy;");
    ASSERT_EQ(renderTemplate("{% for m in memories limit:2 %}{% m.datetime %}|{% m.result %};{% endfor %}", store), "2024-05-03 08:00|sunny;2024-05-02 08:00|rainy;");
    ASSERT_EQ(renderTemplate("{% for m in memories limit=0 %}{% m %}{% endfor %}", store), "");
    // An unusable limit is ignored.
    ASSERT_EQ(renderTemplate("{% for m in memories limit:lots %}{% m %}{% endfor %}", store), "sunnyrainycloudy");
    ASSERT_EQ(renderTemplate("{% for m in memories %}{% m %}{% endfor %}", RenderContext()), "");

    ASSERT_EQ(renderError("{% for m in memories %}{% m.weather %}{% endfor %}", store).type, VATIC_RENDERER_ERROR_TYPE_UNKNOWN_LOOP_FIELD);
    ASSERT_EQ(renderError("{% for m in (1..2) %}{% m.result %}{% endfor %}", store).type, VATIC_RENDERER_ERROR_TYPE_LOOP_FIELD_ON_INDEX);
    ASSERT_EQ(renderError("{% m.result %}", store).type, VATIC_RENDERER_ERROR_TYPE_UNKNOWN_LOOP_VARIABLE);

    error = renderError("{% for m in results %}{% endfor %}", store);
    ASSERT_EQ(error.type, VATIC_RENDERER_ERROR_TYPE_UNKNOWN_COLLECTION);
    ASSERT_STREQ(error.details.args[0], "results");
}

TEST(sanity, lookups) {
    RenderContext store;
    store.dictionary.set("general", "name", "Franz");
    store.dictionary.set("other", "city", "Vienna");
    store.secrets.entries["github"] = Secret{ "token", "Authorization", "https://api.github.com" };

    ASSERT_EQ(renderTemplate("Hello {% custom:name %}!", store), "Hello Franz!");
    ASSERT_EQ(renderTemplate("{% proxy:github %}", store), "https://api.github.com");

    Renderer::Error error = renderError("{% custom:missing %}", store);
    ASSERT_EQ(error.type, VATIC_RENDERER_ERROR_TYPE_UNKNOWN_DICTIONARY_KEY);
    ASSERT_EQ(Renderer::Error::english(error), "Unknown dictionary key 'custom:missing' on line 1, column 1.");
    // Only the general section is reachable.
    ASSERT_EQ(renderError("{% custom:city %}", store).type, VATIC_RENDERER_ERROR_TYPE_UNKNOWN_DICTIONARY_KEY);
    ASSERT_EQ(renderError("{% proxy:missing %}", store).type, VATIC_RENDERER_ERROR_TYPE_UNKNOWN_SECRET);

    error = renderError("ok\n\n   {% bogus %}", store);
    ASSERT_EQ(error.type, VATIC_RENDERER_ERROR_TYPE_UNKNOWN_TAG);
    ASSERT_STREQ(error.details.args[0], "bogus");
    ASSERT_EQ(error.details.line, 3);
    ASSERT_EQ(error.details.column, 4);

    ASSERT_EQ(renderTemplate("[{% result %}][{% message %}][{% sender %}]", store), "[][][]");
    store.result = "done";
    store.message = "what's the weather?";
    store.sender = "franz@example.com";
    ASSERT_EQ(renderTemplate("[{% result %}][{% message %}][{% sender %}]", store), "[done][what's the weather?][franz@example.com]");

    // Dotted names are always loop fields, whatever they start with.
    ASSERT_EQ(renderError("{% custom:name.first %}", store).type, VATIC_RENDERER_ERROR_TYPE_UNKNOWN_LOOP_VARIABLE);

    // Non-breaking and other Unicode spaces around the tag body are trimmed like ASCII ones.
    ASSERT_EQ(renderTemplate("{%\u00a0result\u00a0%}", store), "done");
    ASSERT_EQ(renderTemplate("{%\u3000custom:name\u2003| summary\u00a0%}", store), "Summary of: Franz");
    ASSERT_EQ(trim("\u00a0\u2028 a\u00a0b \u202f"), "a\u00a0b");
    ASSERT_EQ(trim("\u00e9"), "\u00e9");

    // Built in names win over loop variables of the same name.
    ASSERT_EQ(renderTemplate("{% for result in (1..2) %}{% result %}{% endfor %}", store), "donedone");

    store.loopVariables["day"] = LoopValue(4);
    ASSERT_EQ(renderTemplate("{% day %}", store), "4");
}

TEST(sanity, dates) {
    RenderContext store;
    store.dictionary.set("general", "name", "Franz");
    ASSERT_EQ(renderTemplate("Hello {% custom:name %}, today is {% date %}", store), "Hello Franz, today is " + localTime(0, "%Y-%m-%d"));
    ASSERT_EQ(renderTemplate("{% date minus=1d %}", store), localTime(-24*60*60, "%Y-%m-%d"));
    ASSERT_EQ(renderTemplate("{% date plus=2d %}", store), localTime(2*24*60*60, "%Y-%m-%d"));
    ASSERT_EQ(renderTemplate("{% date minus=3d plus=3d %}", store), localTime(0, "%Y-%m-%d"));
    ASSERT_EQ(renderTemplate("{% date minus=-1d %}", store), localTime(24*60*60, "%Y-%m-%d"));
    ASSERT_EQ(renderTemplate("{% datetime minus=48h %}", store), localTime(-48*60*60, "%Y-%m-%d %H:%M"));
    ASSERT_EQ(renderTemplate("{% datetime plus=1440m %}", store), localTime(24*60*60, "%Y-%m-%d %H:%M"));
    ASSERT_EQ(renderTemplate("{% datetime %}", store).size(), 16);

    string iso = renderTemplate("{% datetimeiso minus=5d %}", store);
    ASSERT_EQ(iso.size(), 25);
    ASSERT_EQ(iso.substr(0, 10), localTime(0, "%Y-%m-%d"));
    ASSERT_EQ(iso[10], 'T');
    ASSERT_TRUE(iso[19] == '+' || iso[19] == '-');
    ASSERT_EQ(iso[22], ':');

    // Every date tag of one render sees the same instant.
    string twice = renderTemplate("{% datetimeiso %}|{% datetimeiso %}", store);
    ASSERT_EQ(twice.size(), 51);
    ASSERT_EQ(twice.substr(0, 25), twice.substr(26));
    twice = renderTemplate("{% datetime %}|{% for i in (1..50000) %}{% endfor %}{% datetime %}", store);
    ASSERT_EQ(twice.substr(0, 16), twice.substr(17));

    ASSERT_EQ(renderError("{% date minus= %}", store).type, VATIC_RENDERER_ERROR_TYPE_EMPTY_DURATION);
    ASSERT_EQ(renderError("{% date minus=xd %}", store).type, VATIC_RENDERER_ERROR_TYPE_INVALID_DURATION_NUMBER);
    ASSERT_EQ(renderError("{% date minus=d %}", store).type, VATIC_RENDERER_ERROR_TYPE_INVALID_DURATION_NUMBER);
    ASSERT_EQ(renderError("{% date minus=1.5d %}", store).type, VATIC_RENDERER_ERROR_TYPE_INVALID_DURATION_NUMBER);
    ASSERT_EQ(renderError("{% date plus=99999999999999999d %}", store).type, VATIC_RENDERER_ERROR_TYPE_INVALID_DURATION_NUMBER);
    Renderer::Error error = renderError("{% datetime plus=5w %}", store);
    ASSERT_EQ(error.type, VATIC_RENDERER_ERROR_TYPE_INVALID_DURATION_UNIT);
    ASSERT_STREQ(error.details.args[0], "w");
}

TEST(sanity, interpolation) {
    RenderContext store;
    auto tokens = getParser().parse("{% date minus=i\"d\" %}");
    const Token& token = tokens[0];

    getRenderer().store = &store;
    getRenderer().loopVariables.clear();
    ASSERT_EQ(getRenderer().resolveParameterValue(token, "i\"d\""), "i\"d\"");
    store.loopVariables["i"] = LoopValue(2);
    ASSERT_EQ(getRenderer().resolveParameterValue(token, "i\"d\""), "2d");
    ASSERT_EQ(getRenderer().resolveParameterValue(token, "i\"h\"\""), "2h");
    ASSERT_EQ(getRenderer().resolveParameterValue(token, "3d"), "3d");
    store.loopVariables["i"] = LoopValue(MemoryEntry("2024-05-01", "2024-05-01 08:00", "sunny"));
    ASSERT_THROW({
        getRenderer().resolveParameterValue(token, "i\"d\"");
    }, Renderer::Exception);
    getRenderer().store = nullptr;

    RenderContext empty;
    ASSERT_EQ(renderTemplate("{% for i in (1..2) %}{% date minus=i\"d\" %} {% endfor %}", empty),
        localTime(-24*60*60, "%Y-%m-%d") + " " + localTime(-2*24*60*60, "%Y-%m-%d") + " ");
    // With nothing bound, the raw text goes on to duration parsing.
    ASSERT_EQ(renderError("{% date minus=i\"d\" %}", empty).type, VATIC_RENDERER_ERROR_TYPE_INVALID_DURATION_NUMBER);

    RenderContext weather = getWeatherStore();
    Renderer::Error error = renderError("{% for m in memories %}{% date minus=m\"d\" %}{% endfor %}", weather);
    ASSERT_EQ(error.type, VATIC_RENDERER_ERROR_TYPE_INTERPOLATION_TYPE_MISMATCH);
    ASSERT_STREQ(error.details.args[0], "m");
}

struct ShoutPipe : PipeType {
    ShoutPipe() : PipeType("shout") { }
    string apply(Renderer& renderer, const string& input) const override {
        string result = input;
        for (auto& c : result)
            c = toupper(c);
        return result + "!";
    }
};

struct FailingPipe : PipeType {
    FailingPipe() : PipeType("fail") { }
    string apply(Renderer& renderer, const string& input) const override {
        throw std::runtime_error("pipe failed");
    }
};

TEST(sanity, pipes) {
    RenderContext store = getWeatherStore();
    ASSERT_EQ(renderTemplate("{% memory | summary %}", store), "Summary of: sunny");
    ASSERT_EQ(renderTemplate("{% for m in memories limit:1 %}{% m.result|summary %}{% endfor %}", store), "Summary of: sunny");

    Renderer::Error error = renderError("{% memory | shout %}", store);
    ASSERT_EQ(error.type, VATIC_RENDERER_ERROR_TYPE_UNKNOWN_PIPE);
    ASSERT_STREQ(error.details.args[0], "shout");

    Context context;
    ASSERT_EQ(context.getPipeType("summary"), nullptr);
    context.registerType<ShoutPipe>();
    Parser parser(context);
    Renderer renderer(context);
    ASSERT_EQ(renderer.render(parser.parse("{% memory minus=2 | shout %}"), store), "RAINY!");

    ASSERT_EQ(Vatic::render(getContext(), "{% memory minus=3 | summary %}", store), "Summary of: cloudy");

    // A failing pipe leaves the renderer detached from the caller's store.
    context.registerType<FailingPipe>();
    ASSERT_THROW({
        renderer.render(parser.parse("{% memory | fail %}"), store);
    }, std::runtime_error);
    ASSERT_EQ(renderer.store, nullptr);
}

TEST(sanity, cinterface) {
    auto context = vaticCreateContext();
    vaticImplementStandardDialect(context);
    vaticRegisterPipe(context, "bracket", +[](VaticRenderer renderer, const char* input, size_t size, void* data) {
        string result = string(static_cast<const char*>(data)) + string(input, size) + "]";
        vaticRendererSetReturnValueString(renderer, result.data(), result.size());
    }, (void*)"[");

    auto parser = vaticCreateParser(context);
    auto renderer = vaticCreateRenderer(context);
    auto store = vaticCreateRenderContext();
    vaticRenderContextSetDictionaryValue(store, "general", "name", "Franz");
    vaticRenderContextSetSecret(store, "github", "token", "Authorization", "https://api.github.com");
    vaticRenderContextSetResult(store, "done");
    vaticRenderContextAddMemory(store, "2024-05-02", "2024-05-02 08:00", "sunny");
    vaticRenderContextAddMemory(store, "2024-05-01", "2024-05-01 08:00", "rainy");
    vaticRenderContextSetIndexVariable(store, "n", 7);

    VaticLexerError lexerError;
    VaticParserError parserError;
    const char* text = "{% custom:name %} {% proxy:github %} {% result | bracket %} {% memory minus=2 | summary %} {% n %}";
    VaticTemplate tmpl = vaticParserParseTemplate(parser, text, strlen(text), &lexerError, &parserError);
    ASSERT_NE(tmpl.tokens, nullptr);
    ASSERT_EQ(lexerError.type, VATIC_LEXER_ERROR_TYPE_NONE);
    ASSERT_EQ(parserError.type, VATIC_PARSER_ERROR_TYPE_NONE);
    ASSERT_EQ(vaticTemplateGetTokenCount(tmpl), 9);

    VaticRendererError rendererError;
    VaticTemplateRender render = vaticRendererRenderTemplate(renderer, store, tmpl, &rendererError);
    ASSERT_EQ(rendererError.type, VATIC_RENDERER_ERROR_TYPE_NONE);
    ASSERT_EQ(string(vaticTemplateRenderGetBuffer(render), vaticTemplateRenderGetSize(render)), "Franz https://api.github.com [done] Summary of: rainy 7");
    vaticFreeTemplateRender(render);
    vaticFreeTemplate(tmpl);

    vaticRegisterPipe(context, "host", +[](VaticRenderer renderer, const char* input, size_t size, void* data) {
        string result = string(static_cast<const char*>(vaticRendererGetCustomData(renderer))) + ": " + string(input, size);
        vaticRendererSetReturnValueString(renderer, result.data(), result.size());
    }, nullptr);
    vaticRegisterPipe(context, "silent", +[](VaticRenderer renderer, const char* input, size_t size, void* data) { }, nullptr);
    vaticRendererSetCustomData(renderer, (void*)"matrix");
    ASSERT_EQ(std::string(static_cast<const char*>(vaticRendererGetCustomData(renderer))), "matrix");
    vaticRenderContextSetMessage(store, "what's the weather?");
    vaticRenderContextSetSender(store, "franz@example.com");
    text = "{% message | host %} <{% sender | silent %}> {% sender %}";
    tmpl = vaticParserParseTemplate(parser, text, strlen(text), &lexerError, &parserError);
    ASSERT_NE(tmpl.tokens, nullptr);
    render = vaticRendererRenderTemplate(renderer, store, tmpl, &rendererError);
    ASSERT_EQ(rendererError.type, VATIC_RENDERER_ERROR_TYPE_NONE);
    ASSERT_EQ(string(vaticTemplateRenderGetBuffer(render), vaticTemplateRenderGetSize(render)), "matrix: what's the weather? <> franz@example.com");
    vaticFreeTemplateRender(render);
    vaticFreeTemplate(tmpl);

    char buffer[512];
    tmpl = vaticParserParseTemplate(parser, "abc {% date", sizeof("abc {% date")-1, &lexerError, &parserError);
    ASSERT_EQ(tmpl.tokens, nullptr);
    ASSERT_EQ(lexerError.type, VATIC_LEXER_ERROR_TYPE_UNCLOSED_TAG);
    vaticGetLexerErrorMessage(lexerError, buffer, sizeof(buffer));
    ASSERT_STREQ(buffer, "Unclosed tag on line 1, column 5: missing '%}'.");

    tmpl = vaticParserParseTemplate(parser, "{% %}", sizeof("{% %}")-1, &lexerError, &parserError);
    ASSERT_EQ(tmpl.tokens, nullptr);
    ASSERT_EQ(lexerError.type, VATIC_LEXER_ERROR_TYPE_NONE);
    ASSERT_EQ(parserError.type, VATIC_PARSER_ERROR_TYPE_EMPTY_TAG);
    vaticGetParserErrorMessage(parserError, buffer, sizeof(buffer));
    ASSERT_STREQ(buffer, "Empty tag on line 1, column 1.");

    tmpl = vaticParserParseTemplate(parser, "{% proxy:gitlab %}", sizeof("{% proxy:gitlab %}")-1, &lexerError, &parserError);
    ASSERT_NE(tmpl.tokens, nullptr);
    render = vaticRendererRenderTemplate(renderer, store, tmpl, &rendererError);
    ASSERT_EQ(render.internal, nullptr);
    ASSERT_EQ(rendererError.type, VATIC_RENDERER_ERROR_TYPE_UNKNOWN_SECRET);
    vaticGetRendererErrorMessage(rendererError, buffer, 20);
    ASSERT_STREQ(buffer, "Unknown secret for ");
    vaticFreeTemplate(tmpl);

    vaticFreeRenderContext(store);
    vaticFreeRenderer(renderer);
    vaticFreeParser(parser);
    vaticFreeContext(context);
}

#ifdef VATIC_INCLUDE_RAPIDJSON_CONTEXT
TEST(sanity, rapidjson) {
    RenderContext store = RapidJSONContextLoader::load(string(R"({
        "dictionary": { "general": { "name": "Franz" } },
        "secrets": { "github": { "key": "token", "header": "Authorization", "match_url": "https://api.github.com" } },
        "result": "done",
        "sender": "franz@example.com",
        "memories": [ { "date": "2024-05-02", "datetime": "2024-05-02 08:00", "result": "sunny" }, { "date": "2024-05-01", "datetime": "2024-05-01 08:00", "result": "rainy" } ]
    })"));
    ASSERT_EQ(renderTemplate("{% custom:name %} {% proxy:github %} {% result %} {% message %}{% sender %} {% memory minus=2 %}", store), "Franz https://api.github.com done franz@example.com rainy");
    ASSERT_EQ(store.secrets.get("github")->header, "Authorization");

    ASSERT_THROW({
        RapidJSONContextLoader::load(string(R"({ "result": 5 })"));
    }, Vatic::Exception);
    ASSERT_THROW({
        RapidJSONContextLoader::load(string(R"({ "memories": { } })"));
    }, Vatic::Exception);
    ASSERT_THROW({
        RapidJSONContextLoader::load(string("{ \"result\": "));
    }, Vatic::Exception);
}
#endif

int main(int argc, char **argv) {
    ::testing::InitGoogleTest(&argc, argv);
    return RUN_ALL_TESTS();
}
