#include "interface.h"
#include "dialect.h"
#include "context.h"
#include <algorithm>

using namespace Vatic;

VaticContext vaticCreateContext() {
    return VaticContext({ new Context() });
}

void vaticFreeContext(VaticContext context) {
    delete (Context*)context.context;
}

void vaticImplementStandardDialect(VaticContext context) {
    StandardDialect::implement(*static_cast<Context*>(context.context));
}

void* vaticRegisterPipe(VaticContext context, const char* symbol, VaticPipeFunction pipeFunction, void* data) {
    Context* ctx = static_cast<Context*>(context.context);
    unique_ptr<PipeType> registeredType = make_unique<PipeType>(symbol);
    registeredType->userPipeFunction = pipeFunction;
    registeredType->userData = data;
    return ctx->registerType(move(registeredType));
}

void vaticRendererSetReturnValueString(VaticRenderer renderer, const char* s, size_t length) {
    static_cast<Renderer*>(renderer.renderer)->returnValue = string(s, length);
}


VaticRenderContext vaticCreateRenderContext() {
    return VaticRenderContext({ new RenderContext() });
}

void vaticFreeRenderContext(VaticRenderContext store) {
    delete (RenderContext*)store.store;
}

void vaticRenderContextSetDictionaryValue(VaticRenderContext store, const char* section, const char* key, const char* value) {
    static_cast<RenderContext*>(store.store)->dictionary.set(section, key, value);
}

void vaticRenderContextSetSecret(VaticRenderContext store, const char* name, const char* key, const char* header, const char* matchUrl) {
    Secret& secret = static_cast<RenderContext*>(store.store)->secrets.entries[name];
    secret.key = key ? key : "";
    secret.header = header ? header : "";
    secret.matchUrl = matchUrl ? matchUrl : "";
}

void vaticRenderContextSetResult(VaticRenderContext store, const char* result) {
    static_cast<RenderContext*>(store.store)->result = result ? result : "";
}

void vaticRenderContextSetMessage(VaticRenderContext store, const char* message) {
    static_cast<RenderContext*>(store.store)->message = message ? message : "";
}

void vaticRenderContextSetSender(VaticRenderContext store, const char* sender) {
    static_cast<RenderContext*>(store.store)->sender = sender ? sender : "";
}

void vaticRenderContextAddMemory(VaticRenderContext store, const char* date, const char* datetime, const char* result) {
    static_cast<RenderContext*>(store.store)->memories.emplace_back(date ? date : "", datetime ? datetime : "", result ? result : "");
}

void vaticRenderContextSetIndexVariable(VaticRenderContext store, const char* name, long long value) {
    static_cast<RenderContext*>(store.store)->loopVariables[name] = LoopValue(value);
}


VaticParser vaticCreateParser(VaticContext context) {
    return VaticParser({ new Parser(*static_cast<Context*>(context.context)) });
}

void vaticFreeParser(VaticParser parser) {
    delete (Parser*)parser.parser;
}

VaticTemplate vaticParserParseTemplate(VaticParser parser, const char* buffer, size_t size, VaticLexerError* lexerError, VaticParserError* parserError) {
    vector<Token> tokens;
    if (lexerError)
        lexerError->type = VaticLexerErrorType::VATIC_LEXER_ERROR_TYPE_NONE;
    if (parserError)
        parserError->type = VaticParserErrorType::VATIC_PARSER_ERROR_TYPE_NONE;
    try {
        tokens = static_cast<Parser*>(parser.parser)->parse(buffer, size);
    } catch (Parser::Exception& exp) {
        if (lexerError)
            *lexerError = exp.lexerError;
        if (parserError && exp.parserErrors.size() > 0)
            *parserError = exp.parserErrors[0];
        return VaticTemplate({ NULL });
    }
    return VaticTemplate({ new vector<Token>(move(tokens)) });
}

size_t vaticTemplateGetTokenCount(VaticTemplate tmpl) {
    return static_cast<vector<Token>*>(tmpl.tokens)->size();
}

void vaticFreeTemplate(VaticTemplate tmpl) {
    delete static_cast<vector<Token>*>(tmpl.tokens);
}


VaticRenderer vaticCreateRenderer(VaticContext context) {
    return VaticRenderer({ new Renderer(*static_cast<Context*>(context.context)) });
}

void vaticRendererSetCustomData(VaticRenderer renderer, void* data) {
    static_cast<Renderer*>(renderer.renderer)->customData = data;
}

void* vaticRendererGetCustomData(VaticRenderer renderer) {
    return static_cast<Renderer*>(renderer.renderer)->customData;
}

void vaticFreeRenderer(VaticRenderer renderer) {
    delete (Renderer*)renderer.renderer;
}

VaticTemplateRender vaticRendererRenderTemplate(VaticRenderer renderer, VaticRenderContext store, VaticTemplate tmpl, VaticRendererError* error) {
    if (error)
        error->type = VATIC_RENDERER_ERROR_TYPE_NONE;
    try {
        string result = static_cast<Renderer*>(renderer.renderer)->render(*static_cast<vector<Token>*>(tmpl.tokens), *static_cast<RenderContext*>(store.store));
        return VaticTemplateRender({ new string(move(result)) });
    } catch (Renderer::Exception& exp) {
        if (error)
            *error = exp.rendererError;
    }
    return VaticTemplateRender({ NULL });
}

void vaticFreeTemplateRender(VaticTemplateRender render) {
    delete static_cast<string*>(render.internal);
}

const char* vaticTemplateRenderGetBuffer(VaticTemplateRender render) {
    return static_cast<string*>(render.internal)->data();
}

size_t vaticTemplateRenderGetSize(VaticTemplateRender render) {
    return static_cast<string*>(render.internal)->size();
}


static void copyMessage(const string& message, char* buffer, size_t maxSize) {
    if (maxSize == 0)
        return;
    size_t copied = std::min(maxSize - 1, message.size());
    memcpy(buffer, message.data(), copied);
    buffer[copied] = 0;
}

void vaticGetLexerErrorMessage(VaticLexerError error, char* buffer, size_t maxSize) {
    copyMessage(Parser::Lexer::Error::english(error), buffer, maxSize);
}
void vaticGetParserErrorMessage(VaticParserError error, char* buffer, size_t maxSize) {
    copyMessage(Parser::Error::english(error), buffer, maxSize);
}
void vaticGetRendererErrorMessage(VaticRendererError error, char* buffer, size_t maxSize) {
    copyMessage(Renderer::Error::english(error), buffer, maxSize);
}
