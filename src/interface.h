#ifndef VATICINTERFACE_H
#define VATICINTERFACE_H

#include <stdlib.h>
#include <stdbool.h>

#ifdef __cplusplus
extern "C" {
#endif

    #define VATIC_ERROR_ARG_MAX_LENGTH 64
    #define VATIC_ERROR_ARGS_MAX 5

    typedef enum EVaticLexerErrorType {
        VATIC_LEXER_ERROR_TYPE_NONE,
        // A {% without a closing %}.
        VATIC_LEXER_ERROR_TYPE_UNCLOSED_TAG
    } VaticLexerErrorType;

    typedef enum EVaticParserErrorType {
        VATIC_PARSER_ERROR_TYPE_NONE,
        VATIC_PARSER_ERROR_TYPE_EMPTY_TAG,
        // Parameter without '=' or ':', or with an empty key.
        VATIC_PARSER_ERROR_TYPE_INVALID_PARAM,
        VATIC_PARSER_ERROR_TYPE_INVALID_FOR_LOOP_SYNTAX,
        VATIC_PARSER_ERROR_TYPE_UNCLOSED_RANGE_PAREN,
        VATIC_PARSER_ERROR_TYPE_INVALID_RANGE_BOUND
    } VaticParserErrorType;

    typedef enum EVaticRendererErrorType {
        VATIC_RENDERER_ERROR_TYPE_NONE,
        VATIC_RENDERER_ERROR_TYPE_UNTERMINATED_FOR_LOOP,
        VATIC_RENDERER_ERROR_TYPE_UNEXPECTED_END_FOR,
        VATIC_RENDERER_ERROR_TYPE_UNKNOWN_COLLECTION,
        VATIC_RENDERER_ERROR_TYPE_UNKNOWN_TAG,
        VATIC_RENDERER_ERROR_TYPE_UNKNOWN_LOOP_VARIABLE,
        VATIC_RENDERER_ERROR_TYPE_UNKNOWN_LOOP_FIELD,
        // Dotted access on a variable bound to a range index.
        VATIC_RENDERER_ERROR_TYPE_LOOP_FIELD_ON_INDEX,
        VATIC_RENDERER_ERROR_TYPE_UNKNOWN_DICTIONARY_KEY,
        VATIC_RENDERER_ERROR_TYPE_UNKNOWN_SECRET,
        // The three ways a duration like 2d can be malformed.
        VATIC_RENDERER_ERROR_TYPE_EMPTY_DURATION,
        VATIC_RENDERER_ERROR_TYPE_INVALID_DURATION_NUMBER,
        VATIC_RENDERER_ERROR_TYPE_INVALID_DURATION_UNIT,
        VATIC_RENDERER_ERROR_TYPE_INVALID_MEMORY_OFFSET,
        VATIC_RENDERER_ERROR_TYPE_MEMORY_OFFSET_OUT_OF_RANGE,
        VATIC_RENDERER_ERROR_TYPE_UNKNOWN_PIPE,
        VATIC_RENDERER_ERROR_TYPE_INTERPOLATION_TYPE_MISMATCH
    } VaticRendererErrorType;

    typedef struct SVaticErrorDetails {
        size_t line;
        size_t column;
        char args[VATIC_ERROR_ARGS_MAX][VATIC_ERROR_ARG_MAX_LENGTH];
    } VaticErrorDetails;

    typedef struct SVaticLexerError {
        VaticLexerErrorType type;
        VaticErrorDetails details;
    } VaticLexerError;

    typedef struct SVaticParserError {
        VaticParserErrorType type;
        VaticErrorDetails details;
    } VaticParserError;

    typedef struct SVaticRendererError {
        VaticRendererErrorType type;
        VaticErrorDetails details;
    } VaticRendererError;

    typedef struct SVaticContext { void* context; } VaticContext;
    typedef struct SVaticRenderContext { void* store; } VaticRenderContext;
    typedef struct SVaticRenderer { void* renderer; } VaticRenderer;
    typedef struct SVaticParser { void* parser; } VaticParser;
    typedef struct SVaticTemplate { void* tokens; } VaticTemplate;
    typedef struct SVaticTemplateRender { void* internal; } VaticTemplateRender;

    VaticContext vaticCreateContext();
    void vaticFreeContext(VaticContext context);
    void vaticImplementStandardDialect(VaticContext context);

    // The pipe function receives the resolved tag value, and must write its result with vaticRendererSetReturnValueString.
    // Not calling it yields an empty string.
    typedef void (*VaticPipeFunction)(VaticRenderer renderer, const char* input, size_t size, void* data);
    void* vaticRegisterPipe(VaticContext context, const char* symbol, VaticPipeFunction pipeFunction, void* data);
    void vaticRendererSetReturnValueString(VaticRenderer renderer, const char* s, size_t length);

    VaticRenderContext vaticCreateRenderContext();
    void vaticFreeRenderContext(VaticRenderContext store);
    void vaticRenderContextSetDictionaryValue(VaticRenderContext store, const char* section, const char* key, const char* value);
    void vaticRenderContextSetSecret(VaticRenderContext store, const char* name, const char* key, const char* header, const char* matchUrl);
    void vaticRenderContextSetResult(VaticRenderContext store, const char* result);
    void vaticRenderContextSetMessage(VaticRenderContext store, const char* message);
    void vaticRenderContextSetSender(VaticRenderContext store, const char* sender);
    // Memories are appended in order; the first one added is the newest.
    void vaticRenderContextAddMemory(VaticRenderContext store, const char* date, const char* datetime, const char* result);
    void vaticRenderContextSetIndexVariable(VaticRenderContext store, const char* name, long long value);

    VaticParser vaticCreateParser(VaticContext context);
    void vaticFreeParser(VaticParser parser);
    VaticTemplate vaticParserParseTemplate(VaticParser parser, const char* buffer, size_t size, VaticLexerError* lexerError, VaticParserError* parserError);
    size_t vaticTemplateGetTokenCount(VaticTemplate tmpl);
    void vaticFreeTemplate(VaticTemplate tmpl);

    VaticRenderer vaticCreateRenderer(VaticContext context);
    void vaticRendererSetCustomData(VaticRenderer renderer, void* data);
    void* vaticRendererGetCustomData(VaticRenderer renderer);
    void vaticFreeRenderer(VaticRenderer renderer);

    VaticTemplateRender vaticRendererRenderTemplate(VaticRenderer renderer, VaticRenderContext store, VaticTemplate tmpl, VaticRendererError* error);
    void vaticFreeTemplateRender(VaticTemplateRender render);
    const char* vaticTemplateRenderGetBuffer(VaticTemplateRender render);
    size_t vaticTemplateRenderGetSize(VaticTemplateRender render);

    void vaticGetLexerErrorMessage(VaticLexerError error, char* buffer, size_t maxSize);
    void vaticGetParserErrorMessage(VaticParserError error, char* buffer, size_t maxSize);
    void vaticGetRendererErrorMessage(VaticRendererError error, char* buffer, size_t maxSize);

#ifdef __cplusplus
}
#endif

#endif
