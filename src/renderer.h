#ifndef VATICRENDERER_H
#define VATICRENDERER_H

#include <ctime>

#include "parser.h"
#include "rendercontext.h"

namespace Vatic {
    struct Context;

    // One renderer per thread; though many renderers can be instantiated.
    struct Renderer {
        const Context& context;

        struct Error : VaticRendererError {
            typedef VaticRendererErrorType Type;

            Error() {
                type = Type::VATIC_RENDERER_ERROR_TYPE_NONE;
                details.column = 0;
                details.line = 0;
                details.args[0][0] = 0;
            }
            Error(const Error& error) = default;
            Error(Error&& error) = default;
            Error& operator = (const Error& error) = default;

            Error(Type type, const Token& token, const std::string& arg0 = "", const std::string& arg1 = "", const std::string& arg2 = "") {
                details.column = token.column;
                details.line = token.line;
                this->type = type;
                strncpy(details.args[0], arg0.c_str(), VATIC_ERROR_ARG_MAX_LENGTH-1);
                details.args[0][VATIC_ERROR_ARG_MAX_LENGTH-1] = 0;
                strncpy(details.args[1], arg1.c_str(), VATIC_ERROR_ARG_MAX_LENGTH-1);
                details.args[1][VATIC_ERROR_ARG_MAX_LENGTH-1] = 0;
                strncpy(details.args[2], arg2.c_str(), VATIC_ERROR_ARG_MAX_LENGTH-1);
                details.args[2][VATIC_ERROR_ARG_MAX_LENGTH-1] = 0;
            }

            static string english(const VaticRendererError& rendererError) {
                char buffer[512] = { 0 };
                char position[64];
                snprintf(position, sizeof(position), "on line %lu, column %lu", (unsigned long)rendererError.details.line, (unsigned long)rendererError.details.column);
                const auto& arg = rendererError.details.args;
                switch (rendererError.type) {
                    case Renderer::Error::Type::VATIC_RENDERER_ERROR_TYPE_NONE: break;
                    case Renderer::Error::Type::VATIC_RENDERER_ERROR_TYPE_UNTERMINATED_FOR_LOOP:
                        snprintf(buffer, sizeof(buffer), "For loop %s without matching endfor.", position);
                    break;
                    case Renderer::Error::Type::VATIC_RENDERER_ERROR_TYPE_UNEXPECTED_END_FOR:
                        snprintf(buffer, sizeof(buffer), "Unexpected endfor outside for loop %s.", position);
                    break;
                    case Renderer::Error::Type::VATIC_RENDERER_ERROR_TYPE_UNKNOWN_COLLECTION:
                        snprintf(buffer, sizeof(buffer), "Unknown collection '%s' %s.", arg[0], position);
                    break;
                    case Renderer::Error::Type::VATIC_RENDERER_ERROR_TYPE_UNKNOWN_TAG:
                        snprintf(buffer, sizeof(buffer), "Unknown tag '%s' %s.", arg[0], position);
                    break;
                    case Renderer::Error::Type::VATIC_RENDERER_ERROR_TYPE_UNKNOWN_LOOP_VARIABLE:
                        snprintf(buffer, sizeof(buffer), "Unknown loop variable '%s' %s.", arg[0], position);
                    break;
                    case Renderer::Error::Type::VATIC_RENDERER_ERROR_TYPE_UNKNOWN_LOOP_FIELD:
                        snprintf(buffer, sizeof(buffer), "Memory has no field '%s' %s.", arg[0], position);
                    break;
                    case Renderer::Error::Type::VATIC_RENDERER_ERROR_TYPE_LOOP_FIELD_ON_INDEX:
                        snprintf(buffer, sizeof(buffer), "Index variable '%s' has no field '%s' %s.", arg[0], arg[1], position);
                    break;
                    case Renderer::Error::Type::VATIC_RENDERER_ERROR_TYPE_UNKNOWN_DICTIONARY_KEY:
                        snprintf(buffer, sizeof(buffer), "Unknown dictionary key 'custom:%s' %s.", arg[0], position);
                    break;
                    case Renderer::Error::Type::VATIC_RENDERER_ERROR_TYPE_UNKNOWN_SECRET:
                        snprintf(buffer, sizeof(buffer), "Unknown secret for proxy '%s' %s.", arg[0], position);
                    break;
                    case Renderer::Error::Type::VATIC_RENDERER_ERROR_TYPE_EMPTY_DURATION:
                        snprintf(buffer, sizeof(buffer), "Empty duration %s.", position);
                    break;
                    case Renderer::Error::Type::VATIC_RENDERER_ERROR_TYPE_INVALID_DURATION_NUMBER:
                        snprintf(buffer, sizeof(buffer), "Invalid duration number '%s' %s.", arg[0], position);
                    break;
                    case Renderer::Error::Type::VATIC_RENDERER_ERROR_TYPE_INVALID_DURATION_UNIT:
                        snprintf(buffer, sizeof(buffer), "Unknown duration unit '%s' %s; expected d, h or m.", arg[0], position);
                    break;
                    case Renderer::Error::Type::VATIC_RENDERER_ERROR_TYPE_INVALID_MEMORY_OFFSET:
                        snprintf(buffer, sizeof(buffer), "Invalid memory offset '%s' %s.", arg[0], position);
                    break;
                    case Renderer::Error::Type::VATIC_RENDERER_ERROR_TYPE_MEMORY_OFFSET_OUT_OF_RANGE:
                        snprintf(buffer, sizeof(buffer), "No memory at offset %s (have %s memories) %s.", arg[0], arg[1], position);
                    break;
                    case Renderer::Error::Type::VATIC_RENDERER_ERROR_TYPE_UNKNOWN_PIPE:
                        snprintf(buffer, sizeof(buffer), "Unknown pipe '%s' %s.", arg[0], position);
                    break;
                    case Renderer::Error::Type::VATIC_RENDERER_ERROR_TYPE_INTERPOLATION_TYPE_MISMATCH:
                        snprintf(buffer, sizeof(buffer), "Loop variable '%s' is not an index, cannot interpolate %s.", arg[0], position);
                    break;
                }
                return string(buffer);
            }
        };

        struct Exception : Vatic::Exception {
            Renderer::Error rendererError;
            std::string message;
            Exception(const Renderer::Error& error) : rendererError(error) {
                message = Error::english(error);
            }

            const char* what() const noexcept override {
               return message.data();
            }
        };

        // The store of the render in progress.
        const RenderContext* store = nullptr;
        // Taken once per render; every date tag in the template sees the same instant.
        std::chrono::system_clock::time_point renderStartTime;

        // Loop bindings introduced while rendering, innermost last. Shadows the store's own loopVariables.
        unordered_map<string, vector<LoopValue>> loopVariables;
        void pushLoopVariable(const string& name, const LoopValue& value);
        void setLoopVariable(const string& name, const LoopValue& value);
        void popLoopVariable(const string& name);
        const LoopValue* getLoopVariable(const string& name) const;

        // Used for the C interface: pipe callbacks write their result to returnValue, and can reach host state through customData.
        string returnValue;
        void* customData = nullptr;

        Renderer(const Context& context);

        string render(const vector<Token>& tokens, const RenderContext& store);

        // Renders tokens [start, end) onto output.
        void render(const vector<Token>& tokens, size_t start, size_t end, string& output);
        // Index of the endfor closing the for block whose body begins at start, skipping nested blocks.
        size_t getMatchingEndFor(const vector<Token>& tokens, size_t start, size_t end) const;
        void renderForLoop(const vector<Token>& tokens, size_t forStart, size_t forEnd, string& output);

        string resolveTag(const Token& token);
        string applyPipe(const Token& token, const string& value);

        // Seconds to shift the current time by, from the minus= and plus= parameters of date and datetime.
        long long computeOffset(const Token& token);
        string resolveParameterValue(const Token& token, const string& value) const;
        static long long parseDuration(const Token& token, const string& duration);
        string formatTime(const Token& token, long long offset, const char* format) const;
        string formatISOTime() const;
    };

    // Lexes, parses and renders in one go. Throws Parser::Exception or Renderer::Exception.
    string render(const Context& context, const string& templateText, const RenderContext& store);
}

#endif
