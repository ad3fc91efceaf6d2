#ifndef VATICPARSER_H
#define VATICPARSER_H

#include "common.h"
#include "lexer.h"

namespace Vatic {

    struct Context;

    struct Parser {
        const Context& context;

        struct Error : VaticParserError {
            typedef VaticParserErrorType Type;

            Error() {
                this->type = Type::VATIC_PARSER_ERROR_TYPE_NONE;
                details.column = 0;
                details.line = 0;
                details.args[0][0] = 0;
            }
            Error(const Error& error) = default;
            Error(Error&& error) = default;
            Error& operator = (const Error& error) = default;
            operator bool() const { return type != Type::VATIC_PARSER_ERROR_TYPE_NONE; }

            template <class T>
            Error(T& lexer, Type type, const std::string& arg0 = "", const std::string& arg1 = "") {
                this->type = type;
                details.column = lexer.column;
                details.line = lexer.line;
                strncpy(details.args[0], arg0.c_str(), VATIC_ERROR_ARG_MAX_LENGTH-1);
                details.args[0][VATIC_ERROR_ARG_MAX_LENGTH-1] = 0;
                strncpy(details.args[1], arg1.c_str(), VATIC_ERROR_ARG_MAX_LENGTH-1);
                details.args[1][VATIC_ERROR_ARG_MAX_LENGTH-1] = 0;
            }

            static string english(VaticParserError error) {
                char buffer[512] = { 0 };
                switch (error.type) {
                    case Parser::Error::Type::VATIC_PARSER_ERROR_TYPE_NONE: break;
                    case Parser::Error::Type::VATIC_PARSER_ERROR_TYPE_EMPTY_TAG:
                        snprintf(buffer, sizeof(buffer), "Empty tag on line %lu, column %lu.", (unsigned long)error.details.line, (unsigned long)error.details.column);
                    break;
                    case Parser::Error::Type::VATIC_PARSER_ERROR_TYPE_INVALID_PARAM:
                        if (error.details.args[1][0])
                            snprintf(buffer, sizeof(buffer), "Invalid parameter '%s' on line %lu, column %lu: %s.", error.details.args[0], (unsigned long)error.details.line, (unsigned long)error.details.column, error.details.args[1]);
                        else
                            snprintf(buffer, sizeof(buffer), "Invalid parameter '%s' on line %lu, column %lu.", error.details.args[0], (unsigned long)error.details.line, (unsigned long)error.details.column);
                    break;
                    case Parser::Error::Type::VATIC_PARSER_ERROR_TYPE_INVALID_FOR_LOOP_SYNTAX:
                        snprintf(buffer, sizeof(buffer), "Invalid for loop syntax 'for %s' on line %lu, column %lu.", error.details.args[0], (unsigned long)error.details.line, (unsigned long)error.details.column);
                    break;
                    case Parser::Error::Type::VATIC_PARSER_ERROR_TYPE_UNCLOSED_RANGE_PAREN:
                        snprintf(buffer, sizeof(buffer), "Unclosed range parenthesis in '%s' on line %lu, column %lu.", error.details.args[0], (unsigned long)error.details.line, (unsigned long)error.details.column);
                    break;
                    case Parser::Error::Type::VATIC_PARSER_ERROR_TYPE_INVALID_RANGE_BOUND:
                        snprintf(buffer, sizeof(buffer), "Invalid range %s '%s' on line %lu, column %lu.", error.details.args[1], error.details.args[0], (unsigned long)error.details.line, (unsigned long)error.details.column);
                    break;
                }
                return string(buffer);
            }
        };

        vector<Token> tokens;
        vector<Error> errors;

        void pushError(const Error& error) {
            errors.push_back(error);
        }

        struct Lexer : Vatic::Lexer<Lexer> {
            Parser& parser;
            typedef Vatic::Lexer<Lexer> SUPER;

            bool literal(const char* str, size_t len);
            bool controlBlock(const char* str, size_t len);

            Lexer(Parser& parser) : parser(parser) { }
        };

        struct Exception : Vatic::Exception {
            vector<Parser::Error> parserErrors;
            Lexer::Error lexerError;
            string englishDefault;

            Exception(const vector<Parser::Error>& errors) : parserErrors(errors) {
                englishDefault = Parser::Error::english(parserErrors[0]);
            }
            Exception(const Lexer::Error& error) : lexerError(error) {
                englishDefault = Lexer::Error::english(lexerError);
            }
            const char* what() const noexcept override {
                return englishDefault.c_str();
            }
        };

        Lexer lexer;

        Parser(const Context& context) : context(context), lexer(*this) { }

        // Splits on spaces and tabs, except inside double quotes. The quotes stay in the parts.
        static vector<string> splitParts(const string& str);
        // Splits "name params | pipe" at the first '|'. Both halves are trimmed.
        static void splitPipe(const string& body, string& beforePipe, string& pipe);

        bool parseParameter(const string& part, Parameters& parameters);
        bool parseTag(const string& body);
        bool parseForLoop(const string& body);

        vector<Token> parse(const char* buffer, size_t len);
        vector<Token> parse(const string& str) {
            return parse(str.data(), str.size());
        }
    };
}

#endif
