#ifndef VATICLEXER_H
#define VATICLEXER_H

#include <cstddef>
#include <cstdlib>
#include <cstring>

#include "common.h"

namespace Vatic {

    // Splits a template into literal runs and the raw bodies of {% %} blocks. Derived lexers receive
    // those through literal() and controlBlock(); returning false from either stops lexing.
    template <class T>
    struct Lexer {

        struct Error : VaticLexerError {
            typedef VaticLexerErrorType Type;

            Error() {
                type = Type::VATIC_LEXER_ERROR_TYPE_NONE;
                details.line = 0;
                details.column = 0;
                details.args[0][0] = 0;
            }
            Error(const Error& error) = default;
            Error(Error&& error) = default;
            Error& operator = (const Error& error) = default;
            Error(Lexer& lexer, Type type, const std::string& message = "") {
                details.line = lexer.line;
                details.column = lexer.column;
                this->type = type;
                strncpy(details.args[0], message.data(), VATIC_ERROR_ARG_MAX_LENGTH-1);
                details.args[0][VATIC_ERROR_ARG_MAX_LENGTH-1] = 0;
            }

            operator bool() const { return type != Type::VATIC_LEXER_ERROR_TYPE_NONE; }

            static string english(const VaticLexerError& error) {
                char buffer[512] = { 0 };
                switch (error.type) {
                    case Type::VATIC_LEXER_ERROR_TYPE_NONE: break;
                    case Type::VATIC_LEXER_ERROR_TYPE_UNCLOSED_TAG:
                        snprintf(buffer, sizeof(buffer), "Unclosed tag on line %lu, column %lu: missing '%%}'.", (unsigned long)error.details.line, (unsigned long)error.details.column);
                    break;
                }
                return std::string(buffer);
            }
        };

        // Position of the chunk currently being handed to the derived lexer; 1-based.
        size_t line;
        size_t column;

        bool literal(const char* str, size_t len) { return true; }
        bool controlBlock(const char* str, size_t len) { return true; }

        Lexer() : line(1), column(1) { }
        ~Lexer() { }

        static const char* findPair(const char* offset, const char* end, char first, char second) {
            for (; offset + 1 < end; ++offset) {
                if (offset[0] == first && offset[1] == second)
                    return offset;
            }
            return nullptr;
        }

        void advance(const char* start, const char* end, size_t& currentLine, size_t& currentColumn) {
            for (; start < end; ++start) {
                if (*start == '\n') {
                    ++currentLine;
                    currentColumn = 1;
                } else {
                    ++currentColumn;
                }
            }
        }

        Error parse(const char* str, size_t size) {
            const char* offset = str;
            const char* end = str + size;
            size_t currentLine = 1;
            size_t currentColumn = 1;
            line = 1;
            column = 1;
            while (offset < end) {
                const char* open = findPair(offset, end, '{', '%');
                line = currentLine;
                column = currentColumn;
                if (!open) {
                    static_cast<T*>(this)->literal(offset, end - offset);
                    break;
                }
                if (open > offset) {
                    if (!static_cast<T*>(this)->literal(offset, open - offset))
                        return Error();
                    advance(offset, open, currentLine, currentColumn);
                    line = currentLine;
                    column = currentColumn;
                }
                const char* close = findPair(open + 2, end, '%', '}');
                if (!close)
                    return Error(*this, Error::Type::VATIC_LEXER_ERROR_TYPE_UNCLOSED_TAG);
                if (!static_cast<T*>(this)->controlBlock(open + 2, close - open - 2))
                    return Error();
                advance(open, close + 2, currentLine, currentColumn);
                offset = close + 2;
            }
            return Error();
        }
    };
}

#endif
