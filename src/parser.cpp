#include "context.h"
#include "parser.h"

#include <cerrno>
#include <climits>

namespace Vatic {

    bool parseUnsigned(const string& str, unsigned long long& target) {
        size_t offset = 0;
        if (offset < str.size() && str[offset] == '+')
            ++offset;
        if (offset == str.size())
            return false;
        unsigned long long value = 0;
        for (; offset < str.size(); ++offset) {
            if (str[offset] < '0' || str[offset] > '9')
                return false;
            unsigned long long digit = str[offset] - '0';
            if (value > (ULLONG_MAX - digit) / 10)
                return false;
            value = value * 10 + digit;
        }
        target = value;
        return true;
    }

    bool parseInteger(const string& str, long long& target) {
        bool negative = !str.empty() && str[0] == '-';
        unsigned long long magnitude;
        if (!parseUnsigned(negative ? str.substr(1) : str, magnitude))
            return false;
        // "-+5" slips through parseUnsigned's optional sign.
        if (negative && str.size() > 1 && str[1] == '+')
            return false;
        if (negative) {
            if (magnitude > (unsigned long long)LLONG_MAX + 1)
                return false;
            target = magnitude == (unsigned long long)LLONG_MAX + 1 ? LLONG_MIN : -(long long)magnitude;
        } else {
            if (magnitude > (unsigned long long)LLONG_MAX)
                return false;
            target = (long long)magnitude;
        }
        return true;
    }

    vector<string> Parser::splitParts(const string& str) {
        vector<string> parts;
        string current;
        bool inQuotes = false;
        for (char c : str) {
            switch (c) {
                case '"':
                    inQuotes = !inQuotes;
                    current.push_back(c);
                break;
                case ' ':
                case '\t':
                    if (inQuotes) {
                        current.push_back(c);
                    } else if (!current.empty()) {
                        parts.push_back(current);
                        current.clear();
                    }
                break;
                default:
                    current.push_back(c);
                break;
            }
        }
        if (!current.empty())
            parts.push_back(current);
        return parts;
    }

    void Parser::splitPipe(const string& body, string& beforePipe, string& pipe) {
        size_t position = body.find('|');
        if (position == string::npos) {
            beforePipe = body;
            pipe.clear();
            return;
        }
        beforePipe = trim(body.data(), position);
        pipe = trim(body.substr(position + 1));
    }

    bool Parser::parseParameter(const string& part, Parameters& parameters) {
        // '=' wins over ':', wherever each of them sits.
        size_t separator = part.find('=');
        if (separator == string::npos)
            separator = part.find(':');
        if (separator == string::npos) {
            pushError(Parser::Error(lexer, Parser::Error::Type::VATIC_PARSER_ERROR_TYPE_INVALID_PARAM, part, "missing '=' or ':'"));
            return false;
        }
        if (separator == 0) {
            pushError(Parser::Error(lexer, Parser::Error::Type::VATIC_PARSER_ERROR_TYPE_INVALID_PARAM, part, "empty key"));
            return false;
        }
        parameters[part.substr(0, separator)] = part.substr(separator + 1);
        return true;
    }

    bool Parser::parseTag(const string& body) {
        string beforePipe;
        TagContent tag;
        splitPipe(body, beforePipe, tag.pipe);
        vector<string> parts = splitParts(beforePipe);
        if (parts.empty()) {
            pushError(Parser::Error(lexer, Parser::Error::Type::VATIC_PARSER_ERROR_TYPE_EMPTY_TAG));
            return false;
        }
        tag.name = parts[0];
        for (size_t i = 1; i < parts.size(); ++i) {
            if (!parseParameter(parts[i], tag.params))
                return false;
        }
        tokens.push_back(Token(move(tag), lexer.line, lexer.column));
        return true;
    }

    bool Parser::parseForLoop(const string& body) {
        // At most three pieces, split on single spaces, so that the iterable keeps its own spacing.
        vector<string> pieces;
        size_t offset = 0;
        while (pieces.size() < 2) {
            size_t space = body.find(' ', offset);
            if (space == string::npos)
                break;
            pieces.push_back(body.substr(offset, space - offset));
            offset = space + 1;
        }
        pieces.push_back(body.substr(offset));
        if (pieces.size() < 3 || pieces[1] != "in") {
            pushError(Parser::Error(lexer, Parser::Error::Type::VATIC_PARSER_ERROR_TYPE_INVALID_FOR_LOOP_SYNTAX, body));
            return false;
        }

        ForLoop loop;
        loop.var = pieces[0];
        string rest = trim(pieces[2]);

        if (!rest.empty() && rest[0] == '(') {
            size_t close = rest.find(')');
            if (close == string::npos) {
                pushError(Parser::Error(lexer, Parser::Error::Type::VATIC_PARSER_ERROR_TYPE_UNCLOSED_RANGE_PAREN, rest));
                return false;
            }
            string interior = rest.substr(1, close - 1);
            size_t dots = interior.find("..");
            if (dots == string::npos || interior.find("..", dots + 2) != string::npos) {
                pushError(Parser::Error(lexer, Parser::Error::Type::VATIC_PARSER_ERROR_TYPE_INVALID_RANGE_BOUND, interior, "syntax"));
                return false;
            }
            string startText = interior.substr(0, dots);
            string endText = interior.substr(dots + 2);
            long long start, end;
            if (!parseInteger(trim(startText), start)) {
                pushError(Parser::Error(lexer, Parser::Error::Type::VATIC_PARSER_ERROR_TYPE_INVALID_RANGE_BOUND, startText, "start"));
                return false;
            }
            if (!parseInteger(trim(endText), end)) {
                pushError(Parser::Error(lexer, Parser::Error::Type::VATIC_PARSER_ERROR_TYPE_INVALID_RANGE_BOUND, endText, "end"));
                return false;
            }
            loop.iterable = Iterable::range(start, end);
        } else {
            vector<string> parts = splitParts(rest);
            if (parts.empty()) {
                pushError(Parser::Error(lexer, Parser::Error::Type::VATIC_PARSER_ERROR_TYPE_INVALID_FOR_LOOP_SYNTAX, body));
                return false;
            }
            loop.iterable = Iterable::collection(parts[0]);
            for (size_t i = 1; i < parts.size(); ++i) {
                if (!parseParameter(parts[i], loop.params))
                    return false;
            }
        }
        tokens.push_back(Token(move(loop), lexer.line, lexer.column));
        return true;
    }

    bool Parser::Lexer::literal(const char* str, size_t len) {
        parser.tokens.push_back(Token(string(str, len), line, column));
        return true;
    }

    bool Parser::Lexer::controlBlock(const char* str, size_t len) {
        string body = trim(str, len);
        if (body == "endfor") {
            parser.tokens.push_back(Token(Token::Type::FOR_END, line, column));
            return true;
        }
        if (body.compare(0, 4, "for ") == 0)
            return parser.parseForLoop(trim(body.substr(4)));
        return parser.parseTag(body);
    }

    vector<Token> Parser::parse(const char* str, size_t len) {
        tokens.clear();
        errors.clear();
        Lexer::Error error = lexer.parse(str, len);
        if (error)
            throw Parser::Exception(error);
        if (errors.size() > 0)
            throw Parser::Exception(errors);
        vector<Token> result = move(tokens);
        tokens.clear();
        return result;
    }
}
