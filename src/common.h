#ifndef VATICCOMMON_H
#define VATICCOMMON_H

#include <unordered_map>
#include <string>
#include <vector>
#include <memory>
#include <cstdarg>
#include <cstdio>
#include <cstring>
#include <chrono>

#include "interface.h"

namespace Vatic {
    template<typename T>
    using vector = std::vector<T>;
    using string = std::string;
    template<typename S, typename T>
    using unordered_map = std::unordered_map<S,T>;
    template<typename T>
    using unique_ptr = std::unique_ptr<T>;
    using std::make_unique;
    using std::move;


    struct Exception : public std::exception {
        std::string internal;

        Exception() { }
        Exception(const char* format, ...) {
            char buffer[512];
            va_list args;
            va_start(args, format);
            vsnprintf(buffer, sizeof(buffer), format, args);
            va_end(args);
            internal = buffer;
        }
        const char * what () const throw () {
            return internal.c_str();
        }
    };

    // Key/value pairs following the tag name, or the collection name of a for loop. Later keys overwrite earlier ones.
    typedef unordered_map<string, string> Parameters;

    struct TagContent {
        string name;
        Parameters params;
        // Empty when no pipe was given; '|' with nothing after it counts as no pipe.
        string pipe;

        bool hasPipe() const { return !pipe.empty(); }
    };

    struct Iterable {
        enum class Type {
            RANGE,
            COLLECTION
        };
        Type type;
        long long start;
        long long end;
        string name;

        Iterable() : type(Type::RANGE), start(0), end(-1) { }
        static Iterable range(long long start, long long end) {
            Iterable iterable;
            iterable.start = start;
            iterable.end = end;
            return iterable;
        }
        static Iterable collection(const string& name) {
            Iterable iterable;
            iterable.type = Type::COLLECTION;
            iterable.name = name;
            return iterable;
        }

        bool operator == (const Iterable& iterable) const {
            if (type != iterable.type)
                return false;
            if (type == Type::RANGE)
                return start == iterable.start && end == iterable.end;
            return name == iterable.name;
        }
    };

    struct ForLoop {
        string var;
        Iterable iterable;
        // e.g. limit:3
        Parameters params;
    };

    // The template is lexed into a flat list of these; for blocks are matched up at render time.
    struct Token {
        enum class Type {
            LITERAL,
            TAG,
            FOR_START,
            FOR_END
        };

        Type type;
        size_t line;
        size_t column;

        string literal;
        TagContent tag;
        ForLoop loop;

        Token() : type(Type::FOR_END), line(0), column(0) { }
        Token(Type type, size_t line, size_t column) : type(type), line(line), column(column) { }
        Token(string literal, size_t line, size_t column) : type(Type::LITERAL), line(line), column(column), literal(move(literal)) { }
        Token(TagContent tag, size_t line, size_t column) : type(Type::TAG), line(line), column(column), tag(move(tag)) { }
        Token(ForLoop loop, size_t line, size_t column) : type(Type::FOR_START), line(line), column(column), loop(move(loop)) { }
    };

    inline bool isTrimmable(char c) {
        return c == ' ' || c == '\t' || c == '\n' || c == '\r' || c == '\f' || c == '\v';
    }

    // Byte length of the UTF-8 encoded Unicode whitespace character starting at str, or 0.
    inline size_t leadingWhitespace(const char* str, size_t len) {
        const unsigned char* s = (const unsigned char*)str;
        if (len >= 1 && isTrimmable(str[0]))
            return 1;
        if (len >= 2 && s[0] == 0xC2 && (s[1] == 0x85 || s[1] == 0xA0))
            return 2;
        if (len >= 3) {
            if (s[0] == 0xE1 && s[1] == 0x9A && s[2] == 0x80)
                return 3;
            if (s[0] == 0xE2 && s[1] == 0x80 && ((s[2] >= 0x80 && s[2] <= 0x8A) || s[2] == 0xA8 || s[2] == 0xA9 || s[2] == 0xAF))
                return 3;
            if (s[0] == 0xE2 && s[1] == 0x81 && s[2] == 0x9F)
                return 3;
            if (s[0] == 0xE3 && s[1] == 0x80 && s[2] == 0x80)
                return 3;
        }
        return 0;
    }

    // Byte length of the whitespace character ending at str[len-1], or 0.
    inline size_t trailingWhitespace(const char* str, size_t len) {
        for (size_t width = 1; width <= 3 && width <= len; ++width) {
            if (leadingWhitespace(&str[len - width], width) == width)
                return width;
        }
        return 0;
    }

    // Strips Unicode whitespace at both ends.
    inline string trim(const char* str, size_t len) {
        size_t start = 0;
        size_t width;
        while (start < len && (width = leadingWhitespace(&str[start], len - start)) > 0)
            start += width;
        while (len > start && (width = trailingWhitespace(&str[start], len - start)) > 0)
            len -= width;
        return string(&str[start], len - start);
    }
    inline string trim(const string& str) { return trim(str.data(), str.size()); }

    // Strict integer parsing: an optional sign followed by at least one digit, and nothing else. False on overflow.
    bool parseInteger(const string& str, long long& target);
    // As above, but no '-' is allowed.
    bool parseUnsigned(const string& str, unsigned long long& target);
}

#endif
