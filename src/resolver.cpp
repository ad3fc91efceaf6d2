#include <climits>
#include <ctime>

#include "renderer.h"

namespace Vatic {

    namespace {
        enum class TagKind {
            LOOP_FIELD,
            PROXY,
            CUSTOM,
            DATE,
            DATETIME,
            DATETIMEISO,
            RESULT,
            MESSAGE,
            SENDER,
            MEMORY,
            LOOP_VARIABLE
        };

        struct ResolvedTag {
            TagKind kind;
            // Loop variable, secret name or dictionary key, depending on kind.
            string target;
            // Only for LOOP_FIELD.
            string field;
        };

        bool hasPrefix(const string& name, const char* prefix, size_t length) {
            return name.size() >= length && name.compare(0, length, prefix) == 0;
        }

        // Order matters: a dot anywhere wins over every prefix, prefixes win over the exact names.
        ResolvedTag classifyTag(const string& name) {
            size_t dot = name.find('.');
            if (dot != string::npos)
                return { TagKind::LOOP_FIELD, name.substr(0, dot), name.substr(dot + 1) };
            if (hasPrefix(name, "proxy:", 6))
                return { TagKind::PROXY, name.substr(6), string() };
            if (hasPrefix(name, "custom:", 7))
                return { TagKind::CUSTOM, name.substr(7), string() };
            if (name == "date")
                return { TagKind::DATE, string(), string() };
            if (name == "datetime")
                return { TagKind::DATETIME, string(), string() };
            if (name == "datetimeiso")
                return { TagKind::DATETIMEISO, string(), string() };
            if (name == "result")
                return { TagKind::RESULT, string(), string() };
            if (name == "message")
                return { TagKind::MESSAGE, string(), string() };
            if (name == "sender")
                return { TagKind::SENDER, string(), string() };
            if (name == "memory")
                return { TagKind::MEMORY, string(), string() };
            return { TagKind::LOOP_VARIABLE, name, string() };
        }
    }

    string Renderer::resolveTag(const Token& token) {
        ResolvedTag resolved = classifyTag(token.tag.name);
        switch (resolved.kind) {
            case TagKind::LOOP_FIELD: {
                const LoopValue* value = getLoopVariable(resolved.target);
                if (!value)
                    throw Renderer::Exception(Renderer::Error(Renderer::Error::Type::VATIC_RENDERER_ERROR_TYPE_UNKNOWN_LOOP_VARIABLE, token, resolved.target));
                if (value->type == LoopValue::Type::INDEX)
                    throw Renderer::Exception(Renderer::Error(Renderer::Error::Type::VATIC_RENDERER_ERROR_TYPE_LOOP_FIELD_ON_INDEX, token, resolved.target, resolved.field));
                if (resolved.field == "date")
                    return value->memory.date;
                if (resolved.field == "datetime")
                    return value->memory.datetime;
                if (resolved.field == "result")
                    return value->memory.result;
                throw Renderer::Exception(Renderer::Error(Renderer::Error::Type::VATIC_RENDERER_ERROR_TYPE_UNKNOWN_LOOP_FIELD, token, resolved.field));
            }
            case TagKind::PROXY: {
                const Secret* secret = store->secrets.get(resolved.target);
                if (!secret)
                    throw Renderer::Exception(Renderer::Error(Renderer::Error::Type::VATIC_RENDERER_ERROR_TYPE_UNKNOWN_SECRET, token, resolved.target));
                return secret->matchUrl;
            }
            case TagKind::CUSTOM: {
                const string* value = store->dictionary.get("general", resolved.target);
                if (!value)
                    throw Renderer::Exception(Renderer::Error(Renderer::Error::Type::VATIC_RENDERER_ERROR_TYPE_UNKNOWN_DICTIONARY_KEY, token, resolved.target));
                return *value;
            }
            case TagKind::DATE:
                return formatTime(token, computeOffset(token), "%Y-%m-%d");
            case TagKind::DATETIME:
                return formatTime(token, computeOffset(token), "%Y-%m-%d %H:%M");
            case TagKind::DATETIMEISO:
                return formatISOTime();
            case TagKind::RESULT:
                return store->result;
            case TagKind::MESSAGE:
                return store->message;
            case TagKind::SENDER:
                return store->sender;
            case TagKind::MEMORY: {
                unsigned long long offset = 0;
                auto minus = token.tag.params.find("minus");
                if (minus != token.tag.params.end()) {
                    if (!parseUnsigned(minus->second, offset))
                        throw Renderer::Exception(Renderer::Error(Renderer::Error::Type::VATIC_RENDERER_ERROR_TYPE_INVALID_MEMORY_OFFSET, token, minus->second));
                    if (offset > 0)
                        --offset;
                }
                if (offset >= store->memories.size())
                    throw Renderer::Exception(Renderer::Error(Renderer::Error::Type::VATIC_RENDERER_ERROR_TYPE_MEMORY_OFFSET_OUT_OF_RANGE, token, std::to_string(offset), std::to_string(store->memories.size())));
                return store->memories[(size_t)offset].result;
            }
            case TagKind::LOOP_VARIABLE: {
                const LoopValue* value = getLoopVariable(resolved.target);
                if (!value)
                    throw Renderer::Exception(Renderer::Error(Renderer::Error::Type::VATIC_RENDERER_ERROR_TYPE_UNKNOWN_TAG, token, resolved.target));
                if (value->type == LoopValue::Type::INDEX)
                    return std::to_string(value->index);
                return value->memory.result;
            }
        }
        throw Renderer::Exception(Renderer::Error(Renderer::Error::Type::VATIC_RENDERER_ERROR_TYPE_UNKNOWN_TAG, token, token.tag.name));
    }

    long long Renderer::computeOffset(const Token& token) {
        long long total = 0;
        auto minus = token.tag.params.find("minus");
        if (minus != token.tag.params.end())
            total = -parseDuration(token, resolveParameterValue(token, minus->second));
        auto plus = token.tag.params.find("plus");
        if (plus != token.tag.params.end()) {
            long long duration = parseDuration(token, resolveParameterValue(token, plus->second));
            if ((duration > 0 && total > LLONG_MAX - duration) || (duration < 0 && total < LLONG_MIN - duration))
                throw Renderer::Exception(Renderer::Error(Renderer::Error::Type::VATIC_RENDERER_ERROR_TYPE_INVALID_DURATION_NUMBER, token, plus->second));
            total += duration;
        }
        return total;
    }

    // var"suffix" becomes the index bound to var followed by suffix. Anything naming no bound variable passes through as written.
    string Renderer::resolveParameterValue(const Token& token, const string& value) const {
        size_t quote = value.find('"');
        if (quote == string::npos)
            return value;
        string var = value.substr(0, quote);
        const LoopValue* loopValue = getLoopVariable(var);
        if (!loopValue)
            return value;
        if (loopValue->type != LoopValue::Type::INDEX)
            throw Renderer::Exception(Renderer::Error(Renderer::Error::Type::VATIC_RENDERER_ERROR_TYPE_INTERPOLATION_TYPE_MISMATCH, token, var));
        size_t suffixEnd = value.size();
        while (suffixEnd > quote + 1 && value[suffixEnd-1] == '"')
            --suffixEnd;
        return std::to_string(loopValue->index) + value.substr(quote + 1, suffixEnd - (quote + 1));
    }

    // <integer><d|h|m>, in seconds.
    long long Renderer::parseDuration(const Token& token, const string& duration) {
        if (duration.empty())
            throw Renderer::Exception(Renderer::Error(Renderer::Error::Type::VATIC_RENDERER_ERROR_TYPE_EMPTY_DURATION, token));
        string number = duration.substr(0, duration.size() - 1);
        long long value;
        if (!parseInteger(number, value))
            throw Renderer::Exception(Renderer::Error(Renderer::Error::Type::VATIC_RENDERER_ERROR_TYPE_INVALID_DURATION_NUMBER, token, number));
        long long factor;
        switch (duration.back()) {
            case 'd': factor = 24*60*60; break;
            case 'h': factor = 60*60; break;
            case 'm': factor = 60; break;
            default:
                throw Renderer::Exception(Renderer::Error(Renderer::Error::Type::VATIC_RENDERER_ERROR_TYPE_INVALID_DURATION_UNIT, token, string(1, duration.back())));
        }
        if (value > LLONG_MAX / factor || value < -(LLONG_MAX / factor))
            throw Renderer::Exception(Renderer::Error(Renderer::Error::Type::VATIC_RENDERER_ERROR_TYPE_INVALID_DURATION_NUMBER, token, number));
        return value * factor;
    }

    string Renderer::formatTime(const Token& token, long long offset, const char* format) const {
        long long now = (long long)std::chrono::system_clock::to_time_t(renderStartTime);
        if ((offset > 0 && now > LLONG_MAX - offset) || (offset < 0 && now < LLONG_MIN - offset))
            throw Renderer::Exception(Renderer::Error(Renderer::Error::Type::VATIC_RENDERER_ERROR_TYPE_INVALID_DURATION_NUMBER, token, std::to_string(offset)));
        time_t target = (time_t)(now + offset);
        struct tm timeinfo;
        char buffer[256];
        // Far enough out that the year no longer fits a struct tm.
        if (!localtime_r(&target, &timeinfo))
            throw Renderer::Exception(Renderer::Error(Renderer::Error::Type::VATIC_RENDERER_ERROR_TYPE_INVALID_DURATION_NUMBER, token, std::to_string(offset)));
        size_t length = strftime(buffer, sizeof(buffer), format, &timeinfo);
        return string(buffer, length);
    }

    // RFC 3339 in local time, whole seconds, e.g. 2024-05-01T09:30:00+02:00.
    string Renderer::formatISOTime() const {
        time_t now = std::chrono::system_clock::to_time_t(renderStartTime);
        struct tm timeinfo;
        char buffer[64];
        localtime_r(&now, &timeinfo);
        size_t length = strftime(buffer, sizeof(buffer), "%Y-%m-%dT%H:%M:%S", &timeinfo);
        long offset = timeinfo.tm_gmtoff;
        char sign = offset < 0 ? '-' : '+';
        if (offset < 0)
            offset = -offset;
        snprintf(&buffer[length], sizeof(buffer) - length, "%c%02ld:%02ld", sign, offset / 3600, (offset % 3600) / 60);
        return string(buffer);
    }
}
