#ifndef VATICRAPIDJSONCONTEXT_H
#define VATICRAPIDJSONCONTEXT_H

#include "common.h"
#include "rendercontext.h"

#include <rapidjson/document.h>

namespace Vatic {

    // Fills a RenderContext from a JSON document of the form
    // { "dictionary": { section: { key: value } }, "secrets": { name: { "key", "header", "match_url" } },
    //   "result", "message", "sender", "memories": [ { "date", "datetime", "result" } ] }.
    // Every member is optional; a member of the wrong type throws.
    struct RapidJSONContextLoader {
        static string getString(const rapidjson::Value& object, const char* member, const char* path) {
            auto it = object.FindMember(member);
            if (it == object.MemberEnd() || it->value.IsNull())
                return string();
            if (!it->value.IsString())
                throw Exception("Expected '%s%s' to be a string.", path, member);
            return string(it->value.GetString(), it->value.GetStringLength());
        }

        static void loadDictionary(const rapidjson::Value& value, Dictionary& dictionary) {
            if (!value.IsObject())
                throw Exception("Expected 'dictionary' to be an object.");
            for (auto section = value.MemberBegin(); section != value.MemberEnd(); ++section) {
                if (!section->value.IsObject())
                    throw Exception("Expected 'dictionary.%s' to be an object.", section->name.GetString());
                for (auto entry = section->value.MemberBegin(); entry != section->value.MemberEnd(); ++entry) {
                    if (!entry->value.IsString())
                        throw Exception("Expected 'dictionary.%s.%s' to be a string.", section->name.GetString(), entry->name.GetString());
                    dictionary.set(section->name.GetString(), entry->name.GetString(), string(entry->value.GetString(), entry->value.GetStringLength()));
                }
            }
        }

        static void loadSecrets(const rapidjson::Value& value, Secrets& secrets) {
            if (!value.IsObject())
                throw Exception("Expected 'secrets' to be an object.");
            for (auto it = value.MemberBegin(); it != value.MemberEnd(); ++it) {
                if (!it->value.IsObject())
                    throw Exception("Expected 'secrets.%s' to be an object.", it->name.GetString());
                string path = string("secrets.") + it->name.GetString() + ".";
                Secret& secret = secrets.entries[it->name.GetString()];
                secret.key = getString(it->value, "key", path.c_str());
                secret.header = getString(it->value, "header", path.c_str());
                secret.matchUrl = getString(it->value, "match_url", path.c_str());
            }
        }

        static void loadMemories(const rapidjson::Value& value, vector<MemoryEntry>& memories) {
            if (!value.IsArray())
                throw Exception("Expected 'memories' to be an array.");
            for (rapidjson::SizeType i = 0; i < value.Size(); ++i) {
                if (!value[i].IsObject())
                    throw Exception("Expected 'memories[%u]' to be an object.", (unsigned int)i);
                string path = "memories[" + std::to_string(i) + "].";
                memories.emplace_back(getString(value[i], "date", path.c_str()), getString(value[i], "datetime", path.c_str()), getString(value[i], "result", path.c_str()));
            }
        }

        static RenderContext load(const rapidjson::Value& document) {
            RenderContext store;
            if (!document.IsObject())
                throw Exception("Expected the render context to be an object.");
            auto it = document.FindMember("dictionary");
            if (it != document.MemberEnd())
                loadDictionary(it->value, store.dictionary);
            it = document.FindMember("secrets");
            if (it != document.MemberEnd())
                loadSecrets(it->value, store.secrets);
            store.result = getString(document, "result", "");
            store.message = getString(document, "message", "");
            store.sender = getString(document, "sender", "");
            it = document.FindMember("memories");
            if (it != document.MemberEnd())
                loadMemories(it->value, store.memories);
            return store;
        }

        static RenderContext load(const string& json) {
            rapidjson::Document document;
            document.Parse(json.c_str());
            if (document.HasParseError())
                throw Exception("Invalid JSON at offset %lu.", (unsigned long)document.GetErrorOffset());
            return load(static_cast<const rapidjson::Value&>(document));
        }
    };
}

#endif
