#ifndef VATICRENDERCONTEXT_H
#define VATICRENDERCONTEXT_H

#include "common.h"

namespace Vatic {

    // Two-level section/key lookup; custom: tags read the "general" section.
    struct Dictionary {
        unordered_map<string, unordered_map<string, string>> entries;

        // nullptr if either the section or the key is missing.
        const string* get(const string& section, const string& key) const {
            auto sectionIt = entries.find(section);
            if (sectionIt == entries.end())
                return nullptr;
            auto it = sectionIt->second.find(key);
            if (it == sectionIt->second.end())
                return nullptr;
            return &it->second;
        }

        void set(const string& section, const string& key, const string& value) {
            entries[section][key] = value;
        }
    };

    struct Secret {
        string key;
        string header;
        // What {% proxy:name %} renders to.
        string matchUrl;
    };

    struct Secrets {
        unordered_map<string, Secret> entries;

        const Secret* get(const string& name) const {
            auto it = entries.find(name);
            if (it == entries.end())
                return nullptr;
            return &it->second;
        }
    };

    // One past job run.
    struct MemoryEntry {
        string date;
        string datetime;
        string result;

        MemoryEntry() { }
        MemoryEntry(const string& date, const string& datetime, const string& result) : date(date), datetime(datetime), result(result) { }
    };

    // What a loop variable is bound to: a range index, or an element of a collection.
    struct LoopValue {
        enum class Type {
            INDEX,
            MEMORY
        };
        Type type;
        long long index;
        MemoryEntry memory;

        LoopValue() : type(Type::INDEX), index(0) { }
        LoopValue(long long index) : type(Type::INDEX), index(index) { }
        LoopValue(const MemoryEntry& memory) : type(Type::MEMORY), index(0), memory(memory) { }
    };

    // Everything a template can read. Built by the caller before rendering, never modified by the renderer.
    struct RenderContext {
        Dictionary dictionary;
        Secrets secrets;
        // Empty when there is no result, message or sender for this run; the tags then render nothing.
        string result;
        string message;
        string sender;
        // Newest first.
        vector<MemoryEntry> memories;
        // Bindings visible before any loop is entered. Loops shadow these for the duration of their body.
        unordered_map<string, LoopValue> loopVariables;

        RenderContext() { }
        RenderContext(const Dictionary& dictionary) : dictionary(dictionary) { }
    };
}

#endif
