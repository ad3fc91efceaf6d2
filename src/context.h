#ifndef VATICCONTEXT_H
#define VATICCONTEXT_H

#include "common.h"
#include "parser.h"
#include "renderer.h"

namespace Vatic {

    struct Renderer;

    // A named post-processing step applied to an already resolved tag value: {% i.result | summary %}.
    struct PipeType {
        string symbol;

        // For pipes registered through the C interface.
        VaticPipeFunction userPipeFunction = nullptr;
        void* userData = nullptr;

        PipeType(const string& symbol) : symbol(symbol) { }
        virtual ~PipeType() { }

        virtual string apply(Renderer& renderer, const string& input) const;
    };

    // The registry a dialect fills in. Shared read-only between any number of parsers and renderers.
    struct Context {
        unordered_map<string, unique_ptr<PipeType>> pipeTypes;

        // Re-registering a symbol replaces the previous pipe.
        PipeType* registerType(unique_ptr<PipeType> type) {
            PipeType* value = type.get();
            pipeTypes[type->symbol] = move(type);
            return value;
        }
        template <class T> T* registerType() { return static_cast<T*>(registerType(make_unique<T>())); }

        const PipeType* getPipeType(const string& symbol) const {
            auto it = pipeTypes.find(symbol);
            if (it == pipeTypes.end())
                return nullptr;
            return it->second.get();
        }

        enum EDialects {
            NO_DIALECT                      = 0,
            STANDARD_DIALECT                = 1
        };
        Context(int dialects = NO_DIALECT);
    };
}

#endif
