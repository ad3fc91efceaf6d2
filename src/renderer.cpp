#include "renderer.h"
#include "context.h"

namespace Vatic {

    Renderer::Renderer(const Context& context) : context(context) {

    }

    void Renderer::pushLoopVariable(const string& name, const LoopValue& value) {
        loopVariables[name].push_back(value);
    }

    void Renderer::setLoopVariable(const string& name, const LoopValue& value) {
        loopVariables[name].back() = value;
    }

    void Renderer::popLoopVariable(const string& name) {
        auto it = loopVariables.find(name);
        if (it != loopVariables.end()) {
            it->second.pop_back();
            if (it->second.size() == 0)
                loopVariables.erase(it);
        }
    }

    const LoopValue* Renderer::getLoopVariable(const string& name) const {
        auto it = loopVariables.find(name);
        if (it != loopVariables.end())
            return &it->second.back();
        if (store) {
            auto storeIt = store->loopVariables.find(name);
            if (storeIt != store->loopVariables.end())
                return &storeIt->second;
        }
        return nullptr;
    }

    string Renderer::render(const vector<Token>& tokens, const RenderContext& store) {
        this->store = &store;
        loopVariables.clear();
        renderStartTime = std::chrono::system_clock::now();
        string accumulator;
        try {
            render(tokens, 0, tokens.size(), accumulator);
        } catch (...) {
            this->store = nullptr;
            throw;
        }
        this->store = nullptr;
        return accumulator;
    }

    void Renderer::render(const vector<Token>& tokens, size_t start, size_t end, string& output) {
        size_t i = start;
        while (i < end) {
            const Token& token = tokens[i];
            switch (token.type) {
                case Token::Type::LITERAL:
                    output.append(token.literal);
                    ++i;
                break;
                case Token::Type::TAG: {
                    string value = resolveTag(token);
                    if (token.tag.hasPipe())
                        value = applyPipe(token, value);
                    output.append(value);
                    ++i;
                } break;
                case Token::Type::FOR_START: {
                    size_t forEnd = getMatchingEndFor(tokens, i + 1, end);
                    renderForLoop(tokens, i, forEnd, output);
                    i = forEnd + 1;
                } break;
                case Token::Type::FOR_END:
                    throw Renderer::Exception(Renderer::Error(Renderer::Error::Type::VATIC_RENDERER_ERROR_TYPE_UNEXPECTED_END_FOR, token));
            }
        }
    }

    size_t Renderer::getMatchingEndFor(const vector<Token>& tokens, size_t start, size_t end) const {
        size_t depth = 0;
        for (size_t i = start; i < end; ++i) {
            switch (tokens[i].type) {
                case Token::Type::FOR_START:
                    ++depth;
                break;
                case Token::Type::FOR_END:
                    if (depth == 0)
                        return i;
                    --depth;
                break;
                default:
                break;
            }
        }
        throw Renderer::Exception(Renderer::Error(Renderer::Error::Type::VATIC_RENDERER_ERROR_TYPE_UNTERMINATED_FOR_LOOP, tokens[start - 1]));
    }

    void Renderer::renderForLoop(const vector<Token>& tokens, size_t forStart, size_t forEnd, string& output) {
        const Token& token = tokens[forStart];
        const ForLoop& loop = token.loop;
        size_t bodyStart = forStart + 1;

        if (loop.iterable.type == Iterable::Type::RANGE) {
            if (loop.iterable.start > loop.iterable.end)
                return;
            pushLoopVariable(loop.var, LoopValue(loop.iterable.start));
            // Counted this way so that a range ending on LLONG_MAX terminates.
            for (long long value = loop.iterable.start; ; ++value) {
                setLoopVariable(loop.var, LoopValue(value));
                render(tokens, bodyStart, forEnd, output);
                if (value == loop.iterable.end)
                    break;
            }
            popLoopVariable(loop.var);
            return;
        }

        if (loop.iterable.name != "memories")
            throw Renderer::Exception(Renderer::Error(Renderer::Error::Type::VATIC_RENDERER_ERROR_TYPE_UNKNOWN_COLLECTION, token, loop.iterable.name));

        const vector<MemoryEntry>& items = store->memories;
        size_t count = items.size();
        auto limit = loop.params.find("limit");
        unsigned long long limitValue;
        if (limit != loop.params.end() && parseUnsigned(limit->second, limitValue) && limitValue < count)
            count = (size_t)limitValue;

        if (count == 0)
            return;
        pushLoopVariable(loop.var, LoopValue(items[0]));
        for (size_t i = 0; i < count; ++i) {
            setLoopVariable(loop.var, LoopValue(items[i]));
            render(tokens, bodyStart, forEnd, output);
        }
        popLoopVariable(loop.var);
    }

    string Renderer::applyPipe(const Token& token, const string& value) {
        const PipeType* pipeType = context.getPipeType(token.tag.pipe);
        if (!pipeType)
            throw Renderer::Exception(Renderer::Error(Renderer::Error::Type::VATIC_RENDERER_ERROR_TYPE_UNKNOWN_PIPE, token, token.tag.pipe));
        return pipeType->apply(*this, value);
    }

    string render(const Context& context, const string& templateText, const RenderContext& store) {
        Parser parser(context);
        vector<Token> tokens = parser.parse(templateText);
        Renderer renderer(context);
        return renderer.render(tokens, store);
    }
}
