#include "context.h"
#include "dialect.h"

namespace Vatic {

    // Stand-in until summaries are produced by an agent run; only marks the text.
    struct SummaryPipe : PipeType {
        SummaryPipe() : PipeType("summary") { }
        string apply(Renderer& renderer, const string& input) const override {
            return "Summary of: " + input;
        }
    };

    void StandardDialect::implement(Context& context) {
        context.registerType<SummaryPipe>();
    }
}
