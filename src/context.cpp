#include "context.h"
#include "dialect.h"

namespace Vatic {

    string PipeType::apply(Renderer& renderer, const string& input) const {
        if (!userPipeFunction)
            return string();
        renderer.returnValue.clear();
        userPipeFunction(VaticRenderer{&renderer}, input.data(), input.size(), userData);
        return renderer.returnValue;
    }

    Context::Context(int dialects) {
        if (dialects & STANDARD_DIALECT)
            StandardDialect::implement(*this);
    }
}
