#ifndef VATICDIALECT_H
#define VATICDIALECT_H
#include "common.h"

namespace Vatic {
    struct Context;

    // The pipes every vatic template can use. Tags themselves are fixed, and resolved by the renderer.
    struct StandardDialect {
        static void implement(Context& context);
    };
}

#endif
