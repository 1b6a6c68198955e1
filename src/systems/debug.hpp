#pragma once
#include "../core/corridor.hpp"

// ---------------------------------------------------------------------------
// DebugSystem: Render-stage system that draws the DebugPanel overlay.
// Toggle visibility with F3. Must run after RenderSystem::Draw.
// ---------------------------------------------------------------------------

class DebugSystem {
public:
    static void Draw(corridor::Context& ctx);
};
