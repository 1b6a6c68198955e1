#pragma once
#include "../core/corridor.hpp"

// ---------------------------------------------------------------------------
// WallRenderCache: which archetype signatures carry WallSegment.
//
// Fed incrementally by RenderSystem::OnArchetype. It only gates the wall
// pass: Draw skips it while no matching signature has been seen and logs
// each new one. The walls themselves are still visited with world.each
// every frame.
// ---------------------------------------------------------------------------

struct WallRenderCache {
    corridor::ArchetypeFilter filter;
};

// ---------------------------------------------------------------------------
// RenderSystem: first-person view of the loaded chunks.
//
// Begin (PreRender) opens the frame, Draw (Render) draws the 3D scene and
// HUD, End (Last) presents. DebugSystem draws between Draw and End.
// ---------------------------------------------------------------------------

class RenderSystem {
public:
    static void Begin(corridor::Context& ctx);
    static void Draw(corridor::Context& ctx);
    static void End(corridor::Context& ctx);

    static void OnArchetype(corridor::Context& ctx, const corridor::ArchetypeSignature& sig);
};
