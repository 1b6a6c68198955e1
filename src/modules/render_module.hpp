#pragma once
#include "../components.hpp"
#include "../core/corridor.hpp"
#include "../systems/renderer.hpp"

// ---------------------------------------------------------------------------
// RenderModule
//
// Inserts the WallRenderCache and adds RenderSystem's three passes. Install
// before DebugModule so the overlay draws on top of the scene.
// ---------------------------------------------------------------------------

struct RenderModule {
    static void install(corridor::AppBuilder& app) {
        using corridor::Stage;
        app.track_component<WallSegment>();
        app.insert_resource(WallRenderCache{corridor::ArchetypeFilter::of<WallSegment>()});
        app.add_system_to_stage(Stage::PreRender, RenderSystem::Begin, "render_begin");
        app.add_archetype_system(Stage::Render, RenderSystem::Draw, RenderSystem::OnArchetype,
                                 "render_draw");
        app.add_system_to_stage(Stage::Last, RenderSystem::End, "render_end");
    }
};
