#pragma once
#include "../components.hpp"
#include "../core/corridor.hpp"
#include "../events.hpp"
#include <vector>

// ---------------------------------------------------------------------------
// ChunkSystem: streams the endless maze around the player.
//
// Track emits ChunkExited / ChunkEntered when the player crosses into another
// chunk. The other three consume ChunkEntered later in the same tick:
// SpawnNext appends a chunk beyond the exit once the newest one is entered,
// DespawnTraversed drops every chunk more than one behind, and Stats counts.
// At most three chunks are alive: behind, current and ahead.
// ---------------------------------------------------------------------------

class ChunkSystem {
public:
    static void Track(corridor::Context& ctx);
    static void SpawnNext(corridor::Context& ctx);
    static void DespawnTraversed(corridor::Context& ctx);
    static void Stats(corridor::Context& ctx);

    // Applies one tick of ChunkEntered events. Exposed for unit testing.
    static void tally(PlayStats& stats, const std::vector<ChunkEntered>& entered);
};
