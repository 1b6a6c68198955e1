#pragma once
#include <ecs/ecs.hpp>
#include <cstddef>
#include <cstdint>
#include <initializer_list>
#include <unordered_set>
#include <vector>

namespace corridor {

// Sorted set of component type ids seen together on one entity.
using ArchetypeSignature = ecs::TypeSet;

// ---------------------------------------------------------------------------
// ArchetypeTracker: records every distinct combination of tracked component
// types observed on a live entity.
//
// Stored as a World resource. track<T>() installs on_add / on_remove hooks
// for T; the hooks only mark the entity as touched. collect() runs after each
// flush point and resolves touched entities to their signature (restricted to
// tracked types). The generation is the number of distinct signatures seen so
// far and only ever grows; App::tick() uses it to notify systems once per new
// signature.
// ---------------------------------------------------------------------------

class ArchetypeTracker {
public:
    template <typename T>
    void track(ecs::World& world) {
        const ecs::ComponentTypeID id = ecs::component_id<T>();
        for (const auto& p : checks_)
            if (p.id == id) return;

        add_check({id, [](ecs::World& w, ecs::Entity e) { return w.has<T>(e); }});

        world.on_add<T>([](ecs::World& w, ecs::Entity e, T&) {
            if (auto* tracker = w.try_resource<ArchetypeTracker>()) tracker->touch(e);
        });
        world.on_remove<T>([](ecs::World& w, ecs::Entity e, T&) {
            if (auto* tracker = w.try_resource<ArchetypeTracker>()) tracker->touch(e);
        });
    }

    bool tracks(ecs::ComponentTypeID id) const;

    void touch(ecs::Entity e) { touched_.push_back(e); }

    // Resolves touched entities. Returns the number of new signatures.
    std::size_t collect(ecs::World& world);

    std::uint64_t generation() const { return signatures_.size(); }

    // Signatures in discovery order; index i was discovered at generation i+1.
    const std::vector<ArchetypeSignature>& signatures() const { return signatures_; }

private:
    struct Check {
        ecs::ComponentTypeID id;
        bool (*has)(ecs::World&, ecs::Entity);
    };

    void add_check(Check check);

    std::vector<Check>                                            checks_;
    std::vector<ecs::Entity>                                      touched_;
    std::unordered_set<ArchetypeSignature, ecs::TypeSetHash>      seen_;
    std::vector<ArchetypeSignature>                               signatures_;
};

// ---------------------------------------------------------------------------
// ArchetypeFilter: incremental query cache for a system.
//
// Holds the component ids a system requires and the signatures that satisfy
// them. A system feeds it from its archetype callback instead of rescanning
// every tick.
// ---------------------------------------------------------------------------

class ArchetypeFilter {
public:
    ArchetypeFilter() = default;
    explicit ArchetypeFilter(std::initializer_list<ecs::ComponentTypeID> required);

    template <typename... Ts>
    static ArchetypeFilter of() {
        return ArchetypeFilter{ecs::component_id<Ts>()...};
    }

    bool matches(const ArchetypeSignature& signature) const;

    // Appends the signature if it matches. Returns true when it was added.
    bool absorb(const ArchetypeSignature& signature);

    const std::vector<ArchetypeSignature>& matched() const { return matched_; }
    bool empty() const { return matched_.empty(); }

private:
    ArchetypeSignature              required_;
    std::vector<ArchetypeSignature> matched_;
};

} // namespace corridor
