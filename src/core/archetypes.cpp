#include "archetypes.hpp"
#include "resources.hpp"
#include <algorithm>

namespace corridor {

bool ArchetypeTracker::tracks(ecs::ComponentTypeID id) const {
    return std::any_of(checks_.begin(), checks_.end(),
                       [id](const Check& p) { return p.id == id; });
}

void ArchetypeTracker::add_check(Check check) {
    // Keep checks sorted by id so signatures come out sorted like ecs::TypeSet.
    auto it = std::lower_bound(checks_.begin(), checks_.end(), check.id,
                               [](const Check& p, ecs::ComponentTypeID id) { return p.id < id; });
    checks_.insert(it, check);
}

std::size_t ArchetypeTracker::collect(ecs::World& world) {
    if (touched_.empty()) return 0;

    std::size_t discovered = 0;
    ArchetypeSignature signature;
    std::unordered_set<ecs::Entity, ecs::EntityHash> visited;

    for (auto e : touched_) {
        if (!visited.insert(e).second) continue;
        if (!world.alive(e)) continue;

        signature.clear();
        for (const auto& p : checks_)
            if (p.has(world, e)) signature.push_back(p.id);

        if (signature.empty()) continue;
        CORRIDOR_ASSERT(std::is_sorted(signature.begin(), signature.end()),
                        "component checks must stay sorted by id");
        if (seen_.insert(signature).second) {
            signatures_.push_back(signature);
            ++discovered;
        }
    }
    touched_.clear();
    return discovered;
}

ArchetypeFilter::ArchetypeFilter(std::initializer_list<ecs::ComponentTypeID> required)
    : required_(required) {
    std::sort(required_.begin(), required_.end());
}

bool ArchetypeFilter::matches(const ArchetypeSignature& signature) const {
    return std::includes(signature.begin(), signature.end(),
                         required_.begin(), required_.end());
}

bool ArchetypeFilter::absorb(const ArchetypeSignature& signature) {
    if (!matches(signature)) return false;
    if (std::find(matched_.begin(), matched_.end(), signature) != matched_.end()) return false;
    matched_.push_back(signature);
    return true;
}

} // namespace corridor
