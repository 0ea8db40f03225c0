// SPDX-License-Identifier: Apache-2.0
// composite_builder.hpp - resolves parent/child links into rigid compound body plans
#pragma once
#include "server/game/entity_registry.hpp"

#include <cstdint>
#include <vector>

namespace arena::game {

struct MemberPlan
{
    uint32_t entity_id{0};
    b2Vec2 local_offset{0.f, 0.f}; // relative to the root frame
    float local_rotation{0.f};
};

// One physics body. Ungrouped entities produce a single member plan.
struct BodyPlan
{
    uint32_t key{0}; // root entity id
    bool is_static{false};
    b2Vec2 position{0.f, 0.f};
    float rotation{0.f};
    std::vector<MemberPlan> members; // ascending entity id
    bool has_grabbable{false};
    bool has_death{false};
};

// Disjoint-set forest over dense indices (path halving, union by size).
class UnionFind
{
public:
    explicit UnionFind(std::size_t n);
    std::size_t find(std::size_t i);
    void unite(std::size_t a, std::size_t b);

private:
    std::vector<std::size_t> parent_;
    std::vector<std::size_t> size_;
};

// Throws map::MapError(InvalidMapTopology) when parent links form a cycle; a
// self-parent counts as a cycle. Every parent id must exist in the registry.
// Output is sorted by body key.
std::vector<BodyPlan> build_bodies(const EntityRegistry &registry);

} // namespace arena::game
