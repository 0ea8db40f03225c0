// SPDX-License-Identifier: Apache-2.0
#include "server/game/composite_builder.hpp"

#include "server/map/map_error.hpp"

#include <algorithm>
#include <map>
#include <numeric>
#include <string>

namespace arena::game {

UnionFind::UnionFind(std::size_t n) : parent_(n), size_(n, 1)
{
    std::iota(parent_.begin(), parent_.end(), std::size_t{0});
}

std::size_t UnionFind::find(std::size_t i)
{
    while (parent_[i] != i) {
        parent_[i] = parent_[parent_[i]];
        i = parent_[i];
    }
    return i;
}

void UnionFind::unite(std::size_t a, std::size_t b)
{
    a = find(a);
    b = find(b);
    if (a == b)
        return;
    if (size_[a] < size_[b])
        std::swap(a, b);
    parent_[b] = a;
    size_[a] += size_[b];
}

namespace {

std::size_t index_of(const std::vector<Entity> &ents, uint32_t id)
{
    auto it = std::lower_bound(
        ents.begin(), ents.end(), id, [](const Entity &e, uint32_t v) { return e.id < v; });
    return static_cast<std::size_t>(it - ents.begin());
}

// Each entity has at most one parent, so the link graph is functional: walking
// parent pointers either ends at a root or revisits a node on the current path.
void reject_cycles(const std::vector<Entity> &ents)
{
    enum : uint8_t
    {
        Unvisited,
        OnPath,
        Done
    };
    std::vector<uint8_t> state(ents.size(), Unvisited);
    std::vector<std::size_t> path;
    for (std::size_t start = 0; start < ents.size(); ++start) {
        if (state[start] != Unvisited)
            continue;
        path.clear();
        std::size_t cur = start;
        while (true) {
            if (state[cur] == OnPath) {
                throw map::MapError(map::ErrorKind::InvalidMapTopology,
                    "cyclic parent reference through entity " + std::to_string(ents[cur].id));
            }
            if (state[cur] == Done)
                break;
            state[cur] = OnPath;
            path.push_back(cur);
            if (!ents[cur].parent)
                break;
            cur = index_of(ents, *ents[cur].parent);
        }
        for (auto i : path)
            state[i] = Done;
    }
}

} // namespace

std::vector<BodyPlan> build_bodies(const EntityRegistry &registry)
{
    const auto &ents = registry.all();
    for (const auto &e : ents) {
        if (e.parent && !registry.contains(*e.parent)) {
            throw map::MapError(map::ErrorKind::InvalidMapTopology,
                "entity " + std::to_string(e.id) + " references missing parent " + std::to_string(*e.parent));
        }
    }
    reject_cycles(ents);

    UnionFind uf(ents.size());
    for (std::size_t i = 0; i < ents.size(); ++i) {
        if (ents[i].parent)
            uf.unite(i, index_of(ents, *ents[i].parent));
    }
    // set representative -> member indices (ascending id, since ents is sorted)
    std::map<std::size_t, std::vector<std::size_t>> groups;
    for (std::size_t i = 0; i < ents.size(); ++i)
        groups[uf.find(i)].push_back(i);

    std::vector<BodyPlan> plans;
    plans.reserve(groups.size());
    for (const auto &[rep, members] : groups) {
        (void)rep;
        // acyclic and connected: exactly one member has no parent
        const Entity *root = nullptr;
        for (auto i : members) {
            if (!ents[i].parent) {
                root = &ents[i];
                break;
            }
        }
        BodyPlan plan;
        plan.key = root->id;
        plan.position = root->position;
        plan.rotation = root->rotation;
        b2Rot root_q = b2MakeRot(root->rotation);
        for (auto i : members) {
            const Entity &e = ents[i];
            MemberPlan mp;
            mp.entity_id = e.id;
            mp.local_offset = b2InvRotateVector(root_q, b2Sub(e.position, root->position));
            mp.local_rotation = e.rotation - root->rotation;
            plan.members.push_back(mp);
            if (e.kinematic == Kinematic::Static)
                plan.is_static = true;
            if (e.category == Category::Grabbable)
                plan.has_grabbable = true;
            if (e.category == Category::Death)
                plan.has_death = true;
        }
        plans.push_back(std::move(plan));
    }
    std::sort(plans.begin(), plans.end(), [](const BodyPlan &a, const BodyPlan &b) { return a.key < b.key; });
    return plans;
}

} // namespace arena::game
