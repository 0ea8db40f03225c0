// SPDX-License-Identifier: Apache-2.0
#include "server/game/entity_registry.hpp"

#include <algorithm>

namespace arena::game {

Category derive_category(bool is_static, bool is_death)
{
    if (is_death)
        return Category::Death;
    return is_static ? Category::Wall : Category::Grabbable;
}

uint32_t default_user_data(Category c)
{
    switch (c) {
        case Category::Wall:
            return kWallUserData;
        case Category::Grabbable:
            return kGrabbableUserData;
        case Category::Death:
            return kDeathUserData;
    }
    return kWallUserData;
}

static bool id_less(const Entity &e, uint32_t id)
{
    return e.id < id;
}

bool EntityRegistry::add(Entity e)
{
    auto it = std::lower_bound(entities_.begin(), entities_.end(), e.id, id_less);
    if (it != entities_.end() && it->id == e.id)
        return false;
    entities_.insert(it, std::move(e));
    return true;
}

const Entity *EntityRegistry::find(uint32_t id) const
{
    auto it = std::lower_bound(entities_.begin(), entities_.end(), id, id_less);
    if (it == entities_.end() || it->id != id)
        return nullptr;
    return &*it;
}

void EntityRegistry::clear_parent(uint32_t id)
{
    auto it = std::lower_bound(entities_.begin(), entities_.end(), id, id_less);
    if (it != entities_.end() && it->id == id)
        it->parent.reset();
}

} // namespace arena::game
