// SPDX-License-Identifier: Apache-2.0
#pragma once
#include "server/game/composite_builder.hpp"
#include "server/game/entity_registry.hpp"
#include "server/map/map_document.hpp"

#include <optional>
#include <vector>

namespace arena::map {

// World-space axis aligned rectangle.
struct Zone
{
    b2Vec2 center{0.f, 0.f};
    float half_width{0.f};
    float half_height{0.f};

    bool contains(b2Vec2 p) const
    {
        return p.x >= center.x - half_width && p.x <= center.x + half_width && p.y >= center.y - half_height &&
            p.y <= center.y + half_height;
    }
};

// Validated, world-space result of a map document. Immutable after load.
struct LoadedMap
{
    b2Vec2 gravity{0.f, -2.f};
    float width{16.f};
    float height{9.f};
    float cursor_size{0.35f};
    std::optional<Zone> control_zone;
    game::EntityRegistry registry;
    std::vector<game::BodyPlan> bodies;
    std::vector<LoadWarning> warnings;
};

// Converts normalized coordinates, assigns ids, validates every entity and resolves
// parent groups. Rejected entities and links become warnings (logged). Throws
// MapError(InvalidMapTopology) on cyclic parents; nothing is returned in that case.
LoadedMap load_map(const MapDocument &doc);

} // namespace arena::map
