// SPDX-License-Identifier: Apache-2.0
#include "server/map/map_loader.hpp"

#include "common/logger.hpp"

#include <algorithm>
#include <cmath>
#include <map>
#include <set>
#include <string>

namespace arena::map {

namespace {

bool finite_all(std::initializer_list<float> v)
{
    return std::all_of(v.begin(), v.end(), [](float f) { return std::isfinite(f); });
}

Zone to_world(const NormRect &r, float w, float h)
{
    float x1 = r.x1 * w - w / 2.f;
    float x2 = r.x2 * w - w / 2.f;
    float y1 = r.y1 * h - h / 2.f;
    float y2 = r.y2 * h - h / 2.f;
    return Zone{{(x1 + x2) / 2.f, (y1 + y2) / 2.f}, std::fabs(x2 - x1) / 2.f, std::fabs(y2 - y1) / 2.f};
}

// Fills shape/position of `out`; returns an error message when the spec is unusable.
std::optional<std::string> resolve_shape(const EntitySpec &s, float w, float h, game::Entity &out)
{
    if (s.shape == "rect") {
        if (!s.x1 || !s.y1 || !s.x2 || !s.y2)
            return "rect requires x1, y1, x2, y2";
        if (!finite_all({*s.x1, *s.y1, *s.x2, *s.y2}))
            return "rect coordinates must be finite";
        Zone z = to_world(NormRect{*s.x1, *s.y1, *s.x2, *s.y2}, w, h);
        if (z.half_width <= 0.f || z.half_height <= 0.f)
            return "rect has zero area";
        out.shape = game::Shape{game::ShapeKind::Rectangle, z.half_width, z.half_height, 0.f};
        out.position = z.center;
        return std::nullopt;
    }
    if (s.shape == "circle") {
        if (!s.x || !s.y)
            return "circle requires x, y";
        float r = s.radius.value_or(0.1f) * w;
        if (!finite_all({*s.x, *s.y, r}) || r <= 0.f)
            return "circle radius must be positive and coordinates finite";
        out.shape = game::Shape{game::ShapeKind::Circle, 0.f, 0.f, r};
        out.position = {*s.x * w - w / 2.f, *s.y * h - h / 2.f};
        return std::nullopt;
    }
    if (s.shape.empty())
        return "missing shape";
    return "unknown shape '" + s.shape + "'";
}

} // namespace

LoadedMap load_map(const MapDocument &doc)
{
    LoadedMap out;
    out.gravity = doc.gravity;
    out.width = doc.width;
    out.height = doc.height;
    out.cursor_size = doc.cursor_size;
    if (doc.control_zone)
        out.control_zone = to_world(*doc.control_zone, doc.width, doc.height);

    auto warn = [&](std::size_t idx, std::string msg)
    {
        log::warn("[map] entity #{} rejected: {}", idx, msg);
        out.warnings.push_back({ErrorKind::InvalidEntitySpec, idx, std::move(msg)});
    };

    // Implicit ids fill the gaps between explicit ones, in document order.
    std::set<uint32_t> explicit_ids;
    for (const auto &s : doc.entities) {
        if (s.id)
            explicit_ids.insert(*s.id);
    }
    std::map<uint32_t, std::size_t> doc_index;
    uint32_t next_implicit = 1;
    auto take_implicit = [&]()
    {
        while (explicit_ids.count(next_implicit))
            ++next_implicit;
        return next_implicit++;
    };

    for (std::size_t i = 0; i < doc.entities.size(); ++i) {
        const EntitySpec &s = doc.entities[i];
        game::Entity e;
        e.id = s.id ? *s.id : take_implicit();
        if (auto err = resolve_shape(s, doc.width, doc.height, e)) {
            warn(i, *err);
            continue;
        }
        if (!std::isfinite(s.rotation) || !std::isfinite(s.restitution)) {
            warn(i, "rotation and restitution must be finite");
            continue;
        }
        e.rotation = s.rotation;
        e.kinematic = s.is_static ? game::Kinematic::Static : game::Kinematic::Dynamic;
        e.category = game::derive_category(s.is_static, s.is_death);
        e.restitution = std::clamp(s.restitution, 0.f, 1.f);
        e.parent = s.parent;
        e.user_data = s.user_data.value_or(game::default_user_data(e.category));
        if (!out.registry.add(e))
            warn(i, "duplicate id " + std::to_string(e.id));
        else
            doc_index[e.id] = i;
    }

    // Dangling links (missing or rejected parent) are dropped; the child stays ungrouped.
    // Self-parent is kept so the topology check rejects it.
    std::vector<uint32_t> dangling;
    for (const auto &e : out.registry.all()) {
        if (e.parent && !out.registry.contains(*e.parent)) {
            log::warn("[map] entity {} parent {} not found, left ungrouped", e.id, *e.parent);
            out.warnings.push_back({ErrorKind::InvalidEntitySpec, doc_index[e.id],
                "entity " + std::to_string(e.id) + " parent " + std::to_string(*e.parent) + " not found"});
            dangling.push_back(e.id);
        }
    }
    for (auto id : dangling)
        out.registry.clear_parent(id);

    out.bodies = game::build_bodies(out.registry);
    log::info("[map] loaded entities={} bodies={} warnings={} size={}x{}", out.registry.size(), out.bodies.size(),
        out.warnings.size(), out.width, out.height);
    return out;
}

} // namespace arena::map
