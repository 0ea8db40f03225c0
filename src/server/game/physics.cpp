// SPDX-License-Identifier: Apache-2.0
#include "server/game/physics.hpp"

#include "common/logger.hpp"
#include "common/metrics.hpp"

#include <algorithm>
#include <cmath>

namespace arena::phys {

static bool finite(b2Vec2 v)
{
    return std::isfinite(v.x) && std::isfinite(v.y);
}

PhysicsWorld::PhysicsWorld(const PhysicsConfig &cfg) : cfg_(cfg)
{
    b2WorldDef def = b2DefaultWorldDef();
    def.gravity = cfg_.gravity;
    world_ = b2CreateWorld(&def);
    create_boundaries();
}

PhysicsWorld::~PhysicsWorld()
{
    if (b2World_IsValid(world_))
        b2DestroyWorld(world_);
}

void PhysicsWorld::create_boundaries()
{
    const float hw = cfg_.width / 2.f;
    const float hh = cfg_.height / 2.f;
    const float t = cfg_.wall_half_thickness;
    boundaries_ = {
        {{0.f, -hh}, hw, t}, // floor
        {{0.f, hh}, hw, t}, // ceiling
        {{-hw, 0.f}, t, hh}, // left
        {{hw, 0.f}, t, hh}, // right
    };
    b2BodyDef bd = b2DefaultBodyDef();
    bd.type = b2_staticBody;
    walls_ = b2CreateBody(world_, &bd);
    b2ShapeDef sd = b2DefaultShapeDef();
    sd.enableContactEvents = true;
    for (const auto &b : boundaries_) {
        b2Polygon box = b2MakeOffsetBox(b.half_width, b.half_height, b.center, b2Rot_identity);
        b2CreatePolygonShape(walls_, &sd, &box);
    }
}

void PhysicsWorld::add_body(const game::BodyPlan &plan, const game::EntityRegistry &registry)
{
    Body body;
    body.key = plan.key;
    body.is_static = plan.is_static;
    body.has_grabbable = plan.has_grabbable;
    body.has_death = plan.has_death;

    b2BodyDef bd = b2DefaultBodyDef();
    bd.type = plan.is_static ? b2_staticBody : b2_dynamicBody;
    bd.position = plan.position;
    bd.rotation = b2MakeRot(plan.rotation);
    if (!plan.is_static) {
        bd.linearDamping = cfg_.linear_damping;
        bd.angularDamping = cfg_.angular_damping;
    }
    body.id = b2CreateBody(world_, &bd);

    for (const auto &mp : plan.members) {
        const game::Entity *e = registry.find(mp.entity_id);
        if (!e)
            continue;
        b2ShapeDef sd = b2DefaultShapeDef();
        sd.density = 1.0f;
        sd.material.restitution = e->restitution;
        sd.enableContactEvents = true;
        MemberShape ms;
        ms.entity_id = e->id;
        ms.category = e->category;
        ms.shape = e->shape;
        ms.local_offset = mp.local_offset;
        ms.local_rotation = mp.local_rotation;
        ms.user_data = e->user_data;
        if (e->shape.kind == game::ShapeKind::Rectangle) {
            b2Polygon box = b2MakeOffsetBox(
                e->shape.half_width, e->shape.half_height, mp.local_offset, b2MakeRot(mp.local_rotation));
            ms.shape_id = b2CreatePolygonShape(body.id, &sd, &box);
        } else {
            b2Circle circle{mp.local_offset, e->shape.radius};
            ms.shape_id = b2CreateCircleShape(body.id, &sd, &circle);
        }
        body.members.push_back(ms);
    }
    bodies_.push_back(std::move(body));
}

Body *PhysicsWorld::find(uint32_t key)
{
    auto it = std::lower_bound(
        bodies_.begin(), bodies_.end(), key, [](const Body &b, uint32_t k) { return b.key < k; });
    return (it != bodies_.end() && it->key == key) ? &*it : nullptr;
}

const Body *PhysicsWorld::find(uint32_t key) const
{
    return const_cast<PhysicsWorld *>(this)->find(key);
}

void PhysicsWorld::set_tether(uint32_t key, b2Vec2 local_anchor, b2Vec2 target)
{
    tethers_.push_back({key, local_anchor, target});
}

void PhysicsWorld::begin_hold(uint32_t key)
{
    Body *b = find(key);
    if (!b || b->excluded || b->is_static)
        return;
    b->held = true;
    b->lethal_thrower.reset();
    b2Body_SetGravityScale(b->id, 0.f);
    b2Body_SetLinearDamping(b->id, 0.f);
    b2Body_SetAwake(b->id, true);
}

void PhysicsWorld::end_hold(uint32_t key, std::optional<b2Vec2> fling_velocity)
{
    Body *b = find(key);
    if (!b || !b->held)
        return;
    b->held = false;
    if (b->excluded)
        return;
    b2Body_SetGravityScale(b->id, 1.f);
    b2Body_SetLinearDamping(b->id, cfg_.linear_damping);
    b2Body_SetLinearVelocity(b->id, fling_velocity.value_or(b2Vec2{0.f, 0.f}));
}

void PhysicsWorld::mark_lethal(uint32_t key, uint32_t thrower)
{
    if (Body *b = find(key); b && !b->excluded)
        b->lethal_thrower = thrower;
}

void PhysicsWorld::apply_tether(const Tether &t, float dt, std::vector<uint32_t> &excluded)
{
    Body *b = find(t.key);
    if (!b || b->excluded || b->is_static || dt <= 0.f)
        return;
    b2Vec2 anchor = b2Body_GetWorldPoint(b->id, t.local_anchor);
    b2Vec2 desired = b2MulSV(1.f / dt, b2Sub(t.target, anchor));
    // anchor velocity = v_com + w x r, solve for v_com
    float w = b2Body_GetAngularVelocity(b->id);
    b2Vec2 r = b2Sub(anchor, b2Body_GetWorldCenterOfMass(b->id));
    if (!finite(desired) || !finite(r) || !std::isfinite(w)) {
        exclude(*b, excluded);
        return;
    }
    float speed = b2Length(desired);
    if (speed > cfg_.max_tether_speed)
        desired = b2MulSV(cfg_.max_tether_speed / speed, desired);
    b2Body_SetLinearVelocity(b->id, b2Sub(desired, b2CrossSV(w, r)));
}

Body *PhysicsWorld::body_of(b2ShapeId s)
{
    b2BodyId bid = b2Shape_GetBody(s);
    for (auto &b : bodies_) {
        if (B2_ID_EQUALS(b.id, bid))
            return &b;
    }
    return nullptr;
}

// Boundary walls and Wall-category members of map bodies.
bool PhysicsWorld::is_wall_shape(b2ShapeId s) const
{
    b2BodyId bid = b2Shape_GetBody(s);
    if (B2_ID_EQUALS(bid, walls_))
        return true;
    for (const auto &b : bodies_) {
        if (!B2_ID_EQUALS(b.id, bid))
            continue;
        for (const auto &m : b.members) {
            if (B2_ID_EQUALS(m.shape_id, s))
                return m.category == game::Category::Wall;
        }
        return false;
    }
    return false;
}

void PhysicsWorld::process_contacts()
{
    b2ContactEvents ev = b2World_GetContactEvents(world_);
    for (int i = 0; i < ev.beginCount; ++i) {
        const b2ContactBeginTouchEvent &c = ev.beginEvents[i];
        if (!b2Shape_IsValid(c.shapeIdA) || !b2Shape_IsValid(c.shapeIdB))
            continue;
        Body *a = body_of(c.shapeIdA);
        Body *b = body_of(c.shapeIdB);
        if (a && a->lethal_thrower && is_wall_shape(c.shapeIdB)) {
            log::debug("[phys] projectile {} neutralized by wall contact", a->key);
            a->lethal_thrower.reset();
        }
        if (b && b->lethal_thrower && is_wall_shape(c.shapeIdA)) {
            log::debug("[phys] projectile {} neutralized by wall contact", b->key);
            b->lethal_thrower.reset();
        }
    }
}

void PhysicsWorld::exclude(Body &b, std::vector<uint32_t> &out)
{
    b.excluded = true;
    b.lethal_thrower.reset();
    b.swept_thrower.reset();
    b2Body_Disable(b.id);
    metrics::inc(metrics::runtime().excluded_bodies);
    log::error("[phys] body {} has non-finite state, excluded from simulation", b.key);
    out.push_back(b.key);
}

std::vector<uint32_t> PhysicsWorld::step(float dt)
{
    std::vector<uint32_t> excluded;
    for (const auto &t : tethers_)
        apply_tether(t, dt, excluded);
    tethers_.clear();

    for (auto &b : bodies_) {
        if (b.is_static || b.excluded)
            continue;
        b.prev_transform = b2Body_GetTransform(b.id);
        b.swept_thrower = b.lethal_thrower;
    }

    b2World_Step(world_, dt, cfg_.substeps);
    process_contacts();

    for (auto &b : bodies_) {
        if (b.is_static || b.excluded)
            continue;
        b2Transform xf = b2Body_GetTransform(b.id);
        b2Vec2 v = b2Body_GetLinearVelocity(b.id);
        float w = b2Body_GetAngularVelocity(b.id);
        if (!finite(xf.p) || !std::isfinite(xf.q.c) || !std::isfinite(xf.q.s) || !finite(v) || !std::isfinite(w)) {
            exclude(b, excluded);
            continue;
        }
        if (b.lethal_thrower && b2Length(v) < cfg_.projectile_rest_speed) {
            log::debug("[phys] projectile {} came to rest", b.key);
            b.lethal_thrower.reset();
        }
    }
    return excluded;
}

std::vector<uint32_t> PhysicsWorld::query_point(b2Vec2 p) const
{
    std::vector<uint32_t> keys;
    for (const auto &b : bodies_) {
        if (b.excluded)
            continue;
        for (const auto &m : b.members) {
            if (b2Shape_TestPoint(m.shape_id, p)) {
                keys.push_back(b.key);
                break;
            }
        }
    }
    return keys; // bodies_ is ascending by key
}

bool PhysicsWorld::point_in_category(b2Vec2 p, game::Category c) const
{
    for (const auto &b : bodies_) {
        if (b.excluded)
            continue;
        for (const auto &m : b.members) {
            if (m.category == c && b2Shape_TestPoint(m.shape_id, p))
                return true;
        }
    }
    return false;
}

bool PhysicsWorld::swept_contains(const Body &b, b2Vec2 p) const
{
    if (b.excluded)
        return false;
    // the cursor's path through body space over the step
    b2Vec2 from = b2InvTransformPoint(b.prev_transform, p);
    b2Vec2 to = b2InvTransformPoint(b2Body_GetTransform(b.id), p);
    b2RayCastInput ray{from, b2Sub(to, from), 1.f};
    bool moved = b2LengthSquared(ray.translation) > 1e-12f;
    for (const auto &m : b.members) {
        if (m.shape.kind == game::ShapeKind::Rectangle) {
            b2Polygon box =
                b2MakeOffsetBox(m.shape.half_width, m.shape.half_height, m.local_offset, b2MakeRot(m.local_rotation));
            if (b2PointInPolygon(from, &box) || b2PointInPolygon(to, &box))
                return true;
            if (moved && b2RayCastPolygon(&ray, &box).hit)
                return true;
        } else {
            b2Circle circle{m.local_offset, m.shape.radius};
            if (b2PointInCircle(from, &circle) || b2PointInCircle(to, &circle))
                return true;
            if (moved && b2RayCastCircle(&ray, &circle).hit)
                return true;
        }
    }
    return false;
}

std::optional<float> PhysicsWorld::distance_to_category(
    const Body &b, b2Vec2 p, game::Category c, uint32_t *member_id) const
{
    std::optional<float> best;
    b2Transform xf = b2Body_GetTransform(b.id);
    for (const auto &m : b.members) {
        if (m.category != c)
            continue;
        b2Transform mxf{b2TransformPoint(xf, m.local_offset), b2MulRot(xf.q, b2MakeRot(m.local_rotation))};
        b2Vec2 lp = b2InvTransformPoint(mxf, p);
        float d;
        if (m.shape.kind == game::ShapeKind::Rectangle) {
            float dx = std::max(std::fabs(lp.x) - m.shape.half_width, 0.f);
            float dy = std::max(std::fabs(lp.y) - m.shape.half_height, 0.f);
            d = std::sqrt(dx * dx + dy * dy);
        } else {
            d = std::max(b2Length(lp) - m.shape.radius, 0.f);
        }
        // members are ascending by entity id, so strict < keeps the lowest id on ties
        if (!best || d < *best) {
            best = d;
            if (member_id)
                *member_id = m.entity_id;
        }
    }
    return best;
}

std::vector<MemberPose> PhysicsWorld::member_poses(const Body &b) const
{
    std::vector<MemberPose> out;
    out.reserve(b.members.size());
    b2Transform xf = b2Body_GetTransform(b.id);
    float angle = b2Rot_GetAngle(xf.q);
    for (const auto &m : b.members)
        out.push_back({&m, b2TransformPoint(xf, m.local_offset), angle + m.local_rotation});
    return out;
}

b2Vec2 PhysicsWorld::world_point(const Body &b, b2Vec2 local) const
{
    return b2Body_GetWorldPoint(b.id, local);
}

b2Vec2 PhysicsWorld::local_point(const Body &b, b2Vec2 world) const
{
    return b2Body_GetLocalPoint(b.id, world);
}

b2Transform PhysicsWorld::transform(const Body &b) const
{
    return b2Body_GetTransform(b.id);
}

b2Vec2 PhysicsWorld::linear_velocity(const Body &b) const
{
    return b2Body_GetLinearVelocity(b.id);
}

float PhysicsWorld::angular_velocity(const Body &b) const
{
    return b2Body_GetAngularVelocity(b.id);
}

float PhysicsWorld::mass(const Body &b) const
{
    return b2Body_GetMass(b.id);
}

} // namespace arena::phys
