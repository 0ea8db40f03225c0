// SPDX-License-Identifier: Apache-2.0
// physics.hpp - Box2D world owning compound bodies built from map plans, cursor tethers
#pragma once
#include "server/game/composite_builder.hpp"
#include "server/game/entity_registry.hpp"

#include <box2d/box2d.h>

#include <cstdint>
#include <optional>
#include <vector>

namespace arena::phys {

struct PhysicsConfig
{
    b2Vec2 gravity{0.f, -2.f};
    float width{16.f};
    float height{9.f};
    int substeps{4};
    float wall_half_thickness{0.1f};
    float linear_damping{0.5f};
    float angular_damping{0.8f};
    float max_tether_speed{60.f}; // units/s cap on the tether-imposed anchor velocity
    float projectile_rest_speed{0.25f}; // a flung body below this speed is no longer lethal
};

struct MemberShape
{
    uint32_t entity_id{0};
    game::Category category{game::Category::Grabbable};
    game::Shape shape;
    b2Vec2 local_offset{0.f, 0.f};
    float local_rotation{0.f};
    uint32_t user_data{0};
    b2ShapeId shape_id{b2_nullShapeId};
};

struct Body
{
    uint32_t key{0};
    b2BodyId id{b2_nullBodyId};
    bool is_static{false};
    bool has_grabbable{false};
    bool has_death{false};
    bool excluded{false}; // non-finite state detected; disabled for the rest of the match
    bool held{false};
    std::optional<uint32_t> lethal_thrower; // set while a flung projectile is lethal
    // Pose and thrower as they were when the last step began.
    b2Transform prev_transform = b2Transform_identity;
    std::optional<uint32_t> swept_thrower;
    std::vector<MemberShape> members;
};

// Static walls surrounding the map; mirrored into snapshots.
struct Boundary
{
    b2Vec2 center{0.f, 0.f};
    float half_width{0.f};
    float half_height{0.f};
};

struct MemberPose
{
    const MemberShape *member{nullptr};
    b2Vec2 position{0.f, 0.f};
    float rotation{0.f};
};

class PhysicsWorld
{
public:
    explicit PhysicsWorld(const PhysicsConfig &cfg);
    ~PhysicsWorld();
    PhysicsWorld(const PhysicsWorld &) = delete;
    PhysicsWorld &operator=(const PhysicsWorld &) = delete;

    // Load-time only. Bodies must be added in plan order for deterministic ids.
    void add_body(const game::BodyPlan &plan, const game::EntityRegistry &registry);

    // Queues a positional tether for the next step: the body velocity is chosen so the
    // anchor (body-local) lands on `target` after the step. Applied in call order. A tether
    // that would impose a non-finite velocity excludes the body instead.
    void set_tether(uint32_t key, b2Vec2 local_anchor, b2Vec2 target);
    void begin_hold(uint32_t key);
    // Releases a held body. With a velocity the body is flung, otherwise it is dropped at rest.
    void end_hold(uint32_t key, std::optional<b2Vec2> fling_velocity);
    void mark_lethal(uint32_t key, uint32_t thrower);

    // Advances one fixed step. Returns keys of bodies excluded during this step.
    std::vector<uint32_t> step(float dt);

    // Sorted keys of non-excluded bodies having a member shape that contains p.
    std::vector<uint32_t> query_point(b2Vec2 p) const;
    // True when p lies inside a member shape of the given category (non-excluded bodies only).
    bool point_in_category(b2Vec2 p, game::Category c) const;
    // True when p was inside a member shape at some point of the last step. The body pose is
    // interpolated linearly between the start and the end of the step.
    bool swept_contains(const Body &b, b2Vec2 p) const;
    // Distance from p to the closest member of category c on the body (0 when inside).
    // Reports the member's entity id through `member_id`. Returns nullopt when the body has no such member.
    std::optional<float> distance_to_category(const Body &b, b2Vec2 p, game::Category c, uint32_t *member_id) const;

    Body *find(uint32_t key);
    const Body *find(uint32_t key) const;
    const std::vector<Body> &bodies() const { return bodies_; }
    const std::vector<Boundary> &boundaries() const { return boundaries_; }
    std::vector<MemberPose> member_poses(const Body &b) const;

    b2Vec2 world_point(const Body &b, b2Vec2 local) const;
    b2Vec2 local_point(const Body &b, b2Vec2 world) const;
    b2Transform transform(const Body &b) const;
    b2Vec2 linear_velocity(const Body &b) const;
    float angular_velocity(const Body &b) const;
    float mass(const Body &b) const;

    const PhysicsConfig &config() const { return cfg_; }
    b2WorldId id() const { return world_; }

private:
    struct Tether
    {
        uint32_t key;
        b2Vec2 local_anchor;
        b2Vec2 target;
    };

    void create_boundaries();
    void apply_tether(const Tether &t, float dt, std::vector<uint32_t> &excluded);
    void process_contacts();
    void exclude(Body &b, std::vector<uint32_t> &out);
    Body *body_of(b2ShapeId s);
    bool is_wall_shape(b2ShapeId s) const;

    PhysicsConfig cfg_;
    b2WorldId world_{b2_nullWorldId};
    b2BodyId walls_{b2_nullBodyId};
    std::vector<Body> bodies_; // ascending key
    std::vector<Boundary> boundaries_;
    std::vector<Tether> tethers_;
};

} // namespace arena::phys
