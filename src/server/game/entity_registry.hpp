// SPDX-License-Identifier: Apache-2.0
// entity_registry.hpp - canonical store of authored physics entities
#pragma once
#include <box2d/math_functions.h>

#include <cstdint>
#include <optional>
#include <vector>

namespace arena::game {

enum class ShapeKind
{
    Rectangle,
    Circle
};

struct Shape
{
    ShapeKind kind{ShapeKind::Rectangle};
    float half_width{0.f};
    float half_height{0.f};
    float radius{0.f};
};

enum class Kinematic
{
    Static,
    Dynamic
};

enum class Category
{
    Wall,
    Grabbable,
    Death
};

// Presentation tags sent to clients; no simulation meaning.
inline constexpr uint32_t kWallUserData = 0;
inline constexpr uint32_t kGrabbableUserData = 1;
inline constexpr uint32_t kDeathUserData = 2;

struct Entity
{
    uint32_t id{0};
    Shape shape;
    b2Vec2 position{0.f, 0.f}; // world space, authored
    float rotation{0.f};
    Kinematic kinematic{Kinematic::Dynamic};
    Category category{Category::Grabbable};
    float restitution{0.f};
    std::optional<uint32_t> parent;
    uint32_t user_data{kGrabbableUserData};
};

Category derive_category(bool is_static, bool is_death);
uint32_t default_user_data(Category c);

// Entities kept sorted by id; ids are unique for the registry lifetime.
class EntityRegistry
{
public:
    // Returns false (and leaves the registry unchanged) when the id is already taken.
    bool add(Entity e);
    const Entity *find(uint32_t id) const;
    bool contains(uint32_t id) const { return find(id) != nullptr; }
    // Drops a parent link that turned out to be unusable.
    void clear_parent(uint32_t id);
    const std::vector<Entity> &all() const { return entities_; }
    std::size_t size() const { return entities_.size(); }
    bool empty() const { return entities_.empty(); }

private:
    std::vector<Entity> entities_;
};

} // namespace arena::game
