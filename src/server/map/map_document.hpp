// SPDX-License-Identifier: Apache-2.0
// map_document.hpp - load-time map schema (JSON or YAML) and its parser
#pragma once
#include "server/map/map_error.hpp"

#include <box2d/math_functions.h>
#include <yaml-cpp/yaml.h>

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace arena::map {

// Rectangle in normalized 0..1 map space.
struct NormRect
{
    float x1{0.f};
    float y1{0.f};
    float x2{0.f};
    float y2{0.f};
};

// One entry of the document's entity list. Shape fields stay optional so the
// loader can tell a missing field from a zero.
struct EntitySpec
{
    std::string shape; // "rect" | "circle"
    std::optional<float> x1, y1, x2, y2;
    std::optional<float> x, y, radius;
    bool is_static{false};
    bool is_death{false};
    float restitution{0.f};
    std::optional<uint32_t> id;
    std::optional<uint32_t> parent;
    float rotation{0.f}; // radians
    std::optional<uint32_t> user_data;
};

struct MapDocument
{
    b2Vec2 gravity{0.f, -2.f};
    float width{16.f};
    float height{9.f};
    float cursor_size{0.35f};
    std::optional<NormRect> control_zone;
    std::vector<EntitySpec> entities;
};

// Parses an already loaded YAML/JSON tree. Throws MapError(MalformedDocument) when the
// top level is unusable. Entities whose fields have the wrong type are recorded in
// `warnings` (InvalidEntitySpec) and left out of the result.
MapDocument parse_map_document(const YAML::Node &root, std::vector<LoadWarning> &warnings);
MapDocument parse_map_string(const std::string &text, std::vector<LoadWarning> &warnings);
MapDocument load_map_file(const std::string &path, std::vector<LoadWarning> &warnings);

// 8x5 grid of small grabbable squares, used when no map file is configured.
MapDocument default_map_document();

// Serializes a document back to YAML (flow style for short sequences).
std::string emit_map_document(const MapDocument &doc);

} // namespace arena::map
