// SPDX-License-Identifier: Apache-2.0
#include "server/map/map_document.hpp"

#include <fstream>
#include <sstream>

namespace arena::map {

const char *to_string(ErrorKind k)
{
    switch (k) {
        case ErrorKind::InvalidMapTopology:
            return "InvalidMapTopology";
        case ErrorKind::InvalidEntitySpec:
            return "InvalidEntitySpec";
        case ErrorKind::MalformedDocument:
            return "MalformedDocument";
        case ErrorKind::MalformedInput:
            return "MalformedInput";
        case ErrorKind::GrabConflict:
            return "GrabConflict";
        case ErrorKind::AuthoringScriptFailure:
            return "AuthoringScriptFailure";
    }
    return "Unknown";
}

namespace {

template <typename T>
std::optional<T> opt(const YAML::Node &n, const char *key)
{
    if (n[key] && !n[key].IsNull())
        return n[key].as<T>();
    return std::nullopt;
}

b2Vec2 read_pair(const YAML::Node &n, const char *what)
{
    if (!n.IsSequence() || n.size() != 2)
        throw MapError(ErrorKind::MalformedDocument, std::string(what) + " must be a two element sequence");
    return {n[0].as<float>(), n[1].as<float>()};
}

EntitySpec parse_entity(const YAML::Node &n)
{
    EntitySpec e;
    e.shape = n["shape"] ? n["shape"].as<std::string>() : std::string();
    e.x1 = opt<float>(n, "x1");
    e.y1 = opt<float>(n, "y1");
    e.x2 = opt<float>(n, "x2");
    e.y2 = opt<float>(n, "y2");
    e.x = opt<float>(n, "x");
    e.y = opt<float>(n, "y");
    e.radius = opt<float>(n, "radius");
    e.is_static = opt<bool>(n, "is_static").value_or(false);
    e.is_death = opt<bool>(n, "is_death").value_or(false);
    e.restitution = opt<float>(n, "restitution").value_or(0.f);
    e.id = opt<uint32_t>(n, "id");
    e.parent = opt<uint32_t>(n, "parent");
    e.rotation = opt<float>(n, "rotation").value_or(0.f);
    e.user_data = opt<uint32_t>(n, "user_data");
    return e;
}

} // namespace

MapDocument parse_map_document(const YAML::Node &root, std::vector<LoadWarning> &warnings)
{
    if (!root.IsMap())
        throw MapError(ErrorKind::MalformedDocument, "map document root must be a mapping");
    MapDocument doc;
    try {
        if (root["gravity"])
            doc.gravity = read_pair(root["gravity"], "gravity");
        if (root["dimensions"]) {
            b2Vec2 d = read_pair(root["dimensions"], "dimensions");
            doc.width = d.x;
            doc.height = d.y;
        }
        if (root["cursor_size"])
            doc.cursor_size = root["cursor_size"].as<float>();
        if (auto z = root["control_zone"]) {
            doc.control_zone =
                NormRect{z["x1"].as<float>(), z["y1"].as<float>(), z["x2"].as<float>(), z["y2"].as<float>()};
        }
    } catch (const YAML::Exception &e) {
        throw MapError(ErrorKind::MalformedDocument, std::string("map header: ") + e.what());
    }
    if (!(doc.width > 0.f) || !(doc.height > 0.f))
        throw MapError(ErrorKind::MalformedDocument, "map dimensions must be positive");
    auto ents = root["entities"];
    if (!ents)
        return doc;
    if (!ents.IsSequence())
        throw MapError(ErrorKind::MalformedDocument, "entities must be a sequence");
    for (std::size_t i = 0; i < ents.size(); ++i) {
        try {
            if (!ents[i].IsMap())
                throw YAML::Exception(ents[i].Mark(), "entity must be a mapping");
            doc.entities.push_back(parse_entity(ents[i]));
        } catch (const YAML::Exception &e) {
            warnings.push_back({ErrorKind::InvalidEntitySpec, i, std::string("entity field type: ") + e.what()});
        }
    }
    return doc;
}

MapDocument parse_map_string(const std::string &text, std::vector<LoadWarning> &warnings)
{
    YAML::Node root;
    try {
        root = YAML::Load(text);
    } catch (const YAML::Exception &e) {
        throw MapError(ErrorKind::MalformedDocument, std::string("map parse: ") + e.what());
    }
    return parse_map_document(root, warnings);
}

MapDocument load_map_file(const std::string &path, std::vector<LoadWarning> &warnings)
{
    std::ifstream in(path);
    if (!in)
        throw MapError(ErrorKind::MalformedDocument, "cannot open map file " + path);
    std::stringstream ss;
    ss << in.rdbuf();
    return parse_map_string(ss.str(), warnings);
}

MapDocument default_map_document()
{
    MapDocument doc;
    constexpr float half = 0.3f;
    for (int i = 0; i < 8; ++i) {
        for (int j = 0; j < 5; ++j) {
            float cx = float(i) - 3.5f;
            float cy = float(j) - 2.0f;
            EntitySpec e;
            e.shape = "rect";
            e.x1 = (cx - half + doc.width / 2.f) / doc.width;
            e.x2 = (cx + half + doc.width / 2.f) / doc.width;
            e.y1 = (cy - half + doc.height / 2.f) / doc.height;
            e.y2 = (cy + half + doc.height / 2.f) / doc.height;
            doc.entities.push_back(e);
        }
    }
    return doc;
}

std::string emit_map_document(const MapDocument &doc)
{
    YAML::Emitter out;
    out << YAML::BeginMap;
    out << YAML::Key << "gravity" << YAML::Value << YAML::Flow << YAML::BeginSeq << doc.gravity.x << doc.gravity.y
        << YAML::EndSeq;
    out << YAML::Key << "dimensions" << YAML::Value << YAML::Flow << YAML::BeginSeq << doc.width << doc.height
        << YAML::EndSeq;
    out << YAML::Key << "cursor_size" << YAML::Value << doc.cursor_size;
    if (doc.control_zone) {
        const auto &z = *doc.control_zone;
        out << YAML::Key << "control_zone" << YAML::Value << YAML::Flow << YAML::BeginMap;
        out << YAML::Key << "x1" << YAML::Value << z.x1 << YAML::Key << "y1" << YAML::Value << z.y1;
        out << YAML::Key << "x2" << YAML::Value << z.x2 << YAML::Key << "y2" << YAML::Value << z.y2;
        out << YAML::EndMap;
    }
    out << YAML::Key << "entities" << YAML::Value << YAML::BeginSeq;
    for (const auto &e : doc.entities) {
        out << YAML::Flow << YAML::BeginMap;
        out << YAML::Key << "shape" << YAML::Value << e.shape;
        auto put = [&](const char *k, const std::optional<float> &v)
        {
            if (v)
                out << YAML::Key << k << YAML::Value << *v;
        };
        put("x1", e.x1);
        put("y1", e.y1);
        put("x2", e.x2);
        put("y2", e.y2);
        put("x", e.x);
        put("y", e.y);
        put("radius", e.radius);
        if (e.is_static)
            out << YAML::Key << "is_static" << YAML::Value << true;
        if (e.is_death)
            out << YAML::Key << "is_death" << YAML::Value << true;
        if (e.restitution != 0.f)
            out << YAML::Key << "restitution" << YAML::Value << e.restitution;
        if (e.rotation != 0.f)
            out << YAML::Key << "rotation" << YAML::Value << e.rotation;
        if (e.id)
            out << YAML::Key << "id" << YAML::Value << *e.id;
        if (e.parent)
            out << YAML::Key << "parent" << YAML::Value << *e.parent;
        if (e.user_data)
            out << YAML::Key << "user_data" << YAML::Value << *e.user_data;
        out << YAML::EndMap;
    }
    out << YAML::EndSeq;
    out << YAML::EndMap;
    return out.c_str();
}

} // namespace arena::map
