// SPDX-License-Identifier: Apache-2.0
#include "server/map/authoring.hpp"

#include "common/logger.hpp"

#include <cmath>

namespace arena::map {

namespace {

[[noreturn]] void bad_property(const std::string &key, const char *expected)
{
    throw MapError(ErrorKind::AuthoringScriptFailure, "create_entity: '" + key + "' must be " + expected);
}

float as_number(const std::string &key, const PropertyValue &v)
{
    if (auto d = std::get_if<double>(&v))
        return static_cast<float>(*d);
    bad_property(key, "a number");
}

bool as_bool(const std::string &key, const PropertyValue &v)
{
    if (auto b = std::get_if<bool>(&v))
        return *b;
    bad_property(key, "a boolean");
}

uint32_t as_id(const std::string &key, const PropertyValue &v)
{
    auto d = std::get_if<double>(&v);
    if (!d || *d < 0.0 || *d > 4294967295.0 || std::floor(*d) != *d)
        bad_property(key, "a non-negative integer");
    return static_cast<uint32_t>(*d);
}

} // namespace

void MapBuildContext::set_gravity(float x, float y)
{
    doc_.gravity = {x, y};
}

void MapBuildContext::set_map_dimensions(float width, float height)
{
    if (!(width > 0.f) || !(height > 0.f))
        throw MapError(ErrorKind::AuthoringScriptFailure, "set_map_dimensions: dimensions must be positive");
    doc_.width = width;
    doc_.height = height;
}

void MapBuildContext::set_cursor_size(float size)
{
    doc_.cursor_size = size;
}

std::size_t MapBuildContext::create_entity(const PropertyTable &props)
{
    EntitySpec e;
    for (const auto &[key, value] : props) {
        if (key == "shape") {
            auto s = std::get_if<std::string>(&value);
            if (!s)
                bad_property(key, "a string");
            e.shape = *s;
        } else if (key == "x1")
            e.x1 = as_number(key, value);
        else if (key == "y1")
            e.y1 = as_number(key, value);
        else if (key == "x2")
            e.x2 = as_number(key, value);
        else if (key == "y2")
            e.y2 = as_number(key, value);
        else if (key == "x")
            e.x = as_number(key, value);
        else if (key == "y")
            e.y = as_number(key, value);
        else if (key == "radius")
            e.radius = as_number(key, value);
        else if (key == "rotation")
            e.rotation = as_number(key, value);
        else if (key == "restitution")
            e.restitution = as_number(key, value);
        else if (key == "is_static")
            e.is_static = as_bool(key, value);
        else if (key == "is_death")
            e.is_death = as_bool(key, value);
        else if (key == "id")
            e.id = as_id(key, value);
        else if (key == "parent")
            e.parent = as_id(key, value);
        else if (key == "user_data")
            e.user_data = as_id(key, value);
        else
            log::debug("[authoring] create_entity ignores key '{}'", key);
    }
    doc_.entities.push_back(std::move(e));
    return doc_.entities.size() - 1;
}

void AuthoringHandlerTable::on(AuthoringEvent ev, AuthoringHandler h)
{
    handlers_[ev].push_back(std::move(h));
}

std::size_t AuthoringHandlerTable::count(AuthoringEvent ev) const
{
    auto it = handlers_.find(ev);
    return it == handlers_.end() ? 0 : it->second.size();
}

std::size_t AuthoringHandlerTable::dispatch(
    AuthoringEvent ev, MapBuildContext &ctx, const AuthoringEventArgs &args) const
{
    auto it = handlers_.find(ev);
    if (it == handlers_.end())
        return 0;
    for (const auto &h : it->second)
        h(ctx, args);
    return it->second.size();
}

std::optional<AuthoringSession> run_authoring(AuthoringHost &host)
{
    MapBuildContext ctx;
    AuthoringHandlerTable handlers;
    try {
        host.run(ctx, handlers);
    } catch (const std::exception &e) {
        log::error("[authoring] {}: {}", to_string(ErrorKind::AuthoringScriptFailure), e.what());
        return std::nullopt;
    }
    return AuthoringSession{ctx.take(), std::move(handlers)};
}

bool dispatch_authoring_event(AuthoringSession &session, AuthoringEvent ev, const AuthoringEventArgs &args)
{
    MapBuildContext ctx(session.document);
    try {
        session.handlers.dispatch(ev, ctx, args);
    } catch (const std::exception &e) {
        log::error("[authoring] {} in event handler: {}", to_string(ErrorKind::AuthoringScriptFailure), e.what());
        return false;
    }
    session.document = ctx.take();
    return true;
}

} // namespace arena::map
