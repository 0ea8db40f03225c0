// SPDX-License-Identifier: Apache-2.0
// authoring.hpp - explicit build context and event handler table for external map authoring hosts
#pragma once
#include "server/map/map_document.hpp"

#include <cstdint>
#include <functional>
#include <map>
#include <optional>
#include <string>
#include <variant>
#include <vector>

namespace arena::map {

using PropertyValue = std::variant<double, bool, std::string>;
using PropertyTable = std::map<std::string, PropertyValue>;

// Per-session accumulator for a document under construction. Each authoring run gets
// its own instance; nothing is shared between runs.
class MapBuildContext
{
public:
    MapBuildContext() = default;
    explicit MapBuildContext(MapDocument base) : doc_(std::move(base)) {}

    void set_gravity(float x, float y);
    void set_map_dimensions(float width, float height);
    void set_cursor_size(float size);
    // Appends an entity built from a property table. Throws MapError(AuthoringScriptFailure)
    // when a known key carries the wrong type. Returns the entity's document index.
    std::size_t create_entity(const PropertyTable &props);

    const MapDocument &document() const { return doc_; }
    MapDocument take() { return std::move(doc_); }

private:
    MapDocument doc_;
};

enum class AuthoringEvent
{
    PointerClick,
    ObjectCollision
};

struct AuthoringEventArgs
{
    b2Vec2 point{0.f, 0.f}; // normalized map space for clicks
    uint32_t entity_a{0}; // collisions only
    uint32_t entity_b{0};
};

using AuthoringHandler = std::function<void(MapBuildContext &, const AuthoringEventArgs &)>;

class AuthoringHandlerTable
{
public:
    void on(AuthoringEvent ev, AuthoringHandler h);
    std::size_t count(AuthoringEvent ev) const;
    // Invokes the handlers for `ev` in registration order. Returns how many ran.
    std::size_t dispatch(AuthoringEvent ev, MapBuildContext &ctx, const AuthoringEventArgs &args) const;

private:
    std::map<AuthoringEvent, std::vector<AuthoringHandler>> handlers_;
};

// Implemented by the external scripting runtime. `run` executes a script against the
// context and registers its event handlers; it throws on script failure.
class AuthoringHost
{
public:
    virtual ~AuthoringHost() = default;
    virtual void run(MapBuildContext &ctx, AuthoringHandlerTable &handlers) = 0;
};

struct AuthoringSession
{
    MapDocument document;
    AuthoringHandlerTable handlers;
};

// Runs the host with a fresh context. Script failures are logged as
// AuthoringScriptFailure and produce no session.
std::optional<AuthoringSession> run_authoring(AuthoringHost &host);

// Replays an authoring-time event (editor click or collision) on top of the session's
// document. On success the session document is replaced; on failure it is left as it was.
bool dispatch_authoring_event(AuthoringSession &session, AuthoringEvent ev, const AuthoringEventArgs &args);

} // namespace arena::map
