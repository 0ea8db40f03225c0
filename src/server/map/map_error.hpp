// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <cstdint>
#include <stdexcept>
#include <string>
#include <vector>

namespace arena::map {

enum class ErrorKind
{
    InvalidMapTopology, // cyclic parent references; whole document rejected
    InvalidEntitySpec, // one entity (or one parent link) rejected
    MalformedDocument, // document not parseable or wrong top-level types
    MalformedInput, // inbound client message dropped
    GrabConflict, // resolved by tie-break, never raised
    AuthoringScriptFailure
};

const char *to_string(ErrorKind k);

struct MapError : std::runtime_error
{
    ErrorKind kind;

    MapError(ErrorKind k, const std::string &what) : std::runtime_error(what), kind(k) {}
};

// Non-fatal issue found while loading; the offending entity or link is skipped.
struct LoadWarning
{
    ErrorKind kind{ErrorKind::InvalidEntitySpec};
    std::size_t entity_index{0}; // position in the document's entity list
    std::string message;
};

} // namespace arena::map
