// SPDX-License-Identifier: Apache-2.0
#pragma once
#include "server/map/authoring.hpp"
#include "server/map/map_loader.hpp"

#include <memory>
#include <mutex>

namespace arena::map {

// Holds the map new matches start on. Installs fail closed: a document that does
// not load (or an authoring run that fails) leaves the current map in place.
class MapStore
{
public:
    bool install(const MapDocument &doc);
    bool install_from(AuthoringHost &host);
    std::shared_ptr<const LoadedMap> current() const;

private:
    mutable std::mutex mtx_;
    std::shared_ptr<const LoadedMap> current_;
};

} // namespace arena::map
