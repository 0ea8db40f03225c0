// SPDX-License-Identifier: Apache-2.0
#include "server/map/map_store.hpp"

#include "common/logger.hpp"

namespace arena::map {

bool MapStore::install(const MapDocument &doc)
{
    std::shared_ptr<const LoadedMap> loaded;
    try {
        loaded = std::make_shared<const LoadedMap>(load_map(doc));
    } catch (const MapError &e) {
        log::error("[map] {}: {} (keeping previous map)", to_string(e.kind), e.what());
        return false;
    }
    std::lock_guard lk(mtx_);
    current_ = std::move(loaded);
    return true;
}

bool MapStore::install_from(AuthoringHost &host)
{
    auto session = run_authoring(host);
    if (!session)
        return false;
    return install(session->document);
}

std::shared_ptr<const LoadedMap> MapStore::current() const
{
    std::lock_guard lk(mtx_);
    return current_;
}

} // namespace arena::map
