/**
 * EntityDescriptor.cpp - Implementation
 */

#include "tmdbsync/EntityDescriptor.h"
#include "tmdbsync/EngineConfig.h"

QueryParams EntityDescriptor::query_for(const EntityKey& key) const {
    if (!key_query) return query;
    QueryParams params = query;
    for (auto& [name, value] : key_query(key)) {
        params[name] = std::move(value);
    }
    return params;
}

void EntityDescriptor::validate() const {
    auto require = [this](bool ok, const char* what) {
        if (!ok) throw ConfigError("entity '" + name + "': " + what);
    };

    require(!name.empty(), "missing name");
    require(!store_file.empty(), "missing store file");
    require(!key_fields.empty(), "missing key fields");

    if (full_rebuild) {
        require(!rebuild_endpoint.empty(), "missing rebuild endpoint");
        require(static_cast<bool>(project_rows), "missing row projector");
    } else {
        require(candidates != nullptr, "missing candidate source");
        require(policy != nullptr, "missing refresh policy");
        require(static_cast<bool>(endpoint), "missing endpoint builder");
        require(static_cast<bool>(project) != static_cast<bool>(project_key_rows),
                "needs exactly one of a record projector and a keyed rows projector");
    }
}
