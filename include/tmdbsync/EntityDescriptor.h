/**
 * EntityDescriptor.h - Everything the engine needs to know about one entity
 *
 * Incremental entities supply a candidate source, a refresh policy, an
 * endpoint per key and either a single-record projector or a keyed rows
 * projector (one store line per row, several lines per key). Full-rebuild
 * entities supply one endpoint and a projector that emits many rows.
 */

#pragma once

#include <functional>
#include <memory>
#include <string>
#include <vector>
#include "tmdbsync/CandidateSource.h"
#include "tmdbsync/EntityKey.h"
#include "tmdbsync/Projector.h"
#include "tmdbsync/RefreshPolicy.h"
#include "tmdbsync/RequestExecutor.h"

using EndpointBuilder = std::function<std::string(const EntityKey& key)>;
using QueryBuilder = std::function<QueryParams(const EntityKey& key)>;

struct EntityDescriptor {
    std::string name;
    // Noun used in the run log ("movie details")
    std::string log_label;
    std::string store_file;
    std::vector<std::string> key_fields;
    QueryParams query;

    // Incremental mode
    std::shared_ptr<const CandidateSource> candidates;
    std::shared_ptr<const RefreshPolicy> policy;
    EndpointBuilder endpoint;
    // Per-key parameters added to `query`, e.g. language=<key>
    QueryBuilder key_query;
    RecordProjector project;
    KeyedRowsProjector project_key_rows;

    // Full-rebuild mode
    bool full_rebuild = false;
    std::string rebuild_endpoint;
    RowsProjector project_rows;

    KeyCardinality cardinality() const {
        return project_key_rows ? KeyCardinality::MANY_LINES : KeyCardinality::ONE_LINE;
    }

    QueryParams query_for(const EntityKey& key) const;

    // Throws ConfigError when a required part is missing
    void validate() const;
};
