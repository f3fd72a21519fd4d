/**
 * TargetSetBuilder.h - Reconciles candidates against the existing store
 *
 * Targets = {candidates absent from the store} + {stored keys due for a
 * refresh}. New keys come first in candidate order, then stale keys in
 * store order (or candidate order for parent-derived policies). A key is
 * never listed twice.
 */

#pragma once

#include <cstdint>
#include <memory>
#include <vector>
#include <nlohmann/json.hpp>
#include "tmdbsync/CandidateSource.h"
#include "tmdbsync/CivilDate.h"
#include "tmdbsync/EntityKey.h"
#include "tmdbsync/ExistingStateScanner.h"
#include "tmdbsync/RefreshPolicy.h"

using json = nlohmann::json;

struct Target {
    EntityKey key;
    json context;
    bool is_update = false;
};

struct TargetSet {
    std::vector<Target> targets;
    EntityKeySet keys;
    uint64_t will_add = 0;
    uint64_t will_update = 0;

    size_t size() const { return targets.size(); }
    bool empty() const { return targets.empty(); }
};

class TargetSetBuilder {
public:
    TargetSetBuilder(std::shared_ptr<const RefreshPolicy> policy, CivilDate today);

    TargetSet build(const CandidateList& candidates, const ExistingState& existing) const;

private:
    std::shared_ptr<const RefreshPolicy> policy_;
    CivilDate today_;

    static bool add(TargetSet& set, const EntityKey& key, const json& context, bool is_update);
};
