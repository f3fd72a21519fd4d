/**
 * TargetSetBuilder.cpp - Implementation
 */

#include "tmdbsync/TargetSetBuilder.h"

TargetSetBuilder::TargetSetBuilder(std::shared_ptr<const RefreshPolicy> policy, CivilDate today)
    : policy_(std::move(policy)), today_(today) {}

bool TargetSetBuilder::add(TargetSet& set, const EntityKey& key, const json& context, bool is_update) {
    if (!set.keys.insert(key).second) return false;
    set.targets.push_back(Target{key, context, is_update});
    if (is_update) {
        set.will_update++;
    } else {
        set.will_add++;
    }
    return true;
}

TargetSet TargetSetBuilder::build(const CandidateList& candidates, const ExistingState& existing) const {
    TargetSet set;

    for (const auto& candidate : candidates.candidates) {
        if (existing.keys.count(candidate.key) == 0) {
            add(set, candidate.key, candidate.context, false);
        }
    }

    if (!policy_) return set;

    if (policy_->uses_parent_context()) {
        // Only keys that are both stored and still listed by the parent have
        // a context to evaluate
        for (const auto& candidate : candidates.candidates) {
            if (existing.keys.count(candidate.key) == 0) continue;
            if (policy_->is_due(candidate.context, today_)) {
                add(set, candidate.key, candidate.context, true);
            }
        }
    } else {
        for (const auto& key : existing.refresh_order) {
            add(set, key, nullptr, true);
        }
    }

    return set;
}
