/**
 * ExistingStateScanner.h - Reads the current store before a run
 *
 * Produces the set of stored identity keys and, for scan-time refresh
 * policies, the subset whose records are due for a refetch. Lines that do
 * not parse, or lack a usable key, are skipped and counted; they never
 * fail the scan. In a one-line-per-key store a repeated key is counted as a
 * duplicate line; in a per-key row store it is just another row.
 */

#pragma once

#include <cstdint>
#include <memory>
#include <string>
#include <vector>
#include "tmdbsync/CivilDate.h"
#include "tmdbsync/EntityKey.h"
#include "tmdbsync/RefreshPolicy.h"

struct ExistingState {
    bool store_exists = false;
    EntityKeySet keys;
    EntityKeySet refresh_due;
    // refresh_due in store order
    std::vector<EntityKey> refresh_order;
    // Lines with a usable key, duplicates included
    uint64_t valid_lines = 0;
    uint64_t malformed_lines = 0;
    uint64_t duplicate_lines = 0;
};

class ExistingStateScanner {
public:
    ExistingStateScanner(std::vector<std::string> key_fields,
                         std::shared_ptr<const RefreshPolicy> policy,
                         CivilDate today,
                         KeyCardinality cardinality = KeyCardinality::ONE_LINE);

    ExistingState scan(const std::string& store_path) const;

private:
    std::vector<std::string> key_fields_;
    std::shared_ptr<const RefreshPolicy> policy_;
    CivilDate today_;
    KeyCardinality cardinality_;
};
