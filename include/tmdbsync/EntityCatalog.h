/**
 * EntityCatalog.h - The built-in TMDB entities, in dependency order
 *
 * Reference tables first (genres read the stored languages), then the
 * movie, people, company and network entities fed by the daily ID exports,
 * then series -> seasons -> episodes, each level reading the store written
 * by the level above.
 */

#pragma once

#include <string>
#include <vector>
#include "tmdbsync/EntityDescriptor.h"

class EntityCatalog {
public:
    static EntityCatalog builtin();

    // Throws ConfigError on an invalid descriptor or a duplicate name
    void add(EntityDescriptor descriptor);

    const EntityDescriptor* find(const std::string& name) const;
    const std::vector<EntityDescriptor>& all() const { return entities_; }
    std::vector<std::string> names() const;

    // Requested names in catalog order, each at most once. Throws
    // ConfigError on an unknown name.
    std::vector<const EntityDescriptor*> select(const std::vector<std::string>& requested) const;

private:
    std::vector<EntityDescriptor> entities_;
};
