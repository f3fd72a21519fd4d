/**
 * EntityKey.h - Identity keys for stored records
 *
 * A key is an ordered tuple of integer or string parts, e.g. (1396) for a
 * series, (1396, 2) for a season, (1396, 2, 5) for an episode.
 */

#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <unordered_set>
#include <variant>
#include <vector>
#include <nlohmann/json.hpp>

using json = nlohmann::json;

using KeyPart = std::variant<int64_t, std::string>;

struct EntityKey {
    std::vector<KeyPart> parts;

    EntityKey() = default;
    explicit EntityKey(std::vector<KeyPart> p) : parts(std::move(p)) {}

    // Pulls `fields` out of a record in order. Returns nullopt when a field is
    // missing or is neither an integer nor a string.
    static std::optional<EntityKey> from_record(const json& record,
                                                const std::vector<std::string>& fields);

    static std::optional<KeyPart> part_from_json(const json& value);

    EntityKey with(KeyPart part) const;

    // "1396/2/5"
    std::string to_string() const;

    bool operator==(const EntityKey& other) const { return parts == other.parts; }
    bool operator!=(const EntityKey& other) const { return !(*this == other); }
};

struct EntityKeyHash {
    size_t operator()(const EntityKey& key) const;
};

using EntityKeySet = std::unordered_set<EntityKey, EntityKeyHash>;

// How many store lines may carry the same key. Per-key row stores (watch
// providers, genres by language) hold one line per row of a key's group.
enum class KeyCardinality {
    ONE_LINE,
    MANY_LINES
};

json key_part_to_json(const KeyPart& part);
