/**
 * EntityKey.cpp - Implementation
 */

#include "tmdbsync/EntityKey.h"
#include <functional>

std::optional<KeyPart> EntityKey::part_from_json(const json& value) {
    if (value.is_number_integer()) {
        return KeyPart(value.get<int64_t>());
    }
    if (value.is_string()) {
        const auto& s = value.get_ref<const std::string&>();
        if (s.empty()) return std::nullopt;
        return KeyPart(s);
    }
    return std::nullopt;
}

std::optional<EntityKey> EntityKey::from_record(const json& record,
                                                const std::vector<std::string>& fields) {
    if (!record.is_object() || fields.empty()) return std::nullopt;

    EntityKey key;
    key.parts.reserve(fields.size());
    for (const auto& field : fields) {
        auto it = record.find(field);
        if (it == record.end()) return std::nullopt;
        auto part = part_from_json(*it);
        if (!part) return std::nullopt;
        key.parts.push_back(std::move(*part));
    }
    return key;
}

EntityKey EntityKey::with(KeyPart part) const {
    EntityKey extended = *this;
    extended.parts.push_back(std::move(part));
    return extended;
}

std::string EntityKey::to_string() const {
    std::string out;
    for (size_t i = 0; i < parts.size(); ++i) {
        if (i > 0) out += '/';
        if (const auto* n = std::get_if<int64_t>(&parts[i])) {
            out += std::to_string(*n);
        } else {
            out += std::get<std::string>(parts[i]);
        }
    }
    return out;
}

size_t EntityKeyHash::operator()(const EntityKey& key) const {
    size_t seed = key.parts.size();
    for (const auto& part : key.parts) {
        size_t h = std::hash<KeyPart>{}(part);
        seed ^= h + 0x9e3779b97f4a7c15ULL + (seed << 6) + (seed >> 2);
    }
    return seed;
}

json key_part_to_json(const KeyPart& part) {
    if (const auto* n = std::get_if<int64_t>(&part)) {
        return *n;
    }
    return std::get<std::string>(part);
}
