/**
 * Projector.h - Narrows raw API payloads to the persisted record schemas
 *
 * Projections are total: any JSON value goes in, a record comes out.
 * Absent scalar fields become null, absent list fields become [].
 * Nested lists keep only an allow-list of sub-keys per item and drop items
 * that are not objects or lack a required sub-key.
 */

#pragma once

#include <functional>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>
#include "tmdbsync/EntityKey.h"

using json = nlohmann::json;

using RecordProjector = std::function<json(const json& payload, const EntityKey& key)>;
using RowsProjector = std::function<std::vector<json>(const json& payload)>;
// Many rows for one key, each stamped with the key's fields
using KeyedRowsProjector = std::function<std::vector<json>(const json& payload, const EntityKey& key)>;

namespace projection {

json field_or_null(const json& payload, const std::string& field);

// The field when it is an array, else []
json list_or_empty(const json& payload, const std::string& field);

// Each object item reduced to `keys` (missing ones null). Items that are not
// objects, or where a `required` key is missing or null, are dropped.
json select_list(const json& items,
                 const std::vector<std::string>& keys,
                 const std::vector<std::string>& required = {});

json movie_details(const json& payload, const EntityKey& key);
json movie_reviews(const json& payload, const EntityKey& key);
json movie_credits(const json& payload, const EntityKey& key);
json movie_keywords(const json& payload, const EntityKey& key);
json movie_alternative_titles(const json& payload, const EntityKey& key);
json movie_release_dates(const json& payload, const EntityKey& key);
json movie_translations(const json& payload, const EntityKey& key);
// {id, imdb_id}; shared by movies and series
json external_ids(const json& payload, const EntityKey& key);
json person_details(const json& payload, const EntityKey& key);
json company_details(const json& payload, const EntityKey& key);
json network_details(const json& payload, const EntityKey& key);
json tv_series_details(const json& payload, const EntityKey& key);
json tv_season_details(const json& payload, const EntityKey& key);
json tv_episode_details(const json& payload, const EntityKey& key);
json tv_series_reviews(const json& payload, const EntityKey& key);
json tv_series_translations(const json& payload, const EntityKey& key);
json tv_series_alternative_titles(const json& payload, const EntityKey& key);
json tv_series_content_ratings(const json& payload, const EntityKey& key);

// One row per (country_code, provider_id) across every offer type
std::vector<json> movie_watch_providers(const json& payload, const EntityKey& key);
std::vector<json> series_watch_providers(const json& payload, const EntityKey& key);

// One row per genre, tagged with the language it was requested in
std::vector<json> genres(const json& payload, const EntityKey& key);

std::vector<json> countries(const json& payload);
std::vector<json> languages(const json& payload);
// One row per (country_code, certification)
std::vector<json> certifications(const json& payload);

} // namespace projection
