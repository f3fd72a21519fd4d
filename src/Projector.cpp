/**
 * Projector.cpp - Per-entity projections
 */

#include "tmdbsync/Projector.h"
#include <set>

namespace {
    json key_part_or_null(const EntityKey& key, size_t index) {
        if (index >= key.parts.size()) return nullptr;
        return key_part_to_json(key.parts[index]);
    }

    void copy_fields(json& out, const json& payload, const std::vector<std::string>& fields) {
        for (const auto& field : fields) {
            out[field] = projection::field_or_null(payload, field);
        }
    }

    // Rows of string-only fields; rows with a non-string field are dropped
    std::vector<json> string_rows(const json& payload, const std::vector<std::string>& fields) {
        std::vector<json> rows;
        if (!payload.is_array()) return rows;

        for (const auto& item : payload) {
            if (!item.is_object()) continue;
            json row = json::object();
            bool complete = true;
            for (const auto& field : fields) {
                auto it = item.find(field);
                if (it == item.end() || !it->is_string()) {
                    complete = false;
                    break;
                }
                row[field] = *it;
            }
            if (complete) rows.push_back(std::move(row));
        }
        return rows;
    }

    // Translation texts live under each entry's "data" object
    json flatten_translations(const json& payload, const std::string& title_field) {
        json out = json::array();
        for (const auto& entry : projection::list_or_empty(payload, "translations")) {
            if (!entry.is_object()) continue;
            json data = projection::field_or_null(entry, "data");
            out.push_back(json{
                {"iso_639_1", projection::field_or_null(entry, "iso_639_1")},
                {"iso_3166_1", projection::field_or_null(entry, "iso_3166_1")},
                {title_field, projection::field_or_null(data, title_field)},
                {"overview", projection::field_or_null(data, "overview")},
                {"tagline", projection::field_or_null(data, "tagline")}
            });
        }
        return out;
    }

    json keyed_list(const EntityKey& key, const std::string& list_name, json items) {
        return json{
            {"id", key_part_or_null(key, 0)},
            {list_name, std::move(items)}
        };
    }

    std::vector<json> watch_provider_rows(const json& payload, const EntityKey& key, const std::string& id_field) {
        std::vector<json> rows;
        json results = projection::field_or_null(payload, "results");
        if (!results.is_object()) return rows;

        for (const auto& country : results.items()) {
            const json& offer = country.value();
            if (!offer.is_object()) continue;

            // A provider listed under several offer types yields one row
            std::set<int64_t> seen;
            for (const char* offer_type : {"flatrate", "buy", "rent", "ads", "free"}) {
                for (const auto& provider : projection::list_or_empty(offer, offer_type)) {
                    json provider_id = projection::field_or_null(provider, "provider_id");
                    json provider_name = projection::field_or_null(provider, "provider_name");
                    if (!provider_id.is_number_integer() || !provider_name.is_string()) continue;
                    if (!seen.insert(provider_id.get<int64_t>()).second) continue;

                    rows.push_back(json{
                        {id_field, key_part_or_null(key, 0)},
                        {"provider_id", provider_id},
                        {"provider_name", provider_name},
                        {"country_code", country.key()}
                    });
                }
            }
        }
        return rows;
    }
}

namespace projection {

json field_or_null(const json& payload, const std::string& field) {
    if (!payload.is_object()) return nullptr;
    auto it = payload.find(field);
    return it == payload.end() ? json(nullptr) : *it;
}

json list_or_empty(const json& payload, const std::string& field) {
    json value = field_or_null(payload, field);
    return value.is_array() ? value : json::array();
}

json select_list(const json& items,
                 const std::vector<std::string>& keys,
                 const std::vector<std::string>& required) {
    json out = json::array();
    if (!items.is_array()) return out;

    for (const auto& item : items) {
        if (!item.is_object()) continue;

        bool usable = true;
        for (const auto& key : required) {
            auto it = item.find(key);
            if (it == item.end() || it->is_null()) {
                usable = false;
                break;
            }
        }
        if (!usable) continue;

        json selected = json::object();
        for (const auto& key : keys) {
            selected[key] = field_or_null(item, key);
        }
        out.push_back(std::move(selected));
    }
    return out;
}

// ============================================================================
// Movies
// ============================================================================

json movie_details(const json& payload, const EntityKey& key) {
    json out = json::object();
    copy_fields(out, payload, {
        "budget", "imdb_id", "original_language", "original_title", "overview",
        "popularity", "release_date", "revenue", "runtime", "status", "tagline",
        "title", "vote_average", "vote_count"
    });
    out["id"] = key_part_or_null(key, 0);
    out["genres"] = select_list(field_or_null(payload, "genres"), {"id", "name"}, {"id"});
    out["production_companies"] = select_list(field_or_null(payload, "production_companies"),
                                              {"id", "name", "origin_country"}, {"id"});
    out["production_countries"] = select_list(field_or_null(payload, "production_countries"),
                                              {"iso_3166_1", "name"}, {"iso_3166_1"});
    out["spoken_languages"] = select_list(field_or_null(payload, "spoken_languages"),
                                          {"english_name", "iso_639_1", "name"}, {"iso_639_1"});
    return out;
}

json movie_reviews(const json& payload, const EntityKey& key) {
    json reviews = json::array();
    json results = list_or_empty(payload, "results");
    for (const auto& entry : results) {
        if (!entry.is_object()) continue;
        auto review_id = entry.find("id");
        if (review_id == entry.end() || review_id->is_null()) continue;
        reviews.push_back({
            {"review_id", *review_id},
            {"author", field_or_null(entry, "author")},
            {"content", field_or_null(entry, "content")},
            {"created_at", field_or_null(entry, "created_at")},
            {"url", field_or_null(entry, "url")}
        });
    }

    return json{
        {"id", key_part_or_null(key, 0)},
        {"reviews", reviews}
    };
}

json movie_credits(const json& payload, const EntityKey& key) {
    return json{
        {"id", key_part_or_null(key, 0)},
        {"cast", select_list(field_or_null(payload, "cast"), {"credit_id", "id", "character", "order"})},
        {"crew", select_list(field_or_null(payload, "crew"), {"credit_id", "id", "department", "job"})}
    };
}

json movie_keywords(const json& payload, const EntityKey& key) {
    return keyed_list(key, "keywords", select_list(field_or_null(payload, "keywords"), {"id", "name"}));
}

json movie_alternative_titles(const json& payload, const EntityKey& key) {
    return keyed_list(key, "titles", select_list(field_or_null(payload, "titles"), {"iso_3166_1", "title"}));
}

json movie_release_dates(const json& payload, const EntityKey& key) {
    // Flattened to one entry per (country, release)
    json flattened = json::array();
    for (const auto& entry : list_or_empty(payload, "results")) {
        if (!entry.is_object()) continue;
        json country = field_or_null(entry, "iso_3166_1");
        for (const auto& release : list_or_empty(entry, "release_dates")) {
            if (!release.is_object()) continue;
            flattened.push_back(json{
                {"iso_3166_1", country},
                {"release_date", field_or_null(release, "release_date")},
                {"type", field_or_null(release, "type")},
                {"certification", field_or_null(release, "certification")}
            });
        }
    }
    return keyed_list(key, "release_dates", std::move(flattened));
}

json movie_translations(const json& payload, const EntityKey& key) {
    return keyed_list(key, "translations", flatten_translations(payload, "title"));
}

json external_ids(const json& payload, const EntityKey& key) {
    return json{
        {"id", key_part_or_null(key, 0)},
        {"imdb_id", field_or_null(payload, "imdb_id")}
    };
}

std::vector<json> movie_watch_providers(const json& payload, const EntityKey& key) {
    return watch_provider_rows(payload, key, "id_movie");
}

// ============================================================================
// People, companies and networks
// ============================================================================

json person_details(const json& payload, const EntityKey& key) {
    json out = json::object();
    copy_fields(out, payload, {
        "name", "biography", "birthday", "deathday", "place_of_birth",
        "popularity", "gender", "known_for_department"
    });
    out["id"] = key_part_or_null(key, 0);
    out["also_known_as"] = list_or_empty(payload, "also_known_as");
    return out;
}

json company_details(const json& payload, const EntityKey& key) {
    json out = json::object();
    copy_fields(out, payload, {"name", "description", "origin_country", "headquarters"});
    out["id"] = key_part_or_null(key, 0);
    return out;
}

json network_details(const json& payload, const EntityKey& key) {
    json out = json::object();
    copy_fields(out, payload, {"headquarters", "name", "origin_country"});
    out["id"] = key_part_or_null(key, 0);
    return out;
}

// ============================================================================
// TV
// ============================================================================

json tv_series_details(const json& payload, const EntityKey& key) {
    json out = json::object();
    copy_fields(out, payload, {
        "name", "original_name", "original_language", "overview", "tagline",
        "type", "status", "in_production", "first_air_date", "last_air_date",
        "number_of_seasons", "number_of_episodes", "popularity",
        "vote_average", "vote_count"
    });
    out["id"] = key_part_or_null(key, 0);
    out["languages"] = list_or_empty(payload, "languages");
    out["episode_run_time"] = list_or_empty(payload, "episode_run_time");
    out["origin_country"] = list_or_empty(payload, "origin_country");

    out["genres"] = select_list(field_or_null(payload, "genres"), {"id", "name"}, {"id"});
    out["spoken_languages"] = select_list(field_or_null(payload, "spoken_languages"),
                                          {"english_name", "iso_639_1", "name"}, {"iso_639_1"});
    out["networks"] = select_list(field_or_null(payload, "networks"),
                                  {"id", "name", "origin_country"}, {"id"});
    out["production_companies"] = select_list(field_or_null(payload, "production_companies"),
                                              {"id", "name", "origin_country"}, {"id"});
    out["production_countries"] = select_list(field_or_null(payload, "production_countries"),
                                              {"iso_3166_1", "name"}, {"iso_3166_1"});
    out["created_by"] = select_list(field_or_null(payload, "created_by"),
                                    {"id", "name", "original_name", "gender", "credit_id"}, {"id"});

    // Seasons feed the season fetcher; both numbers must be integers
    json seasons_index = json::array();
    for (const auto& season : list_or_empty(payload, "seasons")) {
        if (!season.is_object()) continue;
        json number = field_or_null(season, "season_number");
        json id = field_or_null(season, "id");
        if (number.is_number_integer() && id.is_number_integer()) {
            seasons_index.push_back({{"season_number", number}, {"id", id}});
        }
    }
    out["seasons_index"] = std::move(seasons_index);
    return out;
}

json tv_season_details(const json& payload, const EntityKey& key) {
    json out = json::object();
    copy_fields(out, payload, {"name", "overview", "air_date", "vote_average"});
    out["season_id"] = field_or_null(payload, "id");
    out["series_id"] = key_part_or_null(key, 0);
    out["season_number"] = key_part_or_null(key, 1);

    json episodes = field_or_null(payload, "episodes");
    out["episode_count"] = episodes.is_array() ? json(episodes.size())
                                               : field_or_null(payload, "episode_count");
    return out;
}

json tv_episode_details(const json& payload, const EntityKey& key) {
    json out = json::object();
    copy_fields(out, payload, {
        "episode_type", "name", "overview", "air_date", "runtime",
        "production_code", "vote_average", "vote_count"
    });
    out["episode_id"] = field_or_null(payload, "id");
    out["series_id"] = key_part_or_null(key, 0);
    out["season_number"] = key_part_or_null(key, 1);
    out["episode_number"] = key_part_or_null(key, 2);
    out["crew"] = select_list(field_or_null(payload, "crew"),
                              {"job", "department", "credit_id", "id", "name", "original_name", "gender"},
                              {"id"});
    out["guest_stars"] = select_list(field_or_null(payload, "guest_stars"),
                                     {"character", "credit_id", "order", "id", "name", "original_name", "gender"},
                                     {"id"});
    return out;
}

json tv_series_reviews(const json& payload, const EntityKey& key) {
    return keyed_list(key, "reviews", select_list(field_or_null(payload, "results"),
                                                  {"id", "author", "content", "created_at", "url"}));
}

json tv_series_translations(const json& payload, const EntityKey& key) {
    return keyed_list(key, "translations", flatten_translations(payload, "name"));
}

json tv_series_alternative_titles(const json& payload, const EntityKey& key) {
    return keyed_list(key, "alternative_titles", select_list(field_or_null(payload, "results"),
                                                             {"iso_3166_1", "title"}));
}

json tv_series_content_ratings(const json& payload, const EntityKey& key) {
    return keyed_list(key, "content_ratings", select_list(field_or_null(payload, "results"),
                                                          {"iso_3166_1", "rating"}));
}

std::vector<json> series_watch_providers(const json& payload, const EntityKey& key) {
    return watch_provider_rows(payload, key, "id_series");
}

// ============================================================================
// Reference tables
// ============================================================================

std::vector<json> countries(const json& payload) {
    return string_rows(payload, {"iso_3166_1", "english_name", "native_name"});
}

std::vector<json> languages(const json& payload) {
    return string_rows(payload, {"iso_639_1", "english_name", "name"});
}

std::vector<json> certifications(const json& payload) {
    std::vector<json> rows;
    json by_country = field_or_null(payload, "certifications");
    if (!by_country.is_object()) return rows;

    for (const auto& country : by_country.items()) {
        if (!country.value().is_array()) continue;
        for (const auto& item : country.value()) {
            json certification = field_or_null(item, "certification");
            json meaning = field_or_null(item, "meaning");
            if (!certification.is_string() || !meaning.is_string()) continue;
            rows.push_back(json{
                {"country_code", country.key()},
                {"certification", certification},
                {"meaning", meaning}
            });
        }
    }
    return rows;
}

std::vector<json> genres(const json& payload, const EntityKey& key) {
    std::vector<json> rows;
    for (const auto& genre : list_or_empty(payload, "genres")) {
        json id = field_or_null(genre, "id");
        json name = field_or_null(genre, "name");
        if (!id.is_number_integer() || !name.is_string()) continue;
        rows.push_back(json{
            {"iso_639_1", key_part_or_null(key, 0)},
            {"id", id},
            {"name", name}
        });
    }
    return rows;
}

} // namespace projection
