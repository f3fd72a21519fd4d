/**
 * EntityCatalog.cpp - Built-in entity descriptors
 */

#include "tmdbsync/EntityCatalog.h"
#include "tmdbsync/EngineConfig.h"
#include <algorithm>
#include <memory>
#include <set>
#include <variant>

namespace {
    // Daily ID exports and the upstream stores they feed
    constexpr const char* MOVIE_LISTING = "movie_dumps.json";
    constexpr const char* PEOPLE_LISTING = "people_dumps.json";
    constexpr const char* COMPANY_LISTING = "production_companies_dumps.json";
    constexpr const char* SERIES_LISTING = "tv_series_dumps.json";
    constexpr const char* NETWORK_LISTING = "tv_networks_dumps.json";
    constexpr const char* LANGUAGE_STORE = "ref_languages.ndjson";

    constexpr int MOVIE_REFRESH_DAYS = 30;
    constexpr int SEASON_REFRESH_DAYS = 60;
    constexpr int EPISODE_REFRESH_DAYS = 60;

    std::string part_str(const EntityKey& key, size_t index) {
        const KeyPart& part = key.parts.at(index);
        if (const auto* number = std::get_if<int64_t>(&part)) {
            return std::to_string(*number);
        }
        return std::get<std::string>(part);
    }

    std::string store_file_for(const std::string& entity) {
        return entity + ".ndjson";
    }

    EntityDescriptor by_id(const std::string& name,
                           const std::string& label,
                           const std::string& listing,
                           const std::string& endpoint_prefix,
                           const std::string& endpoint_suffix,
                           std::shared_ptr<const RefreshPolicy> policy,
                           RecordProjector project) {
        EntityDescriptor d;
        d.name = name;
        d.log_label = label;
        d.store_file = store_file_for(name);
        d.key_fields = {"id"};
        d.candidates = std::make_shared<ListingSource>(listing, std::vector<std::string>{"id"});
        d.policy = std::move(policy);
        d.endpoint = [endpoint_prefix, endpoint_suffix](const EntityKey& key) {
            return endpoint_prefix + part_str(key, 0) + endpoint_suffix;
        };
        d.project = std::move(project);
        return d;
    }

    // Several store lines per listed id, keyed by `store_key_field`
    EntityDescriptor rows_by_id(const std::string& name,
                                const std::string& label,
                                const std::string& listing,
                                const std::string& endpoint_prefix,
                                const std::string& endpoint_suffix,
                                const std::string& store_key_field,
                                KeyedRowsProjector rows) {
        EntityDescriptor d;
        d.name = name;
        d.log_label = label;
        d.store_file = store_file_for(name);
        d.key_fields = {store_key_field};
        d.candidates = std::make_shared<ListingSource>(listing, std::vector<std::string>{"id"});
        d.policy = std::make_shared<NeverRefreshPolicy>();
        d.endpoint = [endpoint_prefix, endpoint_suffix](const EntityKey& key) {
            return endpoint_prefix + part_str(key, 0) + endpoint_suffix;
        };
        d.project_key_rows = std::move(rows);
        return d;
    }

    // One call per stored language, rebuilt on every run
    EntityDescriptor by_language(const std::string& name,
                                 const std::string& endpoint,
                                 KeyedRowsProjector rows) {
        EntityDescriptor d;
        d.name = name;
        d.log_label = name;
        d.store_file = store_file_for(name);
        d.key_fields = {"iso_639_1"};
        d.candidates = std::make_shared<ListingSource>(LANGUAGE_STORE, std::vector<std::string>{"iso_639_1"});
        d.policy = std::make_shared<AlwaysRefreshPolicy>();
        d.endpoint = [endpoint](const EntityKey&) { return endpoint; };
        d.key_query = [](const EntityKey& key) {
            return QueryParams{{"language", part_str(key, 0)}};
        };
        d.project_key_rows = std::move(rows);
        return d;
    }

    EntityDescriptor reference_table(const std::string& name,
                                     const std::string& label,
                                     const std::string& endpoint,
                                     std::vector<std::string> key_fields,
                                     RowsProjector rows) {
        EntityDescriptor d;
        d.name = name;
        d.log_label = label;
        d.store_file = store_file_for(name);
        d.key_fields = std::move(key_fields);
        d.full_rebuild = true;
        d.rebuild_endpoint = endpoint;
        d.project_rows = std::move(rows);
        return d;
    }
}

EntityCatalog EntityCatalog::builtin() {
    EntityCatalog catalog;
    auto never = std::make_shared<NeverRefreshPolicy>();

    catalog.add(reference_table("ref_languages", "languages", "/configuration/languages",
                                {"iso_639_1"}, projection::languages));
    catalog.add(reference_table("ref_countries", "countries", "/configuration/countries",
                                {"iso_3166_1"}, projection::countries));
    catalog.add(by_language("ref_genre_movies", "/genre/movie/list", projection::genres));
    catalog.add(by_language("ref_genre_series", "/genre/tv/list", projection::genres));

    catalog.add(reference_table("certification_movies", "certification_movies", "/certification/movie/list",
                                {"country_code", "certification"}, projection::certifications));
    catalog.add(reference_table("certification_series", "certification_series", "/certification/tv/list",
                                {"country_code", "certification"}, projection::certifications));

    catalog.add(by_id("movie_details", "movie details", MOVIE_LISTING, "/movie/", "",
                      std::make_shared<TimeWindowPolicy>(MOVIE_REFRESH_DAYS, "release_date"),
                      projection::movie_details));
    // Sub-resource records carry no release date, so they are fetched once
    catalog.add(by_id("movie_reviews", "movie reviews", MOVIE_LISTING, "/movie/", "/reviews",
                      never, projection::movie_reviews));
    catalog.add(by_id("movie_credits", "movie credits", MOVIE_LISTING, "/movie/", "/credits",
                      never, projection::movie_credits));
    catalog.add(by_id("movie_keywords", "movie keywords", MOVIE_LISTING, "/movie/", "/keywords",
                      never, projection::movie_keywords));
    catalog.add(by_id("movie_external_ids", "movie external ids", MOVIE_LISTING, "/movie/", "/external_ids",
                      never, projection::external_ids));
    catalog.add(by_id("movie_alternative_titles", "movie alternative titles", MOVIE_LISTING,
                      "/movie/", "/alternative_titles", never, projection::movie_alternative_titles));
    catalog.add(by_id("movie_release_dates", "movie release dates", MOVIE_LISTING, "/movie/", "/release_dates",
                      never, projection::movie_release_dates));
    catalog.add(by_id("movie_translations", "movie translations", MOVIE_LISTING, "/movie/", "/translations",
                      never, projection::movie_translations));
    catalog.add(rows_by_id("watch_providers_movies", "watch_providers_movies", MOVIE_LISTING,
                           "/movie/", "/watch/providers", "id_movie", projection::movie_watch_providers));

    catalog.add(by_id("people_details", "people details", PEOPLE_LISTING, "/person/", "",
                      never, projection::person_details));
    catalog.add(by_id("company_details", "company details", COMPANY_LISTING, "/company/", "",
                      never, projection::company_details));
    catalog.add(by_id("tv_networks_details", "tv_networks_details", NETWORK_LISTING, "/network/", "",
                      never, projection::network_details));

    using Rule = StatusWindowPolicy::Rule;
    catalog.add(by_id("tv_series_details", "series details", SERIES_LISTING, "/tv/", "",
                      std::make_shared<StatusWindowPolicy>(
                          "status", "last_air_date",
                          std::map<std::string, Rule>{
                              {"Returning Series", Rule::Always()},
                              {"In Production", Rule::Window(30)},
                              {"Pilot", Rule::Window(90)},
                              {"Planned", Rule::Window(90)},
                              {"Canceled", Rule::Window(365)},
                              {"Ended", Rule::Window(180)}
                          },
                          60),
                      projection::tv_series_details));
    catalog.add(by_id("tv_series_reviews", "tv series reviews", SERIES_LISTING, "/tv/", "/reviews",
                      never, projection::tv_series_reviews));
    catalog.add(by_id("tv_series_translations", "tv series translations", SERIES_LISTING, "/tv/", "/translations",
                      never, projection::tv_series_translations));
    catalog.add(by_id("tv_series_external_ids", "tv series external ids", SERIES_LISTING, "/tv/", "/external_ids",
                      never, projection::external_ids));
    catalog.add(by_id("tv_series_alternative_titles", "tv series alternative titles", SERIES_LISTING,
                      "/tv/", "/alternative_titles", never, projection::tv_series_alternative_titles));
    catalog.add(by_id("tv_series_content_ratings", "tv series content ratings", SERIES_LISTING,
                      "/tv/", "/content_ratings", never, projection::tv_series_content_ratings));
    catalog.add(rows_by_id("watch_providers_series", "watch_providers_series", SERIES_LISTING,
                           "/tv/", "/watch/providers", "id_series", projection::series_watch_providers));

    EntityDescriptor seasons;
    seasons.name = "tv_seasons_details";
    seasons.log_label = "seasons";
    seasons.store_file = store_file_for(seasons.name);
    seasons.key_fields = {"series_id", "season_number"};
    seasons.candidates = std::make_shared<NestedListingSource>(
        store_file_for("tv_series_details"), "id", "seasons_index", "season_number");
    seasons.policy = std::make_shared<TimeWindowPolicy>(SEASON_REFRESH_DAYS, "air_date");
    seasons.endpoint = [](const EntityKey& key) {
        return "/tv/" + part_str(key, 0) + "/season/" + part_str(key, 1);
    };
    seasons.project = projection::tv_season_details;
    catalog.add(std::move(seasons));

    EntityDescriptor episodes;
    episodes.name = "tv_episodes_details";
    episodes.log_label = "episodes";
    episodes.store_file = store_file_for(episodes.name);
    episodes.key_fields = {"series_id", "season_number", "episode_number"};
    episodes.candidates = std::make_shared<SequenceSource>(
        store_file_for("tv_seasons_details"),
        std::vector<std::string>{"series_id", "season_number"},
        "episode_count",
        std::vector<std::string>{"air_date"});
    episodes.policy = std::make_shared<ParentDerivedPolicy>(EPISODE_REFRESH_DAYS, "air_date");
    episodes.endpoint = [](const EntityKey& key) {
        return "/tv/" + part_str(key, 0) + "/season/" + part_str(key, 1) + "/episode/" + part_str(key, 2);
    };
    episodes.project = projection::tv_episode_details;
    catalog.add(std::move(episodes));

    return catalog;
}

void EntityCatalog::add(EntityDescriptor descriptor) {
    descriptor.validate();
    if (find(descriptor.name)) {
        throw ConfigError("duplicate entity '" + descriptor.name + "'");
    }
    entities_.push_back(std::move(descriptor));
}

const EntityDescriptor* EntityCatalog::find(const std::string& name) const {
    auto it = std::find_if(entities_.begin(), entities_.end(),
                           [&](const EntityDescriptor& d) { return d.name == name; });
    return it == entities_.end() ? nullptr : &*it;
}

std::vector<std::string> EntityCatalog::names() const {
    std::vector<std::string> out;
    out.reserve(entities_.size());
    for (const auto& d : entities_) {
        out.push_back(d.name);
    }
    return out;
}

std::vector<const EntityDescriptor*> EntityCatalog::select(const std::vector<std::string>& requested) const {
    std::set<std::string> wanted;
    for (const auto& name : requested) {
        if (!find(name)) {
            throw ConfigError("unknown entity '" + name + "'");
        }
        wanted.insert(name);
    }

    std::vector<const EntityDescriptor*> out;
    for (const auto& d : entities_) {
        if (wanted.count(d.name)) out.push_back(&d);
    }
    return out;
}
