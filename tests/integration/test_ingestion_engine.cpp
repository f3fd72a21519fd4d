/**
 * test_ingestion_engine.cpp - End-to-end runs against a scripted API
 */

#include "tmdbsync/EntityCatalog.h"
#include "tmdbsync/IngestionEngine.h"
#include "../FakeTransport.h"
#include "../TestFixtures.h"
#include <algorithm>
#include <filesystem>
#include <iostream>
#include <set>
#include <sstream>
#include <string>
#include <vector>

namespace fs = std::filesystem;

namespace {
    void log_info(const std::string& msg) {
        std::cout << "ℹ️  " << msg << std::endl;
    }

    void log_success(const std::string& msg) {
        std::cout << "✅ " << msg << std::endl;
    }

    void log_error(const std::string& msg) {
        std::cerr << "❌ " << msg << std::endl;
    }

    int fail(const std::string& msg) {
        log_error(msg);
        return 1;
    }

    std::vector<std::string> split_path(const std::string& path) {
        std::vector<std::string> parts;
        std::stringstream ss(path);
        std::string part;
        while (std::getline(ss, part, '/')) {
            if (!part.empty()) parts.push_back(part);
        }
        return parts;
    }

    // A tiny TMDB: one series with two seasons of 3 and 2 episodes
    HttpGetResponse fake_tmdb(const std::string& path) {
        auto p = split_path(path);
        if (p.size() == 2 && p[0] == "movie") {
            return FakeTransport::ok({{"id", std::stoll(p[1])}, {"title", "Movie " + p[1]},
                                      {"release_date", "2026-06-25"}, {"adult", false}});
        }
        if (p.size() == 2 && p[0] == "company") {
            return FakeTransport::ok({{"id", std::stoll(p[1])}, {"name", "Company " + p[1]},
                                      {"origin_country", "US"}});
        }
        if (p.size() == 4 && p[0] == "movie" && p[2] == "watch" && p[3] == "providers") {
            // 13 is not streamed anywhere
            if (p[1] == "13") return FakeTransport::ok({{"id", 13}, {"results", json::object()}});
            return FakeTransport::ok({{"id", std::stoll(p[1])}, {"results", {
                {"US", {{"flatrate", {{{"provider_id", 8}, {"provider_name", "Netflix"}}}},
                        {"rent", {{{"provider_id", 8}, {"provider_name", "Netflix"}}}}}},
                {"FR", {{"buy", {{{"provider_id", 2}, {"provider_name", "Apple TV"}}}}}}
            }}});
        }
        if (p.size() == 2 && p[0] == "tv") {
            return FakeTransport::ok({{"id", std::stoll(p[1])}, {"name", "Series"}, {"status", "Ended"},
                                      {"last_air_date", "2015-01-01"},
                                      {"seasons", {{{"season_number", 1}, {"id", 11}},
                                                   {{"season_number", 2}, {"id", 12}}}}});
        }
        if (p.size() == 4 && p[0] == "tv" && p[2] == "season") {
            const bool first = p[3] == "1";
            json episodes = json::array();
            for (int i = 1; i <= (first ? 3 : 2); ++i) episodes.push_back({{"id", i}});
            return FakeTransport::ok({{"id", first ? 11 : 12}, {"season_number", std::stoi(p[3])},
                                      {"air_date", first ? "2026-06-01" : "2012-01-01"},
                                      {"episodes", episodes}});
        }
        if (p.size() == 6 && p[4] == "episode") {
            return FakeTransport::ok({{"id", 1000 + std::stoi(p[5])}, {"name", "Episode " + p[5]}});
        }
        if (path == "/configuration/countries") {
            return FakeTransport::ok(json::array({
                {{"iso_3166_1", "FR"}, {"english_name", "France"}, {"native_name", "France"}},
                {{"iso_3166_1", "DE"}, {"english_name", "Germany"}, {"native_name", "Deutschland"}},
                {{"iso_3166_1", "FR"}, {"english_name", "France"}, {"native_name", "France"}},
                {{"iso_3166_1", ""}, {"english_name", "Nowhere"}, {"native_name", "Nowhere"}}
            }));
        }
        if (path == "/genre/movie/list") {
            return FakeTransport::ok({{"genres", {{{"id", 18}, {"name", "Drama"}},
                                                  {{"id", 35}, {"name", "Comedy"}}}}});
        }
        if (path == "/certification/movie/list") {
            return FakeTransport::ok({{"certifications", {
                {"US", {{{"certification", "R"}, {"meaning", "Restricted"}, {"order", 5}},
                        {{"certification", "PG"}, {"meaning", "Parental guidance"}, {"order", 2}}}},
                {"FR", {{{"certification", "U"}, {"meaning", "Tous publics"}, {"order", 1}}}}
            }}});
        }
        return FakeTransport::status(404);
    }

    struct Env {
        ScratchDir dir;
        EngineConfig config;
        std::shared_ptr<FakeTransport> transport = std::make_shared<FakeTransport>();
        EntityCatalog catalog = EntityCatalog::builtin();
        std::unique_ptr<IngestionEngine> engine;

        explicit Env(const std::string& name) : dir(name) {
            config.api_host = "http://fake.test/3";
            config.data_dir = dir.file("data");
            config.logs_dir = dir.file("logs");
            config.target_rps = 1000;
            config.max_workers = 4;
            config.in_flight_multiplier = 2;
            config.progress_enabled = false;
            fs::create_directories(config.data_dir);

            transport->set_fallback(fake_tmdb);
            engine = std::make_unique<IngestionEngine>(config, transport, "token");
            engine->set_today(*CivilDate::parse("2026-06-30"));
            engine->set_sleeper([](std::chrono::milliseconds) {});
        }

        std::string data(const std::string& file) const { return config.data_dir + "/" + file; }
        const EntityDescriptor& entity(const std::string& name) const { return *catalog.find(name); }
    };

    // Every line parses and no two lines share a key
    bool keys_unique(const std::string& path, const std::vector<std::string>& fields, size_t& lines) {
        EntityKeySet keys;
        lines = 0;
        for (const auto& record : read_records(path)) {
            auto key = EntityKey::from_record(record, fields);
            if (!key || !keys.insert(*key).second) return false;
            lines++;
        }
        return true;
    }

    bool conserved(const RunReport& r, const std::string& store, const std::vector<std::string>& fields) {
        size_t lines = 0;
        return keys_unique(store, fields, lines) && lines == r.total &&
               r.retained + r.added + r.updated == r.total;
    }
}

int main() {
    log_info("=== IngestionEngine Integration Tests ===\n");

    // Scenario A: old record kept, new key added
    {
        log_info("Scenario A: store {100}, candidates [100, 101]");
        Env env("engine_a");
        write_records(env.data("movie_dumps.json"), {{{"id", 100}}, {{"id", 101}}});
        write_records(env.data("movie_details.ndjson"), {{{"id", 100}, {"title", "Old"}, {"release_date", "1999-01-01"}}});

        RunReport r = env.engine->run(env.entity("movie_details"));
        if (r.added != 1 || r.updated != 0 || r.total != 2 || r.retained != 1) {
            return fail("Scenario A failed: " + r.to_json().dump());
        }
        if (env.transport->calls("/movie/100") != 0 || env.transport->calls("/movie/101") != 1) {
            return fail("Scenario A failed: wrong keys fetched");
        }
        if (!conserved(r, env.data("movie_details.ndjson"), {"id"})) return fail("Scenario A failed: conservation");

        auto log = read_lines(env.config.logs_dir + "/movie_details.log");
        if (log.size() != 1 || log[0] != "30/06/2026 : added 1 movie details / updated 0 movie details / errors 0 / total : 2") {
            return fail("Scenario A failed: run log");
        }
        log_success("Scenario A passed: " + log[0]);
    }

    // Scenario B: refresh target answering 404 is dropped
    {
        log_info("\nScenario B: store {100 in window}, fetch -> 404");
        Env env("engine_b");
        write_records(env.data("movie_dumps.json"), {{{"id", 100}}, {{"id", 200}}});
        write_records(env.data("movie_details.ndjson"), {
            {{"id", 100}, {"release_date", "2026-06-20"}},
            {{"id", 200}, {"release_date", "2001-01-01"}}
        });
        env.transport->script("/movie/100", {FakeTransport::status(404)});

        RunReport r = env.engine->run(env.entity("movie_details"));
        auto records = read_records(env.data("movie_details.ndjson"));
        if (r.total != 1 || r.errors["not_found"] != 1 || records.size() != 1 || records[0]["id"] != 200) {
            return fail("Scenario B failed: " + r.to_json().dump());
        }
        auto log = read_lines(env.config.logs_dir + "/movie_details.log");
        if (log.back().find("errors 1 / not_found=1 / total : 1") == std::string::npos) {
            return fail("Scenario B failed: run log " + log.back());
        }
        log_success("Scenario B passed: 100 dropped, not_found=1");
    }

    // Scenario C: full rebuild is stable; a failed rebuild keeps the store
    {
        log_info("\nScenario C: ref_countries rebuilt twice");
        Env env("engine_c");
        RunReport first = env.engine->run(env.entity("ref_countries"));
        auto lines1 = read_lines(env.data("ref_countries.ndjson"));
        RunReport second = env.engine->run(env.entity("ref_countries"));
        auto lines2 = read_lines(env.data("ref_countries.ndjson"));

        std::sort(lines1.begin(), lines1.end());
        std::sort(lines2.begin(), lines2.end());
        if (lines1 != lines2 || lines1.size() != 2 || first.added != 2 || second.total != 2) {
            return fail("Scenario C failed: rebuilds differ");
        }
        if (first.errors["duplicate_row"] != 1 || first.errors["unkeyed_row"] != 1) {
            return fail("Scenario C failed: skipped rows not counted " + first.to_json().dump());
        }
        auto rebuild_log = read_lines(env.config.logs_dir + "/ref_countries.log");
        if (rebuild_log.empty() ||
            rebuild_log[0].find("errors 2 / duplicate_row=1 ; unkeyed_row=1 / total : 2") == std::string::npos) {
            return fail("Scenario C failed: run log");
        }

        env.transport->script("/configuration/countries", {FakeTransport::status(500)});
        RunReport failed = env.engine->run(env.entity("ref_countries"));
        auto lines3 = read_lines(env.data("ref_countries.ndjson"));
        std::sort(lines3.begin(), lines3.end());
        if (failed.store_written || lines3 != lines1 || failed.errors["http_500"] != 1 || failed.total != 2) {
            return fail("Scenario C failed: failed rebuild replaced the store");
        }
        log_success("Scenario C passed: identical rebuilds, failure kept 2 rows");
    }

    // Series -> seasons -> episodes, then an incremental re-run
    {
        log_info("\nTV chain: series, seasons, episodes");
        Env env("engine_tv");
        write_records(env.data("tv_series_dumps.json"), {{{"id", 1396}}});

        RunReport series = env.engine->run(env.entity("tv_series_details"));
        RunReport seasons = env.engine->run(env.entity("tv_seasons_details"));
        RunReport episodes = env.engine->run(env.entity("tv_episodes_details"));

        if (series.added != 1 || seasons.added != 2 || episodes.added != 5) {
            return fail("TV chain failed: added " + std::to_string(series.added) + "/" +
                        std::to_string(seasons.added) + "/" + std::to_string(episodes.added));
        }
        if (!conserved(episodes, env.data("tv_episodes_details.ndjson"),
                       {"series_id", "season_number", "episode_number"})) {
            return fail("TV chain failed: episode store");
        }

        // Season 1 aired 29 days ago: its 3 episodes are due, season 2's are not
        RunReport again = env.engine->run(env.entity("tv_episodes_details"));
        if (again.added != 0 || again.updated != 3 || again.retained != 2 || again.total != 5) {
            return fail("TV chain failed: re-run " + again.to_json().dump());
        }
        if (env.transport->calls("/tv/1396/season/1/episode/1") != 2 ||
            env.transport->calls("/tv/1396/season/2/episode/1") != 1) {
            return fail("TV chain failed: refresh selection");
        }
        if (!conserved(again, env.data("tv_episodes_details.ndjson"),
                       {"series_id", "season_number", "episode_number"})) {
            return fail("TV chain failed: conservation after re-run");
        }

        // Returning Series would always refresh; Ended with an old date never does
        RunReport series_again = env.engine->run(env.entity("tv_series_details"));
        if (series_again.targets != 0 || series_again.total != 1) return fail("TV chain failed: series re-run");
        log_success("TV chain passed: 1 series, 2 seasons, 5 episodes, 3 refreshed");
    }

    // AuthFailure leaves the store pristine
    {
        log_info("\nAuthFailure mid-run");
        Env env("engine_auth");
        std::vector<json> listing;
        for (int i = 1; i <= 50; ++i) listing.push_back({{"id", i}});
        write_records(env.data("people_dumps.json"), listing);
        write_text(env.data("people_details.ndjson"), "{\"id\":1,\"name\":\"Kept\"}\n");
        env.transport->set_fallback([](const std::string&) { return FakeTransport::status(401); });

        bool threw = false;
        try {
            env.engine->run(env.entity("people_details"));
        } catch (const AuthFailure&) {
            threw = true;
        }
        if (!threw) return fail("AuthFailure test failed: not propagated");
        if (read_lines(env.data("people_details.ndjson")) != std::vector<std::string>{"{\"id\":1,\"name\":\"Kept\"}"} ||
            fs::exists(env.data("people_details.ndjson.tmp"))) {
            return fail("AuthFailure test failed: store modified");
        }
        if (env.transport->total_calls() > static_cast<size_t>(env.config.max_in_flight())) {
            return fail("AuthFailure test failed: kept admitting after 401");
        }
        log_success("AuthFailure passed: " + std::to_string(env.transport->total_calls()) + " calls before abort");
    }

    // Missing listing and empty work
    {
        log_info("\nMissing listing and nothing to do");
        Env env("engine_edges");
        bool threw = false;
        try {
            env.engine->run(env.entity("company_details"));
        } catch (const std::runtime_error&) {
            threw = true;
        }
        if (!threw || fs::exists(env.data("company_details.ndjson"))) {
            return fail("Edge test failed: missing listing");
        }

        write_records(env.data("production_companies_dumps.json"), {{{"id", 1}}});
        write_records(env.data("company_details.ndjson"), {{{"id", 1}, {"name", "Lucasfilm"}}});
        RunReport r = env.engine->run(env.entity("company_details"));
        if (r.targets != 0 || r.store_written || r.total != 1 || env.transport->total_calls() != 0) {
            return fail("Edge test failed: no-op run");
        }
        if (read_lines(env.config.logs_dir + "/company_details.log").size() != 1) {
            return fail("Edge test failed: no-op run not logged");
        }
        log_success("Edge tests passed");
    }

    // Duplicate store lines are reported and the total matches the store
    {
        log_info("\nDuplicate keys in an existing store");
        Env env("engine_duplicates");
        write_records(env.data("production_companies_dumps.json"), {{{"id", 1}}, {{"id", 2}}});
        write_records(env.data("company_details.ndjson"), {{{"id", 1}, {"name", "A"}}, {{"id", 1}, {"name", "B"}}});

        RunReport r = env.engine->run(env.entity("company_details"));
        if (r.added != 1 || r.retained != 1 || r.total != 2 || r.errors["duplicate_local_record"] != 1) {
            return fail("Duplicate test failed: " + r.to_json().dump());
        }
        if (!conserved(r, env.data("company_details.ndjson"), {"id"})) return fail("Duplicate test failed: conservation");
        auto records = read_records(env.data("company_details.ndjson"));
        if (records[0]["name"] != "A") return fail("Duplicate test failed: first occurrence not kept");
        auto log = read_lines(env.config.logs_dir + "/company_details.log");
        if (log.back().find("errors 1 / duplicate_local_record=1 / total : 2") == std::string::npos) {
            return fail("Duplicate test failed: run log " + log.back());
        }

        // Nothing to fetch: the untouched store still has both copies
        Env idle("engine_duplicates_idle");
        write_records(idle.data("production_companies_dumps.json"), {{{"id", 1}}});
        write_records(idle.data("company_details.ndjson"), {{{"id", 1}, {"name", "A"}}, {{"id", 1}, {"name", "B"}}});
        RunReport none = idle.engine->run(idle.entity("company_details"));
        if (none.targets != 0 || none.total != 2 || none.retained != 2 || none.errors["duplicate_local_record"] != 1 ||
            read_lines(idle.data("company_details.ndjson")).size() != 2) {
            return fail("Duplicate test failed: no-op total " + none.to_json().dump());
        }
        log_success("Duplicate test passed: duplicate_local_record=1 logged");
    }

    // Several store lines per movie; a fetched key never refreshes
    {
        log_info("\nWatch providers: rows per country");
        Env env("engine_providers");
        write_records(env.data("movie_dumps.json"), {{{"id", 550}}, {{"id", 13}}});

        RunReport first = env.engine->run(env.entity("watch_providers_movies"));
        auto rows = read_records(env.data("watch_providers_movies.ndjson"));
        if (first.added != 1 || first.total != 2 || rows.size() != 2) {
            return fail("Watch providers failed: " + first.to_json().dump());
        }
        std::set<std::string> countries;
        for (const auto& row : rows) {
            if (row["id_movie"] != 550) return fail("Watch providers failed: id_movie");
            countries.insert(row["country_code"].get<std::string>());
        }
        if (countries != std::set<std::string>{"FR", "US"}) return fail("Watch providers failed: countries");

        // 550 is stored; 13 had no rows and is asked for again
        RunReport second = env.engine->run(env.entity("watch_providers_movies"));
        if (second.targets != 1 || second.retained != 2 || second.total != 2 ||
            env.transport->calls("/movie/550/watch/providers") != 1 ||
            env.transport->calls("/movie/13/watch/providers") != 2) {
            return fail("Watch providers failed: re-run " + second.to_json().dump());
        }
        log_success("Watch providers passed: 2 rows for 550, kept on re-run");
    }

    // Genres per stored language and certifications by country
    {
        log_info("\nGenres and certifications");
        Env env("engine_genres");
        write_records(env.data("ref_languages.ndjson"), {
            {{"iso_639_1", "en"}, {"english_name", "English"}, {"name", "English"}},
            {{"iso_639_1", "fr"}, {"english_name", "French"}, {"name", "Français"}}
        });

        RunReport genres = env.engine->run(env.entity("ref_genre_movies"));
        if (genres.added != 2 || genres.total != 4 || read_records(env.data("ref_genre_movies.ndjson")).size() != 4) {
            return fail("Genres failed: " + genres.to_json().dump());
        }
        std::set<std::string> urls;
        for (const auto& request : env.transport->requests()) urls.insert(request.url);
        if (urls != std::set<std::string>{"http://fake.test/3/genre/movie/list?language=en",
                                          "http://fake.test/3/genre/movie/list?language=fr"}) {
            return fail("Genres failed: language query");
        }

        // Every language is fetched again and its rows replaced
        RunReport again = env.engine->run(env.entity("ref_genre_movies"));
        if (again.updated != 2 || again.added != 0 || again.total != 4 || env.transport->total_calls() != 4) {
            return fail("Genres failed: re-run " + again.to_json().dump());
        }

        RunReport certs = env.engine->run(env.entity("certification_movies"));
        auto rows = read_records(env.data("certification_movies.ndjson"));
        if (certs.added != 3 || certs.error_total() != 0 || rows.size() != 3) {
            return fail("Certifications failed: " + certs.to_json().dump());
        }
        for (const auto& row : rows) {
            if (row.size() != 3 || row.contains("order")) return fail("Certifications failed: row shape " + row.dump());
        }
        log_success("Genres and certifications passed");
    }

    log_info("\n=== All IngestionEngine integration tests completed successfully ===");
    return 0;
}
