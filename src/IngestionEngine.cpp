/**
 * IngestionEngine.cpp - Implementation
 */

#include "tmdbsync/IngestionEngine.h"
#include "tmdbsync/ConcurrentFetchScheduler.h"
#include "tmdbsync/ExistingStateScanner.h"
#include "tmdbsync/TargetSetBuilder.h"
#include <iostream>

namespace {
    void log_info(const std::string& msg) {
        std::cout << "ℹ️  " << msg << std::endl;
    }

    void log_warn(const std::string& msg) {
        std::cerr << "⚠️  " << msg << std::endl;
    }

    void log_error(const std::string& msg) {
        std::cerr << "❌ " << msg << std::endl;
    }

    void log_success(const std::string& msg) {
        std::cout << "✅ " << msg << std::endl;
    }
}

IngestionEngine::IngestionEngine(const EngineConfig& config,
                                 std::shared_ptr<HttpTransport> transport,
                                 std::string bearer_token)
    : config_(config),
      transport_(std::move(transport)),
      limiter_(std::make_shared<RateLimiter>(config.target_rps)),
      bearer_token_(std::move(bearer_token)) {
    config_.validate();
}

std::string IngestionEngine::store_path(const EntityDescriptor& descriptor) const {
    return resolve_data_path(config_.data_dir, descriptor.store_file);
}

std::unique_ptr<RequestExecutor> IngestionEngine::make_executor(std::shared_ptr<ErrorCounter> errors) const {
    auto executor = std::make_unique<RequestExecutor>(transport_, limiter_, std::move(errors), config_, bearer_token_);
    if (sleeper_) {
        executor->set_sleeper(sleeper_);
    }
    return executor;
}

RunReport IngestionEngine::run(const EntityDescriptor& descriptor) {
    descriptor.validate();

    RunReport report;
    report.entity = descriptor.name;
    report.date = today_ ? *today_ : CivilDate::today_utc();

    if (logging_enabled_) {
        log_info("[" + descriptor.name + "] starting (" +
                 (descriptor.full_rebuild ? std::string("full rebuild") : descriptor.policy->describe()) + ")");
    }

    report = descriptor.full_rebuild ? run_full_rebuild(descriptor, std::move(report))
                                     : run_incremental(descriptor, std::move(report));
    finish_report(descriptor, report);
    return report;
}

// ============================================================================
// Incremental
// ============================================================================

RunReport IngestionEngine::run_incremental(const EntityDescriptor& descriptor, RunReport report) {
    const std::string path = store_path(descriptor);
    auto errors = std::make_shared<ErrorCounter>();

    CandidateList candidates = descriptor.candidates->load(config_.data_dir);
    if (candidates.candidates.empty()) {
        log_warn("[" + descriptor.name + "] no candidates from " + descriptor.candidates->describe());
    }

    ExistingStateScanner scanner(descriptor.key_fields, descriptor.policy, report.date, descriptor.cardinality());
    ExistingState existing = scanner.scan(path);
    // The writer drops exactly these lines on the next rewrite
    if (existing.malformed_lines > 0) {
        errors->inc(error_category::MALFORMED_LOCAL_RECORD, existing.malformed_lines);
    }
    if (existing.duplicate_lines > 0) {
        errors->inc(error_category::DUPLICATE_LOCAL_RECORD, existing.duplicate_lines);
    }

    TargetSetBuilder builder(descriptor.policy, report.date);
    TargetSet targets = builder.build(candidates, existing);
    report.targets = targets.size();

    if (logging_enabled_) {
        log_info("[" + descriptor.name + "] " + std::to_string(candidates.candidates.size()) + " candidates, " +
                 std::to_string(existing.keys.size()) + " stored, " +
                 std::to_string(targets.will_add) + " to add, " +
                 std::to_string(targets.will_update) + " to refresh");
    }

    if (targets.empty()) {
        // Store left as-is, duplicates included
        report.retained = existing.valid_lines;
        report.total = report.retained;
        report.errors = errors->get_all();
        return report;
    }

    ProgressReporter progress(descriptor.name, config_.progress_enabled);
    progress.set_total(targets.size());
    progress.set_estimates(targets.will_add, targets.will_update);

    AtomicMergeWriter writer(path, descriptor.key_fields, descriptor.cardinality());
    writer.open(targets.keys);

    auto executor = make_executor(errors);
    ConcurrentFetchScheduler scheduler(static_cast<size_t>(config_.max_workers),
                                       static_cast<size_t>(config_.max_in_flight()));

    try {
        scheduler.run(
            targets.targets,
            [&](const Target& target) {
                return executor->fetch(descriptor.endpoint(target.key), descriptor.query_for(target.key));
            },
            [&](const Target& target, const FetchResult& result) {
                progress.record_processed();
                if (result.ok() && write_fetched(descriptor, writer, *result.payload, target.key)) {
                    progress.record_success(target.is_update);
                    if (target.is_update) {
                        report.updated++;
                    } else {
                        report.added++;
                    }
                }
                progress.set_errors(errors->total());
                progress.render(false);
            });
    } catch (...) {
        progress.finish();
        throw;
    }
    progress.finish();

    writer.commit();
    report.store_written = true;
    report.retained = writer.retained();
    report.total = writer.total();
    report.errors = errors->get_all();
    return report;
}

// ============================================================================
// Full rebuild
// ============================================================================

RunReport IngestionEngine::run_full_rebuild(const EntityDescriptor& descriptor, RunReport report) {
    const std::string path = store_path(descriptor);
    auto errors = std::make_shared<ErrorCounter>();
    auto executor = make_executor(errors);
    report.targets = 1;

    FetchResult result = executor->fetch(descriptor.rebuild_endpoint, descriptor.query);
    if (!result.ok()) {
        log_error("[" + descriptor.name + "] " + descriptor.rebuild_endpoint + " failed (" +
                  result.error_category + "), keeping the previous store");
        ExistingStateScanner scanner(descriptor.key_fields, nullptr, report.date);
        report.retained = scanner.scan(path).valid_lines;
        report.total = report.retained;
        report.errors = errors->get_all();
        return report;
    }

    AtomicMergeWriter writer(path, descriptor.key_fields);
    writer.open_fresh();

    EntityKeySet seen;
    uint64_t unkeyed_rows = 0;
    uint64_t duplicate_rows = 0;
    for (const auto& row : descriptor.project_rows(*result.payload)) {
        auto key = EntityKey::from_record(row, descriptor.key_fields);
        if (!key) {
            unkeyed_rows++;
            continue;
        }
        if (!seen.insert(*key).second) {
            duplicate_rows++;
            continue;
        }
        writer.append(row);
    }
    if (unkeyed_rows > 0) {
        errors->inc(error_category::UNKEYED_ROW, unkeyed_rows);
    }
    if (duplicate_rows > 0) {
        errors->inc(error_category::DUPLICATE_ROW, duplicate_rows);
        log_warn("[" + descriptor.name + "] skipped " + std::to_string(duplicate_rows) + " duplicate rows");
    }

    writer.commit();
    report.store_written = true;
    report.added = writer.appended();
    report.total = writer.total();
    report.errors = errors->get_all();
    return report;
}

bool IngestionEngine::write_fetched(const EntityDescriptor& descriptor,
                                    AtomicMergeWriter& writer,
                                    const json& payload,
                                    const EntityKey& key) {
    if (descriptor.cardinality() == KeyCardinality::ONE_LINE) {
        writer.append(descriptor.project(payload, key));
        return true;
    }

    // A key with no rows leaves nothing in the store and is fetched again
    // as new on the next run
    std::vector<json> rows = descriptor.project_key_rows(payload, key);
    for (const auto& row : rows) {
        writer.append(row);
    }
    return !rows.empty();
}

void IngestionEngine::finish_report(const EntityDescriptor& descriptor, const RunReport& report) const {
    const std::string label = descriptor.log_label.empty() ? descriptor.name : descriptor.log_label;
    append_run_log(config_.logs_dir, descriptor.name, format_run_log_line(report, label));

    if (logging_enabled_) {
        log_success("[" + descriptor.name + "] added " + std::to_string(report.added) +
                    ", updated " + std::to_string(report.updated) +
                    ", retained " + std::to_string(report.retained) +
                    ", errors " + std::to_string(report.error_total()) +
                    ", total " + std::to_string(report.total));
    }
}
