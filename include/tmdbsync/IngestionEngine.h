/**
 * IngestionEngine.h - Runs one entity end-to-end
 *
 * Incremental: candidates -> existing-state scan -> target set -> sliding
 * window of fetches -> projection -> merge writer -> commit -> run log.
 * Full rebuild: one call -> rows -> fresh store -> commit -> run log.
 *
 * Store lines dropped on a rewrite (malformed, repeated keys) and rebuild
 * rows that cannot be stored are counted in the run's errors.
 * For per-key row entities `added`/`updated` count keys while `retained`
 * and `total` count lines.
 *
 * AuthFailure propagates out of run() after in-flight calls have drained;
 * the store is left exactly as it was.
 */

#pragma once

#include <memory>
#include <optional>
#include <string>
#include "tmdbsync/AtomicMergeWriter.h"
#include "tmdbsync/CivilDate.h"
#include "tmdbsync/EngineConfig.h"
#include "tmdbsync/EntityDescriptor.h"
#include "tmdbsync/HttpTransport.h"
#include "tmdbsync/RateLimiter.h"
#include "tmdbsync/RequestExecutor.h"
#include "tmdbsync/RunCounters.h"
#include "tmdbsync/RunLog.h"

class IngestionEngine {
public:
    IngestionEngine(const EngineConfig& config,
                    std::shared_ptr<HttpTransport> transport,
                    std::string bearer_token);

    RunReport run(const EntityDescriptor& descriptor);

    // Defaults to the current UTC date, read at each run()
    void set_today(CivilDate today) { today_ = today; }
    void set_sleeper(RequestExecutor::Sleeper sleeper) { sleeper_ = std::move(sleeper); }
    void set_logging_enabled(bool enabled) { logging_enabled_ = enabled; }

    std::string store_path(const EntityDescriptor& descriptor) const;

private:
    EngineConfig config_;
    std::shared_ptr<HttpTransport> transport_;
    std::shared_ptr<RateLimiter> limiter_;
    std::string bearer_token_;

    std::optional<CivilDate> today_;
    RequestExecutor::Sleeper sleeper_;
    bool logging_enabled_ = true;

    std::unique_ptr<RequestExecutor> make_executor(std::shared_ptr<ErrorCounter> errors) const;

    RunReport run_incremental(const EntityDescriptor& descriptor, RunReport report);
    RunReport run_full_rebuild(const EntityDescriptor& descriptor, RunReport report);
    // Projects and appends one fetched payload; false when nothing was stored
    static bool write_fetched(const EntityDescriptor& descriptor,
                              AtomicMergeWriter& writer,
                              const json& payload,
                              const EntityKey& key);
    void finish_report(const EntityDescriptor& descriptor, const RunReport& report) const;
};
