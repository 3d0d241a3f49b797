#include "metricstore/retention/retention_manager.h"
#include "metricstore/common/logger.h"

#include <chrono>
#include <map>
#include <tuple>
#include <vector>

namespace metricstore {
namespace retention {

namespace {

constexpr core::Table kDetailedTables[] = {core::Table::TASK, core::Table::AGENT, core::Table::SWARM};

/**
 * @brief Re-tag a storage error as a retention failure
 *
 * Timeouts and cancellations keep their code so callers can tell them apart.
 */
template<typename T, typename U>
core::Result<T> RetentionError(const std::string& what, const core::Result<U>& failed) {
    auto code = failed.code();
    if (code != core::Error::Code::TIMEOUT && code != core::Error::Code::CANCELLED) {
        code = core::Error::Code::RETENTION_FAILURE;
    }
    METRICSTORE_ERROR("{}: {}", what, failed.error());
    return core::Result<T>::error(what + ": " + failed.error(), code);
}

} // namespace

RetentionCutoffs RetentionCutoffs::Compute(const core::RetentionPolicy& policy, core::Timestamp now) {
    RetentionCutoffs cutoffs;
    cutoffs.detailed = core::FloorTo(now - policy.detailed_days * core::kMillisPerDay, core::kMillisPerHour);
    cutoffs.hourly = core::FloorTo(now - policy.hourly_days * core::kMillisPerDay, core::kMillisPerDay);
    cutoffs.daily = core::FloorTo(now - policy.daily_days * core::kMillisPerDay, core::kMillisPerDay);
    cutoffs.horizon = now - policy.daily_days * core::kMillisPerDay;
    return cutoffs;
}

RetentionManager::RetentionManager(std::shared_ptr<storage::SqliteStorage> storage,
                                   const core::RetentionPolicy& policy,
                                   Clock clock)
    : storage_(std::move(storage)), policy_(policy), clock_(std::move(clock)) {}

RetentionManager::~RetentionManager() {
    stop();
}

RetentionCutoffs RetentionManager::cutoffs() const {
    return RetentionCutoffs::Compute(policy_, clock_());
}

std::optional<RetentionRunStats> RetentionManager::last_run() const {
    std::lock_guard<std::mutex> lock(last_run_mutex_);
    return last_run_;
}

core::Result<void> RetentionManager::compactInto(storage::WriteTransaction& txn,
                                                 const RetentionCutoffs& cutoffs,
                                                 CompactionStats& stats) {
    struct Tier {
        core::AggregationLevel level;
        core::TimeRange range;
    };
    const Tier tiers[] = {
        {core::AggregationLevel::HOURLY, core::TimeRange::Between(cutoffs.hourly, cutoffs.detailed)},
        {core::AggregationLevel::DAILY, core::TimeRange::Between(cutoffs.daily, cutoffs.hourly)},
    };

    for (auto table : kDetailedTables) {
        for (const auto& tier : tiers) {
            auto buckets = txn.group_detailed(table, tier.level, tier.range);
            if (!buckets.ok()) {
                return RetentionError<void>(std::string("Grouping ") + core::TableName(table) + " failed", buckets);
            }
            for (const auto& bucket : buckets.value()) {
                auto merged = txn.merge_bucket(bucket);
                if (!merged.ok()) {
                    return RetentionError<void>("Writing archive bucket failed", merged);
                }
                if (merged.value()) {
                    ++stats.buckets_merged;
                }
                if (tier.level == core::AggregationLevel::HOURLY) {
                    ++stats.hourly_buckets_written;
                } else {
                    ++stats.daily_buckets_written;
                }
            }
        }

        auto deleted = txn.delete_detailed(table, core::TimeRange::Between(cutoffs.daily, cutoffs.detailed));
        if (!deleted.ok()) {
            return RetentionError<void>(std::string("Deleting compacted rows of ") + core::TableName(table) +
                                        " failed", deleted);
        }
        stats.detailed_rows_compacted += deleted.value();
    }

    // Hourly buckets past the hourly window fold into their day
    auto hourly = txn.select_archive(core::AggregationLevel::HOURLY,
                                     core::TimeRange::Between(cutoffs.daily, cutoffs.hourly));
    if (!hourly.ok()) {
        return RetentionError<void>("Selecting hourly buckets for roll-up failed", hourly);
    }

    using DailyKey = std::tuple<core::Table, std::string, std::string, core::Timestamp>;
    std::map<DailyKey, core::ArchiveBucket> daily;
    std::vector<int64_t> rolled_up;
    for (const auto& bucket : hourly.value()) {
        core::Timestamp day = core::FloorTo(bucket.bucket_start, core::kMillisPerDay);
        DailyKey key{bucket.source_table, bucket.scope_id, bucket.metric_kind, day};
        auto it = daily.find(key);
        if (it == daily.end()) {
            core::ArchiveBucket rolled = bucket;
            rolled.id = 0;
            rolled.level = core::AggregationLevel::DAILY;
            rolled.bucket_start = day;
            rolled.bucket_date = core::FormatDate(day);
            daily.emplace(key, std::move(rolled));
        } else {
            it->second.stats.merge(bucket.stats);
        }
        rolled_up.push_back(bucket.id);
    }

    for (const auto& entry : daily) {
        auto merged = txn.merge_bucket(entry.second);
        if (!merged.ok()) {
            return RetentionError<void>("Writing rolled-up daily bucket failed", merged);
        }
        if (merged.value()) {
            ++stats.buckets_merged;
        }
        ++stats.daily_buckets_written;
    }

    auto removed = txn.delete_archive_ids(rolled_up);
    if (!removed.ok()) {
        return RetentionError<void>("Removing rolled-up hourly buckets failed", removed);
    }
    stats.hourly_buckets_rolled_up += removed.value();
    return core::Result<void>();
}

core::Result<void> RetentionManager::purgeInto(storage::WriteTransaction& txn,
                                               const RetentionCutoffs& cutoffs,
                                               PurgeStats& stats) {
    core::TimeRange expired;
    expired.end = cutoffs.daily;

    for (auto table : kDetailedTables) {
        auto deleted = txn.delete_detailed(table, expired);
        if (!deleted.ok()) {
            return RetentionError<void>(std::string("Purging ") + core::TableName(table) + " failed", deleted);
        }
        stats.detailed_rows_purged += deleted.value();
    }

    auto deleted = txn.delete_archive(expired);
    if (!deleted.ok()) {
        return RetentionError<void>("Purging expired archive buckets failed", deleted);
    }
    stats.archive_buckets_purged += deleted.value();
    return core::Result<void>();
}

core::Result<RetentionRunStats> RetentionManager::run_once(const core::QueryContext& ctx) {
    auto start = std::chrono::steady_clock::now();

    RetentionRunStats run;
    run.ran_at = clock_();
    run.cutoffs = RetentionCutoffs::Compute(policy_, run.ran_at);

    auto txn = storage_->begin_write(ctx);
    if (!txn.ok()) {
        return RetentionError<RetentionRunStats>("Starting retention run failed", txn);
    }

    auto compacted = compactInto(txn.value(), run.cutoffs, run.compaction);
    if (!compacted.ok()) {
        return core::PropagateError<RetentionRunStats>(compacted);
    }
    auto purged = purgeInto(txn.value(), run.cutoffs, run.purge);
    if (!purged.ok()) {
        return core::PropagateError<RetentionRunStats>(purged);
    }
    auto committed = txn.value().commit();
    if (!committed.ok()) {
        return RetentionError<RetentionRunStats>("Committing retention run failed", committed);
    }

    run.elapsed_ms = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now() - start).count();

    METRICSTORE_INFO("Retention run: {} rows compacted into {} hourly / {} daily buckets, "
                     "{} hourly buckets rolled up, {} rows and {} buckets purged in {} ms",
                     run.compaction.detailed_rows_compacted, run.compaction.hourly_buckets_written,
                     run.compaction.daily_buckets_written, run.compaction.hourly_buckets_rolled_up,
                     run.purge.detailed_rows_purged, run.purge.archive_buckets_purged, run.elapsed_ms);

    if (policy_.vacuum_after_cleanup) {
        auto vacuumed = storage_->vacuum();
        if (!vacuumed.ok()) {
            METRICSTORE_WARN("VACUUM after retention run failed: {}", vacuumed.error());
        }
    }

    {
        std::lock_guard<std::mutex> lock(last_run_mutex_);
        last_run_ = run;
    }
    return core::Result<RetentionRunStats>(run);
}

core::Result<CompactionStats> RetentionManager::compact(const core::QueryContext& ctx) {
    auto cutoffs = RetentionCutoffs::Compute(policy_, clock_());
    auto txn = storage_->begin_write(ctx);
    if (!txn.ok()) {
        return RetentionError<CompactionStats>("Starting compaction failed", txn);
    }
    CompactionStats stats;
    auto compacted = compactInto(txn.value(), cutoffs, stats);
    if (!compacted.ok()) {
        return core::PropagateError<CompactionStats>(compacted);
    }
    auto committed = txn.value().commit();
    if (!committed.ok()) {
        return RetentionError<CompactionStats>("Committing compaction failed", committed);
    }
    METRICSTORE_INFO("Compaction: {} rows compacted, {} hourly buckets rolled up",
                     stats.detailed_rows_compacted, stats.hourly_buckets_rolled_up);
    return core::Result<CompactionStats>(stats);
}

core::Result<PurgeStats> RetentionManager::purge(const core::QueryContext& ctx) {
    auto cutoffs = RetentionCutoffs::Compute(policy_, clock_());
    auto txn = storage_->begin_write(ctx);
    if (!txn.ok()) {
        return RetentionError<PurgeStats>("Starting purge failed", txn);
    }
    PurgeStats stats;
    auto purged = purgeInto(txn.value(), cutoffs, stats);
    if (!purged.ok()) {
        return core::PropagateError<PurgeStats>(purged);
    }
    auto committed = txn.value().commit();
    if (!committed.ok()) {
        return RetentionError<PurgeStats>("Committing purge failed", committed);
    }
    METRICSTORE_INFO("Purge: {} detailed rows and {} archive buckets older than {} deleted",
                     stats.detailed_rows_purged, stats.archive_buckets_purged, core::FormatDate(cutoffs.daily));
    return core::Result<PurgeStats>(stats);
}

core::Result<void> RetentionManager::start(std::shared_ptr<storage::BackgroundProcessor> processor) {
    if (schedule_id_) {
        return core::Result<void>::error("Retention schedule already started");
    }
    if (!processor) {
        return core::Result<void>::error("Retention schedule needs a background processor",
                                         core::Error::Code::INVALID_QUERY);
    }
    if (!policy_.auto_cleanup) {
        METRICSTORE_INFO("Automatic retention cleanup disabled");
        return core::Result<void>();
    }

    auto scheduled = processor->scheduleRecurring(
        storage::BackgroundTaskType::CLEANUP, policy_.cleanup_interval,
        [this]() -> core::Result<void> {
            auto run = run_once();
            if (!run.ok()) {
                return core::PropagateError<void>(run);
            }
            return core::Result<void>();
        });
    if (!scheduled.ok()) {
        return core::PropagateError<void>(scheduled);
    }
    processor_ = std::move(processor);
    schedule_id_ = scheduled.value();
    METRICSTORE_INFO("Retention cleanup scheduled every {} ms (detailed={}d hourly={}d daily={}d)",
                     policy_.cleanup_interval.count(), policy_.detailed_days,
                     policy_.hourly_days, policy_.daily_days);
    return core::Result<void>();
}

void RetentionManager::stop() {
    if (processor_ && schedule_id_) {
        processor_->cancelRecurring(*schedule_id_);
    }
    schedule_id_.reset();
    processor_.reset();
}

} // namespace retention
} // namespace metricstore
