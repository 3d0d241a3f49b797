#ifndef METRICSTORE_STORAGE_STORAGE_H_
#define METRICSTORE_STORAGE_STORAGE_H_

#include <cstddef>
#include <functional>
#include <memory>
#include <string>
#include <vector>

#include "metricstore/core/config.h"
#include "metricstore/core/error.h"
#include "metricstore/core/query_context.h"
#include "metricstore/core/result.h"
#include "metricstore/core/types.h"

namespace metricstore {
namespace storage {

/**
 * @brief Paging and ordering of a scan
 */
struct ScanOptions {
    size_t limit = 0;     // 0 = unbounded
    size_t offset = 0;
    core::ScanOrder order = core::ScanOrder::TIME_ASCENDING;

    static ScanOptions Limit(size_t limit) {
        ScanOptions options;
        options.limit = limit;
        return options;
    }
};

/**
 * @brief Called once per row; return false to stop the scan early
 */
using RecordVisitor = std::function<bool(const core::Record&)>;

/**
 * @brief Storage engine interface
 *
 * Owns the detailed tables and the archive tier. Readers see committed rows
 * only; anything still sitting in a write buffer is invisible here.
 */
class Storage {
public:
    virtual ~Storage() = default;

    /**
     * @brief Open the store and create the schema if missing
     */
    virtual core::Result<void> init(const core::StorageConfig& config) = 0;

    /**
     * @brief Append one record, committed atomically
     */
    virtual core::Result<void> write(const core::MetricRecord& record) = 0;

    /**
     * @brief Append a batch of records in one transaction
     *
     * Either every record of the batch is committed or none is.
     */
    virtual core::Result<void> write_batch(const std::vector<core::MetricRecord>& records) = 0;

    /**
     * @brief Stream rows of a table matching filter and range to a visitor
     * @return Number of rows visited
     */
    virtual core::Result<size_t> scan(core::Table table,
                                      const core::QueryFilter& filter,
                                      const core::TimeRange& range,
                                      const ScanOptions& options,
                                      const RecordVisitor& visitor,
                                      const core::QueryContext& ctx = core::QueryContext()) = 0;

    /**
     * @brief Materialized scan ordered by timestamp ascending
     */
    core::Result<core::Records> read_range(core::Table table,
                                           const core::QueryFilter& filter,
                                           const core::TimeRange& range,
                                           size_t limit,
                                           const core::QueryContext& ctx = core::QueryContext());

    /**
     * @brief Reclaim space after deletes; serialized with flushes and compaction
     */
    virtual core::Result<void> vacuum() = 0;

    /**
     * @brief Refresh query planner statistics
     */
    virtual core::Result<void> analyze() = 0;

    virtual core::Result<void> close() = 0;

    virtual std::string stats() const = 0;
};

} // namespace storage
} // namespace metricstore

#endif // METRICSTORE_STORAGE_STORAGE_H_
