#include "metricstore/storage/storage.h"

namespace metricstore {
namespace storage {

core::Result<core::Records> Storage::read_range(core::Table table,
                                                const core::QueryFilter& filter,
                                                const core::TimeRange& range,
                                                size_t limit,
                                                const core::QueryContext& ctx) {
    core::Records records;
    auto scanned = scan(table, filter, range, ScanOptions::Limit(limit),
                        [&records](const core::Record& record) {
                            records.push_back(record);
                            return true;
                        },
                        ctx);
    if (!scanned.ok()) {
        return core::PropagateError<core::Records>(scanned);
    }
    return core::Result<core::Records>(std::move(records));
}

} // namespace storage
} // namespace metricstore
