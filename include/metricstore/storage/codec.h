#ifndef METRICSTORE_STORAGE_CODEC_H_
#define METRICSTORE_STORAGE_CODEC_H_

#include <cstdint>
#include <string>
#include <vector>

#include "metricstore/core/aggregation.h"
#include "metricstore/core/config.h"
#include "metricstore/core/result.h"
#include "metricstore/core/types.h"

namespace metricstore {
namespace storage {

/**
 * @brief Serialize a metadata bag as a flat JSON object
 */
std::string EncodeMetadata(const core::Metadata& metadata);

/**
 * @brief Parse a metadata JSON object
 *
 * Non-string members are kept as their JSON text so nothing a producer
 * attached is lost.
 */
core::Result<core::Metadata> DecodeMetadata(const std::string& json);

/**
 * @brief Encoded archive payload plus the flag telling how to read it back
 */
struct EncodedPayload {
    std::vector<uint8_t> bytes;
    bool compressed = false;
};

/**
 * @brief Serialize bucket statistics as {"count","sum","min","max","sum_sq"}
 *
 * The JSON document is deflated with zlib when compression is enabled.
 */
core::Result<EncodedPayload> EncodeStats(const core::AggregateStats& stats,
                                         const core::CompressionConfig& compression);

core::Result<core::AggregateStats> DecodeStats(const uint8_t* data, size_t size, bool compressed);

} // namespace storage
} // namespace metricstore

#endif // METRICSTORE_STORAGE_CODEC_H_
