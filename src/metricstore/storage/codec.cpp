#include "metricstore/storage/codec.h"

#include <rapidjson/document.h>
#include <rapidjson/stringbuffer.h>
#include <rapidjson/writer.h>
#include <zlib.h>

namespace metricstore {
namespace storage {

namespace {

// Compressed payloads carry the inflated size in front of the deflate stream
constexpr size_t kSizePrefix = 4;

// Sums of squares overflow to infinity for large finite samples
using StatsWriter = rapidjson::Writer<rapidjson::StringBuffer, rapidjson::UTF8<>, rapidjson::UTF8<>,
                                      rapidjson::CrtAllocator, rapidjson::kWriteNanAndInfFlag>;

core::Result<std::vector<uint8_t>> Deflate(const std::string& input, int level) {
    uLongf dest_len = compressBound(static_cast<uLong>(input.size()));
    std::vector<uint8_t> output(kSizePrefix + dest_len);

    uint32_t raw_size = static_cast<uint32_t>(input.size());
    for (size_t i = 0; i < kSizePrefix; ++i) {
        output[i] = static_cast<uint8_t>((raw_size >> (8 * i)) & 0xFF);
    }

    int rc = compress2(output.data() + kSizePrefix, &dest_len,
                       reinterpret_cast<const Bytef*>(input.data()),
                       static_cast<uLong>(input.size()), level);
    if (rc != Z_OK) {
        return core::Result<std::vector<uint8_t>>::error(
            "Archive payload compression failed with zlib code " + std::to_string(rc));
    }
    output.resize(kSizePrefix + dest_len);
    return core::Result<std::vector<uint8_t>>(std::move(output));
}

core::Result<std::string> Inflate(const uint8_t* data, size_t size) {
    if (size < kSizePrefix) {
        return core::Result<std::string>::error("Compressed archive payload is truncated");
    }
    uint32_t raw_size = 0;
    for (size_t i = 0; i < kSizePrefix; ++i) {
        raw_size |= static_cast<uint32_t>(data[i]) << (8 * i);
    }

    std::string output(raw_size, '\0');
    uLongf dest_len = raw_size;
    int rc = uncompress(reinterpret_cast<Bytef*>(&output[0]), &dest_len,
                        data + kSizePrefix, static_cast<uLong>(size - kSizePrefix));
    if (rc != Z_OK || dest_len != raw_size) {
        return core::Result<std::string>::error(
            "Archive payload decompression failed with zlib code " + std::to_string(rc));
    }
    return core::Result<std::string>(std::move(output));
}

} // namespace

std::string EncodeMetadata(const core::Metadata& metadata) {
    rapidjson::StringBuffer buffer;
    rapidjson::Writer<rapidjson::StringBuffer> writer(buffer);
    writer.StartObject();
    for (const auto& entry : metadata) {
        writer.Key(entry.first.c_str(), static_cast<rapidjson::SizeType>(entry.first.size()));
        writer.String(entry.second.c_str(), static_cast<rapidjson::SizeType>(entry.second.size()));
    }
    writer.EndObject();
    return std::string(buffer.GetString(), buffer.GetSize());
}

core::Result<core::Metadata> DecodeMetadata(const std::string& json) {
    core::Metadata metadata;
    if (json.empty()) {
        return core::Result<core::Metadata>(std::move(metadata));
    }

    rapidjson::Document doc;
    doc.Parse(json.c_str(), json.size());
    if (doc.HasParseError() || !doc.IsObject()) {
        return core::Result<core::Metadata>::error("Stored metadata is not a JSON object");
    }

    for (auto it = doc.MemberBegin(); it != doc.MemberEnd(); ++it) {
        std::string key(it->name.GetString(), it->name.GetStringLength());
        if (it->value.IsString()) {
            metadata[key] = std::string(it->value.GetString(), it->value.GetStringLength());
        } else {
            rapidjson::StringBuffer buffer;
            rapidjson::Writer<rapidjson::StringBuffer> writer(buffer);
            it->value.Accept(writer);
            metadata[key] = std::string(buffer.GetString(), buffer.GetSize());
        }
    }
    return core::Result<core::Metadata>(std::move(metadata));
}

core::Result<EncodedPayload> EncodeStats(const core::AggregateStats& stats,
                                         const core::CompressionConfig& compression) {
    rapidjson::StringBuffer buffer;
    StatsWriter writer(buffer);
    bool written = writer.StartObject() &&
                   writer.Key("count") && writer.Uint64(stats.count) &&
                   writer.Key("sum") && writer.Double(stats.sum) &&
                   writer.Key("min") && writer.Double(stats.min) &&
                   writer.Key("max") && writer.Double(stats.max) &&
                   writer.Key("sum_sq") && writer.Double(stats.sum_sq) &&
                   writer.EndObject();
    if (!written || !writer.IsComplete()) {
        return core::Result<EncodedPayload>::error("Archive statistics could not be encoded",
                                                   core::Error::Code::INTERNAL);
    }

    std::string json(buffer.GetString(), buffer.GetSize());

    EncodedPayload payload;
    if (compression.enabled) {
        auto deflated = Deflate(json, compression.level);
        if (!deflated.ok()) {
            return core::PropagateError<EncodedPayload>(deflated);
        }
        payload.bytes = deflated.take_value();
        payload.compressed = true;
    } else {
        payload.bytes.assign(json.begin(), json.end());
    }
    return core::Result<EncodedPayload>(std::move(payload));
}

core::Result<core::AggregateStats> DecodeStats(const uint8_t* data, size_t size, bool compressed) {
    std::string json;
    if (compressed) {
        auto inflated = Inflate(data, size);
        if (!inflated.ok()) {
            return core::PropagateError<core::AggregateStats>(inflated);
        }
        json = inflated.take_value();
    } else {
        json.assign(reinterpret_cast<const char*>(data), size);
    }

    rapidjson::Document doc;
    doc.Parse<rapidjson::kParseNanAndInfFlag>(json.c_str(), json.size());
    if (doc.HasParseError() || !doc.IsObject()) {
        return core::Result<core::AggregateStats>::error("Archive payload is not a JSON object");
    }

    for (const char* field : {"count", "sum", "min", "max", "sum_sq"}) {
        if (!doc.HasMember(field) || !doc[field].IsNumber()) {
            return core::Result<core::AggregateStats>::error(
                std::string("Archive payload is missing numeric field ") + field);
        }
    }

    core::AggregateStats stats;
    stats.count = doc["count"].GetUint64();
    stats.sum = doc["sum"].GetDouble();
    stats.min = doc["min"].GetDouble();
    stats.max = doc["max"].GetDouble();
    stats.sum_sq = doc["sum_sq"].GetDouble();
    return core::Result<core::AggregateStats>(stats);
}

} // namespace storage
} // namespace metricstore
