#include "download/segment_planner.h"

#include <algorithm>
#include <spdlog/spdlog.h>

#include "download/download_error.h"
#include "download/manifest.h"

namespace segdl {

size_t SegmentPlanner::clampSegmentCount(size_t requested, uint64_t size) {
    size_t count = requested;
    if (count > kSmallFileMaxSegments && size < kSmallFileThreshold) {
        count = kSmallFileMaxSegments;
    }
    if (size > 0 && static_cast<uint64_t>(count) > size) {
        count = static_cast<size_t>(size);
    }
    return std::max<size_t>(count, 1);
}

SegmentTable SegmentPlanner::partition(const std::string& url,
                                       const std::string& destination,
                                       size_t segment_count,
                                       uint64_t size,
                                       const std::optional<std::string>& etag) {
    if (size == 0) {
        throw InvalidPlanError("cannot partition an empty resource");
    }
    if (segment_count < 1) {
        throw InvalidPlanError("segment count must be at least 1");
    }
    if (static_cast<uint64_t>(segment_count) > size) {
        throw InvalidPlanError("cannot split " + std::to_string(size) + " bytes into " +
                               std::to_string(segment_count) + " non-empty segments");
    }

    SegmentTable table;
    table.url = url;
    table.etag = etag;
    table.segment_count = segment_count;
    table.segments.reserve(segment_count);

    // floor(size * i / n) without overflowing size * i
    const uint64_t n = segment_count;
    const uint64_t q = size / n;
    const uint64_t r = size % n;
    auto boundary = [&](uint64_t i) { return q * i + (r * i) / n; };

    for (size_t i = 0; i < segment_count; ++i) {
        SegmentSpec spec;
        spec.index = i;
        spec.start = boundary(i);
        spec.end = boundary(i + 1) - 1;
        spec.segment_size = spec.end - spec.start + 1;
        spec.path = segmentPath(destination, i);
        table.segments.push_back(std::move(spec));
    }
    return table;
}

SegmentTable SegmentPlanner::plan(const std::string& url,
                                  const std::string& destination,
                                  int requested_segments,
                                  uint64_t size,
                                  const std::optional<std::string>& etag) const {
    if (size == 0) {
        throw InvalidPlanError("resource size is 0");
    }
    if (requested_segments < 1) {
        throw InvalidPlanError("requested segment count " + std::to_string(requested_segments) +
                               " is below 1");
    }

    size_t segments = clampSegmentCount(static_cast<size_t>(requested_segments), size);

    const auto manifest_path = manifestPath(destination);
    if (etag.has_value()) {
        if (auto existing = loadManifest(manifest_path)) {
            if (existing->url == url && existing->etag == etag) {
                if (existing->segments != segments) {
                    spdlog::info("SegmentPlanner: resuming with {} segments from '{}' (requested {})",
                                 existing->segments, manifest_path, segments);
                }
                segments = static_cast<size_t>(std::min<uint64_t>(existing->segments, size));
            } else {
                spdlog::info("SegmentPlanner: manifest '{}' belongs to another resource, replanning",
                             manifest_path);
            }
        }
    }

    ResumeManifest manifest;
    manifest.url = url;
    manifest.etag = etag;
    manifest.segments = segments;
    storeManifest(manifest_path, manifest);

    auto table = partition(url, destination, segments, size, etag);
    spdlog::debug("SegmentPlanner: planned {} segments for {} bytes url='{}'", segments, size, url);
    return table;
}

}  // namespace segdl
