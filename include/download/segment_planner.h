#pragma once

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>

#include "download/segment_table.h"

namespace segdl {

/// Partitions a known-size resource into byte ranges and persists the plan as
/// the resume manifest at <destination>.json.
///
/// A manifest left by an earlier attempt is adopted only when an ETag is
/// supplied and both url and etag match, so segment boundaries stay stable
/// across resumes even when the requested concurrency changes.
class SegmentPlanner {
public:
    static constexpr size_t kSmallFileMaxSegments = 5;
    static constexpr uint64_t kSmallFileThreshold = 50ULL * 1024 * 1024;

    /// @throws InvalidPlanError when size is 0 or requested_segments < 1
    /// @throws ManifestError when the manifest cannot be written
    SegmentTable plan(const std::string& url,
                      const std::string& destination,
                      int requested_segments,
                      uint64_t size,
                      const std::optional<std::string>& etag) const;

    /// Small-file rule plus the cap at one byte per segment.
    static size_t clampSegmentCount(size_t requested, uint64_t size);

    /// Pure partition arithmetic; paths are derived from destination.
    /// @throws InvalidPlanError when size is 0, segment_count is 0 or
    ///         segment_count exceeds size
    static SegmentTable partition(const std::string& url,
                                  const std::string& destination,
                                  size_t segment_count,
                                  uint64_t size,
                                  const std::optional<std::string>& etag);
};

}  // namespace segdl
