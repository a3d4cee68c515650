#pragma once

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace segdl {

/// One contiguous byte range of the remote resource.
/// `start` and `end` are inclusive, matching HTTP Range semantics.
struct SegmentSpec {
    size_t index{0};
    uint64_t start{0};
    uint64_t end{0};
    uint64_t segment_size{0};  // bytes the finished segment file must hold
    std::string path;

    std::string rangeHeader(uint64_t offset = 0) const;
};

struct SegmentTable {
    std::string url;
    std::optional<std::string> etag;
    size_t segment_count{0};
    std::vector<SegmentSpec> segments;

    uint64_t totalSize() const;
};

// <destination>.json
std::string manifestPath(const std::string& destination);

// <destination>.<index>.bin
std::string segmentPath(const std::string& destination, size_t index);

}  // namespace segdl
