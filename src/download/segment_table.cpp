#include "download/segment_table.h"

namespace segdl {

std::string SegmentSpec::rangeHeader(uint64_t offset) const {
    return "bytes=" + std::to_string(start + offset) + "-" + std::to_string(end);
}

uint64_t SegmentTable::totalSize() const {
    if (segments.empty()) return 0;
    return segments.back().end + 1;
}

std::string manifestPath(const std::string& destination) {
    return destination + ".json";
}

std::string segmentPath(const std::string& destination, size_t index) {
    return destination + "." + std::to_string(index) + ".bin";
}

}  // namespace segdl
