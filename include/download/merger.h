#pragma once

#include <cstddef>
#include <string>

namespace segdl {

/// Concatenates <destination>.<i>.bin for i = 0..segment_count-1 into
/// destination, deleting each segment once copied and the manifest last.
/// @throws MergeError on any I/O failure; the manifest and every segment not
///         yet consumed stay on disk.
void merge(const std::string& destination, size_t segment_count, size_t buffer_size = 1024 * 1024);

}  // namespace segdl
