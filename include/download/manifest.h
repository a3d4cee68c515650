#pragma once

#include <cstddef>
#include <optional>
#include <string>

namespace segdl {

/// Persisted identity of a segment plan. Written next to the destination as
/// <destination>.json and removed once the merge has consumed every segment.
struct ResumeManifest {
    std::string url;
    std::optional<std::string> etag;
    size_t segments{0};
};

// Returns std::nullopt when the file is missing, locked, unreadable or malformed.
std::optional<ResumeManifest> loadManifest(const std::string& path);

// Writes through a temporary file and a rename. Throws ManifestError.
void storeManifest(const std::string& path, const ResumeManifest& manifest);

bool removeManifest(const std::string& path);

}  // namespace segdl
