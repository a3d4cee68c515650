#pragma once

#include <stdexcept>
#include <string>

namespace segdl {

/// Base class for errors that abort a download attempt before or after the
/// workers run. Worker-side transfer failures are never thrown; they are
/// reported through the session error flag.
class DownloadError : public std::runtime_error {
public:
    explicit DownloadError(const std::string& message) : std::runtime_error(message) {}
};

/// Resource size or segment count cannot be partitioned.
class InvalidPlanError : public DownloadError {
public:
    explicit InvalidPlanError(const std::string& message) : DownloadError(message) {}
};

/// The resume manifest could not be persisted.
class ManifestError : public DownloadError {
public:
    explicit ManifestError(const std::string& message) : DownloadError(message) {}
};

/// Concatenating segment files into the destination failed.
/// Remaining segment files and the manifest are left on disk.
class MergeError : public DownloadError {
public:
    explicit MergeError(const std::string& message) : DownloadError(message) {}
};

enum class Outcome {
    Completed,
    Cancelled,
    Failed,
};

inline const char* to_string(Outcome outcome) {
    switch (outcome) {
        case Outcome::Completed:
            return "completed";
        case Outcome::Cancelled:
            return "cancelled";
        case Outcome::Failed:
            return "failed";
    }
    return "unknown";
}

}  // namespace segdl
