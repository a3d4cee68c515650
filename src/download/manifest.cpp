#include "download/manifest.h"

#include <filesystem>
#include <fstream>
#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>

#include "download/download_error.h"
#include "utils/file_lock.h"

namespace fs = std::filesystem;

namespace segdl {

std::optional<ResumeManifest> loadManifest(const std::string& path) {
    std::error_code ec;
    if (!fs::exists(path, ec)) return std::nullopt;

    FileLock lock(path);
    if (!lock.locked()) {
        spdlog::debug("Manifest: '{}' is locked by another writer, ignoring", path);
        return std::nullopt;
    }

    std::ifstream ifs(path, std::ios::binary);
    if (!ifs.is_open()) return std::nullopt;

    auto j = nlohmann::json::parse(ifs, nullptr, false);
    if (j.is_discarded() || !j.is_object()) {
        spdlog::debug("Manifest: '{}' is not a JSON object, ignoring", path);
        return std::nullopt;
    }
    if (!j.contains("url") || !j["url"].is_string()) return std::nullopt;
    if (!j.contains("segments") || !j["segments"].is_number_integer()) return std::nullopt;

    ResumeManifest out;
    out.url = j["url"].get<std::string>();
    const auto segments = j["segments"].get<long long>();
    if (segments < 1) return std::nullopt;
    out.segments = static_cast<size_t>(segments);
    if (j.contains("etag") && j["etag"].is_string()) {
        out.etag = j["etag"].get<std::string>();
    }
    return out;
}

void storeManifest(const std::string& path, const ResumeManifest& manifest) {
    const fs::path target(path);
    if (target.has_parent_path()) {
        std::error_code ec;
        fs::create_directories(target.parent_path(), ec);
    }

    nlohmann::json j;
    j["url"] = manifest.url;
    if (manifest.etag.has_value()) {
        j["etag"] = *manifest.etag;
    } else {
        j["etag"] = nullptr;
    }
    j["segments"] = manifest.segments;

    FileLock lock(path);
    if (!lock.locked()) {
        throw ManifestError("manifest is locked by another writer: " + path);
    }

    const auto temp_path = path + ".tmp";
    {
        std::ofstream ofs(temp_path, std::ios::binary | std::ios::trunc);
        if (!ofs.is_open()) {
            throw ManifestError("failed to open manifest for write: " + temp_path);
        }
        ofs << j.dump(4);
        ofs.flush();
        if (!ofs.good()) {
            throw ManifestError("failed to write manifest: " + temp_path);
        }
    }

    std::error_code ec;
    fs::rename(temp_path, target, ec);
    if (ec) {
        fs::remove(temp_path, ec);
        throw ManifestError("failed to replace manifest: " + path);
    }
}

bool removeManifest(const std::string& path) {
    std::error_code ec;
    const bool removed = fs::remove(path, ec);
    if (ec) {
        spdlog::warn("Manifest: failed to remove '{}': {}", path, ec.message());
        return false;
    }
    return removed;
}

}  // namespace segdl
