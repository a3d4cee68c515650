#include "utils/config.h"

#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <limits>
#include <nlohmann/json.hpp>
#include <optional>
#include <sstream>
#include <spdlog/spdlog.h>

#include "utils/file_lock.h"

namespace segdl {

namespace {

constexpr size_t kMaxChunkSize = 64 * 1024 * 1024;
constexpr int kMaxSegments = 64;

std::optional<std::string> getEnvValue(const char* name) {
    if (!name || !*name) {
        return std::nullopt;
    }
    if (const char* v = std::getenv(name)) {
        return std::string(v);
    }
    return std::nullopt;
}

// Integer value of name within [min, max]; anything else is ignored with a warning.
std::optional<long long> envInteger(const char* name, long long min, long long max) {
    auto env = getEnvValue(name);
    if (!env) return std::nullopt;
    try {
        size_t consumed = 0;
        const long long v = std::stoll(*env, &consumed);
        if (consumed == env->size() && v >= min && v <= max) return v;
    } catch (const std::exception&) {
    }
    spdlog::warn("Config: ignoring invalid {}='{}'", name, *env);
    return std::nullopt;
}

std::filesystem::path defaultConfigPath() {
    auto home = getEnvValue("HOME");
    if (!home || home->empty()) return {};
    return std::filesystem::path(*home) / ".segdl" / "config.json";
}

bool readJsonWithLock(const std::filesystem::path& path, nlohmann::json& out) {
    std::error_code ec;
    if (!std::filesystem::exists(path, ec)) return false;
    FileLock lock(path);
    std::ifstream ifs(path);
    if (!ifs.is_open()) return false;
    out = nlohmann::json::parse(ifs, nullptr, false);
    if (out.is_discarded() || !out.is_object()) {
        spdlog::warn("Config: ignoring malformed config file '{}'", path.string());
        return false;
    }
    return true;
}

void applyJson(const nlohmann::json& j, DownloadConfig& cfg) {
    if (j.contains("segments") && j["segments"].is_number_integer()) {
        const auto v = j["segments"].get<long long>();
        if (v > 0 && v <= kMaxSegments) cfg.segments = static_cast<int>(v);
    }
    if (j.contains("chunk") && j["chunk"].is_number_integer()) {
        const auto v = j["chunk"].get<long long>();
        if (v > 0 && static_cast<size_t>(v) <= kMaxChunkSize) cfg.chunk_size = static_cast<size_t>(v);
    }
    if (j.contains("timeout_ms") && j["timeout_ms"].is_number_integer()) {
        const auto v = j["timeout_ms"].get<long long>();
        if (v > 0) cfg.timeout = std::chrono::milliseconds(v);
    }
    if (j.contains("max_retries") && j["max_retries"].is_number_integer()) {
        const auto v = j["max_retries"].get<long long>();
        if (v >= 0) cfg.max_retries = static_cast<int>(v);
    }
    if (j.contains("backoff_ms") && j["backoff_ms"].is_number_integer()) {
        const auto v = j["backoff_ms"].get<long long>();
        if (v >= 0) cfg.backoff = std::chrono::milliseconds(v);
    }
    if (j.contains("progress_interval_ms") && j["progress_interval_ms"].is_number_integer()) {
        const auto v = j["progress_interval_ms"].get<long long>();
        if (v > 0) cfg.progress_interval = std::chrono::milliseconds(v);
    }
}

}  // namespace

DownloadConfig loadDownloadConfig() {
    return loadDownloadConfigWithLog().first;
}

std::pair<DownloadConfig, std::string> loadDownloadConfigWithLog() {
    DownloadConfig cfg;
    std::ostringstream log;
    bool used_file = false;
    bool used_env = false;

    std::filesystem::path cfg_path;
    if (auto env = getEnvValue("SEGDL_CONFIG")) {
        cfg_path = *env;
    } else {
        cfg_path = defaultConfigPath();
    }
    if (!cfg_path.empty()) {
        nlohmann::json j;
        if (readJsonWithLock(cfg_path, j)) {
            applyJson(j, cfg);
            log << "file=" << cfg_path << " ";
            used_file = true;
        }
    }

    if (auto v = envInteger("SEGDL_SEGMENTS", 1, kMaxSegments)) {
        cfg.segments = static_cast<int>(*v);
        log << "env:SEGMENTS=" << *v << " ";
        used_env = true;
    }
    if (auto v = envInteger("SEGDL_CHUNK", 1, static_cast<long long>(kMaxChunkSize))) {
        cfg.chunk_size = static_cast<size_t>(*v);
        log << "env:CHUNK=" << *v << " ";
        used_env = true;
    }
    if (auto v = envInteger("SEGDL_TIMEOUT_MS", 1, std::numeric_limits<long long>::max())) {
        cfg.timeout = std::chrono::milliseconds(*v);
        log << "env:TIMEOUT_MS=" << *v << " ";
        used_env = true;
    }
    if (auto v = envInteger("SEGDL_MAX_RETRIES", 0, 1000)) {
        cfg.max_retries = static_cast<int>(*v);
        log << "env:MAX_RETRIES=" << *v << " ";
        used_env = true;
    }
    if (auto v = envInteger("SEGDL_BACKOFF_MS", 0, std::numeric_limits<long long>::max())) {
        cfg.backoff = std::chrono::milliseconds(*v);
        log << "env:BACKOFF_MS=" << *v << " ";
        used_env = true;
    }

    if (log.tellp() > 0) log << "|";
    log << "sources=";
    if (used_env) log << "env";
    if (used_file) {
        if (used_env) log << ",";
        log << "file";
    }
    if (!used_env && !used_file) log << "default";

    return {cfg, log.str()};
}

}  // namespace segdl
