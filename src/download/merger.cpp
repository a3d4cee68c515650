#include "download/merger.h"

#include <filesystem>
#include <fstream>
#include <spdlog/spdlog.h>
#include <vector>

#include "download/download_error.h"
#include "download/manifest.h"
#include "download/segment_table.h"

namespace fs = std::filesystem;

namespace segdl {

void merge(const std::string& destination, size_t segment_count, size_t buffer_size) {
    std::ofstream dest(destination, std::ios::binary | std::ios::trunc);
    if (!dest.is_open()) {
        throw MergeError("failed to open destination '" + destination + "'");
    }

    std::vector<char> buffer(buffer_size == 0 ? 1024 * 1024 : buffer_size);
    uint64_t total = 0;
    for (size_t i = 0; i < segment_count; ++i) {
        const auto path = segmentPath(destination, i);
        {
            std::ifstream src(path, std::ios::binary);
            if (!src.is_open()) {
                throw MergeError("missing segment file '" + path + "'");
            }
            while (src) {
                src.read(buffer.data(), static_cast<std::streamsize>(buffer.size()));
                const std::streamsize n = src.gcount();
                if (n <= 0) break;
                dest.write(buffer.data(), n);
                if (!dest.good()) {
                    throw MergeError("failed to write '" + destination + "' while copying '" + path + "'");
                }
                total += static_cast<uint64_t>(n);
            }
            if (src.bad()) {
                throw MergeError("failed to read segment file '" + path + "'");
            }
        }
        dest.flush();
        if (!dest.good()) {
            throw MergeError("failed to flush '" + destination + "'");
        }

        std::error_code ec;
        fs::remove(path, ec);
        if (ec) {
            throw MergeError("failed to remove segment file '" + path + "': " + ec.message());
        }
    }
    dest.close();
    if (dest.fail()) {
        throw MergeError("failed to close '" + destination + "'");
    }

    const auto manifest = manifestPath(destination);
    std::error_code ec;
    if (!removeManifest(manifest) && fs::exists(manifest, ec)) {
        spdlog::warn("Merger: '{}' is complete but manifest '{}' could not be removed", destination, manifest);
    }
    spdlog::debug("Merger: wrote {} bytes from {} segments to '{}'", total, segment_count, destination);
}

}  // namespace segdl
