#include "cli/commands.h"
#include "cli/progress_renderer.h"
#include "download/download_coordinator.h"
#include "download/httplib_transport.h"
#include "runtime/state.h"
#include "utils/config.h"

#include <atomic>
#include <chrono>
#include <iostream>
#include <spdlog/spdlog.h>
#include <thread>

namespace segdl {
namespace cli {
namespace commands {

namespace {

constexpr int kExitCancelled = 130;

RequestOptions buildRequestOptions(const DownloadOptions& options, const DownloadConfig& cfg) {
    RequestOptions out;
    out.headers = options.headers;
    out.timeout = options.timeout_sec ? std::chrono::milliseconds(*options.timeout_sec * 1000LL) : cfg.timeout;
    out.verify_tls = !options.insecure;
    if (!options.proxy.empty()) {
        const auto colon = options.proxy.rfind(':');
        out.proxy_host = options.proxy.substr(0, colon);
        try {
            out.proxy_port = std::stoi(options.proxy.substr(colon + 1));
        } catch (const std::exception&) {
            spdlog::warn("download: ignoring proxy with invalid port '{}'", options.proxy);
            out.proxy_host.clear();
        }
    }
    return out;
}

// Forwards SIGINT/SIGTERM to the coordinator; joined on every exit path.
class InterruptWatcher {
public:
    explicit InterruptWatcher(DownloadCoordinator& coordinator)
        : thread_([this, &coordinator]() {
              while (!finished_.load()) {
                  if (interrupt_requested()) {
                      coordinator.cancel();
                  }
                  std::this_thread::sleep_for(std::chrono::milliseconds(100));
              }
          }) {}

    ~InterruptWatcher() {
        finished_.store(true);
        if (thread_.joinable()) thread_.join();
    }

    InterruptWatcher(const InterruptWatcher&) = delete;
    InterruptWatcher& operator=(const InterruptWatcher&) = delete;

private:
    std::atomic<bool> finished_{false};
    std::thread thread_;
};

}  // namespace

int download(const DownloadOptions& options) {
    const auto cfg_pair = loadDownloadConfigWithLog();
    const auto& cfg = cfg_pair.first;
    spdlog::info("download: config {}", cfg_pair.second);

    DownloadRequest request;
    request.url = options.url;
    request.destination = options.output;
    request.segments = options.segments.value_or(cfg.segments);
    request.multisegment = !options.single_stream;
    request.overwrite = options.overwrite;
    request.max_retries = options.max_retries.value_or(cfg.max_retries);
    request.backoff = cfg.backoff;
    request.chunk_size = cfg.chunk_size;
    request.progress_interval = cfg.progress_interval;
    request.options = buildRequestOptions(options, cfg);

    HttplibTransport transport;
    DownloadCoordinator coordinator(transport);
    ProgressRenderer renderer;

    const auto started = std::chrono::steady_clock::now();
    bool first_sample = true;
    uint64_t resumed_bytes = 0;
    auto on_progress = [&](uint64_t downloaded, uint64_t total) {
        if (options.quiet) return;
        if (first_sample) {
            // bytes already on disk from an earlier attempt do not count towards speed
            resumed_bytes = downloaded;
            first_sample = false;
        }
        const double elapsed = std::chrono::duration<double>(std::chrono::steady_clock::now() - started).count();
        const double speed = elapsed > 0 && downloaded > resumed_bytes
                                 ? static_cast<double>(downloaded - resumed_bytes) / elapsed
                                 : 0.0;
        renderer.setTotal(total);
        renderer.update(downloaded, speed);
    };

    Outcome outcome = Outcome::Failed;
    {
        // execute() clears earlier cancels, so keep re-issuing until it returns
        InterruptWatcher watcher(coordinator);
        outcome = coordinator.execute(request, on_progress);
    }

    switch (outcome) {
        case Outcome::Completed:
            if (!options.quiet) renderer.complete();
            std::cout << coordinator.destination() << std::endl;
            return 0;
        case Outcome::Cancelled:
            if (!options.quiet) renderer.fail("cancelled");
            std::cerr << "Download cancelled; run the same command again to resume." << std::endl;
            return kExitCancelled;
        case Outcome::Failed:
            break;
    }
    if (!options.quiet) renderer.fail(coordinator.lastError());
    std::cerr << "Error: " << coordinator.lastError() << std::endl;
    return 1;
}

}  // namespace commands
}  // namespace cli
}  // namespace segdl
