#include "cli/commands.h"
#include "cli/progress_renderer.h"
#include "download/httplib_transport.h"
#include "utils/config.h"
#include "utils/filename.h"

#include <iostream>

namespace segdl {
namespace cli {
namespace commands {

int probe(const ProbeOptions& options) {
    const auto cfg = loadDownloadConfig();

    RequestOptions request;
    request.headers = options.headers;
    request.timeout = cfg.timeout;

    HttplibTransport transport;
    const auto result = transport.probe(options.url, request);
    if (!result.ok) {
        std::cerr << "Error: probe failed: "
                  << (result.error.empty() ? "HTTP status " + std::to_string(result.status) : result.error)
                  << std::endl;
        return 1;
    }

    const bool segmented = result.accept_ranges && result.content_length.value_or(0) > 0;
    std::cout << "url:       " << options.url << "\n";
    std::cout << "status:    " << result.status << "\n";
    if (result.content_length) {
        std::cout << "size:      " << *result.content_length << " ("
                  << ProgressRenderer::formatBytes(*result.content_length) << ")\n";
    } else {
        std::cout << "size:      unknown\n";
    }
    std::cout << "ranges:    " << (result.accept_ranges ? "yes" : "no") << "\n";
    std::cout << "etag:      " << result.etag.value_or("(none)") << "\n";
    std::cout << "filename:  " << filenameFromHeaders(options.url, result.content_disposition) << "\n";
    std::cout << "mode:      " << (segmented ? "segmented" : "single stream") << std::endl;
    return 0;
}

}  // namespace commands
}  // namespace cli
}  // namespace segdl
