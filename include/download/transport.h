#pragma once

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <map>
#include <optional>
#include <string>

namespace segdl {

/// Options applied identically to every request of one download.
struct RequestOptions {
    std::map<std::string, std::string> headers;
    std::chrono::milliseconds timeout{20000};
    std::string proxy_host;
    int proxy_port{0};
    bool verify_tls{true};
    bool follow_redirects{true};
};

/// Response status line and headers. Header names are lower-cased.
struct ResponseHead {
    int status{0};
    std::map<std::string, std::string> headers;

    std::string header(const std::string& name) const;
};

/// Outcome of one streamed request. Never thrown.
struct TransportResult {
    bool ok{false};        // a response arrived and was streamed to its end
    int status{0};
    bool canceled{false};  // a handler returned false
    std::string error;
};

struct ProbeResult {
    bool ok{false};
    int status{0};
    std::optional<uint64_t> content_length;
    bool accept_ranges{false};
    std::optional<std::string> etag;
    std::string content_disposition;
    std::string error;
};

using ResponseHandler = std::function<bool(const ResponseHead& head)>;
using ContentReceiver = std::function<bool(const char* data, size_t length)>;

/// HTTP capability consumed by the workers and the coordinator.
/// Implementations must be safe to call from several threads at once.
class Transport {
public:
    virtual ~Transport() = default;

    /// GET url with extra_headers (e.g. Range) on top of options.headers.
    virtual TransportResult get(const std::string& url,
                                const std::map<std::string, std::string>& extra_headers,
                                const RequestOptions& options,
                                const ResponseHandler& on_response,
                                const ContentReceiver& on_data) = 0;

    /// Size, range support and validator of url.
    virtual ProbeResult probe(const std::string& url, const RequestOptions& options) = 0;
};

std::string toLowerAscii(std::string value);

}  // namespace segdl
