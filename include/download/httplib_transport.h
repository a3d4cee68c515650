#pragma once

#include "download/transport.h"

namespace segdl {

/// Transport backed by cpp-httplib. Every call opens its own client, so
/// segment workers get independent connections. https:// URLs need a
/// cpp-httplib built with CPPHTTPLIB_OPENSSL_SUPPORT.
class HttplibTransport : public Transport {
public:
    TransportResult get(const std::string& url,
                        const std::map<std::string, std::string>& extra_headers,
                        const RequestOptions& options,
                        const ResponseHandler& on_response,
                        const ContentReceiver& on_data) override;

    ProbeResult probe(const std::string& url, const RequestOptions& options) override;
};

}  // namespace segdl
