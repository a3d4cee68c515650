#include "download/httplib_transport.h"

#include <algorithm>
#include <cctype>
#include <charconv>
#include <exception>
#include <httplib.h>
#include <memory>
#include <regex>
#include <spdlog/spdlog.h>

namespace {

struct HttpUrl {
    std::string scheme;
    std::string host;
    int port{0};
    std::string path;
};

HttpUrl parseUrl(const std::string& url) {
    static const std::regex re(R"(^([a-zA-Z][a-zA-Z0-9+.-]*)://([^/:?#]+)(?::(\d+))?(.*)$)");
    std::smatch match;
    HttpUrl parsed;
    if (std::regex_match(url, match, re)) {
        parsed.scheme = segdl::toLowerAscii(match[1].str());
        parsed.host = match[2].str();
        parsed.port = parsed.scheme == "https" ? 443 : 80;
        if (match[3].matched) {
            // an unusable port leaves the whole URL unparsed
            const std::string port = match[3].str();
            int value = 0;
            const auto [end, ec] = std::from_chars(port.data(), port.data() + port.size(), value);
            if (ec != std::errc() || end != port.data() + port.size() || value < 1 || value > 65535) {
                return HttpUrl{};
            }
            parsed.port = value;
        }
        parsed.path = match[4].str();
        const auto fragment = parsed.path.find('#');
        if (fragment != std::string::npos) parsed.path.erase(fragment);
        if (parsed.path.empty()) {
            parsed.path = "/";
        } else if (parsed.path.front() == '?') {
            parsed.path.insert(parsed.path.begin(), '/');
        }
    }
    return parsed;
}

std::unique_ptr<httplib::Client> makeClient(const HttpUrl& url,
                                            const segdl::RequestOptions& options,
                                            std::string& error) {
    if (url.scheme.empty() || url.host.empty()) {
        error = "invalid URL";
        return nullptr;
    }
    if (url.scheme != "http" && url.scheme != "https") {
        error = "unsupported scheme '" + url.scheme + "'";
        return nullptr;
    }
#ifndef CPPHTTPLIB_OPENSSL_SUPPORT
    if (url.scheme == "https") {
        error = "HTTPS is not supported in this build";
        return nullptr;
    }
#endif

    const std::string scheme_host_port = url.scheme + "://" + url.host + ":" + std::to_string(url.port);
    auto client = std::make_unique<httplib::Client>(scheme_host_port);
    if (!client->is_valid()) {
        error = "failed to create HTTP client for " + scheme_host_port;
        return nullptr;
    }

    const auto timeout = options.timeout.count();
    const time_t sec = static_cast<time_t>(timeout / 1000);
    const time_t usec = static_cast<time_t>((timeout % 1000) * 1000);
    client->set_connection_timeout(sec, usec);
    client->set_read_timeout(sec, usec);
    client->set_write_timeout(sec, usec);
    client->set_follow_location(options.follow_redirects);
    if (!options.proxy_host.empty() && options.proxy_port > 0) {
        client->set_proxy(options.proxy_host, options.proxy_port);
    }
#ifdef CPPHTTPLIB_OPENSSL_SUPPORT
    client->enable_server_certificate_verification(options.verify_tls);
#endif
    return client;
}

httplib::Headers buildHeaders(const segdl::RequestOptions& options,
                              const std::map<std::string, std::string>& extra) {
    httplib::Headers headers;
    for (const auto& kv : options.headers) {
        headers.emplace(kv.first, kv.second);
    }
    for (const auto& kv : extra) {
        headers.erase(kv.first);
        headers.emplace(kv.first, kv.second);
    }
    return headers;
}

segdl::ResponseHead toHead(const httplib::Response& res) {
    segdl::ResponseHead head;
    head.status = res.status;
    for (const auto& kv : res.headers) {
        head.headers[segdl::toLowerAscii(kv.first)] = kv.second;
    }
    return head;
}

void fillProbe(segdl::ProbeResult& out, const segdl::ResponseHead& head) {
    out.status = head.status;
    const auto length = head.header("content-length");
    if (!length.empty()) {
        try {
            out.content_length = static_cast<uint64_t>(std::stoull(length));
        } catch (const std::exception&) {
            out.content_length.reset();
        }
    }
    out.accept_ranges = segdl::toLowerAscii(head.header("accept-ranges")).find("bytes") != std::string::npos;
    const auto etag = head.header("etag");
    if (!etag.empty()) out.etag = etag;
    out.content_disposition = head.header("content-disposition");
}

bool isSuccess(int status) { return status >= 200 && status < 300; }

}  // namespace

namespace segdl {

std::string toLowerAscii(std::string value) {
    std::transform(value.begin(), value.end(), value.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return value;
}

std::string ResponseHead::header(const std::string& name) const {
    auto it = headers.find(toLowerAscii(name));
    return it == headers.end() ? std::string() : it->second;
}

TransportResult HttplibTransport::get(const std::string& url,
                                      const std::map<std::string, std::string>& extra_headers,
                                      const RequestOptions& options,
                                      const ResponseHandler& on_response,
                                      const ContentReceiver& on_data) {
    TransportResult result;
    const HttpUrl parsed = parseUrl(url);
    auto client = makeClient(parsed, options, result.error);
    if (!client) {
        return result;
    }

    bool aborted = false;
    auto res = client->Get(
        parsed.path,
        buildHeaders(options, extra_headers),
        [&](const httplib::Response& response) {
            result.status = response.status;
            if (on_response && !on_response(toHead(response))) {
                aborted = true;
                return false;
            }
            return true;
        },
        [&](const char* data, size_t data_length) {
            if (on_data && !on_data(data, data_length)) {
                aborted = true;
                return false;
            }
            return true;
        });

    if (!res) {
        result.canceled = aborted || res.error() == httplib::Error::Canceled;
        result.error = aborted ? "transfer aborted by receiver" : httplib::to_string(res.error());
        return result;
    }
    result.status = res->status;
    result.ok = true;
    return result;
}

ProbeResult HttplibTransport::probe(const std::string& url, const RequestOptions& options) {
    ProbeResult out;
    const HttpUrl parsed = parseUrl(url);
    auto client = makeClient(parsed, options, out.error);
    if (!client) {
        return out;
    }

    const auto headers = buildHeaders(options, {});
    auto res = client->Head(parsed.path, headers);
    if (res && isSuccess(res->status)) {
        fillProbe(out, toHead(*res));
        out.ok = true;
        return out;
    }
    if (res) {
        spdlog::debug("HttplibTransport: HEAD {} returned {}, retrying with GET", url, res->status);
    } else {
        spdlog::debug("HttplibTransport: HEAD {} failed ({}), retrying with GET", url,
                      httplib::to_string(res.error()));
    }

    // Some servers reject HEAD; read the headers of a GET and drop the body.
    std::optional<ResponseHead> head;
    auto get_res = client->Get(parsed.path, headers,
                               [&](const httplib::Response& response) {
                                   head = toHead(response);
                                   return false;
                               },
                               [](const char*, size_t) { return false; });
    if (!head.has_value()) {
        out.status = get_res ? get_res->status : 0;
        out.error = get_res ? "unexpected response" : httplib::to_string(get_res.error());
        return out;
    }
    fillProbe(out, *head);
    if (!isSuccess(head->status)) {
        out.error = "HTTP status " + std::to_string(head->status);
        return out;
    }
    out.ok = true;
    return out;
}

}  // namespace segdl
