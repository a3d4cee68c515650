#include "utils/filename.h"

#include <cctype>

namespace segdl {

namespace {

int hexValue(char c) {
    if (c >= '0' && c <= '9') return c - '0';
    if (c >= 'a' && c <= 'f') return c - 'a' + 10;
    if (c >= 'A' && c <= 'F') return c - 'A' + 10;
    return -1;
}

// Strips directories so a hostile header cannot escape the target directory.
std::string baseName(const std::string& name) {
    const auto slash = name.find_last_of("/\\");
    return slash == std::string::npos ? name : name.substr(slash + 1);
}

std::string fromContentDisposition(const std::string& header) {
    const std::string key = "filename=";
    auto pos = header.find(key);
    if (pos == std::string::npos) return {};
    std::string value = header.substr(pos + key.size());
    const auto semi = value.find(';');
    if (semi != std::string::npos) value.erase(semi);
    while (!value.empty() && std::isspace(static_cast<unsigned char>(value.back()))) value.pop_back();
    while (!value.empty() && (value.front() == '"' || value.front() == '\'')) value.erase(value.begin());
    while (!value.empty() && (value.back() == '"' || value.back() == '\'')) value.pop_back();
    return baseName(percentDecode(value));
}

std::string fromUrl(const std::string& url) {
    std::string path = url;
    const auto scheme = path.find("://");
    if (scheme != std::string::npos) {
        const auto slash = path.find('/', scheme + 3);
        path = slash == std::string::npos ? std::string() : path.substr(slash);
    }
    const auto query = path.find_first_of("?#");
    if (query != std::string::npos) path.erase(query);
    const auto slash = path.find_last_of('/');
    const std::string last = slash == std::string::npos ? path : path.substr(slash + 1);
    return baseName(percentDecode(last));
}

}  // namespace

std::string percentDecode(const std::string& input) {
    std::string out;
    out.reserve(input.size());
    for (size_t i = 0; i < input.size(); ++i) {
        if (input[i] == '%' && i + 2 < input.size()) {
            const int hi = hexValue(input[i + 1]);
            const int lo = hexValue(input[i + 2]);
            if (hi >= 0 && lo >= 0) {
                out.push_back(static_cast<char>((hi << 4) | lo));
                i += 2;
                continue;
            }
        }
        out.push_back(input[i]);
    }
    return out;
}

std::string filenameFromHeaders(const std::string& url, const std::string& content_disposition) {
    std::string name = fromContentDisposition(content_disposition);
    if (name.empty() || name == "." || name == "..") {
        name = fromUrl(url);
    }
    if (name.empty() || name == "." || name == "..") {
        name = "index.html";
    }
    return name;
}

}  // namespace segdl
