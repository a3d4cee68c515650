#pragma once

#include <string>

namespace segdl {

// Decodes %XX escapes; malformed escapes are kept verbatim.
std::string percentDecode(const std::string& input);

// File name for a download: the Content-Disposition filename when present,
// otherwise the last path component of url. Never returns an empty string.
std::string filenameFromHeaders(const std::string& url, const std::string& content_disposition);

}  // namespace segdl
