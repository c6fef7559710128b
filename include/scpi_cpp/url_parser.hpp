#pragma once

#include <map>
#include <string>

namespace scpi {

// Parts of an instrument resource URL:
//   tcp://192.168.1.20:5555?timeout_ms=2000
//   serial:///dev/ttyUSB0?baud=9600&terminator=crlf
struct UrlParser {
    std::string scheme;
    std::string host;
    std::string port;
    std::map<std::string, std::string> params;
};

// Throws std::invalid_argument when the URL has no scheme or a malformed
// query string.
UrlParser parse_url(const std::string& url);

}  // namespace scpi
