#include "scpi_cpp/url_parser.hpp"

#include <stdexcept>

namespace scpi {

namespace {

void parse_query(const std::string& query, UrlParser& parts) {
    std::size_t start = 0;
    while (start <= query.size()) {
        std::size_t end = query.find('&', start);
        if (end == std::string::npos) end = query.size();

        std::string pair = query.substr(start, end - start);
        start = end + 1;
        // "host?" and "a=1&" carry no parameter.
        if (pair.empty()) continue;

        std::size_t eq = pair.find('=');
        if (eq == std::string::npos || eq == 0) throw std::invalid_argument("Malformed URL parameter: " + pair);

        parts.params[pair.substr(0, eq)] = pair.substr(eq + 1);
    }
}

}  // namespace

UrlParser parse_url(const std::string& url) {
    UrlParser parts;

    std::size_t scheme_end = url.find("://");
    if (scheme_end == std::string::npos || scheme_end == 0) {
        throw std::invalid_argument("Missing scheme in resource URL: " + url);
    }

    parts.scheme = url.substr(0, scheme_end);
    std::string rest = url.substr(scheme_end + 3);

    std::size_t query_pos = rest.find('?');
    if (query_pos != std::string::npos) {
        parse_query(rest.substr(query_pos + 1), parts);
        rest.erase(query_pos);
    }

    // Serial resources carry a device path, which may itself contain '/'.
    if (parts.scheme == "serial") {
        parts.host = rest;
        return parts;
    }

    std::size_t slash_pos = rest.find('/');
    if (slash_pos != std::string::npos) rest.erase(slash_pos);

    if (!rest.empty() && rest.front() == '[') {
        std::size_t close = rest.find(']');
        if (close == std::string::npos) throw std::invalid_argument("Unterminated IPv6 address in URL: " + url);

        parts.host = rest.substr(1, close - 1);
        if (close + 1 < rest.size() && rest[close + 1] == ':') parts.port = rest.substr(close + 2);
        return parts;
    }

    std::size_t colon_pos = rest.find(':');
    if (colon_pos != std::string::npos) {
        parts.host = rest.substr(0, colon_pos);
        parts.port = rest.substr(colon_pos + 1);
    } else {
        parts.host = rest;
    }

    return parts;
}

}  // namespace scpi
