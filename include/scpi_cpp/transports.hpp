#pragma once
#include <memory>
#include <string>

#include "scpi_cpp/types.hpp"
#include "scpi_cpp/url_parser.hpp"

#include "transports/serial_transport.hpp"
#include "transports/tcp_transport.hpp"
#include "transports/transport.hpp"

namespace scpi {

// Builds a disconnected transport from a resource URL. Parameters in the URL
// override default_timeout. Throws std::invalid_argument on an unknown scheme
// or parameter.
std::unique_ptr<Transport> create_transport(const UrlParser& url, Duration default_timeout = DEFAULT_TIMEOUT);

inline std::unique_ptr<Transport> create_transport(const std::string& url, Duration default_timeout = DEFAULT_TIMEOUT) {
    return create_transport(parse_url(url), default_timeout);
}

}  // namespace scpi
