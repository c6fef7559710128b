#include "scpi_cpp/transports.hpp"

#include <charconv>
#include <limits>
#include <memory>
#include <stdexcept>
#include <string>

namespace scpi {

namespace {

unsigned long long parse_number(const std::string& key, const std::string& value, unsigned long long max) {
    unsigned long long number = 0;
    const char* first = value.data();
    const char* last = value.data() + value.size();

    auto [ptr, ec] = std::from_chars(first, last, number);
    if (value.empty() || ec != std::errc() || ptr != last || number > max) {
        throw std::invalid_argument("Invalid value for " + key + ": '" + value + "'");
    }
    return number;
}

std::string terminator_from_name(const std::string& name) {
    if (name == "lf") return "\n";
    if (name == "crlf") return "\r\n";
    if (name == "cr") return "\r";
    throw std::invalid_argument("Unknown terminator '" + name + "', expected lf, crlf or cr");
}

}  // namespace

std::unique_ptr<Transport> create_transport(const UrlParser& url, Duration default_timeout) {
    Duration timeout = default_timeout;
    std::string terminator = "\n";
    unsigned int baud_rate = DEFAULT_BAUD_RATE;

    for (const auto& [key, value] : url.params) {
        if (key == "timeout_ms") {
            timeout = Duration(parse_number(key, value, MAX_TIMEOUT.count()));
        } else if (key == "terminator") {
            terminator = terminator_from_name(value);
        } else if (key == "baud" && url.scheme == "serial") {
            baud_rate = static_cast<unsigned int>(parse_number(key, value, std::numeric_limits<unsigned int>::max()));
        } else {
            throw std::invalid_argument("Unknown parameter '" + key + "' for scheme " + url.scheme);
        }
    }

    if (url.host.empty()) throw std::invalid_argument("Missing address in " + url.scheme + " resource URL");

    if (url.scheme == "tcp") {
        uint16_t port = DEFAULT_TCP_PORT;
        if (!url.port.empty()) port = static_cast<uint16_t>(parse_number("port", url.port, 65535));

        return std::make_unique<TcpTransport>(url.host, port, timeout, terminator);
    } else if (url.scheme == "serial") {
        return std::make_unique<SerialTransport>(url.host, baud_rate, timeout, terminator);
    } else {
        throw std::invalid_argument("Unknown transport scheme: " + url.scheme);
    }
}

}  // namespace scpi
