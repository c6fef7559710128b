#include "scpi_cpp/transports/tcp_transport.hpp"

#include <algorithm>
#include <chrono>
#include <iostream>
#include <string>
#include <system_error>
#include <utility>
#include <vector>

#include "scpi_cpp/errors.hpp"

namespace scpi {

TcpTransport::TcpTransport(std::string host, uint16_t port, Duration timeout, std::string terminator)
    : StreamTransport(timeout, std::move(terminator)), host_(std::move(host)), port_(port) {}

TcpTransport::~TcpTransport() { disconnect(); }

void TcpTransport::connect() {
    if (is_connected()) return;

    auto deadline = std::chrono::steady_clock::now() + timeout_;

    std::error_code ec;
    std::vector<asio::ip::tcp::endpoint> endpoints = resolve(ec);
    if (ec == asio::error::operation_aborted) throw TimeoutError("Timeout resolving " + connection_string());
    if (ec) throw ConnectionError("Cannot resolve " + connection_string() + ": " + ec.message());

    auto remaining = std::max(std::chrono::duration_cast<Duration>(deadline - std::chrono::steady_clock::now()),
                              Duration::zero());

    // The range connect retries the next endpoint after a plain cancel, so a
    // deadline has to close the socket to stop it.
    asio::async_connect(stream_, endpoints,
                        [&](const std::error_code& error, const asio::ip::tcp::endpoint&) { ec = error; });
    run(remaining, [this] {
        std::error_code ignored;
        stream_.close(ignored);
    });

    if (ec == asio::error::operation_aborted) {
        close_stream();
        throw TimeoutError("Timeout connecting to " + connection_string());
    }
    if (ec) {
        close_stream();
        throw ConnectionError("Cannot connect to " + connection_string() + ": " + ec.message());
    }

    buffer_.clear();
}

// Numeric addresses never reach the resolver. A host name is looked up by a
// blocking getaddrinfo that cancel() cannot interrupt, so its lookup is
// bounded by the system resolver rather than by timeout_.
std::vector<asio::ip::tcp::endpoint> TcpTransport::resolve(std::error_code& ec) {
    std::vector<asio::ip::tcp::endpoint> endpoints;

    asio::ip::address address = asio::ip::make_address(host_, ec);
    if (!ec) {
        endpoints.emplace_back(address, port_);
        return endpoints;
    }
    ec.clear();

    asio::ip::tcp::resolver resolver(io_);
    resolver.async_resolve(host_, std::to_string(port_), asio::ip::tcp::resolver::numeric_service,
                           [&](const std::error_code& error, asio::ip::tcp::resolver::results_type results) {
                               ec = error;
                               for (const auto& entry : results) endpoints.push_back(entry.endpoint());
                           });
    run(timeout_, [&resolver] { resolver.cancel(); });

    return endpoints;
}

void TcpTransport::disconnect() noexcept {
    if (is_connected()) {
        std::error_code ec;
        stream_.shutdown(asio::ip::tcp::socket::shutdown_both, ec);
        if (ec && ec != asio::error::not_connected) std::cerr << "Shutdown error: " << ec.message() << std::endl;
    }

    close_stream();
}

std::string TcpTransport::connection_string() const { return host_ + ":" + std::to_string(port_); }

void TcpTransport::discard_pending_input() {
    std::error_code ec;
    std::vector<uint8_t> scratch;

    for (std::size_t pending = stream_.available(ec); !ec && pending > 0; pending = stream_.available(ec)) {
        scratch.resize(pending);
        stream_.read_some(asio::buffer(scratch), ec);
    }

    if (ec) fail("Flush failed", ec);
}

}  // namespace scpi
