#pragma once
#include <cstdint>
#include <string>
#include <system_error>
#include <vector>

#include "scpi_cpp/transports/stream_transport.hpp"

#include <asio.hpp>

namespace scpi {

// Raw socket port used by most LXI instruments.
constexpr uint16_t DEFAULT_TCP_PORT = 5555;

// SCPI over a TCP socket (LAN/LXI instruments).
class TcpTransport : public StreamTransport<asio::ip::tcp::socket> {
   public:
    explicit TcpTransport(std::string host, uint16_t port = DEFAULT_TCP_PORT, Duration timeout = DEFAULT_TIMEOUT,
                          std::string terminator = "\n");
    ~TcpTransport() override;

    // Resolution and connection share one deadline.
    void connect() override;
    void disconnect() noexcept override;

    std::string connection_string() const override;

    const std::string& host() const { return host_; }
    uint16_t port() const { return port_; }

   protected:
    void discard_pending_input() override;

   private:
    std::vector<asio::ip::tcp::endpoint> resolve(std::error_code& ec);

    std::string host_;
    uint16_t port_;
};

}  // namespace scpi
