#pragma once
#include <string>

#include "scpi_cpp/transports/stream_transport.hpp"

#include <asio.hpp>

namespace scpi {

constexpr unsigned int DEFAULT_BAUD_RATE = 115200;

// SCPI over a serial port (USB-CDC, RS-232, virtual COM ports). The port is
// opened in raw 8N1 mode without flow control.
class SerialTransport : public StreamTransport<asio::serial_port> {
   public:
    explicit SerialTransport(std::string port, unsigned int baud_rate = DEFAULT_BAUD_RATE,
                             Duration timeout = DEFAULT_TIMEOUT, std::string terminator = "\n");
    ~SerialTransport() override = default;

    void connect() override;

    std::string connection_string() const override { return port_; }

    const std::string& port() const { return port_; }
    unsigned int baud_rate() const { return baud_rate_; }

   protected:
    void discard_pending_input() override;

   private:
    std::string port_;
    unsigned int baud_rate_;

    void configure();
};

}  // namespace scpi
