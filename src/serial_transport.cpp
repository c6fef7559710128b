#include "scpi_cpp/transports/serial_transport.hpp"

#include <cerrno>
#include <string>
#include <system_error>
#include <utility>

#include <termios.h>

#include "scpi_cpp/errors.hpp"

namespace scpi {

SerialTransport::SerialTransport(std::string port, unsigned int baud_rate, Duration timeout, std::string terminator)
    : StreamTransport(timeout, std::move(terminator)), port_(std::move(port)), baud_rate_(baud_rate) {}

void SerialTransport::connect() {
    if (is_connected()) return;

    std::error_code ec;
    stream_.open(port_, ec);
    if (ec) throw ConnectionError("Cannot open serial port " + port_ + ": " + ec.message());

    configure();
    buffer_.clear();
}

void SerialTransport::configure() {
    std::error_code ec;

    stream_.set_option(asio::serial_port::baud_rate(baud_rate_), ec);
    if (!ec) stream_.set_option(asio::serial_port::character_size(8), ec);
    if (!ec) stream_.set_option(asio::serial_port::parity(asio::serial_port::parity::none), ec);
    if (!ec) stream_.set_option(asio::serial_port::stop_bits(asio::serial_port::stop_bits::one), ec);
    if (!ec) stream_.set_option(asio::serial_port::flow_control(asio::serial_port::flow_control::none), ec);

    if (ec) {
        close_stream();
        throw ConnectionError("Cannot configure serial port " + port_ + " at " + std::to_string(baud_rate_) +
                              " baud: " + ec.message());
    }
}

void SerialTransport::discard_pending_input() {
    if (::tcflush(stream_.native_handle(), TCIFLUSH) != 0) {
        fail("Flush failed", std::error_code(errno, std::generic_category()));
    }
}

}  // namespace scpi
