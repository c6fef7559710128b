#pragma once
#include <algorithm>
#include <cstddef>
#include <cstdint>
#include <iostream>
#include <stdexcept>
#include <string>
#include <system_error>
#include <utility>

#include "scpi_cpp/errors.hpp"
#include "scpi_cpp/transports/transport.hpp"
#include "scpi_cpp/types.hpp"

#include <asio.hpp>

namespace scpi {

// Line framing and deadline handling shared by every asio stream (tcp socket,
// serial port). Subclasses only know how to open the stream and how to drop
// input queued below the asio layer.
//
// Each instance owns a private io_context that is run only from inside a
// blocking call and only for as long as that call's timeout allows.
template <typename Stream>
class StreamTransport : public Transport {
   public:
    using Transport::receive;
    using Transport::receive_raw;

    StreamTransport(Duration timeout, std::string terminator)
        : Transport(timeout), stream_(io_), terminator_(std::move(terminator)) {
        if (terminator_.empty()) throw std::invalid_argument("Line terminator must not be empty");
    }

    ~StreamTransport() override { close_stream(); }

    void disconnect() noexcept override { close_stream(); }

    bool is_connected() const override { return stream_.is_open(); }

    void send(const std::string& data) override {
        if (ends_with_terminator(data)) {
            write(data.data(), data.size());
            return;
        }

        std::string payload = data + terminator_;
        write(payload.data(), payload.size());
    }

    void send_raw(const Bytes& data) override { write(data.data(), data.size()); }

    std::string receive(Duration timeout) override {
        ensure_connected();

        std::size_t end = buffer_.find(terminator_);
        if (end == std::string::npos) {
            std::error_code ec;
            std::size_t length = 0;
            asio::async_read_until(stream_, asio::dynamic_buffer(buffer_), terminator_,
                                   [&](const std::error_code& error, std::size_t n) {
                                       ec = error;
                                       length = n;
                                   });
            run(timeout);

            if (ec == asio::error::operation_aborted) {
                throw TimeoutError("Timeout waiting for response from " + connection_string());
            }
            if (ec) fail("Receive failed", ec);

            end = length - terminator_.size();
        }

        std::string line = buffer_.substr(0, end);
        buffer_.erase(0, end + terminator_.size());

        if (!line.empty() && line.back() == '\r') line.pop_back();
        return line;
    }

    Bytes receive_raw(std::size_t count, Duration timeout) override {
        ensure_connected();

        if (buffer_.size() < count) {
            std::error_code ec;
            asio::async_read(stream_, asio::dynamic_buffer(buffer_), asio::transfer_exactly(count - buffer_.size()),
                             [&](const std::error_code& error, std::size_t) { ec = error; });
            run(timeout);

            if (ec == asio::error::operation_aborted) {
                throw TimeoutError("Timeout reading " + std::to_string(count) + " raw bytes from " +
                                   connection_string() + ", got " + std::to_string(buffer_.size()));
            }
            if (ec) fail("Raw receive failed", ec);
        }

        Bytes data(buffer_.begin(), buffer_.begin() + static_cast<std::ptrdiff_t>(count));
        buffer_.erase(0, count);
        return data;
    }

    void flush_input() override {
        ensure_connected();
        buffer_.clear();
        discard_pending_input();
    }

    const std::string& terminator() const { return terminator_; }

   protected:
    asio::io_context io_;
    Stream stream_;
    std::string buffer_;

    // Drops bytes the OS has received but asio has not read yet.
    virtual void discard_pending_input() = 0;

    void ensure_connected() const {
        if (!is_connected()) throw ConnectionError("Not connected to " + connection_string());
    }

    // Runs the pending operation for at most timeout. If it is still pending
    // afterwards, cancel() is invoked and the operation drained, so its
    // handler always completes (with operation_aborted on expiry) before
    // this returns. Per-call timeouts are clamped to [0, MAX_TIMEOUT].
    template <typename Cancel>
    void run(Duration timeout, Cancel cancel) {
        io_.restart();
        io_.run_for(std::clamp(timeout, Duration::zero(), MAX_TIMEOUT));

        if (!io_.stopped()) {
            cancel();
            io_.run();
        }
    }

    void run(Duration timeout) {
        run(timeout, [this] {
            std::error_code ignored;
            stream_.cancel(ignored);
        });
    }

    // I/O failures other than a timeout leave the stream unusable.
    [[noreturn]] void fail(const std::string& what, const std::error_code& ec) {
        std::string target = connection_string();
        close_stream();

        if (ec == asio::error::eof) throw ConnectionError("Connection closed by instrument " + target);
        throw ConnectionError(what + " on " + target + ": " + ec.message());
    }

    void close_stream() noexcept {
        buffer_.clear();
        if (!stream_.is_open()) return;

        std::error_code ec;
        stream_.close(ec);
        if (ec) std::cerr << "Close error: " << ec.message() << std::endl;
    }

   private:
    std::string terminator_;

    bool ends_with_terminator(const std::string& data) const {
        return data.size() >= terminator_.size() &&
               data.compare(data.size() - terminator_.size(), terminator_.size(), terminator_) == 0;
    }

    void write(const void* data, std::size_t length) {
        ensure_connected();

        std::error_code ec;
        asio::async_write(stream_, asio::buffer(data, length), [&](const std::error_code& error, std::size_t) {
            ec = error;
        });
        run(timeout_);

        if (ec == asio::error::operation_aborted) throw TimeoutError("Timeout sending to " + connection_string());
        if (ec) fail("Send failed", ec);
    }
};

}  // namespace scpi
