#pragma once
#include <cstddef>
#include <cstdint>
#include <stdexcept>
#include <string>

#include "scpi_cpp/types.hpp"

namespace scpi {

// Connection-oriented, line-framed byte stream to an instrument.
//
// Every blocking call is bounded: either by the timeout passed in or by the
// default carried by the instance. Instances are not safe for concurrent use;
// callers sharing one across threads must serialise access themselves.
class Transport {
   public:
    explicit Transport(Duration timeout = DEFAULT_TIMEOUT) : timeout_(checked_timeout(timeout)) {}
    virtual ~Transport() = default;

    Transport(const Transport&) = delete;
    Transport& operator=(const Transport&) = delete;

    // No-op when already connected.
    virtual void connect() = 0;
    // Idempotent, never fails.
    virtual void disconnect() noexcept = 0;
    virtual bool is_connected() const = 0;

    // Writes data followed by the line terminator.
    virtual void send(const std::string& data) = 0;
    // Writes data verbatim.
    virtual void send_raw(const Bytes& data) = 0;

    // Returns the next complete line without its terminator.
    std::string receive() { return receive(timeout_); }
    virtual std::string receive(Duration timeout) = 0;

    // Returns exactly count bytes, ignoring line framing.
    Bytes receive_raw(std::size_t count) { return receive_raw(count, timeout_); }
    virtual Bytes receive_raw(std::size_t count, Duration timeout) = 0;

    // Drops buffered and pending input, e.g. a late reply after a timeout.
    virtual void flush_input() = 0;

    virtual std::string connection_string() const = 0;

    Duration timeout() const { return timeout_; }
    // Throws std::invalid_argument outside [0, MAX_TIMEOUT].
    void set_timeout(Duration timeout) { timeout_ = checked_timeout(timeout); }

   protected:
    Duration timeout_;

   private:
    static Duration checked_timeout(Duration timeout) {
        if (timeout < Duration::zero() || timeout > MAX_TIMEOUT) {
            throw std::invalid_argument("Timeout out of range: " + std::to_string(timeout.count()) + " ms");
        }
        return timeout;
    }
};

}  // namespace scpi
