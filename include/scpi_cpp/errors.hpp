#pragma once
#include <stdexcept>
#include <string>
#include <utility>

namespace scpi {

// Root of every failure raised by transports and sessions.
class Error : public std::runtime_error {
   public:
    explicit Error(const std::string& message) : std::runtime_error(message) {}
};

// Connect refused or unreachable, I/O on a closed connection, peer hang-up.
class ConnectionError : public Error {
   public:
    explicit ConnectionError(const std::string& message) : Error(message) {}
};

// A blocking operation did not complete before its deadline.
class TimeoutError : public Error {
   public:
    explicit TimeoutError(const std::string& message) : Error(message) {}
};

// A reply arrived but could not be interpreted. Keeps the raw reply text.
class ProtocolError : public Error {
   public:
    ProtocolError(const std::string& message, std::string response)
        : Error(message), response_(std::move(response)) {}

    const std::string& response() const noexcept { return response_; }

   private:
    std::string response_;
};

}  // namespace scpi
