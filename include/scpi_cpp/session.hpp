#pragma once
#include <cstddef>
#include <cstdint>
#include <iosfwd>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "scpi_cpp/transports/transport.hpp"
#include "scpi_cpp/types.hpp"

namespace scpi {

// Request/response session with one instrument.
//
// The session shares its transport with the caller and never connects or
// reconnects on its own. The protocol is half-duplex: each query's reply is
// consumed before the next command goes out. Not thread-safe; callers
// sharing a session across threads must serialise access themselves.
class Session {
   public:
    explicit Session(std::shared_ptr<Transport> transport);

    std::shared_ptr<Transport> transport() const { return transport_; }

    void connect();
    void disconnect() noexcept;
    bool is_connected() const;

    // Writes "-> command" and "<- reply" lines to out; nullptr turns it off.
    void set_trace(std::ostream* out) { trace_ = out; }

    void command(const std::string& cmd);

    std::string query(const std::string& cmd, std::optional<Duration> timeout = std::nullopt);
    double query_float(const std::string& cmd, std::optional<Duration> timeout = std::nullopt);
    int64_t query_int(const std::string& cmd, std::optional<Duration> timeout = std::nullopt);
    bool query_bool(const std::string& cmd, std::optional<Duration> timeout = std::nullopt);

    // Reads exactly count bytes after sending cmd. Block headers, if the
    // instrument sends any, are part of the returned bytes.
    Bytes query_raw(const std::string& cmd, std::size_t count, std::optional<Duration> timeout = std::nullopt);

    // IEEE 488.2 common commands

    std::string idn();
    Identity identify();
    void reset();
    void clear_status();
    void wait();
    bool opc(std::optional<Duration> timeout = std::nullopt);
    void save_state(int slot);
    void recall_state(int slot);
    int64_t self_test();

    // Pops one entry from the error queue; nullopt when the queue is empty.
    std::optional<ErrorEntry> check_error();
    // Pops entries until the queue is empty or limit entries were read.
    std::vector<ErrorEntry> drain_errors(std::size_t limit = 32);

   private:
    std::shared_ptr<Transport> transport_;
    std::ostream* trace_ = nullptr;

    void ensure_connected() const;
    std::string receive(std::optional<Duration> timeout);

    template <typename Parse>
    auto parse_reply(const std::string& cmd, const std::string& response, Parse parse) -> decltype(parse(response));
};

// Connects a session for the lifetime of a scope and disconnects it on every
// exit path, including stack unwinding.
class ScopedConnection {
   public:
    explicit ScopedConnection(Session& session);
    ~ScopedConnection();

    ScopedConnection(const ScopedConnection&) = delete;
    ScopedConnection& operator=(const ScopedConnection&) = delete;

    Session& session() { return session_; }
    Session* operator->() { return &session_; }

   private:
    Session& session_;
};

}  // namespace scpi
