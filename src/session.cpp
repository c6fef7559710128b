#include "scpi_cpp/session.hpp"

#include <iostream>
#include <memory>
#include <stdexcept>
#include <string>
#include <utility>

#include "scpi_cpp/errors.hpp"
#include "scpi_cpp/response.hpp"

namespace scpi {

Session::Session(std::shared_ptr<Transport> transport) : transport_(std::move(transport)) {
    if (!transport_) throw std::invalid_argument("Session requires a transport");
}

void Session::connect() {
    if (!transport_->is_connected()) transport_->connect();
}

void Session::disconnect() noexcept { transport_->disconnect(); }

bool Session::is_connected() const { return transport_->is_connected(); }

void Session::ensure_connected() const {
    if (!transport_->is_connected()) throw ConnectionError("Not connected to " + transport_->connection_string());
}

void Session::command(const std::string& cmd) {
    ensure_connected();
    if (trace_) *trace_ << "-> " << cmd << std::endl;

    transport_->send(cmd);
}

std::string Session::receive(std::optional<Duration> timeout) {
    std::string response = transport_->receive(timeout.value_or(transport_->timeout()));
    if (trace_) *trace_ << "<- " << response << std::endl;

    return response;
}

std::string Session::query(const std::string& cmd, std::optional<Duration> timeout) {
    command(cmd);
    return receive(timeout);
}

template <typename Parse>
auto Session::parse_reply(const std::string& cmd, const std::string& response, Parse parse)
    -> decltype(parse(response)) {
    try {
        return parse(response);
    } catch (const ProtocolError& e) {
        throw ProtocolError(std::string(e.what()) + " for " + cmd, e.response());
    }
}

double Session::query_float(const std::string& cmd, std::optional<Duration> timeout) {
    return parse_reply(cmd, query(cmd, timeout), parse_double);
}

int64_t Session::query_int(const std::string& cmd, std::optional<Duration> timeout) {
    return parse_reply(cmd, query(cmd, timeout), parse_int);
}

bool Session::query_bool(const std::string& cmd, std::optional<Duration> timeout) {
    return parse_reply(cmd, query(cmd, timeout), parse_bool);
}

Bytes Session::query_raw(const std::string& cmd, std::size_t count, std::optional<Duration> timeout) {
    command(cmd);

    Bytes data = transport_->receive_raw(count, timeout.value_or(transport_->timeout()));
    if (trace_) *trace_ << "<- <" << data.size() << " bytes>" << std::endl;

    return data;
}

std::string Session::idn() { return query("*IDN?"); }

Identity Session::identify() { return parse_reply("*IDN?", idn(), parse_identity); }

void Session::reset() { command("*RST"); }

void Session::clear_status() { command("*CLS"); }

void Session::wait() { command("*WAI"); }

bool Session::opc(std::optional<Duration> timeout) { return trim(query("*OPC?", timeout)) == "1"; }

void Session::save_state(int slot) { command("*SAV " + std::to_string(slot)); }

void Session::recall_state(int slot) { command("*RCL " + std::to_string(slot)); }

int64_t Session::self_test() { return query_int("*TST?"); }

std::optional<ErrorEntry> Session::check_error() {
    ErrorEntry entry = parse_reply(":SYST:ERR?", query(":SYST:ERR?"), parse_error_entry);
    if (entry.code == 0) return std::nullopt;

    return entry;
}

std::vector<ErrorEntry> Session::drain_errors(std::size_t limit) {
    std::vector<ErrorEntry> entries;

    while (entries.size() < limit) {
        auto entry = check_error();
        if (!entry) break;

        entries.push_back(std::move(*entry));
    }

    return entries;
}

ScopedConnection::ScopedConnection(Session& session) : session_(session) { session_.connect(); }

ScopedConnection::~ScopedConnection() { session_.disconnect(); }

}  // namespace scpi
