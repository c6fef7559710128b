#include <cassert>
#include <chrono>
#include <cstdint>
#include <functional>
#include <future>
#include <iostream>
#include <memory>
#include <string>
#include <thread>
#include <vector>

#include "scpi_cpp/errors.hpp"
#include "scpi_cpp/session.hpp"
#include "scpi_cpp/transports/tcp_transport.hpp"

#include <asio.hpp>

using namespace scpi;
using namespace std::chrono_literals;

template <typename E, typename F>
void expect_throws(F&& f) {
    try {
        f();
    } catch (const E&) {
        return;
    }
    assert(false && "expected exception was not thrown");
}

// Loopback server accepting a single client on an ephemeral port and
// handing the socket to a handler on a background thread.
class TestServer {
   public:
    using Handler = std::function<void(asio::ip::tcp::socket&)>;

    explicit TestServer(Handler handler)
        : acceptor_(io_, asio::ip::tcp::endpoint(asio::ip::make_address("127.0.0.1"), 0)) {
        thread_ = std::thread([this, handler] {
            asio::ip::tcp::socket socket(io_);
            acceptor_.accept(socket);
            handler(socket);
        });
    }

    ~TestServer() {
        if (thread_.joinable()) thread_.join();
    }

    uint16_t port() const { return acceptor_.local_endpoint().port(); }

   private:
    asio::io_context io_;
    asio::ip::tcp::acceptor acceptor_;
    std::thread thread_;
};

std::string read_line(asio::ip::tcp::socket& socket) {
    std::string data;
    std::size_t n = asio::read_until(socket, asio::dynamic_buffer(data), "\n");
    return data.substr(0, n);
}

void write_all(asio::ip::tcp::socket& socket, const std::string& data) { asio::write(socket, asio::buffer(data)); }

uint16_t closed_port() {
    asio::io_context io;
    asio::ip::tcp::acceptor acceptor(io, asio::ip::tcp::endpoint(asio::ip::make_address("127.0.0.1"), 0));
    uint16_t port = acceptor.local_endpoint().port();
    acceptor.close();
    return port;
}

void test_connect_disconnect() {
    TestServer server([](asio::ip::tcp::socket& socket) {
        std::string ignored;
        std::error_code ec;
        asio::read(socket, asio::dynamic_buffer(ignored), ec);
    });

    TcpTransport transport("127.0.0.1", server.port(), 2s);
    assert(!transport.is_connected());

    transport.connect();
    assert(transport.is_connected());

    transport.connect();
    assert(transport.is_connected());

    transport.disconnect();
    assert(!transport.is_connected());
    transport.disconnect();
}

void test_connect_refused() {
    TcpTransport transport("127.0.0.1", closed_port(), 1s);
    expect_throws<ConnectionError>([&] { transport.connect(); });
    assert(!transport.is_connected());
}

// A listener that never accepts: once its backlog is full the kernel drops
// further SYNs, so the next connect stalls until its deadline.
void test_connect_timeout_is_bounded() {
    asio::io_context io;
    asio::ip::tcp::acceptor acceptor(io);
    asio::ip::tcp::endpoint endpoint(asio::ip::make_address("127.0.0.1"), 0);
    acceptor.open(endpoint.protocol());
    acceptor.bind(endpoint);
    acceptor.listen(0);
    uint16_t port = acceptor.local_endpoint().port();

    std::vector<std::unique_ptr<TcpTransport>> queued;
    bool timed_out = false;
    for (int attempt = 0; attempt < 16 && !timed_out; ++attempt) {
        auto transport = std::make_unique<TcpTransport>("127.0.0.1", port, 100ms);

        auto start = std::chrono::steady_clock::now();
        try {
            transport->connect();
            queued.push_back(std::move(transport));
        } catch (const TimeoutError&) {
            auto elapsed = std::chrono::steady_clock::now() - start;
            assert(elapsed >= 90ms);
            assert(elapsed < 1s);
            assert(!transport->is_connected());
            timed_out = true;
        }
    }

    assert(timed_out);
}

void test_send_and_receive() {
    std::promise<std::string> received;
    TestServer server([&received](asio::ip::tcp::socket& socket) {
        received.set_value(read_line(socket));
        write_all(socket, "REPLY\n");
    });

    TcpTransport transport("127.0.0.1", server.port(), 2s);
    transport.connect();
    transport.send("HELLO");

    assert(transport.receive() == "REPLY");
    assert(received.get_future().get() == "HELLO\n");
    transport.disconnect();
}

void test_send_does_not_double_terminator() {
    std::promise<std::string> received;
    TestServer server([&received](asio::ip::tcp::socket& socket) {
        received.set_value(read_line(socket));
        write_all(socket, "OK\n");
    });

    TcpTransport transport("127.0.0.1", server.port(), 2s);
    transport.connect();
    transport.send("TEST\n");
    transport.receive();

    assert(received.get_future().get() == "TEST\n");
}

void test_crlf_terminator() {
    std::promise<std::string> received;
    TestServer server([&received](asio::ip::tcp::socket& socket) {
        std::string data;
        std::size_t n = asio::read_until(socket, asio::dynamic_buffer(data), "\r\n");
        received.set_value(data.substr(0, n));
        write_all(socket, "1.25\r\n");
    });

    TcpTransport transport("127.0.0.1", server.port(), 2s, "\r\n");
    transport.connect();
    transport.send(":MEAS:VOLT?");

    assert(transport.receive() == "1.25");
    assert(received.get_future().get() == ":MEAS:VOLT?\r\n");
}

void test_line_split_across_segments() {
    TestServer server([](asio::ip::tcp::socket& socket) {
        read_line(socket);
        write_all(socket, "2.00E");
        std::this_thread::sleep_for(50ms);
        write_all(socket, "+00\nNEXT\r\n");
        read_line(socket);
    });

    TcpTransport transport("127.0.0.1", server.port(), 2s);
    transport.connect();
    transport.send(":CHAN1:SCAL?");

    assert(transport.receive() == "2.00E+00");
    assert(transport.receive() == "NEXT");

    transport.send("DONE");
}

void test_receive_timeout_is_bounded() {
    std::promise<void> release;
    std::shared_future<void> released = release.get_future().share();
    TestServer server([released](asio::ip::tcp::socket& socket) {
        read_line(socket);
        released.wait();
    });

    TcpTransport transport("127.0.0.1", server.port(), 2s);
    transport.connect();
    transport.send("HELLO");

    auto start = std::chrono::steady_clock::now();
    expect_throws<TimeoutError>([&] { transport.receive(100ms); });
    auto elapsed = std::chrono::steady_clock::now() - start;

    assert(elapsed >= 90ms);
    assert(elapsed < 1s);
    assert(transport.is_connected());

    release.set_value();
}

void test_timed_out_line_resumes() {
    std::promise<void> first_timeout;
    std::shared_future<void> timed_out = first_timeout.get_future().share();
    TestServer server([timed_out](asio::ip::tcp::socket& socket) {
        read_line(socket);
        write_all(socket, "PARTIAL");
        timed_out.wait();
        write_all(socket, " LINE\n");
        read_line(socket);
    });

    TcpTransport transport("127.0.0.1", server.port(), 2s);
    transport.connect();
    transport.send("Q?");

    expect_throws<TimeoutError>([&] { transport.receive(100ms); });
    first_timeout.set_value();

    assert(transport.receive() == "PARTIAL LINE");
    transport.send("DONE");
}

void test_peer_close_raises_connection_error() {
    TestServer server([](asio::ip::tcp::socket& socket) {
        read_line(socket);
        socket.close();
    });

    TcpTransport transport("127.0.0.1", server.port(), 2s);
    transport.connect();
    transport.send("HELLO");

    expect_throws<ConnectionError>([&] { transport.receive(); });
    assert(!transport.is_connected());
    transport.disconnect();
}

void test_io_when_disconnected_raises() {
    TcpTransport transport("127.0.0.1", 1, 1s);
    expect_throws<ConnectionError>([&] { transport.send("HELLO"); });
    expect_throws<ConnectionError>([&] { transport.receive(); });
    expect_throws<ConnectionError>([&] { transport.receive_raw(4); });
}

void test_raw_io() {
    std::promise<std::string> received;
    TestServer server([&received](asio::ip::tcp::socket& socket) {
        std::string data(3, '\0');
        asio::read(socket, asio::buffer(&data[0], data.size()));
        received.set_value(data);

        read_line(socket);
        write_all(socket, std::string("\x00\x01", 2));
        std::this_thread::sleep_for(20ms);
        write_all(socket, std::string("\x02\x03\x04" "END\n", 7));
    });

    TcpTransport transport("127.0.0.1", server.port(), 2s);
    transport.connect();
    transport.send_raw(Bytes{0x0a, 0x0b, 0x0c});
    transport.send("WAV:DATA?");

    Bytes data = transport.receive_raw(5);
    assert((data == Bytes{0x00, 0x01, 0x02, 0x03, 0x04}));
    assert(transport.receive() == "END");
    assert(received.get_future().get() == "\x0a\x0b\x0c");
}

void test_raw_underrun_times_out() {
    std::promise<void> release;
    std::shared_future<void> released = release.get_future().share();
    TestServer server([released](asio::ip::tcp::socket& socket) {
        read_line(socket);
        write_all(socket, "ABC");
        released.wait();
    });

    TcpTransport transport("127.0.0.1", server.port(), 2s);
    transport.connect();
    transport.send("WAV:DATA?");

    expect_throws<TimeoutError>([&] { transport.receive_raw(10, 100ms); });

    Bytes partial = transport.receive_raw(3, 100ms);
    assert((partial == Bytes{'A', 'B', 'C'}));

    release.set_value();
}

void test_flush_input_drops_late_reply() {
    std::promise<void> late_reply_sent;
    std::future<void> late_reply = late_reply_sent.get_future();
    TestServer server([&late_reply_sent](asio::ip::tcp::socket& socket) {
        read_line(socket);
        write_all(socket, "LATE\n");
        late_reply_sent.set_value();

        read_line(socket);
        write_all(socket, "FRESH\n");
    });

    TcpTransport transport("127.0.0.1", server.port(), 2s);
    transport.connect();
    transport.send("SLOW?");
    late_reply.wait();
    std::this_thread::sleep_for(50ms);

    transport.flush_input();
    transport.send("FAST?");
    assert(transport.receive() == "FRESH");
}

void test_session_over_tcp() {
    TestServer server([](asio::ip::tcp::socket& socket) {
        assert(read_line(socket) == ":CHAN1:SCAL?\n");
        write_all(socket, "2.00E+00\n");
        assert(read_line(socket) == ":SYST:ERR?\n");
        write_all(socket, "113,\"Undefined header\"\n");
        assert(read_line(socket) == "*RST\n");
    });

    auto transport = std::make_shared<TcpTransport>("127.0.0.1", server.port(), 2s);
    Session session(transport);

    {
        ScopedConnection connection(session);
        assert(session.query_float(":CHAN1:SCAL?") == 2.0);

        auto entry = session.check_error();
        assert(entry.has_value());
        assert(entry->code == 113);
        assert(entry->message == "Undefined header");

        session.reset();
    }

    assert(!transport->is_connected());
}

int main() {
    test_connect_disconnect();
    test_connect_refused();
    test_connect_timeout_is_bounded();
    test_send_and_receive();
    test_send_does_not_double_terminator();
    test_crlf_terminator();
    test_line_split_across_segments();
    test_receive_timeout_is_bounded();
    test_timed_out_line_resumes();
    test_peer_close_raises_connection_error();
    test_io_when_disconnected_raises();
    test_raw_io();
    test_raw_underrun_times_out();
    test_flush_input_drops_late_reply();
    test_session_over_tcp();

    std::cout << "test_tcp_transport: all tests passed" << std::endl;
    return 0;
}
