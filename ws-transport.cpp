#include "ws-transport.h"
#include "bridge-errors.h"

#include <boost/asio/connect.hpp>
#include <boost/asio/executor_work_guard.hpp>
#include <boost/asio/io_context.hpp>
#include <boost/asio/ip/tcp.hpp>
#include <boost/asio/post.hpp>
#include <boost/asio/ssl.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/ssl.hpp>
#include <boost/beast/websocket.hpp>
#include <boost/beast/websocket/ssl.hpp>

#include <openssl/ssl.h>

#include <condition_variable>
#include <deque>
#include <future>
#include <iostream>
#include <mutex>
#include <thread>

namespace beast = boost::beast;
namespace websocket = beast::websocket;
namespace net = boost::asio;
namespace ssl = boost::asio::ssl;
using tcp = boost::asio::ip::tcp;

bool parse_url(const std::string& url, ParsedUrl& out) {
    auto scheme_end = url.find("://");
    if (scheme_end == std::string::npos) return false;

    out.scheme = url.substr(0, scheme_end);
    std::string default_port;
    if (out.scheme == "wss" || out.scheme == "https") {
        default_port = "443";
    } else if (out.scheme == "ws" || out.scheme == "http") {
        default_port = "80";
    } else {
        return false;
    }

    std::string rest = url.substr(scheme_end + 3);
    auto path_start = rest.find('/');
    std::string authority = path_start == std::string::npos ? rest : rest.substr(0, path_start);
    out.target = path_start == std::string::npos ? "/" : rest.substr(path_start);

    auto colon = authority.rfind(':');
    if (colon != std::string::npos) {
        out.host = authority.substr(0, colon);
        out.port = authority.substr(colon + 1);
    } else {
        out.host = authority;
        out.port = default_port;
    }
    return !out.host.empty() && !out.port.empty();
}

namespace {

constexpr auto kWriteTimeout = std::chrono::seconds(15);
constexpr auto kCloseTimeout = std::chrono::seconds(3);

using WsStream = websocket::stream<beast::ssl_stream<beast::tcp_stream>>;

enum class OutgoingKind { Text, Binary, Ping };

struct Outgoing {
    OutgoingKind kind;
    std::string data;
    std::shared_ptr<std::promise<beast::error_code>> done;
};

// Everything that lives on the I/O thread. Member order matters: the stream
// must be destroyed before the SSL context and the io_context.
struct Connection {
    net::io_context ioc;
    net::executor_work_guard<net::io_context::executor_type> work{ioc.get_executor()};
    ssl::context ssl_ctx{ssl::context::tlsv12_client};
    std::unique_ptr<WsStream> ws;
    beast::flat_buffer read_buffer;
    std::deque<Outgoing> write_queue;
    bool writing = false;
    std::thread io_thread;

    ~Connection() {
        work.reset();
        ioc.stop();
        if (io_thread.joinable()) io_thread.join();
    }
};

class BeastWsTransport : public WsTransport {
public:
    BeastWsTransport() = default;
    ~BeastWsTransport() override { close(); }

    void connect(const std::string& url, const WsConnectOptions& options) override;
    void send_binary(const std::string& data) override { enqueue(OutgoingKind::Binary, data); }
    void send_text(const std::string& data) override { enqueue(OutgoingKind::Text, data); }
    ReceiveResult receive(std::chrono::milliseconds timeout) override;
    bool ping(std::chrono::milliseconds timeout) override;
    void close() override;
    bool is_open() const override;

private:
    void do_read(Connection* c);
    void do_write(Connection* c);
    void mark_closed();
    void enqueue(OutgoingKind kind, const std::string& data);

    std::mutex conn_mutex_;
    std::shared_ptr<Connection> conn_;

    mutable std::mutex state_mutex_;
    std::condition_variable state_cv_;
    std::deque<WsMessage> inbox_;
    bool open_ = false;
    uint64_t pong_count_ = 0;
};

void BeastWsTransport::connect(const std::string& url, const WsConnectOptions& options) {
    close();

    ParsedUrl u;
    if (!parse_url(url, u) || (u.scheme != "wss" && u.scheme != "https")) {
        throw BridgeError(ErrorKind::Connection, "unsupported WebSocket URL: " + url);
    }

    auto conn = std::make_shared<Connection>();
    Connection* c = conn.get();

    c->ssl_ctx.set_default_verify_paths();
    c->ssl_ctx.set_verify_mode(options.verify_tls ? ssl::verify_peer : ssl::verify_none);
    c->ws = std::make_unique<WsStream>(c->ioc, c->ssl_ctx);
    c->ws->read_message_max(options.max_message_bytes);

    if (!SSL_set_tlsext_host_name(c->ws->next_layer().native_handle(), u.host.c_str())) {
        throw BridgeError(ErrorKind::Connection, "failed to set TLS SNI host name for " + u.host);
    }
    if (options.verify_tls) {
        c->ws->next_layer().set_verify_callback(ssl::host_name_verification(u.host));
    }

    auto headers = options.headers;
    c->ws->set_option(websocket::stream_base::decorator([headers](websocket::request_type& req) {
        req.set(beast::http::field::user_agent, "avatar-live-bridge");
        for (const auto& kv : headers) {
            req.set(kv.first, kv.second);
        }
    }));
    c->ws->control_callback([this](websocket::frame_type kind, beast::string_view) {
        if (kind == websocket::frame_type::pong) {
            std::lock_guard<std::mutex> lock(state_mutex_);
            ++pong_count_;
            state_cv_.notify_all();
        }
    });

    {
        std::lock_guard<std::mutex> lock(state_mutex_);
        inbox_.clear();
        open_ = false;
        pong_count_ = 0;
    }

    auto done = std::make_shared<std::promise<beast::error_code>>();
    auto result = done->get_future();
    auto resolver = std::make_shared<tcp::resolver>(c->ioc);
    const auto timeout = options.timeout;
    const std::string host_header = u.host + ":" + u.port;
    const std::string target = u.target;

    c->io_thread = std::thread([c]() { c->ioc.run(); });

    resolver->async_resolve(u.host, u.port,
        [this, c, done, resolver, timeout, host_header, target](beast::error_code ec, tcp::resolver::results_type results) {
            if (ec) { done->set_value(ec); return; }
            beast::get_lowest_layer(*c->ws).expires_after(timeout);
            beast::get_lowest_layer(*c->ws).async_connect(results,
                [this, c, done, timeout, host_header, target](beast::error_code ec, const tcp::endpoint&) {
                    if (ec) { done->set_value(ec); return; }
                    beast::get_lowest_layer(*c->ws).expires_after(timeout);
                    c->ws->next_layer().async_handshake(ssl::stream_base::client,
                        [this, c, done, timeout, host_header, target](beast::error_code ec) {
                            if (ec) { done->set_value(ec); return; }
                            beast::get_lowest_layer(*c->ws).expires_never();

                            websocket::stream_base::timeout opt{};
                            opt.handshake_timeout = timeout;
                            opt.idle_timeout = websocket::stream_base::none();
                            opt.keep_alive_pings = false;
                            c->ws->set_option(opt);

                            c->ws->async_handshake(host_header, target,
                                [this, c, done](beast::error_code ec) {
                                    if (!ec) {
                                        {
                                            std::lock_guard<std::mutex> lock(state_mutex_);
                                            open_ = true;
                                        }
                                        do_read(c);
                                    }
                                    done->set_value(ec);
                                });
                        });
                });
        });

    {
        std::lock_guard<std::mutex> lock(conn_mutex_);
        conn_ = conn;
    }

    if (result.wait_for(timeout + std::chrono::seconds(1)) != std::future_status::ready) {
        close();
        throw BridgeError(ErrorKind::Timeout, "WebSocket handshake with " + u.host + " timed out");
    }
    beast::error_code ec = result.get();
    if (ec) {
        close();
        if (ec == beast::error::timeout) {
            throw BridgeError(ErrorKind::Timeout, "WebSocket connect to " + u.host + " timed out");
        }
        throw BridgeError(ErrorKind::Connection, "WebSocket connect to " + u.host + " failed: " + ec.message());
    }
}

void BeastWsTransport::do_read(Connection* c) {
    c->ws->async_read(c->read_buffer, [this, c](beast::error_code ec, std::size_t) {
        if (ec) {
            mark_closed();
            return;
        }
        WsMessage msg;
        msg.binary = c->ws->got_binary();
        msg.data = beast::buffers_to_string(c->read_buffer.data());
        c->read_buffer.consume(c->read_buffer.size());
        {
            std::lock_guard<std::mutex> lock(state_mutex_);
            inbox_.push_back(std::move(msg));
        }
        state_cv_.notify_all();
        do_read(c);
    });
}

void BeastWsTransport::do_write(Connection* c) {
    c->writing = true;
    Outgoing& front = c->write_queue.front();

    auto on_done = [this, c](beast::error_code ec, std::size_t = 0) {
        Outgoing finished = std::move(c->write_queue.front());
        c->write_queue.pop_front();
        finished.done->set_value(ec);
        if (ec) {
            mark_closed();
        }
        if (!c->write_queue.empty()) {
            do_write(c);
        } else {
            c->writing = false;
        }
    };

    if (front.kind == OutgoingKind::Ping) {
        c->ws->async_ping({}, [on_done](beast::error_code ec) { on_done(ec); });
        return;
    }
    c->ws->binary(front.kind == OutgoingKind::Binary);
    c->ws->async_write(net::buffer(front.data), on_done);
}

void BeastWsTransport::enqueue(OutgoingKind kind, const std::string& data) {
    std::shared_ptr<Connection> c;
    {
        std::lock_guard<std::mutex> lock(conn_mutex_);
        c = conn_;
    }
    if (!c || !is_open()) {
        throw BridgeError(ErrorKind::Connection, "WebSocket is not open");
    }

    auto done = std::make_shared<std::promise<beast::error_code>>();
    auto result = done->get_future();
    Connection* raw = c.get();
    net::post(raw->ioc, [this, raw, kind, data, done]() {
        raw->write_queue.push_back(Outgoing{kind, data, done});
        if (!raw->writing) do_write(raw);
    });

    auto deadline = std::chrono::steady_clock::now() + kWriteTimeout;
    while (result.wait_for(std::chrono::milliseconds(100)) != std::future_status::ready) {
        if (!is_open()) {
            throw BridgeError(ErrorKind::Connection, "WebSocket closed while sending");
        }
        if (std::chrono::steady_clock::now() >= deadline) {
            throw BridgeError(ErrorKind::Timeout, "WebSocket write timed out");
        }
    }
    beast::error_code ec = result.get();
    if (ec) {
        throw BridgeError(ErrorKind::Connection, "WebSocket send failed: " + ec.message());
    }
}

ReceiveResult BeastWsTransport::receive(std::chrono::milliseconds timeout) {
    std::unique_lock<std::mutex> lock(state_mutex_);
    state_cv_.wait_for(lock, timeout, [this]() { return !inbox_.empty() || !open_; });

    ReceiveResult result;
    if (!inbox_.empty()) {
        result.status = ReceiveStatus::Message;
        result.message = std::move(inbox_.front());
        inbox_.pop_front();
    } else if (!open_) {
        result.status = ReceiveStatus::Closed;
    } else {
        result.status = ReceiveStatus::Timeout;
    }
    return result;
}

bool BeastWsTransport::ping(std::chrono::milliseconds timeout) {
    uint64_t before = 0;
    {
        std::lock_guard<std::mutex> lock(state_mutex_);
        if (!open_) return false;
        before = pong_count_;
    }
    try {
        enqueue(OutgoingKind::Ping, std::string());
    } catch (const BridgeError& e) {
        std::cout << "⚠️ Ping failed: " << e.what() << std::endl;
        return false;
    }
    std::unique_lock<std::mutex> lock(state_mutex_);
    return state_cv_.wait_for(lock, timeout, [this, before]() { return pong_count_ > before || !open_; }) &&
           pong_count_ > before;
}

void BeastWsTransport::close() {
    std::shared_ptr<Connection> c;
    {
        std::lock_guard<std::mutex> lock(conn_mutex_);
        c = std::move(conn_);
    }
    if (!c) return;

    if (is_open()) {
        auto done = std::make_shared<std::promise<beast::error_code>>();
        auto result = done->get_future();
        Connection* raw = c.get();
        net::post(raw->ioc, [raw, done]() {
            raw->ws->async_close(websocket::close_code::normal, [done](beast::error_code ec) { done->set_value(ec); });
        });
        if (result.wait_for(kCloseTimeout) != std::future_status::ready) {
            std::cout << "⚠️ WebSocket close handshake timed out, dropping socket" << std::endl;
        }
    }

    mark_closed();
    c->work.reset();
    c->ioc.stop();
    if (c->io_thread.joinable()) c->io_thread.join();
}

bool BeastWsTransport::is_open() const {
    std::lock_guard<std::mutex> lock(state_mutex_);
    return open_;
}

void BeastWsTransport::mark_closed() {
    {
        std::lock_guard<std::mutex> lock(state_mutex_);
        open_ = false;
    }
    state_cv_.notify_all();
}

} // namespace

std::unique_ptr<WsTransport> make_beast_transport() {
    return std::make_unique<BeastWsTransport>();
}
