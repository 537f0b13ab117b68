#pragma once

#include <chrono>
#include <map>
#include <memory>
#include <string>

// One WebSocket message as seen by the protocol clients
struct WsMessage {
    bool binary = false;
    std::string data;
};

enum class ReceiveStatus { Message, Timeout, Closed };

struct ReceiveResult {
    ReceiveStatus status = ReceiveStatus::Closed;
    WsMessage message;
};

struct WsConnectOptions {
    std::map<std::string, std::string> headers;
    bool verify_tls = true;
    std::chrono::milliseconds timeout{10000};
    size_t max_message_bytes = 64 * 1024 * 1024;
};

// Message-oriented socket used by the TTS, STT and avatar clients.
// Implementations must allow send/receive/ping from different threads.
class WsTransport {
public:
    virtual ~WsTransport() = default;

    // Opens the socket; throws BridgeError(Connection or Timeout) on failure
    virtual void connect(const std::string& url, const WsConnectOptions& options) = 0;

    // Throws BridgeError(Connection) when the socket is not open or the write fails
    virtual void send_binary(const std::string& data) = 0;
    virtual void send_text(const std::string& data) = 0;

    // Waits up to timeout for the next data message. Never throws.
    virtual ReceiveResult receive(std::chrono::milliseconds timeout) = 0;

    // Transport-level ping; true when the pong arrived in time. Never throws.
    virtual bool ping(std::chrono::milliseconds timeout) = 0;

    // Graceful close; tolerates an already closed socket. Never throws.
    virtual void close() = 0;

    // The one connection-state query each client relies on
    virtual bool is_open() const = 0;
};

// wss:// transport on Boost.Beast + OpenSSL with its own I/O thread
std::unique_ptr<WsTransport> make_beast_transport();

struct ParsedUrl {
    std::string scheme;
    std::string host;
    std::string port;
    std::string target;
};

// Splits ws://, wss://, http:// and https:// URLs; returns false on anything else
bool parse_url(const std::string& url, ParsedUrl& out);
