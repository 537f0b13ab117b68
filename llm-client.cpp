#include "llm-client.h"
#include "bridge-errors.h"
#include "ws-transport.h"

#include <boost/asio/connect.hpp>
#include <boost/asio/io_context.hpp>
#include <boost/asio/ip/tcp.hpp>
#include <boost/asio/ssl.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/http.hpp>
#include <boost/beast/ssl.hpp>

#include <openssl/ssl.h>

#include <iostream>
#include <limits>

namespace beast = boost::beast;
namespace http = beast::http;
namespace net = boost::asio;
namespace ssl = boost::asio::ssl;
using tcp = boost::asio::ip::tcp;

namespace {

// Starts one asynchronous operation and runs the io_context until it completes
template <typename Start>
beast::error_code run_op(net::io_context& ioc, Start&& start) {
    beast::error_code result;
    start([&result](beast::error_code ec, auto&&...) { result = ec; });
    ioc.restart();
    ioc.run();
    return result;
}

std::string trim(const std::string& s) {
    size_t b = s.find_first_not_of(" \t\r\n");
    if (b == std::string::npos) return "";
    size_t e = s.find_last_not_of(" \t\r\n");
    return s.substr(b, e - b + 1);
}

} // namespace

bool SseLineDecoder::feed(const std::string& bytes, const std::function<bool(const nlohmann::json&)>& on_event) {
    pending_ += bytes;
    size_t pos;
    while ((pos = pending_.find('\n')) != std::string::npos) {
        std::string line = trim(pending_.substr(0, pos));
        pending_.erase(0, pos + 1);

        if (line.compare(0, 5, "data:") != 0) continue;
        std::string data = trim(line.substr(5));
        if (data.empty()) continue;
        if (data == "[DONE]") return false;

        nlohmann::json event;
        try {
            event = nlohmann::json::parse(data);
        } catch (const nlohmann::json::exception&) {
            continue;
        }
        if (!on_event(event)) return false;
    }
    return true;
}

LlmClient::LlmClient(const LlmClientConfig& config) : config_(config) {
    ParsedUrl u;
    if (!parse_url(config_.base_url, u) || u.scheme != "https") {
        throw BridgeError(ErrorKind::Connection, "LLM base URL must be https://: " + config_.base_url);
    }
    host_ = u.host;
    port_ = u.port;
    base_path_ = u.target;
    while (!base_path_.empty() && base_path_.back() == '/') base_path_.pop_back();
}

int LlmClient::post(const std::string& path, const nlohmann::json& body, bool event_stream,
                    const std::function<bool(int, const std::string&)>& on_body) {
    net::io_context ioc;
    ssl::context ctx(ssl::context::tlsv12_client);
    ctx.set_default_verify_paths();
    ctx.set_verify_mode(config_.verify_tls ? ssl::verify_peer : ssl::verify_none);

    beast::ssl_stream<beast::tcp_stream> stream(ioc, ctx);
    if (!SSL_set_tlsext_host_name(stream.native_handle(), host_.c_str())) {
        throw BridgeError(ErrorKind::Connection, "failed to set TLS SNI host name for " + host_);
    }
    if (config_.verify_tls) {
        stream.set_verify_callback(ssl::host_name_verification(host_));
    }

    tcp::resolver resolver(ioc);
    beast::error_code ec;
    auto results = resolver.resolve(host_, port_, ec);
    if (ec) {
        throw BridgeError(ErrorKind::Connection, "cannot resolve " + host_ + ": " + ec.message());
    }

    beast::get_lowest_layer(stream).expires_after(config_.connect_timeout);
    ec = run_op(ioc, [&](auto handler) { beast::get_lowest_layer(stream).async_connect(results, handler); });
    if (!ec) {
        ec = run_op(ioc, [&](auto handler) { stream.async_handshake(ssl::stream_base::client, handler); });
    }
    if (ec) {
        ErrorKind kind = ec == beast::error::timeout ? ErrorKind::Timeout : ErrorKind::Connection;
        throw BridgeError(kind, "LLM connect to " + host_ + " failed: " + ec.message());
    }

    http::request<http::string_body> req{http::verb::post, base_path_ + path, 11};
    req.set(http::field::host, host_);
    req.set(http::field::user_agent, "avatar-live-bridge");
    req.set(http::field::content_type, "application/json");
    req.set("Apikey", config_.api_key);
    if (event_stream) req.set(http::field::accept, "text/event-stream");
    req.body() = body.dump();
    req.prepare_payload();

    beast::get_lowest_layer(stream).expires_after(config_.read_timeout);
    ec = run_op(ioc, [&](auto handler) { http::async_write(stream, req, handler); });
    if (ec) {
        throw BridgeError(ErrorKind::Connection, "LLM request write failed: " + ec.message());
    }

    beast::flat_buffer buffer;
    http::response_parser<http::buffer_body> parser;
    parser.body_limit(std::numeric_limits<std::uint64_t>::max());

    beast::get_lowest_layer(stream).expires_after(config_.read_timeout);
    ec = run_op(ioc, [&](auto handler) { http::async_read_header(stream, buffer, parser, handler); });
    if (ec) {
        ErrorKind kind = ec == beast::error::timeout ? ErrorKind::Timeout : ErrorKind::Connection;
        throw BridgeError(kind, "LLM response header read failed: " + ec.message());
    }
    int status = static_cast<int>(parser.get().result_int());

    char chunk[8192];
    bool keep_reading = true;
    while (keep_reading && !parser.is_done()) {
        parser.get().body().data = chunk;
        parser.get().body().size = sizeof(chunk);

        // Each read gets a fresh idle timeout
        beast::get_lowest_layer(stream).expires_after(config_.read_timeout);
        ec = run_op(ioc, [&](auto handler) { http::async_read(stream, buffer, parser, handler); });
        if (ec == http::error::need_buffer) ec = {};
        if (ec) {
            ErrorKind kind = ec == beast::error::timeout ? ErrorKind::Timeout : ErrorKind::Connection;
            throw BridgeError(kind, "LLM response read failed: " + ec.message());
        }
        size_t n = sizeof(chunk) - parser.get().body().size;
        if (n > 0) {
            keep_reading = on_body(status, std::string(chunk, n));
        }
    }

    beast::get_lowest_layer(stream).expires_after(std::chrono::seconds(2));
    ec = run_op(ioc, [&](auto handler) { stream.async_shutdown(handler); });
    if (ec && ec != net::error::eof && ec != ssl::error::stream_truncated && config_.verbose) {
        std::cout << "⚠️ LLM TLS shutdown: " << ec.message() << std::endl;
    }
    return status;
}

namespace {

[[noreturn]] void raise_http_error(int status, const std::string& body) {
    int code = 0;
    std::string message = body.substr(0, 200);
    try {
        auto j = nlohmann::json::parse(body);
        if (j.contains("code") && j["code"].is_number_integer()) code = j["code"].get<int>();
        if (j.contains("message") && j["message"].is_string()) message = j["message"].get<std::string>();
    } catch (const nlohmann::json::exception&) {
        // plain text body
    }
    if (code != 0) message = llm_error_message(code) + ": " + message;
    ErrorKind kind = status >= 500 || status == 429 ? ErrorKind::Connection : ErrorKind::Session;
    throw BridgeError(kind, "LLM HTTP " + std::to_string(status) + ": " + message, code);
}

} // namespace

std::string LlmClient::create_conversation(const std::string& user_id) {
    nlohmann::json inputs = nlohmann::json::object();
    for (const auto& kv : config_.inputs) inputs[kv.first] = kv.second;

    std::string body;
    int status = post("/create_conversation", {{"UserID", user_id}, {"Inputs", inputs}}, false,
                      [&body](int, const std::string& piece) { body += piece; return true; });
    if (status != 200) raise_http_error(status, body);

    try {
        auto j = nlohmann::json::parse(body);
        std::string id = j.at("Conversation").at("AppConversationID").get<std::string>();
        std::cout << "💬 Created LLM conversation " << id << " for user " << user_id << std::endl;
        return id;
    } catch (const nlohmann::json::exception& e) {
        throw BridgeError(ErrorKind::Protocol, std::string("unexpected create_conversation response: ") + e.what());
    }
}

void LlmClient::chat_stream(const std::string& user_id, const std::string& conversation_id,
                            const std::string& query, const TextDeltaCallback& on_delta) {
    nlohmann::json request = {
        {"UserID", user_id},
        {"AppConversationID", conversation_id},
        {"Query", query},
        {"ResponseMode", "streaming"}
    };

    SseLineDecoder decoder;
    std::string error_body;

    auto on_event = [&](const nlohmann::json& event) {
        std::string type = event.value("event", "");
        if (type == "message_end") return false;
        if (type == "error") {
            throw BridgeError(ErrorKind::Session, "LLM stream error: " + event.value("message", event.dump()));
        }
        if (event.contains("answer") && event["answer"].is_string()) {
            std::string delta = event["answer"].get<std::string>();
            if (!delta.empty()) return on_delta(delta);
        }
        return true;
    };

    int status = post("/chat_query_v2", request, true, [&](int http_status, const std::string& piece) {
        if (http_status != 200) {
            error_body += piece;
            return true;
        }
        return decoder.feed(piece, on_event);
    });
    if (status != 200) raise_http_error(status, error_body);
}
