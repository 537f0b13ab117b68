#include "simple-http-api.h"
#include "database.h"
#include "pipeline-orchestrator.h"
#include "room-coordinator.h"
#include "stream-session-registry.h"
#include "stt-client.h"
#include "uuid-util.h"
#include <openssl/evp.h>
#include <iostream>
#include <sstream>
#include <fstream>
#include <sys/socket.h>
#include <sys/time.h>
#include <netinet/in.h>
#include <unistd.h>
#include <cctype>
#include <cmath>
#include <cstdlib>
#include <ctime>
#include <mutex>
#include <chrono>
#include <iomanip>
#include <optional>
#include <stdexcept>

static std::mutex log_mutex;
static void write_server_log(const std::string& message) {
    std::lock_guard<std::mutex> lock(log_mutex);
    std::ofstream logfile("bridge_server.log", std::ios::app);
    auto now = std::chrono::system_clock::now();
    auto time_t = std::chrono::system_clock::to_time_t(now);
    logfile << "[" << std::put_time(std::localtime(&time_t), "%Y-%m-%d %H:%M:%S") << "] " << message << std::endl;
    logfile.close();
}

namespace {

constexpr size_t kMaxRequestBytes = 1024 * 1024;

const std::string kLeavePrefix = "/api/leave_room/";
const std::string kLegacyLeavePrefix = "/api/digital_human_develop/leave_room/";

// Sends everything or reports the peer as gone
bool send_all(int client_socket, const std::string& data) {
    size_t sent = 0;
    while (sent < data.size()) {
        ssize_t n = send(client_socket, data.data() + sent, data.size() - sent, MSG_NOSIGNAL);
        if (n <= 0) return false;
        sent += static_cast<size_t>(n);
    }
    return true;
}

std::string optional_string(const nlohmann::json& body, const char* key) {
    auto it = body.find(key);
    if (it == body.end() || !it->is_string()) return "";
    return it->get<std::string>();
}

std::optional<int> optional_int(const nlohmann::json& obj, const char* key) {
    auto it = obj.find(key);
    if (it == obj.end() || !it->is_number()) return std::nullopt;
    return it->get<int>();
}

// Standard base64 with padding; nullopt on malformed input
std::optional<std::string> base64_decode(const std::string& encoded) {
    if (encoded.empty() || encoded.size() % 4 != 0) return std::nullopt;
    std::string out(encoded.size() / 4 * 3, '\0');
    int n = EVP_DecodeBlock(reinterpret_cast<unsigned char*>(&out[0]),
                            reinterpret_cast<const unsigned char*>(encoded.data()),
                            static_cast<int>(encoded.size()));
    if (n < 0) return std::nullopt;
    size_t padding = 0;
    if (encoded[encoded.size() - 1] == '=') ++padding;
    if (encoded[encoded.size() - 2] == '=') ++padding;
    out.resize(static_cast<size_t>(n) - padding);
    return out;
}

constexpr size_t kMinRecognizeBytes = 1000;

} // namespace

const char* http_status_text(int status_code) {
    switch (status_code) {
        case 200: return "OK";
        case 400: return "Bad Request";
        case 404: return "Not Found";
        case 405: return "Method Not Allowed";
        case 408: return "Request Timeout";
        case 413: return "Payload Too Large";
        case 422: return "Unprocessable Entity";
        case 429: return "Too Many Requests";
        case 499: return "Client Closed Request";
        case 502: return "Bad Gateway";
        case 503: return "Service Unavailable";
        default:  return "Internal Server Error";
    }
}

HttpResponse json_response(int status_code, const nlohmann::json& body) {
    HttpResponse response;
    response.status_code = status_code;
    response.status_text = http_status_text(status_code);
    response.headers["Content-Type"] = "application/json";
    response.body = body.dump();
    return response;
}

HttpResponse error_response(const BridgeError& error) {
    int status = http_status_for(error.kind());
    nlohmann::json body = {
        {"success", false},
        {"error", error_kind_name(error.kind())},
        {"message", error.what()},
        {"retryable", is_retryable_status(status)}
    };
    if (error.remote_code() != 0) {
        body["code"] = error.remote_code();
    }
    HttpResponse response = json_response(status, body);
    if (error.kind() == ErrorKind::ConcurrencyRejected && error.retry_after_seconds() > 0) {
        int seconds = static_cast<int>(std::ceil(error.retry_after_seconds()));
        response.headers["Retry-After"] = std::to_string(seconds);
        body["retry_after"] = error.retry_after_seconds();
        response.body = body.dump();
    }
    return response;
}

SimpleHttpServer::SimpleHttpServer(int port, RoomCoordinator& coordinator, PipelineOrchestrator& orchestrator,
                                   StreamSessionRegistry& registry, Database* database, SttClient* stt)
    : port_(port), server_socket_(-1), running_(false),
      coordinator_(coordinator), orchestrator_(orchestrator), registry_(registry), database_(database), stt_(stt) {}

SimpleHttpServer::~SimpleHttpServer() {
    stop();
}

bool SimpleHttpServer::start() {
    write_server_log("SERVER: Starting HTTP server on port " + std::to_string(port_));
    server_socket_ = socket(AF_INET, SOCK_STREAM, 0);
    if (server_socket_ < 0) {
        write_server_log("SERVER: Failed to create socket");
        std::cerr << "Failed to create socket" << std::endl;
        return false;
    }

    // Allow socket reuse
    int opt = 1;
    setsockopt(server_socket_, SOL_SOCKET, SO_REUSEADDR, &opt, sizeof(opt));

    struct sockaddr_in address;
    address.sin_family = AF_INET;
    address.sin_addr.s_addr = INADDR_ANY;
    address.sin_port = htons(port_);

    if (bind(server_socket_, (struct sockaddr*)&address, sizeof(address)) < 0) {
        std::cerr << "Failed to bind to port " << port_ << std::endl;
        close(server_socket_);
        server_socket_ = -1;
        return false;
    }

    if (listen(server_socket_, 10) < 0) {
        std::cerr << "Failed to listen on socket" << std::endl;
        close(server_socket_);
        server_socket_ = -1;
        return false;
    }

    running_ = true;
    server_thread_ = std::thread(&SimpleHttpServer::server_loop, this);
    write_server_log("SERVER: Listening on port " + std::to_string(port_));
    return true;
}

void SimpleHttpServer::stop() {
    stop_accepting();
    wait_for_clients();
}

void SimpleHttpServer::stop_accepting() {
    running_ = false;
    if (server_socket_ >= 0) {
        shutdown(server_socket_, SHUT_RDWR);
        close(server_socket_);
        server_socket_ = -1;
    }
    if (server_thread_.joinable()) {
        server_thread_.join();
    }

    std::lock_guard<std::mutex> lock(clients_mutex_);
    for (int client_socket : client_sockets_) {
        shutdown(client_socket, SHUT_RD);
    }
}

void SimpleHttpServer::wait_for_clients() {
    std::unique_lock<std::mutex> lock(clients_mutex_);
    if (active_clients_ > 0) {
        std::cout << "⏳ Waiting for " << active_clients_ << " HTTP client(s) to finish" << std::endl;
    }
    clients_cv_.wait(lock, [this]() { return active_clients_ == 0; });
}

size_t SimpleHttpServer::active_clients() const {
    std::lock_guard<std::mutex> lock(clients_mutex_);
    return active_clients_;
}

void SimpleHttpServer::release_client(int client_socket) {
    std::lock_guard<std::mutex> lock(clients_mutex_);
    close(client_socket);
    client_sockets_.erase(client_socket);
    --active_clients_;
    clients_cv_.notify_all();
}

void SimpleHttpServer::server_loop() {
    while (running_) {
        struct sockaddr_in client_addr;
        socklen_t client_len = sizeof(client_addr);

        int client_socket = accept(server_socket_, (struct sockaddr*)&client_addr, &client_len);
        if (client_socket < 0) {
            if (running_) {
                std::cerr << "Failed to accept client connection" << std::endl;
            }
            continue;
        }

        {
            std::lock_guard<std::mutex> lock(clients_mutex_);
            client_sockets_.insert(client_socket);
            ++active_clients_;
        }
        std::thread client_thread(&SimpleHttpServer::handle_client, this, client_socket);
        client_thread.detach();
    }
}

bool SimpleHttpServer::read_request(int client_socket, std::string& raw_request) {
    char buffer[65536];
    size_t headers_end = std::string::npos;
    size_t content_length = 0;

    while (true) {
        ssize_t bytes_read = recv(client_socket, buffer, sizeof(buffer), 0);
        if (bytes_read <= 0) {
            return headers_end != std::string::npos && raw_request.size() >= headers_end + 4 + content_length;
        }
        raw_request.append(buffer, bytes_read);
        if (raw_request.size() > kMaxRequestBytes) return false;

        if (headers_end == std::string::npos) {
            headers_end = raw_request.find("\r\n\r\n");
            if (headers_end == std::string::npos) continue;

            HttpRequest head = parse_request(raw_request.substr(0, headers_end + 4));
            for (const auto& header : head.headers) {
                std::string key = header.first;
                for (auto& c : key) c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
                if (key == "content-length") {
                    content_length = std::strtoul(header.second.c_str(), nullptr, 10);
                }
            }
        }
        if (raw_request.size() >= headers_end + 4 + content_length) {
            return true;
        }
    }
}

void SimpleHttpServer::handle_client(int client_socket) {
    struct ClientGuard {
        SimpleHttpServer* server;
        int socket;
        ~ClientGuard() { server->release_client(socket); }
    } guard{this, client_socket};

    struct timeval timeout;
    timeout.tv_sec = 30;
    timeout.tv_usec = 0;
    setsockopt(client_socket, SOL_SOCKET, SO_RCVTIMEO, &timeout, sizeof(timeout));
    setsockopt(client_socket, SOL_SOCKET, SO_SNDTIMEO, &timeout, sizeof(timeout));

    try {
        std::string raw_request;
        if (!read_request(client_socket, raw_request)) {
            if (!raw_request.empty()) {
                send_all(client_socket, create_response(json_response(400, {{"success", false}, {"error", "bad request"}})));
            }
            return;
        }

        HttpRequest request = parse_request(raw_request);
        write_server_log("REQUEST: " + request.method + " " + request.path);

        if (request.method == "POST" && request.path == "/api/query/stream") {
            handle_query_stream(client_socket, request);
        } else {
            HttpResponse response = handle_request(request);
            write_server_log("RESPONSE: " + request.path + " -> " + std::to_string(response.status_code));
            send_all(client_socket, create_response(response));
        }
    } catch (const std::exception& e) {
        std::cerr << "Client handling error: " << e.what() << std::endl;
        write_server_log(std::string("ERROR: ") + e.what());
        send_all(client_socket, create_response(json_response(500, {{"success", false}, {"error", e.what()}})));
    }
}

HttpRequest SimpleHttpServer::parse_request(const std::string& raw_request) {
    HttpRequest request;
    std::istringstream stream(raw_request);
    std::string line;

    // Parse request line
    if (std::getline(stream, line)) {
        if (!line.empty() && line.back() == '\r') line.pop_back();
        std::istringstream request_line(line);
        request_line >> request.method >> request.path;

        // Parse query parameters
        size_t query_pos = request.path.find('?');
        if (query_pos != std::string::npos) {
            std::string query = request.path.substr(query_pos + 1);
            request.path = request.path.substr(0, query_pos);

            size_t pos = 0;
            while (pos < query.length()) {
                size_t eq_pos = query.find('=', pos);
                size_t amp_pos = query.find('&', pos);
                if (amp_pos == std::string::npos) amp_pos = query.length();

                if (eq_pos != std::string::npos && eq_pos < amp_pos) {
                    std::string key = query.substr(pos, eq_pos - pos);
                    std::string value = query.substr(eq_pos + 1, amp_pos - eq_pos - 1);
                    request.query_params[key] = value;
                }
                pos = amp_pos + 1;
            }
        }
    }

    // Parse headers
    while (std::getline(stream, line) && line != "\r") {
        if (!line.empty() && line.back() == '\r') line.pop_back();
        if (line.empty()) break;

        size_t colon_pos = line.find(':');
        if (colon_pos != std::string::npos) {
            std::string key = line.substr(0, colon_pos);
            std::string value = line.substr(colon_pos + 1);
            value.erase(0, value.find_first_not_of(" \t"));
            value.erase(value.find_last_not_of(" \t") + 1);
            request.headers[key] = value;
        }
    }

    // Parse body (binary safe)
    size_t headers_end = raw_request.find("\r\n\r\n");
    if (headers_end != std::string::npos) {
        request.body = raw_request.substr(headers_end + 4);
    }

    return request;
}

std::string SimpleHttpServer::create_response(const HttpResponse& response) {
    std::ostringstream stream;
    stream << "HTTP/1.1 " << response.status_code << " " << response.status_text << "\r\n";

    for (const auto& header : response.headers) {
        stream << header.first << ": " << header.second << "\r\n";
    }

    stream << "Content-Length: " << response.body.length() << "\r\n";
    stream << "Connection: close\r\n";
    stream << "\r\n";
    stream << response.body;

    return stream.str();
}

HttpResponse SimpleHttpServer::handle_request(const HttpRequest& request) {
    const std::string& path = request.path;

    if (path == "/api/health") {
        return api_health();
    }
    if (path == "/api/connection_status") {
        return api_connection_status();
    }
    if (path == "/api/join_room" || path == "/api/digital_human_develop/join_room") {
        if (request.method != "POST") return json_response(405, {{"success", false}, {"error", "method not allowed"}});
        return api_join_room(request);
    }
    if (path == "/api/query/cancel") {
        if (request.method != "POST") return json_response(405, {{"success", false}, {"error", "method not allowed"}});
        return api_query_cancel(request);
    }
    if (path == "/api/reset_connections") {
        if (request.method != "POST") return json_response(405, {{"success", false}, {"error", "method not allowed"}});
        return api_reset_connections();
    }
    if (path == "/api/voice/recognize") {
        if (request.method != "POST") return json_response(405, {{"success", false}, {"error", "method not allowed"}});
        return api_voice_recognize(request);
    }
    if (path == "/api/query/stream") {
        // Only reachable through the socket path in handle_client
        return json_response(405, {{"success", false}, {"error", "use POST with an open connection"}});
    }

    for (const std::string* prefix : {&kLeavePrefix, &kLegacyLeavePrefix}) {
        if (path.compare(0, prefix->size(), *prefix) == 0) {
            if (request.method != "DELETE") {
                return json_response(405, {{"success", false}, {"error", "method not allowed"}});
            }
            std::string live_id = path.substr(prefix->size());
            if (live_id.empty() || live_id.find('/') != std::string::npos) {
                return json_response(422, {{"success", false}, {"error", "invalid live_id"}});
            }
            return api_leave_room(live_id);
        }
    }

    return json_response(404, {{"success", false}, {"error", "not found"}, {"path", path}});
}

std::string SimpleHttpServer::config_value(const std::string& key, const std::string& fallback) {
    if (!database_) return fallback;
    return database_->get_config(key, fallback);
}

JoinRequest SimpleHttpServer::build_join_request(const nlohmann::json& body) {
    if (!body.is_object()) {
        throw std::invalid_argument("request body must be a JSON object");
    }

    JoinRequest join;
    join.live.live_id = optional_string(body, "live_id");
    if (join.live.live_id.empty()) {
        throw std::invalid_argument("live_id is required");
    }

    std::string type_name = optional_string(body, "avatar_type");
    if (type_name.empty()) type_name = config_value("avatar_type", "3min");
    if (!parse_avatar_type(type_name, join.live.avatar_type)) {
        throw std::invalid_argument("avatar_type must be 'pic' or '3min'");
    }

    join.live.role = optional_string(body, "role");
    if (join.live.role.empty()) join.live.role = config_value("avatar_role");

    std::string background = optional_string(body, "background");
    if (!background.empty()) join.live.background = background;

    auto video = body.find("video_config");
    if (video != body.end() && video->is_object()) {
        AvatarVideoConfig vc;
        vc.width = optional_int(*video, "width").value_or(vc.width);
        vc.height = optional_int(*video, "height").value_or(vc.height);
        vc.bitrate = optional_int(*video, "bitrate").value_or(vc.bitrate);
        join.live.video = vc;
    }

    auto role_conf = body.find("role_config");
    if (role_conf != body.end() && role_conf->is_object()) {
        AvatarRoleConfig rc;
        rc.role_width = optional_int(*role_conf, "role_width");
        rc.left_offset = optional_int(*role_conf, "left_offset");
        rc.top_offset = optional_int(*role_conf, "top_offset");
        if (!rc.empty()) join.live.role_conf = rc;
    }

    std::string rtmp_addr = optional_string(body, "rtmp_addr");
    if (!rtmp_addr.empty()) {
        join.streaming = AvatarClient::rtmp_streaming(rtmp_addr);
        return join;
    }

    auto pick = [&](const char* key) {
        std::string value = optional_string(body, key);
        return value.empty() ? config_value(key) : value;
    };
    join.streaming = AvatarClient::rtc_streaming(pick("rtc_app_id"), pick("rtc_room_id"),
                                                 pick("rtc_uid"), pick("rtc_token"));
    return join;
}

QueryRequest SimpleHttpServer::build_query_request(const nlohmann::json& body) {
    if (!body.is_object()) {
        throw std::invalid_argument("request body must be a JSON object");
    }

    QueryRequest query;
    query.query = optional_string(body, "query");
    if (query.query.empty()) {
        throw std::invalid_argument("query is required");
    }

    std::string user_id = optional_string(body, "user_id");
    if (!user_id.empty()) query.user_id = user_id;

    std::string session_id = optional_string(body, "session_id");
    query.session_id = session_id.empty() ? generate_id("stream") : session_id;

    std::string conversation_id = optional_string(body, "conversation_id");
    if (!conversation_id.empty()) query.conversation_id = conversation_id;

    std::string live_id = optional_string(body, "live_id");
    if (!live_id.empty()) query.live_id = live_id;

    query.speaker = optional_string(body, "speaker");
    if (query.speaker.empty()) query.speaker = config_value("tts_speaker");
    return query;
}

HttpResponse SimpleHttpServer::api_join_room(const HttpRequest& request) {
    JoinRequest join;
    try {
        join = build_join_request(nlohmann::json::parse(request.body));
    } catch (const nlohmann::json::parse_error& e) {
        return json_response(400, {{"success", false}, {"error", "invalid JSON"}, {"message", e.what()}});
    } catch (const std::invalid_argument& e) {
        return json_response(422, {{"success", false}, {"error", "invalid request"}, {"message", e.what()}});
    }

    const std::string live_id = join.live.live_id;
    std::cout << "🔌 [" << live_id << "] Join room requested (" << avatar_type_name(join.live.avatar_type) << ")" << std::endl;
    try {
        nlohmann::json result = coordinator_.join_room(join);
        result["success"] = true;
        write_server_log("JOIN: " + live_id + " -> " + result.value("status", std::string("joined")));
        return json_response(200, result);
    } catch (const BridgeError& e) {
        std::cout << "❌ [" << live_id << "] Join failed (" << error_kind_name(e.kind()) << "): " << e.what() << std::endl;
        write_server_log("JOIN: " + live_id + " failed: " + e.what());
        return error_response(e);
    }
}

HttpResponse SimpleHttpServer::api_leave_room(const std::string& live_id) {
    std::cout << "🔌 [" << live_id << "] Leave room requested" << std::endl;
    nlohmann::json result = coordinator_.leave_room(live_id);
    result["success"] = true;
    write_server_log("LEAVE: " + live_id);
    return json_response(200, result);
}

HttpResponse SimpleHttpServer::api_voice_recognize(const HttpRequest& request) {
    nlohmann::json body;
    try {
        body = nlohmann::json::parse(request.body);
    } catch (const nlohmann::json::parse_error& e) {
        return json_response(400, {{"success", false}, {"error", "invalid JSON"}, {"message", e.what()}});
    }
    if (!body.is_object()) {
        return json_response(422, {{"success", false}, {"error", "request body must be a JSON object"}});
    }

    std::string encoded = optional_string(body, "audio");
    if (encoded.empty()) {
        return json_response(422, {{"success", false}, {"error", "audio is required"}});
    }
    std::optional<std::string> pcm = base64_decode(encoded);
    if (!pcm) {
        return json_response(422, {{"success", false}, {"error", "audio is not valid base64"}});
    }
    if (pcm->size() < kMinRecognizeBytes) {
        return json_response(422, {{"success", false}, {"error", "audio too short"}, {"bytes", pcm->size()}});
    }
    if (pcm->size() % 2 != 0) {
        return json_response(422, {{"success", false}, {"error", "audio must be 16-bit PCM"}});
    }
    if (!stt_) {
        return json_response(503, {{"success", false}, {"error", "speech recognition is not configured"}});
    }

    std::cout << "🎤 Voice recognition requested (" << pcm->size() << " bytes)" << std::endl;
    try {
        RecognitionResult result = stt_->recognize(*pcm);
        write_server_log("RECOGNIZE: " + std::to_string(pcm->size()) + " bytes -> " + result.text);
        if (result.text.empty()) {
            return json_response(200, {{"success", false}, {"status", "no_speech"}});
        }
        return json_response(200, {{"success", true}, {"final_text", result.text}, {"is_final", result.is_final}});
    } catch (const BridgeError& e) {
        std::cout << "❌ Voice recognition failed (" << error_kind_name(e.kind()) << "): " << e.what() << std::endl;
        return error_response(e);
    }
}

HttpResponse SimpleHttpServer::api_query_cancel(const HttpRequest& request) {
    nlohmann::json body;
    try {
        body = nlohmann::json::parse(request.body);
    } catch (const nlohmann::json::parse_error& e) {
        return json_response(400, {{"success", false}, {"error", "invalid JSON"}, {"message", e.what()}});
    }

    std::string session_id = optional_string(body, "session_id");
    std::string live_id = optional_string(body, "live_id");
    if (session_id.empty() && live_id.empty()) {
        return json_response(422, {{"success", false}, {"error", "session_id or live_id is required"}});
    }

    size_t cancelled = 0;
    if (!session_id.empty()) {
        cancelled += registry_.cancel_by_session(session_id);
    }
    if (!live_id.empty()) {
        cancelled += registry_.cancel_by_room(live_id);
    }

    std::cout << "🛑 Cancel requested (session=" << (session_id.empty() ? "-" : session_id)
              << ", live=" << (live_id.empty() ? "-" : live_id) << "): " << cancelled << " stream(s)" << std::endl;
    return json_response(200, {{"success", true}, {"cancelled", cancelled}});
}

HttpResponse SimpleHttpServer::api_reset_connections() {
    std::cout << "🔄 Resetting all connections" << std::endl;
    nlohmann::json result = coordinator_.reset();
    write_server_log("RESET: " + result.dump());
    return json_response(200, result);
}

HttpResponse SimpleHttpServer::api_connection_status() {
    return json_response(200, coordinator_.status());
}

HttpResponse SimpleHttpServer::api_health() {
    return json_response(200, {
        {"status", "healthy"},
        {"timestamp", get_current_timestamp()},
        {"stream_sessions", registry_.size()}
    });
}

void SimpleHttpServer::handle_query_stream(int client_socket, const HttpRequest& request) {
    QueryRequest query;
    try {
        query = build_query_request(nlohmann::json::parse(request.body));
    } catch (const nlohmann::json::parse_error& e) {
        send_all(client_socket, create_response(json_response(400, {{"success", false}, {"error", "invalid JSON"}, {"message", e.what()}})));
        return;
    } catch (const std::invalid_argument& e) {
        send_all(client_socket, create_response(json_response(422, {{"success", false}, {"error", "invalid request"}, {"message", e.what()}})));
        return;
    }

    const std::string header =
        "HTTP/1.1 200 OK\r\n"
        "Content-Type: text/event-stream\r\n"
        "Cache-Control: no-cache\r\n"
        "Connection: close\r\n"
        "X-Session-Id: " + *query.session_id + "\r\n"
        "\r\n";
    if (!send_all(client_socket, header)) {
        return;
    }

    // A vanished client cancels its own query
    bool client_gone = false;
    const std::string session_id = *query.session_id;
    EventSink sink = [&](const nlohmann::json& event) {
        if (client_gone) return;
        std::string line = "data: " + event.dump(-1, ' ', false, nlohmann::json::error_handler_t::replace) + "\n\n";
        if (!send_all(client_socket, line)) {
            client_gone = true;
            std::cout << "⚠️ [" << session_id << "] Client disconnected, cancelling stream" << std::endl;
            registry_.cancel_by_session(session_id);
        }
    };

    write_server_log("QUERY: " + session_id + " started");
    std::string status = orchestrator_.run_query(query, sink);
    write_server_log("QUERY: " + session_id + " " + status);
}
