#pragma once

#include "bridge-errors.h"

#include <nlohmann/json.hpp>

#include <string>
#include <map>
#include <set>
#include <thread>
#include <atomic>
#include <mutex>
#include <condition_variable>

// Forward declarations
class Database;
class RoomCoordinator;
class PipelineOrchestrator;
class StreamSessionRegistry;
class SttClient;
struct JoinRequest;
struct QueryRequest;

// HTTP front door of the bridge: room lifecycle, streamed queries, status

struct HttpRequest {
    std::string method;
    std::string path;
    std::map<std::string, std::string> headers;
    std::map<std::string, std::string> query_params;
    std::string body;
};

struct HttpResponse {
    int status_code;
    std::string status_text;
    std::map<std::string, std::string> headers;
    std::string body;
};

const char* http_status_text(int status_code);

class SimpleHttpServer {
public:
    SimpleHttpServer(int port, RoomCoordinator& coordinator, PipelineOrchestrator& orchestrator,
                     StreamSessionRegistry& registry, Database* database = nullptr,
                     SttClient* stt = nullptr);
    ~SimpleHttpServer();

    bool start();
    // stop_accepting() + wait_for_clients()
    void stop();
    // Closes the listener and half-closes every open client socket so idle
    // readers wake up; handlers already writing a response keep going
    void stop_accepting();
    // Blocks until every client handler thread has released its socket
    void wait_for_clients();
    size_t active_clients() const;
    bool is_running() const { return running_; }

    // Routes every request except the streamed query, which needs the socket
    HttpResponse handle_request(const HttpRequest& request);

    HttpRequest parse_request(const std::string& raw_request);
    std::string create_response(const HttpResponse& response);

    // Body -> JoinRequest, falling back to stored config for omitted fields.
    // Throws std::invalid_argument on a missing live_id or bad avatar_type.
    JoinRequest build_join_request(const nlohmann::json& body);
    QueryRequest build_query_request(const nlohmann::json& body);

private:
    int port_;
    int server_socket_;
    std::atomic<bool> running_;
    std::thread server_thread_;

    RoomCoordinator& coordinator_;
    PipelineOrchestrator& orchestrator_;
    StreamSessionRegistry& registry_;
    Database* database_;
    SttClient* stt_;

    mutable std::mutex clients_mutex_;
    std::condition_variable clients_cv_;
    std::set<int> client_sockets_;
    size_t active_clients_ = 0;

    void server_loop();
    void handle_client(int client_socket);
    void release_client(int client_socket);
    bool read_request(int client_socket, std::string& raw_request);
    void handle_query_stream(int client_socket, const HttpRequest& request);

    // API endpoints
    HttpResponse api_join_room(const HttpRequest& request);
    HttpResponse api_leave_room(const std::string& live_id);
    HttpResponse api_voice_recognize(const HttpRequest& request);
    HttpResponse api_query_cancel(const HttpRequest& request);
    HttpResponse api_reset_connections();
    HttpResponse api_connection_status();
    HttpResponse api_health();

    std::string config_value(const std::string& key, const std::string& fallback = "");
};

HttpResponse json_response(int status_code, const nlohmann::json& body);
HttpResponse error_response(const BridgeError& error);
