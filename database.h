#pragma once

#include <string>
#include <map>
#include <memory>
#include <vector>
#include <mutex>
#include <sqlite3.h>

struct RoomRecord {
    std::string live_id;
    std::string avatar_type;
    std::string role;
    std::string status;       // 'joining', 'active', 'left', 'failed'
    std::string last_error;
    std::string created_at;
    std::string updated_at;
};

struct StreamSessionRecord {
    std::string session_id;
    std::string live_id;
    std::string user_id;
    std::string query;
    std::string full_text;    // Accumulated LLM answer
    std::string status;       // 'running', 'complete', 'cancelled', 'error'
    std::string started_at;
    std::string finished_at;
};

class Database {
public:
    Database();
    ~Database();

    bool init(const std::string& db_path = "avatar_bridge.db");
    void close();

    // Remote service configuration (credentials, endpoints, defaults)
    std::string get_config(const std::string& key, const std::string& fallback = "");
    bool set_config(const std::string& key, const std::string& value);
    std::map<std::string, std::string> get_all_config();

    // Client status: "connected", "disconnected", "error"
    std::string get_service_status(const std::string& service);
    bool set_service_status(const std::string& service, const std::string& status);

    // Room management
    bool create_room(const std::string& live_id, const std::string& avatar_type, const std::string& role);
    bool set_room_status(const std::string& live_id, const std::string& status, const std::string& last_error = "");
    RoomRecord get_room(const std::string& live_id);
    std::vector<RoomRecord> get_all_rooms();

    // Stream session history
    // run_id tells apart executions that reuse a session id; only the latest run may finish the row
    bool create_stream_session(const std::string& session_id, const std::string& run_id, const std::string& live_id,
                               const std::string& user_id, const std::string& query);
    bool finish_stream_session(const std::string& session_id, const std::string& run_id,
                               const std::string& full_text, const std::string& status);
    StreamSessionRecord get_stream_session(const std::string& session_id);
    std::vector<StreamSessionRecord> get_recent_stream_sessions(int limit = 50);

private:
    sqlite3* db_;
    mutable std::mutex db_mutex_;  // Thread safety for database operations
    bool create_tables();
    bool exec_update(const char* sql, const std::vector<std::string>& params, const char* context);
};
