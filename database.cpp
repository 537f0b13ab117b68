#include "database.h"
#include "uuid-util.h"
#include <iostream>

Database::Database() : db_(nullptr) {}

Database::~Database() {
    close();
}

bool Database::init(const std::string& db_path) {
    std::lock_guard<std::mutex> lock(db_mutex_);
    int rc = sqlite3_open(db_path.c_str(), &db_);
    if (rc != SQLITE_OK) {
        std::cerr << "Cannot open database: " << sqlite3_errmsg(db_) << std::endl;
        sqlite3_close(db_);
        db_ = nullptr;
        return false;
    }

    // Enable WAL mode for better performance
    sqlite3_exec(db_, "PRAGMA journal_mode=WAL;", nullptr, nullptr, nullptr);
    sqlite3_exec(db_, "PRAGMA synchronous=NORMAL;", nullptr, nullptr, nullptr);

    return create_tables();
}

void Database::close() {
    std::lock_guard<std::mutex> lock(db_mutex_);
    if (db_) {
        sqlite3_close(db_);
        db_ = nullptr;
    }
}

bool Database::create_tables() {
    const char* service_config_sql = R"(
        CREATE TABLE IF NOT EXISTS service_config (
            key TEXT PRIMARY KEY,
            value TEXT NOT NULL,
            updated_at DATETIME DEFAULT CURRENT_TIMESTAMP
        );
        INSERT OR IGNORE INTO service_config (key, value) VALUES ('tts_url', 'wss://voice.ap-southeast-1.bytepluses.com/api/v3/tts/bidirection');
        INSERT OR IGNORE INTO service_config (key, value) VALUES ('tts_app_key', '');
        INSERT OR IGNORE INTO service_config (key, value) VALUES ('tts_access_key', '');
        INSERT OR IGNORE INTO service_config (key, value) VALUES ('tts_resource_id', 'volc.service_type.10029');
        INSERT OR IGNORE INTO service_config (key, value) VALUES ('tts_speaker', 'zh_female_cancan_mars_bigtts');
        INSERT OR IGNORE INTO service_config (key, value) VALUES ('stt_url', 'wss://voice.ap-southeast-1.bytepluses.com/api/v3/sauc/bigmodel');
        INSERT OR IGNORE INTO service_config (key, value) VALUES ('stt_app_key', '');
        INSERT OR IGNORE INTO service_config (key, value) VALUES ('stt_access_key', '');
        INSERT OR IGNORE INTO service_config (key, value) VALUES ('stt_resource_id', 'volc.bigasr.sauc.duration');
        INSERT OR IGNORE INTO service_config (key, value) VALUES ('avatar_url', 'wss://openspeech.bytedance.com/virtual_human/avatar_live/live');
        INSERT OR IGNORE INTO service_config (key, value) VALUES ('avatar_appid', '');
        INSERT OR IGNORE INTO service_config (key, value) VALUES ('avatar_token', '');
        INSERT OR IGNORE INTO service_config (key, value) VALUES ('avatar_role', '');
        INSERT OR IGNORE INTO service_config (key, value) VALUES ('avatar_type', '3min');
        INSERT OR IGNORE INTO service_config (key, value) VALUES ('rtc_app_id', '');
        INSERT OR IGNORE INTO service_config (key, value) VALUES ('rtc_room_id', '');
        INSERT OR IGNORE INTO service_config (key, value) VALUES ('rtc_uid', '');
        INSERT OR IGNORE INTO service_config (key, value) VALUES ('rtc_token', '');
        INSERT OR IGNORE INTO service_config (key, value) VALUES ('llm_base_url', '');
        INSERT OR IGNORE INTO service_config (key, value) VALUES ('llm_api_key', '');
    )";

    const char* service_status_sql = R"(
        CREATE TABLE IF NOT EXISTS service_status (
            service TEXT PRIMARY KEY,
            status TEXT NOT NULL DEFAULT 'disconnected',
            updated_at DATETIME DEFAULT CURRENT_TIMESTAMP
        );
        INSERT OR IGNORE INTO service_status (service, status) VALUES ('tts', 'disconnected');
        INSERT OR IGNORE INTO service_status (service, status) VALUES ('stt', 'disconnected');
        INSERT OR IGNORE INTO service_status (service, status) VALUES ('avatar', 'disconnected');
    )";

    const char* rooms_sql = R"(
        CREATE TABLE IF NOT EXISTS rooms (
            live_id TEXT PRIMARY KEY,
            avatar_type TEXT DEFAULT '',
            role TEXT DEFAULT '',
            status TEXT DEFAULT 'joining',
            last_error TEXT DEFAULT '',
            created_at TEXT NOT NULL,
            updated_at TEXT NOT NULL
        );
    )";

    const char* stream_sessions_sql = R"(
        CREATE TABLE IF NOT EXISTS stream_sessions (
            id INTEGER PRIMARY KEY AUTOINCREMENT,
            session_id TEXT UNIQUE NOT NULL,
            run_id TEXT DEFAULT '',
            live_id TEXT DEFAULT '',
            user_id TEXT DEFAULT '',
            query TEXT DEFAULT '',
            full_text TEXT DEFAULT '',
            status TEXT DEFAULT 'running',
            started_at TEXT NOT NULL,
            finished_at TEXT
        );
        CREATE INDEX IF NOT EXISTS idx_stream_sessions_live_id ON stream_sessions(live_id);
    )";

    for (const char* sql : {service_config_sql, service_status_sql, rooms_sql, stream_sessions_sql}) {
        char* err_msg = nullptr;
        int rc = sqlite3_exec(db_, sql, nullptr, nullptr, &err_msg);
        if (rc != SQLITE_OK) {
            std::cerr << "SQL error creating tables: " << (err_msg ? err_msg : "unknown") << std::endl;
            sqlite3_free(err_msg);
            return false;
        }
    }

    // Databases created before run ids existed (ignore error if the column is there)
    sqlite3_exec(db_, "ALTER TABLE stream_sessions ADD COLUMN run_id TEXT DEFAULT ''", nullptr, nullptr, nullptr);
    return true;
}

bool Database::exec_update(const char* sql, const std::vector<std::string>& params, const char* context) {
    std::lock_guard<std::mutex> lock(db_mutex_);
    if (!db_) return false;

    sqlite3_stmt* stmt = nullptr;
    if (sqlite3_prepare_v2(db_, sql, -1, &stmt, nullptr) != SQLITE_OK) {
        std::cerr << "❌ SQLite prepare error in " << context << "(): " << sqlite3_errmsg(db_) << std::endl;
        return false;
    }
    for (size_t i = 0; i < params.size(); ++i) {
        sqlite3_bind_text(stmt, static_cast<int>(i + 1), params[i].c_str(), -1, SQLITE_TRANSIENT);
    }
    int rc = sqlite3_step(stmt);
    if (rc != SQLITE_DONE) {
        std::cerr << "❌ SQLite step error in " << context << "(): " << sqlite3_errmsg(db_) << std::endl;
    }
    sqlite3_finalize(stmt);
    return rc == SQLITE_DONE;
}

// Service configuration
std::string Database::get_config(const std::string& key, const std::string& fallback) {
    std::lock_guard<std::mutex> lock(db_mutex_);
    if (!db_) return fallback;

    const char* sql = "SELECT value FROM service_config WHERE key = ?";
    sqlite3_stmt* stmt = nullptr;
    std::string value = fallback;

    if (sqlite3_prepare_v2(db_, sql, -1, &stmt, nullptr) == SQLITE_OK) {
        sqlite3_bind_text(stmt, 1, key.c_str(), -1, SQLITE_STATIC);
        int step_result = sqlite3_step(stmt);
        if (step_result == SQLITE_ROW) {
            const char* text = (const char*)sqlite3_column_text(stmt, 0);
            if (text && *text) {
                value = text;
            }
        } else if (step_result != SQLITE_DONE) {
            std::cerr << "❌ SQLite step error in get_config(): " << sqlite3_errmsg(db_) << std::endl;
        }
        sqlite3_finalize(stmt);
    } else {
        std::cerr << "❌ SQLite prepare error in get_config(): " << sqlite3_errmsg(db_) << std::endl;
    }
    return value;
}

bool Database::set_config(const std::string& key, const std::string& value) {
    return exec_update("INSERT OR REPLACE INTO service_config (key, value, updated_at) VALUES (?, ?, CURRENT_TIMESTAMP)",
                       {key, value}, "set_config");
}

std::map<std::string, std::string> Database::get_all_config() {
    std::lock_guard<std::mutex> lock(db_mutex_);
    std::map<std::string, std::string> config;
    if (!db_) return config;

    const char* sql = "SELECT key, value FROM service_config ORDER BY key";
    sqlite3_stmt* stmt = nullptr;
    if (sqlite3_prepare_v2(db_, sql, -1, &stmt, nullptr) == SQLITE_OK) {
        while (sqlite3_step(stmt) == SQLITE_ROW) {
            const char* k = (const char*)sqlite3_column_text(stmt, 0);
            const char* v = (const char*)sqlite3_column_text(stmt, 1);
            if (k) config[k] = v ? v : "";
        }
        sqlite3_finalize(stmt);
    }
    return config;
}

// Service status
std::string Database::get_service_status(const std::string& service) {
    std::lock_guard<std::mutex> lock(db_mutex_);
    std::string status = "disconnected"; // default
    if (!db_) return status;

    const char* sql = "SELECT status FROM service_status WHERE service = ?";
    sqlite3_stmt* stmt = nullptr;
    if (sqlite3_prepare_v2(db_, sql, -1, &stmt, nullptr) == SQLITE_OK) {
        sqlite3_bind_text(stmt, 1, service.c_str(), -1, SQLITE_STATIC);
        if (sqlite3_step(stmt) == SQLITE_ROW) {
            const char* value = (const char*)sqlite3_column_text(stmt, 0);
            if (value) status = value;
        }
        sqlite3_finalize(stmt);
    }
    return status;
}

bool Database::set_service_status(const std::string& service, const std::string& status) {
    return exec_update("INSERT OR REPLACE INTO service_status (service, status, updated_at) VALUES (?, ?, CURRENT_TIMESTAMP)",
                       {service, status}, "set_service_status");
}

// Room management
bool Database::create_room(const std::string& live_id, const std::string& avatar_type, const std::string& role) {
    std::string now = get_current_timestamp();
    const char* sql = R"(
        INSERT INTO rooms (live_id, avatar_type, role, status, last_error, created_at, updated_at)
        VALUES (?, ?, ?, 'joining', '', ?, ?)
        ON CONFLICT(live_id) DO UPDATE SET
            avatar_type = excluded.avatar_type,
            role = excluded.role,
            status = 'joining',
            last_error = '',
            updated_at = excluded.updated_at
    )";
    return exec_update(sql, {live_id, avatar_type, role, now, now}, "create_room");
}

bool Database::set_room_status(const std::string& live_id, const std::string& status, const std::string& last_error) {
    std::string now = get_current_timestamp();
    const char* sql = R"(
        INSERT INTO rooms (live_id, status, last_error, created_at, updated_at)
        VALUES (?, ?, ?, ?, ?)
        ON CONFLICT(live_id) DO UPDATE SET
            status = excluded.status,
            last_error = excluded.last_error,
            updated_at = excluded.updated_at
    )";
    return exec_update(sql, {live_id, status, last_error, now, now}, "set_room_status");
}

namespace {

std::string column_string(sqlite3_stmt* stmt, int col) {
    const char* text = (const char*)sqlite3_column_text(stmt, col);
    return text ? text : "";
}

RoomRecord read_room(sqlite3_stmt* stmt) {
    RoomRecord room;
    room.live_id = column_string(stmt, 0);
    room.avatar_type = column_string(stmt, 1);
    room.role = column_string(stmt, 2);
    room.status = column_string(stmt, 3);
    room.last_error = column_string(stmt, 4);
    room.created_at = column_string(stmt, 5);
    room.updated_at = column_string(stmt, 6);
    return room;
}

StreamSessionRecord read_stream_session(sqlite3_stmt* stmt) {
    StreamSessionRecord s;
    s.session_id = column_string(stmt, 0);
    s.live_id = column_string(stmt, 1);
    s.user_id = column_string(stmt, 2);
    s.query = column_string(stmt, 3);
    s.full_text = column_string(stmt, 4);
    s.status = column_string(stmt, 5);
    s.started_at = column_string(stmt, 6);
    s.finished_at = column_string(stmt, 7);
    return s;
}

} // namespace

RoomRecord Database::get_room(const std::string& live_id) {
    std::lock_guard<std::mutex> lock(db_mutex_);
    RoomRecord room;
    if (!db_) return room;

    const char* sql = "SELECT live_id, avatar_type, role, status, last_error, created_at, updated_at FROM rooms WHERE live_id = ?";
    sqlite3_stmt* stmt = nullptr;
    if (sqlite3_prepare_v2(db_, sql, -1, &stmt, nullptr) == SQLITE_OK) {
        sqlite3_bind_text(stmt, 1, live_id.c_str(), -1, SQLITE_STATIC);
        if (sqlite3_step(stmt) == SQLITE_ROW) {
            room = read_room(stmt);
        }
        sqlite3_finalize(stmt);
    } else {
        std::cerr << "❌ SQLite prepare error in get_room(): " << sqlite3_errmsg(db_) << std::endl;
    }
    return room;
}

std::vector<RoomRecord> Database::get_all_rooms() {
    std::lock_guard<std::mutex> lock(db_mutex_);
    std::vector<RoomRecord> rooms;
    if (!db_) return rooms;

    const char* sql = "SELECT live_id, avatar_type, role, status, last_error, created_at, updated_at FROM rooms ORDER BY updated_at DESC";
    sqlite3_stmt* stmt = nullptr;
    if (sqlite3_prepare_v2(db_, sql, -1, &stmt, nullptr) == SQLITE_OK) {
        while (sqlite3_step(stmt) == SQLITE_ROW) {
            rooms.push_back(read_room(stmt));
        }
        sqlite3_finalize(stmt);
    }
    return rooms;
}

// Stream session history
bool Database::create_stream_session(const std::string& session_id, const std::string& run_id,
                                     const std::string& live_id, const std::string& user_id, const std::string& query) {
    const char* sql = R"(
        INSERT OR REPLACE INTO stream_sessions (session_id, run_id, live_id, user_id, query, full_text, status, started_at)
        VALUES (?, ?, ?, ?, ?, '', 'running', ?)
    )";
    return exec_update(sql, {session_id, run_id, live_id, user_id, query, get_current_timestamp()}, "create_stream_session");
}

bool Database::finish_stream_session(const std::string& session_id, const std::string& run_id,
                                     const std::string& full_text, const std::string& status) {
    // A run superseded under the same session id no longer owns the row
    const char* sql = "UPDATE stream_sessions SET full_text = ?, status = ?, finished_at = ? "
                      "WHERE session_id = ? AND run_id = ?";
    return exec_update(sql, {full_text, status, get_current_timestamp(), session_id, run_id}, "finish_stream_session");
}

StreamSessionRecord Database::get_stream_session(const std::string& session_id) {
    std::lock_guard<std::mutex> lock(db_mutex_);
    StreamSessionRecord s;
    if (!db_) return s;

    const char* sql = "SELECT session_id, live_id, user_id, query, full_text, status, started_at, finished_at "
                      "FROM stream_sessions WHERE session_id = ?";
    sqlite3_stmt* stmt = nullptr;
    if (sqlite3_prepare_v2(db_, sql, -1, &stmt, nullptr) == SQLITE_OK) {
        sqlite3_bind_text(stmt, 1, session_id.c_str(), -1, SQLITE_STATIC);
        if (sqlite3_step(stmt) == SQLITE_ROW) {
            s = read_stream_session(stmt);
        }
        sqlite3_finalize(stmt);
    } else {
        std::cerr << "❌ SQLite prepare error in get_stream_session(): " << sqlite3_errmsg(db_) << std::endl;
    }
    return s;
}

std::vector<StreamSessionRecord> Database::get_recent_stream_sessions(int limit) {
    std::lock_guard<std::mutex> lock(db_mutex_);
    std::vector<StreamSessionRecord> sessions;
    if (!db_) return sessions;

    const char* sql = "SELECT session_id, live_id, user_id, query, full_text, status, started_at, finished_at "
                      "FROM stream_sessions ORDER BY id DESC LIMIT ?";
    sqlite3_stmt* stmt = nullptr;
    if (sqlite3_prepare_v2(db_, sql, -1, &stmt, nullptr) == SQLITE_OK) {
        sqlite3_bind_int(stmt, 1, limit);
        while (sqlite3_step(stmt) == SQLITE_ROW) {
            sessions.push_back(read_stream_session(stmt));
        }
        sqlite3_finalize(stmt);
    }
    return sessions;
}
