#pragma once

#include "cancel-token.h"

#include <chrono>
#include <memory>
#include <mutex>
#include <optional>
#include <set>
#include <string>
#include <unordered_map>
#include <vector>

// In-flight pipeline executions, indexed by session id and by live (room) id
class StreamSessionRegistry {
public:
    struct SessionInfo {
        std::string session_id;
        std::optional<std::string> live_id;
        bool cancelled = false;
        std::chrono::system_clock::time_point created_at;
    };

    // Registers a session and returns the token the pipeline must poll.
    // Registering an id that is still live cancels the older execution first.
    std::shared_ptr<CancelToken> register_session(const std::string& session_id,
                                                  const std::optional<std::string>& live_id);

    // 1 when this call tripped the session's signal, 0 if unknown or already cancelled
    size_t cancel_by_session(const std::string& session_id);

    // Number of signals tripped by this call under the given room
    size_t cancel_by_room(const std::string& live_id);

    size_t cancel_all();

    // Drops the session from both indices; safe to call more than once.
    // With an owner token, only the execution holding that token is removed.
    void release(const std::string& session_id, const std::shared_ptr<CancelToken>& owner = nullptr);

    void clear();

    bool contains(const std::string& session_id) const;
    bool room_has_sessions(const std::string& live_id) const;
    size_t size() const;
    std::vector<SessionInfo> snapshot() const;

private:
    struct Entry {
        std::optional<std::string> live_id;
        std::shared_ptr<CancelToken> token;
        std::chrono::system_clock::time_point created_at;
    };

    mutable std::mutex mutex_;
    std::unordered_map<std::string, Entry> sessions_;
    // Mirrors sessions_ for entries with a live id; pruned when a room empties
    std::unordered_map<std::string, std::set<std::string>> rooms_;

    void unindex_locked(const std::string& session_id, const std::optional<std::string>& live_id);
};
