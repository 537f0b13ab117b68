#include "stream-session-registry.h"

#include <iostream>

std::shared_ptr<CancelToken> StreamSessionRegistry::register_session(const std::string& session_id,
                                                                     const std::optional<std::string>& live_id) {
    std::lock_guard<std::mutex> lock(mutex_);

    auto existing = sessions_.find(session_id);
    if (existing != sessions_.end()) {
        std::cout << "🔁 [" << session_id << "] Replacing running stream session" << std::endl;
        existing->second.token->cancel();
        unindex_locked(session_id, existing->second.live_id);
        sessions_.erase(existing);
    }

    Entry entry;
    entry.live_id = live_id;
    entry.token = std::make_shared<CancelToken>();
    entry.created_at = std::chrono::system_clock::now();
    auto token = entry.token;
    sessions_.emplace(session_id, std::move(entry));

    if (live_id) {
        rooms_[*live_id].insert(session_id);
    }
    return token;
}

size_t StreamSessionRegistry::cancel_by_session(const std::string& session_id) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = sessions_.find(session_id);
    if (it == sessions_.end()) {
        return 0;
    }
    if (!it->second.token->cancel()) {
        return 0;
    }
    std::cout << "🛑 [" << session_id << "] Stream session cancelled" << std::endl;
    return 1;
}

size_t StreamSessionRegistry::cancel_by_room(const std::string& live_id) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto room = rooms_.find(live_id);
    if (room == rooms_.end()) {
        return 0;
    }

    size_t count = 0;
    for (const auto& session_id : room->second) {
        auto it = sessions_.find(session_id);
        if (it != sessions_.end() && it->second.token->cancel()) {
            ++count;
        }
    }
    if (count > 0) {
        std::cout << "🛑 [" << live_id << "] Cancelled " << count << " stream session(s)" << std::endl;
    }
    return count;
}

size_t StreamSessionRegistry::cancel_all() {
    std::lock_guard<std::mutex> lock(mutex_);
    size_t count = 0;
    for (auto& kv : sessions_) {
        if (kv.second.token->cancel()) ++count;
    }
    return count;
}

void StreamSessionRegistry::release(const std::string& session_id, const std::shared_ptr<CancelToken>& owner) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = sessions_.find(session_id);
    if (it == sessions_.end()) {
        return;
    }
    if (owner && it->second.token != owner) {
        // The id was re-registered by a newer execution
        return;
    }
    unindex_locked(session_id, it->second.live_id);
    sessions_.erase(it);
}

void StreamSessionRegistry::clear() {
    std::lock_guard<std::mutex> lock(mutex_);
    sessions_.clear();
    rooms_.clear();
}

bool StreamSessionRegistry::contains(const std::string& session_id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return sessions_.count(session_id) > 0;
}

bool StreamSessionRegistry::room_has_sessions(const std::string& live_id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return rooms_.count(live_id) > 0;
}

size_t StreamSessionRegistry::size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return sessions_.size();
}

std::vector<StreamSessionRegistry::SessionInfo> StreamSessionRegistry::snapshot() const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<SessionInfo> out;
    out.reserve(sessions_.size());
    for (const auto& kv : sessions_) {
        SessionInfo info;
        info.session_id = kv.first;
        info.live_id = kv.second.live_id;
        info.cancelled = kv.second.token->is_cancelled();
        info.created_at = kv.second.created_at;
        out.push_back(info);
    }
    return out;
}

void StreamSessionRegistry::unindex_locked(const std::string& session_id, const std::optional<std::string>& live_id) {
    if (!live_id) return;
    auto room = rooms_.find(*live_id);
    if (room == rooms_.end()) return;
    room->second.erase(session_id);
    if (room->second.empty()) {
        rooms_.erase(room);
    }
}
