#include "room-coordinator.h"
#include "database.h"
#include "stt-client.h"
#include "tts-client.h"

#include <functional>
#include <iostream>

RoomCoordinator::RoomCoordinator(const CoordinatorConfig& config, AvatarClient& avatar, StreamSessionRegistry& registry,
                                 TtsClient* tts, SttClient* stt, Database* database)
    : config_(config), avatar_(avatar), registry_(registry), tts_(tts), stt_(stt), database_(database) {
    sweeper_thread_ = std::thread(&RoomCoordinator::sweep_loop, this);
}

RoomCoordinator::~RoomCoordinator() {
    // The listener callbacks point back here
    avatar_.stop_listening();
    running_.store(false);
    {
        std::lock_guard<std::mutex> lock(sweep_mutex_);
        sweep_cv_.notify_all();
    }
    if (sweeper_thread_.joinable()) sweeper_thread_.join();

    {
        std::lock_guard<std::mutex> lock(state_mutex_);
        for (auto& kv : pending_) kv.second->cancel->cancel();
    }
    std::unique_lock<std::mutex> lock(workers_mutex_);
    workers_cv_.wait(lock, [this]() { return active_workers_ == 0; });
}

double RoomCoordinator::cooldown_remaining_locked(const std::string& live_id, std::chrono::steady_clock::time_point now) {
    auto it = failures_.find(live_id);
    if (it == failures_.end()) return 0.0;
    auto elapsed = now - it->second;
    if (elapsed >= config_.cooldown) {
        failures_.erase(it);
        return 0.0;
    }
    return std::chrono::duration<double>(config_.cooldown - elapsed).count();
}

double RoomCoordinator::cooldown_remaining(const std::string& live_id) {
    std::lock_guard<std::mutex> lock(state_mutex_);
    return cooldown_remaining_locked(live_id, std::chrono::steady_clock::now());
}

bool RoomCoordinator::is_active(const std::string& live_id) {
    std::lock_guard<std::mutex> lock(state_mutex_);
    return active_.count(live_id) > 0;
}

bool RoomCoordinator::is_pending(const std::string& live_id) {
    std::lock_guard<std::mutex> lock(state_mutex_);
    return pending_.count(live_id) > 0;
}

nlohmann::json RoomCoordinator::join_room(const JoinRequest& request) {
    const std::string& live_id = request.live.live_id;
    if (live_id.empty()) {
        throw BridgeError(ErrorKind::Session, "live_id is required");
    }

    std::shared_ptr<JoinAttempt> attempt;
    std::future<nlohmann::json> result;
    {
        std::lock_guard<std::mutex> lock(state_mutex_);
        if (pending_.count(live_id)) {
            std::cout << "⚠️ [" << live_id << "] Join already in progress, rejecting" << std::endl;
            throw BridgeError(ErrorKind::ConcurrencyRejected, "join already in progress for " + live_id);
        }

        double remaining = cooldown_remaining_locked(live_id, std::chrono::steady_clock::now());
        if (remaining > 0.0) {
            std::cout << "⏳ [" << live_id << "] In failure cooldown, " << remaining << "s left" << std::endl;
            BridgeError e(ErrorKind::ConcurrencyRejected,
                          "room " + live_id + " is cooling down after a failed join, retry in " +
                          std::to_string(static_cast<int>(remaining + 0.999)) + "s");
            e.set_retry_after_seconds(remaining);
            throw e;
        }

        if (active_.count(live_id)) {
            auto bound = avatar_.live_id();
            if (avatar_.is_connected() && bound && *bound == live_id) {
                std::cout << "✅ [" << live_id << "] Room already active" << std::endl;
                return {{"live_id", live_id}, {"status", "already_active"}};
            }
            std::cout << "⚠️ [" << live_id << "] Dropping stale active entry" << std::endl;
            active_.erase(live_id);
        }

        attempt = std::make_shared<JoinAttempt>();
        attempt->id = ++next_attempt_id_;
        attempt->live_id = live_id;
        result = attempt->result.get_future();
        pending_[live_id] = attempt;
    }

    if (database_) {
        database_->create_room(live_id, avatar_type_name(request.live.avatar_type), request.live.role);
    }

    {
        std::lock_guard<std::mutex> lock(workers_mutex_);
        ++active_workers_;
    }
    std::thread(&RoomCoordinator::run_join, this, attempt, request).detach();

    if (result.wait_for(config_.join_timeout) != std::future_status::ready) {
        attempt->cancel->cancel();
        {
            std::lock_guard<std::mutex> lock(state_mutex_);
            auto it = pending_.find(live_id);
            if (it != pending_.end() && it->second == attempt) {
                pending_.erase(it);
                failures_[live_id] = std::chrono::steady_clock::now();
            }
        }
        record_room(live_id, "failed", "join timed out");
        std::cout << "❌ [" << live_id << "] Join timed out after " << config_.join_timeout.count() << "ms" << std::endl;
        throw BridgeError(ErrorKind::Timeout, "join_room timed out for " + live_id);
    }
    return result.get();
}

void RoomCoordinator::run_join(std::shared_ptr<JoinAttempt> attempt, JoinRequest request) {
    const std::string& live_id = attempt->live_id;
    try {
        nlohmann::json started;
        {
            std::lock_guard<std::mutex> conn_lock(connection_mutex_);
            if (attempt->cancel->is_cancelled()) {
                throw BridgeError(ErrorKind::Cancelled, "join cancelled before connecting");
            }

            std::cout << "🔌 [" << live_id << "] Acquired connection lock" << std::endl;
            connect_with_retry(*attempt->cancel);

            auto previous = avatar_.live_id();
            if (previous && *previous != live_id) {
                std::cout << "⚠️ Avatar still bound to " << *previous << ", stopping it for " << live_id << std::endl;
                avatar_.stop_live();
                std::lock_guard<std::mutex> lock(state_mutex_);
                active_.erase(*previous);
            }

            started = avatar_.start_live(request.live, request.streaming, config_.start_live_timeout);

            if (attempt->cancel->is_cancelled()) {
                std::cout << "⚠️ [" << live_id << "] Join cancelled after start-live, stopping" << std::endl;
                avatar_.stop_live();
                throw BridgeError(ErrorKind::Cancelled, "join cancelled");
            }
            watch_avatar_events(live_id);
        }

        started["status"] = "joined";
        finish_attempt(attempt, true, nullptr);
        attempt->result.set_value(started);
    } catch (const BridgeError& e) {
        if (attempt->cancel->is_cancelled() && e.kind() != ErrorKind::Cancelled) {
            // Leave or reset tore the socket down underneath the attempt
            BridgeError cancelled(ErrorKind::Cancelled, std::string("join cancelled: ") + e.what());
            finish_attempt(attempt, false, &cancelled);
            attempt->result.set_exception(std::make_exception_ptr(cancelled));
        } else {
            finish_attempt(attempt, false, &e);
            attempt->result.set_exception(std::current_exception());
        }
    } catch (const std::exception& e) {
        BridgeError wrapped(ErrorKind::Connection, std::string("join failed: ") + e.what());
        finish_attempt(attempt, false, &wrapped);
        attempt->result.set_exception(std::make_exception_ptr(wrapped));
    }

    std::lock_guard<std::mutex> lock(workers_mutex_);
    --active_workers_;
    workers_cv_.notify_all();
}

void RoomCoordinator::connect_with_retry(const CancelToken& cancel) {
    BridgeError last(ErrorKind::Connection, "avatar connection not attempted");

    for (int attempt = 1; attempt <= config_.connect_attempts; ++attempt) {
        if (cancel.is_cancelled()) {
            throw BridgeError(ErrorKind::Cancelled, "join cancelled");
        }
        try {
            if (!avatar_.is_connected()) {
                avatar_.connect(config_.connect_timeout);
            }
            if (avatar_.health_check(config_.health_check_timeout)) {
                record_service("avatar", "connected");
                return;
            }
            std::cout << "⚠️ Avatar health check failed on attempt " << attempt << ", reconnecting" << std::endl;
            avatar_.disconnect();
            last = BridgeError(ErrorKind::Connection, "avatar health check failed");
        } catch (const BridgeError& e) {
            if (e.kind() != ErrorKind::Connection && e.kind() != ErrorKind::Timeout) throw;
            last = e;
            std::cout << "⚠️ Avatar connect attempt " << attempt << "/" << config_.connect_attempts
                      << " failed: " << e.what() << std::endl;
        }

        if (attempt < config_.connect_attempts && cancel.wait_for(config_.retry_delay)) {
            throw BridgeError(ErrorKind::Cancelled, "join cancelled");
        }
    }
    record_service("avatar", "error");
    throw BridgeError(last.kind(), "avatar connection failed after " + std::to_string(config_.connect_attempts) +
                                   " attempts: " + last.what());
}

void RoomCoordinator::finish_attempt(const std::shared_ptr<JoinAttempt>& attempt, bool joined, const BridgeError* error) {
    const std::string& live_id = attempt->live_id;
    bool owner = false;
    {
        std::lock_guard<std::mutex> lock(state_mutex_);
        auto it = pending_.find(live_id);
        if (it != pending_.end() && it->second == attempt) {
            pending_.erase(it);
            owner = true;
        }
        // After a timeout, leave or reset the marker is already gone and so is the bookkeeping
        if (owner && joined) {
            active_.insert(live_id);
            failures_.erase(live_id);
        } else if (owner && error && error->kind() != ErrorKind::Cancelled) {
            failures_[live_id] = std::chrono::steady_clock::now();
        }
    }

    if (!owner) return;
    if (joined) {
        record_room(live_id, "active");
        std::cout << "✅ [" << live_id << "] Room joined" << std::endl;
    } else if (error && error->kind() != ErrorKind::Cancelled) {
        record_room(live_id, "failed", error->what());
        std::cout << "❌ [" << live_id << "] Join failed (" << error_kind_name(error->kind()) << "): "
                  << error->what() << std::endl;
    } else {
        std::cout << "🛑 [" << live_id << "] Join cancelled" << std::endl;
    }
}

nlohmann::json RoomCoordinator::leave_room(const std::string& live_id) {
    size_t cancelled = registry_.cancel_by_room(live_id);
    bool had_pending = false;
    bool was_active = false;
    {
        std::lock_guard<std::mutex> lock(state_mutex_);
        auto it = pending_.find(live_id);
        if (it != pending_.end()) {
            it->second->cancel->cancel();
            pending_.erase(it);
            had_pending = true;
        }
        was_active = active_.erase(live_id) > 0;
    }

    auto bound = avatar_.live_id();
    bool bound_here = bound && *bound == live_id;
    if (!was_active && !had_pending && !bound_here) {
        // The clients may be serving another room
        std::cout << "ℹ️ [" << live_id << "] Room not active, connections left untouched ("
                  << cancelled << " stream session(s) cancelled)" << std::endl;
        return {
            {"live_id", live_id},
            {"status", "not_active"},
            {"was_active", false},
            {"cancelled_join", false},
            {"cancelled_sessions", cancelled}
        };
    }

    if (bound_here) {
        avatar_.stop_live();
    }
    avatar_.disconnect();
    if (tts_) tts_->disconnect();
    if (stt_) stt_->disconnect();
    record_service("avatar", "disconnected");
    if (tts_) record_service("tts", "disconnected");
    if (stt_) record_service("stt", "disconnected");
    {
        std::lock_guard<std::mutex> lock(state_mutex_);
        avatar_events_ = nlohmann::json::object();
    }

    record_room(live_id, "left");
    std::cout << "👋 [" << live_id << "] Left room (" << cancelled << " stream session(s) cancelled)" << std::endl;
    return {
        {"live_id", live_id},
        {"status", "left"},
        {"was_active", was_active},
        {"cancelled_join", had_pending},
        {"cancelled_sessions", cancelled}
    };
}

nlohmann::json RoomCoordinator::reset() {
    size_t pending = 0;
    size_t rooms = 0;
    {
        std::lock_guard<std::mutex> lock(state_mutex_);
        for (auto& kv : pending_) kv.second->cancel->cancel();
        pending = pending_.size();
        rooms = active_.size();
        pending_.clear();
        active_.clear();
        failures_.clear();
        avatar_events_ = nlohmann::json::object();
    }
    size_t sessions = registry_.cancel_all();

    nlohmann::json errors = nlohmann::json::array();
    auto best_effort = [&errors](const char* name, const std::function<void()>& fn) {
        try {
            fn();
        } catch (const std::exception& e) {
            std::cout << "⚠️ Reset: " << name << " disconnect failed: " << e.what() << std::endl;
            errors.push_back({{"client", name}, {"error", e.what()}});
        }
    };
    best_effort("avatar", [this]() { avatar_.disconnect(); });
    if (tts_) best_effort("tts", [this]() { tts_->disconnect(); });
    if (stt_) best_effort("stt", [this]() { stt_->disconnect(); });
    record_service("avatar", "disconnected");
    if (tts_) record_service("tts", "disconnected");
    if (stt_) record_service("stt", "disconnected");

    std::cout << "🔄 Connections reset: " << pending << " pending join(s), " << rooms << " room(s), "
              << sessions << " stream session(s)" << std::endl;
    return {
        {"status", "reset"},
        {"cancelled_joins", pending},
        {"cleared_rooms", rooms},
        {"cancelled_sessions", sessions},
        {"errors", errors}
    };
}

nlohmann::json RoomCoordinator::status() {
    nlohmann::json out;
    {
        std::lock_guard<std::mutex> lock(state_mutex_);
        auto now = std::chrono::steady_clock::now();
        out["active_rooms"] = nlohmann::json(std::vector<std::string>(active_.begin(), active_.end()));
        nlohmann::json pending = nlohmann::json::array();
        for (const auto& kv : pending_) pending.push_back(kv.first);
        out["pending_joins"] = pending;
        nlohmann::json cooldowns = nlohmann::json::object();
        for (auto it = failures_.begin(); it != failures_.end(); ++it) {
            auto elapsed = now - it->second;
            if (elapsed < config_.cooldown) {
                cooldowns[it->first] = std::chrono::duration<double>(config_.cooldown - elapsed).count();
            }
        }
        out["cooldowns"] = cooldowns;
    }

    auto bound = avatar_.live_id();
    bool avatar_connected = avatar_.is_connected();
    out["avatar"] = {
        {"initialized", true},
        {"state", avatar_state_name(avatar_.state())},
        {"connected", avatar_connected},
        {"live_id", bound ? nlohmann::json(*bound) : nlohmann::json(nullptr)},
        {"health_check", avatar_connected ? avatar_.health_check() : false}
    };
    {
        std::lock_guard<std::mutex> lock(state_mutex_);
        out["avatar"]["events"] = avatar_events_;
    }
    out["tts"] = {
        {"initialized", tts_ != nullptr},
        {"connected", tts_ ? tts_->is_connected() : false},
        {"health_check", tts_ ? tts_->health_check() : false}
    };
    if (tts_) {
        auto st = tts_->get_stats();
        out["tts"]["stats"] = {
            {"sessions", st.sessions},
            {"audio_chunks", st.audio_chunks},
            {"audio_bytes", st.audio_bytes},
            {"failures", st.failures}
        };
    }
    record_service("avatar", avatar_connected ? "connected" : "disconnected");
    if (tts_) record_service("tts", tts_->is_connected() ? "connected" : "disconnected");
    if (stt_) record_service("stt", stt_->is_connected() ? "connected" : "disconnected");
    out["stt"] = {
        {"initialized", stt_ != nullptr},
        {"connected", stt_ ? stt_->is_connected() : false},
        {"health_check", stt_ ? stt_->health_check() : false}
    };
    if (stt_) {
        auto st = stt_->get_stats();
        out["stt"]["stats"] = {
            {"sessions", st.sessions},
            {"audio_bytes_sent", st.audio_bytes_sent},
            {"results", st.results},
            {"errors", st.errors}
        };
    }

    nlohmann::json sessions = nlohmann::json::array();
    for (const auto& s : registry_.snapshot()) {
        sessions.push_back({
            {"session_id", s.session_id},
            {"live_id", s.live_id ? nlohmann::json(*s.live_id) : nlohmann::json(nullptr)},
            {"cancelled", s.cancelled}
        });
    }
    out["stream_sessions"] = sessions;

    if (database_) {
        nlohmann::json rooms = nlohmann::json::array();
        for (const auto& r : database_->get_all_rooms()) {
            rooms.push_back({{"live_id", r.live_id}, {"status", r.status}, {"last_error", r.last_error},
                             {"updated_at", r.updated_at}});
        }
        out["room_history"] = rooms;
        nlohmann::json recent = nlohmann::json::array();
        for (const auto& r : database_->get_recent_stream_sessions(20)) {
            recent.push_back({{"session_id", r.session_id}, {"live_id", r.live_id}, {"status", r.status},
                              {"started_at", r.started_at}, {"finished_at", r.finished_at}});
        }
        out["recent_sessions"] = recent;
    }
    return out;
}

void RoomCoordinator::watch_avatar_events(const std::string& live_id) {
    {
        std::lock_guard<std::mutex> lock(state_mutex_);
        avatar_events_ = {{"live_id", live_id}, {"status_events", 0}, {"errors", 0}};
    }
    avatar_.listen_events(
        [this, live_id](const std::string& type, const nlohmann::json&) {
            std::lock_guard<std::mutex> lock(state_mutex_);
            if (avatar_events_.value("live_id", std::string()) != live_id) return;
            avatar_events_["status_events"] = avatar_events_["status_events"].get<int>() + 1;
            avatar_events_["last_status"] = type;
        },
        [this, live_id](int code, const std::string& message) {
            {
                std::lock_guard<std::mutex> lock(state_mutex_);
                if (avatar_events_.value("live_id", std::string()) != live_id) return;
                avatar_events_["errors"] = avatar_events_["errors"].get<int>() + 1;
                avatar_events_["last_error"] = {{"code", code}, {"message", message}};
            }
            std::cout << "⚠️ [" << live_id << "] Avatar reported error " << code << ": " << message << std::endl;
        });
    std::cout << "📡 [" << live_id << "] Listening for avatar events" << std::endl;
}

void RoomCoordinator::sweep_loop() {
    while (running_.load()) {
        std::unique_lock<std::mutex> lock(sweep_mutex_);
        sweep_cv_.wait_for(lock, config_.sweep_interval, [this]() { return !running_.load(); });
        if (!running_.load()) break;
        lock.unlock();

        std::lock_guard<std::mutex> state_lock(state_mutex_);
        auto now = std::chrono::steady_clock::now();
        for (auto it = failures_.begin(); it != failures_.end();) {
            if (now - it->second >= config_.cooldown) {
                it = failures_.erase(it);
            } else {
                ++it;
            }
        }
    }
}

void RoomCoordinator::record_room(const std::string& live_id, const std::string& status, const std::string& error) {
    if (database_) {
        database_->set_room_status(live_id, status, error);
    }
}

void RoomCoordinator::record_service(const std::string& service, const std::string& status) {
    if (database_) {
        database_->set_service_status(service, status);
    }
}
