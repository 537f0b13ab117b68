#pragma once

#include "avatar-client.h"
#include "bridge-errors.h"
#include "cancel-token.h"
#include "stream-session-registry.h"

#include <nlohmann/json.hpp>

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <future>
#include <map>
#include <memory>
#include <mutex>
#include <set>
#include <string>
#include <thread>

class Database;
class TtsClient;
class SttClient;

struct CoordinatorConfig {
    std::chrono::milliseconds cooldown{10000};
    int connect_attempts = 3;
    std::chrono::milliseconds retry_delay{3000};
    std::chrono::milliseconds connect_timeout{45000};
    std::chrono::milliseconds health_check_timeout{10000};
    std::chrono::milliseconds start_live_timeout{30000};
    std::chrono::milliseconds join_timeout{90000};
    std::chrono::milliseconds sweep_interval{5000};
};

struct JoinRequest {
    AvatarLiveOptions live;
    nlohmann::json streaming;
};

// Guards binding a room to the avatar control channel: one pending join per room,
// a cooldown after failures, and one connection attempt at a time process-wide.
class RoomCoordinator {
public:
    RoomCoordinator(const CoordinatorConfig& config, AvatarClient& avatar, StreamSessionRegistry& registry,
                    TtsClient* tts = nullptr, SttClient* stt = nullptr, Database* database = nullptr);
    ~RoomCoordinator();

    // Returns {"live_id", "status": "joined"|"already_active", ...}. Throws BridgeError:
    // ConcurrencyRejected (pending or cooling down), Timeout, Connection, Session, Cancelled.
    nlohmann::json join_room(const JoinRequest& request);

    nlohmann::json leave_room(const std::string& live_id);

    // Cancels everything and disconnects every client; never throws
    nlohmann::json reset();

    nlohmann::json status();

    bool is_active(const std::string& live_id);
    bool is_pending(const std::string& live_id);
    // Seconds left in the room's cooldown, 0 when none
    double cooldown_remaining(const std::string& live_id);

private:
    struct JoinAttempt {
        uint64_t id = 0;
        std::string live_id;
        std::shared_ptr<CancelToken> cancel = std::make_shared<CancelToken>();
        std::promise<nlohmann::json> result;
    };

    CoordinatorConfig config_;
    AvatarClient& avatar_;
    StreamSessionRegistry& registry_;
    TtsClient* tts_;
    SttClient* stt_;
    Database* database_;

    // pending_, active_, failures_ and the attempt counter
    std::mutex state_mutex_;
    std::map<std::string, std::shared_ptr<JoinAttempt>> pending_;
    std::set<std::string> active_;
    std::map<std::string, std::chrono::steady_clock::time_point> failures_;
    uint64_t next_attempt_id_ = 0;
    // Counters fed by the avatar event listener of the bound live
    nlohmann::json avatar_events_ = nlohmann::json::object();

    // Held around connect, health check and start-live only
    std::mutex connection_mutex_;

    std::mutex workers_mutex_;
    std::condition_variable workers_cv_;
    size_t active_workers_ = 0;

    std::atomic<bool> running_{true};
    std::mutex sweep_mutex_;
    std::condition_variable sweep_cv_;
    std::thread sweeper_thread_;

    void run_join(std::shared_ptr<JoinAttempt> attempt, JoinRequest request);
    void connect_with_retry(const CancelToken& cancel);
    void finish_attempt(const std::shared_ptr<JoinAttempt>& attempt, bool joined, const BridgeError* error);
    double cooldown_remaining_locked(const std::string& live_id, std::chrono::steady_clock::time_point now);
    // Drains heartbeats and status events for as long as the live runs
    void watch_avatar_events(const std::string& live_id);
    void sweep_loop();
    void record_room(const std::string& live_id, const std::string& status, const std::string& error = "");
    void record_service(const std::string& service, const std::string& status);
};
