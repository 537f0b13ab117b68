#include "database.h"
#include "room-coordinator.h"
#include "fake-transport.h"
#include "test-util.h"

#include <chrono>
#include <future>
#include <memory>
#include <string>
#include <thread>

using namespace std::chrono_literals;

static CoordinatorConfig fast_coordinator_config() {
    CoordinatorConfig cfg;
    cfg.cooldown = 300ms;
    cfg.connect_attempts = 2;
    cfg.retry_delay = 5ms;
    cfg.connect_timeout = 500ms;
    cfg.health_check_timeout = 100ms;
    cfg.start_live_timeout = 1000ms;
    cfg.join_timeout = 2000ms;
    cfg.sweep_interval = 50ms;
    return cfg;
}

static AvatarClientConfig single_strategy_avatar() {
    AvatarClientConfig cfg;
    cfg.appid = "appid";
    cfg.token = "token";
    cfg.strategies = {{true, 200ms}};
    cfg.strategy_delay = 1ms;
    cfg.stop_grace = 1ms;
    return cfg;
}

static JoinRequest join_request(const std::string& live_id) {
    JoinRequest req;
    req.live.live_id = live_id;
    req.live.role = "role";
    req.streaming = AvatarClient::rtc_streaming("app", "room", "uid", "token");
    return req;
}

// Fake avatar service, client, registry and coordinator wired together
struct Harness {
    FakeAvatarServer server;
    FakeTransport* fake = nullptr;
    std::unique_ptr<AvatarClient> avatar;
    StreamSessionRegistry registry;
    Database database;
    std::unique_ptr<RoomCoordinator> coordinator;

    explicit Harness(const CoordinatorConfig& cfg = fast_coordinator_config(),
                     const AvatarClientConfig& avatar_cfg = single_strategy_avatar()) {
        auto transport = std::make_unique<FakeTransport>();
        fake = transport.get();
        server.install(*fake);
        avatar = std::make_unique<AvatarClient>(avatar_cfg, std::move(transport));
        database.init(":memory:");
        coordinator = std::make_unique<RoomCoordinator>(cfg, *avatar, registry, nullptr, nullptr, &database);
    }

    ~Harness() {
        coordinator.reset();
        avatar.reset();
    }
};

static ErrorKind join_error(RoomCoordinator& coordinator, const std::string& live_id, double* retry_after = nullptr) {
    try {
        coordinator.join_room(join_request(live_id));
    } catch (const BridgeError& e) {
        if (retry_after) *retry_after = e.retry_after_seconds();
        return e.kind();
    }
    throw std::runtime_error("join_room unexpectedly succeeded for " + live_id);
}

static void test_join_and_already_active() {
    section("Join, then join again");
    Harness h;
    auto first = h.coordinator->join_room(join_request("live-1"));
    check_eq(first["status"].get<std::string>(), std::string("joined"), "first join binds the room");
    check(h.coordinator->is_active("live-1"), "room tracked as active");
    check_eq(h.database.get_room("live-1").status, std::string("active"), "room row marked active");
    check_eq(h.database.get_service_status("avatar"), std::string("connected"), "avatar service status persisted");

    auto second = h.coordinator->join_room(join_request("live-1"));
    check_eq(second["status"].get<std::string>(), std::string("already_active"), "second join is a no-op");
    check_eq(h.server.start_requests().size(), size_t(1), "only one start-live sent");
    check_eq(h.fake->connect_count(), 1, "connection reused");

    auto status = h.coordinator->status();
    check(status["active_rooms"].size() == 1 && status["avatar"]["connected"].get<bool>(), "status reports the room");
    check(status["room_history"].size() == 1 && status["room_history"][0]["status"] == "active",
          "status includes the persisted room history");
    check(status["recent_sessions"].empty(), "no stream sessions recorded yet");
}

static void test_pending_rejection() {
    section("Concurrent join of the same room");
    Harness h;
    h.server.start_delay = 300ms;
    auto pending = std::async(std::launch::async, [&h]() { return h.coordinator->join_room(join_request("live-p")); });

    check(wait_until([&h]() { return h.coordinator->is_pending("live-p"); }), "first join is pending");
    check(join_error(*h.coordinator, "live-p") == ErrorKind::ConcurrencyRejected, "second join rejected while pending");

    auto result = pending.get();
    check_eq(result["status"].get<std::string>(), std::string("joined"), "pending join completes");
    check(!h.coordinator->is_pending("live-p"), "pending marker cleared");
}

static void test_cooldown() {
    section("Cooldown after a failed join");
    Harness h;
    h.fake->fail_next_connects(100);

    check(join_error(*h.coordinator, "live-c") == ErrorKind::Connection, "join fails after all connect attempts");
    check_eq(h.fake->connect_count(), 2, "one socket per connect attempt");
    check_eq(h.database.get_room("live-c").status, std::string("failed"), "room row marked failed");
    check_eq(h.database.get_service_status("avatar"), std::string("error"), "avatar service status is error");

    double retry_after = 0.0;
    check(join_error(*h.coordinator, "live-c", &retry_after) == ErrorKind::ConcurrencyRejected, "immediate retry rejected");
    check(retry_after > 0.0 && retry_after <= 0.3, "rejection carries the time left");
    check_eq(h.fake->connect_count(), 2, "no socket opened during cooldown");
    check(h.coordinator->status()["cooldowns"].contains("live-c"), "status lists the cooldown");

    h.fake->fail_next_connects(0);
    check(wait_until([&h]() { return h.coordinator->cooldown_remaining("live-c") == 0.0; }), "cooldown expires");
    auto joined = h.coordinator->join_room(join_request("live-c"));
    check_eq(joined["status"].get<std::string>(), std::string("joined"), "join allowed after the cooldown");
    check_eq(h.coordinator->cooldown_remaining("live-c"), 0.0, "success clears the failure record");
}

static void test_connect_retry() {
    section("Connect retry");
    CoordinatorConfig cfg = fast_coordinator_config();
    cfg.connect_attempts = 3;
    Harness h(cfg);
    h.fake->fail_next_connects(2);

    auto joined = h.coordinator->join_room(join_request("live-r"));
    check_eq(joined["status"].get<std::string>(), std::string("joined"), "third attempt joins");
    check_eq(h.fake->connect_count(), 3, "three sockets tried");
}

static void test_leave() {
    section("Leave room");
    Harness h;
    h.coordinator->join_room(join_request("live-l"));
    auto token = h.registry.register_session("s-1", std::string("live-l"));
    auto other = h.registry.register_session("s-2", std::string("elsewhere"));

    auto left = h.coordinator->leave_room("live-l");
    check_eq(left["status"].get<std::string>(), std::string("left"), "leave reports left");
    check(left["was_active"].get<bool>(), "room was active");
    check_eq(left["cancelled_sessions"].get<size_t>(), size_t(1), "one session cancelled");
    check(token->is_cancelled() && !other->is_cancelled(), "only the room's sessions are cancelled");
    check_eq(h.server.count_control("|CTL|01|"), 1, "stop-live sent");
    check(!h.avatar->is_connected(), "avatar disconnected");
    check(!h.coordinator->is_active("live-l"), "room no longer active");
    check_eq(h.database.get_room("live-l").status, std::string("left"), "room row marked left");
    check_eq(h.database.get_service_status("avatar"), std::string("disconnected"), "avatar service status is disconnected");
}

static void test_leave_other_room() {
    section("Leave a room that was never joined");
    Harness h;
    h.coordinator->join_room(join_request("room-a"));
    auto stray = h.registry.register_session("s-b", std::string("room-b"));

    auto left = h.coordinator->leave_room("room-b");
    check_eq(left["status"].get<std::string>(), std::string("not_active"), "unknown room reported as not active");
    check(!left["was_active"].get<bool>(), "room b was not active");
    check(stray->is_cancelled(), "room b's own sessions are still cancelled");
    check(h.avatar->is_connected(), "room a's avatar still connected");
    auto bound = h.avatar->live_id();
    check(bound && *bound == "room-a", "avatar still bound to room a");
    check_eq(h.server.count_control("|CTL|01|"), 0, "no stop-live sent");
    check(h.coordinator->is_active("room-a"), "room a still tracked as active");
    check_eq(h.database.get_room("room-a").status, std::string("active"), "room a row untouched");
}

static void test_avatar_events_drained() {
    section("Avatar events after a join");
    Harness h;
    h.coordinator->join_room(join_request("live-e"));

    for (int i = 0; i < 20; ++i) h.fake->push_text("|MSG|02|{}");
    h.fake->push_text(R"(|DAT|02|{"type":"voice_start","data":{}})");
    h.fake->push_text(R"(|MSG|01|{"code":5002,"message":"busy"})");

    check(wait_until([&h]() { return h.fake->queued() == 0; }), "heartbeats and events do not pile up");
    check(wait_until([&h]() {
        auto events = h.coordinator->status()["avatar"]["events"];
        return events.value("status_events", 0) == 1 && events.value("errors", 0) == 1;
    }), "status counts the live's events");
    auto events = h.coordinator->status()["avatar"]["events"];
    check_eq(events.value("last_status", std::string()), std::string("voice_start"), "last status event kept");
    check(events.contains("last_error") && events["last_error"].value("code", 0) == 5002, "last avatar error kept");

    h.coordinator->leave_room("live-e");
    check(h.coordinator->status()["avatar"]["events"].empty(), "leave clears the event counters");
}

static void test_join_timeout() {
    section("Join timeout");
    CoordinatorConfig cfg = fast_coordinator_config();
    cfg.join_timeout = 100ms;
    cfg.cooldown = 5000ms;
    Harness h(cfg);
    h.server.start_delay = 400ms;

    check(join_error(*h.coordinator, "live-t") == ErrorKind::Timeout, "slow start-live times out");
    check(!h.coordinator->is_pending("live-t"), "pending marker cleared on timeout");
    check(h.coordinator->cooldown_remaining("live-t") > 0.0, "timeout starts a cooldown");
    check(!h.coordinator->is_active("live-t"), "abandoned attempt never marks the room active");
}

static void test_leave_during_join() {
    section("Leave during a pending join");
    Harness h;
    h.server.start_delay = 300ms;
    auto pending = std::async(std::launch::async, [&h]() {
        try {
            h.coordinator->join_room(join_request("live-x"));
        } catch (const BridgeError& e) {
            return e.kind();
        }
        return ErrorKind::Protocol;
    });

    check(wait_until([&h]() { return h.server.start_requests().size() == 1; }), "start-live in flight");
    auto left = h.coordinator->leave_room("live-x");
    check(left["cancelled_join"].get<bool>(), "leave cancels the pending join");
    check(pending.get() == ErrorKind::Cancelled, "join reports cancellation");
    check_eq(h.coordinator->cooldown_remaining("live-x"), 0.0, "cancellation never starts a cooldown");
    check(!h.coordinator->is_active("live-x"), "cancelled join leaves no active room");
}

static void test_reset() {
    section("Reset");
    Harness h;
    h.coordinator->join_room(join_request("live-a"));
    auto token = h.registry.register_session("s-r", std::nullopt);

    auto reset = h.coordinator->reset();
    check_eq(reset["cleared_rooms"].get<size_t>(), size_t(1), "active room cleared");
    check_eq(reset["cancelled_sessions"].get<size_t>(), size_t(1), "every session cancelled");
    check(reset["errors"].empty(), "disconnects succeed");
    check(token->is_cancelled(), "room-less session cancelled too");
    check(!h.avatar->is_connected(), "avatar disconnected");
    check(!h.coordinator->is_active("live-a"), "no active rooms left");

    auto again = h.coordinator->join_room(join_request("live-a"));
    check_eq(again["status"].get<std::string>(), std::string("joined"), "rooms can be joined after a reset");
}

int main() {
    std::cout << "🧪 Room coordinator tests\n";
    test_join_and_already_active();
    test_pending_rejection();
    test_cooldown();
    test_connect_retry();
    test_leave();
    test_leave_other_room();
    test_avatar_events_drained();
    test_join_timeout();
    test_leave_during_join();
    test_reset();
    return finish_tests("room_coordinator_test");
}
