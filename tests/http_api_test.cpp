#include "database.h"
#include "llm-client.h"
#include "pipeline-orchestrator.h"
#include "room-coordinator.h"
#include "simple-http-api.h"
#include "stream-session-registry.h"
#include "stt-client.h"
#include "tts-client.h"
#include "fake-transport.h"
#include "test-util.h"

#include <arpa/inet.h>
#include <netinet/in.h>
#include <sys/socket.h>
#include <unistd.h>

#include <chrono>
#include <memory>
#include <string>
#include <thread>
#include <vector>

using namespace std::chrono_literals;

class FixedAnswer : public TextStreamSource {
public:
    std::string create_conversation(const std::string&) override { return "conv-http"; }
    void chat_stream(const std::string&, const std::string&, const std::string&,
                     const TextDeltaCallback& on_delta) override {
        for (const char* d : {"Hi. ", "Bye."}) {
            if (!on_delta(d)) return;
        }
    }
};

// Whole bridge over fake sockets; the HTTP server is only started by the stream test
struct Bridge {
    FakeTtsServer tts_server;
    FakeSttServer stt_server;
    FakeAvatarServer avatar_server;
    FakeTransport* avatar_fake = nullptr;
    std::unique_ptr<TtsClient> tts;
    std::unique_ptr<SttClient> stt;
    std::unique_ptr<AvatarClient> avatar;
    FixedAnswer llm;
    StreamSessionRegistry registry;
    Database database;
    std::unique_ptr<RoomCoordinator> coordinator;
    std::unique_ptr<PipelineOrchestrator> orchestrator;
    std::unique_ptr<SimpleHttpServer> server;

    explicit Bridge(int port = 0) {
        TtsClientConfig tts_cfg;
        tts_cfg.retry_delay = 5ms;
        tts_cfg.settle_delay = 0ms;
        auto tts_transport = std::make_unique<FakeTransport>();
        tts_server.install(*tts_transport);
        tts = std::make_unique<TtsClient>(tts_cfg, std::move(tts_transport));

        SttClientConfig stt_cfg;
        stt_cfg.connect_timeout = 500ms;
        stt_cfg.recognize_timeout = 300ms;
        auto stt_transport = std::make_unique<FakeTransport>();
        stt_server.install(*stt_transport);
        stt = std::make_unique<SttClient>(stt_cfg, std::move(stt_transport));

        AvatarClientConfig avatar_cfg;
        avatar_cfg.strategies = {{true, 200ms}};
        avatar_cfg.stop_grace = 1ms;
        auto avatar_transport = std::make_unique<FakeTransport>();
        avatar_fake = avatar_transport.get();
        avatar_server.install(*avatar_transport);
        avatar = std::make_unique<AvatarClient>(avatar_cfg, std::move(avatar_transport));

        database.init(":memory:");
        CoordinatorConfig coord_cfg;
        coord_cfg.cooldown = 10000ms;
        coord_cfg.connect_attempts = 1;
        coord_cfg.retry_delay = 5ms;
        coord_cfg.join_timeout = 2000ms;
        coordinator = std::make_unique<RoomCoordinator>(coord_cfg, *avatar, registry, tts.get(), nullptr, &database);
        orchestrator = std::make_unique<PipelineOrchestrator>(llm, *tts, avatar.get(), registry, &database);
        server = std::make_unique<SimpleHttpServer>(port, *coordinator, *orchestrator, registry, &database, stt.get());
    }

    ~Bridge() {
        server.reset();
        orchestrator.reset();
        coordinator.reset();
        avatar.reset();
        stt.reset();
        tts.reset();
    }

    HttpResponse call(const std::string& method, const std::string& path, const std::string& body = "") {
        HttpRequest req;
        req.method = method;
        req.path = path;
        req.body = body;
        return server->handle_request(req);
    }
};

static nlohmann::json body_of(const HttpResponse& r) {
    return nlohmann::json::parse(r.body);
}

static void test_parse_request() {
    section("Request parsing");
    Bridge b;
    HttpRequest req = b.server->parse_request(
        "POST /api/join_room?debug=1&x=y HTTP/1.1\r\nHost: localhost\r\nContent-Type:  application/json \r\n\r\n{\"live_id\":\"r\"}");
    check_eq(req.method, std::string("POST"), "method");
    check_eq(req.path, std::string("/api/join_room"), "path without the query string");
    check(req.query_params["debug"] == "1" && req.query_params["x"] == "y", "query parameters");
    check_eq(req.headers["Content-Type"], std::string("application/json"), "header value trimmed");
    check_eq(req.body, std::string("{\"live_id\":\"r\"}"), "body after the blank line");

    HttpResponse res = json_response(200, {{"ok", true}});
    std::string wire = b.server->create_response(res);
    check(wire.compare(0, 17, "HTTP/1.1 200 OK\r\n") == 0, "status line");
    check(wire.find("Content-Length: 11\r\n") != std::string::npos, "content length");
    check(wire.find("Content-Type: application/json\r\n") != std::string::npos, "content type");
}

static void test_error_mapping() {
    section("Error responses");
    BridgeError cooling(ErrorKind::ConcurrencyRejected, "cooling down");
    cooling.set_retry_after_seconds(4.2);
    HttpResponse r = error_response(cooling);
    check_eq(r.status_code, 429, "concurrency rejection is 429");
    check_eq(r.headers["Retry-After"], std::string("5"), "Retry-After rounds up");
    auto body = body_of(r);
    check(!body["success"].get<bool>() && body["retryable"].get<bool>(), "retryable failure");
    check_eq(body["error"].get<std::string>(), std::string("concurrency_rejected"), "error kind name");
    check(body["retry_after"].get<double>() > 4.0, "retry_after in the body");

    r = error_response(BridgeError(ErrorKind::Session, "rejected", 4001));
    check_eq(r.status_code, 502, "session failure is 502");
    check(!body_of(r)["retryable"].get<bool>(), "502 not retryable");
    check_eq(body_of(r)["code"].get<int>(), 4001, "remote code surfaced");
    check(r.headers.count("Retry-After") == 0, "no Retry-After outside cooldowns");

    check_eq(error_response(BridgeError(ErrorKind::Timeout, "t")).status_code, 408, "timeout is 408");
    check_eq(error_response(BridgeError(ErrorKind::Connection, "c")).status_code, 503, "connection is 503");
    check_eq(error_response(BridgeError(ErrorKind::Cancelled, "x")).status_code, 499, "cancelled is 499");
    check_eq(std::string(http_status_text(422)), std::string("Unprocessable Entity"), "status text");
}

static void test_request_builders() {
    section("Request builders");
    Bridge b;
    b.database.set_config("avatar_role", "stored-role");
    b.database.set_config("rtc_app_id", "stored-app");
    b.database.set_config("rtc_token", "stored-token");
    b.database.set_config("tts_speaker", "stored-speaker");

    JoinRequest join = b.server->build_join_request({{"live_id", "room-1"}, {"rtc_room_id", "given-room"},
                                                     {"video_config", {{"width", 640}}}});
    check(join.live.avatar_type == AvatarType::ThreeMin, "avatar type from config");
    check_eq(join.live.role, std::string("stored-role"), "role from config");
    check_eq(join.streaming["rtc_app_id"].get<std::string>(), std::string("stored-app"), "RTC app id from config");
    check_eq(join.streaming["rtc_room_id"].get<std::string>(), std::string("given-room"), "body value wins");
    check(join.live.video && join.live.video->width == 640 && join.live.video->height == 720, "partial video config");

    join = b.server->build_join_request({{"live_id", "room-2"}, {"avatar_type", "pic"}, {"rtmp_addr", "rtmp://push"}});
    check(join.live.avatar_type == AvatarType::Pic, "explicit avatar type");
    check_eq(join.streaming["type"].get<std::string>(), std::string("rtmp"), "RTMP streaming when an address is given");

    bool rejected = false;
    try {
        b.server->build_join_request({{"avatar_type", "pic"}});
    } catch (const std::invalid_argument&) {
        rejected = true;
    }
    check(rejected, "missing live_id rejected");
    rejected = false;
    try {
        b.server->build_join_request({{"live_id", "r"}, {"avatar_type", "hologram"}});
    } catch (const std::invalid_argument&) {
        rejected = true;
    }
    check(rejected, "unknown avatar type rejected");

    QueryRequest q = b.server->build_query_request({{"query", "hello"}});
    check(q.session_id && !q.session_id->empty(), "session id generated");
    check_eq(q.speaker, std::string("stored-speaker"), "speaker from config");
    check_eq(q.user_id, std::string("default_user"), "default user");
    check(!q.live_id, "no live id unless given");
    q = b.server->build_query_request({{"query", "hi"}, {"session_id", "s"}, {"live_id", "r"}, {"speaker", "sp"}});
    check(*q.session_id == "s" && q.live_id && *q.live_id == "r" && q.speaker == "sp", "explicit fields kept");
}

static void test_routes() {
    section("Routes");
    Bridge b;

    auto health = b.call("GET", "/api/health");
    check_eq(health.status_code, 200, "health is 200");
    check_eq(body_of(health)["status"].get<std::string>(), std::string("healthy"), "health body");

    check_eq(b.call("GET", "/api/join_room").status_code, 405, "join requires POST");
    check_eq(b.call("POST", "/api/join_room", "{not json").status_code, 400, "invalid JSON is 400");
    check_eq(b.call("POST", "/api/join_room", "{}").status_code, 422, "missing live_id is 422");
    check_eq(b.call("GET", "/api/nowhere").status_code, 404, "unknown path is 404");
    check_eq(b.call("GET", "/api/query/stream").status_code, 405, "stream requires POST");

    auto joined = b.call("POST", "/api/join_room", R"({"live_id":"room-h"})");
    check_eq(joined.status_code, 200, "join succeeds");
    check(body_of(joined)["success"].get<bool>() && body_of(joined)["status"] == "joined", "join body");
    auto again = b.call("POST", "/api/digital_human_develop/join_room", R"({"live_id":"room-h"})");
    check_eq(body_of(again)["status"].get<std::string>(), std::string("already_active"), "legacy route alias");

    auto status = body_of(b.call("GET", "/api/connection_status"));
    check(status["avatar"]["connected"].get<bool>(), "status shows the avatar connected");

    auto token = b.registry.register_session("s-cancel", std::string("room-h"));
    check_eq(b.call("POST", "/api/query/cancel", "{}").status_code, 422, "cancel needs an id");
    auto cancelled = body_of(b.call("POST", "/api/query/cancel", R"({"session_id":"s-cancel"})"));
    check_eq(cancelled["cancelled"].get<size_t>(), size_t(1), "cancel by session");
    check(token->is_cancelled(), "session token tripped");
    cancelled = body_of(b.call("POST", "/api/query/cancel", R"({"live_id":"room-h"})"));
    check_eq(cancelled["cancelled"].get<size_t>(), size_t(0), "already cancelled sessions are not counted again");
    b.registry.release("s-cancel", token);

    check_eq(b.call("POST", "/api/leave_room/room-h").status_code, 405, "leave requires DELETE");
    check_eq(b.call("DELETE", "/api/leave_room/").status_code, 422, "leave needs a live id");
    auto left = b.call("DELETE", "/api/leave_room/room-h");
    check_eq(left.status_code, 200, "leave succeeds");
    check(body_of(left)["was_active"].get<bool>(), "leave reports the active room");

    b.avatar_fake->fail_next_connects(1);
    auto failed = b.call("POST", "/api/join_room", R"({"live_id":"room-f"})");
    check_eq(failed.status_code, 503, "connection failure is 503");
    auto cooling = b.call("POST", "/api/join_room", R"({"live_id":"room-f"})");
    check_eq(cooling.status_code, 429, "cooldown is 429");
    check(cooling.headers.count("Retry-After") == 1, "cooldown carries Retry-After");

    auto reset = b.call("POST", "/api/reset_connections");
    check_eq(reset.status_code, 200, "reset succeeds");
    check_eq(b.call("POST", "/api/join_room", R"({"live_id":"room-f"})").status_code, 200, "reset clears cooldowns");
}

static void test_voice_recognize() {
    section("Voice recognition route");
    Bridge b;

    // 32000 zero bytes: one second of 16 kHz mono silence
    std::string silence;
    for (int i = 0; i < 10666; ++i) silence += "AAAA";
    silence += "AAA=";
    std::string request = nlohmann::json{{"audio", silence}}.dump();

    check_eq(b.call("GET", "/api/voice/recognize").status_code, 405, "recognize requires POST");
    check_eq(b.call("POST", "/api/voice/recognize", "{oops").status_code, 400, "invalid JSON is 400");
    check_eq(b.call("POST", "/api/voice/recognize", "{}").status_code, 422, "missing audio is 422");
    check_eq(b.call("POST", "/api/voice/recognize", R"({"audio":"not base64!"})").status_code, 422,
             "malformed base64 is 422");
    auto short_audio = b.call("POST", "/api/voice/recognize", R"({"audio":"AAAA"})");
    check_eq(short_audio.status_code, 422, "three bytes of audio is too short");
    check_eq(body_of(short_audio)["error"].get<std::string>(), std::string("audio too short"), "too short reason");

    b.stt_server.set_transcript("hello there");
    auto recognised = b.call("POST", "/api/voice/recognize", request);
    check_eq(recognised.status_code, 200, "recognition succeeds");
    auto body = body_of(recognised);
    check(body["success"].get<bool>(), "success flag");
    check_eq(body["final_text"].get<std::string>(), std::string("hello there"), "transcript returned");
    check(body["is_final"].get<bool>(), "final result");

    b.stt_server.set_transcript("");
    auto silent = b.call("POST", "/api/voice/recognize", request);
    check_eq(silent.status_code, 408, "no result within the timeout");
    check_eq(body_of(silent)["error"].get<std::string>(), std::string(error_kind_name(ErrorKind::Timeout)),
             "timeout error kind");

    Bridge no_stt;
    no_stt.server = std::make_unique<SimpleHttpServer>(0, *no_stt.coordinator, *no_stt.orchestrator,
                                                       no_stt.registry, &no_stt.database);
    check_eq(no_stt.call("POST", "/api/voice/recognize", request).status_code, 503, "no STT client is 503");
}

static std::string http_exchange(int port, const std::string& raw) {
    int fd = socket(AF_INET, SOCK_STREAM, 0);
    if (fd < 0) return "";
    sockaddr_in addr{};
    addr.sin_family = AF_INET;
    addr.sin_port = htons(static_cast<uint16_t>(port));
    inet_pton(AF_INET, "127.0.0.1", &addr.sin_addr);
    if (connect(fd, reinterpret_cast<sockaddr*>(&addr), sizeof(addr)) < 0) {
        close(fd);
        return "";
    }
    send(fd, raw.data(), raw.size(), MSG_NOSIGNAL);
    std::string response;
    char buffer[4096];
    ssize_t n;
    while ((n = recv(fd, buffer, sizeof(buffer), 0)) > 0) {
        response.append(buffer, static_cast<size_t>(n));
    }
    close(fd);
    return response;
}

static void test_query_stream() {
    section("Streamed query over a socket");
    const int port = 19473;
    Bridge b(port);
    if (!b.server->start()) {
        std::cout << "  ⚠️ port " << port << " unavailable, skipping\n";
        return;
    }

    std::string body = R"({"query":"hello","session_id":"sid-http"})";
    std::string response = http_exchange(port,
        "POST /api/query/stream HTTP/1.1\r\nHost: localhost\r\nContent-Type: application/json\r\nContent-Length: " +
        std::to_string(body.size()) + "\r\n\r\n" + body);

    check(response.find("Content-Type: text/event-stream") != std::string::npos, "event-stream response");
    check(response.find("X-Session-Id: sid-http") != std::string::npos, "session id header");
    size_t start = response.find("data: {\"conversation_id\"");
    size_t complete = response.find("\"type\":\"complete\"");
    check(start != std::string::npos && complete != std::string::npos && start < complete, "start then complete");
    check(response.find("\"type\":\"sentence_complete\"") != std::string::npos, "sentence events streamed");
    check(wait_until([&b]() { return b.database.get_stream_session("sid-http").status == "complete"; }),
          "session row completed");

    std::string bad = http_exchange(port, "POST /api/query/stream HTTP/1.1\r\nContent-Length: 2\r\n\r\n{}");
    check(bad.compare(0, 12, "HTTP/1.1 422") == 0, "query without text rejected before streaming");
    b.server->stop();
}

static void test_shutdown_waits_for_clients() {
    section("Shutdown with an idle client connection");
    const int port = 19474;
    Bridge b(port);
    if (!b.server->start()) {
        std::cout << "  ⚠️ port " << port << " unavailable, skipping\n";
        return;
    }

    // Connected but silent: the handler sits in recv until shutdown wakes it
    int fd = socket(AF_INET, SOCK_STREAM, 0);
    sockaddr_in addr{};
    addr.sin_family = AF_INET;
    addr.sin_port = htons(static_cast<uint16_t>(port));
    inet_pton(AF_INET, "127.0.0.1", &addr.sin_addr);
    bool connected = fd >= 0 && connect(fd, reinterpret_cast<sockaddr*>(&addr), sizeof(addr)) == 0;
    check(connected, "idle client connected");
    check(wait_until([&b]() { return b.server->active_clients() == 1; }), "handler tracked");

    auto begin = std::chrono::steady_clock::now();
    b.server->stop();
    auto elapsed = std::chrono::steady_clock::now() - begin;
    check(elapsed < std::chrono::seconds(5), "stop does not wait for the read timeout");
    check_eq(b.server->active_clients(), size_t(0), "every handler released its socket");
    if (fd >= 0) close(fd);
}

int main() {
    std::cout << "🧪 HTTP API tests\n";
    test_parse_request();
    test_error_mapping();
    test_request_builders();
    test_routes();
    test_voice_recognize();
    test_query_stream();
    test_shutdown_waits_for_clients();
    return finish_tests("http_api_test");
}
