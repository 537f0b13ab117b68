#include "avatar-client.h"
#include "stt-client.h"
#include "tts-client.h"
#include "fake-transport.h"
#include "test-util.h"

#include <atomic>
#include <chrono>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

using namespace std::chrono_literals;

static TtsClientConfig fast_tts_config() {
    TtsClientConfig cfg;
    cfg.url = "wss://tts.test/api/v3/tts/bidirection";
    cfg.app_key = "app";
    cfg.access_key = "access";
    cfg.connect_timeout = 500ms;
    cfg.session_timeout = 500ms;
    cfg.frame_timeout = 500ms;
    cfg.drain_timeout = 200ms;
    cfg.retry_delay = 5ms;
    cfg.settle_delay = 0ms;
    return cfg;
}

static AvatarClientConfig fast_avatar_config() {
    AvatarClientConfig cfg;
    cfg.url = "wss://avatar.test/live";
    cfg.appid = "appid-1";
    cfg.token = "token-1";
    cfg.strategies = {{true, 200ms}, {false, 200ms}, {false, 300ms}};
    cfg.strategy_delay = 1ms;
    cfg.start_live_timeout = 500ms;
    cfg.stop_grace = 1ms;
    return cfg;
}

// ---------------------------------------------------------------- TTS

static void test_tts_synthesis() {
    section("TTS: connect and synthesize");
    auto transport = std::make_unique<FakeTransport>();
    FakeTransport* fake = transport.get();
    FakeTtsServer server;
    server.install(*fake);

    TtsClient tts(fast_tts_config(), std::move(transport));
    tts.connect();
    check(tts.is_connected(), "connected after ConnectionStarted");
    auto headers = fake->last_headers();
    check(headers["X-Api-App-Key"] == "app" && headers["X-Api-Access-Key"] == "access", "credential headers sent");
    check_eq(headers["X-Api-Resource-Id"], std::string("volc.service_type.10029"), "resource id header");
    check(!headers["X-Api-Connect-Id"].empty(), "connect id header present");

    std::vector<std::string> chunks;
    size_t n = tts.synthesize_text("Hello.", "", "session-1", [&](const std::string& audio) {
        chunks.push_back(audio);
        return true;
    });
    check_eq(n, size_t(2), "two audio chunks delivered");
    check(chunks.size() == 2 && chunks[0] == "Hello.#0" && chunks[1] == "Hello.#1", "chunks arrive in order, sentence frames skipped");

    auto requests = server.requests();
    check(requests.size() == 2, "StartSession and TaskRequest payloads seen by the server");
    if (requests.size() == 2) {
        check_eq(requests[1]["namespace"].get<std::string>(), std::string("BidirectionalTTS"), "request namespace");
        check_eq(requests[1]["req_params"]["speaker"].get<std::string>(), std::string("zh_female_cancan_mars_bigtts"),
                 "empty speaker falls back to the default");
        check_eq(requests[1]["req_params"]["audio_params"]["sample_rate"].get<int>(), 16000, "PCM at 16 kHz");
    }

    tts.disconnect();
    check(!tts.is_connected(), "disconnect closes the socket");
    auto sent = fake->sent();
    check(!sent.empty() && decode_frame(sent.back().data).event == wire_event::FinishConnection,
          "FinishConnection sent before closing");
}

static void test_tts_session_failure() {
    section("TTS: session failure");
    auto transport = std::make_unique<FakeTransport>();
    FakeTransport* fake = transport.get();
    FakeTtsServer server;
    server.install(*fake);
    TtsClient tts(fast_tts_config(), std::move(transport));
    tts.connect();

    server.fail_next_sessions(1);
    bool session_error = false;
    int code = 0;
    try {
        tts.synthesize_text("x", "", "s-fail", [](const std::string&) { return true; });
    } catch (const BridgeError& e) {
        session_error = e.kind() == ErrorKind::Session;
        code = e.remote_code();
    }
    check(session_error, "SessionFailed raises a session error");
    check_eq(code, 55000001, "remote status code kept on the error");
    check(tts.is_connected(), "a rejected session start leaves the connection usable");
}

static void test_tts_early_stop() {
    section("TTS: callback stops delivery");
    auto transport = std::make_unique<FakeTransport>();
    FakeTtsServer server;
    server.audio_for = [](const std::string& text) {
        return std::vector<std::string>{text + "#0", text + "#1", text + "#2", text + "#3"};
    };
    server.install(*transport);
    TtsClient tts(fast_tts_config(), std::move(transport));
    tts.connect();

    std::vector<std::string> chunks;
    size_t n = tts.synthesize_text("stop early", "", "s-stop", [&](const std::string& audio) {
        chunks.push_back(audio);
        return chunks.size() < 2;
    });
    check_eq(n, size_t(2), "delivery stops once the callback refuses");
    check_eq(chunks.size(), size_t(2), "remaining chunks are drained, not delivered");

    size_t next = tts.synthesize_text("again", "", "s-next", [](const std::string&) { return true; });
    check_eq(next, size_t(4), "next session starts clean after the drain");
}

static void test_tts_safe_synthesize() {
    section("TTS: safe_synthesize retries");
    {
        auto transport = std::make_unique<FakeTransport>();
        FakeTransport* fake = transport.get();
        FakeTtsServer server;
        server.install(*fake);
        TtsClient tts(fast_tts_config(), std::move(transport));

        server.fail_next_sessions(1);
        size_t chunks = 0;
        CancelToken cancel;
        Outcome out = tts.safe_synthesize("retry me", "", cancel, [&](const std::string&) { ++chunks; return true; });
        check(out.is_ok(), "second attempt succeeds");
        check_eq(fake->connect_count(), 1, "socket opened lazily, kept across the retry");
        check_eq(server.sessions_started(), 2, "one failed and one good session");
        check_eq(chunks, size_t(2), "audio delivered once");
    }
    {
        auto transport = std::make_unique<FakeTransport>();
        FakeTtsServer server;
        server.audio_for = [](const std::string&) { return std::vector<std::string>{}; };
        server.install(*transport);
        TtsClient tts(fast_tts_config(), std::move(transport));

        CancelToken cancel;
        Outcome out = tts.safe_synthesize("silent", "", cancel, [](const std::string&) { return true; });
        check(out.is_failed(), "zero audio chunks counts as a failure");
        check_eq(server.sessions_started(), 3, "bounded to three attempts");
    }
    {
        auto transport = std::make_unique<FakeTransport>();
        FakeTransport* fake = transport.get();
        FakeTtsServer server;
        server.install(*fake);
        TtsClient tts(fast_tts_config(), std::move(transport));

        CancelToken cancel;
        cancel.cancel();
        Outcome out = tts.safe_synthesize("never", "", cancel, [](const std::string&) { return true; });
        check(out.is_cancelled(), "cancelled before the first attempt");
        check_eq(fake->connect_count(), 0, "no socket opened for a cancelled request");
    }
    {
        auto transport = std::make_unique<FakeTransport>();
        FakeTtsServer server;
        server.fail_next_sessions(10);
        server.install(*transport);
        TtsClientConfig cfg = fast_tts_config();
        cfg.retry_delay = 2000ms;
        TtsClient tts(cfg, std::move(transport));

        CancelToken cancel;
        std::thread canceller([&cancel]() {
            std::this_thread::sleep_for(50ms);
            cancel.cancel();
        });
        auto started = std::chrono::steady_clock::now();
        Outcome out = tts.safe_synthesize("slow", "", cancel, [](const std::string&) { return true; });
        auto elapsed = std::chrono::steady_clock::now() - started;
        canceller.join();
        check(out.is_cancelled(), "cancellation during the retry delay is reported as cancelled");
        check(elapsed < 1000ms, "retry delay is interrupted by cancellation");
        check_eq(server.sessions_started(), 1, "cancellation is never retried");
    }
}

static void test_tts_streaming_text() {
    section("TTS: incremental text in one session");
    auto transport = std::make_unique<FakeTransport>();
    FakeTtsServer server;
    server.install(*transport);
    TtsClient tts(fast_tts_config(), std::move(transport));
    tts.connect();

    tts.start_streaming("", "s-stream");
    tts.send_streaming_text("A");
    tts.send_streaming_text("B");

    bool busy = false;
    try {
        tts.synthesize_text("x", "", "s-other", [](const std::string&) { return true; });
    } catch (const BridgeError& e) {
        busy = e.kind() == ErrorKind::Session;
    }
    check(busy, "one-shot synthesis refused while streaming");

    std::vector<std::string> chunks;
    size_t n = tts.stop_streaming([&](const std::string& audio) {
        chunks.push_back(audio);
        return true;
    });
    std::vector<std::string> expected = {"A#0", "A#1", "B#0", "B#1"};
    check_eq(n, size_t(4), "all audio of the session delivered on stop");
    check(chunks == expected, "audio follows the order the text was fed");
    check_eq(server.sessions_started(), 1, "a single session carried both texts");
    check_eq(tts.stop_streaming([](const std::string&) { return true; }), size_t(0), "second stop is a no-op");
}

static void test_tts_health_and_disconnect() {
    section("TTS: health check, disconnect during a session");
    auto transport = std::make_unique<FakeTransport>();
    FakeTransport* fake = transport.get();
    // Acknowledges the session but never sends its audio
    fake->set_responder([](FakeTransport& t, const WsMessage& m) {
        Frame f = decode_frame(m.data);
        if (f.event == wire_event::StartConnection) {
            t.push_binary(tts_server_event(wire_event::ConnectionStarted));
        } else if (f.event == wire_event::StartSession) {
            t.push_binary(tts_server_event(wire_event::SessionStarted, f.session_id.value_or("")));
        }
    });
    TtsClientConfig cfg = fast_tts_config();
    cfg.frame_timeout = 3000ms;
    TtsClient tts(cfg, std::move(transport));

    check(!tts.health_check(), "health check fails before connecting");
    tts.connect();
    check(tts.health_check(), "health check pings the open socket");
    fake->set_ping_ok(false);
    check(!tts.health_check(10ms), "missing pong fails the health check");
    fake->set_ping_ok(true);

    std::atomic<int> outcome{0};
    std::thread session([&]() {
        try {
            tts.synthesize_text("stalled", "", "s-stall", [](const std::string&) { return true; });
            outcome = 2;
        } catch (const BridgeError& e) {
            outcome = e.kind() == ErrorKind::Connection ? 1 : 3;
        }
    });
    check(wait_until([&]() { return fake->sent_count() == size_t(4); }), "session waiting for its audio");

    auto started = std::chrono::steady_clock::now();
    tts.disconnect();
    auto took = std::chrono::steady_clock::now() - started;
    session.join();
    check(took < 1000ms, "disconnect does not wait for the running session");
    check_eq(outcome.load(), 1, "running session fails with a connection error");
    check_eq(fake->sent_count(), size_t(4), "no FinishConnection competes with the session for frames");
    check(!tts.is_connected(), "socket closed");
}

// ---------------------------------------------------------------- STT

static void test_stt() {
    section("STT: handshake and audio framing");
    auto transport = std::make_unique<FakeTransport>();
    FakeTransport* fake = transport.get();
    FakeSttServer server;
    server.install(*fake);

    SttClientConfig cfg;
    cfg.connect_timeout = 500ms;
    SttClient stt(cfg, std::move(transport));
    stt.connect();

    auto frames = server.frames();
    check(frames.size() == 1, "one full client request on connect");
    if (!frames.empty()) {
        auto body = frames[0].payload_json();
        check(frames[0].sequence && *frames[0].sequence == 1, "handshake carries sequence 1");
        check_eq(body["request"]["model_name"].get<std::string>(), std::string("bigmodel"), "model name");
        check_eq(body["audio"]["format"].get<std::string>(), std::string("wav"), "audio format");
    }
    check_eq(stt.current_sequence(), 2, "sequence advanced after the handshake");
    check_eq(fake->last_headers()["X-Api-Resource-Id"], std::string("volc.bigasr.sauc.duration"), "resource id header");

    std::string pcm(3200, '\x01');
    stt.send_audio(pcm, false);
    stt.send_audio(pcm, true);
    frames = server.frames();
    check(frames.size() == 3, "two audio requests sent");
    if (frames.size() == 3) {
        check(frames[1].sequence && *frames[1].sequence == 2, "first audio packet uses sequence 2");
        check(frames[2].sequence && *frames[2].sequence == -3, "last audio packet negates sequence 3");
        check(frames[1].payload.compare(0, 4, "RIFF") == 0, "PCM wrapped in a WAV header");
        check_eq(frames[1].payload.size(), pcm.size() + 44, "WAV header is 44 bytes");
    }
    check_eq(stt.current_sequence(), 4, "sequence counts every successful send");

    bool rejected = false;
    try {
        stt.send_audio(std::string(3, '\x00'), false);
    } catch (const BridgeError& e) {
        rejected = e.kind() == ErrorKind::Protocol;
    }
    check(rejected, "odd-length PCM rejected");
    rejected = false;
    try {
        stt.send_audio(std::string(16000 * 2 * 11, '\x00'), false);
    } catch (const BridgeError& e) {
        rejected = e.kind() == ErrorKind::Protocol;
    }
    check(rejected, "more than 10 s of PCM rejected");
    check_eq(stt.current_sequence(), 4, "rejected audio does not consume a sequence");

    std::mutex results_mutex;
    std::vector<RecognitionResult> results;
    stt.start_recognition([&](const RecognitionResult& r) {
        std::lock_guard<std::mutex> lock(results_mutex);
        results.push_back(r);
    }, nullptr);
    fake->push_binary(stt_server_frame(2, {{"result", {{"text", "你好"}}}}));
    fake->push_binary(stt_server_frame(-3, {{"result", {{"text", "你好世界"}}}}));
    bool got = wait_until([&]() {
        std::lock_guard<std::mutex> lock(results_mutex);
        return results.size() == 2;
    });
    check(got, "listener reports both results");
    if (got) {
        std::lock_guard<std::mutex> lock(results_mutex);
        check(results[0].text == "你好" && !results[0].is_final, "partial result");
        check(results[1].text == "你好世界" && results[1].is_final, "last package is final");
    }
    stt.reset_session();
    check(stt.is_connected(), "reset keeps the connection");
    check_eq(stt.current_sequence(), 4, "reset keeps the sequence counter");
    check(stt.health_check(), "healthy right after activity");
}

static void test_stt_idle() {
    section("STT: idle connection");
    auto transport = std::make_unique<FakeTransport>();
    FakeSttServer server;
    server.install(*transport);
    SttClientConfig cfg;
    cfg.idle_limit = std::chrono::seconds(0);
    SttClient stt(cfg, std::move(transport));
    stt.connect();
    std::this_thread::sleep_for(5ms);
    check(stt.is_connected(), "socket still open");
    check(!stt.health_check(), "idle connection fails the health check");
    stt.disconnect();
    check(!stt.health_check(), "closed connection fails the health check");
}

static void test_stt_recognize() {
    section("STT: one-shot recognition");
    auto transport = std::make_unique<FakeTransport>();
    FakeTransport* fake = transport.get();
    FakeSttServer server;
    server.install(*fake);
    server.set_transcript("turn on the lights");

    SttClientConfig cfg;
    cfg.connect_timeout = 500ms;
    cfg.recognize_timeout = 2000ms;
    SttClient stt(cfg, std::move(transport));

    // One second of silence at 16 kHz mono is five 200 ms segments
    RecognitionResult r = stt.recognize(std::string(32000, '\x00'));
    check_eq(r.text, std::string("turn on the lights"), "final transcript returned");
    check(r.is_final, "result is final");

    auto frames = server.frames();
    check_eq(frames.size(), size_t(6), "handshake plus five audio segments");
    if (frames.size() == 6) {
        check(frames[1].sequence && *frames[1].sequence == 2, "first segment uses sequence 2");
        check(frames[5].sequence && *frames[5].sequence == -6, "last segment negates sequence 6");
        check_eq(frames[1].payload.size(), size_t(6400 + 44), "segment holds 200 ms of PCM");
    }
    check(!stt.is_connected(), "connection closed after the utterance");

    bool rejected = false;
    try {
        stt.recognize(std::string());
    } catch (const BridgeError& e) {
        rejected = e.kind() == ErrorKind::Protocol;
    }
    check(rejected, "empty audio rejected");

    server.set_transcript("");
    bool timed_out = false;
    try {
        stt.recognize(std::string(3200, '\x00'), 100ms);
    } catch (const BridgeError& e) {
        timed_out = e.kind() == ErrorKind::Timeout;
    }
    check(timed_out, "silent service times out");
    check_eq(fake->connect_count(), 2, "each utterance opens its own connection");
}

static void test_recognition_decoder() {
    section("STT: recognised text fallback order");
    auto r = decode_recognition({{"result", {{"text", "a"}}}, {"text", "b"}}, false);
    check(r && r->text == "a", "result.text wins");
    r = decode_recognition({{"result", "plain"}}, false);
    check(r && r->text == "plain", "result as a string");
    r = decode_recognition({{"text", "top"}}, false);
    check(r && r->text == "top", "top-level text");
    r = decode_recognition({{"sentence", {{{"text", "s0"}}, {{"text", "s1"}}}}}, false);
    check(r && r->text == "s0", "first sentence entry");
    r = decode_recognition({{"sentence", {{"text", "single"}}}}, false);
    check(r && r->text == "single", "sentence object");
    r = decode_recognition({{"utterances", {{{"text", "u0"}}}}}, false);
    check(r && r->text == "u0", "first utterance");
    check(!decode_recognition({{"code", 1000}}, true), "no text field, no result");

    r = decode_recognition({{"text", "t"}, {"is_final", true}}, false);
    check(r && r->is_final, "top-level is_final");
    r = decode_recognition({{"result", {{"text", "t"}, {"final", true}}}}, false);
    check(r && r->is_final, "result.final");
    r = decode_recognition({{"result", {{"text", "t"}, {"is_final", false}}}}, true);
    check(r && !r->is_final, "explicit flag beats the last-package flag");
    r = decode_recognition({{"text", "t"}}, true);
    check(r && r->is_final, "last-package flag as the final fallback");

    std::string wav = wrap_wav(std::string(100, '\0'), 16000, 16, 1);
    check(wav.compare(8, 4, "WAVE") == 0 && wav.compare(36, 4, "data") == 0, "WAV chunk layout");
}

// ---------------------------------------------------------------- Avatar

static void test_avatar_connect() {
    section("Avatar: connection strategies");
    {
        auto transport = std::make_unique<FakeTransport>();
        FakeTransport* fake = transport.get();
        fake->fail_next_connects(2);
        AvatarClient avatar(fast_avatar_config(), std::move(transport));
        avatar.connect();
        check(avatar.is_connected(), "third strategy connects");
        check_eq(fake->connect_count(), 3, "strategies tried in order");
        auto verify = fake->verify_history();
        check(verify.size() == 3 && verify[0] && !verify[1] && !verify[2], "verified TLS first, then unverified");
    }
    {
        auto transport = std::make_unique<FakeTransport>();
        FakeTransport* fake = transport.get();
        fake->fail_next_connects(5);
        AvatarClient avatar(fast_avatar_config(), std::move(transport));
        bool failed = false;
        try {
            avatar.connect();
        } catch (const BridgeError& e) {
            failed = e.kind() == ErrorKind::Connection;
        }
        check(failed, "connection error after the last strategy");
        check(avatar.state() == AvatarState::Disconnected, "state back to disconnected");
    }
}

static void test_avatar_live() {
    section("Avatar: live lifecycle");
    auto transport = std::make_unique<FakeTransport>();
    FakeTransport* fake = transport.get();
    FakeAvatarServer server;
    server.install(*fake);
    AvatarClient avatar(fast_avatar_config(), std::move(transport));
    avatar.connect();

    AvatarLiveOptions options;
    options.live_id = "live-1";
    options.avatar_type = AvatarType::Pic;
    options.role = "role-a";
    AvatarVideoConfig video;
    video.width = 5000;
    video.bitrate = 50;
    options.video = video;

    nlohmann::json result = avatar.start_live_rtc(options, "rtc-app", "rtc-room", "rtc-uid", "rtc-token");
    check_eq(result["status"].get<std::string>(), std::string("success"), "start-live succeeds past the heartbeat");
    check(avatar.live_id() && *avatar.live_id() == "live-1", "avatar bound to the live id");

    auto starts = server.start_requests();
    check(starts.size() == 1, "one start-live request");
    if (!starts.empty()) {
        const auto& init = starts[0];
        check_eq(init["live"]["live_id"].get<std::string>(), std::string("live-1"), "live id in the request");
        check_eq(init["auth"]["appid"].get<std::string>(), std::string("appid-1"), "auth appid");
        check_eq(init["avatar"]["avatar_type"].get<std::string>(), std::string("pic"), "avatar type name");
        check_eq(init["streaming"]["type"].get<std::string>(), std::string("bytertc"), "RTC streaming block");
        check_eq(init["video"]["video_width"].get<int>(), 1920, "video width clamped");
        check_eq(init["video"]["bitrate"].get<int>(), 100, "bitrate clamped");
    }

    avatar.drive_with_streaming_audio(std::string("\x01\x02", 2));
    auto audio = server.audio();
    check(audio.size() == 1 && audio[0] == std::string("\x01\x02", 2), "streaming audio sent as |DAT|02| binary");

    avatar.drive_with_structured_audio(std::string("\x01\x02\x03", 3));
    auto controls = server.controls();
    check(!controls.empty() && controls.back() == R"(|DAT|04|{"audio":"AQID"})", "structured audio is base64 JSON");

    avatar.drive_with_audio_url("https://cdn.test/a.wav");
    controls = server.controls();
    check(!controls.empty() && controls.back() == R"(|DAT|01|<speak><audio url="https://cdn.test/a.wav" format="wav"/></speak>)",
          "audio URL wrapped in SSML");

    avatar.interrupt_playback();
    check_eq(server.count_control("|CTL|03|"), 1, "interrupt tag sent");

    avatar.finish_streaming_audio();
    check_eq(server.count_control("|CTL|12|"), 1, "finish-audio tag sent");

    avatar.stop_live();
    check_eq(server.count_control("|CTL|01|"), 1, "stop-live tag sent");
    check(!avatar.live_id(), "binding cleared by stop_live");

    server.start_code = 4004;
    bool rejected = false;
    try {
        avatar.start_live(options, AvatarClient::rtmp_streaming("rtmp://x"));
    } catch (const BridgeError& e) {
        rejected = e.remote_code() == 4004 && e.kind() == ErrorKind::Connection;
    }
    check(rejected, "non-1000 result code raises with the remote code");
    check(!avatar.live_id(), "failed start leaves no binding");

    for (const char* reply : {R"(|MSG|01|"server busy")", R"(|MSG|00|{"code":"1000"})", "|MSG|00|[1000]"}) {
        server.start_reply = reply;
        bool protocol_error = false;
        try {
            avatar.start_live(options, AvatarClient::rtmp_streaming("rtmp://x"));
        } catch (const BridgeError& e) {
            protocol_error = e.kind() == ErrorKind::Protocol;
        }
        check(protocol_error, std::string("malformed result is a protocol error: ") + reply);
        check(!avatar.live_id(), "malformed result leaves no binding");
    }
    server.start_reply.clear();

    server.start_code = 1000;
    avatar.start_live_rtmp(options, "rtmp://x");
    fake->server_close();
    check(!avatar.is_connected(), "remote close observed");
    check(!avatar.live_id(), "remote close clears the binding");

    bool not_connected = false;
    try {
        avatar.drive_with_streaming_audio("pcm");
    } catch (const BridgeError& e) {
        not_connected = e.kind() == ErrorKind::Connection;
    }
    check(not_connected, "driving a closed socket is a connection error");
}

static void test_avatar_events() {
    section("Avatar: event listener");
    auto transport = std::make_unique<FakeTransport>();
    FakeTransport* fake = transport.get();
    AvatarClient avatar(fast_avatar_config(), std::move(transport));
    avatar.connect();

    std::mutex m;
    std::vector<std::string> statuses;
    std::vector<int> errors;
    avatar.listen_events(
        [&](const std::string& type, const nlohmann::json&) {
            std::lock_guard<std::mutex> lock(m);
            statuses.push_back(type);
        },
        [&](int code, const std::string&) {
            std::lock_guard<std::mutex> lock(m);
            errors.push_back(code);
        });
    fake->push_text(R"(|DAT|02|{"type":"voice_start","data":{}})");
    fake->push_text("|MSG|02|{}");
    fake->push_text(R"(|MSG|01|{"code":5002,"message":"busy"})");
    bool got = wait_until([&]() {
        std::lock_guard<std::mutex> lock(m);
        return statuses.size() == 1 && errors.size() == 1;
    });
    check(got, "status and error events dispatched, heartbeat ignored");
    avatar.stop_listening();
    check(avatar.health_check(), "health check pings the open socket");
    fake->set_ping_ok(false);
    check(!avatar.health_check(), "missing pong fails the health check");
}

int main() {
    std::cout << "🧪 Protocol client tests\n";
    test_tts_synthesis();
    test_tts_session_failure();
    test_tts_early_stop();
    test_tts_safe_synthesize();
    test_tts_streaming_text();
    test_tts_health_and_disconnect();
    test_stt();
    test_stt_idle();
    test_stt_recognize();
    test_recognition_decoder();
    test_avatar_connect();
    test_avatar_live();
    test_avatar_events();
    return finish_tests("protocol_clients_test");
}
