#pragma once

#include "bridge-errors.h"
#include "cancel-token.h"
#include "wire-codec.h"
#include "ws-transport.h"

#include <atomic>
#include <chrono>
#include <functional>
#include <memory>
#include <mutex>
#include <string>

// Bidirectional TTS service configuration
struct TtsClientConfig {
    std::string url = "wss://voice.ap-southeast-1.bytepluses.com/api/v3/tts/bidirection";
    std::string app_key;
    std::string access_key;
    std::string resource_id = "volc.service_type.10029";
    std::string default_speaker = "zh_female_cancan_mars_bigtts";
    std::string uid = "1234";
    int sample_rate = 16000;
    bool verify_tls = true;
    bool verbose = false;

    std::chrono::milliseconds connect_timeout{10000};
    std::chrono::milliseconds session_timeout{15000};
    std::chrono::milliseconds ping_timeout{5000};
    // Upper bound for waiting on the next audio frame of a running session
    std::chrono::milliseconds frame_timeout{30000};
    // Bound for draining a session whose consumer stopped early
    std::chrono::milliseconds drain_timeout{5000};

    // safe_synthesize() retry policy
    int max_attempts = 3;
    std::chrono::milliseconds retry_delay{2000};
    std::chrono::milliseconds settle_delay{1500};
};

// Return false from the callback to stop delivery of the current session
using AudioChunkCallback = std::function<bool(const std::string& audio)>;

class TtsClient {
public:
    TtsClient(const TtsClientConfig& config, std::unique_ptr<WsTransport> transport);
    ~TtsClient();

    // Opens the socket and waits for ConnectionStarted. Throws BridgeError.
    void connect();
    // FinishConnection then close; never throws. A session still running is
    // not drained: the socket is closed and the session fails with a connection error.
    void disconnect();
    bool is_connected() const;

    // Ping with a bounded pong wait; timeout of zero uses ping_timeout. Never throws.
    bool health_check(std::chrono::milliseconds timeout = std::chrono::milliseconds::zero());

    // One sentence: StartSession, TaskRequest, FinishSession, audio until SessionFinished.
    // Returns the number of audio chunks handed to on_chunk. Throws BridgeError.
    size_t synthesize_text(const std::string& text, const std::string& speaker,
                           const std::string& session_id, const AudioChunkCallback& on_chunk);

    // synthesize_text() with reconnect and bounded retry; never retries a cancellation
    Outcome safe_synthesize(const std::string& text, const std::string& speaker,
                            const CancelToken& cancel, const AudioChunkCallback& on_chunk);

    // Incremental text feeding inside one session
    void start_streaming(const std::string& speaker, const std::string& session_id);
    void send_streaming_text(const std::string& text);
    // FinishSession then delivers the remaining audio; returns chunk count
    size_t stop_streaming(const AudioChunkCallback& on_chunk);

    const TtsClientConfig& config() const { return config_; }

    struct Stats {
        size_t sessions = 0;
        size_t audio_chunks = 0;
        size_t audio_bytes = 0;
        size_t failures = 0;
    };
    Stats get_stats() const;

private:
    TtsClientConfig config_;
    std::unique_ptr<WsTransport> transport_;

    // Serialises whole sessions on the single connection
    std::mutex session_mutex_;
    std::mutex send_mutex_;

    std::string streaming_session_id_;
    std::string streaming_speaker_;
    bool streaming_active_ = false;

    std::atomic<size_t> total_sessions_{0};
    std::atomic<size_t> total_chunks_{0};
    std::atomic<size_t> total_bytes_{0};
    std::atomic<size_t> total_failures_{0};

    void send_frame(const Frame& frame);
    Frame wait_for_frame(std::chrono::milliseconds timeout, const char* waiting_for);
    nlohmann::json build_request(int32_t event, const std::string& text, const std::string& speaker) const;

    void start_session(const std::string& speaker, const std::string& session_id);
    size_t collect_audio(const std::string& session_id, const AudioChunkCallback& on_chunk);
    [[noreturn]] void raise_session_error(const Frame& frame, const std::string& context);
};
