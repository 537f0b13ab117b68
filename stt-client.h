#pragma once

#include "bridge-errors.h"
#include "wire-codec.h"
#include "ws-transport.h"

#include <atomic>
#include <chrono>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <thread>

// Streaming ASR service configuration
struct SttClientConfig {
    std::string url = "wss://voice.ap-southeast-1.bytepluses.com/api/v3/sauc/bigmodel";
    std::string app_key;
    std::string access_key;
    std::string resource_id = "volc.bigasr.sauc.duration";
    std::string uid = "demo_uid";

    int sample_rate = 16000;
    int bits = 16;
    int channels = 1;

    bool enable_itn = true;
    bool enable_punc = true;
    bool enable_ddc = false;
    bool show_utterances = true;
    bool enable_nonstream = false;

    bool verify_tls = true;
    bool verbose = false;

    std::chrono::milliseconds connect_timeout{10000};
    std::chrono::milliseconds ping_timeout{5000};
    // Longest PCM block accepted by send_audio()
    int max_chunk_seconds = 10;
    // health_check() fails once the connection has been idle this long
    std::chrono::seconds idle_limit{60};

    // recognize(): audio is streamed in blocks of this length
    int segment_ms = 200;
    std::chrono::milliseconds recognize_timeout{15000};
};

struct RecognitionResult {
    std::string text;
    bool is_final = false;
};

// Pulls recognised text out of a server payload. Text is looked up in this order:
//   result.text, result (as string), text, sentence[0].text or sentence.text, utterances[0].text
// and finality in this order: is_final, result.is_final, result.final, then the frame's
// last-package flag. Returns nothing when no text field is present.
std::optional<RecognitionResult> decode_recognition(const nlohmann::json& payload, bool last_package);

// 44-byte RIFF/WAVE header followed by the PCM bytes
std::string wrap_wav(const std::string& pcm, int sample_rate, int bits, int channels);

class SttClient {
public:
    using ResultCallback = std::function<void(const RecognitionResult&)>;
    using ErrorCallback = std::function<void(const BridgeError&)>;

    SttClient(const SttClientConfig& config, std::unique_ptr<WsTransport> transport);
    ~SttClient();

    // Opens the socket, sends the full client request and waits for the first reply
    void connect();
    void disconnect();
    bool is_connected() const;

    void start_recognition(ResultCallback on_result, ErrorCallback on_error);
    void stop_recognition();
    // Stops listening and clears per-session counters; the connection and sequence survive
    void reset_session();

    // Throws BridgeError(Protocol) for invalid PCM, BridgeError(Connection) if the send fails
    void send_audio(const std::string& pcm, bool is_last);

    // One utterance on a fresh connection: streams the PCM in segments, waits for the final
    // result and disconnects. Returns the last partial text if no final result arrives in time;
    // throws BridgeError(Timeout) if nothing was recognised at all.
    RecognitionResult recognize(const std::string& pcm,
                                std::chrono::milliseconds timeout = std::chrono::milliseconds::zero());

    bool health_check();
    int32_t current_sequence() const;

    struct Stats {
        size_t sessions = 0;
        size_t audio_bytes_sent = 0;
        size_t results = 0;
        size_t errors = 0;
        std::chrono::steady_clock::time_point last_activity;
    };
    Stats get_stats() const;

private:
    SttClientConfig config_;
    std::unique_ptr<WsTransport> transport_;

    // One recognize() at a time on the single connection
    std::mutex recognize_mutex_;

    mutable std::mutex seq_mutex_;
    int32_t sequence_ = 1;

    std::thread listener_thread_;
    std::atomic<bool> listening_{false};
    std::mutex listener_mutex_;

    mutable std::mutex stats_mutex_;
    Stats stats_;

    nlohmann::json build_full_request() const;
    void listen_loop(ResultCallback on_result, ErrorCallback on_error);
    void touch();
};
