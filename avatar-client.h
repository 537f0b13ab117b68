#pragma once

#include "bridge-errors.h"
#include "ws-transport.h"

#include <nlohmann/json.hpp>

#include <atomic>
#include <chrono>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <thread>
#include <vector>

// Fixed 8-byte tags of the avatar control channel
namespace avatar_tag {
constexpr const char* StartLive       = "|CTL|00|";
constexpr const char* StopLive        = "|CTL|01|";
constexpr const char* Interrupt       = "|CTL|03|";
constexpr const char* FinishAudio     = "|CTL|12|";
constexpr const char* AudioUrl        = "|DAT|01|";
constexpr const char* StreamingAudio  = "|DAT|02|"; // also the server status event
constexpr const char* StructuredAudio = "|DAT|04|";
constexpr const char* StartResult     = "|MSG|00|";
constexpr const char* Error           = "|MSG|01|";
constexpr const char* Heartbeat       = "|MSG|02|";
constexpr size_t kLength = 8;
} // namespace avatar_tag

constexpr int kAvatarSuccessCode = 1000;

enum class AvatarType { Pic, ThreeMin };
const char* avatar_type_name(AvatarType type);
bool parse_avatar_type(const std::string& name, AvatarType& out);

struct AvatarVideoConfig {
    int width = 1280;
    int height = 720;
    int bitrate = 2000;

    // Clamped to 240-1920 px and 100-8000 kbps
    nlohmann::json to_json() const;
};

struct AvatarRoleConfig {
    std::optional<int> role_width;
    std::optional<int> left_offset;
    std::optional<int> top_offset;

    nlohmann::json to_json() const;
    bool empty() const { return !role_width && !left_offset && !top_offset; }
};

struct AvatarLiveOptions {
    std::string live_id;
    AvatarType avatar_type = AvatarType::ThreeMin;
    std::string role;
    std::optional<std::string> background;
    std::optional<AvatarVideoConfig> video;
    std::optional<AvatarRoleConfig> role_conf;
};

struct AvatarConnectStrategy {
    bool verify_tls;
    std::chrono::milliseconds timeout;
};

struct AvatarClientConfig {
    std::string url = "wss://openspeech.bytedance.com/virtual_human/avatar_live/live";
    std::string appid;
    std::string token;

    std::vector<AvatarConnectStrategy> strategies = {
        {true, std::chrono::milliseconds(25000)},
        {false, std::chrono::milliseconds(25000)},
        {false, std::chrono::milliseconds(35000)},
    };
    std::chrono::milliseconds strategy_delay{2000};
    std::chrono::milliseconds start_live_timeout{20000};
    std::chrono::milliseconds ping_timeout{5000};
    std::chrono::milliseconds stop_grace{500};
    size_t max_message_bytes = 8 * 1024 * 1024;
    bool verbose = false;
};

enum class AvatarState { Disconnected, Connecting, Connected };
const char* avatar_state_name(AvatarState state);

class AvatarClient {
public:
    using StatusCallback = std::function<void(const std::string& type, const nlohmann::json& data)>;
    using ErrorCallback = std::function<void(int code, const std::string& message)>;

    AvatarClient(const AvatarClientConfig& config, std::unique_ptr<WsTransport> transport);
    ~AvatarClient();

    // Walks the connection strategies; budget of zero means no overall limit.
    // Throws BridgeError(Connection or Timeout) after the last failure.
    void connect(std::chrono::milliseconds budget = std::chrono::milliseconds::zero());

    // Stops a bound live first, then closes; always clears the binding
    void disconnect();

    // Sends |CTL|00| and waits for |MSG|00|; timeout of zero uses the configured window
    nlohmann::json start_live(const AvatarLiveOptions& options, const nlohmann::json& streaming,
                              std::chrono::milliseconds timeout = std::chrono::milliseconds::zero());
    nlohmann::json start_live_rtc(const AvatarLiveOptions& options, const std::string& rtc_app_id,
                                  const std::string& rtc_room_id, const std::string& rtc_uid,
                                  const std::string& rtc_token,
                                  std::chrono::milliseconds timeout = std::chrono::milliseconds::zero());
    nlohmann::json start_live_rtmp(const AvatarLiveOptions& options, const std::string& rtmp_addr,
                                   std::chrono::milliseconds timeout = std::chrono::milliseconds::zero());

    static nlohmann::json rtc_streaming(const std::string& app_id, const std::string& room_id,
                                        const std::string& uid, const std::string& token);
    static nlohmann::json rtmp_streaming(const std::string& rtmp_addr);

    void drive_with_streaming_audio(const std::string& pcm);
    void drive_with_structured_audio(const std::string& pcm, const std::string& extra_data = "");
    void drive_with_audio_url(const std::string& audio_url, const std::string& format = "wav");
    void finish_streaming_audio();
    void interrupt_playback();
    void stop_live();

    void listen_events(StatusCallback on_status, ErrorCallback on_error);
    void stop_listening();

    bool health_check(std::chrono::milliseconds timeout = std::chrono::milliseconds::zero());

    AvatarState state();
    bool is_connected();
    std::optional<std::string> live_id();

private:
    AvatarClientConfig config_;
    std::unique_ptr<WsTransport> transport_;

    std::mutex state_mutex_;
    AvatarState state_ = AvatarState::Disconnected;
    std::optional<std::string> live_id_;

    std::mutex send_mutex_;

    std::mutex listener_mutex_;
    std::thread listener_thread_;
    std::atomic<bool> listening_{false};

    void set_state(AvatarState state);
    void refresh_state();
    void require_open(const char* operation);
    void send_text(const std::string& message);
    void listen_loop(StatusCallback on_status, ErrorCallback on_error);
};
