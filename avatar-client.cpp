#include "avatar-client.h"

#include <openssl/evp.h>

#include <algorithm>
#include <iostream>

namespace {

std::string base64_encode(const std::string& in) {
    std::string out(4 * ((in.size() + 2) / 3), '\0');
    int n = EVP_EncodeBlock(reinterpret_cast<unsigned char*>(&out[0]),
                            reinterpret_cast<const unsigned char*>(in.data()),
                            static_cast<int>(in.size()));
    out.resize(n < 0 ? 0 : static_cast<size_t>(n));
    return out;
}

bool has_tag(const std::string& message, const char* tag) {
    return message.compare(0, avatar_tag::kLength, tag) == 0;
}

std::string body_of(const std::string& message) {
    return message.size() > avatar_tag::kLength ? message.substr(avatar_tag::kLength) : std::string();
}

} // namespace

const char* avatar_type_name(AvatarType type) {
    return type == AvatarType::Pic ? "pic" : "3min";
}

bool parse_avatar_type(const std::string& name, AvatarType& out) {
    if (name == "pic") { out = AvatarType::Pic; return true; }
    if (name == "3min") { out = AvatarType::ThreeMin; return true; }
    return false;
}

const char* avatar_state_name(AvatarState state) {
    switch (state) {
        case AvatarState::Disconnected: return "disconnected";
        case AvatarState::Connecting: return "connecting";
        case AvatarState::Connected: return "connected";
    }
    return "unknown";
}

nlohmann::json AvatarVideoConfig::to_json() const {
    return {
        {"video_width", std::max(240, std::min(1920, width))},
        {"video_height", std::max(240, std::min(1920, height))},
        {"bitrate", std::max(100, std::min(8000, bitrate))}
    };
}

nlohmann::json AvatarRoleConfig::to_json() const {
    nlohmann::json j = nlohmann::json::object();
    if (role_width) j["role_width"] = std::max(100, std::min(5760, *role_width));
    if (left_offset) j["role_left_offset"] = *left_offset;
    if (top_offset) j["role_top_offset"] = std::max(0, *top_offset);
    return j;
}

AvatarClient::AvatarClient(const AvatarClientConfig& config, std::unique_ptr<WsTransport> transport)
    : config_(config), transport_(std::move(transport)) {}

AvatarClient::~AvatarClient() {
    disconnect();
}

void AvatarClient::set_state(AvatarState state) {
    std::lock_guard<std::mutex> lock(state_mutex_);
    state_ = state;
    if (state == AvatarState::Disconnected) {
        live_id_.reset();
    }
}

void AvatarClient::refresh_state() {
    std::lock_guard<std::mutex> lock(state_mutex_);
    if (state_ == AvatarState::Connected && !transport_->is_open()) {
        std::cout << "⚠️ Avatar socket closed unexpectedly"
                  << (live_id_ ? " [" + *live_id_ + "]" : std::string()) << std::endl;
        state_ = AvatarState::Disconnected;
        live_id_.reset();
    }
}

AvatarState AvatarClient::state() {
    refresh_state();
    std::lock_guard<std::mutex> lock(state_mutex_);
    return state_;
}

bool AvatarClient::is_connected() {
    return state() == AvatarState::Connected;
}

std::optional<std::string> AvatarClient::live_id() {
    refresh_state();
    std::lock_guard<std::mutex> lock(state_mutex_);
    return live_id_;
}

void AvatarClient::connect(std::chrono::milliseconds budget) {
    stop_listening();
    set_state(AvatarState::Connecting);

    const bool bounded = budget.count() > 0;
    const auto deadline = std::chrono::steady_clock::now() + budget;
    BridgeError last_error(ErrorKind::Connection, "no connection strategy configured");

    for (size_t i = 0; i < config_.strategies.size(); ++i) {
        const auto& strategy = config_.strategies[i];
        WsConnectOptions options;
        options.verify_tls = strategy.verify_tls;
        options.timeout = strategy.timeout;
        options.max_message_bytes = config_.max_message_bytes;

        if (bounded) {
            auto remaining = std::chrono::duration_cast<std::chrono::milliseconds>(deadline - std::chrono::steady_clock::now());
            if (remaining.count() <= 0) {
                last_error = BridgeError(ErrorKind::Timeout, "avatar connect budget exhausted");
                break;
            }
            options.timeout = std::min(options.timeout, remaining);
        }

        std::cout << "🔌 Avatar connection attempt " << (i + 1) << "/" << config_.strategies.size()
                  << " (verify_tls=" << (strategy.verify_tls ? "true" : "false")
                  << ", timeout=" << options.timeout.count() << "ms)" << std::endl;
        try {
            transport_->connect(config_.url, options);
            set_state(AvatarState::Connected);
            std::cout << "✅ Connected to avatar service using strategy " << (i + 1) << std::endl;
            return;
        } catch (const BridgeError& e) {
            last_error = e;
            std::cout << "⚠️ Avatar connection attempt " << (i + 1) << " failed: " << e.what() << std::endl;
        }

        if (i + 1 < config_.strategies.size()) {
            if (bounded && std::chrono::steady_clock::now() + config_.strategy_delay >= deadline) {
                last_error = BridgeError(ErrorKind::Timeout, "avatar connect budget exhausted");
                break;
            }
            std::this_thread::sleep_for(config_.strategy_delay);
        }
    }

    set_state(AvatarState::Disconnected);
    std::cout << "❌ All avatar connection strategies failed: " << last_error.what() << std::endl;
    throw last_error;
}

void AvatarClient::disconnect() {
    stop_listening();
    try {
        if (live_id()) {
            stop_live();
            std::this_thread::sleep_for(config_.stop_grace);
        }
    } catch (const BridgeError& e) {
        std::cout << "⚠️ Error stopping live during disconnect: " << e.what() << std::endl;
    }
    bool was_connected = state() != AvatarState::Disconnected;
    transport_->close();
    set_state(AvatarState::Disconnected);
    if (was_connected) {
        std::cout << "🔌 Avatar connection closed" << std::endl;
    }
}

void AvatarClient::require_open(const char* operation) {
    if (!transport_->is_open()) {
        refresh_state();
        throw BridgeError(ErrorKind::Connection, std::string("avatar not connected: ") + operation);
    }
}

void AvatarClient::send_text(const std::string& message) {
    std::lock_guard<std::mutex> lock(send_mutex_);
    transport_->send_text(message);
}

nlohmann::json AvatarClient::rtc_streaming(const std::string& app_id, const std::string& room_id,
                                           const std::string& uid, const std::string& token) {
    return {
        {"type", "bytertc"},
        {"rtc_app_id", app_id},
        {"rtc_room_id", room_id},
        {"rtc_uid", uid},
        {"rtc_token", token}
    };
}

nlohmann::json AvatarClient::rtmp_streaming(const std::string& rtmp_addr) {
    return {{"type", "rtmp"}, {"rtmp_addr", rtmp_addr}};
}

nlohmann::json AvatarClient::start_live_rtc(const AvatarLiveOptions& options, const std::string& rtc_app_id,
                                            const std::string& rtc_room_id, const std::string& rtc_uid,
                                            const std::string& rtc_token, std::chrono::milliseconds timeout) {
    std::cout << "🚀 Starting RTC live streaming on " << options.live_id << std::endl;
    return start_live(options, rtc_streaming(rtc_app_id, rtc_room_id, rtc_uid, rtc_token), timeout);
}

nlohmann::json AvatarClient::start_live_rtmp(const AvatarLiveOptions& options, const std::string& rtmp_addr,
                                             std::chrono::milliseconds timeout) {
    std::cout << "🚀 Starting RTMP live streaming on " << options.live_id << std::endl;
    return start_live(options, rtmp_streaming(rtmp_addr), timeout);
}

nlohmann::json AvatarClient::start_live(const AvatarLiveOptions& options, const nlohmann::json& streaming,
                                        std::chrono::milliseconds timeout) {
    require_open("start_live");
    stop_listening();

    nlohmann::json init = {
        {"live", {{"live_id", options.live_id}}},
        {"auth", {{"appid", config_.appid}, {"token", config_.token}}},
        {"avatar", {
            {"avatar_type", avatar_type_name(options.avatar_type)},
            {"input_mode", "audio"},
            {"role", options.role}
        }},
        {"streaming", streaming}
    };
    if (options.background) init["avatar"]["background"] = *options.background;
    if (options.video) init["video"] = options.video->to_json();
    if (options.role_conf && !options.role_conf->empty()) init["avatar"]["role_conf"] = options.role_conf->to_json();

    {
        std::lock_guard<std::mutex> lock(state_mutex_);
        live_id_ = options.live_id;
    }

    auto fail = [this](const BridgeError& e) -> BridgeError {
        std::lock_guard<std::mutex> lock(state_mutex_);
        live_id_.reset();
        return e;
    };

    try {
        send_text(std::string(avatar_tag::StartLive) + init.dump());
    } catch (const BridgeError& e) {
        throw fail(e);
    }
    std::cout << "📤 [" << options.live_id << "] Sent start-live request" << std::endl;

    if (timeout.count() <= 0) timeout = config_.start_live_timeout;
    auto deadline = std::chrono::steady_clock::now() + timeout;

    while (true) {
        auto now = std::chrono::steady_clock::now();
        if (now >= deadline) {
            throw fail(BridgeError(ErrorKind::Timeout, "timed out waiting for start-live response"));
        }
        ReceiveResult r = transport_->receive(std::chrono::duration_cast<std::chrono::milliseconds>(deadline - now));
        if (r.status == ReceiveStatus::Timeout) continue;
        if (r.status == ReceiveStatus::Closed) {
            refresh_state();
            throw fail(BridgeError(ErrorKind::Connection, "avatar connection closed during start-live"));
        }

        const std::string& message = r.message.data;
        if (has_tag(message, avatar_tag::Heartbeat)) {
            continue;
        }

        if (has_tag(message, avatar_tag::StartResult) || has_tag(message, avatar_tag::Error)) {
            int code = 0;
            std::string text;
            try {
                nlohmann::json body = nlohmann::json::parse(body_of(message));
                if (!body.is_object()) {
                    throw fail(BridgeError(ErrorKind::Protocol,
                                           "start-live response is not an object: " + message.substr(0, 100)));
                }
                code = body.value("code", 0);
                text = body.value("message", std::string());
            } catch (const nlohmann::json::exception& e) {
                throw fail(BridgeError(ErrorKind::Protocol, std::string("invalid start-live response: ") + e.what()));
            }

            if (has_tag(message, avatar_tag::StartResult) && code == kAvatarSuccessCode) {
                std::cout << "✅ [" << options.live_id << "] Avatar live streaming started" << std::endl;
                return {{"live_id", options.live_id}, {"status", "success"}, {"message", text.empty() ? "success" : text}};
            }
            if (text.empty()) text = avatar_error_message(code);
            throw fail(BridgeError(avatar_error_kind(code),
                                   "failed to start live: " + text + " (code: " + std::to_string(code) + ")", code));
        }

        if (has_tag(message, avatar_tag::StreamingAudio)) {
            // Status events of an earlier live can still be in flight
            continue;
        }
        throw fail(BridgeError(ErrorKind::Protocol, "unexpected start-live response: " + message.substr(0, 100)));
    }
}

void AvatarClient::drive_with_streaming_audio(const std::string& pcm) {
    require_open("drive_with_streaming_audio");
    std::string message;
    message.reserve(avatar_tag::kLength + pcm.size());
    message.append(avatar_tag::StreamingAudio);
    message.append(pcm);
    std::lock_guard<std::mutex> lock(send_mutex_);
    transport_->send_binary(message);
}

void AvatarClient::drive_with_structured_audio(const std::string& pcm, const std::string& extra_data) {
    require_open("drive_with_structured_audio");
    nlohmann::json body = {{"audio", base64_encode(pcm)}};
    if (!extra_data.empty()) body["extra_data"] = extra_data;
    send_text(std::string(avatar_tag::StructuredAudio) + body.dump());
}

void AvatarClient::drive_with_audio_url(const std::string& audio_url, const std::string& format) {
    require_open("drive_with_audio_url");
    send_text(std::string(avatar_tag::AudioUrl) + "<speak><audio url=\"" + audio_url + "\" format=\"" + format + "\"/></speak>");
}

void AvatarClient::finish_streaming_audio() {
    require_open("finish_streaming_audio");
    try {
        send_text(avatar_tag::FinishAudio);
    } catch (const BridgeError& e) {
        if (e.kind() != ErrorKind::Connection) throw;
        std::cout << "⚠️ Connection closed while finishing streaming audio: " << e.what() << std::endl;
    }
}

void AvatarClient::interrupt_playback() {
    require_open("interrupt_playback");
    send_text(avatar_tag::Interrupt);
}

void AvatarClient::stop_live() {
    std::optional<std::string> bound;
    {
        std::lock_guard<std::mutex> lock(state_mutex_);
        bound = live_id_;
        live_id_.reset();
    }
    if (!bound) {
        std::cout << "ℹ️ No live to stop" << std::endl;
        return;
    }
    if (!transport_->is_open()) {
        std::cout << "⚠️ [" << *bound << "] Avatar socket already closed, live dropped" << std::endl;
        return;
    }
    try {
        send_text(avatar_tag::StopLive);
        std::cout << "🛑 [" << *bound << "] Stop-live sent" << std::endl;
    } catch (const BridgeError& e) {
        std::cout << "⚠️ [" << *bound << "] Stop-live failed: " << e.what() << std::endl;
    }
}

void AvatarClient::listen_events(StatusCallback on_status, ErrorCallback on_error) {
    require_open("listen_events");
    std::lock_guard<std::mutex> lock(listener_mutex_);
    if (listening_.load()) return;
    // A loop that ended on a remote close is still joinable
    if (listener_thread_.joinable()) listener_thread_.join();
    listening_.store(true);
    listener_thread_ = std::thread(&AvatarClient::listen_loop, this, std::move(on_status), std::move(on_error));
}

void AvatarClient::stop_listening() {
    std::lock_guard<std::mutex> lock(listener_mutex_);
    listening_.store(false);
    if (listener_thread_.joinable()) {
        listener_thread_.join();
    }
}

void AvatarClient::listen_loop(StatusCallback on_status, ErrorCallback on_error) {
    while (listening_.load()) {
        ReceiveResult r = transport_->receive(std::chrono::milliseconds(200));
        if (r.status == ReceiveStatus::Timeout) continue;
        if (r.status == ReceiveStatus::Closed) break;

        const std::string& message = r.message.data;
        try {
            if (has_tag(message, avatar_tag::StreamingAudio)) {
                auto body = nlohmann::json::parse(body_of(message));
                std::string type = body.value("type", "");
                nlohmann::json data = body.contains("data") ? body["data"] : nlohmann::json::object();
                if (config_.verbose) {
                    std::cout << "📡 Avatar status: " << type << std::endl;
                }
                if (on_status) on_status(type, data);
            } else if (has_tag(message, avatar_tag::Error)) {
                auto body = nlohmann::json::parse(body_of(message));
                int code = body.value("code", 0);
                std::string text = body.value("message", avatar_error_message(code));
                std::cout << "❌ Avatar error " << code << ": " << text << std::endl;
                if (on_error) on_error(code, text);
            }
        } catch (const nlohmann::json::exception& e) {
            std::cout << "⚠️ Unparseable avatar event: " << e.what() << std::endl;
        }
    }
    listening_.store(false);
}

bool AvatarClient::health_check(std::chrono::milliseconds timeout) {
    if (!is_connected()) return false;
    if (timeout.count() <= 0) timeout = config_.ping_timeout;
    bool ok = transport_->ping(timeout);
    if (!ok) {
        std::cout << "⚠️ Avatar health check failed" << std::endl;
    }
    return ok;
}
