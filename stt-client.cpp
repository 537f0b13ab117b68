#include "stt-client.h"
#include "uuid-util.h"

#include <algorithm>
#include <condition_variable>
#include <iostream>
#include <limits>

namespace {

void put_le(std::string& out, uint32_t v, int bytes) {
    for (int i = 0; i < bytes; ++i) {
        out.push_back(static_cast<char>((v >> (8 * i)) & 0xFF));
    }
}

std::optional<std::string> string_field(const nlohmann::json& obj, const char* key) {
    if (obj.is_object() && obj.contains(key) && obj[key].is_string()) {
        return obj[key].get<std::string>();
    }
    return std::nullopt;
}

std::optional<bool> bool_field(const nlohmann::json& obj, const char* key) {
    if (obj.is_object() && obj.contains(key) && obj[key].is_boolean()) {
        return obj[key].get<bool>();
    }
    return std::nullopt;
}

std::optional<std::string> first_text(const nlohmann::json& node) {
    if (node.is_array()) {
        if (node.empty()) return std::nullopt;
        return string_field(node.front(), "text");
    }
    return string_field(node, "text");
}

} // namespace

std::optional<RecognitionResult> decode_recognition(const nlohmann::json& payload, bool last_package) {
    if (!payload.is_object()) return std::nullopt;

    std::optional<std::string> text;
    const nlohmann::json* result = payload.contains("result") ? &payload["result"] : nullptr;

    if (result && result->is_object()) {
        text = string_field(*result, "text");
    } else if (result && result->is_string()) {
        text = result->get<std::string>();
    }
    if (!text) text = string_field(payload, "text");
    if (!text && payload.contains("sentence")) text = first_text(payload["sentence"]);
    if (!text && payload.contains("utterances")) text = first_text(payload["utterances"]);
    if (!text) return std::nullopt;

    RecognitionResult r;
    r.text = *text;

    std::optional<bool> final_flag = bool_field(payload, "is_final");
    if (!final_flag && result) final_flag = bool_field(*result, "is_final");
    if (!final_flag && result) final_flag = bool_field(*result, "final");
    r.is_final = final_flag.value_or(last_package);
    return r;
}

std::string wrap_wav(const std::string& pcm, int sample_rate, int bits, int channels) {
    uint32_t data_size = static_cast<uint32_t>(pcm.size());
    uint32_t byte_rate = static_cast<uint32_t>(sample_rate * channels * bits / 8);
    uint16_t block_align = static_cast<uint16_t>(channels * bits / 8);

    std::string out;
    out.reserve(44 + pcm.size());
    out.append("RIFF");
    put_le(out, 36 + data_size, 4);
    out.append("WAVE");
    out.append("fmt ");
    put_le(out, 16, 4);
    put_le(out, 1, 2);                     // PCM
    put_le(out, static_cast<uint32_t>(channels), 2);
    put_le(out, static_cast<uint32_t>(sample_rate), 4);
    put_le(out, byte_rate, 4);
    put_le(out, block_align, 2);
    put_le(out, static_cast<uint32_t>(bits), 2);
    out.append("data");
    put_le(out, data_size, 4);
    out.append(pcm);
    return out;
}

SttClient::SttClient(const SttClientConfig& config, std::unique_ptr<WsTransport> transport)
    : config_(config), transport_(std::move(transport)) {
    stats_.last_activity = std::chrono::steady_clock::now();
}

SttClient::~SttClient() {
    disconnect();
}

nlohmann::json SttClient::build_full_request() const {
    return {
        {"user", {{"uid", config_.uid}}},
        {"audio", {
            {"format", "wav"},
            {"codec", "raw"},
            {"rate", config_.sample_rate},
            {"bits", config_.bits},
            {"channel", config_.channels}
        }},
        {"request", {
            {"model_name", "bigmodel"},
            {"enable_itn", config_.enable_itn},
            {"enable_punc", config_.enable_punc},
            {"enable_ddc", config_.enable_ddc},
            {"show_utterances", config_.show_utterances},
            {"enable_nonstream", config_.enable_nonstream}
        }}
    };
}

void SttClient::connect() {
    stop_recognition();

    WsConnectOptions options;
    options.headers["X-Api-Resource-Id"] = config_.resource_id;
    options.headers["X-Api-Request-Id"] = generate_uuid();
    options.headers["X-Api-Access-Key"] = config_.access_key;
    options.headers["X-Api-App-Key"] = config_.app_key;
    options.verify_tls = config_.verify_tls;
    options.timeout = config_.connect_timeout;

    std::cout << "🔌 Connecting to STT service: " << config_.url << std::endl;
    transport_->connect(config_.url, options);

    try {
        {
            std::lock_guard<std::mutex> lock(seq_mutex_);
            sequence_ = 1;
            transport_->send_binary(encode_frame(make_json_request(build_full_request(), sequence_)));
            ++sequence_;
        }

        auto deadline = std::chrono::steady_clock::now() + config_.connect_timeout;
        while (true) {
            auto now = std::chrono::steady_clock::now();
            if (now >= deadline) {
                throw BridgeError(ErrorKind::Timeout, "timed out waiting for STT handshake reply");
            }
            ReceiveResult r = transport_->receive(std::chrono::duration_cast<std::chrono::milliseconds>(deadline - now));
            if (r.status == ReceiveStatus::Timeout) continue;
            if (r.status == ReceiveStatus::Closed) {
                throw BridgeError(ErrorKind::Connection, "STT socket closed during handshake");
            }
            if (!r.message.binary) continue;

            Frame reply = decode_frame(r.message.data);
            if (reply.message_type == MessageType::Error) {
                throw BridgeError(ErrorKind::Connection,
                                  "STT handshake rejected (" + std::to_string(reply.error_code) + "): " + reply.payload,
                                  reply.error_code);
            }
            break;
        }
    } catch (const BridgeError&) {
        transport_->close();
        throw;
    }

    {
        std::lock_guard<std::mutex> lock(stats_mutex_);
        ++stats_.sessions;
    }
    touch();
    std::cout << "✅ STT connection established" << std::endl;
}

void SttClient::disconnect() {
    stop_recognition();
    transport_->close();
}

bool SttClient::is_connected() const {
    return transport_->is_open();
}

void SttClient::start_recognition(ResultCallback on_result, ErrorCallback on_error) {
    std::lock_guard<std::mutex> lock(listener_mutex_);
    if (listening_.load()) return;
    if (!transport_->is_open()) {
        throw BridgeError(ErrorKind::Connection, "STT client is not connected");
    }
    listening_.store(true);
    listener_thread_ = std::thread(&SttClient::listen_loop, this, std::move(on_result), std::move(on_error));
    std::cout << "🎤 STT recognition started" << std::endl;
}

void SttClient::stop_recognition() {
    std::lock_guard<std::mutex> lock(listener_mutex_);
    listening_.store(false);
    if (listener_thread_.joinable()) {
        listener_thread_.join();
        std::cout << "🛑 STT recognition stopped" << std::endl;
    }
}

void SttClient::reset_session() {
    stop_recognition();
    std::lock_guard<std::mutex> lock(stats_mutex_);
    stats_.results = 0;
    stats_.errors = 0;
    stats_.audio_bytes_sent = 0;
}

void SttClient::listen_loop(ResultCallback on_result, ErrorCallback on_error) {
    while (listening_.load()) {
        ReceiveResult r = transport_->receive(std::chrono::milliseconds(200));
        if (r.status == ReceiveStatus::Timeout) continue;
        if (r.status == ReceiveStatus::Closed) {
            listening_.store(false);
            if (on_error) on_error(BridgeError(ErrorKind::Connection, "STT connection closed"));
            break;
        }
        if (!r.message.binary) continue;
        touch();

        try {
            Frame frame = decode_frame(r.message.data);
            if (frame.message_type == MessageType::Error) {
                throw BridgeError(ErrorKind::Protocol,
                                  "STT server error " + std::to_string(frame.error_code) + ": " + frame.payload,
                                  frame.error_code);
            }
            if (frame.payload_decode_failed) {
                throw BridgeError(ErrorKind::Protocol, "STT payload could not be decompressed");
            }
            bool last = frame.is_last_package() || (frame.sequence && *frame.sequence < 0);
            auto result = decode_recognition(frame.payload_json(), last);
            if (!result) continue;

            {
                std::lock_guard<std::mutex> lock(stats_mutex_);
                ++stats_.results;
            }
            if (config_.verbose) {
                std::cout << "📝 STT " << (result->is_final ? "final" : "partial") << ": " << result->text << std::endl;
            }
            if (on_result) on_result(*result);
        } catch (const BridgeError& e) {
            {
                std::lock_guard<std::mutex> lock(stats_mutex_);
                ++stats_.errors;
            }
            std::cout << "❌ STT: " << e.what() << std::endl;
            if (on_error) on_error(e);
        }
    }
}

void SttClient::send_audio(const std::string& pcm, bool is_last) {
    size_t bytes_per_sample = static_cast<size_t>(config_.bits / 8) * static_cast<size_t>(config_.channels);
    size_t max_bytes = static_cast<size_t>(config_.sample_rate) * bytes_per_sample * static_cast<size_t>(config_.max_chunk_seconds);
    if (bytes_per_sample > 1 && pcm.size() % bytes_per_sample != 0) {
        throw BridgeError(ErrorKind::Protocol, "PCM length " + std::to_string(pcm.size()) + " is not sample aligned");
    }
    if (pcm.size() > max_bytes) {
        throw BridgeError(ErrorKind::Protocol, "PCM block longer than " + std::to_string(config_.max_chunk_seconds) + "s");
    }

    std::string wav = wrap_wav(pcm, config_.sample_rate, config_.bits, config_.channels);
    {
        std::lock_guard<std::mutex> lock(seq_mutex_);
        if (!transport_->is_open()) {
            throw BridgeError(ErrorKind::Connection, "STT client is not connected");
        }
        if (sequence_ == std::numeric_limits<int32_t>::max()) {
            throw BridgeError(ErrorKind::Session, "STT sequence exhausted, reconnect to start a new stream");
        }
        transport_->send_binary(encode_frame(make_audio_only_request(sequence_, wav, is_last)));
        ++sequence_;
    }

    {
        std::lock_guard<std::mutex> lock(stats_mutex_);
        stats_.audio_bytes_sent += pcm.size();
    }
    touch();
}

RecognitionResult SttClient::recognize(const std::string& pcm, std::chrono::milliseconds timeout) {
    std::lock_guard<std::mutex> guard(recognize_mutex_);
    if (pcm.empty()) {
        throw BridgeError(ErrorKind::Protocol, "no audio to recognise");
    }
    if (timeout.count() <= 0) timeout = config_.recognize_timeout;

    // The server ends a stream after its last package, so every utterance gets its own connection
    if (is_connected()) disconnect();
    connect();

    struct Progress {
        std::mutex mutex;
        std::condition_variable cv;
        std::optional<RecognitionResult> latest;
        std::optional<BridgeError> error;
        bool done = false;
    };
    auto progress = std::make_shared<Progress>();

    start_recognition(
        [progress](const RecognitionResult& r) {
            std::lock_guard<std::mutex> lock(progress->mutex);
            if (progress->done) return;
            progress->latest = r;
            if (r.is_final) {
                progress->done = true;
                progress->cv.notify_all();
            }
        },
        [progress](const BridgeError& e) {
            std::lock_guard<std::mutex> lock(progress->mutex);
            if (progress->done) return;
            progress->error = e;
            progress->done = true;
            progress->cv.notify_all();
        });

    size_t frame_bytes = static_cast<size_t>(config_.bits / 8) * static_cast<size_t>(config_.channels);
    size_t segment = static_cast<size_t>(config_.sample_rate) * frame_bytes * static_cast<size_t>(config_.segment_ms) / 1000;
    segment -= segment % frame_bytes;
    if (segment == 0) segment = frame_bytes;

    try {
        for (size_t offset = 0; offset < pcm.size(); offset += segment) {
            size_t len = std::min(segment, pcm.size() - offset);
            send_audio(pcm.substr(offset, len), offset + len >= pcm.size());
        }
    } catch (const BridgeError&) {
        disconnect();
        throw;
    }

    std::optional<RecognitionResult> latest;
    std::optional<BridgeError> error;
    {
        std::unique_lock<std::mutex> lock(progress->mutex);
        progress->cv.wait_for(lock, timeout, [&progress]() { return progress->done; });
        progress->done = true;
        latest = progress->latest;
        error = progress->error;
    }
    disconnect();

    if (latest) {
        std::cout << "📝 STT recognised (" << (latest->is_final ? "final" : "partial") << "): " << latest->text << std::endl;
        return *latest;
    }
    if (error) throw *error;
    throw BridgeError(ErrorKind::Timeout, "no recognition result within " + std::to_string(timeout.count()) + "ms");
}

bool SttClient::health_check() {
    if (!transport_->is_open()) return false;
    {
        std::lock_guard<std::mutex> lock(stats_mutex_);
        if (std::chrono::steady_clock::now() - stats_.last_activity > config_.idle_limit) {
            std::cout << "⚠️ STT connection idle for more than " << config_.idle_limit.count() << "s" << std::endl;
            return false;
        }
    }
    return transport_->ping(config_.ping_timeout);
}

int32_t SttClient::current_sequence() const {
    std::lock_guard<std::mutex> lock(seq_mutex_);
    return sequence_;
}

SttClient::Stats SttClient::get_stats() const {
    std::lock_guard<std::mutex> lock(stats_mutex_);
    return stats_;
}

void SttClient::touch() {
    std::lock_guard<std::mutex> lock(stats_mutex_);
    stats_.last_activity = std::chrono::steady_clock::now();
}
