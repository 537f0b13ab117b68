#include "tts-client.h"
#include "uuid-util.h"

#include <iostream>
#include <thread>

TtsClient::TtsClient(const TtsClientConfig& config, std::unique_ptr<WsTransport> transport)
    : config_(config), transport_(std::move(transport)) {}

TtsClient::~TtsClient() {
    disconnect();
}

void TtsClient::connect() {
    WsConnectOptions options;
    options.headers["X-Api-App-Key"] = config_.app_key;
    options.headers["X-Api-Access-Key"] = config_.access_key;
    options.headers["X-Api-Resource-Id"] = config_.resource_id;
    options.headers["X-Api-Connect-Id"] = generate_uuid();
    options.verify_tls = config_.verify_tls;
    options.timeout = config_.connect_timeout;

    std::cout << "🔌 Connecting to TTS service: " << config_.url << std::endl;
    transport_->connect(config_.url, options);

    try {
        send_frame(make_event_frame(wire_event::StartConnection, std::nullopt, "{}", Serialization::None));

        Frame reply = wait_for_frame(config_.connect_timeout, "ConnectionStarted");
        if (reply.message_type == MessageType::Error) {
            throw BridgeError(ErrorKind::Connection,
                              "TTS connection rejected: " + tts_error_message(reply.error_code) + " " + reply.payload,
                              reply.error_code);
        }
        if (reply.event == wire_event::ConnectionFailed) {
            throw BridgeError(ErrorKind::Connection,
                              "TTS connection failed: " + reply.response_meta_json.value_or(reply.payload));
        }
        if (reply.event != wire_event::ConnectionStarted) {
            throw BridgeError(ErrorKind::Protocol,
                              std::string("expected ConnectionStarted, got ") + wire_event_name(reply.event));
        }
        std::cout << "✅ TTS connection established (id: " << reply.connection_id.value_or("-") << ")" << std::endl;
    } catch (const BridgeError&) {
        transport_->close();
        throw;
    }
}

void TtsClient::disconnect() {
    std::unique_lock<std::mutex> session(session_mutex_, std::try_to_lock);
    if (!session.owns_lock()) {
        // The running session is the only reader of the socket
        std::cout << "⚠️ TTS session in progress, closing without FinishConnection" << std::endl;
        transport_->close();
        return;
    }
    streaming_active_ = false;
    streaming_session_id_.clear();
    if (!transport_->is_open()) {
        transport_->close();
        return;
    }
    try {
        send_frame(make_event_frame(wire_event::FinishConnection, std::nullopt, "{}", Serialization::None));
        auto deadline = std::chrono::steady_clock::now() + std::chrono::seconds(2);
        while (std::chrono::steady_clock::now() < deadline) {
            auto remaining = std::chrono::duration_cast<std::chrono::milliseconds>(deadline - std::chrono::steady_clock::now());
            Frame f = wait_for_frame(remaining, "ConnectionFinished");
            if (f.event == wire_event::ConnectionFinished) break;
        }
    } catch (const BridgeError& e) {
        std::cout << "⚠️ TTS FinishConnection not acknowledged: " << e.what() << std::endl;
    }
    transport_->close();
    std::cout << "🔌 TTS connection closed" << std::endl;
}

bool TtsClient::is_connected() const {
    return transport_->is_open();
}

bool TtsClient::health_check(std::chrono::milliseconds timeout) {
    if (!is_connected()) return false;
    if (timeout.count() <= 0) timeout = config_.ping_timeout;
    bool ok = transport_->ping(timeout);
    if (!ok) {
        std::cout << "⚠️ TTS health check failed" << std::endl;
    }
    return ok;
}

void TtsClient::send_frame(const Frame& frame) {
    std::lock_guard<std::mutex> lock(send_mutex_);
    transport_->send_binary(encode_frame(frame));
}

Frame TtsClient::wait_for_frame(std::chrono::milliseconds timeout, const char* waiting_for) {
    auto deadline = std::chrono::steady_clock::now() + timeout;
    while (true) {
        auto now = std::chrono::steady_clock::now();
        if (now >= deadline) {
            throw BridgeError(ErrorKind::Timeout, std::string("timed out waiting for ") + waiting_for);
        }
        ReceiveResult r = transport_->receive(std::chrono::duration_cast<std::chrono::milliseconds>(deadline - now));
        if (r.status == ReceiveStatus::Timeout) {
            continue;
        }
        if (r.status == ReceiveStatus::Closed) {
            throw BridgeError(ErrorKind::Connection, std::string("TTS socket closed while waiting for ") + waiting_for);
        }
        if (!r.message.binary) {
            if (config_.verbose) {
                std::cout << "🔍 TTS text message ignored: " << r.message.data << std::endl;
            }
            continue;
        }
        Frame frame = decode_frame(r.message.data);
        if (frame.payload_decode_failed) {
            throw BridgeError(ErrorKind::Protocol, "TTS payload could not be decompressed");
        }
        return frame;
    }
}

nlohmann::json TtsClient::build_request(int32_t event, const std::string& text, const std::string& speaker) const {
    return {
        {"user", {{"uid", config_.uid}}},
        {"event", event},
        {"namespace", "BidirectionalTTS"},
        {"req_params", {
            {"text", text},
            {"speaker", speaker.empty() ? config_.default_speaker : speaker},
            {"audio_params", {{"format", "pcm"}, {"sample_rate", config_.sample_rate}}}
        }}
    };
}

void TtsClient::raise_session_error(const Frame& frame, const std::string& context) {
    if (frame.message_type == MessageType::Error) {
        throw BridgeError(tts_error_kind(frame.error_code),
                          context + ": " + tts_error_message(frame.error_code) + " " + frame.payload,
                          frame.error_code);
    }
    std::string detail = frame.response_meta_json.value_or(frame.payload);
    int code = 0;
    try {
        auto meta = nlohmann::json::parse(detail);
        code = meta.value("status_code", 0);
        if (meta.contains("message") && meta["message"].is_string()) {
            detail = meta["message"].get<std::string>();
        }
    } catch (const nlohmann::json::exception&) {
        // meta is free text
    }
    throw BridgeError(ErrorKind::Session, context + ": " + detail, code);
}

void TtsClient::start_session(const std::string& speaker, const std::string& session_id) {
    if (!transport_->is_open()) {
        throw BridgeError(ErrorKind::Connection, "TTS client is not connected");
    }
    send_frame(make_event_frame(wire_event::StartSession, session_id,
                                build_request(wire_event::StartSession, "", speaker).dump()));

    auto deadline = std::chrono::steady_clock::now() + config_.session_timeout;
    while (true) {
        auto remaining = std::chrono::duration_cast<std::chrono::milliseconds>(deadline - std::chrono::steady_clock::now());
        Frame f = wait_for_frame(remaining, "SessionStarted");
        if (f.message_type == MessageType::Error || f.event == wire_event::SessionFailed) {
            raise_session_error(f, "TTS session start failed");
        }
        if (f.event == wire_event::SessionStarted) {
            return;
        }
        if (f.event == wire_event::ConnectionFinished) {
            transport_->close();
            throw BridgeError(ErrorKind::Connection, "TTS server finished the connection");
        }
        if (config_.verbose) {
            std::cout << "🔍 TTS skipping " << wire_event_name(f.event) << " before SessionStarted" << std::endl;
        }
    }
}

size_t TtsClient::collect_audio(const std::string& session_id, const AudioChunkCallback& on_chunk) {
    size_t delivered = 0;
    bool delivering = true;
    auto drain_deadline = std::chrono::steady_clock::time_point::max();

    while (true) {
        std::chrono::milliseconds timeout = config_.frame_timeout;
        if (!delivering) {
            auto now = std::chrono::steady_clock::now();
            if (now >= drain_deadline) {
                std::cout << "⚠️ [" << session_id << "] TTS drain timed out, dropping connection" << std::endl;
                transport_->close();
                return delivered;
            }
            timeout = std::chrono::duration_cast<std::chrono::milliseconds>(drain_deadline - now);
        }

        Frame f;
        try {
            f = wait_for_frame(timeout, "TTS audio");
        } catch (const BridgeError& e) {
            if (!delivering && e.kind() == ErrorKind::Timeout) continue;
            throw;
        }

        if (f.message_type == MessageType::Error) {
            raise_session_error(f, "TTS synthesis failed");
        }

        bool is_audio = f.event == wire_event::TTSResponse ||
                        (f.message_type == MessageType::AudioOnlyResponse && !f.has_event());
        if (is_audio) {
            if (!delivering || f.payload.empty()) continue;
            ++delivered;
            ++total_chunks_;
            total_bytes_ += f.payload.size();
            if (config_.verbose) {
                std::cout << "🎵 [" << session_id << "] TTS chunk " << delivered << " (" << f.payload.size() << " bytes)" << std::endl;
            }
            if (!on_chunk(f.payload)) {
                delivering = false;
                drain_deadline = std::chrono::steady_clock::now() + config_.drain_timeout;
            }
            continue;
        }

        switch (f.event) {
            case wire_event::TTSSentenceStart:
            case wire_event::TTSSentenceEnd:
                break;
            case wire_event::SessionFinished:
                ++total_sessions_;
                return delivered;
            case wire_event::SessionFailed:
                raise_session_error(f, "TTS session failed");
            case wire_event::ConnectionFinished:
                transport_->close();
                throw BridgeError(ErrorKind::Connection, "TTS server finished the connection");
            default:
                if (config_.verbose) {
                    std::cout << "🔍 [" << session_id << "] TTS skipping " << wire_event_name(f.event) << std::endl;
                }
                break;
        }
    }
}

size_t TtsClient::synthesize_text(const std::string& text, const std::string& speaker,
                                  const std::string& session_id, const AudioChunkCallback& on_chunk) {
    std::lock_guard<std::mutex> lock(session_mutex_);
    if (streaming_active_) {
        throw BridgeError(ErrorKind::Session, "TTS streaming session in progress");
    }

    start_session(speaker, session_id);
    send_frame(make_event_frame(wire_event::TaskRequest, session_id,
                                build_request(wire_event::TaskRequest, text, speaker).dump()));
    send_frame(make_event_frame(wire_event::FinishSession, session_id, "{}"));
    return collect_audio(session_id, on_chunk);
}

Outcome TtsClient::safe_synthesize(const std::string& text, const std::string& speaker,
                                   const CancelToken& cancel, const AudioChunkCallback& on_chunk) {
    Outcome last = Outcome::failed(ErrorKind::Session, "TTS synthesis not attempted");

    for (int attempt = 1; attempt <= config_.max_attempts; ++attempt) {
        if (cancel.is_cancelled()) return Outcome::cancelled();

        size_t delivered = 0;
        try {
            if (!is_connected()) {
                std::cout << "🔄 TTS socket closed, reconnecting (attempt " << attempt << ")" << std::endl;
                connect();
                if (config_.settle_delay.count() > 0 && cancel.wait_for(config_.settle_delay)) {
                    return Outcome::cancelled();
                }
            }

            auto guarded = [&](const std::string& audio) {
                if (cancel.is_cancelled()) return false;
                ++delivered;
                return on_chunk(audio);
            };
            size_t n = synthesize_text(text, speaker, generate_uuid(), guarded);
            if (cancel.is_cancelled()) return Outcome::cancelled();
            if (n > 0) return Outcome::ok();

            ++total_failures_;
            last = Outcome::failed(ErrorKind::Session, "TTS returned no audio");
        } catch (const BridgeError& e) {
            ++total_failures_;
            if (e.kind() == ErrorKind::Cancelled) return Outcome::cancelled(e.what());
            last = Outcome::failed(e.kind(), e.what());
            // A session broken off mid-stream leaves frames behind on the socket
            if (delivered > 0 || e.kind() != ErrorKind::Session) {
                transport_->close();
            }
            if (delivered > 0) {
                std::cout << "❌ TTS failed after " << delivered << " chunks, not retrying: " << e.what() << std::endl;
                return last;
            }
        }

        std::cout << "⚠️ TTS attempt " << attempt << "/" << config_.max_attempts << " failed: " << last.message << std::endl;
        if (attempt < config_.max_attempts && cancel.wait_for(config_.retry_delay)) {
            return Outcome::cancelled();
        }
    }
    return last;
}

void TtsClient::start_streaming(const std::string& speaker, const std::string& session_id) {
    std::lock_guard<std::mutex> lock(session_mutex_);
    if (streaming_active_) {
        throw BridgeError(ErrorKind::Session, "TTS streaming session already active");
    }
    start_session(speaker, session_id);
    streaming_session_id_ = session_id;
    streaming_speaker_ = speaker;
    streaming_active_ = true;
    std::cout << "🎤 [" << session_id << "] TTS streaming session started" << std::endl;
}

void TtsClient::send_streaming_text(const std::string& text) {
    std::lock_guard<std::mutex> lock(session_mutex_);
    if (!streaming_active_) {
        throw BridgeError(ErrorKind::Session, "no TTS streaming session");
    }
    send_frame(make_event_frame(wire_event::TaskRequest, streaming_session_id_,
                                build_request(wire_event::TaskRequest, text, streaming_speaker_).dump()));
}

size_t TtsClient::stop_streaming(const AudioChunkCallback& on_chunk) {
    std::lock_guard<std::mutex> lock(session_mutex_);
    if (!streaming_active_) {
        return 0;
    }
    std::string session_id = streaming_session_id_;
    streaming_active_ = false;
    streaming_session_id_.clear();

    send_frame(make_event_frame(wire_event::FinishSession, session_id, "{}"));
    size_t n = collect_audio(session_id, on_chunk);
    std::cout << "✅ [" << session_id << "] TTS streaming session finished (" << n << " chunks)" << std::endl;
    return n;
}

TtsClient::Stats TtsClient::get_stats() const {
    Stats s;
    s.sessions = total_sessions_.load();
    s.audio_chunks = total_chunks_.load();
    s.audio_bytes = total_bytes_.load();
    s.failures = total_failures_.load();
    return s;
}
