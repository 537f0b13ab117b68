#include "pipeline-orchestrator.h"
#include "avatar-client.h"
#include "database.h"
#include "llm-client.h"
#include "stream-session-registry.h"
#include "tts-client.h"
#include "uuid-util.h"

#include <iostream>

namespace {

// Byte length of the sentence terminal starting at pos, 0 if there is none
size_t terminal_length(const std::string& s, size_t pos) {
    char c = s[pos];
    if (c == '.' || c == '!' || c == '?') return 1;
    static const char* const kWide[] = {"\xE3\x80\x82", "\xEF\xBC\x81", "\xEF\xBC\x9F"}; // 。！？
    for (const char* t : kWide) {
        if (s.compare(pos, 3, t) == 0) return 3;
    }
    return 0;
}

std::string trim(const std::string& s) {
    size_t b = s.find_first_not_of(" \t\r\n");
    if (b == std::string::npos) return "";
    size_t e = s.find_last_not_of(" \t\r\n");
    return s.substr(b, e - b + 1);
}

// Releases the stream session however run_query leaves
class SessionRelease {
public:
    SessionRelease(StreamSessionRegistry& registry, std::string session_id, std::shared_ptr<CancelToken> token)
        : registry_(registry), session_id_(std::move(session_id)), token_(std::move(token)) {}
    ~SessionRelease() { registry_.release(session_id_, token_); }

    SessionRelease(const SessionRelease&) = delete;
    SessionRelease& operator=(const SessionRelease&) = delete;

private:
    StreamSessionRegistry& registry_;
    std::string session_id_;
    std::shared_ptr<CancelToken> token_;
};

} // namespace

std::vector<std::string> extract_sentences(std::string& buffer) {
    std::vector<std::string> sentences;
    size_t start = 0;
    size_t pos = 0;
    while (pos < buffer.size()) {
        size_t len = terminal_length(buffer, pos);
        if (len == 0) {
            ++pos;
            continue;
        }
        // Runs like "?!" or "..." stay with their sentence
        size_t end = pos + len;
        while (end < buffer.size()) {
            size_t more = terminal_length(buffer, end);
            if (more == 0) break;
            end += more;
        }
        std::string sentence = trim(buffer.substr(start, end - start));
        if (!sentence.empty()) sentences.push_back(sentence);
        start = end;
        pos = end;
    }
    buffer.erase(0, start);
    return sentences;
}

PipelineOrchestrator::PipelineOrchestrator(TextStreamSource& llm, TtsClient& tts, AvatarClient* avatar,
                                           StreamSessionRegistry& registry, Database* database, bool verbose)
    : llm_(llm), tts_(tts), avatar_(avatar), registry_(registry), database_(database), verbose_(verbose) {}

std::string PipelineOrchestrator::conversation_for(const QueryRequest& request) {
    if (request.conversation_id && !request.conversation_id->empty()) {
        return *request.conversation_id;
    }
    {
        std::lock_guard<std::mutex> lock(conversations_mutex_);
        auto it = conversations_.find(request.user_id);
        if (it != conversations_.end()) return it->second;
    }
    std::string id = llm_.create_conversation(request.user_id);
    std::lock_guard<std::mutex> lock(conversations_mutex_);
    conversations_[request.user_id] = id;
    return id;
}

bool PipelineOrchestrator::process_sentence(const std::string& sentence, const QueryRequest& request,
                                            const CancelToken& cancel, const EventSink& emit, bool final_sentence) {
    if (cancel.is_cancelled()) return false;

    size_t chunks = 0;
    std::optional<BridgeError> avatar_error;
    const bool drive = avatar_ != nullptr && request.live_id.has_value();

    Outcome outcome = tts_.safe_synthesize(sentence, request.speaker, cancel, [&](const std::string& audio) {
        if (cancel.is_cancelled()) return false;
        ++chunks;
        emit({
            {"type", final_sentence ? "final_audio_chunk" : "audio_chunk"},
            {"sentence", sentence},
            {"audio_size", audio.size()},
            {"chunk_index", chunks}
        });
        if (drive) {
            try {
                avatar_->drive_with_streaming_audio(audio);
            } catch (const BridgeError& e) {
                avatar_error = e;
                return false;
            }
        }
        return !cancel.is_cancelled();
    });

    if (avatar_error) {
        throw *avatar_error;
    }
    if (outcome.is_cancelled() || cancel.is_cancelled()) {
        return false;
    }
    if (outcome.is_failed()) {
        std::cout << "❌ TTS failed for sentence '" << sentence << "': " << outcome.message << std::endl;
        emit({
            {"type", final_sentence ? "final_tts_error" : "tts_error"},
            {"sentence", sentence},
            {"error_kind", error_kind_name(outcome.kind)},
            {"error", outcome.message}
        });
        return true;
    }

    if (!final_sentence) {
        emit({{"type", "sentence_processed"}, {"sentence", sentence}, {"audio_chunks", chunks}});
    }
    return true;
}

std::string PipelineOrchestrator::run_query(const QueryRequest& request, const EventSink& emit) {
    const std::string session_id = request.session_id && !request.session_id->empty()
                                       ? *request.session_id : generate_id("stream");
    auto token = registry_.register_session(session_id, request.live_id);
    SessionRelease release(registry_, session_id, token);

    std::string status = "error";
    std::string full_text;
    const std::string tag = "[" + session_id + "] ";
    const std::string run_id = generate_id("run");

    if (database_) {
        database_->create_stream_session(session_id, run_id, request.live_id.value_or(""), request.user_id, request.query);
    }

    try {
        if (token->is_cancelled()) {
            throw BridgeError(ErrorKind::Cancelled, "cancelled before start");
        }

        std::string conversation_id = conversation_for(request);
        emit({
            {"type", "start"},
            {"session_id", session_id},
            {"conversation_id", conversation_id},
            {"live_id", request.live_id ? nlohmann::json(*request.live_id) : nlohmann::json(nullptr)},
            {"query", request.query}
        });
        std::cout << "🚀 " << tag << "Query started: " << request.query << std::endl;

        std::string buffer;
        llm_.chat_stream(request.user_id, conversation_id, request.query, [&](const std::string& delta) {
            if (token->is_cancelled()) return false;

            full_text += delta;
            buffer += delta;
            emit({{"type", "text_chunk"}, {"content", delta}, {"accumulated_text", full_text}});

            for (const auto& sentence : extract_sentences(buffer)) {
                if (token->is_cancelled()) return false;
                if (verbose_) {
                    std::cout << "📝 " << tag << "Sentence: " << sentence << std::endl;
                }
                emit({{"type", "sentence_complete"}, {"sentence", sentence}});
                if (!process_sentence(sentence, request, *token, emit, false)) return false;
            }
            return !token->is_cancelled();
        });

        if (!token->is_cancelled()) {
            std::string rest = trim(buffer);
            if (!rest.empty()) {
                emit({{"type", "final_sentence"}, {"sentence", rest}});
                process_sentence(rest, request, *token, emit, true);
            }
        }

        if (token->is_cancelled()) {
            throw BridgeError(ErrorKind::Cancelled, "cancelled");
        }

        if (avatar_ && request.live_id) {
            try {
                avatar_->finish_streaming_audio();
            } catch (const BridgeError& e) {
                std::cout << "⚠️ " << tag << "finish_streaming_audio failed: " << e.what() << std::endl;
            }
        }

        emit({{"type", "complete"}, {"session_id", session_id}, {"full_text", full_text}});
        status = "complete";
        std::cout << "✅ " << tag << "Query complete (" << full_text.size() << " chars)" << std::endl;
    } catch (const BridgeError& e) {
        if (e.kind() == ErrorKind::Cancelled || token->is_cancelled()) {
            status = "cancelled";
            std::cout << "🛑 " << tag << "Query cancelled" << std::endl;
            emit({{"type", "cancelled"}, {"session_id", session_id}, {"partial_text", full_text}});
        } else {
            std::cout << "❌ " << tag << "Query failed: " << e.what() << std::endl;
            emit({
                {"type", "error"},
                {"session_id", session_id},
                {"error_kind", error_kind_name(e.kind())},
                {"error", e.what()}
            });
        }
    } catch (const std::exception& e) {
        std::cout << "❌ " << tag << "Query failed: " << e.what() << std::endl;
        emit({{"type", "error"}, {"session_id", session_id}, {"error", e.what()}});
    }

    if (database_) {
        database_->finish_stream_session(session_id, run_id, full_text, status);
    }
    return status;
}
