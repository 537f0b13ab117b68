#pragma once

#include "bridge-errors.h"
#include "cancel-token.h"

#include <nlohmann/json.hpp>

#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

class AvatarClient;
class Database;
class StreamSessionRegistry;
class TextStreamSource;
class TtsClient;

struct QueryRequest {
    std::string query;
    std::string user_id = "default_user";
    std::optional<std::string> session_id;
    std::optional<std::string> conversation_id;
    std::optional<std::string> live_id;
    std::string speaker;
};

// Receives every progress event of a query as one JSON object with a "type" field
using EventSink = std::function<void(const nlohmann::json&)>;

// Cuts every complete sentence (ending in one of 。！？.!?) off the front of buffer.
// Whatever follows the last terminal stays in buffer.
std::vector<std::string> extract_sentences(std::string& buffer);

// LLM text -> sentences -> TTS audio -> avatar, strictly in order, one query at a time per call
class PipelineOrchestrator {
public:
    PipelineOrchestrator(TextStreamSource& llm, TtsClient& tts, AvatarClient* avatar,
                         StreamSessionRegistry& registry, Database* database = nullptr, bool verbose = false);

    // Runs the query to its end and returns "complete", "cancelled" or "error".
    // The session is always released before returning.
    std::string run_query(const QueryRequest& request, const EventSink& emit);

private:
    TextStreamSource& llm_;
    TtsClient& tts_;
    AvatarClient* avatar_;
    StreamSessionRegistry& registry_;
    Database* database_;
    bool verbose_;

    std::mutex conversations_mutex_;
    std::map<std::string, std::string> conversations_;

    std::string conversation_for(const QueryRequest& request);

    // false once the session is cancelled
    bool process_sentence(const std::string& sentence, const QueryRequest& request, const CancelToken& cancel,
                          const EventSink& emit, bool final_sentence);
};
