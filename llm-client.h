#pragma once

#include <nlohmann/json.hpp>

#include <chrono>
#include <functional>
#include <map>
#include <string>

// Return false to stop reading the stream early
using TextDeltaCallback = std::function<bool(const std::string& delta)>;

// Source of streamed answer text for the pipeline
class TextStreamSource {
public:
    virtual ~TextStreamSource() = default;

    // Throws BridgeError on transport or API failure
    virtual std::string create_conversation(const std::string& user_id) = 0;
    virtual void chat_stream(const std::string& user_id, const std::string& conversation_id,
                             const std::string& query, const TextDeltaCallback& on_delta) = 0;
};

struct LlmClientConfig {
    std::string base_url;
    std::string api_key;
    std::map<std::string, std::string> inputs;
    bool verify_tls = true;
    std::chrono::milliseconds connect_timeout{30000};
    std::chrono::milliseconds read_timeout{60000};
    bool verbose = false;
};

// Conversational agent API over HTTPS (Apikey header, JSON bodies, SSE answers)
class LlmClient : public TextStreamSource {
public:
    explicit LlmClient(const LlmClientConfig& config);

    std::string create_conversation(const std::string& user_id) override;
    void chat_stream(const std::string& user_id, const std::string& conversation_id,
                     const std::string& query, const TextDeltaCallback& on_delta) override;

private:
    LlmClientConfig config_;
    std::string host_;
    std::string port_;
    std::string base_path_;

    // Posts body to base_url + path. on_body receives the status and the response body
    // in pieces and returns false to abort. Returns the HTTP status.
    int post(const std::string& path, const nlohmann::json& body, bool event_stream,
             const std::function<bool(int, const std::string&)>& on_body);
};

// Splits a server-sent-event byte stream into the JSON objects of its data: lines
class SseLineDecoder {
public:
    // Returns false once a callback asked to stop
    bool feed(const std::string& bytes, const std::function<bool(const nlohmann::json&)>& on_event);

private:
    std::string pending_;
};
