#include "bridge-errors.h"

#include <map>

const char* error_kind_name(ErrorKind kind) {
    switch (kind) {
        case ErrorKind::Connection: return "connection_error";
        case ErrorKind::Protocol: return "protocol_error";
        case ErrorKind::Session: return "session_error";
        case ErrorKind::ConcurrencyRejected: return "concurrency_rejected";
        case ErrorKind::Cancelled: return "cancelled";
        case ErrorKind::Timeout: return "timeout";
    }
    return "unknown";
}

void Outcome::raise_if_not_ok() const {
    if (status == Status::Ok) return;
    if (status == Status::Cancelled) {
        throw BridgeError(ErrorKind::Cancelled, message);
    }
    throw BridgeError(kind, message);
}

namespace {

const std::map<int, std::string> kTtsCodes = {
    {20000000, "Success"},
    {45000000, "Client error"},
    {45000001, "Invalid request parameters"},
    {55000000, "Server error"},
    {55000001, "Session error"},
};

const std::map<int, std::string> kAvatarCodes = {
    {1000, "Success"},
    {4000, "Request error"},
    {4001, "Authentication error"},
    {4002, "Concurrency limit exceeded"},
    {4003, "Too many connections"},
    {4004, "Live ID duplicate"},
    {4005, "RTMP address duplicate"},
    {4006, "Live session not found"},
    {4007, "Invalid interrupt"},
    {5000, "Live service internal error"},
    {5001, "Avatar service internal error"},
    {5002, "Server busy"},
};

const std::map<int, std::string> kLlmCodes = {
    {4000, "Request error"},
    {4001, "Authentication error"},
    {4002, "Rate limit exceeded"},
    {4003, "Too many connections"},
    {4004, "Conversation ID duplicate"},
    {4005, "Invalid conversation"},
    {5000, "Internal server error"},
    {5001, "Service unavailable"},
    {5002, "Server busy"},
};

std::string lookup(const std::map<int, std::string>& table, int code) {
    auto it = table.find(code);
    if (it != table.end()) return it->second;
    return "Unknown error: " + std::to_string(code);
}

} // namespace

std::string tts_error_message(int code) { return lookup(kTtsCodes, code); }
std::string avatar_error_message(int code) { return lookup(kAvatarCodes, code); }
std::string llm_error_message(int code) { return lookup(kLlmCodes, code); }

ErrorKind tts_error_kind(int code) {
    switch (code) {
        case 55000001: return ErrorKind::Session;
        case 45000001: return ErrorKind::Protocol;
        case 45000000:
        case 55000000: return ErrorKind::Connection;
        default: return ErrorKind::Session;
    }
}

ErrorKind avatar_error_kind(int code) {
    switch (code) {
        case 4000: case 4002: case 4003: case 4004: case 4005: case 4006:
            return ErrorKind::Connection;
        default:
            return ErrorKind::Session;
    }
}

int http_status_for(ErrorKind kind) {
    switch (kind) {
        case ErrorKind::ConcurrencyRejected: return 429;
        case ErrorKind::Timeout: return 408;
        case ErrorKind::Connection: return 503;
        case ErrorKind::Session:
        case ErrorKind::Protocol: return 502;
        case ErrorKind::Cancelled: return 499;
    }
    return 500;
}

bool is_retryable_status(int http_status) {
    return http_status == 429 || http_status == 408 || http_status == 503;
}
