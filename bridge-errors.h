#pragma once

#include <stdexcept>
#include <string>

// Error kinds shared by the protocol clients, the room coordinator and the pipeline
enum class ErrorKind {
    Connection,          // transport/handshake failure, TLS variants included
    Protocol,            // malformed frame, unexpected message or event, bad gzip
    Session,             // remote side rejected a session start/finish
    ConcurrencyRejected, // duplicate pending request or cooldown active
    Cancelled,           // cooperative cancellation observed
    Timeout              // a bounded wait expired
};

const char* error_kind_name(ErrorKind kind);

class BridgeError : public std::runtime_error {
public:
    BridgeError(ErrorKind kind, const std::string& message, int remote_code = 0)
        : std::runtime_error(message), kind_(kind), remote_code_(remote_code) {}

    ErrorKind kind() const { return kind_; }
    int remote_code() const { return remote_code_; }

    // Seconds until a cooldown expires (ConcurrencyRejected only, 0 otherwise)
    double retry_after_seconds() const { return retry_after_seconds_; }
    void set_retry_after_seconds(double s) { retry_after_seconds_ = s; }

private:
    ErrorKind kind_;
    int remote_code_;
    double retry_after_seconds_ = 0.0;
};

// Result of an operation that a retry loop drives. Cancelled is kept apart from
// Failed so that a cancellation is never retried.
struct Outcome {
    enum class Status { Ok, Failed, Cancelled };

    Status status = Status::Ok;
    ErrorKind kind = ErrorKind::Connection;
    std::string message;

    static Outcome ok() { return Outcome{}; }
    static Outcome failed(ErrorKind k, const std::string& msg) { return Outcome{Status::Failed, k, msg}; }
    static Outcome cancelled(const std::string& msg = "cancelled") {
        return Outcome{Status::Cancelled, ErrorKind::Cancelled, msg};
    }

    bool is_ok() const { return status == Status::Ok; }
    bool is_cancelled() const { return status == Status::Cancelled; }
    bool is_failed() const { return status == Status::Failed; }

    // Throws the matching BridgeError for Failed/Cancelled, no-op for Ok
    void raise_if_not_ok() const;
};

// Remote error code tables
std::string tts_error_message(int code);
std::string avatar_error_message(int code);
std::string llm_error_message(int code);
ErrorKind tts_error_kind(int code);
ErrorKind avatar_error_kind(int code);

// HTTP status used by the front door for an error kind
int http_status_for(ErrorKind kind);
bool is_retryable_status(int http_status);
