#pragma once

#include <nlohmann/json.hpp>

#include <cstdint>
#include <optional>
#include <string>

// Binary frame format shared by the TTS and STT WebSocket services.
//
// Header (4 bytes, header_size counts 4-byte units):
//   byte 0: protocol_version(4) | header_size(4)
//   byte 1: message_type(4)     | type_flags(4)
//   byte 2: serialization(4)    | compression(4)
//   byte 3: reserved
// Optional block (fixed order, only what the flags/event ask for):
//   event(int32) | session id / connection id / meta (int32 length + utf-8)
//   | sequence(int32, negative = last packet)
// Payload: int32 big-endian length + bytes (gzip when compression says so).
// Error frames carry error_code(int32) before the payload.

enum class MessageType : uint8_t {
    FullClientRequest  = 0x1,
    AudioOnlyRequest   = 0x2,
    FullServerResponse = 0x9,
    AudioOnlyResponse  = 0xB,
    FrontEndResult     = 0xC,
    Error              = 0xF
};

// type_flags bits
constexpr uint8_t kFlagHasSequence  = 0x1;
constexpr uint8_t kFlagLastPackage  = 0x2;
constexpr uint8_t kFlagHasEvent     = 0x4;

constexpr uint8_t kFlagsNoSequence       = 0x0;
constexpr uint8_t kFlagsPositiveSequence = kFlagHasSequence;
constexpr uint8_t kFlagsLastNoSequence   = kFlagLastPackage;
constexpr uint8_t kFlagsNegativeSequence = kFlagHasSequence | kFlagLastPackage;
constexpr uint8_t kFlagsWithEvent        = kFlagHasEvent;

enum class Serialization : uint8_t { None = 0x0, Json = 0x1 };
enum class Compression : uint8_t { None = 0x0, Gzip = 0x1 };

constexpr uint8_t kProtocolVersion = 0x1;
constexpr uint8_t kDefaultHeaderSize = 0x1;

namespace wire_event {
constexpr int32_t None               = 0;
constexpr int32_t StartConnection    = 1;
constexpr int32_t FinishConnection   = 2;
constexpr int32_t ConnectionStarted  = 50;
constexpr int32_t ConnectionFailed   = 51;
constexpr int32_t ConnectionFinished = 52;
constexpr int32_t StartSession       = 100;
constexpr int32_t FinishSession      = 102;
constexpr int32_t SessionStarted     = 150;
constexpr int32_t SessionFinished    = 152;
constexpr int32_t SessionFailed      = 153;
constexpr int32_t TaskRequest        = 200;
constexpr int32_t TTSSentenceStart   = 350;
constexpr int32_t TTSSentenceEnd     = 351;
constexpr int32_t TTSResponse        = 352;
} // namespace wire_event

const char* wire_event_name(int32_t event);

struct Frame {
    uint8_t protocol_version = kProtocolVersion;
    uint8_t header_size = kDefaultHeaderSize;
    MessageType message_type = MessageType::FullClientRequest;
    uint8_t flags = kFlagsNoSequence;
    Serialization serialization = Serialization::None;
    Compression compression = Compression::None;
    uint8_t reserved = 0;

    int32_t event = wire_event::None;
    std::optional<std::string> session_id;
    std::optional<int32_t> sequence;

    // Server-side only
    std::optional<std::string> connection_id;
    std::optional<std::string> response_meta_json;
    int32_t error_code = 0;

    // Always the uncompressed bytes
    std::string payload;
    // Set by decode_frame when a gzip payload could not be inflated (payload is then empty)
    bool payload_decode_failed = false;

    bool has_event() const { return (flags & kFlagHasEvent) != 0; }
    bool has_sequence() const { return (flags & kFlagHasSequence) != 0; }
    bool is_last_package() const { return (flags & kFlagLastPackage) != 0; }

    // Parses payload as JSON; throws BridgeError(Protocol) when it is not JSON
    nlohmann::json payload_json() const;
};

// Serialises a frame. Throws BridgeError(Protocol) if compression fails.
std::string encode_frame(const Frame& frame);

// Parses a frame. Throws BridgeError(Protocol) on truncated or inconsistent input;
// a gzip failure is reported through Frame::payload_decode_failed instead.
Frame decode_frame(const std::string& bytes);

// Frame builders
Frame make_event_frame(int32_t event, const std::optional<std::string>& session_id,
                       const std::string& payload, Serialization serialization = Serialization::Json);
Frame make_json_request(const nlohmann::json& body, int32_t sequence, Compression compression = Compression::Gzip);

// Audio-only request: the sequence is sent as-is, or negated for the last chunk.
// Throws BridgeError(Protocol) for a sequence that is not positive.
Frame make_audio_only_request(int32_t sequence, const std::string& audio, bool is_last,
                              Compression compression = Compression::Gzip);

// gzip helpers (RFC 1952 framing)
bool gzip_compress(const std::string& in, std::string& out);
bool gzip_decompress(const std::string& in, std::string& out);
