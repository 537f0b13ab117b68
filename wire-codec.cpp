#include "wire-codec.h"
#include "bridge-errors.h"

#include <zlib.h>

#include <cstring>

namespace {

// How the optional block of an event frame is laid out
enum class EventLayout {
    ConnectionPayload, // [sequence] payload
    ConnectionId,      // connection id [payload]
    ConnectionMeta,    // meta json [payload]
    SessionMeta,       // session id, meta json [payload]
    SessionPayload     // session id [sequence] payload
};

EventLayout event_layout(int32_t event) {
    switch (event) {
        case wire_event::StartConnection:
        case wire_event::FinishConnection:
        case wire_event::ConnectionFinished:
            return EventLayout::ConnectionPayload;
        case wire_event::ConnectionStarted:
            return EventLayout::ConnectionId;
        case wire_event::ConnectionFailed:
            return EventLayout::ConnectionMeta;
        case wire_event::SessionStarted:
        case wire_event::SessionFinished:
        case wire_event::SessionFailed:
            return EventLayout::SessionMeta;
        default:
            return EventLayout::SessionPayload;
    }
}

void put_i32(std::string& out, int32_t v) {
    uint32_t u = static_cast<uint32_t>(v);
    out.push_back(static_cast<char>((u >> 24) & 0xFF));
    out.push_back(static_cast<char>((u >> 16) & 0xFF));
    out.push_back(static_cast<char>((u >> 8) & 0xFF));
    out.push_back(static_cast<char>(u & 0xFF));
}

void put_string(std::string& out, const std::string& s) {
    put_i32(out, static_cast<int32_t>(s.size()));
    out.append(s);
}

bool carries_gzip(MessageType type, Compression compression) {
    // Audio responses are raw PCM whatever the header claims
    return compression == Compression::Gzip && type != MessageType::AudioOnlyResponse;
}

void put_payload(std::string& out, const Frame& frame) {
    if (carries_gzip(frame.message_type, frame.compression) && !frame.payload.empty()) {
        std::string compressed;
        if (!gzip_compress(frame.payload, compressed)) {
            throw BridgeError(ErrorKind::Protocol, "gzip compression failed");
        }
        put_string(out, compressed);
    } else {
        put_string(out, frame.payload);
    }
}

class Reader {
public:
    explicit Reader(const std::string& data) : data_(data) {}

    size_t remaining() const { return data_.size() - offset_; }

    void skip_to(size_t offset) {
        if (offset > data_.size()) {
            throw BridgeError(ErrorKind::Protocol, "frame shorter than its declared header");
        }
        offset_ = offset;
    }

    int32_t i32(const char* what) {
        if (remaining() < 4) {
            throw BridgeError(ErrorKind::Protocol, std::string("truncated frame reading ") + what);
        }
        const auto* p = reinterpret_cast<const uint8_t*>(data_.data() + offset_);
        uint32_t u = (static_cast<uint32_t>(p[0]) << 24) | (static_cast<uint32_t>(p[1]) << 16) |
                     (static_cast<uint32_t>(p[2]) << 8) | static_cast<uint32_t>(p[3]);
        offset_ += 4;
        return static_cast<int32_t>(u);
    }

    std::string block(const char* what) {
        int32_t size = i32(what);
        if (size < 0 || static_cast<size_t>(size) > remaining()) {
            throw BridgeError(ErrorKind::Protocol,
                              std::string("bad length prefix for ") + what + ": " + std::to_string(size));
        }
        std::string out = data_.substr(offset_, static_cast<size_t>(size));
        offset_ += static_cast<size_t>(size);
        return out;
    }

private:
    const std::string& data_;
    size_t offset_ = 0;
};

void read_payload(Reader& r, Frame& frame) {
    std::string raw = r.block("payload");
    if (carries_gzip(frame.message_type, frame.compression) && !raw.empty()) {
        std::string inflated;
        if (gzip_decompress(raw, inflated)) {
            frame.payload = std::move(inflated);
        } else {
            frame.payload.clear();
            frame.payload_decode_failed = true;
        }
    } else {
        frame.payload = std::move(raw);
    }
}

} // namespace

const char* wire_event_name(int32_t event) {
    switch (event) {
        case wire_event::None: return "None";
        case wire_event::StartConnection: return "StartConnection";
        case wire_event::FinishConnection: return "FinishConnection";
        case wire_event::ConnectionStarted: return "ConnectionStarted";
        case wire_event::ConnectionFailed: return "ConnectionFailed";
        case wire_event::ConnectionFinished: return "ConnectionFinished";
        case wire_event::StartSession: return "StartSession";
        case wire_event::FinishSession: return "FinishSession";
        case wire_event::SessionStarted: return "SessionStarted";
        case wire_event::SessionFinished: return "SessionFinished";
        case wire_event::SessionFailed: return "SessionFailed";
        case wire_event::TaskRequest: return "TaskRequest";
        case wire_event::TTSSentenceStart: return "TTSSentenceStart";
        case wire_event::TTSSentenceEnd: return "TTSSentenceEnd";
        case wire_event::TTSResponse: return "TTSResponse";
    }
    return "Unknown";
}

nlohmann::json Frame::payload_json() const {
    if (payload.empty()) {
        return nlohmann::json::object();
    }
    try {
        return nlohmann::json::parse(payload);
    } catch (const nlohmann::json::exception& e) {
        throw BridgeError(ErrorKind::Protocol, std::string("payload is not JSON: ") + e.what());
    }
}

std::string encode_frame(const Frame& frame) {
    std::string out;
    out.reserve(16 + frame.payload.size());

    uint8_t header_size = frame.header_size == 0 ? kDefaultHeaderSize : frame.header_size;
    out.push_back(static_cast<char>(((frame.protocol_version & 0x0F) << 4) | (header_size & 0x0F)));
    out.push_back(static_cast<char>(((static_cast<uint8_t>(frame.message_type) & 0x0F) << 4) | (frame.flags & 0x0F)));
    out.push_back(static_cast<char>(((static_cast<uint8_t>(frame.serialization) & 0x0F) << 4) |
                                    (static_cast<uint8_t>(frame.compression) & 0x0F)));
    out.push_back(static_cast<char>(frame.reserved));
    // Header extension bytes, if any, are zero
    out.append(static_cast<size_t>(header_size) * 4 - 4, '\0');

    if (frame.message_type == MessageType::Error) {
        put_i32(out, frame.error_code);
        put_payload(out, frame);
        return out;
    }

    if (!frame.has_event()) {
        if (frame.has_sequence()) {
            put_i32(out, frame.sequence.value_or(0));
        }
        put_payload(out, frame);
        return out;
    }

    put_i32(out, frame.event);
    switch (event_layout(frame.event)) {
        case EventLayout::ConnectionPayload:
            if (frame.has_sequence()) put_i32(out, frame.sequence.value_or(0));
            put_payload(out, frame);
            break;
        case EventLayout::ConnectionId:
            put_string(out, frame.connection_id.value_or(""));
            if (!frame.payload.empty()) put_payload(out, frame);
            break;
        case EventLayout::ConnectionMeta:
            put_string(out, frame.response_meta_json.value_or(""));
            if (!frame.payload.empty()) put_payload(out, frame);
            break;
        case EventLayout::SessionMeta:
            put_string(out, frame.session_id.value_or(""));
            put_string(out, frame.response_meta_json.value_or(""));
            if (!frame.payload.empty()) put_payload(out, frame);
            break;
        case EventLayout::SessionPayload:
            put_string(out, frame.session_id.value_or(""));
            if (frame.has_sequence()) put_i32(out, frame.sequence.value_or(0));
            put_payload(out, frame);
            break;
    }
    return out;
}

Frame decode_frame(const std::string& bytes) {
    if (bytes.size() < 4) {
        throw BridgeError(ErrorKind::Protocol, "frame shorter than 4-byte header");
    }
    const auto* h = reinterpret_cast<const uint8_t*>(bytes.data());

    Frame frame;
    frame.protocol_version = (h[0] >> 4) & 0x0F;
    frame.header_size = h[0] & 0x0F;
    frame.message_type = static_cast<MessageType>((h[1] >> 4) & 0x0F);
    frame.flags = h[1] & 0x0F;
    frame.serialization = static_cast<Serialization>((h[2] >> 4) & 0x0F);
    frame.compression = static_cast<Compression>(h[2] & 0x0F);
    frame.reserved = h[3];

    if (frame.header_size == 0) {
        throw BridgeError(ErrorKind::Protocol, "header size of zero");
    }

    Reader r(bytes);
    r.skip_to(static_cast<size_t>(frame.header_size) * 4);

    if (frame.message_type == MessageType::Error) {
        frame.error_code = r.i32("error code");
        read_payload(r, frame);
        return frame;
    }

    if (!frame.has_event()) {
        if (frame.has_sequence()) {
            frame.sequence = r.i32("sequence");
        }
        if (r.remaining() > 0) {
            read_payload(r, frame);
        }
        return frame;
    }

    frame.event = r.i32("event");
    if (frame.event == wire_event::None) {
        return frame;
    }

    switch (event_layout(frame.event)) {
        case EventLayout::ConnectionPayload:
            if (frame.has_sequence()) frame.sequence = r.i32("sequence");
            if (r.remaining() > 0) read_payload(r, frame);
            break;
        case EventLayout::ConnectionId:
            frame.connection_id = r.block("connection id");
            if (r.remaining() > 0) read_payload(r, frame);
            break;
        case EventLayout::ConnectionMeta:
            frame.response_meta_json = r.block("response meta");
            if (r.remaining() > 0) read_payload(r, frame);
            break;
        case EventLayout::SessionMeta:
            frame.session_id = r.block("session id");
            frame.response_meta_json = r.block("response meta");
            if (r.remaining() > 0) read_payload(r, frame);
            break;
        case EventLayout::SessionPayload:
            frame.session_id = r.block("session id");
            if (frame.has_sequence()) frame.sequence = r.i32("sequence");
            read_payload(r, frame);
            break;
    }
    return frame;
}

Frame make_event_frame(int32_t event, const std::optional<std::string>& session_id,
                       const std::string& payload, Serialization serialization) {
    Frame frame;
    frame.message_type = MessageType::FullClientRequest;
    frame.flags = kFlagsWithEvent;
    frame.serialization = serialization;
    frame.compression = Compression::None;
    frame.event = event;
    frame.session_id = session_id;
    frame.payload = payload;
    return frame;
}

Frame make_json_request(const nlohmann::json& body, int32_t sequence, Compression compression) {
    Frame frame;
    frame.message_type = MessageType::FullClientRequest;
    frame.flags = kFlagsPositiveSequence;
    frame.serialization = Serialization::Json;
    frame.compression = compression;
    frame.sequence = sequence;
    frame.payload = body.dump();
    return frame;
}

Frame make_audio_only_request(int32_t sequence, const std::string& audio, bool is_last,
                              Compression compression) {
    if (sequence <= 0) {
        throw BridgeError(ErrorKind::Protocol, "audio sequence must be positive, got " + std::to_string(sequence));
    }
    Frame frame;
    frame.message_type = MessageType::AudioOnlyRequest;
    frame.flags = is_last ? kFlagsNegativeSequence : kFlagsPositiveSequence;
    frame.serialization = Serialization::None;
    frame.compression = compression;
    frame.sequence = is_last ? -sequence : sequence;
    frame.payload = audio;
    return frame;
}

bool gzip_compress(const std::string& in, std::string& out) {
    z_stream zs;
    std::memset(&zs, 0, sizeof(zs));
    // 15 window bits + 16 selects the gzip wrapper
    if (deflateInit2(&zs, Z_DEFAULT_COMPRESSION, Z_DEFLATED, 15 + 16, 8, Z_DEFAULT_STRATEGY) != Z_OK) {
        return false;
    }

    zs.next_in = reinterpret_cast<Bytef*>(const_cast<char*>(in.data()));
    zs.avail_in = static_cast<uInt>(in.size());

    out.clear();
    char buffer[16384];
    int rc = Z_OK;
    do {
        zs.next_out = reinterpret_cast<Bytef*>(buffer);
        zs.avail_out = sizeof(buffer);
        rc = deflate(&zs, Z_FINISH);
        if (rc == Z_STREAM_ERROR) {
            deflateEnd(&zs);
            return false;
        }
        out.append(buffer, sizeof(buffer) - zs.avail_out);
    } while (rc != Z_STREAM_END);

    deflateEnd(&zs);
    return true;
}

bool gzip_decompress(const std::string& in, std::string& out) {
    z_stream zs;
    std::memset(&zs, 0, sizeof(zs));
    if (inflateInit2(&zs, 15 + 16) != Z_OK) {
        return false;
    }

    zs.next_in = reinterpret_cast<Bytef*>(const_cast<char*>(in.data()));
    zs.avail_in = static_cast<uInt>(in.size());

    out.clear();
    char buffer[16384];
    int rc = Z_OK;
    do {
        zs.next_out = reinterpret_cast<Bytef*>(buffer);
        zs.avail_out = sizeof(buffer);
        rc = inflate(&zs, Z_NO_FLUSH);
        if (rc != Z_OK && rc != Z_STREAM_END) {
            inflateEnd(&zs);
            out.clear();
            return false;
        }
        out.append(buffer, sizeof(buffer) - zs.avail_out);
        if (rc == Z_OK && zs.avail_in == 0 && zs.avail_out != 0) {
            // Input exhausted before the gzip trailer
            inflateEnd(&zs);
            out.clear();
            return false;
        }
    } while (rc != Z_STREAM_END);

    inflateEnd(&zs);
    return true;
}
