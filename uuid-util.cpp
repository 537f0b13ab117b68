#include "uuid-util.h"
#include "bridge-errors.h"

#include <openssl/rand.h>

#include <chrono>
#include <cstdio>
#include <ctime>

std::string generate_uuid() {
    unsigned char bytes[16];
    if (RAND_bytes(bytes, sizeof(bytes)) != 1) {
        throw BridgeError(ErrorKind::Protocol, "RAND_bytes failed to produce an id");
    }
    bytes[6] = static_cast<unsigned char>((bytes[6] & 0x0F) | 0x40); // version 4
    bytes[8] = static_cast<unsigned char>((bytes[8] & 0x3F) | 0x80); // RFC 4122 variant

    static const char hex[] = "0123456789abcdef";
    std::string out;
    out.reserve(36);
    for (int i = 0; i < 16; ++i) {
        if (i == 4 || i == 6 || i == 8 || i == 10) out.push_back('-');
        out.push_back(hex[bytes[i] >> 4]);
        out.push_back(hex[bytes[i] & 0x0F]);
    }
    return out;
}

std::string generate_id(const std::string& prefix) {
    if (prefix.empty()) return generate_uuid();
    return prefix + "-" + generate_uuid();
}

std::string get_current_timestamp() {
    auto now = std::chrono::system_clock::now();
    auto time_t = std::chrono::system_clock::to_time_t(now);
    auto millis = std::chrono::duration_cast<std::chrono::milliseconds>(now.time_since_epoch()).count() % 1000;

    std::tm tm_utc{};
    gmtime_r(&time_t, &tm_utc);
    char buffer[32];
    size_t n = std::strftime(buffer, sizeof(buffer), "%Y-%m-%d %H:%M:%S", &tm_utc);
    std::snprintf(buffer + n, sizeof(buffer) - n, ".%03d", static_cast<int>(millis));
    return buffer;
}
