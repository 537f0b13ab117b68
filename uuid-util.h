#pragma once

#include <string>

// Version-4 UUID from OpenSSL's CSPRNG (connect ids, request ids).
// Throws BridgeError(Protocol) if the generator is not seeded.
std::string generate_uuid();

// "<prefix>-<uuid>", used for stream session and run ids so logs show what an id names
std::string generate_id(const std::string& prefix);

// "YYYY-mm-dd HH:MM:SS.mmm" in UTC; sorts in time order as text
std::string get_current_timestamp();
