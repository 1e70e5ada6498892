#pragma once

#include <cstdint>
#include <string>
#include <string_view>
#include <vector>

namespace b64unpack::base64 {

using Bytes = std::vector<std::uint8_t>;

std::string Encode(const Bytes& data);

// Strips data-URI / "base64:" prefixes and every character outside the
// standard alphabet (A-Za-z0-9+/=).
std::string Normalize(std::string_view text);

// Strict decode of already-clean, padded text. Sets *ok to false and returns
// an empty buffer on any invalid character or misplaced padding.
Bytes Decode(const std::string& input, bool* ok = nullptr);

// Normalize, pad to a multiple of four, decode. Throws Error(InvalidEncoding).
Bytes DecodePayload(std::string_view text);

bool IsLikelyBase64(std::string_view input);

}  // namespace b64unpack::base64
