#pragma once

#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

namespace b64unpack::crypto {

using Bytes = std::vector<std::uint8_t>;

Bytes Pbkdf2HmacSha1(const std::string& password, const Bytes& salt, std::size_t iterations, std::size_t length);
Bytes HmacSha1(const Bytes& key, const std::uint8_t* data, std::size_t size);

// AES in WinZip's CTR flavour: 128-bit little-endian counter starting at 1.
// Key length selects AES-128/192/256. Encryption and decryption coincide.
Bytes WinZipAesCtr(const Bytes& key, const std::uint8_t* data, std::size_t size);

bool ConstantTimeEqual(const std::uint8_t* a, const std::uint8_t* b, std::size_t size);

}  // namespace b64unpack::crypto
