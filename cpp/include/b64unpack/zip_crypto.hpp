#pragma once

#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

namespace b64unpack::zipcrypto {

using Bytes = std::vector<std::uint8_t>;

// PKWARE "traditional" stream cipher (APPNOTE 6.1).
class TraditionalCipher {
public:
    explicit TraditionalCipher(const std::string& password);

    std::uint8_t DecryptByte(std::uint8_t cipher);
    std::uint8_t EncryptByte(std::uint8_t plain);
    void Decrypt(std::uint8_t* data, std::size_t size);

private:
    void UpdateKeys(std::uint8_t plain);
    std::uint8_t KeystreamByte() const;

    std::uint32_t keys_[3];
};

// Key material for WinZip AE-1/AE-2 entries.
struct AesKeys {
    Bytes encryption_key;
    Bytes mac_key;
    Bytes verifier;
};

// Strength byte of the 0x9901 extra field: 1 = AES-128, 2 = AES-192, 3 = AES-256.
std::size_t AesKeyLength(std::uint8_t strength);
std::size_t AesSaltLength(std::uint8_t strength);

AesKeys DeriveAesKeys(const std::string& password, const Bytes& salt, std::uint8_t strength);

}  // namespace b64unpack::zipcrypto
