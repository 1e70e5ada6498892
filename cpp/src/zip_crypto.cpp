#include "b64unpack/zip_crypto.hpp"

#include "b64unpack/constants.hpp"
#include "b64unpack/crypto.hpp"
#include "b64unpack/errors.hpp"

#include <zlib.h>

namespace b64unpack::zipcrypto {

namespace {

std::uint32_t Crc32Update(std::uint32_t crc, std::uint8_t byte) {
    const z_crc_t* table = get_crc_table();
    return static_cast<std::uint32_t>(table[(crc ^ byte) & 0xFF]) ^ (crc >> 8);
}

}  // namespace

TraditionalCipher::TraditionalCipher(const std::string& password)
    : keys_{0x12345678u, 0x23456789u, 0x34567890u} {
    for (unsigned char ch : password) {
        UpdateKeys(ch);
    }
}

void TraditionalCipher::UpdateKeys(std::uint8_t plain) {
    keys_[0] = Crc32Update(keys_[0], plain);
    keys_[1] = (keys_[1] + (keys_[0] & 0xFF)) * 134775813u + 1;
    keys_[2] = Crc32Update(keys_[2], static_cast<std::uint8_t>(keys_[1] >> 24));
}

std::uint8_t TraditionalCipher::KeystreamByte() const {
    std::uint16_t temp = static_cast<std::uint16_t>((keys_[2] & 0xFFFF) | 2);
    return static_cast<std::uint8_t>((temp * (temp ^ 1)) >> 8);
}

std::uint8_t TraditionalCipher::DecryptByte(std::uint8_t cipher) {
    std::uint8_t plain = static_cast<std::uint8_t>(cipher ^ KeystreamByte());
    UpdateKeys(plain);
    return plain;
}

std::uint8_t TraditionalCipher::EncryptByte(std::uint8_t plain) {
    std::uint8_t cipher = static_cast<std::uint8_t>(plain ^ KeystreamByte());
    UpdateKeys(plain);
    return cipher;
}

void TraditionalCipher::Decrypt(std::uint8_t* data, std::size_t size) {
    for (std::size_t i = 0; i < size; ++i) {
        data[i] = DecryptByte(data[i]);
    }
}

std::size_t AesKeyLength(std::uint8_t strength) {
    if (strength < 1 || strength > 3) {
        throw Error(ErrorKind::CorruptArchive, "Invalid AES strength " + std::to_string(strength));
    }
    return 8 + 8 * static_cast<std::size_t>(strength);
}

std::size_t AesSaltLength(std::uint8_t strength) {
    return AesKeyLength(strength) / 2;
}

AesKeys DeriveAesKeys(const std::string& password, const Bytes& salt, std::uint8_t strength) {
    std::size_t key_len = AesKeyLength(strength);
    Bytes derived = crypto::Pbkdf2HmacSha1(password, salt, constants::kZipAesIterations,
                                           2 * key_len + constants::kZipAesVerifierSize);
    AesKeys keys;
    keys.encryption_key.assign(derived.begin(), derived.begin() + static_cast<std::ptrdiff_t>(key_len));
    keys.mac_key.assign(derived.begin() + static_cast<std::ptrdiff_t>(key_len),
                        derived.begin() + static_cast<std::ptrdiff_t>(2 * key_len));
    keys.verifier.assign(derived.begin() + static_cast<std::ptrdiff_t>(2 * key_len), derived.end());
    return keys;
}

}  // namespace b64unpack::zipcrypto
