#include "b64unpack/crypto.hpp"

#include "b64unpack/errors.hpp"

#include <openssl/crypto.h>
#include <openssl/evp.h>
#include <openssl/hmac.h>

#include <algorithm>
#include <array>

namespace b64unpack::crypto {

namespace {

constexpr std::size_t kAesBlock = 16;
constexpr std::size_t kBlocksPerBatch = 4096;

void Ensure(bool ok, const char* message) {
    if (!ok) {
        throw Error(ErrorKind::CorruptArchive, message);
    }
}

const EVP_CIPHER* AesEcbForKey(std::size_t key_size) {
    switch (key_size) {
        case 16:
            return EVP_aes_128_ecb();
        case 24:
            return EVP_aes_192_ecb();
        case 32:
            return EVP_aes_256_ecb();
        default:
            throw Error(ErrorKind::CorruptArchive, "AES key must be 16, 24 or 32 bytes");
    }
}

void Increment(std::array<std::uint8_t, kAesBlock>& counter) {
    for (auto& byte : counter) {
        if (++byte != 0) {
            break;
        }
    }
}

}  // namespace

Bytes Pbkdf2HmacSha1(const std::string& password, const Bytes& salt, std::size_t iterations, std::size_t length) {
    Bytes out(length);
    Ensure(PKCS5_PBKDF2_HMAC(password.c_str(), static_cast<int>(password.size()), salt.data(),
                             static_cast<int>(salt.size()), static_cast<int>(iterations), EVP_sha1(),
                             static_cast<int>(out.size()), out.data()) == 1,
           "PBKDF2 failed");
    return out;
}

Bytes HmacSha1(const Bytes& key, const std::uint8_t* data, std::size_t size) {
    unsigned int out_len = EVP_MAX_MD_SIZE;
    Bytes out(out_len);
    if (!HMAC(EVP_sha1(), key.data(), static_cast<int>(key.size()), data, size, out.data(), &out_len)) {
        throw Error(ErrorKind::CorruptArchive, "HMAC-SHA1 failed");
    }
    out.resize(out_len);
    return out;
}

Bytes WinZipAesCtr(const Bytes& key, const std::uint8_t* data, std::size_t size) {
    const EVP_CIPHER* cipher = AesEcbForKey(key.size());
    Bytes out(size);
    EVP_CIPHER_CTX* ctx = EVP_CIPHER_CTX_new();
    if (!ctx) {
        throw Error(ErrorKind::CorruptArchive, "AES context allocation failed");
    }

    try {
        Ensure(EVP_EncryptInit_ex(ctx, cipher, nullptr, key.data(), nullptr) == 1, "AES init failed");
        Ensure(EVP_CIPHER_CTX_set_padding(ctx, 0) == 1, "AES padding setup failed");
        std::array<std::uint8_t, kAesBlock> counter{};
        Bytes counters;
        Bytes keystream;
        std::size_t offset = 0;
        while (offset < size) {
            std::size_t chunk = std::min(size - offset, kBlocksPerBatch * kAesBlock);
            std::size_t blocks = (chunk + kAesBlock - 1) / kAesBlock;
            counters.resize(blocks * kAesBlock);
            keystream.resize(blocks * kAesBlock);
            for (std::size_t b = 0; b < blocks; ++b) {
                Increment(counter);
                std::copy(counter.begin(), counter.end(), counters.begin() + static_cast<std::ptrdiff_t>(b * kAesBlock));
            }
            int out_len = 0;
            Ensure(EVP_EncryptUpdate(ctx, keystream.data(), &out_len, counters.data(),
                                     static_cast<int>(counters.size())) == 1,
                   "AES keystream generation failed");
            for (std::size_t i = 0; i < chunk; ++i) {
                out[offset + i] = static_cast<std::uint8_t>(data[offset + i] ^ keystream[i]);
            }
            offset += chunk;
        }
    } catch (...) {
        EVP_CIPHER_CTX_free(ctx);
        throw;
    }

    EVP_CIPHER_CTX_free(ctx);
    return out;
}

bool ConstantTimeEqual(const std::uint8_t* a, const std::uint8_t* b, std::size_t size) {
    return CRYPTO_memcmp(a, b, size) == 0;
}

}  // namespace b64unpack::crypto
