#pragma once

#include <cstddef>
#include <cstdint>
#include <optional>
#include <vector>

namespace b64unpack::decompress {

using Bytes = std::vector<std::uint8_t>;

enum class Codec {
    Gzip,
    Bzip2,
    Xz,
    Deflate  // raw deflate, as stored inside ZIP entries
};

// Decompresses a complete stream (concatenated gzip/bzip2/xz members are
// joined). Throws Error(SizeLimitExceeded) once the output would pass
// `limit` and Error(CorruptArchive) on damaged or truncated input.
Bytes Decompress(Codec codec, const std::uint8_t* data, std::size_t size, std::uint64_t limit);

inline Bytes Decompress(Codec codec, const Bytes& data, std::uint64_t limit) {
    return Decompress(codec, data.data(), data.size(), limit);
}

// First `max_out` bytes of the decompressed stream. A stream that ends
// cleanly before `max_out` yields what it produced; a stream that fails
// before producing `max_out` bytes yields nullopt.
std::optional<Bytes> DecompressPrefix(Codec codec, const Bytes& data, std::size_t max_out);

}  // namespace b64unpack::decompress
