#pragma once

#include <cstddef>
#include <cstdint>
#include <string_view>

#include "b64unpack/env.hpp"

namespace b64unpack::constants {

inline constexpr std::uint64_t kDefaultMaxTotalBytes = 512ull * 1024ull * 1024ull;
inline constexpr std::size_t kDefaultMaxEntries = 100000;

// Floor for the decompressed TAR stream cap, so tiny ceilings still admit headers.
inline constexpr std::uint64_t kMinStreamBytes = 1u << 20;

inline constexpr std::size_t kTarBlockSize = 512;
inline constexpr std::size_t kTarMagicOffset = 257;
inline constexpr std::size_t kSniffPrefixBytes = 512;

inline constexpr std::size_t kZipEocdSize = 22;
inline constexpr std::size_t kZipMaxCommentSize = 0xFFFF;
inline constexpr std::uint32_t kZipAesIterations = 1000;
inline constexpr std::size_t kZipAesVerifierSize = 2;
inline constexpr std::size_t kZipAesAuthCodeSize = 10;
inline constexpr std::size_t kZipTraditionalHeaderSize = 12;

inline constexpr std::string_view kExtractedDirName = "extracted";
inline constexpr std::string_view kDefaultOutputDir = "extracted_files";

inline constexpr std::string_view kEnvMaxBytes = "B64UNPACK_MAX_BYTES";
inline constexpr std::string_view kEnvMaxEntries = "B64UNPACK_MAX_ENTRIES";
inline constexpr std::string_view kEnvInteresting = "B64UNPACK_INTERESTING";
inline constexpr std::string_view kEnvNoColor = "B64UNPACK_NO_COLOR";

inline std::uint64_t MaxTotalBytes() {
    return b64unpack::env::GetUint(kEnvMaxBytes, kDefaultMaxTotalBytes);
}

inline std::size_t MaxEntries() {
    return static_cast<std::size_t>(b64unpack::env::GetUint(kEnvMaxEntries, kDefaultMaxEntries));
}

}  // namespace b64unpack::constants
