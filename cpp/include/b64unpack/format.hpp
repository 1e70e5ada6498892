#pragma once

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace b64unpack::format {

using Bytes = std::vector<std::uint8_t>;

enum class FormatTag {
    Unknown,
    Zip,
    Tar,
    TarGzip,
    TarBzip2,
    TarXz,
    Rar
};

bool HasZipSignature(const Bytes& data);
bool HasGzipSignature(const Bytes& data);
bool HasBzip2Signature(const Bytes& data);
bool HasXzSignature(const Bytes& data);
bool HasRarSignature(const Bytes& data);
bool HasUstarMagic(const Bytes& data);

// Classifies the payload by its leading signature (and "ustar" at offset
// 257). Compressed wrappers are only tagged as TAR variants when their
// decompressed prefix is a TAR header or a zero end-of-archive block, or
// when the prefix cannot be decompressed at all.
FormatTag Sniff(const Bytes& payload);

// A forced tag bypasses sniffing entirely.
FormatTag SniffOrForced(const Bytes& payload, std::optional<FormatTag> forced);

// Accepts zip, tar, tar.gz/tgz, tar.bz2/tbz2, tar.xz/txz, rar (any case).
std::optional<FormatTag> FormatFromFlag(const std::string& flag);
std::string_view FormatName(FormatTag tag);

// File name used when the decoded payload is persisted.
std::string ArchiveFileName(FormatTag tag);

}  // namespace b64unpack::format
