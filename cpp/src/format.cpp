#include "b64unpack/format.hpp"

#include "b64unpack/constants.hpp"
#include "b64unpack/decompress.hpp"
#include "b64unpack/tar_reader.hpp"

#include <algorithm>
#include <cctype>
#include <cstring>

namespace b64unpack::format {

namespace {

bool StartsWith(const Bytes& data, const char* signature, std::size_t size) {
    return data.size() >= size && std::memcmp(data.data(), signature, size) == 0;
}

std::string ToLower(std::string value) {
    std::transform(value.begin(), value.end(), value.begin(), [](unsigned char ch) {
        return static_cast<char>(std::tolower(ch));
    });
    return value;
}

// An archive with no members is nothing but zero-filled end blocks.
bool IsEndOfArchiveBlock(const Bytes& prefix) {
    if (prefix.size() < constants::kTarBlockSize) {
        return false;
    }
    return std::all_of(prefix.begin(), prefix.begin() + constants::kTarBlockSize,
                       [](std::uint8_t byte) { return byte == 0; });
}

bool PrefixIsTar(const Bytes& prefix) {
    return HasUstarMagic(prefix) || archive::LooksLikeTarHeader(prefix.data(), prefix.size())
           || IsEndOfArchiveBlock(prefix);
}

FormatTag SniffCompressed(const Bytes& payload, decompress::Codec codec, FormatTag tag) {
    auto prefix = decompress::DecompressPrefix(codec, payload, constants::kSniffPrefixBytes);
    if (!prefix) {
        return tag;
    }
    return PrefixIsTar(*prefix) ? tag : FormatTag::Unknown;
}

}  // namespace

bool HasZipSignature(const Bytes& data) {
    return StartsWith(data, "PK\x03\x04", 4) || StartsWith(data, "PK\x05\x06", 4)
           || StartsWith(data, "PK\x07\x08", 4);
}

bool HasGzipSignature(const Bytes& data) {
    return StartsWith(data, "\x1F\x8B", 2);
}

bool HasBzip2Signature(const Bytes& data) {
    return StartsWith(data, "BZh", 3);
}

bool HasXzSignature(const Bytes& data) {
    return StartsWith(data, "\xFD" "7zXZ", 5);
}

bool HasRarSignature(const Bytes& data) {
    return StartsWith(data, "Rar!", 4);
}

bool HasUstarMagic(const Bytes& data) {
    constexpr std::size_t offset = constants::kTarMagicOffset;
    return data.size() >= offset + 5 && std::memcmp(data.data() + offset, "ustar", 5) == 0;
}

FormatTag Sniff(const Bytes& payload) {
    if (payload.empty()) {
        return FormatTag::Unknown;
    }
    if (HasZipSignature(payload)) {
        return FormatTag::Zip;
    }
    if (HasGzipSignature(payload)) {
        return SniffCompressed(payload, decompress::Codec::Gzip, FormatTag::TarGzip);
    }
    if (HasBzip2Signature(payload)) {
        return SniffCompressed(payload, decompress::Codec::Bzip2, FormatTag::TarBzip2);
    }
    if (HasXzSignature(payload)) {
        return SniffCompressed(payload, decompress::Codec::Xz, FormatTag::TarXz);
    }
    if (HasRarSignature(payload)) {
        return FormatTag::Rar;
    }
    if (HasUstarMagic(payload)) {
        return FormatTag::Tar;
    }
    if (archive::LooksLikeTarHeader(payload.data(), payload.size())) {
        return FormatTag::Tar;
    }
    return FormatTag::Unknown;
}

FormatTag SniffOrForced(const Bytes& payload, std::optional<FormatTag> forced) {
    if (forced) {
        return *forced;
    }
    return Sniff(payload);
}

std::optional<FormatTag> FormatFromFlag(const std::string& flag) {
    std::string lower = ToLower(flag);
    if (lower == "zip") {
        return FormatTag::Zip;
    }
    if (lower == "tar") {
        return FormatTag::Tar;
    }
    if (lower == "tar.gz" || lower == "tgz") {
        return FormatTag::TarGzip;
    }
    if (lower == "tar.bz2" || lower == "tbz2") {
        return FormatTag::TarBzip2;
    }
    if (lower == "tar.xz" || lower == "txz") {
        return FormatTag::TarXz;
    }
    if (lower == "rar") {
        return FormatTag::Rar;
    }
    return std::nullopt;
}

std::string_view FormatName(FormatTag tag) {
    switch (tag) {
        case FormatTag::Zip:
            return "zip";
        case FormatTag::Tar:
            return "tar";
        case FormatTag::TarGzip:
            return "tar.gz";
        case FormatTag::TarBzip2:
            return "tar.bz2";
        case FormatTag::TarXz:
            return "tar.xz";
        case FormatTag::Rar:
            return "rar";
        case FormatTag::Unknown:
            break;
    }
    return "unknown";
}

std::string ArchiveFileName(FormatTag tag) {
    if (tag == FormatTag::Unknown) {
        return "decoded_data.bin";
    }
    return "decoded_archive." + std::string(FormatName(tag));
}

}  // namespace b64unpack::format
