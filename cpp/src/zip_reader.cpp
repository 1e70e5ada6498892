#include "b64unpack/zip_reader.hpp"

#include "b64unpack/constants.hpp"
#include "b64unpack/crypto.hpp"
#include "b64unpack/decompress.hpp"
#include "b64unpack/errors.hpp"
#include "b64unpack/zip_crypto.hpp"

#include <algorithm>
#include <string>
#include <utility>

#include <zlib.h>

namespace b64unpack::archive {

namespace {

constexpr std::uint32_t kLocalHeaderSig = 0x04034b50u;
constexpr std::uint32_t kCentralHeaderSig = 0x02014b50u;
constexpr std::uint32_t kEocdSig = 0x06054b50u;
constexpr std::uint32_t kZip64EocdSig = 0x06064b50u;
constexpr std::uint32_t kZip64LocatorSig = 0x07064b50u;

constexpr std::size_t kLocalHeaderSize = 30;
constexpr std::size_t kCentralHeaderSize = 46;
constexpr std::size_t kZip64LocatorSize = 20;
constexpr std::size_t kZip64EocdSize = 56;

constexpr std::uint16_t kExtraZip64 = 0x0001;
constexpr std::uint16_t kExtraAes = 0x9901;

constexpr std::uint16_t kFlagEncrypted = 0x0001;
constexpr std::uint16_t kFlagDataDescriptor = 0x0008;
constexpr std::uint16_t kFlagStrongEncryption = 0x0040;

constexpr std::uint16_t kMethodStored = 0;
constexpr std::uint16_t kMethodDeflate = 8;
constexpr std::uint16_t kMethodBzip2 = 12;
constexpr std::uint16_t kMethodXz = 95;
constexpr std::uint16_t kMethodAes = 99;

constexpr std::uint8_t kHostUnix = 3;
constexpr std::uint32_t kUnixTypeMask = 0170000;
constexpr std::uint32_t kUnixSymlink = 0120000;
constexpr std::uint32_t kDosDirectoryAttr = 0x10;

[[noreturn]] void Corrupt(const std::string& what) {
    throw Error(ErrorKind::CorruptArchive, "Corrupt ZIP archive: " + what);
}

std::uint16_t ReadU16LE(const std::uint8_t* data) {
    return static_cast<std::uint16_t>(data[0] | (data[1] << 8));
}

std::uint32_t ReadU32LE(const std::uint8_t* data) {
    return static_cast<std::uint32_t>(data[0]) | (static_cast<std::uint32_t>(data[1]) << 8)
           | (static_cast<std::uint32_t>(data[2]) << 16) | (static_cast<std::uint32_t>(data[3]) << 24);
}

std::uint64_t ReadU64LE(const std::uint8_t* data) {
    return static_cast<std::uint64_t>(ReadU32LE(data))
           | (static_cast<std::uint64_t>(ReadU32LE(data + 4)) << 32);
}

bool Fits(std::uint64_t offset, std::uint64_t length, std::size_t total) {
    return offset <= total && length <= total - offset;
}

std::uint32_t Crc32(const Bytes& data) {
    uLong crc = crc32(0L, Z_NULL, 0);
    std::size_t offset = 0;
    while (offset < data.size()) {
        uInt chunk = static_cast<uInt>(std::min<std::size_t>(data.size() - offset, 1u << 30));
        crc = crc32(crc, data.data() + offset, chunk);
        offset += chunk;
    }
    return static_cast<std::uint32_t>(crc);
}

}  // namespace

ZipReader::ZipReader(Bytes payload, std::string password)
    : payload_(std::move(payload)), password_(std::move(password)) {
    ParseCentralDirectory();
}

std::size_t ZipReader::LocateEndOfCentralDirectory() const {
    const std::size_t size = payload_.size();
    if (size < constants::kZipEocdSize) {
        return std::string::npos;
    }
    std::size_t lowest = size > constants::kZipEocdSize + constants::kZipMaxCommentSize
                             ? size - constants::kZipEocdSize - constants::kZipMaxCommentSize
                             : 0;
    for (std::size_t pos = size - constants::kZipEocdSize + 1; pos-- > lowest;) {
        if (ReadU32LE(payload_.data() + pos) != kEocdSig) {
            continue;
        }
        std::uint16_t comment_len = ReadU16LE(payload_.data() + pos + 20);
        if (pos + constants::kZipEocdSize + comment_len <= size) {
            return pos;
        }
    }
    return std::string::npos;
}

void ZipReader::ParseExtraFields(const std::uint8_t* extra, std::size_t size, Record& record, bool need_usize,
                                 bool need_csize, bool need_offset) const {
    std::size_t pos = 0;
    while (pos + 4 <= size) {
        std::uint16_t id = ReadU16LE(extra + pos);
        std::uint16_t len = ReadU16LE(extra + pos + 2);
        const std::uint8_t* body = extra + pos + 4;
        if (pos + 4 + len > size) {
            Corrupt("extra field overruns its header");
        }
        if (id == kExtraZip64) {
            std::size_t cursor = 0;
            auto next = [&](std::uint64_t& field) {
                if (cursor + 8 > len) {
                    Corrupt("truncated ZIP64 extra field");
                }
                field = ReadU64LE(body + cursor);
                cursor += 8;
            };
            if (need_usize) {
                next(record.uncompressed_size);
            }
            if (need_csize) {
                next(record.compressed_size);
            }
            if (need_offset) {
                next(record.local_offset);
            }
        } else if (id == kExtraAes) {
            if (len < 7 || body[2] != 'A' || body[3] != 'E') {
                Corrupt("malformed AES extra field");
            }
            record.aes = true;
            record.aes_version = ReadU16LE(body);
            record.aes_strength = body[4];
            record.aes_method = ReadU16LE(body + 5);
        }
        pos += 4 + len;
    }
}

void ZipReader::ParseCentralDirectory() {
    std::size_t eocd = LocateEndOfCentralDirectory();
    if (eocd == std::string::npos) {
        if (!format::HasZipSignature(payload_)) {
            throw Error(ErrorKind::FormatMismatch, "Data is not a ZIP archive");
        }
        Corrupt("end of central directory not found");
    }
    const std::uint8_t* end = payload_.data() + eocd;
    std::uint64_t total_entries = ReadU16LE(end + 10);
    std::uint64_t cd_size = ReadU32LE(end + 12);
    std::uint64_t cd_offset = ReadU32LE(end + 16);

    if (total_entries == 0xFFFF || cd_size == 0xFFFFFFFFu || cd_offset == 0xFFFFFFFFu) {
        if (eocd >= kZip64LocatorSize && ReadU32LE(end - kZip64LocatorSize) == kZip64LocatorSig) {
            std::uint64_t z64_offset = ReadU64LE(end - kZip64LocatorSize + 8);
            if (!Fits(z64_offset, kZip64EocdSize, payload_.size())
                || ReadU32LE(payload_.data() + z64_offset) != kZip64EocdSig) {
                Corrupt("ZIP64 end of central directory record is missing");
            }
            const std::uint8_t* z64 = payload_.data() + z64_offset;
            total_entries = ReadU64LE(z64 + 32);
            cd_size = ReadU64LE(z64 + 40);
            cd_offset = ReadU64LE(z64 + 48);
        }
    }

    if (!Fits(cd_offset, cd_size, payload_.size())) {
        Corrupt("central directory lies outside the archive");
    }
    if (total_entries > cd_size / kCentralHeaderSize) {
        Corrupt("entry count does not fit the central directory");
    }

    records_.reserve(static_cast<std::size_t>(total_entries));
    std::size_t pos = static_cast<std::size_t>(cd_offset);
    const std::size_t cd_end = static_cast<std::size_t>(cd_offset + cd_size);
    for (std::uint64_t i = 0; i < total_entries; ++i) {
        if (pos + kCentralHeaderSize > cd_end || ReadU32LE(payload_.data() + pos) != kCentralHeaderSig) {
            Corrupt("bad central directory header for entry " + std::to_string(i));
        }
        const std::uint8_t* hdr = payload_.data() + pos;
        Record record;
        record.version_made_by = ReadU16LE(hdr + 4);
        record.flags = ReadU16LE(hdr + 8);
        record.method = ReadU16LE(hdr + 10);
        record.dos_time = ReadU16LE(hdr + 12);
        record.crc = ReadU32LE(hdr + 16);
        record.compressed_size = ReadU32LE(hdr + 20);
        record.uncompressed_size = ReadU32LE(hdr + 24);
        std::uint16_t name_len = ReadU16LE(hdr + 28);
        std::uint16_t extra_len = ReadU16LE(hdr + 30);
        std::uint16_t comment_len = ReadU16LE(hdr + 32);
        record.external_attrs = ReadU32LE(hdr + 38);
        record.local_offset = ReadU32LE(hdr + 42);

        std::size_t variable = static_cast<std::size_t>(name_len) + extra_len + comment_len;
        if (pos + kCentralHeaderSize + variable > cd_end) {
            Corrupt("central directory entry " + std::to_string(i) + " is truncated");
        }
        record.name.assign(reinterpret_cast<const char*>(hdr + kCentralHeaderSize), name_len);
        ParseExtraFields(hdr + kCentralHeaderSize + name_len, extra_len, record,
                         record.uncompressed_size == 0xFFFFFFFFu, record.compressed_size == 0xFFFFFFFFu,
                         record.local_offset == 0xFFFFFFFFu);
        records_.push_back(std::move(record));
        pos += kCentralHeaderSize + variable;
    }
}

std::vector<ArchiveEntry> ZipReader::ListEntries() {
    std::vector<ArchiveEntry> entries;
    entries.reserve(records_.size());
    for (std::size_t i = 0; i < records_.size(); ++i) {
        const Record& record = records_[i];
        ArchiveEntry entry;
        entry.path = record.name;
        entry.size = record.uncompressed_size;
        entry.index = i;
        entry.encrypted = (record.flags & kFlagEncrypted) != 0;
        std::uint8_t host = static_cast<std::uint8_t>(record.version_made_by >> 8);
        bool trailing_slash = !record.name.empty() && (record.name.back() == '/' || record.name.back() == '\\');
        if (host == kHostUnix && ((record.external_attrs >> 16) & kUnixTypeMask) == kUnixSymlink) {
            entry.kind = EntryKind::Unsupported;
            entry.note = "symbolic link";
        } else if (trailing_slash || (host != kHostUnix && (record.external_attrs & kDosDirectoryAttr))) {
            entry.kind = EntryKind::Directory;
            entry.size = 0;
        }
        entries.push_back(std::move(entry));
    }
    return entries;
}

std::size_t ZipReader::LocalDataOffset(const Record& record) const {
    if (!Fits(record.local_offset, kLocalHeaderSize, payload_.size())
        || ReadU32LE(payload_.data() + record.local_offset) != kLocalHeaderSig) {
        Corrupt("bad local header for '" + record.name + "'");
    }
    const std::uint8_t* local = payload_.data() + record.local_offset;
    std::uint64_t data_offset = record.local_offset + kLocalHeaderSize + ReadU16LE(local + 26)
                                + ReadU16LE(local + 28);
    if (!Fits(data_offset, record.compressed_size, payload_.size())) {
        Corrupt("data for '" + record.name + "' runs past the end of the archive");
    }
    return static_cast<std::size_t>(data_offset);
}

Bytes ZipReader::Inflate(std::uint16_t method, const std::uint8_t* data, std::size_t size,
                         path_guard::SizeBudget& budget) const {
    switch (method) {
        case kMethodStored:
            if (size > budget.Remaining()) {
                throw Error(ErrorKind::SizeLimitExceeded,
                            "Extracted data exceeds the limit of " + std::to_string(budget.Limit()) + " bytes");
            }
            return Bytes(data, data + size);
        case kMethodDeflate:
            return decompress::Decompress(decompress::Codec::Deflate, data, size, budget.Remaining());
        case kMethodBzip2:
            return decompress::Decompress(decompress::Codec::Bzip2, data, size, budget.Remaining());
        case kMethodXz:
            return decompress::Decompress(decompress::Codec::Xz, data, size, budget.Remaining());
        default:
            throw Error(ErrorKind::UnsupportedFormat,
                        "Unsupported ZIP compression method " + std::to_string(method));
    }
}

Bytes ZipReader::DecryptTraditional(const Record& record, const std::uint8_t* data, std::size_t size) const {
    if (size < constants::kZipTraditionalHeaderSize) {
        Corrupt("encryption header for '" + record.name + "' is truncated");
    }
    zipcrypto::TraditionalCipher cipher(password_);
    std::uint8_t check = 0;
    for (std::size_t i = 0; i < constants::kZipTraditionalHeaderSize; ++i) {
        check = cipher.DecryptByte(data[i]);
    }
    std::uint8_t expected = (record.flags & kFlagDataDescriptor)
                                ? static_cast<std::uint8_t>(record.dos_time >> 8)
                                : static_cast<std::uint8_t>(record.crc >> 24);
    if (check != expected) {
        throw Error(ErrorKind::PasswordIncorrect, "Incorrect password for '" + record.name + "'");
    }
    Bytes plain(data + constants::kZipTraditionalHeaderSize, data + size);
    cipher.Decrypt(plain.data(), plain.size());
    return plain;
}

Bytes ZipReader::DecryptAes(const Record& record, const std::uint8_t* data, std::size_t size) const {
    std::size_t salt_len = zipcrypto::AesSaltLength(record.aes_strength);
    std::size_t overhead = salt_len + constants::kZipAesVerifierSize + constants::kZipAesAuthCodeSize;
    if (size < overhead) {
        Corrupt("AES envelope for '" + record.name + "' is truncated");
    }
    Bytes salt(data, data + salt_len);
    zipcrypto::AesKeys keys = zipcrypto::DeriveAesKeys(password_, salt, record.aes_strength);
    if (!crypto::ConstantTimeEqual(keys.verifier.data(), data + salt_len, constants::kZipAesVerifierSize)) {
        throw Error(ErrorKind::PasswordIncorrect, "Incorrect password for '" + record.name + "'");
    }
    const std::uint8_t* cipher_text = data + salt_len + constants::kZipAesVerifierSize;
    std::size_t cipher_len = size - overhead;
    Bytes mac = crypto::HmacSha1(keys.mac_key, cipher_text, cipher_len);
    if (!crypto::ConstantTimeEqual(mac.data(), cipher_text + cipher_len, constants::kZipAesAuthCodeSize)) {
        Corrupt("authentication code mismatch for '" + record.name + "'");
    }
    return crypto::WinZipAesCtr(keys.encryption_key, cipher_text, cipher_len);
}

Bytes ZipReader::ReadEntry(const ArchiveEntry& entry, path_guard::SizeBudget& budget) {
    if (entry.index >= records_.size()) {
        throw Error(ErrorKind::CorruptArchive, "Unknown ZIP entry index");
    }
    const Record& record = records_[entry.index];
    if (record.flags & kFlagStrongEncryption) {
        throw Error(ErrorKind::UnsupportedFormat, "PKWARE strong encryption is not supported ('" + record.name + "')");
    }
    std::size_t offset = LocalDataOffset(record);
    const std::uint8_t* data = payload_.data() + offset;
    std::size_t size = static_cast<std::size_t>(record.compressed_size);

    bool encrypted = (record.flags & kFlagEncrypted) != 0;
    if (encrypted && password_.empty()) {
        throw Error(ErrorKind::PasswordRequired, "'" + record.name + "' is encrypted and no password was supplied");
    }

    std::uint16_t method = record.method;
    bool check_crc = true;
    Bytes decrypted;
    if (encrypted && record.aes) {
        if (record.method != kMethodAes) {
            Corrupt("AES extra field on a non-AES entry '" + record.name + "'");
        }
        decrypted = DecryptAes(record, data, size);
        method = record.aes_method;
        // AE-2 stores no CRC; the HMAC already authenticated the data.
        check_crc = record.aes_version == 1;
    } else if (encrypted) {
        decrypted = DecryptTraditional(record, data, size);
    }
    if (encrypted) {
        data = decrypted.data();
        size = decrypted.size();
    }

    Bytes out;
    try {
        out = Inflate(method, data, size, budget);
    } catch (const Error& err) {
        if (encrypted && !record.aes && err.kind() == ErrorKind::CorruptArchive) {
            throw Error(ErrorKind::PasswordIncorrect, "Incorrect password for '" + record.name + "'");
        }
        throw;
    }
    bool size_ok = out.size() == record.uncompressed_size;
    bool crc_ok = !check_crc || Crc32(out) == record.crc;
    if (!size_ok || !crc_ok) {
        // The traditional check byte passes one wrong password in 256.
        if (encrypted && !record.aes) {
            throw Error(ErrorKind::PasswordIncorrect, "Incorrect password for '" + record.name + "'");
        }
        Corrupt(std::string(size_ok ? "CRC" : "size") + " mismatch for '" + record.name + "'");
    }
    budget.Charge(out.size());
    return out;
}

}  // namespace b64unpack::archive
