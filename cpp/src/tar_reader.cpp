#include "b64unpack/tar_reader.hpp"

#include "b64unpack/constants.hpp"
#include "b64unpack/errors.hpp"

#include <cstring>
#include <optional>
#include <string>
#include <utility>

namespace b64unpack::archive {

namespace {

using constants::kTarBlockSize;

struct TarHeader {
    char name[100];
    char mode[8];
    char uid[8];
    char gid[8];
    char size[12];
    char mtime[12];
    char chksum[8];
    char typeflag;
    char linkname[100];
    char magic[6];
    char version[2];
    char uname[32];
    char gname[32];
    char devmajor[8];
    char devminor[8];
    char prefix[155];
    char pad[12];
};

static_assert(sizeof(TarHeader) == kTarBlockSize, "Tar header must be 512 bytes");

[[noreturn]] void Corrupt(const std::string& what) {
    throw Error(ErrorKind::CorruptArchive, "Corrupt TAR archive: " + what);
}

std::uint64_t ParseOctal(const char* data, std::size_t size) {
    std::uint64_t value = 0;
    for (std::size_t i = 0; i < size; ++i) {
        char ch = data[i];
        if (ch == '\0' || ch == ' ') {
            continue;
        }
        if (ch < '0' || ch > '7') {
            break;
        }
        value = (value << 3) + static_cast<std::uint64_t>(ch - '0');
    }
    return value;
}

// GNU base-256 extension: high bit of the first byte set.
std::uint64_t ParseNumeric(const char* data, std::size_t size) {
    const auto* bytes = reinterpret_cast<const unsigned char*>(data);
    if ((bytes[0] & 0x80) == 0) {
        return ParseOctal(data, size);
    }
    if (bytes[0] & 0x40) {
        Corrupt("negative numeric field");
    }
    std::uint64_t value = bytes[0] & 0x3F;
    for (std::size_t i = 1; i < size; ++i) {
        if (value >> 56) {
            Corrupt("numeric field overflow");
        }
        value = (value << 8) | bytes[i];
    }
    return value;
}

bool IsAllZero(const std::uint8_t* block, std::size_t size) {
    for (std::size_t i = 0; i < size; ++i) {
        if (block[i] != 0) {
            return false;
        }
    }
    return true;
}

std::string FieldString(const char* field, std::size_t size) {
    std::size_t len = 0;
    while (len < size && field[len] != '\0') {
        ++len;
    }
    return std::string(field, len);
}

bool IsUstar(const TarHeader& header) {
    return std::memcmp(header.magic, "ustar", 5) == 0 && header.magic[5] == '\0';
}

std::string ExtractName(const TarHeader& header) {
    std::string name = FieldString(header.name, sizeof(header.name));
    if (IsUstar(header)) {
        std::string prefix = FieldString(header.prefix, sizeof(header.prefix));
        if (!prefix.empty()) {
            return prefix + "/" + name;
        }
    }
    return name;
}

std::string DescribeType(char type) {
    switch (type) {
        case '1':
            return "hard link";
        case '2':
            return "symbolic link";
        case '3':
            return "character device";
        case '4':
            return "block device";
        case '6':
            return "FIFO";
        default:
            return std::string("entry type '") + type + "'";
    }
}

struct PaxOverrides {
    std::optional<std::string> path;
    std::optional<std::uint64_t> size;
};

// Records are "<len> <key>=<value>\n" where <len> counts the whole record.
PaxOverrides ParsePax(const std::uint8_t* data, std::size_t size) {
    PaxOverrides out;
    std::size_t pos = 0;
    while (pos < size) {
        if (data[pos] == '\0') {
            break;
        }
        std::size_t len = 0;
        std::size_t cursor = pos;
        while (cursor < size && data[cursor] >= '0' && data[cursor] <= '9') {
            len = len * 10 + static_cast<std::size_t>(data[cursor] - '0');
            if (len > size) {
                Corrupt("pax record length out of range");
            }
            ++cursor;
        }
        if (cursor >= size || data[cursor] != ' ' || len == 0 || pos + len > size
            || data[pos + len - 1] != '\n') {
            Corrupt("malformed pax record");
        }
        std::string record(reinterpret_cast<const char*>(data + cursor + 1), pos + len - 1 - (cursor + 1));
        std::size_t eq = record.find('=');
        if (eq == std::string::npos) {
            Corrupt("pax record without '='");
        }
        std::string key = record.substr(0, eq);
        std::string value = record.substr(eq + 1);
        if (key == "path") {
            out.path = value;
        } else if (key == "size") {
            try {
                out.size = static_cast<std::uint64_t>(std::stoull(value));
            } catch (const std::exception&) {
                Corrupt("invalid pax size");
            }
        }
        pos += len;
    }
    return out;
}

}  // namespace

bool LooksLikeTarHeader(const std::uint8_t* block, std::size_t size) {
    if (size < kTarBlockSize || IsAllZero(block, kTarBlockSize)) {
        return false;
    }
    TarHeader header{};
    std::memcpy(&header, block, sizeof(header));
    std::uint64_t stored = ParseOctal(header.chksum, sizeof(header.chksum));
    std::memset(header.chksum, ' ', sizeof(header.chksum));
    std::uint64_t unsigned_sum = 0;
    std::int64_t signed_sum = 0;
    const auto* bytes = reinterpret_cast<const unsigned char*>(&header);
    for (std::size_t i = 0; i < sizeof(TarHeader); ++i) {
        unsigned_sum += bytes[i];
        signed_sum += static_cast<signed char>(bytes[i]);
    }
    return stored == unsigned_sum || static_cast<std::int64_t>(stored) == signed_sum;
}

TarReader::TarReader(Bytes stream) : stream_(std::move(stream)) {
    Index();
}

void TarReader::Index() {
    std::size_t offset = 0;
    std::optional<std::string> long_name;
    PaxOverrides pax;
    while (offset + kTarBlockSize <= stream_.size()) {
        const std::uint8_t* block = stream_.data() + offset;
        if (IsAllZero(block, kTarBlockSize)) {
            return;
        }
        if (!LooksLikeTarHeader(block, kTarBlockSize)) {
            if (offset == 0) {
                throw Error(ErrorKind::FormatMismatch, "Data is not a TAR archive (bad header checksum)");
            }
            Corrupt("bad header checksum at offset " + std::to_string(offset));
        }
        TarHeader header{};
        std::memcpy(&header, block, sizeof(header));

        std::uint64_t size = ParseNumeric(header.size, sizeof(header.size));
        std::size_t data_offset = offset + kTarBlockSize;
        char type = header.typeflag;

        if (type == 'L' || type == 'K' || type == 'x' || type == 'g') {
            if (size > stream_.size() - data_offset) {
                Corrupt("truncated extended header");
            }
            const std::uint8_t* data = stream_.data() + data_offset;
            if (type == 'L') {
                long_name = FieldString(reinterpret_cast<const char*>(data), static_cast<std::size_t>(size));
            } else if (type == 'x') {
                pax = ParsePax(data, static_cast<std::size_t>(size));
            }
            std::uint64_t padded = (size + kTarBlockSize - 1) / kTarBlockSize * kTarBlockSize;
            offset = data_offset + static_cast<std::size_t>(padded);
            continue;
        }

        if (pax.size) {
            size = *pax.size;
        }
        if (size > stream_.size() - data_offset) {
            Corrupt("entry data is truncated");
        }

        ArchiveEntry entry;
        if (pax.path) {
            entry.path = *pax.path;
        } else if (long_name) {
            entry.path = *long_name;
        } else {
            entry.path = ExtractName(header);
        }
        long_name.reset();
        pax = PaxOverrides{};
        if (entry.path.empty()) {
            Corrupt("entry with an empty name at offset " + std::to_string(offset));
        }

        if (type == '5' || ((type == '\0' || type == '0') && entry.path.back() == '/')) {
            entry.kind = EntryKind::Directory;
            entry.size = 0;
        } else if (type == '0' || type == '\0' || type == '7') {
            entry.kind = EntryKind::File;
            entry.size = size;
        } else {
            entry.kind = EntryKind::Unsupported;
            entry.size = size;
            entry.note = DescribeType(type);
        }
        entry.index = entries_.size();
        entries_.push_back(entry);
        members_.push_back({data_offset, entry.kind == EntryKind::File ? size : 0});

        std::uint64_t padded = (size + kTarBlockSize - 1) / kTarBlockSize * kTarBlockSize;
        if (padded > stream_.size() - data_offset) {
            // Final member without block padding.
            offset = stream_.size();
        } else {
            offset = data_offset + static_cast<std::size_t>(padded);
        }
    }
    if (offset < stream_.size() && !IsAllZero(stream_.data() + offset, stream_.size() - offset)) {
        if (offset == 0) {
            throw Error(ErrorKind::FormatMismatch, "Data is too short to be a TAR archive");
        }
        Corrupt("trailing partial block");
    }
}

std::vector<ArchiveEntry> TarReader::ListEntries() {
    return entries_;
}

Bytes TarReader::ReadEntry(const ArchiveEntry& entry, path_guard::SizeBudget& budget) {
    if (entry.index >= members_.size()) {
        throw Error(ErrorKind::CorruptArchive, "Unknown TAR entry index");
    }
    const Member& member = members_[entry.index];
    budget.Charge(member.size);
    auto begin = stream_.begin() + static_cast<std::ptrdiff_t>(member.data_offset);
    return Bytes(begin, begin + static_cast<std::ptrdiff_t>(member.size));
}

}  // namespace b64unpack::archive
