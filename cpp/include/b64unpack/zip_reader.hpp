#pragma once

#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

#include "b64unpack/archive.hpp"

namespace b64unpack::archive {

// ZIP / ZIP64 reader driven by the central directory. Supports stored,
// deflate, bzip2 and xz members with traditional PKWARE or WinZip AES
// encryption.
class ZipReader : public ArchiveReader {
public:
    ZipReader(Bytes payload, std::string password);

    std::vector<ArchiveEntry> ListEntries() override;
    Bytes ReadEntry(const ArchiveEntry& entry, path_guard::SizeBudget& budget) override;

private:
    struct Record {
        std::string name;
        std::uint16_t version_made_by = 0;
        std::uint16_t flags = 0;
        std::uint16_t method = 0;
        std::uint16_t dos_time = 0;
        std::uint32_t crc = 0;
        std::uint64_t compressed_size = 0;
        std::uint64_t uncompressed_size = 0;
        std::uint64_t local_offset = 0;
        std::uint32_t external_attrs = 0;
        bool aes = false;
        std::uint16_t aes_version = 0;
        std::uint8_t aes_strength = 0;
        std::uint16_t aes_method = 0;
    };

    void ParseCentralDirectory();
    std::size_t LocateEndOfCentralDirectory() const;
    void ParseExtraFields(const std::uint8_t* extra, std::size_t size, Record& record, bool need_usize,
                          bool need_csize, bool need_offset) const;
    std::size_t LocalDataOffset(const Record& record) const;
    Bytes Inflate(std::uint16_t method, const std::uint8_t* data, std::size_t size,
                  path_guard::SizeBudget& budget) const;
    Bytes DecryptTraditional(const Record& record, const std::uint8_t* data, std::size_t size) const;
    Bytes DecryptAes(const Record& record, const std::uint8_t* data, std::size_t size) const;

    Bytes payload_;
    std::string password_;
    std::vector<Record> records_;
};

}  // namespace b64unpack::archive
