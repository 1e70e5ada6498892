#pragma once

#include <cstddef>
#include <cstdint>
#include <vector>

#include "b64unpack/archive.hpp"

namespace b64unpack::archive {

// ustar / GNU / pax TAR stream. The whole stream is indexed on construction.
class TarReader : public ArchiveReader {
public:
    explicit TarReader(Bytes stream);

    std::vector<ArchiveEntry> ListEntries() override;
    Bytes ReadEntry(const ArchiveEntry& entry, path_guard::SizeBudget& budget) override;

private:
    struct Member {
        std::size_t data_offset = 0;
        std::uint64_t size = 0;
    };

    void Index();

    Bytes stream_;
    std::vector<ArchiveEntry> entries_;
    std::vector<Member> members_;
};

// A 512-byte block whose stored checksum matches its contents.
bool LooksLikeTarHeader(const std::uint8_t* block, std::size_t size);

}  // namespace b64unpack::archive
