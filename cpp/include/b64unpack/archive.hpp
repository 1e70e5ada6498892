#pragma once

#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <memory>
#include <string>
#include <vector>

#include "b64unpack/constants.hpp"
#include "b64unpack/format.hpp"
#include "b64unpack/path_guard.hpp"

namespace b64unpack::archive {

using Bytes = std::vector<std::uint8_t>;

enum class EntryKind {
    File,
    Directory,
    Unsupported  // links, devices, FIFOs: recorded, never written
};

struct ArchiveEntry {
    std::string path;  // untrusted until path_guard::ValidateEntryPath accepts it
    std::uint64_t size = 0;
    EntryKind kind = EntryKind::File;
    bool encrypted = false;
    std::string note;
    std::size_t index = 0;  // reader-private handle

    bool is_directory() const { return kind == EntryKind::Directory; }
};

enum class EntryStatus {
    Extracted,
    Listed,
    Skipped
};

struct EntryResult {
    ArchiveEntry entry;
    EntryStatus status = EntryStatus::Listed;
    std::uint64_t bytes_written = 0;
    std::filesystem::path output_path;
};

enum class ResultStatus {
    Extracted,
    Analyzed,
    DetectedOnly
};

struct ExtractLimits {
    std::uint64_t max_total_bytes = constants::kDefaultMaxTotalBytes;
    std::size_t max_entries = constants::kDefaultMaxEntries;

    static ExtractLimits FromEnvironment();
};

struct ExtractOptions {
    std::string password;
    bool analyze_only = false;
    ExtractLimits limits;
};

struct ExtractionResult {
    format::FormatTag format = format::FormatTag::Unknown;
    ResultStatus status = ResultStatus::Extracted;
    std::filesystem::path output_root;
    std::vector<EntryResult> entries;
    std::uint64_t total_bytes = 0;
};

// Capability every format backend provides. Readers validate that the bytes
// match their format on construction and throw Error(FormatMismatch)
// otherwise.
class ArchiveReader {
public:
    virtual ~ArchiveReader() = default;

    virtual std::vector<ArchiveEntry> ListEntries() = 0;

    // Full contents of a file entry; charges `budget` for every byte.
    virtual Bytes ReadEntry(const ArchiveEntry& entry, path_guard::SizeBudget& budget) = 0;
};

// Lists, validates and (unless analyze_only) writes every entry beneath
// `output_root`. When extraction fails, files it created are removed and
// files it overwrote get their previous contents back.
ExtractionResult Extract(const Bytes& payload,
                         format::FormatTag tag,
                         const std::filesystem::path& output_root,
                         const ExtractOptions& options);

}  // namespace b64unpack::archive
