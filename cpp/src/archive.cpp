#include "b64unpack/archive.hpp"

#include "b64unpack/constants.hpp"
#include "b64unpack/decompress.hpp"
#include "b64unpack/errors.hpp"
#include "b64unpack/tar_reader.hpp"
#include "b64unpack/zip_reader.hpp"

#include <algorithm>
#include <array>
#include <fstream>
#include <string>
#include <system_error>
#include <utility>

namespace b64unpack::archive {

namespace {

using format::FormatTag;

// Signature-only backend: RAR archives are recognised but never unpacked.
class RarReader : public ArchiveReader {
public:
    explicit RarReader(const Bytes& payload) {
        if (!format::HasRarSignature(payload)) {
            throw Error(ErrorKind::FormatMismatch, "Data is not a RAR archive");
        }
    }

    std::vector<ArchiveEntry> ListEntries() override { return {}; }

    Bytes ReadEntry(const ArchiveEntry&, path_guard::SizeBudget&) override {
        throw Error(ErrorKind::UnsupportedFormat, "RAR extraction is not supported");
    }
};

std::uint64_t StreamLimit(const ExtractLimits& limits) {
    // Headers and block padding ride on top of the file data.
    std::uint64_t doubled = limits.max_total_bytes > UINT64_MAX / 2 ? UINT64_MAX : limits.max_total_bytes * 2;
    return std::max(doubled, constants::kMinStreamBytes);
}

std::unique_ptr<ArchiveReader> OpenZip(const Bytes& payload, const ExtractOptions& options) {
    return std::make_unique<ZipReader>(Bytes(payload), options.password);
}

std::unique_ptr<ArchiveReader> OpenTar(const Bytes& payload, const ExtractOptions&) {
    return std::make_unique<TarReader>(payload);
}

template <decompress::Codec codec, bool (*has_magic)(const Bytes&)>
std::unique_ptr<ArchiveReader> OpenCompressedTar(const Bytes& payload, const ExtractOptions& options) {
    if (!has_magic(payload)) {
        throw Error(ErrorKind::FormatMismatch, "Data does not carry the expected compression signature");
    }
    return std::make_unique<TarReader>(decompress::Decompress(codec, payload, StreamLimit(options.limits)));
}

std::unique_ptr<ArchiveReader> OpenRar(const Bytes& payload, const ExtractOptions&) {
    return std::make_unique<RarReader>(payload);
}

using ReaderFactory = std::unique_ptr<ArchiveReader> (*)(const Bytes&, const ExtractOptions&);

struct FormatHandler {
    FormatTag tag;
    ReaderFactory open;
    bool extracts;
};

const std::array<FormatHandler, 6> kHandlers = {{
    {FormatTag::Zip, &OpenZip, true},
    {FormatTag::Tar, &OpenTar, true},
    {FormatTag::TarGzip, &OpenCompressedTar<decompress::Codec::Gzip, &format::HasGzipSignature>, true},
    {FormatTag::TarBzip2, &OpenCompressedTar<decompress::Codec::Bzip2, &format::HasBzip2Signature>, true},
    {FormatTag::TarXz, &OpenCompressedTar<decompress::Codec::Xz, &format::HasXzSignature>, true},
    {FormatTag::Rar, &OpenRar, false},
}};

const FormatHandler& FindHandler(FormatTag tag) {
    for (const auto& handler : kHandlers) {
        if (handler.tag == tag) {
            return handler;
        }
    }
    throw Error(ErrorKind::UnsupportedFormat, "Could not detect a supported archive format");
}

[[noreturn]] void IoFailure(const std::string& what, const std::filesystem::path& path, const std::error_code& ec) {
    throw Error(ErrorKind::IoError, what + " " + path.string() + (ec ? ": " + ec.message() : std::string()));
}

// Records every file and directory an extraction creates, and parks any file
// it overwrites beside the original, so a failed run can be rolled back.
// Rollback happens in the destructor unless Commit() ran.
class ExtractionJournal {
public:
    explicit ExtractionJournal(std::filesystem::path root) : root_(std::move(root)) {}

    ExtractionJournal(const ExtractionJournal&) = delete;
    ExtractionJournal& operator=(const ExtractionJournal&) = delete;

    ~ExtractionJournal() {
        if (committed_) {
            return;
        }
        std::error_code ec;
        for (auto it = files_.rbegin(); it != files_.rend(); ++it) {
            std::filesystem::remove(*it, ec);
        }
        for (auto it = replaced_.rbegin(); it != replaced_.rend(); ++it) {
            std::filesystem::rename(it->second, it->first, ec);
        }
        for (auto it = dirs_.rbegin(); it != dirs_.rend(); ++it) {
            std::filesystem::remove(*it, ec);
        }
    }

    void CreateDirectories(const std::filesystem::path& target) {
        std::filesystem::path current = root_;
        auto rel = target.lexically_relative(root_);
        for (const auto& part : rel) {
            if (part.empty() || part == ".") {
                continue;
            }
            current /= part;
            std::error_code ec;
            if (std::filesystem::is_directory(current, ec)) {
                continue;
            }
            if (!std::filesystem::create_directory(current, ec) || ec) {
                IoFailure("Failed to create directory", current, ec);
            }
            dirs_.push_back(current);
        }
    }

    void WriteFile(const std::filesystem::path& target, const Bytes& data) {
        std::error_code ec;
        bool ours = std::find(files_.begin(), files_.end(), target) != files_.end()
                    || std::find_if(replaced_.begin(), replaced_.end(),
                                    [&](const auto& item) { return item.first == target; })
                           != replaced_.end();
        if (!ours && std::filesystem::is_regular_file(target, ec)) {
            auto backup = target;
            backup += kBackupSuffix;
            std::filesystem::rename(target, backup, ec);
            if (ec) {
                IoFailure("Failed to set aside existing file", target, ec);
            }
            replaced_.emplace_back(target, backup);
        } else if (!ours) {
            files_.push_back(target);
        }
        std::ofstream output(target, std::ios::binary | std::ios::trunc);
        if (!output) {
            IoFailure("Failed to write output", target, ec);
        }
        if (!data.empty()) {
            output.write(reinterpret_cast<const char*>(data.data()), static_cast<std::streamsize>(data.size()));
        }
        output.close();
        if (!output) {
            IoFailure("Failed to write output", target, ec);
        }
    }

    void Commit() {
        committed_ = true;
        std::error_code ec;
        for (const auto& item : replaced_) {
            std::filesystem::remove(item.second, ec);
        }
    }

private:
    static constexpr const char* kBackupSuffix = ".b64unpack-prev";

    std::filesystem::path root_;
    std::vector<std::filesystem::path> files_;
    std::vector<std::pair<std::filesystem::path, std::filesystem::path>> replaced_;
    std::vector<std::filesystem::path> dirs_;
    bool committed_ = false;
};

}  // namespace

ExtractLimits ExtractLimits::FromEnvironment() {
    ExtractLimits limits;
    limits.max_total_bytes = constants::MaxTotalBytes();
    limits.max_entries = constants::MaxEntries();
    return limits;
}

ExtractionResult Extract(const Bytes& payload,
                         format::FormatTag tag,
                         const std::filesystem::path& output_root,
                         const ExtractOptions& options) {
    if (payload.empty()) {
        throw Error(ErrorKind::EmptyArchive, "Decoded payload is empty");
    }
    const FormatHandler& handler = FindHandler(tag);
    auto reader = handler.open(payload, options);

    ExtractionResult result;
    result.format = tag;
    result.output_root = output_root;
    if (!handler.extracts) {
        result.status = ResultStatus::DetectedOnly;
        return result;
    }

    std::vector<ArchiveEntry> entries = reader->ListEntries();
    if (entries.size() > options.limits.max_entries) {
        throw Error(ErrorKind::SizeLimitExceeded,
                    "Archive holds " + std::to_string(entries.size()) + " entries, limit is "
                        + std::to_string(options.limits.max_entries));
    }

    // Listing pass: every path and the password requirement are checked
    // before anything touches the disk.
    result.entries.reserve(entries.size());
    for (const auto& entry : entries) {
        EntryResult item;
        item.entry = entry;
        if (entry.kind == EntryKind::Unsupported) {
            item.status = EntryStatus::Skipped;
        } else {
            item.output_path = path_guard::ValidateEntryPath(entry.path, output_root);
            item.status = EntryStatus::Listed;
            if (!options.analyze_only && entry.encrypted && options.password.empty()) {
                throw Error(ErrorKind::PasswordRequired,
                            "'" + entry.path + "' is encrypted and no password was supplied");
            }
        }
        result.entries.push_back(std::move(item));
    }
    if (options.analyze_only) {
        result.status = ResultStatus::Analyzed;
        return result;
    }

    std::error_code ec;
    std::filesystem::create_directories(output_root, ec);
    if (ec) {
        IoFailure("Failed to create output directory", output_root, ec);
    }
    auto root = path_guard::ValidateEntryPath(".", output_root);
    ExtractionJournal journal(root);
    path_guard::SizeBudget budget(options.limits.max_total_bytes);

    for (auto& item : result.entries) {
        const ArchiveEntry& entry = item.entry;
        if (item.status == EntryStatus::Skipped) {
            continue;
        }
        // Re-resolved right before the write: earlier entries may have
        // changed what exists on disk.
        auto target = path_guard::ValidateEntryPath(entry.path, output_root);
        item.output_path = target;
        if (entry.is_directory()) {
            journal.CreateDirectories(target);
            item.status = EntryStatus::Extracted;
            continue;
        }
        if (target == root) {
            throw Error(ErrorKind::CorruptArchive, "File entry '" + entry.path + "' has no file name");
        }
        Bytes data = reader->ReadEntry(entry, budget);
        journal.CreateDirectories(target.parent_path());
        journal.WriteFile(target, data);
        item.status = EntryStatus::Extracted;
        item.bytes_written = data.size();
        result.total_bytes += data.size();
    }

    journal.Commit();
    result.status = ResultStatus::Extracted;
    return result;
}

}  // namespace b64unpack::archive
