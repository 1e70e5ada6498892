#pragma once

#include <atomic>
#include <cstdint>
#include <filesystem>
#include <string>

namespace b64unpack::path_guard {

// Maps an untrusted archive entry path to an absolute location under
// `output_root`. Backslashes count as separators. Throws
// Error(PathTraversal) for ".." segments, absolute or drive-qualified
// paths, embedded NULs, and targets that resolve (following existing
// symlinks) outside the root. An entry naming the root itself ("./")
// resolves to the canonical root.
std::filesystem::path ValidateEntryPath(const std::string& entry_path,
                                        const std::filesystem::path& output_root);

// True when `candidate` equals `root` or lies beneath it, component-wise.
bool IsWithin(const std::filesystem::path& root, const std::filesystem::path& candidate);

// Cumulative decompressed-byte ceiling shared by every entry of one
// extraction. Safe to charge from several threads.
class SizeBudget {
public:
    explicit SizeBudget(std::uint64_t limit);

    SizeBudget(const SizeBudget&) = delete;
    SizeBudget& operator=(const SizeBudget&) = delete;

    // Throws Error(SizeLimitExceeded) and leaves the total unchanged when
    // `bytes` would take it past the limit.
    void Charge(std::uint64_t bytes);

    std::uint64_t Used() const { return used_.load(); }
    std::uint64_t Remaining() const;
    std::uint64_t Limit() const { return limit_; }

private:
    std::uint64_t limit_;
    std::atomic<std::uint64_t> used_{0};
};

}  // namespace b64unpack::path_guard
