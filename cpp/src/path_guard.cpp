#include "b64unpack/path_guard.hpp"

#include "b64unpack/errors.hpp"

#include <algorithm>
#include <cctype>
#include <system_error>

namespace b64unpack::path_guard {

namespace {

[[noreturn]] void Reject(const std::string& entry_path, const char* reason) {
    throw Error(ErrorKind::PathTraversal, "Unsafe entry path '" + entry_path + "': " + reason);
}

std::filesystem::path Canonical(const std::filesystem::path& path) {
    std::error_code ec;
    auto absolute = std::filesystem::absolute(path, ec);
    if (ec) {
        throw Error(ErrorKind::IoError, "Failed to resolve path " + path.string() + ": " + ec.message());
    }
    auto resolved = std::filesystem::weakly_canonical(absolute, ec);
    if (ec) {
        throw Error(ErrorKind::IoError, "Failed to resolve path " + path.string() + ": " + ec.message());
    }
    return resolved;
}

}  // namespace

bool IsWithin(const std::filesystem::path& root, const std::filesystem::path& candidate) {
    auto base = root.lexically_normal();
    auto full = candidate.lexically_normal();
    if (!base.empty() && !base.has_filename()) {
        base = base.parent_path();
    }
    auto mismatch = std::mismatch(base.begin(), base.end(), full.begin(), full.end());
    return mismatch.first == base.end();
}

std::filesystem::path ValidateEntryPath(const std::string& entry_path,
                                        const std::filesystem::path& output_root) {
    if (entry_path.find('\0') != std::string::npos) {
        Reject(entry_path, "embedded NUL byte");
    }
    std::string generic = entry_path;
    std::replace(generic.begin(), generic.end(), '\\', '/');

    std::filesystem::path rel(generic);
    for (const auto& part : rel) {
        if (part == "..") {
            Reject(entry_path, "parent directory segment");
        }
    }
    if (!generic.empty() && generic.front() == '/') {
        Reject(entry_path, "absolute path");
    }
    if (generic.size() >= 2 && std::isalpha(static_cast<unsigned char>(generic[0])) && generic[1] == ':') {
        Reject(entry_path, "drive-qualified path");
    }
    if (rel.is_absolute() || rel.has_root_path()) {
        Reject(entry_path, "absolute path");
    }

    auto normalized = rel.lexically_normal();
    if (!normalized.empty() && !normalized.has_filename()) {
        normalized = normalized.parent_path();
    }
    auto root = Canonical(output_root);
    if (normalized.empty() || normalized == ".") {
        return root;
    }
    auto full = Canonical(root / normalized);
    if (!IsWithin(root, full)) {
        Reject(entry_path, "resolves outside the output directory");
    }
    return full;
}

SizeBudget::SizeBudget(std::uint64_t limit) : limit_(limit) {}

void SizeBudget::Charge(std::uint64_t bytes) {
    std::uint64_t current = used_.load();
    while (true) {
        if (bytes > limit_ || current > limit_ - bytes) {
            throw Error(ErrorKind::SizeLimitExceeded,
                        "Extracted data exceeds the limit of " + std::to_string(limit_) + " bytes");
        }
        if (used_.compare_exchange_weak(current, current + bytes)) {
            return;
        }
    }
}

std::uint64_t SizeBudget::Remaining() const {
    std::uint64_t used = used_.load();
    return used >= limit_ ? 0 : limit_ - used;
}

}  // namespace b64unpack::path_guard
