#pragma once

#include <cstddef>
#include <cstdint>
#include <string>
#include <string_view>
#include <vector>

#include "b64unpack/archive.hpp"

namespace b64unpack::report {

struct FileInfo {
    std::string path;
    std::uint64_t size = 0;
};

struct Summary {
    std::size_t file_count = 0;
    std::size_t directory_count = 0;
    std::size_t skipped_count = 0;
    std::uint64_t total_size = 0;
    std::vector<FileInfo> files;  // sorted by path
    std::vector<std::string> interesting;
};

// Built once per process from B64UNPACK_INTERESTING (comma separated) or the
// built-in list; never modified afterwards.
const std::vector<std::string>& DefaultInterestingKeywords();

// Case-insensitive substring match on the final path component.
bool IsInteresting(std::string_view path, const std::vector<std::string>& keywords);

Summary Summarize(const archive::ExtractionResult& result,
                  const std::vector<std::string>& keywords = DefaultInterestingKeywords());

}  // namespace b64unpack::report
