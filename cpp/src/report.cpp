#include "b64unpack/report.hpp"

#include "b64unpack/constants.hpp"
#include "b64unpack/env.hpp"

#include <algorithm>
#include <cctype>

namespace b64unpack::report {

namespace {

std::string ToLower(std::string_view value) {
    std::string out(value);
    std::transform(out.begin(), out.end(), out.begin(), [](unsigned char ch) {
        return static_cast<char>(std::tolower(ch));
    });
    return out;
}

std::vector<std::string> LoadKeywords() {
    std::vector<std::string> keywords = env::GetList(constants::kEnvInteresting);
    if (keywords.empty()) {
        keywords = {"key",  "password", "passwd", "secret", "flag", "token", "credential", "id_rsa",
                    ".pem", ".env",     ".crt",   ".kdbx",  ".log", ".pdf",  ".doc",       ".txt"};
    }
    for (auto& keyword : keywords) {
        keyword = ToLower(keyword);
    }
    return keywords;
}

std::string DisplayPath(const archive::EntryResult& item) {
    std::string path = item.entry.path;
    std::replace(path.begin(), path.end(), '\\', '/');
    while (path.rfind("./", 0) == 0) {
        path.erase(0, 2);
    }
    return path;
}

}  // namespace

const std::vector<std::string>& DefaultInterestingKeywords() {
    static const std::vector<std::string> keywords = LoadKeywords();
    return keywords;
}

bool IsInteresting(std::string_view path, const std::vector<std::string>& keywords) {
    std::size_t slash = path.find_last_of("/\\");
    std::string name = ToLower(slash == std::string_view::npos ? path : path.substr(slash + 1));
    for (const auto& keyword : keywords) {
        if (!keyword.empty() && name.find(ToLower(keyword)) != std::string::npos) {
            return true;
        }
    }
    return false;
}

Summary Summarize(const archive::ExtractionResult& result, const std::vector<std::string>& keywords) {
    Summary summary;
    for (const auto& item : result.entries) {
        if (item.status == archive::EntryStatus::Skipped) {
            ++summary.skipped_count;
            continue;
        }
        if (item.entry.is_directory()) {
            ++summary.directory_count;
            continue;
        }
        FileInfo info;
        info.path = DisplayPath(item);
        info.size = item.status == archive::EntryStatus::Extracted ? item.bytes_written : item.entry.size;
        summary.total_size += info.size;
        summary.files.push_back(std::move(info));
    }
    std::sort(summary.files.begin(), summary.files.end(),
              [](const FileInfo& a, const FileInfo& b) { return a.path < b.path; });
    summary.file_count = summary.files.size();
    for (const auto& file : summary.files) {
        if (IsInteresting(file.path, keywords)) {
            summary.interesting.push_back(file.path);
        }
    }
    return summary;
}

}  // namespace b64unpack::report
