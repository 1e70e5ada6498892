#pragma once

#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <vector>

#include "b64unpack/archive.hpp"
#include "b64unpack/constants.hpp"
#include "b64unpack/errors.hpp"
#include "b64unpack/format.hpp"

namespace b64unpack {

struct ProcessOptions {
    std::filesystem::path output_dir = std::string(constants::kDefaultOutputDir);
    std::optional<format::FormatTag> forced_format;
    std::string password;
    bool keep_archive = false;
    bool analyze_only = false;  // implies keep_archive
    bool keep_on_failure = false;  // persist the decoded bytes when extraction fails
    archive::ExtractLimits limits = archive::ExtractLimits::FromEnvironment();
};

struct ProcessResult {
    std::size_t decoded_size = 0;
    format::FormatTag format = format::FormatTag::Unknown;
    std::filesystem::path archive_path;  // set when the decoded bytes were persisted
    archive::ExtractionResult extraction;
};

std::vector<std::uint8_t> ReadFile(const std::string& path);

// "-" reads stdin, an existing regular file is read whole, anything else is
// taken as the base64 text itself.
std::string ReadInput(const std::string& source);

std::filesystem::path SaveDecodedArchive(const std::vector<std::uint8_t>& payload,
                                         const std::filesystem::path& output_dir,
                                         format::FormatTag tag);

// Decode -> sniff -> extract into `<output_dir>/extracted`.
ProcessResult Process(const std::string& base64_text, const ProcessOptions& options);

}  // namespace b64unpack
