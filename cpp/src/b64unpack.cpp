#include "b64unpack/b64unpack.hpp"

#include "b64unpack/base64.hpp"

#include <fstream>
#include <iostream>
#include <iterator>
#include <system_error>

namespace b64unpack {

namespace {

bool ShouldPersistOnFailure(ErrorKind kind) {
    // Password failures are retried by the caller; everything else leaves
    // the decoded bytes behind for manual inspection.
    return kind != ErrorKind::PasswordRequired && kind != ErrorKind::PasswordIncorrect
           && kind != ErrorKind::InvalidEncoding && kind != ErrorKind::EmptyArchive;
}

void EnsureDirectory(const std::filesystem::path& dir) {
    std::error_code ec;
    std::filesystem::create_directories(dir, ec);
    if (ec) {
        throw Error(ErrorKind::IoError, "Failed to create output directory " + dir.string() + ": " + ec.message());
    }
}

}  // namespace

std::vector<std::uint8_t> ReadFile(const std::string& path) {
    std::ifstream input(path, std::ios::binary);
    if (!input) {
        throw Error(ErrorKind::IoError, "Failed to open file: " + path);
    }
    input.seekg(0, std::ios::end);
    std::streamoff size = input.tellg();
    if (size < 0) {
        throw Error(ErrorKind::IoError, "Failed to read file size: " + path);
    }
    input.seekg(0, std::ios::beg);

    std::vector<std::uint8_t> data;
    data.resize(static_cast<std::size_t>(size));

    if (!data.empty()) {
        input.read(reinterpret_cast<char*>(data.data()), static_cast<std::streamsize>(data.size()));
        if (!input) {
            throw Error(ErrorKind::IoError, "Failed to read file: " + path);
        }
    }
    return data;
}

std::string ReadInput(const std::string& source) {
    if (source.empty() || source == "-") {
        return std::string(std::istreambuf_iterator<char>(std::cin), std::istreambuf_iterator<char>());
    }
    std::error_code ec;
    if (std::filesystem::is_regular_file(source, ec)) {
        auto data = ReadFile(source);
        return std::string(data.begin(), data.end());
    }
    return source;
}

std::filesystem::path SaveDecodedArchive(const std::vector<std::uint8_t>& payload,
                                         const std::filesystem::path& output_dir,
                                         format::FormatTag tag) {
    EnsureDirectory(output_dir);
    auto path = output_dir / format::ArchiveFileName(tag);
    std::ofstream out(path, std::ios::binary | std::ios::trunc);
    if (!out) {
        throw Error(ErrorKind::IoError, "Failed to open " + path.string() + " for writing");
    }
    out.write(reinterpret_cast<const char*>(payload.data()), static_cast<std::streamsize>(payload.size()));
    out.close();
    if (!out) {
        throw Error(ErrorKind::IoError, "Failed to write " + path.string());
    }
    return path;
}

ProcessResult Process(const std::string& base64_text, const ProcessOptions& options) {
    ProcessResult result;
    const std::vector<std::uint8_t> payload = base64::DecodePayload(base64_text);
    result.decoded_size = payload.size();
    if (payload.empty()) {
        throw Error(ErrorKind::EmptyArchive, "No data left after base64 decoding");
    }
    result.format = format::SniffOrForced(payload, options.forced_format);

    if (options.keep_archive || options.analyze_only) {
        result.archive_path = SaveDecodedArchive(payload, options.output_dir, result.format);
    }

    archive::ExtractOptions extract_options;
    extract_options.password = options.password;
    extract_options.analyze_only = options.analyze_only;
    extract_options.limits = options.limits;
    try {
        result.extraction = archive::Extract(payload, result.format,
                                             options.output_dir / std::string(constants::kExtractedDirName),
                                             extract_options);
    } catch (const Error& err) {
        if (!options.keep_on_failure || !result.archive_path.empty() || !ShouldPersistOnFailure(err.kind())) {
            throw;
        }
        auto saved = SaveDecodedArchive(payload, options.output_dir, result.format);
        throw Error(err.kind(), std::string(err.what()) + " (decoded data saved to " + saved.string() + ")");
    }
    return result;
}

}  // namespace b64unpack
