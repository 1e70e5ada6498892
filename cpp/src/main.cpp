#include "b64unpack/b64unpack.hpp"

#include "b64unpack/base64.hpp"
#include "b64unpack/cli_colors.hpp"
#include "b64unpack/env.hpp"
#include "b64unpack/report.hpp"

#include <filesystem>
#include <iostream>
#include <stdexcept>
#include <string>

namespace {

constexpr std::size_t kListedFiles = 20;

void PrintUsage() {
    std::cout << "Usage:\n";
    std::cout << "  b64unpack [-i <file|-|base64>] [-o <dir>] [--format <fmt>] [--keep] [--analyze-only]\n";
    std::cout << "            [-p <password>] [--max-bytes <n>] [--max-entries <n>] [--no-color]\n";
    std::cout << "\n";
    std::cout << "  -i, --input      base64 source: file path, '-' for stdin (default), or literal text\n";
    std::cout << "  -o, --output     output directory (default: extracted_files)\n";
    std::cout << "  --format         force zip, tar, tar.gz, tar.bz2, tar.xz or rar\n";
    std::cout << "  --keep           keep the decoded archive next to the extracted files\n";
    std::cout << "  --analyze-only   list and validate entries without extracting (implies --keep)\n";
    std::cout << "  -p, --password   password for encrypted ZIP entries\n";
    std::cout << "  --max-bytes      ceiling on total extracted bytes\n";
    std::cout << "  --max-entries    ceiling on archive entry count\n";
}

struct CliArgs {
    std::string input = "-";
    b64unpack::ProcessOptions options;
    bool no_color = false;
    bool help = false;
};

std::uint64_t ParseCount(const std::string& flag, const std::string& value) {
    std::size_t used = 0;
    unsigned long long parsed = 0;
    try {
        parsed = std::stoull(value, &used);
    } catch (const std::exception&) {
        throw std::runtime_error("Invalid value for " + flag + ": " + value);
    }
    if (used != value.size() || parsed == 0 || value.front() == '-') {
        throw std::runtime_error("Invalid value for " + flag + ": " + value);
    }
    return static_cast<std::uint64_t>(parsed);
}

CliArgs ParseArgs(int argc, char** argv) {
    CliArgs args;
    int idx = 1;
    auto value = [&](const std::string& flag) -> std::string {
        if (idx + 1 >= argc) {
            throw std::runtime_error("Missing value for " + flag);
        }
        return argv[idx + 1];
    };
    while (idx < argc) {
        std::string flag(argv[idx]);
        if (flag == "-h" || flag == "--help") {
            args.help = true;
            idx += 1;
        } else if (flag == "-i" || flag == "--input") {
            args.input = value(flag);
            idx += 2;
        } else if (flag == "-o" || flag == "--output") {
            args.options.output_dir = value(flag);
            idx += 2;
        } else if (flag == "--format") {
            std::string name = value(flag);
            auto tag = b64unpack::format::FormatFromFlag(name);
            if (!tag) {
                throw std::runtime_error("Unknown format: " + name);
            }
            args.options.forced_format = *tag;
            idx += 2;
        } else if (flag == "-p" || flag == "--password") {
            args.options.password = value(flag);
            idx += 2;
        } else if (flag == "--keep") {
            args.options.keep_archive = true;
            idx += 1;
        } else if (flag == "--analyze-only") {
            args.options.analyze_only = true;
            idx += 1;
        } else if (flag == "--max-bytes") {
            args.options.limits.max_total_bytes = ParseCount(flag, value(flag));
            idx += 2;
        } else if (flag == "--max-entries") {
            args.options.limits.max_entries = static_cast<std::size_t>(ParseCount(flag, value(flag)));
            idx += 2;
        } else if (flag == "--no-color") {
            args.no_color = true;
            idx += 1;
        } else {
            throw std::runtime_error("Unknown flag: " + flag);
        }
    }
    return args;
}

std::string FormatSize(std::uint64_t bytes) {
    std::string digits = std::to_string(bytes);
    for (int pos = static_cast<int>(digits.size()) - 3; pos > 0; pos -= 3) {
        digits.insert(static_cast<std::size_t>(pos), ",");
    }
    return digits + " bytes";
}

void PrintSummary(const b64unpack::ProcessResult& result) {
    using b64unpack::cli::Info;
    const auto& extraction = result.extraction;
    auto summary = b64unpack::report::Summarize(extraction);
    bool analyzed = extraction.status == b64unpack::archive::ResultStatus::Analyzed;

    std::cout << "\n" << Info(analyzed ? "Archive analysis:" : "Extraction summary:") << "\n";
    std::cout << "    Total files: " << summary.file_count << "\n";
    std::cout << "    Total size: " << FormatSize(summary.total_size) << "\n";
    if (summary.directory_count > 0) {
        std::cout << "    Directories: " << summary.directory_count << "\n";
    }
    if (summary.skipped_count > 0) {
        std::cout << "    Skipped entries: " << summary.skipped_count << "\n";
        for (const auto& item : extraction.entries) {
            if (item.status == b64unpack::archive::EntryStatus::Skipped) {
                std::cout << "      - " << item.entry.path << " (" << item.entry.note << ")\n";
            }
        }
    }
    if (!summary.files.empty()) {
        std::cout << (analyzed ? "    Files:\n" : "    Files extracted:\n");
        std::size_t shown = 0;
        for (const auto& file : summary.files) {
            if (shown++ == kListedFiles) {
                break;
            }
            std::cout << "      - " << file.path << " (" << FormatSize(file.size) << ")\n";
        }
        if (summary.files.size() > kListedFiles) {
            std::cout << "      ... and " << (summary.files.size() - kListedFiles) << " more files\n";
        }
    }
    if (!summary.interesting.empty()) {
        std::cout << "\n" << Info("Potentially interesting files:") << "\n";
        for (const auto& path : summary.interesting) {
            std::cout << "      - " << b64unpack::cli::Yellow(path) << "\n";
        }
    }
}

bool IsPasswordError(b64unpack::ErrorKind kind) {
    return kind == b64unpack::ErrorKind::PasswordRequired || kind == b64unpack::ErrorKind::PasswordIncorrect;
}

}  // namespace

int main(int argc, char** argv) {
    using b64unpack::cli::Failure;
    using b64unpack::cli::Info;
    using b64unpack::cli::Success;

    CliArgs args;
    try {
        args = ParseArgs(argc, argv);
    } catch (const std::exception& exc) {
        std::cerr << "Error: " << exc.what() << "\n";
        PrintUsage();
        return 2;
    }
    if (args.help) {
        PrintUsage();
        return 0;
    }
    if (args.no_color || b64unpack::env::IsEnabled(b64unpack::constants::kEnvNoColor)) {
        b64unpack::cli::SetColorsEnabled(false);
    }
    args.options.keep_on_failure = true;

    std::cout << b64unpack::cli::BoldWhite("BASE64 ARCHIVE EXTRACTOR") << "\n";
    try {
        bool from_stdin = args.input.empty() || args.input == "-";
        if (from_stdin && b64unpack::cli::StdinIsTerminal()) {
            std::cout << Info("Reading from stdin (paste base64 data, then Ctrl+D)...") << "\n";
        }
        std::string text = b64unpack::ReadInput(args.input);
        if (!b64unpack::base64::IsLikelyBase64(text)) {
            std::cout << Info("Input contains non-base64 characters; they will be ignored") << "\n";
        }

        b64unpack::ProcessResult result;
        bool prompted = false;
        while (true) {
            try {
                result = b64unpack::Process(text, args.options);
                break;
            } catch (const b64unpack::Error& err) {
                bool can_prompt = !prompted && !from_stdin && b64unpack::cli::StdinIsTerminal();
                if (!IsPasswordError(err.kind()) || !can_prompt) {
                    throw;
                }
                std::cerr << Failure(err.what()) << "\n";
                args.options.password = b64unpack::cli::ReadSecret("Enter password: ");
                prompted = true;
                if (args.options.password.empty()) {
                    throw;
                }
            }
        }

        std::cout << Success("Decoded " + FormatSize(result.decoded_size)) << "\n";
        std::cout << Info("Format: " + std::string(b64unpack::format::FormatName(result.format))) << "\n";
        if (!result.archive_path.empty()) {
            std::cout << Success("Saved decoded archive: " + result.archive_path.string()) << "\n";
        }
        if (result.extraction.status == b64unpack::archive::ResultStatus::DetectedOnly) {
            std::cerr << Failure("RAR archive detected; extraction is not supported") << "\n";
            return 1;
        }
        if (result.extraction.status == b64unpack::archive::ResultStatus::Extracted) {
            std::cout << Success("Extracted to: " + result.extraction.output_root.string()) << "\n";
        }
        PrintSummary(result);
        std::cout << "\n" << Success("Process complete. Output directory: " + args.options.output_dir.string())
                  << "\n";
        return 0;
    } catch (const b64unpack::Error& err) {
        std::cerr << Failure(std::string(b64unpack::ErrorKindName(err.kind())) + ": " + err.what()) << "\n";
        return 1;
    } catch (const std::exception& exc) {
        std::cerr << Failure(std::string("Unexpected error: ") + exc.what()) << "\n";
        return 1;
    }
}
