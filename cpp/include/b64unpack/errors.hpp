#pragma once

#include <stdexcept>
#include <string>
#include <string_view>

namespace b64unpack {

enum class ErrorKind {
    InvalidEncoding,
    FormatMismatch,
    EmptyArchive,
    CorruptArchive,
    PasswordRequired,
    PasswordIncorrect,
    PathTraversal,
    SizeLimitExceeded,
    UnsupportedFormat,
    IoError
};

std::string_view ErrorKindName(ErrorKind kind);

// Every failure raised by the decode/sniff/extract pipeline.
class Error : public std::runtime_error {
public:
    Error(ErrorKind kind, const std::string& message);

    ErrorKind kind() const noexcept { return kind_; }

private:
    ErrorKind kind_;
};

}  // namespace b64unpack
