#include "b64unpack/errors.hpp"

namespace b64unpack {

std::string_view ErrorKindName(ErrorKind kind) {
    switch (kind) {
        case ErrorKind::InvalidEncoding:
            return "InvalidEncoding";
        case ErrorKind::FormatMismatch:
            return "FormatMismatch";
        case ErrorKind::EmptyArchive:
            return "EmptyArchive";
        case ErrorKind::CorruptArchive:
            return "CorruptArchive";
        case ErrorKind::PasswordRequired:
            return "PasswordRequired";
        case ErrorKind::PasswordIncorrect:
            return "PasswordIncorrect";
        case ErrorKind::PathTraversal:
            return "PathTraversal";
        case ErrorKind::SizeLimitExceeded:
            return "SizeLimitExceeded";
        case ErrorKind::UnsupportedFormat:
            return "UnsupportedFormat";
        case ErrorKind::IoError:
            return "IoError";
    }
    return "Unknown";
}

Error::Error(ErrorKind kind, const std::string& message)
    : std::runtime_error(message), kind_(kind) {}

}  // namespace b64unpack
