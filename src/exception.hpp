#pragma once

#include <stdexcept>
#include <string>

enum class ErrorKind {
    BadIdentifier,
    EntryExists,
    EntryNotFound,
    StaleIndex,
    IndexCorrupt,
    FetchFailed,
    IntegrityFailed,
    ExtractionFailed,
    Cancelled,
    FileSystem,
    Usage
};

class PackgetException : public std::runtime_error {
public:
    PackgetException(ErrorKind kind, const std::string& message)
        : std::runtime_error(message), kind_(kind) {}

    ErrorKind kind() const { return kind_; }

private:
    ErrorKind kind_;
};

inline const char* error_kind_name(ErrorKind kind) {
    switch (kind) {
        case ErrorKind::BadIdentifier: return "BadIdentifier";
        case ErrorKind::EntryExists: return "EntryExists";
        case ErrorKind::EntryNotFound: return "EntryNotFound";
        case ErrorKind::StaleIndex: return "StaleIndex";
        case ErrorKind::IndexCorrupt: return "IndexCorrupt";
        case ErrorKind::FetchFailed: return "FetchFailed";
        case ErrorKind::IntegrityFailed: return "IntegrityFailed";
        case ErrorKind::ExtractionFailed: return "ExtractionFailed";
        case ErrorKind::Cancelled: return "Cancelled";
        case ErrorKind::FileSystem: return "FileSystem";
        case ErrorKind::Usage: return "Usage";
    }
    return "Unknown";
}
