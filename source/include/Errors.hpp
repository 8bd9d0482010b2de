#pragma once

#include <string>
#include <string_view>

enum class ErrorKind {
    Transport,
    Decode,
    PathPrefixMismatch,
    InvalidName,
    SourceNotFound,
    UnsupportedSourceType,
    DestinationExists,
    CopyFailed,
    PartialMove
};

struct Error {
    ErrorKind kind;
    std::string message;
};

constexpr std::string_view to_string(ErrorKind kind) {
    switch (kind) {
        case ErrorKind::Transport:             return "transport";
        case ErrorKind::Decode:                return "decode";
        case ErrorKind::PathPrefixMismatch:    return "path prefix mismatch";
        case ErrorKind::InvalidName:           return "invalid name";
        case ErrorKind::SourceNotFound:        return "source not found";
        case ErrorKind::UnsupportedSourceType: return "unsupported source type";
        case ErrorKind::DestinationExists:     return "destination exists";
        case ErrorKind::CopyFailed:            return "copy failed";
        case ErrorKind::PartialMove:           return "partial move";
    }
    return "unknown";
}
