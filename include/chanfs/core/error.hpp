#pragma once

#include <string>

namespace chanfs {

enum class ErrorCode {
    // Preconditions
    InvalidArgument,
    NotFound,
    AlreadyExists,
    ContainerLimitReached,
    SizeMismatch,

    // Resume inference
    CannotInferBlockSize,
    IncompleteUploadFromPartialLastBlock,
    BlockSizeExceedsLimit,
    AlreadyComplete,
    MalformedBlockName,

    // Download verification
    BlockSequenceGap,
    BlockSizeInconsistent,
    IncompleteUpload,

    // Remote / local I/O
    RemoteWriteError,
    RemoteReadError,
    LocalReadError,
    LocalWriteError,

    ChunkTooSmall,
    ConfigError,
    ProtocolError
};

/**
 * @brief Coded error carried by every chanfs::Result
 *
 * The code lets callers (and tests) branch on the failure kind, the message
 * is what the command layer prints.
 */
struct Error {
    ErrorCode code = ErrorCode::ProtocolError;
    std::string message;
};

inline Error make_error(ErrorCode code, std::string message) {
    return Error{code, std::move(message)};
}

inline const char* to_string(ErrorCode code) {
    switch (code) {
        case ErrorCode::InvalidArgument: return "InvalidArgument";
        case ErrorCode::NotFound: return "NotFound";
        case ErrorCode::AlreadyExists: return "AlreadyExists";
        case ErrorCode::ContainerLimitReached: return "ContainerLimitReached";
        case ErrorCode::SizeMismatch: return "SizeMismatch";
        case ErrorCode::CannotInferBlockSize: return "CannotInferBlockSize";
        case ErrorCode::IncompleteUploadFromPartialLastBlock: return "IncompleteUploadFromPartialLastBlock";
        case ErrorCode::BlockSizeExceedsLimit: return "BlockSizeExceedsLimit";
        case ErrorCode::AlreadyComplete: return "AlreadyComplete";
        case ErrorCode::MalformedBlockName: return "MalformedBlockName";
        case ErrorCode::BlockSequenceGap: return "BlockSequenceGap";
        case ErrorCode::BlockSizeInconsistent: return "BlockSizeInconsistent";
        case ErrorCode::IncompleteUpload: return "IncompleteUpload";
        case ErrorCode::RemoteWriteError: return "RemoteWriteError";
        case ErrorCode::RemoteReadError: return "RemoteReadError";
        case ErrorCode::LocalReadError: return "LocalReadError";
        case ErrorCode::LocalWriteError: return "LocalWriteError";
        case ErrorCode::ChunkTooSmall: return "ChunkTooSmall";
        case ErrorCode::ConfigError: return "ConfigError";
        case ErrorCode::ProtocolError: return "ProtocolError";
    }
    return "Unknown";
}

} // namespace chanfs
