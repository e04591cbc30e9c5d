#pragma once

enum class ErrorCode {
    OK,
    FILE_NOT_FOUND,
    CHUNK_NOT_FOUND,
    INSUFFICIENT_HEALTHY_NODES,
    NO_HEALTHY_REPLICA,
    TOTAL_UPLOAD_FAILURE,
    TRANSPORT_FAILURE,
    INVALID_DESCRIPTOR,
    INVALID_ARGUMENT,
    MISSING_CHUNK_INDEX,
    DUPLICATE_CHUNK_INDEX,
    STORAGE_ERROR
};

inline const char* errorCodeName(ErrorCode code) {
    switch (code) {
        case ErrorCode::OK: return "OK";
        case ErrorCode::FILE_NOT_FOUND: return "FILE_NOT_FOUND";
        case ErrorCode::CHUNK_NOT_FOUND: return "CHUNK_NOT_FOUND";
        case ErrorCode::INSUFFICIENT_HEALTHY_NODES: return "INSUFFICIENT_HEALTHY_NODES";
        case ErrorCode::NO_HEALTHY_REPLICA: return "NO_HEALTHY_REPLICA";
        case ErrorCode::TOTAL_UPLOAD_FAILURE: return "TOTAL_UPLOAD_FAILURE";
        case ErrorCode::TRANSPORT_FAILURE: return "TRANSPORT_FAILURE";
        case ErrorCode::INVALID_DESCRIPTOR: return "INVALID_DESCRIPTOR";
        case ErrorCode::INVALID_ARGUMENT: return "INVALID_ARGUMENT";
        case ErrorCode::MISSING_CHUNK_INDEX: return "MISSING_CHUNK_INDEX";
        case ErrorCode::DUPLICATE_CHUNK_INDEX: return "DUPLICATE_CHUNK_INDEX";
        case ErrorCode::STORAGE_ERROR: return "STORAGE_ERROR";
    }
    return "UNKNOWN";
}
