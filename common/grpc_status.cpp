#include "grpc_status.hpp"

namespace {

grpc::StatusCode statusCodeFor(ErrorCode code) {
    switch (code) {
        case ErrorCode::OK:
            return grpc::StatusCode::OK;
        case ErrorCode::FILE_NOT_FOUND:
        case ErrorCode::CHUNK_NOT_FOUND:
            return grpc::StatusCode::NOT_FOUND;
        case ErrorCode::INVALID_DESCRIPTOR:
        case ErrorCode::INVALID_ARGUMENT:
        case ErrorCode::MISSING_CHUNK_INDEX:
        case ErrorCode::DUPLICATE_CHUNK_INDEX:
            return grpc::StatusCode::INVALID_ARGUMENT;
        case ErrorCode::INSUFFICIENT_HEALTHY_NODES:
        case ErrorCode::NO_HEALTHY_REPLICA:
        case ErrorCode::TRANSPORT_FAILURE:
            return grpc::StatusCode::UNAVAILABLE;
        case ErrorCode::TOTAL_UPLOAD_FAILURE:
        case ErrorCode::STORAGE_ERROR:
            return grpc::StatusCode::INTERNAL;
    }
    return grpc::StatusCode::UNKNOWN;
}

const ErrorCode ALL_CODES[] = {
    ErrorCode::OK,
    ErrorCode::FILE_NOT_FOUND,
    ErrorCode::CHUNK_NOT_FOUND,
    ErrorCode::INSUFFICIENT_HEALTHY_NODES,
    ErrorCode::NO_HEALTHY_REPLICA,
    ErrorCode::TOTAL_UPLOAD_FAILURE,
    ErrorCode::TRANSPORT_FAILURE,
    ErrorCode::INVALID_DESCRIPTOR,
    ErrorCode::INVALID_ARGUMENT,
    ErrorCode::MISSING_CHUNK_INDEX,
    ErrorCode::DUPLICATE_CHUNK_INDEX,
    ErrorCode::STORAGE_ERROR,
};

} // namespace

grpc::Status toGrpcStatus(ErrorCode code, const std::string& message) {
    if (code == ErrorCode::OK) {
        return grpc::Status::OK;
    }
    return grpc::Status(statusCodeFor(code), message, errorCodeName(code));
}

std::optional<ErrorCode> errorCodeFromDetails(const grpc::Status& status) {
    const std::string& details = status.error_details();
    for (ErrorCode code : ALL_CODES) {
        if (details == errorCodeName(code)) {
            return code;
        }
    }
    return std::nullopt;
}

ErrorCode fromGrpcStatus(const grpc::Status& status) {
    if (status.ok()) {
        return ErrorCode::OK;
    }
    if (status.error_code() == grpc::StatusCode::NOT_FOUND) {
        return ErrorCode::CHUNK_NOT_FOUND;
    }
    return ErrorCode::TRANSPORT_FAILURE;
}
