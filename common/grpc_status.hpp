#pragma once

#include <string>
#include <optional>
#include <grpcpp/grpcpp.h>
#include "error_code.hpp"

// Translation between ErrorCode and grpc::Status at the RPC boundary.
// Failed statuses carry the ErrorCode name in their error details.
grpc::Status toGrpcStatus(ErrorCode code, const std::string& message);

// The ErrorCode a ReplicaDFS server attached, or nullopt when the status
// did not come from one (connection failures, deadlines).
std::optional<ErrorCode> errorCodeFromDetails(const grpc::Status& status);

// Node-scoped view of a failed call: NOT_FOUND stays a not-found,
// everything else is a transport failure of that node.
ErrorCode fromGrpcStatus(const grpc::Status& status);
