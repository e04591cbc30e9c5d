#include "meta_service.hpp"
#include "grpc_status.hpp"
#include <string>

using ::grpc::Status;
using ::grpc::ServerContext;

namespace {

void fillEndpoint(NodeEndpoint* endpoint, const NodeInfo& node, bool healthy) {
    endpoint->set_node_id(node.node_id);
    endpoint->set_address(node.address);
    endpoint->set_healthy(healthy);
}

} // namespace

Status MetaServiceImpl::HealthCheck(ServerContext* context, const ::HealthCheckRequest* request,
                                    ::HealthCheckResponse* response) {
    response->set_status("healthy");
    response->set_node_id("metaserver");
    return Status::OK;
}

Status MetaServiceImpl::GetUploadLocations(ServerContext* context, const ::UploadLocationsRequest* request,
                                           ::UploadLocationsResponse* response) {
    if (request->replication_factor() < 0) {
        return Status(grpc::StatusCode::INVALID_ARGUMENT, "replication_factor must not be negative");
    }

    size_t wanted = request->replication_factor() == 0
        ? theManager->defaultReplicationFactor()
        : static_cast<size_t>(request->replication_factor());

    auto [code, nodes] = theManager->allocateUploadTargets(wanted);
    if (code != ErrorCode::OK) {
        return toGrpcStatus(code, "Not enough healthy nodes. Need " + std::to_string(wanted));
    }

    for (const auto& node : nodes) {
        fillEndpoint(response->add_nodes(), node, true);
    }
    return Status::OK;
}

Status MetaServiceImpl::RegisterFile(ServerContext* context, const ::RegisterFileRequest* request,
                                     ::Ack* response) {
    FileDescriptor descriptor;
    descriptor.file_id = request->file_id();
    descriptor.filename = request->filename();
    descriptor.total_chunks = request->total_chunks();
    descriptor.size = request->size();
    descriptor.content_type = request->content_type();

    ErrorCode code = theManager->registerFile(descriptor);
    if (code != ErrorCode::OK) {
        std::string message = code == ErrorCode::INVALID_DESCRIPTOR
            ? "Missing required fields (file_id, filename, total_chunks)"
            : "Failed to register file";
        return toGrpcStatus(code, message);
    }

    response->set_ok(true);
    response->set_message("File registered successfully");
    return Status::OK;
}

Status MetaServiceImpl::RegisterChunk(ServerContext* context, const ::RegisterChunkRequest* request,
                                      ::Ack* response) {
    std::vector<std::string> nodes(request->nodes().begin(), request->nodes().end());

    ErrorCode code = theManager->registerChunk(request->file_id(), request->index(),
                                               request->chunk_id(), request->size(), nodes);
    switch (code) {
        case ErrorCode::OK:
            response->set_ok(true);
            response->set_message("Chunk registered successfully");
            return Status::OK;
        case ErrorCode::FILE_NOT_FOUND:
            return toGrpcStatus(code, "File not found");
        case ErrorCode::INVALID_DESCRIPTOR:
            return toGrpcStatus(code, "Missing or invalid fields (chunk_id, index, nodes)");
        default:
            return toGrpcStatus(code, "Failed to register chunk");
    }
}

Status MetaServiceImpl::GetFileInfo(ServerContext* context, const ::FileRequest* request,
                                    ::FileInfoResponse* response) {
    auto [code, descriptor] = theManager->getFile(request->file_id());
    if (code != ErrorCode::OK) {
        return toGrpcStatus(code, code == ErrorCode::FILE_NOT_FOUND ? "File not found"
                                                                     : "Failed to load file record");
    }

    *response->mutable_file() = toFileRecord(descriptor);
    return Status::OK;
}

Status MetaServiceImpl::ListFiles(ServerContext* context, const ::ListFilesRequest* request,
                                  ::ListFilesResponse* response) {
    for (const auto& file : theManager->listFiles()) {
        FileSummary* summary = response->add_files();
        summary->set_file_id(file.file_id);
        summary->set_filename(file.filename);
        summary->set_size(file.size);
        summary->set_total_chunks(file.total_chunks);
        summary->set_content_type(file.content_type);
        summary->set_created_at(toEpochMillis(file.created_at));
    }
    return Status::OK;
}

Status MetaServiceImpl::GetChunkLocations(ServerContext* context, const ::ChunkLocationRequest* request,
                                          ::ChunkLocationResponse* response) {
    auto [code, location] = theManager->locateChunk(request->file_id(), request->index());
    switch (code) {
        case ErrorCode::OK:
            break;
        case ErrorCode::FILE_NOT_FOUND:
            return toGrpcStatus(code, "File not found");
        case ErrorCode::CHUNK_NOT_FOUND:
            return toGrpcStatus(code, "Chunk not found");
        case ErrorCode::NO_HEALTHY_REPLICA:
            return toGrpcStatus(code, "No healthy nodes found for this chunk");
        default:
            return toGrpcStatus(code, "Failed to locate chunk");
    }

    response->set_chunk_id(location.chunk.chunk_id);
    response->set_size(location.chunk.size);
    for (const auto& node : location.healthy_nodes) {
        fillEndpoint(response->add_nodes(), node, true);
    }
    return Status::OK;
}

Status MetaServiceImpl::GetNodeStatus(ServerContext* context, const ::NodeStatusRequest* request,
                                      ::NodeStatusResponse* response) {
    for (const auto& status : theManager->nodeStatus()) {
        fillEndpoint(response->add_nodes(), status.node, status.healthy);
    }
    return Status::OK;
}

Status MetaServiceImpl::DeleteFile(ServerContext* context, const ::FileRequest* request,
                                   ::DeleteFileResponse* response) {
    auto [code, report] = theManager->deleteFile(request->file_id());
    if (code != ErrorCode::OK) {
        return toGrpcStatus(code, code == ErrorCode::FILE_NOT_FOUND ? "File not found"
                                                                     : "Failed to delete file");
    }

    response->set_ok(true);
    response->set_message("File and all chunks deleted successfully");
    response->set_chunks_removed(static_cast<int32_t>(report.chunks_removed));
    response->set_replicas_deleted(static_cast<int32_t>(report.replicas_deleted));
    response->set_replicas_orphaned(static_cast<int32_t>(report.replicas_orphaned));
    return Status::OK;
}
