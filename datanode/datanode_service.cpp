#include "datanode_service.hpp"
#include "grpc_status.hpp"
#include <iostream>
#include <vector>

using ::grpc::Status;
using ::grpc::ServerContext;

Status DataNodeServiceImpl::HealthCheck(ServerContext* context, const ::HealthCheckRequest* request,
                                        ::HealthCheckResponse* response) {
    response->set_status("healthy");
    response->set_node_id(node_id);
    return Status::OK;
}

Status DataNodeServiceImpl::StoreChunk(ServerContext* context, const ::StoreChunkRequest* request,
                                       ::Ack* response) {
    if (request->chunk_id().empty() || request->file_id().empty() || request->index() < 0) {
        return Status(grpc::StatusCode::INVALID_ARGUMENT,
                      "Missing required fields (chunk_id, file_id, index)");
    }
    if (request->size() != static_cast<int64_t>(request->data().size())) {
        return Status(grpc::StatusCode::INVALID_ARGUMENT,
                      "Declared size " + std::to_string(request->size()) + " does not match "
                      + std::to_string(request->data().size()) + " payload bytes");
    }

    std::vector<char> data(request->data().begin(), request->data().end());

    ErrorCode code = storage->putChunk(request->chunk_id(), request->file_id(), request->index(), data);
    if (code != ErrorCode::OK) {
        return toGrpcStatus(code, "Failed to store chunk " + request->chunk_id());
    }

    response->set_ok(true);
    response->set_message("Chunk stored successfully");
    return Status::OK;
}

Status DataNodeServiceImpl::ReadChunk(ServerContext* context, const ::ChunkRequest* request,
                                      ::ChunkData* response) {
    auto [code, stored] = storage->getChunk(request->chunk_id());
    if (code == ErrorCode::CHUNK_NOT_FOUND) {
        return toGrpcStatus(code, "Chunk not found");
    }
    if (code != ErrorCode::OK) {
        return toGrpcStatus(code, "Failed to read chunk " + request->chunk_id());
    }

    response->set_data(stored.data.data(), stored.data.size());
    *response->mutable_metadata() = stored.metadata;
    response->set_node_id(node_id);
    return Status::OK;
}

Status DataNodeServiceImpl::DeleteChunk(ServerContext* context, const ::ChunkRequest* request,
                                        ::Ack* response) {
    ErrorCode code = storage->deleteChunk(request->chunk_id());
    if (code == ErrorCode::CHUNK_NOT_FOUND) {
        return toGrpcStatus(code, "Chunk not found");
    }
    if (code != ErrorCode::OK) {
        return toGrpcStatus(code, "Failed to delete chunk " + request->chunk_id());
    }

    response->set_ok(true);
    response->set_message("Chunk deleted successfully");
    return Status::OK;
}

Status DataNodeServiceImpl::ListChunks(ServerContext* context, const ::ListChunksRequest* request,
                                       grpc::ServerWriter<::ChunkMetadata>* writer) {
    size_t sent = 0;
    storage->listChunks([&](const ChunkMetadata& metadata) {
        if (context->IsCancelled() || !writer->Write(metadata)) {
            return false;
        }
        ++sent;
        return true;
    });

    std::cout << "[INFO] Listed " << sent << " chunks\n";
    return Status::OK;
}
