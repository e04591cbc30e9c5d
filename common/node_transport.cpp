#include "node_transport.hpp"
#include "grpc_status.hpp"
#include <iostream>

namespace {

void setDeadline(grpc::ClientContext& context, std::chrono::milliseconds timeout) {
    context.set_deadline(std::chrono::system_clock::now() + timeout);
}

} // namespace

std::unique_ptr<DataNodeService::Stub> GrpcNodeTransport::stubFor(const std::string& address) {
    std::lock_guard<std::mutex> lock(channels_mutex);

    auto it = channels.find(address);
    if (it == channels.end()) {
        grpc::ChannelArguments args;
        args.SetMaxReceiveMessageSize(64 * 1024 * 1024);
        args.SetMaxSendMessageSize(64 * 1024 * 1024);
        auto channel = grpc::CreateCustomChannel(address, grpc::InsecureChannelCredentials(), args);
        it = channels.emplace(address, channel).first;
    }
    return DataNodeService::NewStub(it->second);
}

ErrorCode GrpcNodeTransport::healthCheck(const NodeInfo& node, std::chrono::milliseconds timeout) {
    auto stub = stubFor(node.address);

    HealthCheckRequest request;
    HealthCheckResponse response;
    grpc::ClientContext context;
    setDeadline(context, timeout);

    grpc::Status status = stub->HealthCheck(&context, request, &response);
    if (!status.ok()) {
        return ErrorCode::TRANSPORT_FAILURE;
    }
    return ErrorCode::OK;
}

ErrorCode GrpcNodeTransport::storeChunk(const NodeInfo& node, const Chunk& chunk,
                                        std::chrono::milliseconds timeout) {
    auto stub = stubFor(node.address);

    StoreChunkRequest request;
    request.set_chunk_id(chunk.chunk_id);
    request.set_file_id(chunk.file_id);
    request.set_index(chunk.index);
    request.set_size(static_cast<int64_t>(chunk.data.size()));
    request.set_data(chunk.data.data(), chunk.data.size());

    Ack ack;
    grpc::ClientContext context;
    setDeadline(context, timeout);

    grpc::Status status = stub->StoreChunk(&context, request, &ack);
    if (!status.ok()) {
        std::cerr << "[WARNING] Failed to store chunk " << chunk.chunk_id << " on "
                  << node.node_id << ": " << status.error_message() << "\n";
        if (status.error_code() == grpc::StatusCode::INTERNAL) {
            return ErrorCode::STORAGE_ERROR;
        }
        return ErrorCode::TRANSPORT_FAILURE;
    }
    if (!ack.ok()) {
        std::cerr << "[WARNING] Node " << node.node_id << " refused chunk "
                  << chunk.chunk_id << ": " << ack.message() << "\n";
        return ErrorCode::STORAGE_ERROR;
    }
    return ErrorCode::OK;
}

ErrorCode GrpcNodeTransport::fetchChunk(const NodeInfo& node, const std::string& chunk_id,
                                        Chunk& out, std::chrono::milliseconds timeout) {
    auto stub = stubFor(node.address);

    ChunkRequest request;
    request.set_chunk_id(chunk_id);

    ChunkData response;
    grpc::ClientContext context;
    setDeadline(context, timeout);

    grpc::Status status = stub->ReadChunk(&context, request, &response);
    if (!status.ok()) {
        std::cerr << "[WARNING] Failed to retrieve chunk " << chunk_id << " from "
                  << node.node_id << ": " << status.error_message() << "\n";
        return fromGrpcStatus(status);
    }

    out.chunk_id = response.metadata().chunk_id().empty() ? chunk_id : response.metadata().chunk_id();
    out.file_id = response.metadata().file_id();
    out.index = response.metadata().index();
    out.data.assign(response.data().begin(), response.data().end());
    return ErrorCode::OK;
}

ErrorCode GrpcNodeTransport::deleteChunk(const NodeInfo& node, const std::string& chunk_id,
                                         std::chrono::milliseconds timeout) {
    auto stub = stubFor(node.address);

    ChunkRequest request;
    request.set_chunk_id(chunk_id);

    Ack ack;
    grpc::ClientContext context;
    setDeadline(context, timeout);

    grpc::Status status = stub->DeleteChunk(&context, request, &ack);
    return fromGrpcStatus(status);
}
