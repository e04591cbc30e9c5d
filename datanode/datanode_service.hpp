#pragma once

#include <string>
#include "dfs.grpc.pb.h"
#include "storage.hpp"
#include <grpcpp/grpcpp.h>

class DataNodeServiceImpl final : public DataNodeService::Service {
private:
    DataNodeStorage* storage;
    std::string node_id;

public:
    DataNodeServiceImpl(DataNodeStorage* storage, const std::string& node_id)
        : storage(storage), node_id(node_id) {}

    grpc::Status HealthCheck(grpc::ServerContext* context, const ::HealthCheckRequest* request,
                             ::HealthCheckResponse* response) override;

    grpc::Status StoreChunk(grpc::ServerContext* context, const ::StoreChunkRequest* request,
                            ::Ack* response) override;

    grpc::Status ReadChunk(grpc::ServerContext* context, const ::ChunkRequest* request,
                           ::ChunkData* response) override;

    grpc::Status DeleteChunk(grpc::ServerContext* context, const ::ChunkRequest* request,
                             ::Ack* response) override;

    grpc::Status ListChunks(grpc::ServerContext* context, const ::ListChunksRequest* request,
                            grpc::ServerWriter<::ChunkMetadata>* writer) override;
};
