#pragma once

#include "dfs.grpc.pb.h"
#include "manager.hpp"
#include <grpcpp/grpcpp.h>

class MetaServiceImpl final : public MetaService::Service {
private:
    Manager* theManager;

public:
    explicit MetaServiceImpl(Manager* aManager) : theManager(aManager) {}

    grpc::Status HealthCheck(grpc::ServerContext* context, const ::HealthCheckRequest* request,
                             ::HealthCheckResponse* response) override;

    grpc::Status GetUploadLocations(grpc::ServerContext* context, const ::UploadLocationsRequest* request,
                                    ::UploadLocationsResponse* response) override;

    grpc::Status RegisterFile(grpc::ServerContext* context, const ::RegisterFileRequest* request,
                              ::Ack* response) override;

    grpc::Status RegisterChunk(grpc::ServerContext* context, const ::RegisterChunkRequest* request,
                               ::Ack* response) override;

    grpc::Status GetFileInfo(grpc::ServerContext* context, const ::FileRequest* request,
                             ::FileInfoResponse* response) override;

    grpc::Status ListFiles(grpc::ServerContext* context, const ::ListFilesRequest* request,
                           ::ListFilesResponse* response) override;

    grpc::Status GetChunkLocations(grpc::ServerContext* context, const ::ChunkLocationRequest* request,
                                   ::ChunkLocationResponse* response) override;

    grpc::Status GetNodeStatus(grpc::ServerContext* context, const ::NodeStatusRequest* request,
                               ::NodeStatusResponse* response) override;

    grpc::Status DeleteFile(grpc::ServerContext* context, const ::FileRequest* request,
                            ::DeleteFileResponse* response) override;
};
