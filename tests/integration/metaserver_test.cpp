#include <gtest/gtest.h>
#include "../utils/test_utils.hpp"
#include "dfs.grpc.pb.h"
#include "chunker.hpp"
#include "grpc_status.hpp"
#include <grpcpp/grpcpp.h>
#include <set>

// Two running DataNodes plus a third configured node that is never started.
class MetaServerTest : public ::testing::Test {
protected:
    void SetUp() override {
        datanode1_ = std::make_unique<test_utils::TestDataNode>("node1", storage1_.path());
        datanode2_ = std::make_unique<test_utils::TestDataNode>("node2", storage2_.path());
        ASSERT_TRUE(datanode1_->start()) << "Failed to start node1";
        ASSERT_TRUE(datanode2_->start()) << "Failed to start node2";

        std::vector<NodeInfo> nodes = {
            datanode1_->info(),
            datanode2_->info(),
            NodeInfo{"node3", test_utils::createTestAddress()}
        };

        metaserver_ = std::make_unique<test_utils::TestMetaServer>(nodes, metadata_.path(), 2);
        ASSERT_TRUE(metaserver_->start()) << "Failed to start MetaServer";

        channel_ = test_utils::createChannel(metaserver_->address());
        stub_ = MetaService::NewStub(channel_);
    }

    void TearDown() override {
        if (metaserver_) {
            metaserver_->stop();
        }
        datanode1_->stop();
        datanode2_->stop();
    }

    grpc::Status registerFile(const std::string& file_id, int32_t total_chunks) {
        RegisterFileRequest request;
        request.set_file_id(file_id);
        request.set_filename(file_id + ".bin");
        request.set_total_chunks(total_chunks);
        request.set_size(total_chunks * 16);

        Ack response;
        grpc::ClientContext context;
        return stub_->RegisterFile(&context, request, &response);
    }

    grpc::Status registerChunk(const std::string& file_id, int32_t index, const std::string& chunk_id,
                               const std::vector<std::string>& nodes) {
        RegisterChunkRequest request;
        request.set_file_id(file_id);
        request.set_chunk_id(chunk_id);
        request.set_index(index);
        request.set_size(16);
        for (const auto& node : nodes) {
            request.add_nodes(node);
        }

        Ack response;
        grpc::ClientContext context;
        return stub_->RegisterChunk(&context, request, &response);
    }

    test_utils::TempDirectory metadata_;
    test_utils::TempDirectory storage1_;
    test_utils::TempDirectory storage2_;
    std::unique_ptr<test_utils::TestDataNode> datanode1_;
    std::unique_ptr<test_utils::TestDataNode> datanode2_;
    std::unique_ptr<test_utils::TestMetaServer> metaserver_;
    std::shared_ptr<grpc::Channel> channel_;
    std::unique_ptr<MetaService::Stub> stub_;
};

TEST_F(MetaServerTest, HealthCheck) {
    HealthCheckRequest request;
    HealthCheckResponse response;
    grpc::ClientContext context;

    ASSERT_TRUE(stub_->HealthCheck(&context, request, &response).ok());
    EXPECT_EQ(response.status(), "healthy");
}

TEST_F(MetaServerTest, NodeStatusReflectsProbes) {
    NodeStatusRequest request;
    NodeStatusResponse response;
    grpc::ClientContext context;

    ASSERT_TRUE(stub_->GetNodeStatus(&context, request, &response).ok());
    ASSERT_EQ(response.nodes_size(), 3);
    EXPECT_EQ(response.nodes(0).node_id(), "node1");
    EXPECT_TRUE(response.nodes(0).healthy());
    EXPECT_TRUE(response.nodes(1).healthy());
    EXPECT_EQ(response.nodes(2).node_id(), "node3");
    EXPECT_FALSE(response.nodes(2).healthy());
}

TEST_F(MetaServerTest, UploadLocationsUseOnlyHealthyNodes) {
    for (int attempt = 0; attempt < 10; ++attempt) {
        UploadLocationsRequest request;
        request.set_replication_factor(2);
        UploadLocationsResponse response;
        grpc::ClientContext context;

        ASSERT_TRUE(stub_->GetUploadLocations(&context, request, &response).ok());
        ASSERT_EQ(response.nodes_size(), 2);

        std::set<std::string> ids;
        for (const auto& node : response.nodes()) {
            EXPECT_NE(node.node_id(), "node3");
            EXPECT_TRUE(node.healthy());
            ids.insert(node.node_id());
        }
        EXPECT_EQ(ids.size(), 2u);
    }
}

TEST_F(MetaServerTest, UploadLocationsDefaultFactor) {
    UploadLocationsRequest request;
    UploadLocationsResponse response;
    grpc::ClientContext context;

    ASSERT_TRUE(stub_->GetUploadLocations(&context, request, &response).ok());
    EXPECT_EQ(response.nodes_size(), 2);
}

TEST_F(MetaServerTest, UploadLocationsScarcity) {
    UploadLocationsRequest request;
    request.set_replication_factor(3);
    UploadLocationsResponse response;
    grpc::ClientContext context;

    grpc::Status status = stub_->GetUploadLocations(&context, request, &response);
    EXPECT_EQ(status.error_code(), grpc::StatusCode::UNAVAILABLE);
    EXPECT_EQ(status.error_message(), "Not enough healthy nodes. Need 3");
    EXPECT_EQ(errorCodeFromDetails(status).value_or(ErrorCode::OK), ErrorCode::INSUFFICIENT_HEALTHY_NODES);
    EXPECT_EQ(response.nodes_size(), 0);
}

TEST_F(MetaServerTest, UploadLocationsRejectNegativeFactor) {
    UploadLocationsRequest request;
    request.set_replication_factor(-1);
    UploadLocationsResponse response;
    grpc::ClientContext context;

    EXPECT_EQ(stub_->GetUploadLocations(&context, request, &response).error_code(),
              grpc::StatusCode::INVALID_ARGUMENT);
}

TEST_F(MetaServerTest, RegisterFileRequiresFields) {
    EXPECT_TRUE(registerFile("f1", 2).ok());
    EXPECT_EQ(registerFile("", 2).error_code(), grpc::StatusCode::INVALID_ARGUMENT);
    EXPECT_EQ(registerFile("f2", 0).error_code(), grpc::StatusCode::INVALID_ARGUMENT);
}

TEST_F(MetaServerTest, RegisterChunkErrors) {
    ASSERT_TRUE(registerFile("f1", 2).ok());

    EXPECT_EQ(registerChunk("missing", 0, "c", {"node1"}).error_code(), grpc::StatusCode::NOT_FOUND);
    EXPECT_EQ(registerChunk("f1", 0, "c", {}).error_code(), grpc::StatusCode::INVALID_ARGUMENT);
    EXPECT_EQ(registerChunk("f1", 5, "c", {"node1"}).error_code(), grpc::StatusCode::INVALID_ARGUMENT);
    EXPECT_EQ(registerChunk("f1", 0, "c", {"node42"}).error_code(), grpc::StatusCode::INVALID_ARGUMENT);
    EXPECT_TRUE(registerChunk("f1", 0, "c", {"node1", "node2"}).ok());
}

TEST_F(MetaServerTest, GetFileInfo) {
    FileRequest request;
    request.set_file_id("f1");
    FileInfoResponse missing;
    grpc::ClientContext missing_context;
    EXPECT_EQ(stub_->GetFileInfo(&missing_context, request, &missing).error_code(),
              grpc::StatusCode::NOT_FOUND);

    ASSERT_TRUE(registerFile("f1", 2).ok());
    ASSERT_TRUE(registerChunk("f1", 1, "f1_1_x", {"node2"}).ok());

    FileInfoResponse response;
    grpc::ClientContext context;
    ASSERT_TRUE(stub_->GetFileInfo(&context, request, &response).ok());
    EXPECT_EQ(response.file().file_id(), "f1");
    EXPECT_EQ(response.file().filename(), "f1.bin");
    EXPECT_EQ(response.file().total_chunks(), 2);
    EXPECT_EQ(response.file().content_type(), "application/octet-stream");
    EXPECT_GT(response.file().created_at(), 0);
    ASSERT_EQ(response.file().chunks().count(1), 1u);
    EXPECT_EQ(response.file().chunks().at(1).chunk_id(), "f1_1_x");
    EXPECT_EQ(response.file().chunks().count(0), 0u);
}

TEST_F(MetaServerTest, ListFiles) {
    ASSERT_TRUE(registerFile("f1", 1).ok());
    ASSERT_TRUE(registerFile("f2", 3).ok());

    ListFilesRequest request;
    ListFilesResponse response;
    grpc::ClientContext context;
    ASSERT_TRUE(stub_->ListFiles(&context, request, &response).ok());
    ASSERT_EQ(response.files_size(), 2);

    std::set<std::string> ids;
    for (const auto& file : response.files()) {
        ids.insert(file.file_id());
    }
    EXPECT_EQ(ids, (std::set<std::string>{"f1", "f2"}));
}

TEST_F(MetaServerTest, ChunkLocations) {
    ASSERT_TRUE(registerFile("f1", 3).ok());
    ASSERT_TRUE(registerChunk("f1", 0, "f1_0_a", {"node3", "node1"}).ok());
    ASSERT_TRUE(registerChunk("f1", 1, "f1_1_b", {"node3"}).ok());

    ChunkLocationRequest request;
    request.set_file_id("f1");
    request.set_index(0);
    ChunkLocationResponse response;
    grpc::ClientContext context;
    ASSERT_TRUE(stub_->GetChunkLocations(&context, request, &response).ok());
    EXPECT_EQ(response.chunk_id(), "f1_0_a");
    ASSERT_EQ(response.nodes_size(), 1);
    EXPECT_EQ(response.nodes(0).node_id(), "node1");
    EXPECT_EQ(response.nodes(0).address(), datanode1_->address());

    // Only replica is on the node that never came up
    request.set_index(1);
    ChunkLocationResponse unhealthy;
    grpc::ClientContext unhealthy_context;
    grpc::Status unhealthy_status = stub_->GetChunkLocations(&unhealthy_context, request, &unhealthy);
    EXPECT_EQ(unhealthy_status.error_code(), grpc::StatusCode::UNAVAILABLE);
    EXPECT_EQ(errorCodeFromDetails(unhealthy_status).value_or(ErrorCode::OK), ErrorCode::NO_HEALTHY_REPLICA);

    request.set_index(2);
    ChunkLocationResponse unregistered;
    grpc::ClientContext unregistered_context;
    EXPECT_EQ(stub_->GetChunkLocations(&unregistered_context, request, &unregistered).error_code(),
              grpc::StatusCode::NOT_FOUND);
}

TEST_F(MetaServerTest, ChunkLocationsFollowNodeFailure) {
    ASSERT_TRUE(registerFile("f1", 1).ok());
    ASSERT_TRUE(registerChunk("f1", 0, "f1_0_a", {"node1", "node2"}).ok());

    datanode1_->stop();
    metaserver_->probeNodes();

    ChunkLocationRequest request;
    request.set_file_id("f1");
    request.set_index(0);
    ChunkLocationResponse response;
    grpc::ClientContext context;
    ASSERT_TRUE(stub_->GetChunkLocations(&context, request, &response).ok());
    ASSERT_EQ(response.nodes_size(), 1);
    EXPECT_EQ(response.nodes(0).node_id(), "node2");

    datanode2_->stop();
    metaserver_->probeNodes();

    ChunkLocationResponse none;
    grpc::ClientContext none_context;
    EXPECT_EQ(stub_->GetChunkLocations(&none_context, request, &none).error_code(),
              grpc::StatusCode::UNAVAILABLE);

    ASSERT_TRUE(datanode1_->start());
    metaserver_->probeNodes();

    ChunkLocationResponse recovered;
    grpc::ClientContext recovered_context;
    ASSERT_TRUE(stub_->GetChunkLocations(&recovered_context, request, &recovered).ok());
    ASSERT_EQ(recovered.nodes_size(), 1);
    EXPECT_EQ(recovered.nodes(0).node_id(), "node1");
}

TEST_F(MetaServerTest, DeleteFileRemovesReplicas) {
    std::vector<char> data(16, 'x');
    std::string chunk_id = Chunker::makeChunkId("f1", 0, data);
    ASSERT_EQ(datanode1_->storage()->putChunk(chunk_id, "f1", 0, data), ErrorCode::OK);
    ASSERT_EQ(datanode2_->storage()->putChunk(chunk_id, "f1", 0, data), ErrorCode::OK);

    ASSERT_TRUE(registerFile("f1", 1).ok());
    ASSERT_TRUE(registerChunk("f1", 0, chunk_id, {"node1", "node2"}).ok());

    FileRequest request;
    request.set_file_id("f1");
    DeleteFileResponse response;
    grpc::ClientContext context;
    ASSERT_TRUE(stub_->DeleteFile(&context, request, &response).ok());
    EXPECT_TRUE(response.ok());
    EXPECT_EQ(response.chunks_removed(), 1);
    EXPECT_EQ(response.replicas_deleted(), 2);
    EXPECT_EQ(response.replicas_orphaned(), 0);

    EXPECT_FALSE(datanode1_->storage()->hasChunk(chunk_id));
    EXPECT_FALSE(datanode2_->storage()->hasChunk(chunk_id));

    FileInfoResponse info;
    grpc::ClientContext info_context;
    EXPECT_EQ(stub_->GetFileInfo(&info_context, request, &info).error_code(), grpc::StatusCode::NOT_FOUND);

    DeleteFileResponse again;
    grpc::ClientContext again_context;
    EXPECT_EQ(stub_->DeleteFile(&again_context, request, &again).error_code(), grpc::StatusCode::NOT_FOUND);
}

TEST_F(MetaServerTest, RecordsSurviveRestart) {
    ASSERT_TRUE(registerFile("f1", 1).ok());
    ASSERT_TRUE(registerChunk("f1", 0, "f1_0_a", {"node1"}).ok());

    metaserver_->stop();
    ASSERT_TRUE(metaserver_->start());
    channel_ = test_utils::createChannel(metaserver_->address());
    stub_ = MetaService::NewStub(channel_);

    FileRequest request;
    request.set_file_id("f1");
    FileInfoResponse response;
    grpc::ClientContext context;
    ASSERT_TRUE(stub_->GetFileInfo(&context, request, &response).ok());
    EXPECT_EQ(response.file().chunks().at(0).nodes(0), "node1");
}

TEST_F(MetaServerTest, StartFailsOnUnusableMetadataDirectory) {
    test_utils::TempFile blocker(std::vector<char>{'x'});
    test_utils::TestMetaServer broken({datanode1_->info()}, blocker.path() + "/metadata");

    EXPECT_FALSE(broken.start());
    EXPECT_FALSE(broken.isRunning());
}
