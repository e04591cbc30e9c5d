#include <gtest/gtest.h>
#include "../utils/test_utils.hpp"
#include "dfs_client.hpp"
#include "node_transport.hpp"
#include <filesystem>
#include <set>
#include <algorithm>

constexpr size_t TEST_CHUNK_SIZE = 64 * 1024;

// MetaServer with replication factor 2 in front of three DataNodes.
class FullSystemTest : public ::testing::Test {
protected:
    void SetUp() override {
        for (int i = 1; i <= 3; ++i) {
            storage_dirs_.push_back(std::make_unique<test_utils::TempDirectory>());
            datanodes_.push_back(std::make_unique<test_utils::TestDataNode>(
                "node" + std::to_string(i), storage_dirs_.back()->path()));
            ASSERT_TRUE(datanodes_.back()->start()) << "Failed to start node" << i;
        }

        std::vector<NodeInfo> nodes;
        for (const auto& datanode : datanodes_) {
            nodes.push_back(datanode->info());
        }

        metaserver_ = std::make_unique<test_utils::TestMetaServer>(nodes, metadata_.path(), 2);
        ASSERT_TRUE(metaserver_->start()) << "Failed to start MetaServer";

        client_ = makeClient(0);
        ASSERT_TRUE(client_->IsMetaServerAvailable());
    }

    void TearDown() override {
        if (metaserver_) {
            metaserver_->stop();
        }
        for (auto& datanode : datanodes_) {
            datanode->stop();
        }
    }

    std::unique_ptr<DfsClient> makeClient(int32_t replication) {
        return std::make_unique<DfsClient>(test_utils::createChannel(metaserver_->address()),
                                           &transport_, TEST_CHUNK_SIZE, replication);
    }

    test_utils::TestDataNode* nodeById(const std::string& node_id) {
        for (auto& datanode : datanodes_) {
            if (datanode->info().node_id == node_id) {
                return datanode.get();
            }
        }
        return nullptr;
    }

    size_t totalStoredChunks() {
        size_t total = 0;
        for (auto& datanode : datanodes_) {
            total += datanode->storage()->getChunkCount();
        }
        return total;
    }

    test_utils::TempDirectory metadata_;
    test_utils::TempDirectory downloads_;
    std::vector<std::unique_ptr<test_utils::TempDirectory>> storage_dirs_;
    std::vector<std::unique_ptr<test_utils::TestDataNode>> datanodes_;
    std::unique_ptr<test_utils::TestMetaServer> metaserver_;
    GrpcNodeTransport transport_;
    std::unique_ptr<DfsClient> client_;
};

TEST_F(FullSystemTest, SmallFileUploadDownload) {
    std::string text = "Hello ReplicaDFS! This is a test file for end-to-end testing.";
    test_utils::TempFile test_file(std::vector<char>(text.begin(), text.end()));

    auto upload = client_->UploadFile(test_file.path());
    ASSERT_EQ(upload.result, ErrorCode::OK) << upload.message;
    EXPECT_EQ(upload.total_chunks, 1);
    EXPECT_EQ(upload.size, static_cast<int64_t>(text.size()));
    ASSERT_EQ(upload.chunks.size(), 1u);
    EXPECT_EQ(upload.chunks[0].replication.status, ReplicationStatus::FULL);
    EXPECT_EQ(upload.chunks[0].replication.stored_on.size(), 2u);

    for (const auto& node_id : upload.chunks[0].replication.stored_on) {
        test_utils::TestDataNode* node = nodeById(node_id);
        ASSERT_NE(node, nullptr);
        test_utils::expectChunkStored(node->storagePath(), upload.file_id, upload.chunks[0].chunk_id);
    }

    std::string output = downloads_.file_path("small.txt");
    auto download = client_->DownloadFile(upload.file_id, output);
    ASSERT_EQ(download.result, ErrorCode::OK) << download.message;
    EXPECT_EQ(download.size, static_cast<int64_t>(text.size()));
    test_utils::expectFilesEqual(test_file.path(), output);
}

TEST_F(FullSystemTest, MultiChunkRoundTrip) {
    auto data = test_utils::generateRandomData(5 * TEST_CHUNK_SIZE + 1234);
    test_utils::TempFile test_file(data);

    auto upload = client_->UploadFile(test_file.path());
    ASSERT_EQ(upload.result, ErrorCode::OK) << upload.message;
    EXPECT_EQ(upload.total_chunks, 6);
    EXPECT_EQ(totalStoredChunks(), 12u);

    std::set<std::string> chunk_ids;
    for (const auto& chunk : upload.chunks) {
        EXPECT_EQ(chunk.result, ErrorCode::OK);
        chunk_ids.insert(chunk.chunk_id);
    }
    EXPECT_EQ(chunk_ids.size(), 6u);

    std::string output = downloads_.file_path("nested/dir/out.bin");
    auto download = client_->DownloadFile(upload.file_id, output);
    ASSERT_EQ(download.result, ErrorCode::OK) << download.message;
    test_utils::expectDataEqual(test_utils::readFile(output), data);
}

TEST_F(FullSystemTest, EmptyFileRoundTrip) {
    test_utils::TempFile test_file;

    auto upload = client_->UploadFile(test_file.path());
    ASSERT_EQ(upload.result, ErrorCode::OK) << upload.message;
    EXPECT_EQ(upload.total_chunks, 1);
    EXPECT_EQ(upload.size, 0);

    std::string output = downloads_.file_path("empty.bin");
    auto download = client_->DownloadFile(upload.file_id, output);
    ASSERT_EQ(download.result, ErrorCode::OK) << download.message;
    EXPECT_EQ(std::filesystem::file_size(output), 0u);
}

TEST_F(FullSystemTest, FileInfoAfterUpload) {
    auto data = test_utils::generatePatternData(3 * TEST_CHUNK_SIZE, "replica");
    test_utils::TempFile test_file(data);

    auto upload = client_->UploadFile(test_file.path());
    ASSERT_EQ(upload.result, ErrorCode::OK) << upload.message;

    auto [code, record] = client_->GetFileInfo(upload.file_id);
    ASSERT_EQ(code, ErrorCode::OK);
    EXPECT_EQ(record.filename(), upload.filename);
    EXPECT_EQ(record.size(), static_cast<int64_t>(data.size()));
    EXPECT_EQ(record.total_chunks(), 3);
    ASSERT_EQ(record.chunks_size(), 3);
    for (int32_t index = 0; index < 3; ++index) {
        const auto& chunk = record.chunks().at(index);
        EXPECT_EQ(chunk.index(), index);
        EXPECT_EQ(chunk.size(), static_cast<int64_t>(TEST_CHUNK_SIZE));
        EXPECT_EQ(chunk.nodes_size(), 2);
    }
}

TEST_F(FullSystemTest, DownloadSurvivesNodeFailure) {
    auto data = test_utils::generateRandomData(4 * TEST_CHUNK_SIZE);
    test_utils::TempFile test_file(data);

    auto upload = client_->UploadFile(test_file.path());
    ASSERT_EQ(upload.result, ErrorCode::OK) << upload.message;

    // Every chunk has two replicas, so any single node can go away
    datanodes_[0]->stop();
    metaserver_->probeNodes();

    std::string output = downloads_.file_path("after_failure.bin");
    auto download = client_->DownloadFile(upload.file_id, output);
    ASSERT_EQ(download.result, ErrorCode::OK) << download.message;
    test_utils::expectDataEqual(test_utils::readFile(output), data);
}

TEST_F(FullSystemTest, DownloadFallsThroughStaleHealth) {
    auto data = test_utils::generateRandomData(4 * TEST_CHUNK_SIZE);
    test_utils::TempFile test_file(data);

    auto upload = client_->UploadFile(test_file.path());
    ASSERT_EQ(upload.result, ErrorCode::OK) << upload.message;

    // The MetaServer still believes node2 is healthy; the client tries the next replica
    datanodes_[1]->stop();

    std::string output = downloads_.file_path("stale.bin");
    auto download = client_->DownloadFile(upload.file_id, output);
    ASSERT_EQ(download.result, ErrorCode::OK) << download.message;
    test_utils::expectDataEqual(test_utils::readFile(output), data);
}

TEST_F(FullSystemTest, LostReplicaFailsDownload) {
    auto single = makeClient(1);
    auto data = test_utils::generateRandomData(3 * TEST_CHUNK_SIZE);
    test_utils::TempFile test_file(data);

    auto upload = single->UploadFile(test_file.path());
    ASSERT_EQ(upload.result, ErrorCode::OK) << upload.message;
    ASSERT_EQ(upload.chunks[0].replication.stored_on.size(), 1u);

    nodeById(upload.chunks[0].replication.stored_on[0])->stop();
    metaserver_->probeNodes();

    std::string output = downloads_.file_path("lost.bin");
    auto download = single->DownloadFile(upload.file_id, output);
    EXPECT_EQ(download.result, ErrorCode::NO_HEALTHY_REPLICA);
    ASSERT_TRUE(download.failed_index.has_value());
    EXPECT_EQ(*download.failed_index, 0);
    EXPECT_FALSE(std::filesystem::exists(output));
}

TEST_F(FullSystemTest, PartialReplicationIsRegistered) {
    auto triple = makeClient(3);
    auto data = test_utils::generateRandomData(2 * TEST_CHUNK_SIZE);
    test_utils::TempFile test_file(data);

    // Stopped but not yet probed, so placement still hands it out
    datanodes_[2]->stop();

    auto upload = triple->UploadFile(test_file.path());
    ASSERT_EQ(upload.result, ErrorCode::OK) << upload.message;
    for (const auto& chunk : upload.chunks) {
        EXPECT_EQ(chunk.replication.status, ReplicationStatus::PARTIAL);
        EXPECT_EQ(chunk.replication.requested, 3u);
        EXPECT_EQ(chunk.replication.stored_on.size(), 2u);
        EXPECT_EQ(std::count(chunk.replication.stored_on.begin(), chunk.replication.stored_on.end(),
                             "node3"), 0);
    }

    auto [code, record] = triple->GetFileInfo(upload.file_id);
    ASSERT_EQ(code, ErrorCode::OK);
    for (const auto& [index, chunk] : record.chunks()) {
        EXPECT_EQ(chunk.nodes_size(), 2) << "chunk " << index;
    }

    metaserver_->probeNodes();
    std::string output = downloads_.file_path("partial.bin");
    auto download = triple->DownloadFile(upload.file_id, output);
    ASSERT_EQ(download.result, ErrorCode::OK) << download.message;
    test_utils::expectDataEqual(test_utils::readFile(output), data);
}

TEST_F(FullSystemTest, TotalUploadFailure) {
    test_utils::TempFile test_file(test_utils::generateRandomData(1000));

    for (auto& datanode : datanodes_) {
        datanode->stop();
    }

    auto upload = client_->UploadFile(test_file.path());
    EXPECT_EQ(upload.result, ErrorCode::TOTAL_UPLOAD_FAILURE);
    ASSERT_EQ(upload.chunks.size(), 1u);
    EXPECT_EQ(upload.chunks[0].replication.status, ReplicationStatus::FAILED);

    auto [code, record] = client_->GetFileInfo(upload.file_id);
    ASSERT_EQ(code, ErrorCode::OK);
    EXPECT_EQ(record.chunks_size(), 0);
}

TEST_F(FullSystemTest, NotEnoughHealthyNodes) {
    auto wide = makeClient(4);
    test_utils::TempFile test_file(test_utils::generateRandomData(1000));

    auto upload = wide->UploadFile(test_file.path());
    EXPECT_EQ(upload.result, ErrorCode::INSUFFICIENT_HEALTHY_NODES);
    EXPECT_EQ(totalStoredChunks(), 0u);
}

TEST_F(FullSystemTest, ListAndDeleteFiles) {
    test_utils::TempFile first(test_utils::generateRandomData(2 * TEST_CHUNK_SIZE));
    test_utils::TempFile second(test_utils::generateRandomData(100));

    auto upload_first = client_->UploadFile(first.path());
    auto upload_second = client_->UploadFile(second.path());
    ASSERT_EQ(upload_first.result, ErrorCode::OK);
    ASSERT_EQ(upload_second.result, ErrorCode::OK);
    EXPECT_EQ(totalStoredChunks(), 6u);

    auto [list_code, files] = client_->ListFiles();
    ASSERT_EQ(list_code, ErrorCode::OK);
    ASSERT_EQ(files.size(), 2u);

    auto [delete_code, summary] = client_->DeleteFile(upload_first.file_id);
    ASSERT_EQ(delete_code, ErrorCode::OK);
    EXPECT_EQ(summary.chunks_removed, 2);
    EXPECT_EQ(summary.replicas_deleted, 4);
    EXPECT_EQ(summary.replicas_orphaned, 0);
    EXPECT_EQ(totalStoredChunks(), 2u);

    auto [after_code, remaining] = client_->ListFiles();
    ASSERT_EQ(after_code, ErrorCode::OK);
    ASSERT_EQ(remaining.size(), 1u);
    EXPECT_EQ(remaining[0].file_id, upload_second.file_id);

    EXPECT_EQ(client_->GetFileInfo(upload_first.file_id).first, ErrorCode::FILE_NOT_FOUND);
    EXPECT_EQ(client_->DeleteFile(upload_first.file_id).first, ErrorCode::FILE_NOT_FOUND);
    EXPECT_EQ(client_->DownloadFile(upload_first.file_id, downloads_.file_path("gone")).result,
              ErrorCode::FILE_NOT_FOUND);
}

TEST_F(FullSystemTest, DeleteWithNodeDownLeavesOrphans) {
    test_utils::TempFile test_file(test_utils::generateRandomData(100));
    auto upload = client_->UploadFile(test_file.path());
    ASSERT_EQ(upload.result, ErrorCode::OK);

    const std::string& down_id = upload.chunks[0].replication.stored_on[0];
    nodeById(down_id)->stop();
    metaserver_->probeNodes();

    auto [code, summary] = client_->DeleteFile(upload.file_id);
    ASSERT_EQ(code, ErrorCode::OK);
    EXPECT_EQ(summary.replicas_deleted, 1);
    EXPECT_EQ(summary.replicas_orphaned, 1);
    EXPECT_EQ(client_->GetFileInfo(upload.file_id).first, ErrorCode::FILE_NOT_FOUND);
}

TEST_F(FullSystemTest, NodeStatus) {
    datanodes_[1]->stop();
    metaserver_->probeNodes();

    auto [code, nodes] = client_->GetNodeStatus();
    ASSERT_EQ(code, ErrorCode::OK);
    ASSERT_EQ(nodes.size(), 3u);
    EXPECT_TRUE(nodes[0].healthy);
    EXPECT_EQ(nodes[1].node_id, "node2");
    EXPECT_FALSE(nodes[1].healthy);
    EXPECT_TRUE(nodes[2].healthy);
}

TEST_F(FullSystemTest, UploadMissingFile) {
    auto upload = client_->UploadFile(downloads_.file_path("does_not_exist"));
    EXPECT_NE(upload.result, ErrorCode::OK);
    EXPECT_TRUE(upload.file_id.empty());
}

TEST_F(FullSystemTest, MetaServerUnavailable) {
    metaserver_->stop();

    DfsClient offline(test_utils::createChannel(metaserver_->address()), &transport_,
                      TEST_CHUNK_SIZE, 0, std::chrono::milliseconds(500));
    EXPECT_FALSE(offline.IsMetaServerAvailable());
}

TEST(DfsClientTest, GuessContentType) {
    EXPECT_EQ(DfsClient::GuessContentType("notes.txt"), "text/plain");
    EXPECT_EQ(DfsClient::GuessContentType("IMAGE.PNG"), "image/png");
    EXPECT_EQ(DfsClient::GuessContentType("/a/b/archive.tar"), "application/x-tar");
    EXPECT_EQ(DfsClient::GuessContentType("noext"), "application/octet-stream");
}
