#include "dfs_client.hpp"
#include "grpc_status.hpp"
#include <fstream>
#include <iostream>
#include <algorithm>
#include <filesystem>
#include <unordered_map>
#include <cctype>
#include <grpcpp/grpcpp.h>

namespace {

// MetaServer replies carry their meaning in the status code.
ErrorCode fromMetaStatus(const grpc::Status& status, ErrorCode not_found) {
    switch (status.error_code()) {
        case grpc::StatusCode::OK:
            return ErrorCode::OK;
        case grpc::StatusCode::NOT_FOUND:
            return not_found;
        case grpc::StatusCode::INVALID_ARGUMENT:
            return ErrorCode::INVALID_DESCRIPTOR;
        case grpc::StatusCode::UNAVAILABLE:
            // Node scarcity and lost replicas share a status code; an
            // unreachable MetaServer attaches no details at all
            return errorCodeFromDetails(status).value_or(ErrorCode::TRANSPORT_FAILURE);
        case grpc::StatusCode::DEADLINE_EXCEEDED:
            return ErrorCode::TRANSPORT_FAILURE;
        default:
            return ErrorCode::STORAGE_ERROR;
    }
}

// The trailing segment of a chunk id is the MD5 of its payload.
bool matchesChunkId(const std::string& chunk_id, const Chunk& chunk) {
    auto separator = chunk_id.rfind('_');
    if (separator == std::string::npos) {
        return false;
    }
    return chunk_id.substr(separator + 1) == Chunker::md5Hex(chunk.data.data(), chunk.data.size());
}

std::vector<NodeInfo> toNodes(const google::protobuf::RepeatedPtrField<NodeEndpoint>& endpoints) {
    std::vector<NodeInfo> nodes;
    nodes.reserve(endpoints.size());
    for (const auto& endpoint : endpoints) {
        nodes.push_back(NodeInfo{endpoint.node_id(), endpoint.address()});
    }
    return nodes;
}

} // namespace

DfsClient::DfsClient(std::shared_ptr<grpc::ChannelInterface> aChannel,
                     NodeTransport* aTransport,
                     size_t aChunkSize,
                     int32_t aReplication,
                     std::chrono::milliseconds aTimeout)
    : theStub{aChannel}, theTransport{aTransport}, theChunkSize{aChunkSize},
      theReplication{aReplication}, theTimeout{aTimeout} {}

void DfsClient::setDeadline(grpc::ClientContext& context) const {
    context.set_deadline(std::chrono::system_clock::now() + theTimeout);
}

bool DfsClient::IsMetaServerAvailable() {
    HealthCheckRequest request;
    HealthCheckResponse response;
    grpc::ClientContext context;
    setDeadline(context);

    return theStub.HealthCheck(&context, request, &response).ok();
}

std::string DfsClient::GuessContentType(const std::string& path) {
    static const std::unordered_map<std::string, std::string> types = {
        {".txt", "text/plain"},
        {".md", "text/markdown"},
        {".csv", "text/csv"},
        {".html", "text/html"},
        {".htm", "text/html"},
        {".css", "text/css"},
        {".js", "application/javascript"},
        {".json", "application/json"},
        {".xml", "application/xml"},
        {".pdf", "application/pdf"},
        {".zip", "application/zip"},
        {".gz", "application/gzip"},
        {".tar", "application/x-tar"},
        {".png", "image/png"},
        {".jpg", "image/jpeg"},
        {".jpeg", "image/jpeg"},
        {".gif", "image/gif"},
        {".svg", "image/svg+xml"},
        {".mp3", "audio/mpeg"},
        {".wav", "audio/x-wav"},
        {".mp4", "video/mp4"},
    };

    std::string extension = std::filesystem::path(path).extension().string();
    std::transform(extension.begin(), extension.end(), extension.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

    auto it = types.find(extension);
    return it == types.end() ? "application/octet-stream" : it->second;
}

UploadReport DfsClient::UploadFile(const std::string& path) {
    UploadReport report;

    Chunker chunker(theChunkSize);
    auto [split_code, file] = chunker.splitFile(path);
    if (split_code != ErrorCode::OK) {
        report.result = split_code;
        report.message = "Cannot read file: " + path;
        std::cerr << "[ERROR] " << report.message << "\n";
        return report;
    }

    report.file_id = file.file_id;
    report.filename = file.filename;
    report.size = file.size;
    report.total_chunks = file.total_chunks;

    std::cout << "[INFO] File split into " << file.total_chunks << " chunks\n";

    // Register the file before any chunk so chunk registrations have a parent
    {
        RegisterFileRequest request;
        request.set_file_id(file.file_id);
        request.set_filename(file.filename);
        request.set_size(file.size);
        request.set_total_chunks(file.total_chunks);
        request.set_content_type(GuessContentType(path));

        Ack ack;
        grpc::ClientContext context;
        setDeadline(context);

        grpc::Status status = theStub.RegisterFile(&context, request, &ack);
        if (!status.ok()) {
            report.result = fromMetaStatus(status, ErrorCode::FILE_NOT_FOUND);
            report.message = "Failed to register file with MetaServer: " + status.error_message();
            std::cerr << "[ERROR] " << report.message << "\n";
            return report;
        }
    }

    for (const Chunk& chunk : file.chunks) {
        ChunkUploadResult chunk_result;
        chunk_result.index = chunk.index;
        chunk_result.chunk_id = chunk.chunk_id;
        chunk_result.size = static_cast<int64_t>(chunk.data.size());

        UploadLocationsRequest locations_request;
        locations_request.set_replication_factor(theReplication);

        UploadLocationsResponse locations;
        grpc::ClientContext locations_context;
        setDeadline(locations_context);

        grpc::Status status = theStub.GetUploadLocations(&locations_context, locations_request, &locations);
        if (!status.ok()) {
            chunk_result.result = fromMetaStatus(status, ErrorCode::FILE_NOT_FOUND);
            report.chunks.push_back(chunk_result);
            report.result = chunk_result.result;
            report.message = "Failed to get upload locations for chunk " + std::to_string(chunk.index)
                             + ": " + status.error_message();
            std::cerr << "[ERROR] " << report.message << "\n";
            return report;
        }

        std::vector<NodeInfo> targets = toNodes(locations.nodes());
        std::vector<ReplicaOutcome> outcomes = storeOnAll(theTransport, targets, chunk);
        chunk_result.replication = summarizeReplication(outcomes, targets.size());

        if (chunk_result.replication.status == ReplicationStatus::FAILED) {
            chunk_result.result = ErrorCode::TOTAL_UPLOAD_FAILURE;
            report.chunks.push_back(chunk_result);
            report.result = ErrorCode::TOTAL_UPLOAD_FAILURE;
            report.message = "Failed to upload chunk " + std::to_string(chunk.index) + " to any node";
            std::cerr << "[ERROR] " << report.message << "\n";
            return report;
        }

        if (chunk_result.replication.status == ReplicationStatus::PARTIAL) {
            std::cerr << "[WARNING] Chunk " << chunk.index << " stored on "
                      << chunk_result.replication.stored_on.size() << " of "
                      << chunk_result.replication.requested << " nodes\n";
        }

        RegisterChunkRequest register_request;
        register_request.set_file_id(file.file_id);
        register_request.set_chunk_id(chunk.chunk_id);
        register_request.set_index(chunk.index);
        register_request.set_size(chunk_result.size);
        for (const auto& node_id : chunk_result.replication.stored_on) {
            register_request.add_nodes(node_id);
        }

        Ack ack;
        grpc::ClientContext register_context;
        setDeadline(register_context);

        status = theStub.RegisterChunk(&register_context, register_request, &ack);
        if (!status.ok()) {
            chunk_result.result = fromMetaStatus(status, ErrorCode::FILE_NOT_FOUND);
            report.chunks.push_back(chunk_result);
            report.result = chunk_result.result;
            report.message = "Failed to register chunk " + std::to_string(chunk.index)
                             + ": " + status.error_message();
            std::cerr << "[ERROR] " << report.message << "\n";
            return report;
        }

        std::cout << "[INFO] Chunk " << chunk.index + 1 << "/" << file.total_chunks
                  << " registered on " << chunk_result.replication.stored_on.size() << " nodes\n";
        report.chunks.push_back(chunk_result);
    }

    report.message = "File " + file.filename + " (ID: " + file.file_id + ") uploaded successfully";
    std::cout << "[SUCCESS] " << report.message << "\n";
    return report;
}

std::pair<ErrorCode, FileRecord> DfsClient::GetFileInfo(const std::string& file_id) {
    FileRequest request;
    request.set_file_id(file_id);

    FileInfoResponse response;
    grpc::ClientContext context;
    setDeadline(context);

    grpc::Status status = theStub.GetFileInfo(&context, request, &response);
    if (!status.ok()) {
        return {fromMetaStatus(status, ErrorCode::FILE_NOT_FOUND), FileRecord{}};
    }
    return {ErrorCode::OK, response.file()};
}

DownloadReport DfsClient::DownloadFile(const std::string& file_id, const std::string& output_path) {
    DownloadReport report;
    report.file_id = file_id;

    auto [info_code, record] = GetFileInfo(file_id);
    if (info_code != ErrorCode::OK) {
        report.result = info_code;
        report.message = info_code == ErrorCode::FILE_NOT_FOUND
            ? "File not found: " + file_id
            : "Failed to get file info for " + file_id;
        std::cerr << "[ERROR] " << report.message << "\n";
        return report;
    }

    report.output_path = output_path.empty() ? record.filename() : output_path;
    std::cout << "[INFO] Downloading " << record.filename() << " (ID: " << file_id << ") with "
              << record.total_chunks() << " chunks\n";

    std::vector<Chunk> chunks;
    chunks.reserve(record.total_chunks());

    for (int32_t index = 0; index < record.total_chunks(); ++index) {
        ChunkLocationRequest request;
        request.set_file_id(file_id);
        request.set_index(index);

        ChunkLocationResponse location;
        grpc::ClientContext context;
        setDeadline(context);

        grpc::Status status = theStub.GetChunkLocations(&context, request, &location);
        if (!status.ok()) {
            report.result = fromMetaStatus(status, ErrorCode::CHUNK_NOT_FOUND);
            report.failed_index = index;
            report.message = "Cannot locate chunk " + std::to_string(index) + ": " + status.error_message();
            std::cerr << "[ERROR] " << report.message << "\n";
            return report;
        }

        Chunk chunk;
        std::string served_by;
        ErrorCode code = fetchFirstAvailable(theTransport, location.chunk_id(), toNodes(location.nodes()),
                                             chunk, &served_by, matchesChunkId);
        if (code != ErrorCode::OK) {
            report.result = ErrorCode::NO_HEALTHY_REPLICA;
            report.failed_index = index;
            report.message = "Failed to retrieve chunk " + std::to_string(index) + " from any node";
            std::cerr << "[ERROR] " << report.message << "\n";
            return report;
        }

        std::cout << "[INFO] Retrieved chunk " << index + 1 << "/" << record.total_chunks()
                  << " from " << served_by << "\n";

        chunk.index = index;
        report.size += static_cast<int64_t>(chunk.data.size());
        chunks.push_back(std::move(chunk));
    }

    Chunker chunker(theChunkSize);
    ErrorCode code = chunker.reassemble(std::move(chunks), report.output_path, record.total_chunks());
    if (code != ErrorCode::OK) {
        report.result = code;
        report.message = std::string("Error reassembling the file: ") + errorCodeName(code);
        std::cerr << "[ERROR] " << report.message << "\n";
        return report;
    }

    report.message = "File downloaded successfully to " + report.output_path;
    std::cout << "[SUCCESS] " << report.message << "\n";
    return report;
}

std::pair<ErrorCode, std::vector<FileListing>> DfsClient::ListFiles() {
    ListFilesRequest request;
    ListFilesResponse response;
    grpc::ClientContext context;
    setDeadline(context);

    grpc::Status status = theStub.ListFiles(&context, request, &response);
    if (!status.ok()) {
        std::cerr << "[ERROR] Failed to list files: " << status.error_message() << "\n";
        return {fromMetaStatus(status, ErrorCode::FILE_NOT_FOUND), {}};
    }

    std::vector<FileListing> files;
    for (const auto& summary : response.files()) {
        FileListing file;
        file.file_id = summary.file_id();
        file.filename = summary.filename();
        file.size = summary.size();
        file.total_chunks = summary.total_chunks();
        file.content_type = summary.content_type();
        file.created_at = summary.created_at();
        files.push_back(file);
    }
    return {ErrorCode::OK, files};
}

std::pair<ErrorCode, std::vector<NodeListing>> DfsClient::GetNodeStatus() {
    NodeStatusRequest request;
    NodeStatusResponse response;
    grpc::ClientContext context;
    setDeadline(context);

    grpc::Status status = theStub.GetNodeStatus(&context, request, &response);
    if (!status.ok()) {
        std::cerr << "[ERROR] Failed to get node status: " << status.error_message() << "\n";
        return {fromMetaStatus(status, ErrorCode::FILE_NOT_FOUND), {}};
    }

    std::vector<NodeListing> nodes;
    for (const auto& endpoint : response.nodes()) {
        nodes.push_back(NodeListing{endpoint.node_id(), endpoint.address(), endpoint.healthy()});
    }
    return {ErrorCode::OK, nodes};
}

std::pair<ErrorCode, DeleteSummary> DfsClient::DeleteFile(const std::string& file_id) {
    FileRequest request;
    request.set_file_id(file_id);

    DeleteFileResponse response;
    grpc::ClientContext context;
    setDeadline(context);

    grpc::Status status = theStub.DeleteFile(&context, request, &response);
    if (!status.ok()) {
        std::cerr << "[ERROR] Failed to delete file " << file_id << ": " << status.error_message() << "\n";
        return {fromMetaStatus(status, ErrorCode::FILE_NOT_FOUND), {}};
    }

    DeleteSummary summary;
    summary.chunks_removed = response.chunks_removed();
    summary.replicas_deleted = response.replicas_deleted();
    summary.replicas_orphaned = response.replicas_orphaned();

    if (summary.replicas_orphaned > 0) {
        std::cerr << "[WARNING] " << summary.replicas_orphaned
                  << " replicas could not be removed from their nodes\n";
    }
    return {ErrorCode::OK, summary};
}
