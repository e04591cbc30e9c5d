#include <string>
#include <iostream>
#include <sstream>
#include <iomanip>
#include <vector>
#include <ctime>
#include <algorithm>
#include <stdexcept>
#include "dfs_client.hpp"
#include "node_transport.hpp"
#include "dfs.grpc.pb.h"
#include <grpcpp/grpcpp.h>

std::vector<std::string> ParseCommand(const std::string& line) {
    std::istringstream iss(line);
    std::vector<std::string> tokens;
    std::string s;
    while (iss >> s) {
        tokens.push_back(s);
    }
    return tokens;
}

std::string FormatSize(int64_t size) {
    std::ostringstream out;
    if (size < 1024) {
        out << size << " B";
    } else if (size < 1024 * 1024) {
        out << std::fixed << std::setprecision(1) << size / 1024.0 << " KB";
    } else {
        out << std::fixed << std::setprecision(1) << size / (1024.0 * 1024.0) << " MB";
    }
    return out.str();
}

std::string FormatTime(int64_t epoch_ms) {
    std::time_t seconds = static_cast<std::time_t>(epoch_ms / 1000);
    std::tm local{};
    localtime_r(&seconds, &local);

    std::ostringstream out;
    out << std::put_time(&local, "%Y-%m-%d %H:%M:%S");
    return out.str();
}

void PrintTable(const std::vector<std::string>& headers, const std::vector<std::vector<std::string>>& rows) {
    std::vector<size_t> widths(headers.size());
    for (size_t i = 0; i < headers.size(); ++i) {
        widths[i] = headers[i].size();
        for (const auto& row : rows) {
            widths[i] = std::max(widths[i], row[i].size());
        }
    }

    auto separator = [&]() {
        std::cout << "+";
        for (size_t width : widths) {
            std::cout << std::string(width + 2, '-') << "+";
        }
        std::cout << "\n";
    };
    auto line = [&](const std::vector<std::string>& cells) {
        std::cout << "|";
        for (size_t i = 0; i < cells.size(); ++i) {
            std::cout << " " << std::left << std::setw(static_cast<int>(widths[i])) << cells[i] << " |";
        }
        std::cout << "\n";
    };

    separator();
    line(headers);
    separator();
    for (const auto& row : rows) {
        line(row);
    }
    separator();
}

bool RunCommand(DfsClient& client, const std::vector<std::string>& tokens) {
    const std::string& cmd = tokens[0];

    if (cmd == "upload" && tokens.size() == 2) {
        UploadReport report = client.UploadFile(tokens[1]);
        if (report.result != ErrorCode::OK) {
            return false;
        }
        for (const auto& chunk : report.chunks) {
            std::cout << "  chunk " << chunk.index << ": "
                      << replicationStatusName(chunk.replication.status) << " ("
                      << chunk.replication.stored_on.size() << "/" << chunk.replication.requested
                      << " replicas)\n";
        }
        std::cout << "File ID: " << report.file_id << "\n";
        return true;
    }

    if (cmd == "download" && (tokens.size() == 2 || tokens.size() == 3)) {
        DownloadReport report = client.DownloadFile(tokens[1], tokens.size() == 3 ? tokens[2] : "");
        if (report.result != ErrorCode::OK) {
            if (report.failed_index) {
                std::cerr << "[ERROR] Download failed at chunk " << *report.failed_index << "\n";
            }
            return false;
        }
        return true;
    }

    if (cmd == "list" && tokens.size() == 1) {
        auto [code, files] = client.ListFiles();
        if (code != ErrorCode::OK) {
            return false;
        }
        if (files.empty()) {
            std::cout << "No files found in the system\n";
            return true;
        }

        std::vector<std::vector<std::string>> rows;
        for (const auto& file : files) {
            rows.push_back({file.filename, file.file_id, FormatSize(file.size),
                            std::to_string(file.total_chunks), FormatTime(file.created_at)});
        }
        PrintTable({"Filename", "File ID", "Size", "Chunks", "Created"}, rows);
        return true;
    }

    if (cmd == "delete" && tokens.size() == 2) {
        auto [code, summary] = client.DeleteFile(tokens[1]);
        if (code == ErrorCode::FILE_NOT_FOUND) {
            std::cerr << "[ERROR] File not found: " << tokens[1] << "\n";
            return false;
        }
        if (code != ErrorCode::OK) {
            return false;
        }
        std::cout << "[SUCCESS] File " << tokens[1] << " deleted ("
                  << summary.chunks_removed << " chunks, "
                  << summary.replicas_deleted << " replicas removed, "
                  << summary.replicas_orphaned << " orphaned)\n";
        return true;
    }

    if (cmd == "status" && tokens.size() == 1) {
        auto [code, nodes] = client.GetNodeStatus();
        if (code != ErrorCode::OK) {
            return false;
        }

        std::vector<std::vector<std::string>> rows;
        for (const auto& node : nodes) {
            rows.push_back({node.node_id, node.address, node.healthy ? "ONLINE" : "OFFLINE"});
        }
        PrintTable({"Node ID", "Address", "Status"}, rows);
        return true;
    }

    std::cout << "[ERROR] Invalid command.\n";
    return false;
}

void PrintCommands() {
    std::cout << "Commands:\n";
    std::cout << "  upload <path>\n";
    std::cout << "  download <file_id> [output]\n";
    std::cout << "  list\n";
    std::cout << "  delete <file_id>\n";
    std::cout << "  status\n";
    std::cout << "  exit\n";
}

void RunInteractive(DfsClient& client) {
    std::cout << "ReplicaDFS Client Started\n";
    PrintCommands();

    std::string line;
    while (true) {
        std::cout << "> ";
        if (!std::getline(std::cin, line)) {
            break;
        }
        auto tokens = ParseCommand(line);
        if (tokens.empty()) continue;

        if (tokens[0] == "exit") {
            break;
        }
        RunCommand(client, tokens);
    }
}

int main(int argc, char* argv[]) {
    std::string metaserver_addr = "localhost:50051";
    size_t chunk_size = DEFAULT_CHUNK_SIZE;
    int32_t replication = 0;
    std::vector<std::string> command;

    for (int i = 1; i < argc; i++) {
        std::string arg = argv[i];
        try {
            if (arg == "--metaserver" && i + 1 < argc) {
                metaserver_addr = argv[++i];
            } else if (arg == "--chunk-size" && i + 1 < argc) {
                long long value = std::stoll(argv[++i]);
                if (value <= 0) {
                    std::cerr << "[ERROR] --chunk-size must be positive\n";
                    return 1;
                }
                chunk_size = static_cast<size_t>(value);
            } else if (arg == "--replication" && i + 1 < argc) {
                replication = std::stoi(argv[++i]);
                if (replication < 0) {
                    std::cerr << "[ERROR] --replication must not be negative\n";
                    return 1;
                }
            } else if (arg == "--help") {
                std::cout << "Usage: " << argv[0] << " [options] [command]\n"
                          << "Options:\n"
                          << "  --metaserver <addr>     MetaServer address (default: localhost:50051)\n"
                          << "  --chunk-size <bytes>    Chunk size for uploads (default: 1048576)\n"
                          << "  --replication <n>       Replicas per chunk, 0 = server default (default: 0)\n"
                          << "  --help                  Show this help message\n"
                          << "Without a command the client starts an interactive prompt.\n";
                PrintCommands();
                return 0;
            } else {
                command.push_back(arg);
            }
        } catch (const std::logic_error&) {
            std::cerr << "[ERROR] Invalid numeric value for " << arg << "\n";
            return 1;
        }
    }

    grpc::ChannelArguments channel_args;
    channel_args.SetMaxReceiveMessageSize(64 * 1024 * 1024);
    std::shared_ptr<grpc::ChannelInterface> channel{
        grpc::CreateCustomChannel(metaserver_addr, grpc::InsecureChannelCredentials(), channel_args)
    };

    GrpcNodeTransport transport;
    DfsClient client{channel, &transport, chunk_size, replication};

    if (!client.IsMetaServerAvailable()) {
        std::cerr << "[ERROR] MetaServer at " << metaserver_addr << " is not available\n";
        return 1;
    }

    if (!command.empty()) {
        return RunCommand(client, command) ? 0 : 1;
    }

    RunInteractive(client);
    return 0;
}
