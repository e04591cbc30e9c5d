#include <iostream>
#include <thread>
#include <chrono>
#include <atomic>
#include <csignal>
#include <stdexcept>
#include <grpcpp/grpcpp.h>
#include <grpcpp/server.h>
#include <grpcpp/server_builder.h>
#include "datanode_service.hpp"
#include "storage.hpp"

using grpc::Server;
using grpc::ServerBuilder;

// Global flag for graceful shutdown
std::atomic<bool> running{true};

void runDataNode(const std::string& listen_addr,
                 const std::string& node_id,
                 const std::string& storage_path,
                 int64_t storage_capacity) {

    // Initialize storage
    DataNodeStorage storage(storage_path, storage_capacity);

    // Perform initial health check
    if (!storage.performHealthCheck()) {
        std::cerr << "[WARNING] Health check found issues, continuing anyway\n";
    }

    DataNodeServiceImpl service(&storage, node_id);

    ServerBuilder builder;
    builder.AddListeningPort(listen_addr, grpc::InsecureServerCredentials());
    builder.SetMaxReceiveMessageSize(64 * 1024 * 1024);
    builder.SetMaxSendMessageSize(64 * 1024 * 1024);
    builder.RegisterService(&service);

    std::unique_ptr<Server> server(builder.BuildAndStart());

    if (!server) {
        std::cerr << "[ERROR] Failed to start DataNode server on " << listen_addr << "\n";
        return;
    }

    std::cout << "[INFO] DataNode " << node_id << " listening on " << listen_addr << "\n";
    std::cout << "[INFO] Storage path: " << storage_path << "\n";
    std::cout << "[INFO] Storage capacity: " << storage_capacity / (1024*1024*1024) << " GB\n";

    auto on_signal = [](int) { running = false; };
    signal(SIGINT, on_signal);
    signal(SIGTERM, on_signal);

    std::thread shutdown_watcher([&server]() {
        while (running.load()) {
            std::this_thread::sleep_for(std::chrono::milliseconds(200));
        }
        std::cout << "\n[INFO] Shutdown signal received\n";
        server->Shutdown();
    });

    // Wait for server to shutdown
    server->Wait();

    running = false;
    if (shutdown_watcher.joinable()) {
        shutdown_watcher.join();
    }

    std::cout << "[INFO] DataNode shutdown complete\n";
}

int main(int argc, char* argv[]) {
    std::string listen_addr = "0.0.0.0:50061";
    std::string node_id = "node1";
    std::string storage_path = "./datanode_storage";
    int64_t storage_capacity = 10L * 1024 * 1024 * 1024;  // Default 10GB

    for (int i = 1; i < argc; i++) {
        std::string arg = argv[i];
        try {
            if (arg == "--listen" && i + 1 < argc) {
                listen_addr = argv[++i];
            } else if (arg == "--node-id" && i + 1 < argc) {
                node_id = argv[++i];
            } else if (arg == "--storage-path" && i + 1 < argc) {
                storage_path = argv[++i];
            } else if (arg == "--storage-capacity" && i + 1 < argc) {
                int64_t gigabytes = std::stoll(argv[++i]);
                if (gigabytes <= 0) {
                    std::cerr << "[ERROR] --storage-capacity must be positive\n";
                    return 1;
                }
                storage_capacity = gigabytes * 1024 * 1024 * 1024;  // Convert GB to bytes
            } else if (arg == "--help") {
                std::cout << "Usage: " << argv[0] << " [options]\n"
                          << "Options:\n"
                          << "  --listen <addr>            Listen address (default: 0.0.0.0:50061)\n"
                          << "  --node-id <id>             Node id reported to callers (default: node1)\n"
                          << "  --storage-path <path>      Storage directory path (default: ./datanode_storage)\n"
                          << "  --storage-capacity <GB>    Storage capacity in GB (default: 10)\n"
                          << "  --help                     Show this help message\n";
                return 0;
            } else {
                std::cerr << "[ERROR] Unknown or incomplete option: " << arg << "\n";
                std::cerr << "Run with --help for usage\n";
                return 1;
            }
        } catch (const std::logic_error&) {
            std::cerr << "[ERROR] Invalid numeric value for " << arg << "\n";
            return 1;
        }
    }

    std::cout << "====================================\n";
    std::cout << "      ReplicaDFS DataNode Starting  \n";
    std::cout << "====================================\n";

    try {
        runDataNode(listen_addr, node_id, storage_path, storage_capacity);
    } catch (const std::filesystem::filesystem_error& e) {
        std::cerr << "[ERROR] Storage initialization failed: " << e.what() << "\n";
        return 1;
    }

    return 0;
}
