#include <string>
#include <iostream>
#include <thread>
#include <atomic>
#include <csignal>
#include <filesystem>
#include "config.hpp"
#include "registry.hpp"
#include "health_tracker.hpp"
#include "placement.hpp"
#include "manager.hpp"
#include "meta_service.hpp"
#include "node_transport.hpp"
#include <grpcpp/server_builder.h>
#include <grpcpp/server.h>

using ::grpc::ServerBuilder;
using ::grpc::Server;

// Global flag for graceful shutdown
std::atomic<bool> running{true};

void RunServer(const MetaServerConfig& config) {
    GrpcNodeTransport transport;
    Registry registry(config.metadata_dir, config.cache_capacity);
    HealthTracker tracker(config.nodes, &transport, config.check_interval, config.probe_timeout);
    PlacementCoordinator placement(&tracker);
    Manager manager(&registry, &tracker, &placement, &transport, config.replication_factor);
    MetaServiceImpl service(&manager);

    ServerBuilder server_builder;
    server_builder.AddListeningPort(config.listen_address, grpc::InsecureServerCredentials());
    server_builder.RegisterService(&service);

    std::unique_ptr<Server> server{server_builder.BuildAndStart()};
    if (!server) {
        std::cerr << "[ERROR] Failed to start MetaServer on " << config.listen_address << "\n";
        return;
    }

    tracker.startMonitoring();

    std::cout << "[INFO] MetaServer listening on " << config.listen_address << "\n";
    std::cout << "[INFO] Metadata directory: " << config.metadata_dir << "\n";
    std::cout << "[INFO] Replication factor: " << config.replication_factor << "\n";
    for (const auto& node : config.nodes) {
        std::cout << "[INFO] Monitoring storage node " << node.node_id << " at " << node.address << "\n";
    }

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

    server->Wait();

    running = false;
    if (shutdown_watcher.joinable()) {
        shutdown_watcher.join();
    }

    tracker.stopMonitoring();
    std::cout << "[INFO] MetaServer shutdown complete\n";
}

int main(int argc, char* argv[]) {
    MetaServerConfig config;
    bool show_help = false;
    std::string error;

    if (!parseMetaServerArgs(argc, argv, config, show_help, error)) {
        std::cerr << "[ERROR] " << error << "\n";
        std::cerr << "Run with --help for usage\n";
        return 1;
    }

    if (show_help) {
        std::cout << "Usage: " << argv[0] << " [options]\n"
                  << "Options:\n"
                  << "  --listen <addr>               Listen address (default: 0.0.0.0:50051)\n"
                  << "  --metadata-dir <path>         File record directory (default: ./metadata)\n"
                  << "  --node <id>=<host:port>       Storage node, repeatable\n"
                  << "                                (default: node1..node3 on localhost:50061-50063)\n"
                  << "  --replication-factor <n>      Replicas per chunk (default: 2)\n"
                  << "  --check-interval <seconds>    Health probe interval (default: 30)\n"
                  << "  --probe-timeout <ms>          Health probe timeout (default: 5000)\n"
                  << "  --cache-capacity <records>    File record cache size (default: 1000)\n"
                  << "  --help                        Show this help message\n";
        return 0;
    }

    std::cout << "====================================\n";
    std::cout << "     ReplicaDFS MetaServer Starting \n";
    std::cout << "====================================\n";

    try {
        RunServer(config);
    } catch (const std::filesystem::filesystem_error& e) {
        std::cerr << "[ERROR] Metadata directory initialization failed: " << e.what() << "\n";
        return 1;
    }

    return 0;
}
