#pragma once

#include <string>
#include <vector>
#include <optional>
#include <chrono>
#include "types.hpp"
#include "health_tracker.hpp"

struct MetaServerConfig {
    std::string listen_address = "0.0.0.0:50051";
    std::string metadata_dir = "./metadata";
    std::vector<NodeInfo> nodes;
    size_t replication_factor = 2;
    std::chrono::milliseconds check_interval = DEFAULT_CHECK_INTERVAL;
    std::chrono::milliseconds probe_timeout = DEFAULT_PROBE_TIMEOUT;
    size_t cache_capacity = 1000;
};

// The three local storage nodes used when no --node is given
std::vector<NodeInfo> defaultStorageNodes();

// Parses "<node_id>=<host:port>"
std::optional<NodeInfo> parseNodeEntry(const std::string& entry);

// Parses the MetaServer command line into `config`. Returns false and fills
// `error` on bad input; sets `show_help` when --help was given.
bool parseMetaServerArgs(int argc, char* argv[], MetaServerConfig& config,
                         bool& show_help, std::string& error);
