#include "config.hpp"
#include <algorithm>
#include <stdexcept>

std::vector<NodeInfo> defaultStorageNodes() {
    return {
        {"node1", "localhost:50061"},
        {"node2", "localhost:50062"},
        {"node3", "localhost:50063"}
    };
}

std::optional<NodeInfo> parseNodeEntry(const std::string& entry) {
    size_t eq = entry.find('=');
    if (eq == std::string::npos || eq == 0 || eq + 1 >= entry.size()) {
        return std::nullopt;
    }

    NodeInfo node;
    node.node_id = entry.substr(0, eq);
    node.address = entry.substr(eq + 1);

    // host:port with a numeric port
    size_t colon = node.address.rfind(':');
    if (colon == std::string::npos || colon == 0 || colon + 1 >= node.address.size()) {
        return std::nullopt;
    }
    std::string port = node.address.substr(colon + 1);
    if (!std::all_of(port.begin(), port.end(), [](char c) { return c >= '0' && c <= '9'; })) {
        return std::nullopt;
    }
    return node;
}

bool parseMetaServerArgs(int argc, char* argv[], MetaServerConfig& config,
                         bool& show_help, std::string& error) {
    show_help = false;
    std::vector<NodeInfo> nodes;

    try {
        for (int i = 1; i < argc; i++) {
            std::string arg = argv[i];
            bool has_value = i + 1 < argc;

            if (arg == "--listen" && has_value) {
                config.listen_address = argv[++i];
            } else if (arg == "--metadata-dir" && has_value) {
                config.metadata_dir = argv[++i];
            } else if (arg == "--node" && has_value) {
                std::string entry = argv[++i];
                auto node = parseNodeEntry(entry);
                if (!node) {
                    error = "invalid --node '" + entry + "', expected <id>=<host:port>";
                    return false;
                }
                nodes.push_back(*node);
            } else if (arg == "--replication-factor" && has_value) {
                long value = std::stol(argv[++i]);
                if (value <= 0) {
                    error = "--replication-factor must be positive";
                    return false;
                }
                config.replication_factor = static_cast<size_t>(value);
            } else if (arg == "--check-interval" && has_value) {
                long value = std::stol(argv[++i]);
                if (value <= 0) {
                    error = "--check-interval must be positive";
                    return false;
                }
                config.check_interval = std::chrono::seconds(value);
            } else if (arg == "--probe-timeout" && has_value) {
                long value = std::stol(argv[++i]);
                if (value <= 0) {
                    error = "--probe-timeout must be positive";
                    return false;
                }
                config.probe_timeout = std::chrono::milliseconds(value);
            } else if (arg == "--cache-capacity" && has_value) {
                long value = std::stol(argv[++i]);
                if (value <= 0) {
                    error = "--cache-capacity must be positive";
                    return false;
                }
                config.cache_capacity = static_cast<size_t>(value);
            } else if (arg == "--help") {
                show_help = true;
                return true;
            } else {
                error = "unknown or incomplete option '" + arg + "'";
                return false;
            }
        }
    } catch (const std::logic_error& e) {
        // std::stol throws invalid_argument / out_of_range
        error = std::string("invalid numeric value: ") + e.what();
        return false;
    }

    if (!nodes.empty()) {
        config.nodes = nodes;
    } else if (config.nodes.empty()) {
        config.nodes = defaultStorageNodes();
    }

    for (size_t i = 0; i < config.nodes.size(); ++i) {
        for (size_t j = i + 1; j < config.nodes.size(); ++j) {
            if (config.nodes[i].node_id == config.nodes[j].node_id) {
                error = "duplicate node id '" + config.nodes[i].node_id + "'";
                return false;
            }
        }
    }
    return true;
}
