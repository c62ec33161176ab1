#pragma once

#include <cstddef>
#include <optional>
#include <string>
#include <vector>

namespace mcpfs {

struct ServerConfig {
    std::string sandbox_root;
    std::size_t max_workers = 4;
    std::size_t max_frame_bytes = 16 * 1024 * 1024;
    std::size_t max_file_bytes = 10 * 1024 * 1024;
    std::string server_name = "mcpfs";
};

struct ClientConfig {
    std::vector<std::string> command;  // argv of the server subprocess
    int call_timeout_ms = 30000;
    int startup_timeout_ms = 10000;
    int shutdown_grace_ms = 2000;
    std::size_t max_frame_bytes = 16 * 1024 * 1024;
    std::string client_name = "mcpfs-client";
};

struct AppConfig {
    ServerConfig server;
    ClientConfig client;
    std::optional<std::string> config_path;
    std::optional<std::string> log_file;
    std::optional<std::string> log_level;
    bool json_output = false;
    bool json_logs = false;
    int verbosity = 0;   // -v: 1, -vv: 2
    bool quiet = false;
    std::optional<bool> color;  // --color / --no-color
};

} // namespace mcpfs
