#pragma once

#include <string>
#include <vector>

#include "../rpc/server_config.hpp"

namespace toolproxy {
namespace runtime {

// Environment variable that overrides the upstream server command line
constexpr const char *kInnerCommandEnv = "TOOLPROXY_INNER_CMD";

struct LoggingConfig {
    std::string level = "info";  // debug, info, warn, error
};

struct MaskingConfig {
    bool enabled = true;  // Mask search results with the default rules
};

// Proxy section configuration (proxy: in YAML)
struct ProxySettings {
    std::string upstream;  // Server backing the masked toolset (empty = none)
    MaskingConfig masking;
};

struct ProxyConfig {
    std::vector<rpc::ServerConfig> servers;
    ProxySettings proxy;
    LoggingConfig logging;

    // nullptr when no server has that name
    const rpc::ServerConfig *find_server(const std::string &name) const;
};

// Split a command line on whitespace; the first word becomes `command`, the rest are
// prepended to `args`. A Python interpreter command gets `-u` (unbuffered stdout) unless
// already present. Returns false for a blank command line.
bool apply_command_line(const std::string &command_line, rpc::ServerConfig &server);

// Loads configuration from a YAML file
bool load_config(const std::string &config_path, ProxyConfig &config, std::string &error);

// Validates the configuration
bool validate_config(const ProxyConfig &config, std::string &error);

}  // namespace runtime
}  // namespace toolproxy
