#include "config.hpp"

#include <yaml-cpp/yaml.h>

#include <algorithm>
#include <cstdlib>
#include <set>
#include <sstream>

#include "../logging/logger.hpp"

namespace toolproxy {
namespace runtime {

const rpc::ServerConfig *ProxyConfig::find_server(const std::string &name) const {
    for (const auto &server : servers) {
        if (server.name == name) {
            return &server;
        }
    }
    return nullptr;
}

namespace {
bool is_python_interpreter(const std::string &command) {
    const auto slash = command.find_last_of('/');
    const std::string base = slash == std::string::npos ? command : command.substr(slash + 1);
    if (base.rfind("python", 0) != 0) {
        return false;
    }
    // python, python3, python3.12
    return base.find_first_not_of("0123456789.", 6) == std::string::npos;
}
}  // namespace

bool apply_command_line(const std::string &command_line, rpc::ServerConfig &server) {
    std::istringstream words(command_line);
    std::vector<std::string> parts;
    std::string word;
    while (words >> word) {
        parts.push_back(word);
    }
    if (parts.empty()) {
        return false;
    }

    server.command = parts.front();
    parts.erase(parts.begin());

    // Python block-buffers stdout on a pipe; -u keeps responses flowing line by line
    if (is_python_interpreter(server.command) && std::find(parts.begin(), parts.end(), "-u") == parts.end()) {
        parts.insert(parts.begin(), "-u");
    }
    server.args.insert(server.args.begin(), parts.begin(), parts.end());
    return true;
}

bool validate_config(const ProxyConfig &config, std::string &error) {
    // Validate server settings
    if (config.servers.empty()) {
        error = "Config must specify at least one server";
        return false;
    }

    std::set<std::string> names;
    for (const auto &server : config.servers) {
        if (server.name.empty()) {
            error = "Server missing 'name' field";
            return false;
        }
        if (!names.insert(server.name).second) {
            error = "Duplicate server name: '" + server.name + "'";
            return false;
        }
        if (server.command.empty()) {
            error = "Server '" + server.name + "' missing 'command' field";
            return false;
        }
        if (server.timeout_ms < 100) {
            error = "Server '" + server.name + "' timeout_ms must be >= 100ms";
            return false;
        }
        if (server.handshake_timeout_ms < 100) {
            error = "Server '" + server.name + "' handshake_timeout_ms must be >= 100ms";
            return false;
        }
        if (server.shutdown_grace_ms < 0) {
            error = "Server '" + server.name + "' shutdown_grace_ms must be >= 0";
            return false;
        }

        // Validate restart policy
        const auto &policy = server.restart_policy;
        if (policy.enabled) {
            if (policy.max_attempts < 1) {
                error = "Server '" + server.name + "' restart policy max_attempts must be >= 1";
                return false;
            }

            // Validate backoff array length matches max_attempts
            if (policy.backoff_ms.size() != static_cast<size_t>(policy.max_attempts)) {
                error = "Server '" + server.name + "' restart policy backoff_ms array length (" +
                        std::to_string(policy.backoff_ms.size()) + ") must match max_attempts (" +
                        std::to_string(policy.max_attempts) + ")";
                return false;
            }

            for (size_t i = 0; i < policy.backoff_ms.size(); ++i) {
                if (policy.backoff_ms[i] < 0) {
                    error = "Server '" + server.name + "' restart policy backoff_ms[" + std::to_string(i) +
                            "] must be >= 0";
                    return false;
                }
            }

            if (policy.success_reset_ms < 0) {
                error = "Server '" + server.name + "' restart policy success_reset_ms must be >= 0";
                return false;
            }
        }
    }

    // Validate proxy settings
    if (!config.proxy.upstream.empty() && !config.find_server(config.proxy.upstream)) {
        error = "proxy.upstream '" + config.proxy.upstream + "' does not name a configured server";
        return false;
    }

    // Validate Logging settings
    if (!logging::is_valid_level(config.logging.level)) {
        error = "Invalid log level: " + config.logging.level;
        return false;
    }

    return true;
}

namespace {
rpc::ServerConfig parse_server(const YAML::Node &node) {
    rpc::ServerConfig server;

    if (node["name"]) {
        server.name = node["name"].as<std::string>();
    }

    if (node["args"]) {
        for (const auto &arg : node["args"]) {
            server.args.push_back(arg.as<std::string>());
        }
    }

    // "uvx opensearch-mcp-server-py" carries its own arguments
    if (node["command"]) {
        apply_command_line(node["command"].as<std::string>(), server);
    }

    if (node["env"]) {
        for (const auto &entry : node["env"]) {
            server.env[entry.first.as<std::string>()] = entry.second.as<std::string>();
        }
    }

    if (node["timeout_ms"]) {
        server.timeout_ms = node["timeout_ms"].as<int>();
    }
    if (node["handshake_timeout_ms"]) {
        server.handshake_timeout_ms = node["handshake_timeout_ms"].as<int>();
    }
    if (node["shutdown_grace_ms"]) {
        server.shutdown_grace_ms = node["shutdown_grace_ms"].as<int>();
    }

    // Parse restart policy
    if (node["restart_policy"]) {
        const auto &rp = node["restart_policy"];

        if (rp["enabled"]) {
            server.restart_policy.enabled = rp["enabled"].as<bool>();
        }
        if (rp["max_attempts"]) {
            server.restart_policy.max_attempts = rp["max_attempts"].as<int>();
        }
        if (rp["backoff_ms"]) {
            server.restart_policy.backoff_ms.clear();
            for (const auto &backoff : rp["backoff_ms"]) {
                server.restart_policy.backoff_ms.push_back(backoff.as<int>());
            }
        }
        if (rp["success_reset_ms"]) {
            server.restart_policy.success_reset_ms = rp["success_reset_ms"].as<int>();
        }
    }

    return server;
}
}  // namespace

bool load_config(const std::string &config_path, ProxyConfig &config, std::string &error) {
    try {
        YAML::Node yaml = YAML::LoadFile(config_path);

        // Check for unknown top-level keys
        const std::set<std::string> valid_keys = {"servers", "proxy", "logging"};
        for (const auto &key_node : yaml) {
            std::string key = key_node.first.as<std::string>();
            if (valid_keys.count(key) == 0) {
                LOG_WARN("[Config] Unknown top-level key: '" << key << "' (will be ignored)");
            }
        }

        // Load servers
        if (yaml["servers"]) {
            config.servers.clear();  // Ensure idempotent parsing
            for (const auto &server_node : yaml["servers"]) {
                config.servers.push_back(parse_server(server_node));
            }
        }

        // Load proxy config
        if (yaml["proxy"]) {
            if (yaml["proxy"]["upstream"]) {
                config.proxy.upstream = yaml["proxy"]["upstream"].as<std::string>();
            }
            if (yaml["proxy"]["masking"] && yaml["proxy"]["masking"]["enabled"]) {
                config.proxy.masking.enabled = yaml["proxy"]["masking"]["enabled"].as<bool>();
            }
        }

        // Load logging config
        if (yaml["logging"]) {
            if (yaml["logging"]["level"]) {
                config.logging.level = yaml["logging"]["level"].as<std::string>();
            }
        }

        // Upstream command override from the environment
        const char *inner_cmd = std::getenv(kInnerCommandEnv);
        if (inner_cmd != nullptr && !config.proxy.upstream.empty()) {
            for (auto &server : config.servers) {
                if (server.name != config.proxy.upstream) {
                    continue;
                }
                rpc::ServerConfig overridden = server;
                overridden.args.clear();
                if (apply_command_line(inner_cmd, overridden)) {
                    LOG_INFO("[Config] " << kInnerCommandEnv << " overrides command of '" << server.name << "'");
                    server = overridden;
                } else {
                    LOG_WARN("[Config] Ignoring blank " << kInnerCommandEnv);
                }
            }
        }

        if (!validate_config(config, error)) {
            return false;
        }

        LOG_INFO("[Config] Loaded " << config.servers.size() << " server(s)");
        for (const auto &server : config.servers) {
            std::stringstream server_msg;
            server_msg << "[Config]   " << server.name << ": " << server.command;
            for (const auto &arg : server.args) {
                server_msg << " " << arg;
            }
            server_msg << " (timeout " << server.timeout_ms << "ms, restarts "
                       << (server.restart_policy.enabled ? std::to_string(server.restart_policy.max_attempts)
                                                         : std::string("unlimited"))
                       << ")";
            LOG_INFO(server_msg.str());
        }

        std::stringstream proxy_msg;
        proxy_msg << "[Config] Proxy upstream: " << (config.proxy.upstream.empty() ? "none" : config.proxy.upstream);
        if (!config.proxy.upstream.empty()) {
            proxy_msg << " (masking " << (config.proxy.masking.enabled ? "enabled" : "disabled") << ")";
        }
        LOG_INFO(proxy_msg.str());

        LOG_INFO("[Config] Log level: " << config.logging.level);

        return true;
    } catch (const YAML::BadFile &e) {
        error = "Cannot open config file: " + config_path;
        return false;
    } catch (const YAML::ParserException &e) {
        error = "YAML parse error: " + std::string(e.what());
        return false;
    } catch (const std::exception &e) {
        error = "Config load error: " + std::string(e.what());
        return false;
    }
}

}  // namespace runtime
}  // namespace toolproxy
