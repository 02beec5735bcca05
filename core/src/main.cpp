// toolproxy
// Config-driven MCP tool client with a masked OpenSearch proxy toolset

#include <chrono>
#include <filesystem>
#include <iostream>
#include <memory>
#include <nlohmann/json.hpp>
#include <optional>
#include <string>

#include "logging/logger.hpp"
#include "masking/regex_masker.hpp"
#include "proxy/masked_toolset.hpp"
#include "rpc/tool_client.hpp"
#include "rpc/tool_client_registry.hpp"
#include "runtime/config.hpp"
#include "runtime/signal_handler.hpp"

namespace {

void print_usage() {
    std::cerr << "Usage: toolproxy --config=PATH [COMMAND]\n\n";
    std::cerr << "Commands (default: --list-tools):\n";
    std::cerr << "  --list-tools         List the tools of every configured server\n";
    std::cerr << "  --call NAME          Call tool NAME on a server\n";
    std::cerr << "  --proxy NAME         Call masked proxy tool NAME (search_index_masked, list_indices,\n";
    std::cerr << "                       get_index_mapping) on the proxy upstream\n\n";
    std::cerr << "Options:\n";
    std::cerr << "  --config=PATH        Path to config file (default: toolproxy.yaml)\n";
    std::cerr << "  --server NAME        Server for --call (default: proxy upstream, else the first server)\n";
    std::cerr << "  --args JSON          Tool arguments as a JSON object (default: {})\n";
    std::cerr << "  --timeout-ms N       Deadline for --call (default: server timeout_ms)\n";
    std::cerr << "  --help, -h           Show this help\n";
}

enum class Command { LIST_TOOLS, CALL, PROXY };

struct Options {
    std::string config_path = "toolproxy.yaml";
    Command command = Command::LIST_TOOLS;
    std::string tool;
    std::string server;
    std::string args_json = "{}";
    std::optional<int> timeout_ms;
};

// Returns 0 to continue, otherwise the process exit code + 1
int parse_args(int argc, char **argv, Options &options) {
    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        auto next = [&](std::string &out) {
            if (i + 1 >= argc) {
                std::cerr << "Missing value for " << arg << "\n";
                return false;
            }
            out = argv[++i];
            return true;
        };

        if (arg == "--config") {
            if (!next(options.config_path)) return 2;
        } else if (arg.rfind("--config=", 0) == 0) {
            options.config_path = arg.substr(9);
        } else if (arg == "--list-tools") {
            options.command = Command::LIST_TOOLS;
        } else if (arg == "--call") {
            options.command = Command::CALL;
            if (!next(options.tool)) return 2;
        } else if (arg == "--proxy") {
            options.command = Command::PROXY;
            if (!next(options.tool)) return 2;
        } else if (arg == "--server") {
            if (!next(options.server)) return 2;
        } else if (arg == "--args") {
            if (!next(options.args_json)) return 2;
        } else if (arg == "--timeout-ms") {
            std::string value;
            if (!next(value)) return 2;
            try {
                options.timeout_ms = std::stoi(value);
            } catch (const std::exception &) {
                std::cerr << "Invalid --timeout-ms: " << value << "\n";
                return 2;
            }
        } else if (arg == "--help" || arg == "-h") {
            print_usage();
            return 1;
        } else {
            std::cerr << "Unknown argument: " << arg << "\n";
            std::cerr << "Use --help for usage information\n";
            return 2;
        }
    }
    return 0;
}

bool list_all_tools(toolproxy::rpc::ToolClientRegistry &registry) {
    nlohmann::json out = nlohmann::json::object();
    bool ok = true;

    for (const auto &name : registry.names()) {
        if (toolproxy::runtime::SignalHandler::is_shutdown_requested()) {
            return false;
        }
        auto client = registry.get(name);
        std::vector<toolproxy::rpc::ToolDescriptor> tools;
        auto result = client->list_tools(tools);
        if (!result.success) {
            LOG_ERROR("[Main] tools/list on '" << name << "' failed: " << result.error_message);
            out[name] = {{"error", result.error_message}};
            ok = false;
            continue;
        }

        nlohmann::json entries = nlohmann::json::array();
        for (const auto &tool : tools) {
            entries.push_back(toolproxy::rpc::encode_tool_descriptor(tool));
        }
        out[name] = entries;
    }

    std::cout << out.dump(2) << std::endl;
    return ok;
}

}  // namespace

int main(int argc, char **argv) {
    Options options;
    int parsed = parse_args(argc, argv, options);
    if (parsed != 0) {
        return parsed - 1;
    }

    // Check if config exists
    if (!std::filesystem::exists(options.config_path)) {
        std::cerr << "ERROR: Config file not found: " << options.config_path << "\n";
        std::cerr << "\nCreate a config file or specify path with --config=PATH\n";
        return 1;
    }

    nlohmann::json arguments;
    try {
        arguments = nlohmann::json::parse(options.args_json);
    } catch (const nlohmann::json::parse_error &e) {
        std::cerr << "ERROR: --args is not valid JSON: " << e.what() << "\n";
        return 1;
    }
    if (!arguments.is_object()) {
        std::cerr << "ERROR: --args must be a JSON object\n";
        return 1;
    }

    LOG_INFO("toolproxy " << toolproxy::rpc::kClientVersion << " starting...");
    LOG_INFO("Loading config: " << options.config_path);

    toolproxy::runtime::ProxyConfig config;
    std::string error;
    if (!toolproxy::runtime::load_config(options.config_path, config, error)) {
        LOG_ERROR("Failed to load config: " << error);
        return 1;
    }

    toolproxy::logging::Logger::set_level(toolproxy::logging::string_to_level(config.logging.level));
    toolproxy::runtime::SignalHandler::install();

    toolproxy::rpc::ToolClientRegistry registry;
    for (const auto &server : config.servers) {
        auto client = std::make_shared<toolproxy::rpc::ToolClient>(server);
        registry.add(server.name, client);

        auto started = client->start();
        if (!started.success) {
            // Not fatal here: the next call retries the spawn
            LOG_ERROR("[Main] Server '" << server.name << "' failed to start: " << started.error_message);
        }
    }

    bool ok = false;
    if (toolproxy::runtime::SignalHandler::is_shutdown_requested()) {
        LOG_INFO("Signal received, shutting down");
    } else if (options.command == Command::LIST_TOOLS) {
        ok = list_all_tools(registry);
    } else if (options.command == Command::CALL) {
        std::string target = options.server;
        if (target.empty()) {
            target = config.proxy.upstream.empty() ? config.servers.front().name : config.proxy.upstream;
        }

        auto client = registry.get(target);
        if (!client) {
            LOG_ERROR("[Main] Unknown server: " << target);
        } else {
            std::optional<std::chrono::milliseconds> timeout;
            if (options.timeout_ms) {
                timeout = std::chrono::milliseconds(*options.timeout_ms);
            }
            auto result = client->call_tool(options.tool, arguments, timeout);
            if (result.success) {
                std::cout << result.value.dump(2) << std::endl;
                ok = true;
            } else {
                LOG_ERROR("[Main] " << options.tool << " failed ("
                                    << toolproxy::rpc::error_kind_to_string(result.error_kind)
                                    << "): " << result.error_message);
                if (result.error_kind == toolproxy::rpc::ErrorKind::REMOTE) {
                    std::cout << nlohmann::json({{"error", result.remote_error}}).dump(2) << std::endl;
                }
            }
        }
    } else {
        std::shared_ptr<toolproxy::rpc::IToolClient> upstream;
        if (!config.proxy.upstream.empty()) {
            upstream = registry.get(config.proxy.upstream);
        }

        toolproxy::masking::RegexMasker masker;
        toolproxy::proxy::MaskedToolset toolset(upstream.get(),
                                                config.proxy.masking.enabled ? &masker : nullptr);

        auto result = toolset.dispatch(options.tool, arguments);
        std::cout << result.dump(2) << std::endl;
        ok = !(result.is_object() && result.contains("error"));
    }

    registry.shutdown_all();
    LOG_INFO("Shutdown complete");
    return ok ? 0 : 1;
}
