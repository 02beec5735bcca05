#pragma once

#include <cstdint>
#include <nlohmann/json.hpp>
#include <string>
#include <vector>

namespace toolproxy {
namespace rpc {

/**
 * @brief Newline-delimited JSON-RPC 2.0 codec for the MCP tool protocol
 *
 * Every encoded message is a single line without the trailing '\n';
 * LineStdioClient adds the terminator.
 */
namespace jsonrpc {

constexpr const char *kVersion = "2.0";
constexpr const char *kProtocolVersion = "2024-11-05";

constexpr const char *kMethodInitialize = "initialize";
constexpr const char *kMethodInitialized = "notifications/initialized";
constexpr const char *kMethodToolsList = "tools/list";
constexpr const char *kMethodToolsCall = "tools/call";

enum class MessageKind {
    RESPONSE,      // id + (result | error)
    NOTIFICATION,  // method, no id
    REQUEST        // method + id (server-initiated; not served by this client)
};

struct Message {
    MessageKind kind = MessageKind::RESPONSE;
    int64_t id = 0;
    std::string method;
    nlohmann::json params;
    bool is_error = false;
    nlohmann::json result;
    nlohmann::json error;
};

std::string encode_request(int64_t id, const std::string &method, const nlohmann::json &params);
std::string encode_notification(const std::string &method, const nlohmann::json &params);

// Decode one line. Returns false and sets error for anything that is not a well-formed
// response, notification, or request.
bool decode_message(const std::string &line, Message &out, std::string &error);

nlohmann::json make_initialize_params(const std::string &client_name, const std::string &client_version);
nlohmann::json make_tool_call_params(const std::string &tool_name, const nlohmann::json &arguments);

}  // namespace jsonrpc

// Tool advertised by a server in its tools/list response
struct ToolDescriptor {
    std::string name;
    std::string description;
    nlohmann::json input_schema = nlohmann::json::object();
};

bool decode_tool_list(const nlohmann::json &result, std::vector<ToolDescriptor> &tools, std::string &error);
nlohmann::json encode_tool_descriptor(const ToolDescriptor &tool);

}  // namespace rpc
}  // namespace toolproxy
