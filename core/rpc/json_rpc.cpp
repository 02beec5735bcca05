#include "json_rpc.hpp"

namespace toolproxy {
namespace rpc {
namespace jsonrpc {

std::string encode_request(int64_t id, const std::string &method, const nlohmann::json &params) {
    nlohmann::json request = {{"jsonrpc", kVersion}, {"id", id}, {"method", method}, {"params", params}};
    // dump() escapes control characters, so the encoded request never spans lines
    return request.dump();
}

std::string encode_notification(const std::string &method, const nlohmann::json &params) {
    nlohmann::json notification = {{"jsonrpc", kVersion}, {"method", method}, {"params", params}};
    return notification.dump();
}

bool decode_message(const std::string &line, Message &out, std::string &error) {
    nlohmann::json msg;
    try {
        msg = nlohmann::json::parse(line);
    } catch (const nlohmann::json::parse_error &e) {
        error = "Invalid JSON: " + std::string(e.what());
        return false;
    }

    if (!msg.is_object()) {
        error = "Message is not a JSON object";
        return false;
    }

    out = Message{};
    const bool has_id = msg.contains("id") && !msg["id"].is_null();

    if (msg.contains("method")) {
        if (!msg["method"].is_string()) {
            error = "Message 'method' is not a string";
            return false;
        }
        out.method = msg["method"].get<std::string>();
        out.params = msg.value("params", nlohmann::json::object());
        if (has_id) {
            out.kind = MessageKind::REQUEST;
            if (msg["id"].is_number_integer()) {
                out.id = msg["id"].get<int64_t>();
            }
        } else {
            out.kind = MessageKind::NOTIFICATION;
        }
        return true;
    }

    if (!has_id) {
        if (msg.contains("error")) {
            error = "Error response without id: " + msg["error"].dump();
        } else {
            error = "Message has neither method nor id";
        }
        return false;
    }

    if (!msg["id"].is_number_integer()) {
        error = "Response id is not an integer: " + msg["id"].dump();
        return false;
    }

    const bool has_result = msg.contains("result");
    const bool has_error = msg.contains("error");
    if (has_result == has_error) {
        error = has_result ? "Response carries both result and error" : "Response carries neither result nor error";
        return false;
    }

    out.kind = MessageKind::RESPONSE;
    out.id = msg["id"].get<int64_t>();
    out.is_error = has_error;
    if (has_error) {
        out.error = msg["error"];
    } else {
        out.result = msg["result"];
    }
    return true;
}

nlohmann::json make_initialize_params(const std::string &client_name, const std::string &client_version) {
    return {{"protocolVersion", kProtocolVersion},
            {"capabilities", nlohmann::json::object()},
            {"clientInfo", {{"name", client_name}, {"version", client_version}}}};
}

nlohmann::json make_tool_call_params(const std::string &tool_name, const nlohmann::json &arguments) {
    return {{"name", tool_name}, {"arguments", arguments.is_null() ? nlohmann::json::object() : arguments}};
}

}  // namespace jsonrpc

bool decode_tool_list(const nlohmann::json &result, std::vector<ToolDescriptor> &tools, std::string &error) {
    if (!result.is_object() || !result.contains("tools") || !result["tools"].is_array()) {
        error = "tools/list result missing 'tools' array";
        return false;
    }

    tools.clear();
    for (const auto &entry : result["tools"]) {
        if (!entry.is_object() || !entry.contains("name") || !entry["name"].is_string()) {
            error = "tools/list entry missing 'name': " + entry.dump();
            return false;
        }

        ToolDescriptor tool;
        tool.name = entry["name"].get<std::string>();
        if (entry.contains("description") && entry["description"].is_string()) {
            tool.description = entry["description"].get<std::string>();
        }
        if (entry.contains("inputSchema") && entry["inputSchema"].is_object()) {
            tool.input_schema = entry["inputSchema"];
        }
        tools.push_back(std::move(tool));
    }
    return true;
}

nlohmann::json encode_tool_descriptor(const ToolDescriptor &tool) {
    return {{"name", tool.name}, {"description", tool.description}, {"inputSchema", tool.input_schema}};
}

}  // namespace rpc
}  // namespace toolproxy
