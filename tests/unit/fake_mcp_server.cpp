// Scriptable MCP tool server for the ToolClient tests.
//
// Speaks newline-delimited JSON-RPC on stdin/stdout. Options:
//   --mode=normal          answer everything (default)
//   --mode=bad-handshake   answer initialize with an error
//   --mode=silent          never answer initialize
//   --mode=exit-on-start   exit before reading anything
//   --noisy                precede every response with a notification and a malformed line
//
// Tools: echo, sleep {ms}, hang, crash, error, garbage, stale, notify,
// request_ids (every request id received so far, in arrival order),
// plus canned SearchIndexTool, ListIndexTool and IndexMappingTool.

#include <unistd.h>

#include <chrono>
#include <cstdlib>
#include <iostream>
#include <mutex>
#include <nlohmann/json.hpp>
#include <string>
#include <thread>

using json = nlohmann::json;

namespace {

std::mutex g_out_mutex;
bool g_noisy = false;
json g_request_ids = json::array();

void write_raw(const std::string &line) {
    std::lock_guard<std::mutex> lock(g_out_mutex);
    std::cout << line << "\n" << std::flush;
}

void write_noise() {
    write_raw(json({{"jsonrpc", "2.0"}, {"method", "notifications/message"}, {"params", {{"level", "info"}}}}).dump());
    write_raw("this is not json {");
}

void respond(const json &id, const json &result) {
    if (g_noisy) {
        write_noise();
    }
    write_raw(json({{"jsonrpc", "2.0"}, {"id", id}, {"result", result}}).dump());
}

void respond_error(const json &id, int code, const std::string &message) {
    if (g_noisy) {
        write_noise();
    }
    write_raw(json({{"jsonrpc", "2.0"}, {"id", id}, {"error", {{"code", code}, {"message", message}}}}).dump());
}

json text_content(const std::string &text) {
    return {{"content", json::array({{{"type", "text"}, {"text", text}}})}, {"isError", false}};
}

json tool_list() {
    json tools = json::array();
    for (const char *name : {"echo", "sleep", "hang", "crash", "error", "garbage", "stale", "notify",
                             "request_ids", "SearchIndexTool", "ListIndexTool", "IndexMappingTool"}) {
        tools.push_back({{"name", name},
                         {"description", std::string("Fake ") + name},
                         {"inputSchema", {{"type", "object"}, {"properties", json::object()}}}});
    }
    return tools;
}

void call_tool(const json &id, const json &params) {
    const std::string name = params.value("name", "");
    const json args = params.value("arguments", json::object());

    if (name == "echo") {
        json result = text_content(args.dump());
        result["echo"] = args;
        respond(id, result);
    } else if (name == "sleep") {
        int ms = args.value("ms", 100);
        // Answer from a worker so other requests keep flowing
        std::thread([id, ms, args]() {
            std::this_thread::sleep_for(std::chrono::milliseconds(ms));
            json result = text_content("slept");
            result["echo"] = args;
            respond(id, result);
        }).detach();
    } else if (name == "hang") {
        // never answered
    } else if (name == "crash") {
        std::_Exit(3);
    } else if (name == "error") {
        respond_error(id, -32000, "tool failed on purpose");
    } else if (name == "garbage") {
        write_raw("{\"jsonrpc\":\"2.0\",\"id\":");
        write_raw("[1,2,3]");
        write_raw(json({{"jsonrpc", "2.0"}, {"id", "not-a-number"}, {"result", {}}}).dump());
        respond(id, text_content("after garbage"));
    } else if (name == "stale") {
        // A response for an id nobody is waiting for, then the real one
        write_raw(json({{"jsonrpc", "2.0"}, {"id", 999999}, {"result", text_content("stale")}}).dump());
        respond(id, text_content("fresh"));
    } else if (name == "notify") {
        write_raw(json({{"jsonrpc", "2.0"}, {"method", "notifications/progress"}, {"params", {{"progress", 50}}}})
                      .dump());
        respond(id, text_content("notified"));
    } else if (name == "request_ids") {
        json result = text_content(std::to_string(g_request_ids.size()) + " requests");
        result["ids"] = g_request_ids;
        respond(id, result);
    } else if (name == "SearchIndexTool") {
        json hits = json::array();
        hits.push_back({{"_id", "1"},
                        {"_source",
                         {{"customer", "PDS"},
                          {"contact", "jane.doe@example.com"},
                          {"homepage", "https://internal.example.com/x"},
                          {"host", "10.1.2.3"},
                          {"count", 7}}}});
        respond(id, {{"index", args.value("index", "")}, {"query", args.value("query", json())}, {"hits", hits}});
    } else if (name == "ListIndexTool") {
        respond(id, text_content("logs-2024\nmetrics"));
    } else if (name == "IndexMappingTool") {
        respond(id, {{"index", args.value("index", "")}, {"mappings", {{"properties", json::object()}}}});
    } else {
        respond_error(id, -32602, "Unknown tool: " + name);
    }
}

}  // namespace

int main(int argc, char **argv) {
    std::string mode = "normal";
    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        if (arg.rfind("--mode=", 0) == 0) {
            mode = arg.substr(7);
        } else if (arg == "--noisy") {
            g_noisy = true;
        }
    }

    if (mode == "exit-on-start") {
        return 2;
    }

    std::cerr << "[fake_mcp_server] pid " << getpid() << " mode " << mode << std::endl;

    std::string line;
    while (std::getline(std::cin, line)) {
        json msg;
        try {
            msg = json::parse(line);
        } catch (const json::parse_error &) {
            continue;
        }
        if (!msg.is_object() || !msg.contains("method")) {
            continue;
        }

        const std::string method = msg["method"].get<std::string>();
        if (!msg.contains("id")) {
            continue;  // notifications/initialized and friends
        }
        const json id = msg["id"];
        g_request_ids.push_back(id);
        const json params = msg.value("params", json::object());

        if (method == "initialize") {
            if (mode == "silent") {
                continue;
            }
            if (mode == "bad-handshake") {
                respond_error(id, -32603, "initialization refused");
                continue;
            }
            respond(id, {{"protocolVersion", params.value("protocolVersion", "2024-11-05")},
                         {"capabilities", {{"tools", json::object()}}},
                         {"serverInfo", {{"name", "fake-mcp"}, {"version", "1.2.3"}}}});
        } else if (method == "tools/list") {
            respond(id, {{"tools", tool_list()}});
        } else if (method == "tools/call") {
            call_tool(id, params);
        } else {
            respond_error(id, -32601, "Method not found: " + method);
        }
    }
    return 0;
}
