#include "masked_toolset.hpp"

#include "logging/logger.hpp"

namespace toolproxy {
namespace proxy {

namespace {
nlohmann::json error_object(const std::string &message) { return {{"error", message}}; }

nlohmann::json object_schema(const nlohmann::json &properties, const std::vector<std::string> &required) {
    nlohmann::json schema = {{"type", "object"}, {"properties", properties}};
    if (!required.empty()) {
        schema["required"] = required;
    }
    return schema;
}
}  // namespace

MaskedToolset::MaskedToolset(rpc::IToolClient *upstream, const masking::IMasker *masker)
    : upstream_(upstream), masker_(masker) {}

bool MaskedToolset::call_upstream(const std::string &tool, const nlohmann::json &arguments,
                                  const std::string &context, nlohmann::json &out) {
    if (!upstream_) {
        out = error_object("Inner MCP server is not running.");
        return false;
    }

    rpc::RpcResult result = upstream_->call_tool(tool, arguments, std::nullopt);
    if (!result.success) {
        LOG_WARN("[Proxy] " << tool << " failed (" << rpc::error_kind_to_string(result.error_kind)
                            << "): " << result.error_message);
        out = error_object(context + ": " + result.error_message);
        return false;
    }

    out = result.value;
    return true;
}

nlohmann::json MaskedToolset::search_index_masked(const std::string &index, const nlohmann::json &query) {
    nlohmann::json effective_query = query;
    if (effective_query.is_null()) {
        effective_query = {{"query", {{"match_all", nlohmann::json::object()}}}};
    }

    nlohmann::json raw;
    if (!call_upstream("SearchIndexTool", {{"index", index}, {"query", effective_query}},
                       "Failed to search and mask", raw)) {
        return raw;
    }
    return masker_ ? masker_->mask(raw) : raw;
}

nlohmann::json MaskedToolset::list_indices() {
    nlohmann::json result;
    call_upstream("ListIndexTool", nlohmann::json::object(), "Failed to list indices", result);
    return result;
}

nlohmann::json MaskedToolset::get_index_mapping(const std::string &index) {
    nlohmann::json result;
    call_upstream("IndexMappingTool", {{"index", index}}, "Failed to get mapping", result);
    return result;
}

std::vector<rpc::ToolDescriptor> MaskedToolset::tools() {
    std::vector<rpc::ToolDescriptor> tools;

    rpc::ToolDescriptor search;
    search.name = kSearchIndexMasked;
    search.description =
        "Search an OpenSearch index and return masked results. Query defaults to {\"query\":{\"match_all\":{}}}.";
    search.input_schema =
        object_schema({{"index", {{"type", "string"}}}, {"query", {{"type", "object"}}}}, {"index"});
    tools.push_back(search);

    rpc::ToolDescriptor list;
    list.name = kListIndices;
    list.description = "List indices in the OpenSearch cluster.";
    list.input_schema = object_schema(nlohmann::json::object(), {});
    tools.push_back(list);

    rpc::ToolDescriptor mapping;
    mapping.name = kGetIndexMapping;
    mapping.description = "Get mapping for an index.";
    mapping.input_schema = object_schema({{"index", {{"type", "string"}}}}, {"index"});
    tools.push_back(mapping);

    return tools;
}

nlohmann::json MaskedToolset::dispatch(const std::string &name, const nlohmann::json &arguments) {
    const nlohmann::json args = arguments.is_object() ? arguments : nlohmann::json::object();

    auto index_arg = [&args](std::string &index) {
        if (!args.contains("index") || !args["index"].is_string()) {
            return false;
        }
        index = args["index"].get<std::string>();
        return true;
    };

    if (name == kSearchIndexMasked) {
        std::string index;
        if (!index_arg(index)) {
            return error_object("Missing required argument 'index'");
        }
        return search_index_masked(index, args.value("query", nlohmann::json()));
    }
    if (name == kListIndices) {
        return list_indices();
    }
    if (name == kGetIndexMapping) {
        std::string index;
        if (!index_arg(index)) {
            return error_object("Missing required argument 'index'");
        }
        return get_index_mapping(index);
    }

    return error_object("Unknown tool: " + name);
}

}  // namespace proxy
}  // namespace toolproxy
