#pragma once

#include <nlohmann/json.hpp>
#include <string>
#include <vector>

#include "masking/masker.hpp"
#include "rpc/i_tool_client.hpp"

namespace toolproxy {
namespace proxy {

constexpr const char *kSearchIndexMasked = "search_index_masked";
constexpr const char *kListIndices = "list_indices";
constexpr const char *kGetIndexMapping = "get_index_mapping";

/**
 * @brief Masked view over an OpenSearch MCP server
 *
 * Exposes three tools that forward to the upstream server's SearchIndexTool,
 * ListIndexTool and IndexMappingTool. Search hits are passed through the masker.
 *
 * Results are always JSON objects: failures come back as {"error": "..."} instead
 * of being thrown, so a caller can hand them straight to a model.
 */
class MaskedToolset {
public:
    // Either pointer may be null: no upstream reports "not running", no masker passes results through
    MaskedToolset(rpc::IToolClient *upstream, const masking::IMasker *masker);

    nlohmann::json search_index_masked(const std::string &index, const nlohmann::json &query = nullptr);
    nlohmann::json list_indices();
    nlohmann::json get_index_mapping(const std::string &index);

    // Tools this proxy exposes
    static std::vector<rpc::ToolDescriptor> tools();

    // Route a call by proxy tool name
    nlohmann::json dispatch(const std::string &name, const nlohmann::json &arguments);

private:
    rpc::IToolClient *upstream_;
    const masking::IMasker *masker_;

    bool call_upstream(const std::string &tool, const nlohmann::json &arguments, const std::string &context,
                       nlohmann::json &out);
};

}  // namespace proxy
}  // namespace toolproxy
