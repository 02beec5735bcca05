#pragma once
#include <gmock/gmock.h>
#include <gtest/gtest.h>

#include <chrono>
#include <optional>
#include <string>
#include <vector>

#include "rpc/i_tool_client.hpp"

namespace toolproxy::tests {

using namespace toolproxy;
using namespace testing;
using OptionalTimeout = std::optional<std::chrono::milliseconds>;

class MockToolClient : public rpc::IToolClient {
public:
    MOCK_METHOD(rpc::RpcResult, start, (), (override));
    MOCK_METHOD(void, shutdown, (), (override));
    MOCK_METHOD(bool, is_available, (), (const, override));
    MOCK_METHOD(rpc::ConnectionState, state, (), (const, override));

    MOCK_METHOD(rpc::RpcResult, call_tool, (const std::string &, const nlohmann::json &, OptionalTimeout),
                (override));
    MOCK_METHOD(rpc::RpcResult, list_tools, (std::vector<rpc::ToolDescriptor> &), (override));

    MOCK_METHOD(const std::string &, name, (), (const, override));

    // Helper to store/return name reference
    std::string _name = "upstream";
};

}  // namespace toolproxy::tests
