#include "masking/regex_masker.hpp"

#include <gtest/gtest.h>

#include <string>

using namespace toolproxy::masking;
using nlohmann::json;

TEST(RegexMaskerTest, ReplacesUrlAndIp) {
    RegexMasker masker;
    EXPECT_EQ(masker.mask_text("see https://intranet.example.com/page?id=4 now"), "see <URL> now");
    EXPECT_EQ(masker.mask_text("host 192.168.10.25 is down"), "host <IP> is down");
}

TEST(RegexMaskerTest, ReplacesClientNameCaseInsensitive) {
    RegexMasker masker;
    EXPECT_EQ(masker.mask_text("PDS and pds and Pds"), "<Client_name> and <Client_name> and <Client_name>");
    // Whole words only
    EXPECT_EQ(masker.mask_text("PDSX and UPDS"), "PDSX and UPDS");
}

TEST(RegexMaskerTest, StarsEmailAndPhoneKeepingLength) {
    RegexMasker masker;
    EXPECT_EQ(masker.mask_text("mail jane.doe@example.com today"), "mail " + std::string(20, '*') + " today");
    EXPECT_EQ(masker.mask_text("call 555-123-4567"), "call " + std::string(12, '*'));
    EXPECT_EQ(masker.mask_text("call (555) 123-4567"), "call " + std::string(14, '*'));
}

TEST(RegexMaskerTest, LeavesPlainTextAlone) {
    RegexMasker masker;
    EXPECT_EQ(masker.mask_text("nothing sensitive on 2024-01-15"), "nothing sensitive on 2024-01-15");
    EXPECT_EQ(masker.mask_text(""), "");
}

TEST(RegexMaskerTest, MasksNestedJsonStringsOnly) {
    RegexMasker masker;
    json input = {{"hits",
                   {{{"_source",
                      {{"owner", "PDS"}, {"ip", "10.0.0.1"}, {"count", 3}, {"ok", true}, {"none", nullptr}}}}}},
                  {"https://keys.example.com", "key is not masked"}};

    json masked = masker.mask(input);

    const auto &source = masked["hits"][0]["_source"];
    EXPECT_EQ(source["owner"], "<Client_name>");
    EXPECT_EQ(source["ip"], "<IP>");
    EXPECT_EQ(source["count"], 3);
    EXPECT_EQ(source["ok"], true);
    EXPECT_TRUE(source["none"].is_null());
    EXPECT_TRUE(masked.contains("https://keys.example.com"));

    // The input is untouched
    EXPECT_EQ(input["hits"][0]["_source"]["owner"], "PDS");
}

TEST(RegexMaskerTest, MasksTopLevelScalarsAndArrays) {
    RegexMasker masker;
    EXPECT_EQ(masker.mask(json("PDS")), json("<Client_name>"));
    EXPECT_EQ(masker.mask(json::array({"1.2.3.4", 5})), json::array({"<IP>", 5}));
    EXPECT_EQ(masker.mask(json(42)), json(42));
}

TEST(RegexMaskerTest, CustomRules) {
    RegexMasker masker(false);
    EXPECT_EQ(masker.rule_count(), 0u);

    std::string error;
    ASSERT_TRUE(masker.add_rule("ticket", R"(TICKET-\d+)", MaskAction::REPLACE, "<TICKET>", false, error)) << error;
    ASSERT_TRUE(masker.add_rule("secret", "secret", MaskAction::STAR, "", true, error)) << error;

    EXPECT_EQ(masker.mask_text("TICKET-42 has a SECRET"), "<TICKET> has a ******");
    // Default rules are not installed
    EXPECT_EQ(masker.mask_text("PDS"), "PDS");
}

TEST(RegexMaskerTest, InvalidPatternRejected) {
    RegexMasker masker(false);
    std::string error;
    EXPECT_FALSE(masker.add_rule("broken", "([a-z", MaskAction::REPLACE, "x", false, error));
    EXPECT_NE(error.find("broken"), std::string::npos);
    EXPECT_EQ(masker.rule_count(), 0u);
}

TEST(RegexMaskerTest, DefaultRuleCount) {
    RegexMasker masker;
    EXPECT_EQ(masker.rule_count(), 5u);
}
