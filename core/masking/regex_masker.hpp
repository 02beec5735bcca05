#pragma once

#include <regex>
#include <string>
#include <vector>

#include "masker.hpp"

namespace toolproxy {
namespace masking {

enum class MaskAction {
    REPLACE,  // substitute a fixed placeholder
    STAR      // overwrite with '*', same length as the match
};

struct MaskRule {
    std::string name;
    std::regex pattern;
    MaskAction action = MaskAction::REPLACE;
    std::string replacement;  // REPLACE only
};

/**
 * @brief Pattern-based masker for tool results
 *
 * Rules apply in registration order, each to the output of the previous one.
 * Default rules: URL -> <URL>, IPv4 -> <IP>, the word "PDS" -> <Client_name>,
 * email address and phone number -> '*' of the same length.
 */
class RegexMasker : public IMasker {
public:
    // with_defaults = false starts with no rules
    explicit RegexMasker(bool with_defaults = true);

    // Compile and append a rule. Returns false (and sets error) on an invalid pattern.
    bool add_rule(const std::string &name, const std::string &pattern, MaskAction action,
                  const std::string &replacement, bool ignore_case, std::string &error);

    nlohmann::json mask(const nlohmann::json &value) const override;

    std::string mask_text(const std::string &text) const;

    size_t rule_count() const { return rules_.size(); }

private:
    std::vector<MaskRule> rules_;

    static std::string apply_rule(const MaskRule &rule, const std::string &text);
};

}  // namespace masking
}  // namespace toolproxy
