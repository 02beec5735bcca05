#include "regex_masker.hpp"

#include <iterator>

#include "logging/logger.hpp"

namespace toolproxy {
namespace masking {

namespace {
struct DefaultRule {
    const char *name;
    const char *pattern;
    MaskAction action;
    const char *replacement;
    bool ignore_case;
};

// Order matters: URLs are replaced before their host part could match the IP rule
const DefaultRule kDefaultRules[] = {
    {"url", R"re(https?://[^\s)"',]+)re", MaskAction::REPLACE, "<URL>", false},
    {"ip_address", R"re(\b(?:\d{1,3}\.){3}\d{1,3}\b)re", MaskAction::REPLACE, "<IP>", false},
    {"client_name", R"re(\bPDS\b)re", MaskAction::REPLACE, "<Client_name>", true},
    {"email", R"re([A-Za-z0-9._%+-]+@[A-Za-z0-9.-]+\.[A-Za-z]{2,})re", MaskAction::STAR, "", false},
    {"phone", R"re((?:\+\d{1,3}[ .-]?)?(?:\(\d{3}\)|\b\d{3})[ .-]?\d{3}[ .-]?\d{4}\b)re", MaskAction::STAR, "", false},
};
}  // namespace

RegexMasker::RegexMasker(bool with_defaults) {
    if (!with_defaults) {
        return;
    }
    for (const auto &rule : kDefaultRules) {
        std::string error;
        if (!add_rule(rule.name, rule.pattern, rule.action, rule.replacement, rule.ignore_case, error)) {
            LOG_ERROR("[Masking] Default rule '" << rule.name << "' rejected: " << error);
        }
    }
}

bool RegexMasker::add_rule(const std::string &name, const std::string &pattern, MaskAction action,
                           const std::string &replacement, bool ignore_case, std::string &error) {
    auto flags = std::regex::ECMAScript;
    if (ignore_case) {
        flags |= std::regex::icase;
    }

    MaskRule rule;
    try {
        rule.pattern = std::regex(pattern, flags);
    } catch (const std::regex_error &e) {
        error = "Invalid pattern for rule '" + name + "': " + e.what();
        return false;
    }
    rule.name = name;
    rule.action = action;
    rule.replacement = replacement;
    rules_.push_back(std::move(rule));
    return true;
}

std::string RegexMasker::apply_rule(const MaskRule &rule, const std::string &text) {
    std::string out;
    out.reserve(text.size());

    auto last = text.cbegin();
    for (std::sregex_iterator it(text.cbegin(), text.cend(), rule.pattern), end; it != end; ++it) {
        const std::smatch &match = *it;
        if (match.length(0) == 0) {
            continue;
        }
        out.append(last, match[0].first);
        if (rule.action == MaskAction::STAR) {
            out.append(static_cast<size_t>(match.length(0)), '*');
        } else {
            out += rule.replacement;
        }
        last = match[0].second;
    }
    out.append(last, text.cend());
    return out;
}

std::string RegexMasker::mask_text(const std::string &text) const {
    if (text.empty()) {
        return text;
    }

    std::string masked = text;
    for (const auto &rule : rules_) {
        try {
            masked = apply_rule(rule, masked);
        } catch (const std::regex_error &e) {
            // e.g. error_complexity on very long input
            LOG_ERROR("[Masking] Rule '" << rule.name << "' failed: " << e.what() << "; returning text unmasked");
            return text;
        }
    }
    return masked;
}

nlohmann::json RegexMasker::mask(const nlohmann::json &value) const {
    if (value.is_string()) {
        return mask_text(value.get<std::string>());
    }
    if (value.is_object()) {
        nlohmann::json out = nlohmann::json::object();
        for (auto it = value.begin(); it != value.end(); ++it) {
            out[it.key()] = mask(it.value());
        }
        return out;
    }
    if (value.is_array()) {
        nlohmann::json out = nlohmann::json::array();
        for (const auto &item : value) {
            out.push_back(mask(item));
        }
        return out;
    }
    return value;
}

}  // namespace masking
}  // namespace toolproxy
