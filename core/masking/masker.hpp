#pragma once

#include <nlohmann/json.hpp>

namespace toolproxy {
namespace masking {

// Interface for maskers to enable mocking
class IMasker {
public:
    virtual ~IMasker() = default;

    // Returns a copy of `value` with sensitive text in every string replaced.
    // Object keys and non-string scalars are left untouched. Never throws.
    virtual nlohmann::json mask(const nlohmann::json &value) const = 0;
};

}  // namespace masking
}  // namespace toolproxy
