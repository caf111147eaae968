/**
 * PolicyGuard.hpp - Decides whether an incoming message gets an answer at all
 */

#pragma once

#include <string>
#include <vector>

namespace vox::llm {

struct PolicyVerdict {
    bool allowed = true;
    std::string reason;  // set when !allowed
};

class PolicyGuard {
public:
    PolicyGuard() = default;
    explicit PolicyGuard(std::vector<std::string> blocked_keywords);

    /// Blank messages and messages containing a blocked keyword
    /// (ASCII case-insensitive) are refused.
    PolicyVerdict check(const std::string& text) const;

    size_t keywordCount() const { return blocked_.size(); }

private:
    std::vector<std::string> blocked_;  // lowercased
};

} // namespace vox::llm
