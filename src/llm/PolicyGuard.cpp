/**
 * PolicyGuard.cpp
 */

#include "vox/llm/PolicyGuard.hpp"

#include <algorithm>
#include <cctype>

namespace vox::llm {

namespace {

std::string lower(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return s;
}

bool isBlank(const std::string& s) {
    return std::all_of(s.begin(), s.end(), [](unsigned char c) { return std::isspace(c); });
}

} // anonymous namespace

PolicyGuard::PolicyGuard(std::vector<std::string> blocked_keywords) {
    for (auto& keyword : blocked_keywords) {
        if (!isBlank(keyword)) {
            blocked_.push_back(lower(std::move(keyword)));
        }
    }
}

PolicyVerdict PolicyGuard::check(const std::string& text) const {
    if (isBlank(text)) {
        return {false, "empty message"};
    }

    std::string haystack = lower(text);
    for (const auto& keyword : blocked_) {
        if (haystack.find(keyword) != std::string::npos) {
            return {false, "blocked topic '" + keyword + "'"};
        }
    }
    return {};
}

} // namespace vox::llm
