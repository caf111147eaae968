/**
 * LLMClient.hpp - HTTP client for a llama.cpp compatible completion server
 */

#pragma once

#include <memory>
#include <string>
#include <vector>

namespace vox::llm {

struct CompletionRequest {
    std::string prompt;
    int max_tokens = 256;
    float temperature = 0.7f;
    float top_p = 0.9f;
    std::vector<std::string> stop;
};

struct CompletionResponse {
    bool ok = false;
    std::string content;
    int tokens_generated = 0;
    int tokens_prompt = 0;
    bool stopped = false;
    std::string stop_reason;
    std::string error;  // set when !ok
};

class LLMClient {
public:
    LLMClient(const std::string& base_url, int timeout_ms);
    ~LLMClient();

    LLMClient(const LLMClient&) = delete;
    LLMClient& operator=(const LLMClient&) = delete;

    bool isHealthy();

    /// Blocking POST /completion. Never throws; failures come back in `error`.
    CompletionResponse complete(const CompletionRequest& request);

    const std::string& baseUrl() const { return base_url_; }

private:
    struct Impl;
    std::unique_ptr<Impl> impl_;
    std::string base_url_;
};

} // namespace vox::llm
