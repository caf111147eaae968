/**
 * LLMClient.cpp - HTTP client for llama.cpp server
 *
 * One blocking request per reply; the response pipeline is the only caller.
 */

#include "vox/llm/LLMClient.hpp"

#include <iostream>

#include <httplib.h>
#include <nlohmann/json.hpp>

using json = nlohmann::json;

namespace vox::llm {

struct LLMClient::Impl {
    std::unique_ptr<httplib::Client> client;

    Impl(const std::string& url, int timeout_ms) {
        client = std::make_unique<httplib::Client>(url);
        client->set_connection_timeout(timeout_ms / 1000, (timeout_ms % 1000) * 1000);
        client->set_read_timeout(timeout_ms / 1000, (timeout_ms % 1000) * 1000);
        client->set_write_timeout(timeout_ms / 1000, (timeout_ms % 1000) * 1000);
    }
};

LLMClient::LLMClient(const std::string& base_url, int timeout_ms)
    : impl_(std::make_unique<Impl>(base_url, timeout_ms))
    , base_url_(base_url) {
}

LLMClient::~LLMClient() = default;

bool LLMClient::isHealthy() {
    auto res = impl_->client->Get("/health");
    return res && res->status == 200;
}

CompletionResponse LLMClient::complete(const CompletionRequest& request) {
    CompletionResponse response;

    json req_json = {
        {"prompt", request.prompt},
        {"n_predict", request.max_tokens},
        {"temperature", request.temperature},
        {"top_p", request.top_p},
        {"stream", false}
    };

    if (!request.stop.empty()) {
        req_json["stop"] = request.stop;
    }

    auto res = impl_->client->Post("/completion", req_json.dump(), "application/json");

    if (!res) {
        response.error = "no response from " + base_url_ + " (" + httplib::to_string(res.error()) + ")";
        std::cerr << "[LLMClient] Request failed: " << response.error << std::endl;
        return response;
    }
    if (res->status != 200) {
        response.error = "HTTP " + std::to_string(res->status);
        std::cerr << "[LLMClient] Request failed: " << response.error << std::endl;
        return response;
    }

    try {
        json res_json = json::parse(res->body);
        response.content = res_json.value("content", "");
        response.tokens_generated = res_json.value("tokens_predicted", 0);
        response.tokens_prompt = res_json.value("tokens_evaluated", 0);
        response.stopped = res_json.value("stopped_eos", false) ||
                           res_json.value("stopped_word", false);
        response.stop_reason = res_json.value("stopping_word", "");
        response.ok = true;
    } catch (const std::exception& e) {
        response.error = std::string("invalid completion JSON: ") + e.what();
        std::cerr << "[LLMClient] " << response.error << std::endl;
    }

    return response;
}

} // namespace vox::llm
