/**
 * ConversationEngine.hpp - Reply generation backed by the LLM server
 *
 * Applies the PolicyGuard before calling the model, keeps a short rolling
 * history so follow-up questions make sense, and trims every reply so it
 * stays short enough to be spoken.
 */

#pragma once

#include "vox/Config.hpp"
#include "vox/core/Collaborators.hpp"
#include "vox/llm/PolicyGuard.hpp"

#include <memory>
#include <string>

namespace vox::llm {

/// Keeps the first `max_sentences` sentences, then clips to `max_chars`
/// bytes (never inside a UTF-8 sequence). The result ends on sentence
/// punctuation or with "...".
std::string makeConcise(const std::string& text, size_t max_sentences = 3, size_t max_chars = 200);

class ConversationEngine : public core::ReplyGenerator {
public:
    ConversationEngine(const LLMConfig& config, PolicyGuard policy);
    ~ConversationEngine() override;

    bool isReady();

    core::Reply generate(const std::string& text, const std::string& user, core::Source source) override;

    void clearHistory();
    size_t historySize() const;

private:
    struct Impl;
    std::unique_ptr<Impl> impl_;
};

} // namespace vox::llm
