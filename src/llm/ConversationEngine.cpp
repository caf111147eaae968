/**
 * ConversationEngine.cpp - Gemma-style chat prompt over LLMClient
 */

#include "vox/llm/ConversationEngine.hpp"
#include "vox/llm/LLMClient.hpp"

#include <algorithm>
#include <cctype>
#include <cstring>
#include <deque>
#include <iostream>
#include <sstream>
#include <vector>

namespace vox::llm {

namespace {

const char* DEFAULT_SYSTEM_PROMPT = R"(You are Vox, a friendly live-stream co-host.
You answer viewers out loud, so keep every answer to two or three short sentences.
Never use emojis, markdown or lists; everything you write is read by a speech engine.
If you do not know something, say so honestly.)";

constexpr size_t kMaxHistory = 20;  // messages, i.e. 10 turns

// ASCII terminators plus the ellipsis and CJK full stops, as UTF-8
const char* const kTerminators[] = {
    ".", "!", "?",
    "\xE2\x80\xA6",  // U+2026
    "\xE3\x80\x82",  // U+3002
    "\xEF\xBC\x81",  // U+FF01
    "\xEF\xBC\x9F",  // U+FF1F
};

/// Length of the terminator that ends exactly at `end`, or 0.
size_t terminatorEndingAt(const std::string& s, size_t end) {
    for (const char* t : kTerminators) {
        size_t len = std::strlen(t);
        if (end >= len && s.compare(end - len, len, t) == 0) {
            return len;
        }
    }
    return 0;
}

std::string trim(const std::string& s) {
    size_t begin = 0;
    size_t end = s.size();
    while (begin < end && std::isspace(static_cast<unsigned char>(s[begin]))) ++begin;
    while (end > begin && std::isspace(static_cast<unsigned char>(s[end - 1]))) --end;
    return s.substr(begin, end - begin);
}

std::vector<std::string> splitSentences(const std::string& text) {
    std::vector<std::string> sentences;
    size_t start = 0;
    for (size_t i = 1; i < text.size(); ++i) {
        if (std::isspace(static_cast<unsigned char>(text[i])) && terminatorEndingAt(text, i) > 0) {
            std::string sentence = trim(text.substr(start, i - start));
            if (!sentence.empty()) sentences.push_back(sentence);
            start = i + 1;
        }
    }
    std::string rest = trim(text.substr(std::min(start, text.size())));
    if (!rest.empty()) sentences.push_back(rest);
    return sentences;
}

} // anonymous namespace

std::string makeConcise(const std::string& text, size_t max_sentences, size_t max_chars) {
    std::string raw = trim(text);
    if (raw.empty()) return raw;

    std::vector<std::string> sentences = splitSentences(raw);
    if (sentences.size() > max_sentences) {
        sentences.resize(max_sentences);
    }

    std::string concise;
    for (const auto& sentence : sentences) {
        if (!concise.empty()) concise += ' ';
        concise += sentence;
    }

    if (concise.size() > max_chars) {
        size_t cut = max_chars;
        while (cut > 0 && (static_cast<unsigned char>(concise[cut]) & 0xC0) == 0x80) {
            --cut;
        }
        std::string clipped = concise.substr(0, cut);

        size_t last_end = 0;
        for (size_t pos = clipped.size(); pos > 0; --pos) {
            if (terminatorEndingAt(clipped, pos) > 0) {
                last_end = pos;
                break;
            }
        }
        concise = last_end > 0 ? clipped.substr(0, last_end) : trim(clipped);
    }

    if (terminatorEndingAt(concise, concise.size()) == 0) {
        concise = trim(concise) + "...";
    }
    return concise;
}

struct ConversationEngine::Impl {
    struct Message {
        bool from_user;
        std::string speaker;
        std::string content;
    };

    LLMClient client;
    PolicyGuard policy;
    std::string system_prompt;
    int max_tokens;
    float temperature;
    std::deque<Message> history;

    Impl(const LLMConfig& config, PolicyGuard guard)
        : client(config.url, config.timeout_ms)
        , policy(std::move(guard))
        , system_prompt(config.system_prompt.empty() ? DEFAULT_SYSTEM_PROMPT : config.system_prompt)
        , max_tokens(config.max_tokens)
        , temperature(config.temperature) {
    }

    std::string buildPrompt(const std::string& user, core::Source source, const std::string& text) const {
        std::stringstream prompt;

        // Gemma instruction format
        prompt << "<start_of_turn>user\n";
        prompt << system_prompt << "\n\n";

        for (const auto& msg : history) {
            if (msg.from_user) {
                prompt << msg.speaker << ": " << msg.content << "\n";
            } else {
                prompt << "Vox: " << msg.content << "\n";
            }
        }

        prompt << "[" << core::toString(source) << "] " << user << ": " << text << "\n";
        prompt << "<end_of_turn>\n";
        prompt << "<start_of_turn>model\n";
        prompt << "Vox: ";

        return prompt.str();
    }

    void remember(const std::string& user, const std::string& text, const std::string& reply) {
        history.push_back({true, user, text});
        history.push_back({false, "Vox", reply});
        while (history.size() > kMaxHistory) {
            history.pop_front();
        }
    }
};

ConversationEngine::ConversationEngine(const LLMConfig& config, PolicyGuard policy)
    : impl_(std::make_unique<Impl>(config, std::move(policy))) {
    std::cout << "[ConversationEngine] Using LLM server at " << config.url
              << " (" << impl_->policy.keywordCount() << " blocked keywords)" << std::endl;
}

ConversationEngine::~ConversationEngine() = default;

bool ConversationEngine::isReady() {
    return impl_->client.isHealthy();
}

core::Reply ConversationEngine::generate(const std::string& text, const std::string& user, core::Source source) {
    PolicyVerdict verdict = impl_->policy.check(text);
    if (!verdict.allowed) {
        std::cout << "[ConversationEngine] Policy declined message from " << user
                  << ": " << verdict.reason << std::endl;
        return core::Reply::suppressed(verdict.reason);
    }

    CompletionRequest request;
    request.prompt = impl_->buildPrompt(user, source, text);
    request.max_tokens = impl_->max_tokens;
    request.temperature = impl_->temperature;
    request.stop = {"<end_of_turn>", "\n\n"};

    CompletionResponse response = impl_->client.complete(request);
    if (!response.ok) {
        return core::Reply::failed(response.error);
    }

    std::string reply = makeConcise(response.content);
    if (reply.empty()) {
        return core::Reply::failed("model returned an empty completion");
    }

    impl_->remember(user, text, reply);
    return core::Reply::ok(reply);
}

void ConversationEngine::clearHistory() {
    impl_->history.clear();
}

size_t ConversationEngine::historySize() const {
    return impl_->history.size();
}

} // namespace vox::llm
