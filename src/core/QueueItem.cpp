/**
 * QueueItem.cpp - Source/priority names
 */

#include "vox/core/QueueItem.hpp"

namespace vox::core {

const char* toString(Source source) {
    switch (source) {
        case Source::Voice: return "voice";
        case Source::Text: return "text";
        case Source::LiveChat: return "live_chat";
    }
    return "unknown";
}

const char* toString(Priority priority) {
    return priority == Priority::Admin ? "admin" : "normal";
}

} // namespace vox::core
