#pragma once

#include "gateway/chat_request.h"

#include <string>
#include <vector>

namespace guardway {

class Guardrail;

// Every string content and every `text` of a "text" block, in message order.
// Blocks of other types, or text blocks whose `text` is not a string, are
// skipped.
std::vector<std::string> ExtractMessageTexts(const ChatCompletionsRequest& request);

// Joins fragments with '\n', dropping empty and whitespace-only ones.
std::string NormalizeMessagesToText(const std::vector<std::string>& texts);

// Returns a copy of `request` in which every textual field of every message
// has been replaced by the guardrail's redacted text. The input is not
// modified and fields outside messages[*].content are copied unchanged.
// `redacted` (optional) reports whether any fragment changed.
ChatCompletionsRequest RedactRequest(const ChatCompletionsRequest& request,
                                     const Guardrail& guardrail, bool* redacted = nullptr);

}  // namespace guardway
