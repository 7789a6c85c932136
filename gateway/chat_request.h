#pragma once

#include <nlohmann/json.hpp>

#include <optional>
#include <string>
#include <vector>

namespace guardway {

enum class ChatRole { kSystem, kUser, kAssistant, kTool };

const char* ChatRoleName(ChatRole role);

// One chat message. Content is either a plain string or an ordered list of
// content blocks; blocks are kept as raw JSON objects so that non-text block
// types survive a round trip untouched.
struct ChatMessage {
  ChatRole role{ChatRole::kUser};
  bool has_blocks{false};
  std::string text;
  std::vector<nlohmann::json> blocks;
};

struct ChatCompletionsRequest {
  std::string model;
  std::vector<ChatMessage> messages;
  double temperature{1.0};
  double top_p{1.0};
  std::optional<int> max_tokens;
  bool stream{false};
  int n{1};
  double presence_penalty{0.0};
  double frequency_penalty{0.0};
  // "text" or "json_object" when present.
  std::optional<std::string> response_format;
  std::optional<std::string> user;
};

// One schema violation. `loc` is the path to the offending value, made of
// field names and list indices.
struct ValidationIssue {
  nlohmann::json loc;
  std::string msg;
  std::string type;
};

// Limits of the closed request schema.
constexpr std::size_t kMaxModelLength = 200;
constexpr std::size_t kMaxMessages = 200;
constexpr std::size_t kMaxUserLength = 200;
constexpr int kMaxTokensLimit = 8192;
constexpr int kMaxChoices = 10;

// Parses and strictly validates a request body. Unknown fields, wrong JSON
// types and out-of-range values are all reported; `null` on an optional
// field selects its default. Returns false when `issues` is non-empty.
bool ParseChatRequest(const std::string& body, ChatCompletionsRequest* out,
                      std::vector<ValidationIssue>* issues);

// Same checks on an already-parsed document.
bool ValidateChatRequest(const nlohmann::json& doc, ChatCompletionsRequest* out,
                         std::vector<ValidationIssue>* issues);

// Serializes every field, defaults included; unset optionals become null.
nlohmann::json ToJson(const ChatCompletionsRequest& request);

// [{"loc": [...], "msg": "...", "type": "..."}, ...]
nlohmann::json ValidationDetailsJson(const std::vector<ValidationIssue>& issues);

}  // namespace guardway
