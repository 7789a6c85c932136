#include "gateway/redaction.h"

#include "server/policy/guardrail.h"

#include <algorithm>
#include <cctype>

namespace guardway {

namespace {

bool IsTextBlock(const nlohmann::json& block) {
  auto type = block.find("type");
  if (type == block.end() || !type->is_string() ||
      type->get_ref<const std::string&>() != "text") {
    return false;
  }
  auto text = block.find("text");
  return text != block.end() && text->is_string();
}

bool IsBlank(const std::string& s) {
  return std::all_of(s.begin(), s.end(),
                     [](unsigned char c) { return std::isspace(c) != 0; });
}

}  // namespace

std::vector<std::string> ExtractMessageTexts(const ChatCompletionsRequest& request) {
  std::vector<std::string> texts;
  for (const auto& msg : request.messages) {
    if (!msg.has_blocks) {
      texts.push_back(msg.text);
      continue;
    }
    for (const auto& block : msg.blocks) {
      if (IsTextBlock(block)) {
        texts.push_back(block.at("text").get<std::string>());
      }
    }
  }
  return texts;
}

std::string NormalizeMessagesToText(const std::vector<std::string>& texts) {
  std::string out;
  for (const auto& t : texts) {
    if (IsBlank(t)) continue;
    if (!out.empty()) out += '\n';
    out += t;
  }
  return out;
}

ChatCompletionsRequest RedactRequest(const ChatCompletionsRequest& request,
                                     const Guardrail& guardrail, bool* redacted) {
  ChatCompletionsRequest copy = request;
  bool any = false;
  for (auto& msg : copy.messages) {
    if (!msg.has_blocks) {
      auto result = guardrail.Redact(msg.text);
      any = any || result.redacted;
      msg.text = std::move(result.text);
      continue;
    }
    for (auto& block : msg.blocks) {
      if (!IsTextBlock(block)) continue;
      auto result = guardrail.Redact(block.at("text").get<std::string>());
      any = any || result.redacted;
      block["text"] = std::move(result.text);
    }
  }
  if (redacted) *redacted = any;
  return copy;
}

}  // namespace guardway
