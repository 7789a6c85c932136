#include <catch2/catch_test_macros.hpp>

#include "gateway/chat_request.h"
#include "gateway/redaction.h"
#include "server/policy/guardrail.h"

#include <nlohmann/json.hpp>

#include <string>
#include <vector>

using json = nlohmann::json;
using namespace guardway;

namespace {

ChatCompletionsRequest Parse(const json& doc) {
  ChatCompletionsRequest req;
  std::vector<ValidationIssue> issues;
  REQUIRE(ValidateChatRequest(doc, &req, &issues));
  return req;
}

json MixedRequest() {
  return {{"model", "gpt-4o-mini"},
          {"temperature", 0.2},
          {"user", "ops@corp.com"},
          {"messages",
           json::array({{{"role", "system"}, {"content", "You are helpful."}},
                        {{"role", "user"},
                         {"content",
                          json::array({{{"type", "text"}, {"text", "mail a@b.com"}},
                                       {{"type", "image_url"},
                                        {"image_url", {{"url", "https://h/1.2.3.4.png"}}}},
                                       {{"type", "text"}, {"text", 42}},
                                       {{"type", "text"}, {"text", "   "}}})}}})}};
}

}  // namespace

TEST_CASE("Message texts are extracted in order", "[redaction]") {
  auto req = Parse(MixedRequest());
  auto texts = ExtractMessageTexts(req);
  REQUIRE(texts == std::vector<std::string>{"You are helpful.", "mail a@b.com", "   "});
}

TEST_CASE("Normalization joins non-blank fragments", "[redaction]") {
  REQUIRE(NormalizeMessagesToText({"a", "", "  \t", "b"}) == "a\nb");
  REQUIRE(NormalizeMessagesToText({}).empty());
  REQUIRE(NormalizeMessagesToText({" x "}) == " x ");
}

TEST_CASE("RedactRequest rewrites only message text", "[redaction]") {
  auto req = Parse(MixedRequest());
  Guardrail guardrail;
  bool redacted = false;
  auto clean = RedactRequest(req, guardrail, &redacted);
  REQUIRE(redacted);

  // The input is left untouched.
  REQUIRE(req.messages[1].blocks[0]["text"] == "mail a@b.com");

  REQUIRE(clean.messages[0].text == "You are helpful.");
  REQUIRE(clean.messages[1].blocks[0]["text"] == "mail [REDACTED_EMAIL]");
  // Non-text blocks and non-string text survive unchanged.
  REQUIRE(clean.messages[1].blocks[1] == req.messages[1].blocks[1]);
  REQUIRE(clean.messages[1].blocks[2]["text"] == 42);
  // Fields outside messages are not redacted.
  REQUIRE(*clean.user == "ops@corp.com");
  REQUIRE(clean.temperature == 0.2);
  REQUIRE(clean.model == "gpt-4o-mini");
}

TEST_CASE("RedactRequest reports clean requests", "[redaction]") {
  json doc = {{"model", "m"},
              {"messages", json::array({{{"role", "user"}, {"content", "hello there"}}})}};
  auto req = Parse(doc);
  Guardrail guardrail;
  bool redacted = true;
  auto clean = RedactRequest(req, guardrail, &redacted);
  REQUIRE_FALSE(redacted);
  REQUIRE(ToJson(clean) == ToJson(req));
}
