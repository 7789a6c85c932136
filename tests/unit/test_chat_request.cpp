#include <catch2/catch_test_macros.hpp>

#include "gateway/chat_request.h"

#include <nlohmann/json.hpp>

#include <string>
#include <vector>

using json = nlohmann::json;
using namespace guardway;

namespace {

std::vector<ValidationIssue> IssuesFor(const json& doc) {
  ChatCompletionsRequest req;
  std::vector<ValidationIssue> issues;
  ValidateChatRequest(doc, &req, &issues);
  return issues;
}

json MinimalRequest() {
  return {{"model", "gpt-4o-mini"},
          {"messages", json::array({{{"role", "user"}, {"content", "hi"}}})}};
}

}  // namespace

TEST_CASE("Minimal request gets defaults", "[chat_request]") {
  ChatCompletionsRequest req;
  std::vector<ValidationIssue> issues;
  REQUIRE(ParseChatRequest(MinimalRequest().dump(), &req, &issues));
  REQUIRE(issues.empty());
  REQUIRE(req.model == "gpt-4o-mini");
  REQUIRE(req.messages.size() == 1);
  REQUIRE(req.messages[0].role == ChatRole::kUser);
  REQUIRE(req.messages[0].text == "hi");
  REQUIRE_FALSE(req.messages[0].has_blocks);
  REQUIRE(req.temperature == 1.0);
  REQUIRE(req.top_p == 1.0);
  REQUIRE_FALSE(req.max_tokens.has_value());
  REQUIRE_FALSE(req.stream);
  REQUIRE(req.n == 1);
  REQUIRE_FALSE(req.response_format.has_value());
  REQUIRE_FALSE(req.user.has_value());
}

TEST_CASE("Full request is accepted", "[chat_request]") {
  json doc = MinimalRequest();
  doc["messages"] = json::array(
      {{{"role", "system"}, {"content", "be brief"}},
       {{"role", "user"},
        {"content", json::array({{{"type", "text"}, {"text", "look"}},
                                 {{"type", "image_url"},
                                  {"image_url", {{"url", "https://x/y.png"}}}}})}}});
  doc["temperature"] = 0;
  doc["top_p"] = 0.5;
  doc["max_tokens"] = 256;
  doc["stream"] = false;
  doc["n"] = 2;
  doc["presence_penalty"] = -1.5;
  doc["frequency_penalty"] = 2;
  doc["response_format"] = {{"type", "json_object"}};
  doc["user"] = "u-42";

  ChatCompletionsRequest req;
  std::vector<ValidationIssue> issues;
  REQUIRE(ValidateChatRequest(doc, &req, &issues));
  REQUIRE(req.messages[0].role == ChatRole::kSystem);
  REQUIRE(req.messages[1].has_blocks);
  REQUIRE(req.messages[1].blocks.size() == 2);
  REQUIRE(req.temperature == 0.0);
  REQUIRE(*req.max_tokens == 256);
  REQUIRE(req.n == 2);
  REQUIRE(req.frequency_penalty == 2.0);
  REQUIRE(*req.response_format == "json_object");
  REQUIRE(*req.user == "u-42");
}

TEST_CASE("Null optional fields select defaults", "[chat_request]") {
  json doc = MinimalRequest();
  doc["temperature"] = nullptr;
  doc["max_tokens"] = nullptr;
  doc["user"] = nullptr;
  ChatCompletionsRequest req;
  std::vector<ValidationIssue> issues;
  REQUIRE(ValidateChatRequest(doc, &req, &issues));
  REQUIRE(req.temperature == 1.0);
  REQUIRE_FALSE(req.max_tokens.has_value());
  REQUIRE_FALSE(req.user.has_value());
}

TEST_CASE("Malformed JSON body", "[chat_request]") {
  ChatCompletionsRequest req;
  std::vector<ValidationIssue> issues;
  REQUIRE_FALSE(ParseChatRequest("{\"model\": ", &req, &issues));
  REQUIRE(issues.size() == 1);
  REQUIRE(issues[0].type == "json_invalid");
  REQUIRE(issues[0].loc == json::array({"body"}));
}

TEST_CASE("Non-object body", "[chat_request]") {
  auto issues = IssuesFor(json::array({1, 2}));
  REQUIRE(issues.size() == 1);
  REQUIRE(issues[0].type == "model_type");
  REQUIRE(issues[0].loc == json::array());
}

TEST_CASE("Missing required fields", "[chat_request]") {
  auto issues = IssuesFor(json::object());
  REQUIRE(issues.size() == 2);
  REQUIRE(issues[0].loc == json::array({"model"}));
  REQUIRE(issues[0].type == "missing");
  REQUIRE(issues[0].msg == "Field required");
  REQUIRE(issues[1].loc == json::array({"messages"}));
}

TEST_CASE("Unknown fields are rejected", "[chat_request]") {
  json doc = MinimalRequest();
  doc["tools"] = json::array();
  doc["messages"][0]["name"] = "bob";
  auto issues = IssuesFor(doc);
  REQUIRE(issues.size() == 2);
  for (const auto& issue : issues) {
    REQUIRE(issue.type == "extra_forbidden");
    REQUIRE(issue.msg == "Extra inputs are not permitted");
  }
  REQUIRE(issues[0].loc == json::array({"tools"}));
  REQUIRE(issues[1].loc == json::array({"messages", 0, "name"}));
}

TEST_CASE("Model length limits", "[chat_request]") {
  json doc = MinimalRequest();
  doc["model"] = "";
  auto issues = IssuesFor(doc);
  REQUIRE(issues.size() == 1);
  REQUIRE(issues[0].type == "string_too_short");

  doc["model"] = std::string(kMaxModelLength, 'm');
  REQUIRE(IssuesFor(doc).empty());
  doc["model"] = std::string(kMaxModelLength + 1, 'm');
  REQUIRE(IssuesFor(doc)[0].type == "string_too_long");

  doc["model"] = 7;
  REQUIRE(IssuesFor(doc)[0].type == "string_type");
}

TEST_CASE("Lengths count code points", "[chat_request]") {
  json doc = MinimalRequest();
  std::string user;
  for (std::size_t i = 0; i < kMaxUserLength; ++i) {
    user += "\xc3\xa9";
  }
  doc["user"] = user;
  REQUIRE(IssuesFor(doc).empty());
}

TEST_CASE("Message list bounds", "[chat_request]") {
  json doc = MinimalRequest();
  doc["messages"] = json::array();
  REQUIRE(IssuesFor(doc)[0].type == "too_short");

  doc["messages"] = "hello";
  REQUIRE(IssuesFor(doc)[0].type == "list_type");

  json many = json::array();
  for (std::size_t i = 0; i <= kMaxMessages; ++i) {
    many.push_back({{"role", "user"}, {"content", "x"}});
  }
  doc["messages"] = many;
  REQUIRE(IssuesFor(doc)[0].type == "too_long");
}

TEST_CASE("Message shape errors", "[chat_request]") {
  json doc = MinimalRequest();
  doc["messages"] = json::array({"not an object",
                                 {{"role", "robot"}, {"content", "x"}},
                                 {{"role", "user"}},
                                 {{"role", "user"}, {"content", ""}},
                                 {{"role", "user"}, {"content", 5}},
                                 {{"role", "user"}, {"content", json::array({"raw"})}}});
  auto issues = IssuesFor(doc);
  REQUIRE(issues.size() == 6);
  REQUIRE(issues[0].type == "model_type");
  REQUIRE(issues[0].loc == json::array({"messages", 0}));
  REQUIRE(issues[1].type == "literal_error");
  REQUIRE(issues[1].loc == json::array({"messages", 1, "role"}));
  REQUIRE(issues[2].type == "missing");
  REQUIRE(issues[2].loc == json::array({"messages", 2, "content"}));
  REQUIRE(issues[3].type == "string_too_short");
  REQUIRE(issues[4].type == "union_type");
  REQUIRE(issues[5].type == "dict_type");
  REQUIRE(issues[5].loc == json::array({"messages", 5, "content", 0}));
}

TEST_CASE("Numeric ranges and types", "[chat_request]") {
  json doc = MinimalRequest();

  doc["temperature"] = 2.5;
  REQUIRE(IssuesFor(doc)[0].type == "less_than_equal");
  doc["temperature"] = -0.1;
  REQUIRE(IssuesFor(doc)[0].type == "greater_than_equal");
  doc["temperature"] = "hot";
  REQUIRE(IssuesFor(doc)[0].type == "float_type");
  doc.erase("temperature");

  doc["max_tokens"] = 0;
  REQUIRE(IssuesFor(doc)[0].type == "greater_than_equal");
  doc["max_tokens"] = kMaxTokensLimit + 1;
  REQUIRE(IssuesFor(doc)[0].type == "less_than_equal");
  doc["max_tokens"] = 10.0;
  REQUIRE(IssuesFor(doc)[0].type == "int_type");
  doc.erase("max_tokens");

  doc["n"] = 11;
  REQUIRE(IssuesFor(doc)[0].type == "less_than_equal");
  doc["n"] = true;
  REQUIRE(IssuesFor(doc)[0].type == "int_type");
  doc.erase("n");

  doc["stream"] = "yes";
  REQUIRE(IssuesFor(doc)[0].type == "bool_type");
}

TEST_CASE("Response format must be a known type", "[chat_request]") {
  json doc = MinimalRequest();
  doc["response_format"] = {{"type", "xml"}};
  auto issues = IssuesFor(doc);
  REQUIRE(issues[0].type == "literal_error");
  REQUIRE(issues[0].loc == json::array({"response_format", "type"}));

  doc["response_format"] = "text";
  REQUIRE(IssuesFor(doc)[0].type == "model_type");
}

TEST_CASE("ToJson writes every field", "[chat_request]") {
  ChatCompletionsRequest req;
  std::vector<ValidationIssue> issues;
  REQUIRE(ValidateChatRequest(MinimalRequest(), &req, &issues));
  auto j = ToJson(req);
  REQUIRE(j["model"] == "gpt-4o-mini");
  REQUIRE(j["messages"][0]["role"] == "user");
  REQUIRE(j["messages"][0]["content"] == "hi");
  REQUIRE(j["temperature"] == 1.0);
  REQUIRE(j["max_tokens"].is_null());
  REQUIRE(j["stream"] == false);
  REQUIRE(j["n"] == 1);
  REQUIRE(j["response_format"].is_null());
  REQUIRE(j["user"].is_null());
}

TEST_CASE("Validation details are serializable", "[chat_request]") {
  auto details = ValidationDetailsJson({{json::array({"model"}), "Field required", "missing"}});
  REQUIRE(details.size() == 1);
  REQUIRE(details[0]["loc"] == json::array({"model"}));
  REQUIRE(details[0]["msg"] == "Field required");
  REQUIRE(details[0]["type"] == "missing");
}
