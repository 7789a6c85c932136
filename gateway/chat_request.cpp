#include "gateway/chat_request.h"

#include <climits>
#include <set>

using json = nlohmann::json;

namespace guardway {

namespace {

const std::set<std::string> kRequestFields = {
    "model",    "messages",         "temperature",       "top_p",
    "max_tokens", "stream",         "n",                 "presence_penalty",
    "frequency_penalty", "response_format", "user"};
const std::set<std::string> kMessageFields = {"role", "content"};
const std::set<std::string> kResponseFormatFields = {"type"};

json At(const json& path, const json& part) {
  json out = path;
  out.push_back(part);
  return out;
}

void AddIssue(std::vector<ValidationIssue>* issues, json loc, std::string msg, std::string type) {
  issues->push_back({std::move(loc), std::move(msg), std::move(type)});
}

// Length in Unicode code points; continuation bytes are not counted.
std::size_t CodePointLength(const std::string& s) {
  std::size_t n = 0;
  for (unsigned char c : s) {
    if ((c & 0xC0) != 0x80) ++n;
  }
  return n;
}

void RejectExtraFields(const json& obj, const std::set<std::string>& allowed, const json& path,
                       std::vector<ValidationIssue>* issues) {
  for (auto it = obj.begin(); it != obj.end(); ++it) {
    if (allowed.count(it.key()) == 0) {
      AddIssue(issues, At(path, it.key()), "Extra inputs are not permitted", "extra_forbidden");
    }
  }
}

bool ReadString(const json& value, const json& loc, std::size_t min_len, std::size_t max_len,
                std::string* out, std::vector<ValidationIssue>* issues) {
  if (!value.is_string()) {
    AddIssue(issues, loc, "Input should be a valid string", "string_type");
    return false;
  }
  const auto& s = value.get_ref<const std::string&>();
  std::size_t len = CodePointLength(s);
  if (len < min_len) {
    AddIssue(issues, loc,
             "String should have at least " + std::to_string(min_len) +
                 (min_len == 1 ? " character" : " characters"),
             "string_too_short");
    return false;
  }
  if (len > max_len) {
    AddIssue(issues, loc, "String should have at most " + std::to_string(max_len) + " characters",
             "string_too_long");
    return false;
  }
  *out = s;
  return true;
}

// Float-typed field: integers are accepted, booleans and strings are not.
bool ReadNumber(const json& value, const json& loc, double lo, double hi, double* out,
                std::vector<ValidationIssue>* issues) {
  if (!value.is_number()) {
    AddIssue(issues, loc, "Input should be a valid number", "float_type");
    return false;
  }
  double v = value.get<double>();
  if (v < lo) {
    AddIssue(issues, loc, "Input should be greater than or equal to " + json(lo).dump(),
             "greater_than_equal");
    return false;
  }
  if (v > hi) {
    AddIssue(issues, loc, "Input should be less than or equal to " + json(hi).dump(),
             "less_than_equal");
    return false;
  }
  *out = v;
  return true;
}

// Integer-typed field: floats are rejected even when integral.
bool ReadInteger(const json& value, const json& loc, long long lo, long long hi, int* out,
                 std::vector<ValidationIssue>* issues) {
  if (!value.is_number_integer()) {
    AddIssue(issues, loc, "Input should be a valid integer", "int_type");
    return false;
  }
  bool too_large = false;
  long long v = 0;
  if (value.is_number_unsigned()) {
    auto u = value.get<unsigned long long>();
    if (u > static_cast<unsigned long long>(LLONG_MAX)) {
      too_large = true;
    } else {
      v = static_cast<long long>(u);
    }
  } else {
    v = value.get<long long>();
  }
  if (!too_large && v < lo) {
    AddIssue(issues, loc, "Input should be greater than or equal to " + std::to_string(lo),
             "greater_than_equal");
    return false;
  }
  if (too_large || v > hi) {
    AddIssue(issues, loc, "Input should be less than or equal to " + std::to_string(hi),
             "less_than_equal");
    return false;
  }
  *out = static_cast<int>(v);
  return true;
}

bool ParseRole(const json& value, ChatRole* role) {
  if (!value.is_string()) return false;
  const auto& s = value.get_ref<const std::string&>();
  if (s == "system") {
    *role = ChatRole::kSystem;
  } else if (s == "user") {
    *role = ChatRole::kUser;
  } else if (s == "assistant") {
    *role = ChatRole::kAssistant;
  } else if (s == "tool") {
    *role = ChatRole::kTool;
  } else {
    return false;
  }
  return true;
}

void ValidateMessage(const json& value, const json& path, ChatMessage* msg,
                     std::vector<ValidationIssue>* issues) {
  if (!value.is_object()) {
    AddIssue(issues, path, "Input should be a valid dictionary or instance of ChatMessage",
             "model_type");
    return;
  }
  RejectExtraFields(value, kMessageFields, path, issues);

  auto role = value.find("role");
  if (role == value.end()) {
    AddIssue(issues, At(path, "role"), "Field required", "missing");
  } else if (!ParseRole(*role, &msg->role)) {
    AddIssue(issues, At(path, "role"), "Input should be 'system', 'user', 'assistant' or 'tool'",
             "literal_error");
  }

  auto content = value.find("content");
  json content_loc = At(path, "content");
  if (content == value.end()) {
    AddIssue(issues, content_loc, "Field required", "missing");
    return;
  }
  if (content->is_string()) {
    msg->has_blocks = false;
    ReadString(*content, content_loc, 1, std::string::npos, &msg->text, issues);
    return;
  }
  if (content->is_array()) {
    msg->has_blocks = true;
    if (content->empty()) {
      AddIssue(issues, content_loc, "List should have at least 1 item after validation, not 0",
               "too_short");
      return;
    }
    for (std::size_t i = 0; i < content->size(); ++i) {
      const auto& block = (*content)[i];
      if (!block.is_object()) {
        AddIssue(issues, At(content_loc, i), "Input should be a valid dictionary", "dict_type");
        continue;
      }
      msg->blocks.push_back(block);
    }
    return;
  }
  AddIssue(issues, content_loc, "Input should be a valid string or a list of content blocks",
           "union_type");
}

}  // namespace

const char* ChatRoleName(ChatRole role) {
  switch (role) {
    case ChatRole::kSystem:
      return "system";
    case ChatRole::kUser:
      return "user";
    case ChatRole::kAssistant:
      return "assistant";
    case ChatRole::kTool:
      return "tool";
  }
  return "user";
}

bool ValidateChatRequest(const json& doc, ChatCompletionsRequest* out,
                         std::vector<ValidationIssue>* issues) {
  issues->clear();
  ChatCompletionsRequest req;
  const json root = json::array();

  if (!doc.is_object()) {
    AddIssue(issues, root, "Input should be a valid dictionary or object to extract fields from",
             "model_type");
    return false;
  }
  RejectExtraFields(doc, kRequestFields, root, issues);

  auto model = doc.find("model");
  if (model == doc.end()) {
    AddIssue(issues, At(root, "model"), "Field required", "missing");
  } else {
    ReadString(*model, At(root, "model"), 1, kMaxModelLength, &req.model, issues);
  }

  auto messages = doc.find("messages");
  json messages_loc = At(root, "messages");
  if (messages == doc.end()) {
    AddIssue(issues, messages_loc, "Field required", "missing");
  } else if (!messages->is_array()) {
    AddIssue(issues, messages_loc, "Input should be a valid list", "list_type");
  } else if (messages->empty()) {
    AddIssue(issues, messages_loc, "List should have at least 1 item after validation, not 0",
             "too_short");
  } else if (messages->size() > kMaxMessages) {
    AddIssue(issues, messages_loc,
             "List should have at most " + std::to_string(kMaxMessages) +
                 " items after validation, not " + std::to_string(messages->size()),
             "too_long");
  } else {
    req.messages.resize(messages->size());
    for (std::size_t i = 0; i < messages->size(); ++i) {
      ValidateMessage((*messages)[i], At(messages_loc, i), &req.messages[i], issues);
    }
  }

  // Optional fields: absent or null keeps the default.
  auto present = [&doc](const char* key) -> const json* {
    auto it = doc.find(key);
    if (it == doc.end() || it->is_null()) return nullptr;
    return &*it;
  };

  if (const json* v = present("temperature")) {
    ReadNumber(*v, At(root, "temperature"), 0.0, 2.0, &req.temperature, issues);
  }
  if (const json* v = present("top_p")) {
    ReadNumber(*v, At(root, "top_p"), 0.0, 1.0, &req.top_p, issues);
  }
  if (const json* v = present("max_tokens")) {
    int max_tokens = 0;
    if (ReadInteger(*v, At(root, "max_tokens"), 1, kMaxTokensLimit, &max_tokens, issues)) {
      req.max_tokens = max_tokens;
    }
  }
  if (const json* v = present("stream")) {
    if (!v->is_boolean()) {
      AddIssue(issues, At(root, "stream"), "Input should be a valid boolean", "bool_type");
    } else {
      req.stream = v->get<bool>();
    }
  }
  if (const json* v = present("n")) {
    ReadInteger(*v, At(root, "n"), 1, kMaxChoices, &req.n, issues);
  }
  if (const json* v = present("presence_penalty")) {
    ReadNumber(*v, At(root, "presence_penalty"), -2.0, 2.0, &req.presence_penalty, issues);
  }
  if (const json* v = present("frequency_penalty")) {
    ReadNumber(*v, At(root, "frequency_penalty"), -2.0, 2.0, &req.frequency_penalty, issues);
  }
  if (const json* v = present("response_format")) {
    json loc = At(root, "response_format");
    if (!v->is_object()) {
      AddIssue(issues, loc, "Input should be a valid dictionary or instance of ResponseFormat",
               "model_type");
    } else {
      RejectExtraFields(*v, kResponseFormatFields, loc, issues);
      auto type = v->find("type");
      if (type == v->end()) {
        AddIssue(issues, At(loc, "type"), "Field required", "missing");
      } else if (!type->is_string() ||
                 (type->get_ref<const std::string&>() != "text" &&
                  type->get_ref<const std::string&>() != "json_object")) {
        AddIssue(issues, At(loc, "type"), "Input should be 'text' or 'json_object'",
                 "literal_error");
      } else {
        req.response_format = type->get<std::string>();
      }
    }
  }
  if (const json* v = present("user")) {
    std::string user;
    if (ReadString(*v, At(root, "user"), 0, kMaxUserLength, &user, issues)) {
      req.user = std::move(user);
    }
  }

  if (!issues->empty()) {
    return false;
  }
  *out = std::move(req);
  return true;
}

bool ParseChatRequest(const std::string& body, ChatCompletionsRequest* out,
                      std::vector<ValidationIssue>* issues) {
  issues->clear();
  json doc = json::parse(body, nullptr, false);
  if (doc.is_discarded()) {
    AddIssue(issues, json::array({"body"}), "JSON decode error", "json_invalid");
    return false;
  }
  return ValidateChatRequest(doc, out, issues);
}

json ToJson(const ChatCompletionsRequest& request) {
  json j;
  j["model"] = request.model;
  json messages = json::array();
  for (const auto& msg : request.messages) {
    json m;
    m["role"] = ChatRoleName(msg.role);
    if (msg.has_blocks) {
      m["content"] = msg.blocks;
    } else {
      m["content"] = msg.text;
    }
    messages.push_back(std::move(m));
  }
  j["messages"] = std::move(messages);
  j["temperature"] = request.temperature;
  j["top_p"] = request.top_p;
  j["max_tokens"] = request.max_tokens ? json(*request.max_tokens) : json(nullptr);
  j["stream"] = request.stream;
  j["n"] = request.n;
  j["presence_penalty"] = request.presence_penalty;
  j["frequency_penalty"] = request.frequency_penalty;
  if (request.response_format) {
    j["response_format"] = json{{"type", *request.response_format}};
  } else {
    j["response_format"] = nullptr;
  }
  j["user"] = request.user ? json(*request.user) : json(nullptr);
  return j;
}

json ValidationDetailsJson(const std::vector<ValidationIssue>& issues) {
  json details = json::array();
  for (const auto& issue : issues) {
    details.push_back({{"loc", issue.loc}, {"msg", issue.msg}, {"type", issue.type}});
  }
  return details;
}

}  // namespace guardway
