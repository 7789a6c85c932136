#include "server/logging/event_log.h"

#include <chrono>
#include <stdexcept>

using json = nlohmann::json;

namespace guardway {

json MakeRequestEvent(const std::string& request_id, const std::string& client_id,
                      const std::string& method, const std::string& path, int status_code,
                      long long latency_ms) {
  json j;
  j["event"] = "request";
  j["request_id"] = request_id;
  j["client_id"] = client_id;
  j["method"] = method;
  j["path"] = path;
  j["status_code"] = status_code;
  j["latency_ms"] = latency_ms;
  return j;
}

json MakeBillingEvent(const std::string& request_id, const std::string& client_id,
                      const std::string& model, int prompt_tokens,
                      std::optional<int> completion_tokens) {
  auto now = std::chrono::system_clock::now();
  auto ts = std::chrono::duration_cast<std::chrono::seconds>(now.time_since_epoch()).count();
  json j;
  j["event"] = "billing_simulation";
  j["request_id"] = request_id;
  j["client_id"] = client_id;
  j["model"] = model;
  j["prompt_tokens_estimated"] = prompt_tokens;
  j["completion_tokens_estimated"] =
      completion_tokens ? json(*completion_tokens) : json(nullptr);
  j["timestamp_unix"] = ts;
  return j;
}

EventLog::EventLog(std::ostream* out, std::size_t max_queue_depth)
    : out_(out), max_queue_depth_(max_queue_depth == 0 ? 1 : max_queue_depth) {
  if (!out_) {
    throw std::invalid_argument("EventLog requires an output stream");
  }
  Start();
}

EventLog::EventLog(const std::string& path, std::size_t max_queue_depth)
    : max_queue_depth_(max_queue_depth == 0 ? 1 : max_queue_depth) {
  file_.open(path, std::ios::app);
  if (!file_.is_open()) {
    throw std::runtime_error("cannot open event log " + path);
  }
  out_ = &file_;
  Start();
}

EventLog::~EventLog() { Stop(); }

void EventLog::Start() { worker_ = std::thread(&EventLog::Worker, this); }

void EventLog::Stop() {
  {
    std::lock_guard<std::mutex> lock(mutex_);
    stop_ = true;
  }
  cv_.notify_all();
  if (worker_.joinable()) {
    worker_.join();
  }
}

void EventLog::Emit(const json& event) {
  std::string line = event.dump(-1, ' ', false, json::error_handler_t::replace);
  {
    std::lock_guard<std::mutex> lock(mutex_);
    if (stop_ || lines_.size() >= max_queue_depth_) {
      dropped_.fetch_add(1);
      return;
    }
    lines_.push(std::move(line));
  }
  cv_.notify_one();
}

void EventLog::Worker() {
  while (true) {
    std::string line;
    {
      std::unique_lock<std::mutex> lock(mutex_);
      cv_.wait(lock, [&] { return stop_ || !lines_.empty(); });
      if (stop_ && lines_.empty()) {
        return;
      }
      line = std::move(lines_.front());
      lines_.pop();
    }
    (*out_) << line << "\n";
    out_->flush();
    written_.fetch_add(1);
  }
}

}  // namespace guardway
