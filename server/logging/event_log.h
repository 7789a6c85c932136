#pragma once

#include <nlohmann/json.hpp>

#include <atomic>
#include <condition_variable>
#include <cstdint>
#include <fstream>
#include <mutex>
#include <optional>
#include <ostream>
#include <queue>
#include <string>
#include <thread>

namespace guardway {

// Destination for observation events (request summaries, billing
// simulation). Emit() may throw; callers on the request path catch and log.
class ObservationSink {
 public:
  virtual ~ObservationSink() = default;
  virtual void Emit(const nlohmann::json& event) = 0;
};

nlohmann::json MakeRequestEvent(const std::string& request_id, const std::string& client_id,
                                const std::string& method, const std::string& path,
                                int status_code, long long latency_ms);

// `completion_tokens` is null on the first (prompt-only) event of a request.
nlohmann::json MakeBillingEvent(const std::string& request_id, const std::string& client_id,
                                const std::string& model, int prompt_tokens,
                                std::optional<int> completion_tokens);

// JSON-lines event writer. Emit() serializes the event and hands the line to
// a background thread through a bounded queue; when the queue is full the
// event is dropped and counted, so a slow disk never stalls a request.
class EventLog : public ObservationSink {
 public:
  static constexpr std::size_t kDefaultQueueDepth = 4096;

  // Writes to `out`, which must outlive the EventLog (std::cout in the daemon).
  explicit EventLog(std::ostream* out, std::size_t max_queue_depth = kDefaultQueueDepth);
  // Appends to the file at `path`. Throws std::runtime_error if it cannot be
  // opened.
  explicit EventLog(const std::string& path, std::size_t max_queue_depth = kDefaultQueueDepth);
  ~EventLog() override;

  EventLog(const EventLog&) = delete;
  EventLog& operator=(const EventLog&) = delete;

  void Emit(const nlohmann::json& event) override;

  // Writes whatever is still queued and joins the writer thread. Events
  // emitted afterwards are dropped.
  void Stop();

  uint64_t Written() const { return written_.load(); }
  uint64_t Dropped() const { return dropped_.load(); }

 private:
  void Start();
  void Worker();

  std::ofstream file_;
  std::ostream* out_{nullptr};
  std::size_t max_queue_depth_;

  std::queue<std::string> lines_;
  std::mutex mutex_;
  std::condition_variable cv_;
  bool stop_{false};
  std::thread worker_;

  std::atomic<uint64_t> written_{0};
  std::atomic<uint64_t> dropped_{0};
};

}  // namespace guardway
