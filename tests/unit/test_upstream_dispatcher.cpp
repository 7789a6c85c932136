#include <catch2/catch_test_macros.hpp>

#include "gateway/upstream_dispatcher.h"
#include "test_fakes.h"

#include <nlohmann/json.hpp>

#include <chrono>
#include <stdexcept>
#include <string>
#include <vector>

using json = nlohmann::json;
using namespace guardway;
using std::chrono::milliseconds;

namespace {

struct RecordingSleeper {
  std::vector<milliseconds>* waits;
  void operator()(milliseconds d) const { waits->push_back(d); }
};

DispatcherConfig TestConfig() {
  DispatcherConfig config;
  config.base_url = "http://upstream.test/";
  config.api_key = "sk-test";
  config.timeout = milliseconds(1500);
  return config;
}

const json kPayload = {{"model", "gpt-4o-mini"},
                       {"messages", json::array({{{"role", "user"}, {"content", "hi"}}})}};

}  // namespace

TEST_CASE("Dispatcher requires a transport", "[upstream]") {
  REQUIRE_THROWS_AS(UpstreamDispatcher(TestConfig(), nullptr), std::invalid_argument);
}

TEST_CASE("Dispatcher forwards payload and correlation headers", "[upstream]") {
  test::FakeTransport transport;
  transport.PushResponse(200, R"({"id":"chatcmpl-1"})");
  std::vector<milliseconds> waits;
  UpstreamDispatcher dispatcher(TestConfig(), &transport, RecordingSleeper{&waits});

  auto outcome = dispatcher.Dispatch(kPayload, "req-1", "client-9");
  REQUIRE(outcome.result == DispatchResult::kSuccess);
  REQUIRE(outcome.HasResponse());
  REQUIRE(outcome.attempts == 1);
  REQUIRE(outcome.response.status == 200);
  REQUIRE(waits.empty());

  auto calls = transport.Calls();
  REQUIRE(calls.size() == 1);
  REQUIRE(calls[0].method == "POST");
  REQUIRE(calls[0].url == "http://upstream.test/v1/chat/completions");
  REQUIRE(calls[0].timeout == milliseconds(1500));
  REQUIRE(json::parse(calls[0].body) == kPayload);
  REQUIRE(calls[0].headers.at("Authorization") == "Bearer sk-test");
  REQUIRE(calls[0].headers.at("Content-Type") == "application/json");
  REQUIRE(calls[0].headers.at("X-Request-Id") == "req-1");
  REQUIRE(calls[0].headers.at("X-Client-Id") == "client-9");
}

TEST_CASE("Dispatcher omits Authorization without a key", "[upstream]") {
  test::FakeTransport transport;
  auto config = TestConfig();
  config.api_key.clear();
  config.request_id_header = "X-Correlation-Id";
  UpstreamDispatcher dispatcher(config, &transport);

  dispatcher.Dispatch(kPayload, "req-2", "anonymous", milliseconds(250));
  auto calls = transport.Calls();
  REQUIRE(calls.size() == 1);
  REQUIRE(calls[0].headers.count("Authorization") == 0);
  REQUIRE(calls[0].headers.at("X-Correlation-Id") == "req-2");
  REQUIRE(calls[0].timeout == milliseconds(250));
}

TEST_CASE("Dispatcher retries transient statuses with linear backoff", "[upstream]") {
  test::FakeTransport transport;
  transport.PushResponse(503, "busy");
  transport.PushResponse(503, "busy");
  transport.PushResponse(200, R"({"ok":true})");
  std::vector<milliseconds> waits;
  UpstreamDispatcher dispatcher(TestConfig(), &transport, RecordingSleeper{&waits});

  auto outcome = dispatcher.Dispatch(kPayload, "req-3", "c");
  REQUIRE(outcome.result == DispatchResult::kSuccess);
  REQUIRE(outcome.attempts == 3);
  REQUIRE(outcome.response.body == R"({"ok":true})");
  REQUIRE(waits == std::vector<milliseconds>{milliseconds(400), milliseconds(800)});
  REQUIRE(transport.CallCount() == 3);
}

TEST_CASE("Dispatcher returns the last transient status when attempts run out", "[upstream]") {
  test::FakeTransport transport;
  transport.SetDefault(500, R"({"error":"boom"})");
  std::vector<milliseconds> waits;
  UpstreamDispatcher dispatcher(TestConfig(), &transport, RecordingSleeper{&waits});

  auto outcome = dispatcher.Dispatch(kPayload, "req-4", "c");
  REQUIRE(outcome.result == DispatchResult::kNonTransientStatus);
  REQUIRE(outcome.HasResponse());
  REQUIRE(outcome.response.status == 500);
  REQUIRE(outcome.attempts == kMaxUpstreamAttempts);
  REQUIRE(waits.size() == 2);
}

TEST_CASE("Dispatcher passes non-transient statuses through at once", "[upstream]") {
  test::FakeTransport transport;
  transport.PushResponse(400, R"({"error":{"message":"bad"}})");
  std::vector<milliseconds> waits;
  UpstreamDispatcher dispatcher(TestConfig(), &transport, RecordingSleeper{&waits});

  auto outcome = dispatcher.Dispatch(kPayload, "req-5", "c");
  REQUIRE(outcome.result == DispatchResult::kNonTransientStatus);
  REQUIRE(outcome.response.status == 400);
  REQUIRE(outcome.attempts == 1);
  REQUIRE(waits.empty());
}

TEST_CASE("Dispatcher reports exhausted timeouts", "[upstream]") {
  test::FakeTransport transport;
  transport.PushTimeout();
  transport.PushTimeout();
  transport.PushTimeout();
  std::vector<milliseconds> waits;
  UpstreamDispatcher dispatcher(TestConfig(), &transport, RecordingSleeper{&waits});

  auto outcome = dispatcher.Dispatch(kPayload, "req-6", "c");
  REQUIRE(outcome.result == DispatchResult::kTimeout);
  REQUIRE_FALSE(outcome.HasResponse());
  REQUIRE(outcome.attempts == 3);
  REQUIRE_FALSE(outcome.error.empty());
  REQUIRE(waits == std::vector<milliseconds>{milliseconds(400), milliseconds(800)});
  REQUIRE(std::string(DispatchResultName(outcome.result)) == "timeout");
}

TEST_CASE("Dispatcher recovers from a network error", "[upstream]") {
  test::FakeTransport transport;
  transport.PushNetworkError();
  transport.PushResponse(201, "{}");
  std::vector<milliseconds> waits;
  UpstreamDispatcher dispatcher(TestConfig(), &transport, RecordingSleeper{&waits});

  auto outcome = dispatcher.Dispatch(kPayload, "req-7", "c");
  REQUIRE(outcome.result == DispatchResult::kSuccess);
  REQUIRE(outcome.attempts == 2);
  REQUIRE(outcome.error.empty());
}

TEST_CASE("Dispatcher reports the last transport failure", "[upstream]") {
  test::FakeTransport transport;
  transport.PushTimeout();
  transport.PushTimeout();
  transport.PushNetworkError();
  std::vector<milliseconds> waits;
  UpstreamDispatcher dispatcher(TestConfig(), &transport, RecordingSleeper{&waits});

  auto outcome = dispatcher.Dispatch(kPayload, "req-8", "c");
  REQUIRE(outcome.result == DispatchResult::kNetworkError);
  REQUIRE(outcome.attempts == 3);
  // No sleep after the final attempt.
  REQUIRE(waits.size() == 2);
  REQUIRE(std::string(DispatchResultName(outcome.result)) == "network_error");
}

TEST_CASE("Transient status table", "[upstream]") {
  for (int status : {408, 429, 500, 502, 503, 504}) {
    REQUIRE(UpstreamDispatcher::IsTransientStatus(status));
  }
  for (int status : {200, 400, 401, 404, 501}) {
    REQUIRE_FALSE(UpstreamDispatcher::IsTransientStatus(status));
  }
}

TEST_CASE("ListModels issues an authenticated GET", "[upstream]") {
  test::FakeTransport transport;
  transport.PushResponse(200, R"({"data":[]})");
  UpstreamDispatcher dispatcher(TestConfig(), &transport);

  auto response = dispatcher.ListModels();
  REQUIRE(response.status == 200);
  auto calls = transport.Calls();
  REQUIRE(calls[0].method == "GET");
  REQUIRE(calls[0].url == "http://upstream.test/v1/models");
  REQUIRE(calls[0].headers.at("Authorization") == "Bearer sk-test");

  transport.PushNetworkError();
  REQUIRE_THROWS_AS(dispatcher.ListModels(), HttpError);
}
