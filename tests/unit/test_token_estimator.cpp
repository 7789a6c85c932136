#include <catch2/catch_test_macros.hpp>

#include "model/tokenizer/token_estimator.h"

#include <string>

using namespace guardway;

TEST_CASE("Encoding family per model", "[tokens]") {
  REQUIRE(std::string(EncodingForModel("gpt-4o-mini").name) == "o200k_base");
  REQUIRE(std::string(EncodingForModel("gpt-4.1").name) == "o200k_base");
  REQUIRE(std::string(EncodingForModel("o3-mini").name) == "o200k_base");
  REQUIRE(std::string(EncodingForModel("gpt-4").name) == "cl100k_base");
  REQUIRE(std::string(EncodingForModel("gpt-3.5-turbo").name) == "cl100k_base");
  REQUIRE(std::string(EncodingForModel("some-local-model").name) == "cl100k_base");
  REQUIRE(std::string(EncodingForModel("").name) == "cl100k_base");
}

TEST_CASE("Empty text costs nothing", "[tokens]") {
  HeuristicTokenEstimator estimator;
  REQUIRE(estimator.Estimate("gpt-4o-mini", "") == 0);
  REQUIRE(estimator.Estimate("unknown", "") == 0);
}

TEST_CASE("Words and punctuation", "[tokens]") {
  HeuristicTokenEstimator estimator;
  REQUIRE(estimator.Estimate("gpt-3.5-turbo", "hello world") == 2);
  REQUIRE(estimator.Estimate("gpt-3.5-turbo", "Hello, world!") == 4);
  REQUIRE(estimator.Estimate("gpt-3.5-turbo", "   ") == 0);
  // A run of line breaks is one token.
  REQUIRE(estimator.Estimate("gpt-3.5-turbo", "a\n\n\nb") == 3);
}

TEST_CASE("Long words depend on the encoding", "[tokens]") {
  HeuristicTokenEstimator estimator;
  const std::string word = "abcdefghijklmnopqrstuvwxyz";
  REQUIRE(estimator.Estimate("gpt-4", word) == 7);
  REQUIRE(estimator.Estimate("gpt-4o", word) == 6);
}

TEST_CASE("Non-ASCII text is charged per code point", "[tokens]") {
  HeuristicTokenEstimator estimator;
  const std::string text = "\xe6\x97\xa5\xe6\x9c\xac\xe8\xaa\x9e";  // three CJK characters
  REQUIRE(estimator.Estimate("gpt-4", text) == 3);
  REQUIRE(estimator.Estimate("gpt-4o", text) == 2);
}

TEST_CASE("Estimates grow with text", "[tokens]") {
  HeuristicTokenEstimator estimator;
  std::string text;
  int previous = 0;
  for (int i = 0; i < 20; ++i) {
    text += "the quick brown fox jumps. ";
    int current = estimator.Estimate("gpt-4o-mini", text);
    REQUIRE(current > previous);
    previous = current;
  }
}
