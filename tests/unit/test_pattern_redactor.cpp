#include <catch2/catch_test_macros.hpp>

#include "policy/pattern_redactor.h"

#include <string>

using namespace guardway;

TEST_CASE("Pattern redactor masks email and card in one prompt", "[redactor]") {
  auto result = RedactPatterns("My email is a@b.com and card 4111111111111111");
  REQUIRE(result.redacted);
  REQUIRE(result.text == "My email is [REDACTED_EMAIL] and card [REDACTED_CREDIT_CARD]");
}

TEST_CASE("Pattern redactor leaves clean text untouched", "[redactor]") {
  auto result = RedactPatterns("What's the weather in Paris? Order 1234 shipped.");
  REQUIRE_FALSE(result.redacted);
  REQUIRE(result.text == "What's the weather in Paris? Order 1234 shipped.");

  auto empty = RedactPatterns("");
  REQUIRE_FALSE(empty.redacted);
  REQUIRE(empty.text.empty());
}

TEST_CASE("Email detection", "[redactor]") {
  REQUIRE(RedactEmails("contact john.doe+tag@example.co.uk today") ==
          "contact [REDACTED_EMAIL] today");
  REQUIRE(RedactEmails("a@b.com,c@d.org") == "[REDACTED_EMAIL],[REDACTED_EMAIL]");
  // No dotted TLD: not an address.
  REQUIRE(RedactEmails("ssh user@localhost") == "ssh user@localhost");
  REQUIRE(RedactEmails("lone @ sign") == "lone @ sign");
}

TEST_CASE("IPv4 detection", "[redactor]") {
  REQUIRE(RedactIpv4("connect to 192.168.1.10 now") == "connect to [REDACTED_IP] now");
  REQUIRE(RedactIpv4("0.0.0.0 and 255.255.255.255") == "[REDACTED_IP] and [REDACTED_IP]");
  // Octet out of range and too few octets.
  REQUIRE(RedactIpv4("999.1.1.1") == "999.1.1.1");
  REQUIRE(RedactIpv4("version 1.2.3") == "version 1.2.3");
  // Glued to a word on either side.
  REQUIRE(RedactIpv4("build v1.2.3.4") == "build v1.2.3.4");
  REQUIRE(RedactIpv4("10.0.0.1x") == "10.0.0.1x");
}

TEST_CASE("Luhn checksum", "[redactor]") {
  REQUIRE(LuhnValid("4111111111111111"));
  REQUIRE(LuhnValid("4111 1111 1111 1111"));
  REQUIRE(LuhnValid("378282246310005"));
  REQUIRE_FALSE(LuhnValid("4111111111111112"));
  // Valid checksum but too short to be a card number.
  REQUIRE_FALSE(LuhnValid("79927398713"));
  REQUIRE_FALSE(LuhnValid(""));
}

TEST_CASE("Card detection accepts grouped numbers", "[redactor]") {
  REQUIRE(RedactCreditCards("card 4111 1111 1111 1111 exp") == "card [REDACTED_CREDIT_CARD] exp");
  REQUIRE(RedactCreditCards("card 4111-1111-1111-1111.") == "card [REDACTED_CREDIT_CARD].");
  REQUIRE(RedactCreditCards("amex 378282246310005") == "amex [REDACTED_CREDIT_CARD]");
}

TEST_CASE("Card detection requires a valid checksum", "[redactor]") {
  REQUIRE(RedactCreditCards("card 4111111111111112") == "card 4111111111111112");
  auto result = RedactPatterns("ticket 1234567890123");
  REQUIRE_FALSE(result.redacted);
}

TEST_CASE("Card detection ignores digits glued to words", "[redactor]") {
  REQUIRE(RedactCreditCards("id abc4111111111111111") == "id abc4111111111111111");
  REQUIRE(RedactCreditCards("card 4111111111111111x") == "card 4111111111111111x");
}

// A candidate ends at the first group end holding 13 or more digits, so
// trailing numbers such as a CVV or expiry stay outside it.
TEST_CASE("Card detection stops at the first group reaching 13 digits", "[redactor]") {
  REQUIRE(RedactCreditCards("card 4111 1111 1111 1111 123") ==
          "card [REDACTED_CREDIT_CARD] 123");
  REQUIRE(RedactCreditCards("card 4111111111111111 12 25") == "card [REDACTED_CREDIT_CARD] 12 25");
  REQUIRE(RedactCreditCards("x+ 6011111111111117 092+Z3b") == "x+ [REDACTED_CREDIT_CARD] 092+Z3b");
  REQUIRE(RedactCreditCards("4111111111111111 4111 1111 1111 1111") ==
          "[REDACTED_CREDIT_CARD] [REDACTED_CREDIT_CARD]");
  REQUIRE(RedactCreditCards("4111111111111111-4111111111111111") ==
          "[REDACTED_CREDIT_CARD]-[REDACTED_CREDIT_CARD]");
  REQUIRE(RedactCreditCards("4111  --  1111 1111 1111") == "[REDACTED_CREDIT_CARD]");
}

TEST_CASE("Card detection skips runs longer than 19 digits", "[redactor]") {
  REQUIRE(RedactCreditCards("acct 41111111111111111111 end") == "acct 41111111111111111111 end");
  // Leading groups that overflow are skipped; the card after them is found.
  REQUIRE(RedactCreditCards("1234 5678 4111111111111111") == "1234 5678 [REDACTED_CREDIT_CARD]");
  REQUIRE(RedactCreditCards("n 12345678901 4111111111111111") ==
          "n 12345678901 [REDACTED_CREDIT_CARD]");
}

TEST_CASE("Pattern redaction is idempotent", "[redactor]") {
  const std::string input =
      "mail a@b.com from 10.1.2.3 paying with 4111 1111 1111 1111, cc x.y@corp.io";
  auto once = RedactPatterns(input);
  auto twice = RedactPatterns(once.text);
  REQUIRE(once.redacted);
  REQUIRE_FALSE(twice.redacted);
  REQUIRE(twice.text == once.text);
}

TEST_CASE("PatternRedactor reports its name", "[redactor]") {
  PatternRedactor redactor;
  REQUIRE(redactor.Name() == "pattern");
  REQUIRE(redactor.Redact("x@y.com").text == kRedactedEmail);
}
