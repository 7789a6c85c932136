#pragma once

#include "policy/pii_redactor.h"

#include <string>

namespace guardway {

// Luhn checksum over the digits of `number`; non-digits are ignored.
// Candidates with fewer than 13 or more than 19 digits never pass.
bool LuhnValid(const std::string& number);

// Individual detectors, applied in this order by RedactPatterns().
std::string RedactEmails(const std::string& text);
std::string RedactIpv4(const std::string& text);
std::string RedactCreditCards(const std::string& text);

// Email -> IPv4 -> payment card. Every detector is a single left-to-right
// scan, so the cost is linear in the input size.
RedactionResult RedactPatterns(const std::string& text);

class PatternRedactor : public PiiRedactor {
 public:
  RedactionResult Redact(const std::string& text) const override { return RedactPatterns(text); }
  std::string Name() const override { return "pattern"; }
};

}  // namespace guardway
