#pragma once

#include <string>

namespace guardway {

// Approximation parameters for one BPE encoding family.
struct EncodingProfile {
  const char* name;
  // Average ASCII letters/digits folded into one token.
  double ascii_chars_per_token;
  // Average non-ASCII code points per token.
  double non_ascii_chars_per_token;
};

// Profile used for a model id. gpt-4o, gpt-4.1, gpt-5 and the o-series map to
// o200k_base; everything else, unknown ids included, to cl100k_base.
const EncodingProfile& EncodingForModel(const std::string& model);

// Token-count estimation for billing simulation. Implementations never throw.
class TokenEstimator {
 public:
  virtual ~TokenEstimator() = default;
  virtual int Estimate(const std::string& model, const std::string& text) const = 0;
};

// Word-piece heuristic: text is pre-tokenized into words, punctuation and
// line breaks the way BPE pre-tokenizers split it, and each word is charged
// by its length under the model's encoding profile.
class HeuristicTokenEstimator : public TokenEstimator {
 public:
  int Estimate(const std::string& model, const std::string& text) const override;
};

}  // namespace guardway
