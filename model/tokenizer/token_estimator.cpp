#include "model/tokenizer/token_estimator.h"

#include <cctype>
#include <cmath>

namespace guardway {

namespace {

const EncodingProfile kCl100k{"cl100k_base", 4.0, 1.0};
const EncodingProfile kO200k{"o200k_base", 4.4, 1.5};

bool StartsWith(const std::string& s, const char* prefix) {
  return s.rfind(prefix, 0) == 0;
}

// A word costs at least one token; short common words are a single token.
int ChargeWord(std::size_t chars, double per_token) {
  if (chars == 0) return 0;
  long rounded = std::lround(static_cast<double>(chars) / per_token);
  return rounded < 1 ? 1 : static_cast<int>(rounded);
}

int ChargeNonAscii(std::size_t code_points, double per_token) {
  if (code_points == 0) return 0;
  return static_cast<int>(std::ceil(static_cast<double>(code_points) / per_token));
}

}  // namespace

const EncodingProfile& EncodingForModel(const std::string& model) {
  if (StartsWith(model, "gpt-4o") || StartsWith(model, "gpt-4.1") || StartsWith(model, "gpt-5") ||
      StartsWith(model, "o1") || StartsWith(model, "o3") || StartsWith(model, "o4")) {
    return kO200k;
  }
  return kCl100k;
}

int HeuristicTokenEstimator::Estimate(const std::string& model, const std::string& text) const {
  const EncodingProfile& profile = EncodingForModel(model);
  int tokens = 0;
  std::size_t ascii_run = 0;
  std::size_t non_ascii_run = 0;
  bool in_newlines = false;

  auto flush = [&]() {
    tokens += ChargeWord(ascii_run, profile.ascii_chars_per_token);
    tokens += ChargeNonAscii(non_ascii_run, profile.non_ascii_chars_per_token);
    ascii_run = 0;
    non_ascii_run = 0;
  };

  for (unsigned char c : text) {
    if (c >= 0x80) {
      // Count code points, not bytes.
      if ((c & 0xC0) != 0x80) ++non_ascii_run;
      in_newlines = false;
      continue;
    }
    if (std::isalnum(c)) {
      ++ascii_run;
      in_newlines = false;
      continue;
    }
    flush();
    if (c == '\n' || c == '\r') {
      // A run of line breaks is a single token.
      if (!in_newlines) ++tokens;
      in_newlines = true;
    } else if (!std::isspace(c)) {
      // Punctuation.
      ++tokens;
      in_newlines = false;
    } else {
      // Spaces merge into the following word.
      in_newlines = false;
    }
  }
  flush();
  return tokens;
}

}  // namespace guardway
