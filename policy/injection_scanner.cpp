#include "policy/injection_scanner.h"

#include <algorithm>
#include <cstddef>

namespace guardway {
namespace {

// Bytes of multi-byte UTF-8 sequences count as word characters, as in the
// pattern redactor.
bool IsWordChar(char c) {
  return (c >= '0' && c <= '9') || (c >= 'a' && c <= 'z') || (c >= 'A' && c <= 'Z') ||
         c == '_' || static_cast<unsigned char>(c) >= 0x80;
}

char FoldCase(char c) { return (c >= 'A' && c <= 'Z') ? static_cast<char>(c - 'A' + 'a') : c; }

std::string Folded(const std::string& text) {
  std::string out(text);
  for (auto& c : out) {
    c = FoldCase(c);
  }
  return out;
}

// Earliest word-bounded occurrence of `phrase` in folded[from, line_end).
// Returns npos when absent. `phrase` is lower case.
std::size_t FindPhrase(const std::string& folded, std::size_t from, std::size_t line_begin,
                       std::size_t line_end, const std::string& phrase) {
  const auto first = folded.begin();
  while (from < line_end) {
    auto it = std::search(first + from, first + line_end, phrase.begin(), phrase.end());
    if (it == first + line_end) {
      return std::string::npos;
    }
    std::size_t at = static_cast<std::size_t>(it - first);
    std::size_t end = at + phrase.size();
    bool starts = at == line_begin || !IsWordChar(folded[at - 1]);
    bool ends = end == line_end || !IsWordChar(folded[end]);
    if (starts && ends) {
      return at;
    }
    from = at + 1;
  }
  return std::string::npos;
}

// Taking the earliest occurrence of each term is enough: any later choice
// leaves less of the line for the terms that follow.
bool MatchesLine(const InjectionSignature& sig, const std::string& folded, std::size_t begin,
                 std::size_t end) {
  std::size_t cursor = begin;
  for (const auto& alternatives : sig.terms) {
    std::size_t best = std::string::npos;
    std::size_t best_end = 0;
    for (const auto& phrase : alternatives) {
      std::size_t at = FindPhrase(folded, cursor, begin, end, phrase);
      if (at != std::string::npos && (best == std::string::npos || at < best)) {
        best = at;
        best_end = at + phrase.size();
      }
    }
    if (best == std::string::npos) {
      return false;
    }
    cursor = best_end;
  }
  return true;
}

}  // namespace

const std::vector<InjectionSignature>& InjectionSignatures() {
  static const std::vector<InjectionSignature> signatures = {
      {"ignore_previous_instructions", {{"ignore"}, {"previous"}, {"instructions"}}},
      {"system_override", {{"system"}, {"override"}}},
      {"dan", {{"dan"}}},
      {"jailbreak", {{"jailbreak", "do anything now"}}},
  };
  return signatures;
}

std::set<std::string> DetectInjection(const std::string& text) {
  std::set<std::string> hits;
  const std::string folded = Folded(text);
  std::size_t line_start = 0;
  while (line_start < folded.size()) {
    std::size_t line_end = folded.find('\n', line_start);
    if (line_end == std::string::npos) {
      line_end = folded.size();
    }
    for (const auto& sig : InjectionSignatures()) {
      if (!hits.count(sig.id) && MatchesLine(sig, folded, line_start, line_end)) {
        hits.insert(sig.id);
      }
    }
    if (hits.size() == InjectionSignatures().size()) {
      break;
    }
    line_start = line_end + 1;
  }
  return hits;
}

}  // namespace guardway
