#pragma once

#include <set>
#include <string>
#include <vector>

namespace guardway {

// A signature matches when its terms occur in order on one line. Each term
// is a list of alternative phrases; a phrase must start and end on a word
// boundary. Matching is ASCII case-insensitive and lines are split on '\n'.
struct InjectionSignature {
  std::string id;
  std::vector<std::vector<std::string>> terms;
};

// The signature table, in evaluation order.
const std::vector<InjectionSignature>& InjectionSignatures();

// Returns the ids of every signature found anywhere in `text`. Empty means
// no detection. Runs in time linear in the text length.
std::set<std::string> DetectInjection(const std::string& text);

}  // namespace guardway
