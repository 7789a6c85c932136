#include "policy/pattern_redactor.h"

#include <cstddef>
#include <vector>

namespace guardway {
namespace {

bool IsDigit(char c) { return c >= '0' && c <= '9'; }

bool IsAlpha(char c) { return (c >= 'a' && c <= 'z') || (c >= 'A' && c <= 'Z'); }

// Bytes of multi-byte UTF-8 sequences count as word characters so that a
// boundary is not reported in the middle of a non-ASCII word.
bool IsWordChar(char c) {
  return IsDigit(c) || IsAlpha(c) || c == '_' || static_cast<unsigned char>(c) >= 0x80;
}

bool IsEmailLocalChar(char c) {
  return IsDigit(c) || IsAlpha(c) || c == '.' || c == '_' || c == '%' || c == '+' || c == '-';
}

bool IsEmailDomainChar(char c) { return IsDigit(c) || IsAlpha(c) || c == '.' || c == '-'; }

bool IsCardSeparator(char c) { return c == ' ' || c == '-'; }

bool WordBoundaryAt(const std::string& text, std::size_t pos) {
  bool before = pos > 0 && IsWordChar(text[pos - 1]);
  bool after = pos < text.size() && IsWordChar(text[pos]);
  return before != after;
}

// Returns the end (exclusive) of the longest `host.tld` prefix of the domain
// run [begin, run_end), or npos. The TLD is two or more letters and must be
// followed by a word boundary.
std::size_t MatchEmailDomain(const std::string& text, std::size_t begin, std::size_t run_end) {
  for (std::size_t end = run_end; end >= begin + 3; --end) {
    if (!IsAlpha(text[end - 1]) || !WordBoundaryAt(text, end)) {
      continue;
    }
    std::size_t letters_begin = end;
    while (letters_begin > begin && IsAlpha(text[letters_begin - 1])) {
      --letters_begin;
    }
    if (end - letters_begin < 2 || letters_begin == begin) {
      continue;
    }
    std::size_t dot = letters_begin - 1;
    if (text[dot] == '.' && dot > begin) {
      return end;
    }
  }
  return std::string::npos;
}

bool MatchIpv4At(const std::string& text, std::size_t start, std::size_t* end) {
  std::size_t pos = start;
  for (int octet = 0; octet < 4; ++octet) {
    std::size_t digits_end = pos;
    while (digits_end < text.size() && IsDigit(text[digits_end])) {
      ++digits_end;
    }
    std::size_t len = digits_end - pos;
    if (len == 0 || len > 3) {
      return false;
    }
    int value = 0;
    for (std::size_t i = pos; i < digits_end; ++i) {
      value = value * 10 + (text[i] - '0');
    }
    if (value > 255) {
      return false;
    }
    if (octet < 3) {
      if (digits_end >= text.size() || text[digits_end] != '.') {
        return false;
      }
      pos = digits_end + 1;
    } else {
      if (digits_end < text.size() && IsWordChar(text[digits_end])) {
        return false;
      }
      *end = digits_end;
    }
  }
  return true;
}

// Card candidates are digit groups joined by runs of spaces or hyphens. A
// candidate starting at `start` ends at the first group end where 13 or more
// digits have been read; that point must be a word boundary and the total
// must not exceed 19. Returns false when no candidate starts at `start`.
bool MatchCardAt(const std::string& text, std::size_t start, std::size_t* end) {
  std::size_t digits = 0;
  std::size_t pos = start;
  while (true) {
    std::size_t run_end = pos;
    while (run_end < text.size() && IsDigit(text[run_end])) {
      ++run_end;
    }
    digits += run_end - pos;
    if (digits > 19) {
      return false;
    }
    if (digits >= 13) {
      if (run_end < text.size() && IsWordChar(text[run_end])) {
        return false;
      }
      *end = run_end;
      return true;
    }
    std::size_t sep = run_end;
    while (sep < text.size() && IsCardSeparator(text[sep])) {
      ++sep;
    }
    if (sep == run_end || sep == text.size() || !IsDigit(text[sep])) {
      return false;
    }
    pos = sep;
  }
}

}  // namespace

bool LuhnValid(const std::string& number) {
  std::vector<int> digits;
  digits.reserve(number.size());
  for (char c : number) {
    if (IsDigit(c)) {
      digits.push_back(c - '0');
    }
  }
  if (digits.size() < 13 || digits.size() > 19) {
    return false;
  }
  int checksum = 0;
  bool doubled = false;
  for (auto it = digits.rbegin(); it != digits.rend(); ++it) {
    int d = *it;
    if (doubled) {
      d *= 2;
      if (d > 9) {
        d -= 9;
      }
    }
    checksum += d;
    doubled = !doubled;
  }
  return checksum % 10 == 0;
}

std::string RedactEmails(const std::string& text) {
  std::string out;
  out.reserve(text.size());
  std::size_t emitted = 0;
  std::size_t at = text.find('@');
  while (at != std::string::npos) {
    std::size_t run_begin = at;
    while (run_begin > emitted && IsEmailLocalChar(text[run_begin - 1])) {
      --run_begin;
    }
    std::size_t start = std::string::npos;
    for (std::size_t s = run_begin; s < at; ++s) {
      if (WordBoundaryAt(text, s)) {
        start = s;
        break;
      }
    }
    std::size_t run_end = at + 1;
    while (run_end < text.size() && IsEmailDomainChar(text[run_end])) {
      ++run_end;
    }
    std::size_t end = std::string::npos;
    if (start != std::string::npos) {
      end = MatchEmailDomain(text, at + 1, run_end);
    }
    if (end == std::string::npos) {
      at = text.find('@', at + 1);
      continue;
    }
    out.append(text, emitted, start - emitted);
    out.append(kRedactedEmail);
    emitted = end;
    at = text.find('@', end);
  }
  out.append(text, emitted, std::string::npos);
  return out;
}

std::string RedactIpv4(const std::string& text) {
  std::string out;
  out.reserve(text.size());
  std::size_t emitted = 0;
  std::size_t i = 0;
  while (i < text.size()) {
    if (IsDigit(text[i]) && (i == 0 || !IsWordChar(text[i - 1]))) {
      std::size_t end = 0;
      if (MatchIpv4At(text, i, &end)) {
        out.append(text, emitted, i - emitted);
        out.append(kRedactedIp);
        emitted = end;
        i = end;
        continue;
      }
    }
    ++i;
  }
  out.append(text, emitted, std::string::npos);
  return out;
}

// Candidates start at digit groups that begin on a word boundary; see
// MatchCardAt. Luhn-valid candidates are replaced and scanning resumes after
// every candidate, valid or not.
std::string RedactCreditCards(const std::string& text) {
  std::string out;
  out.reserve(text.size());
  std::size_t emitted = 0;
  std::size_t i = 0;
  while (i < text.size()) {
    if (IsDigit(text[i]) && (i == 0 || !IsWordChar(text[i - 1]))) {
      std::size_t end = 0;
      if (MatchCardAt(text, i, &end)) {
        if (LuhnValid(text.substr(i, end - i))) {
          out.append(text, emitted, i - emitted);
          out.append(kRedactedCreditCard);
          emitted = end;
        }
        i = end;
        continue;
      }
    }
    ++i;
  }
  out.append(text, emitted, std::string::npos);
  return out;
}

RedactionResult RedactPatterns(const std::string& text) {
  RedactionResult result;
  result.text = RedactCreditCards(RedactIpv4(RedactEmails(text)));
  result.redacted = result.text != text;
  return result;
}

}  // namespace guardway
