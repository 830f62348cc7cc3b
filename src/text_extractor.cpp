#include "text_extractor.hpp"
#include "amount_resolver.hpp"
#include "text_util.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <cctype>
#include <regex>
#include <sstream>
#include <string>

namespace {

struct Span {
  size_t begin;
  size_t end;
  std::string text;
};

bool overlaps(const Span& a, const std::vector<Span>& others) {
  return std::any_of(others.begin(), others.end(),
                     [&](const Span& o) { return a.begin < o.end && o.begin < a.end; });
}

std::vector<Span> findAll(const std::string& line, const std::regex& re, int group) {
  std::vector<Span> spans;
  for (auto it = std::sregex_iterator(line.begin(), line.end(), re); it != std::sregex_iterator(); ++it) {
    const std::smatch& m = *it;
    size_t begin = static_cast<size_t>(m.position(group));
    spans.push_back(Span{begin, begin + static_cast<size_t>(m.length(group)), m.str(group)});
  }
  return spans;
}

} // namespace

const std::vector<std::string>& nonTransactionLabels() {
  static const std::vector<std::string> labels = {
    "opening balance", "closing balance", "balance brought forward", "balance carried forward",
  };
  return labels;
}

std::optional<TextCandidate> parseTransactionLine(const std::string& rawLine) {
  static const std::regex datePattern(
    "\\b\\d{1,2}[-/]\\d{1,2}[-/]\\d{4}\\b"
    "|\\b\\d{1,2}\\s(?:jan|feb|mar|apr|may|jun|jul|aug|sep|oct|nov|dec)[a-z]*\\s\\d{4}\\b",
    std::regex::icase);
  static const std::regex amountPattern("\\d[\\d,]*\\.\\d{2}(?!\\d)");
  // dashes count only as a whole whitespace-delimited token
  static const std::regex placeholderPattern("(^|\\s)(-{1,3})(?=\\s|$)");
  static const std::regex strayPunctuation("[^a-zA-Z0-9\\s.,-]");

  const std::string line = trim(rawLine);
  if (line.empty() || !containsDigit(line)) return std::nullopt;

  std::vector<Span> dates = findAll(line, datePattern, 0);
  if (dates.empty()) return std::nullopt;

  std::vector<Span> amounts;
  for (auto& s : findAll(line, amountPattern, 0)) {
    if (!overlaps(s, dates)) amounts.push_back(std::move(s));
  }
  for (auto& s : findAll(line, placeholderPattern, 2)) amounts.push_back(std::move(s));
  if (amounts.size() < 2) return std::nullopt;
  std::sort(amounts.begin(), amounts.end(), [](const Span& a, const Span& b) { return a.begin < b.begin; });

  std::string desc = line;
  std::vector<Span> removed = dates;
  removed.insert(removed.end(), amounts.begin(), amounts.end());
  for (const auto& s : removed) {
    std::fill(desc.begin() + static_cast<std::ptrdiff_t>(s.begin),
              desc.begin() + static_cast<std::ptrdiff_t>(s.end), ' ');
  }
  desc = collapseWhitespace(std::regex_replace(desc, strayPunctuation, ""));

  if (desc.size() < 3) return std::nullopt;
  std::string lower = toLower(desc);
  for (const auto& label : nonTransactionLabels()) {
    if (lower.find(label) != std::string::npos) return std::nullopt;
  }

  TextCandidate candidate;
  candidate.date = dates.front().text;
  candidate.description = desc;
  for (size_t i = 0; i < amounts.size() && i < 3; ++i) candidate.amountTokens.push_back(amounts[i].text);
  return candidate;
}

std::vector<TextCandidate> findTextCandidates(const std::vector<std::string>& pageTexts) {
  std::vector<TextCandidate> candidates;
  for (size_t page = 0; page < pageTexts.size(); ++page) {
    std::istringstream in(pageTexts[page]);
    std::string line;
    while (std::getline(in, line)) {
      if (auto c = parseTransactionLine(line)) {
        spdlog::debug("Page {}: transaction line '{}'", page + 1, c->description);
        candidates.push_back(std::move(*c));
      }
    }
  }
  return candidates;
}

std::optional<StageResult> extractFromText(const std::vector<std::string>& pageTexts) {
  std::vector<TextCandidate> candidates = findTextCandidates(pageTexts);
  if (candidates.empty()) return std::nullopt;
  return resolveAmountColumns(candidates);
}
