#include "value_parsers.hpp"
#include "text_util.hpp"

#include <cctype>
#include <cmath>
#include <cstdio>
#include <cstdlib>
#include <regex>
#include <string>

namespace {

bool endsWith(const std::string& s, const std::string& suffix) {
  return s.size() >= suffix.size() && s.compare(s.size() - suffix.size(), suffix.size(), suffix) == 0;
}

bool startsWith(const std::string& s, const std::string& prefix) {
  return s.rfind(prefix, 0) == 0;
}

void eraseAll(std::string& s, const std::string& what) {
  size_t pos;
  while ((pos = s.find(what)) != std::string::npos) s.erase(pos, what.size());
}

struct MonthName {
  const char* full;
  int number;
};

const MonthName kMonths[] = {
  {"january", 1}, {"february", 2}, {"march", 3}, {"april", 4},
  {"may", 5}, {"june", 6}, {"july", 7}, {"august", 8},
  {"september", 9}, {"october", 10}, {"november", 11}, {"december", 12},
};

const char* const kWeekdays[] = {
  "mon", "tue", "tues", "wed", "thu", "thur", "thurs", "fri", "sat", "sun",
  "monday", "tuesday", "wednesday", "thursday", "friday", "saturday", "sunday",
};

bool isWeekday(const std::string& lower) {
  for (const char* w : kWeekdays) {
    if (lower == w) return true;
  }
  return false;
}

bool isOrdinalSuffix(const std::string& lower) {
  return lower == "st" || lower == "nd" || lower == "rd" || lower == "th";
}

// Reads 1..maxDigits digits at pos.
bool readNumber(const std::string& s, size_t& pos, size_t minDigits, size_t maxDigits, int& out) {
  size_t start = pos;
  while (pos < s.size() && pos - start < maxDigits && std::isdigit(static_cast<unsigned char>(s[pos]))) pos++;
  if (pos - start < minDigits) return false;
  out = std::atoi(s.substr(start, pos - start).c_str());
  return true;
}

bool readWord(const std::string& s, size_t& pos, std::string& out) {
  size_t start = pos;
  while (pos < s.size() && std::isalpha(static_cast<unsigned char>(s[pos]))) pos++;
  out = s.substr(start, pos - start);
  return !out.empty();
}

int expandTwoDigitYear(int yy) {
  return yy < 69 ? 2000 + yy : 1900 + yy;
}

std::optional<CalendarDate> makeDate(int y, int m, int d) {
  if (!isValidCalendarDate(y, m, d)) return std::nullopt;
  return CalendarDate{y, m, d};
}

} // namespace

ParsedNumber parseNumber(const std::string& text) {
  ParsedNumber result;
  std::string s = toLower(trim(text));
  if (s.empty() || s == "-" || s == "--" || s == "---") {
    result.kind = NumberKind::Placeholder;
    return result;
  }
  // Export artifacts of an empty cell; they carry no amount and no zero.
  if (isEmptyMarker(s)) return result;

  bool negative = false;
  if (s.size() >= 2 && s.front() == '(' && s.back() == ')') {
    negative = true;
    s = trim(s.substr(1, s.size() - 2));
  }

  if (endsWith(s, "dr")) {
    negative = true;
    s = trim(s.substr(0, s.size() - 2));
  } else if (endsWith(s, "cr")) {
    s = trim(s.substr(0, s.size() - 2));
  }

  // Currency markers: naira, dollar, euro, pound and their ISO codes.
  for (const char* marker : {"\xE2\x82\xA6", "$", "\xE2\x82\xAC", "\xC2\xA3", "ngn", "usd", "eur", "gbp"}) {
    eraseAll(s, marker);
  }
  eraseAll(s, ",");
  std::string compact;
  for (char ch : s) {
    if (!std::isspace(static_cast<unsigned char>(ch))) compact.push_back(ch);
  }

  if (startsWith(compact, "-")) {
    negative = !negative;
    compact.erase(0, 1);
  } else if (startsWith(compact, "+")) {
    compact.erase(0, 1);
  } else if (endsWith(compact, "-")) {
    negative = !negative;
    compact.pop_back();
  }

  bool sawDigit = false;
  bool sawDot = false;
  for (char ch : compact) {
    if (std::isdigit(static_cast<unsigned char>(ch))) {
      sawDigit = true;
    } else if (ch == '.' && !sawDot) {
      sawDot = true;
    } else {
      return result;
    }
  }
  if (!sawDigit) return result;

  double value = std::strtod(compact.c_str(), nullptr);
  result.kind = NumberKind::Value;
  result.value = negative ? -value : value;
  return result;
}

bool isEmptyMarker(const std::string& text) {
  std::string lower = toLower(trim(text));
  return lower.empty() || lower == "nan" || lower == "none" || lower == "null";
}

bool isPlaceholder(const std::string& text) {
  return parseNumber(text).kind == NumberKind::Placeholder;
}

std::string formatNumber(double value) {
  char buf[64];
  std::snprintf(buf, sizeof(buf), "%.15g", value);
  return buf;
}

std::string formatAmount(double value) {
  char buf[64];
  std::snprintf(buf, sizeof(buf), "%.2f", value);
  std::string out = buf;
  if (out == "-0.00") out = "0.00";
  return out;
}

bool isValidCalendarDate(int year, int month, int day) {
  if (year < 1 || month < 1 || month > 12 || day < 1) return false;
  static const int kDays[] = {31, 28, 31, 30, 31, 30, 31, 31, 30, 31, 30, 31};
  bool leap = (year % 4 == 0 && year % 100 != 0) || year % 400 == 0;
  int limit = kDays[month - 1] + (month == 2 && leap ? 1 : 0);
  return day <= limit;
}

std::optional<int> monthFromName(const std::string& name) {
  std::string lower = toLower(name);
  if (lower.size() < 3) return std::nullopt;
  if (lower == "sept") return 9;
  for (const auto& m : kMonths) {
    std::string full = m.full;
    if (lower == full || lower == full.substr(0, 3)) return m.number;
  }
  return std::nullopt;
}

const std::vector<std::string>& explicitDateFormats() {
  static const std::vector<std::string> formats = {
    "%Y-%m-%d",  // 2026-01-15
    "%d/%m/%Y",  // 15/01/2026
    "%m/%d/%Y",  // 01/15/2026
    "%d-%m-%Y",  // 15-01-2026
    "%d-%b-%Y",  // 15-Jan-2026
    "%d-%B-%Y",  // 15-January-2026
    "%d %b %Y",  // 15 Jan 2026
    "%d %B %Y",  // 15 January 2026
    "%Y/%m/%d",  // 2026/01/15
  };
  return formats;
}

std::optional<CalendarDate> parseDateWithFormat(const std::string& text, const std::string& format) {
  const std::string s = trim(text);
  int year = -1, month = -1, day = -1;
  size_t pos = 0;

  for (size_t f = 0; f < format.size(); ++f) {
    char fc = format[f];
    if (fc == '%' && f + 1 < format.size()) {
      char conversion = format[++f];
      std::string word;
      switch (conversion) {
      case 'Y':
        if (!readNumber(s, pos, 4, 4, year)) return std::nullopt;
        break;
      case 'm':
        if (!readNumber(s, pos, 1, 2, month)) return std::nullopt;
        break;
      case 'd':
        if (!readNumber(s, pos, 1, 2, day)) return std::nullopt;
        break;
      case 'b':
      case 'B': {
        if (!readWord(s, pos, word)) return std::nullopt;
        std::optional<int> m = monthFromName(word);
        if (!m) return std::nullopt;
        // "May" is both the abbreviation and the full name.
        if (conversion == 'b' && word.size() != 3) return std::nullopt;
        if (conversion == 'B' && toLower(word) != kMonths[*m - 1].full) return std::nullopt;
        month = *m;
        break;
      }
      default:
        return std::nullopt;
      }
    } else if (fc == ' ') {
      size_t start = pos;
      while (pos < s.size() && std::isspace(static_cast<unsigned char>(s[pos]))) pos++;
      if (pos == start) return std::nullopt;
    } else {
      if (pos >= s.size() || s[pos] != fc) return std::nullopt;
      pos++;
    }
  }
  if (pos != s.size()) return std::nullopt;
  return makeDate(year, month, day);
}

std::optional<CalendarDate> inferDate(const std::string& text) {
  static const std::regex timeOfDay(
    "[t ]?\\d{1,2}:\\d{2}(:\\d{2}(\\.\\d+)?)?( ?[ap]\\.?m\\.?)?(z|[+-]\\d{2}:?\\d{2})?",
    std::regex::icase);

  std::string s = toLower(trim(text));
  if (isEmptyMarker(s)) return std::nullopt;
  s = std::regex_replace(s, timeOfDay, " ");

  // Split into alphabetic and numeric runs.
  std::vector<std::string> tokens;
  std::string current;
  auto flush = [&]() {
    if (!current.empty()) tokens.push_back(current);
    current.clear();
  };
  for (char ch : s) {
    unsigned char uc = static_cast<unsigned char>(ch);
    if (!std::isalnum(uc)) { flush(); continue; }
    if (!current.empty() && (std::isdigit(uc) != 0) != (std::isdigit(static_cast<unsigned char>(current.back())) != 0)) {
      flush();
    }
    current.push_back(ch);
  }
  flush();

  std::vector<std::string> numbers;
  std::optional<int> namedMonth;
  for (const auto& tok : tokens) {
    if (std::isdigit(static_cast<unsigned char>(tok[0]))) {
      numbers.push_back(tok);
    } else if (auto m = monthFromName(tok)) {
      if (namedMonth) return std::nullopt;
      namedMonth = m;
    } else if (!isWeekday(tok) && !isOrdinalSuffix(tok)) {
      return std::nullopt;
    }
  }

  if (namedMonth) {
    if (numbers.size() != 2) return std::nullopt;
    const std::string& a = numbers[0];
    const std::string& b = numbers[1];
    if (a.size() == 4 && b.size() <= 2) return makeDate(std::atoi(a.c_str()), *namedMonth, std::atoi(b.c_str()));
    if (a.size() > 2) return std::nullopt;
    int year;
    if (b.size() == 4) year = std::atoi(b.c_str());
    else if (b.size() <= 2) year = expandTwoDigitYear(std::atoi(b.c_str()));
    else return std::nullopt;
    return makeDate(year, *namedMonth, std::atoi(a.c_str()));
  }

  if (numbers.size() == 1 && numbers[0].size() == 8) {
    const std::string& n = numbers[0];
    int head = std::atoi(n.substr(0, 4).c_str());
    if (head >= 1900 && head <= 2099) {
      return makeDate(head, std::atoi(n.substr(4, 2).c_str()), std::atoi(n.substr(6, 2).c_str()));
    }
    return makeDate(std::atoi(n.substr(4, 4).c_str()), std::atoi(n.substr(2, 2).c_str()),
                    std::atoi(n.substr(0, 2).c_str()));
  }

  if (numbers.size() != 3) return std::nullopt;
  for (const auto& n : numbers) {
    if (n.size() > 4) return std::nullopt;
  }

  int n0 = std::atoi(numbers[0].c_str());
  int n1 = std::atoi(numbers[1].c_str());
  int n2 = std::atoi(numbers[2].c_str());

  if (numbers[0].size() == 4) {
    if (auto d = makeDate(n0, n1, n2)) return d;
    return makeDate(n0, n2, n1);
  }
  if (numbers[0].size() > 2 || numbers[1].size() > 2) return std::nullopt;

  int year;
  if (numbers[2].size() == 4) year = n2;
  else if (numbers[2].size() <= 2) year = expandTwoDigitYear(n2);
  else return std::nullopt;

  if (auto d = makeDate(year, n1, n0)) return d;
  return makeDate(year, n0, n1);
}

DateColumnParse parseDateColumn(const std::vector<std::string>& values) {
  DateColumnParse out;
  size_t nonEmpty = 0;
  for (const auto& v : values) {
    if (!isEmptyMarker(v)) nonEmpty++;
  }
  out.dates.assign(values.size(), std::nullopt);
  if (nonEmpty == 0) return out;

  for (const auto& fmt : explicitDateFormats()) {
    std::vector<std::optional<CalendarDate>> parsed(values.size());
    size_t hits = 0;
    for (size_t i = 0; i < values.size(); ++i) {
      parsed[i] = parseDateWithFormat(values[i], fmt);
      if (parsed[i]) hits++;
    }
    if (static_cast<double>(hits) > 0.8 * static_cast<double>(nonEmpty)) {
      out.dates = std::move(parsed);
      out.format = fmt;
      out.failures = nonEmpty - hits;
      return out;
    }
  }

  size_t hits = 0;
  for (size_t i = 0; i < values.size(); ++i) {
    out.dates[i] = inferDate(values[i]);
    if (out.dates[i]) hits++;
  }
  out.failures = nonEmpty - hits;
  if (hits > 0) out.format = "inferred";
  return out;
}

bool looksLikeDate(const std::string& text) {
  static const std::regex datePattern(
    "\\b\\d{1,2}[-/.]\\d{1,2}[-/.]\\d{2,4}\\b"
    "|\\b\\d{4}[-/]\\d{1,2}[-/]\\d{1,2}\\b"
    "|\\b\\d{1,2}[-\\s](jan|feb|mar|apr|may|jun|jul|aug|sep|oct|nov|dec)[a-z]*[-\\s,]+\\d{2,4}\\b",
    std::regex::icase);
  return std::regex_search(text, datePattern);
}
