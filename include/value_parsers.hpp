#pragma once

#include "statement_types.hpp"

#include <optional>
#include <string>
#include <vector>

// --- Numbers ---

enum class NumberKind {
  Value,        // real digits were present
  Placeholder,  // "-", "--", "---", empty: no value in this column
  Missing       // not a number at all
};

struct ParsedNumber {
  NumberKind kind = NumberKind::Missing;
  double value = 0.0;

  bool ok() const { return kind != NumberKind::Missing; }
};

// Parses amounts such as "5,000.00", "₦1,200", "(300.00)", "45.10 DR".
// Placeholders parse to 0.0 with kind Placeholder; "nan", "none" and "null"
// are Missing.
ParsedNumber parseNumber(const std::string& text);

// Blank, or a "nan"/"none"/"null" left behind by a spreadsheet export.
bool isEmptyMarker(const std::string& text);

bool isPlaceholder(const std::string& text);

// Lossless textual form used between pipeline stages.
std::string formatNumber(double value);

// Two-decimal form used in the canonical ledger output.
std::string formatAmount(double value);

// --- Dates ---

bool isValidCalendarDate(int year, int month, int day);

// 1..12 for "jan", "January", "SEPT"..., or nullopt.
std::optional<int> monthFromName(const std::string& name);

// Ordered strptime-style formats tried on a whole date column.
const std::vector<std::string>& explicitDateFormats();

// Strict parse of a single value against one format. Supports %Y %m %d %b %B,
// literal characters, and a space matching any run of whitespace.
std::optional<CalendarDate> parseDateWithFormat(const std::string& text, const std::string& format);

// Day-first general inference for values no explicit format handled.
std::optional<CalendarDate> inferDate(const std::string& text);

struct DateColumnParse {
  std::vector<std::optional<CalendarDate>> dates;
  std::string format;  // the explicit format adopted, "inferred", or empty when nothing parsed
  size_t failures = 0; // non-empty values that did not parse
};

// An explicit format is adopted only if it parses more than 80% of the
// column's non-empty values; otherwise every value goes through inferDate().
DateColumnParse parseDateColumn(const std::vector<std::string>& values);

// True when the text contains a date-shaped token.
bool looksLikeDate(const std::string& text);
