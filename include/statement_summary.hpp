#pragma once

#include "statement_types.hpp"

#include <optional>
#include <string>
#include <vector>

constexpr int kMinimumMonths = 3;

struct MonthlyTotals {
  std::string month;  // "YYYY-MM"
  double creditsSum = 0.0;
  double debitsSum = 0.0;  // absolute value
  double net = 0.0;
  size_t count = 0;
};

struct StatementSummary {
  size_t totalTransactions = 0;
  std::optional<CalendarDate> startDate;
  std::optional<CalendarDate> endDate;
  long daysCovered = 0;
  int monthsCovered = 1;
  std::vector<MonthlyTotals> monthlyBreakdown;
  double totalCredits = 0.0;
  double totalDebits = 0.0;
  std::string dateFormatDetected = "unknown";
  std::vector<std::string> columnsFound;
};

// max(1, round(days / 30)) with round-half-to-even.
int monthsCoveredForDays(long days);

StatementSummary summarizeLedger(const Ledger& ledger);

// Non-empty when the summary covers fewer than kMinimumMonths.
std::optional<std::string> shortHistoryWarning(const StatementSummary& summary);
