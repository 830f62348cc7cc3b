#include "statement_summary.hpp"

#include <algorithm>
#include <cmath>
#include <cstdio>
#include <map>
#include <utility>

int monthsCoveredForDays(long days) {
  // nearbyint rounds half to even under the default rounding mode.
  double months = std::nearbyint(static_cast<double>(days) / 30.0);
  return std::max(1, static_cast<int>(months));
}

StatementSummary summarizeLedger(const Ledger& ledger) {
  StatementSummary summary;
  summary.totalTransactions = ledger.size();

  std::map<std::pair<int, int>, MonthlyTotals> byMonth;
  for (const auto& tx : ledger) {
    if (!summary.startDate || tx.date < *summary.startDate) summary.startDate = tx.date;
    if (!summary.endDate || *summary.endDate < tx.date) summary.endDate = tx.date;

    MonthlyTotals& bucket = byMonth[{tx.date.year, tx.date.month}];
    if (tx.amount > 0) {
      bucket.creditsSum += tx.amount;
      summary.totalCredits += tx.amount;
    } else if (tx.amount < 0) {
      bucket.debitsSum += -tx.amount;
      summary.totalDebits += -tx.amount;
    }
    bucket.count++;
  }

  if (summary.startDate && summary.endDate) {
    summary.daysCovered = summary.endDate->daysSinceEpoch() - summary.startDate->daysSinceEpoch();
    summary.monthsCovered = monthsCoveredForDays(summary.daysCovered);
  }

  for (auto& kv : byMonth) {
    char label[16];
    std::snprintf(label, sizeof(label), "%04d-%02d", kv.first.first, kv.first.second);
    MonthlyTotals totals = kv.second;
    totals.month = label;
    totals.net = totals.creditsSum - totals.debitsSum;
    summary.monthlyBreakdown.push_back(std::move(totals));
  }

  return summary;
}

std::optional<std::string> shortHistoryWarning(const StatementSummary& summary) {
  if (summary.monthsCovered >= kMinimumMonths) return std::nullopt;
  return "Statement covers only " + std::to_string(summary.monthsCovered) + " month(s). "
         "A minimum of " + std::to_string(kMinimumMonths) + " months is recommended for reliable scoring.";
}
