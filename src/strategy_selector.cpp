#include "strategy_selector.hpp"
#include "statement_errors.hpp"
#include "value_parsers.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>

size_t countValidDates(const LabeledTable& table) {
  const int dateIdx = table.columnIndex("date");
  if (dateIdx < 0) return 0;
  return static_cast<size_t>(std::count_if(table.rows.begin(), table.rows.end(),
                                           [&](const RawRow& r) { return looksLikeDate(r[dateIdx]); }));
}

int strategyPriority(ExtractionStrategy strategy) {
  switch (strategy) {
  case ExtractionStrategy::Text: return 1;
  case ExtractionStrategy::Table: return 0;
  }
  return 0;
}

StrategyChoice selectStrategy(std::vector<ExtractionResult> candidates) {
  for (const auto& c : candidates) {
    spdlog::debug("{}: {} row(s), {} with a valid date", strategyName(c.strategy), c.table.rows.size(),
                  c.validRowCount);
  }

  auto best = std::max_element(candidates.begin(), candidates.end(),
                               [](const ExtractionResult& a, const ExtractionResult& b) {
                                 if (a.validRowCount != b.validRowCount) return a.validRowCount < b.validRowCount;
                                 return strategyPriority(a.strategy) < strategyPriority(b.strategy);
                               });

  StrategyChoice choice;
  if (best != candidates.end() && best->validRowCount > 0) {
    choice.label = std::string(strategyName(best->strategy)) + " (" + std::to_string(best->validRowCount) +
                   " valid rows)";
    choice.result = std::move(*best);
    return choice;
  }

  auto fallback = std::find_if(candidates.begin(), candidates.end(), [](const ExtractionResult& c) {
    return c.strategy == ExtractionStrategy::Table && !c.table.rows.empty();
  });
  if (fallback == candidates.end()) {
    throw NoValidRowsError("Could not extract any valid transactions. Please try CSV export.");
  }
  choice.degraded = true;
  choice.label = std::string(strategyName(fallback->strategy)) + " (fallback, " +
                 std::to_string(fallback->table.rows.size()) + " rows)";
  choice.result = std::move(*fallback);
  return choice;
}
