#pragma once

#include "statement_types.hpp"

#include <string>
#include <vector>

// Number of rows whose date cell has a date shape.
size_t countValidDates(const LabeledTable& table);

// Higher wins a score tie. Text output survives garbled table borders better.
int strategyPriority(ExtractionStrategy strategy);

struct StrategyChoice {
  ExtractionResult result;
  bool degraded = false;  // no candidate had a valid date; raw table kept
  std::string label;      // e.g. "text_extraction (6 valid rows)"
};

// Picks the candidate with the highest (validRowCount, priority). When every
// score is zero a table candidate with rows is returned as a degraded
// fallback; otherwise NoValidRowsError is thrown.
StrategyChoice selectStrategy(std::vector<ExtractionResult> candidates);
