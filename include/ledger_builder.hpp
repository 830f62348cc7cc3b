#pragma once

#include "statement_types.hpp"

#include <string>
#include <vector>

struct LedgerBuild {
  Ledger ledger;
  std::string dateFormat;  // explicit format, "inferred", or empty
  size_t droppedDates = 0;
  size_t droppedAmounts = 0;
  std::vector<std::string> warnings;
};

// Types a validated table into canonical transactions: dates through
// parseDateColumn(), amounts through parseNumber() (placeholders become 0.0),
// type re-derived from the sign. Rows failing either parse are dropped and
// counted. The ledger is stably sorted by date.
LedgerBuild buildLedger(const LabeledTable& table);
