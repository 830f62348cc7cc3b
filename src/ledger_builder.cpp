#include "ledger_builder.hpp"
#include "text_util.hpp"
#include "value_parsers.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>

LedgerBuild buildLedger(const LabeledTable& table) {
  LedgerBuild out;
  const int dateIdx = table.columnIndex("date");
  const int descIdx = table.columnIndex("description");
  const int amountIdx = table.columnIndex("amount");
  if (dateIdx < 0 || descIdx < 0 || amountIdx < 0) return out;

  std::vector<std::string> dateValues;
  dateValues.reserve(table.rows.size());
  for (const auto& r : table.rows) dateValues.push_back(r[dateIdx]);
  DateColumnParse dates = parseDateColumn(dateValues);
  out.dateFormat = dates.format;
  spdlog::debug("Date column parsed with '{}' ({} failure(s))",
                dates.format.empty() ? "nothing" : dates.format, dates.failures);

  for (size_t i = 0; i < table.rows.size(); ++i) {
    const RawRow& row = table.rows[i];
    if (!dates.dates[i]) {
      out.droppedDates++;
      spdlog::debug("Dropping row {}: date '{}' does not parse", i, row[dateIdx]);
      continue;
    }
    ParsedNumber amount = parseNumber(row[amountIdx]);
    if (!amount.ok()) {
      out.droppedAmounts++;
      spdlog::debug("Dropping row {}: amount '{}' does not parse", i, row[amountIdx]);
      continue;
    }

    CanonicalTransaction tx;
    tx.date = *dates.dates[i];
    tx.description = collapseWhitespace(row[descIdx]);
    tx.amount = amount.value == 0.0 ? 0.0 : amount.value;
    tx.type = typeForAmount(tx.amount);
    out.ledger.push_back(std::move(tx));
  }

  std::stable_sort(out.ledger.begin(), out.ledger.end(),
                   [](const CanonicalTransaction& a, const CanonicalTransaction& b) { return a.date < b.date; });

  if (out.dateFormat.empty() && !table.rows.empty()) {
    out.warnings.push_back("Could not parse dates. Please ensure a 'date' column with a recognizable format.");
  }
  if (out.droppedDates > 0) {
    out.warnings.push_back("Dropped " + std::to_string(out.droppedDates) + " row(s) with unparseable dates.");
  }
  if (out.droppedAmounts > 0) {
    out.warnings.push_back("Dropped " + std::to_string(out.droppedAmounts) + " row(s) with unparseable amounts.");
  }
  return out;
}
