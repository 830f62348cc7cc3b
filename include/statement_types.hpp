#pragma once

#include <cstddef>
#include <optional>
#include <string>
#include <vector>

using RawRow = std::vector<std::string>;

struct RawTable {
  std::optional<RawRow> header;
  std::vector<RawRow> rows;
};

// A table whose columns carry (possibly normalized) labels. Every row has
// exactly columns.size() cells.
struct LabeledTable {
  std::vector<std::string> columns;
  std::vector<RawRow> rows;

  // Index of the column with the given label, or -1.
  int columnIndex(const std::string& name) const;
  bool hasColumn(const std::string& name) const { return columnIndex(name) >= 0; }
  bool empty() const { return rows.empty(); }
};

struct CalendarDate {
  int year = 1970;
  int month = 1;
  int day = 1;

  std::string toIso() const;
  // Days since 1970-01-01.
  long daysSinceEpoch() const;
};

bool operator==(const CalendarDate& a, const CalendarDate& b);
bool operator!=(const CalendarDate& a, const CalendarDate& b);
bool operator<(const CalendarDate& a, const CalendarDate& b);

enum class TransactionType { Credit, Debit };

const char* transactionTypeName(TransactionType type);
TransactionType typeForAmount(double amount);

struct CanonicalTransaction {
  CalendarDate date;
  std::string description;
  double amount = 0.0;
  TransactionType type = TransactionType::Credit;
};

using Ledger = std::vector<CanonicalTransaction>;

enum class ExtractionStrategy { Table, Text };

const char* strategyName(ExtractionStrategy strategy);

struct ExtractionResult {
  LabeledTable table;
  ExtractionStrategy strategy = ExtractionStrategy::Table;
  std::size_t validRowCount = 0;
  std::vector<std::string> warnings;
};

// Output of a table-to-table stage together with the diagnostics it raised.
struct StageResult {
  LabeledTable table;
  std::vector<std::string> warnings;
};
