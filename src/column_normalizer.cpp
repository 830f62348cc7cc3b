#include "column_normalizer.hpp"
#include "statement_errors.hpp"
#include "text_util.hpp"
#include "value_parsers.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <cmath>
#include <regex>
#include <string>

namespace {

void removeColumns(LabeledTable& table, const std::vector<std::string>& names) {
  std::vector<size_t> keep;
  for (size_t c = 0; c < table.columns.size(); ++c) {
    if (std::find(names.begin(), names.end(), table.columns[c]) == names.end()) keep.push_back(c);
  }
  if (keep.size() == table.columns.size()) return;

  std::vector<std::string> columns;
  for (size_t c : keep) columns.push_back(table.columns[c]);
  for (auto& row : table.rows) {
    RawRow kept;
    kept.reserve(keep.size());
    for (size_t c : keep) kept.push_back(row[c]);
    row = std::move(kept);
  }
  table.columns = std::move(columns);
}

// Index of the named column, appending an empty one when absent.
size_t ensureColumn(LabeledTable& table, const std::string& name) {
  int idx = table.columnIndex(name);
  if (idx >= 0) return static_cast<size_t>(idx);
  table.columns.push_back(name);
  for (auto& row : table.rows) row.emplace_back();
  return table.columns.size() - 1;
}

} // namespace

const char* roleLabel(ColumnRole role) {
  switch (role) {
  case ColumnRole::Date: return "date";
  case ColumnRole::Description: return "description";
  case ColumnRole::Amount: return "amount";
  case ColumnRole::Type: return "type";
  case ColumnRole::Credit: return "_credit";
  case ColumnRole::Debit: return "_debit";
  }
  return "";
}

const std::vector<ColumnSynonym>& columnSynonyms() {
  static const std::vector<ColumnSynonym> synonyms = {
    {"date", ColumnRole::Date},
    {"trans date", ColumnRole::Date},
    {"transaction date", ColumnRole::Date},
    {"txn date", ColumnRole::Date},
    {"tran date", ColumnRole::Date},
    {"trans. date", ColumnRole::Date},
    {"posting date", ColumnRole::Date},
    {"post date", ColumnRole::Date},
    {"booking date", ColumnRole::Date},
    {"value date", ColumnRole::Date},

    {"description", ColumnRole::Description},
    {"narration", ColumnRole::Description},
    {"narrative", ColumnRole::Description},
    {"transaction details", ColumnRole::Description},
    {"details", ColumnRole::Description},
    {"remarks", ColumnRole::Description},
    {"particulars", ColumnRole::Description},
    {"memo", ColumnRole::Description},
    {"reference", ColumnRole::Description},

    {"amount", ColumnRole::Amount},
    {"transaction amount", ColumnRole::Amount},
    {"txn amount", ColumnRole::Amount},

    {"credit", ColumnRole::Credit},
    {"credits", ColumnRole::Credit},
    {"credit amount", ColumnRole::Credit},
    {"deposit", ColumnRole::Credit},
    {"deposits", ColumnRole::Credit},
    {"money in", ColumnRole::Credit},
    {"paid in", ColumnRole::Credit},
    {"lodgement", ColumnRole::Credit},
    {"lodgements", ColumnRole::Credit},
    {"cr", ColumnRole::Credit},

    {"debit", ColumnRole::Debit},
    {"debits", ColumnRole::Debit},
    {"debit amount", ColumnRole::Debit},
    {"withdrawal", ColumnRole::Debit},
    {"withdrawals", ColumnRole::Debit},
    {"money out", ColumnRole::Debit},
    {"paid out", ColumnRole::Debit},
    {"dr", ColumnRole::Debit},

    {"type", ColumnRole::Type},
    {"transaction type", ColumnRole::Type},
    {"txn type", ColumnRole::Type},
    {"dr/cr", ColumnRole::Type},
    {"cr/dr", ColumnRole::Type},

    // already-normalized split columns
    {"_credit", ColumnRole::Credit},
    {"_debit", ColumnRole::Debit},
  };
  return synonyms;
}

std::string normalizeLabel(const std::string& label) {
  return toLower(collapseWhitespace(label));
}

std::string stripCurrencyAnnotation(const std::string& label) {
  static const std::regex annotation("\\s*\\([^()]*\\)\\s*$");
  return trim(std::regex_replace(label, annotation, ""));
}

std::optional<ColumnRole> roleForLabel(const std::string& label) {
  const std::string normalized = normalizeLabel(label);
  const std::string stripped = stripCurrencyAnnotation(normalized);
  for (const auto& syn : columnSynonyms()) {
    if (syn.label == normalized) return syn.role;
  }
  for (const auto& syn : columnSynonyms()) {
    if (syn.label == stripped) return syn.role;
  }
  return std::nullopt;
}

LabeledTable renameColumns(LabeledTable table) {
  std::vector<std::string> normalized;
  std::vector<std::string> stripped;
  for (const auto& c : table.columns) {
    normalized.push_back(normalizeLabel(c));
    stripped.push_back(stripCurrencyAnnotation(normalized.back()));
  }

  std::vector<bool> assigned(table.columns.size(), false);
  std::vector<ColumnRole> takenRoles;
  std::vector<std::string> result = normalized;

  // Exact labels first, then with annotations stripped; synonym order decides.
  for (const auto* labels : {&normalized, &stripped}) {
    for (const auto& syn : columnSynonyms()) {
      if (std::find(takenRoles.begin(), takenRoles.end(), syn.role) != takenRoles.end()) continue;
      for (size_t c = 0; c < labels->size(); ++c) {
        if (assigned[c] || (*labels)[c] != syn.label) continue;
        result[c] = roleLabel(syn.role);
        assigned[c] = true;
        takenRoles.push_back(syn.role);
        break;
      }
    }
  }

  // A loser that still spells a canonical label would shadow the winner.
  for (size_t c = 0; c < result.size(); ++c) {
    if (assigned[c]) continue;
    bool clashes = std::any_of(takenRoles.begin(), takenRoles.end(),
                               [&](ColumnRole r) { return result[c] == roleLabel(r); });
    if (clashes) {
      spdlog::debug("Column '{}' duplicates a mapped column; kept as '{}_{}'", table.columns[c], result[c], c);
      result[c] += "_" + std::to_string(c);
    }
  }

  table.columns = std::move(result);
  return table;
}

StageResult combineSplitAmounts(LabeledTable table) {
  StageResult out;
  const std::string credit = roleLabel(ColumnRole::Credit);
  const std::string debit = roleLabel(ColumnRole::Debit);

  if (table.hasColumn("amount")) {
    removeColumns(table, {credit, debit});
    out.table = std::move(table);
    return out;
  }
  if (!table.hasColumn(credit) || !table.hasColumn(debit)) {
    out.table = std::move(table);
    return out;
  }

  const size_t creditIdx = static_cast<size_t>(table.columnIndex(credit));
  const size_t debitIdx = static_cast<size_t>(table.columnIndex(debit));
  const size_t amountIdx = ensureColumn(table, "amount");
  const size_t typeIdx = ensureColumn(table, "type");

  std::vector<RawRow> kept;
  kept.reserve(table.rows.size());
  size_t unparseable = 0;
  for (auto& row : table.rows) {
    // An exported empty cell in one half of the pair means that side is zero.
    ParsedNumber c = isEmptyMarker(row[creditIdx]) ? ParsedNumber{NumberKind::Placeholder, 0.0}
                                                   : parseNumber(row[creditIdx]);
    ParsedNumber d = isEmptyMarker(row[debitIdx]) ? ParsedNumber{NumberKind::Placeholder, 0.0}
                                                  : parseNumber(row[debitIdx]);
    if (!c.ok() || !d.ok()) {
      unparseable++;
      spdlog::debug("Dropping row: credit '{}' / debit '{}' is not a number", row[creditIdx], row[debitIdx]);
      continue;
    }
    // Some exports print debits with a minus sign; only magnitudes count.
    double amount = std::fabs(c.value) - std::fabs(d.value);
    row[amountIdx] = formatNumber(amount);
    row[typeIdx] = transactionTypeName(typeForAmount(amount));
    kept.push_back(std::move(row));
  }
  table.rows = std::move(kept);
  removeColumns(table, {credit, debit});

  if (unparseable > 0) {
    out.warnings.push_back("Dropped " + std::to_string(unparseable) +
                           " row(s) with unparseable credit/debit values.");
  }
  out.table = std::move(table);
  return out;
}

StageResult normalizeColumns(LabeledTable table) {
  return combineSplitAmounts(renameColumns(std::move(table)));
}

void validateColumns(const LabeledTable& table) {
  std::vector<std::string> missing;
  for (const char* required : {"date", "description", "amount"}) {
    if (!table.hasColumn(required)) missing.push_back(required);
  }
  if (!missing.empty()) throw MissingColumnError(missing, table.columns);
}
