#pragma once

#include "statement_types.hpp"

#include <optional>
#include <string>
#include <vector>

enum class ColumnRole { Date, Description, Amount, Type, Credit, Debit };

// Canonical label of a role: "date", "description", "amount", "type",
// and the transient "_credit" / "_debit".
const char* roleLabel(ColumnRole role);

struct ColumnSynonym {
  std::string label;  // normalized form
  ColumnRole role;
};

// Ordered; when two columns compete for one role the earlier synonym wins.
const std::vector<ColumnSynonym>& columnSynonyms();

// Trimmed, lower-cased, whitespace-collapsed.
std::string normalizeLabel(const std::string& label);

// Drops a trailing parenthesized annotation such as "(₦)" or "(NGN)".
std::string stripCurrencyAnnotation(const std::string& label);

std::optional<ColumnRole> roleForLabel(const std::string& label);

// Normalizes every label and renames recognized columns to their canonical
// role label.
LabeledTable renameColumns(LabeledTable table);

// Folds _credit/_debit into a signed amount (credit - debit) and a
// sign-derived type. A unified amount column takes precedence.
StageResult combineSplitAmounts(LabeledTable table);

// renameColumns() followed by combineSplitAmounts().
StageResult normalizeColumns(LabeledTable table);

// Throws MissingColumnError unless date, description and amount are present.
void validateColumns(const LabeledTable& table);
