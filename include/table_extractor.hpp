#pragma once

#include "pdf_layout.hpp"
#include "statement_types.hpp"

#include <optional>
#include <string>
#include <vector>

// Keywords whose presence in two or more cells marks a header row.
const std::vector<std::string>& headerKeywords();

// Trims a cell and folds internal line breaks into spaces.
std::string cleanCell(const std::string& cell);

bool isHeaderRow(const RawRow& row);

// Truncates or right-pads with empty cells.
RawRow normalizeRowWidth(RawRow row, size_t width);

// Reconstructs one transaction table from the per-page grids. The first
// header row found in the document labels the columns; without one the
// columns are labeled by position ("0", "1", ...). Returns nullopt when no
// data rows remain.
std::optional<LabeledTable> extractFromTables(const std::vector<PageTable>& tables);

// Shapes a raw table into a labeled one: width-normalization to the header
// (or the most common row width) and removal of columns empty in every row.
std::optional<LabeledTable> assembleTable(RawTable raw);
