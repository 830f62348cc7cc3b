#include "row_sanitizer.hpp"
#include "text_util.hpp"
#include "value_parsers.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <regex>

bool isHeaderArtifact(const std::string& cell) {
  static const std::regex junk(
    "^(date|description|narration|trans\\.?\\s*time|channel|balance|s/n|no\\.)$",
    std::regex::icase);
  return std::regex_match(trim(cell), junk);
}

SanitizeResult sanitizeRows(LabeledTable table) {
  SanitizeResult out;
  const int dateIdx = table.columnIndex("date");
  const int descIdx = table.columnIndex("description");

  std::vector<RawRow> kept;
  kept.reserve(table.rows.size());
  for (auto& row : table.rows) {
    for (auto& cell : row) cell = collapseWhitespace(cell);

    if (dateIdx >= 0) {
      if (isEmptyMarker(row[dateIdx])) {
        out.blankDateRows++;
        continue;
      }
      if (isHeaderArtifact(row[dateIdx])) {
        out.headerArtifactRows++;
        continue;
      }
    }
    if (descIdx >= 0 && isHeaderArtifact(row[descIdx])) {
      out.headerArtifactRows++;
      continue;
    }
    if (std::all_of(row.begin(), row.end(), [](const std::string& c) { return c.empty(); })) {
      out.emptyRows++;
      continue;
    }
    kept.push_back(std::move(row));
  }
  table.rows = std::move(kept);

  if (out.blankDateRows || out.headerArtifactRows || out.emptyRows) {
    spdlog::debug("Sanitizer dropped {} blank-date, {} header-artifact and {} empty row(s)",
                  out.blankDateRows, out.headerArtifactRows, out.emptyRows);
  }
  out.table = std::move(table);
  return out;
}
