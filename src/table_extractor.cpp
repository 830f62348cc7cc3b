#include "table_extractor.hpp"
#include "text_util.hpp"
#include "value_parsers.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <map>
#include <string>

const std::vector<std::string>& headerKeywords() {
  static const std::vector<std::string> keywords = {
    "date", "narration", "description", "particulars", "details",
    "debit", "credit", "amount", "withdrawal", "deposit", "balance",
    "value date", "trans date", "reference", "remarks", "type",
  };
  return keywords;
}

std::string cleanCell(const std::string& cell) {
  std::string out = cell;
  for (char& ch : out) {
    if (ch == '\n' || ch == '\r') ch = ' ';
  }
  return trim(out);
}

bool isHeaderRow(const RawRow& row) {
  // a data row carries a date somewhere; a header never does
  if (std::any_of(row.begin(), row.end(), [](const std::string& cell) { return looksLikeDate(cell); })) {
    return false;
  }

  // Layout clustering may merge several captions into one cell, so keywords
  // are counted over the whole row.
  std::string rowText;
  for (const auto& cell : row) rowText += toLower(cell) + ' ';
  auto keywords = std::count_if(headerKeywords().begin(), headerKeywords().end(),
                                [&](const std::string& kw) { return rowText.find(kw) != std::string::npos; });
  return keywords >= 2;
}

RawRow normalizeRowWidth(RawRow row, size_t width) {
  row.resize(width);
  return row;
}

std::optional<LabeledTable> assembleTable(RawTable raw) {
  if (raw.rows.empty()) return std::nullopt;

  size_t width = 0;
  if (raw.header) {
    width = raw.header->size();
  } else {
    std::map<size_t, size_t> widths;
    for (const auto& r : raw.rows) widths[r.size()]++;
    // most common width; ties go to the narrower one
    size_t best = 0;
    for (const auto& kv : widths) {
      if (kv.second > best) { best = kv.second; width = kv.first; }
    }
  }
  if (width == 0) return std::nullopt;

  for (auto& r : raw.rows) r = normalizeRowWidth(std::move(r), width);

  std::vector<size_t> keep;
  for (size_t c = 0; c < width; ++c) {
    bool used = std::any_of(raw.rows.begin(), raw.rows.end(),
                            [&](const RawRow& r) { return !r[c].empty(); });
    if (used) keep.push_back(c);
  }
  if (keep.empty()) return std::nullopt;

  LabeledTable table;
  for (size_t c : keep) {
    std::string label = raw.header ? (*raw.header)[c] : std::string();
    table.columns.push_back(label.empty() ? std::to_string(c) : label);
  }
  table.rows.reserve(raw.rows.size());
  for (const auto& r : raw.rows) {
    RawRow row;
    row.reserve(keep.size());
    for (size_t c : keep) row.push_back(r[c]);
    table.rows.push_back(std::move(row));
  }
  return table;
}

std::optional<LabeledTable> extractFromTables(const std::vector<PageTable>& tables) {
  RawTable raw;

  for (const auto& table : tables) {
    for (const auto& row : table.rows) {
      RawRow cleaned;
      cleaned.reserve(row.size());
      for (const auto& cell : row) cleaned.push_back(cleanCell(cell));

      if (!raw.header && isHeaderRow(cleaned)) {
        spdlog::debug("Header row detected on page {}", table.pageNumber);
        raw.header = std::move(cleaned);
        continue;
      }

      if (std::all_of(cleaned.begin(), cleaned.end(), [](const std::string& c) { return c.empty(); })) {
        continue;
      }
      raw.rows.push_back(std::move(cleaned));
    }
  }

  return assembleTable(std::move(raw));
}
