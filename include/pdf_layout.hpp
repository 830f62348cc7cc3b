#pragma once

#include "statement_types.hpp"

#include <string>
#include <vector>

struct WordBox {
  int pageNumber;
  double xMin;
  double yMin;
  double xMax;
  double yMax;
  std::string text;
};

// A grid recovered from the word positions of one page. Cells may be empty.
struct PageTable {
  int pageNumber;
  std::vector<RawRow> rows;
};

// Parses the XHTML emitted by `pdftotext -bbox-layout` into word boxes,
// tagging each with the page it came from.
std::vector<WordBox> parseWordBoxes(const std::string& bboxXml);

// Clusters words into rows and columns heuristically. Pages with fewer than
// two rows or two columns yield no table.
std::vector<PageTable> buildPageTables(std::vector<WordBox> words);

// Write tables into CSV files in outDir as table_<page>_<index>.csv
void writePageTablesAsCsv(const std::vector<PageTable>& tables, const std::string& outDir);
