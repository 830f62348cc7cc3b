#pragma once

#include "statement_types.hpp"

#include <string>

struct SanitizeResult {
  LabeledTable table;
  size_t blankDateRows = 0;
  size_t headerArtifactRows = 0;
  size_t emptyRows = 0;
};

// True for a cell that is only a repeated column caption ("Date",
// "Narration", "Balance", "S/N", "No." ...).
bool isHeaderArtifact(const std::string& cell);

// Trims and whitespace-collapses every cell, then drops rows with a blank
// date, rows that are repeated header/footer captions, and rows left empty.
SanitizeResult sanitizeRows(LabeledTable table);
