#pragma once

#include "statement_types.hpp"

#include <optional>
#include <string>
#include <vector>

// One flowed-text line that looks like a transaction.
struct TextCandidate {
  std::string date;
  std::string description;
  // Up to three amount or placeholder tokens, in left-to-right order.
  std::vector<std::string> amountTokens;
};

// Labels that carry a date and figures but are not transactions.
const std::vector<std::string>& nonTransactionLabels();

// Returns a candidate when the line has at least one date and at least two
// amount/placeholder tokens and a usable description remains.
std::optional<TextCandidate> parseTransactionLine(const std::string& line);

std::vector<TextCandidate> findTextCandidates(const std::vector<std::string>& pageTexts);

// Runs the candidate scan and resolves the positional amounts into a table
// with date, description, amount and type columns. Returns nullopt when no
// line qualified.
std::optional<StageResult> extractFromText(const std::vector<std::string>& pageTexts);
