#pragma once

#include "statement_types.hpp"
#include "text_extractor.hpp"

#include <optional>
#include <string>
#include <vector>

// Lower-case phrases that mark a transaction as money coming in.
const std::vector<std::string>& creditKeywords();

bool hasCreditKeyword(const std::string& description);

// How the sign of a resolved amount was decided.
enum class AmountBasis {
  PositionalDebit,   // column 1 set, column 2 empty
  PositionalCredit,  // column 2 set, column 1 empty
  KeywordCredit,     // both set, description names a credit
  DefaultDebit       // both set, no credit keyword
};

struct ResolvedAmount {
  double amount = 0.0;
  TransactionType type = TransactionType::Debit;
  AmountBasis basis = AmountBasis::DefaultDebit;
  // Positional debit whose description nevertheless reads like a credit.
  bool keywordConflict = false;
};

// Resolves up to three positional tokens (Debit | Credit | Balance) into one
// signed amount. Returns nullopt when a token is not a number or placeholder.
std::optional<ResolvedAmount> resolveSignedAmount(const std::vector<std::string>& tokens,
                                                  const std::string& description);

// Converts text candidates into a table with date, description, amount and
// type columns. Rows whose tokens do not parse are dropped and reported.
StageResult resolveAmountColumns(const std::vector<TextCandidate>& candidates);
