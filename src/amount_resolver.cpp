#include "amount_resolver.hpp"
#include "text_util.hpp"
#include "value_parsers.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <cmath>
#include <string>

const std::vector<std::string>& creditKeywords() {
  static const std::vector<std::string> keywords = {
    "transfer from", "deposit", "credit", "inward", "nip from", "trf from",
    "fip", "ut", "dividend", "interest", "refund", "reversal", "topup",
    "received", "fbn mobile", "uba mobile", "access mobile", "gtb mobile",
    "zenith mobile", "firstmobile", "alat", "opay", "loan", "disbursement",
  };
  return keywords;
}

bool hasCreditKeyword(const std::string& description) {
  std::string lower = toLower(description);
  return std::any_of(creditKeywords().begin(), creditKeywords().end(),
                     [&](const std::string& kw) { return lower.find(kw) != std::string::npos; });
}

std::optional<ResolvedAmount> resolveSignedAmount(const std::vector<std::string>& tokens,
                                                  const std::string& description) {
  ParsedNumber first = tokens.size() > 0 ? parseNumber(tokens[0]) : ParsedNumber{NumberKind::Placeholder, 0.0};
  ParsedNumber second = tokens.size() > 1 ? parseNumber(tokens[1]) : ParsedNumber{NumberKind::Placeholder, 0.0};
  if (!first.ok() || !second.ok()) return std::nullopt;

  // A third token is the running balance and never contributes.
  double a1 = std::fabs(first.value);
  double a2 = std::fabs(second.value);
  bool creditWords = hasCreditKeyword(description);

  ResolvedAmount r;
  if (a1 > 0 && a2 == 0) {
    r.amount = -a1;
    r.basis = AmountBasis::PositionalDebit;
    r.keywordConflict = creditWords;
  } else if (a2 > 0 && a1 == 0) {
    r.amount = a2;
    r.basis = AmountBasis::PositionalCredit;
  } else if (creditWords) {
    r.amount = a1;
    r.basis = AmountBasis::KeywordCredit;
  } else {
    r.amount = a1 == 0 ? 0.0 : -a1;
    r.basis = AmountBasis::DefaultDebit;
  }
  r.type = typeForAmount(r.amount);
  return r;
}

StageResult resolveAmountColumns(const std::vector<TextCandidate>& candidates) {
  StageResult out;
  out.table.columns = {"date", "description", "amount", "type"};

  size_t unparseable = 0;
  size_t conflicts = 0;
  size_t keywordSigned = 0;
  for (const auto& c : candidates) {
    std::optional<ResolvedAmount> r = resolveSignedAmount(c.amountTokens, c.description);
    if (!r) {
      unparseable++;
      spdlog::debug("Dropping '{}': amount tokens do not parse", c.description);
      continue;
    }
    if (r->keywordConflict) {
      conflicts++;
      spdlog::debug("'{}' sits in the debit column but reads like a credit; keeping debit", c.description);
    }
    if (r->basis == AmountBasis::KeywordCredit || r->basis == AmountBasis::DefaultDebit) keywordSigned++;
    out.table.rows.push_back({c.date, c.description, formatNumber(r->amount), transactionTypeName(r->type)});
  }

  if (unparseable > 0) {
    out.warnings.push_back("Dropped " + std::to_string(unparseable) + " row(s) with unparseable amount tokens.");
  }
  if (conflicts > 0) {
    out.warnings.push_back(std::to_string(conflicts) +
      " row(s) were placed in the debit column but their description suggests a credit; "
      "kept as debits, please review.");
  }
  if (keywordSigned > 0) {
    spdlog::info("{} row(s) had no empty debit/credit column; sign inferred from description", keywordSigned);
  }
  return out;
}
