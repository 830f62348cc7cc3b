#pragma once

#include "document_loader.hpp"
#include "statement_summary.hpp"
#include "statement_types.hpp"
#include "strategy_selector.hpp"

#include <optional>
#include <string>
#include <vector>

// Outcome of processing one document. A fatal failure leaves ledger and
// summary empty and carries a message fit for an end user.
struct PipelineResult {
  std::string source;
  std::optional<Ledger> ledger;
  std::optional<StatementSummary> summary;
  std::string extractionMethod;
  std::vector<std::string> warnings;
  std::string error;

  bool ok() const { return ledger.has_value(); }
};

// Builds both PDF candidates (table and text strategies), each normalized,
// sanitized and scored.
std::vector<ExtractionResult> extractCandidates(const std::vector<PdfPage>& pages);

// Normalize, validate, sanitize, type and summarize a table that already has
// its source labels. Throws StatementError subclasses on fatal problems.
PipelineResult finishStatement(LabeledTable table, std::string extractionMethod,
                               std::vector<std::string> warnings);

PipelineResult processDocument(const LoadedDocument& doc);

// Loads and processes one file. Never throws StatementError; fatal problems
// are reported through PipelineResult::error.
PipelineResult processStatement(const std::string& path);

// Processes independent documents on a worker pool; results keep input order.
std::vector<PipelineResult> processStatements(const std::vector<std::string>& paths, size_t jobs);
