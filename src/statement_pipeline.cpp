#include "statement_pipeline.hpp"
#include "column_normalizer.hpp"
#include "ledger_builder.hpp"
#include "row_sanitizer.hpp"
#include "statement_errors.hpp"
#include "table_extractor.hpp"
#include "text_extractor.hpp"

#include <boost/asio/post.hpp>
#include <boost/asio/thread_pool.hpp>
#include <spdlog/spdlog.h>

#include <algorithm>
#include <exception>
#include <utility>

namespace {

ExtractionResult scoreCandidate(LabeledTable table, ExtractionStrategy strategy,
                                std::vector<std::string> warnings) {
  ExtractionResult result;
  result.strategy = strategy;
  result.table = sanitizeRows(std::move(table)).table;
  result.validRowCount = countValidDates(result.table);
  result.warnings = std::move(warnings);
  return result;
}

void appendAll(std::vector<std::string>& into, const std::vector<std::string>& from) {
  into.insert(into.end(), from.begin(), from.end());
}

} // namespace

std::vector<ExtractionResult> extractCandidates(const std::vector<PdfPage>& pages) {
  std::vector<PageTable> tables;
  std::vector<std::string> texts;
  for (const auto& page : pages) {
    tables.insert(tables.end(), page.tables.begin(), page.tables.end());
    texts.push_back(page.text);
  }

  std::vector<ExtractionResult> candidates;

  if (std::optional<LabeledTable> fromTables = extractFromTables(tables)) {
    candidates.push_back(scoreCandidate(renameColumns(std::move(*fromTables)), ExtractionStrategy::Table, {}));
  } else {
    candidates.push_back(scoreCandidate(LabeledTable{}, ExtractionStrategy::Table, {}));
  }

  if (std::optional<StageResult> fromText = extractFromText(texts)) {
    candidates.push_back(scoreCandidate(std::move(fromText->table), ExtractionStrategy::Text,
                                        std::move(fromText->warnings)));
  } else {
    candidates.push_back(scoreCandidate(LabeledTable{}, ExtractionStrategy::Text, {}));
  }

  return candidates;
}

PipelineResult finishStatement(LabeledTable table, std::string extractionMethod,
                               std::vector<std::string> warnings) {
  PipelineResult result;
  result.extractionMethod = std::move(extractionMethod);
  result.warnings = std::move(warnings);

  StageResult normalized = normalizeColumns(std::move(table));
  appendAll(result.warnings, normalized.warnings);
  validateColumns(normalized.table);

  SanitizeResult clean = sanitizeRows(std::move(normalized.table));
  LedgerBuild built = buildLedger(clean.table);
  appendAll(result.warnings, built.warnings);
  if (built.ledger.empty()) {
    throw NoValidRowsError("No transactions with a valid date and amount were found.");
  }

  StatementSummary summary = summarizeLedger(built.ledger);
  summary.dateFormatDetected = built.dateFormat.empty() ? "unknown" : built.dateFormat;
  summary.columnsFound = clean.table.columns;
  if (std::optional<std::string> shortHistory = shortHistoryWarning(summary)) {
    result.warnings.push_back(*shortHistory);
  }

  result.ledger = std::move(built.ledger);
  result.summary = std::move(summary);
  return result;
}

PipelineResult processDocument(const LoadedDocument& doc) {
  if (doc.kind == DocumentKind::Csv) {
    std::optional<LabeledTable> table = assembleTable(doc.csvTable);
    if (!table) throw NoValidRowsError("The CSV file contains no transaction rows.");
    return finishStatement(std::move(*table), "csv", {});
  }

  StrategyChoice choice = selectStrategy(extractCandidates(doc.pages));
  spdlog::info("{}: using {}", doc.path, choice.label);
  std::vector<std::string> warnings = std::move(choice.result.warnings);
  if (choice.degraded) {
    warnings.push_back("No extraction strategy found rows with recognizable dates; "
                       "falling back to the raw table. Results may be unreliable.");
  }
  return finishStatement(std::move(choice.result.table), choice.label, std::move(warnings));
}

PipelineResult processStatement(const std::string& path) {
  PipelineResult result;
  try {
    result = processDocument(loadDocument(path));
  } catch (const StatementError& e) {
    spdlog::error("{}: {}", path, e.what());
    result = PipelineResult{};
    result.error = e.what();
  }
  result.source = path;

  for (const auto& w : result.warnings) spdlog::warn("{}: {}", path, w);
  if (result.ok()) {
    spdlog::info("{}: {} transaction(s) kept", path, result.ledger->size());
  }
  return result;
}

std::vector<PipelineResult> processStatements(const std::vector<std::string>& paths, size_t jobs) {
  std::vector<PipelineResult> results(paths.size());
  std::vector<std::exception_ptr> failures(paths.size());

  boost::asio::thread_pool pool(std::max<size_t>(1, std::min(jobs, paths.size())));
  for (size_t i = 0; i < paths.size(); ++i) {
    boost::asio::post(pool, [&, i]() {
      try {
        results[i] = processStatement(paths[i]);
      } catch (...) {
        failures[i] = std::current_exception();
      }
    });
  }
  pool.join();

  for (const auto& f : failures) {
    if (f) std::rethrow_exception(f);
  }
  return results;
}
