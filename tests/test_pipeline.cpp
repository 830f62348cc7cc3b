#include <catch2/catch_all.hpp>

#include "ledger_builder.hpp"
#include "ledger_writer.hpp"
#include "statement_errors.hpp"
#include "statement_pipeline.hpp"

#include <algorithm>
#include <filesystem>
#include <fstream>
#include <sstream>
#include <string>
#include <vector>

namespace fs = std::filesystem;

namespace {

fs::path writeTempFile(const std::string& name, const std::string& content) {
  fs::path p = fs::temp_directory_path() / ("stmtparse_pipeline_" + name);
  std::ofstream ofs(p, std::ios::binary);
  ofs << content;
  return p;
}

bool hasWarning(const PipelineResult& r, const std::string& text) {
  return std::find(r.warnings.begin(), r.warnings.end(), text) != r.warnings.end();
}

LoadedDocument textOnlyPdf() {
  LoadedDocument doc;
  doc.path = "statement.pdf";
  doc.kind = DocumentKind::Pdf;
  doc.pages.push_back(PdfPage{1,
    "ACME BANK PLC\n"
    "Date        Narration                        Debit      Credit      Balance\n"
    "15/01/2026  Transfer to ABC Fuel Station     5,000.00   --          95,000.00\n"
    "16/01/2026  Transfer from Bola Stores        --         20,000.00   115,000.00\n",
    {}});
  doc.pages.push_back(PdfPage{2,
    "20/04/2026  POS Purchase Shoprite            1,200.00   --          113,800.00\n"
    "Page 2 of 2\n",
    {}});
  return doc;
}

} // namespace

TEST_CASE("a text-only PDF resolves signs from column position", "[pipeline]") {
  PipelineResult r = processDocument(textOnlyPdf());
  REQUIRE(r.ok());
  REQUIRE(r.extractionMethod == "text_extraction (3 valid rows)");

  const Ledger& ledger = *r.ledger;
  REQUIRE(ledger.size() == 3);
  REQUIRE(ledger[0].date.toIso() == "2026-01-15");
  REQUIRE(ledger[0].description == "Transfer to ABC Fuel Station");
  REQUIRE(ledger[0].amount == Catch::Approx(-5000));
  REQUIRE(ledger[0].type == TransactionType::Debit);
  REQUIRE(ledger[1].amount == Catch::Approx(20000));
  REQUIRE(ledger[1].type == TransactionType::Credit);
  REQUIRE(ledger[2].date.toIso() == "2026-04-20");

  REQUIRE(r.summary->monthsCovered == 3);
  REQUIRE(r.summary->dateFormatDetected == "%d/%m/%Y");
  REQUIRE(r.warnings.empty());
}

TEST_CASE("a PDF with nothing usable is reported as no valid rows", "[pipeline]") {
  LoadedDocument doc;
  doc.path = "scan.pdf";
  doc.kind = DocumentKind::Pdf;
  doc.pages.push_back(PdfPage{1, "Dear customer,\nThank you.\n", {}});
  REQUIRE_THROWS_AS(processDocument(doc), NoValidRowsError);
}

TEST_CASE("a CSV with split columns and preamble runs end to end", "[pipeline]") {
  fs::path csv = writeTempFile("split.csv",
    "Account Statement\n"
    "Trans Date,Narration,Debit,Credit,Balance\n"
    "15/01/2026,Transfer to ABC Fuel Station,5000.00,,95000\n"
    "16/01/2026,Salary,,20000.00,115000\n"
    "bad date,Something,10,,0\n");

  PipelineResult r = processStatement(csv.string());
  fs::remove(csv);

  REQUIRE(r.ok());
  REQUIRE(r.error.empty());
  REQUIRE(r.source == csv.string());
  REQUIRE(r.extractionMethod == "csv");
  REQUIRE(r.ledger->size() == 2);
  REQUIRE((*r.ledger)[0].amount == Catch::Approx(-5000));
  REQUIRE((*r.ledger)[1].type == TransactionType::Credit);

  REQUIRE(hasWarning(r, "Dropped 1 row(s) with unparseable dates."));
  REQUIRE(hasWarning(r,
    "Statement covers only 1 month(s). A minimum of 3 months is recommended for reliable scoring."));
  REQUIRE(r.summary->columnsFound == std::vector<std::string>{"date", "description", "balance", "amount", "type"});
}

TEST_CASE("fatal problems come back as errors, not exceptions", "[pipeline]") {
  fs::path csv = writeTempFile("nocol.csv", "Date,Description\n15/01/2026,Fuel\n");
  PipelineResult missing = processStatement(csv.string());
  fs::remove(csv);
  REQUIRE_FALSE(missing.ok());
  REQUIRE(missing.error == "Missing required columns: amount. Found: date, description");

  PipelineResult absent = processStatement("/nonexistent/statement.csv");
  REQUIRE_FALSE(absent.ok());
  REQUIRE_THAT(absent.error, Catch::Matchers::StartsWith("Could not open document"));

  fs::path headerOnly = writeTempFile("header.csv", "Date,Description,Amount\n");
  PipelineResult empty = processStatement(headerOnly.string());
  fs::remove(headerOnly);
  REQUIRE(empty.error == "The CSV file contains no transaction rows.");
}

TEST_CASE("buildLedger drops null-marker amounts instead of booking zero", "[pipeline]") {
  LabeledTable table;
  table.columns = {"date", "description", "amount"};
  table.rows = {
    {"15/01/2026", "Fuel", "-5,000.00"},
    {"16/01/2026", "Bad cell", "nan"},
    {"17/01/2026", "None cell", "None"},
    {"18/01/2026", "Levy", "--"},
  };

  LedgerBuild built = buildLedger(table);
  REQUIRE(built.ledger.size() == 2);
  REQUIRE(built.ledger[0].description == "Fuel");
  REQUIRE(built.ledger[1].description == "Levy");
  REQUIRE(built.ledger[1].amount == 0.0);
  REQUIRE(built.droppedAmounts == 2);
  REQUIRE(std::find(built.warnings.begin(), built.warnings.end(),
                    "Dropped 2 row(s) with unparseable amounts.") != built.warnings.end());
}

TEST_CASE("re-processing a canonical ledger is a no-op", "[pipeline]") {
  PipelineResult first = processDocument(textOnlyPdf());
  REQUIRE(first.ok());

  PipelineResult second = finishStatement(ledgerToTable(*first.ledger), "csv", {});
  REQUIRE(second.ok());
  REQUIRE(second.ledger->size() == first.ledger->size());
  for (size_t i = 0; i < first.ledger->size(); ++i) {
    const CanonicalTransaction& a = (*first.ledger)[i];
    const CanonicalTransaction& b = (*second.ledger)[i];
    REQUIRE(a.date == b.date);
    REQUIRE(a.description == b.description);
    REQUIRE(a.amount == Catch::Approx(b.amount));
    REQUIRE(a.type == b.type);
  }
}

TEST_CASE("processStatements keeps input order", "[pipeline]") {
  fs::path good = writeTempFile("order.csv", "Date,Description,Amount\n15/01/2026,Fuel,-10.00\n");
  std::vector<std::string> paths = {"/nonexistent/a.csv", good.string(), "/nonexistent/b.csv"};

  std::vector<PipelineResult> results = processStatements(paths, 2);
  fs::remove(good);

  REQUIRE(results.size() == 3);
  for (size_t i = 0; i < paths.size(); ++i) REQUIRE(results[i].source == paths[i]);
  REQUIRE_FALSE(results[0].ok());
  REQUIRE(results[1].ok());
  REQUIRE_FALSE(results[2].ok());
}

TEST_CASE("writeSummaryJson reports errors and summaries", "[pipeline]") {
  std::ostringstream failed;
  writeSummaryJson(failed, "a.pdf", "", nullptr, {}, "Could not open PDF: \"bad\"");
  REQUIRE_THAT(failed.str(), Catch::Matchers::ContainsSubstring("\"error\": \"Could not open PDF: \\\"bad\\\"\""));
  REQUIRE_THAT(failed.str(), !Catch::Matchers::ContainsSubstring("\"summary\""));

  PipelineResult r = processDocument(textOnlyPdf());
  std::ostringstream ok;
  writeSummaryJson(ok, "statement.pdf", r.extractionMethod, &*r.summary, r.warnings, "");
  REQUIRE_THAT(ok.str(), Catch::Matchers::ContainsSubstring("\"months_covered\": 3"));
  REQUIRE_THAT(ok.str(), Catch::Matchers::ContainsSubstring("\"start_date\": \"2026-01-15\""));
  REQUIRE_THAT(ok.str(), Catch::Matchers::ContainsSubstring("\"total_debits\": 6200.00"));
}
