#include <catch2/catch_all.hpp>

#include "row_sanitizer.hpp"

#include <string>
#include <vector>

TEST_CASE("isHeaderArtifact matches whole captions only", "[sanitize]") {
  REQUIRE(isHeaderArtifact("Date"));
  REQUIRE(isHeaderArtifact(" NARRATION "));
  REQUIRE(isHeaderArtifact("S/N"));
  REQUIRE(isHeaderArtifact("No."));
  REQUIRE(isHeaderArtifact("Trans. Time"));
  REQUIRE(isHeaderArtifact("balance"));
  REQUIRE_FALSE(isHeaderArtifact("Balance transfer to savings"));
  REQUIRE_FALSE(isHeaderArtifact("Transfer"));
}

TEST_CASE("sanitizeRows drops junk and collapses whitespace", "[sanitize]") {
  LabeledTable table;
  table.columns = {"date", "description", "amount"};
  table.rows = {
    {"15/01/2026", "  Transfer   to\tABC ", "-5000"},
    {"", "Carried over", "1"},
    {"nan", "x", "1"},
    {"None", "x", "1"},
    {"Date", "Narration", "Amount"},
    {"16/01/2026", "Balance", "100"},
    {"17/01/2026", "Balance transfer to savings", "100"},
  };

  SanitizeResult out = sanitizeRows(table);
  REQUIRE(out.table.rows.size() == 2);
  REQUIRE(out.table.rows[0] == RawRow{"15/01/2026", "Transfer to ABC", "-5000"});
  REQUIRE(out.table.rows[1][1] == "Balance transfer to savings");
  REQUIRE(out.blankDateRows == 3);
  REQUIRE(out.headerArtifactRows == 2);
}

TEST_CASE("sanitizeRows without canonical columns only removes empty rows", "[sanitize]") {
  LabeledTable table;
  table.columns = {"0", "1"};
  table.rows = {{" ", ""}, {"a", ""}};

  SanitizeResult out = sanitizeRows(table);
  REQUIRE(out.table.rows.size() == 1);
  REQUIRE(out.emptyRows == 1);
}

TEST_CASE("sanitizeRows is idempotent", "[sanitize]") {
  LabeledTable table;
  table.columns = {"date", "description", "amount"};
  table.rows = {{"15/01/2026", " a  b ", "1"}, {"", "x", "2"}};

  LabeledTable once = sanitizeRows(table).table;
  LabeledTable twice = sanitizeRows(once).table;
  REQUIRE(once.rows == twice.rows);
  REQUIRE(once.columns == twice.columns);
}
