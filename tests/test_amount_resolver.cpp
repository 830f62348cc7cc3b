#include <catch2/catch_all.hpp>

#include "amount_resolver.hpp"

#include <string>
#include <vector>

TEST_CASE("first column with empty second column is a debit", "[amounts]") {
  auto r = resolveSignedAmount({"5,000.00", "--"}, "Transfer to ABC Fuel Station");
  REQUIRE(r);
  REQUIRE(r->amount == Catch::Approx(-5000.0));
  REQUIRE(r->type == TransactionType::Debit);
  REQUIRE(r->basis == AmountBasis::PositionalDebit);
  REQUIRE_FALSE(r->keywordConflict);
}

TEST_CASE("second column with empty first column is a credit", "[amounts]") {
  auto r = resolveSignedAmount({"--", "2,000.00", "12,000.00"}, "Cash lodgement");
  REQUIRE(r);
  REQUIRE(r->amount == Catch::Approx(2000.0));
  REQUIRE(r->type == TransactionType::Credit);
  REQUIRE(r->basis == AmountBasis::PositionalCredit);
}

TEST_CASE("a genuine zero behaves like a placeholder positionally", "[amounts]") {
  auto r = resolveSignedAmount({"0.00", "750.00", "9,000.00"}, "Payment received");
  REQUIRE(r->amount == Catch::Approx(750.0));
  REQUIRE(r->type == TransactionType::Credit);
}

TEST_CASE("both columns set: first column is the amount, signed by keywords", "[amounts]") {
  SECTION("no credit keyword defaults to debit") {
    auto r = resolveSignedAmount({"1,500.00", "20,000.00"}, "POS purchase SHOPRITE");
    REQUIRE(r->amount == Catch::Approx(-1500.0));
    REQUIRE(r->basis == AmountBasis::DefaultDebit);
  }
  SECTION("credit keyword makes it a credit") {
    auto r = resolveSignedAmount({"1,500.00", "20,000.00"}, "Transfer from John Okafor");
    REQUIRE(r->amount == Catch::Approx(1500.0));
    REQUIRE(r->type == TransactionType::Credit);
    REQUIRE(r->basis == AmountBasis::KeywordCredit);
  }
  SECTION("the balance column never becomes the amount") {
    auto r = resolveSignedAmount({"100.00", "250.00", "99,999.00"}, "Airtime");
    REQUIRE(r->amount == Catch::Approx(-100.0));
  }
}

TEST_CASE("positional debit wins over a conflicting keyword but is flagged", "[amounts]") {
  auto r = resolveSignedAmount({"700.00", "-"}, "Loan repayment");
  REQUIRE(r->amount == Catch::Approx(-700.0));
  REQUIRE(r->type == TransactionType::Debit);
  REQUIRE(r->keywordConflict);
}

TEST_CASE("unparseable tokens are rejected", "[amounts]") {
  REQUIRE_FALSE(resolveSignedAmount({"abc", "1.00"}, "Anything"));
}

TEST_CASE("hasCreditKeyword is case-insensitive", "[amounts]") {
  REQUIRE(hasCreditKeyword("NIP FROM ACME LTD"));
  REQUIRE(hasCreditKeyword("Reversal of charge"));
  REQUIRE_FALSE(hasCreditKeyword("Shop purchase"));
}

TEST_CASE("resolveAmountColumns builds a typed table and aggregates warnings", "[amounts]") {
  std::vector<TextCandidate> candidates = {
    {"15/01/2026", "Transfer to ABC Fuel Station", {"5,000.00", "--"}},
    {"16/01/2026", "NIP FROM ACME LTD", {"--", "25,000.00", "45,000.00"}},
    {"17/01/2026", "Loan repayment", {"700.00", "-"}},
  };

  StageResult out = resolveAmountColumns(candidates);
  REQUIRE(out.table.columns == std::vector<std::string>{"date", "description", "amount", "type"});
  REQUIRE(out.table.rows.size() == 3);
  REQUIRE(out.table.rows[0][2] == "-5000");
  REQUIRE(out.table.rows[0][3] == "Debit");
  REQUIRE(out.table.rows[1][2] == "25000");
  REQUIRE(out.table.rows[1][3] == "Credit");

  REQUIRE(out.warnings.size() == 1);
  REQUIRE(out.warnings[0].find("1 row(s)") == 0);
}

TEST_CASE("dropped text rows are reported as unparseable amount tokens", "[amounts]") {
  std::vector<TextCandidate> candidates = {
    {"15/01/2026", "Fuel", {"5,000.00", "--"}},
    {"16/01/2026", "Garbled", {"nan", "1.00"}},
  };

  StageResult out = resolveAmountColumns(candidates);
  REQUIRE(out.table.rows.size() == 1);
  REQUIRE(out.warnings == std::vector<std::string>{"Dropped 1 row(s) with unparseable amount tokens."});
}
