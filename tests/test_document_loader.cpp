#include <catch2/catch_all.hpp>

#include "document_loader.hpp"
#include "pdf_layout.hpp"
#include "statement_errors.hpp"

#include <filesystem>
#include <fstream>
#include <string>
#include <vector>

namespace fs = std::filesystem;

namespace {

fs::path writeTempFile(const std::string& name, const std::string& content) {
  fs::path p = fs::temp_directory_path() / ("stmtparse_loader_" + name);
  std::ofstream ofs(p, std::ios::binary);
  ofs << content;
  return p;
}

} // namespace

TEST_CASE("splitPages splits on form feeds", "[loader]") {
  REQUIRE(splitPages("page one\fpage two\f") == std::vector<std::string>{"page one", "page two"});
  REQUIRE(splitPages("only page") == std::vector<std::string>{"only page"});
  REQUIRE(splitPages("a\f\fc\f").size() == 3);
}

TEST_CASE("sniffDelimiter picks the most consistent separator", "[loader]") {
  REQUIRE(sniffDelimiter("Date,Amount\n01/01/2026,10\n") == ',');
  REQUIRE(sniffDelimiter("Date;Amount\n01/01/2026;1,50\n02/01/2026;2,50\n") == ';');
  REQUIRE(sniffDelimiter("Date\tAmount\n01/01/2026\t10\n") == '\t');
  REQUIRE(sniffDelimiter("Date|Narration|Amount\n01/01/2026|x|10\n") == '|');
  REQUIRE(sniffDelimiter("no separators here\n") == ',');
}

TEST_CASE("parseCsvText skips preamble, BOM and blank lines", "[loader]") {
  const std::string text =
    "\xEF\xBB\xBF" "ACME BANK STATEMENT\n"
    "Account: 0123\n"
    "\n"
    "Date,Description,Amount\r\n"
    "15/01/2026,\"Transfer, to ABC\",\"-5,000.00\"\r\n"
    "\r\n"
    "16/01/2026,Salary\r\n";

  RawTable t = parseCsvText(text);
  REQUIRE(t.header);
  REQUIRE(*t.header == RawRow{"Date", "Description", "Amount"});
  REQUIRE(t.rows.size() == 2);
  REQUIRE(t.rows[0] == RawRow{"15/01/2026", "Transfer, to ABC", "-5,000.00"});
  REQUIRE(t.rows[1] == RawRow{"16/01/2026", "Salary", ""});
}

TEST_CASE("parseCsvText falls back to the first non-blank row as header", "[loader]") {
  RawTable t = parseCsvText("\nfoo,bar\n1,2\n");
  REQUIRE(t.header);
  REQUIRE(*t.header == RawRow{"foo", "bar"});
  REQUIRE(t.rows.size() == 1);

  REQUIRE_FALSE(parseCsvText("\n\n").header);
}

TEST_CASE("parseCsvText unescapes doubled quotes", "[loader]") {
  RawTable t = parseCsvText("Date,Narration,Amount\n15/01/2026,\"Paid \"\"Bola\"\"\",10\n");
  REQUIRE(t.rows.size() == 1);
  REQUIRE(t.rows[0][1] == "Paid \"Bola\"");
}

TEST_CASE("detectDocumentKind uses extension, then signature", "[loader]") {
  REQUIRE(detectDocumentKind("statement.PDF") == DocumentKind::Pdf);
  REQUIRE(detectDocumentKind("statement.csv") == DocumentKind::Csv);

  fs::path pdf = writeTempFile("sig_pdf", "%PDF-1.7\n%binary\n");
  fs::path csv = writeTempFile("sig_csv", "Date,Amount\n");
  REQUIRE(detectDocumentKind(pdf.string()) == DocumentKind::Pdf);
  REQUIRE(detectDocumentKind(csv.string()) == DocumentKind::Csv);
  fs::remove(pdf);
  fs::remove(csv);
}

TEST_CASE("loadDocument reads CSV files and rejects missing ones", "[loader]") {
  fs::path csv = writeTempFile("load.csv", "Date,Description,Amount\n15/01/2026,Fuel,-10.00\n");
  LoadedDocument doc = loadDocument(csv.string());
  REQUIRE(doc.kind == DocumentKind::Csv);
  REQUIRE(doc.csvTable.rows.size() == 1);
  fs::remove(csv);

  REQUIRE_THROWS_AS(loadDocument("/nonexistent/statement.pdf"), DocumentOpenError);
  REQUIRE_THROWS_WITH(loadDocument("/nonexistent/statement.pdf"),
                      "Could not open document: /nonexistent/statement.pdf not found");

  fs::path empty = writeTempFile("empty.csv", "  \n");
  REQUIRE_THROWS_AS(loadDocument(empty.string()), DocumentOpenError);
  fs::remove(empty);
}

TEST_CASE("parseWordBoxes reads pages, coordinates and entities", "[layout]") {
  const std::string xml =
    "<doc>\n"
    "<page width=\"612.000000\" height=\"792.000000\">\n"
    "<word xMin=\"10.000000\" yMin=\"10.000000\" xMax=\"40.000000\" yMax=\"20.000000\">Date</word>\n"
    "<word xMin=\"200.000000\" yMin=\"10.000000\" xMax=\"240.000000\" yMax=\"20.000000\">Amount</word>\n"
    "<word xMin=\"10.000000\" yMin=\"30.000000\" xMax=\"60.000000\" yMax=\"40.000000\">15/01/2026</word>\n"
    "<word xMin=\"200.000000\" yMin=\"30.000000\" xMax=\"250.000000\" yMax=\"40.000000\">5,000.00</word>\n"
    "</page>\n"
    "<page width=\"612.000000\" height=\"792.000000\">\n"
    "<word xMin=\"10.000000\" yMin=\"10.000000\" xMax=\"60.000000\" yMax=\"20.000000\">Cash&amp;Carry&#8358;</word>\n"
    "</page>\n"
    "</doc>\n";

  std::vector<WordBox> words = parseWordBoxes(xml);
  REQUIRE(words.size() == 5);
  REQUIRE(words[0].pageNumber == 1);
  REQUIRE(words[0].xMax == Catch::Approx(40.0));
  REQUIRE(words[4].pageNumber == 2);
  REQUIRE(words[4].text == "Cash&Carry\xE2\x82\xA6");

  SECTION("buildPageTables recovers the grid of each page") {
    std::vector<PageTable> tables = buildPageTables(words);
    // page 2 has a single word, which is not a table
    REQUIRE(tables.size() == 1);
    REQUIRE(tables[0].pageNumber == 1);
    REQUIRE(tables[0].rows.size() == 2);
    REQUIRE(tables[0].rows[0] == RawRow{"Date", "Amount"});
    REQUIRE(tables[0].rows[1] == RawRow{"15/01/2026", "5,000.00"});
  }
}

TEST_CASE("buildPageTables joins words of one column into a cell", "[layout]") {
  auto word = [](double x0, double y0, double x1, double y1, const char* text) {
    return WordBox{1, x0, y0, x1, y1, text};
  };
  // given out of reading order, with a slightly skewed baseline
  std::vector<WordBox> words = {
    word(300, 30, 350, 40, "5,000.00"),
    word(144, 31, 154, 41, "to"),
    word(10, 10, 40, 20, "Date"),
    word(100, 31, 140, 41, "Transfer"),
    word(300, 10, 340, 20, "Amount"),
    word(10, 30, 60, 40, "15/01/2026"),
    word(100, 10.5, 160, 20.5, "Narration"),
  };

  std::vector<PageTable> tables = buildPageTables(words);
  REQUIRE(tables.size() == 1);
  REQUIRE(tables[0].rows.size() == 2);
  REQUIRE(tables[0].rows[0] == RawRow{"Date", "Narration", "Amount"});
  REQUIRE(tables[0].rows[1] == RawRow{"15/01/2026", "Transfer to", "5,000.00"});
}

TEST_CASE("writePageTablesAsCsv numbers tables per page", "[layout]") {
  fs::path dir = fs::temp_directory_path() / "stmtparse_loader_dump";
  fs::remove_all(dir);

  std::vector<PageTable> tables = {
    {1, {{"Date", "Amount"}, {"15/01/2026", "5,000.00"}}},
    {1, {{"a", "b"}}},
    {2, {{"Note", "x, y"}}},
  };
  writePageTablesAsCsv(tables, dir.string());

  REQUIRE(fs::exists(dir / "table_1_0.csv"));
  REQUIRE(fs::exists(dir / "table_1_1.csv"));
  REQUIRE(fs::exists(dir / "table_2_0.csv"));

  std::ifstream in(dir / "table_2_0.csv");
  std::string line;
  std::getline(in, line);
  REQUIRE(line == "Note,\"x, y\"");
  in.close();
  fs::remove_all(dir);
}
