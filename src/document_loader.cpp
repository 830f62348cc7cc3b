#include "document_loader.hpp"
#include "statement_errors.hpp"
#include "table_extractor.hpp"
#include "text_util.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <cstdio>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <map>
#include <sstream>
#include <string>

namespace {

constexpr size_t kSniffLines = 20;
constexpr size_t kHeaderSearchRows = 20;

bool commandExists(const std::string& command) {
  std::string test = "command -v " + command + " >/dev/null 2>&1";
  return std::system(test.c_str()) == 0;
}

std::string runPdftotext(const std::string& options, const std::string& pdfPath) {
  std::string cmd = "pdftotext " + options + " -q " + shellQuote(pdfPath) + " - 2>/dev/null";
  std::string output;

  FILE* pipe = popen(cmd.c_str(), "r");
  if (!pipe) {
    throw DocumentOpenError("Could not open PDF: failed to start pdftotext");
  }

  char buffer[8192];
  size_t n;
  while ((n = std::fread(buffer, 1, sizeof(buffer), pipe)) > 0) {
    output.append(buffer, n);
  }

  int rc = pclose(pipe);
  if (rc != 0) {
    throw DocumentOpenError("Could not open PDF: pdftotext " + options +
                            " failed (the file may be corrupt or encrypted)");
  }
  return output;
}

LoadedDocument loadPdf(const std::string& path) {
  if (!commandExists("pdftotext")) {
    throw DocumentOpenError(
      "Could not open PDF: pdftotext not found. Please install poppler-utils (e.g., apt-get install -y poppler-utils).");
  }

  std::vector<std::string> texts = splitPages(runPdftotext("-layout", path));
  std::vector<PageTable> tables = buildPageTables(parseWordBoxes(runPdftotext("-bbox-layout", path)));

  int pageCount = static_cast<int>(texts.size());
  for (const auto& t : tables) pageCount = std::max(pageCount, t.pageNumber);

  LoadedDocument doc;
  doc.path = path;
  doc.kind = DocumentKind::Pdf;
  for (int p = 1; p <= pageCount; ++p) {
    PdfPage page;
    page.pageNumber = p;
    if (static_cast<size_t>(p) <= texts.size()) page.text = std::move(texts[p - 1]);
    for (auto& t : tables) {
      if (t.pageNumber == p) page.tables.push_back(std::move(t));
    }
    doc.pages.push_back(std::move(page));
  }
  spdlog::debug("{}: {} page(s), {} page table(s)", path, doc.pages.size(), tables.size());
  return doc;
}

LoadedDocument loadCsv(const std::string& path) {
  std::ifstream in(path, std::ios::binary);
  if (!in) {
    throw DocumentOpenError("Could not open CSV: cannot read " + path);
  }
  std::ostringstream ss;
  ss << in.rdbuf();
  std::string text = ss.str();
  if (trim(text).empty()) {
    throw DocumentOpenError("Could not open CSV: " + path + " is empty");
  }

  LoadedDocument doc;
  doc.path = path;
  doc.kind = DocumentKind::Csv;
  doc.csvTable = parseCsvText(text);
  spdlog::debug("{}: {} CSV data row(s)", path, doc.csvTable.rows.size());
  return doc;
}

// Occurrences of delim outside double quotes.
size_t countDelimiter(const std::string& line, char delim) {
  size_t count = 0;
  bool quoted = false;
  for (char ch : line) {
    if (ch == '"') quoted = !quoted;
    else if (ch == delim && !quoted) count++;
  }
  return count;
}

std::vector<RawRow> splitRecords(const std::string& text, char delim) {
  std::vector<RawRow> records;
  RawRow record;
  std::string field;
  bool inQuotes = false;
  bool fieldStarted = false;

  auto endField = [&]() {
    record.push_back(field);
    field.clear();
    fieldStarted = false;
  };
  auto endRecord = [&]() {
    endField();
    records.push_back(std::move(record));
    record.clear();
  };

  for (size_t i = 0; i < text.size(); ++i) {
    char ch = text[i];
    if (inQuotes) {
      if (ch == '"') {
        if (i + 1 < text.size() && text[i + 1] == '"') {
          field.push_back('"');
          ++i;
        } else {
          inQuotes = false;
        }
      } else {
        field.push_back(ch);
      }
      continue;
    }

    if (ch == '"' && !fieldStarted) {
      inQuotes = true;
      fieldStarted = true;
    } else if (ch == delim) {
      endField();
    } else if (ch == '\r' || ch == '\n') {
      if (ch == '\r' && i + 1 < text.size() && text[i + 1] == '\n') ++i;
      endRecord();
    } else {
      field.push_back(ch);
      fieldStarted = true;
    }
  }
  if (fieldStarted || !field.empty() || !record.empty()) endRecord();
  return records;
}

} // namespace

DocumentKind detectDocumentKind(const std::string& path) {
  std::string ext = toLower(std::filesystem::path(path).extension().string());
  if (ext == ".pdf") return DocumentKind::Pdf;
  if (ext == ".csv" || ext == ".tsv" || ext == ".txt") return DocumentKind::Csv;

  std::ifstream in(path, std::ios::binary);
  char magic[5] = {0, 0, 0, 0, 0};
  in.read(magic, sizeof(magic));
  if (in.gcount() == 5 && std::string(magic, 5) == "%PDF-") return DocumentKind::Pdf;
  return DocumentKind::Csv;
}

LoadedDocument loadDocument(const std::string& path) {
  if (!std::filesystem::exists(path)) {
    throw DocumentOpenError("Could not open document: " + path + " not found");
  }
  if (detectDocumentKind(path) == DocumentKind::Pdf) return loadPdf(path);
  return loadCsv(path);
}

std::vector<std::string> splitPages(const std::string& layoutText) {
  std::vector<std::string> pages;
  size_t start = 0;
  while (start <= layoutText.size()) {
    size_t ff = layoutText.find('\f', start);
    if (ff == std::string::npos) {
      std::string tail = layoutText.substr(start);
      // pdftotext ends the last page with a form feed too
      if (!trim(tail).empty() || pages.empty()) pages.push_back(std::move(tail));
      break;
    }
    pages.push_back(layoutText.substr(start, ff - start));
    start = ff + 1;
  }
  return pages;
}

char sniffDelimiter(const std::string& text) {
  std::vector<std::string> lines;
  std::istringstream in(text);
  std::string line;
  while (lines.size() < kSniffLines && std::getline(in, line)) {
    if (!trim(line).empty()) lines.push_back(line);
  }

  char best = ',';
  size_t bestAgreement = 0;
  for (char delim : {',', ';', '\t', '|'}) {
    std::map<size_t, size_t> countFrequency;
    for (const auto& l : lines) {
      size_t n = countDelimiter(l, delim);
      if (n > 0) countFrequency[n]++;
    }
    size_t agreement = 0;
    for (const auto& kv : countFrequency) agreement = std::max(agreement, kv.second);
    if (agreement > bestAgreement) {
      bestAgreement = agreement;
      best = delim;
    }
  }
  return best;
}

RawTable parseCsvText(const std::string& text) {
  std::string body = text;
  if (body.compare(0, 3, "\xEF\xBB\xBF") == 0) body.erase(0, 3);

  std::vector<RawRow> records = splitRecords(body, sniffDelimiter(body));
  for (auto& r : records) {
    for (auto& cell : r) cell = cleanCell(cell);
  }
  auto isBlank = [](const RawRow& r) {
    return std::all_of(r.begin(), r.end(), [](const std::string& c) { return c.empty(); });
  };

  size_t headerAt = records.size();
  for (size_t i = 0; i < records.size() && i < kHeaderSearchRows; ++i) {
    if (isHeaderRow(records[i])) { headerAt = i; break; }
  }
  if (headerAt == records.size()) {
    for (size_t i = 0; i < records.size(); ++i) {
      if (!isBlank(records[i])) { headerAt = i; break; }
    }
  }

  RawTable table;
  if (headerAt == records.size()) return table;
  if (headerAt > 0) spdlog::debug("Skipped {} preamble line(s) before the CSV header", headerAt);

  table.header = records[headerAt];
  const size_t width = table.header->size();
  for (size_t i = headerAt + 1; i < records.size(); ++i) {
    if (isBlank(records[i])) continue;
    table.rows.push_back(normalizeRowWidth(std::move(records[i]), width));
  }
  return table;
}
