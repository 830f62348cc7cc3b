#pragma once

#include "pdf_layout.hpp"
#include "statement_types.hpp"

#include <string>
#include <vector>

enum class DocumentKind { Csv, Pdf };

struct PdfPage {
  int pageNumber;
  std::string text;              // flowed text, layout preserved
  std::vector<PageTable> tables; // grids recovered from word positions
};

struct LoadedDocument {
  std::string path;
  DocumentKind kind = DocumentKind::Csv;
  std::vector<PdfPage> pages;  // PDF only
  RawTable csvTable;           // CSV only
};

// By extension (.pdf, .csv, .tsv, .txt), else by the "%PDF-" signature.
DocumentKind detectDocumentKind(const std::string& path);

// Opens the source and extracts its raw structures. Throws DocumentOpenError
// when the file is unreadable, the PDF is corrupt or encrypted, or
// `pdftotext` is not installed.
LoadedDocument loadDocument(const std::string& path);

// Splits `pdftotext -layout` output into pages on form feeds.
std::vector<std::string> splitPages(const std::string& layoutText);

// Delimiter among , ; TAB | whose per-line count is most consistent.
char sniffDelimiter(const std::string& text);

// Parses CSV text of any common dialect. Preamble lines before the header
// row are skipped and data rows are width-normalized to the header.
RawTable parseCsvText(const std::string& text);
