#include "document_loader.hpp"
#include "ledger_writer.hpp"
#include "pdf_layout.hpp"
#include "statement_errors.hpp"
#include "statement_pipeline.hpp"

#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>

#include <algorithm>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>

namespace {

void printUsage(const char* argv0) {
  std::cerr << "Usage: " << argv0
            << " [--out=path] [--summary] [--jobs=n] [--dump-tables=dir] [-v|--verbose] [--quiet]"
               " <statement.csv|statement.pdf>...\n";
}

void dumpTables(const std::string& path, const std::string& dir) {
  LoadedDocument doc = loadDocument(path);
  std::vector<PageTable> tables;
  for (const auto& page : doc.pages) tables.insert(tables.end(), page.tables.begin(), page.tables.end());
  writePageTablesAsCsv(tables, dir);
  std::cerr << "Extracted " << tables.size() << " table(s) from '" << path << "' to '" << dir << "'\n";
}

void writeLedgerFile(const std::string& filename, const Ledger& ledger) {
  std::ofstream ofs(filename);
  if (!ofs) throw std::runtime_error("Cannot write " + filename);
  writeLedgerCsv(ofs, ledger);
}

} // namespace

int main(int argc, char** argv)
{
  try {
    std::vector<std::string> inputs;
    std::string outPath;
    std::string tablesOutDir;
    bool printSummary = false;
    size_t jobs = std::max(1u, std::thread::hardware_concurrency());
    auto level = spdlog::level::info;

    for (int i = 1; i < argc; ++i) {
      std::string arg = argv[i];
      if (arg == "--summary") {
        printSummary = true;
      } else if (arg == "-v" || arg == "--verbose") {
        level = spdlog::level::debug;
      } else if (arg == "--quiet") {
        level = spdlog::level::warn;
      } else if (arg.rfind("--out=", 0) == 0) {
        outPath = arg.substr(std::string("--out=").size());
      } else if (arg.rfind("--dump-tables=", 0) == 0) {
        tablesOutDir = arg.substr(std::string("--dump-tables=").size());
      } else if (arg.rfind("--jobs=", 0) == 0) {
        int n = 0;
        try {
          n = std::stoi(arg.substr(std::string("--jobs=").size()));
        } catch (const std::logic_error&) {
          n = 0;
        }
        if (n < 1) {
          std::cerr << "--jobs must be at least 1\n";
          return 2;
        }
        jobs = static_cast<size_t>(n);
      } else if (arg == "-h" || arg == "--help") {
        printUsage(argv[0]);
        return 0;
      } else if (!arg.empty() && arg[0] == '-') {
        std::cerr << "Unknown option: " << arg << "\n";
        printUsage(argv[0]);
        return 2;
      } else {
        inputs.push_back(arg);
      }
    }

    if (inputs.empty()) {
      printUsage(argv[0]);
      return 2;
    }

    auto logger = spdlog::stderr_color_mt("stmtparse");
    spdlog::set_default_logger(logger);
    spdlog::set_level(level);

    const bool several = inputs.size() > 1;

    if (!tablesOutDir.empty()) {
      for (const auto& path : inputs) {
        std::string dir = several ? tablesOutDir + "/" + std::filesystem::path(path).stem().string() : tablesOutDir;
        try {
          dumpTables(path, dir);
        } catch (const DocumentOpenError& e) {
          std::cerr << "Error: " << path << ": " << e.what() << "\n";
        }
      }
    }

    std::vector<PipelineResult> results = processStatements(inputs, jobs);

    int exitCode = 0;
    for (const auto& r : results) {
      if (!r.ok()) {
        std::cerr << "Error: " << r.source << ": " << r.error << "\n";
        exitCode = 1;
      } else if (several) {
        std::string dir = outPath.empty() ? "." : outPath;
        std::filesystem::create_directories(dir);
        writeLedgerFile(dir + "/" + std::filesystem::path(r.source).stem().string() + ".ledger.csv", *r.ledger);
      } else if (!outPath.empty()) {
        writeLedgerFile(outPath, *r.ledger);
      } else if (!printSummary) {
        writeLedgerCsv(std::cout, *r.ledger);
      }

      if (printSummary) {
        writeSummaryJson(std::cout, r.source, r.extractionMethod, r.summary ? &*r.summary : nullptr,
                         r.warnings, r.error);
      }
    }

    return exitCode;
  } catch (const std::exception& ex) {
    std::cerr << "Error: " << ex.what() << "\n";
    return 1;
  }
}
