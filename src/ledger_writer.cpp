#include "ledger_writer.hpp"
#include "value_parsers.hpp"

#include <cstdio>
#include <string>

namespace {

std::string jsonEscape(const std::string& s) {
  std::string out;
  out.reserve(s.size() + 2);
  for (char ch : s) {
    switch (ch) {
    case '"': out += "\\\""; break;
    case '\\': out += "\\\\"; break;
    case '\n': out += "\\n"; break;
    case '\r': out += "\\r"; break;
    case '\t': out += "\\t"; break;
    default:
      if (static_cast<unsigned char>(ch) < 0x20) {
        char buf[8];
        std::snprintf(buf, sizeof(buf), "\\u%04x", static_cast<unsigned char>(ch));
        out += buf;
      } else {
        out.push_back(ch);
      }
    }
  }
  return out;
}

std::string quoted(const std::string& s) {
  return "\"" + jsonEscape(s) + "\"";
}

} // namespace

void writeCsvRow(std::ostream& os, const RawRow& row) {
  for (size_t i = 0; i < row.size(); ++i) {
    const std::string& cell = row[i];
    bool needQuotes = cell.find_first_of(",\"\r\n") != std::string::npos;
    if (needQuotes) {
      std::string escaped;
      for (char ch : cell) {
        if (ch == '"') escaped += '"';
        escaped += ch;
      }
      os << '"' << escaped << '"';
    } else {
      os << cell;
    }
    if (i + 1 < row.size()) os << ',';
  }
  os << "\n";
}

LabeledTable ledgerToTable(const Ledger& ledger) {
  LabeledTable table;
  table.columns = {"date", "description", "amount", "type"};
  table.rows.reserve(ledger.size());
  for (const auto& tx : ledger) {
    table.rows.push_back({tx.date.toIso(), tx.description, formatAmount(tx.amount), transactionTypeName(tx.type)});
  }
  return table;
}

void writeLedgerCsv(std::ostream& os, const Ledger& ledger) {
  LabeledTable table = ledgerToTable(ledger);
  writeCsvRow(os, table.columns);
  for (const auto& r : table.rows) writeCsvRow(os, r);
}

void writeSummaryJson(std::ostream& os,
                      const std::string& source,
                      const std::string& extractionMethod,
                      const StatementSummary* summary,
                      const std::vector<std::string>& warnings,
                      const std::string& error) {
  auto printStrings = [&](const std::vector<std::string>& arr) {
    os << "[";
    for (size_t i = 0; i < arr.size(); ++i) {
      os << quoted(arr[i]) << (i + 1 == arr.size() ? "" : ", ");
    }
    os << "]";
  };

  os << "{\n";
  os << "  \"source\": " << quoted(source) << ",\n";
  if (!error.empty()) {
    os << "  \"error\": " << quoted(error) << ",\n";
  }
  os << "  \"extraction_method\": " << quoted(extractionMethod) << ",\n";

  if (summary) {
    os << "  \"summary\": {\n";
    os << "    \"total_transactions\": " << summary->totalTransactions << ",\n";
    if (summary->startDate && summary->endDate) {
      os << "    \"start_date\": " << quoted(summary->startDate->toIso()) << ",\n";
      os << "    \"end_date\": " << quoted(summary->endDate->toIso()) << ",\n";
    }
    os << "    \"days_covered\": " << summary->daysCovered << ",\n";
    os << "    \"months_covered\": " << summary->monthsCovered << ",\n";
    os << "    \"date_format_detected\": " << quoted(summary->dateFormatDetected) << ",\n";
    os << "    \"columns_found\": ";
    printStrings(summary->columnsFound);
    os << ",\n";
    os << "    \"monthly_breakdown\": [";
    for (size_t i = 0; i < summary->monthlyBreakdown.size(); ++i) {
      const MonthlyTotals& m = summary->monthlyBreakdown[i];
      os << (i == 0 ? "\n" : ",\n");
      os << "      {\"month\": " << quoted(m.month)
         << ", \"credits\": " << formatAmount(m.creditsSum)
         << ", \"debits\": " << formatAmount(m.debitsSum)
         << ", \"net\": " << formatAmount(m.net)
         << ", \"count\": " << m.count << "}";
    }
    os << (summary->monthlyBreakdown.empty() ? "],\n" : "\n    ],\n");
    os << "    \"total_credits\": " << formatAmount(summary->totalCredits) << ",\n";
    os << "    \"total_debits\": " << formatAmount(summary->totalDebits) << "\n";
    os << "  },\n";
  }

  os << "  \"warnings\": ";
  printStrings(warnings);
  os << "\n}\n";
}
