#pragma once

#include "statement_summary.hpp"
#include "statement_types.hpp"

#include <ostream>
#include <string>
#include <vector>

// Writes one RFC 4180 line, quoting cells that contain a comma, quote or line break.
void writeCsvRow(std::ostream& os, const RawRow& row);

// date,description,amount,type with ISO dates and two-decimal amounts.
void writeLedgerCsv(std::ostream& os, const Ledger& ledger);

// The canonical ledger rendered back into a labeled table.
LabeledTable ledgerToTable(const Ledger& ledger);

void writeSummaryJson(std::ostream& os,
                      const std::string& source,
                      const std::string& extractionMethod,
                      const StatementSummary* summary,
                      const std::vector<std::string>& warnings,
                      const std::string& error);
