#include "statement_types.hpp"

#include <cstdio>
#include <tuple>

int LabeledTable::columnIndex(const std::string& name) const {
  for (size_t i = 0; i < columns.size(); ++i) {
    if (columns[i] == name) return static_cast<int>(i);
  }
  return -1;
}

std::string CalendarDate::toIso() const {
  char buf[16];
  std::snprintf(buf, sizeof(buf), "%04d-%02d-%02d", year, month, day);
  return buf;
}

long CalendarDate::daysSinceEpoch() const {
  // Civil-from-days inverse on the proleptic Gregorian calendar.
  long y = year - (month <= 2 ? 1 : 0);
  long era = (y >= 0 ? y : y - 399) / 400;
  long yoe = y - era * 400;
  long mp = (month + 9) % 12;
  long doy = (153 * mp + 2) / 5 + day - 1;
  long doe = yoe * 365 + yoe / 4 - yoe / 100 + doy;
  return era * 146097 + doe - 719468;
}

bool operator==(const CalendarDate& a, const CalendarDate& b) {
  return a.year == b.year && a.month == b.month && a.day == b.day;
}

bool operator!=(const CalendarDate& a, const CalendarDate& b) {
  return !(a == b);
}

bool operator<(const CalendarDate& a, const CalendarDate& b) {
  return std::tie(a.year, a.month, a.day) < std::tie(b.year, b.month, b.day);
}

const char* transactionTypeName(TransactionType type) {
  return type == TransactionType::Credit ? "Credit" : "Debit";
}

TransactionType typeForAmount(double amount) {
  return amount >= 0 ? TransactionType::Credit : TransactionType::Debit;
}

const char* strategyName(ExtractionStrategy strategy) {
  return strategy == ExtractionStrategy::Text ? "text_extraction" : "table_extraction";
}
