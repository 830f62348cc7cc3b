#include "statement_errors.hpp"

#include <utility>

namespace {

std::string joinNames(const std::vector<std::string>& names) {
  std::string out;
  for (size_t i = 0; i < names.size(); ++i) {
    if (i) out += ", ";
    out += names[i];
  }
  return out;
}

} // namespace

MissingColumnError::MissingColumnError(std::vector<std::string> missing, std::vector<std::string> found)
  : StatementError("Missing required columns: " + joinNames(missing) + ". Found: " + joinNames(found)),
    missing_(std::move(missing)),
    found_(std::move(found)) {}
