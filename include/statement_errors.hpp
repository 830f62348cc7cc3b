#pragma once

#include <stdexcept>
#include <string>
#include <vector>

// Base of every error that aborts processing of a single document.
class StatementError : public std::runtime_error {
public:
  explicit StatementError(const std::string& message) : std::runtime_error(message) {}
};

// The source could not be opened (missing file, corrupt or encrypted PDF,
// pdftotext unavailable).
class DocumentOpenError : public StatementError {
public:
  explicit DocumentOpenError(const std::string& message) : StatementError(message) {}
};

// Required canonical columns are absent after normalization.
class MissingColumnError : public StatementError {
public:
  MissingColumnError(std::vector<std::string> missing, std::vector<std::string> found);

  const std::vector<std::string>& missingColumns() const { return missing_; }
  const std::vector<std::string>& foundColumns() const { return found_; }

private:
  std::vector<std::string> missing_;
  std::vector<std::string> found_;
};

// Neither extraction strategy produced a usable row.
class NoValidRowsError : public StatementError {
public:
  explicit NoValidRowsError(const std::string& message) : StatementError(message) {}
};
