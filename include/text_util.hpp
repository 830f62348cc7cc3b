#pragma once

#include <string>

std::string trim(const std::string& s);
std::string toLower(std::string s);

// Trims and replaces every run of whitespace (including line breaks) by a
// single space.
std::string collapseWhitespace(const std::string& s);

bool containsDigit(const std::string& s);

// Escapes a value for use as a single POSIX shell word.
std::string shellQuote(const std::string& s);
