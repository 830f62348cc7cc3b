#include "pdf_layout.hpp"
#include "ledger_writer.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <cmath>
#include <filesystem>
#include <fstream>
#include <map>
#include <numeric>
#include <regex>
#include <stdexcept>
#include <string>

namespace {

void appendUtf8(std::string& out, unsigned long code) {
  if (code < 0x80) {
    out.push_back(static_cast<char>(code));
  } else if (code < 0x800) {
    out.push_back(static_cast<char>(0xC0 | (code >> 6)));
    out.push_back(static_cast<char>(0x80 | (code & 0x3F)));
  } else if (code < 0x10000) {
    out.push_back(static_cast<char>(0xE0 | (code >> 12)));
    out.push_back(static_cast<char>(0x80 | ((code >> 6) & 0x3F)));
    out.push_back(static_cast<char>(0x80 | (code & 0x3F)));
  } else if (code < 0x110000) {
    out.push_back(static_cast<char>(0xF0 | (code >> 18)));
    out.push_back(static_cast<char>(0x80 | ((code >> 12) & 0x3F)));
    out.push_back(static_cast<char>(0x80 | ((code >> 6) & 0x3F)));
    out.push_back(static_cast<char>(0x80 | (code & 0x3F)));
  }
}

std::string decodeEntities(const std::string& in) {
  std::string out;
  out.reserve(in.size());
  for (size_t i = 0; i < in.size(); ++i) {
    if (in[i] == '&') {
      size_t j = in.find(';', i + 1);
      if (j != std::string::npos && j - i <= 10) {
        std::string ent = in.substr(i + 1, j - (i + 1));
        std::string rep;
        if (ent == "amp") rep = "&";
        else if (ent == "lt") rep = "<";
        else if (ent == "gt") rep = ">";
        else if (ent == "quot") rep = "\"";
        else if (ent == "apos") rep = "'";
        else if (ent.size() > 1 && ent[0] == '#') {
          bool hex = ent[1] == 'x' || ent[1] == 'X';
          std::string digits = ent.substr(hex ? 2 : 1);
          if (!digits.empty() &&
              digits.find_first_not_of(hex ? "0123456789abcdefABCDEF" : "0123456789") == std::string::npos) {
            appendUtf8(rep, std::stoul(digits, nullptr, hex ? 16 : 10));
          }
        }
        if (!rep.empty()) {
          out += rep; i = j; continue;
        }
      }
    }
    out.push_back(in[i]);
  }
  return out;
}

// Words of one visual line, left to right.
struct TextLine {
  double baseline;  // mean vertical centre of the words so far
  std::vector<WordBox> words;
};

double verticalCentre(const WordBox& w) { return (w.yMin + w.yMax) * 0.5; }
double horizontalCentre(const WordBox& w) { return (w.xMin + w.xMax) * 0.5; }

double medianOf(std::vector<double> values) {
  if (values.empty()) return 0.0;
  auto mid = values.begin() + static_cast<std::ptrdiff_t>(values.size() / 2);
  std::nth_element(values.begin(), mid, values.end());
  return *mid;
}

// Words whose vertical centre lies within 0.8 median word heights of the
// current line's baseline join that line. pdftotext's y axis grows downwards.
std::vector<TextLine> groupIntoLines(std::vector<WordBox> words) {
  std::vector<double> heights;
  heights.reserve(words.size());
  for (const auto& w : words) heights.push_back(w.yMax - w.yMin);
  const double typicalHeight = medianOf(std::move(heights));
  const double tolerance = typicalHeight > 0 ? typicalHeight * 0.8 : 6.0;

  std::sort(words.begin(), words.end(), [](const WordBox& a, const WordBox& b) {
    const double ya = verticalCentre(a);
    const double yb = verticalCentre(b);
    return ya != yb ? ya < yb : a.xMin < b.xMin;
  });

  std::vector<TextLine> lines;
  for (auto& w : words) {
    const double yc = verticalCentre(w);
    if (lines.empty() || std::abs(yc - lines.back().baseline) > tolerance) {
      lines.push_back(TextLine{yc, {}});
    }
    TextLine& line = lines.back();
    line.words.push_back(std::move(w));
    line.baseline += (yc - line.baseline) / static_cast<double>(line.words.size());
  }

  for (auto& line : lines) {
    std::sort(line.words.begin(), line.words.end(),
              [](const WordBox& a, const WordBox& b) { return a.xMin < b.xMin; });
  }
  return lines;
}

// One anchor per column: sorted word centres split wherever the gap exceeds
// max(8, 1.2 median word widths), each run averaged.
std::vector<double> columnAnchors(const std::vector<TextLine>& lines) {
  std::vector<double> centres;
  std::vector<double> widths;
  for (const auto& line : lines) {
    for (const auto& w : line.words) {
      centres.push_back(horizontalCentre(w));
      widths.push_back(w.xMax - w.xMin);
    }
  }
  if (centres.empty()) return {};

  const double tolerance = std::max(8.0, medianOf(std::move(widths)) * 1.2);
  std::sort(centres.begin(), centres.end());

  std::vector<double> anchors;
  size_t runStart = 0;
  for (size_t i = 1; i <= centres.size(); ++i) {
    if (i < centres.size() && centres[i] - centres[i - 1] <= tolerance) continue;
    double sum = std::accumulate(centres.begin() + static_cast<std::ptrdiff_t>(runStart),
                                 centres.begin() + static_cast<std::ptrdiff_t>(i), 0.0);
    anchors.push_back(sum / static_cast<double>(i - runStart));
    runStart = i;
  }
  return anchors;
}

size_t nearestAnchor(double x, const std::vector<double>& anchors) {
  auto best = std::min_element(anchors.begin(), anchors.end(),
                               [x](double a, double b) { return std::abs(x - a) < std::abs(x - b); });
  return static_cast<size_t>(best - anchors.begin());
}

// Words falling in the same column are joined with a space.
RawRow lineToRow(const TextLine& line, const std::vector<double>& anchors) {
  RawRow row(anchors.size());
  for (const auto& w : line.words) {
    std::string& cell = row[nearestAnchor(horizontalCentre(w), anchors)];
    if (!cell.empty()) cell += ' ';
    cell += w.text;
  }
  return row;
}

} // namespace

std::vector<WordBox> parseWordBoxes(const std::string& bboxXml) {
  static const std::regex pageOpen("<page\\b[^>]*>");
  static const std::regex pageNumberAttr("number=\"([0-9]+)\"");
  static const std::regex wordRe(
    "<word[^>]*?xMin=\"([0-9.]+)\"[^>]*?yMin=\"([0-9.]+)\"[^>]*?xMax=\"([0-9.]+)\"[^>]*?yMax=\"([0-9.]+)\"[^>]*>([^<]*)</word>");

  std::vector<WordBox> words;
  int currentPage = 0;
  const auto flags = std::regex_constants::match_continuous;

  size_t pos = bboxXml.find('<');
  while (pos != std::string::npos) {
    auto at = bboxXml.begin() + static_cast<std::ptrdiff_t>(pos);
    std::smatch m;
    if (std::regex_search(at, bboxXml.end(), m, pageOpen, flags)) {
      std::smatch num;
      std::string tag = m.str();
      if (std::regex_search(tag, num, pageNumberAttr)) currentPage = std::stoi(num[1].str());
      else currentPage++;
      pos += m.length();
    } else if (std::regex_search(at, bboxXml.end(), m, wordRe, flags)) {
      WordBox w;
      w.pageNumber = std::max(currentPage, 1);
      w.xMin = std::stod(m[1].str());
      w.yMin = std::stod(m[2].str());
      w.xMax = std::stod(m[3].str());
      w.yMax = std::stod(m[4].str());
      w.text = decodeEntities(m[5].str());
      words.push_back(std::move(w));
      pos += m.length();
    } else {
      pos += 1;
    }
    pos = bboxXml.find('<', pos);
  }

  return words;
}

std::vector<PageTable> buildPageTables(std::vector<WordBox> words) {
  std::map<int, std::vector<WordBox>> byPage;
  for (auto& w : words) byPage[w.pageNumber].push_back(std::move(w));

  std::vector<PageTable> tables;
  for (auto& entry : byPage) {
    std::vector<TextLine> lines = groupIntoLines(std::move(entry.second));
    if (lines.size() < 2) continue;
    std::vector<double> anchors = columnAnchors(lines);
    if (anchors.size() < 2) continue;

    PageTable table{entry.first, {}};
    table.rows.reserve(lines.size());
    for (const auto& line : lines) table.rows.push_back(lineToRow(line, anchors));
    spdlog::debug("Page {}: recovered {}x{} grid from word layout", table.pageNumber, table.rows.size(),
                  anchors.size());
    tables.push_back(std::move(table));
  }
  return tables;
}

void writePageTablesAsCsv(const std::vector<PageTable>& tables, const std::string& outDir) {
  std::filesystem::create_directories(outDir);
  std::map<int, int> tablesOnPage;
  for (const auto& t : tables) {
    const std::string name = "table_" + std::to_string(t.pageNumber) + "_" +
                             std::to_string(tablesOnPage[t.pageNumber]++) + ".csv";
    const std::filesystem::path file = std::filesystem::path(outDir) / name;
    std::ofstream ofs(file);
    if (!ofs) throw std::runtime_error("Cannot write " + file.string());
    for (const auto& row : t.rows) writeCsvRow(ofs, row);
  }
}
