#include "pdf_layout.hpp"

#include "logging.hpp"

#include <algorithm>
#include <cmath>
#include <cstdio>
#include <cstdlib>
#include <map>
#include <regex>
#include <stdexcept>

namespace invoicemap {

namespace {

struct WordBox {
  int pageNumber;
  double xMin;
  double yMin;
  double xMax;
  double yMax;
  std::string text;
};

bool commandExists(const std::string& command) {
  std::string test = "command -v " + command + " >/dev/null 2>&1";
  return std::system(test.c_str()) == 0;
}

std::string runCaptureStdout(const std::string& cmd) {
  FILE* pipe = popen(cmd.c_str(), "r");
  if (!pipe) throw std::runtime_error("Failed to open pipe to pdftotext");

  std::string output;
  char buffer[8192];
  while (true) {
    size_t n = std::fread(buffer, 1, sizeof(buffer), pipe);
    if (n > 0) output.append(buffer, n);
    if (n < sizeof(buffer)) break;
  }

  int rc = pclose(pipe);
  if (rc != 0) throw std::runtime_error("pdftotext returned non-zero exit code");
  return output;
}

void requirePdftotext() {
  if (!commandExists("pdftotext")) {
    throw std::runtime_error(
      "pdftotext not found. Please install poppler-utils (e.g., apt-get install -y poppler-utils)."
    );
  }
}

std::string decodeEntities(const std::string& in) {
  std::string out;
  out.reserve(in.size());
  for (size_t i = 0; i < in.size(); ++i) {
    if (in[i] == '&') {
      size_t j = in.find(';', i + 1);
      if (j != std::string::npos) {
        std::string ent = in.substr(i + 1, j - (i + 1));
        std::string rep;
        if (ent == "amp") rep = "&";
        else if (ent == "lt") rep = "<";
        else if (ent == "gt") rep = ">";
        else if (ent == "quot") rep = "\"";
        else if (ent == "apos") rep = "'";
        else if (ent.size() > 1 && ent[0] == '#') {
          bool hex = ent[1] == 'x' || ent[1] == 'X';
          const std::string digits = ent.substr(hex ? 2 : 1);
          char* end = nullptr;
          unsigned long code = std::strtoul(digits.c_str(), &end, hex ? 16 : 10);
          if (!digits.empty() && end && *end == '\0' && code > 0 && code <= 0x7F) {
            rep.push_back(static_cast<char>(code));
          }
        }
        if (!rep.empty()) {
          out += rep;
          i = j;
          continue;
        }
      }
    }
    out.push_back(in[i]);
  }
  return out;
}

std::vector<WordBox> parseWords(const std::string& xmlish) {
  std::vector<WordBox> words;
  // A single alternation keeps page tracking and word order in one forward scan.
  std::regex token(
    "<page\\s[^>]*?number=\"([0-9]+)\"[^>]*>|"
    "<word[^>]*?xMin=\"([0-9.]+)\"[^>]*?yMin=\"([0-9.]+)\"[^>]*?xMax=\"([0-9.]+)\"[^>]*?yMax=\"([0-9.]+)\"[^>]*>([^<]*)</word>|"
    "<page(?:\\s[^>]*)?>");

  int currentPage = 0;
  auto begin = std::sregex_iterator(xmlish.begin(), xmlish.end(), token);
  auto end = std::sregex_iterator();
  for (auto it = begin; it != end; ++it) {
    const std::smatch& m = *it;
    if (m[1].matched) {
      currentPage = std::stoi(m[1].str());
      continue;
    }
    if (m[2].matched) {
      WordBox w;
      w.pageNumber = currentPage > 0 ? currentPage : 1;
      w.xMin = std::stod(m[2].str());
      w.yMin = std::stod(m[3].str());
      w.xMax = std::stod(m[4].str());
      w.yMax = std::stod(m[5].str());
      w.text = decodeEntities(m[6].str());
      words.push_back(std::move(w));
      continue;
    }
    // <page> without a number attribute: count pages ourselves
    currentPage++;
  }
  return words;
}

double median(std::vector<double> v) {
  if (v.empty()) return 0.0;
  std::nth_element(v.begin(), v.begin() + v.size() / 2, v.end());
  return v[v.size() / 2];
}

struct RowGroup {
  double yCenter;
  std::vector<const WordBox*> words;
};

std::vector<RowGroup> clusterRows(std::vector<WordBox>& wordsOnPage) {
  std::vector<RowGroup> rows;
  if (wordsOnPage.empty()) return rows;

  std::vector<double> heights;
  heights.reserve(wordsOnPage.size());
  for (const auto& w : wordsOnPage) heights.push_back(w.yMax - w.yMin);
  double hMed = median(heights);
  double tol = hMed > 0 ? hMed * 0.5 : 3.0;

  std::sort(wordsOnPage.begin(), wordsOnPage.end(), [](const WordBox& a, const WordBox& b) {
    double ya = (a.yMin + a.yMax) * 0.5;
    double yb = (b.yMin + b.yMax) * 0.5;
    if (ya == yb) return a.xMin < b.xMin;
    return ya < yb;
  });

  for (const auto& w : wordsOnPage) {
    double yc = (w.yMin + w.yMax) * 0.5;
    if (rows.empty() || std::abs(yc - rows.back().yCenter) > tol) {
      rows.push_back(RowGroup{yc, {}});
    }
    auto& row = rows.back();
    row.words.push_back(&w);
    row.yCenter = (row.yCenter * (row.words.size() - 1) + yc) / row.words.size();
  }

  for (auto& r : rows) {
    std::sort(r.words.begin(), r.words.end(),
              [](const WordBox* a, const WordBox* b) { return a->xMin < b->xMin; });
  }
  return rows;
}

OcrLine toLine(const RowGroup& row) {
  OcrLine line;
  BoundingBox box{row.words.front()->xMin, row.words.front()->yMin,
                  row.words.front()->xMax, row.words.front()->yMax};
  for (const auto* w : row.words) {
    if (!line.content.empty()) line.content += ' ';
    line.content += w->text;
    box.xMin = std::min(box.xMin, w->xMin);
    box.yMin = std::min(box.yMin, w->yMin);
    box.xMax = std::max(box.xMax, w->xMax);
    box.yMax = std::max(box.yMax, w->yMax);
  }
  line.boundingBox = box;
  return line;
}

} // namespace

std::string extractPdfText(const std::string& pdfPath) {
  requirePdftotext();
  return runCaptureStdout("pdftotext -layout -q \"" + pdfPath + "\" -");
}

std::vector<OcrPage> parseBboxLayout(const std::string& xmlish) {
  std::map<int, std::vector<WordBox>> pageWords;
  for (auto& w : parseWords(xmlish)) pageWords[w.pageNumber].push_back(std::move(w));

  std::vector<OcrPage> pages;
  for (auto& kv : pageWords) {
    OcrPage page;
    page.pageNumber = kv.first;
    for (const auto& row : clusterRows(kv.second)) page.lines.push_back(toLine(row));
    pages.push_back(std::move(page));
  }
  return pages;
}

OcrPayload ocrPayloadFromPdf(const std::string& pdfPath) {
  OcrPayload payload;
  payload.text = extractPdfText(pdfPath);
  payload.pages = parseBboxLayout(runCaptureStdout("pdftotext -bbox-layout -q \"" + pdfPath + "\" -"));
  logger()->debug("pdf layout: {} page(s) from {}", payload.pages.size(), pdfPath);
  return payload;
}

} // namespace invoicemap
