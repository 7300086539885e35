#include "ocr_payload.hpp"

#include <algorithm>
#include <cctype>
#include <cmath>
#include <fstream>
#include <sstream>

#include <yaml-cpp/yaml.h>

namespace invoicemap {

namespace {

std::string lower(std::string s) {
  std::transform(s.begin(), s.end(), s.begin(),
                 [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
  return s;
}

BoundingBox parseBox(const YAML::Node& node) {
  // Either {xMin, yMin, xMax, yMax} or a polygon [x1, y1, x2, y2, ...].
  if (node.IsMap()) {
    return BoundingBox{node["xMin"].as<double>(), node["yMin"].as<double>(),
                       node["xMax"].as<double>(), node["yMax"].as<double>()};
  }
  if (node.IsSequence() && node.size() >= 4 && node.size() % 2 == 0) {
    BoundingBox box{node[0].as<double>(), node[1].as<double>(),
                    node[0].as<double>(), node[1].as<double>()};
    for (size_t i = 0; i < node.size(); i += 2) {
      double x = node[i].as<double>();
      double y = node[i + 1].as<double>();
      box.xMin = std::min(box.xMin, x);
      box.xMax = std::max(box.xMax, x);
      box.yMin = std::min(box.yMin, y);
      box.yMax = std::max(box.yMax, y);
    }
    return box;
  }
  throw PayloadError("boundingBox must be a map or an even-length polygon");
}

OcrPage parsePage(const YAML::Node& node, int index) {
  OcrPage page;
  page.pageNumber = node["pageNumber"] ? node["pageNumber"].as<int>() : index + 1;
  const YAML::Node lines = node["lines"];
  if (!lines) return page;
  if (!lines.IsSequence()) {
    throw PayloadError("page " + std::to_string(page.pageNumber) + ": lines must be a sequence");
  }
  for (const auto& lineNode : lines) {
    if (!lineNode["content"]) {
      throw PayloadError("page " + std::to_string(page.pageNumber) + ": line without content");
    }
    OcrLine line;
    line.content = lineNode["content"].as<std::string>();
    const YAML::Node box = lineNode["boundingBox"] ? lineNode["boundingBox"] : lineNode["polygon"];
    if (box) line.boundingBox = parseBox(box);
    page.lines.push_back(std::move(line));
  }
  return page;
}

double parseConfidence(const YAML::Node& node, const std::string& what) {
  double value = node.as<double>();
  if (std::isnan(value) || value < 0.0 || value > 1.0) {
    throw PayloadError(what + " confidence out of range 0..1");
  }
  return value;
}

OcrPayload fromNode(const YAML::Node& root) {
  if (!root.IsMap()) throw PayloadError("payload must be a map");
  if (!root["text"]) throw PayloadError("payload has no text");

  OcrPayload payload;
  payload.text = root["text"].as<std::string>();

  if (const YAML::Node pages = root["pages"]) {
    if (!pages.IsSequence()) throw PayloadError("pages must be a sequence");
    int index = 0;
    for (const auto& pageNode : pages) {
      payload.pages.push_back(parsePage(pageNode, index++));
    }
  }

  if (const YAML::Node fields = root["fields"]) {
    if (!fields.IsMap()) throw PayloadError("fields must be a map");
    for (const auto& kv : fields) {
      const std::string name = kv.first.as<std::string>();
      const YAML::Node field = kv.second;
      PretrainedField pf{"", 1.0};
      if (field.IsMap()) {
        if (field["value"]) pf.value = field["value"].as<std::string>();
        else if (field["content"]) pf.value = field["content"].as<std::string>();
        if (field["confidence"]) pf.confidence = parseConfidence(field["confidence"], "field " + name);
      } else if (field.IsScalar()) {
        pf.value = field.as<std::string>();
      }
      payload.pretrainedFields[name] = pf;
    }
  }

  if (root["confidence"]) payload.confidence = parseConfidence(root["confidence"], "document");
  return payload;
}

} // namespace

OcrPayload parseOcrPayload(const std::string& document) {
  try {
    return fromNode(YAML::Load(document));
  } catch (const YAML::Exception& ex) {
    throw PayloadError(std::string("malformed payload: ") + ex.what());
  }
}

OcrPayload loadOcrPayload(const std::string& path) {
  std::ifstream in(path);
  if (!in) throw PayloadError("cannot open payload: " + path);
  std::stringstream buffer;
  buffer << in.rdbuf();
  return parseOcrPayload(buffer.str());
}

const PretrainedField* findPretrainedField(const OcrPayload& payload, const std::string& name) {
  auto it = payload.pretrainedFields.find(name);
  if (it != payload.pretrainedFields.end()) return &it->second;
  const std::string wanted = lower(name);
  for (const auto& kv : payload.pretrainedFields) {
    if (lower(kv.first) == wanted) return &kv.second;
  }
  return nullptr;
}

} // namespace invoicemap
