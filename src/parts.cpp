#include "parts.hpp"
#include "logging.hpp"
#include "newick.hpp"
#include "treegraft_utils.hpp"

#include <cmath>
#include <cstdlib>
#include <sstream>
#include <stdexcept>

namespace parts {

static std::string trim(const std::string &s) {
  size_t b = s.find_first_not_of(" \t\r");
  if (b == std::string::npos) return {};
  size_t e = s.find_last_not_of(" \t\r");
  return s.substr(b, e - b + 1);
}

std::vector<MapRow> parseMap(std::string_view text) {
  std::vector<MapRow> rows;
  std::istringstream in{std::string(text)};
  std::string line;
  size_t lineNo = 0;

  while (std::getline(in, line)) {
    ++lineNo;
    if (size_t hash = line.find('#'); hash != std::string::npos) {
      line.erase(hash);
    }
    if (trim(line).empty()) continue;

    std::vector<std::string> fields;
    std::stringstream ss(line);
    std::string field;
    while (std::getline(ss, field, '\t')) {
      fields.push_back(trim(field));
    }

    if (fields.size() < 2 || fields[0].empty() || fields[1].empty()) {
      throw std::runtime_error("Part map line " + std::to_string(lineNo) + ": expected 'token<TAB>file'");
    }
    if (fields.size() > 4) {
      throw std::runtime_error("Part map line " + std::to_string(lineNo) + ": too many fields");
    }

    MapRow row;
    row.token = fields[0];
    row.file = fields[1];
    row.line = lineNo;
    if (fields.size() > 2 && !fields[2].empty()) {
      char *end = nullptr;
      double value = std::strtod(fields[2].c_str(), &end);
      if (end != fields[2].c_str() + fields[2].size() || !std::isfinite(value) || value < 0) {
        throw std::runtime_error("Part map line " + std::to_string(lineNo) + ": '" + fields[2] +
                                 "' is not a valid edge length");
      }
      row.edgeLength = value;
    }
    if (fields.size() > 3 && !fields[3].empty()) {
      row.taxon = fields[3];
    }
    rows.push_back(std::move(row));
  }
  return rows;
}

void PartLibrary::add(Part part) {
  if (part.tree.empty()) {
    throw std::runtime_error("Part " + part.token + " is empty");
  }
  if (part.tree.isGraftPoint(part.tree.root())) {
    throw std::runtime_error("Part " + part.token + ": the root of a part cannot be a graft point");
  }
  std::string token = part.token;
  auto [it, inserted] = parts_.try_emplace(token, std::move(part));
  if (!inserted) {
    throw std::runtime_error("Part token " + token + " is listed more than once");
  }
}

const Part *PartLibrary::find(const std::string &token) const {
  auto it = parts_.find(token);
  return it == parts_.end() ? nullptr : &it->second;
}

PartLibrary PartLibrary::load(const std::string &mapFile, const std::string &partsDir,
                              const directive::IdScheme &scheme) {
  TIME_OPERATION("Loading parts");

  PartLibrary library;
  for (auto &row : parseMap(treegraftUtils::readTextFile(mapFile))) {
    std::string path = treegraftUtils::resolvePath(partsDir, row.file);
    logging::debug("Part {} <- {}", row.token, path);

    Part part;
    try {
      part.tree = newick::parseTree(treegraftUtils::readTextFile(path), scheme);
    } catch (const newick::ParseError &e) {
      throw std::runtime_error("In part file " + path + ": " + e.what());
    }
    part.token = std::move(row.token);
    part.file = std::move(path);
    part.edgeLength = row.edgeLength;
    part.taxon = std::move(row.taxon);
    library.add(std::move(part));
  }

  logging::info("Loaded {} parts from {}", library.size(), mapFile);
  return library;
}

} // namespace parts
