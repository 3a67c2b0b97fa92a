#pragma once

/**
 * @file parts.hpp
 * @brief Bespoke part trees named by token in a part map
 */

#include "directive.hpp"
#include "phylo_tree.hpp"

#include <absl/container/flat_hash_map.h>

#include <optional>
#include <string>
#include <string_view>
#include <vector>

// Bespoke sub-skeletons referenced from other trees by a bare token
// ("AMORPHEA@"). The map file lists one part per line:
//
//   token <TAB> file [<TAB> edge_length [<TAB> taxon]]
//
// '#' starts a comment; an empty field means "absent".
namespace parts {

struct MapRow {
  std::string token;
  std::string file;
  std::optional<double> edgeLength;  // overrides the edge into the attached part
  std::optional<std::string> taxon;  // overrides the attached part's label
  size_t line = 0;
};

// Throws std::runtime_error with the line number on malformed rows
std::vector<MapRow> parseMap(std::string_view text);

struct Part {
  std::string token;
  std::string file;
  std::optional<double> edgeLength;
  std::optional<std::string> taxon;
  phylo::PhyloTree tree;
};

class PartLibrary {
public:
  PartLibrary() = default;

  // Read the map and parse every part it names. Relative part paths are
  // resolved against partsDir.
  static PartLibrary load(const std::string &mapFile, const std::string &partsDir,
                          const directive::IdScheme &scheme);

  // Register a parsed part. Throws on a duplicate token or a part whose
  // root is itself a graft point.
  void add(Part part);

  const Part *find(const std::string &token) const;
  size_t size() const { return parts_.size(); }
  bool empty() const { return parts_.empty(); }

private:
  absl::flat_hash_map<std::string, Part> parts_;
};

} // namespace parts
