#pragma once

/**
 * @file grafting.hpp
 * @brief Replace graft points in a skeleton with reference subtrees and parts
 */

#include "parts.hpp"
#include "phylo_tree.hpp"
#include "reference_index.hpp"

#include <cstddef>
#include <cstdint>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

namespace grafting {

// Fatal grafting conflict: a subtree attached twice, a cycle of parts, or
// duplicate identifiers in the merged tree
class GraftError : public std::runtime_error {
public:
  explicit GraftError(const std::string &what) : std::runtime_error(what) {}
};

struct UnresolvedGraft {
  std::string label;
  std::optional<std::string> id;
  std::string source;  // identifier or part token that could not be found
};

struct GraftReport {
  size_t resolvedReference = 0;
  size_t resolvedParts = 0;
  std::vector<UnresolvedGraft> unresolved;
  size_t leavesWithoutId = 0;
  // Nodes of the merged tree where a part was attached, outer parts first
  std::vector<uint32_t> partRoots;

  size_t resolved() const { return resolvedReference + resolvedParts; }
  size_t unresolvedCount() const { return unresolved.size(); }
};

struct GraftOptions {
  // Applied to every reference extraction
  bool collapseUnifurcations = false;
};

struct GraftResult {
  phylo::PhyloTree tree;
  GraftReport report;
};

// Build a fresh tree from skeleton with every graft point replaced by its
// reference subtree or part. Missing subtrees are recorded, not thrown.
// partLibrary may be null when no part library is in use.
GraftResult graft(const phylo::PhyloTree &skeleton, const refindex::ReferenceIndex &index,
                  const parts::PartLibrary *partLibrary = nullptr, const GraftOptions &options = {});

// Throws GraftError if an identifier occurs twice; returns the number of
// leaves without an identifier
size_t validateIdentifiers(const phylo::PhyloTree &tree);

} // namespace grafting
