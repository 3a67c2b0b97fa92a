#pragma once

/**
 * @file minimal_tree.hpp
 * @brief Smallest subtree connecting a set of taxa
 */

#include "directive.hpp"
#include "phylo_tree.hpp"

#include <optional>
#include <string>
#include <vector>

namespace minimal_tree {

struct MinimalResult {
  std::optional<phylo::PhyloTree> tree;  // empty when no target was found
  std::vector<std::string> missing;
};

// Smallest tree spanning the targets, rooted at their MRCA. Targets are
// matched by identifier or label (first match in pre-order). A target that
// has other targets below it stays as an internal node; every other node
// with a single surviving child is spliced out and its edge length added to
// that child's. The root keeps its own edge length.
MinimalResult extractMinimal(const phylo::PhyloTree &tree, const std::vector<std::string> &targets,
                             const directive::IdScheme &scheme = {});

} // namespace minimal_tree
