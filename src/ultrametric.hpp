#pragma once

/**
 * @file ultrametric.hpp
 * @brief Ultrametricity check and repair
 */

#include "phylo_tree.hpp"

#include <cstddef>
#include <string>
#include <utility>
#include <vector>

// Equal root-to-leaf path length checks and repairs. Subtrees below an
// unresolved graft point are skipped throughout: their depth is not known
// until they are supplied. Absent branch lengths count as zero.
namespace ultrametric {

struct Violation {
  std::string leafA;
  std::string leafB;
  double depthA;
  double depthB;
};

struct UltrametricReport {
  size_t leaves = 0;
  double minDepth = 0.0;
  double maxDepth = 0.0;
  size_t violatingPairs = 0;          // all pairs differing by more than epsilon
  std::vector<Violation> violations;  // the first few of them
  // Distinct leaf depths (rounded to 12 decimals) and how often each occurs
  std::vector<std::pair<double, size_t>> depthCounts;

  bool ultrametric() const { return violatingPairs == 0; }
};

UltrametricReport check(const phylo::PhyloTree &tree, double epsilon, size_t maxReported = 20);

struct UnfixableNode {
  std::string name;
  std::string reason;
};

struct FixReport {
  size_t adjusted = 0;
  std::vector<UnfixableNode> unfixable;
};

// Bottom-up repair: below every internal node, lengthen each child's edge so
// all children reach the deepest child's depth. Only lengthens, so no branch
// ever turns negative. Graft points are reported as unfixable.
FixReport fix(phylo::PhyloTree &tree);

// Adjust each leaf's own edge so its root distance equals expectedAge.
// Adjustments larger than maxAdjustment, or that would make an edge
// negative, leave the leaf untouched and are reported.
FixReport fixToAge(phylo::PhyloTree &tree, double expectedAge, double maxAdjustment);

} // namespace ultrametric
