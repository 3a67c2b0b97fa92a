#pragma once

/**
 * @file dating.hpp
 * @brief Node dates: supplied ages, dates from branch lengths, imputation
 *
 * A date is the age of a node before the present, with leaves at zero.
 * Undated nodes are interpolated between the nearest dated nodes above and
 * below, then branch lengths are rebuilt from the dates.
 */

#include "directive.hpp"
#include "phylo_tree.hpp"

#include <absl/container/flat_hash_map.h>

#include <cstddef>
#include <cstdint>
#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>
#include <vector>

namespace dating {

// Per-node date, indexed like the tree's arena. Absent means undated.
using NodeDates = std::vector<std::optional<double>>;

// Supplied ages keyed by prefixed identifier ("ott123") or by full label
using NodeAges = absl::flat_hash_map<std::string, std::vector<double>>;

class DatingError : public std::runtime_error {
public:
  explicit DatingError(const std::string &what) : std::runtime_error(what) {}
};

// Interior ages below this are treated as missing
constexpr double MIN_INTERIOR_AGE = 1e-6;

// Reads {"node_ages": {"ott123": [{"age": 4.5}, ...], ...}}. Ages may be
// numbers or numeric strings. Throws DatingError on malformed input.
NodeAges parseNodeAges(std::string_view json);

// Median of the given ages, absent for an empty list
std::optional<double> medianAge(std::vector<double> ages);

struct AgeReport {
  size_t dated = 0;
  // Interior nodes whose supplied median was (near) zero
  std::vector<std::string> ignored;
};

// Date every node from the supplied ages. A node is looked up by its
// prefixed identifier when it has one, otherwise by its label. Unmatched
// leaves are dated zero unless they are graft points.
NodeDates applyNodeAges(const phylo::PhyloTree &tree, const NodeAges &ages, const directive::IdScheme &scheme = {},
                        AgeReport *report = nullptr);

// Date the subtree under from by its branch lengths: leaves are zero, a
// parent is the oldest child date plus that child's edge. A missing length
// or an undated child leaves the parent undated; leaf graft points are undated.
void agesFromLengths(const phylo::PhyloTree &tree, uint32_t from, NodeDates &dates);
NodeDates agesFromLengths(const phylo::PhyloTree &tree);

struct ImputeOptions {
  // Weight of the longest-path solution against the shortest-path one
  double longPathWeight = 0.25;
  // Spacing along a path: 0 even, > 0 biased older, < 0 biased younger
  double spacing = 0.0;
};

// Fill every undated node by interpolating between its parent's date and the
// oldest date found below it. Undated leaves are taken as present day.
// Throws DatingError when the root is undated. Returns the number of dates filled.
size_t imputeMissingDates(const phylo::PhyloTree &tree, NodeDates &dates, const ImputeOptions &options = {});

// Set every non-root branch length to the parent's date minus the node's.
// Throws DatingError on an undated node or a negative length.
void lengthsFromDates(phylo::PhyloTree &tree, const NodeDates &dates);

struct DatingReport {
  size_t fromAges = 0;     // dated from supplied ages
  size_t fromLengths = 0;  // interior nodes dated from part branch lengths
  size_t imputed = 0;
  std::vector<std::string> ignored;
  bool rootUndated = false;
};

// Supplied ages for the whole tree, branch-length dates inside each subtree
// listed in lengthRoots (bespoke parts), imputation of the rest, then branch
// lengths rebuilt from the dates. With an undated root nothing is changed.
DatingReport dateTree(phylo::PhyloTree &tree, const NodeAges &ages, const std::vector<uint32_t> &lengthRoots,
                      const directive::IdScheme &scheme = {}, const ImputeOptions &options = {});

} // namespace dating
