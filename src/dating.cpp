#include "dating.hpp"
#include "logging.hpp"

#include <absl/container/flat_hash_set.h>
#include <boost/property_tree/json_parser.hpp>
#include <boost/property_tree/ptree.hpp>

#include <algorithm>
#include <cmath>
#include <sstream>
#include <utility>

namespace pt = boost::property_tree;

namespace dating {

// ============================================================================
// Supplied ages
// ============================================================================

NodeAges parseNodeAges(std::string_view json) {
  pt::ptree root;
  std::istringstream in{std::string(json)};
  try {
    pt::read_json(in, root);
  } catch (const pt::json_parser_error &e) {
    throw DatingError(std::string("node ages: ") + e.what());
  }

  auto section = root.get_child_optional("node_ages");
  if (!section) {
    throw DatingError("node ages: no \"node_ages\" object");
  }

  NodeAges ages;
  for (const auto &[key, list] : *section) {
    auto &bucket = ages[key];
    for (const auto &entry : list) {
      auto age = entry.second.get_optional<double>("age");
      if (!age) {
        throw DatingError("node ages: entry for '" + key + "' has no numeric age");
      }
      bucket.push_back(*age);
    }
  }
  return ages;
}

std::optional<double> medianAge(std::vector<double> ages) {
  if (ages.empty()) return std::nullopt;
  std::sort(ages.begin(), ages.end());
  size_t mid = (ages.size() - 1) / 2;
  if (ages.size() % 2 == 0) {
    return (ages[mid] + ages[mid + 1]) / 2;
  }
  return ages[mid];
}

NodeDates applyNodeAges(const phylo::PhyloTree &tree, const NodeAges &ages, const directive::IdScheme &scheme,
                        AgeReport *report) {
  NodeDates dates(tree.size());
  if (tree.empty()) return dates;

  for (uint32_t n : tree.preorder()) {
    // Placeholders are dated by whatever replaces them
    if (tree.isGraftPoint(n)) continue;

    const auto &node = tree.node(n);
    const std::string key = node.id ? scheme.prefix + *node.id : node.label;

    std::optional<double> date;
    if (auto it = ages.find(key); !key.empty() && it != ages.end()) {
      date = medianAge(it->second);
    }

    if (tree.isLeaf(n)) {
      if (date && report) ++report->dated;
      dates[n] = date.value_or(0.0);
      continue;
    }
    if (date && *date < MIN_INTERIOR_AGE) {
      logging::warn("Interior node {} has median age {}, leaving it undated", tree.displayName(n), *date);
      if (report) report->ignored.push_back(tree.displayName(n));
      continue;
    }
    dates[n] = date;
    if (date && report) ++report->dated;
  }
  return dates;
}

// ============================================================================
// Dates from branch lengths
// ============================================================================

void agesFromLengths(const phylo::PhyloTree &tree, uint32_t from, NodeDates &dates) {
  if (dates.size() < tree.size()) dates.resize(tree.size());

  for (uint32_t n : tree.postorder(from)) {
    if (tree.isLeaf(n)) {
      if (tree.isGraftPoint(n)) {
        dates[n].reset();
      } else {
        dates[n] = 0.0;
      }
      continue;
    }

    std::optional<double> date = 0.0;
    for (uint32_t c : tree.children(n)) {
      const auto &length = tree.node(c).branchLength;
      if (!dates[c] || !length) {
        date.reset();
        break;
      }
      date = std::max(*date, *dates[c] + *length);
    }
    dates[n] = date;
  }
}

NodeDates agesFromLengths(const phylo::PhyloTree &tree) {
  NodeDates dates(tree.size());
  if (!tree.empty()) agesFromLengths(tree, tree.root(), dates);
  return dates;
}

// ============================================================================
// Imputation
// ============================================================================

namespace {

// Oldest date below a node and the number of edges down to it
struct OldestBelow {
  double date = 0.0;
  int64_t steps = 0;
};

constexpr int64_t FAR = 100000000;

// Date at the first of steps + 1 points spaced along exp(spacing * x) from
// above down to the oldest date below
double interpolate(double above, const OldestBelow &below, double spacing) {
  const int64_t points = below.steps + 1;
  double total = 0.0;
  for (int64_t i = 0; i < points; ++i) {
    double x = points > 1 ? static_cast<double>(i) / static_cast<double>(points - 1) : 0.0;
    total += std::exp(spacing * x);
  }
  const double first = 1.0 / total;
  return above - (above - below.date) * first;
}

} // namespace

size_t imputeMissingDates(const phylo::PhyloTree &tree, NodeDates &dates, const ImputeOptions &options) {
  if (tree.empty()) return 0;
  if (dates.size() < tree.size()) dates.resize(tree.size());
  if (!dates[tree.root()]) {
    throw DatingError("cannot impute dates: root " + tree.displayName(tree.root()) + " is undated");
  }

  size_t filled = 0;
  for (uint32_t leaf : tree.leaves()) {
    if (!dates[leaf]) {
      dates[leaf] = 0.0;
      ++filled;
    }
  }

  // Longest and shortest path to the oldest date below each node. Ties on
  // the date are broken by path length in opposite directions.
  std::vector<OldestBelow> longest(tree.size());
  std::vector<OldestBelow> shortest(tree.size());
  for (uint32_t n : tree.postorder()) {
    OldestBelow lg{0.0, -FAR};
    OldestBelow sh{0.0, FAR};
    for (uint32_t c : tree.children(n)) {
      OldestBelow cl{longest[c].date, longest[c].steps + 1};
      if (cl.date > lg.date || (cl.date == lg.date && cl.steps > lg.steps)) lg = cl;
      OldestBelow cs{shortest[c].date, shortest[c].steps + 1};
      if (cs.date > sh.date || (cs.date == sh.date && cs.steps < sh.steps)) sh = cs;
    }
    if (dates[n]) {
      lg = sh = OldestBelow{*dates[n], 0};
    }
    longest[n] = lg;
    shortest[n] = sh;
  }

  const double w = options.longPathWeight;
  for (uint32_t n : tree.preorder()) {
    if (dates[n]) continue;
    const double above = *dates[tree.parent(n)];
    const double viaLongest = interpolate(above, longest[n], options.spacing);
    const double viaShortest = interpolate(above, shortest[n], options.spacing);
    dates[n] = w * viaLongest + (1 - w) * viaShortest;
    ++filled;
  }
  return filled;
}

void lengthsFromDates(phylo::PhyloTree &tree, const NodeDates &dates) {
  if (tree.empty()) return;

  std::vector<std::pair<uint32_t, double>> lengths;
  lengths.reserve(tree.size());
  for (uint32_t n : tree.preorder()) {
    if (n >= dates.size() || !dates[n]) {
      throw DatingError("node " + tree.displayName(n) + " is undated");
    }
    if (n == tree.root()) continue;

    double length = *dates[tree.parent(n)] - *dates[n];
    if (length < 0) {
      throw DatingError(fmt::format("negative branch length {} above {} (dated {}, parent {} dated {})", length,
                                    tree.displayName(n), *dates[n], tree.displayName(tree.parent(n)),
                                    *dates[tree.parent(n)]));
    }
    lengths.emplace_back(n, length);
  }

  for (const auto &[n, length] : lengths) {
    tree.node(n).branchLength = length;
  }
}

// ============================================================================
// Whole-tree dating
// ============================================================================

DatingReport dateTree(phylo::PhyloTree &tree, const NodeAges &ages, const std::vector<uint32_t> &lengthRoots,
                      const directive::IdScheme &scheme, const ImputeOptions &options) {
  TIME_OPERATION("Dating");
  DatingReport report;
  if (tree.empty()) return report;

  AgeReport supplied;
  NodeDates dates = applyNodeAges(tree, ages, scheme, &supplied);
  report.fromAges = supplied.dated;
  report.ignored = std::move(supplied.ignored);

  // A part nested in another part is dated along with the outer one
  const absl::flat_hash_set<uint32_t> roots(lengthRoots.begin(), lengthRoots.end());
  for (uint32_t top : lengthRoots) {
    bool nested = false;
    for (uint32_t p = tree.parent(top); p != phylo::PhyloTree::NO_PARENT; p = tree.parent(p)) {
      if (roots.contains(p)) {
        nested = true;
        break;
      }
    }
    if (nested) continue;

    agesFromLengths(tree, top, dates);
    for (uint32_t n : tree.preorder(top)) {
      if (!tree.isLeaf(n) && dates[n]) ++report.fromLengths;
    }
  }

  if (!dates[tree.root()]) {
    report.rootUndated = true;
    logging::warn("Root {} has no age; branch lengths left as they are", tree.displayName(tree.root()));
    return report;
  }

  report.imputed = imputeMissingDates(tree, dates, options);
  lengthsFromDates(tree, dates);

  logging::info("Dated {} nodes from ages and {} from part lengths; imputed {}", report.fromAges,
                report.fromLengths, report.imputed);
  return report;
}

} // namespace dating
