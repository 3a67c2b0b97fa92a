#include "ultrametric.hpp"
#include "logging.hpp"

#include <algorithm>
#include <cmath>
#include <map>

namespace ultrametric {

namespace {

struct Walk {
  std::vector<uint32_t> order;                      // pre-order, graft subtrees left out
  std::vector<std::pair<uint32_t, double>> leaves;  // leaf and its root distance
  std::vector<uint32_t> graftPoints;
};

Walk walk(const phylo::PhyloTree &tree) {
  Walk w;
  if (tree.empty()) return w;

  std::vector<std::pair<uint32_t, double>> stack;
  stack.push_back({tree.root(), 0.0});
  while (!stack.empty()) {
    auto [n, dist] = stack.back();
    stack.pop_back();

    if (tree.isGraftPoint(n)) {
      w.graftPoints.push_back(n);
      continue;
    }
    w.order.push_back(n);

    const auto &kids = tree.children(n);
    if (kids.empty()) {
      w.leaves.push_back({n, dist});
      continue;
    }
    for (auto it = kids.rbegin(); it != kids.rend(); ++it) {
      stack.push_back({*it, dist + tree.edgeLength(*it)});
    }
  }
  return w;
}

} // namespace

UltrametricReport check(const phylo::PhyloTree &tree, double epsilon, size_t maxReported) {
  UltrametricReport report;
  Walk w = walk(tree);
  auto &leaves = w.leaves;
  report.leaves = leaves.size();
  if (leaves.empty()) {
    return report;
  }

  std::stable_sort(leaves.begin(), leaves.end(),
                   [](const auto &a, const auto &b) { return a.second < b.second; });
  report.minDepth = leaves.front().second;
  report.maxDepth = leaves.back().second;

  std::map<double, size_t> counts;
  for (const auto &[n, depth] : leaves) {
    counts[std::round(depth * 1e12) / 1e12]++;
  }
  report.depthCounts.assign(counts.begin(), counts.end());

  // Pairs (i, j) with depth[j] - depth[i] > epsilon, counted per i from the
  // first leaf deeper than depth[i] + epsilon
  const size_t n = leaves.size();
  auto deeperThan = [&](size_t i) {
    double limit = leaves[i].second + epsilon;
    return static_cast<size_t>(
        std::upper_bound(leaves.begin() + i + 1, leaves.end(), limit,
                         [](double value, const auto &leaf) { return value < leaf.second; }) -
        leaves.begin());
  };

  for (size_t i = 0; i < n; ++i) {
    size_t j = deeperThan(i);
    if (j == n) break;
    report.violatingPairs += n - j;

    for (size_t k = n; k > j && report.violations.size() < maxReported; --k) {
      report.violations.push_back({tree.displayName(leaves[i].first), tree.displayName(leaves[k - 1].first),
                                   leaves[i].second, leaves[k - 1].second});
    }
  }

  if (report.violatingPairs > 0) {
    logging::warn("Not ultrametric: {} leaf pairs differ by more than {} (depths {} to {})", report.violatingPairs,
                  epsilon, report.minDepth, report.maxDepth);
  }
  return report;
}

FixReport fix(phylo::PhyloTree &tree) {
  TIME_OPERATION("Ultrametric repair");

  FixReport report;
  Walk w = walk(tree);
  std::vector<double> height(tree.size(), 0.0);

  // Reverse pre-order visits children before their parent
  for (auto it = w.order.rbegin(); it != w.order.rend(); ++it) {
    const uint32_t n = *it;
    const auto &kids = tree.children(n);

    double deepest = 0.0;
    for (auto c : kids) {
      if (tree.isGraftPoint(c)) continue;
      deepest = std::max(deepest, tree.edgeLength(c) + height[c]);
    }

    for (auto c : kids) {
      if (tree.isGraftPoint(c)) continue;
      double deficit = deepest - (tree.edgeLength(c) + height[c]);
      if (deficit > 0.0) {
        tree.node(c).branchLength = tree.edgeLength(c) + deficit;
        ++report.adjusted;
      }
    }
    height[n] = deepest;
  }

  for (auto g : w.graftPoints) {
    logging::warn("Cannot make {} ultrametric: unresolved graft point", tree.displayName(g));
    report.unfixable.push_back({tree.displayName(g), "unresolved graft point"});
  }

  logging::info("Lengthened {} branches", report.adjusted);
  return report;
}

FixReport fixToAge(phylo::PhyloTree &tree, double expectedAge, double maxAdjustment) {
  FixReport report;
  Walk w = walk(tree);

  for (const auto &[leaf, depth] : w.leaves) {
    if (depth == expectedAge) continue;

    double delta = expectedAge - depth;
    if (std::abs(delta) > maxAdjustment) {
      std::string reason = "age " + std::to_string(depth) + " is " + std::to_string(std::abs(delta)) + " from " +
                           std::to_string(expectedAge);
      logging::warn("Cannot fix {}: {} (max allowed delta is {})", tree.displayName(leaf), reason, maxAdjustment);
      report.unfixable.push_back({tree.displayName(leaf), reason});
      continue;
    }

    double length = tree.edgeLength(leaf) + delta;
    if (length < 0.0) {
      logging::warn("Cannot fix {}: edge would become negative", tree.displayName(leaf));
      report.unfixable.push_back({tree.displayName(leaf), "edge would become negative"});
      continue;
    }
    tree.node(leaf).branchLength = length;
    ++report.adjusted;
  }
  return report;
}

} // namespace ultrametric
