#include "minimal_tree.hpp"
#include "logging.hpp"

#include <absl/container/flat_hash_map.h>

namespace minimal_tree {

MinimalResult extractMinimal(const phylo::PhyloTree &tree, const std::vector<std::string> &targets,
                             const directive::IdScheme &scheme) {
  MinimalResult result;
  if (tree.empty()) {
    result.missing = targets;
    return result;
  }

  const auto order = tree.preorder();

  absl::flat_hash_map<std::string, uint32_t> byId;
  absl::flat_hash_map<std::string, uint32_t> byLabel;
  for (auto n : order) {
    const auto &node = tree.node(n);
    if (node.id) byId.try_emplace(*node.id, n);
    if (!node.label.empty()) byLabel.try_emplace(node.label, n);
  }

  std::vector<char> isTarget(tree.size(), 0);
  size_t found = 0;
  auto resolve = [&](const std::string &t) -> std::optional<uint32_t> {
    if (auto it = byId.find(t); it != byId.end()) return it->second;
    if (auto it = byId.find(directive::normalizeId(t, scheme)); it != byId.end()) return it->second;
    if (auto it = byLabel.find(t); it != byLabel.end()) return it->second;
    return std::nullopt;
  };

  for (const auto &t : targets) {
    auto n = resolve(t);
    if (!n) {
      result.missing.push_back(t);
      continue;
    }
    if (!isTarget[*n]) {
      isTarget[*n] = 1;
      ++found;
    }
  }

  if (!result.missing.empty()) {
    std::string joined;
    for (const auto &m : result.missing) {
      if (!joined.empty()) joined += ", ";
      joined += m;
    }
    logging::warn("Could not find the following taxa: {}", joined);
  }
  if (found == 0) {
    return result;
  }

  // Whether a subtree holds any target, filled bottom-up
  std::vector<char> hasTarget(tree.size(), 0);
  for (auto it = order.rbegin(); it != order.rend(); ++it) {
    uint32_t n = *it;
    if (isTarget[n]) {
      hasTarget[n] = 1;
    }
    if (hasTarget[n] && tree.parent(n) != phylo::PhyloTree::NO_PARENT) {
      hasTarget[tree.parent(n)] = 1;
    }
  }

  auto branching = [&](uint32_t n) {
    size_t count = 0;
    for (auto c : tree.children(n)) {
      if (hasTarget[c]) ++count;
    }
    return count;
  };
  auto kept = [&](uint32_t n) { return isTarget[n] || branching(n) > 1; };
  auto onlyChild = [&](uint32_t n) {
    for (auto c : tree.children(n)) {
      if (hasTarget[c]) return c;
    }
    return phylo::PhyloTree::NO_NODE;
  };

  uint32_t top = tree.root();
  while (!kept(top)) {
    top = onlyChild(top);
  }

  phylo::PhyloTree &out = result.tree.emplace();
  auto copyOf = [&tree](uint32_t n, std::optional<double> length) {
    phylo::TreeNode copy;
    copy.label = tree.node(n).label;
    copy.id = tree.node(n).id;
    copy.branchLength = length;
    return copy;
  };

  // (source node, copy)
  std::vector<std::pair<uint32_t, uint32_t>> stack;
  uint32_t outRoot = out.addNode(copyOf(top, tree.node(top).branchLength));
  out.setRoot(outRoot);
  stack.push_back({top, outRoot});

  while (!stack.empty()) {
    auto [src, dst] = stack.back();
    stack.pop_back();

    const auto &kids = tree.children(src);
    std::vector<std::pair<uint32_t, uint32_t>> next;
    for (auto c : kids) {
      if (!hasTarget[c]) continue;

      std::optional<double> carried;
      while (!kept(c)) {
        carried = phylo::sumLengths(carried, tree.node(c).branchLength);
        c = onlyChild(c);
      }
      uint32_t copied = out.addNode(copyOf(c, phylo::sumLengths(carried, tree.node(c).branchLength)));
      out.attach(dst, copied);
      next.push_back({c, copied});
    }
    for (auto it = next.rbegin(); it != next.rend(); ++it) {
      stack.push_back(*it);
    }
  }

  logging::debug("Minimal tree for {} targets has {} nodes", found, out.size());
  return result;
}

} // namespace minimal_tree
