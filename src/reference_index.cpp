#include "reference_index.hpp"
#include "logging.hpp"

#include <absl/container/flat_hash_set.h>

#include <utility>

namespace refindex {

ReferenceIndex::ReferenceIndex(phylo::PhyloTree tree) : tree_(std::move(tree)) {
  TIME_OPERATION("Reference index");

  byId_.reserve(tree_.size());
  for (auto n : tree_.preorder()) {
    const auto &node = tree_.node(n);
    if (node.id) {
      auto [it, inserted] = byId_.try_emplace(*node.id, n);
      if (!inserted) {
        throw DuplicateIdError(*node.id, tree_.displayName(it->second), tree_.displayName(n));
      }
    }
    if (!node.label.empty()) {
      auto [it, inserted] = byLabel_.try_emplace(node.label, n);
      if (!inserted) {
        it->second = phylo::PhyloTree::NO_NODE;
      }
    }
  }

  logging::info("Indexed {} identifiers over {} reference nodes", byId_.size(), tree_.size());
}

std::optional<uint32_t> ReferenceIndex::lookup(const std::string &key) const {
  if (auto it = byId_.find(key); it != byId_.end()) {
    return it->second;
  }
  if (auto it = byLabel_.find(key); it != byLabel_.end() && it->second != phylo::PhyloTree::NO_NODE) {
    return it->second;
  }
  return std::nullopt;
}

std::optional<uint32_t> ReferenceIndex::extractInto(phylo::PhyloTree &dest, const std::string &id,
                                                    const std::vector<std::string> &excluded,
                                                    const ExtractOptions &options) const {
  auto found = lookup(id);
  if (!found) {
    return std::nullopt;
  }
  const uint32_t srcRoot = *found;

  absl::flat_hash_set<std::string> excludedSet(excluded.begin(), excluded.end());
  absl::flat_hash_set<std::string> matched;
  auto isExcluded = [&](uint32_t n) {
    const auto &node = tree_.node(n);
    if (node.id && excludedSet.contains(*node.id)) {
      matched.insert(*node.id);
      return true;
    }
    if (!node.label.empty() && excludedSet.contains(node.label)) {
      matched.insert(node.label);
      return true;
    }
    return false;
  };

  const uint32_t top = dest.addNode(phylo::copyPayload(tree_.node(srcRoot)));

  // Length carried down from spliced-out unifurcations
  struct Item {
    uint32_t src;
    uint32_t dstParent;
    std::optional<double> carried;
  };
  std::vector<Item> stack;
  const auto &rootKids = tree_.children(srcRoot);
  for (auto it = rootKids.rbegin(); it != rootKids.rend(); ++it) {
    stack.push_back({*it, top, std::nullopt});
  }

  while (!stack.empty()) {
    Item item = stack.back();
    stack.pop_back();
    if (isExcluded(item.src)) {
      continue;
    }

    const auto &kids = tree_.children(item.src);
    if (options.collapseUnifurcations && !kids.empty()) {
      uint32_t survivor = phylo::PhyloTree::NO_NODE;
      size_t surviving = 0;
      for (auto k : kids) {
        if (!isExcluded(k)) {
          survivor = k;
          ++surviving;
        }
      }
      if (surviving == 1) {
        stack.push_back({survivor, item.dstParent,
                         phylo::sumLengths(item.carried, tree_.node(item.src).branchLength)});
        continue;
      }
    }

    phylo::TreeNode copy = phylo::copyPayload(tree_.node(item.src));
    copy.branchLength = phylo::sumLengths(item.carried, copy.branchLength);
    uint32_t copied = dest.addNode(std::move(copy));
    dest.attach(item.dstParent, copied);
    for (auto it = kids.rbegin(); it != kids.rend(); ++it) {
      stack.push_back({*it, copied, std::nullopt});
    }
  }

  // Tokens nested inside another excluded clade never get visited; only
  // complain about the ones that really are absent from this clade
  for (const auto &token : excluded) {
    if (matched.contains(token)) continue;
    auto n = lookup(token);
    if (!n || !tree_.isAncestor(srcRoot, *n)) {
      logging::warn("Excluded taxon '{}' not found inside '{}'", token, id);
    }
  }

  uint32_t result = top;
  uint32_t ancestor = tree_.parent(srcRoot);
  for (uint32_t k = 0; k < options.includedAncestors && ancestor != phylo::PhyloTree::NO_PARENT; ++k) {
    phylo::TreeNode wrapper;
    wrapper.label = tree_.node(ancestor).label;
    wrapper.id = tree_.node(ancestor).id;
    uint32_t w = dest.addNode(std::move(wrapper));
    dest.attach(w, result);
    result = w;
    ancestor = tree_.parent(ancestor);
  }

  return result;
}

std::optional<phylo::PhyloTree> ReferenceIndex::extract(const std::string &id, const std::vector<std::string> &excluded,
                                                        const ExtractOptions &options) const {
  phylo::PhyloTree out;
  auto root = extractInto(out, id, excluded, options);
  if (!root) {
    return std::nullopt;
  }
  out.setRoot(*root);
  return out;
}

ExtractManyResult ReferenceIndex::extractMany(const std::vector<std::string> &ids,
                                              const std::vector<std::string> &excluded,
                                              const ExtractOptions &options) const {
  ExtractManyResult result;
  for (const auto &id : ids) {
    if (result.subtrees.count(id)) continue;
    auto subtree = extract(id, excluded, options);
    if (subtree) {
      result.subtrees.emplace(id, std::move(*subtree));
    } else {
      result.missing.push_back(id);
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
  return result;
}

} // namespace refindex
