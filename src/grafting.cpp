#include "grafting.hpp"
#include "logging.hpp"

#include <absl/container/flat_hash_map.h>
#include <absl/container/flat_hash_set.h>

#include <algorithm>

namespace grafting {

namespace {

constexpr uint32_t NO_FRAME = UINT32_MAX;

// One level of part expansion; chained through parent for cycle detection
struct Frame {
  std::string token;
  uint32_t parent;
};

// Pending node: where it comes from and where its copy goes
struct Item {
  const phylo::PhyloTree *src;
  uint32_t node;
  uint32_t dstParent;
  uint32_t frame;
};

std::string describeCycle(const std::vector<Frame> &frames, uint32_t frame, const std::string &token) {
  std::vector<std::string> chain{token};
  for (uint32_t f = frame; f != NO_FRAME; f = frames[f].parent) {
    chain.push_back(frames[f].token);
    if (frames[f].token == token) break;
  }
  std::reverse(chain.begin(), chain.end());

  std::string out;
  for (const auto &t : chain) {
    if (!out.empty()) out += " -> ";
    out += t;
  }
  return out;
}

} // namespace

size_t validateIdentifiers(const phylo::PhyloTree &tree) {
  absl::flat_hash_map<std::string, uint32_t> seen;
  seen.reserve(tree.size());
  size_t leavesWithoutId = 0;

  for (auto n : tree.preorder()) {
    const auto &node = tree.node(n);
    if (node.id) {
      auto [it, inserted] = seen.try_emplace(*node.id, n);
      if (!inserted) {
        throw GraftError("duplicate identifier '" + *node.id + "' in merged tree (" +
                         tree.displayName(it->second) + " and " + tree.displayName(n) + ")");
      }
    } else if (node.children.empty()) {
      ++leavesWithoutId;
    }
  }
  return leavesWithoutId;
}

GraftResult graft(const phylo::PhyloTree &skeleton, const refindex::ReferenceIndex &index,
                  const parts::PartLibrary *partLibrary, const GraftOptions &options) {
  TIME_OPERATION("Grafting");

  GraftResult result;
  if (skeleton.empty()) {
    return result;
  }

  auto &merged = result.tree;
  auto &report = result.report;

  absl::flat_hash_map<std::string, std::string> usedSources;  // source id -> graft point
  absl::flat_hash_set<std::string> usedParts;
  std::vector<Frame> frames;

  auto place = [&merged](uint32_t n, uint32_t dstParent) {
    if (dstParent == phylo::PhyloTree::NO_NODE) {
      merged.setRoot(n);
    } else {
      merged.attach(dstParent, n);
    }
  };

  std::vector<Item> stack;
  stack.push_back({&skeleton, skeleton.root(), phylo::PhyloTree::NO_NODE, NO_FRAME});

  auto pushChildren = [&stack](const phylo::PhyloTree *src, uint32_t n, uint32_t dstParent, uint32_t frame) {
    const auto &kids = src->children(n);
    for (auto it = kids.rbegin(); it != kids.rend(); ++it) {
      stack.push_back({src, *it, dstParent, frame});
    }
  };

  while (!stack.empty()) {
    Item item = stack.back();
    stack.pop_back();

    const phylo::PhyloTree &src = *item.src;
    const phylo::TreeNode &node = src.node(item.node);

    if (!directive::hasGraftMarker(node.directives)) {
      uint32_t copied = merged.addNode(phylo::copyPayload(node));
      place(copied, item.dstParent);
      pushChildren(item.src, item.node, copied, item.frame);
      continue;
    }

    const directive::Exclusion *exclusion = directive::findExclusion(node.directives);
    const directive::Alias *alias = directive::findAlias(node.directives);
    std::optional<std::string> source = (exclusion && exclusion->sourceId) ? exclusion->sourceId : node.id;

    if (source) {
      // ========================================================================
      // Reference subtree
      // ========================================================================
      auto [used, first] = usedSources.try_emplace(*source, src.displayName(item.node));
      if (!first) {
        throw GraftError("identifier '" + *source + "' is grafted twice (at " + used->second + " and " +
                         src.displayName(item.node) + ")");
      }

      std::vector<std::string> excluded;
      if (exclusion) excluded = exclusion->excludedIds;
      refindex::ExtractOptions extractOptions;
      extractOptions.collapseUnifurcations = options.collapseUnifurcations;

      if (auto top = index.extractInto(merged, *source, excluded, extractOptions)) {
        auto &attached = merged.node(*top);
        // A source override grafts a different clade; the placeholder's own
        // identifier names nothing in the attached subtree and is dropped
        const bool overridden = exclusion && exclusion->sourceId;
        if (alias) {
          attached.label = alias->label;
          if (overridden) {
            attached.id.reset();
          } else if (node.id) {
            attached.id = node.id;
          }
        } else if (!node.label.empty()) {
          attached.label = node.label;
          attached.id.reset();
          if (!overridden) attached.id = node.id;
        }
        if (node.branchLength) {
          attached.branchLength = node.branchLength;
        }
        attached.directives.clear();
        place(*top, item.dstParent);

        if (!node.children.empty()) {
          logging::debug("Discarding {} skeleton children of {}", node.children.size(), src.displayName(item.node));
        }
        ++report.resolvedReference;
        continue;
      }

      usedSources.erase(*source);
      logging::warn("Unresolved graft point {}: identifier '{}' not in reference", src.displayName(item.node), *source);
      report.unresolved.push_back({node.label, node.id, *source});
    } else {
      // ========================================================================
      // Bespoke part
      // ========================================================================
      const std::string &token = node.label;
      const parts::Part *part = partLibrary ? partLibrary->find(token) : nullptr;

      if (part) {
        for (uint32_t f = item.frame; f != NO_FRAME; f = frames[f].parent) {
          if (frames[f].token == token) {
            throw GraftError("cyclic part inclusion: " + describeCycle(frames, item.frame, token));
          }
        }
        if (!usedParts.insert(token).second) {
          throw GraftError("part " + token + " is grafted twice");
        }

        frames.push_back({token, item.frame});
        const uint32_t frame = static_cast<uint32_t>(frames.size() - 1);

        const phylo::PhyloTree &partTree = part->tree;
        const auto &partRoot = partTree.node(partTree.root());

        phylo::TreeNode top = phylo::copyPayload(partRoot);
        top.directives.clear();
        if (alias) {
          top.label = alias->label;
        } else if (part->taxon) {
          top.label = *part->taxon;
        } else if (top.label.empty()) {
          top.label = token;
        }
        if (part->edgeLength) {
          top.branchLength = part->edgeLength;
        } else if (node.branchLength) {
          top.branchLength = node.branchLength;
        }

        uint32_t attached = merged.addNode(std::move(top));
        place(attached, item.dstParent);
        pushChildren(&partTree, partTree.root(), attached, frame);
        report.partRoots.push_back(attached);
        ++report.resolvedParts;
        continue;
      }

      logging::warn("Unresolved graft point {}: no part named '{}'", src.displayName(item.node), token);
      report.unresolved.push_back({node.label, node.id, token});
    }

    // Left as it was, marker and children included
    uint32_t kept = merged.addNode(phylo::copyPayload(node));
    place(kept, item.dstParent);
    pushChildren(item.src, item.node, kept, item.frame);
  }

  report.leavesWithoutId = validateIdentifiers(merged);

  logging::info("Grafted {} reference subtrees and {} parts; {} unresolved", report.resolvedReference,
                report.resolvedParts, report.unresolvedCount());
  if (report.leavesWithoutId > 0) {
    logging::warn("{} leaves have no identifier", report.leavesWithoutId);
  }
  return result;
}

} // namespace grafting
