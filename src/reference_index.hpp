#pragma once

/**
 * @file reference_index.hpp
 * @brief Identifier index over the reference taxonomy and subtree extraction
 */

#include "phylo_tree.hpp"

#include <absl/container/flat_hash_map.h>

#include <cstdint>
#include <map>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

namespace refindex {

class DuplicateIdError : public std::runtime_error {
public:
  DuplicateIdError(const std::string &id, const std::string &first, const std::string &second)
      : std::runtime_error("duplicate identifier '" + id + "' in reference tree (" + first + " and " + second + ")"),
        id_(id) {}

  const std::string &id() const { return id_; }

private:
  std::string id_;
};

struct ExtractOptions {
  // Splice out internal nodes left with a single child after exclusion
  bool collapseUnifurcations = false;
  // Wrap the clade in up to this many ancestors (label and identifier only)
  uint32_t includedAncestors = 0;
};

struct ExtractManyResult {
  std::map<std::string, phylo::PhyloTree> subtrees;
  std::vector<std::string> missing;
};

// Identifier lookup over an immutable reference tree. All extraction
// operations copy; the indexed tree is never modified.
class ReferenceIndex {
public:
  // Index every identifier of tree. Throws DuplicateIdError.
  explicit ReferenceIndex(phylo::PhyloTree tree);

  static ReferenceIndex build(phylo::PhyloTree tree) { return ReferenceIndex(std::move(tree)); }

  const phylo::PhyloTree &tree() const { return tree_; }
  size_t size() const { return byId_.size(); }

  // Resolve an identifier, falling back to a label that occurs only once
  std::optional<uint32_t> lookup(const std::string &key) const;
  bool contains(const std::string &key) const { return lookup(key).has_value(); }

  // Deep copy of the clade rooted at id, minus every descendant whose
  // identifier (or label) is listed in excluded. The clade root itself is
  // never pruned.
  std::optional<phylo::PhyloTree> extract(const std::string &id, const std::vector<std::string> &excluded,
                                          const ExtractOptions &options = {}) const;

  // Same as extract, but appends the copy to dest and returns the index of
  // its top node (unattached)
  std::optional<uint32_t> extractInto(phylo::PhyloTree &dest, const std::string &id,
                                      const std::vector<std::string> &excluded,
                                      const ExtractOptions &options = {}) const;

  ExtractManyResult extractMany(const std::vector<std::string> &ids, const std::vector<std::string> &excluded,
                                const ExtractOptions &options = {}) const;

private:
  phylo::PhyloTree tree_;
  absl::flat_hash_map<std::string, uint32_t> byId_;
  absl::flat_hash_map<std::string, uint32_t> byLabel_;  // NO_NODE when ambiguous
};

} // namespace refindex
