#pragma once

#include "directive.hpp"

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace phylo {

// Node data stored in a contiguous arena, referenced by index
struct TreeNode {
  std::string label;                           // Name without identifier or directives
  std::optional<std::string> id;               // Stable taxon identifier
  std::optional<double> branchLength;          // Length of the edge into this node
  std::vector<directive::Directive> directives;
  uint32_t parent;
  std::vector<uint32_t> children;              // Order is meaningful and preserved

  TreeNode() : parent(UINT32_MAX) {}
};

// Payload of a node (label, identifier, length, directives) without links
TreeNode copyPayload(const TreeNode &n);

// Length of two merged edges; absent only when both are absent
std::optional<double> sumLengths(const std::optional<double> &a, const std::optional<double> &b);

class PhyloTree {
public:
  static constexpr uint32_t NO_PARENT = UINT32_MAX;
  static constexpr uint32_t NO_NODE = UINT32_MAX;

  // ==========================================================================
  // Navigation
  // ==========================================================================

  uint32_t root() const { return root_; }
  bool empty() const { return nodes_.empty(); }
  size_t size() const { return nodes_.size(); }

  const TreeNode &node(uint32_t i) const { return nodes_[i]; }
  TreeNode &node(uint32_t i) { return nodes_[i]; }

  uint32_t parent(uint32_t i) const { return nodes_[i].parent; }
  const std::vector<uint32_t> &children(uint32_t i) const { return nodes_[i].children; }
  bool isLeaf(uint32_t i) const { return nodes_[i].children.empty(); }

  // A node still carrying a graft marker
  bool isGraftPoint(uint32_t i) const { return directive::hasGraftMarker(nodes_[i].directives); }

  // ==========================================================================
  // Construction
  // ==========================================================================

  // Append a disconnected node, returns its index
  uint32_t addNode(TreeNode node);

  // Append child to the end of parent's children
  void attach(uint32_t parent, uint32_t child);

  void setRoot(uint32_t i) { root_ = i; }

  // ==========================================================================
  // Traversal (iterative, safe on very deep trees)
  // ==========================================================================

  std::vector<uint32_t> preorder() const { return preorder(root_); }
  std::vector<uint32_t> preorder(uint32_t from) const;

  std::vector<uint32_t> postorder() const { return postorder(root_); }
  std::vector<uint32_t> postorder(uint32_t from) const;

  std::vector<uint32_t> leaves() const { return leaves(root_); }
  std::vector<uint32_t> leaves(uint32_t from) const;

  size_t numLeaves() const;

  // ==========================================================================
  // Distances (absent branch lengths count as zero)
  // ==========================================================================

  double edgeLength(uint32_t i) const { return nodes_[i].branchLength.value_or(0.0); }

  // Sum of branch lengths from the root down to i, excluding the root's own edge
  double pathLength(uint32_t i) const;

  // Height of each node in the subtree rooted at from: the longest path down
  // to a leaf. Indexed by node; nodes outside the subtree are left at zero.
  std::vector<double> subtreeHeights(uint32_t from) const;

  double subtreeHeight(uint32_t i) const { return subtreeHeights(i)[i]; }

  // ==========================================================================
  // Queries
  // ==========================================================================

  uint32_t mrca(uint32_t a, uint32_t b) const;
  bool isAncestor(uint32_t ancestor, uint32_t node) const;
  uint32_t depth(uint32_t i) const;

  // Linear scans; build an index for repeated lookups
  std::optional<uint32_t> findById(const std::string &id) const;
  std::vector<uint32_t> findByLabel(const std::string &label) const;

  // Human-readable name for log messages: label, identifier, or "#index"
  std::string displayName(uint32_t i) const;

private:
  std::vector<TreeNode> nodes_;
  uint32_t root_ = NO_NODE;
};

} // namespace phylo
