#include "phylo_tree.hpp"

#include <algorithm>
#include <stack>
#include <stdexcept>
#include <utility>

namespace phylo {

// Maximum number of nodes supported (uint32_t indices, UINT32_MAX reserved)
static constexpr size_t MAX_NODES = static_cast<size_t>(UINT32_MAX) - 1;

uint32_t PhyloTree::addNode(TreeNode node) {
  if (nodes_.size() >= MAX_NODES) {
    throw std::runtime_error("Tree too large: exceeds maximum of " + std::to_string(MAX_NODES) + " nodes");
  }
  node.parent = NO_PARENT;
  node.children.clear();
  nodes_.push_back(std::move(node));
  return static_cast<uint32_t>(nodes_.size() - 1);
}

void PhyloTree::attach(uint32_t parent, uint32_t child) {
  nodes_[child].parent = parent;
  nodes_[parent].children.push_back(child);
}

TreeNode copyPayload(const TreeNode &n) {
  TreeNode copy;
  copy.label = n.label;
  copy.id = n.id;
  copy.branchLength = n.branchLength;
  copy.directives = n.directives;
  return copy;
}

std::optional<double> sumLengths(const std::optional<double> &a, const std::optional<double> &b) {
  if (!a) return b;
  if (!b) return a;
  return *a + *b;
}

std::vector<uint32_t> PhyloTree::preorder(uint32_t from) const {
  std::vector<uint32_t> result;
  if (nodes_.empty() || from == NO_NODE) {
    return result;
  }

  std::stack<uint32_t> s;
  s.push(from);
  while (!s.empty()) {
    uint32_t n = s.top();
    s.pop();
    result.push_back(n);

    const auto &kids = nodes_[n].children;
    for (auto it = kids.rbegin(); it != kids.rend(); ++it) {
      s.push(*it);
    }
  }
  return result;
}

std::vector<uint32_t> PhyloTree::postorder(uint32_t from) const {
  std::vector<uint32_t> result;
  if (nodes_.empty() || from == NO_NODE) {
    return result;
  }

  // Iterative post-order using two stacks
  std::stack<uint32_t> s1, s2;
  s1.push(from);
  while (!s1.empty()) {
    uint32_t n = s1.top();
    s1.pop();
    s2.push(n);
    for (auto child : nodes_[n].children) {
      s1.push(child);
    }
  }

  result.reserve(s2.size());
  while (!s2.empty()) {
    result.push_back(s2.top());
    s2.pop();
  }
  return result;
}

std::vector<uint32_t> PhyloTree::leaves(uint32_t from) const {
  std::vector<uint32_t> result;
  for (auto n : preorder(from)) {
    if (nodes_[n].children.empty()) {
      result.push_back(n);
    }
  }
  return result;
}

size_t PhyloTree::numLeaves() const {
  return leaves().size();
}

double PhyloTree::pathLength(uint32_t i) const {
  double total = 0.0;
  while (i != root_ && nodes_[i].parent != NO_PARENT) {
    total += edgeLength(i);
    i = nodes_[i].parent;
  }
  return total;
}

std::vector<double> PhyloTree::subtreeHeights(uint32_t from) const {
  std::vector<double> height(nodes_.size(), 0.0);
  for (auto n : postorder(from)) {
    double h = 0.0;
    for (auto child : nodes_[n].children) {
      h = std::max(h, edgeLength(child) + height[child]);
    }
    height[n] = h;
  }
  return height;
}

uint32_t PhyloTree::depth(uint32_t i) const {
  uint32_t d = 0;
  while (nodes_[i].parent != NO_PARENT) {
    i = nodes_[i].parent;
    ++d;
  }
  return d;
}

uint32_t PhyloTree::mrca(uint32_t a, uint32_t b) const {
  uint32_t da = depth(a);
  uint32_t db = depth(b);

  while (da > db) {
    a = nodes_[a].parent;
    --da;
  }
  while (db > da) {
    b = nodes_[b].parent;
    --db;
  }
  while (a != b) {
    a = nodes_[a].parent;
    b = nodes_[b].parent;
  }
  return a;
}

bool PhyloTree::isAncestor(uint32_t ancestor, uint32_t node) const {
  while (node != NO_PARENT) {
    if (node == ancestor) return true;
    node = nodes_[node].parent;
  }
  return false;
}

std::optional<uint32_t> PhyloTree::findById(const std::string &id) const {
  for (auto n : preorder()) {
    if (nodes_[n].id && *nodes_[n].id == id) {
      return n;
    }
  }
  return std::nullopt;
}

std::vector<uint32_t> PhyloTree::findByLabel(const std::string &label) const {
  std::vector<uint32_t> result;
  for (auto n : preorder()) {
    if (nodes_[n].label == label) {
      result.push_back(n);
    }
  }
  return result;
}

std::string PhyloTree::displayName(uint32_t i) const {
  const auto &n = nodes_[i];
  if (!n.label.empty() && n.id) return n.label + " (" + *n.id + ")";
  if (!n.label.empty()) return n.label;
  if (n.id) return *n.id;
  return "#" + std::to_string(i);
}

} // namespace phylo
