#pragma once

/**
 * @file newick.hpp
 * @brief Newick reading and writing with graft-point label directives
 *
 * Parsing and writing are iterative, so very deep trees do not overflow the
 * stack. Leading [...] comments are kept for constraint extraction.
 */

#include "directive.hpp"
#include "phylo_tree.hpp"

#include <cstddef>
#include <stdexcept>
#include <string>
#include <string_view>

namespace newick {

// Fatal syntax error, located in the input text
class ParseError : public std::runtime_error {
public:
  ParseError(const std::string &reason, size_t offset, size_t line, size_t column);

  const std::string &reason() const { return reason_; }
  size_t offset() const { return offset_; }
  size_t line() const { return line_; }
  size_t column() const { return column_; }

private:
  std::string reason_;
  size_t offset_;
  size_t line_;
  size_t column_;
};

struct ParseResult {
  phylo::PhyloTree tree;
  // Text of the [...] blocks preceding the tree, one block per line
  std::string leadingComment;
};

// Parse one extended-Newick tree terminated by ';'. Labels are split into
// name, identifier and directives with the given scheme.
ParseResult parse(std::string_view text, const directive::IdScheme &scheme = {});

// Convenience wrapper discarding the leading comment
phylo::PhyloTree parseTree(std::string_view text, const directive::IdScheme &scheme = {});

// ============================================================================
// Serialization
// ============================================================================

struct NewickStyle {
  std::string idPrefix = "ott";
  int indent = 0;      // spaces per level; 0 writes a single line
  int precision = 15;  // significant digits for branch lengths
};

std::string write(const phylo::PhyloTree &tree, const NewickStyle &style = {});

// Serialize the subtree rooted at node, terminated by ';'
std::string writeSubtree(const phylo::PhyloTree &tree, uint32_t node, const NewickStyle &style = {});

// Quote a label if it contains Newick punctuation or whitespace
std::string quoteLabel(const std::string &label);

std::string formatLength(double length, int precision = 15);

} // namespace newick
