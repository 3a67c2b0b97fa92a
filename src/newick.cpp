#include "newick.hpp"

#include <cctype>
#include <cmath>
#include <cstdio>
#include <cstdlib>
#include <vector>

namespace newick {

ParseError::ParseError(const std::string &reason, size_t offset, size_t line, size_t column)
    : std::runtime_error("line " + std::to_string(line) + ", column " + std::to_string(column) +
                         " (offset " + std::to_string(offset) + "): " + reason),
      reason_(reason), offset_(offset), line_(line), column_(column) {}

namespace {

bool isPunctuation(char c) {
  return c == '(' || c == ')' || c == ',' || c == ':' || c == ';' || c == '[' || c == ']';
}

bool isSpace(char c) {
  return std::isspace(static_cast<unsigned char>(c)) != 0;
}

// Single-pass, non-recursive parser. Open clades are kept on an explicit
// stack of node indices so nesting depth is bounded by memory only.
class Parser {
public:
  Parser(std::string_view input, const directive::IdScheme &scheme)
      : input_(input), scheme_(scheme) {}

  ParseResult parse() {
    ParseResult result;
    readLeadingComments(result.leadingComment);
    if (pos_ >= input_.size()) {
      fail("empty input", pos_);
    }

    auto &tree = result.tree;
    std::vector<uint32_t> open;   // clades whose ')' has not been seen yet
    std::vector<size_t> openedAt; // offsets of their '('
    bool expectNode = true;

    while (true) {
      skipSpaceAndComments();

      if (expectNode) {
        if (pos_ >= input_.size()) {
          fail("unexpected end of input, expected a node", pos_);
        }
        uint32_t n = tree.addNode(phylo::TreeNode{});
        if (open.empty()) {
          tree.setRoot(n);
        } else {
          tree.attach(open.back(), n);
        }

        if (input_[pos_] == '(') {
          open.push_back(n);
          openedAt.push_back(pos_);
          ++pos_;
          continue;
        }
        readNodeSuffix(tree, n);
        expectNode = false;
        continue;
      }

      // A complete node has just been read
      if (open.empty()) {
        break;
      }
      if (pos_ >= input_.size()) {
        fail("unbalanced parentheses: " + std::to_string(open.size()) + " unclosed '('", openedAt.back());
      }

      char c = input_[pos_];
      if (c == ',') {
        ++pos_;
        expectNode = true;
      } else if (c == ')') {
        ++pos_;
        uint32_t closed = open.back();
        open.pop_back();
        openedAt.pop_back();
        readNodeSuffix(tree, closed);
      } else if (c == ';') {
        fail("unbalanced parentheses: " + std::to_string(open.size()) + " unclosed '('", openedAt.back());
      } else {
        fail(std::string("expected ',' or ')', found '") + c + "'", pos_);
      }
    }

    skipSpaceAndComments();
    if (pos_ >= input_.size() || input_[pos_] != ';') {
      if (pos_ < input_.size() && input_[pos_] == ')') {
        fail("unbalanced parentheses: unexpected ')'", pos_);
      }
      fail("expected a semicolon at the end of the tree", pos_);
    }
    ++pos_;

    skipSpaceAndComments();
    if (pos_ < input_.size()) {
      fail("unexpected text after the end of the tree", pos_);
    }
    return result;
  }

private:
  std::string_view input_;
  const directive::IdScheme &scheme_;
  size_t pos_ = 0;

  [[noreturn]] void fail(const std::string &reason, size_t offset) const {
    size_t line = 1;
    size_t column = 1;
    for (size_t i = 0; i < offset && i < input_.size(); ++i) {
      if (input_[i] == '\n') {
        ++line;
        column = 1;
      } else {
        ++column;
      }
    }
    throw ParseError(reason, offset, line, column);
  }

  void skipSpace() {
    while (pos_ < input_.size() && isSpace(input_[pos_])) {
      ++pos_;
    }
  }

  // Consume one bracketed comment (brackets may nest), returning its body
  std::string_view readComment() {
    size_t start = pos_;
    int depth = 0;
    while (pos_ < input_.size()) {
      char c = input_[pos_++];
      if (c == '[') {
        ++depth;
      } else if (c == ']') {
        if (--depth == 0) {
          return input_.substr(start + 1, pos_ - start - 2);
        }
      }
    }
    fail("unterminated comment", start);
  }

  void readLeadingComments(std::string &out) {
    skipSpace();
    while (pos_ < input_.size() && input_[pos_] == '[') {
      std::string_view body = readComment();
      if (!out.empty()) out += '\n';
      out.append(body);
      skipSpace();
    }
  }

  void skipSpaceAndComments() {
    skipSpace();
    while (pos_ < input_.size() && input_[pos_] == '[') {
      readComment();
      skipSpace();
    }
  }

  // Optional label then optional ":length" for node n
  void readNodeSuffix(phylo::PhyloTree &tree, uint32_t n) {
    skipSpaceAndComments();
    size_t labelStart = pos_;
    bool quoted = false;
    std::string raw = readLabel(quoted);

    if (!raw.empty()) {
      try {
        directive::ParsedLabel parsed = directive::parseLabel(raw, scheme_);
        auto &node = tree.node(n);
        node.label = std::move(parsed.name);
        node.id = std::move(parsed.id);
        node.directives = std::move(parsed.directives);
      } catch (const directive::DirectiveError &e) {
        fail(std::string("bad label '") + raw + "': " + e.what(), labelStart + (quoted ? 1 : 0) + e.position());
      }
    }

    skipSpaceAndComments();
    if (pos_ < input_.size() && input_[pos_] == ':') {
      ++pos_;
      skipSpace();
      tree.node(n).branchLength = readLength();
    }
  }

  std::string readLabel(bool &quoted) {
    if (pos_ >= input_.size()) {
      return {};
    }

    char q = input_[pos_];
    if (q == '\'' || q == '"') {
      quoted = true;
      size_t start = pos_++;
      std::string label;
      while (pos_ < input_.size()) {
        char c = input_[pos_++];
        if (c == q) {
          if (pos_ < input_.size() && input_[pos_] == q) {
            label += q;  // doubled quote
            ++pos_;
            continue;
          }
          return label;
        }
        label += c;
      }
      fail("unterminated quoted label", start);
    }

    size_t start = pos_;
    while (pos_ < input_.size() && !isPunctuation(input_[pos_])) {
      ++pos_;
    }
    size_t end = pos_;
    while (end > start && isSpace(input_[end - 1])) {
      --end;
    }
    return std::string(input_.substr(start, end - start));
  }

  double readLength() {
    size_t start = pos_;
    while (pos_ < input_.size() && !isPunctuation(input_[pos_]) && !isSpace(input_[pos_])) {
      ++pos_;
    }
    std::string token(input_.substr(start, pos_ - start));
    if (token.empty()) {
      fail("missing edge length after ':'", start);
    }

    char *end = nullptr;
    double value = std::strtod(token.c_str(), &end);
    if (end != token.c_str() + token.size() || !std::isfinite(value)) {
      fail("'" + token + "' is not a valid edge length", start);
    }
    if (value < 0) {
      fail("negative edge length '" + token + "'", start);
    }
    return value;
  }
};

} // namespace

ParseResult parse(std::string_view text, const directive::IdScheme &scheme) {
  Parser parser(text, scheme);
  return parser.parse();
}

phylo::PhyloTree parseTree(std::string_view text, const directive::IdScheme &scheme) {
  return parse(text, scheme).tree;
}

// ============================================================================
// Serialization
// ============================================================================

std::string quoteLabel(const std::string &label) {
  bool needsQuote = false;
  for (char c : label) {
    if (c == '(' || c == ')' || c == ',' || c == ':' || c == ';' || c == '\'' || c == '"' ||
        c == '[' || c == ']' || isSpace(c)) {
      needsQuote = true;
      break;
    }
  }
  if (!needsQuote) {
    return label;
  }

  std::string out = "'";
  for (char c : label) {
    if (c == '\'') {
      out += "''";
    } else {
      out += c;
    }
  }
  out += '\'';
  return out;
}

std::string formatLength(double length, int precision) {
  char buf[64];
  int len = std::snprintf(buf, sizeof(buf), "%.*g", precision, length);
  return std::string(buf, static_cast<size_t>(len));
}

std::string writeSubtree(const phylo::PhyloTree &tree, uint32_t node, const NewickStyle &style) {
  if (tree.empty() || node == phylo::PhyloTree::NO_NODE) {
    return ";";
  }

  const directive::IdScheme scheme{style.idPrefix};
  const bool pretty = style.indent > 0;
  std::string result;
  result.reserve(tree.size() * 24);

  auto newline = [&](size_t depth) {
    result += '\n';
    result.append(depth * static_cast<size_t>(style.indent), ' ');
  };

  // state 0: opening, 1: emitting children, 2: writing label and length
  struct Frame {
    uint32_t node;
    size_t child;
    int state;
  };
  std::vector<Frame> stack;
  stack.push_back({node, 0, 0});

  while (!stack.empty()) {
    size_t top = stack.size() - 1;
    size_t depth = top;
    uint32_t cur = stack[top].node;
    const auto &n = tree.node(cur);

    if (stack[top].state == 0) {
      if (n.children.empty()) {
        stack[top].state = 2;
      } else {
        result += '(';
        stack[top].state = 1;
      }
      continue;
    }

    if (stack[top].state == 1) {
      size_t i = stack[top].child;
      if (i < n.children.size()) {
        if (i > 0) result += ',';
        if (pretty) newline(depth + 1);
        stack[top].child++;
        stack.push_back({n.children[i], 0, 0});
      } else {
        if (pretty) newline(depth);
        result += ')';
        stack[top].state = 2;
      }
      continue;
    }

    std::string label = directive::formatLabel(n.label, n.id, n.directives, scheme);
    if (!label.empty()) {
      result += quoteLabel(label);
    }
    if (n.branchLength) {
      result += ':';
      result += formatLength(*n.branchLength, style.precision);
    }
    stack.pop_back();
  }

  result += ';';
  return result;
}

std::string write(const phylo::PhyloTree &tree, const NewickStyle &style) {
  return writeSubtree(tree, tree.root(), style);
}

} // namespace newick
