#include "calibration.hpp"
#include "logging.hpp"

#include <absl/container/flat_hash_map.h>

#include <algorithm>
#include <cmath>
#include <cstdlib>
#include <optional>
#include <sstream>

namespace calibration {

std::string Constraint::describe() const {
  std::ostringstream out;
  out << "mrca: " << taxonA << ", " << taxonB << ", fixage=" << age;
  return out.str();
}

// ============================================================================
// Sidecar parsing
// ============================================================================

static std::string_view trim(std::string_view s) {
  size_t b = s.find_first_not_of(" \t\r\n");
  if (b == std::string_view::npos) return {};
  size_t e = s.find_last_not_of(" \t\r\n");
  return s.substr(b, e - b + 1);
}

static bool startsWithKeyword(std::string_view line) {
  return line.size() > 4 && line.substr(0, 4) == "mrca" && trim(line.substr(4)).substr(0, 1) == ":";
}

static Constraint parseLine(std::string_view line, size_t lineNo) {
  if (!startsWithKeyword(line)) {
    throw ConstraintSyntaxError("expected 'mrca:'", lineNo);
  }
  std::string_view body = trim(line.substr(line.find(':') + 1));
  if (!body.empty() && body.back() == ';') {
    body = trim(body.substr(0, body.size() - 1));
  }
  if (body.find(';') != std::string_view::npos) {
    throw ConstraintSyntaxError("only one constraint per line", lineNo);
  }

  std::vector<std::string_view> fields;
  size_t start = 0;
  while (true) {
    size_t comma = body.find(',', start);
    fields.push_back(trim(body.substr(start, comma == std::string_view::npos ? std::string_view::npos : comma - start)));
    if (comma == std::string_view::npos) break;
    start = comma + 1;
  }
  if (fields.size() != 3) {
    throw ConstraintSyntaxError("expected 'taxonA, taxonB, fixage=<age>'", lineNo);
  }
  if (fields[0].empty() || fields[1].empty()) {
    throw ConstraintSyntaxError("empty taxon name", lineNo);
  }

  std::string_view fix = fields[2];
  size_t eq = fix.find('=');
  if (eq == std::string_view::npos || trim(fix.substr(0, eq)) != "fixage") {
    throw ConstraintSyntaxError("expected 'fixage=<age>'", lineNo);
  }
  std::string number(trim(fix.substr(eq + 1)));
  char *end = nullptr;
  double age = std::strtod(number.c_str(), &end);
  if (number.empty() || end != number.c_str() + number.size() || !std::isfinite(age) || age < 0) {
    throw ConstraintSyntaxError("'" + number + "' is not a valid age", lineNo);
  }

  Constraint c;
  c.taxonA = std::string(fields[0]);
  c.taxonB = std::string(fields[1]);
  c.age = age;
  c.line = lineNo;
  return c;
}

static std::vector<Constraint> parseLines(std::string_view text, bool skipFreeText) {
  std::vector<Constraint> constraints;
  size_t lineNo = 0;
  size_t pos = 0;
  while (pos <= text.size()) {
    size_t nl = text.find('\n', pos);
    std::string_view line = text.substr(pos, nl == std::string_view::npos ? std::string_view::npos : nl - pos);
    ++lineNo;
    pos = (nl == std::string_view::npos) ? text.size() + 1 : nl + 1;

    if (size_t hash = line.find('#'); hash != std::string_view::npos) {
      line = line.substr(0, hash);
    }
    line = trim(line);
    if (line.empty()) continue;
    if (skipFreeText && !startsWithKeyword(line)) continue;

    constraints.push_back(parseLine(line, lineNo));
  }
  return constraints;
}

std::vector<Constraint> parseConstraints(std::string_view text) {
  return parseLines(text, false);
}

std::vector<Constraint> constraintsFromComment(std::string_view comment) {
  return parseLines(comment, true);
}

// ============================================================================
// Rescaling
// ============================================================================

namespace {

class TaxonResolver {
public:
  TaxonResolver(const phylo::PhyloTree &tree, const directive::IdScheme &scheme) : scheme_(scheme) {
    for (auto n : tree.preorder()) {
      const auto &node = tree.node(n);
      if (node.id) byId_.try_emplace(*node.id, n);
      if (!node.label.empty()) {
        auto [it, inserted] = byLabel_.try_emplace(node.label, n);
        if (!inserted) it->second = phylo::PhyloTree::NO_NODE;
      }
    }
  }

  // Node for name, or the reason it cannot be resolved
  std::optional<uint32_t> resolve(const std::string &name, std::string &reason) const {
    if (auto it = byId_.find(name); it != byId_.end()) return it->second;
    if (auto it = byId_.find(directive::normalizeId(name, scheme_)); it != byId_.end()) return it->second;
    if (auto it = byLabel_.find(name); it != byLabel_.end()) {
      if (it->second != phylo::PhyloTree::NO_NODE) return it->second;
      reason = "taxon '" + name + "' is ambiguous";
      return std::nullopt;
    }
    reason = "taxon '" + name + "' not found";
    return std::nullopt;
  }

private:
  const directive::IdScheme &scheme_;
  absl::flat_hash_map<std::string, uint32_t> byId_;
  absl::flat_hash_map<std::string, uint32_t> byLabel_;
};

} // namespace

CalibrationReport calibrate(phylo::PhyloTree &tree, const std::vector<Constraint> &constraints,
                            const directive::IdScheme &scheme) {
  TIME_OPERATION("Calibration");

  CalibrationReport report;
  if (tree.empty() || constraints.empty()) {
    return report;
  }

  TaxonResolver resolver(tree, scheme);
  std::vector<std::pair<const Constraint *, uint32_t>> applied;

  for (const auto &c : constraints) {
    std::string reason;
    auto a = resolver.resolve(c.taxonA, reason);
    auto b = a ? resolver.resolve(c.taxonB, reason) : std::nullopt;
    if (!a || !b) {
      logging::warn("Skipping constraint '{}': {}", c.describe(), reason);
      report.failed.push_back({c, reason});
      continue;
    }

    uint32_t m = tree.mrca(*a, *b);
    double depth = tree.subtreeHeight(m);
    if (depth <= 0.0) {
      reason = "clade " + tree.displayName(m) + " has zero depth";
      logging::warn("Skipping constraint '{}': {}", c.describe(), reason);
      report.failed.push_back({c, reason});
      continue;
    }

    double factor = c.age / depth;
    for (auto n : tree.preorder(m)) {
      if (n == m) continue;
      auto &len = tree.node(n).branchLength;
      if (len) *len *= factor;
    }
    logging::debug("Scaled {} by {} (depth {} -> {})", tree.displayName(m), factor, depth, c.age);

    applied.emplace_back(&c, m);
    ++report.applied;
  }

  // Later constraints win for nested clades; surface the ones they overrode
  for (const auto &[c, m] : applied) {
    double achieved = tree.subtreeHeight(m);
    if (std::abs(achieved - c->age) > 1e-9 * std::max(1.0, c->age)) {
      logging::warn("Constraint '{}' superseded: clade {} ends at age {}", c->describe(), tree.displayName(m),
                    achieved);
      report.superseded.push_back({*c, achieved});
    }
  }

  logging::info("Applied {} of {} age constraints", report.applied, constraints.size());
  return report;
}

} // namespace calibration
