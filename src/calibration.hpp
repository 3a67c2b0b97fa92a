#pragma once

/**
 * @file calibration.hpp
 * @brief Clade age constraints ("mrca: A, B, fixage=N;") and rescaling
 */

#include "directive.hpp"
#include "phylo_tree.hpp"

#include <cstddef>
#include <stdexcept>
#include <string>
#include <string_view>
#include <vector>

namespace calibration {

// Fix the age of the MRCA of taxonA and taxonB. Taxa are named by
// identifier (with or without prefix) or by a label that is unique in the tree.
struct Constraint {
  std::string taxonA;
  std::string taxonB;
  double age = 0.0;
  size_t line = 0;  // source line, for messages

  std::string describe() const;
};

class ConstraintSyntaxError : public std::runtime_error {
public:
  ConstraintSyntaxError(const std::string &reason, size_t line)
      : std::runtime_error("constraint line " + std::to_string(line) + ": " + reason), line_(line) {}

  size_t line() const { return line_; }

private:
  size_t line_;
};

// Sidecar syntax, one per line:  mrca: taxonA, taxonB, fixage=<number>;
// Blank lines and '#' comments are ignored. Throws ConstraintSyntaxError.
std::vector<Constraint> parseConstraints(std::string_view text);

// Constraints embedded in a tree's leading comment. Lines that do not start
// with "mrca:" are free text and skipped.
std::vector<Constraint> constraintsFromComment(std::string_view comment);

struct FailedConstraint {
  Constraint constraint;
  std::string reason;
};

struct SupersededConstraint {
  Constraint constraint;
  double achievedAge;
};

struct CalibrationReport {
  size_t applied = 0;
  std::vector<FailedConstraint> failed;
  // Applied, but a later constraint moved the clade away from its target
  std::vector<SupersededConstraint> superseded;
};

// Rescale branch lengths in place, constraints applied in the given order.
// Only lengths below each MRCA change; topology is untouched.
CalibrationReport calibrate(phylo::PhyloTree &tree, const std::vector<Constraint> &constraints,
                            const directive::IdScheme &scheme = {});

} // namespace calibration
