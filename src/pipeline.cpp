#include "pipeline.hpp"
#include "logging.hpp"
#include "newick.hpp"

#include <sstream>
#include <stdexcept>

namespace pipeline {

Stage parseStage(const std::string &name) {
  if (name == "graft") return Stage::GRAFT;
  if (name == "date") return Stage::DATE;
  if (name == "calibrate") return Stage::CALIBRATE;
  if (name == "fix") return Stage::FIX;
  throw std::runtime_error("Unknown stage '" + name + "' (expected graft, date, calibrate or fix)");
}

const char *stageName(Stage stage) {
  switch (stage) {
    case Stage::GRAFT:     return "graft";
    case Stage::DATE:      return "date";
    case Stage::CALIBRATE: return "calibrate";
    case Stage::FIX:       return "fix";
  }
  return "unknown";
}

size_t BuildSummary::issueCount() const {
  return graft.unresolvedCount() + (dating.rootUndated ? 1 : 0) + calibration.failed.size() + calibration.superseded.size() +
         fix.unfixable.size() + check.violatingPairs;
}

BuildResult run(std::string_view skeletonText, const std::vector<calibration::Constraint> &constraints,
                const refindex::ReferenceIndex &index, const parts::PartLibrary *partLibrary, const Options &options) {
  BuildResult result;
  auto &summary = result.summary;

  newick::ParseResult parsed = newick::parse(skeletonText, options.scheme);

  grafting::GraftOptions graftOptions;
  graftOptions.collapseUnifurcations = options.collapseUnifurcations;
  grafting::GraftResult grafted = grafting::graft(parsed.tree, index, partLibrary, graftOptions);
  result.tree = std::move(grafted.tree);
  summary.graft = std::move(grafted.report);
  summary.reached = Stage::GRAFT;

  if (options.stopAfter >= Stage::DATE) {
    if (options.nodeAges) {
      summary.dating = dating::dateTree(result.tree, *options.nodeAges, summary.graft.partRoots, options.scheme,
                                        options.impute);
    }
    summary.reached = Stage::DATE;
  }

  if (options.stopAfter >= Stage::CALIBRATE) {
    std::vector<calibration::Constraint> all = calibration::constraintsFromComment(parsed.leadingComment);
    if (!all.empty()) {
      logging::debug("{} constraints embedded in the tree comment", all.size());
    }
    all.insert(all.end(), constraints.begin(), constraints.end());

    summary.calibration = calibration::calibrate(result.tree, all, options.scheme);
    summary.reached = Stage::CALIBRATE;
  }

  if (options.stopAfter == Stage::FIX) {
    summary.fix = ultrametric::fix(result.tree);
    if (options.rootAge) {
      auto pinned = ultrametric::fixToAge(result.tree, *options.rootAge, options.maxAdjustment);
      summary.fix.adjusted += pinned.adjusted;
      for (auto &u : pinned.unfixable) {
        summary.fix.unfixable.push_back(std::move(u));
      }
    }
    summary.reached = Stage::FIX;
  }

  summary.check = ultrametric::check(result.tree, options.epsilon, options.maxReported);
  return result;
}

std::string formatReport(const BuildSummary &summary, const directive::IdScheme &scheme) {
  std::ostringstream out;
  out.precision(15);
  out << "kind\tsubject\tdetail\n";

  auto row = [&out](const std::string &kind, const std::string &subject, const auto &detail) {
    out << kind << '\t' << subject << '\t' << detail << '\n';
  };

  row("count", "stage", stageName(summary.reached));
  row("count", "resolved_grafts", summary.graft.resolved());
  row("count", "unresolved_grafts", summary.graft.unresolvedCount());
  row("count", "leaves_without_id", summary.graft.leavesWithoutId);
  row("count", "dated_from_ages", summary.dating.fromAges);
  row("count", "dated_from_lengths", summary.dating.fromLengths);
  row("count", "imputed_dates", summary.dating.imputed);
  row("count", "applied_constraints", summary.calibration.applied);
  row("count", "failed_constraints", summary.calibration.failed.size());
  row("count", "superseded_constraints", summary.calibration.superseded.size());
  row("count", "adjusted_branches", summary.fix.adjusted);
  row("count", "unfixable_nodes", summary.fix.unfixable.size());
  row("count", "leaves", summary.check.leaves);
  row("count", "violating_pairs", summary.check.violatingPairs);
  row("count", "min_depth", summary.check.minDepth);
  row("count", "max_depth", summary.check.maxDepth);

  for (const auto &u : summary.graft.unresolved) {
    row("unresolved_graft", directive::formatLabel(u.label, u.id, {}, scheme), u.source);
  }
  if (summary.dating.rootUndated) {
    row("undated_root", "root", "no supplied age; lengths not rebuilt");
  }
  for (const auto &name : summary.dating.ignored) {
    row("ignored_age", name, "interior median age is zero");
  }
  for (const auto &f : summary.calibration.failed) {
    row("failed_constraint", f.constraint.describe(), f.reason);
  }
  for (const auto &s : summary.calibration.superseded) {
    row("superseded_constraint", s.constraint.describe(), s.achievedAge);
  }
  for (const auto &u : summary.fix.unfixable) {
    row("unfixable", u.name, u.reason);
  }
  for (const auto &v : summary.check.violations) {
    std::ostringstream detail;
    detail.precision(15);
    detail << v.depthA << " vs " << v.depthB;
    row("violation", v.leafA + " | " + v.leafB, detail.str());
  }
  return out.str();
}

} // namespace pipeline
