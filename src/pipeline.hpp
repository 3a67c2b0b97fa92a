#pragma once

/**
 * @file pipeline.hpp
 * @brief One skeleton build: parse, graft, date, calibrate, fix
 *
 * Every stage records recoverable problems in the BuildSummary, which is
 * written out as the per-skeleton report.
 */

#include "calibration.hpp"
#include "dating.hpp"
#include "directive.hpp"
#include "grafting.hpp"
#include "parts.hpp"
#include "phylo_tree.hpp"
#include "reference_index.hpp"
#include "ultrametric.hpp"

#include <cstddef>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace pipeline {

// Last stage to run, in pipeline order
enum class Stage { GRAFT, DATE, CALIBRATE, FIX };

Stage parseStage(const std::string &name);
const char *stageName(Stage stage);

struct Options {
  directive::IdScheme scheme;
  Stage stopAfter = Stage::FIX;
  double epsilon = 1e-6;
  std::optional<double> rootAge;  // pin every leaf to this age after repair
  double maxAdjustment = 5e-6;
  bool collapseUnifurcations = false;
  size_t maxReported = 20;
  // Supplied node ages; the date stage is skipped without them
  const dating::NodeAges *nodeAges = nullptr;
  dating::ImputeOptions impute;
};

// Machine-readable account of every recoverable condition of one build
struct BuildSummary {
  Stage reached = Stage::GRAFT;
  grafting::GraftReport graft;
  dating::DatingReport dating;
  calibration::CalibrationReport calibration;
  ultrametric::FixReport fix;
  ultrametric::UltrametricReport check;

  // Number of conditions a caller may need to act on
  size_t issueCount() const;
  bool clean() const { return issueCount() == 0; }
};

struct BuildResult {
  phylo::PhyloTree tree;
  BuildSummary summary;
};

// parse -> graft -> date -> calibrate -> fix, stopping after options.stopAfter.
// Constraints found in the skeleton's leading comment run before the given
// ones. Fatal conditions throw; everything else ends up in the summary.
BuildResult run(std::string_view skeletonText, const std::vector<calibration::Constraint> &constraints,
                const refindex::ReferenceIndex &index, const parts::PartLibrary *partLibrary, const Options &options);

// kind <TAB> subject <TAB> detail, with a header row
std::string formatReport(const BuildSummary &summary, const directive::IdScheme &scheme = {});

} // namespace pipeline
