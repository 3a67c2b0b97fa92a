/**
 * @file main.cpp
 * @brief treegraft - assemble, calibrate and repair time-scaled trees of life
 *
 * A command-line interface for:
 * - Grafting reference subtrees and bespoke parts onto skeleton trees
 * - Applying clade age constraints
 * - Checking and repairing ultrametricity
 * - Exporting reference subtrees and minimal trees
 */

#include <boost/program_options.hpp>
#include <boost/filesystem.hpp>
#include <tbb/blocked_range.h>
#include <tbb/global_control.h>
#include <tbb/parallel_for.h>
#include <iostream>
#include <optional>
#include <string>
#include <vector>

#include "dating.hpp"
#include "logging.hpp"
#include "newick.hpp"
#include "parts.hpp"
#include "pipeline.hpp"
#include "reference_index.hpp"
#include "minimal_tree.hpp"
#include "treegraft_utils.hpp"
#include "ultrametric.hpp"

namespace po = boost::program_options;
namespace fs = boost::filesystem;

// ============================================================================
// Version and Constants
// ============================================================================

constexpr const char* VERSION = "0.1.0";
constexpr const char* PROGRAM_NAME = "treegraft";

// ANSI color codes for terminal output
namespace color {
    constexpr const char* reset = "\033[0m";
    constexpr const char* bold = "\033[1m";
    constexpr const char* dim = "\033[2m";
    constexpr const char* red = "\033[31m";
    constexpr const char* green = "\033[32m";
    constexpr const char* yellow = "\033[33m";
    constexpr const char* cyan = "\033[36m";
}

// ============================================================================
// Configuration
// ============================================================================

struct Config {
    // Input files
    std::string reference;              // Reference taxonomy tree
    std::vector<std::string> skeletons; // Skeleton trees with graft points

    // Output
    std::string output = ".";           // Output directory
    int indent = 0;                     // Pretty-print indentation (0 = one line)

    // Pipeline control
    pipeline::Options options;
    std::string partsDir;
    std::string partMap;
    std::string constraintsFile;
    std::string nodeAgesFile;           // JSON node ages for the date stage
    bool strict = false;

    // Resources
    int threads = 1;

    // Utility modes
    std::vector<std::string> extractIds;
    std::vector<std::string> excludeIds;
    uint32_t ancestors = 0;
    std::vector<std::string> minimalTaxa;
    bool checkOnly = false;

    // Verbosity
    int verbosity = 1;                  // 0=quiet, 1=normal, 2=verbose
};

// ============================================================================
// Utility Functions
// ============================================================================

refindex::ReferenceIndex loadReference(const Config& cfg) {
    logging::msg("Loading reference tree: {}", cfg.reference);
    std::string text = treegraftUtils::readTextFile(cfg.reference);
    phylo::PhyloTree tree;
    {
        TIME_OPERATION("Parsing reference");
        tree = newick::parseTree(text, cfg.options.scheme);
    }
    logging::msg("Reference tree: {} nodes, {} leaves", tree.size(), tree.numLeaves());
    return refindex::ReferenceIndex(std::move(tree));
}

std::vector<calibration::Constraint> loadConstraints(const std::string& path) {
    try {
        return calibration::parseConstraints(treegraftUtils::readTextFile(path));
    } catch (const calibration::ConstraintSyntaxError& e) {
        throw std::runtime_error(path + ": " + e.what());
    }
}

newick::NewickStyle outputStyle(const Config& cfg) {
    newick::NewickStyle style;
    style.idPrefix = cfg.options.scheme.prefix;
    style.indent = cfg.indent;
    return style;
}

// ============================================================================
// Utility Modes
// ============================================================================

int runCheck(const Config& cfg) {
    std::vector<std::string> files;
    if (!cfg.reference.empty()) files.push_back(cfg.reference);
    files.insert(files.end(), cfg.skeletons.begin(), cfg.skeletons.end());

    bool allUltrametric = true;
    for (const auto& file : files) {
        auto tree = newick::parseTree(treegraftUtils::readTextFile(file), cfg.options.scheme);
        auto report = ultrametric::check(tree, cfg.options.epsilon);

        for (const auto& [depth, count] : report.depthCounts) {
            logging::debug("{}: depth {} x {}", file, depth, count);
        }
        for (const auto& v : report.violations) {
            logging::verbose("{}: {} has depth {}, but {} has depth {}", file, v.leafB, v.depthB, v.leafA, v.depthA);
        }

        std::cout << file << '\t' << (report.ultrametric() ? "ultrametric" : "not_ultrametric") << '\t'
                  << report.leaves << '\t' << report.minDepth << '\t' << report.maxDepth << '\t'
                  << report.violatingPairs << '\n';
        allUltrametric = allUltrametric && report.ultrametric();
    }
    return (cfg.strict && !allUltrametric) ? 2 : 0;
}

int runExtract(const Config& cfg, const refindex::ReferenceIndex& index) {
    refindex::ExtractOptions opts;
    opts.collapseUnifurcations = cfg.options.collapseUnifurcations;
    opts.includedAncestors = cfg.ancestors;

    auto result = index.extractMany(cfg.extractIds, cfg.excludeIds, opts);
    auto style = outputStyle(cfg);

    if (result.subtrees.size() == 1) {
        std::cout << newick::write(result.subtrees.begin()->second, style) << "\n";
    } else {
        for (const auto& [id, tree] : result.subtrees) {
            std::cout << id << ": " << newick::write(tree, style) << "\n";
        }
    }
    return (cfg.strict && !result.missing.empty()) ? 2 : 0;
}

int runMinimal(const Config& cfg, const phylo::PhyloTree& tree) {
    auto result = minimal_tree::extractMinimal(tree, cfg.minimalTaxa, cfg.options.scheme);
    if (result.tree) {
        std::cout << newick::write(*result.tree, outputStyle(cfg)) << "\n";
    }
    return (cfg.strict && !result.missing.empty()) ? 2 : 0;
}

// ============================================================================
// Tree Building
// ============================================================================

struct SkeletonOutcome {
    bool ok = false;
    bool clean = false;
    std::string error;
};

SkeletonOutcome buildSkeleton(const Config& cfg, const std::string& path, const refindex::ReferenceIndex& index,
                              const parts::PartLibrary* partLibrary,
                              const std::vector<calibration::Constraint>& globalConstraints) {
    SkeletonOutcome outcome;
    std::string stem = treegraftUtils::fileStem(path);

    std::vector<calibration::Constraint> constraints;
    std::string sidecar = treegraftUtils::replaceExtension(path, ".mrca");
    if (treegraftUtils::fileExists(sidecar)) {
        constraints = loadConstraints(sidecar);
        logging::info("{}: {} constraints from {}", stem, constraints.size(), sidecar);
    }
    constraints.insert(constraints.end(), globalConstraints.begin(), globalConstraints.end());

    auto built = pipeline::run(treegraftUtils::readTextFile(path), constraints, index, partLibrary, cfg.options);
    auto style = outputStyle(cfg);

    std::string base = (fs::path(cfg.output) / stem).string();
    treegraftUtils::writeTextFile(base + ".nwk", newick::write(built.tree, style) + "\n");
    treegraftUtils::writeTextFile(base + ".report.tsv", pipeline::formatReport(built.summary, cfg.options.scheme));

    if (!cfg.minimalTaxa.empty()) {
        auto minimal = minimal_tree::extractMinimal(built.tree, cfg.minimalTaxa, cfg.options.scheme);
        if (minimal.tree) {
            treegraftUtils::writeTextFile(base + ".minimal.nwk", newick::write(*minimal.tree, style) + "\n");
        }
    }

    logging::msg("{}: {} nodes, {} grafted, {} unresolved, {} issues -> {}.nwk", stem, built.tree.size(),
                 built.summary.graft.resolved(), built.summary.graft.unresolvedCount(),
                 built.summary.issueCount(), base);

    outcome.ok = true;
    outcome.clean = built.summary.clean();
    return outcome;
}

// ============================================================================
// Main Entry Point
// ============================================================================

void printUsage() {
    std::cout << color::bold << "treegraft" << color::reset << " v" << VERSION << "\n";
    std::cout << "Assemble, calibrate and repair time-scaled trees of life\n\n";

    std::cout << color::bold << "USAGE:" << color::reset << "\n";
    std::cout << "  treegraft [OPTIONS] <reference.tre> [skeleton.phy ...]\n\n";

    std::cout << color::bold << "EXAMPLES:" << color::reset << "\n";
    std::cout << "  # Build every skeleton (graft -> calibrate -> fix)\n";
    std::cout << "  treegraft ott.tre Base.PHY Amorphea.PHY -o build --part-map parts.tsv --parts include_files\n\n";

    std::cout << "  # Graft only, keep the raw lengths\n";
    std::cout << "  treegraft ott.tre Base.PHY --stop graft\n\n";

    std::cout << "  # Export two reference clades without one descendant\n";
    std::cout << "  treegraft ott.tre --extract 244265 770315 --exclude 417950\n\n";

    std::cout << "  # Check trees for ultrametricity\n";
    std::cout << "  treegraft --check build/Base.nwk\n\n";

    std::cout << color::bold << "PIPELINE STAGES:" << color::reset << "\n";
    std::cout << "  graft      Stop after grafting\n";
    std::cout << "  date       Stop after dating nodes from --node-ages\n";
    std::cout << "  calibrate  Stop after applying age constraints\n";
    std::cout << "  fix        Full pipeline through ultrametric repair (default)\n\n";

    std::cout << color::bold << "OPTIONS:" << color::reset << "\n";
}

int main(int argc, char** argv) {
    Config cfg;
    double rootAge = 0.0;

    // Define options
    po::options_description general("General");
    general.add_options()
        ("help,h", "Show this help message")
        ("version,V", "Show version")
        ("threads,t", po::value<int>(&cfg.threads)->default_value(1), "Number of threads")
        ("output,o", po::value<std::string>(&cfg.output)->default_value("."), "Output directory")
        ("verbose,v", po::bool_switch(), "Verbose output")
        ("quiet,q", po::bool_switch(), "Suppress non-essential output");

    po::options_description pipelineOpts("Pipeline Control");
    pipelineOpts.add_options()
        ("stop", po::value<std::string>()->default_value("fix"),
            "Stop after stage: graft|date|calibrate|fix")
        ("parts", po::value<std::string>(&cfg.partsDir), "Directory holding bespoke part files")
        ("part-map", po::value<std::string>(&cfg.partMap), "Part map (token, file, edge length, taxon)")
        ("constraints", po::value<std::string>(&cfg.constraintsFile),
            "Age constraints applied to every skeleton")
        ("node-ages", po::value<std::string>(&cfg.nodeAgesFile),
            "JSON node ages; dates the grafted tree and rebuilds its lengths")
        ("long-path-weight", po::value<double>(&cfg.options.impute.longPathWeight)->default_value(0.25),
            "Weight of longest-path interpolation for undated nodes")
        ("date-spacing", po::value<double>(&cfg.options.impute.spacing)->default_value(0.0),
            "Spacing of interpolated dates: 0 even, >0 older, <0 younger")
        ("id-prefix", po::value<std::string>(&cfg.options.scheme.prefix)->default_value("ott"),
            "Prefix of taxon identifiers in labels")
        ("epsilon", po::value<double>(&cfg.options.epsilon)->default_value(1e-6),
            "Ultrametricity tolerance")
        ("root-age", po::value<double>(&rootAge), "Pin every leaf to this age after repair")
        ("max-adjustment", po::value<double>(&cfg.options.maxAdjustment)->default_value(5e-6),
            "Largest leaf adjustment allowed with --root-age")
        ("collapse-unifurcations", po::bool_switch(&cfg.options.collapseUnifurcations),
            "Splice out single-child nodes left by exclusions")
        ("strict", po::bool_switch(&cfg.strict), "Exit with status 2 when any issue is reported")
        ("indent", po::value<int>(&cfg.indent)->default_value(0),
            "Indent output trees by N spaces per level");

    po::options_description utility("Utility");
    utility.add_options()
        ("extract", po::value<std::vector<std::string>>(&cfg.extractIds)->multitoken(),
            "Export reference subtrees for these taxa")
        ("exclude", po::value<std::vector<std::string>>(&cfg.excludeIds)->multitoken(),
            "Taxa to leave out of exported subtrees")
        ("ancestors", po::value<uint32_t>(&cfg.ancestors)->default_value(0),
            "Number of ancestors to wrap around each exported subtree")
        ("minimal", po::value<std::vector<std::string>>(&cfg.minimalTaxa)->multitoken(),
            "Export the minimal tree spanning these taxa")
        ("check", po::bool_switch(&cfg.checkOnly), "Only check the given trees for ultrametricity");

    po::options_description hidden("Hidden");
    hidden.add_options()
        ("reference", po::value<std::string>(&cfg.reference), "")
        ("skeletons", po::value<std::vector<std::string>>(&cfg.skeletons), "");

    po::positional_options_description pos;
    pos.add("reference", 1).add("skeletons", -1);

    po::options_description all;
    all.add(general).add(pipelineOpts).add(utility).add(hidden);

    po::options_description visible;
    visible.add(general).add(pipelineOpts).add(utility);

    // Parse
    po::variables_map vm;
    try {
        po::store(po::command_line_parser(argc, argv)
            .options(all).positional(pos).run(), vm);
        po::notify(vm);
    } catch (const po::error& e) {
        std::cerr << color::red << "Error: " << e.what() << color::reset << "\n\n";
        printUsage();
        std::cout << visible << "\n";
        return 1;
    }

    // Handle help/version
    if (vm.count("help") || argc == 1) {
        printUsage();
        std::cout << visible << "\n";
        return 0;
    }

    if (vm.count("version")) {
        std::cout << PROGRAM_NAME << " " << VERSION << "\n";
        return 0;
    }

    // Verbosity
    if (vm["verbose"].as<bool>()) cfg.verbosity = 2;
    if (vm["quiet"].as<bool>()) cfg.verbosity = 0;

    logging::initSpdlog();
    if (cfg.verbosity == 0) logging::setLoggingLevel(logging::LogLevel::QUIET);
    if (cfg.verbosity == 2) logging::setLoggingLevel(logging::LogLevel::VERBOSE);

    // Validate required args
    if (cfg.reference.empty()) {
        std::cerr << color::red << "Error: reference tree required" << color::reset << "\n";
        return 1;
    }
    if (vm.count("root-age")) {
        cfg.options.rootAge = rootAge;
    }
    if (cfg.indent < 0) {
        std::cerr << color::red << "Error: --indent must not be negative" << color::reset << "\n";
        return 1;
    }
    if (cfg.options.impute.longPathWeight < 0.0 || cfg.options.impute.longPathWeight > 1.0) {
        std::cerr << color::red << "Error: --long-path-weight must be between 0 and 1" << color::reset << "\n";
        return 1;
    }
    if (!cfg.partsDir.empty() && cfg.partMap.empty()) {
        logging::warn("--parts given without --part-map; part graft points will stay unresolved");
    }

    try {
        cfg.options.stopAfter = pipeline::parseStage(vm["stop"].as<std::string>());
    } catch (const std::runtime_error& e) {
        std::cerr << color::red << "Error: " << e.what() << color::reset << "\n";
        return 1;
    }

    // Initialize threading
    tbb::global_control tbb_ctl(tbb::global_control::max_allowed_parallelism, cfg.threads);

    // ========================================================================
    // Print Configuration Summary
    // ========================================================================

    auto printConfigSummary = [&]() {
        if (cfg.verbosity == 0) return;  // Skip in quiet mode
        if (cfg.checkOnly || !cfg.extractIds.empty() || cfg.skeletons.empty()) return;  // Skip for utility modes

        std::string stageStr;
        switch (cfg.options.stopAfter) {
            case pipeline::Stage::GRAFT:     stageStr = "graft"; break;
            case pipeline::Stage::DATE:      stageStr = "graft → date"; break;
            case pipeline::Stage::CALIBRATE: stageStr = "graft → date → calibrate"; break;
            case pipeline::Stage::FIX:       stageStr = "graft → date → calibrate → fix"; break;
        }

        // Header
        std::cout << color::bold << color::cyan << "┌─ treegraft " << color::reset
                  << color::dim << "v" << VERSION << color::reset
                  << color::bold << color::cyan << " ─";
        for (int i = 0; i < 47; i++) std::cout << "─";
        std::cout << "┐" << color::reset << "\n";

        std::cout << color::bold << color::cyan << "│" << color::reset << " "
                  << color::bold << "Input:  " << color::reset
                  << color::yellow << cfg.reference << color::reset
                  << "  " << color::dim << "+" << color::reset << " " << cfg.skeletons.size() << " skeleton(s)\n";

        std::cout << color::bold << color::cyan << "│" << color::reset << " "
                  << color::bold << "Output: " << color::reset
                  << color::green << cfg.output << color::reset << "/*.nwk\n";

        std::cout << color::bold << color::cyan << "│" << color::reset << " "
                  << color::bold << "Stages: " << color::reset << stageStr << "\n";

        std::cout << color::bold << color::cyan << "│" << color::reset << " "
                  << color::bold << "Config: " << color::reset
                  << color::dim << "threads=" << color::reset << cfg.threads
                  << color::dim << "  epsilon=" << color::reset << cfg.options.epsilon
                  << color::dim << "  prefix=" << color::reset << cfg.options.scheme.prefix;
        if (cfg.options.rootAge) {
            std::cout << color::dim << "  root-age=" << color::reset << *cfg.options.rootAge;
        }
        if (cfg.options.collapseUnifurcations) {
            std::cout << "  " << color::yellow << "collapse" << color::reset;
        }
        if (cfg.strict) {
            std::cout << "  " << color::yellow << "strict" << color::reset;
        }
        std::cout << "\n";

        // Footer
        std::cout << color::bold << color::cyan << "└";
        for (int i = 0; i < 68; i++) std::cout << "─";
        std::cout << "┘" << color::reset << "\n\n";
    };

    printConfigSummary();

    // ========================================================================
    // Run Pipeline
    // ========================================================================

    try {
        // Utility: ultrametricity check, no reference index needed
        if (cfg.checkOnly) {
            return runCheck(cfg);
        }

        const refindex::ReferenceIndex index = loadReference(cfg);

        // Utility: reference subtree export
        if (!cfg.extractIds.empty()) {
            return runExtract(cfg, index);
        }

        // Utility: minimal tree of the reference itself
        if (cfg.skeletons.empty()) {
            if (!cfg.minimalTaxa.empty()) {
                return runMinimal(cfg, index.tree());
            }
            logging::msg("No skeleton trees given. Reference indexed, nothing else to do.");
            return 0;
        }

        std::optional<parts::PartLibrary> partLibrary;
        if (!cfg.partMap.empty()) {
            partLibrary = parts::PartLibrary::load(cfg.partMap, cfg.partsDir, cfg.options.scheme);
        }

        dating::NodeAges nodeAges;
        if (!cfg.nodeAgesFile.empty()) {
            nodeAges = dating::parseNodeAges(treegraftUtils::readTextFile(cfg.nodeAgesFile));
            cfg.options.nodeAges = &nodeAges;
            logging::info("Ages for {} taxa from {}", nodeAges.size(), cfg.nodeAgesFile);
        }

        std::vector<calibration::Constraint> globalConstraints;
        if (!cfg.constraintsFile.empty()) {
            globalConstraints = loadConstraints(cfg.constraintsFile);
            logging::info("{} constraints from {}", globalConstraints.size(), cfg.constraintsFile);
        }

        treegraftUtils::requireDistinctStems(cfg.skeletons);
        treegraftUtils::ensureDirectory(cfg.output);

        // Each skeleton is an independent run sharing the read-only index and parts
        std::vector<SkeletonOutcome> outcomes(cfg.skeletons.size());
        const parts::PartLibrary* partsPtr = partLibrary ? &*partLibrary : nullptr;
        tbb::parallel_for(tbb::blocked_range<size_t>(0, cfg.skeletons.size()),
            [&](const tbb::blocked_range<size_t>& range) {
                for (size_t i = range.begin(); i != range.end(); ++i) {
                    try {
                        outcomes[i] = buildSkeleton(cfg, cfg.skeletons[i], index, partsPtr, globalConstraints);
                    } catch (const std::exception& e) {
                        logging::err("{}: {}", cfg.skeletons[i], e.what());
                        outcomes[i].error = e.what();
                    }
                }
            });

        size_t failed = 0;
        size_t withIssues = 0;
        for (const auto& outcome : outcomes) {
            if (!outcome.ok) ++failed;
            else if (!outcome.clean) ++withIssues;
        }

        if (failed > 0) {
            logging::err("{} of {} skeletons failed", failed, outcomes.size());
            return 1;
        }
        if (withIssues > 0) {
            logging::warn("{} of {} trees have issues, see the .report.tsv files", withIssues, outcomes.size());
            if (cfg.strict) return 2;
        }

        logging::msg("{}Done.{} {} trees written to {}", color::green, color::reset, outcomes.size(), cfg.output);
        return 0;

    } catch (const std::exception& e) {
        logging::err("Fatal error: {}", e.what());
        return 1;
    }
}
