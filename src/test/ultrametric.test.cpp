#include <boost/test/unit_test.hpp>

#include "../newick.hpp"
#include "../ultrametric.hpp"

using namespace ultrametric;

BOOST_AUTO_TEST_SUITE(UltrametricCheck)

BOOST_AUTO_TEST_CASE(violatingPairs) {
    auto tree = newick::parseTree("(A:5,(B:2,C:3):2)Root;");
    UltrametricReport report = check(tree, 1e-6);
    BOOST_TEST(!report.ultrametric());
    BOOST_TEST(report.leaves == 3u);
    BOOST_TEST(report.minDepth == 4.0);
    BOOST_TEST(report.maxDepth == 5.0);
    BOOST_TEST(report.violatingPairs == 2u);
    BOOST_REQUIRE(report.violations.size() == 2u);
    BOOST_TEST(report.violations[0].leafA == "B");
    BOOST_TEST(report.violations[0].depthA == 4.0);
    BOOST_TEST(report.violations[0].depthB == 5.0);
}

BOOST_AUTO_TEST_CASE(withinEpsilon) {
    auto tree = newick::parseTree("((A:1,B:1.0000001):1,C:2)R;");
    BOOST_TEST(check(tree, 1e-6).ultrametric());
    BOOST_TEST(!check(tree, 1e-9).ultrametric());
}

BOOST_AUTO_TEST_CASE(absentLengthsAreZero) {
    auto tree = newick::parseTree("((A,B),C)R;");
    UltrametricReport report = check(tree, 1e-6);
    BOOST_TEST(report.ultrametric());
    BOOST_TEST(report.maxDepth == 0.0);
}

BOOST_AUTO_TEST_CASE(depthHistogram) {
    auto tree = newick::parseTree("(A:1,B:1,(C:1,D:1):1)R;");
    UltrametricReport report = check(tree, 1e-6);
    BOOST_REQUIRE(report.depthCounts.size() == 2u);
    BOOST_TEST(report.depthCounts[0].first == 1.0);
    BOOST_TEST(report.depthCounts[0].second == 2u);
    BOOST_TEST(report.depthCounts[1].first == 2.0);
    BOOST_TEST(report.depthCounts[1].second == 2u);
    BOOST_TEST(report.violatingPairs == 4u);
}

BOOST_AUTO_TEST_CASE(reportCap) {
    std::string text = "(";
    for (int i = 0; i < 30; ++i) {
        if (i > 0) text += ",";
        text += "L" + std::to_string(i) + ":" + std::to_string(i + 1);
    }
    text += ")R;";
    UltrametricReport report = check(newick::parseTree(text), 1e-6, 5);
    BOOST_TEST(report.violatingPairs == 30u * 29u / 2u);
    BOOST_TEST(report.violations.size() == 5u);
}

BOOST_AUTO_TEST_CASE(graftSubtreesSkipped) {
    auto tree = newick::parseTree("(A:1,(x:5,y:1)G_ott9@:1,B:1)R;");
    UltrametricReport report = check(tree, 1e-6);
    BOOST_TEST(report.leaves == 2u);
    BOOST_TEST(report.ultrametric());
}

BOOST_AUTO_TEST_SUITE_END()

BOOST_AUTO_TEST_SUITE(UltrametricRepair)

BOOST_AUTO_TEST_CASE(lengthensShortLeaf) {
    auto tree = newick::parseTree("(A:5,(B:2,C:3):2)Root;");
    FixReport report = fix(tree);
    BOOST_TEST(newick::write(tree) == "(A:5,(B:3,C:3):2)Root;");
    BOOST_TEST(report.adjusted == 1u);
    BOOST_TEST(report.unfixable.empty());
    BOOST_TEST(check(tree, 1e-6).ultrametric());
}

BOOST_AUTO_TEST_CASE(internalEdges) {
    auto tree = newick::parseTree("((A:1,B:3):1,(C:2,D:2):5,E)R;");
    FixReport report = fix(tree);
    BOOST_TEST(newick::write(tree) == "((A:3,B:3):4,(C:2,D:2):5,E:7)R;");
    BOOST_TEST(report.adjusted == 3u);
    BOOST_TEST(check(tree, 1e-9).ultrametric());
}

BOOST_AUTO_TEST_CASE(alreadyUltrametric) {
    const std::string text = "((A:1,B:1):1,C:2)R;";
    auto tree = newick::parseTree(text);
    BOOST_TEST(fix(tree).adjusted == 0u);
    BOOST_TEST(newick::write(tree) == text);
}

BOOST_AUTO_TEST_CASE(graftPointsUnfixable) {
    auto tree = newick::parseTree("(A:1,(x:5,y:1)G_ott9@:1,B:2)R;");
    FixReport report = fix(tree);
    BOOST_TEST(newick::write(tree) == "(A:2,(x:5,y:1)G_ott9@:1,B:2)R;");
    BOOST_REQUIRE(report.unfixable.size() == 1u);
    BOOST_TEST(report.unfixable[0].name == "G (9)");
    BOOST_TEST(report.unfixable[0].reason == "unresolved graft point");
}

BOOST_AUTO_TEST_CASE(pinToAge) {
    auto tree = newick::parseTree("(A:2,B:2.000002,C:2.000004)R;");
    FixReport report = fixToAge(tree, 2.000002, 5e-6);
    BOOST_TEST(report.adjusted == 2u);
    BOOST_TEST(report.unfixable.empty());
    for (auto leaf : tree.leaves()) {
        BOOST_TEST(tree.pathLength(leaf) == 2.000002, boost::test_tools::tolerance(1e-12));
    }
}

BOOST_AUTO_TEST_CASE(pinToAgeLimits) {
    auto tree = newick::parseTree("(A:1,B:2,C:0.000001)R;");
    FixReport report = fixToAge(tree, 2.0, 5e-6);
    BOOST_TEST(report.adjusted == 0u);
    BOOST_TEST(report.unfixable.size() == 2u);
    BOOST_TEST(newick::write(tree) == "(A:1,B:2,C:1e-06)R;");

    auto shrinking = newick::parseTree("((A:0.000001):1,B:1)R;");
    FixReport negative = fixToAge(shrinking, 0.999997, 5e-6);
    BOOST_REQUIRE(negative.unfixable.size() == 1u);
    BOOST_TEST(negative.unfixable[0].reason == "edge would become negative");
    BOOST_TEST(negative.adjusted == 1u);
}

BOOST_AUTO_TEST_SUITE_END()
