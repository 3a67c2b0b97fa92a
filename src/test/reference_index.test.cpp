#include <boost/test/unit_test.hpp>

#include "../newick.hpp"
#include "../reference_index.hpp"

using namespace refindex;

namespace {

ReferenceIndex indexOf(const std::string &text) {
    return ReferenceIndex(newick::parseTree(text));
}

std::string extracted(const ReferenceIndex &index, const std::string &id, const std::vector<std::string> &excluded,
                      const ExtractOptions &options = {}) {
    auto tree = index.extract(id, excluded, options);
    BOOST_REQUIRE_MESSAGE(tree.has_value(), "nothing extracted for " << id);
    return newick::write(*tree);
}

} // namespace

struct CladeFixture {
    CladeFixture()
        : index(indexOf("((A_ott11:1,B_ott12:2)C_ott3:3,D_ott4:4,(F_ott61,G_ott62)H_ott6)E_ott5;")) {}

    ReferenceIndex index;
};

BOOST_AUTO_TEST_SUITE(ReferenceLookup)

BOOST_AUTO_TEST_CASE(identifiersAndLabels) {
    ReferenceIndex index = indexOf("((A,B)X,(C,D)X,E_ott7)R;");
    BOOST_TEST(index.size() == 1u);
    BOOST_TEST(index.contains("7"));
    BOOST_TEST(index.contains("R"));
    BOOST_TEST(index.contains("E"));
    // "X" names two clades
    BOOST_TEST(!index.contains("X"));
    BOOST_TEST(!index.lookup("missing").has_value());
}

BOOST_AUTO_TEST_CASE(buildFromTree) {
    ReferenceIndex index = ReferenceIndex::build(newick::parseTree("(A_ott1,B_ott2)R_ott3;"));
    BOOST_TEST(index.size() == 3u);
    BOOST_TEST(index.tree().node(*index.lookup("2")).label == "B");
}

BOOST_AUTO_TEST_CASE(duplicateIdentifier) {
    BOOST_CHECK_THROW(indexOf("(A_ott1,B_ott1);"), DuplicateIdError);
    try {
        indexOf("(A_ott1,(B_ott1,C)D)R;");
        BOOST_FAIL("expected DuplicateIdError");
    } catch (const DuplicateIdError &e) {
        BOOST_TEST(e.id() == "1");
        BOOST_TEST(std::string(e.what()) == "duplicate identifier '1' in reference tree (A (1) and B (1))");
    }
}

BOOST_AUTO_TEST_SUITE_END()

BOOST_AUTO_TEST_SUITE(ReferenceExtraction)

BOOST_AUTO_TEST_CASE(excludeOneChild) {
    ReferenceIndex index = indexOf("(P:1,Q:1,R:1)X:1;");
    BOOST_TEST(extracted(index, "X", {"Q"}) == "(P:1,R:1)X:1;");
    BOOST_TEST(extracted(index, "X", {}) == "(P:1,Q:1,R:1)X:1;");
}

BOOST_AUTO_TEST_CASE(nestedExclusions) {
    ReferenceIndex index = indexOf("((A,B)C,D)E;");
    BOOST_TEST(extracted(index, "E", {"B", "C"}) == "(D)E;");
}

BOOST_AUTO_TEST_CASE(unifurcationsKeptByDefault) {
    ReferenceIndex index = indexOf("((A:1,B:2)C:3,D:4)E;");
    BOOST_TEST(extracted(index, "E", {"B"}) == "((A:1)C:3,D:4)E;");
}

BOOST_AUTO_TEST_CASE(collapseUnifurcations) {
    ReferenceIndex index = indexOf("((A:1,B:2)C:3,D:4)E;");
    ExtractOptions options;
    options.collapseUnifurcations = true;
    BOOST_TEST(extracted(index, "E", {"B"}, options) == "(A:4,D:4)E;");

    // The clade root itself stays even with a single child left
    BOOST_TEST(extracted(index, "E", {"C"}, options) == "(D:4)E;");
}

BOOST_FIXTURE_TEST_CASE(byIdentifier, CladeFixture) {
    BOOST_TEST(extracted(index, "3", {}) == "(A_ott11:1,B_ott12:2)C_ott3:3;");
    BOOST_TEST(extracted(index, "5", {"3", "62"}) == "(D_ott4:4,(F_ott61)H_ott6)E_ott5;");
    BOOST_TEST(!index.extract("999", {}).has_value());
}

BOOST_FIXTURE_TEST_CASE(excludingTheRootIsIgnored, CladeFixture) {
    BOOST_TEST(extracted(index, "3", {"3", "12"}) == "(A_ott11:1)C_ott3:3;");
}

BOOST_FIXTURE_TEST_CASE(ancestors, CladeFixture) {
    ExtractOptions options;
    options.includedAncestors = 1;
    BOOST_TEST(extracted(index, "3", {}, options) == "((A_ott11:1,B_ott12:2)C_ott3:3)E_ott5;");

    // Stops at the reference root
    options.includedAncestors = 4;
    BOOST_TEST(extracted(index, "11", {}, options) == "((A_ott11:1)C_ott3)E_ott5;");
}

BOOST_FIXTURE_TEST_CASE(referenceUnchanged, CladeFixture) {
    const std::string before = newick::write(index.tree());
    ExtractOptions options;
    options.collapseUnifurcations = true;
    index.extract("5", {"3", "61"}, options);
    BOOST_TEST(newick::write(index.tree()) == before);
}

BOOST_FIXTURE_TEST_CASE(extractInto, CladeFixture) {
    phylo::PhyloTree dest = newick::parseTree("(Z)Top;");
    auto top = index.extractInto(dest, "6", {});
    BOOST_REQUIRE(top.has_value());
    BOOST_TEST(dest.parent(*top) == phylo::PhyloTree::NO_PARENT);
    dest.attach(dest.root(), *top);
    BOOST_TEST(newick::write(dest) == "(Z,(F_ott61,G_ott62)H_ott6)Top;");
}

BOOST_FIXTURE_TEST_CASE(extractMany, CladeFixture) {
    ExtractManyResult result = index.extractMany({"3", "999", "6", "3"}, {"12"});
    BOOST_TEST(result.subtrees.size() == 2u);
    BOOST_REQUIRE(result.missing.size() == 1u);
    BOOST_TEST(result.missing[0] == "999");
    BOOST_TEST(newick::write(result.subtrees.at("3")) == "(A_ott11:1)C_ott3:3;");
    BOOST_TEST(newick::write(result.subtrees.at("6")) == "(F_ott61,G_ott62)H_ott6;");
}

BOOST_AUTO_TEST_SUITE_END()
