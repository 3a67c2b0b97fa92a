#include <boost/test/unit_test.hpp>

#include "../minimal_tree.hpp"
#include "../newick.hpp"

using namespace minimal_tree;

struct SpanningFixture {
    SpanningFixture()
        : tree(newick::parseTree("(A,(BA,((BBAA_ott123,BBAB,BBAC,BBAD)BAA,(BBBA)BBB,(BBCA:12.34,BBCB)BBC_ott456:78.9)BB)"
                                 "B_ott789,((CAA,CAB):5.25,CB)C,D)Root;")) {}

    std::string spanning(const std::vector<std::string> &targets) {
        MinimalResult result = extractMinimal(tree, targets);
        missing = result.missing;
        if (!result.tree) {
            return "None";
        }
        return newick::write(*result.tree);
    }

    phylo::PhyloTree tree;
    std::vector<std::string> missing;
};

BOOST_FIXTURE_TEST_SUITE(MinimalTree, SpanningFixture)

BOOST_AUTO_TEST_CASE(singleTarget) {
    BOOST_TEST(spanning({"X", "BBC", "Y"}) == "BBC_ott456:78.9;");
    BOOST_REQUIRE(missing.size() == 2u);
    BOOST_TEST(missing[0] == "X");
    BOOST_TEST(missing[1] == "Y");
}

BOOST_AUTO_TEST_CASE(nothingFound) {
    BOOST_TEST(spanning({"X", "6789"}) == "None");
    BOOST_TEST(missing.size() == 2u);
    BOOST_TEST(spanning({}) == "None");
}

BOOST_AUTO_TEST_CASE(rootedAtMrca) {
    BOOST_TEST(spanning({"BA", "BBBA"}) == "(BA,BBBA)B_ott789;");
    BOOST_TEST(spanning({"CAA", "CAB"}) == "(CAA,CAB):5.25;");
    BOOST_TEST(spanning({"BBAD", "BBAA", "BBAC"}) == "(BBAA_ott123,BBAC,BBAD)BAA;");
    BOOST_TEST(missing.empty());
}

BOOST_AUTO_TEST_CASE(acrossTheRoot) {
    BOOST_TEST(spanning({"BA", "C", "BBC"}) == "((BA,BBC_ott456:78.9)B_ott789,C)Root;");
}

BOOST_AUTO_TEST_CASE(nestedTargetsKept) {
    BOOST_TEST(spanning({"B", "BBC"}) == "(BBC_ott456:78.9)B_ott789;");
    BOOST_TEST(spanning({"BB", "BBC", "B"}) == "((BBC_ott456:78.9)BB)B_ott789;");
    BOOST_TEST(spanning({"BBAB", "B", "BBAD"}) == "((BBAB,BBAD)BAA)B_ott789;");
}

BOOST_AUTO_TEST_CASE(identifiers) {
    BOOST_TEST(spanning({"BBB", "789", "BBCA", "BBCB"}) == "((BBB,(BBCA:12.34,BBCB)BBC_ott456:78.9)BB)B_ott789;");
    BOOST_TEST(spanning({"123", "789", "456"}) == "((BBAA_ott123,BBC_ott456:78.9)BB)B_ott789;");
    BOOST_TEST(spanning({"ott123", "ott456"}) == "(BBAA_ott123,BBC_ott456:78.9)BB;");
}

BOOST_AUTO_TEST_CASE(collapsedLengthsAdd) {
    phylo::PhyloTree weighted = newick::parseTree("((((A:1,X:1)P:2)Q:3,B:4)R:5,C:1)Top;");
    MinimalResult result = extractMinimal(weighted, {"A", "B"});
    BOOST_REQUIRE(result.tree.has_value());
    BOOST_TEST(newick::write(*result.tree) == "(A:6,B:4)R:5;");
}

BOOST_AUTO_TEST_CASE(sourceUnchanged) {
    const std::string before = newick::write(tree);
    spanning({"BA", "C", "BBC"});
    BOOST_TEST(newick::write(tree) == before);
}

BOOST_AUTO_TEST_SUITE_END()
