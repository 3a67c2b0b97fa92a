#include <boost/test/unit_test.hpp>

#include "../newick.hpp"

#include <string>

using namespace newick;

namespace {

std::string roundTrip(const std::string &text) {
    return write(parseTree(text));
}

ParseError parseFailure(const std::string &text) {
    try {
        parseTree(text);
    } catch (const ParseError &e) {
        return e;
    }
    BOOST_FAIL("expected a ParseError for " << text);
    return ParseError("", 0, 0, 0);
}

} // namespace

BOOST_AUTO_TEST_SUITE(NewickParsing)

BOOST_AUTO_TEST_CASE(structure) {
    phylo::PhyloTree tree = parseTree("(A:1,(B:1,C:1):2)Root;");
    BOOST_REQUIRE(tree.size() == 5u);
    BOOST_TEST(tree.numLeaves() == 3u);

    const auto &root = tree.node(tree.root());
    BOOST_TEST(root.label == "Root");
    BOOST_TEST(!root.branchLength.has_value());
    BOOST_REQUIRE(root.children.size() == 2u);

    const auto &inner = tree.node(root.children[1]);
    BOOST_TEST(inner.label.empty());
    BOOST_TEST(*inner.branchLength == 2.0);
    BOOST_TEST(tree.node(inner.children[0]).label == "B");
    BOOST_TEST(tree.node(inner.children[1]).label == "C");
}

BOOST_AUTO_TEST_CASE(roundTrips) {
    for (const std::string text : {"(A:1,(B:1,C:1):2)Root;", "((A,B),(C,D));", "A;", "(A:0.1,B:0)R:0.5;",
                                   "(Brachiopoda_ott826261@,foobar_ott123~-789-111@,AMORPHEA@)Root_ott1;",
                                   "(Amoebozoa_ott1~-2=Amoebae@:3,X)Y;", "((((A))));"}) {
        BOOST_TEST(roundTrip(text) == text);
    }
}

BOOST_AUTO_TEST_CASE(identifiersAndDirectives) {
    phylo::PhyloTree tree = parseTree("(Brachiopoda_ott826261@,Plain_ott5:2)Root;");
    const auto &kids = tree.children(tree.root());
    BOOST_TEST(tree.isGraftPoint(kids[0]));
    BOOST_TEST(*tree.node(kids[0]).id == "826261");
    BOOST_TEST(!tree.isGraftPoint(kids[1]));
    BOOST_TEST(tree.node(kids[1]).label == "Plain");
    BOOST_TEST(*tree.node(kids[1]).id == "5");
}

BOOST_AUTO_TEST_CASE(quotedLabels) {
    phylo::PhyloTree tree = parseTree("('Homo sapiens':1,'it''s',\"a,b\");");
    const auto &kids = tree.children(tree.root());
    BOOST_TEST(tree.node(kids[0]).label == "Homo sapiens");
    BOOST_TEST(tree.node(kids[1]).label == "it's");
    BOOST_TEST(tree.node(kids[2]).label == "a,b");
    BOOST_TEST(write(tree) == "('Homo sapiens':1,'it''s','a,b');");
}

BOOST_AUTO_TEST_CASE(unquotedSpaces) {
    phylo::PhyloTree tree = parseTree("( Homo sapiens ,B );");
    BOOST_TEST(tree.node(tree.children(tree.root())[0]).label == "Homo sapiens");
    BOOST_TEST(write(tree) == "('Homo sapiens',B);");
}

BOOST_AUTO_TEST_CASE(comments) {
    ParseResult result = parse("[mrca: A, B, fixage=10;]\n[second [nested] block]\n(A[&&NHX:x=1],B)[end];");
    BOOST_TEST(result.leadingComment == "mrca: A, B, fixage=10;\nsecond [nested] block");
    BOOST_TEST(write(result.tree) == "(A,B);");

    BOOST_TEST(parse("(A,B);").leadingComment.empty());
}

BOOST_AUTO_TEST_CASE(whitespaceAndTrailingComment) {
    BOOST_TEST(roundTrip("  (\n  A : 1 ,\n  B\n) R ;\n [trailing]\n") == "(A:1,B)R;");
}

BOOST_AUTO_TEST_CASE(deepNesting) {
    const size_t depth = 100000;
    std::string text(depth, '(');
    text += "A";
    text += std::string(depth, ')');
    text += ";";

    phylo::PhyloTree tree = parseTree(text);
    BOOST_TEST(tree.size() == depth + 1);
    BOOST_TEST(tree.numLeaves() == 1u);
    BOOST_TEST(write(tree) == text);
}

BOOST_AUTO_TEST_SUITE_END()

BOOST_AUTO_TEST_SUITE(NewickErrors)

BOOST_AUTO_TEST_CASE(emptyInput) {
    BOOST_TEST(parseFailure("").reason() == "empty input");
    BOOST_TEST(parseFailure("  \n ").reason() == "empty input");
    BOOST_TEST(parseFailure("[only a comment]").reason() == "empty input");
}

BOOST_AUTO_TEST_CASE(unbalanced) {
    ParseError open = parseFailure("(A,(B,C);");
    BOOST_TEST(open.reason().find("unbalanced parentheses") == 0u);

    ParseError unclosed = parseFailure("(A,B");
    BOOST_TEST(unclosed.reason() == "unbalanced parentheses: 1 unclosed '('");
    BOOST_TEST(unclosed.offset() == 0u);

    ParseError extra = parseFailure("(A,B));");
    BOOST_TEST(extra.reason() == "unbalanced parentheses: unexpected ')'");
    BOOST_TEST(extra.column() == 6u);
}

BOOST_AUTO_TEST_CASE(terminator) {
    BOOST_TEST(parseFailure("(A,B)").reason() == "expected a semicolon at the end of the tree");
    BOOST_TEST(parseFailure("(A,B);C;").reason() == "unexpected text after the end of the tree");
    BOOST_TEST(parseFailure("(A:1 B,C);").reason() == "expected ',' or ')', found 'B'");
}

BOOST_AUTO_TEST_CASE(lengths) {
    BOOST_TEST(parseFailure("(A:x,B);").reason() == "'x' is not a valid edge length");
    BOOST_TEST(parseFailure("(A:1.5.2,B);").reason() == "'1.5.2' is not a valid edge length");
    BOOST_TEST(parseFailure("(A:nan,B);").reason() == "'nan' is not a valid edge length");
    BOOST_TEST(parseFailure("(A:-1,B);").reason() == "negative edge length '-1'");
    BOOST_TEST(parseFailure("(A:,B);").reason() == "missing edge length after ':'");
}

BOOST_AUTO_TEST_CASE(location) {
    ParseError e = parseFailure("(A,\nB:abc);");
    BOOST_TEST(e.line() == 2u);
    BOOST_TEST(e.column() == 3u);
    BOOST_TEST(e.offset() == 6u);
    BOOST_TEST(std::string(e.what()) == "line 2, column 3 (offset 6): 'abc' is not a valid edge length");
}

BOOST_AUTO_TEST_CASE(unterminated) {
    BOOST_TEST(parseFailure("('open,B);").reason() == "unterminated quoted label");
    BOOST_TEST(parseFailure("(A,B)[never closed;").reason() == "unterminated comment");
}

BOOST_AUTO_TEST_CASE(badDirective) {
    ParseError e = parseFailure("(X_ott1~-@,B);");
    BOOST_TEST(e.reason().find("bad label 'X_ott1~-@'") == 0u);
}

BOOST_AUTO_TEST_SUITE_END()

BOOST_AUTO_TEST_SUITE(NewickWriting)

BOOST_AUTO_TEST_CASE(lengthFormatting) {
    BOOST_TEST(formatLength(78.9) == "78.9");
    BOOST_TEST(formatLength(5.25) == "5.25");
    BOOST_TEST(formatLength(2.0) == "2");
    BOOST_TEST(formatLength(1.0 / 3.0) == "0.333333333333333");
    BOOST_TEST(formatLength(1.0 / 3.0, 4) == "0.3333");
}

BOOST_AUTO_TEST_CASE(quoting) {
    BOOST_TEST(quoteLabel("Homo_sapiens") == "Homo_sapiens");
    BOOST_TEST(quoteLabel("Homo sapiens") == "'Homo sapiens'");
    BOOST_TEST(quoteLabel("a(b)") == "'a(b)'");
    BOOST_TEST(quoteLabel("it's") == "'it''s'");
}

BOOST_AUTO_TEST_CASE(indented) {
    NewickStyle style;
    style.indent = 2;
    phylo::PhyloTree tree = parseTree("(A:1,(B,C)D)E;");
    std::string pretty = write(tree, style);
    BOOST_TEST(pretty == "(\n  A:1,\n  (\n    B,\n    C\n  )D\n)E;");
    BOOST_TEST(roundTrip(pretty) == "(A:1,(B,C)D)E;");
}

BOOST_AUTO_TEST_CASE(subtreeAndPrefix) {
    phylo::PhyloTree tree = parseTree("(A_ott1,(B_ott2,C_ott3)D_ott4)E;");
    uint32_t d = *tree.findById("4");
    BOOST_TEST(writeSubtree(tree, d) == "(B_ott2,C_ott3)D_ott4;");

    NewickStyle style;
    style.idPrefix = "ncbi";
    BOOST_TEST(writeSubtree(tree, d, style) == "(B_ncbi2,C_ncbi3)D_ncbi4;");

    BOOST_TEST(write(phylo::PhyloTree{}) == ";");
}

BOOST_AUTO_TEST_SUITE_END()
