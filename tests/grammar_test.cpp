#include "bang/grammar.h"

#include <vector>

#include "gtest/gtest.h"

using namespace bang;

namespace {

using K = TokenKind;

Line printQuoted(K quote) {
    llvm::StringRef q = quote == K::SingleQuote ? "'" : "\"";
    return {Token(K::PrintKeyword, "print"), Token(K::OpenParen, "("), Token(quote, q),
            Token(K::Identifier, "hi"), Token(quote, q), Token(K::CloseParen, ")")};
}

TEST(GrammarTest, PrintTemplateMatches) {
    EXPECT_TRUE(matchesShape(printQuoted(K::SingleQuote), "print"));
    EXPECT_TRUE(matchesShape(printQuoted(K::DoubleQuote), "print"));
    EXPECT_FALSE(matchesShape(printQuoted(K::SingleQuote), "var"));
}

TEST(GrammarTest, PrintShapesAreRegistered) {
    auto shapes = getShapes("print");
    ASSERT_EQ(3u, shapes.size());
    std::vector<K> singleQuoted = {K::PrintKeyword, K::OpenParen, K::SingleQuote,
                                   K::Identifier,   K::SingleQuote, K::CloseParen};
    EXPECT_EQ(singleQuoted, std::vector<K>(shapes[0].kinds.begin(), shapes[0].kinds.end()));
    for (const Shape &shape : shapes)
        EXPECT_EQ("print", shape.statement);
}

TEST(GrammarTest, UnknownStatementHasNoShapes) {
    EXPECT_TRUE(getShapes("loop").empty());
    EXPECT_FALSE(matchesShape(printQuoted(K::SingleQuote), "loop"));
}

TEST(GrammarTest, MatchIsExactLength) {
    Line line = printQuoted(K::SingleQuote);
    line.pop_back();
    EXPECT_FALSE(matchesShape(line, "print"));
    EXPECT_EQ(nullptr, findShape(line));

    line = printQuoted(K::SingleQuote);
    line.push_back(Token(K::Identifier, "extra"));
    EXPECT_EQ(nullptr, findShape(line));
}

TEST(GrammarTest, QuotesMustPair) {
    Line line = printQuoted(K::SingleQuote);
    line[4] = Token(K::DoubleQuote, "\"");
    EXPECT_EQ(nullptr, findShape(line));
}

TEST(GrammarTest, FindShapeReportsForm) {
    Line printName = {Token(K::PrintKeyword, "print"), Token(K::OpenParen, "("),
                      Token(K::Identifier, "x"), Token(K::CloseParen, ")")};
    const Shape *shape = findShape(printName);
    ASSERT_NE(nullptr, shape);
    EXPECT_EQ(ShapeKind::PrintVariable, shape->kind);

    Line varNumber = {Token(K::VarKeyword, "var"), Token(K::Identifier, "x"),
                      Token(K::Assign, "="), Token(K::Integer, "1")};
    shape = findShape(varNumber);
    ASSERT_NE(nullptr, shape);
    EXPECT_EQ(ShapeKind::VarNumber, shape->kind);
    EXPECT_TRUE(matchesShape(varNumber, "var"));

    EXPECT_EQ(nullptr, findShape(Line()));
}

} // end anonymous namespace
