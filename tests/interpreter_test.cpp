#include "bang/interpreter.h"

#include <string>
#include <vector>

#include "gtest/gtest.h"

#include "bang/ast.h"
#include "bang/error.h"
#include "bang/lexer.h"

using namespace bang;

namespace {

class InterpreterTest : public ::testing::Test {
protected:
    InterpreterTest() : os(output), ctx(os), interp(ctx) {}

    llvm::Error run(llvm::StringRef source) {
        Lexer lexer(source);
        auto lines = lexer.tokenize();
        if (!lines)
            return lines.takeError();
        llvm::Error err = interp.run(*lines);
        os.flush();
        return err;
    }

    void runOk(llvm::StringRef source) {
        if (llvm::Error err = run(source))
            FAIL() << llvm::toString(std::move(err));
    }

    std::string output;
    llvm::raw_string_ostream os;
    InterpContext ctx;
    Interpreter interp;
};

TEST_F(InterpreterTest, DeclarationsFillTheTable) {
    runOk("var a = 'x'! var b = 12!");
    ASSERT_TRUE(ctx.hasVariable("a"));
    ASSERT_TRUE(ctx.hasVariable("b"));
    EXPECT_FALSE(ctx.hasVariable("c"));

    const Variable *a = ctx.lookup("a");
    ASSERT_NE(nullptr, a);
    EXPECT_EQ(ValueType::String, a->type);
    EXPECT_EQ("x", a->rawValue);

    const Variable *b = ctx.lookup("b");
    ASSERT_NE(nullptr, b);
    EXPECT_EQ(ValueType::Number, b->type);
    EXPECT_EQ("12", b->rawValue);

    EXPECT_TRUE(output.empty());
    EXPECT_EQ(2u, interp.getExecutedCount());
}

TEST_F(InterpreterTest, RedeclarationOverwrites) {
    runOk("var a = 1! var a = 'one'!");
    EXPECT_EQ(1u, ctx.variables.size());
    const Variable *a = ctx.lookup("a");
    ASSERT_NE(nullptr, a);
    EXPECT_EQ(ValueType::String, a->type);
    EXPECT_EQ("one", a->rawValue);
}

TEST_F(InterpreterTest, TableOutlivesSingleRun) {
    runOk("var a = 5!");
    runOk("print(a)!");
    EXPECT_EQ("5\n", output);
}

TEST_F(InterpreterTest, SkipsUnrecognizedLines) {
    runOk("print('a')! nonsense! print(b c)! print('d')!");
    EXPECT_EQ("a\nd\n", output);
    EXPECT_EQ(2u, interp.getExecutedCount());
    std::vector<unsigned> expected = {1, 2};
    EXPECT_EQ(expected, interp.getSkippedLines());
}

TEST_F(InterpreterTest, PrintChecksTableWhateverTheQuoting) {
    runOk("print(ghost)! print('ghost')! var ghost = 'boo'! print(ghost)! print('ghost')!");
    EXPECT_EQ("ghost\nghost\nboo\nboo\n", output);
    EXPECT_EQ(5u, interp.getExecutedCount());
}

TEST_F(InterpreterTest, DeclaredLiteralWithUndeclaredArgumentFails) {
    ctx.declare("known", ValueType::Number, "1");
    PrintStmtAST stmt(PrintStmtAST::Bare, "ghost", {"print", "(", "known", "ghost", ")"});

    llvm::Error err = stmt.execute(ctx);
    ASSERT_TRUE(static_cast<bool>(err));

    bool sawLookupError = false;
    llvm::handleAllErrors(std::move(err), [&](const LookupError &lookup) {
        EXPECT_EQ("ghost", lookup.getName());
        sawLookupError = true;
    });
    EXPECT_TRUE(sawLookupError);
    os.flush();
    EXPECT_TRUE(output.empty());
}

TEST_F(InterpreterTest, NumberFormatting) {
    runOk("var z = 0! var p = 007! print(z)! print(p)!");
    EXPECT_EQ("0\n7\n", output);
}

} // end anonymous namespace
