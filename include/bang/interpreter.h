#ifndef BANG_INTERPRETER_H
#define BANG_INTERPRETER_H

#include <vector>

#include "llvm/ADT/ArrayRef.h"
#include "llvm/ADT/StringRef.h"
#include "llvm/Support/Error.h"
#include "llvm/Support/raw_ostream.h"

#include "bang/interp_ctx.h"
#include "bang/parser.h"
#include "bang/token.h"

namespace bang {

// Executes lines top to bottom against one interpreter context.
class Interpreter {
public:
    explicit Interpreter(InterpContext &ctx) : ctx(ctx) {}

    /// run - Execute every line in order. Lines that are not statements are
    /// skipped. Stops at the first failing statement.
    llvm::Error run(llvm::ArrayRef<Line> lines);

    unsigned getExecutedCount() const { return executed; }
    const std::vector<unsigned> &getSkippedLines() const { return skipped; }

private:
    InterpContext &ctx;
    Parser parser;
    unsigned executed = 0;
    std::vector<unsigned> skipped;  // indices of lines that matched no shape
};

/// runScript - Tokenize the whole source, then interpret it with a fresh
/// context writing to out. Nothing is written if tokenizing fails.
llvm::Error runScript(llvm::StringRef source, llvm::raw_ostream &out);

} // end namespace bang

#endif // BANG_INTERPRETER_H
