#include "bang/interpreter.h"

#include <string>

#include "bang/lexer.h"
#include "bang/log.h"

using namespace bang;

llvm::Error Interpreter::run(llvm::ArrayRef<Line> lines) {
    for (unsigned index = 0; index < lines.size(); ++index) {
        const Line &line = lines[index];

        auto stmt = parser.parseLine(line);
        if (!stmt) {
            skipped.push_back(index);
            if (isVerbose()) {
                std::string text;
                llvm::raw_string_ostream os(text);
                printLine(os, line);
                logTrace("skipping line " + llvm::Twine(index) + ": " + os.str());
            }
            continue;
        }

        if (llvm::Error err = stmt->execute(ctx))
            return err;
        ++executed;
    }
    return llvm::Error::success();
}

llvm::Error bang::runScript(llvm::StringRef source, llvm::raw_ostream &out) {
    Lexer lexer(source);
    auto lines = lexer.tokenize();
    if (!lines)
        return lines.takeError();

    InterpContext ctx(out);
    Interpreter interp(ctx);
    return interp.run(*lines);
}
