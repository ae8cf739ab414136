#include <memory>
#include <string>

#include "llvm/Support/CommandLine.h"
#include "llvm/Support/InitLLVM.h"
#include "llvm/Support/MemoryBuffer.h"
#include "llvm/Support/raw_ostream.h"

#include "bang/interp_ctx.h"
#include "bang/interpreter.h"
#include "bang/lexer.h"
#include "bang/log.h"

using namespace llvm;

static cl::OptionCategory BangCategory("bang options");

static cl::opt<std::string> InputFilename(cl::Positional, cl::desc("<script>"),
                                          cl::init("input.txt"), cl::cat(BangCategory));

static cl::opt<bool> DumpLines("dump-lines",
                               cl::desc("Print the tokenized lines before running"),
                               cl::cat(BangCategory));

static cl::opt<bool> Verbose("verbose", cl::desc("Trace skipped lines"),
                             cl::cat(BangCategory));

static void dumpLines(ArrayRef<bang::Line> lines) {
    errs() << "lines\n";
    for (unsigned i = 0; i < lines.size(); ++i) {
        errs() << "  " << i << ": ";
        bang::printLine(errs(), lines[i]);
        errs() << '\n';
    }
}

//===----------------------------------------------------------------------===//
// Main driver code.
//===----------------------------------------------------------------------===//
int main(int argc, char **argv) {
    InitLLVM X(argc, argv);

    cl::HideUnrelatedOptions(BangCategory);
    cl::SetVersionPrinter([](raw_ostream &os) { os << "bang version 0.1.0\n"; });
    cl::ParseCommandLineOptions(argc, argv, "bang script interpreter\n");
    bang::setVerbose(Verbose);

    const std::string &path = InputFilename.getValue();

    // The whole script is read once, up front.
    ErrorOr<std::unique_ptr<MemoryBuffer>> fileOrErr = MemoryBuffer::getFileOrSTDIN(path);
    if (std::error_code ec = fileOrErr.getError()) {
        bang::logError("could not open '" + path + "': " + ec.message());
        return 1;
    }
    std::unique_ptr<MemoryBuffer> buffer = std::move(*fileOrErr);

    bang::Lexer lexer(buffer->getBuffer());
    auto lines = lexer.tokenize();
    if (!lines) {
        bang::logError(lines.takeError());
        return 1;
    }
    bang::logTrace("read " + Twine(lines->size()) + " lines from '" + path + "'");

    size_t lineTokens = 0;
    for (const bang::Line &line : *lines)
        lineTokens += line.size();
    if (lexer.getTokens().size() > lineTokens)
        bang::logWarning("ignoring unterminated statement at end of '" + path + "'");

    if (DumpLines)
        dumpLines(*lines);

    bang::InterpContext ctx(outs());
    bang::Interpreter interp(ctx);
    if (Error err = interp.run(*lines)) {
        outs().flush();
        bang::logError(std::move(err));
        return 1;
    }
    bang::logTrace(Twine(interp.getExecutedCount()) + " statements executed, " +
                   Twine(interp.getSkippedLines().size()) + " lines skipped");

    outs().flush();
    return 0;
}
