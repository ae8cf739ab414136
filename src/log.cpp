#include "bang/log.h"

#include "llvm/Support/WithColor.h"
#include "llvm/Support/raw_ostream.h"

namespace bang {

static const char ToolName[] = "bang";
static bool Verbose = false;

void setVerbose(bool enabled) { Verbose = enabled; }
bool isVerbose() { return Verbose; }

void logError(const llvm::Twine &msg) {
    llvm::WithColor::error(llvm::errs(), ToolName) << msg << '\n';
}

void logError(llvm::Error err) {
    llvm::handleAllErrors(std::move(err), [](const llvm::ErrorInfoBase &info) {
        logError(info.message());
    });
}

void logWarning(const llvm::Twine &msg) {
    llvm::WithColor::warning(llvm::errs(), ToolName) << msg << '\n';
}

void logTrace(const llvm::Twine &msg) {
    if (!Verbose)
        return;
    llvm::WithColor::note(llvm::errs(), ToolName) << msg << '\n';
}

} // end namespace bang
