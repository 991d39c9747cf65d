#include "progress_reporter.hpp"
#include <format>

namespace segread {

std::string ProgressReporter::render(int64_t completed, int64_t total) {
    char glyph = kGlyphs[calls_++ % kGlyphs.size()];
    return std::format("\r Processing {} : Written {}/{} bytes.", glyph, completed, total);
}

} // namespace segread
