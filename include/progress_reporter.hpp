#pragma once

#include <cstdint>
#include <functional>
#include <string>
#include <string_view>

namespace segread {

struct DownloadProgress {
    int64_t downloaded_bytes = 0;
    int64_t total_bytes = 0;
};

using ProgressCallback = std::function<void(const DownloadProgress&)>;

// Spinner-style progress line. The call counter only selects the glyph.
class ProgressReporter {
public:
    static constexpr std::string_view kGlyphs = "|/-\\";

    std::string render(int64_t completed, int64_t total);
    std::string render(const DownloadProgress& progress) {
        return render(progress.downloaded_bytes, progress.total_bytes);
    }

    uint64_t calls() const { return calls_; }

private:
    uint64_t calls_ = 0;
};

} // namespace segread
