#pragma once

#include "file_sink.hpp"
#include "progress_reporter.hpp"
#include "range_requester.hpp"
#include <chrono>
#include <cstdint>
#include <expected>
#include <filesystem>
#include <string>

namespace segread {

struct DownloadConfig {
    int64_t max_chunk_size = 2 * 1024 * 1024;
    std::chrono::milliseconds request_timeout{10'000};
};

enum class DownloadError {
    InvalidArgument,
    AlreadyExists,
    IOFailure,
    RequestTimeout,
    RemoteError,
    StalledRead
};

const char* to_string(DownloadError error);

struct DownloadErrorInfo {
    DownloadError error;
    std::string message;
    std::string segment;
    int64_t offset = 0;     // segment offset the failure occurred at
};

struct DownloadResult {
    int64_t bytes_written = 0;
    int64_t requests_issued = 0;
};

// Bookkeeping for one download. current_offset - initial_offset + remaining
// always equals total_length.
struct DownloadState {
    int64_t initial_offset = 0;
    int64_t current_offset = 0;
    int64_t remaining = 0;
    int64_t total_length = 0;

    int64_t completed() const { return current_offset - initial_offset; }
};

// Copies [offset, offset + length) of a segment into a sink as a sequence
// of bounded reads, one in flight at a time. The first failure aborts the
// download; bytes already appended stay in the sink.
class ChunkedDownloader {
public:
    explicit ChunkedDownloader(IRangeRequester& requester, DownloadConfig config = {});

    // Creates destination (never overwriting it) and downloads into it
    std::expected<DownloadResult, DownloadErrorInfo> download(
        const std::string& segment,
        int64_t offset,
        int64_t length,
        const std::filesystem::path& destination,
        ProgressCallback progress_callback = nullptr
    );

    // Releases the sink before returning, whatever the outcome
    std::expected<DownloadResult, DownloadErrorInfo> download(
        const std::string& segment,
        int64_t offset,
        int64_t length,
        ISink& sink,
        ProgressCallback progress_callback = nullptr
    );

private:
    std::expected<void, DownloadErrorInfo> validate(const std::string& segment, int64_t offset, int64_t length) const;

    std::expected<void, DownloadErrorInfo> transfer(
        const std::string& segment,
        DownloadState& state,
        ISink& sink,
        DownloadResult& result,
        const ProgressCallback& progress_callback
    );

    IRangeRequester& requester_;
    DownloadConfig config_;
};

} // namespace segread
