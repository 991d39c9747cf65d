#include "chunked_downloader.hpp"
#include "compact_log.hpp"
#include <algorithm>
#include <format>
#include <limits>

namespace segread {

const char* to_string(DownloadError error) {
    switch (error) {
        case DownloadError::InvalidArgument: return "InvalidArgument";
        case DownloadError::AlreadyExists: return "AlreadyExists";
        case DownloadError::IOFailure: return "IOFailure";
        case DownloadError::RequestTimeout: return "RequestTimeout";
        case DownloadError::RemoteError: return "RemoteError";
        case DownloadError::StalledRead: return "StalledRead";
    }
    return "Unknown";
}

ChunkedDownloader::ChunkedDownloader(IRangeRequester& requester, DownloadConfig config)
    : requester_(requester), config_(config) {}

std::expected<void, DownloadErrorInfo> ChunkedDownloader::validate(
    const std::string& segment, int64_t offset, int64_t length) const
{
    auto invalid = [&](std::string message) {
        return std::unexpected(DownloadErrorInfo{DownloadError::InvalidArgument, std::move(message), segment, offset});
    };

    if (offset < 0) return invalid("The provided offset cannot be negative.");
    if (length < 0) return invalid("The provided length cannot be negative.");
    if (segment.empty()) return invalid("The segment name cannot be empty.");
    if (config_.max_chunk_size <= 0 || config_.max_chunk_size > kMaxRequestValue) {
        return invalid(std::format("Chunk size {} is outside [1, {}].", config_.max_chunk_size, kMaxRequestValue));
    }
    if (config_.request_timeout.count() <= 0 || config_.request_timeout > kMaxRequestTimeout) {
        return invalid(std::format("The request timeout must be in (0, {}] ms, got {} ms.",
            kMaxRequestTimeout.count(), config_.request_timeout.count()));
    }
    if (length > 0) {
        if (offset > std::numeric_limits<int64_t>::max() - length) {
            return invalid("offset + length overflows.");
        }
        if (offset + length - 1 > kMaxRequestValue) {
            return invalid(std::format("Range [{}, {}) reaches past offset {}, the largest a single request can address.",
                offset, offset + length, kMaxRequestValue));
        }
    }
    return {};
}

std::expected<DownloadResult, DownloadErrorInfo> ChunkedDownloader::download(
    const std::string& segment,
    int64_t offset,
    int64_t length,
    const std::filesystem::path& destination,
    ProgressCallback progress_callback)
{
    if (auto valid = validate(segment, offset, length); !valid) {
        return std::unexpected(valid.error());
    }

    auto sink = FileSink::create(destination);
    if (!sink) {
        auto kind = sink.error().error == SinkError::AlreadyExists ? DownloadError::AlreadyExists : DownloadError::IOFailure;
        return std::unexpected(DownloadErrorInfo{kind, sink.error().message, segment, offset});
    }

    compact::Log::info("Downloading {} bytes from offset {} into {}.", length, offset, destination.string());

    auto result = download(segment, offset, length, *sink, std::move(progress_callback));
    if (!result && sink->bytes_written() > 0) {
        compact::Log::warn("{} contains the first {} of {} requested bytes; the partial file was not removed.",
            destination.string(), sink->bytes_written(), length);
    }
    return result;
}

std::expected<DownloadResult, DownloadErrorInfo> ChunkedDownloader::download(
    const std::string& segment,
    int64_t offset,
    int64_t length,
    ISink& sink,
    ProgressCallback progress_callback)
{
    if (auto valid = validate(segment, offset, length); !valid) {
        if (auto released = sink.release(); !released) {
            compact::Log::error("{}", released.error().message);
        }
        return std::unexpected(valid.error());
    }

    DownloadState state{offset, offset, length, length};
    DownloadResult result;
    auto transferred = transfer(segment, state, sink, result, progress_callback);
    auto released = sink.release();

    if (!transferred) {
        // The transfer error is what the caller sees
        if (!released) {
            compact::Log::error("{}", released.error().message);
        }
        return std::unexpected(transferred.error());
    }
    if (!released) {
        return std::unexpected(DownloadErrorInfo{DownloadError::IOFailure, released.error().message,
            segment, state.current_offset});
    }
    return result;
}

std::expected<void, DownloadErrorInfo> ChunkedDownloader::transfer(
    const std::string& segment,
    DownloadState& state,
    ISink& sink,
    DownloadResult& result,
    const ProgressCallback& progress_callback)
{
    auto fail = [&](DownloadError error, std::string message) {
        return std::unexpected(DownloadErrorInfo{error,
            std::format("{} (segment {}, offset {})", message, segment, state.current_offset),
            segment, state.current_offset});
    };

    while (state.remaining > 0) {
        int64_t chunk_size = std::min(config_.max_chunk_size, state.remaining);

        ++result.requests_issued;
        auto chunk = requester_.read_range(segment, state.current_offset, chunk_size, config_.request_timeout);
        if (!chunk) {
            const auto& err = chunk.error();
            switch (err.error) {
                case ReadError::Timeout:
                    return fail(DownloadError::RequestTimeout,
                        std::format("Read of {} bytes timed out after {} ms: {}",
                            chunk_size, config_.request_timeout.count(), err.message));
                case ReadError::InvalidRequest:
                    return fail(DownloadError::InvalidArgument, err.message);
                case ReadError::Remote:
                case ReadError::Connection:
                    break;
            }
            return fail(DownloadError::RemoteError, err.message);
        }

        int64_t bytes_obtained = chunk->length();
        if (bytes_obtained == 0) {
            return fail(DownloadError::StalledRead,
                std::format("Read returned no data with {} bytes still expected", state.remaining));
        }
        if (bytes_obtained > chunk_size) {
            return fail(DownloadError::RemoteError,
                std::format("Read returned {} bytes for a request of {}", bytes_obtained, chunk_size));
        }
        if (bytes_obtained < chunk_size) {
            compact::Log::debug("Short read at offset {}: {} of {} bytes", state.current_offset, bytes_obtained, chunk_size);
        }

        if (auto appended = sink.append(chunk->data); !appended) {
            return fail(DownloadError::IOFailure, appended.error().message);
        }

        state.current_offset += bytes_obtained;
        state.remaining -= bytes_obtained;
        result.bytes_written += bytes_obtained;

        if (progress_callback) {
            progress_callback(DownloadProgress{state.completed(), state.total_length});
        }
    }
    return {};
}

} // namespace segread
