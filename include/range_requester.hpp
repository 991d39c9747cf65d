#pragma once

#include <chrono>
#include <cstdint>
#include <expected>
#include <limits>
#include <string>
#include <vector>

namespace segread {

// The current protocol version carries per-request offsets and lengths as
// signed 32-bit integers.
inline constexpr int64_t kMaxRequestValue = std::numeric_limits<int32_t>::max();

// Upper bound on a single request's timeout
inline constexpr std::chrono::milliseconds kMaxRequestTimeout = std::chrono::hours(24);

struct Chunk {
    std::vector<char> data;

    int64_t length() const { return static_cast<int64_t>(data.size()); }
};

enum class ReadError {
    Timeout,
    Remote,
    Connection,
    InvalidRequest
};

struct ReadErrorInfo {
    ReadError error;
    std::string message;
};

// One bounded read against a segment. Implementations block until the
// reply arrives or the timeout elapses; at most one call is in flight.
class IRangeRequester {
public:
    virtual ~IRangeRequester() = default;
    virtual std::expected<Chunk, ReadErrorInfo> read_range(
        const std::string& segment,
        int64_t offset,
        int64_t length,
        std::chrono::milliseconds timeout
    ) = 0;
};

} // namespace segread
