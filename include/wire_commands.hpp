#pragma once

#include <cstdint>
#include <expected>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

namespace segread::wire {

// Admin gateway wire protocol: every command is framed as
// [int32 type][int32 payload length][payload], all integers big-endian.
enum class CommandType : int32_t {
    Hello = -127,
    ReadSegment = 8,
    SegmentRead = 9,
    WrongHost = 50,
    NoSuchSegment = 53,
    SegmentIsTruncated = 56,
    OperationUnsupported = 57,
    AuthTokenCheckFailed = 60,
    KeepAlive = 100
};

inline constexpr int32_t kWireVersion = 15;
inline constexpr int32_t kOldestCompatibleVersion = 5;
inline constexpr size_t kHeaderLength = 8;
inline constexpr int32_t kMaxPayloadLength = 16 * 1024 * 1024 + 64 * 1024;

enum class WireError {
    Truncated,
    FrameTooLarge,
    UnknownCommand,
    Malformed
};

struct WireErrorInfo {
    WireError error;
    std::string message;
};

struct Hello {
    int32_t high_version = kWireVersion;
    int32_t low_version = kOldestCompatibleVersion;
};

struct ReadSegment {
    std::string segment;
    int64_t offset = 0;
    int32_t suggested_length = 0;
    std::string delegation_token;
    int64_t request_id = 0;
};

struct SegmentRead {
    std::string segment;
    int64_t offset = 0;
    bool at_tail = false;
    bool end_of_segment = false;
    std::vector<char> data;
    int64_t request_id = 0;
};

struct WrongHost {
    int64_t request_id = 0;
    std::string segment;
    std::string correct_host;
    std::string stack_trace;
};

struct NoSuchSegment {
    int64_t request_id = 0;
    std::string segment;
    std::string stack_trace;
    int64_t offset = 0;
};

struct SegmentIsTruncated {
    int64_t request_id = 0;
    std::string segment;
    int64_t start_offset = 0;
    std::string stack_trace;
    int64_t offset = 0;
};

struct OperationUnsupported {
    int64_t request_id = 0;
    std::string operation;
    std::string stack_trace;
};

struct AuthTokenCheckFailed {
    int64_t request_id = 0;
    std::string stack_trace;
    int32_t error_code = 0;
};

struct KeepAlive {};

using Reply = std::variant<Hello, SegmentRead, WrongHost, NoSuchSegment, SegmentIsTruncated,
                           OperationUnsupported, AuthTokenCheckFailed, KeepAlive>;

struct FrameHeader {
    int32_t type = 0;
    int32_t length = 0;
};

class ByteWriter {
public:
    void put_i32(int32_t v);
    void put_i64(int64_t v);
    void put_u16(uint16_t v);
    void put_bool(bool v);
    std::expected<void, WireErrorInfo> put_utf(std::string_view s);
    void put_bytes(std::span<const char> bytes);

    // Prepends the frame header for the bytes written so far
    std::vector<char> frame(CommandType type) const;
    const std::vector<char>& bytes() const { return buf_; }

private:
    std::vector<char> buf_;
};

class ByteReader {
public:
    explicit ByteReader(std::span<const char> data) : data_(data) {}

    std::expected<int32_t, WireErrorInfo> get_i32();
    std::expected<int64_t, WireErrorInfo> get_i64();
    std::expected<uint16_t, WireErrorInfo> get_u16();
    std::expected<bool, WireErrorInfo> get_bool();
    std::expected<std::string, WireErrorInfo> get_utf();
    std::expected<std::vector<char>, WireErrorInfo> get_bytes(size_t n);

    size_t remaining() const { return data_.size() - pos_; }

private:
    std::expected<std::span<const char>, WireErrorInfo> take(size_t n);

    std::span<const char> data_;
    size_t pos_ = 0;
};

std::vector<char> encode(const Hello& hello);
std::expected<std::vector<char>, WireErrorInfo> encode(const ReadSegment& request);

std::expected<FrameHeader, WireErrorInfo> decode_header(std::span<const char> header);
std::expected<Reply, WireErrorInfo> decode_reply(int32_t type, std::span<const char> payload);

// Hello and KeepAlive are connection-scoped and carry no request id
std::optional<int64_t> request_id_of(const Reply& reply);

} // namespace segread::wire
