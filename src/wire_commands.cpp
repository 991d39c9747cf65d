#include "wire_commands.hpp"
#include <format>
#include <limits>
#include <type_traits>

namespace segread::wire {

void ByteWriter::put_i32(int32_t v) {
    auto u = static_cast<uint32_t>(v);
    for (int shift = 24; shift >= 0; shift -= 8) buf_.push_back(static_cast<char>((u >> shift) & 0xFF));
}

void ByteWriter::put_i64(int64_t v) {
    auto u = static_cast<uint64_t>(v);
    for (int shift = 56; shift >= 0; shift -= 8) buf_.push_back(static_cast<char>((u >> shift) & 0xFF));
}

void ByteWriter::put_u16(uint16_t v) {
    buf_.push_back(static_cast<char>((v >> 8) & 0xFF));
    buf_.push_back(static_cast<char>(v & 0xFF));
}

void ByteWriter::put_bool(bool v) {
    buf_.push_back(v ? 1 : 0);
}

std::expected<void, WireErrorInfo> ByteWriter::put_utf(std::string_view s) {
    if (s.size() > std::numeric_limits<uint16_t>::max()) {
        return std::unexpected(WireErrorInfo{WireError::Malformed,
            std::format("String of {} bytes exceeds the 65535 byte limit", s.size())});
    }
    put_u16(static_cast<uint16_t>(s.size()));
    buf_.insert(buf_.end(), s.begin(), s.end());
    return {};
}

void ByteWriter::put_bytes(std::span<const char> bytes) {
    buf_.insert(buf_.end(), bytes.begin(), bytes.end());
}

std::vector<char> ByteWriter::frame(CommandType type) const {
    ByteWriter out;
    out.buf_.reserve(kHeaderLength + buf_.size());
    out.put_i32(static_cast<int32_t>(type));
    out.put_i32(static_cast<int32_t>(buf_.size()));
    out.put_bytes(buf_);
    return std::move(out.buf_);
}

std::expected<std::span<const char>, WireErrorInfo> ByteReader::take(size_t n) {
    if (remaining() < n) {
        return std::unexpected(WireErrorInfo{WireError::Truncated,
            std::format("Needed {} bytes at position {}, only {} left", n, pos_, remaining())});
    }
    auto out = data_.subspan(pos_, n);
    pos_ += n;
    return out;
}

std::expected<int32_t, WireErrorInfo> ByteReader::get_i32() {
    auto raw = take(4);
    if (!raw) return std::unexpected(raw.error());
    uint32_t u = 0;
    for (char c : *raw) u = (u << 8) | static_cast<uint8_t>(c);
    return static_cast<int32_t>(u);
}

std::expected<int64_t, WireErrorInfo> ByteReader::get_i64() {
    auto raw = take(8);
    if (!raw) return std::unexpected(raw.error());
    uint64_t u = 0;
    for (char c : *raw) u = (u << 8) | static_cast<uint8_t>(c);
    return static_cast<int64_t>(u);
}

std::expected<uint16_t, WireErrorInfo> ByteReader::get_u16() {
    auto raw = take(2);
    if (!raw) return std::unexpected(raw.error());
    return static_cast<uint16_t>((static_cast<uint8_t>((*raw)[0]) << 8) | static_cast<uint8_t>((*raw)[1]));
}

std::expected<bool, WireErrorInfo> ByteReader::get_bool() {
    auto raw = take(1);
    if (!raw) return std::unexpected(raw.error());
    return (*raw)[0] != 0;
}

std::expected<std::string, WireErrorInfo> ByteReader::get_utf() {
    auto len = get_u16();
    if (!len) return std::unexpected(len.error());
    auto raw = take(*len);
    if (!raw) return std::unexpected(raw.error());
    return std::string(raw->begin(), raw->end());
}

std::expected<std::vector<char>, WireErrorInfo> ByteReader::get_bytes(size_t n) {
    auto raw = take(n);
    if (!raw) return std::unexpected(raw.error());
    return std::vector<char>(raw->begin(), raw->end());
}

std::vector<char> encode(const Hello& hello) {
    ByteWriter w;
    w.put_i32(hello.high_version);
    w.put_i32(hello.low_version);
    return w.frame(CommandType::Hello);
}

std::expected<std::vector<char>, WireErrorInfo> encode(const ReadSegment& request) {
    ByteWriter w;
    if (auto r = w.put_utf(request.segment); !r) return std::unexpected(r.error());
    w.put_i64(request.offset);
    w.put_i32(request.suggested_length);
    if (auto r = w.put_utf(request.delegation_token); !r) return std::unexpected(r.error());
    w.put_i64(request.request_id);
    return w.frame(CommandType::ReadSegment);
}

std::expected<FrameHeader, WireErrorInfo> decode_header(std::span<const char> header) {
    ByteReader r(header);
    auto type = r.get_i32();
    if (!type) return std::unexpected(type.error());
    auto length = r.get_i32();
    if (!length) return std::unexpected(length.error());
    if (*length < 0 || *length > kMaxPayloadLength) {
        return std::unexpected(WireErrorInfo{WireError::FrameTooLarge,
            std::format("Frame of type {} declares invalid payload length {}", *type, *length)});
    }
    return FrameHeader{*type, *length};
}

namespace {

std::expected<Reply, WireErrorInfo> decode_hello(ByteReader& r) {
    auto high = r.get_i32();
    if (!high) return std::unexpected(high.error());
    auto low = r.get_i32();
    if (!low) return std::unexpected(low.error());
    return Hello{*high, *low};
}

std::expected<Reply, WireErrorInfo> decode_segment_read(ByteReader& r) {
    SegmentRead out;
    auto segment = r.get_utf();
    if (!segment) return std::unexpected(segment.error());
    out.segment = std::move(*segment);

    auto offset = r.get_i64();
    if (!offset) return std::unexpected(offset.error());
    out.offset = *offset;

    auto at_tail = r.get_bool();
    if (!at_tail) return std::unexpected(at_tail.error());
    out.at_tail = *at_tail;

    auto end_of_segment = r.get_bool();
    if (!end_of_segment) return std::unexpected(end_of_segment.error());
    out.end_of_segment = *end_of_segment;

    auto data_length = r.get_i32();
    if (!data_length) return std::unexpected(data_length.error());
    if (*data_length < 0) {
        return std::unexpected(WireErrorInfo{WireError::Malformed,
            std::format("SegmentRead declares negative data length {}", *data_length)});
    }
    auto data = r.get_bytes(static_cast<size_t>(*data_length));
    if (!data) return std::unexpected(data.error());
    out.data = std::move(*data);

    auto request_id = r.get_i64();
    if (!request_id) return std::unexpected(request_id.error());
    out.request_id = *request_id;
    return out;
}

std::expected<Reply, WireErrorInfo> decode_wrong_host(ByteReader& r) {
    auto request_id = r.get_i64();
    if (!request_id) return std::unexpected(request_id.error());
    auto segment = r.get_utf();
    if (!segment) return std::unexpected(segment.error());
    auto correct_host = r.get_utf();
    if (!correct_host) return std::unexpected(correct_host.error());
    auto stack_trace = r.get_utf();
    if (!stack_trace) return std::unexpected(stack_trace.error());
    return WrongHost{*request_id, std::move(*segment), std::move(*correct_host), std::move(*stack_trace)};
}

std::expected<Reply, WireErrorInfo> decode_no_such_segment(ByteReader& r) {
    auto request_id = r.get_i64();
    if (!request_id) return std::unexpected(request_id.error());
    auto segment = r.get_utf();
    if (!segment) return std::unexpected(segment.error());
    auto stack_trace = r.get_utf();
    if (!stack_trace) return std::unexpected(stack_trace.error());
    auto offset = r.get_i64();
    if (!offset) return std::unexpected(offset.error());
    return NoSuchSegment{*request_id, std::move(*segment), std::move(*stack_trace), *offset};
}

std::expected<Reply, WireErrorInfo> decode_truncated(ByteReader& r) {
    auto request_id = r.get_i64();
    if (!request_id) return std::unexpected(request_id.error());
    auto segment = r.get_utf();
    if (!segment) return std::unexpected(segment.error());
    auto start_offset = r.get_i64();
    if (!start_offset) return std::unexpected(start_offset.error());
    auto stack_trace = r.get_utf();
    if (!stack_trace) return std::unexpected(stack_trace.error());
    auto offset = r.get_i64();
    if (!offset) return std::unexpected(offset.error());
    return SegmentIsTruncated{*request_id, std::move(*segment), *start_offset, std::move(*stack_trace), *offset};
}

std::expected<Reply, WireErrorInfo> decode_unsupported(ByteReader& r) {
    auto request_id = r.get_i64();
    if (!request_id) return std::unexpected(request_id.error());
    auto operation = r.get_utf();
    if (!operation) return std::unexpected(operation.error());
    auto stack_trace = r.get_utf();
    if (!stack_trace) return std::unexpected(stack_trace.error());
    return OperationUnsupported{*request_id, std::move(*operation), std::move(*stack_trace)};
}

std::expected<Reply, WireErrorInfo> decode_auth_failed(ByteReader& r) {
    auto request_id = r.get_i64();
    if (!request_id) return std::unexpected(request_id.error());
    auto stack_trace = r.get_utf();
    if (!stack_trace) return std::unexpected(stack_trace.error());
    auto error_code = r.get_i32();
    if (!error_code) return std::unexpected(error_code.error());
    return AuthTokenCheckFailed{*request_id, std::move(*stack_trace), *error_code};
}

} // namespace

std::expected<Reply, WireErrorInfo> decode_reply(int32_t type, std::span<const char> payload) {
    ByteReader r(payload);
    std::expected<Reply, WireErrorInfo> reply;
    switch (static_cast<CommandType>(type)) {
        case CommandType::Hello: reply = decode_hello(r); break;
        case CommandType::SegmentRead: reply = decode_segment_read(r); break;
        case CommandType::WrongHost: reply = decode_wrong_host(r); break;
        case CommandType::NoSuchSegment: reply = decode_no_such_segment(r); break;
        case CommandType::SegmentIsTruncated: reply = decode_truncated(r); break;
        case CommandType::OperationUnsupported: reply = decode_unsupported(r); break;
        case CommandType::AuthTokenCheckFailed: reply = decode_auth_failed(r); break;
        case CommandType::KeepAlive: reply = KeepAlive{}; break;
        default:
            return std::unexpected(WireErrorInfo{WireError::UnknownCommand,
                std::format("Unexpected reply command type {}", type)});
    }
    // Newer servers may append fields; trailing bytes are tolerated.
    return reply;
}

std::optional<int64_t> request_id_of(const Reply& reply) {
    return std::visit([](const auto& r) -> std::optional<int64_t> {
        using T = std::decay_t<decltype(r)>;
        if constexpr (std::is_same_v<T, Hello> || std::is_same_v<T, KeepAlive>) {
            return std::nullopt;
        } else {
            return r.request_id;
        }
    }, reply);
}

} // namespace segread::wire
