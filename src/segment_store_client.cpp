#include "segment_store_client.hpp"
#include "compact_log.hpp"
#include <array>
#include <charconv>
#include <format>
#include <variant>

namespace segread {

namespace {

ReadError from_socket_error(SocketError error) {
    return error == SocketError::TimeoutError ? ReadError::Timeout : ReadError::Connection;
}

std::expected<uint16_t, ReadErrorInfo> parse_port(std::string_view text, std::string_view endpoint) {
    uint16_t port = 0;
    auto [ptr, ec] = std::from_chars(text.data(), text.data() + text.size(), port);
    if (ec != std::errc() || ptr != text.data() + text.size() || port == 0) {
        return std::unexpected(ReadErrorInfo{ReadError::InvalidRequest,
            std::format("Invalid port '{}' in endpoint '{}'", text, endpoint)});
    }
    return port;
}

} // namespace

std::expected<Endpoint, ReadErrorInfo> parse_endpoint(std::string_view text, uint16_t default_port) {
    if (text.empty()) {
        return std::unexpected(ReadErrorInfo{ReadError::InvalidRequest, "Segment store endpoint is empty"});
    }

    if (text.front() == '[') {
        auto close = text.find(']');
        if (close == std::string_view::npos || close == 1) {
            return std::unexpected(ReadErrorInfo{ReadError::InvalidRequest,
                std::format("Malformed IPv6 endpoint '{}'", text)});
        }
        Endpoint ep{std::string(text.substr(1, close - 1)), default_port};
        auto rest = text.substr(close + 1);
        if (rest.empty()) return ep;
        if (rest.front() != ':') {
            return std::unexpected(ReadErrorInfo{ReadError::InvalidRequest,
                std::format("Malformed IPv6 endpoint '{}'", text)});
        }
        auto port = parse_port(rest.substr(1), text);
        if (!port) return std::unexpected(port.error());
        ep.port = *port;
        return ep;
    }

    auto colon = text.rfind(':');
    // Bare IPv6 literals contain several colons and never a port
    if (colon == std::string_view::npos || text.find(':') != colon) {
        return Endpoint{std::string(text), default_port};
    }
    if (colon == 0) {
        return std::unexpected(ReadErrorInfo{ReadError::InvalidRequest,
            std::format("Missing host in endpoint '{}'", text)});
    }
    auto port = parse_port(text.substr(colon + 1), text);
    if (!port) return std::unexpected(port.error());
    return Endpoint{std::string(text.substr(0, colon)), *port};
}

SegmentStoreClient::SegmentStoreClient(Endpoint endpoint, std::string delegation_token, std::unique_ptr<ISocket> socket)
    : endpoint_(std::move(endpoint))
    , delegation_token_(std::move(delegation_token))
    , socket_(std::move(socket))
{
}

SegmentStoreClient::~SegmentStoreClient() {
    close();
}

void SegmentStoreClient::close() {
    if (socket_ && socket_->is_open()) socket_->close();
}

ReadErrorInfo SegmentStoreClient::fail(ReadError error, std::string message) {
    close();
    return ReadErrorInfo{error, std::move(message)};
}

std::expected<void, ReadErrorInfo> SegmentStoreClient::ensure_connected() {
    if (socket_->is_open()) return {};

    compact::Log::debug("Connecting to segment store {}:{}", endpoint_.host, endpoint_.port);
    auto conn = socket_->connect(endpoint_.host, endpoint_.port);
    if (!conn) {
        return std::unexpected(fail(from_socket_error(conn.error().error), conn.error().message));
    }

    auto hello = wire::encode(wire::Hello{});
    if (auto sent = write_all(*socket_, hello); !sent) {
        return std::unexpected(fail(from_socket_error(sent.error().error),
            std::format("Failed to send Hello: {}", sent.error().message)));
    }
    return {};
}

std::expected<wire::Reply, ReadErrorInfo> SegmentStoreClient::read_reply() {
    std::array<char, wire::kHeaderLength> header_bytes{};
    if (auto r = read_exact(*socket_, header_bytes); !r) {
        return std::unexpected(fail(from_socket_error(r.error().error), r.error().message));
    }
    auto header = wire::decode_header(header_bytes);
    if (!header) {
        return std::unexpected(fail(ReadError::Remote, header.error().message));
    }

    std::vector<char> payload(static_cast<size_t>(header->length));
    if (auto r = read_exact(*socket_, payload); !r) {
        return std::unexpected(fail(from_socket_error(r.error().error), r.error().message));
    }
    auto reply = wire::decode_reply(header->type, payload);
    if (!reply) {
        return std::unexpected(fail(ReadError::Remote, reply.error().message));
    }
    return std::move(*reply);
}

std::expected<Chunk, ReadErrorInfo> SegmentStoreClient::await_segment_read(const wire::ReadSegment& request) {
    while (true) {
        auto reply = read_reply();
        if (!reply) return std::unexpected(reply.error());

        if (auto* hello = std::get_if<wire::Hello>(&*reply)) {
            if (hello->low_version > wire::kWireVersion || hello->high_version < wire::kOldestCompatibleVersion) {
                return std::unexpected(fail(ReadError::Remote,
                    std::format("Incompatible wire protocol: server supports versions {}-{}, client {}-{}",
                        hello->low_version, hello->high_version, wire::kOldestCompatibleVersion, wire::kWireVersion)));
            }
            continue;
        }
        if (std::holds_alternative<wire::KeepAlive>(*reply)) continue;

        if (auto id = wire::request_id_of(*reply); id && *id != request.request_id) {
            compact::Log::debug("Discarding reply for stale request {}", *id);
            continue;
        }

        if (auto* read = std::get_if<wire::SegmentRead>(&*reply)) {
            if (read->offset != request.offset) {
                return std::unexpected(fail(ReadError::Remote,
                    std::format("Segment store answered offset {} for a read at offset {}", read->offset, request.offset)));
            }
            return Chunk{std::move(read->data)};
        }
        if (auto* wrong = std::get_if<wire::WrongHost>(&*reply)) {
            return std::unexpected(fail(ReadError::Remote,
                std::format("Segment {} is not owned by this segment store (owner: {})",
                    wrong->segment, wrong->correct_host.empty() ? "unknown" : wrong->correct_host)));
        }
        if (auto* missing = std::get_if<wire::NoSuchSegment>(&*reply)) {
            return std::unexpected(fail(ReadError::Remote,
                std::format("Segment {} does not exist", missing->segment)));
        }
        if (auto* truncated = std::get_if<wire::SegmentIsTruncated>(&*reply)) {
            return std::unexpected(fail(ReadError::Remote,
                std::format("Segment {} is truncated at offset {}; offset {} is no longer readable",
                    truncated->segment, truncated->start_offset, truncated->offset)));
        }
        if (auto* unsupported = std::get_if<wire::OperationUnsupported>(&*reply)) {
            return std::unexpected(fail(ReadError::Remote,
                std::format("Operation {} is not supported by the segment store", unsupported->operation)));
        }
        if (auto* auth = std::get_if<wire::AuthTokenCheckFailed>(&*reply)) {
            return std::unexpected(fail(ReadError::Remote,
                std::format("Delegation token rejected by the segment store (code {})", auth->error_code)));
        }
    }
}

std::expected<Chunk, ReadErrorInfo> SegmentStoreClient::read_range(
    const std::string& segment,
    int64_t offset,
    int64_t length,
    std::chrono::milliseconds timeout)
{
    if (offset < 0 || offset > kMaxRequestValue) {
        return std::unexpected(ReadErrorInfo{ReadError::InvalidRequest,
            std::format("Offset {} is outside the per-request range [0, {}]", offset, kMaxRequestValue)});
    }
    if (length <= 0 || length > kMaxRequestValue) {
        return std::unexpected(ReadErrorInfo{ReadError::InvalidRequest,
            std::format("Length {} is outside the per-request range [1, {}]", length, kMaxRequestValue)});
    }

    if (timeout.count() <= 0 || timeout > kMaxRequestTimeout) {
        return std::unexpected(ReadErrorInfo{ReadError::InvalidRequest,
            std::format("Timeout {} ms is outside (0, {}] ms", timeout.count(), kMaxRequestTimeout.count())});
    }

    wire::ReadSegment request{segment, offset, static_cast<int32_t>(length), delegation_token_, next_request_id_++};
    auto frame = wire::encode(request);
    if (!frame) {
        return std::unexpected(ReadErrorInfo{ReadError::InvalidRequest, frame.error().message});
    }

    socket_->set_deadline(std::chrono::steady_clock::now() + timeout);
    auto result = [&]() -> std::expected<Chunk, ReadErrorInfo> {
        if (auto conn = ensure_connected(); !conn) return std::unexpected(conn.error());
        if (auto sent = write_all(*socket_, *frame); !sent) {
            return std::unexpected(fail(from_socket_error(sent.error().error),
                std::format("Failed to send ReadSegment: {}", sent.error().message)));
        }
        return await_segment_read(request);
    }();
    socket_->set_deadline(std::nullopt);

    if (!result && result.error().error == ReadError::Timeout) {
        result.error().message = std::format("No reply within {} ms ({})", timeout.count(), result.error().message);
    }
    return result;
}

} // namespace segread
