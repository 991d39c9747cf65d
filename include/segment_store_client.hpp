#pragma once

#include "range_requester.hpp"
#include "socket_wrapper.hpp"
#include "wire_commands.hpp"
#include <memory>
#include <string>
#include <string_view>

namespace segread {

struct Endpoint {
    std::string host;
    uint16_t port = 0;
};

// Accepts "host", "host:port", "[v6addr]" and "[v6addr]:port"
std::expected<Endpoint, ReadErrorInfo> parse_endpoint(std::string_view text, uint16_t default_port);

// Reads segment ranges from a segment store's admin gateway. A single
// connection is opened lazily and reused for every request; it is dropped
// after any failure so a late reply cannot answer a later request.
class SegmentStoreClient : public IRangeRequester {
public:
    SegmentStoreClient(Endpoint endpoint, std::string delegation_token, std::unique_ptr<ISocket> socket);
    ~SegmentStoreClient() override;

    SegmentStoreClient(const SegmentStoreClient&) = delete;
    SegmentStoreClient& operator=(const SegmentStoreClient&) = delete;

    std::expected<Chunk, ReadErrorInfo> read_range(
        const std::string& segment,
        int64_t offset,
        int64_t length,
        std::chrono::milliseconds timeout
    ) override;

    void close();

private:
    std::expected<void, ReadErrorInfo> ensure_connected();
    std::expected<wire::Reply, ReadErrorInfo> read_reply();
    std::expected<Chunk, ReadErrorInfo> await_segment_read(const wire::ReadSegment& request);
    ReadErrorInfo fail(ReadError error, std::string message);

    Endpoint endpoint_;
    std::string delegation_token_;
    std::unique_ptr<ISocket> socket_;
    int64_t next_request_id_ = 1;
};

} // namespace segread
