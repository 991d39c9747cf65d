#include "segment_store_client.hpp"
#include "chunked_downloader.hpp"
#include "compact_log.hpp"
#include "test_support.hpp"
#include <algorithm>
#include <cassert>
#include <deque>
#include <iostream>

using namespace segread;
using namespace std::chrono_literals;

namespace {

// In-memory socket: replies are queued before the call, everything the
// client sends is captured. Running out of queued bytes behaves like the
// deadline passing.
class FakeSocket : public ISocket {
public:
    std::expected<void, SocketErrorInfo> connect(const std::string& host, uint16_t port) override {
        ++connects;
        last_host = host;
        last_port = port;
        if (refuse) return std::unexpected(SocketErrorInfo{SocketError::ConnectionFailed, "Connection refused"});
        open = true;
        return {};
    }

    std::expected<size_t, SocketErrorInfo> write(std::span<const char> data) override {
        if (!open) return std::unexpected(SocketErrorInfo{SocketError::WriteError, "not connected"});
        sent.insert(sent.end(), data.begin(), data.end());
        return data.size();
    }

    std::expected<size_t, SocketErrorInfo> read(std::span<char> buffer) override {
        if (!open) return std::unexpected(SocketErrorInfo{SocketError::ReadError, "not connected"});
        if (inbound.empty()) {
            if (peer_closed) return 0;
            return std::unexpected(SocketErrorInfo{SocketError::TimeoutError, "Deadline exceeded"});
        }
        // Hand out small pieces to exercise read_exact
        size_t n = std::min({buffer.size(), inbound.size(), size_t{7}});
        for (size_t i = 0; i < n; ++i) {
            buffer[i] = inbound.front();
            inbound.pop_front();
        }
        return n;
    }

    void set_deadline(std::optional<Deadline> d) override { deadline_set = d.has_value(); }
    void close() override { open = false; ++closes; }
    bool is_open() const override { return open; }

    void queue(const std::vector<char>& frame) { inbound.insert(inbound.end(), frame.begin(), frame.end()); }

    std::deque<char> inbound;
    std::vector<char> sent;
    int connects = 0;
    int closes = 0;
    bool open = false;
    bool refuse = false;
    bool peer_closed = false;
    bool deadline_set = false;
    std::string last_host;
    uint16_t last_port = 0;
};

std::vector<char> hello_frame(int32_t high = wire::kWireVersion, int32_t low = wire::kOldestCompatibleVersion) {
    return wire::encode(wire::Hello{high, low});
}

std::vector<char> segment_read_frame(const std::string& segment, int64_t offset, const std::vector<char>& data, int64_t request_id) {
    wire::ByteWriter w;
    assert(w.put_utf(segment).has_value());
    w.put_i64(offset);
    w.put_bool(false);
    w.put_bool(false);
    w.put_i32(static_cast<int32_t>(data.size()));
    w.put_bytes(data);
    w.put_i64(request_id);
    return w.frame(wire::CommandType::SegmentRead);
}

std::vector<char> no_such_segment_frame(const std::string& segment, int64_t request_id) {
    wire::ByteWriter w;
    w.put_i64(request_id);
    assert(w.put_utf(segment).has_value());
    assert(w.put_utf("").has_value());
    w.put_i64(0);
    return w.frame(wire::CommandType::NoSuchSegment);
}

// Splits the captured client bytes back into frames
std::vector<std::pair<int32_t, std::vector<char>>> sent_frames(const std::vector<char>& bytes) {
    std::vector<std::pair<int32_t, std::vector<char>>> frames;
    std::span<const char> rest(bytes);
    while (!rest.empty()) {
        auto header = wire::decode_header(rest.first(wire::kHeaderLength));
        assert(header.has_value());
        auto payload = rest.subspan(wire::kHeaderLength, static_cast<size_t>(header->length));
        frames.emplace_back(header->type, std::vector<char>(payload.begin(), payload.end()));
        rest = rest.subspan(wire::kHeaderLength + payload.size());
    }
    return frames;
}

struct Harness {
    FakeSocket* socket;
    SegmentStoreClient client;

    explicit Harness(std::string token = "master-token")
        : Harness(std::make_unique<FakeSocket>(), std::move(token)) {}

private:
    Harness(std::unique_ptr<FakeSocket> s, std::string token)
        : socket(s.get()), client(Endpoint{"segmentstore", 9999}, std::move(token), std::move(s)) {}
};

void test_read_sends_hello_then_read_segment() {
    Harness h;
    h.socket->queue(hello_frame());
    h.socket->queue(segment_read_frame("scope/stream/0", 100, {'a', 'b', 'c'}, 1));

    auto chunk = h.client.read_range("scope/stream/0", 100, 3, 1s);
    assert(chunk.has_value());
    assert((chunk->data == std::vector<char>{'a', 'b', 'c'}));
    assert(h.socket->connects == 1);
    assert(h.socket->last_host == "segmentstore" && h.socket->last_port == 9999);
    assert(!h.socket->deadline_set);

    auto frames = sent_frames(h.socket->sent);
    assert(frames.size() == 2);
    assert(frames[0].first == static_cast<int32_t>(wire::CommandType::Hello));
    assert(frames[1].first == static_cast<int32_t>(wire::CommandType::ReadSegment));
    wire::ByteReader r(frames[1].second);
    assert(r.get_utf().value() == "scope/stream/0");
    assert(r.get_i64().value() == 100);
    assert(r.get_i32().value() == 3);
    assert(r.get_utf().value() == "master-token");
    assert(r.get_i64().value() == 1);
    std::cout << "✓ Hello then ReadSegment with token and request id\n";
}

void test_connection_reused_and_stale_replies_skipped() {
    Harness h;
    h.socket->queue(hello_frame());
    h.socket->queue(segment_read_frame("seg", 0, {'x'}, 1));
    assert(h.client.read_range("seg", 0, 1, 1s).has_value());

    // A keep-alive and a reply for some other request arrive first
    h.socket->queue(wire::ByteWriter{}.frame(wire::CommandType::KeepAlive));
    h.socket->queue(segment_read_frame("seg", 555, {'z'}, 99));
    h.socket->queue(segment_read_frame("seg", 1, {'y', 'y'}, 2));
    auto second = h.client.read_range("seg", 1, 2, 1s);
    assert(second.has_value());
    assert((second->data == std::vector<char>{'y', 'y'}));
    assert(h.socket->connects == 1);
    assert(sent_frames(h.socket->sent).size() == 3);
    std::cout << "✓ Connection reused; stale replies discarded\n";
}

void test_remote_errors_drop_the_connection() {
    Harness h;
    h.socket->queue(hello_frame());
    h.socket->queue(no_such_segment_frame("missing", 1));
    auto res = h.client.read_range("missing", 0, 10, 1s);
    assert(!res.has_value());
    assert(res.error().error == ReadError::Remote);
    assert(res.error().message.find("does not exist") != std::string::npos);
    assert(!h.socket->is_open());

    h.socket->queue(hello_frame());
    h.socket->queue(segment_read_frame("seg", 0, {'k'}, 2));
    assert(h.client.read_range("seg", 0, 1, 1s).has_value());
    assert(h.socket->connects == 2);
    std::cout << "✓ Remote error closes the connection; next read reconnects\n";
}

void test_missing_reply_is_a_timeout() {
    Harness h;
    h.socket->queue(hello_frame());
    auto res = h.client.read_range("seg", 0, 10, 250ms);
    assert(!res.has_value());
    assert(res.error().error == ReadError::Timeout);
    assert(res.error().message.find("250 ms") != std::string::npos);
    assert(!h.socket->is_open());
    std::cout << "✓ Missing reply reported as Timeout\n";
}

void test_peer_close_is_a_connection_error() {
    Harness h;
    h.socket->peer_closed = true;
    auto res = h.client.read_range("seg", 0, 10, 1s);
    assert(!res.has_value());
    assert(res.error().error == ReadError::Connection);
    std::cout << "✓ Peer close reported as Connection error\n";
}

void test_offset_mismatch_and_bad_hello() {
    {
        Harness h;
        h.socket->queue(hello_frame());
        h.socket->queue(segment_read_frame("seg", 8, {'a'}, 1));
        auto res = h.client.read_range("seg", 4, 1, 1s);
        assert(!res.has_value());
        assert(res.error().error == ReadError::Remote);
    }
    {
        Harness h;
        h.socket->queue(hello_frame(3, 1));
        auto res = h.client.read_range("seg", 0, 1, 1s);
        assert(!res.has_value());
        assert(res.error().error == ReadError::Remote);
        assert(res.error().message.find("Incompatible") != std::string::npos);
    }
    std::cout << "✓ Offset mismatch and incompatible Hello rejected\n";
}

void test_request_bounds_checked_before_connecting() {
    Harness h;
    auto far = h.client.read_range("seg", kMaxRequestValue + 1, 1, 1s);
    assert(!far.has_value());
    assert(far.error().error == ReadError::InvalidRequest);
    auto empty = h.client.read_range("seg", 0, 0, 1s);
    assert(!empty.has_value());
    assert(empty.error().error == ReadError::InvalidRequest);
    auto forever = h.client.read_range("seg", 0, 1, std::chrono::hours(24 * 365));
    assert(!forever.has_value());
    assert(forever.error().error == ReadError::InvalidRequest);
    auto no_wait = h.client.read_range("seg", 0, 1, 0ms);
    assert(!no_wait.has_value());
    assert(no_wait.error().error == ReadError::InvalidRequest);
    assert(h.socket->connects == 0);
    std::cout << "✓ Out-of-range requests rejected without connecting\n";
}

void test_connect_failure() {
    Harness h;
    h.socket->refuse = true;
    auto res = h.client.read_range("seg", 0, 1, 1s);
    assert(!res.has_value());
    assert(res.error().error == ReadError::Connection);
    std::cout << "✓ Refused connection reported as Connection error\n";
}

void test_endpoint_parsing() {
    auto plain = parse_endpoint("segmentstore", 9999);
    assert(plain && plain->host == "segmentstore" && plain->port == 9999);

    auto with_port = parse_endpoint("10.0.0.5:12345", 9999);
    assert(with_port && with_port->host == "10.0.0.5" && with_port->port == 12345);

    auto v6 = parse_endpoint("[::1]:6000", 9999);
    assert(v6 && v6->host == "::1" && v6->port == 6000);

    auto bare_v6 = parse_endpoint("fe80::1", 9999);
    assert(bare_v6 && bare_v6->host == "fe80::1" && bare_v6->port == 9999);

    assert(!parse_endpoint("", 9999));
    assert(!parse_endpoint("host:", 9999));
    assert(!parse_endpoint("host:70000", 9999));
    assert(!parse_endpoint(":9999", 9999));
    assert(!parse_endpoint("[::1", 9999));
    std::cout << "✓ Endpoint parsing\n";
}

void test_downloader_over_wire() {
    test::TempDir dir("wire_download");
    auto socket = std::make_unique<FakeSocket>();
    FakeSocket* raw = socket.get();
    raw->queue(hello_frame());
    raw->queue(segment_read_frame("seg", 10, test::segment_bytes(10, 4), 1));
    raw->queue(segment_read_frame("seg", 14, test::segment_bytes(14, 4), 2));
    raw->queue(segment_read_frame("seg", 18, test::segment_bytes(18, 2), 3));

    SegmentStoreClient client(Endpoint{"localhost", 9999}, "", std::move(socket));
    ChunkedDownloader downloader(client, DownloadConfig{4, 1s});
    auto res = downloader.download("seg", 10, 10, dir / "out.bin");
    assert(res.has_value());
    assert(res->requests_issued == 3);
    assert(test::read_file(dir / "out.bin") == test::segment_bytes(10, 10));
    assert(raw->connects == 1);
    std::cout << "✓ Chunked download over the wire client\n";
}

} // namespace

int main() {
    compact::Log::set_level(compact::Level::Off);
    try {
        test_read_sends_hello_then_read_segment();
        test_connection_reused_and_stale_replies_skipped();
        test_remote_errors_drop_the_connection();
        test_missing_reply_is_a_timeout();
        test_peer_close_is_a_connection_error();
        test_offset_mismatch_and_bad_hello();
        test_request_bounds_checked_before_connecting();
        test_connect_failure();
        test_endpoint_parsing();
        test_downloader_over_wire();
        std::cout << "\n✅ All segment store client tests passed!\n";
        return 0;
    } catch (const std::exception& e) {
        std::cerr << "❌ Test failed: " << e.what() << "\n";
        return 1;
    }
}
