#include "chunked_downloader.hpp"
#include "compact_log.hpp"
#include "test_support.hpp"
#include <cassert>
#include <iostream>

using namespace segread;
using segread::test::FakeRequester;
using segread::test::MemorySink;
using segread::test::TempDir;

namespace {

DownloadConfig small_chunks(int64_t size) {
    return DownloadConfig{size, std::chrono::milliseconds(500)};
}

void test_full_range_is_written_verbatim() {
    TempDir dir("full");
    FakeRequester requester;
    ChunkedDownloader downloader(requester, small_chunks(4096));

    auto res = downloader.download("scope/stream/0.#epoch.0", 1000, 10000, dir / "out.bin");
    assert(res.has_value());
    assert(res->bytes_written == 10000);
    assert(res->requests_issued == 3);
    assert(test::read_file(dir / "out.bin") == test::segment_bytes(1000, 10000));
    for (const auto& call : requester.calls) assert(call.segment == "scope/stream/0.#epoch.0");
    std::cout << "✓ Range written verbatim\n";
}

void test_five_mib_in_two_mib_chunks() {
    TempDir dir("5mib");
    FakeRequester requester;
    ChunkedDownloader downloader(requester, small_chunks(2'097'152));

    auto res = downloader.download("scope/stream/0", 0, 5'242'880, dir / "out.bin");
    assert(res.has_value());
    assert(requester.calls.size() == 3);
    assert(requester.calls[0].offset == 0 && requester.calls[0].length == 2'097'152);
    assert(requester.calls[1].offset == 2'097'152 && requester.calls[1].length == 2'097'152);
    assert(requester.calls[2].offset == 4'194'304 && requester.calls[2].length == 1'048'576);
    assert(std::filesystem::file_size(dir / "out.bin") == 5'242'880);
    std::cout << "✓ 5 MiB range split into (0,2M) (2M,2M) (4M,1M)\n";
}

void test_requests_are_contiguous() {
    TempDir dir("contig");
    FakeRequester requester;
    ChunkedDownloader downloader(requester, small_chunks(1000));

    auto res = downloader.download("seg", 77, 4000, dir / "out.bin");
    assert(res.has_value());
    assert(requester.calls.size() == 4);
    for (size_t i = 1; i < requester.calls.size(); ++i) {
        const auto& prev = requester.calls[i - 1];
        assert(requester.calls[i].offset == prev.offset + prev.length);
    }
    // Evenly divisible: the last chunk is a full one
    assert(requester.calls.back().length == 1000);
    std::cout << "✓ Requests contiguous and non-overlapping\n";
}

void test_negative_arguments_rejected_before_io() {
    TempDir dir("neg");
    FakeRequester requester;
    ChunkedDownloader downloader(requester, small_chunks(1024));

    auto bad_offset = downloader.download("seg", -1, 10, dir / "a.bin");
    assert(!bad_offset.has_value());
    assert(bad_offset.error().error == DownloadError::InvalidArgument);

    auto bad_length = downloader.download("seg", 0, -10, dir / "b.bin");
    assert(!bad_length.has_value());
    assert(bad_length.error().error == DownloadError::InvalidArgument);

    assert(requester.calls.empty());
    assert(!std::filesystem::exists(dir / "a.bin"));
    assert(!std::filesystem::exists(dir / "b.bin"));
    std::cout << "✓ Negative offset/length rejected without I/O\n";
}

void test_range_past_protocol_limit_rejected() {
    TempDir dir("limit");
    FakeRequester requester;
    ChunkedDownloader downloader(requester, small_chunks(1024));

    auto res = downloader.download("seg", kMaxRequestValue, 2, dir / "out.bin");
    assert(!res.has_value());
    assert(res.error().error == DownloadError::InvalidArgument);
    assert(requester.calls.empty());
    assert(!std::filesystem::exists(dir / "out.bin"));

    ChunkedDownloader oversized(requester, small_chunks(kMaxRequestValue + 1));
    auto too_big = oversized.download("seg", 0, 10, dir / "out.bin");
    assert(!too_big.has_value());
    assert(too_big.error().error == DownloadError::InvalidArgument);
    std::cout << "✓ Ranges beyond the 32-bit request limit rejected\n";
}

void test_existing_destination_is_not_overwritten() {
    TempDir dir("exists");
    auto target = dir / "out.bin";
    {
        std::ofstream f(target, std::ios::binary);
        f << "keep me";
    }
    FakeRequester requester;
    ChunkedDownloader downloader(requester, small_chunks(1024));

    auto res = downloader.download("seg", 0, 100, target);
    assert(!res.has_value());
    assert(res.error().error == DownloadError::AlreadyExists);
    assert(requester.calls.empty());
    auto content = test::read_file(target);
    assert(std::string(content.begin(), content.end()) == "keep me");
    std::cout << "✓ Existing destination left untouched\n";
}

void test_zero_length_creates_empty_file() {
    TempDir dir("zero");
    FakeRequester requester;
    ChunkedDownloader downloader(requester, small_chunks(1024));
    int progress_calls = 0;

    auto res = downloader.download("seg", 100, 0, dir / "nested" / "empty.bin",
        [&](const DownloadProgress&) { ++progress_calls; });
    assert(res.has_value());
    assert(res->bytes_written == 0);
    assert(res->requests_issued == 0);
    assert(requester.calls.empty());
    assert(progress_calls == 0);
    assert(std::filesystem::exists(dir / "nested" / "empty.bin"));
    assert(std::filesystem::file_size(dir / "nested" / "empty.bin") == 0);
    std::cout << "✓ Zero-length download creates an empty file\n";
}

void test_empty_read_is_a_stall() {
    TempDir dir("stall");
    FakeRequester requester([](size_t call, int64_t offset, int64_t length) -> std::expected<Chunk, ReadErrorInfo> {
        if (call == 1) return Chunk{};
        return Chunk{test::segment_bytes(offset, length)};
    });
    ChunkedDownloader downloader(requester, small_chunks(100));

    auto res = downloader.download("seg", 0, 1000, dir / "out.bin");
    assert(!res.has_value());
    assert(res.error().error == DownloadError::StalledRead);
    assert(res.error().offset == 100);
    assert(requester.calls.size() == 2);
    assert(std::filesystem::file_size(dir / "out.bin") == 100);
    std::cout << "✓ Zero-byte read fails with StalledRead\n";
}

void test_timeout_keeps_partial_file() {
    TempDir dir("timeout");
    FakeRequester requester([](size_t call, int64_t offset, int64_t length) -> std::expected<Chunk, ReadErrorInfo> {
        if (call == 1) return std::unexpected(ReadErrorInfo{ReadError::Timeout, "no reply"});
        return Chunk{test::segment_bytes(offset, length)};
    });
    ChunkedDownloader downloader(requester, small_chunks(256));

    auto res = downloader.download("seg", 10, 1024, dir / "out.bin");
    assert(!res.has_value());
    assert(res.error().error == DownloadError::RequestTimeout);
    assert(res.error().segment == "seg");
    assert(res.error().offset == 266);
    assert(requester.calls.size() == 2);
    assert(requester.last_timeout == std::chrono::milliseconds(500));
    assert(test::read_file(dir / "out.bin") == test::segment_bytes(10, 256));
    std::cout << "✓ Timeout at second chunk leaves exactly the first chunk\n";
}

void test_remote_error_is_wrapped() {
    TempDir dir("remote");
    FakeRequester requester([](size_t, int64_t, int64_t) -> std::expected<Chunk, ReadErrorInfo> {
        return std::unexpected(ReadErrorInfo{ReadError::Remote, "Segment seg does not exist"});
    });
    ChunkedDownloader downloader(requester, small_chunks(256));

    auto res = downloader.download("seg", 0, 10, dir / "out.bin");
    assert(!res.has_value());
    assert(res.error().error == DownloadError::RemoteError);
    assert(res.error().message.find("does not exist") != std::string::npos);
    assert(requester.calls.size() == 1);
    assert(std::filesystem::file_size(dir / "out.bin") == 0);

    FakeRequester unreachable([](size_t, int64_t, int64_t) -> std::expected<Chunk, ReadErrorInfo> {
        return std::unexpected(ReadErrorInfo{ReadError::Connection, "Connection refused"});
    });
    ChunkedDownloader second(unreachable, small_chunks(256));
    auto conn = second.download("seg", 0, 10, dir / "other.bin");
    assert(!conn.has_value());
    assert(conn.error().error == DownloadError::RemoteError);
    std::cout << "✓ Remote and connection failures surface as RemoteError\n";
}

void test_short_reads_advance_by_actual_count() {
    TempDir dir("short");
    FakeRequester requester([](size_t, int64_t offset, int64_t length) -> std::expected<Chunk, ReadErrorInfo> {
        int64_t n = length > 1 ? length / 2 : length;
        return Chunk{test::segment_bytes(offset, n)};
    });
    ChunkedDownloader downloader(requester, small_chunks(64));

    auto res = downloader.download("seg", 5, 200, dir / "out.bin");
    assert(res.has_value());
    assert(res->bytes_written == 200);
    for (size_t i = 1; i < requester.calls.size(); ++i) {
        const auto& prev = requester.calls[i - 1];
        int64_t obtained = prev.length > 1 ? prev.length / 2 : prev.length;
        assert(requester.calls[i].offset == prev.offset + obtained);
    }
    assert(test::read_file(dir / "out.bin") == test::segment_bytes(5, 200));
    std::cout << "✓ Short reads accepted and offsets advance by bytes obtained\n";
}

void test_oversized_reply_rejected() {
    TempDir dir("oversize");
    FakeRequester requester([](size_t, int64_t offset, int64_t length) -> std::expected<Chunk, ReadErrorInfo> {
        return Chunk{test::segment_bytes(offset, length + 1)};
    });
    ChunkedDownloader downloader(requester, small_chunks(64));

    auto res = downloader.download("seg", 0, 64, dir / "out.bin");
    assert(!res.has_value());
    assert(res.error().error == DownloadError::RemoteError);
    assert(std::filesystem::file_size(dir / "out.bin") == 0);
    std::cout << "✓ Reply larger than requested rejected\n";
}

void test_progress_reported_per_chunk() {
    TempDir dir("progress");
    FakeRequester requester;
    ChunkedDownloader downloader(requester, small_chunks(300));
    std::vector<DownloadProgress> seen;

    auto res = downloader.download("seg", 0, 1000, dir / "out.bin",
        [&](const DownloadProgress& p) { seen.push_back(p); });
    assert(res.has_value());
    assert(seen.size() == 4);
    assert(seen[0].downloaded_bytes == 300);
    assert(seen[1].downloaded_bytes == 600);
    assert(seen[2].downloaded_bytes == 900);
    assert(seen[3].downloaded_bytes == 1000);
    for (const auto& p : seen) assert(p.total_bytes == 1000);
    std::cout << "✓ Progress reported once per chunk\n";
}

void test_unwritable_destination_is_io_failure() {
    TempDir dir("io");
    {
        std::ofstream f(dir / "blocker");
        f << "x";
    }
    FakeRequester requester;
    ChunkedDownloader downloader(requester, small_chunks(64));

    // The parent "directory" is a regular file
    auto res = downloader.download("seg", 0, 10, dir / "blocker" / "out.bin");
    assert(!res.has_value());
    assert(res.error().error == DownloadError::IOFailure);
    assert(requester.calls.empty());
    std::cout << "✓ Directory creation failure reported as IOFailure\n";
}

void test_append_failure_stops_requests_and_releases() {
    FakeRequester requester;
    MemorySink sink;
    sink.fail_append_at = 1;
    ChunkedDownloader downloader(requester, small_chunks(100));

    auto res = downloader.download("seg", 0, 1000, sink);
    assert(!res.has_value());
    assert(res.error().error == DownloadError::IOFailure);
    assert(res.error().offset == 100);
    assert(res.error().message.find("No space left") != std::string::npos);
    assert(requester.calls.size() == 2);
    assert(sink.bytes == test::segment_bytes(0, 100));
    assert(sink.releases == 1);
    std::cout << "✓ Append failure stops requests; sink still released\n";
}

void test_release_failure_after_success_is_io_failure() {
    FakeRequester requester;
    MemorySink sink;
    sink.fail_release = true;
    ChunkedDownloader downloader(requester, small_chunks(100));

    auto res = downloader.download("seg", 50, 250, sink);
    assert(!res.has_value());
    assert(res.error().error == DownloadError::IOFailure);
    assert(res.error().offset == 300);
    assert(requester.calls.size() == 3);
    assert(sink.bytes == test::segment_bytes(50, 250));
    assert(sink.releases == 1);
    std::cout << "✓ Release failure after a complete transfer is IOFailure\n";
}

void test_release_failure_does_not_mask_earlier_error() {
    FakeRequester requester([](size_t call, int64_t offset, int64_t length) -> std::expected<Chunk, ReadErrorInfo> {
        if (call == 2) return std::unexpected(ReadErrorInfo{ReadError::Timeout, "no reply"});
        return Chunk{test::segment_bytes(offset, length)};
    });
    MemorySink sink;
    sink.fail_release = true;
    ChunkedDownloader downloader(requester, small_chunks(100));

    auto res = downloader.download("seg", 0, 1000, sink);
    assert(!res.has_value());
    assert(res.error().error == DownloadError::RequestTimeout);
    assert(res.error().offset == 200);
    assert(requester.calls.size() == 3);
    assert(sink.releases == 1);
    std::cout << "✓ Release failure after an error keeps the original error\n";
}

void test_out_of_range_timeout_rejected() {
    FakeRequester requester;
    for (auto timeout : {std::chrono::milliseconds(0), kMaxRequestTimeout + std::chrono::milliseconds(1)}) {
        MemorySink sink;
        ChunkedDownloader downloader(requester, DownloadConfig{100, timeout});
        auto res = downloader.download("seg", 0, 10, sink);
        assert(!res.has_value());
        assert(res.error().error == DownloadError::InvalidArgument);
        assert(sink.appends == 0);
    }
    assert(requester.calls.empty());

    MemorySink sink;
    ChunkedDownloader downloader(requester, DownloadConfig{100, kMaxRequestTimeout});
    assert(downloader.download("seg", 0, 10, sink).has_value());
    assert(requester.last_timeout == kMaxRequestTimeout);
    std::cout << "✓ Timeouts outside (0, 24h] rejected before any request\n";
}

} // namespace

int main() {
    compact::Log::set_level(compact::Level::Error);
    try {
        test_full_range_is_written_verbatim();
        test_five_mib_in_two_mib_chunks();
        test_requests_are_contiguous();
        test_negative_arguments_rejected_before_io();
        test_range_past_protocol_limit_rejected();
        test_existing_destination_is_not_overwritten();
        test_zero_length_creates_empty_file();
        test_empty_read_is_a_stall();
        test_timeout_keeps_partial_file();
        test_remote_error_is_wrapped();
        test_short_reads_advance_by_actual_count();
        test_oversized_reply_rejected();
        test_progress_reported_per_chunk();
        test_unwritable_destination_is_io_failure();
        test_append_failure_stops_requests_and_releases();
        test_release_failure_after_success_is_io_failure();
        test_release_failure_does_not_mask_earlier_error();
        test_out_of_range_timeout_rejected();
        std::cout << "\n✅ All downloader tests passed!\n";
        return 0;
    } catch (const std::exception& e) {
        std::cerr << "❌ Test failed: " << e.what() << "\n";
        return 1;
    }
}
