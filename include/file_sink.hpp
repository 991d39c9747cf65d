#pragma once

#include <cstdint>
#include <expected>
#include <filesystem>
#include <span>
#include <string>

namespace segread {

enum class SinkError {
    AlreadyExists,
    IOFailure
};

struct SinkErrorInfo {
    SinkError error;
    std::string message;
    int code = 0;   // errno, when one applies
};

// Ordered byte destination of a download
class ISink {
public:
    virtual ~ISink() = default;

    virtual std::expected<void, SinkErrorInfo> append(std::span<const char> data) = 0;
    // Later calls succeed without doing anything
    virtual std::expected<void, SinkErrorInfo> release() = 0;
    virtual int64_t bytes_written() const = 0;
};

// Exclusive owner of a freshly created output file. Writes are synchronous
// and land in call order; the descriptor is released exactly once, either
// explicitly through release() or by the destructor.
class FileSink : public ISink {
public:
    // Fails with AlreadyExists rather than overwrite anything.
    static std::expected<FileSink, SinkErrorInfo> create(const std::filesystem::path& path);

    ~FileSink() override;

    FileSink(const FileSink&) = delete;
    FileSink& operator=(const FileSink&) = delete;

    FileSink(FileSink&&) noexcept;
    FileSink& operator=(FileSink&&) noexcept;

    std::expected<void, SinkErrorInfo> append(std::span<const char> data) override;

    // Flushes and closes
    std::expected<void, SinkErrorInfo> release() override;

    bool is_open() const { return fd_ != -1; }
    int64_t bytes_written() const override { return bytes_written_; }
    const std::filesystem::path& path() const { return path_; }

private:
    FileSink(int fd, std::filesystem::path path);

    int fd_ = -1;
    std::filesystem::path path_;
    int64_t bytes_written_ = 0;
};

} // namespace segread
