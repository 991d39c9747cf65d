#include "file_sink.hpp"
#include "compact_log.hpp"
#include <fcntl.h>
#include <unistd.h>
#include <cerrno>
#include <cstring>
#include <format>

namespace segread {

std::expected<FileSink, SinkErrorInfo> FileSink::create(const std::filesystem::path& path) {
    std::error_code ec;
    if (std::filesystem::exists(std::filesystem::symlink_status(path, ec))) {
        return std::unexpected(SinkErrorInfo{SinkError::AlreadyExists,
            std::format("Cannot write segment data into {}: the file already exists", path.string()), EEXIST});
    }

    if (path.has_parent_path()) {
        std::filesystem::create_directories(path.parent_path(), ec);
        if (ec) {
            return std::unexpected(SinkErrorInfo{SinkError::IOFailure,
                std::format("Failed to create directory {}: {}", path.parent_path().string(), ec.message()),
                ec.value()});
        }
    }

    // O_EXCL closes the gap between the existence check and the open
    int fd = ::open(path.c_str(), O_WRONLY | O_CREAT | O_EXCL | O_CLOEXEC, 0644);
    if (fd == -1) {
        int err = errno;
        if (err == EEXIST) {
            return std::unexpected(SinkErrorInfo{SinkError::AlreadyExists,
                std::format("Cannot write segment data into {}: the file already exists", path.string()), err});
        }
        return std::unexpected(SinkErrorInfo{SinkError::IOFailure,
            std::format("Error creating file {}: {}", path.string(), strerror(err)), err});
    }
    return FileSink(fd, path);
}

FileSink::FileSink(int fd, std::filesystem::path path)
    : fd_(fd), path_(std::move(path)) {}

FileSink::~FileSink() {
    if (auto r = release(); !r) {
        compact::Log::error("{}", r.error().message);
    }
}

FileSink::FileSink(FileSink&& other) noexcept
    : fd_(other.fd_),
      path_(std::move(other.path_)),
      bytes_written_(other.bytes_written_)
{
    other.fd_ = -1;
}

FileSink& FileSink::operator=(FileSink&& other) noexcept {
    if (this != &other) {
        if (auto r = release(); !r) {
            compact::Log::error("{}", r.error().message);
        }
        fd_ = other.fd_;
        path_ = std::move(other.path_);
        bytes_written_ = other.bytes_written_;
        other.fd_ = -1;
    }
    return *this;
}

std::expected<void, SinkErrorInfo> FileSink::append(std::span<const char> data) {
    if (fd_ == -1) {
        return std::unexpected(SinkErrorInfo{SinkError::IOFailure,
            std::format("Write to {} after release", path_.string())});
    }

    while (!data.empty()) {
        ssize_t written = ::write(fd_, data.data(), data.size());
        if (written == -1) {
            if (errno == EINTR) continue;
            int err = errno;
            return std::unexpected(SinkErrorInfo{SinkError::IOFailure,
                std::format("write to {} failed: {}", path_.string(), strerror(err)), err});
        }
        data = data.subspan(static_cast<size_t>(written));
        bytes_written_ += written;
    }
    return {};
}

std::expected<void, SinkErrorInfo> FileSink::release() {
    if (fd_ == -1) return {};

    int fd = fd_;
    fd_ = -1;

    int sync_err = fdatasync(fd) == -1 ? errno : 0;
    int close_err = ::close(fd) == -1 ? errno : 0;

    if (sync_err != 0) {
        return std::unexpected(SinkErrorInfo{SinkError::IOFailure,
            std::format("sync of {} failed: {}", path_.string(), strerror(sync_err)), sync_err});
    }
    if (close_err != 0) {
        return std::unexpected(SinkErrorInfo{SinkError::IOFailure,
            std::format("close of {} failed: {}", path_.string(), strerror(close_err)), close_err});
    }
    return {};
}

} // namespace segread
