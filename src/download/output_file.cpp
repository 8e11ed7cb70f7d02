#include "skopje/download/output_file.hpp"
#include "skopje/error.hpp"

#include <cerrno>
#include <cstring>

#if !defined(_WIN32)
#include <fcntl.h>
#include <sys/stat.h>
#include <unistd.h>
#endif

namespace skopje::download {

#if !defined(_WIN32)

OutputFile::OutputFile(const std::filesystem::path& path, uint64_t size)
    : path_(path), size_(size), fd_(-1) {
    fd_ = ::open(path.c_str(), O_RDWR | O_CREAT | O_TRUNC | O_CLOEXEC, 0644);
    if (fd_ < 0) {
        int ec = errno;
        throw IOError(std::string("Failed to create file: ") + std::strerror(ec), path.string());
    }
    if (size_ > 0 && ::ftruncate(fd_, static_cast<off_t>(size_)) != 0) {
        int ec = errno;
        ::close(fd_);
        fd_ = -1;
        throw IOError(std::string("Failed to size file: ") + std::strerror(ec), path.string());
    }
}

OutputFile::~OutputFile() {
    if (fd_ >= 0) {
        ::close(fd_);
    }
}

void OutputFile::write_at(uint64_t offset, std::string_view data) {
    const char* ptr = data.data();
    size_t remaining = data.size();
    off_t pos = static_cast<off_t>(offset);

    while (remaining > 0) {
        ssize_t n = ::pwrite(fd_, ptr, remaining, pos);
        if (n < 0) {
            if (errno == EINTR) continue;
            int ec = errno;
            throw IOError(std::string("pwrite failed: ") + std::strerror(ec),
                          path_.string() + " @" + std::to_string(offset));
        }
        ptr += n;
        pos += n;
        remaining -= static_cast<size_t>(n);
    }
}

void OutputFile::close() {
    if (fd_ < 0) return;
    int fd = fd_;
    fd_ = -1;
    if (::fsync(fd) != 0) {
        int ec = errno;
        ::close(fd);
        throw IOError(std::string("fsync failed: ") + std::strerror(ec), path_.string());
    }
    if (::close(fd) != 0) {
        int ec = errno;
        throw IOError(std::string("close failed: ") + std::strerror(ec), path_.string());
    }
}

#else

OutputFile::OutputFile(const std::filesystem::path& path, uint64_t size)
    : path_(path), size_(size) {
    stream_.open(path, std::ios::in | std::ios::out | std::ios::binary | std::ios::trunc);
    if (!stream_) {
        throw IOError("Failed to create file", path.string());
    }
    std::error_code ec;
    std::filesystem::resize_file(path, size, ec);
    if (ec) {
        throw IOError("Failed to size file: " + ec.message(), path.string());
    }
}

OutputFile::~OutputFile() = default;

void OutputFile::write_at(uint64_t offset, std::string_view data) {
    std::lock_guard<std::mutex> lock(mutex_);
    stream_.seekp(static_cast<std::streamoff>(offset));
    stream_.write(data.data(), static_cast<std::streamsize>(data.size()));
    if (!stream_) {
        throw IOError("write failed", path_.string() + " @" + std::to_string(offset));
    }
}

void OutputFile::close() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!stream_.is_open()) return;
    stream_.flush();
    bool ok = static_cast<bool>(stream_);
    stream_.close();
    if (!ok) {
        throw IOError("flush failed", path_.string());
    }
}

#endif

} // namespace skopje::download
