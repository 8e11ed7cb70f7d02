#pragma once

#include <cstdint>
#include <filesystem>
#include <string_view>

#if defined(_WIN32)
#include <fstream>
#include <mutex>
#endif

namespace skopje::download {

/**
 * Destination of a chunked download: one file written concurrently at
 * disjoint offsets by many chunk tasks.
 *
 * POSIX: a single descriptor and pwrite(), which carries its own offset, so
 * concurrent writers need no lock. Elsewhere the seek+write pair is
 * serialized by a mutex held only for the duration of one write.
 */
class OutputFile {
public:
    // Create (or truncate) path and pre-size it to size bytes.
    // Throws IOError when the file cannot be created or sized.
    OutputFile(const std::filesystem::path& path, uint64_t size);
    ~OutputFile();

    OutputFile(const OutputFile&) = delete;
    OutputFile& operator=(const OutputFile&) = delete;

    // Write data at offset. Thread-safe. Throws IOError on short or failed writes.
    void write_at(uint64_t offset, std::string_view data);

    // Flush to stable storage and close. Throws IOError on failure.
    void close();

    const std::filesystem::path& path() const { return path_; }
    uint64_t size() const { return size_; }

private:
    std::filesystem::path path_;
    uint64_t size_;
#if defined(_WIN32)
    std::fstream stream_;
    std::mutex mutex_;
#else
    int fd_;
#endif
};

} // namespace skopje::download
