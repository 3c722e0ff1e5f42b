#pragma once

#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <string>

namespace fetchy::detail {

// Destination data in flight. Writes are positioned (pwrite), so workers
// filling disjoint ranges share one descriptor without locking.
class PartialFile {
public:
    PartialFile() = default;
    // truncate discards existing content; otherwise it is kept for resume.
    PartialFile(const std::filesystem::path& path, bool truncate);
    ~PartialFile();

    PartialFile(const PartialFile&) = delete;
    PartialFile& operator=(const PartialFile&) = delete;
    PartialFile(PartialFile&& other) noexcept;
    PartialFile& operator=(PartialFile&& other) noexcept;

    [[nodiscard]] bool isOpen() const noexcept { return fd_ >= 0; }
    [[nodiscard]] const std::filesystem::path& path() const noexcept { return path_; }

    // Sparse extension to size bytes.
    void preallocate(std::uint64_t size);
    void writeAt(const char* data, std::size_t size, std::uint64_t offset);
    void truncate(std::uint64_t size);
    void sync();
    [[nodiscard]] std::uint64_t size() const;
    void close();

private:
    int fd_{-1};
    std::filesystem::path path_;
};

// fsync-ed rename of a finished partial file onto its final name.
void commitFile(const std::filesystem::path& partial, const std::filesystem::path& destination);

// Writes content to path.tmp, fsyncs, then renames over path.
void writeFileAtomically(const std::filesystem::path& path, const std::string& content);

} // namespace fetchy::detail
