#include "fetchy/detail/partial_file.hpp"

#include "fetchy/error.hpp"
#include "fetchy/logging.hpp"

#include <cerrno>
#include <cstdio>
#include <cstring>
#include <utility>

#include <fcntl.h>
#include <sys/stat.h>
#include <unistd.h>

#include <fmt/format.h>

namespace fetchy::detail {

namespace {

[[noreturn]] void throwDiskError(const std::string& what, const std::filesystem::path& path) {
    throw DownloadError(ErrorKind::DiskError,
                        fmt::format("{} '{}': {}", what, path.string(), std::strerror(errno)));
}

void syncDirectory(const std::filesystem::path& file) {
    auto dir = file.parent_path();
    if (dir.empty()) {
        dir = ".";
    }
    const int fd = ::open(dir.c_str(), O_RDONLY | O_DIRECTORY);
    if (fd < 0) {
        FETCHY_WARN("Cannot open directory {} for fsync: {}", dir.string(), std::strerror(errno));
        return;
    }
    if (::fsync(fd) != 0) {
        FETCHY_WARN("fsync of directory {} failed: {}", dir.string(), std::strerror(errno));
    }
    ::close(fd);
}

} // namespace

PartialFile::PartialFile(const std::filesystem::path& path, bool truncate) : path_(path) {
    int flags = O_RDWR | O_CREAT | O_CLOEXEC;
    if (truncate) {
        flags |= O_TRUNC;
    }
    fd_ = ::open(path.c_str(), flags, 0644);
    if (fd_ < 0) {
        throwDiskError("Cannot open", path);
    }
}

PartialFile::~PartialFile() {
    if (fd_ >= 0) {
        ::close(fd_);
    }
}

PartialFile::PartialFile(PartialFile&& other) noexcept
    : fd_(std::exchange(other.fd_, -1)), path_(std::move(other.path_)) {}

PartialFile& PartialFile::operator=(PartialFile&& other) noexcept {
    if (this != &other) {
        if (fd_ >= 0) {
            ::close(fd_);
        }
        fd_ = std::exchange(other.fd_, -1);
        path_ = std::move(other.path_);
    }
    return *this;
}

void PartialFile::preallocate(std::uint64_t size) {
    if (size > this->size() && ::ftruncate(fd_, static_cast<off_t>(size)) == -1) {
        throwDiskError("Cannot resize", path_);
    }
}

void PartialFile::writeAt(const char* data, std::size_t size, std::uint64_t offset) {
    while (size > 0) {
        const ssize_t written = ::pwrite(fd_, data, size, static_cast<off_t>(offset));
        if (written < 0) {
            if (errno == EINTR) {
                continue;
            }
            throwDiskError("Failed to write", path_);
        }
        data += written;
        size -= static_cast<std::size_t>(written);
        offset += static_cast<std::uint64_t>(written);
    }
}

void PartialFile::truncate(std::uint64_t size) {
    if (::ftruncate(fd_, static_cast<off_t>(size)) == -1) {
        throwDiskError("Cannot truncate", path_);
    }
}

void PartialFile::sync() {
    if (::fdatasync(fd_) != 0) {
        throwDiskError("Failed to sync", path_);
    }
}

std::uint64_t PartialFile::size() const {
    struct stat st {};
    if (::fstat(fd_, &st) != 0) {
        throwDiskError("Cannot stat", path_);
    }
    return static_cast<std::uint64_t>(st.st_size);
}

void PartialFile::close() {
    if (fd_ < 0) {
        return;
    }
    const int fd = std::exchange(fd_, -1);
    if (::close(fd) != 0) {
        throwDiskError("Failed to close", path_);
    }
}

void commitFile(const std::filesystem::path& partial, const std::filesystem::path& destination) {
    if (std::rename(partial.c_str(), destination.c_str()) != 0) {
        throwDiskError("Cannot rename to " + destination.string() + " from", partial);
    }
    syncDirectory(destination);
}

void writeFileAtomically(const std::filesystem::path& path, const std::string& content) {
    const std::filesystem::path tmp = path.string() + ".tmp";
    {
        PartialFile file(tmp, true);
        file.writeAt(content.data(), content.size(), 0);
        file.sync();
        file.close();
    }
    commitFile(tmp, path);
}

} // namespace fetchy::detail
