#include "iofile.hpp"

#include <fcntl.h>
#include <sys/stat.h>
#include <unistd.h>

#include <cerrno>

#include "common.hpp"

using namespace dsum;

IO::File::File(fs::path const& path, Flags flags) {
    dsum_trace("path: %s", path.generic_string().c_str());
    if ((flags & WRITE) && path.has_parent_path()) {
        fs::create_directories(path.parent_path());
    }
    int fd = 0;
    if (flags & WRITE) {
        fd = ::open(path.string().c_str(), O_RDWR | O_CREAT | ((flags & TRUNCATE) ? O_TRUNC : 0), 0644);
    } else {
        fd = ::open(path.string().c_str(), O_RDONLY);
    }
    if (!fd || fd == -1) [[unlikely]] {
        auto ec = std::error_code((int)errno, std::system_category());
        throw_error("::open", ec);
    }
    struct ::stat size = {};
    if (::fstat(fd, &size) == -1) [[unlikely]] {
        auto ec = std::error_code((int)errno, std::system_category());
        ::close(fd);
        throw_error("::fstat", ec);
    }
    impl_ = {.fd = (std::intptr_t)fd, .size = (std::size_t)size.st_size, .flags = flags};
}

IO::File::~File() noexcept { close(std::exchange(impl_, {})); }

auto IO::File::close(Impl const& impl) noexcept -> void {
    if (impl.fd) {
        ::close((int)impl.fd);
    }
}

auto IO::File::resize(std::size_t offset, std::size_t count) noexcept -> bool {
    if (!impl_.fd || !(impl_.flags & WRITE)) {
        return false;
    }
    std::uint64_t const total = (std::uint64_t)offset + count;
    if (total < offset || total < count) {
        return false;
    }
    if (impl_.size == total) {
        return true;
    }
    if (::ftruncate((int)impl_.fd, (off_t)total) == -1) [[unlikely]] {
        return false;
    }
    impl_.size = total;
    return true;
}

auto IO::File::read(std::size_t offset, std::span<char> dst) const noexcept -> bool {
    if (!impl_.fd) {
        return false;
    }
    while (!dst.empty()) {
        auto got = ::pread((int)impl_.fd, dst.data(), dst.size(), (off_t)offset);
        if (got <= 0 || (std::size_t)got > dst.size()) {
            return false;
        }
        dst = dst.subspan(got);
        offset += got;
    }
    return true;
}

auto IO::File::write(std::size_t offset, std::span<char const> src) noexcept -> bool {
    if (!impl_.fd || !(impl_.flags & WRITE)) {
        return false;
    }
    std::size_t const write_end = offset + src.size();
    if (write_end < offset || write_end < src.size()) {
        return false;
    }
    while (!src.empty()) {
        auto got = ::pwrite((int)impl_.fd, src.data(), src.size(), (off_t)offset);
        if (got <= 0 || (std::size_t)got > src.size()) {
            return false;
        }
        src = src.subspan(got);
        offset += got;
    }
    if (write_end > impl_.size) {
        impl_.size = write_end;
    }
    return true;
}
