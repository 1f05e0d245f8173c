#include "richclip/byte_source.h"

#include <cerrno>
#include <cstring>
#include <utility>

#include <fcntl.h>
#include <unistd.h>

namespace richclip {

SpanByteSource::SpanByteSource(std::span<const std::byte> bytes) noexcept
    : bytes_(bytes)
{
}


ByteReadResult
SpanByteSource::read(std::span<std::byte> out) noexcept
{
    ByteReadResult result;
    const size_t avail = bytes_.size() - pos_;
    const size_t n     = out.size() < avail ? out.size() : avail;
    if (n != 0U) {
        std::memcpy(out.data(), bytes_.data() + pos_, n);
        pos_ += n;
    }
    result.bytes_read = n;
    return result;
}


size_t
SpanByteSource::remaining() const noexcept
{
    return bytes_.size() - pos_;
}


FdByteSource::FdByteSource() noexcept = default;


FdByteSource::~FdByteSource() noexcept
{
    close();
}


FdByteSource::FdByteSource(FdByteSource&& other) noexcept
{
    *this = std::move(other);
}


FdByteSource&
FdByteSource::operator=(FdByteSource&& other) noexcept
{
    if (this == &other) {
        return *this;
    }
    close();

    fd_          = other.fd_;
    owned_       = other.owned_;
    other.fd_    = -1;
    other.owned_ = false;
    return *this;
}


FdByteSource
FdByteSource::borrow(int fd) noexcept
{
    FdByteSource source;
    source.fd_    = fd;
    source.owned_ = false;
    return source;
}


FdOpenStatus
FdByteSource::open_file(const char* path) noexcept
{
    close();

    if (!path || !*path) {
        return FdOpenStatus::OpenFailed;
    }

    int fd = -1;
    do {
        fd = ::open(path, O_RDONLY);
    } while (fd < 0 && errno == EINTR);
    if (fd < 0) {
        return FdOpenStatus::OpenFailed;
    }

    fd_    = fd;
    owned_ = true;
    return FdOpenStatus::Ok;
}


void
FdByteSource::close() noexcept
{
    if (owned_ && fd_ >= 0) {
        (void)::close(fd_);
    }
    fd_    = -1;
    owned_ = false;
}


bool
FdByteSource::is_open() const noexcept
{
    return fd_ >= 0;
}


int
FdByteSource::fd() const noexcept
{
    return fd_;
}


ByteReadResult
FdByteSource::read(std::span<std::byte> out) noexcept
{
    ByteReadResult result;
    if (fd_ < 0) {
        result.status = ByteReadStatus::IoFailed;
        return result;
    }
    if (out.empty()) {
        return result;
    }

    for (;;) {
        const ssize_t n = ::read(fd_, out.data(), out.size());
        if (n >= 0) {
            result.bytes_read = static_cast<size_t>(n);
            return result;
        }
        if (errno == EINTR) {
            continue;
        }
        result.status = ByteReadStatus::IoFailed;
        return result;
    }
}

}  // namespace richclip
