#pragma once

#include <cstddef>
#include <cstdint>
#include <span>

/**
 * \file byte_source.h
 * \brief Sequential, blocking byte sources consumed by the decoders.
 */

namespace richclip {

/// Status of a single \ref ByteSource::read call.
enum class ByteReadStatus : uint8_t {
    Ok,
    /// The underlying file/pipe/socket reported an error.
    IoFailed,
};

struct ByteReadResult final {
    ByteReadStatus status = ByteReadStatus::Ok;
    /// Number of bytes stored into the buffer. 0 with `Ok` means end-of-stream.
    size_t bytes_read = 0;
};

/**
 * \brief Abstract "read up to N bytes" capability.
 *
 * Implementations block as needed and return fewer bytes than requested
 * only at end-of-stream or when the transport delivers a short read.
 * Seeking and peeking are not part of the contract.
 */
class ByteSource {
public:
    virtual ~ByteSource() noexcept = default;

    /// Reads at most `out.size()` bytes into \p out.
    virtual ByteReadResult read(std::span<std::byte> out) noexcept = 0;
};


/// Reads from a caller-owned memory span.
class SpanByteSource final : public ByteSource {
public:
    explicit SpanByteSource(std::span<const std::byte> bytes) noexcept;

    ByteReadResult read(std::span<std::byte> out) noexcept override;

    /// Bytes not yet consumed.
    size_t remaining() const noexcept;

private:
    std::span<const std::byte> bytes_;
    size_t pos_ = 0;
};


/// Status code for \ref FdByteSource::open_file.
enum class FdOpenStatus : uint8_t {
    Ok,
    OpenFailed,
};

/**
 * \brief Reads from a POSIX file descriptor (file, pipe, socket, stdin).
 *
 * A source created with \ref FdByteSource::borrow leaves the descriptor
 * open; one created by \ref open_file closes it on destruction.
 */
class FdByteSource final : public ByteSource {
public:
    FdByteSource() noexcept;
    ~FdByteSource() noexcept override;

    FdByteSource(const FdByteSource&)            = delete;
    FdByteSource& operator=(const FdByteSource&) = delete;

    FdByteSource(FdByteSource&& other) noexcept;
    FdByteSource& operator=(FdByteSource&& other) noexcept;

    /// Wraps \p fd without taking ownership.
    static FdByteSource borrow(int fd) noexcept;

    /// Opens \p path read-only; the descriptor is owned by this source.
    FdOpenStatus open_file(const char* path) noexcept;

    /// Closes an owned descriptor (idempotent).
    void close() noexcept;

    bool is_open() const noexcept;
    int fd() const noexcept;

    ByteReadResult read(std::span<std::byte> out) noexcept override;

private:
    int fd_     = -1;
    bool owned_ = false;
};

}  // namespace richclip
