#pragma once

#include "richclip/byte_source.h"
#include "richclip/decode_status.h"

#include <cstddef>
#include <cstdint>
#include <span>
#include <string>
#include <vector>

/**
 * \file stream_reader.h
 * \brief Fixed-width primitive reads over a \ref ByteSource.
 */

namespace richclip {

/**
 * \brief Primitive readers used by the decoders.
 *
 * Tracks the number of bytes consumed so failures can report a stream
 * offset. Every method returns `DecodeStatus::Ok` or the status that ends
 * the decode call; outputs are unspecified on failure.
 *
 * `max_bytes` arguments bound length-prefixed payloads before any
 * allocation happens (0 = unlimited). Payload buffers grow with the data
 * actually received, so a corrupt length on a short stream does not
 * allocate the declared size up front.
 */
class StreamReader final {
public:
    explicit StreamReader(ByteSource& source) noexcept;

    StreamReader(const StreamReader&)            = delete;
    StreamReader& operator=(const StreamReader&) = delete;

    /// Fills \p out completely, or fails with `TruncatedInput`.
    DecodeStatus read_exact_bytes(std::span<std::byte> out) noexcept;

    /// Reads exactly \p n bytes into \p out (replacing its contents).
    DecodeStatus read_exact_bytes(uint64_t n,
                                  std::vector<std::byte>* out) noexcept;

    /**
     * \brief Reads a single byte, distinguishing a clean end-of-stream.
     *
     * On a clean end, returns `Ok` with `*at_end == true`.
     */
    DecodeStatus read_u8_or_end(uint8_t* out, bool* at_end) noexcept;

    /// Reads a 4-byte big-endian length.
    DecodeStatus read_u32be(uint32_t* out) noexcept;

    /**
     * \brief Reads `[u32be L][L bytes]`.
     *
     * \p declared_length receives `L` once it is known (may be null).
     * Fails with `LimitExceeded` when `L > max_bytes` (and `max_bytes != 0`)
     * or when the payload would end past the \ref set_max_offset bound,
     * before reading the payload.
     */
    DecodeStatus read_length_prefixed_block(uint64_t max_bytes,
                                            std::vector<std::byte>* out,
                                            uint32_t* declared_length) noexcept;

    /// Length-prefixed block validated as UTF-8 (`InvalidEncoding` otherwise).
    DecodeStatus read_mime_type_string(uint64_t max_bytes, std::string* out,
                                       uint32_t* declared_length) noexcept;

    /// Length-prefixed block returned unchanged.
    DecodeStatus read_content_block(uint64_t max_bytes,
                                    std::vector<std::byte>* out,
                                    uint32_t* declared_length) noexcept;

    /// Reads until end-of-stream; `LimitExceeded` past \p max_bytes (0 = unlimited).
    DecodeStatus read_to_end(uint64_t max_bytes,
                             std::vector<std::byte>* out) noexcept;

    /// Bytes consumed so far.
    uint64_t offset() const noexcept;

    /**
     * \brief Bounds the stream offset length-prefixed payloads may reach.
     *
     * A block whose payload would end past \p max_offset fails with
     * `LimitExceeded` before the payload is read (0 = unlimited).
     */
    void set_max_offset(uint64_t max_offset) noexcept;

private:
    DecodeStatus read_some(std::span<std::byte> out, size_t* got) noexcept;

    ByteSource* source_ = nullptr;
    uint64_t offset_    = 0;
    uint64_t max_offset_ = 0;
};

}  // namespace richclip
