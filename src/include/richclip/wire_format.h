#pragma once

#include <array>
#include <cstddef>
#include <cstdint>

/**
 * \file wire_format.h
 * \brief Constants of the richclip bulk stream format.
 *
 * \code
 * Header:  [magic: 20 09 02 14][version: 00]
 * Section: [tag: 'M' | 'C'][length: u32 big-endian][payload]
 * Stream  = Header, Section*
 * \endcode
 */

namespace richclip {

inline constexpr std::array<std::byte, 4> kStreamMagic = {
    std::byte { 0x20 },
    std::byte { 0x09 },
    std::byte { 0x02 },
    std::byte { 0x14 },
};

/// The only protocol version accepted by the decoder.
inline constexpr uint8_t kProtocolVersion = 0x00;

inline constexpr size_t kHeaderBytes        = kStreamMagic.size() + 1U;
inline constexpr size_t kSectionTagBytes    = 1U;
inline constexpr size_t kSectionLengthBytes = 4U;

/// One-byte section tags.
enum class SectionTag : uint8_t {
    /// UTF-8 MIME-type label for the next content section.
    MimeType = 'M',
    /// Raw content bytes; closes the current item.
    Content = 'C',
};

inline constexpr uint32_t
load_u32be(const std::byte* p) noexcept
{
    return (static_cast<uint32_t>(p[0]) << 24)
           | (static_cast<uint32_t>(p[1]) << 16)
           | (static_cast<uint32_t>(p[2]) << 8)
           | static_cast<uint32_t>(p[3]);
}

inline constexpr void
store_u32be(uint32_t v, std::byte* p) noexcept
{
    p[0] = static_cast<std::byte>((v >> 24) & 0xFFU);
    p[1] = static_cast<std::byte>((v >> 16) & 0xFFU);
    p[2] = static_cast<std::byte>((v >> 8) & 0xFFU);
    p[3] = static_cast<std::byte>(v & 0xFFU);
}

}  // namespace richclip
