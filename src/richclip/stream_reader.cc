#include "richclip/stream_reader.h"

#include "richclip/utf8.h"
#include "richclip/wire_format.h"

#include <array>

namespace richclip {
namespace {

    // Payload buffers grow by at most this much per read.
    static constexpr size_t kReadChunkBytes = 64U * 1024U;

}  // namespace

StreamReader::StreamReader(ByteSource& source) noexcept
    : source_(&source)
{
}


DecodeStatus
StreamReader::read_some(std::span<std::byte> out, size_t* got) noexcept
{
    *got                   = 0;
    const ByteReadResult r = source_->read(out);
    if (r.status != ByteReadStatus::Ok) {
        return DecodeStatus::IoFailed;
    }
    *got = r.bytes_read;
    offset_ += r.bytes_read;
    return DecodeStatus::Ok;
}


DecodeStatus
StreamReader::read_exact_bytes(std::span<std::byte> out) noexcept
{
    size_t filled = 0;
    while (filled < out.size()) {
        size_t got            = 0;
        const DecodeStatus st = read_some(out.subspan(filled), &got);
        if (st != DecodeStatus::Ok) {
            return st;
        }
        if (got == 0U) {
            return DecodeStatus::TruncatedInput;
        }
        filled += got;
    }
    return DecodeStatus::Ok;
}


DecodeStatus
StreamReader::read_exact_bytes(uint64_t n, std::vector<std::byte>* out) noexcept
{
    out->clear();
    if (n == 0U) {
        return DecodeStatus::Ok;
    }
    out->reserve(static_cast<size_t>(n < kReadChunkBytes ? n
                                                         : kReadChunkBytes));

    uint64_t filled = 0;
    while (filled < n) {
        const uint64_t left = n - filled;
        const size_t chunk  = static_cast<size_t>(
            left < kReadChunkBytes ? left : kReadChunkBytes);
        const size_t base = out->size();
        out->resize(base + chunk);

        const DecodeStatus st = read_exact_bytes(
            std::span<std::byte>(out->data() + base, chunk));
        if (st != DecodeStatus::Ok) {
            return st;
        }
        filled += chunk;
    }
    return DecodeStatus::Ok;
}


DecodeStatus
StreamReader::read_u8_or_end(uint8_t* out, bool* at_end) noexcept
{
    *at_end = false;
    std::byte b {};
    size_t got            = 0;
    const DecodeStatus st = read_some(std::span<std::byte>(&b, 1), &got);
    if (st != DecodeStatus::Ok) {
        return st;
    }
    if (got == 0U) {
        *at_end = true;
        return DecodeStatus::Ok;
    }
    *out = static_cast<uint8_t>(b);
    return DecodeStatus::Ok;
}


DecodeStatus
StreamReader::read_u32be(uint32_t* out) noexcept
{
    std::array<std::byte, kSectionLengthBytes> buf {};
    const DecodeStatus st = read_exact_bytes(buf);
    if (st != DecodeStatus::Ok) {
        return st;
    }
    *out = load_u32be(buf.data());
    return DecodeStatus::Ok;
}


DecodeStatus
StreamReader::read_length_prefixed_block(uint64_t max_bytes,
                                         std::vector<std::byte>* out,
                                         uint32_t* declared_length) noexcept
{
    uint32_t len          = 0;
    const DecodeStatus st = read_u32be(&len);
    if (st != DecodeStatus::Ok) {
        return st;
    }
    if (declared_length) {
        *declared_length = len;
    }
    if (max_bytes != 0U && len > max_bytes) {
        return DecodeStatus::LimitExceeded;
    }
    if (max_offset_ != 0U && offset_ + len > max_offset_) {
        return DecodeStatus::LimitExceeded;
    }
    return read_exact_bytes(len, out);
}


DecodeStatus
StreamReader::read_mime_type_string(uint64_t max_bytes, std::string* out,
                                    uint32_t* declared_length) noexcept
{
    std::vector<std::byte> buf;
    const DecodeStatus st = read_length_prefixed_block(max_bytes, &buf,
                                                       declared_length);
    if (st != DecodeStatus::Ok) {
        return st;
    }
    if (!is_valid_utf8(buf)) {
        return DecodeStatus::InvalidEncoding;
    }
    out->assign(reinterpret_cast<const char*>(buf.data()), buf.size());
    return DecodeStatus::Ok;
}


DecodeStatus
StreamReader::read_content_block(uint64_t max_bytes,
                                 std::vector<std::byte>* out,
                                 uint32_t* declared_length) noexcept
{
    return read_length_prefixed_block(max_bytes, out, declared_length);
}


DecodeStatus
StreamReader::read_to_end(uint64_t max_bytes,
                          std::vector<std::byte>* out) noexcept
{
    out->clear();
    for (;;) {
        const size_t base = out->size();
        out->resize(base + kReadChunkBytes);

        size_t got            = 0;
        const DecodeStatus st = read_some(
            std::span<std::byte>(out->data() + base, kReadChunkBytes), &got);
        out->resize(base + got);
        if (st != DecodeStatus::Ok) {
            return st;
        }
        if (got == 0U) {
            return DecodeStatus::Ok;
        }
        if (max_bytes != 0U && out->size() > max_bytes) {
            return DecodeStatus::LimitExceeded;
        }
    }
}


uint64_t
StreamReader::offset() const noexcept
{
    return offset_;
}


void
StreamReader::set_max_offset(uint64_t max_offset) noexcept
{
    max_offset_ = max_offset;
}

}  // namespace richclip
