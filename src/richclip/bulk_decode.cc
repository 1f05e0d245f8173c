#include "richclip/bulk_decode.h"

#include "richclip/stream_reader.h"
#include "richclip/wire_format.h"

#include <array>
#include <string>
#include <utility>

namespace richclip {
namespace {

    enum class BulkState : uint8_t {
        ExpectHeader,
        ExpectSectionOrEnd,
        ExpectMimeBody,
        ExpectContentBody,
        Done,
    };

    static bool over_limit(uint64_t value, uint64_t limit) noexcept
    {
        return limit != 0U && value > limit;
    }

    class BulkDecoder final {
    public:
        BulkDecoder(ByteSource& source, const BulkDecodeLimits& limits,
                    std::vector<DataItem>* items) noexcept
            : reader_(source)
            , limits_(limits)
            , items_(items)
        {
            reader_.set_max_offset(limits.max_total_bytes);
        }

        DecodeResult run() noexcept
        {
            while (state_ != BulkState::Done) {
                DecodeStatus st = DecodeStatus::Ok;
                switch (state_) {
                case BulkState::ExpectHeader: st = read_header(); break;
                case BulkState::ExpectSectionOrEnd: st = read_tag(); break;
                case BulkState::ExpectMimeBody: st = read_mime_body(); break;
                case BulkState::ExpectContentBody:
                    st = read_content_body();
                    break;
                case BulkState::Done: break;
                }
                if (st == DecodeStatus::Ok
                    && over_limit(reader_.offset(), limits_.max_total_bytes)) {
                    st = DecodeStatus::LimitExceeded;
                }
                if (st != DecodeStatus::Ok) {
                    result_.status = st;
                    break;
                }
            }
            result_.bytes_consumed = reader_.offset();
            return result_;
        }

    private:
        void begin_field(DecodeField field) noexcept
        {
            result_.field  = field;
            result_.offset = reader_.offset();
        }

        DecodeStatus read_header() noexcept
        {
            begin_field(DecodeField::Magic);
            std::array<std::byte, kStreamMagic.size()> magic {};
            DecodeStatus st = reader_.read_exact_bytes(magic);
            if (st != DecodeStatus::Ok) {
                return st;
            }
            if (magic != kStreamMagic) {
                return DecodeStatus::BadMagic;
            }

            begin_field(DecodeField::Version);
            std::array<std::byte, 1> ver {};
            st = reader_.read_exact_bytes(ver);
            if (st != DecodeStatus::Ok) {
                return st;
            }
            result_.version = static_cast<uint8_t>(ver[0]);
            if (result_.version != kProtocolVersion) {
                return DecodeStatus::UnsupportedVersion;
            }

            state_ = BulkState::ExpectSectionOrEnd;
            return DecodeStatus::Ok;
        }

        DecodeStatus read_tag() noexcept
        {
            begin_field(DecodeField::SectionTag);
            uint8_t tag           = 0;
            bool at_end           = false;
            const DecodeStatus st = reader_.read_u8_or_end(&tag, &at_end);
            if (st != DecodeStatus::Ok) {
                return st;
            }
            if (at_end) {
                result_.field                      = DecodeField::None;
                result_.pending_mime_types_dropped = static_cast<uint32_t>(
                    pending_.size());
                pending_.clear();
                state_ = BulkState::Done;
                return DecodeStatus::Ok;
            }

            result_.tag = tag;
            if (tag != static_cast<uint8_t>(SectionTag::MimeType)
                && tag != static_cast<uint8_t>(SectionTag::Content)) {
                return DecodeStatus::UnknownSectionTag;
            }
            if (over_limit(static_cast<uint64_t>(result_.sections_decoded) + 1U,
                           limits_.max_sections)) {
                return DecodeStatus::LimitExceeded;
            }

            switch (static_cast<SectionTag>(tag)) {
            case SectionTag::MimeType:
                if (over_limit(pending_.size() + 1U,
                               limits_.max_mime_types_per_item)) {
                    return DecodeStatus::LimitExceeded;
                }
                state_ = BulkState::ExpectMimeBody;
                return DecodeStatus::Ok;
            case SectionTag::Content:
                if (pending_.empty()) {
                    return DecodeStatus::ContentWithoutMimeType;
                }
                if (over_limit(static_cast<uint64_t>(items_->size()) + 1U,
                               limits_.max_items)) {
                    return DecodeStatus::LimitExceeded;
                }
                state_ = BulkState::ExpectContentBody;
                return DecodeStatus::Ok;
            }
            return DecodeStatus::UnknownSectionTag;
        }

        DecodeStatus read_mime_body() noexcept
        {
            begin_field(DecodeField::SectionLength);
            std::string mime_type;
            uint32_t len          = 0;
            const DecodeStatus st = reader_.read_mime_type_string(
                limits_.max_mime_type_bytes, &mime_type, &len);
            note_length(len, st);
            if (st != DecodeStatus::Ok) {
                return st;
            }

            pending_.push_back(std::move(mime_type));
            result_.sections_decoded += 1;
            state_ = BulkState::ExpectSectionOrEnd;
            return DecodeStatus::Ok;
        }

        DecodeStatus read_content_body() noexcept
        {
            begin_field(DecodeField::SectionLength);
            DataItem item;
            uint32_t len          = 0;
            const DecodeStatus st = reader_.read_content_block(
                limits_.max_content_bytes, &item.content, &len);
            note_length(len, st);
            if (st != DecodeStatus::Ok) {
                return st;
            }

            item.mime_types = std::move(pending_);
            pending_.clear();
            items_->push_back(std::move(item));
            result_.sections_decoded += 1;
            result_.items_decoded += 1;
            state_ = BulkState::ExpectSectionOrEnd;
            return DecodeStatus::Ok;
        }

        // Once the 4-byte length is in, failures belong to the payload
        // unless the length itself was rejected.
        void note_length(uint32_t len, DecodeStatus st) noexcept
        {
            if (reader_.offset() < result_.offset + kSectionLengthBytes) {
                return;
            }
            result_.declared_length = len;
            if (st == DecodeStatus::LimitExceeded) {
                return;
            }
            result_.offset += kSectionLengthBytes;
            result_.field = (state_ == BulkState::ExpectMimeBody)
                                ? DecodeField::MimeTypePayload
                                : DecodeField::ContentPayload;
        }

        StreamReader reader_;
        const BulkDecodeLimits& limits_;
        std::vector<DataItem>* items_ = nullptr;
        std::vector<std::string> pending_;
        BulkState state_ = BulkState::ExpectHeader;
        DecodeResult result_;
    };

}  // namespace

DecodeResult
decode_bulk(ByteSource& source, std::vector<DataItem>* out,
            const BulkDecodeOptions& options) noexcept
{
    std::vector<DataItem> items;
    BulkDecoder decoder(source, options.limits, &items);
    const DecodeResult result = decoder.run();

    if (out) {
        if (result.status == DecodeStatus::Ok) {
            *out = std::move(items);
        } else {
            out->clear();
        }
    }
    return result;
}

}  // namespace richclip
