#include "index/passage_codec.h"

#include <finbot/util/crc32c.h>

namespace finbot::index
{
    namespace
    {
        constexpr std::string_view kMetaHeader = "finbot.meta.v1\n";
        constexpr std::size_t kCrcSize = 4;
        constexpr std::uint8_t kHasCategory = 0x1;
        constexpr std::uint8_t kHasSheetName = 0x2;

        void PutU32(std::string *out, std::uint32_t v)
        {
            for (int i = 0; i < 4; ++i)
                out->push_back(static_cast<char>((v >> (8 * i)) & 0xFF));
        }

        void PutU64(std::string *out, std::uint64_t v)
        {
            for (int i = 0; i < 8; ++i)
                out->push_back(static_cast<char>((v >> (8 * i)) & 0xFF));
        }

        void PutStr(std::string *out, std::string_view s)
        {
            PutU32(out, static_cast<std::uint32_t>(s.size()));
            out->append(s);
        }

        class Reader
        {
        public:
            explicit Reader(std::string_view data) : data_(data) {}

            bool U8(std::uint8_t *v)
            {
                if (pos_ + 1 > data_.size())
                    return false;
                *v = static_cast<std::uint8_t>(data_[pos_++]);
                return true;
            }

            bool U32(std::uint32_t *v)
            {
                if (pos_ + 4 > data_.size())
                    return false;
                std::uint32_t r = 0;
                for (int i = 0; i < 4; ++i)
                    r |= static_cast<std::uint32_t>(static_cast<unsigned char>(data_[pos_ + i])) << (8 * i);
                pos_ += 4;
                *v = r;
                return true;
            }

            bool U64(std::uint64_t *v)
            {
                if (pos_ + 8 > data_.size())
                    return false;
                std::uint64_t r = 0;
                for (int i = 0; i < 8; ++i)
                    r |= static_cast<std::uint64_t>(static_cast<unsigned char>(data_[pos_ + i])) << (8 * i);
                pos_ += 8;
                *v = r;
                return true;
            }

            bool Str(std::string *s)
            {
                std::uint32_t n = 0;
                if (!U32(&n) || pos_ + n > data_.size())
                    return false;
                s->assign(data_.substr(pos_, n));
                pos_ += n;
                return true;
            }

            bool done() const { return pos_ == data_.size(); }
            std::size_t remaining() const { return data_.size() - pos_; }

        private:
            std::string_view data_;
            std::size_t pos_ = 0;
        };
    } // namespace

    std::string EncodePassages(std::uint32_t dim, const std::vector<Passage> &passages)
    {
        std::string buf;
        buf.append(kMetaHeader);
        PutU32(&buf, dim);
        PutU64(&buf, passages.size());
        for (const auto &p : passages)
        {
            std::uint8_t flags = 0;
            if (p.category)
                flags |= kHasCategory;
            if (p.sheet_name)
                flags |= kHasSheetName;
            buf.push_back(static_cast<char>(flags));
            PutStr(&buf, p.content);
            PutStr(&buf, p.source);
            if (p.category)
                PutStr(&buf, *p.category);
            if (p.sheet_name)
                PutStr(&buf, *p.sheet_name);
            PutU32(&buf, static_cast<std::uint32_t>(p.extra.size()));
            for (const auto &[k, v] : p.extra)
            {
                PutStr(&buf, k);
                PutStr(&buf, v);
            }
        }
        PutU32(&buf, util::Crc32c(buf.data(), buf.size()));
        return buf;
    }

    Status DecodePassages(std::string_view raw, std::uint32_t *dim, std::vector<Passage> *out)
    {
        if (raw.size() < kMetaHeader.size() + kCrcSize || !raw.starts_with(kMetaHeader))
            return Status::Corruption("meta: bad header");

        const std::size_t body_len = raw.size() - kCrcSize;
        Reader crc_reader(raw.substr(body_len));
        std::uint32_t stored_crc = 0;
        crc_reader.U32(&stored_crc);
        if (util::Crc32c(raw.data(), body_len) != stored_crc)
            return Status::Corruption("meta: CRC mismatch");

        Reader r(raw.substr(kMetaHeader.size(), body_len - kMetaHeader.size()));
        std::uint32_t d = 0;
        std::uint64_t count = 0;
        if (!r.U32(&d) || !r.U64(&count))
            return Status::Corruption("meta: truncated counts");
        // Every record needs at least 13 bytes; reject absurd counts before reserving.
        if (count > r.remaining() / 13)
            return Status::Corruption("meta: record count exceeds payload");

        std::vector<Passage> passages;
        passages.reserve(static_cast<std::size_t>(count));
        for (std::uint64_t i = 0; i < count; ++i)
        {
            Passage p;
            std::uint8_t flags = 0;
            if (!r.U8(&flags) || !r.Str(&p.content) || !r.Str(&p.source))
                return Status::Corruption("meta: truncated record " + std::to_string(i));
            if (flags & kHasCategory)
            {
                std::string s;
                if (!r.Str(&s))
                    return Status::Corruption("meta: truncated category");
                p.category = std::move(s);
            }
            if (flags & kHasSheetName)
            {
                std::string s;
                if (!r.Str(&s))
                    return Status::Corruption("meta: truncated sheet_name");
                p.sheet_name = std::move(s);
            }
            std::uint32_t n_extra = 0;
            if (!r.U32(&n_extra))
                return Status::Corruption("meta: truncated extra count");
            for (std::uint32_t j = 0; j < n_extra; ++j)
            {
                std::string k, v;
                if (!r.Str(&k) || !r.Str(&v))
                    return Status::Corruption("meta: truncated extra field");
                p.extra.emplace(std::move(k), std::move(v));
            }
            passages.push_back(std::move(p));
        }
        if (!r.done())
            return Status::Corruption("meta: trailing bytes");

        *dim = d;
        *out = std::move(passages);
        return Status::Ok();
    }

} // namespace finbot::index
