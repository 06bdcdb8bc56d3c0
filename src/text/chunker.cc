#include <finbot/text/chunker.h>

#include <finbot/text/sanitizer.h>
#include <finbot/text/utf8.h>

namespace finbot::text
{
    namespace
    {
        bool IsAsciiSpace(char c)
        {
            return c == ' ' || c == '\t' || c == '\n' || c == '\r' || c == '\f' || c == '\v';
        }

        std::string_view Trim(std::string_view s)
        {
            while (!s.empty() && IsAsciiSpace(s.front()))
                s.remove_prefix(1);
            while (!s.empty() && IsAsciiSpace(s.back()))
                s.remove_suffix(1);
            return s;
        }

        std::string ToUnixNewlines(std::string_view text)
        {
            std::string out;
            out.reserve(text.size());
            for (std::size_t i = 0; i < text.size(); ++i)
            {
                if (text[i] == '\r' && i + 1 < text.size() && text[i + 1] == '\n')
                    continue;
                out.push_back(text[i]);
            }
            return out;
        }
    } // namespace

    std::vector<std::string> SplitSentences(std::string_view paragraph)
    {
        std::vector<std::string> out;
        std::size_t start = 0;
        std::size_t i = 0;
        while (i < paragraph.size())
        {
            const bool boundary = IsAsciiSpace(paragraph[i]) && i > 0 &&
                                  (paragraph[i - 1] == '.' || paragraph[i - 1] == '!' || paragraph[i - 1] == '?');
            if (!boundary)
            {
                ++i;
                continue;
            }
            const std::string_view sentence = Trim(paragraph.substr(start, i - start));
            if (!sentence.empty())
                out.emplace_back(sentence);
            while (i < paragraph.size() && IsAsciiSpace(paragraph[i]))
                ++i;
            start = i;
        }
        const std::string_view tail = Trim(paragraph.substr(start));
        if (!tail.empty())
            out.emplace_back(tail);
        return out;
    }

    ChunkStream::ChunkStream(std::string_view text, ChunkerOptions opts)
        : text_(ToUnixNewlines(text)), opts_(opts)
    {
    }

    void ChunkStream::Reset()
    {
        para_pos_ = 0;
        units_.clear();
        unit_idx_ = 0;
        buffer_.clear();
        buffer_size_ = 0;
        finished_ = false;
    }

    bool ChunkStream::LoadNextParagraph()
    {
        units_.clear();
        unit_idx_ = 0;
        while (para_pos_ < text_.size())
        {
            std::size_t end = text_.find("\n\n", para_pos_);
            if (end == std::string::npos)
                end = text_.size();
            const std::string_view para = Trim(std::string_view(text_).substr(para_pos_, end - para_pos_));
            para_pos_ = end == text_.size() ? end : end + 2;
            if (para.empty())
                continue;

            if (Utf8Length(para) > opts_.max_chunk_size)
                units_ = SplitSentences(para);
            else
                units_.emplace_back(para);
            if (!units_.empty())
                return true;
        }
        return false;
    }

    std::string ChunkStream::FlushBuffer()
    {
        std::string chunk;
        for (std::size_t i = 0; i < buffer_.size(); ++i)
        {
            if (i != 0)
                chunk += ' ';
            chunk += buffer_[i];
        }
        buffer_.clear();
        buffer_size_ = 0;
        return chunk;
    }

    bool ChunkStream::Next(std::string *out)
    {
        while (!finished_)
        {
            if (unit_idx_ >= units_.size())
            {
                if (LoadNextParagraph())
                    continue;

                finished_ = true;
                if (buffer_.empty())
                    return false;
                std::string chunk = FlushBuffer();
                if (Utf8Length(chunk) < opts_.min_chunk_size)
                    return false;
                *out = std::move(chunk);
                return true;
            }

            std::string unit = std::move(units_[unit_idx_++]);
            const std::size_t len = Utf8Length(unit);

            if (buffer_size_ + len > opts_.max_chunk_size && !buffer_.empty())
            {
                std::string chunk = FlushBuffer();
                std::string seed = Utf8Suffix(chunk, opts_.overlap_size);
                if (!seed.empty())
                {
                    buffer_size_ = Utf8Length(seed);
                    buffer_.push_back(std::move(seed));
                }
                buffer_size_ += len;
                buffer_.push_back(std::move(unit));

                if (Utf8Length(chunk) >= opts_.min_chunk_size)
                {
                    *out = std::move(chunk);
                    return true;
                }
                continue;
            }

            buffer_size_ += len;
            buffer_.push_back(std::move(unit));
        }
        return false;
    }

    std::vector<std::string> SplitIntoChunks(std::string_view text, const ChunkerOptions &opts)
    {
        std::vector<std::string> chunks;
        ChunkStream stream(text, opts);
        std::string chunk;
        while (stream.Next(&chunk))
            chunks.push_back(std::move(chunk));
        return chunks;
    }

    std::vector<std::string> ChunkDocument(std::string_view text,
                                           const ChunkerOptions &opts,
                                           const Sanitizer &sanitizer,
                                           std::size_t *produced)
    {
        std::vector<std::string> out;
        ChunkStream stream(text, opts);
        std::string chunk;
        std::size_t count = 0;
        while (stream.Next(&chunk))
        {
            ++count;
            std::string cleaned = sanitizer.Clean(chunk);
            if (Sanitizer::IsValidChunk(cleaned))
                out.push_back(std::move(cleaned));
        }
        if (produced)
            *produced = count;
        return out;
    }

} // namespace finbot::text
