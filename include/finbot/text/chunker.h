#pragma once
#include <cstddef>
#include <string>
#include <string_view>
#include <vector>

#include <finbot/options.h>

namespace finbot::text
{
    class Sanitizer;

    /**
     * ChunkStream: lazily splits a document into bounded, overlapping passages.
     *
     * Paragraphs are separated by blank lines. A paragraph longer than
     * max_chunk_size is broken into sentences. Units accumulate until the next
     * one would overflow max_chunk_size; the buffer is then flushed (kept only
     * if it reaches min_chunk_size) and reseeded with the last overlap_size
     * characters of the flushed chunk. Sizes count code points.
     *
     * Usage:
     *   ChunkStream s(text, opts);
     *   std::string chunk;
     *   while (s.Next(&chunk)) { ... }
     */
    class ChunkStream
    {
    public:
        ChunkStream(std::string_view text, ChunkerOptions opts = {});

        // Writes the next chunk to *out. Returns false once the input is exhausted.
        bool Next(std::string *out);

        // Rewinds to the first chunk.
        void Reset();

    private:
        bool LoadNextParagraph();
        std::string FlushBuffer();

        std::string text_;
        ChunkerOptions opts_;

        std::size_t para_pos_ = 0;
        std::vector<std::string> units_;
        std::size_t unit_idx_ = 0;

        std::vector<std::string> buffer_;
        std::size_t buffer_size_ = 0;
        bool finished_ = false;
    };

    std::vector<std::string> SplitIntoChunks(std::string_view text, const ChunkerOptions &opts = {});

    // Chunks, cleans and validates; chunks failing validation are dropped.
    // *produced (optional) receives the chunk count before validation.
    std::vector<std::string> ChunkDocument(std::string_view text,
                                           const ChunkerOptions &opts,
                                           const Sanitizer &sanitizer,
                                           std::size_t *produced = nullptr);

    // Sentence split at whitespace that follows '.', '!' or '?'. Trimmed, empties skipped.
    std::vector<std::string> SplitSentences(std::string_view paragraph);

} // namespace finbot::text
