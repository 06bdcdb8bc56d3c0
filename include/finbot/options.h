#pragma once
#include <cstddef>
#include <cstdint>
#include <string>

namespace finbot
{

    struct ChunkerOptions
    {
        std::size_t max_chunk_size = 1000; // characters
        std::size_t min_chunk_size = 100;  // shorter flushes are dropped
        std::size_t overlap_size = 50;     // tail of the previous chunk carried forward
    };

    struct IndexOptions
    {
        // Directory holding the faiss.index / meta.bin pair.
        std::string index_dir{"data/vector_store"};
    };

    struct PipelineOptions
    {
        std::uint32_t top_k = 3;
        ChunkerOptions chunker;
    };

} // namespace finbot
