#pragma once
#include <cstdint>

#include <finbot/embed/embedder.h>

namespace finbot::embed
{
    // Feature hashing over lowercase alphanumeric tokens (FNV-1a), L2-normalized.
    // Stable across runs and platforms; empty or token-free text maps to the zero vector.
    class HashingEmbedder final : public Embedder
    {
    public:
        explicit HashingEmbedder(std::size_t dim = kDefaultDim);

        Result<Embedding> Embed(std::string_view text) override;
        std::size_t dim() const override { return dim_; }

        static constexpr std::size_t kDefaultDim = 384;

    private:
        std::size_t dim_;
    };

    std::uint64_t Fnv1a64(std::string_view s) noexcept;

} // namespace finbot::embed
