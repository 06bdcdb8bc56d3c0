#include <finbot/embed/hashing_embedder.h>

#include <cctype>
#include <cmath>

namespace finbot::embed
{
    std::uint64_t Fnv1a64(std::string_view s) noexcept
    {
        std::uint64_t h = 1469598103934665603ull;
        for (unsigned char c : s)
        {
            h ^= c;
            h *= 1099511628211ull;
        }
        return h;
    }

    HashingEmbedder::HashingEmbedder(std::size_t dim) : dim_(dim) {}

    Result<Embedding> HashingEmbedder::Embed(std::string_view text)
    {
        if (dim_ == 0)
            return Status::FailedPrecondition("embedding dimension is zero");

        Embedding vec(dim_, 0.0f);
        std::string token;
        auto flush = [&]()
        {
            if (token.empty())
                return;
            vec[Fnv1a64(token) % dim_] += 1.0f;
            token.clear();
        };

        for (char ch : text)
        {
            const auto c = static_cast<unsigned char>(ch);
            // Bytes >= 0x80 belong to UTF-8 sequences; keep them inside tokens.
            if (c >= 0x80 || std::isalnum(c))
                token += static_cast<char>(std::tolower(c));
            else
                flush();
        }
        flush();

        double norm = 0.0;
        for (float v : vec)
            norm += static_cast<double>(v) * v;
        if (norm > 0.0)
        {
            const float inv = static_cast<float>(1.0 / std::sqrt(norm));
            for (float &v : vec)
                v *= inv;
        }
        return vec;
    }

} // namespace finbot::embed
