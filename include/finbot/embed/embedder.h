#pragma once
#include <cstddef>
#include <string>
#include <string_view>
#include <vector>

#include <finbot/status.h>
#include <finbot/types.h>

namespace finbot::embed
{
    /**
     * Embedder: text -> fixed-dimension vector.
     *
     * Implementations must be deterministic for a given model and return
     * vectors of exactly dim() floats. Calls are blocking.
     */
    class Embedder
    {
    public:
        virtual ~Embedder() = default;

        virtual Result<Embedding> Embed(std::string_view text) = 0;

        // One vector per input, in input order. Fails as a whole.
        virtual Result<std::vector<Embedding>> EmbedMany(const std::vector<std::string> &texts)
        {
            std::vector<Embedding> out;
            out.reserve(texts.size());
            for (const auto &t : texts)
            {
                auto r = Embed(t);
                if (!r.ok())
                    return r.status();
                out.push_back(r.move_value());
            }
            return out;
        }

        virtual std::size_t dim() const = 0;
    };

} // namespace finbot::embed
