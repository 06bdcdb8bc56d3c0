#pragma once
#include <cstddef>
#include <cstdint>
#include <memory>
#include <string>
#include <string_view>
#include <vector>

#include <finbot/options.h>
#include <finbot/status.h>
#include <finbot/types.h>

namespace finbot
{
    class Logger;
    namespace embed
    {
        class Embedder;
    }
} // namespace finbot

namespace finbot::index
{
    /**
     * VectorIndex: passages plus their embeddings, searchable by inner product.
     *
     * Persists to `faiss.index` + `meta.bin` under IndexOptions::index_dir.
     * Passages are append-only; Create() replaces everything.
     * No internal locking: callers serialize all operations.
     */
    class VectorIndex
    {
    public:
        static constexpr const char *kIndexFileName = "faiss.index";
        static constexpr const char *kMetaFileName = "meta.bin";

        VectorIndex(embed::Embedder *embedder, IndexOptions opts, Logger *logger = nullptr);
        ~VectorIndex();

        VectorIndex(const VectorIndex &) = delete;
        VectorIndex &operator=(const VectorIndex &) = delete;

        // Builds a fresh index from `passages` and persists it.
        Status Create(const std::vector<Passage> &passages);

        // Appends and re-persists; behaves as Create() when nothing is loaded.
        Status Add(const std::vector<Passage> &passages);

        // No-op (Ok) when nothing is loaded.
        Status Save() const;

        // True when both files were read and agree. On false the current state is kept.
        bool Load();

        // Best `k` passages by inner product, highest first; ties keep insertion order.
        // Empty result (Ok) when nothing is loaded.
        Status Search(std::string_view query, std::size_t k, std::vector<ScoredPassage> *out) const;

        bool loaded() const { return store_ != nullptr; }
        std::size_t size() const;
        std::uint32_t dim() const;
        const std::string &index_dir() const { return opts_.index_dir; }

        // Checks the persisted pair under `index_dir` without loading it into an instance.
        // NotFound when either file is missing, Corruption when they disagree.
        static Status Verify(const std::string &index_dir, std::size_t *passage_count = nullptr);

    private:
        struct Store;

        Result<std::vector<Embedding>> EmbedAll(const std::vector<Passage> &passages,
                                                std::uint32_t expected_dim) const;
        Status Persist(const Store &store) const;

        embed::Embedder *embedder_;
        IndexOptions opts_;
        Logger *logger_;
        std::unique_ptr<Store> store_;
    };

} // namespace finbot::index
