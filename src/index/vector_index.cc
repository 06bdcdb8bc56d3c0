#include <finbot/index/vector_index.h>

#include <algorithm>
#include <filesystem>

#include <finbot/embed/embedder.h>
#include <finbot/storage/file_util.h>
#include <finbot/util/logger.h>

#include "index/flat_ip_index.h"
#include "index/passage_codec.h"

namespace finbot::index
{
    namespace fs = std::filesystem;

    // Vectors and passages live together; Append is the only way to grow them,
    // so FAISS id i always names passages[i].
    struct VectorIndex::Store
    {
        std::unique_ptr<FlatIpIndex> vectors;
        std::vector<Passage> passages;

        Status Append(const std::vector<Embedding> &embeddings, const std::vector<Passage> &batch)
        {
            if (embeddings.size() != batch.size())
                return Status::Internal("embedding count does not match passage count");
            const std::size_t d = vectors->dim();
            std::vector<float> flat;
            flat.reserve(embeddings.size() * d);
            for (const auto &e : embeddings)
            {
                if (e.size() != d)
                    return Status::InvalidArgument("embedding dim mismatch");
                flat.insert(flat.end(), e.begin(), e.end());
            }
            Status st = vectors->AddBatch(flat.data(), embeddings.size());
            if (!st.ok())
                return st;
            passages.insert(passages.end(), batch.begin(), batch.end());
            return Status::Ok();
        }
    };

    namespace
    {
        void LogTo(Logger *logger, LogLevel lvl, std::string_view event, const std::string &msg)
        {
            if (!logger)
                return;
            switch (lvl)
            {
            case LogLevel::debug:
                logger->Debug(event, msg);
                break;
            case LogLevel::info:
                logger->Info(event, msg);
                break;
            case LogLevel::warn:
                logger->Warn(event, msg);
                break;
            case LogLevel::error:
                logger->Error(event, msg);
                break;
            }
        }

        struct LoadedPair
        {
            std::unique_ptr<FlatIpIndex> vectors;
            std::vector<Passage> passages;
        };

        Status ReadPair(const std::string &index_dir, LoadedPair *out)
        {
            const fs::path index_path = fs::path(index_dir) / VectorIndex::kIndexFileName;
            const fs::path meta_path = fs::path(index_dir) / VectorIndex::kMetaFileName;
            std::error_code ec;
            if (!fs::exists(index_path, ec) || !fs::exists(meta_path, ec))
                return Status::NotFound("no persisted index in " + index_dir);

            std::unique_ptr<FlatIpIndex> vectors;
            Status st = FlatIpIndex::Load(index_path.string(), &vectors);
            if (!st.ok())
                return st;

            std::string raw;
            st = storage::ReadFileToString(meta_path.string(), &raw);
            if (!st.ok())
                return st;
            std::uint32_t meta_dim = 0;
            std::vector<Passage> passages;
            st = DecodePassages(raw, &meta_dim, &passages);
            if (!st.ok())
                return st;

            if (meta_dim != vectors->dim())
                return Status::Corruption("dimension mismatch between faiss.index and meta.bin");
            if (vectors->count() != passages.size())
                return Status::Corruption("vector count " + std::to_string(vectors->count()) +
                                          " != passage count " + std::to_string(passages.size()));
            out->vectors = std::move(vectors);
            out->passages = std::move(passages);
            return Status::Ok();
        }
    } // namespace

    VectorIndex::VectorIndex(embed::Embedder *embedder, IndexOptions opts, Logger *logger)
        : embedder_(embedder), opts_(std::move(opts)), logger_(logger)
    {
    }

    VectorIndex::~VectorIndex() = default;

    std::size_t VectorIndex::size() const
    {
        return store_ ? store_->passages.size() : 0;
    }

    std::uint32_t VectorIndex::dim() const
    {
        return store_ ? store_->vectors->dim() : 0;
    }

    Result<std::vector<Embedding>> VectorIndex::EmbedAll(const std::vector<Passage> &passages,
                                                         std::uint32_t expected_dim) const
    {
        if (!embedder_)
            return Status::FailedPrecondition("no embedder configured");
        std::vector<std::string> texts;
        texts.reserve(passages.size());
        for (const auto &p : passages)
            texts.push_back(p.content);

        auto res = embedder_->EmbedMany(texts);
        if (!res.ok())
            return Status::Unavailable("embedding failed: " + res.status().msg);
        std::vector<Embedding> embeddings = res.move_value();
        if (embeddings.size() != passages.size())
            return Status::Internal("embedder returned " + std::to_string(embeddings.size()) +
                                    " vectors for " + std::to_string(passages.size()) + " texts");

        const std::size_t d = expected_dim != 0 ? expected_dim : embeddings.front().size();
        if (d == 0)
            return Status::InvalidArgument("embedder returned empty vectors");
        for (const auto &e : embeddings)
        {
            if (e.size() != d)
                return Status::InvalidArgument("embedding dim " + std::to_string(e.size()) +
                                               " != index dim " + std::to_string(d));
        }
        return embeddings;
    }

    Status VectorIndex::Create(const std::vector<Passage> &passages)
    {
        if (passages.empty())
        {
            LogTo(logger_, LogLevel::warn, "index.create", "indexed 0 passages: no passages to index");
            return Status::InvalidArgument("no passages to index");
        }

        auto embedded = EmbedAll(passages, 0);
        if (!embedded.ok())
            return embedded.status();

        auto fresh = std::make_unique<Store>();
        fresh->vectors = std::make_unique<FlatIpIndex>(static_cast<std::uint32_t>(embedded.value().front().size()));
        Status st = fresh->Append(embedded.value(), passages);
        if (!st.ok())
            return st;

        store_ = std::move(fresh);
        LogTo(logger_, LogLevel::info, "index.create",
              "indexed " + std::to_string(store_->passages.size()) + " passages dim=" +
                  std::to_string(store_->vectors->dim()));
        return Save();
    }

    Status VectorIndex::Add(const std::vector<Passage> &passages)
    {
        if (!store_)
            return Create(passages);
        if (passages.empty())
            return Status::Ok();

        auto embedded = EmbedAll(passages, store_->vectors->dim());
        if (!embedded.ok())
            return embedded.status();

        Status st = store_->Append(embedded.value(), passages);
        if (!st.ok())
            return st;
        LogTo(logger_, LogLevel::info, "index.add",
              "added " + std::to_string(passages.size()) + " passages total=" +
                  std::to_string(store_->passages.size()));
        return Save();
    }

    Status VectorIndex::Save() const
    {
        if (!store_)
        {
            LogTo(logger_, LogLevel::warn, "index.save", "no index to save");
            return Status::Ok();
        }
        return Persist(*store_);
    }

    Status VectorIndex::Persist(const Store &store) const
    {
        if (!storage::EnsureDirExists(opts_.index_dir))
            return Status::FromErrno(ErrorCode::kIoError, "create index dir " + opts_.index_dir);

        const fs::path dir(opts_.index_dir);
        const std::string index_path = (dir / kIndexFileName).string();
        const std::string meta_path = (dir / kMetaFileName).string();
        const std::string index_tmp = index_path + ".tmp";
        const std::string meta_tmp = meta_path + ".tmp";

        Status st = store.vectors->Save(index_tmp);
        if (!st.ok())
            return st;
        st = storage::WriteStringToFileSync(meta_tmp, EncodePassages(store.vectors->dim(), store.passages));
        if (!st.ok())
            return st;

        if (!storage::AtomicRename(index_tmp, index_path))
            return Status::FromErrno(ErrorCode::kIoError, "rename " + index_tmp);
        if (!storage::AtomicRename(meta_tmp, meta_path))
            return Status::FromErrno(ErrorCode::kIoError, "rename " + meta_tmp);
        if (!storage::FsyncDirPath(opts_.index_dir))
            LogTo(logger_, LogLevel::warn, "index.save", "directory fsync failed for " + opts_.index_dir);

        LogTo(logger_, LogLevel::info, "index.save",
              "saved " + std::to_string(store.passages.size()) + " passages to " + opts_.index_dir);
        return Status::Ok();
    }

    bool VectorIndex::Load()
    {
        LoadedPair pair;
        Status st = ReadPair(opts_.index_dir, &pair);
        if (!st.ok())
        {
            LogTo(logger_, st.code == ErrorCode::kNotFound ? LogLevel::info : LogLevel::error,
                  "index.load", st.ToString());
            return false;
        }
        if (embedder_ && embedder_->dim() != pair.vectors->dim())
        {
            LogTo(logger_, LogLevel::error, "index.load",
                  "persisted dim " + std::to_string(pair.vectors->dim()) + " != embedder dim " +
                      std::to_string(embedder_->dim()));
            return false;
        }

        auto loaded = std::make_unique<Store>();
        loaded->vectors = std::move(pair.vectors);
        loaded->passages = std::move(pair.passages);
        store_ = std::move(loaded);
        LogTo(logger_, LogLevel::info, "index.load",
              "loaded " + std::to_string(store_->passages.size()) + " passages from " + opts_.index_dir);
        return true;
    }

    Status VectorIndex::Search(std::string_view query, std::size_t k, std::vector<ScoredPassage> *out) const
    {
        out->clear();
        if (k == 0)
            return Status::InvalidArgument("k must be positive");
        if (!store_ || store_->passages.empty())
        {
            LogTo(logger_, LogLevel::debug, "index.search", "no index loaded");
            return Status::Ok();
        }
        if (!embedder_)
            return Status::FailedPrecondition("no embedder configured");

        auto q = embedder_->Embed(query);
        if (!q.ok())
            return Status::Unavailable("query embedding failed: " + q.status().msg);
        if (q.value().size() != store_->vectors->dim())
            return Status::InvalidArgument("query dim mismatch");

        std::vector<std::int64_t> ids;
        std::vector<float> scores;
        const auto topk = static_cast<std::uint32_t>(std::min<std::size_t>(k, store_->passages.size()));
        Status st = store_->vectors->Search(q.value(), topk, &ids, &scores);
        if (!st.ok())
            return st;

        struct Hit
        {
            std::int64_t id;
            float score;
        };
        std::vector<Hit> hits;
        hits.reserve(ids.size());
        for (std::size_t i = 0; i < ids.size(); ++i)
        {
            if (ids[i] < 0 || static_cast<std::size_t>(ids[i]) >= store_->passages.size())
                continue;
            hits.push_back({ids[i], scores[i]});
        }
        std::sort(hits.begin(), hits.end(), [](const Hit &a, const Hit &b)
                  { return a.score != b.score ? a.score > b.score : a.id < b.id; });

        out->reserve(hits.size());
        for (const auto &h : hits)
            out->push_back({store_->passages[static_cast<std::size_t>(h.id)], h.score});
        return Status::Ok();
    }

    Status VectorIndex::Verify(const std::string &index_dir, std::size_t *passage_count)
    {
        LoadedPair pair;
        Status st = ReadPair(index_dir, &pair);
        if (!st.ok())
            return st;
        if (passage_count)
            *passage_count = pair.passages.size();
        return Status::Ok();
    }

} // namespace finbot::index
