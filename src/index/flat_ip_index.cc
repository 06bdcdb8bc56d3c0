// flat_ip_index.cc: FlatIpIndex implementation wrapping faiss::IndexFlatIP.

#include "index/flat_ip_index.h"

#include <algorithm>
#include <exception>

// Pull complete FAISS headers only in this TU
#include <faiss/Index.h>
#include <faiss/IndexFlat.h>
#include <faiss/index_io.h>

namespace finbot::index {

FlatIpIndex::FlatIpIndex(std::uint32_t dim)
    : dim_(dim), index_(std::make_unique<faiss::IndexFlatIP>(static_cast<faiss::idx_t>(dim)))
{
}

FlatIpIndex::~FlatIpIndex() = default;

std::size_t FlatIpIndex::count() const
{
    return static_cast<std::size_t>(index_->ntotal);
}

// ── Build ─────────────────────────────────────────────────────────────────────
Status FlatIpIndex::AddBatch(const float* vecs, std::size_t n)
{
    if (n == 0) return Status::Ok();
    try {
        index_->add(static_cast<faiss::idx_t>(n), vecs);
    } catch (const std::exception& ex) {
        return Status::Internal(std::string("faiss add failed: ") + ex.what());
    }
    return Status::Ok();
}

// ── Query ─────────────────────────────────────────────────────────────────────
Status FlatIpIndex::Search(std::span<const float> query,
                           std::uint32_t          topk,
                           std::vector<std::int64_t>* out_ids,
                           std::vector<float>*        out_scores) const
{
    out_ids->clear();
    out_scores->clear();
    if (query.size() != dim_)
        return Status::InvalidArgument("query dim mismatch");
    if (index_->ntotal == 0 || topk == 0)
        return Status::Ok();

    const auto k = static_cast<faiss::idx_t>(
        std::min<std::size_t>(topk, static_cast<std::size_t>(index_->ntotal)));

    std::vector<faiss::idx_t> faiss_ids(static_cast<std::size_t>(k), -1);
    std::vector<float>        faiss_scores(static_cast<std::size_t>(k), 0.0f);
    try {
        index_->search(1, query.data(), k, faiss_scores.data(), faiss_ids.data());
    } catch (const std::exception& ex) {
        return Status::Internal(std::string("faiss search failed: ") + ex.what());
    }

    for (std::size_t i = 0; i < faiss_ids.size(); ++i) {
        if (faiss_ids[i] < 0) continue;
        out_ids->push_back(static_cast<std::int64_t>(faiss_ids[i]));
        out_scores->push_back(faiss_scores[i]);
    }
    return Status::Ok();
}

// ── Persistence ───────────────────────────────────────────────────────────────
Status FlatIpIndex::Save(const std::string& path) const
{
    try {
        faiss::write_index(index_.get(), path.c_str());
    } catch (const std::exception& ex) {
        return Status::IoError(std::string("faiss write failed: ") + ex.what());
    }
    return Status::Ok();
}

Status FlatIpIndex::Load(const std::string& path, std::unique_ptr<FlatIpIndex>* out)
{
    std::unique_ptr<faiss::Index> raw;
    try {
        raw.reset(faiss::read_index(path.c_str()));
    } catch (const std::exception& ex) {
        return Status::IoError(std::string("faiss read failed: ") + ex.what());
    }

    auto* flat = dynamic_cast<faiss::IndexFlatIP*>(raw.get());
    if (!flat || flat->metric_type != faiss::METRIC_INNER_PRODUCT)
        return Status::Corruption("not an inner-product flat index: " + path);
    raw.release();

    auto result = std::make_unique<FlatIpIndex>(static_cast<std::uint32_t>(flat->d));
    result->index_.reset(flat);
    *out = std::move(result);
    return Status::Ok();
}

} // namespace finbot::index
