// flat_ip_index.h: finbot wrapper around faiss::IndexFlatIP.
//
// Exact inner-product search over every stored vector. Internal FAISS ids are
// sequential and double as positions in the passage table of VectorIndex.

#pragma once

#include <cstdint>
#include <memory>
#include <span>
#include <string>
#include <vector>

#include <finbot/status.h>

// Forward-declare FAISS types to avoid pulling FAISS headers into every TU.
namespace faiss {
struct IndexFlatIP;
} // namespace faiss

namespace finbot::index {

/// Exhaustive inner-product index. Not thread-safe; callers serialize access.
class FlatIpIndex {
public:
    explicit FlatIpIndex(std::uint32_t dim);
    ~FlatIpIndex();

    FlatIpIndex(const FlatIpIndex&) = delete;
    FlatIpIndex& operator=(const FlatIpIndex&) = delete;

    // ── Build ─────────────────────────────────────────────────────────────────
    /// Append n vectors stored row-major in `vecs` (n * dim() floats).
    Status AddBatch(const float* vecs, std::size_t n);

    // ── Query ─────────────────────────────────────────────────────────────────
    /// Top-k by raw inner product, best first. Fewer than k results when the
    /// index holds fewer vectors; FAISS padding (-1 ids) is dropped.
    Status Search(std::span<const float> query,
                  std::uint32_t          topk,
                  std::vector<std::int64_t>* out_ids,
                  std::vector<float>*        out_scores) const;

    // ── Metadata ──────────────────────────────────────────────────────────────
    std::uint32_t dim()   const { return dim_; }
    std::size_t   count() const;

    // ── Persistence ───────────────────────────────────────────────────────────
    /// FAISS native binary (faiss::write_index).
    Status Save(const std::string& path) const;

    /// Fails with Corruption unless the file holds an inner-product flat index.
    static Status Load(const std::string& path, std::unique_ptr<FlatIpIndex>* out);

private:
    std::uint32_t dim_;
    std::unique_ptr<faiss::IndexFlatIP> index_;
};

} // namespace finbot::index
