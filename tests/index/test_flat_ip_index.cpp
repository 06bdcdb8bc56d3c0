#include <catch2/catch.hpp>

#include "index/flat_ip_index.h"

#include "common/test_utils.h"

#include <faiss/IndexFlat.h>
#include <faiss/index_io.h>

#include <vector>

using namespace finbot;
using finbot::index::FlatIpIndex;

TEST_CASE("FlatIpIndex ranks by raw inner product", "[index][faiss]")
{
    FlatIpIndex idx(2);
    const std::vector<float> rows = {1.0f, 0.0f,
                                     0.0f, 1.0f,
                                     0.7f, 0.7f};
    REQUIRE(idx.AddBatch(rows.data(), 3).ok());
    REQUIRE(idx.count() == 3);

    std::vector<std::int64_t> ids;
    std::vector<float> scores;
    const std::vector<float> q = {1.0f, 0.0f};
    REQUIRE(idx.Search(q, 2, &ids, &scores).ok());
    REQUIRE(ids == std::vector<std::int64_t>{0, 2});
    REQUIRE(scores[0] == Approx(1.0f));
    REQUIRE(scores[1] == Approx(0.7f));

    // k larger than the index is clamped.
    REQUIRE(idx.Search(q, 10, &ids, &scores).ok());
    REQUIRE(ids.size() == 3);
}

TEST_CASE("FlatIpIndex rejects wrong query dimension", "[index][faiss]")
{
    FlatIpIndex idx(4);
    std::vector<std::int64_t> ids;
    std::vector<float> scores;
    const std::vector<float> q = {1.0f, 0.0f};
    REQUIRE(idx.Search(q, 1, &ids, &scores).code == ErrorCode::kInvalidArgument);

    const std::vector<float> ok_q(4, 0.5f);
    REQUIRE(idx.Search(ok_q, 1, &ids, &scores).ok());
    REQUIRE(ids.empty());
}

TEST_CASE("FlatIpIndex save and load keep vectors", "[index][faiss]")
{
    test::TempDir dir;
    const std::string path = (dir.path() / "faiss.index").string();

    FlatIpIndex idx(2);
    const std::vector<float> rows = {0.6f, 0.8f, 0.8f, 0.6f};
    REQUIRE(idx.AddBatch(rows.data(), 2).ok());
    REQUIRE(idx.Save(path).ok());

    std::unique_ptr<FlatIpIndex> loaded;
    REQUIRE(FlatIpIndex::Load(path, &loaded).ok());
    REQUIRE(loaded->dim() == 2);
    REQUIRE(loaded->count() == 2);

    std::vector<std::int64_t> ids;
    std::vector<float> scores;
    const std::vector<float> q = {0.0f, 1.0f};
    REQUIRE(loaded->Search(q, 1, &ids, &scores).ok());
    REQUIRE(ids == std::vector<std::int64_t>{0});
}

TEST_CASE("FlatIpIndex refuses non inner-product files", "[index][faiss]")
{
    test::TempDir dir;
    const std::string l2_path = (dir.path() / "l2.index").string();
    faiss::IndexFlatL2 l2(2);
    faiss::write_index(&l2, l2_path.c_str());

    std::unique_ptr<FlatIpIndex> out;
    REQUIRE(FlatIpIndex::Load(l2_path, &out).code == ErrorCode::kCorruption);
    REQUIRE(out == nullptr);

    const auto junk = dir.path() / "junk.index";
    test::WriteFile(junk, "not a faiss file");
    REQUIRE_FALSE(FlatIpIndex::Load(junk.string(), &out).ok());
    REQUIRE(out == nullptr);
}
