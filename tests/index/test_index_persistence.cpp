#include <catch2/catch.hpp>

#include <finbot/index/vector_index.h>

#include "common/test_utils.h"
#include "index/passage_codec.h"

#include <filesystem>

using namespace finbot;
using finbot::index::VectorIndex;
namespace fs = std::filesystem;

namespace
{
    IndexOptions OptionsAt(const fs::path &dir)
    {
        IndexOptions opts;
        opts.index_dir = dir.string();
        return opts;
    }

    std::vector<Passage> RichPassages()
    {
        Passage a = test::MakePassage("minimum balance for current accounts is 500 rupees", "products.tsv");
        a.category = "Accounts";
        a.sheet_name = "Current";
        a.extra["question"] = "What is the minimum balance?";
        a.extra["answer"] = "500 rupees";

        Passage b = test::MakePassage("debit card replacement takes seven days", "cards.txt");
        Passage c = test::MakePassage("home finance is available for salaried customers", "finance.txt");
        c.category = "Finance";
        return {a, b, c};
    }

    void SeedEmbeddings(test::FakeEmbedder *e)
    {
        e->Set("minimum balance for current accounts is 500 rupees", {1.0f, 0.0f, 0.0f, 0.0f});
        e->Set("debit card replacement takes seven days", {0.0f, 1.0f, 0.0f, 0.0f});
        e->Set("home finance is available for salaried customers", {0.0f, 0.0f, 1.0f, 0.0f});
        e->Set("minimum balance", {0.8f, 0.0f, 0.6f, 0.0f});
    }
}

TEST_CASE("Save then Load reproduces passages and search results", "[index][persistence]")
{
    test::TempDir dir;
    const fs::path store = dir.path() / "vector_store";
    test::FakeEmbedder embedder;
    SeedEmbeddings(&embedder);

    std::vector<ScoredPassage> before;
    {
        VectorIndex idx(&embedder, OptionsAt(store));
        REQUIRE(idx.Create(RichPassages()).ok());
        REQUIRE(idx.Search("minimum balance", 3, &before).ok());
    }
    REQUIRE(fs::exists(store / VectorIndex::kIndexFileName));
    REQUIRE(fs::exists(store / VectorIndex::kMetaFileName));
    REQUIRE_FALSE(fs::exists(store / "meta.bin.tmp"));

    VectorIndex reopened(&embedder, OptionsAt(store));
    REQUIRE(reopened.Load());
    REQUIRE(reopened.size() == 3);

    std::vector<ScoredPassage> after;
    REQUIRE(reopened.Search("minimum balance", 3, &after).ok());
    REQUIRE(after.size() == before.size());
    for (std::size_t i = 0; i < after.size(); ++i)
    {
        REQUIRE(after[i].passage == before[i].passage);
        REQUIRE(after[i].score == Approx(before[i].score));
    }
    REQUIRE(after[0].passage.category == std::optional<std::string>("Accounts"));
    REQUIRE(after[0].passage.sheet_name == std::optional<std::string>("Current"));
    REQUIRE(after[0].passage.extra.at("answer") == "500 rupees");
    REQUIRE(after[1].passage.category == std::optional<std::string>("Finance"));
}

TEST_CASE("Load needs both files", "[index][persistence]")
{
    test::TempDir dir;
    const fs::path store = dir.path() / "vector_store";
    test::FakeEmbedder embedder;
    SeedEmbeddings(&embedder);

    VectorIndex writer(&embedder, OptionsAt(store));
    REQUIRE(writer.Create(RichPassages()).ok());
    fs::remove(store / VectorIndex::kMetaFileName);

    VectorIndex fresh(&embedder, OptionsAt(store));
    REQUIRE_FALSE(fresh.Load());
    REQUIRE_FALSE(fresh.loaded());
    REQUIRE(VectorIndex::Verify(store.string()).code == ErrorCode::kNotFound);

    // A failed reload keeps what is already in memory.
    REQUIRE_FALSE(writer.Load());
    REQUIRE(writer.loaded());
    REQUIRE(writer.size() == 3);
}

TEST_CASE("Corrupt metadata is detected", "[index][persistence]")
{
    test::TempDir dir;
    const fs::path store = dir.path() / "vector_store";
    test::FakeEmbedder embedder;
    SeedEmbeddings(&embedder);
    {
        VectorIndex idx(&embedder, OptionsAt(store));
        REQUIRE(idx.Create(RichPassages()).ok());
    }

    std::string raw = test::ReadFile(store / VectorIndex::kMetaFileName);
    REQUIRE(raw.size() > 40);
    raw[30] = static_cast<char>(raw[30] ^ 0x5A);
    test::WriteFile(store / VectorIndex::kMetaFileName, raw);

    REQUIRE(VectorIndex::Verify(store.string()).code == ErrorCode::kCorruption);
    VectorIndex idx(&embedder, OptionsAt(store));
    REQUIRE_FALSE(idx.Load());
}

TEST_CASE("Vector and passage counts must agree", "[index][persistence]")
{
    test::TempDir dir;
    const fs::path big = dir.path() / "big";
    const fs::path small = dir.path() / "small";
    test::FakeEmbedder embedder;
    SeedEmbeddings(&embedder);
    {
        VectorIndex a(&embedder, OptionsAt(big));
        REQUIRE(a.Create(RichPassages()).ok());
        VectorIndex b(&embedder, OptionsAt(small));
        REQUIRE(b.Create({RichPassages()[1]}).ok());
    }
    fs::copy_file(small / VectorIndex::kMetaFileName, big / VectorIndex::kMetaFileName,
                  fs::copy_options::overwrite_existing);

    REQUIRE(VectorIndex::Verify(big.string()).code == ErrorCode::kCorruption);
    VectorIndex idx(&embedder, OptionsAt(big));
    REQUIRE_FALSE(idx.Load());
}

TEST_CASE("Load refuses an index built for another embedding dimension", "[index][persistence]")
{
    test::TempDir dir;
    const fs::path store = dir.path() / "vector_store";
    test::FakeEmbedder four;
    SeedEmbeddings(&four);
    {
        VectorIndex idx(&four, OptionsAt(store));
        REQUIRE(idx.Create(RichPassages()).ok());
    }

    test::FakeEmbedder eight(8);
    VectorIndex idx(&eight, OptionsAt(store));
    REQUIRE_FALSE(idx.Load());
    REQUIRE(VectorIndex::Verify(store.string()).ok());
}

TEST_CASE("Passage codec rejects truncated and foreign input", "[index][persistence]")
{
    const std::string encoded = finbot::index::EncodePassages(4, RichPassages());
    std::uint32_t dim = 0;
    std::vector<Passage> out;
    REQUIRE(finbot::index::DecodePassages(encoded, &dim, &out).ok());
    REQUIRE(dim == 4);
    REQUIRE(out == RichPassages());

    REQUIRE(finbot::index::DecodePassages(encoded.substr(0, encoded.size() - 9), &dim, &out).code ==
            ErrorCode::kCorruption);
    REQUIRE(finbot::index::DecodePassages("pickle data", &dim, &out).code == ErrorCode::kCorruption);
    REQUIRE(finbot::index::DecodePassages("", &dim, &out).code == ErrorCode::kCorruption);
}
