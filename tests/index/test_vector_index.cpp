#include <catch2/catch.hpp>

#include <finbot/embed/hashing_embedder.h>
#include <finbot/index/vector_index.h>

#include "common/test_utils.h"

#include <filesystem>

using namespace finbot;
using finbot::index::VectorIndex;

namespace
{
    IndexOptions OptionsIn(const test::TempDir &dir)
    {
        IndexOptions opts;
        opts.index_dir = (dir.path() / "vector_store").string();
        return opts;
    }

    void SeedEmbeddings(test::FakeEmbedder *e)
    {
        e->Set("minimum balance is 500", {1.0f, 0.0f, 0.0f, 0.0f});
        e->Set("debit card replacement", {0.0f, 1.0f, 0.0f, 0.0f});
        e->Set("car loan markup", {0.0f, 0.0f, 1.0f, 0.0f});
        e->Set("what is the minimum balance", {0.9f, 0.1f, 0.0f, 0.0f});
    }

    std::vector<Passage> ThreePassages()
    {
        return {test::MakePassage("minimum balance is 500", "accounts.txt"),
                test::MakePassage("debit card replacement", "cards.txt"),
                test::MakePassage("car loan markup", "loans.txt")};
    }
}

TEST_CASE("Create with no passages fails and creates nothing", "[index]")
{
    test::TempDir dir;
    test::FakeEmbedder embedder;
    VectorIndex idx(&embedder, OptionsIn(dir));

    Status st = idx.Create({});
    REQUIRE(st.code == ErrorCode::kInvalidArgument);
    REQUIRE(st.msg == "no passages to index");
    REQUIRE_FALSE(idx.loaded());
    REQUIRE_FALSE(std::filesystem::exists(std::filesystem::path(idx.index_dir()) / VectorIndex::kIndexFileName));
}

TEST_CASE("Search on an unloaded index is empty, k of zero is invalid", "[index]")
{
    test::TempDir dir;
    test::FakeEmbedder embedder;
    VectorIndex idx(&embedder, OptionsIn(dir));

    std::vector<ScoredPassage> out{ScoredPassage{}};
    REQUIRE(idx.Search("anything", 3, &out).ok());
    REQUIRE(out.empty());
    REQUIRE(embedder.calls() == 0);
    REQUIRE(idx.Search("anything", 0, &out).code == ErrorCode::kInvalidArgument);
    REQUIRE(idx.Save().ok());
    REQUIRE_FALSE(std::filesystem::exists(idx.index_dir()));
}

TEST_CASE("Search ranks passages by inner product", "[index]")
{
    test::TempDir dir;
    test::FakeEmbedder embedder;
    SeedEmbeddings(&embedder);
    VectorIndex idx(&embedder, OptionsIn(dir));
    REQUIRE(idx.Create(ThreePassages()).ok());
    REQUIRE(idx.loaded());
    REQUIRE(idx.size() == 3);
    REQUIRE(idx.dim() == 4);

    std::vector<ScoredPassage> out;
    REQUIRE(idx.Search("what is the minimum balance", 2, &out).ok());
    REQUIRE(out.size() == 2);
    REQUIRE(out[0].passage.content == "minimum balance is 500");
    REQUIRE(out[0].score == Approx(0.9f));
    REQUIRE(out[1].passage.content == "debit card replacement");
    REQUIRE(out[0].score >= out[1].score);
}

TEST_CASE("Equal scores keep insertion order", "[index]")
{
    test::TempDir dir;
    test::FakeEmbedder embedder; // every text maps to the same vector
    VectorIndex idx(&embedder, OptionsIn(dir));
    REQUIRE(idx.Create({test::MakePassage("first", "a"),
                        test::MakePassage("second", "b"),
                        test::MakePassage("third", "c")})
                .ok());

    std::vector<ScoredPassage> out;
    REQUIRE(idx.Search("query", 3, &out).ok());
    REQUIRE(out.size() == 3);
    REQUIRE(out[0].passage.content == "first");
    REQUIRE(out[1].passage.content == "second");
    REQUIRE(out[2].passage.content == "third");
}

TEST_CASE("Add on an empty index creates it, then appends", "[index]")
{
    test::TempDir dir;
    test::FakeEmbedder embedder;
    SeedEmbeddings(&embedder);
    VectorIndex idx(&embedder, OptionsIn(dir));

    REQUIRE(idx.Add({test::MakePassage("minimum balance is 500", "accounts.txt")}).ok());
    REQUIRE(idx.size() == 1);
    REQUIRE(idx.Add({test::MakePassage("car loan markup", "loans.txt")}).ok());
    REQUIRE(idx.size() == 2);

    std::size_t persisted = 0;
    REQUIRE(VectorIndex::Verify(idx.index_dir(), &persisted).ok());
    REQUIRE(persisted == 2);
}

TEST_CASE("A failed embedding batch leaves the index untouched", "[index]")
{
    test::TempDir dir;
    test::FakeEmbedder embedder;
    SeedEmbeddings(&embedder);
    VectorIndex idx(&embedder, OptionsIn(dir));
    REQUIRE(idx.Create(ThreePassages()).ok());

    embedder.FailWith(Status::Unavailable("model offline"));
    Status st = idx.Add({test::MakePassage("new passage", "new.txt")});
    REQUIRE_FALSE(st.ok());
    REQUIRE(idx.size() == 3);

    std::size_t persisted = 0;
    REQUIRE(VectorIndex::Verify(idx.index_dir(), &persisted).ok());
    REQUIRE(persisted == 3);
}

TEST_CASE("Embeddings of the wrong dimension are rejected", "[index]")
{
    test::TempDir dir;
    test::FakeEmbedder embedder;
    SeedEmbeddings(&embedder);
    embedder.Set("short vector", {1.0f, 0.0f});
    VectorIndex idx(&embedder, OptionsIn(dir));
    REQUIRE(idx.Create(ThreePassages()).ok());

    REQUIRE(idx.Add({test::MakePassage("short vector", "x")}).code == ErrorCode::kInvalidArgument);
    REQUIRE(idx.size() == 3);

    std::vector<ScoredPassage> out;
    REQUIRE(idx.Search("short vector", 1, &out).code == ErrorCode::kInvalidArgument);
}

TEST_CASE("Minimum balance passage outranks unrelated passages", "[index][scenario]")
{
    test::TempDir dir;
    embed::HashingEmbedder embedder;
    VectorIndex idx(&embedder, OptionsIn(dir));
    REQUIRE(idx.Create({test::MakePassage("Question: What is the minimum balance? Answer: Rs. 500.", "doc.json"),
                        test::MakePassage("Debit card replacement takes seven working days", "cards.json"),
                        test::MakePassage("Car finance markup is KIBOR plus three percent", "finance.json")})
                .ok());

    std::vector<ScoredPassage> hits;
    REQUIRE(idx.Search("minimum balance", 1, &hits).ok());
    REQUIRE(hits.size() == 1);
    REQUIRE(hits[0].passage.source == "doc.json");
    REQUIRE(hits[0].score > 0.0f);
}
