#include <catch2/catch.hpp>

#include <finbot/status.h>

#include <string>
#include <vector>

using namespace finbot;

TEST_CASE("Status defaults to OK", "[status]")
{
    Status s;
    REQUIRE(s.ok());
    REQUIRE(s.code == ErrorCode::kOk);
    REQUIRE(s.ToString() == "OK");
}

TEST_CASE("Status factories carry code and message", "[status]")
{
    Status s = Status::InvalidArgument("no passages to index");
    REQUIRE_FALSE(s.ok());
    REQUIRE(s.code == ErrorCode::kInvalidArgument);
    REQUIRE(s.ToString() == "InvalidArgument: no passages to index");

    REQUIRE(Status::Corruption("x").code == ErrorCode::kCorruption);
    REQUIRE(Status::IoError("x").code == ErrorCode::kIoError);
    REQUIRE(Status::NotFound("x").code == ErrorCode::kNotFound);
    REQUIRE(Status::Internal("").ToString() == "Internal");
}

TEST_CASE("Result holds either a value or a status", "[status]")
{
    Result<std::vector<int>> good(std::vector<int>{1, 2, 3});
    REQUIRE(good.ok());
    REQUIRE(good.value().size() == 3);
    std::vector<int> moved = good.move_value();
    REQUIRE(moved.back() == 3);

    Result<std::string> bad(Status::NotFound("missing"));
    REQUIRE_FALSE(bad.ok());
    REQUIRE(bad.status().code == ErrorCode::kNotFound);

    Result<int> uninit;
    REQUIRE_FALSE(uninit.ok());
    REQUIRE(uninit.status().code == ErrorCode::kInternal);
}

namespace
{
    finbot::Status CheckPositive(int v)
    {
        if (v <= 0)
            return finbot::Status::InvalidArgument("not positive");
        return finbot::Status::Ok();
    }

    finbot::Result<int> Doubled(int v)
    {
        finbot::Status st = CheckPositive(v);
        if (!st.ok())
            return st;
        return 2 * v;
    }
} // namespace

TEST_CASE("Errors propagate through checked returns", "[status]")
{
    auto good = Doubled(4);
    REQUIRE(good.ok());
    REQUIRE(good.value() == 8);

    auto bad = Doubled(-1);
    REQUIRE_FALSE(bad.ok());
    REQUIRE(bad.status().code == ErrorCode::kInvalidArgument);
    REQUIRE(bad.status().msg == "not positive");
}
