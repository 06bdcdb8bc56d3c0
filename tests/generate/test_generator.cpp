#include <catch2/catch.hpp>

#include <finbot/generate/generator.h>

using namespace finbot::generate;

TEST_CASE("BuildPrompt places context before the question", "[generator]")
{
    const std::string prompt = BuildPrompt("Minimum balance is 500.", "What is the minimum balance?");
    REQUIRE(prompt.rfind("You are an AI assistant for Finbot", 0) == 0);
    const auto ctx = prompt.find("Minimum balance is 500.");
    const auto q = prompt.find("Question: What is the minimum balance?");
    REQUIRE(ctx != std::string::npos);
    REQUIRE(q != std::string::npos);
    REQUIRE(ctx < q);
    REQUIRE(prompt.size() >= 15);
    REQUIRE(prompt.compare(prompt.size() - 15, 15, "Helpful Answer:") == 0);
}

TEST_CASE("FilterSensitiveTerms masks phrases in any case", "[generator]")
{
    REQUIRE(FilterSensitiveTerms("Never share your Password or PIN code.") ==
            "Never share your [REDACTED] or [REDACTED].");
    REQUIRE(FilterSensitiveTerms("account number and routing number") == "[REDACTED] and [REDACTED]");
    REQUIRE(FilterSensitiveTerms("nothing to hide") == "nothing to hide");
}

TEST_CASE("ContextOnlyGenerator answers with the filtered context", "[generator]")
{
    ContextOnlyGenerator g;
    auto r = g.Generate("Reset your password in the app.", "how?");
    REQUIRE(r.ok());
    REQUIRE(r.value() == "Reset your [REDACTED] in the app.");
}

TEST_CASE("PromptEchoGenerator returns the rendered prompt", "[generator]")
{
    PromptEchoGenerator g;
    auto r = g.Generate("Debit cards are issued in seven days.", "When will my card arrive?");
    REQUIRE(r.ok());
    REQUIRE(r.value() == BuildPrompt("Debit cards are issued in seven days.", "When will my card arrive?"));
}
