#pragma once
#include <string>
#include <string_view>

#include <finbot/status.h>

namespace finbot::generate
{
    /**
     * Generator: the answer-producing collaborator behind the retrieval core.
     *
     * `context` is the retrieved passages joined by blank lines; `question` is
     * the user's raw query. Implementations block until the answer is ready.
     */
    class Generator
    {
    public:
        virtual ~Generator() = default;
        virtual Result<std::string> Generate(std::string_view context, std::string_view question) = 0;
    };

    // Bank-assistant prompt with the context and question substituted.
    std::string BuildPrompt(std::string_view context, std::string_view question);

    // Replaces sensitive phrases (any case) with "[REDACTED]".
    std::string FilterSensitiveTerms(std::string_view response);

    // Retrieval-only mode: answers with the retrieved context itself.
    class ContextOnlyGenerator final : public Generator
    {
    public:
        Result<std::string> Generate(std::string_view context, std::string_view question) override;
    };

    // Answers with the rendered prompt, i.e. what a language model would be sent.
    class PromptEchoGenerator final : public Generator
    {
    public:
        Result<std::string> Generate(std::string_view context, std::string_view question) override;
    };

} // namespace finbot::generate
