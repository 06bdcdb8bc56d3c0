#include <finbot/generate/generator.h>

#include <array>

#include <finbot/guard/guardrail.h>

namespace finbot::generate
{
    namespace
    {
        constexpr std::string_view kPromptHead =
            "You are an AI assistant for Finbot, a trusted financial institution. Your role is to "
            "provide helpful, accurate, and professional responses to customer inquiries about the "
            "bank's products, services, and procedures.\n"
            "\n"
            "Use the following pieces of bank information to answer the question at the end.\n"
            "If you don't know the answer, just say \"I don't have enough information to answer "
            "this question. Please contact our customer service at +92 (51) 111 000 494 for "
            "assistance.\" Don't try to make up an answer.\n"
            "\n";

        constexpr std::array<std::string_view, 6> kSensitivePhrases = {
            "social security",
            "credit card number",
            "password",
            "pin code",
            "account number",
            "routing number",
        };
    } // namespace

    std::string BuildPrompt(std::string_view context, std::string_view question)
    {
        std::string prompt(kPromptHead);
        prompt.append(context);
        prompt.append("\n\nQuestion: ");
        prompt.append(question);
        prompt.append("\n\nHelpful Answer:");
        return prompt;
    }

    std::string FilterSensitiveTerms(std::string_view response)
    {
        std::string out(response);
        for (std::string_view phrase : kSensitivePhrases)
        {
            std::string lower = guard::AsciiLower(out);
            std::size_t pos = lower.find(phrase);
            if (pos == std::string::npos)
                continue;
            std::string replaced;
            std::size_t copied = 0;
            while (pos != std::string::npos)
            {
                replaced.append(out, copied, pos - copied);
                replaced.append("[REDACTED]");
                copied = pos + phrase.size();
                pos = lower.find(phrase, copied);
            }
            replaced.append(out, copied, std::string::npos);
            out = std::move(replaced);
        }
        return out;
    }

    Result<std::string> ContextOnlyGenerator::Generate(std::string_view context, std::string_view)
    {
        return FilterSensitiveTerms(context);
    }

    Result<std::string> PromptEchoGenerator::Generate(std::string_view context, std::string_view question)
    {
        return BuildPrompt(context, question);
    }

} // namespace finbot::generate
