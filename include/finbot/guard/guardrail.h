#pragma once
#include <cstdint>
#include <string>
#include <string_view>
#include <vector>

#include <finbot/status.h>

namespace finbot::guard
{
    struct GuardrailLists
    {
        std::vector<std::string> jailbreak_phrases;
        std::vector<std::string> domain_terms;
    };

    // Built-in phrase and vocabulary lists for the bank-support deployment.
    GuardrailLists DefaultGuardrailLists();

    // Reads one phrase per line; blank lines and '#' comments are skipped.
    // An empty path keeps the corresponding default list.
    Status LoadGuardrailLists(const std::string &jailbreak_path,
                              const std::string &domain_path,
                              GuardrailLists *out);

    enum class GuardrailVerdict : std::uint8_t
    {
        kAdmissible = 0,
        kJailbreak,
        kOutOfDomain,
    };

    const char *VerdictName(GuardrailVerdict v) noexcept;

    struct Classification
    {
        GuardrailVerdict verdict = GuardrailVerdict::kAdmissible;
        std::string matched; // phrase or domain term that decided it; empty for out-of-domain
    };

    /**
     * GuardrailClassifier: decides whether a query may reach retrieval.
     *
     * Case-insensitive substring matching against immutable lists. Stateless
     * after construction, so one instance can be shared across threads.
     */
    class GuardrailClassifier
    {
    public:
        explicit GuardrailClassifier(GuardrailLists lists = DefaultGuardrailLists());

        bool IsJailbreakAttempt(std::string_view query) const;

        // True when no domain term occurs in the query.
        bool IsOutOfDomain(std::string_view query) const;

        // Jailbreak check first, then the domain check.
        Classification Classify(std::string_view query) const;

        const GuardrailLists &lists() const { return lists_; }

    private:
        GuardrailLists lists_; // lowercased, empties removed
    };

    std::string AsciiLower(std::string_view s);

} // namespace finbot::guard
