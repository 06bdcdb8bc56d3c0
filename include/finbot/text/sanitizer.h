#pragma once

#include <cstdint>
#include <memory>
#include <string>
#include <string_view>

namespace finbot::text
{
    // PII categories in the order the combined pattern tries them.
    enum class PiiKind : std::uint8_t
    {
        kCreditCard = 0,
        kSsn,
        kPhone,
        kEmail,
        kAccountNumber,
        kDate,
        kAddress,
    };

    inline constexpr std::size_t kPiiKindCount = 7;

    // Replacement tag for a category, e.g. "[REDACTED_CREDIT_CARD]".
    std::string RedactionTag(PiiKind kind);

    /**
     * Sanitizer: text normalization, PII redaction and chunk validation.
     *
     * All entry points are total: invalid UTF-8 or otherwise malformed input
     * degrades to an empty string (or false) instead of failing.
     * The PII pattern is compiled once per instance and is safe to share
     * across threads; each RedactPii call runs its own matcher.
     */
    class Sanitizer
    {
    public:
        Sanitizer();
        ~Sanitizer();

        Sanitizer(const Sanitizer &) = delete;
        Sanitizer &operator=(const Sanitizer &) = delete;

        // HTML entity decoding, NFC, whitespace runs collapsed to one space, trimmed.
        std::string Normalize(std::string_view text) const;

        // Replaces every PII match with its category tag. Leftmost match wins,
        // then the first category in PiiKind order; matches never overlap.
        // Empty when the matcher gives up (backtrack stack exhausted).
        std::string RedactPii(std::string_view text) const;

        // Normalize, lowercase, drop everything except word characters,
        // whitespace and ". , ! ? -", collapse whitespace, redact PII.
        std::string Clean(std::string_view text) const;

        // False for blank text, fewer than 10 characters after trimming,
        // or no ASCII letter at all.
        static bool IsValidChunk(std::string_view text);

    private:
        struct CompiledPii;
        std::unique_ptr<CompiledPii> pii_;
    };

    // Decodes named (common set) and numeric character references.
    // Unknown entities are left verbatim.
    std::string DecodeHtmlEntities(std::string_view text);

} // namespace finbot::text
