#include <finbot/text/sanitizer.h>

#include <algorithm>
#include <cctype>
#include <climits>
#include <cstdint>
#include <iterator>

#include <unicode/locid.h>
#include <unicode/normalizer2.h>
#include <unicode/regex.h>
#include <unicode/uchar.h>
#include <unicode/unistr.h>
#include <unicode/ustring.h>
#include <unicode/utf16.h>

namespace finbot::text
{
    namespace
    {
        struct PiiPattern
        {
            PiiKind kind;
            const char *tag;
            const char *regex;
        };

        // Order matters: at a given position the first alternative that matches wins.
        constexpr PiiPattern kPiiPatterns[kPiiKindCount] = {
            {PiiKind::kCreditCard, "CREDIT_CARD", R"re((?:\b\d{4}[-\s]?\d{4}[-\s]?\d{4}[-\s]?\d{4}\b))re"},
            {PiiKind::kSsn, "SSN", R"re(\b\d{3}[-\s]?\d{2}[-\s]?\d{4}\b)re"},
            {PiiKind::kPhone, "PHONE", R"re(\b(?:\+\d{1,3}[-\s]?)?\(?\d{3}\)?[-\s]?\d{3}[-\s]?\d{4}\b)re"},
            {PiiKind::kEmail, "EMAIL", R"re(\b[A-Za-z0-9._%+-]+@[A-Za-z0-9.-]+\.[A-Z|a-z]{2,}\b)re"},
            {PiiKind::kAccountNumber, "ACCOUNT_NUMBER", R"re(\b\d{10,17}\b)re"},
            {PiiKind::kDate, "DATE", R"re(\b\d{1,2}[/-]\d{1,2}[/-]\d{2,4}\b)re"},
            {PiiKind::kAddress, "ADDRESS",
             R"re(\b\d+\s+[A-Za-z\s,]+(?:Street|St|Avenue|Ave|Road|Rd|Boulevard|Blvd|Lane|Ln|Drive|Dr|Court|Ct|Circle|Cir|Way)\b)re"},
        };

        // Heap-allocated backtrack stack for one match attempt; exceeding it
        // ends the scan with U_REGEX_STACK_OVERFLOW instead of recursing.
        constexpr int32_t kMatcherStackLimit = 8 * 1024 * 1024;

        // Each category is exactly one capture group; inner groups are (?:...).
        std::string BuildPiiAlternation()
        {
            std::string pattern;
            for (std::size_t i = 0; i < kPiiKindCount; ++i)
            {
                if (i != 0)
                    pattern += '|';
                pattern += '(';
                pattern += kPiiPatterns[i].regex;
                pattern += ')';
            }
            return pattern;
        }

        struct NamedEntity
        {
            std::string_view name;
            UChar32 cp;
        };

        constexpr NamedEntity kNamedEntities[] = {
            {"amp", 0x26}, {"lt", 0x3C}, {"gt", 0x3E}, {"quot", 0x22}, {"apos", 0x27},
            {"nbsp", 0xA0}, {"iexcl", 0xA1}, {"cent", 0xA2}, {"pound", 0xA3}, {"yen", 0xA5},
            {"sect", 0xA7}, {"copy", 0xA9}, {"laquo", 0xAB}, {"shy", 0xAD}, {"reg", 0xAE},
            {"deg", 0xB0}, {"plusmn", 0xB1}, {"micro", 0xB5}, {"para", 0xB6}, {"middot", 0xB7},
            {"raquo", 0xBB}, {"frac14", 0xBC}, {"frac12", 0xBD}, {"frac34", 0xBE}, {"iquest", 0xBF},
            {"times", 0xD7}, {"divide", 0xF7}, {"agrave", 0xE0}, {"aacute", 0xE1}, {"auml", 0xE4},
            {"ccedil", 0xE7}, {"egrave", 0xE8}, {"eacute", 0xE9}, {"iacute", 0xED}, {"ntilde", 0xF1},
            {"oacute", 0xF3}, {"ouml", 0xF6}, {"uacute", 0xFA}, {"uuml", 0xFC},
            {"ndash", 0x2013}, {"mdash", 0x2014}, {"lsquo", 0x2018}, {"rsquo", 0x2019},
            {"ldquo", 0x201C}, {"rdquo", 0x201D}, {"bull", 0x2022}, {"hellip", 0x2026},
            {"euro", 0x20AC}, {"trade", 0x2122}, {"rupee", 0x20B9},
        };

        constexpr std::size_t kMaxEntityLen = 10;

        void AppendCodePoint(UChar32 cp, std::string *out)
        {
            if (cp <= 0 || cp > 0x10FFFF || U_IS_SURROGATE(cp))
                cp = 0xFFFD;
            icu::UnicodeString(cp).toUTF8String(*out);
        }

        // Parses "&#...;" starting at text[pos] == '&'. Returns bytes consumed, 0 if not numeric.
        std::size_t DecodeNumericRef(std::string_view text, std::size_t pos, std::string *out)
        {
            std::size_t i = pos + 2; // past "&#"
            bool hex = false;
            if (i < text.size() && (text[i] == 'x' || text[i] == 'X'))
            {
                hex = true;
                ++i;
            }
            const std::size_t digits_begin = i;
            std::uint32_t value = 0;
            while (i < text.size())
            {
                const unsigned char c = static_cast<unsigned char>(text[i]);
                int digit = -1;
                if (std::isdigit(c))
                    digit = c - '0';
                else if (hex && std::isxdigit(c))
                    digit = std::tolower(c) - 'a' + 10;
                if (digit < 0)
                    break;
                if (value <= 0x10FFFF)
                    value = value * (hex ? 16u : 10u) + static_cast<std::uint32_t>(digit);
                ++i;
            }
            if (i == digits_begin)
                return 0;
            if (i < text.size() && text[i] == ';')
                ++i;
            AppendCodePoint(static_cast<UChar32>(std::min<std::uint32_t>(value, 0x110000)), out);
            return i - pos;
        }

        // Invalid UTF-8 is rejected rather than substituted.
        bool ToUnicode(std::string_view s, icu::UnicodeString *out)
        {
            if (s.size() > static_cast<std::size_t>(INT32_MAX))
                return false;
            if (s.empty())
            {
                out->remove();
                return true;
            }
            UErrorCode err = U_ZERO_ERROR;
            int32_t needed = 0;
            u_strFromUTF8(nullptr, 0, &needed, s.data(), static_cast<int32_t>(s.size()), &err);
            if (U_FAILURE(err) && err != U_BUFFER_OVERFLOW_ERROR)
                return false;
            *out = icu::UnicodeString::fromUTF8(icu::StringPiece(s.data(), static_cast<int32_t>(s.size())));
            return true;
        }

        icu::UnicodeString CollapseWhitespace(const icu::UnicodeString &in)
        {
            icu::UnicodeString out;
            bool pending_space = false;
            for (int32_t i = 0; i < in.length();)
            {
                const UChar32 c = in.char32At(i);
                i += U16_LENGTH(c);
                if (u_isUWhiteSpace(c))
                {
                    if (!out.isEmpty())
                        pending_space = true;
                    continue;
                }
                if (pending_space)
                {
                    out.append(static_cast<UChar>(0x20));
                    pending_space = false;
                }
                out.append(c);
            }
            return out;
        }

        bool NormalizeToUnicode(std::string_view text, icu::UnicodeString *out)
        {
            icu::UnicodeString decoded;
            if (!ToUnicode(DecodeHtmlEntities(text), &decoded))
                return false;

            UErrorCode err = U_ZERO_ERROR;
            const icu::Normalizer2 *nfc = icu::Normalizer2::getNFCInstance(err);
            if (U_FAILURE(err) || nfc == nullptr)
                return false;
            icu::UnicodeString composed = nfc->normalize(decoded, err);
            if (U_FAILURE(err))
                return false;

            *out = CollapseWhitespace(composed);
            return true;
        }

        bool IsKeptPunctuation(UChar32 c)
        {
            return c == '.' || c == ',' || c == '!' || c == '?' || c == '-';
        }
    } // namespace

    std::string RedactionTag(PiiKind kind)
    {
        const auto idx = static_cast<std::size_t>(kind);
        if (idx >= kPiiKindCount)
            return "[REDACTED]";
        return std::string("[REDACTED_") + kPiiPatterns[idx].tag + "]";
    }

    std::string DecodeHtmlEntities(std::string_view text)
    {
        std::string out;
        out.reserve(text.size());
        std::size_t i = 0;
        while (i < text.size())
        {
            if (text[i] != '&')
            {
                out.push_back(text[i]);
                ++i;
                continue;
            }

            if (i + 1 < text.size() && text[i + 1] == '#')
            {
                const std::size_t used = DecodeNumericRef(text, i, &out);
                if (used > 0)
                {
                    i += used;
                    continue;
                }
            }
            else
            {
                const std::size_t semi = text.find(';', i + 1);
                if (semi != std::string_view::npos && semi - i - 1 <= kMaxEntityLen)
                {
                    const std::string_view name = text.substr(i + 1, semi - i - 1);
                    auto it = std::find_if(std::begin(kNamedEntities), std::end(kNamedEntities),
                                           [name](const NamedEntity &e)
                                           { return e.name == name; });
                    if (it != std::end(kNamedEntities))
                    {
                        AppendCodePoint(it->cp, &out);
                        i = semi + 1;
                        continue;
                    }
                }
            }

            out.push_back('&');
            ++i;
        }
        return out;
    }

    struct Sanitizer::CompiledPii
    {
        // Null when compilation failed; RedactPii then fails closed.
        std::unique_ptr<icu::RegexPattern> pattern;
    };

    Sanitizer::Sanitizer() : pii_(std::make_unique<CompiledPii>())
    {
        UErrorCode err = U_ZERO_ERROR;
        UParseError parse_error{};
        std::unique_ptr<icu::RegexPattern> pattern(icu::RegexPattern::compile(
            icu::UnicodeString::fromUTF8(BuildPiiAlternation()), UREGEX_CASE_INSENSITIVE, parse_error, err));
        if (U_SUCCESS(err))
            pii_->pattern = std::move(pattern);
    }

    Sanitizer::~Sanitizer() = default;

    std::string Sanitizer::Normalize(std::string_view text) const
    {
        icu::UnicodeString us;
        if (!NormalizeToUnicode(text, &us))
            return {};
        std::string out;
        us.toUTF8String(out);
        return out;
    }

    std::string Sanitizer::RedactPii(std::string_view text) const
    {
        if (!pii_->pattern)
            return {};
        icu::UnicodeString input;
        if (!ToUnicode(text, &input))
            return {};

        UErrorCode err = U_ZERO_ERROR;
        std::unique_ptr<icu::RegexMatcher> m(pii_->pattern->matcher(input, err));
        if (U_FAILURE(err))
            return {};
        m->setStackLimit(kMatcherStackLimit, err);
        if (U_FAILURE(err))
            return {};

        icu::UnicodeString out;
        int32_t copied = 0;
        while (m->find(err))
        {
            const int32_t begin = m->start(err);
            const int32_t end = m->end(err);
            if (U_FAILURE(err))
                return {};
            out.append(input, copied, begin - copied);

            PiiKind kind = PiiKind::kCreditCard;
            for (int32_t g = 1; g <= static_cast<int32_t>(kPiiKindCount); ++g)
            {
                if (m->start(g, err) >= 0)
                {
                    kind = kPiiPatterns[g - 1].kind;
                    break;
                }
            }
            out.append(icu::UnicodeString::fromUTF8(RedactionTag(kind)));
            copied = end;
        }
        // Stack overflow or time-out: never hand back partially redacted text.
        if (U_FAILURE(err))
            return {};
        out.append(input, copied, input.length() - copied);

        std::string utf8;
        out.toUTF8String(utf8);
        return utf8;
    }

    std::string Sanitizer::Clean(std::string_view text) const
    {
        icu::UnicodeString us;
        if (!NormalizeToUnicode(text, &us))
            return {};
        us.toLower(icu::Locale::getRoot());

        icu::UnicodeString kept;
        for (int32_t i = 0; i < us.length();)
        {
            const UChar32 c = us.char32At(i);
            i += U16_LENGTH(c);
            if (u_isalnum(c) || c == '_' || u_isUWhiteSpace(c) || IsKeptPunctuation(c))
                kept.append(c);
            else
                kept.append(static_cast<UChar>(0x20));
        }

        std::string utf8;
        CollapseWhitespace(kept).toUTF8String(utf8);
        return RedactPii(utf8);
    }

    bool Sanitizer::IsValidChunk(std::string_view text)
    {
        icu::UnicodeString us;
        if (!ToUnicode(text, &us))
            return false;
        us.trim();
        if (us.isEmpty() || us.countChar32() < 10)
            return false;
        return std::any_of(text.begin(), text.end(), [](char c)
                           { return (c >= 'a' && c <= 'z') || (c >= 'A' && c <= 'Z'); });
    }

} // namespace finbot::text
