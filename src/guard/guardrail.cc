#include <finbot/guard/guardrail.h>

#include <algorithm>
#include <cctype>
#include <fstream>

namespace finbot::guard
{
    namespace
    {
        std::vector<std::string> NormalizePhrases(const std::vector<std::string> &phrases)
        {
            std::vector<std::string> normalized;
            normalized.reserve(phrases.size());
            for (const auto &p : phrases)
            {
                std::string lower = AsciiLower(p);
                if (!lower.empty())
                    normalized.push_back(std::move(lower));
            }
            return normalized;
        }

        const std::string *FindAny(const std::string &haystack, const std::vector<std::string> &needles)
        {
            for (const auto &n : needles)
            {
                if (haystack.find(n) != std::string::npos)
                    return &n;
            }
            return nullptr;
        }

        Status ReadPhraseFile(const std::string &path, std::vector<std::string> *out)
        {
            std::ifstream in(path);
            if (!in)
                return Status::NotFound("guardrail list not found: " + path);
            std::vector<std::string> phrases;
            std::string line;
            while (std::getline(in, line))
            {
                std::size_t a = 0;
                std::size_t b = line.size();
                while (a < b && std::isspace(static_cast<unsigned char>(line[a])))
                    ++a;
                while (b > a && std::isspace(static_cast<unsigned char>(line[b - 1])))
                    --b;
                if (a == b || line[a] == '#')
                    continue;
                phrases.push_back(line.substr(a, b - a));
            }
            if (in.bad())
                return Status::IoError("guardrail list read failed: " + path);
            *out = std::move(phrases);
            return Status::Ok();
        }
    } // namespace

    std::string AsciiLower(std::string_view s)
    {
        std::string out(s);
        std::transform(out.begin(), out.end(), out.begin(),
                       [](unsigned char c)
                       { return static_cast<char>(std::tolower(c)); });
        return out;
    }

    GuardrailLists DefaultGuardrailLists()
    {
        GuardrailLists lists;
        lists.jailbreak_phrases = {
            "ignore previous instructions",
            "bypass",
            "override",
            "disregard",
            "ignore your training",
            "forget your guidelines",
            "act as if",
            "pretend you are",
            "you're no longer",
            "ignore all rules",
        };
        lists.domain_terms = {
            "card", "interest", "balance", "statement", "transaction", "branch", "atm",
            "bank", "finance", "payment", "fund", "money", "check", "saving", "investment",
            "mortgage", "rate", "fee", "charge", "online", "mobile", "app", "password",
            "pin", "login", "security", "otp", "NUST", "customer", "global ranking",
            "admission", "undergraduate", "international", "sports", "facilities",
            "faculty", "help", "department", "Library", "account", "current", "business",
            "premium", "remittance", "PakWatan", "Value Plus", "Value Premium", "Flour Mill",
            "transfer", "withdrawal", "deposit", "cheque", "banker's cheque", "debit card",
            "credit card", "internet banking", "SMS alerts", "e-statement", "fund transfer",
            "loan", "Kamyab Jawan", "insurance", "credit", "debit", "KIBOR",
            "processing fee", "documentation", "legal charges", "initial deposit",
            "minimum balance", "monthly average balance", "SOC", "issuance", "facility",
            "services", "cash management", "salary processing", "VPBA", "NADRA", "NMC",
            "NFMF", "PWRA", "beneficiary",
        };
        return lists;
    }

    Status LoadGuardrailLists(const std::string &jailbreak_path,
                              const std::string &domain_path,
                              GuardrailLists *out)
    {
        GuardrailLists lists = DefaultGuardrailLists();
        if (!jailbreak_path.empty())
        {
            Status st = ReadPhraseFile(jailbreak_path, &lists.jailbreak_phrases);
            if (!st.ok())
                return st;
        }
        if (!domain_path.empty())
        {
            Status st = ReadPhraseFile(domain_path, &lists.domain_terms);
            if (!st.ok())
                return st;
        }
        *out = std::move(lists);
        return Status::Ok();
    }

    const char *VerdictName(GuardrailVerdict v) noexcept
    {
        switch (v)
        {
        case GuardrailVerdict::kAdmissible:
            return "admissible";
        case GuardrailVerdict::kJailbreak:
            return "jailbreak";
        case GuardrailVerdict::kOutOfDomain:
            return "out_of_domain";
        }
        return "unknown";
    }

    GuardrailClassifier::GuardrailClassifier(GuardrailLists lists)
    {
        lists_.jailbreak_phrases = NormalizePhrases(lists.jailbreak_phrases);
        lists_.domain_terms = NormalizePhrases(lists.domain_terms);
    }

    bool GuardrailClassifier::IsJailbreakAttempt(std::string_view query) const
    {
        return FindAny(AsciiLower(query), lists_.jailbreak_phrases) != nullptr;
    }

    bool GuardrailClassifier::IsOutOfDomain(std::string_view query) const
    {
        return FindAny(AsciiLower(query), lists_.domain_terms) == nullptr;
    }

    Classification GuardrailClassifier::Classify(std::string_view query) const
    {
        const std::string lower = AsciiLower(query);
        Classification c;
        if (const std::string *hit = FindAny(lower, lists_.jailbreak_phrases))
        {
            c.verdict = GuardrailVerdict::kJailbreak;
            c.matched = *hit;
            return c;
        }
        if (const std::string *hit = FindAny(lower, lists_.domain_terms))
        {
            c.matched = *hit;
            return c;
        }
        c.verdict = GuardrailVerdict::kOutOfDomain;
        return c;
    }

} // namespace finbot::guard
