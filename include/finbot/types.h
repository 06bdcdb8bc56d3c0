#pragma once
#include <cstddef>
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace finbot
{
    using Embedding = std::vector<float>;

    /**
     * Passage: one indexable unit of text plus where it came from.
     * Stored as-is in the vector index; never updated after insertion.
     */
    struct Passage
    {
        std::string content;
        std::string source; // origin file identifier, e.g. "faq.json"
        std::optional<std::string> category;
        std::optional<std::string> sheet_name;
        // Pass-through fields (question, answer, ...) kept in key order.
        std::map<std::string, std::string> extra;

        bool operator==(const Passage &) const = default;
    };

    // Query-time annotation on a copy of a stored passage.
    struct ScoredPassage
    {
        Passage passage;
        float score = 0.0f;
    };

    /**
     * SourceRecord: an already-normalized ingest record as produced by the
     * file readers (spreadsheet rows, FAQ entries, manual additions).
     */
    struct SourceRecord
    {
        std::string content;
        std::string source;
        std::optional<std::string> category;
        std::optional<std::string> sheet_name;
        std::optional<std::string> question;
        std::optional<std::string> answer;
    };

    Passage ToPassage(const SourceRecord &record);

} // namespace finbot
