#pragma once
#include <cstddef>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include <finbot/options.h>
#include <finbot/status.h>
#include <finbot/types.h>

namespace finbot
{
    class Logger;
    namespace index
    {
        class VectorIndex;
    }
    namespace guard
    {
        class GuardrailClassifier;
    }
    namespace generate
    {
        class Generator;
    }
    namespace text
    {
        class Sanitizer;
    }
} // namespace finbot

namespace finbot::pipeline
{
    class MetricsCollector;

    inline constexpr std::string_view kRefusalMessage =
        "I cannot process this request as it appears to be attempting to bypass "
        "my operational guidelines. Please submit a valid banking inquiry.";

    inline constexpr std::string_view kOutOfDomainMessage =
        "I'm a Finbot assistant, designed to help with banking-related inquiries. "
        "It seems your question is not related to Finbot services. "
        "I'd be happy to help with questions about accounts, transfers, loans, credit cards, "
        "or other banking products and services.";

    inline constexpr std::string_view kNoDocumentsMessage =
        "I don't have enough information to answer this question. "
        "Please contact our customer service at +92 (51) 111 000 494 for assistance.";

    inline constexpr std::string_view kManualSource = "manual_addition";

    struct QueryMetrics
    {
        std::size_t query_length = 0; // code points
        std::size_t retrieved_docs = 0;
        std::vector<float> similarity_scores;
        double classification_ms = 0.0;
        double retrieval_ms = 0.0;
        double generation_ms = 0.0;
        double total_ms = 0.0;

        // Single-line JSON object, times rounded to 0.01 ms.
        std::string ToJson() const;
    };

    struct QueryResponse
    {
        std::string response;
        std::vector<std::string> sources; // distinct, first-seen order
        bool is_jailbreak = false;
        bool is_out_of_domain = false;
        QueryMetrics metrics;
    };

    struct IngestReport
    {
        std::size_t chunks_produced = 0;
        std::size_t passages_indexed = 0;
    };

    /**
     * RetrievalOrchestrator: guardrail -> retrieval -> generation for one query,
     * plus the ingest paths that feed the index.
     *
     * Collaborators are borrowed and must outlive the orchestrator. One mutex
     * covers every index operation, so searches never observe a half-applied
     * ingest. Guardrail and generator calls run outside the lock.
     */
    class RetrievalOrchestrator
    {
    public:
        RetrievalOrchestrator(index::VectorIndex *index,
                              const guard::GuardrailClassifier *guardrail,
                              generate::Generator *generator,
                              const text::Sanitizer *sanitizer,
                              PipelineOptions opts,
                              Logger *logger = nullptr,
                              MetricsCollector *metrics = nullptr);

        // InvalidArgument for a blank query. Guardrail rejections are successful responses.
        Result<QueryResponse> ProcessQuery(std::string_view query);

        // Appends normalized records; content and source are required.
        Result<IngestReport> IngestRecords(const std::vector<SourceRecord> &records);

        // Replaces the whole index with `records`.
        Result<IngestReport> RebuildFromRecords(const std::vector<SourceRecord> &records);

        // Chunks, cleans and validates raw text, then appends the surviving chunks.
        Result<IngestReport> IngestDocument(std::string_view text,
                                            const std::string &source,
                                            const std::optional<std::string> &sheet_name = std::nullopt);

        // Indexes "Question: q\nAnswer: a" with source "manual_addition".
        Result<IngestReport> AddQaDocument(const std::string &category,
                                           const std::string &question,
                                           const std::string &answer);

        // .txt, .tsv and .csv files are read whole and ingested as one plain-text
        // document: delimiters and any header row are not parsed and stay in the
        // text. `source` defaults to the file name.
        Result<IngestReport> IngestFile(const std::string &path, const std::string &source = {});

        // Loads the persisted index; when there is none, rebuilds it from every
        // supported file directly under `data_dir`.
        Result<IngestReport> Bootstrap(const std::string &data_dir);

        static bool IsSupportedFile(const std::string &path);

    private:
        Result<std::vector<Passage>> ChunkToPassages(std::string_view text,
                                                     const std::string &source,
                                                     const std::optional<std::string> &sheet_name,
                                                     std::size_t *chunks_produced) const;
        Result<IngestReport> AppendLocked(const std::vector<Passage> &passages, std::size_t chunks_produced);
        void FinishQuery(const QueryResponse &resp);

        index::VectorIndex *index_;
        const guard::GuardrailClassifier *guardrail_;
        generate::Generator *generator_;
        const text::Sanitizer *sanitizer_;
        PipelineOptions opts_;
        Logger *logger_;
        MetricsCollector *metrics_;

        std::mutex index_mu_;
    };

} // namespace finbot::pipeline
