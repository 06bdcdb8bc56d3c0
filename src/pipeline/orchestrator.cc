#include <finbot/pipeline/orchestrator.h>

#include <algorithm>
#include <chrono>
#include <cmath>
#include <cstdio>
#include <filesystem>

#include <finbot/generate/generator.h>
#include <finbot/guard/guardrail.h>
#include <finbot/index/vector_index.h>
#include <finbot/pipeline/metrics.h>
#include <finbot/storage/file_util.h>
#include <finbot/text/chunker.h>
#include <finbot/text/sanitizer.h>
#include <finbot/text/utf8.h>
#include <finbot/util/logger.h>

namespace finbot::pipeline
{
    namespace fs = std::filesystem;

    namespace
    {
        using Clock = std::chrono::steady_clock;

        double MillisSince(Clock::time_point start)
        {
            return std::chrono::duration<double, std::milli>(Clock::now() - start).count();
        }

        double Round2(double v)
        {
            return std::round(v * 100.0) / 100.0;
        }

        void AppendNumber(std::string *out, double v)
        {
            char buf[64];
            std::snprintf(buf, sizeof(buf), "%.2f", Round2(v));
            out->append(buf);
        }

        void AppendScore(std::string *out, float v)
        {
            char buf[64];
            std::snprintf(buf, sizeof(buf), "%.6g", static_cast<double>(v));
            out->append(buf);
        }

        bool IsBlank(std::string_view s)
        {
            return std::all_of(s.begin(), s.end(), [](char c)
                               { return c == ' ' || c == '\t' || c == '\n' || c == '\r' || c == '\f' || c == '\v'; });
        }

        std::string LowerExtension(const std::string &path)
        {
            return guard::AsciiLower(fs::path(path).extension().string());
        }
    } // namespace

    std::string QueryMetrics::ToJson() const
    {
        std::string out = "{\"query_length\": " + std::to_string(query_length);
        out += ", \"retrieved_docs\": " + std::to_string(retrieved_docs);
        out += ", \"similarity_scores\": [";
        for (std::size_t i = 0; i < similarity_scores.size(); ++i)
        {
            if (i != 0)
                out += ", ";
            AppendScore(&out, similarity_scores[i]);
        }
        out += "], \"classification_time_ms\": ";
        AppendNumber(&out, classification_ms);
        out += ", \"retrieval_time_ms\": ";
        AppendNumber(&out, retrieval_ms);
        out += ", \"generation_time_ms\": ";
        AppendNumber(&out, generation_ms);
        out += ", \"total_time_ms\": ";
        AppendNumber(&out, total_ms);
        out += "}";
        return out;
    }

    RetrievalOrchestrator::RetrievalOrchestrator(index::VectorIndex *index,
                                                 const guard::GuardrailClassifier *guardrail,
                                                 generate::Generator *generator,
                                                 const text::Sanitizer *sanitizer,
                                                 PipelineOptions opts,
                                                 Logger *logger,
                                                 MetricsCollector *metrics)
        : index_(index),
          guardrail_(guardrail),
          generator_(generator),
          sanitizer_(sanitizer),
          opts_(opts),
          logger_(logger),
          metrics_(metrics)
    {
    }

    void RetrievalOrchestrator::FinishQuery(const QueryResponse &resp)
    {
        if (logger_)
            logger_->Info("pipeline.metrics", "[METRICS] " + resp.metrics.ToJson());
        if (metrics_)
            metrics_->RecordQuery(resp.metrics.total_ms / 1000.0, resp.is_jailbreak, resp.is_out_of_domain);
    }

    Result<QueryResponse> RetrievalOrchestrator::ProcessQuery(std::string_view query)
    {
        const auto start = Clock::now();
        if (IsBlank(query))
            return Status::InvalidArgument("No query provided");

        QueryResponse resp;
        resp.metrics.query_length = text::Utf8Length(query);

        const auto cls_start = Clock::now();
        const guard::Classification cls = guardrail_->Classify(query);
        resp.metrics.classification_ms = MillisSince(cls_start);

        if (cls.verdict != guard::GuardrailVerdict::kAdmissible)
        {
            if (cls.verdict == guard::GuardrailVerdict::kJailbreak)
            {
                resp.response = std::string(kRefusalMessage);
                resp.is_jailbreak = true;
                if (logger_)
                    logger_->Warn("pipeline.guardrail", "jailbreak phrase matched: " + cls.matched);
            }
            else
            {
                resp.response = std::string(kOutOfDomainMessage);
                resp.is_out_of_domain = true;
                if (logger_)
                    logger_->Info("pipeline.guardrail", "out-of-domain query");
            }
            resp.metrics.total_ms = MillisSince(start);
            FinishQuery(resp);
            return resp;
        }

        std::vector<ScoredPassage> hits;
        const auto retrieval_start = Clock::now();
        {
            std::lock_guard<std::mutex> lk(index_mu_);
            Status st = index_->Search(query, opts_.top_k, &hits);
            if (!st.ok())
            {
                if (metrics_)
                    metrics_->RecordError("retrieval: " + st.ToString());
                return st;
            }
        }
        resp.metrics.retrieval_ms = MillisSince(retrieval_start);

        for (const auto &h : hits)
        {
            if (std::find(resp.sources.begin(), resp.sources.end(), h.passage.source) == resp.sources.end())
                resp.sources.push_back(h.passage.source);
        }

        if (hits.empty())
        {
            resp.response = std::string(kNoDocumentsMessage);
            resp.metrics.total_ms = MillisSince(start);
            FinishQuery(resp);
            return resp;
        }

        std::string context;
        for (std::size_t i = 0; i < hits.size(); ++i)
        {
            if (i != 0)
                context += "\n\n";
            context += hits[i].passage.content;
            resp.metrics.similarity_scores.push_back(hits[i].score);
        }
        resp.metrics.retrieved_docs = hits.size();

        if (!generator_)
            return Status::FailedPrecondition("no generator configured");
        const auto gen_start = Clock::now();
        auto answer = generator_->Generate(context, query);
        if (!answer.ok())
        {
            if (metrics_)
                metrics_->RecordError("generation: " + answer.status().msg);
            if (logger_)
                logger_->Error("pipeline.generate", answer.status().ToString());
            return Status::Internal("generation failed: " + answer.status().msg);
        }
        resp.metrics.generation_ms = MillisSince(gen_start);
        resp.response = answer.move_value();
        resp.metrics.total_ms = MillisSince(start);
        FinishQuery(resp);
        return resp;
    }

    Result<IngestReport> RetrievalOrchestrator::AppendLocked(const std::vector<Passage> &passages,
                                                             std::size_t chunks_produced)
    {
        Status st = index_->Add(passages);
        if (!st.ok())
        {
            if (metrics_)
                metrics_->RecordError("ingest: " + st.ToString());
            return st;
        }
        IngestReport report;
        report.chunks_produced = chunks_produced;
        report.passages_indexed = passages.size();
        return report;
    }

    Result<IngestReport> RetrievalOrchestrator::IngestRecords(const std::vector<SourceRecord> &records)
    {
        if (records.empty())
            return Status::InvalidArgument("no records to ingest");
        std::vector<Passage> passages;
        passages.reserve(records.size());
        for (std::size_t i = 0; i < records.size(); ++i)
        {
            if (records[i].content.empty() || records[i].source.empty())
                return Status::InvalidArgument("record " + std::to_string(i) + " lacks content or source");
            passages.push_back(ToPassage(records[i]));
        }
        std::lock_guard<std::mutex> lk(index_mu_);
        return AppendLocked(passages, 0);
    }

    Result<IngestReport> RetrievalOrchestrator::RebuildFromRecords(const std::vector<SourceRecord> &records)
    {
        std::vector<Passage> passages;
        passages.reserve(records.size());
        for (std::size_t i = 0; i < records.size(); ++i)
        {
            if (records[i].content.empty() || records[i].source.empty())
                return Status::InvalidArgument("record " + std::to_string(i) + " lacks content or source");
            passages.push_back(ToPassage(records[i]));
        }
        std::lock_guard<std::mutex> lk(index_mu_);
        Status st = index_->Create(passages);
        if (!st.ok())
            return st;
        IngestReport report;
        report.passages_indexed = passages.size();
        return report;
    }

    Result<std::vector<Passage>> RetrievalOrchestrator::ChunkToPassages(
        std::string_view text,
        const std::string &source,
        const std::optional<std::string> &sheet_name,
        std::size_t *chunks_produced) const
    {
        if (source.empty())
            return Status::InvalidArgument("document source is required");
        std::vector<Passage> passages;
        for (auto &chunk : text::ChunkDocument(text, opts_.chunker, *sanitizer_, chunks_produced))
        {
            Passage p;
            p.content = std::move(chunk);
            p.source = source;
            p.sheet_name = sheet_name;
            passages.push_back(std::move(p));
        }
        return passages;
    }

    Result<IngestReport> RetrievalOrchestrator::IngestDocument(std::string_view text,
                                                               const std::string &source,
                                                               const std::optional<std::string> &sheet_name)
    {
        std::size_t produced = 0;
        auto passages = ChunkToPassages(text, source, sheet_name, &produced);
        if (!passages.ok())
            return passages.status();
        if (passages.value().empty())
            return Status::InvalidArgument("no indexable content in " + source);

        std::lock_guard<std::mutex> lk(index_mu_);
        auto report = AppendLocked(passages.value(), produced);
        if (report.ok() && logger_)
            logger_->Info("pipeline.ingest", source + ": " + std::to_string(produced) + " chunks, " +
                                                 std::to_string(report.value().passages_indexed) + " indexed");
        return report;
    }

    Result<IngestReport> RetrievalOrchestrator::AddQaDocument(const std::string &category,
                                                              const std::string &question,
                                                              const std::string &answer)
    {
        if (question.empty() || answer.empty())
            return Status::InvalidArgument("question and answer are required");
        Passage p;
        p.content = "Question: " + question + "\nAnswer: " + answer;
        p.source = std::string(kManualSource);
        if (!category.empty())
            p.category = category;
        p.extra["question"] = question;
        p.extra["answer"] = answer;

        std::lock_guard<std::mutex> lk(index_mu_);
        return AppendLocked({p}, 0);
    }

    bool RetrievalOrchestrator::IsSupportedFile(const std::string &path)
    {
        const std::string ext = LowerExtension(path);
        return ext == ".txt" || ext == ".tsv" || ext == ".csv";
    }

    Result<IngestReport> RetrievalOrchestrator::IngestFile(const std::string &path, const std::string &source)
    {
        if (!IsSupportedFile(path))
            return Status::NotSupported("Unsupported file format: " + path);
        std::string contents;
        Status st = storage::ReadFileToString(path, &contents);
        if (!st.ok())
            return st;
        return IngestDocument(contents, source.empty() ? fs::path(path).filename().string() : source);
    }

    Result<IngestReport> RetrievalOrchestrator::Bootstrap(const std::string &data_dir)
    {
        std::lock_guard<std::mutex> lk(index_mu_);
        if (index_->Load())
        {
            IngestReport report;
            report.passages_indexed = index_->size();
            return report;
        }

        std::error_code ec;
        if (!fs::is_directory(data_dir, ec))
            return Status::NotFound("data directory not found: " + data_dir);

        std::vector<std::string> files;
        for (const auto &entry : fs::directory_iterator(data_dir, ec))
        {
            if (entry.is_regular_file(ec) && IsSupportedFile(entry.path().string()))
                files.push_back(entry.path().string());
        }
        if (ec)
            return Status::IoError("cannot list " + data_dir + ": " + ec.message());
        std::sort(files.begin(), files.end());

        IngestReport report;
        std::vector<Passage> all;
        for (const auto &file : files)
        {
            std::string contents;
            Status st = storage::ReadFileToString(file, &contents);
            if (!st.ok())
                return st;
            std::size_t produced = 0;
            auto passages = ChunkToPassages(contents, fs::path(file).filename().string(), std::nullopt, &produced);
            if (!passages.ok())
                return passages.status();
            report.chunks_produced += produced;
            for (auto &p : passages.value())
                all.push_back(std::move(p));
        }
        if (all.empty())
            return Status::NotFound("no documents to index in " + data_dir);

        Status st = index_->Create(all);
        if (!st.ok())
            return st;
        report.passages_indexed = all.size();
        if (logger_)
            logger_->Info("pipeline.bootstrap", "built index from " + std::to_string(files.size()) +
                                                    " files, " + std::to_string(all.size()) + " passages");
        return report;
    }

} // namespace finbot::pipeline
