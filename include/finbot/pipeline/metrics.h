#pragma once
#include <chrono>
#include <cstdint>
#include <mutex>
#include <string>
#include <vector>

#include <finbot/status.h>

namespace finbot::pipeline
{
    struct ErrorEntry
    {
        std::string timestamp; // local time, ISO-8601
        std::string error;
    };

    struct SessionStats
    {
        double session_duration_s = 0.0;
        std::uint64_t total_queries = 0;
        double average_response_time_s = 0.0;
        std::uint64_t jailbreak_attempts = 0;
        std::uint64_t out_of_domain_queries = 0;
        std::size_t error_count = 0;
        std::string session_start;
    };

    // Per-session query counters. Thread-safe.
    class MetricsCollector
    {
    public:
        MetricsCollector();

        void RecordQuery(double response_time_s, bool is_jailbreak, bool is_out_of_domain);
        void RecordError(std::string error);

        SessionStats Stats() const;
        std::vector<ErrorEntry> Errors() const;
        std::vector<double> ResponseTimes() const;

        // Multi-line human-readable summary.
        std::string FormatStats() const;

        // Writes {"session_stats", "response_times", "errors"} as indented JSON.
        Status ExportMetrics(const std::string &path) const;

    private:
        mutable std::mutex mu_;
        std::chrono::steady_clock::time_point start_;
        std::string start_stamp_;
        std::uint64_t query_count_ = 0;
        std::vector<double> response_times_s_;
        std::uint64_t jailbreak_attempts_ = 0;
        std::uint64_t out_of_domain_queries_ = 0;
        std::vector<ErrorEntry> errors_;
    };

    // Current local time as "YYYY-MM-DDTHH:MM:SS".
    std::string NowIso8601();

    // "finbot_metrics_YYYYMMDD_HHMMSS.json" for the current local time.
    std::string DefaultMetricsFileName();

} // namespace finbot::pipeline
