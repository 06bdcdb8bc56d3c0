#include <finbot/pipeline/metrics.h>

#include <cstdio>
#include <ctime>
#include <fstream>
#include <numeric>

namespace finbot::pipeline
{
    namespace
    {
        std::string FormatNow(const char *fmt)
        {
            const std::time_t t = std::time(nullptr);
            std::tm tm{};
            localtime_r(&t, &tm);
            char buf[64];
            std::strftime(buf, sizeof(buf), fmt, &tm);
            return buf;
        }

        std::string JsonEscape(const std::string &s)
        {
            std::string out;
            out.reserve(s.size() + 2);
            for (char ch : s)
            {
                const auto c = static_cast<unsigned char>(ch);
                switch (c)
                {
                case '"':
                    out += "\\\"";
                    break;
                case '\\':
                    out += "\\\\";
                    break;
                case '\n':
                    out += "\\n";
                    break;
                case '\r':
                    out += "\\r";
                    break;
                case '\t':
                    out += "\\t";
                    break;
                default:
                    if (c < 0x20)
                    {
                        char buf[16];
                        std::snprintf(buf, sizeof(buf), "\\u%04x", c);
                        out += buf;
                    }
                    else
                    {
                        out.push_back(ch);
                    }
                }
            }
            return out;
        }

        std::string Num(double v)
        {
            char buf[32];
            std::snprintf(buf, sizeof(buf), "%.6f", v);
            return buf;
        }
    } // namespace

    std::string NowIso8601()
    {
        return FormatNow("%Y-%m-%dT%H:%M:%S");
    }

    std::string DefaultMetricsFileName()
    {
        return "finbot_metrics_" + FormatNow("%Y%m%d_%H%M%S") + ".json";
    }

    MetricsCollector::MetricsCollector()
        : start_(std::chrono::steady_clock::now()), start_stamp_(NowIso8601())
    {
    }

    void MetricsCollector::RecordQuery(double response_time_s, bool is_jailbreak, bool is_out_of_domain)
    {
        std::lock_guard<std::mutex> lk(mu_);
        ++query_count_;
        response_times_s_.push_back(response_time_s);
        if (is_jailbreak)
            ++jailbreak_attempts_;
        if (is_out_of_domain)
            ++out_of_domain_queries_;
    }

    void MetricsCollector::RecordError(std::string error)
    {
        std::lock_guard<std::mutex> lk(mu_);
        errors_.push_back({NowIso8601(), std::move(error)});
    }

    SessionStats MetricsCollector::Stats() const
    {
        std::lock_guard<std::mutex> lk(mu_);
        SessionStats s;
        s.session_duration_s =
            std::chrono::duration<double>(std::chrono::steady_clock::now() - start_).count();
        s.total_queries = query_count_;
        if (!response_times_s_.empty())
            s.average_response_time_s = std::accumulate(response_times_s_.begin(), response_times_s_.end(), 0.0) /
                                        static_cast<double>(response_times_s_.size());
        s.jailbreak_attempts = jailbreak_attempts_;
        s.out_of_domain_queries = out_of_domain_queries_;
        s.error_count = errors_.size();
        s.session_start = start_stamp_;
        return s;
    }

    std::vector<ErrorEntry> MetricsCollector::Errors() const
    {
        std::lock_guard<std::mutex> lk(mu_);
        return errors_;
    }

    std::vector<double> MetricsCollector::ResponseTimes() const
    {
        std::lock_guard<std::mutex> lk(mu_);
        return response_times_s_;
    }

    Status MetricsCollector::ExportMetrics(const std::string &path) const
    {
        const SessionStats s = Stats();
        const std::vector<double> times = ResponseTimes();
        const std::vector<ErrorEntry> errors = Errors();

        std::ofstream out(path, std::ios::trunc);
        if (!out)
            return Status::FromErrno(ErrorCode::kIoError, "open " + path);
        out << "{\n  \"session_stats\": {\n"
            << "    \"session_duration\": " << Num(s.session_duration_s) << ",\n"
            << "    \"total_queries\": " << s.total_queries << ",\n"
            << "    \"average_response_time\": " << Num(s.average_response_time_s) << ",\n"
            << "    \"jailbreak_attempts\": " << s.jailbreak_attempts << ",\n"
            << "    \"out_of_domain_queries\": " << s.out_of_domain_queries << ",\n"
            << "    \"error_count\": " << s.error_count << ",\n"
            << "    \"session_start\": \"" << JsonEscape(s.session_start) << "\"\n"
            << "  },\n  \"response_times\": [";
        for (std::size_t i = 0; i < times.size(); ++i)
            out << (i == 0 ? "" : ", ") << Num(times[i]);
        out << "],\n  \"errors\": [";
        for (std::size_t i = 0; i < errors.size(); ++i)
        {
            out << (i == 0 ? "\n" : ",\n")
                << "    {\"timestamp\": \"" << JsonEscape(errors[i].timestamp)
                << "\", \"error\": \"" << JsonEscape(errors[i].error) << "\"}";
        }
        out << (errors.empty() ? "]\n}\n" : "\n  ]\n}\n");
        out.flush();
        if (!out)
            return Status::IoError("write failed: " + path);
        return Status::Ok();
    }

    std::string MetricsCollector::FormatStats() const
    {
        const SessionStats s = Stats();
        char buf[512];
        std::snprintf(buf, sizeof(buf),
                      "===== FINBOT SESSION STATISTICS =====\n"
                      "Session Duration: %.2f seconds\n"
                      "Total Queries: %llu\n"
                      "Average Response Time: %.3f seconds\n"
                      "Jailbreak Attempts: %llu\n"
                      "Out-of-Domain Queries: %llu\n"
                      "Errors: %zu\n"
                      "Session Start: %s\n"
                      "=====================================\n",
                      s.session_duration_s,
                      static_cast<unsigned long long>(s.total_queries),
                      s.average_response_time_s,
                      static_cast<unsigned long long>(s.jailbreak_attempts),
                      static_cast<unsigned long long>(s.out_of_domain_queries),
                      s.error_count,
                      s.session_start.c_str());
        return buf;
    }

} // namespace finbot::pipeline
