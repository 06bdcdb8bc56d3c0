#include <finbot/server/config.h>

#include <charconv>
#include <cstdlib>
#include <fstream>

namespace finbot::server
{

    static std::string Trim(const std::string &s)
    {
        std::size_t a = 0;
        while (a < s.size() && (s[a] == ' ' || s[a] == '\t'))
            ++a;
        std::size_t b = s.size();
        while (b > a && (s[b - 1] == ' ' || s[b - 1] == '\t' || s[b - 1] == '\r'))
            --b;
        return s.substr(a, b - a);
    }

    template <typename T>
    static Status ParseNumber(const std::string &key, const std::string &val, T *out)
    {
        T v{};
        const char *first = val.data();
        const char *last = val.data() + val.size();
        auto [ptr, ec] = std::from_chars(first, last, v);
        if (ec != std::errc() || ptr != last)
            return Status::InvalidArgument("config: bad number for " + key + ": '" + val + "'");
        *out = v;
        return Status::Ok();
    }

    IndexOptions AppConfig::ToIndexOptions() const
    {
        IndexOptions opts;
        opts.index_dir = index_dir;
        return opts;
    }

    PipelineOptions AppConfig::ToPipelineOptions() const
    {
        PipelineOptions opts;
        opts.top_k = top_k;
        opts.chunker = chunker;
        return opts;
    }

    Result<AppConfig> LoadConfigFile(const std::string &path)
    {
        AppConfig cfg;

        std::ifstream in(path);
        if (!in)
            return cfg;

        std::string line;
        std::size_t lineno = 0;
        while (std::getline(in, line))
        {
            ++lineno;
            line = Trim(line);
            if (line.empty() || line[0] == '#')
                continue;

            auto pos = line.find(':');
            if (pos == std::string::npos)
                continue;

            std::string key = Trim(line.substr(0, pos));
            std::string val = Trim(line.substr(pos + 1));

            if (!val.empty() && val.front() == '"' && val.back() == '"' && val.size() >= 2)
            {
                val = val.substr(1, val.size() - 2);
            }

            Status st;
            if (key == "data_dir")
                cfg.data_dir = val;
            else if (key == "index_dir")
                cfg.index_dir = val;
            else if (key == "log_path")
                cfg.log_path = val;
            else if (key == "log_level")
                cfg.log_level = val;
            else if (key == "embedding_dim")
                st = ParseNumber(key, val, &cfg.embedding_dim);
            else if (key == "top_k")
                st = ParseNumber(key, val, &cfg.top_k);
            else if (key == "max_chunk_size")
                st = ParseNumber(key, val, &cfg.chunker.max_chunk_size);
            else if (key == "min_chunk_size")
                st = ParseNumber(key, val, &cfg.chunker.min_chunk_size);
            else if (key == "overlap_size")
                st = ParseNumber(key, val, &cfg.chunker.overlap_size);
            else if (key == "jailbreak_phrases_file")
                cfg.jailbreak_phrases_file = val;
            else if (key == "domain_terms_file")
                cfg.domain_terms_file = val;
            else if (key == "generator")
                cfg.generator = val;
            else if (key == "metrics_path")
                cfg.metrics_path = val;

            if (!st.ok())
                return Status::InvalidArgument(path + ":" + std::to_string(lineno) + ": " + st.msg);
        }

        if (cfg.embedding_dim == 0)
            return Status::InvalidArgument("config: embedding_dim must be positive");
        if (cfg.top_k == 0)
            return Status::InvalidArgument("config: top_k must be positive");
        if (cfg.chunker.max_chunk_size == 0 || cfg.chunker.min_chunk_size > cfg.chunker.max_chunk_size)
            return Status::InvalidArgument("config: min_chunk_size must not exceed max_chunk_size");
        if (cfg.chunker.overlap_size >= cfg.chunker.max_chunk_size)
            return Status::InvalidArgument("config: overlap_size must be below max_chunk_size");
        if (cfg.generator != "context" && cfg.generator != "prompt")
            return Status::InvalidArgument("config: generator must be 'context' or 'prompt', got '" + cfg.generator + "'");

        return cfg;
    }

    void ApplyEnvOverrides(AppConfig *cfg)
    {
        if (const char *v = std::getenv("FINBOT_DATA_DIR"); v && *v)
            cfg->data_dir = v;
        if (const char *v = std::getenv("FINBOT_INDEX_DIR"); v && *v)
            cfg->index_dir = v;
        if (const char *v = std::getenv("FINBOT_LOG_LEVEL"); v && *v)
            cfg->log_level = v;
        if (const char *v = std::getenv("FINBOT_LOG_PATH"); v && *v)
            cfg->log_path = v;
    }

}
