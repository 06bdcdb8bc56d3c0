#pragma once
#include <cstdint>
#include <string>

#include <finbot/options.h>
#include <finbot/status.h>

namespace finbot::server
{
    struct AppConfig
    {
        std::string data_dir{"data"};
        std::string index_dir{"data/vector_store"};

        std::string log_path{};       // empty: stderr
        std::string log_level{"info"};

        std::size_t embedding_dim{384};
        std::uint32_t top_k{3};
        ChunkerOptions chunker{};

        std::string jailbreak_phrases_file{}; // empty: built-in list
        std::string domain_terms_file{};      // empty: built-in list

        std::string generator{"context"}; // "context" or "prompt"
        std::string metrics_path{};       // empty: finbot_metrics_<timestamp>.json

        IndexOptions ToIndexOptions() const;
        PipelineOptions ToPipelineOptions() const;
    };

    // `key: value` lines, '#' comments, optional double quotes around values.
    // A missing file yields the defaults; unknown keys are ignored.
    // InvalidArgument for malformed numbers or inconsistent chunk sizes.
    Result<AppConfig> LoadConfigFile(const std::string &path);

    // FINBOT_DATA_DIR, FINBOT_INDEX_DIR, FINBOT_LOG_LEVEL, FINBOT_LOG_PATH.
    void ApplyEnvOverrides(AppConfig *cfg);

}
