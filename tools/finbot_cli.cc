#include <finbot/embed/hashing_embedder.h>
#include <finbot/generate/generator.h>
#include <finbot/guard/guardrail.h>
#include <finbot/index/vector_index.h>
#include <finbot/pipeline/metrics.h>
#include <finbot/pipeline/orchestrator.h>
#include <finbot/server/config.h>
#include <finbot/text/sanitizer.h>
#include <finbot/util/logger.h>

#include <iostream>
#include <memory>
#include <string>
#include <vector>

// Front end without a generation backend: answers are the retrieved context
// ("generator: context") or the prompt a model would receive ("generator: prompt").

static void PrintUsage()
{
    std::cerr << "Usage: finbot_cli [--config <file>] <command> [args]\n"
                 "Commands:\n"
                 "  bootstrap                      load the index or build it from data_dir\n"
                 "  ingest <file> [--source <s>]   add a .txt/.tsv/.csv document\n"
                 "  add-qa <category> <question> <answer>\n"
                 "  query <text...>                answer one query\n"
                 "  repl                           answer one query per stdin line, then print and export stats\n"
                 "  verify                         check the persisted index\n";
}

static void PrintResponse(const finbot::pipeline::QueryResponse &resp)
{
    std::cout << resp.response << "\n";
    if (!resp.sources.empty())
    {
        std::cout << "Sources:";
        for (const auto &s : resp.sources)
            std::cout << " " << s;
        std::cout << "\n";
    }
    std::cout << "[METRICS] " << resp.metrics.ToJson() << "\n";
}

int main(int argc, char **argv)
{
    std::string config_path = "finbot.conf";
    std::vector<std::string> args;
    for (int i = 1; i < argc; ++i)
    {
        std::string a = argv[i];
        if (a == "--config" && i + 1 < argc)
            config_path = argv[++i];
        else
            args.push_back(std::move(a));
    }
    if (args.empty())
    {
        PrintUsage();
        return 2;
    }

    auto loaded = finbot::server::LoadConfigFile(config_path);
    if (!loaded.ok())
    {
        std::cerr << "Config error: " << loaded.status().ToString() << "\n";
        return 2;
    }
    finbot::server::AppConfig cfg = loaded.move_value();
    finbot::server::ApplyEnvOverrides(&cfg);

    finbot::Logger logger;
    logger.SetLevel(finbot::ParseLogLevel(cfg.log_level));
    if (!cfg.log_path.empty())
        logger.SetFile(cfg.log_path);

    const std::string &cmd = args[0];
    if (cmd == "verify")
    {
        std::size_t count = 0;
        finbot::Status st = finbot::index::VectorIndex::Verify(cfg.index_dir, &count);
        if (!st.ok())
        {
            std::cerr << "Verification failed: " << st.ToString() << "\n";
            return 1;
        }
        std::cout << "Index dir: " << cfg.index_dir << "\n";
        std::cout << "Passages: " << count << "\n";
        return 0;
    }

    finbot::guard::GuardrailLists lists;
    finbot::Status st = finbot::guard::LoadGuardrailLists(cfg.jailbreak_phrases_file, cfg.domain_terms_file, &lists);
    if (!st.ok())
    {
        std::cerr << "Guardrail lists: " << st.ToString() << "\n";
        return 2;
    }

    finbot::embed::HashingEmbedder embedder(cfg.embedding_dim);
    finbot::index::VectorIndex index(&embedder, cfg.ToIndexOptions(), &logger);
    finbot::guard::GuardrailClassifier guardrail(std::move(lists));
    std::unique_ptr<finbot::generate::Generator> generator;
    if (cfg.generator == "prompt")
        generator = std::make_unique<finbot::generate::PromptEchoGenerator>();
    else
        generator = std::make_unique<finbot::generate::ContextOnlyGenerator>();
    finbot::text::Sanitizer sanitizer;
    finbot::pipeline::MetricsCollector metrics;
    finbot::pipeline::RetrievalOrchestrator orchestrator(&index, &guardrail, generator.get(), &sanitizer,
                                                         cfg.ToPipelineOptions(), &logger, &metrics);

    if (cmd == "bootstrap")
    {
        auto r = orchestrator.Bootstrap(cfg.data_dir);
        if (!r.ok())
        {
            std::cerr << "Bootstrap failed: " << r.status().ToString() << "\n";
            return 1;
        }
        std::cout << "Passages indexed: " << r.value().passages_indexed << "\n";
        return 0;
    }

    if (cmd == "ingest")
    {
        if (args.size() < 2)
        {
            PrintUsage();
            return 2;
        }
        std::string source;
        for (std::size_t i = 2; i + 1 < args.size(); ++i)
        {
            if (args[i] == "--source")
                source = args[i + 1];
        }
        if (!index.Load())
            logger.Info("cli", "no persisted index in " + cfg.index_dir + "; starting a new one");
        auto r = orchestrator.IngestFile(args[1], source);
        if (!r.ok())
        {
            std::cerr << "Ingest failed: " << r.status().ToString() << "\n";
            return 1;
        }
        std::cout << "Chunks: " << r.value().chunks_produced
                  << " indexed: " << r.value().passages_indexed
                  << " total: " << index.size() << "\n";
        return 0;
    }

    if (cmd == "add-qa")
    {
        if (args.size() != 4)
        {
            PrintUsage();
            return 2;
        }
        if (!index.Load())
            logger.Info("cli", "no persisted index in " + cfg.index_dir + "; starting a new one");
        auto r = orchestrator.AddQaDocument(args[1], args[2], args[3]);
        if (!r.ok())
        {
            std::cerr << "Add failed: " << r.status().ToString() << "\n";
            return 1;
        }
        std::cout << "Total passages: " << index.size() << "\n";
        return 0;
    }

    if (cmd == "query" || cmd == "repl")
    {
        if (!index.Load())
            logger.Warn("cli", "no persisted index in " + cfg.index_dir + "; answers will fall back");

        if (cmd == "query")
        {
            std::string q;
            for (std::size_t i = 1; i < args.size(); ++i)
            {
                if (i != 1)
                    q += ' ';
                q += args[i];
            }
            auto r = orchestrator.ProcessQuery(q);
            if (!r.ok())
            {
                std::cerr << "Query failed: " << r.status().ToString() << "\n";
                return 1;
            }
            PrintResponse(r.value());
            return 0;
        }

        std::string line;
        while (std::getline(std::cin, line))
        {
            auto r = orchestrator.ProcessQuery(line);
            if (!r.ok())
            {
                std::cerr << "Query failed: " << r.status().ToString() << "\n";
                continue;
            }
            PrintResponse(r.value());
        }
        std::cout << metrics.FormatStats();
        const std::string metrics_path =
            cfg.metrics_path.empty() ? finbot::pipeline::DefaultMetricsFileName() : cfg.metrics_path;
        finbot::Status exported = metrics.ExportMetrics(metrics_path);
        if (!exported.ok())
        {
            std::cerr << "Metrics export failed: " << exported.ToString() << "\n";
            return 1;
        }
        std::cout << "Metrics exported to " << metrics_path << "\n";
        return 0;
    }

    PrintUsage();
    return 2;
}
