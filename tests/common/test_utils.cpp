#include "common/test_utils.h"

#include <atomic>
#include <fstream>
#include <sstream>
#include <thread>

namespace finbot::test
{
    namespace
    {
        std::atomic<std::uint64_t> g_temp_counter{0};
    }

    TempDir::TempDir()
    {
        auto base = std::filesystem::temp_directory_path();
        std::ostringstream ss;
        ss << "finbot_test_" << std::this_thread::get_id() << "_" << g_temp_counter.fetch_add(1);
        path_ = base / ss.str();
        std::filesystem::remove_all(path_);
        std::filesystem::create_directories(path_);
    }

    TempDir::~TempDir()
    {
        std::error_code ec;
        std::filesystem::remove_all(path_, ec);
    }

    void WriteFile(const std::filesystem::path &path, const std::string &contents)
    {
        std::ofstream out(path, std::ios::binary | std::ios::trunc);
        out << contents;
    }

    std::string ReadFile(const std::filesystem::path &path)
    {
        std::ifstream in(path, std::ios::binary);
        std::ostringstream ss;
        ss << in.rdbuf();
        return ss.str();
    }

    FakeEmbedder::FakeEmbedder(std::size_t dim) : dim_(dim), fallback_(dim, 0.0f)
    {
        if (dim_ > 0)
            fallback_[0] = 1.0f;
    }

    Result<Embedding> FakeEmbedder::Embed(std::string_view text)
    {
        ++calls_;
        if (!failure_.ok())
            return failure_;
        auto it = table_.find(text);
        if (it != table_.end())
            return it->second;
        return fallback_;
    }

    Result<std::string> FakeGenerator::Generate(std::string_view context, std::string_view question)
    {
        ++calls;
        last_context = std::string(context);
        last_question = std::string(question);
        if (!failure_.ok())
            return failure_;
        return "answer: " + last_context;
    }

    Passage MakePassage(std::string content, std::string source)
    {
        Passage p;
        p.content = std::move(content);
        p.source = std::move(source);
        return p;
    }

    std::string SampleBankDocument()
    {
        return "The minimum balance required for a current account is 500 rupees. "
               "Customers who fall below the minimum balance are charged a monthly fee of 100 rupees.\n\n"
               "Debit cards can be blocked through the mobile app or by calling the helpline. "
               "A replacement card is issued within seven working days at the nearest branch.\n\n"
               "Funds transfer between accounts of the same bank is free of charge. "
               "Interbank transfers through internet banking are processed within one business day.";
    }
}
