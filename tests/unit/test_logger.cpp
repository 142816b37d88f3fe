#include <dragkit/logger.hpp>
#include <filesystem>
#include <fstream>
#include <gtest/gtest.h>
#include <iostream>
#include <sstream>
#include <string>

#include "../util/log_capture.hpp"

using namespace dragkit;
using dragkit::test::LogCapture;

TEST(Logger, MemorySinkReceivesEntries)
{
    LogCapture logs;
    Logger::instance().log(LogLevel::Info, "dnd", "hello");

    ASSERT_EQ(logs.entries().size(), 1u);
    EXPECT_EQ(logs.entries()[0].level, LogLevel::Info);
    EXPECT_EQ(logs.entries()[0].category, "dnd");
    EXPECT_EQ(logs.entries()[0].message, "hello");
}

TEST(Logger, LevelFilter)
{
    LogCapture logs(LogLevel::Warning);
    DRAGKIT_LOG_DEBUG("dnd", "dropped {}", 1);
    DRAGKIT_LOG_INFO("dnd", "dropped {}", 2);
    DRAGKIT_LOG_WARN("dnd", "kept {}", 3);
    DRAGKIT_LOG_ERROR("dnd", "kept {}", 4);

    ASSERT_EQ(logs.entries().size(), 2u);
    EXPECT_EQ(logs.entries()[0].message, "kept 3");
    EXPECT_EQ(logs.entries()[1].level, LogLevel::Error);
}

TEST(Logger, FormatsPlaceholdersInOrder)
{
    LogCapture logs;
    DRAGKIT_LOG_INFO("reorder", "{} -> {} of {}", size_t{1}, size_t{3}, std::string("four"));
    ASSERT_EQ(logs.entries().size(), 1u);
    EXPECT_EQ(logs.entries()[0].message, "1 -> 3 of four");
}

TEST(Logger, ArgumentContainingPlaceholderIsNotReplaced)
{
    LogCapture logs;
    DRAGKIT_LOG_INFO("dnd", "{} and {}", "{}", "x");
    ASSERT_EQ(logs.entries().size(), 1u);
    EXPECT_EQ(logs.entries()[0].message, "{} and x");
}

TEST(Logger, SurplusArgumentsIgnored)
{
    LogCapture logs;
    DRAGKIT_LOG_INFO("dnd", "only {}", 1, 2);
    ASSERT_EQ(logs.entries().size(), 1u);
    EXPECT_EQ(logs.entries()[0].message, "only 1");
}

TEST(Logger, BoolAndNullFormatting)
{
    LogCapture  logs;
    const char* none = nullptr;
    DRAGKIT_LOG_INFO("dnd", "{} {}", true, none);
    ASSERT_EQ(logs.entries().size(), 1u);
    EXPECT_EQ(logs.entries()[0].message, "true (null)");
}

TEST(Logger, LevelNames)
{
    EXPECT_EQ(Logger::level_to_string(LogLevel::Warning), "WARN");
    EXPECT_EQ(Logger::level_to_string(LogLevel::Critical), "CRITICAL");
}

// ─── Sinks ───────────────────────────────────────────────────────────────────

namespace
{

Logger::LogEntry make_entry(LogLevel level, const char* category, const char* message)
{
    return Logger::LogEntry{std::chrono::system_clock::now(), level, category, message};
}

// Redirects a standard stream into a string for the lifetime of the object.
class StreamCapture
{
   public:
    explicit StreamCapture(std::ostream& stream) : stream_(stream), previous_(stream.rdbuf(buffer_.rdbuf())) {}
    ~StreamCapture() { stream_.rdbuf(previous_); }

    std::string str() const { return buffer_.str(); }

   private:
    std::ostream&      stream_;
    std::ostringstream buffer_;
    std::streambuf*    previous_;
};

}   // namespace

TEST(LoggerSinks, FileSinkAppendsLines)
{
    const auto path = std::filesystem::temp_directory_path() / "dragkit_test_logger_file_sink.log";
    std::filesystem::remove(path);

    {
        auto sink = sinks::file_sink(path.string());
        sink(make_entry(LogLevel::Warning, "reorder", "rejected move"));
        sink(make_entry(LogLevel::Debug, "dnd", "drag started"));
    }

    std::ifstream in(path);
    ASSERT_TRUE(in.is_open());
    std::string first;
    std::string second;
    ASSERT_TRUE(std::getline(in, first));
    ASSERT_TRUE(std::getline(in, second));
    EXPECT_NE(first.find("WARN [reorder] rejected move"), std::string::npos);
    EXPECT_NE(second.find("DEBUG [dnd] drag started"), std::string::npos);
    in.close();

    std::filesystem::remove(path);
}

TEST(LoggerSinks, FileSinkOnUnwritablePathIsSilent)
{
    auto sink = sinks::file_sink("/nonexistent-dir/dragkit.log");
    EXPECT_NO_THROW(sink(make_entry(LogLevel::Error, "dnd", "lost")));
}

TEST(LoggerSinks, ConsoleSinkSplitsByLevel)
{
    std::string out_text;
    std::string err_text;
    {
        StreamCapture out(std::cout);
        StreamCapture err(std::cerr);
        auto          sink = sinks::console_sink();
        sink(make_entry(LogLevel::Info, "dnd", "dropped"));
        sink(make_entry(LogLevel::Critical, "dnd.guard", "not finished"));
        out_text = out.str();
        err_text = err.str();
    }

    EXPECT_NE(out_text.find("INFO [dnd] dropped"), std::string::npos);
    EXPECT_EQ(out_text.find("not finished"), std::string::npos);
    EXPECT_NE(err_text.find("CRITICAL [dnd.guard] not finished"), std::string::npos);
    EXPECT_NE(err_text.find("\033[35m"), std::string::npos);
}

TEST(LoggerSinks, NullSinkThroughLogger)
{
    LogCapture logs;
    Logger::instance().add_sink(sinks::null_sink());
    EXPECT_NO_THROW(DRAGKIT_LOG_ERROR("dnd", "discarded {}", 1));
    EXPECT_EQ(logs.entries().size(), 1u);
}

TEST(LoggerSinks, CaptureRestoresPreviousSinks)
{
    auto outer = std::make_shared<std::vector<Logger::LogEntry>>();
    Logger::instance().clear_sinks();
    Logger::instance().add_sink(sinks::memory_sink(outer));

    {
        LogCapture inner;
        Logger::instance().log(LogLevel::Critical, "dnd", "inner");
    }
    Logger::instance().log(LogLevel::Critical, "dnd", "outer");
    Logger::instance().clear_sinks();

    ASSERT_EQ(outer->size(), 1u);
    EXPECT_EQ((*outer)[0].message, "outer");
}
