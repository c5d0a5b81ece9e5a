#include <cmath>
#include <filesystem>
#include <fstream>
#include <gtest/gtest.h>
#include <string>
#include <vector>
#include <vellum/logger.hpp>
#include <vellum/scale.hpp>

namespace vellum
{
namespace
{

class LoggerTest : public ::testing::Test
{
   protected:
    void SetUp() override
    {
        auto& log = Logger::instance();
        log.clear_sinks();
        log.set_level(LogLevel::Trace);
        log.add_sink([this](const Logger::LogEntry& e) { entries.push_back(e); });
    }

    void TearDown() override
    {
        auto& log = Logger::instance();
        log.clear_sinks();
        log.set_level(LogLevel::Warning);
    }

    std::vector<Logger::LogEntry> entries;
};

}   // anonymous namespace

TEST_F(LoggerTest, FormatsPlaceholdersInOrder)
{
    VELLUM_LOG_INFO("test", "{} of {} is {}", 3, std::string("four"), true);
    ASSERT_EQ(entries.size(), 1u);
    EXPECT_EQ(entries[0].message, "3 of four is true");
    EXPECT_EQ(entries[0].category, "test");
    EXPECT_EQ(entries[0].level, LogLevel::Info);
}

TEST_F(LoggerTest, SurplusArgumentsAreDropped)
{
    VELLUM_LOG_INFO("test", "only {}", 1, 2);
    ASSERT_EQ(entries.size(), 1u);
    EXPECT_EQ(entries[0].message, "only 1");
}

TEST_F(LoggerTest, LevelFilters)
{
    Logger::instance().set_level(LogLevel::Error);
    VELLUM_LOG_WARN("test", "dropped");
    VELLUM_LOG_ERROR("test", "kept");
    ASSERT_EQ(entries.size(), 1u);
    EXPECT_EQ(entries[0].message, "kept");

    Logger::instance().set_level(LogLevel::Off);
    VELLUM_LOG_CRITICAL("test", "dropped");
    EXPECT_EQ(entries.size(), 1u);
}

TEST_F(LoggerTest, SilentWithoutSinks)
{
    Logger::instance().clear_sinks();
    EXPECT_FALSE(Logger::instance().is_enabled(LogLevel::Critical));
}

TEST_F(LoggerTest, ScaleWarnsOnNonFiniteData)
{
    std::vector<Point> pts = {{1.0f, 0.0f}, {NAN, 0.0f}, {3.0f, 0.0f}};
    Scale::from_data(pts, &Point::x);
    ASSERT_EQ(entries.size(), 1u);
    EXPECT_EQ(entries[0].level, LogLevel::Warning);
    EXPECT_EQ(entries[0].category, "scale");
    EXPECT_NE(entries[0].message.find("1 non-finite"), std::string::npos);
}

TEST_F(LoggerTest, FileSinkAppends)
{
    auto path = std::filesystem::temp_directory_path() / "vellum_test_logger.log";
    std::filesystem::remove(path);
    Logger::instance().add_sink(sinks::file_sink(path.string()));

    VELLUM_LOG_ERROR("io", "cannot open '{}'", "x.svg");

    std::ifstream in(path);
    std::string   line;
    std::getline(in, line);
    EXPECT_NE(line.find("ERROR [io] cannot open 'x.svg'"), std::string::npos);
    std::filesystem::remove(path);
}

TEST(LoggerStatic, ParseLevel)
{
    EXPECT_EQ(Logger::parse_level("debug"), LogLevel::Debug);
    EXPECT_EQ(Logger::parse_level("WARNING"), LogLevel::Warning);
    EXPECT_EQ(Logger::parse_level("warn"), LogLevel::Warning);
    EXPECT_EQ(Logger::parse_level("off"), LogLevel::Off);
    EXPECT_FALSE(Logger::parse_level("loud").has_value());
}

TEST(LoggerStatic, ConfigureReplacesSinks)
{
    auto& log = Logger::instance();
    log.add_sink(sinks::null_sink());
    log.add_sink(sinks::null_sink());

    LogConfig cfg;
    cfg.level   = LogLevel::Info;
    cfg.console = false;
    log.configure(cfg);
    EXPECT_EQ(log.sink_count(), 0u);
    EXPECT_EQ(log.level(), LogLevel::Info);

    cfg.console = true;
    log.configure(cfg);
    EXPECT_EQ(log.sink_count(), 1u);

    log.clear_sinks();
    log.set_level(LogLevel::Warning);
}

}   // namespace vellum
