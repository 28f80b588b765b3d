#include <gtest/gtest.h>
#include <topomap/common/Logger.h>

#include <cstdlib>
#include <memory>
#include <optional>
#include <string>
#include <vector>

using namespace topomap;

namespace {

struct LoggedLine {
    LogLevel level;
    std::string message;
    unsigned line;
};

struct Recorded {
    std::vector<LoggedLine> lines;
    std::optional<LogLevel> level;
    int flushes = 0;
};

class RecordingBackend : public ILoggerBackend {
public:
    explicit RecordingBackend(std::shared_ptr<Recorded> recorded)
        : recorded_(std::move(recorded)) {}

    void log(LogLevel level, const std::string& message,
             const std::source_location& loc) override {
        recorded_->lines.push_back({level, message, loc.line()});
    }
    void setLevel(LogLevel level) override { recorded_->level = level; }
    void flush() override { ++recorded_->flushes; }

private:
    std::shared_ptr<Recorded> recorded_;
};

// Sets an environment variable for one test and restores it afterwards
class ScopedEnv {
public:
    ScopedEnv(const char* name, const char* value) : name_(name) {
        if (const char* old = std::getenv(name)) {
            old_ = old;
        }
        if (value) {
            setenv(name, value, 1);
        } else {
            unsetenv(name);
        }
    }
    ~ScopedEnv() {
        if (old_) {
            setenv(name_, old_->c_str(), 1);
        } else {
            unsetenv(name_);
        }
    }

private:
    const char* name_;
    std::optional<std::string> old_;
};

}  // namespace

// =============================================================================
// Test Fixture
// =============================================================================

class LoggerTest : public ::testing::Test {
protected:
    void SetUp() override {
        recorded_ = std::make_shared<Recorded>();
        Logger::setBackend(std::make_unique<RecordingBackend>(recorded_));
    }

    void TearDown() override {
        Logger::setBackend(nullptr);
    }

    std::shared_ptr<Recorded> recorded_;
};

TEST_F(LoggerTest, Macros_FormatAndForward) {
    LOG_INFO("routed {} of {} links", 3, 4);
    unsigned expectedLine = __LINE__ - 1;
    LOG_ERROR("bad node '{}'", "x");

    ASSERT_EQ(recorded_->lines.size(), 2u);
    EXPECT_EQ(recorded_->lines[0].level, LogLevel::Info);
    EXPECT_EQ(recorded_->lines[0].line, expectedLine);
    EXPECT_EQ(recorded_->lines[0].message, "routed 3 of 4 links");
    EXPECT_EQ(recorded_->lines[1].level, LogLevel::Error);
    EXPECT_EQ(recorded_->lines[1].message, "bad node 'x'");
}

TEST_F(LoggerTest, EveryMacro_MapsToItsLevel) {
    LOG_TRACE("t");
    LOG_DEBUG("d");
    LOG_WARN("w");

    ASSERT_EQ(recorded_->lines.size(), 3u);
    EXPECT_EQ(recorded_->lines[0].level, LogLevel::Trace);
    EXPECT_EQ(recorded_->lines[1].level, LogLevel::Debug);
    EXPECT_EQ(recorded_->lines[2].level, LogLevel::Warn);
}

TEST_F(LoggerTest, SetLevelAndFlush_ReachBackend) {
    Logger::setLevel(LogLevel::Debug);
    Logger::flush();

    ASSERT_TRUE(recorded_->level.has_value());
    EXPECT_EQ(*recorded_->level, LogLevel::Debug);
    EXPECT_EQ(recorded_->flushes, 1);
}

// =============================================================================
// Level names
// =============================================================================

TEST(LogLevelTest, ParseLevel_AcceptsNamesInAnyCase) {
    EXPECT_EQ(Logger::parseLevel("trace"), LogLevel::Trace);
    EXPECT_EQ(Logger::parseLevel("DEBUG"), LogLevel::Debug);
    EXPECT_EQ(Logger::parseLevel("Warning"), LogLevel::Warn);
    EXPECT_EQ(Logger::parseLevel("err"), LogLevel::Error);
    EXPECT_EQ(Logger::parseLevel("off"), LogLevel::Off);
    EXPECT_FALSE(Logger::parseLevel("loud").has_value());
    EXPECT_FALSE(Logger::parseLevel("").has_value());
}

TEST(LogLevelTest, LevelFromEnvironment_LogLevelWins) {
    ScopedEnv logLevel("LOG_LEVEL", "error");
    ScopedEnv spdlogLevel("SPDLOG_LEVEL", "trace");

    EXPECT_EQ(Logger::levelFromEnvironment(), LogLevel::Error);
}

TEST(LogLevelTest, LevelFromEnvironment_FallsBackToInfo) {
    ScopedEnv logLevel("LOG_LEVEL", nullptr);
    ScopedEnv spdlogLevel("SPDLOG_LEVEL", "nonsense");

    EXPECT_EQ(Logger::levelFromEnvironment(), LogLevel::Info);
}
