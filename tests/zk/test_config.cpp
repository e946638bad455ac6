#include <gtest/gtest.h>
#include <zk/config.hpp>
#include <zk/result.hpp>
#include <zk/util/logger.hpp>

#include <cstdlib>
#include <optional>
#include <sstream>
#include <stdexcept>
#include <string>

using namespace zk;

// Saves and restores an environment variable around a test
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

// ============================================================================
// Config
// ============================================================================

TEST(ConfigTest, FromRootLayout) {
    auto config = Config::from_root("/srv/wiki");
    EXPECT_EQ(config.root, fs::path("/srv/wiki"));
    EXPECT_EQ(config.note_dir, fs::path("/srv/wiki/note"));
    EXPECT_EQ(config.link_file, fs::path("/srv/wiki/link.typ"));
    EXPECT_EQ(config.debounce, std::chrono::milliseconds(300));
    EXPECT_EQ(config.channel_capacity, 64u);
}

TEST(ConfigTest, ResolveOrder) {
    ScopedEnv wiki("WIKI_ROOT", "/env/wiki");
    ScopedEnv home("HOME", "/home/tester");

    EXPECT_EQ(Config::resolve(fs::path("/cli/wiki"), fs::path("/init/wiki")).root,
              fs::path("/cli/wiki"));
    EXPECT_EQ(Config::resolve(std::nullopt, fs::path("/init/wiki")).root, fs::path("/env/wiki"));

    {
        ScopedEnv no_wiki("WIKI_ROOT", nullptr);
        EXPECT_EQ(Config::resolve(std::nullopt, fs::path("/init/wiki")).root, fs::path("/init/wiki"));
        EXPECT_EQ(Config::resolve(fs::path(""), std::nullopt).root, fs::path("/home/tester/wiki"));

        ScopedEnv no_home("HOME", nullptr);
        EXPECT_EQ(Config::resolve(std::nullopt).root, fs::path("./wiki"));
    }
}

// ============================================================================
// Logger
// ============================================================================

TEST(LoggerTest, LevelFiltering) {
    std::ostringstream out;
    ConsoleLogger logger(out);
    logger.set_min_level(LogLevel::WARNING);

    logger.info("hidden");
    logger.warning("shown");
    logger.error("also shown");

    EXPECT_EQ(out.str(), "[WARN] shown\n[ERROR] also shown\n");
}

TEST(LoggerTest, ParseLogLevel) {
    EXPECT_EQ(parse_log_level("debug"), LogLevel::DEBUG);
    EXPECT_EQ(parse_log_level("warn"), LogLevel::WARNING);
    EXPECT_EQ(parse_log_level("error"), LogLevel::ERROR);
    EXPECT_EQ(parse_log_level("bogus"), LogLevel::INFO);
}

TEST(LoggerTest, EnvironmentLevel) {
    ScopedEnv level("ZK_LOG", "error");
    EXPECT_EQ(make_console_logger(false)->get_min_level(), LogLevel::ERROR);
    EXPECT_EQ(make_console_logger(true)->get_min_level(), LogLevel::DEBUG);
}

TEST(LoggerTest, NullFallback) {
    auto logger = or_null_logger(nullptr);
    ASSERT_NE(logger, nullptr);
    logger->error("discarded");
}

// ============================================================================
// Result
// ============================================================================

TEST(ResultTest, ValueAndError) {
    Result<int> ok = 7;
    EXPECT_TRUE(ok.ok());
    EXPECT_EQ(ok.value(), 7);
    EXPECT_EQ(ok.error_code(), ErrorCode::OK);

    Result<int> failed = Error(ErrorCode::NOT_FOUND, "note 1");
    EXPECT_FALSE(failed.ok());
    EXPECT_EQ(failed.value_or(3), 3);
    EXPECT_EQ(failed.error().to_string(), "NOT_FOUND: note 1");
    EXPECT_THROW(failed.value(), std::runtime_error);

    Result<void> done = Ok();
    EXPECT_TRUE(done.ok());
    Result<void> watch = Err(ErrorCode::WATCH_ERROR);
    EXPECT_EQ(watch.error().to_string(), "WATCH_ERROR");
}
